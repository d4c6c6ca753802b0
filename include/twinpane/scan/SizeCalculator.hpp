// include/twinpane/scan/SizeCalculator.hpp
#ifndef TWINPANE_SIZECALCULATOR_HPP
#define TWINPANE_SIZECALCULATOR_HPP

#include "../common/Types.hpp"
#include "../io/FileSystem.hpp"
#include "../traversal/Walker.hpp"
#include "../utils/CancelToken.hpp"
#include "../utils/ProgressChannel.hpp"
#include "../utils/metrics_base.hpp"

#include <memory>
#include <string>
#include <vector>

namespace twinpane {
namespace scan {

struct DirCalcResult {
    uint64_t totalSize;
    uint64_t fileCount;
    // Directories below the roots; the roots themselves are not counted.
    uint64_t dirCount;
    common::EntryErrorList errors;
    // Some part of the tree was not counted (diagnostics or cancellation).
    bool partial;
    bool cancelled;

    DirCalcResult() : totalSize(0), fileCount(0), dirCount(0), partial(false), cancelled(false) {}
};

class SizeCalculator : public MetricsBase {
public:
    SizeCalculator(io::FileSystem& fs, const traversal::WalkOptions& options,
                   std::shared_ptr<metrics::MetricsSink> sink = nullptr);

    DirCalcResult calculate(const std::string& root, const utils::CancelToken& cancel,
                            utils::ProgressSink* progress = nullptr);
    // Sums over several roots (a multi-selection).
    DirCalcResult calculate(const std::vector<std::string>& roots, const utils::CancelToken& cancel,
                            utils::ProgressSink* progress = nullptr);

private:
    io::FileSystem& fs_;
    traversal::WalkOptions options_;
};

} // namespace scan
} // namespace twinpane

#endif
