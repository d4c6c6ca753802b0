/*
twinpane command line entry point


*/

#include "twinpane/core/EngineConfig.hpp"
#include "twinpane/core/OperationService.hpp"
#include "twinpane/io/PosixFileSystem.hpp"
#include "twinpane/utils/Format.hpp"
#include "twinpane/utils/metrics_engine.hpp"

#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <limits>
#include <string>
#include <vector>

#include <sys/ioctl.h>
#include <unistd.h>

using namespace twinpane;

namespace {

volatile std::sig_atomic_t g_interrupted = 0;

void onInterrupt(int) {
    g_interrupted = 1;
}

struct CommandLine {
    std::string command;
    std::vector<std::string> arguments;
    std::string configText;
    long maxDepth = -1;
    long cap = -1;
    bool followSymlinks = false;
    bool caseSensitive = false;
    scan::MatchMode mode = scan::MatchMode::SUBSTRING;
    scan::SearchFilter filter = scan::SearchFilter::ALL;
    ops::CollisionDecision onCollision = ops::CollisionDecision::SKIP;
};

void printUsage(const char* program) {
    std::fprintf(stderr,
        "usage: %s [options] size <path>...\n"
        "       %s [options] search <root> <pattern>\n"
        "       %s [options] copy <source>... <destination-dir>\n"
        "       %s [options] move <source>... <destination-dir>\n"
        "       %s [options] delete <path>...\n"
        "\n"
        "options:\n"
        "  --max-depth N             deepest directory level visited\n"
        "  --cap N                   stop a search after N matches (0 = no limit)\n"
        "  --follow-symlinks         size and search descend into symlinked directories\n"
        "  --config JSON             engine configuration as a JSON object\n"
        "  --mode substring|subsequence|glob\n"
        "  --case-sensitive\n"
        "  --files-only | --dirs-only\n"
        "  --on-collision skip|overwrite|rename\n",
        program, program, program, program, program);
}

bool parseCount(const char* text, long& value) {
    char* end = nullptr;
    long parsed = std::strtol(text, &end, 10);
    if (end == text || *end != '\0' || parsed < 0) {
        return false;
    }
    value = parsed;
    return true;
}

bool parseCommandLine(int argc, char** argv, CommandLine& cmd) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        bool hasValue = i + 1 < argc;

        if (arg == "--max-depth" && hasValue) {
            if (!parseCount(argv[++i], cmd.maxDepth)) return false;
        } else if (arg == "--cap" && hasValue) {
            if (!parseCount(argv[++i], cmd.cap)) return false;
        } else if (arg == "--config" && hasValue) {
            cmd.configText = argv[++i];
        } else if (arg == "--follow-symlinks") {
            cmd.followSymlinks = true;
        } else if (arg == "--case-sensitive") {
            cmd.caseSensitive = true;
        } else if (arg == "--files-only") {
            cmd.filter = scan::SearchFilter::FILES_ONLY;
        } else if (arg == "--dirs-only") {
            cmd.filter = scan::SearchFilter::DIRECTORIES_ONLY;
        } else if (arg == "--mode" && hasValue) {
            std::string mode = argv[++i];
            if (mode == "substring") cmd.mode = scan::MatchMode::SUBSTRING;
            else if (mode == "subsequence") cmd.mode = scan::MatchMode::SUBSEQUENCE;
            else if (mode == "glob") cmd.mode = scan::MatchMode::GLOB;
            else return false;
        } else if (arg == "--on-collision" && hasValue) {
            std::string decision = argv[++i];
            if (decision == "skip") cmd.onCollision = ops::CollisionDecision::SKIP;
            else if (decision == "overwrite") cmd.onCollision = ops::CollisionDecision::OVERWRITE;
            else if (decision == "rename") cmd.onCollision = ops::CollisionDecision::RENAME;
            else return false;
        } else if (arg.size() > 1 && arg[0] == '-' && arg[1] == '-') {
            return false;
        } else if (cmd.command.empty()) {
            cmd.command = arg;
        } else {
            cmd.arguments.push_back(arg);
        }
    }

    if (cmd.command == "search") {
        return cmd.arguments.size() == 2;
    }
    if (cmd.command == "copy" || cmd.command == "move") {
        return cmd.arguments.size() >= 2;
    }
    if (cmd.command == "size" || cmd.command == "delete") {
        return !cmd.arguments.empty();
    }
    return false;
}

// Columns of the terminal behind fd, or 0 when fd is not a terminal.
size_t terminalWidth(int fd) {
    struct winsize ws;
    if (isatty(fd) && ioctl(fd, TIOCGWINSZ, &ws) == 0 && ws.ws_col > 0) {
        return ws.ws_col;
    }
    return 0;
}

// Lines written to a pipe or file keep their full paths.
size_t lineWidth(int fd) {
    size_t width = terminalWidth(fd);
    return width > 0 ? width : std::numeric_limits<size_t>::max();
}

void printErrors(const common::EntryErrorList& errors) {
    const size_t width = lineWidth(STDERR_FILENO);
    for (const auto& error : errors) {
        std::fprintf(stderr, "%s\n", utils::Format::describeEntryError(error, width).c_str());
    }
}

// Polls the handle from the control thread until the worker publishes the
// outcome, echoing new progress and forwarding Ctrl-C as a cancellation.
template<typename Outcome>
Outcome waitWithProgress(core::OperationHandle<Outcome>& handle) {
    size_t width = terminalWidth(STDERR_FILENO);
    if (width == 0) {
        width = 80;
    }
    uint64_t shownSequence = 0;

    while (true) {
        if (g_interrupted && !handle.isCancelled()) {
            std::fprintf(stderr, "Cancelling...\n");
            handle.cancel();
        }

        auto outcome = handle.waitOutcome(std::chrono::milliseconds(200));
        if (outcome) {
            return std::move(*outcome);
        }

        utils::OperationProgress progress;
        uint64_t sequence = handle.latestProgress(progress);
        if (sequence != shownSequence) {
            shownSequence = sequence;
            utils::ProgressLines lines = utils::Format::describeProgress(progress, width);
            std::fprintf(stderr, "%s\n%s\n", lines.fileLine.c_str(), lines.countLine.c_str());
        }
    }
}

int runSize(core::OperationService& service, const CommandLine& cmd) {
    core::SizeHandle handle = service.computeSize(cmd.arguments);
    scan::DirCalcResult result = waitWithProgress(handle);

    std::printf("%s (%llu bytes) in %llu files, %llu directories%s\n",
                utils::Format::formatSize(result.totalSize).c_str(),
                static_cast<unsigned long long>(result.totalSize),
                static_cast<unsigned long long>(result.fileCount),
                static_cast<unsigned long long>(result.dirCount),
                result.partial ? " (partial)" : "");
    printErrors(result.errors);

    if (result.cancelled) return 130;
    return result.partial ? 1 : 0;
}

int runSearch(core::OperationService& service, const CommandLine& cmd) {
    scan::SearchQuery query;
    query.pattern = cmd.arguments[1];
    query.mode = cmd.mode;
    query.caseSensitive = cmd.caseSensitive;
    query.filter = cmd.filter;
    query.cap = cmd.cap >= 0 ? static_cast<size_t>(cmd.cap) : service.config().searchCap;

    core::SearchHandle handle = service.search(cmd.arguments[0], query);
    scan::SearchResult result = waitWithProgress(handle);

    const size_t width = lineWidth(STDOUT_FILENO);
    for (const auto& match : result.matches) {
        std::string line = utils::Format::fitPath(
            std::string(), match.relativePath,
            match.kind == common::EntryKind::DIRECTORY ? "/" : "", width);
        std::printf("%s\n", line.c_str());
    }
    std::printf("%zu matches, %llu entries visited%s%s\n",
                result.matches.size(),
                static_cast<unsigned long long>(result.entriesVisited),
                result.capReached ? " (limit reached)" : "",
                result.partial ? " (partial)" : "");
    printErrors(result.errors);

    if (result.cancelled) return 130;
    return 0;
}

int runBulk(core::OperationService& service, const CommandLine& cmd) {
    ops::CollisionDecision decision = cmd.onCollision;
    ops::CollisionResolver resolver = [decision](const ops::Collision& collision) {
        std::string line = utils::Format::fitPath("Exists: ", collision.destinationPath,
                                                  std::string(), lineWidth(STDERR_FILENO));
        std::fprintf(stderr, "%s\n", line.c_str());
        return ops::CollisionResolution(decision);
    };

    core::BulkHandle handle = [&]() {
        if (cmd.command == "delete") {
            return service.remove(cmd.arguments);
        }
        std::vector<std::string> sources(cmd.arguments.begin(), cmd.arguments.end() - 1);
        const std::string& destination = cmd.arguments.back();
        return cmd.command == "copy" ? service.copy(sources, destination, resolver)
                                     : service.move(sources, destination, resolver);
    }();

    ops::OperationResult result = waitWithProgress(handle);

    std::printf("%s: %s, %llu/%llu entries, %s of %s",
                ops::operationKindName(result.kind),
                ops::operationStateName(result.state),
                static_cast<unsigned long long>(result.entriesCompleted),
                static_cast<unsigned long long>(result.entriesTotal),
                utils::Format::formatSize(result.bytesDone).c_str(),
                utils::Format::formatSize(result.bytesTotal).c_str());
    if (result.skippedEntries > 0) {
        std::printf(", %llu skipped", static_cast<unsigned long long>(result.skippedEntries));
    }
    if (result.crossDeviceFallbacks > 0) {
        std::printf(", %llu copied across devices",
                    static_cast<unsigned long long>(result.crossDeviceFallbacks));
    }
    std::printf("\n");

    if (result.state == ops::OperationState::ABORTED) {
        std::string line = utils::Format::fitPath(
            std::string("Aborted: ") + common::errorName(result.fatalError) + " ",
            result.fatalPath, std::string(), lineWidth(STDERR_FILENO));
        std::fprintf(stderr, "%s\n", line.c_str());
    }
    printErrors(result.errors);

    switch (result.state) {
        case ops::OperationState::COMPLETED: return 0;
        case ops::OperationState::CANCELLED: return 130;
        default: return 1;
    }
}

} // namespace

int main(int argc, char** argv) {
    CommandLine cmd;
    if (!parseCommandLine(argc, argv, cmd)) {
        printUsage(argv[0]);
        return 2;
    }

    core::EngineConfig config;
    if (!cmd.configText.empty()) {
        std::string detail;
        std::error_code ec = core::EngineConfig::fromJsonString(cmd.configText, config, &detail);
        if (ec) {
            std::fprintf(stderr, "Invalid configuration: %s\n", detail.c_str());
            return 2;
        }
    }
    if (cmd.maxDepth > 0) {
        config.maxDepth = static_cast<size_t>(cmd.maxDepth);
    }
    if (cmd.followSymlinks) {
        config.symlinkPolicy = common::SymlinkPolicy::FOLLOW;
    }

    std::shared_ptr<metrics::MetricsSink> sink;
    if (!config.metrics.base_path.empty()) {
        auto engine = std::make_shared<metrics::MetricsEngine>();
        if (!engine->initialize(config.metrics)) {
            std::fprintf(stderr, "Could not open log directory %s\n", config.metrics.base_path.c_str());
            return 1;
        }
        engine->setMinLevel(config.logLevel);
        sink = engine;
    }

    std::signal(SIGINT, onInterrupt);

    io::PosixFileSystem fs;
    int status = 0;
    {
        core::OperationService service(fs, config, sink);

        if (cmd.command == "size") {
            status = runSize(service, cmd);
        } else if (cmd.command == "search") {
            status = runSearch(service, cmd);
        } else {
            status = runBulk(service, cmd);
        }
    }

    if (sink && !sink->flush()) {
        std::fprintf(stderr, "Could not flush log records\n");
    }
    return status;
}
