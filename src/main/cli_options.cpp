#include "main/cli_options.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include <cctype>
#include <csignal>
#include <limits>

namespace {

CancellationToken* signalToken = nullptr;

void handleSignal(int) {
    if (signalToken) {
        signalToken->cancel();
    }
}

std::string requireValue(int argc, char* argv[], int& i) {
    if (i + 1 >= argc) {
        throw ConfigurationError(std::string("Missing value for ") + argv[i]);
    }
    return argv[++i];
}

} // namespace

uint64_t parseByteSize(const std::string& text) {
    if (text.empty()) {
        throw ConfigurationError("Empty size");
    }

    if (!std::isdigit(static_cast<unsigned char>(text[0]))) {
        throw ConfigurationError("Invalid size: " + text);
    }

    size_t used = 0;
    uint64_t value;
    try {
        value = std::stoull(text, &used, 10);
    } catch (const std::exception&) {
        throw ConfigurationError("Invalid size: " + text);
    }

    std::string suffix = text.substr(used);
    if (!suffix.empty() && (suffix.back() == 'B' || suffix.back() == 'b')) {
        suffix.pop_back();
    }
    if (suffix.size() == 2 && (suffix[1] == 'i' || suffix[1] == 'I')) {
        suffix.pop_back();
    }

    uint64_t multiplier = 1;
    if (suffix.empty()) {
        multiplier = 1;
    } else if (suffix.size() == 1) {
        switch (std::toupper(static_cast<unsigned char>(suffix[0]))) {
            case 'K': multiplier = 1024ULL; break;
            case 'M': multiplier = 1024ULL * 1024; break;
            case 'G': multiplier = 1024ULL * 1024 * 1024; break;
            case 'T': multiplier = 1024ULL * 1024 * 1024 * 1024; break;
            default:  throw ConfigurationError("Invalid size suffix: " + text);
        }
    } else {
        throw ConfigurationError("Invalid size suffix: " + text);
    }

    if (value == 0) {
        throw ConfigurationError("Size must be positive: " + text);
    }
    if (value > std::numeric_limits<uint64_t>::max() / multiplier) {
        throw ConfigurationError("Size out of range: " + text);
    }
    return value * multiplier;
}

CliOptions parseCliOptions(int argc, char* argv[]) {
    CliOptions options;
    for (int i = 0; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            options.help = true;
        } else if (arg == "-c" || arg == "--config") {
            options.configPath = requireValue(argc, argv, i);
        } else if (arg == "-r" || arg == "--remote") {
            options.remote = requireValue(argc, argv, i);
        } else if (arg == "-d" || arg == "--dest") {
            options.destinationPath = requireValue(argc, argv, i);
        } else if (arg == "-s" || arg == "--shard-size") {
            options.shardSize = parseByteSize(requireValue(argc, argv, i));
        } else if (arg == "--since") {
            options.since = requireValue(argc, argv, i);
        } else if (arg == "--prefix") {
            options.prefix = requireValue(argc, argv, i);
        } else if (arg == "--source-type") {
            options.sourceType = requireValue(argc, argv, i);
            if (options.sourceType != "zfs" && options.sourceType != "file") {
                throw ConfigurationError("--source-type must be 'zfs' or 'file'");
            }
        } else if (arg == "--sink-type") {
            options.sinkType = requireValue(argc, argv, i);
            if (options.sinkType != "zfs" && options.sinkType != "file") {
                throw ConfigurationError("--sink-type must be 'zfs' or 'file'");
            }
        } else if (arg == "--full") {
            options.full = true;
        } else if (arg == "-y" || arg == "--yes") {
            options.yes = true;
        } else if (arg == "-f" || arg == "--force") {
            options.force = true;
        } else if (arg == "-v" || arg == "--verbose") {
            options.verbose = true;
        } else if (arg.size() > 1 && arg[0] == '-') {
            throw ConfigurationError("Unknown option: " + arg);
        } else {
            options.positional.push_back(arg);
        }
    }
    if (options.full && !options.since.empty()) {
        throw ConfigurationError("--full and --since are mutually exclusive");
    }
    return options;
}

AppConfig loadCliConfig(const CliOptions& options) {
    // Console-only logging until the configured log file is known.
    if (!Logger::isInitialized()) {
        Logger::initialize("", options.verbose ? LogLevel::DEBUG : LogLevel::INFO);
    }

    AppConfig config = AppConfig::load(options.configPath);

    LogLevel level = LogLevel::INFO;
    Logger::parseLevel(config.logLevel, level);
    if (options.verbose) {
        level = LogLevel::DEBUG;
    }
    Logger::shutdown();
    if (!Logger::initialize(config.logFile, level)) {
        Logger::initialize("", level);
        Logger::warning("Cannot open log file " + config.logFile + ", logging to console only");
    }
    return config;
}

void installSignalHandlers(CancellationToken& token) {
    signalToken = &token;

    struct sigaction action{};
    action.sa_handler = handleSignal;
    sigemptyset(&action.sa_mask);
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);

    std::signal(SIGPIPE, SIG_IGN);
}

int exitCodeFor(const std::exception& e) {
    const PipelineError* error = dynamic_cast<const PipelineError*>(&e);
    if (!error) {
        return 1;
    }
    switch (error->kind()) {
        case ErrorKind::InconsistentRemoteState:
        case ErrorKind::MissingShard:
        case ErrorKind::CorruptShard:
            return 2;
        case ErrorKind::Cancelled:
            return 130;
        default:
            return 1;
    }
}
