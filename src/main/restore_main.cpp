#include "main/restore_main.hpp"
#include "common/cancellation.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "main/cli_options.hpp"
#include "restore/restore_manager.hpp"
#include "restore/stream_sink.hpp"
#include "storage/remote_store_factory.hpp"
#include <iostream>

void printRestoreUsage() {
    std::cout << "Restore command:\n"
              << "  snapshard restore <destinationPath> <backupPrefix> [target] [options]\n"
              << "      Download, verify and replay every shard of a backup in order\n"
              << "\n"
              << "Options:\n"
              << "  -c, --config <file>      Configuration file\n"
              << "  -r, --remote <name>      Remote from the configuration\n"
              << "      --sink-type <t>      zfs (default, receives into a dataset) or file\n"
              << "  -f, --force              Replace an existing target dataset\n"
              << "  -v, --verbose            Debug logging\n"
              << "  -h, --help               Show this help message\n";
}

int restoreMain(int argc, char* argv[]) {
    CliOptions options = parseCliOptions(argc - 1, argv + 1);
    if (options.help) {
        printRestoreUsage();
        return 0;
    }
    if (options.positional.size() < 2 || options.positional.size() > 3) {
        printRestoreUsage();
        return 1;
    }

    AppConfig config = loadCliConfig(options);
    if (config.encryption.identityKeyFile.empty()) {
        throw ConfigurationError("No identity key configured (encryption.identityKeyFile or SNAPSHARD_IDENTITY_KEY)");
    }

    CancellationToken cancel;
    installSignalHandlers(cancel);

    std::shared_ptr<ShardDecoder> decoder;
    try {
        decoder = std::make_shared<ShardDecoder>(IdentityKey::loadPem(config.encryption.identityKeyFile));
    } catch (const CodecError& e) {
        throw ConfigurationError(e.what());
    }

    std::shared_ptr<StreamSinkFactory> sinks;
    std::shared_ptr<SnapshotManager> snapshots;
    if (options.sinkType == "file") {
        sinks = std::make_shared<FileSinkFactory>();
    } else if (options.sinkType == "zfs") {
        sinks = std::make_shared<ZfsReceiveSinkFactory>();
        snapshots = std::make_shared<SnapshotManager>(config.snapshots.prefix);
    } else {
        throw ConfigurationError("Unknown sink type: " + options.sinkType);
    }

    RemoteStoreRegistry remotes(config);
    RestoreManager manager(config, remotes.get(options.remote), sinks, snapshots, decoder);

    RestoreRequest request;
    request.destinationPath = options.positional[0];
    request.backupPrefix = options.positional[1];
    if (options.positional.size() == 3) {
        request.target = options.positional[2];
    }
    request.force = options.force;

    RestoreResult result = manager.restore(request, &cancel);
    std::cout << "Restored " << request.backupPrefix << ": " << result.shardsRestored << " shards, "
              << result.bytesRestored << " bytes" << std::endl;
    return 0;
}
