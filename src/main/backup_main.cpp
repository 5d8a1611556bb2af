#include "main/backup_main.hpp"
#include "backup/backup_cli.hpp"
#include "common/cancellation.hpp"
#include "common/logger.hpp"
#include "main/cli_options.hpp"
#include <iostream>

void printBackupUsage() {
    std::cout << "Backup commands:\n"
              << "  snapshard backup <dataset[@snapshot]> [options]\n"
              << "      Stream a snapshot into encrypted shards, resuming an interrupted run\n"
              << "  snapshard list <dataset> [options]\n"
              << "      List backups stored for a dataset\n"
              << "  snapshard status <dataset> <backupPrefix> [options]\n"
              << "      Show the shards of one backup and whether it is complete\n"
              << "  snapshard clean <dataset> <backupPrefix> --yes [options]\n"
              << "      Delete every shard and sidecar of one backup\n"
              << "  snapshard verify-stream <dataset@snapshot> [--since <snapshot>]\n"
              << "      Export twice and compare digests\n"
              << "\n"
              << "Options:\n"
              << "  -c, --config <file>      Configuration file\n"
              << "  -r, --remote <name>      Remote from the configuration (default: defaultRemote)\n"
              << "  -d, --dest <path>        Remote destination path (default: dataset with / as _)\n"
              << "  -s, --shard-size <size>  Shard size, e.g. 512M or 2G\n"
              << "      --since <snapshot>   Incremental base snapshot\n"
              << "      --full               Ignore previous snapshots and send a full stream\n"
              << "      --prefix <name>      Backup prefix override\n"
              << "      --source-type <t>    zfs (default) or file\n"
              << "  -y, --yes                Confirm destructive commands\n"
              << "  -v, --verbose            Debug logging\n"
              << "  -h, --help               Show this help message\n";
}

int backupMain(int argc, char* argv[]) {
    if (argc < 1) {
        printBackupUsage();
        return 1;
    }

    CliOptions options = parseCliOptions(argc - 1, argv + 1);
    if (options.help) {
        printBackupUsage();
        return 0;
    }

    AppConfig config = loadCliConfig(options);
    CancellationToken cancel;
    installSignalHandlers(cancel);

    BackupCLI cli(config, cancel);
    return cli.run(argc, argv);
}
