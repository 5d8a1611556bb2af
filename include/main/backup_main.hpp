#pragma once

// Print the backup-side command usage
void printBackupUsage();

// Entry point for backup, list, status, clean and verify-stream.
// argv[0] is the command name.
int backupMain(int argc, char* argv[]);
