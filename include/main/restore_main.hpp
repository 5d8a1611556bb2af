#pragma once

void printRestoreUsage();

// argv[0] is "restore".
int restoreMain(int argc, char* argv[]);
