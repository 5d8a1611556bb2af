#include <gtest/gtest.h>
#include "backup/snapshot_manager.hpp"
#include "test_helpers.hpp"
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <fstream>

using namespace testing_support;

namespace {

// Installs a shell script standing in for the zfs binary.
std::string writeFakeZfs(const ScopedTempDir& dir, const std::string& body) {
    std::string path = dir.file("zfs");
    std::ofstream(path) << "#!/bin/sh\n" << body;
    std::filesystem::permissions(path, std::filesystem::perms::owner_all);
    return path;
}

} // namespace

TEST(SnapshotManagerTest, NamesSnapshotsByTime) {
    setenv("TZ", "UTC", 1);
    tzset();
    // 2024-01-01T02:00:00Z
    EXPECT_EQ(SnapshotManager::makeSnapshotName("auto", 1704074400), "auto-20240101-020000");
}

TEST(SnapshotManagerTest, ParsesListKeepingOwnSnapshots) {
    const std::string output =
        "tank/data@auto-20240102-020000\t1704160800\n"
        "tank/data@manual\t1704100000\n"
        "tank/data@auto-20240101-020000\t1704074400\n"
        "tank/data/child@auto-20240101-020000\t1704074400\n"
        "tank/database@auto-20240101-020000\t1704074400\n"
        "tank/data@auto-broken\tnot-a-number\n";

    std::vector<SnapshotInfo> snapshots = SnapshotManager::parseSnapshotList(output, "tank/data", "auto");
    ASSERT_EQ(snapshots.size(), 2u);
    EXPECT_EQ(snapshots[0].name, "tank/data@auto-20240101-020000");
    EXPECT_EQ(snapshots[0].creation, 1704074400);
    EXPECT_EQ(snapshots[1].name, "tank/data@auto-20240102-020000");
}

TEST(SnapshotManagerTest, FindsPreviousSnapshot) {
    ScopedTempDir dir;
    std::string zfs = writeFakeZfs(dir,
        "printf 'tank/data@auto-1\\t100\\ntank/data@auto-2\\t200\\ntank/data@auto-3\\t300\\n'\n");
    SnapshotManager manager("auto", zfs);

    EXPECT_EQ(manager.previousSnapshot("tank/data", "tank/data@auto-3"), "tank/data@auto-2");
    EXPECT_FALSE(manager.previousSnapshot("tank/data", "tank/data@auto-1").has_value());
    EXPECT_EQ(manager.previousSnapshot("tank/data", "tank/data@other"), "tank/data@auto-3");
}

TEST(SnapshotManagerTest, ReportsExistenceFromExitStatus) {
    ScopedTempDir dir;
    std::string zfs = writeFakeZfs(dir,
        "for last; do :; done\n"
        "[ \"$last\" = \"tank/data@auto-1\" ] && exit 0\n"
        "exit 1\n");
    SnapshotManager manager("auto", zfs);

    EXPECT_TRUE(manager.snapshotExists("tank/data@auto-1"));
    EXPECT_FALSE(manager.snapshotExists("tank/data@auto-2"));
}

TEST(SnapshotManagerTest, ReadsUsedBytes) {
    ScopedTempDir dir;
    SnapshotManager good("auto", writeFakeZfs(dir, "echo 123456789\n"));
    EXPECT_EQ(good.datasetUsedBytes("tank/data"), 123456789u);

    ScopedTempDir other;
    SnapshotManager failing("auto", writeFakeZfs(other, "exit 1\n"));
    EXPECT_FALSE(failing.datasetUsedBytes("tank/data").has_value());
}

TEST(SnapshotManagerTest, PruneKeepsNewestAndRecent) {
    ScopedTempDir dir;
    std::string log = dir.file("destroyed");
    std::string zfs = writeFakeZfs(dir,
        "if [ \"$1\" = destroy ]; then echo \"$2\" >> '" + log + "'; exit 0; fi\n"
        "printf 'tank/data@auto-1\\t100\\ntank/data@auto-2\\t200\\ntank/data@auto-3\\t300\\n'\n");
    SnapshotManager manager("auto", zfs);

    // Cutoff at 250: auto-1 and auto-2 are old, auto-3 is the newest.
    int destroyed = manager.pruneSnapshots("tank/data", 1, 250 + 86400);
    EXPECT_EQ(destroyed, 2);

    std::ifstream in(log);
    std::string first;
    std::string second;
    std::string third;
    std::getline(in, first);
    std::getline(in, second);
    EXPECT_EQ(first, "tank/data@auto-1");
    EXPECT_EQ(second, "tank/data@auto-2");
    EXPECT_FALSE(std::getline(in, third));
}
