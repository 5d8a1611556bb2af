#include <gtest/gtest.h>
#include "common/file_lock.hpp"
#include "common/temp_file.hpp"
#include "test_helpers.hpp"
#include <filesystem>

using namespace testing_support;

TEST(FileLockTest, SecondHolderIsRefused) {
    ScopedTempDir dir;
    FileLock first(dir.path(), "tank/data");
    FileLock second(dir.path(), "tank/data");

    ASSERT_TRUE(first.tryLock());
    EXPECT_TRUE(first.isLocked());
    EXPECT_FALSE(second.tryLock());

    first.unlock();
    EXPECT_TRUE(second.tryLock());
}

TEST(FileLockTest, DifferentResourcesDoNotConflict) {
    ScopedTempDir dir;
    FileLock a(dir.path(), "tank/a");
    FileLock b(dir.path(), "tank/b");
    EXPECT_TRUE(a.tryLock());
    EXPECT_TRUE(b.tryLock());
    EXPECT_NE(a.path(), b.path());
}

TEST(FileLockTest, ReleasedOnDestruction) {
    ScopedTempDir dir;
    {
        FileLock held(dir.path(), "tank/data@snap");
        ASSERT_TRUE(held.tryLock());
    }
    FileLock next(dir.path(), "tank/data@snap");
    EXPECT_TRUE(next.tryLock());
}

TEST(FileLockTest, LockFileNameIsFlat) {
    EXPECT_EQ(FileLock::lockFileName("tank/data@snap"), "tank_data_snap.lock");
}

TEST(TempFileTest, RemovedWithOwner) {
    ScopedTempDir dir;
    std::string path;
    {
        TempFile file(dir.path(), "shard");
        path = file.path();
        EXPECT_TRUE(std::filesystem::exists(path));
        EXPECT_EQ(file.size(), 0u);
    }
    EXPECT_FALSE(std::filesystem::exists(path));
}
