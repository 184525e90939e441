#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <thread>

#include "state/FileState.h"

using namespace std::chrono_literals;

TEST(BasicFileState, LastAccessedRoundTrip) {
  BasicFileState state;
  EXPECT_FALSE(state.getFileLastAccessed("/w/a.txt").has_value());

  const auto when = std::chrono::system_clock::now();
  state.setFileLastAccessed("/w/a.txt", when);
  ASSERT_TRUE(state.getFileLastAccessed("/w/a.txt").has_value());
  EXPECT_EQ(*state.getFileLastAccessed("/w/a.txt"), when);

  const auto later = when + 5s;
  state.setFileLastAccessed("/w/a.txt", later);
  EXPECT_EQ(*state.getFileLastAccessed("/w/a.txt"), later);

  state.clearFileLastAccessed("/w/a.txt");
  EXPECT_FALSE(state.getFileLastAccessed("/w/a.txt").has_value());
}

TEST(BasicFileState, SnapshotListsAllEntries) {
  BasicFileState state;
  const auto now = std::chrono::system_clock::now();
  state.setFileLastAccessed("/w/b", now);
  state.setFileLastAccessed("/w/a", now);

  auto snapshot = state.fileLastAccess();
  ASSERT_EQ(snapshot.size(), 2u);
  EXPECT_EQ(snapshot.begin()->first, "/w/a");

  state.clearFileLastAccessed("/w/a");
  EXPECT_EQ(snapshot.size(), 2u);
  EXPECT_EQ(state.fileLastAccess().size(), 1u);
}

TEST(BasicFileState, UnlockingUnknownPathIsNoOp) {
  BasicFileState state;
  state.unlockFile("/never/locked");
  state.lockFile("/w/a");
  state.unlockFile("/w/a");
}

TEST(BasicFileState, LockExcludesOtherThreads) {
  BasicFileState state;
  std::atomic<bool> acquired{false};

  state.lockFile("/w/a");
  std::thread other([&] {
    state.lockFile("/w/a");
    acquired = true;
    state.unlockFile("/w/a");
  });

  std::this_thread::sleep_for(50ms);
  EXPECT_FALSE(acquired.load());
  state.unlockFile("/w/a");
  other.join();
  EXPECT_TRUE(acquired.load());
}

TEST(BasicFileState, DistinctPathsDoNotBlockEachOther) {
  BasicFileState state;
  std::atomic<bool> acquired{false};

  state.lockFile("/w/a");
  std::thread other([&] {
    state.lockFile("/w/b");
    acquired = true;
    state.unlockFile("/w/b");
  });
  other.join();
  EXPECT_TRUE(acquired.load());
  state.unlockFile("/w/a");
}
