#include <gtest/gtest.h>
#include <chrono>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "state/PathLock.h"

using namespace std::chrono_literals;

namespace {

// 只记录加锁/解锁顺序, 不真正加锁
class RecordingFileState : public IFileState {
public:
  std::vector<std::string> events;
  std::string failOn;

  void lockFile(const std::string& path) override {
    if (path == failOn) throw std::runtime_error("lock failed: " + path);
    events.push_back("lock:" + path);
  }
  void unlockFile(const std::string& path) override { events.push_back("unlock:" + path); }
  void setFileLastAccessed(const std::string&, TimePoint) override {}
  void clearFileLastAccessed(const std::string&) override {}
  std::optional<TimePoint> getFileLastAccessed(const std::string&) const override { return std::nullopt; }
};

// 在拿到指定路径的锁之后通知测试, 并停顿一会儿让另一个线程去抢锁
class GatedFileState : public BasicFileState {
public:
  std::string gatePath;
  std::promise<void> gateReached;
  bool gateFired = false;

  void lockFile(const std::string& path) override {
    BasicFileState::lockFile(path);
    if (path == gatePath && !gateFired) {
      gateFired = true;
      gateReached.set_value();
      std::this_thread::sleep_for(50ms);
    }
  }
};

// 在分离的线程中运行 job; 测试只等待返回的 future, 超时即失败而不会卡住。
// job 捕获的状态必须由 shared_ptr 持有, 线程可能比测试活得久。
std::future<void> runDetached(std::function<void()> job) {
  auto done = std::make_shared<std::promise<void>>();
  std::future<void> finished = done->get_future();
  std::thread([job = std::move(job), done] {
    try {
      job();
      done->set_value();
    } catch (...) {
      done->set_exception(std::current_exception());
    }
  }).detach();
  return finished;
}

}  // namespace

TEST(PathLock, LocksInSortedOrderAndReleasesInReverse) {
  RecordingFileState state;
  {
    auto guard = lockPaths(state, {"/w/b", "/w/a", "/w/b", ""});
    EXPECT_EQ(guard.paths(), std::vector<std::string>({"/w/a", "/w/b"}));
    EXPECT_EQ(state.events, std::vector<std::string>({"lock:/w/a", "lock:/w/b"}));
  }
  EXPECT_EQ(state.events,
            std::vector<std::string>({"lock:/w/a", "lock:/w/b", "unlock:/w/b", "unlock:/w/a"}));
}

TEST(PathLock, EmptyPathListLocksNothing) {
  RecordingFileState state;
  {
    auto guard = lockPaths(state, {"", ""});
    EXPECT_TRUE(guard.paths().empty());
  }
  EXPECT_TRUE(state.events.empty());
}

TEST(PathLock, ReleasesWhenScopeExitsByException) {
  RecordingFileState state;
  try {
    auto guard = lockPaths(state, {"/w/x", "/w/y"});
    throw std::runtime_error("boom");
  } catch (const std::runtime_error&) {
  }
  EXPECT_EQ(state.events,
            std::vector<std::string>({"lock:/w/x", "lock:/w/y", "unlock:/w/y", "unlock:/w/x"}));
}

TEST(PathLock, PartialAcquisitionIsRolledBack) {
  RecordingFileState state;
  state.failOn = "/w/c";
  EXPECT_THROW(lockPaths(state, {"/w/c", "/w/a", "/w/b"}), std::runtime_error);
  EXPECT_EQ(state.events, std::vector<std::string>(
                              {"lock:/w/a", "lock:/w/b", "unlock:/w/b", "unlock:/w/a"}));
}

TEST(PathLock, MovedGuardUnlocksOnce) {
  RecordingFileState state;
  {
    auto first = lockPaths(state, {"/w/a"});
    PathLockGuard second(std::move(first));
    EXPECT_EQ(second.paths().size(), 1u);
  }
  EXPECT_EQ(state.events, std::vector<std::string>({"lock:/w/a", "unlock:/w/a"}));
}

TEST(PathLock, OpposingRequestOrdersDoNotDeadlock) {
  struct Shared {
    GatedFileState state;
    std::mutex orderMtx;
    std::vector<std::string> order;
  };
  auto shared = std::make_shared<Shared>();
  shared->state.gatePath = "/w/a";
  std::future<void> gate = shared->state.gateReached.get_future();

  std::future<void> first = runDetached([shared] {
    auto guard = lockPaths(shared->state, {"/w/a", "/w/b"});
    std::lock_guard<std::mutex> lock(shared->orderMtx);
    shared->order.push_back("first");
  });

  ASSERT_EQ(gate.wait_for(5s), std::future_status::ready);
  std::future<void> second = runDetached([shared] {
    auto guard = lockPaths(shared->state, {"/w/b", "/w/a"});
    std::lock_guard<std::mutex> lock(shared->orderMtx);
    shared->order.push_back("second");
  });

  ASSERT_EQ(first.wait_for(5s), std::future_status::ready) << "first locker is stuck";
  ASSERT_EQ(second.wait_for(5s), std::future_status::ready) << "second locker is stuck";
  first.get();
  second.get();
  std::lock_guard<std::mutex> lock(shared->orderMtx);
  EXPECT_EQ(shared->order, std::vector<std::string>({"first", "second"}));
}

TEST(PathLock, ConcurrentOverlappingLocksSerializeWork) {
  struct Shared {
    BasicFileState state;
    int counter = 0;
  };
  auto shared = std::make_shared<Shared>();
  const int iterations = 2000;

  auto worker = [shared, iterations](std::vector<std::string> paths) {
    return [shared, iterations, paths] {
      for (int i = 0; i < iterations; ++i) {
        auto guard = lockPaths(shared->state, paths);
        ++shared->counter;
      }
    };
  };

  std::future<void> a = runDetached(worker({"/w/a", "/w/b"}));
  std::future<void> b = runDetached(worker({"/w/b", "/w/a"}));
  std::future<void> c = runDetached(worker({"/w/a"}));

  ASSERT_EQ(a.wait_for(30s), std::future_status::ready);
  ASSERT_EQ(b.wait_for(30s), std::future_status::ready);
  ASSERT_EQ(c.wait_for(30s), std::future_status::ready);
  a.get();
  b.get();
  c.get();
  EXPECT_EQ(shared->counter, 3 * iterations);
}
