#include <asyncrw/asyncrw.hpp>

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

using Raw = asyncrw::AsyncRawRwLock<>;

static_assert(asyncrw::SharedLockable<Raw>);
static_assert(asyncrw::AsyncLockable<Raw>);
static_assert(asyncrw::UpgradeLockable<Raw>);
static_assert(asyncrw::UpgradeLockable<asyncrw::AsyncUpgradeMutex>);
static_assert(!asyncrw::UpgradeLockable<asyncrw::AsyncRawRwLock<std::shared_mutex>>);

TEST(RawRwLock, StdLocks) {
    Raw raw;
    {
        std::unique_lock lock {raw};
        EXPECT_FALSE(raw.try_lock_shared());
        EXPECT_FALSE(raw.try_lock());
    }
    {
        std::shared_lock first {raw};
        std::shared_lock second {raw};
        EXPECT_FALSE(raw.try_lock());
        EXPECT_TRUE(raw.try_lock_shared());
        raw.unlock_shared();
    }
    {
        std::scoped_lock lock {raw};
        EXPECT_FALSE(raw.try_lock_shared());
    }
    EXPECT_TRUE(raw.try_lock());
    raw.unlock();
}

TEST(RawRwLock, ReleasedOnAnotherThread) {
    Raw raw;
    std::thread([&raw] { EXPECT_TRUE(raw.try_lock()); }).join();
    EXPECT_FALSE(raw.try_lock_shared());
    std::thread([&raw] { raw.unlock(); }).join();
    EXPECT_TRUE(raw.try_lock());
    raw.unlock();

    std::thread([&raw] { EXPECT_TRUE(raw.try_lock_shared()); }).join();
    EXPECT_FALSE(raw.try_lock());
    std::thread([&raw] { raw.unlock_shared(); }).join();
    EXPECT_TRUE(raw.try_lock());
    raw.unlock();
}

TEST(RawRwLock, CreateAndDestroy) {
    for (int i = 0; i < 1000; ++i) {
        Raw unused;
    }
    for (int i = 0; i < 1000; ++i) {
        auto raw = std::make_unique<Raw>();
        raw->lock_shared();
        raw->unlock_shared();
        raw->lock();
        raw->unlock();
        EXPECT_FALSE(raw->notify_one());
    }
}

asyncrw::Task<int> exclusive(Raw& raw, int& value) {
    auto lock = co_await asyncrw::uniqueLock(raw);
    EXPECT_TRUE(lock.owns_lock());
    co_return ++value;
}

asyncrw::Task<int> shared(Raw& raw, const int& value) {
    auto lock = co_await asyncrw::sharedLock(raw);
    EXPECT_TRUE(lock.owns_lock());
    co_return value;
}

TEST(RawRwLock, FreeLock) {
    Raw raw;
    int value = 0;
    auto e = asyncrw::SerialExecutor::create();
    EXPECT_EQ(e->syncWait(exclusive(raw, value)), 1);
    EXPECT_EQ(e->syncWait(shared(raw, value)), 1);
    EXPECT_TRUE(raw.try_lock());
    raw.unlock();
}

TEST(RawRwLock, WokenOnRelease) {
    Raw raw;
    int value = 0;
    auto e = asyncrw::SerialExecutor::create();

    raw.lock();
    auto future = e->future(exclusive(raw, value));
    EXPECT_EQ(future.wait_for(50ms), std::future_status::timeout);
    raw.unlock();
    EXPECT_EQ(future.get(), 1);
}

TEST(RawRwLock, WriterWaitsForReaders) {
    Raw raw;
    int value = 0;
    auto e = asyncrw::ThreadPoolExecutor::create(2);

    raw.lock_shared();
    raw.lock_shared();
    auto future = e->future(exclusive(raw, value));
    EXPECT_EQ(future.wait_for(50ms), std::future_status::timeout);
    raw.unlock_shared();
    EXPECT_EQ(future.wait_for(50ms), std::future_status::timeout);
    raw.unlock_shared();
    EXPECT_EQ(future.get(), 1);
}

TEST(RawRwLock, SpuriousWakeup) {
    Raw raw;
    int value = 0;
    auto e = asyncrw::SerialExecutor::create();

    raw.lock();
    auto future = e->future(exclusive(raw, value));
    EXPECT_EQ(future.wait_for(50ms), std::future_status::timeout);

    // the lock is still held, the task fails again and registers a new waker
    EXPECT_TRUE(raw.notify_one());
    EXPECT_EQ(future.wait_for(50ms), std::future_status::timeout);
    raw.notify_all();
    EXPECT_EQ(future.wait_for(50ms), std::future_status::timeout);
    EXPECT_EQ(value, 0);

    raw.unlock();
    EXPECT_EQ(future.get(), 1);
}

TEST(RawRwLock, CancelledWaiter) {
    Raw raw;
    int value = 0;
    auto e = asyncrw::SerialExecutor::create();
    asyncrw::StopSource ss;

    raw.lock();
    auto cancelled = e->future(exclusive(raw, value).setStopToken(ss.token()));
    EXPECT_EQ(cancelled.wait_for(50ms), std::future_status::timeout);
    auto live = e->future(exclusive(raw, value));
    EXPECT_EQ(live.wait_for(50ms), std::future_status::timeout);

    ss.requestStop();
    EXPECT_THROW(cancelled.get(), asyncrw::StopError);

    // the waker of the cancelled task is first in the queue, the release must skip it
    raw.unlock();
    EXPECT_EQ(live.get(), 1);
    EXPECT_EQ(value, 1);
}

asyncrw::Task<void> block(std::promise<void>& started, std::shared_future<void> release) {
    started.set_value();
    release.wait();
    co_return;
}

TEST(RawRwLock, WokenThenCancelledWaiter) {
    Raw raw;
    int value = 0;
    auto e = asyncrw::SerialExecutor::create();
    asyncrw::StopSource ss;

    raw.lock();
    auto cancelled = e->future(exclusive(raw, value).setStopToken(ss.token()));
    auto live = e->future(exclusive(raw, value));
    EXPECT_EQ(live.wait_for(50ms), std::future_status::timeout);

    // keep the executor busy, so the first waiter is woken but can't run before the stop request
    std::promise<void> started;
    std::promise<void> release;
    auto blocker = e->future(block(started, release.get_future().share()));
    started.get_future().wait();

    raw.unlock();
    ss.requestStop();
    release.set_value();
    blocker.get();

    EXPECT_THROW(cancelled.get(), asyncrw::StopError);
    // the wake up taken by the cancelled task must reach the other waiter
    ASSERT_EQ(live.wait_for(5s), std::future_status::ready);
    EXPECT_EQ(live.get(), 1);
    EXPECT_TRUE(raw.try_lock());
    raw.unlock();
}

asyncrw::Task<int> reader(Raw& raw, std::atomic<int>& inside) {
    auto lock = co_await asyncrw::sharedLock(raw);
    ++inside;
    // hold the lock until all the readers are in
    for (int i = 0; i < 200 && inside < 3; ++i) {
        co_await asyncrw::sleep(5);
    }
    co_return inside.load();
}

TEST(RawRwLock, ReleaseWakesAllQueuedReaders) {
    Raw raw;
    std::atomic<int> inside = 0;
    auto e = asyncrw::SerialExecutor::create();

    raw.lock();
    std::vector<std::future<int>> futures;
    for (int i = 0; i < 3; ++i) {
        futures.push_back(e->future(reader(raw, inside)));
    }
    EXPECT_EQ(futures.back().wait_for(50ms), std::future_status::timeout);
    raw.unlock();
    for (auto& future : futures) {
        ASSERT_EQ(future.wait_for(10s), std::future_status::ready);
        EXPECT_EQ(future.get(), 3);
    }
}

TEST(RawRwLock, Stress) {
    Raw raw;
    int value = 0;
    std::atomic<int> readers = 0;
    auto e = asyncrw::ThreadPoolExecutor::create(4);

    auto writer = [](Raw& raw, int& value, std::atomic<int>& readers) -> asyncrw::Task<void> {
        for (int i = 0; i < 200; ++i) {
            auto lock = co_await asyncrw::uniqueLock(raw);
            EXPECT_EQ(readers.load(), 0);
            ++value;
        }
    };
    auto reader = [](Raw& raw, const int& value, std::atomic<int>& readers) -> asyncrw::Task<void> {
        for (int i = 0; i < 200; ++i) {
            auto lock = co_await asyncrw::sharedLock(raw);
            ++readers;
            EXPECT_GE(value, 0);
            --readers;
        }
    };

    std::vector<std::future<void>> futures;
    for (int i = 0; i < 8; ++i) {
        futures.push_back(e->future(writer(raw, value, readers)));
        futures.push_back(e->future(reader(raw, value, readers)));
    }
    const auto deadline = std::chrono::steady_clock::now() + 30s;
    for (auto& future : futures) {
        ASSERT_EQ(future.wait_until(deadline), std::future_status::ready);
        future.get();
    }
    EXPECT_EQ(value, 1600);
}
