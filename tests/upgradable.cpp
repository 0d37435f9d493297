#include <asyncrw/asyncrw.hpp>

#include <gtest/gtest.h>

#include <chrono>
#include <future>
#include <vector>

using namespace std::chrono_literals;

using Lock = asyncrw::UpgradableRwLock<int>;

TEST(Upgradable, Blocking) {
    Lock lock {1};
    auto upgradable = lock.upgradableRead();
    EXPECT_EQ(*upgradable, 1);
    // readers are let in, writers and other upgraders are not
    EXPECT_TRUE(lock.tryRead());
    EXPECT_FALSE(lock.tryWrite());
    EXPECT_FALSE(lock.tryUpgradableRead());

    {
        auto reading = lock.read();
        EXPECT_FALSE(upgradable.tryUpgrade());
        EXPECT_TRUE(upgradable);
    }
    auto write = upgradable.tryUpgrade();
    ASSERT_TRUE(write);
    EXPECT_FALSE(upgradable);
    **write = 2;
    EXPECT_FALSE(lock.tryRead());

    auto read = write->downgrade();
    EXPECT_FALSE(*write);
    EXPECT_EQ(*read, 2);
    EXPECT_TRUE(lock.tryRead());
    EXPECT_FALSE(lock.tryWrite());
    read.reset();

    auto second = lock.write();
    auto again = second.downgradeToUpgradable();
    EXPECT_TRUE(lock.tryRead());
    EXPECT_FALSE(lock.tryUpgradableRead());
    auto third = again.upgrade();
    EXPECT_FALSE(again);
    *third = 3;
    third.reset();
    auto last = lock.upgradableRead().downgrade();
    EXPECT_EQ(*last, 3);
    EXPECT_TRUE(lock.tryUpgradableRead());
}

asyncrw::Task<int> upgradeAndIncrement(Lock& lock) {
    auto upgradable = co_await lock.asyncUpgradableRead();
    const int seen = *upgradable;
    auto write = co_await Lock::UpgradableReadGuard::asyncUpgrade(std::move(upgradable));
    *write = seen + 1;
    co_return *write;
}

TEST(Upgradable, LastReaderWakesUpgrader) {
    Lock lock;
    auto e = asyncrw::SerialExecutor::create();

    auto first = lock.read();
    auto second = lock.read();
    auto future = e->future(upgradeAndIncrement(lock));
    EXPECT_EQ(future.wait_for(50ms), std::future_status::timeout);
    // upgradable access was granted despite the readers
    EXPECT_FALSE(lock.tryUpgradableRead());

    first.reset();
    EXPECT_EQ(future.wait_for(50ms), std::future_status::timeout);
    second.reset();
    EXPECT_EQ(future.get(), 1);
    EXPECT_EQ(*lock.read(), 1);
}

TEST(Upgradable, WaitsForWriter) {
    Lock lock;
    auto e = asyncrw::SerialExecutor::create();

    auto write = lock.write();
    auto future = e->future(upgradeAndIncrement(lock));
    EXPECT_EQ(future.wait_for(50ms), std::future_status::timeout);
    *write = 10;
    write.reset();
    EXPECT_EQ(future.get(), 11);
}

TEST(Upgradable, SerializedUpgraders) {
    Lock lock;
    auto e = asyncrw::ThreadPoolExecutor::create(4);
    std::vector<std::future<int>> futures;
    for (int i = 0; i < 20; ++i) {
        futures.push_back(e->future(upgradeAndIncrement(lock)));
    }
    for (auto& future : futures) {
        future.get();
    }
    // no upgrader observed a value changed by another one before its upgrade
    EXPECT_EQ(*lock.read(), 20);
}

TEST(Upgradable, CancelledUpgradeReleases) {
    Lock lock;
    asyncrw::StopSource ss;
    auto e = asyncrw::SerialExecutor::create();

    auto reading = lock.read();
    auto future = e->future(upgradeAndIncrement(lock).setStopToken(ss.token()));
    EXPECT_EQ(future.wait_for(50ms), std::future_status::timeout);
    ss.requestStop();
    EXPECT_THROW(future.get(), asyncrw::StopError);
    // the upgradable access went away with the cancelled task
    EXPECT_TRUE(lock.tryUpgradableRead());
    reading.reset();
    EXPECT_TRUE(lock.tryWrite());
}

asyncrw::Task<int> readValue(Lock& lock) {
    auto guard = co_await lock.asyncRead();
    co_return *guard;
}

TEST(Upgradable, DowngradeWakesReaders) {
    Lock lock;
    auto e = asyncrw::SerialExecutor::create();

    auto write = lock.write();
    auto future = e->future(readValue(lock));
    EXPECT_EQ(future.wait_for(50ms), std::future_status::timeout);
    *write = 7;
    auto read = write.downgrade();
    EXPECT_EQ(future.get(), 7);
    EXPECT_EQ(*read, 7);
}

asyncrw::Task<bool> rawUpgrade(asyncrw::AsyncUpgradeMutex& raw) {
    auto lock = co_await asyncrw::uniqueLock(raw);
    co_return lock.owns_lock();
}

TEST(Upgradable, RawMutex) {
    asyncrw::AsyncUpgradeMutex raw;
    auto e = asyncrw::SerialExecutor::create();
    raw.lock_upgrade();
    auto future = e->future(rawUpgrade(raw));
    EXPECT_EQ(future.wait_for(50ms), std::future_status::timeout);
    raw.unlock_upgrade();
    EXPECT_TRUE(future.get());
}
