#include <asyncrw/asyncrw.hpp>

#include <gtest/gtest.h>

#include <chrono>
#include <future>
#include <thread>
#include <vector>

using Clock = std::chrono::steady_clock;

asyncrw::Task<Clock::duration> measure(uint32_t ms) {
    const auto start = Clock::now();
    co_await asyncrw::sleep(ms);
    co_return Clock::now() - start;
}

TEST(Sleep, Duration) {
    using namespace std::chrono_literals;
    auto e = asyncrw::SerialExecutor::create();
    EXPECT_GE(e->syncWait(measure(50)), 50ms);
}

TEST(Sleep, DoesNotBlockExecutor) {
    using namespace std::chrono_literals;
    auto e = asyncrw::SerialExecutor::create();
    const auto start = Clock::now();
    std::vector<std::future<Clock::duration>> futures;
    for (int i = 0; i < 10; ++i) {
        futures.push_back(e->future(measure(100)));
    }
    for (auto& future : futures) {
        future.wait();
    }
    // the sleeps overlap on the single executor thread
    EXPECT_LT(Clock::now() - start, 900ms);
}

TEST(Sleep, Order) {
    auto e = asyncrw::SerialExecutor::create();
    std::vector<int> order;
    auto sleeper = [](std::vector<int>& order, int id, uint32_t ms) -> asyncrw::Task<void> {
        co_await asyncrw::sleep(ms);
        order.push_back(id);
    };
    auto f1 = e->future(sleeper(order, 1, 150));
    auto f2 = e->future(sleeper(order, 2, 50));
    auto f3 = e->future(sleeper(order, 3, 100));
    f1.get();
    f2.get();
    f3.get();
    EXPECT_EQ(order, (std::vector<int> {2, 3, 1}));
}

TEST(Sleep, InterruptedByStop) {
    using namespace std::chrono_literals;
    asyncrw::StopSource ss;
    auto e = asyncrw::SerialExecutor::create();
    const auto start = Clock::now();
    auto future = e->future(measure(5000).setStopToken(ss.token()));
    std::this_thread::sleep_for(50ms);
    ss.requestStop();
    EXPECT_THROW(future.get(), asyncrw::StopError);
    EXPECT_LT(Clock::now() - start, 2s);
}
