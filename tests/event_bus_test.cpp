// C++ Standard Library
#include <stdexcept>
#include <vector>

// GoogleTest
#include <gtest/gtest.h>

// Boost.Asio
#include <boost/asio/io_context.hpp>

// Project
#include <dm/mining/event_bus.hpp>
#include <dm/mining/loop_timer.hpp>

#include "fakes.hpp"

using namespace drop_miner;
using namespace drop_miner::fakes;

TEST(EventBus, DeliversToEverySubscriberOnTheExecutor)
{
    boost::asio::io_context io;
    EventBus bus{ io.get_executor() };
    std::vector<int> first;
    std::vector<int> second;

    (void)bus.subscribe(k_drop_progress_topic, [&](const ProgressEvent& e) { first.push_back(e.current_minutes); });
    (void)bus.subscribe(k_drop_progress_topic, [&](const ProgressEvent& e) { second.push_back(e.current_minutes); });
    EXPECT_EQ(bus.subscriber_count(k_drop_progress_topic), 2u);

    bus.publish(k_drop_progress_topic, ProgressEvent{ "d1", 12, 60 });
    EXPECT_TRUE(first.empty());

    io.run();
    EXPECT_EQ(first, (std::vector<int>{ 12 }));
    EXPECT_EQ(second, (std::vector<int>{ 12 }));
}

TEST(EventBus, UnsubscribedHandlersStopReceiving)
{
    boost::asio::io_context io;
    EventBus bus{ io.get_executor() };
    int calls = 0;

    const auto id = bus.subscribe(k_drop_progress_topic, [&](const ProgressEvent&) { ++calls; });
    EXPECT_NE(id, 0u);
    bus.unsubscribe(id);
    bus.unsubscribe(id + 100);

    bus.publish(k_drop_progress_topic, ProgressEvent{ "d1", 1, 60 });
    io.run();
    EXPECT_EQ(calls, 0);
    EXPECT_EQ(bus.subscriber_count(k_drop_progress_topic), 0u);
}

TEST(EventBus, UnknownTopicIsIgnored)
{
    boost::asio::io_context io;
    EventBus bus{ io.get_executor() };
    int calls = 0;

    (void)bus.subscribe("other", [&](const ProgressEvent&) { ++calls; });
    bus.publish(k_drop_progress_topic, ProgressEvent{ "d1", 1, 60 });
    io.run();
    EXPECT_EQ(calls, 0);
}

TEST(EventBus, ThrowingHandlerDoesNotStopOthers)
{
    boost::asio::io_context io;
    EventBus bus{ io.get_executor() };
    int calls = 0;

    (void)bus.subscribe(k_drop_progress_topic, [](const ProgressEvent&) { throw std::runtime_error("boom"); });
    (void)bus.subscribe(k_drop_progress_topic, [&](const ProgressEvent&) { ++calls; });

    bus.publish(k_drop_progress_topic, ProgressEvent{ "d1", 1, 60 });
    EXPECT_NO_THROW(io.run());
    EXPECT_EQ(calls, 1);
}

TEST(LoopTimer, CancelledTimerNeverSleepsAgain)
{
    boost::asio::io_context io;
    auto timer = std::make_shared<LoopTimer>(io.get_executor());

    EXPECT_TRUE(run_sync(io, timer->sleep(std::chrono::milliseconds{ 1 })));
    timer->cancel();
    EXPECT_FALSE(run_sync(io, timer->sleep(std::chrono::hours{ 1 })));
}
