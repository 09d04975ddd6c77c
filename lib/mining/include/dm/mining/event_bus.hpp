/*
Module Name:
- event_bus.hpp

Abstract:
- Named topics carrying realtime progress events from the push subscriber to
  the engine. Handlers run on a supplied Asio executor so publish() can be
  called from any thread, including the subscriber's own strand.
- Topics are keyed without allocations via transparent hashing.
*/
#pragma once

// C++ Standard Library
#include <cstdint>
#include <functional>
#include <mutex>
#include <string_view>
#include <vector>

// Boost.Asio
#include <boost/asio/any_io_executor.hpp>

// Project
#include <dm/mining/model.hpp>
#include <dm/utils/transparent_string_hash.hpp>

namespace drop_miner
{

    inline constexpr std::string_view k_drop_progress_topic = "drop-progress";

    using progress_handler_t = std::function<void(const ProgressEvent&)>;

    class EventBus
    {
    public:
        using subscription_id = std::uint64_t;

        explicit EventBus(boost::asio::any_io_executor executor);

        EventBus(const EventBus&) = delete;
        EventBus& operator=(const EventBus&) = delete;

        // Returns a non-zero id for unsubscribe().
        [[nodiscard]] subscription_id subscribe(std::string_view topic, progress_handler_t handler);

        // Unknown ids are ignored.
        void unsubscribe(subscription_id id);

        // Posts one invocation per current subscriber; returns immediately.
        void publish(std::string_view topic, ProgressEvent event);

        [[nodiscard]] std::size_t subscriber_count(std::string_view topic) const;

    private:
        struct Entry
        {
            subscription_id id;
            progress_handler_t handler;
        };

        boost::asio::any_io_executor executor_;
        mutable std::mutex mutex_; // protects topics_ and next_id_
        dm::StringMap<std::vector<Entry>> topics_;
        subscription_id next_id_{ 1 };
    };

} // namespace drop_miner
