/*
Module Name:
- event_bus.cpp

Abstract:
- Handlers are copied out under the lock and invoked on the executor, so a
  handler may subscribe or unsubscribe without deadlocking the bus.
- A throwing handler is logged and never reaches the publisher.
*/

// C++ Standard Library
#include <algorithm>
#include <exception>
#include <iostream>
#include <utility>

// Boost.Asio
#include <boost/asio/post.hpp>

// Project
#include <dm/mining/event_bus.hpp>

namespace drop_miner
{

    EventBus::EventBus(boost::asio::any_io_executor executor) :
        executor_(std::move(executor))
    {
        topics_.reserve(4);
    }

    EventBus::subscription_id EventBus::subscribe(std::string_view topic, progress_handler_t handler)
    {
        std::lock_guard lk(mutex_);
        const auto id = next_id_++;
        auto [it, inserted] = topics_.try_emplace(std::string{ topic });
        it->second.push_back(Entry{ id, std::move(handler) });
        return id;
    }

    void EventBus::unsubscribe(subscription_id id)
    {
        std::lock_guard lk(mutex_);
        for (auto& [topic, entries] : topics_)
        {
            auto it = std::remove_if(entries.begin(), entries.end(), [id](const Entry& e) { return e.id == id; });
            if (it != entries.end())
            {
                entries.erase(it, entries.end());
                return;
            }
        }
    }

    void EventBus::publish(std::string_view topic, ProgressEvent event)
    {
        std::vector<progress_handler_t> targets;
        {
            std::lock_guard lk(mutex_);
            auto it = topics_.find(topic);
            if (it == topics_.end())
            {
                return;
            }
            targets.reserve(it->second.size());
            for (const auto& e : it->second)
            {
                targets.push_back(e.handler);
            }
        }

        for (auto& handler : targets)
        {
            boost::asio::post(executor_, [handler = std::move(handler), event, name = std::string{ topic }]() {
                try
                {
                    handler(event);
                }
                catch (const std::exception& e)
                {
                    std::cerr << "[EventBus] handler for '" << name << "' threw: " << e.what() << '\n';
                }
            });
        }
    }

    std::size_t EventBus::subscriber_count(std::string_view topic) const
    {
        std::lock_guard lk(mutex_);
        auto it = topics_.find(topic);
        return it == topics_.end() ? 0 : it->second.size();
    }

} // namespace drop_miner
