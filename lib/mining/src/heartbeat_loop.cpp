// C++ Standard Library
#include <iostream>
#include <utility>

// Project
#include <dm/mining/errors.hpp>
#include <dm/mining/heartbeat_loop.hpp>

namespace drop_miner
{

    std::string_view to_string(HeartbeatState state) noexcept
    {
        switch (state)
        {
        case HeartbeatState::idle:
            return "idle";
        case HeartbeatState::watching:
            return "watching";
        case HeartbeatState::failing:
            return "failing";
        case HeartbeatState::switching:
            return "switching";
        case HeartbeatState::stopped:
            return "stopped";
        }
        return "unknown";
    }

    HeartbeatLoop::HeartbeatLoop(CatalogClient& client,
                                 CredentialProvider& creds,
                                 SharedState& shared,
                                 FailoverStateMachine& failover,
                                 std::shared_ptr<LoopTimer> timer,
                                 const MiningSettings& settings,
                                 SessionHandle handle,
                                 MiningTarget target,
                                 SwitchResult initial) :
        client_(client),
        creds_(creds),
        shared_(shared),
        failover_(failover),
        timer_(std::move(timer)),
        settings_(settings),
        handle_(std::move(handle)),
        target_(std::move(target)),
        current_(std::move(initial))
    {
        Expects(timer_ != nullptr);
    }

    MiningChannel HeartbeatLoop::channel() const
    {
        std::lock_guard lk(channel_mutex_);
        return current_.channel;
    }

    void HeartbeatLoop::set_state(HeartbeatState next) noexcept
    {
        const auto prev = state_.exchange(next, std::memory_order_acq_rel);
        if (prev != next)
        {
            std::cout << "[Heartbeat] " << to_string(prev) << " -> " << to_string(next) << '\n';
        }
    }

    auto HeartbeatLoop::beat() -> boost::asio::awaitable<bool>
    {
        if (!handle_.is_current())
        {
            set_state(HeartbeatState::stopped);
            co_return false;
        }

        SwitchResult watched;
        {
            std::lock_guard lk(channel_mutex_);
            watched = current_;
        }

        bool acknowledged = false;
        try
        {
            const auto user_id = co_await shared_.identity.user_id(client_, creds_);
            if (endpoint_.empty())
            {
                endpoint_ = co_await client_.resolve_watch_endpoint(watched.channel.login);
            }
            const WatchSignal signal{
                .endpoint = endpoint_,
                .channel_id = watched.channel.id,
                .channel_login = watched.channel.login,
                .broadcast_id = watched.broadcast_id,
                .user_id = user_id,
            };
            acknowledged = co_await client_.submit_watch_signal(signal, settings_.watch_timeout);
        }
        catch (const AuthError&)
        {
            throw;
        }
        catch (const MiningError& e)
        {
            std::cerr << "[Heartbeat] " << watched.channel.login << ": " << e.what() << '\n';
        }

        if (!handle_.is_current())
        {
            set_state(HeartbeatState::stopped);
            co_return false;
        }

        if (acknowledged)
        {
            failures_.store(0, std::memory_order_release);
            set_state(HeartbeatState::watching);
            co_return true;
        }

        const int failures = failures_.fetch_add(1, std::memory_order_acq_rel) + 1;
        set_state(HeartbeatState::failing);
        std::cerr << "[Heartbeat] watch signal for " << watched.channel.login << " not acknowledged (" << failures
                  << "/" << settings_.failure_threshold << ")\n";
        if (failures < settings_.failure_threshold)
        {
            co_return true;
        }

        set_state(HeartbeatState::switching);
        auto next = co_await failover_.handle_failure(handle_,
                                                      watched.channel,
                                                      watched.index,
                                                      target_,
                                                      std::to_string(failures) + " consecutive watch failures");
        if (!next)
        {
            set_state(HeartbeatState::stopped);
            co_return false;
        }

        {
            std::lock_guard lk(channel_mutex_);
            current_ = std::move(*next);
        }
        endpoint_.clear();
        failures_.store(0, std::memory_order_release);
        set_state(HeartbeatState::watching);
        co_return true;
    }

    auto HeartbeatLoop::run() -> boost::asio::awaitable<void>
    {
        while (co_await beat())
        {
            if (!co_await timer_->sleep(settings_.heartbeat_interval))
            {
                break;
            }
        }
        set_state(HeartbeatState::stopped);
        std::cout << "[Heartbeat] loop for session " << handle_.id() << " exited\n";
    }

} // namespace drop_miner
