/*
Module Name:
- heartbeat_loop.hpp

Abstract:
- Emits one synthetic "minute watched" signal per interval for the watched
  channel and counts consecutive failures.
- Only an explicit acknowledgement counts as success. Reaching the failure
  threshold hands the channel to the failover state machine; a single failure
  keeps watching.

States:
- idle -> watching -> { watching, failing }
- failing -> { watching, switching }
- switching -> { watching, stopped }
*/
#pragma once

// C++ Standard Library
#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

// Boost.Asio
#include <boost/asio/awaitable.hpp>

// Project
#include <dm/mining/failover.hpp>
#include <dm/mining/interfaces.hpp>
#include <dm/mining/loop_timer.hpp>
#include <dm/mining/settings.hpp>
#include <dm/mining/shared_state.hpp>

namespace drop_miner
{

    enum class HeartbeatState
    {
        idle,
        watching,
        failing,
        switching,
        stopped,
    };

    [[nodiscard]] std::string_view to_string(HeartbeatState state) noexcept;

    class HeartbeatLoop
    {
    public:
        HeartbeatLoop(CatalogClient& client,
                      CredentialProvider& creds,
                      SharedState& shared,
                      FailoverStateMachine& failover,
                      std::shared_ptr<LoopTimer> timer,
                      const MiningSettings& settings,
                      SessionHandle handle,
                      MiningTarget target,
                      SwitchResult initial);

        HeartbeatLoop(const HeartbeatLoop&) = delete;
        HeartbeatLoop& operator=(const HeartbeatLoop&) = delete;

        // beat() then sleep, until the session ends or recovery is exhausted.
        [[nodiscard]] auto run() -> boost::asio::awaitable<void>;

        // One emission plus failure bookkeeping. false when the loop must exit.
        // Throws AuthError.
        [[nodiscard]] auto beat() -> boost::asio::awaitable<bool>;

        [[nodiscard]] HeartbeatState state() const noexcept
        {
            return state_.load(std::memory_order_acquire);
        }

        [[nodiscard]] int consecutive_failures() const noexcept
        {
            return failures_.load(std::memory_order_acquire);
        }

        [[nodiscard]] MiningChannel channel() const;

    private:
        void set_state(HeartbeatState next) noexcept;

        CatalogClient& client_;
        CredentialProvider& creds_;
        SharedState& shared_;
        FailoverStateMachine& failover_;
        std::shared_ptr<LoopTimer> timer_;
        const MiningSettings& settings_;
        const SessionHandle handle_;
        const MiningTarget target_;

        mutable std::mutex channel_mutex_; // protects current_
        SwitchResult current_;
        std::string endpoint_; // cached per watched channel

        std::atomic<HeartbeatState> state_{ HeartbeatState::idle };
        std::atomic<int> failures_{ 0 };
    };

} // namespace drop_miner
