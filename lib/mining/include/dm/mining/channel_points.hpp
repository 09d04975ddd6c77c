/*
Module Name:
- channel_points.hpp

Abstract:
- Collects the periodic channel-points bonus on the watched channel while a
  session runs and auto_claim_channel_points is enabled.
*/
#pragma once

// C++ Standard Library
#include <memory>
#include <optional>
#include <utility>

// Boost.Asio
#include <boost/asio/awaitable.hpp>

// Project
#include <dm/mining/interfaces.hpp>
#include <dm/mining/loop_timer.hpp>
#include <dm/mining/settings.hpp>
#include <dm/mining/shared_state.hpp>

namespace drop_miner
{

    class ChannelPointsHarvester
    {
    public:
        ChannelPointsHarvester(CatalogClient& client,
                               CredentialProvider& creds,
                               SharedState& shared,
                               StatusSink& sink,
                               std::shared_ptr<LoopTimer> timer,
                               const MiningSettings& settings,
                               SessionHandle handle);

        // Points gained by a bonus claim, or nullopt when there was nothing to do.
        // Throws AuthError.
        [[nodiscard]] auto harvest_once() -> boost::asio::awaitable<std::optional<int>>;

        [[nodiscard]] auto run() -> boost::asio::awaitable<void>;

    private:
        CatalogClient& client_;
        CredentialProvider& creds_;
        SharedState& shared_;
        StatusSink& sink_;
        std::shared_ptr<LoopTimer> timer_;
        const MiningSettings& settings_;
        const SessionHandle handle_;
    };

} // namespace drop_miner
