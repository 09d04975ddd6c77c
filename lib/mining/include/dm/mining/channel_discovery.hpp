/*
Module Name:
- channel_discovery.hpp

Abstract:
- Finds live channels that can earn progress for a set of campaigns.
- Access-controlled campaigns are served only by their allow-list, probed one
  channel at a time. Other campaigns use the open pool of live, drops-enabled
  streams for the game.
- A failed probe or query is logged and skipped. AuthError always propagates.
*/
#pragma once

// C++ Standard Library
#include <optional>
#include <utility>
#include <vector>

// Boost.Asio
#include <boost/asio/awaitable.hpp>

// Project
#include <dm/mining/interfaces.hpp>
#include <dm/mining/model.hpp>
#include <dm/mining/settings.hpp>

namespace drop_miner
{

    struct EligibleChannel
    {
        MiningChannel channel;
        Campaign campaign;
    };

    class ChannelDiscovery
    {
    public:
        ChannelDiscovery(CatalogClient& client, CredentialProvider& creds) noexcept :
            client_(client),
            creds_(creds)
        {
        }

        // Every eligible channel across campaigns, deduplicated by id, in discovery order.
        [[nodiscard]] auto discover_eligible(const std::vector<Campaign>& campaigns, const MiningSettings& settings)
            -> boost::asio::awaitable<std::vector<MiningChannel>>;

        // First live channel found; ACL campaigns are tried before the open pool.
        [[nodiscard]] auto find_first_eligible(const std::vector<Campaign>& campaigns)
            -> boost::asio::awaitable<std::optional<EligibleChannel>>;

    private:
        // Up to cap live allow-listed channels of c.
        auto probe_allow_list(const Campaign& c, std::size_t cap) -> boost::asio::awaitable<std::vector<MiningChannel>>;

        auto query_open_pool(const Campaign& c, std::size_t limit) -> boost::asio::awaitable<std::vector<MiningChannel>>;

        CatalogClient& client_;
        CredentialProvider& creds_;
    };

} // namespace drop_miner
