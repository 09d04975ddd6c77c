/*
Module Name:
- campaign_catalog.hpp

Abstract:
- Fetches the currently active drop campaigns and keeps them in a TTL cache.
- Each successful fetch merges any self progress the listing carries into the
  shared ProgressMap.
- apply_filters() applies the user's game exclusion and priority settings and
  orders the result by priority position, then by soonest end.
*/
#pragma once

// C++ Standard Library
#include <chrono>
#include <optional>
#include <shared_mutex>
#include <string_view>
#include <utility>
#include <vector>

// Boost.Asio
#include <boost/asio/awaitable.hpp>

// Project
#include <dm/mining/interfaces.hpp>
#include <dm/mining/model.hpp>
#include <dm/mining/settings.hpp>
#include <dm/mining/shared_state.hpp>
#include <dm/utils/timer.hpp>

namespace drop_miner
{

    // Drop structurally invalid campaigns and those outside their window at now.
    [[nodiscard]] std::vector<Campaign> normalize_campaigns(std::vector<Campaign> raw, time_point now);

    // Exclusion and priority filtering plus ordering. Input is not modified.
    [[nodiscard]] std::vector<Campaign> apply_filters(const std::vector<Campaign>& campaigns,
                                                      const MiningSettings& settings);

    class CampaignCatalog
    {
    public:
        CampaignCatalog(CatalogClient& client,
                        CredentialProvider& creds,
                        ProgressMap& progress,
                        std::chrono::milliseconds ttl);

        CampaignCatalog(const CampaignCatalog&) = delete;
        CampaignCatalog& operator=(const CampaignCatalog&) = delete;

        // Always goes to the network. Throws AuthError, TransportError or ParseError.
        [[nodiscard]] auto fetch_active_campaigns() -> boost::asio::awaitable<std::vector<Campaign>>;

        // Cached result when younger than the configured ttl, else a fresh fetch.
        [[nodiscard]] auto get_cached() -> boost::asio::awaitable<std::vector<Campaign>>;
        [[nodiscard]] auto get_cached(std::chrono::milliseconds ttl) -> boost::asio::awaitable<std::vector<Campaign>>;

        // Last fetched list without touching the network (may be empty).
        [[nodiscard]] std::vector<Campaign> cached_snapshot() const;

        [[nodiscard]] std::optional<Campaign> find_campaign(std::string_view campaign_id) const;

        // Campaign and drop for drop_id, searched in the cached list.
        [[nodiscard]] std::optional<std::pair<Campaign, Drop>> find_drop(std::string_view drop_id) const;

        // Next get_cached() refetches.
        void invalidate();

    private:
        CatalogClient& client_;
        CredentialProvider& creds_;
        ProgressMap& progress_;
        const std::chrono::milliseconds ttl_;

        mutable std::shared_mutex mutex_; // protects cache_ and age_
        std::vector<Campaign> cache_;
        dm::Timer age_;
    };

} // namespace drop_miner
