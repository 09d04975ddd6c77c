/*
Module Name:
- campaign_catalog.cpp

Abstract:
- Normalization, filtering and the TTL cache for active campaigns.
*/

// C++ Standard Library
#include <algorithm>
#include <iostream>
#include <limits>

// Project
#include <dm/mining/campaign_catalog.hpp>

namespace drop_miner
{

    std::vector<Campaign> normalize_campaigns(std::vector<Campaign> raw, time_point now)
    {
        std::vector<Campaign> out;
        out.reserve(raw.size());
        for (auto& c : raw)
        {
            if (c.id.empty() || c.game_name.empty())
            {
                continue;
            }
            if (!c.is_active_at(now))
            {
                continue;
            }
            out.push_back(std::move(c));
        }
        return out;
    }

    std::vector<Campaign> apply_filters(const std::vector<Campaign>& campaigns, const MiningSettings& settings)
    {
        const bool priority_only =
            settings.priority_mode == PriorityMode::priority_only && !settings.priority_games.empty();

        std::vector<Campaign> out;
        out.reserve(campaigns.size());
        for (const auto& c : campaigns)
        {
            if (settings.excluded_games.contains(c.game_name))
            {
                continue;
            }
            if (priority_only && settings.priority_index(c.game_name) < 0)
            {
                continue;
            }
            out.push_back(c);
        }

        // Unlisted games sort after every listed one.
        auto rank = [&settings](const Campaign& c) {
            const int idx = settings.priority_index(c.game_name);
            return idx < 0 ? std::numeric_limits<int>::max() : idx;
        };
        std::stable_sort(out.begin(), out.end(), [&rank](const Campaign& a, const Campaign& b) {
            const int ra = rank(a);
            const int rb = rank(b);
            if (ra != rb)
            {
                return ra < rb;
            }
            return a.end_at < b.end_at;
        });
        return out;
    }

    CampaignCatalog::CampaignCatalog(CatalogClient& client,
                                     CredentialProvider& creds,
                                     ProgressMap& progress,
                                     std::chrono::milliseconds ttl) :
        client_(client),
        creds_(creds),
        progress_(progress),
        ttl_(ttl)
    {
    }

    auto CampaignCatalog::fetch_active_campaigns() -> boost::asio::awaitable<std::vector<Campaign>>
    {
        const auto token = co_await creds_.get_token();
        auto raw = co_await client_.list_active_campaigns(token);
        const auto fetched = raw.size();
        auto campaigns = normalize_campaigns(std::move(raw), wall_clock::now());

        for (const auto& c : campaigns)
        {
            for (const auto& d : c.drops)
            {
                if (!d.progress)
                {
                    continue;
                }
                DropProgress p = *d.progress;
                p.drop_id = d.id;
                p.campaign_id = c.id;
                if (p.required_minutes <= 0)
                {
                    p.required_minutes = d.required_minutes;
                }
                (void)progress_.merge(p);
            }
        }

        {
            std::unique_lock lk(mutex_);
            cache_ = campaigns;
            age_.reset();
        }
        std::cout << "[Catalog] " << campaigns.size() << " active campaigns (" << fetched << " listed)\n";
        co_return campaigns;
    }

    auto CampaignCatalog::get_cached() -> boost::asio::awaitable<std::vector<Campaign>>
    {
        co_return co_await get_cached(ttl_);
    }

    auto CampaignCatalog::get_cached(std::chrono::milliseconds ttl) -> boost::asio::awaitable<std::vector<Campaign>>
    {
        {
            std::shared_lock lk(mutex_);
            if (!age_.is_older_than(ttl))
            {
                co_return cache_;
            }
        }
        co_return co_await fetch_active_campaigns();
    }

    std::vector<Campaign> CampaignCatalog::cached_snapshot() const
    {
        std::shared_lock lk(mutex_);
        return cache_;
    }

    std::optional<Campaign> CampaignCatalog::find_campaign(std::string_view campaign_id) const
    {
        std::shared_lock lk(mutex_);
        auto it = std::find_if(cache_.begin(), cache_.end(), [campaign_id](const Campaign& c) { return c.id == campaign_id; });
        if (it == cache_.end())
        {
            return std::nullopt;
        }
        return *it;
    }

    std::optional<std::pair<Campaign, Drop>> CampaignCatalog::find_drop(std::string_view drop_id) const
    {
        std::shared_lock lk(mutex_);
        for (const auto& c : cache_)
        {
            if (const Drop* d = c.find_drop(drop_id))
            {
                return std::make_pair(c, *d);
            }
        }
        return std::nullopt;
    }

    void CampaignCatalog::invalidate()
    {
        std::unique_lock lk(mutex_);
        age_.clear();
    }

} // namespace drop_miner
