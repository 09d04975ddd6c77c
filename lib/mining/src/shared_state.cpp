// C++ Standard Library
#include <algorithm>
#include <iostream>

// Project
#include <dm/mining/shared_state.hpp>

namespace drop_miner
{

    DropProgress ProgressMap::merge(const DropProgress& update)
    {
        Expects(!update.drop_id.empty());

        std::unique_lock lk(mutex_);
        auto [it, inserted] = entries_.try_emplace(update.drop_id, update);
        DropProgress& cur = it->second;
        if (inserted)
        {
            if (cur.last_updated == time_point{})
            {
                cur.last_updated = wall_clock::now();
            }
            return cur;
        }

        if (update.current_minutes < cur.current_minutes)
        {
            std::cout << "[Progress] ignoring lower progress for " << cur.drop_id << ": "
                      << update.current_minutes << " < " << cur.current_minutes << '\n';
        }
        else
        {
            cur.current_minutes = update.current_minutes;
        }
        if (update.required_minutes > 0)
        {
            cur.required_minutes = update.required_minutes;
        }
        if (cur.campaign_id.empty())
        {
            cur.campaign_id = update.campaign_id;
        }
        cur.claimed = cur.claimed || update.claimed;
        if (update.claim_token)
        {
            cur.claim_token = update.claim_token;
        }
        cur.last_updated = std::max(cur.last_updated, update.last_updated == time_point{} ? wall_clock::now() : update.last_updated);
        return cur;
    }

    void ProgressMap::mark_claimed(std::string_view drop_id, std::string_view campaign_id)
    {
        std::unique_lock lk(mutex_);
        auto it = entries_.find(drop_id);
        if (it == entries_.end())
        {
            DropProgress p{};
            p.drop_id = std::string{ drop_id };
            p.campaign_id = std::string{ campaign_id };
            it = entries_.emplace(p.drop_id, std::move(p)).first;
        }
        it->second.claimed = true;
        it->second.last_updated = wall_clock::now();
    }

    std::optional<DropProgress> ProgressMap::get(std::string_view drop_id) const
    {
        std::shared_lock lk(mutex_);
        auto it = entries_.find(drop_id);
        if (it == entries_.end())
        {
            return std::nullopt;
        }
        return it->second;
    }

    std::vector<DropProgress> ProgressMap::snapshot() const
    {
        std::shared_lock lk(mutex_);
        std::vector<DropProgress> out;
        out.reserve(entries_.size());
        for (const auto& [id, p] : entries_)
        {
            out.push_back(p);
        }
        return out;
    }

    std::size_t ProgressMap::size() const
    {
        std::shared_lock lk(mutex_);
        return entries_.size();
    }

    void ProgressMap::reset(std::string_view drop_id)
    {
        std::unique_lock lk(mutex_);
        if (auto it = entries_.find(drop_id); it != entries_.end())
        {
            it->second.current_minutes = 0;
            it->second.last_updated = wall_clock::now();
        }
    }

    void ProgressMap::clear()
    {
        std::unique_lock lk(mutex_);
        entries_.clear();
    }

    auto IdentityCache::user_id(CatalogClient& client, CredentialProvider& creds)
        -> boost::asio::awaitable<std::string>
    {
        if (auto id = cached())
        {
            co_return *id;
        }
        const auto token = co_await creds.get_token();
        auto id = co_await client.resolve_user_id(token);
        {
            std::lock_guard lk(mutex_);
            user_id_ = id;
        }
        co_return id;
    }

    std::optional<std::string> IdentityCache::cached() const
    {
        std::lock_guard lk(mutex_);
        return user_id_;
    }

    void IdentityCache::clear()
    {
        std::lock_guard lk(mutex_);
        user_id_.reset();
    }

} // namespace drop_miner
