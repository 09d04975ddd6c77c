/*
Module Name:
- failover.cpp

Abstract:
- Channel recovery: cached scan, refresh scan, then termination.
*/

// C++ Standard Library
#include <iostream>
#include <utility>

// Project
#include <dm/mining/channel_scorer.hpp>
#include <dm/mining/errors.hpp>
#include <dm/mining/failover.hpp>

namespace drop_miner
{

    namespace
    {
        // Campaigns the refresh may draw channels from.
        std::vector<Campaign> campaigns_for_target(const std::vector<Campaign>& campaigns, const MiningTarget& target)
        {
            std::vector<Campaign> out;
            for (const auto& c : campaigns)
            {
                const bool match = target.pinned ? c.id == target.campaign_id
                                                 : (c.id == target.campaign_id || (!target.game_id.empty() && c.game_id == target.game_id) ||
                                                    c.game_name == target.game_name);
                if (match)
                {
                    out.push_back(c);
                }
            }
            return out;
        }
    } // namespace

    FailoverStateMachine::FailoverStateMachine(CatalogClient& client,
                                               CredentialProvider& creds,
                                               CampaignCatalog& catalog,
                                               ChannelDiscovery& discovery,
                                               SharedState& shared,
                                               StatusSink& sink,
                                               const MiningSettings& settings,
                                               exhausted_fn_t on_exhausted) :
        client_(client),
        creds_(creds),
        catalog_(catalog),
        discovery_(discovery),
        shared_(shared),
        sink_(sink),
        settings_(settings),
        on_exhausted_(std::move(on_exhausted))
    {
    }

    void FailoverStateMachine::mark_failed(std::string_view channel_id)
    {
        std::lock_guard lk(cooldown_mutex_);
        cooldown_[std::string{ channel_id }].reset();
    }

    bool FailoverStateMachine::is_cooling_down(std::string_view channel_id) const
    {
        std::lock_guard lk(cooldown_mutex_);
        auto it = cooldown_.find(channel_id);
        return it != cooldown_.end() && !it->second.is_older_than(settings_.failed_channel_cooldown);
    }

    auto FailoverStateMachine::try_switch(const std::vector<MiningChannel>& cached,
                                          std::string_view failing_id,
                                          std::optional<std::size_t> last_index)
        -> boost::asio::awaitable<std::optional<SwitchResult>>
    {
        const std::size_t n = cached.size();
        const std::size_t start = last_index ? (*last_index + 1) : 0;

        for (std::size_t step = 0; step < n; ++step)
        {
            const std::size_t idx = (start + step) % n;
            const auto& candidate = cached[idx];
            if (candidate.id == failing_id || is_cooling_down(candidate.id))
            {
                continue;
            }

            std::optional<LiveStatus> live;
            try
            {
                const auto token = co_await creds_.get_token();
                live = co_await client_.probe_channel(token, candidate.id);
            }
            catch (const AuthError&)
            {
                throw;
            }
            catch (const MiningError& e)
            {
                std::cerr << "[Failover] probe of " << candidate.login << " failed: " << e.what() << '\n';
                continue;
            }

            if (!live || live->broadcast_id.empty())
            {
                continue;
            }

            MiningChannel picked = candidate;
            picked.viewers = live->viewers;
            picked.online = true;
            co_return SwitchResult{ std::move(picked), live->broadcast_id, idx };
        }
        co_return std::nullopt;
    }

    auto FailoverStateMachine::try_switch_with_refresh(std::string_view failing_id, const MiningTarget& target)
        -> boost::asio::awaitable<std::optional<RefreshedSwitch>>
    {
        std::vector<Campaign> campaigns;
        try
        {
            campaigns = co_await catalog_.fetch_active_campaigns();
        }
        catch (const AuthError&)
        {
            throw;
        }
        catch (const MiningError& e)
        {
            std::cerr << "[Failover] campaign refresh failed: " << e.what() << '\n';
            co_return std::nullopt;
        }

        const auto scoped = campaigns_for_target(apply_filters(campaigns, settings_), target);
        if (scoped.empty())
        {
            std::cout << "[Failover] no active campaign left for " << target.game_name << '\n';
            co_return std::nullopt;
        }

        auto ranked = rank_channels(co_await discovery_.discover_eligible(scoped, settings_), settings_);
        shared_.channels.replace(ranked);

        // An index into the old list means nothing in the fresh one.
        auto selected = co_await try_switch(ranked, failing_id, std::nullopt);
        if (!selected)
        {
            co_return std::nullopt;
        }
        co_return RefreshedSwitch{ std::move(*selected), std::move(ranked) };
    }

    auto FailoverStateMachine::handle_failure(const SessionHandle& handle,
                                              const MiningChannel& failing,
                                              std::optional<std::size_t> last_index,
                                              const MiningTarget& target,
                                              std::string reason)
        -> boost::asio::awaitable<std::optional<SwitchResult>>
    {
        ++attempts_;
        mark_failed(failing.id);
        std::cout << "[Failover] attempt " << attempts_ << " leaving " << failing.login << ": " << reason << '\n';

        std::optional<SwitchResult> result = co_await try_switch(shared_.channels.snapshot(), failing.id, last_index);
        std::optional<std::vector<MiningChannel>> refreshed;
        if (!result)
        {
            if (auto rr = co_await try_switch_with_refresh(failing.id, target))
            {
                result = std::move(rr->selected);
                refreshed = std::move(rr->refreshed);
            }
        }

        if (!handle.is_current())
        {
            co_return std::nullopt;
        }

        if (!result)
        {
            std::cerr << "[Failover] no live channel left for " << target.campaign_name << '\n';
            if (on_exhausted_)
            {
                on_exhausted_(handle, "no live channel after " + reason);
            }
            co_return std::nullopt;
        }

        auto snap = shared_.status.update_if_current(handle, [&](MiningStatus& s) {
            s.channel = result->channel;
            if (refreshed)
            {
                s.eligible_channels = *refreshed;
            }
        });
        if (!snap)
        {
            co_return std::nullopt;
        }
        sink_.publish_status(*snap);
        if (settings_.notify_on_recovery_action)
        {
            sink_.notify(ChannelSwitched{ failing.login, result->channel.login, reason });
        }
        std::cout << "[Failover] switched " << failing.login << " -> " << result->channel.login << '\n';
        co_return result;
    }

} // namespace drop_miner
