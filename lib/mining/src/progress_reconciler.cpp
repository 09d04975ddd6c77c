/*
Module Name:
- progress_reconciler.cpp

Abstract:
- Push and poll paths of progress reconciliation.

Notes:
- In automatic mode the target is the game: campaigns of the same game are
  in scope. A pinned target only accepts its own campaign. A pushed drop of
  any cached campaign may still become the current drop.
- A target campaign that is in neither the inventory nor the catalog cache is
  treated as finished.
*/

// C++ Standard Library
#include <algorithm>
#include <iostream>
#include <optional>
#include <tuple>
#include <utility>
#include <vector>

// Project
#include <dm/mining/errors.hpp>
#include <dm/mining/progress_reconciler.hpp>
#include <dm/utils/transparent_string_hash.hpp>

namespace drop_miner
{

    std::string_view to_string(PollOutcome outcome) noexcept
    {
        switch (outcome)
        {
        case PollOutcome::in_progress:
            return "in-progress";
        case PollOutcome::complete:
            return "complete";
        case PollOutcome::skipped:
            return "skipped";
        case PollOutcome::stale:
            return "stale";
        }
        return "unknown";
    }

    ProgressReconciler::ProgressReconciler(CatalogClient& client,
                                           CredentialProvider& creds,
                                           CampaignCatalog& catalog,
                                           ClaimService& claims,
                                           SharedState& shared,
                                           StatusSink& sink,
                                           std::shared_ptr<LoopTimer> timer,
                                           const MiningSettings& settings,
                                           SessionHandle handle,
                                           MiningTarget target,
                                           completion_fn_t on_complete) :
        client_(client),
        creds_(creds),
        catalog_(catalog),
        claims_(claims),
        shared_(shared),
        sink_(sink),
        timer_(std::move(timer)),
        settings_(settings),
        handle_(std::move(handle)),
        target_(std::move(target)),
        on_complete_(std::move(on_complete))
    {
        Expects(timer_ != nullptr);
    }

    bool ProgressReconciler::tracks(const MiningStatus& s) const noexcept
    {
        if (!s.active)
        {
            return false;
        }
        if (s.campaign_id == target_.campaign_id)
        {
            return true;
        }
        return !target_.pinned && s.game_name == target_.game_name;
    }

    bool ProgressReconciler::in_scope(const Campaign& c) const noexcept
    {
        if (c.id == target_.campaign_id)
        {
            return true;
        }
        return !target_.pinned && c.game_name == target_.game_name;
    }

    bool ProgressReconciler::tracks_target() const
    {
        return tracks(shared_.status.snapshot());
    }

    void ProgressReconciler::on_push(const ProgressEvent& event)
    {
        if (event.drop_id.empty() || !handle_.is_current())
        {
            return;
        }

        const auto found = catalog_.find_drop(event.drop_id);
        const auto now = wall_clock::now();

        DropProgress update{};
        update.drop_id = event.drop_id;
        update.current_minutes = event.current_minutes;
        update.required_minutes = event.required_minutes;
        update.last_updated = now;
        if (found)
        {
            update.campaign_id = found->first.id;
            if (update.required_minutes <= 0)
            {
                update.required_minutes = found->second.required_minutes;
            }
        }
        const DropProgress merged = shared_.progress.merge(update);

        auto snap = shared_.status.update_if_current(handle_, [&](MiningStatus& s) -> bool {
            if (!tracks(s))
            {
                return false;
            }
            if (s.current_drop && s.current_drop->drop_id == event.drop_id)
            {
                auto& cur = *s.current_drop;
                const int minutes = std::max(cur.current_minutes, merged.current_minutes);
                const int required = merged.required_minutes > 0 ? merged.required_minutes : cur.required_minutes;
                cur.current_minutes = minutes;
                cur.required_minutes = required;
                cur.percentage = progress_percentage(minutes, required);
                cur.estimated_completion.reset();
                if (minutes > 0 && minutes < required)
                {
                    cur.estimated_completion = now + std::chrono::minutes{ required - minutes };
                }
                return true;
            }
            if (found && found->second.is_mineable() && !merged.claimed)
            {
                // CurrentDrop carries the drop's own campaign; the target only moves within scope.
                const auto& [campaign, drop] = *found;
                const int required = merged.required_minutes > 0 ? merged.required_minutes : drop.required_minutes;
                s.current_drop = make_current_drop(campaign, drop, merged.current_minutes, required, now);
                if (in_scope(campaign))
                {
                    s.campaign_id = campaign.id;
                    s.campaign_name = campaign.name;
                    s.game_name = campaign.game_name;
                }
                return true;
            }
            return false;
        });
        if (snap)
        {
            sink_.publish_status(*snap);
        }
    }

    void ProgressReconciler::apply_claimed_benefits(const std::vector<Campaign>& scoped, const Inventory& inventory)
    {
        if (inventory.claimed_benefits.empty())
        {
            return;
        }
        for (const auto& c : scoped)
        {
            for (const auto& d : c.drops)
            {
                if (d.progress || shared_.progress.get(d.id))
                {
                    continue; // explicit self progress wins
                }
                for (const auto& b : d.benefits)
                {
                    auto it = std::find_if(inventory.claimed_benefits.begin(),
                                           inventory.claimed_benefits.end(),
                                           [&](const ClaimedBenefit& cb) {
                                               return cb.benefit_id == b.id && c.is_active_at(cb.awarded_at);
                                           });
                    if (it != inventory.claimed_benefits.end())
                    {
                        std::cout << "[Progress] " << d.display_name() << " treated as claimed: benefit " << b.id
                                  << " awarded during the campaign\n";
                        shared_.progress.mark_claimed(d.id, c.id);
                        break;
                    }
                }
            }
        }
    }

    auto ProgressReconciler::poll_once() -> boost::asio::awaitable<PollOutcome>
    {
        if (!handle_.is_current() || !tracks_target())
        {
            co_return PollOutcome::stale;
        }

        Inventory inventory;
        try
        {
            const auto token = co_await creds_.get_token();
            inventory = co_await client_.fetch_inventory(token);
        }
        catch (const AuthError&)
        {
            throw;
        }
        catch (const ParseError& e)
        {
            std::cerr << "[Progress] inventory unreadable, using cached campaigns: " << e.what() << '\n';
        }
        catch (const MiningError& e)
        {
            std::cerr << "[Progress] inventory poll failed: " << e.what() << '\n';
            co_return PollOutcome::skipped;
        }

        if (!handle_.is_current())
        {
            co_return PollOutcome::stale;
        }

        for (const auto& c : inventory.campaigns)
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
                (void)shared_.progress.merge(p);
            }
        }

        // Inventory copies first; the catalog only fills in campaigns not yet started.
        // A campaign whose window has closed is out even while the cache still holds it.
        const auto now = wall_clock::now();
        std::vector<Campaign> scoped;
        dm::StringSet seen;
        for (const auto& c : inventory.campaigns)
        {
            if (in_scope(c) && c.is_active_at(now) && seen.insert(c.id).second)
            {
                scoped.push_back(c);
            }
        }
        for (const auto& c : catalog_.cached_snapshot())
        {
            if (in_scope(c) && c.is_active_at(now) && seen.insert(c.id).second)
            {
                scoped.push_back(c);
            }
        }

        if (scoped.empty())
        {
            if (on_complete_)
            {
                on_complete_(handle_, MiningComplete{ target_.game_name, target_.campaign_name, "campaign no longer active" });
            }
            co_return PollOutcome::complete;
        }

        apply_claimed_benefits(scoped, inventory);

        struct Candidate
        {
            const Campaign* campaign;
            const Drop* drop;
            int current;
            int required;
        };
        std::vector<Candidate> candidates;
        std::vector<std::tuple<const Campaign*, const Drop*, DropProgress>> ready;

        for (const auto& c : scoped)
        {
            for (const auto& d : c.drops)
            {
                if (!d.is_mineable())
                {
                    continue;
                }
                DropProgress p = shared_.progress.get(d.id).value_or(DropProgress{});
                const int required = p.required_minutes > 0 ? p.required_minutes : d.required_minutes;
                if (p.claimed)
                {
                    continue;
                }
                if (p.current_minutes >= required)
                {
                    p.drop_id = d.id;
                    p.campaign_id = c.id;
                    p.required_minutes = required;
                    ready.emplace_back(&c, &d, std::move(p));
                    continue;
                }
                candidates.push_back(Candidate{ &c, &d, p.current_minutes, required });
            }
        }

        for (const auto& [campaign, drop, progress] : ready)
        {
            (void)co_await claims_.handle_ready(handle_, *campaign, *drop, progress);
        }

        if (!handle_.is_current())
        {
            co_return PollOutcome::stale;
        }

        if (candidates.empty())
        {
            std::cout << "[Progress] every drop of " << target_.campaign_name << " is finished\n";
            if (on_complete_)
            {
                on_complete_(handle_, MiningComplete{ target_.game_name, target_.campaign_name, "all drops complete" });
            }
            co_return PollOutcome::complete;
        }

        const auto best = std::max_element(candidates.begin(), candidates.end(), [](const Candidate& a, const Candidate& b) {
            return progress_percentage(a.current, a.required) < progress_percentage(b.current, b.required);
        });

        auto snap = shared_.status.update_if_current(handle_, [&](MiningStatus& s) -> bool {
            if (!tracks(s))
            {
                return false;
            }
            int current = best->current;
            if (s.current_drop && s.current_drop->drop_id == best->drop->id)
            {
                current = std::max(current, s.current_drop->current_minutes);
            }
            s.current_drop = make_current_drop(*best->campaign, *best->drop, current, best->required, now);
            s.campaign_id = best->campaign->id;
            s.campaign_name = best->campaign->name;
            s.game_name = best->campaign->game_name;
            return true;
        });
        if (!snap)
        {
            co_return PollOutcome::stale;
        }
        sink_.publish_status(*snap);
        std::cout << "[Progress] mining " << snap->current_drop->drop_name << " " << snap->current_drop->current_minutes
                  << "/" << snap->current_drop->required_minutes << " min\n";
        co_return PollOutcome::in_progress;
    }

    auto ProgressReconciler::run() -> boost::asio::awaitable<void>
    {
        while (handle_.is_current())
        {
            PollOutcome outcome = PollOutcome::skipped;
            try
            {
                outcome = co_await poll_once();
            }
            catch (const AuthError&)
            {
                throw;
            }
            catch (const MiningError& e)
            {
                std::cerr << "[Progress] poll failed: " << e.what() << '\n';
            }
            if (outcome == PollOutcome::complete || outcome == PollOutcome::stale)
            {
                break;
            }
            if (!co_await timer_->sleep(settings_.poll_interval))
            {
                break;
            }
        }
        std::cout << "[Progress] loop for session " << handle_.id() << " exited\n";
    }

} // namespace drop_miner
