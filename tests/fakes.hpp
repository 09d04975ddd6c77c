/*
Module Name:
- fakes.hpp

Abstract:
- In-memory implementations of the engine seams, plus helpers that drive
  coroutines on a test-owned io_context.
*/
#pragma once

// C++ Standard Library
#include <chrono>
#include <deque>
#include <functional>
#include <future>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

// Boost.Asio
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/use_future.hpp>

// Project
#include <dm/mining/errors.hpp>
#include <dm/mining/interfaces.hpp>
#include <dm/mining/model.hpp>
#include <dm/mining/shared_state.hpp>

namespace drop_miner::fakes
{

    class FakeCredentials final : public CredentialProvider
    {
    public:
        auto get_token() -> boost::asio::awaitable<std::string> override
        {
            if (reject)
            {
                throw AuthError("token revoked");
            }
            co_return token;
        }

        std::string token{ "test-token" };
        bool reject{ false };
    };

    class FakeCatalogClient final : public CatalogClient
    {
    public:
        auto list_active_campaigns(std::string_view) -> boost::asio::awaitable<std::vector<Campaign>> override
        {
            ++list_calls;
            co_return campaigns;
        }

        auto probe_channel(std::string_view, std::string_view channel_id)
            -> boost::asio::awaitable<std::optional<LiveStatus>> override
        {
            probed.emplace_back(channel_id);
            if (auto it = live.find(channel_id); it != live.end())
            {
                co_return it->second;
            }
            co_return std::nullopt;
        }

        auto list_live_channels(std::string_view, std::string_view game_id, std::string_view, std::size_t limit)
            -> boost::asio::awaitable<std::vector<MiningChannel>> override
        {
            std::vector<MiningChannel> out;
            for (const auto& c : open_pool)
            {
                if (c.game_id == game_id && out.size() < limit)
                {
                    out.push_back(c);
                }
            }
            co_return out;
        }

        auto fetch_inventory(std::string_view) -> boost::asio::awaitable<Inventory> override
        {
            ++inventory_calls;
            if (inventory_unreadable)
            {
                throw ParseError("inventory shape changed");
            }
            if (inventory_unreachable)
            {
                throw TransportError("gql returned 503");
            }
            co_return inventory;
        }

        auto resolve_user_id(std::string_view) -> boost::asio::awaitable<std::string> override
        {
            co_return user_id;
        }

        auto resolve_watch_endpoint(std::string_view) -> boost::asio::awaitable<std::string> override
        {
            co_return endpoint;
        }

        auto submit_watch_signal(const WatchSignal& signal, std::chrono::milliseconds)
            -> boost::asio::awaitable<bool> override
        {
            signals.push_back(signal);
            if (watch_results.empty())
            {
                co_return watch_default;
            }
            const bool ok = watch_results.front();
            watch_results.pop_front();
            co_return ok;
        }

        auto submit_claim(std::string_view, std::string_view claim_token)
            -> boost::asio::awaitable<ClaimOutcome> override
        {
            claims.emplace_back(claim_token);
            co_return claim_outcome;
        }

        auto fetch_channel_points(std::string_view, std::string_view)
            -> boost::asio::awaitable<std::optional<ChannelPointsContext>> override
        {
            co_return points;
        }

        auto claim_channel_points(std::string_view, std::string_view, std::string_view claim_id)
            -> boost::asio::awaitable<int> override
        {
            points_claims.emplace_back(claim_id);
            co_return points_after_claim;
        }

        // Campaign listing.
        std::vector<Campaign> campaigns;
        int list_calls{ 0 };

        // Liveness by channel id; absent means offline.
        std::map<std::string, LiveStatus, std::less<>> live;
        std::vector<std::string> probed;

        std::vector<MiningChannel> open_pool;

        Inventory inventory;
        bool inventory_unreadable{ false };
        bool inventory_unreachable{ false };
        int inventory_calls{ 0 };

        std::string user_id{ "1001" };
        std::string endpoint{ "https://video-edge-test.twitch.tv/spade" };

        std::deque<bool> watch_results;
        bool watch_default{ true };
        std::vector<WatchSignal> signals;

        ClaimOutcome claim_outcome{ ClaimOutcome::claimed };
        std::vector<std::string> claims;

        std::optional<ChannelPointsContext> points;
        int points_after_claim{ 0 };
        std::vector<std::string> points_claims;
    };

    class RecordingStatusSink final : public StatusSink
    {
    public:
        void publish_status(const MiningStatus& status) override
        {
            std::lock_guard lk(mutex_);
            statuses.push_back(status);
        }

        void notify(const Notification& note) override
        {
            std::lock_guard lk(mutex_);
            notes.push_back(note);
        }

        template<class T>
        [[nodiscard]] std::vector<T> notes_of() const
        {
            std::lock_guard lk(mutex_);
            std::vector<T> out;
            for (const auto& n : notes)
            {
                if (const auto* p = std::get_if<T>(&n))
                {
                    out.push_back(*p);
                }
            }
            return out;
        }

        [[nodiscard]] std::optional<MiningStatus> last_status() const
        {
            std::lock_guard lk(mutex_);
            if (statuses.empty())
            {
                return std::nullopt;
            }
            return statuses.back();
        }

        std::vector<MiningStatus> statuses;
        std::vector<Notification> notes;

    private:
        mutable std::mutex mutex_;
    };

    class FakeSubscriber final : public ProgressSubscriber
    {
    public:
        void connect(std::string user_id, std::string token) override
        {
            connected_user = std::move(user_id);
            connected_token = std::move(token);
            ++connects;
        }

        void disconnect() noexcept override
        {
            ++disconnects;
        }

        std::string connected_user;
        std::string connected_token;
        int connects{ 0 };
        int disconnects{ 0 };
    };

    /// Run aw to completion on io and return its result (or rethrow).
    template<class T>
    T run_sync(boost::asio::io_context& io, boost::asio::awaitable<T> aw)
    {
        auto fut = boost::asio::co_spawn(io, std::move(aw), boost::asio::use_future);
        io.restart();
        while (fut.wait_for(std::chrono::seconds{ 0 }) != std::future_status::ready)
        {
            if (io.run_one_for(std::chrono::milliseconds{ 50 }) == 0 && io.stopped())
            {
                io.restart();
            }
        }
        return fut.get();
    }

    /// Run io until done() holds or the budget runs out. Returns done().
    inline bool run_until(boost::asio::io_context& io,
                          const std::function<bool()>& done,
                          std::chrono::milliseconds budget = std::chrono::seconds{ 2 })
    {
        const auto deadline = std::chrono::steady_clock::now() + budget;
        io.restart();
        while (!done() && std::chrono::steady_clock::now() < deadline)
        {
            io.run_for(std::chrono::milliseconds{ 10 });
            if (io.stopped())
            {
                io.restart();
            }
        }
        return done();
    }

    /// A current session handle over fresh flags.
    struct LiveSession
    {
        std::shared_ptr<SessionFlags> flags = make_flags();
        SessionHandle handle{ flags, 1 };

        // Simulate a newer session taking over.
        void supersede()
        {
            flags->current_id.store(2);
        }

    private:
        static std::shared_ptr<SessionFlags> make_flags()
        {
            auto f = std::make_shared<SessionFlags>();
            f->running = true;
            f->current_id = 1;
            return f;
        }
    };

    // Builders.

    inline Drop make_drop(std::string id, int required, int current = 0, bool claimed = false, bool with_progress = true)
    {
        Drop d{};
        d.id = id;
        d.name = "Drop " + id;
        d.required_minutes = required;
        d.benefits.push_back(Benefit{ "benefit-" + id, "Reward " + id, "https://img.example/" + id + ".png" });
        if (with_progress)
        {
            DropProgress p{};
            p.drop_id = id;
            p.current_minutes = current;
            p.required_minutes = required;
            p.claimed = claimed;
            d.progress = p;
        }
        return d;
    }

    inline Campaign make_campaign(std::string id, std::string game, std::vector<Drop> drops = {})
    {
        const auto now = wall_clock::now();
        Campaign c{};
        c.id = id;
        c.name = "Campaign " + id;
        c.game_id = "game-" + game;
        c.game_name = game;
        c.start_at = now - std::chrono::hours{ 24 };
        c.end_at = now + std::chrono::hours{ 24 * 7 };
        c.drops = std::move(drops);
        for (auto& d : c.drops)
        {
            if (d.progress)
            {
                d.progress->campaign_id = c.id;
            }
        }
        return c;
    }

    inline MiningChannel make_channel(std::string id, std::string game, int viewers, bool acl = false)
    {
        MiningChannel ch{};
        ch.id = id;
        ch.login = "login_" + id;
        ch.game_id = "game-" + game;
        ch.game_name = game;
        ch.viewers = viewers;
        ch.from_allow_list = acl;
        return ch;
    }

} // namespace drop_miner::fakes
