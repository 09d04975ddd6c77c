/*
Module Name:
- session_controller.cpp

Abstract:
- Session bootstrap, loop supervision and teardown.

Notes:
- Session owns the per-session components; every spawned loop holds a
  shared_ptr to it, so stop() may drop the controller's reference while loops
  are still finishing their current tick.
- Loop exit handlers contain errors: AuthError stops the session, anything
  else is logged.
*/

// C++ Standard Library
#include <algorithm>
#include <exception>
#include <iostream>
#include <utility>

// Boost.Asio
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/strand.hpp>

// Project
#include <dm/mining/channel_discovery.hpp>
#include <dm/mining/channel_points.hpp>
#include <dm/mining/channel_scorer.hpp>
#include <dm/mining/claim_service.hpp>
#include <dm/mining/errors.hpp>
#include <dm/mining/failover.hpp>
#include <dm/mining/heartbeat_loop.hpp>
#include <dm/mining/loop_timer.hpp>
#include <dm/mining/progress_reconciler.hpp>
#include <dm/mining/session_controller.hpp>

namespace drop_miner
{

    struct SessionController::Session
    {
        Session(SessionController& owner, SessionHandle h) :
            handle(std::move(h)),
            strand(boost::asio::make_strand(owner.executor_)),
            heartbeat_timer(std::make_shared<LoopTimer>(strand)),
            poll_timer(std::make_shared<LoopTimer>(strand)),
            points_timer(std::make_shared<LoopTimer>(strand)),
            discovery(owner.client_, owner.creds_),
            claims(owner.client_, owner.creds_, owner.shared_, owner.sink_, owner.settings_),
            failover(owner.client_,
                     owner.creds_,
                     owner.catalog_,
                     discovery,
                     owner.shared_,
                     owner.sink_,
                     owner.settings_,
                     [&owner](const SessionHandle& handle, std::string reason) {
                         owner.finish(handle, NoChannelsAvailable{ std::move(reason) });
                     })
        {
        }

        void cancel_timers()
        {
            heartbeat_timer->cancel();
            poll_timer->cancel();
            points_timer->cancel();
        }

        const SessionHandle handle;
        boost::asio::strand<boost::asio::any_io_executor> strand;
        std::shared_ptr<LoopTimer> heartbeat_timer;
        std::shared_ptr<LoopTimer> poll_timer;
        std::shared_ptr<LoopTimer> points_timer;

        ChannelDiscovery discovery;
        ClaimService claims;
        FailoverStateMachine failover;

        // Built once the target is known.
        std::unique_ptr<HeartbeatLoop> heartbeat;
        std::shared_ptr<ProgressReconciler> reconciler;
        std::unique_ptr<ChannelPointsHarvester> points;

        std::atomic<EventBus::subscription_id> subscription{ 0 };
    };

    SessionController::SessionController(boost::asio::any_io_executor executor,
                                         CatalogClient& client,
                                         CredentialProvider& creds,
                                         ProgressSubscriber& subscriber,
                                         EventBus& bus,
                                         StatusSink& sink,
                                         MiningSettings settings) :
        executor_(std::move(executor)),
        client_(client),
        creds_(creds),
        subscriber_(subscriber),
        bus_(bus),
        sink_(sink),
        settings_(std::move(settings)),
        flags_(std::make_shared<SessionFlags>()),
        catalog_(client_, creds_, shared_.progress, settings_.campaign_cache_ttl)
    {
    }

    SessionController::~SessionController() noexcept
    {
        // Best-effort: loops still holding a Session exit on their next tick.
        try
        {
            stop();
        }
        catch (const std::exception& e)
        {
            std::cerr << "[Session] stop during destruction failed: " << e.what() << '\n';
        }
    }

    auto SessionController::start(StartRequest request) -> boost::asio::awaitable<void>
    {
        std::shared_ptr<Session> session;
        {
            std::lock_guard lk(session_mutex_);
            if (flags_->running.load(std::memory_order_acquire))
            {
                std::cout << "[Session] start ignored, session " << session_id() << " is running\n";
                co_return;
            }
            // New id first so handles of the previous session can never look current again.
            const auto id = flags_->current_id.fetch_add(1, std::memory_order_acq_rel) + 1;
            flags_->running.store(true, std::memory_order_release);
            session = std::make_shared<Session>(*this, SessionHandle{ flags_, id });
            session_ = session;
        }
        std::cout << "[Session] starting session " << session->handle.id()
                  << (request.campaign_id ? " for campaign " + *request.campaign_id : std::string{ " in automatic mode" })
                  << '\n';

        std::exception_ptr failure;
        try
        {
            co_await bootstrap(session, std::move(request));
        }
        catch (const std::exception& e)
        {
            std::cerr << "[Session] bootstrap failed: " << e.what() << '\n';
            failure = std::current_exception();
        }
        if (failure)
        {
            if (session->handle.is_current())
            {
                stop();
            }
            std::rethrow_exception(failure);
        }
    }

    auto SessionController::bootstrap(std::shared_ptr<Session> session, StartRequest request)
        -> boost::asio::awaitable<void>
    {
        const SessionHandle& handle = session->handle;

        std::vector<Campaign> campaigns;
        try
        {
            campaigns = co_await catalog_.get_cached();
        }
        catch (const ParseError& e)
        {
            std::cerr << "[Session] campaign listing unreadable: " << e.what() << '\n';
        }
        const auto filtered = apply_filters(campaigns, settings_);

        std::optional<MiningTarget> target;
        std::vector<MiningChannel> ranked;
        if (request.campaign_id)
        {
            auto it = std::find_if(filtered.begin(), filtered.end(), [&](const Campaign& c) {
                return c.id == *request.campaign_id;
            });
            if (it == filtered.end())
            {
                throw CampaignUnavailable("campaign " + *request.campaign_id + " is not active");
            }
            target = MiningTarget{ it->id, it->name, it->game_id, it->game_name, true };
            const std::vector<Campaign> scoped{ *it };
            auto found = co_await session->discovery.discover_eligible(scoped, settings_);
            ranked = rank_channels(std::move(found), settings_);
        }
        else if (auto first = co_await session->discovery.find_first_eligible(filtered))
        {
            target = MiningTarget{ first->campaign.id, first->campaign.name, first->campaign.game_id, first->campaign.game_name, false };
            ranked.push_back(std::move(first->channel));
        }

        if (request.channel_id && !ranked.empty())
        {
            auto it = std::find_if(ranked.begin(), ranked.end(), [&](const MiningChannel& c) { return c.id == *request.channel_id; });
            if (it != ranked.end())
            {
                std::rotate(ranked.begin(), it, it + 1);
            }
            else
            {
                std::cout << "[Session] preferred channel " << *request.channel_id << " is not eligible, using the best one\n";
            }
        }

        if (!handle.is_current())
        {
            co_return;
        }
        if (!target || ranked.empty())
        {
            std::cout << "[Session] no live channel found at startup\n";
            finish(handle, NoChannelsAvailable{ "no live channel found at startup" });
            co_return;
        }

        shared_.channels.replace(ranked);
        auto initial = co_await session->failover.try_switch(ranked, {}, std::nullopt);
        if (!initial)
        {
            finish(handle, NoChannelsAvailable{ "no channel is broadcasting for " + target->campaign_name });
            co_return;
        }

        auto snap = shared_.status.update_if_current(handle, [&](MiningStatus& s) {
            s = MiningStatus{};
            s.active = true;
            s.channel = initial->channel;
            s.campaign_id = target->campaign_id;
            s.campaign_name = target->campaign_name;
            s.game_name = target->game_name;
            s.eligible_channels = ranked;
        });
        if (!snap)
        {
            co_return;
        }
        sink_.publish_status(*snap);
        std::cout << "[Session] session " << handle.id() << " watching " << initial->channel.login << " for "
                  << target->campaign_name << " (" << target->game_name << ")\n";

        // The poll path keeps progress correct without push events.
        try
        {
            const auto user_id = co_await shared_.identity.user_id(client_, creds_);
            const auto token = co_await creds_.get_token();
            subscriber_.connect(user_id, token);
        }
        catch (const AuthError&)
        {
            throw;
        }
        catch (const MiningError& e)
        {
            std::cerr << "[Session] realtime progress unavailable, polling only: " << e.what() << '\n';
        }

        session->heartbeat = std::make_unique<HeartbeatLoop>(client_,
                                                             creds_,
                                                             shared_,
                                                             session->failover,
                                                             session->heartbeat_timer,
                                                             settings_,
                                                             handle,
                                                             *target,
                                                             std::move(*initial));
        session->reconciler = std::make_shared<ProgressReconciler>(client_,
                                                                   creds_,
                                                                   catalog_,
                                                                   session->claims,
                                                                   shared_,
                                                                   sink_,
                                                                   session->poll_timer,
                                                                   settings_,
                                                                   handle,
                                                                   *target,
                                                                   [this](const SessionHandle& h, MiningComplete note) {
                                                                       finish(h, std::move(note));
                                                                   });
        session->points = std::make_unique<ChannelPointsHarvester>(
            client_, creds_, shared_, sink_, session->points_timer, settings_, handle);

        std::weak_ptr<ProgressReconciler> weak = session->reconciler;
        session->subscription.store(bus_.subscribe(k_drop_progress_topic,
                                                   [weak](const ProgressEvent& event) {
                                                       if (auto r = weak.lock())
                                                       {
                                                           r->on_push(event);
                                                       }
                                                   }),
                                    std::memory_order_release);
        if (!handle.is_current())
        {
            // stop() ran while we were subscribing.
            if (const auto id = session->subscription.exchange(0); id != 0)
            {
                bus_.unsubscribe(id);
            }
            co_return;
        }

        spawn_loops(session);
    }

    void SessionController::spawn_loops(const std::shared_ptr<Session>& session)
    {
        auto on_exit = [this, session](std::string_view name) {
            return [this, session, name](std::exception_ptr ep) {
                if (!ep)
                {
                    return;
                }
                try
                {
                    std::rethrow_exception(ep);
                }
                catch (const AuthError& e)
                {
                    std::cerr << "[Session] " << name << " loop: re-authentication required: " << e.what() << '\n';
                    if (session->handle.is_current())
                    {
                        stop();
                    }
                }
                catch (const std::exception& e)
                {
                    std::cerr << "[Session] " << name << " loop failed: " << e.what() << '\n';
                }
            };
        };

        boost::asio::co_spawn(
            session->strand,
            [session]() -> boost::asio::awaitable<void> { co_await session->heartbeat->run(); },
            on_exit("heartbeat"));
        boost::asio::co_spawn(
            session->strand,
            [session]() -> boost::asio::awaitable<void> { co_await session->reconciler->run(); },
            on_exit("progress"));
        boost::asio::co_spawn(
            session->strand,
            [session]() -> boost::asio::awaitable<void> { co_await session->points->run(); },
            on_exit("points"));
    }

    void SessionController::finish(const SessionHandle& handle, Notification note)
    {
        if (!handle.is_current())
        {
            return;
        }
        // Only the first terminal event of a session is reported.
        if (finished_id_.exchange(handle.id(), std::memory_order_acq_rel) == handle.id())
        {
            return;
        }
        std::cout << "[Session] session " << handle.id() << " finished: " << notification_name(note) << '\n';
        stop();
        sink_.notify(note);
    }

    void SessionController::stop()
    {
        std::shared_ptr<Session> session;
        bool was_running = false;
        {
            std::lock_guard lk(session_mutex_);
            was_running = flags_->running.exchange(false, std::memory_order_acq_rel);
            session = std::exchange(session_, nullptr);
        }
        if (!was_running && !session)
        {
            return;
        }

        if (session)
        {
            session->cancel_timers();
            if (const auto id = session->subscription.exchange(0); id != 0)
            {
                bus_.unsubscribe(id);
            }
        }
        subscriber_.disconnect();
        shared_.identity.clear();
        shared_.channels.clear();

        const auto empty = shared_.status.reset();
        sink_.publish_status(empty);
        std::cout << "[Session] stopped session " << session_id() << '\n';
    }

} // namespace drop_miner
