/*
Module Name:
- session_controller.hpp

Abstract:
- Owns the run flag and the monotonic session id, the shared state and the
  campaign cache. start() picks a channel (catalog, discovery, scorer),
  publishes the initial status, connects the realtime subscriber and spawns
  the heartbeat, reconciliation and channel-points loops on a per-session
  strand. stop() tears all of that down and publishes the empty status.
- Loops of an older session notice their stale SessionHandle on the next tick
  and exit without writing status.
*/
#pragma once

// C++ Standard Library
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

// Boost.Asio
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>

// Project
#include <dm/mining/campaign_catalog.hpp>
#include <dm/mining/event_bus.hpp>
#include <dm/mining/interfaces.hpp>
#include <dm/mining/model.hpp>
#include <dm/mining/settings.hpp>
#include <dm/mining/shared_state.hpp>

namespace drop_miner
{

    // Empty campaign_id means automatic mode.
    struct StartRequest
    {
        std::optional<std::string> campaign_id;
        std::optional<std::string> channel_id; ///< preferred channel, used when eligible
    };

    class SessionController
    {
    public:
        SessionController(boost::asio::any_io_executor executor,
                          CatalogClient& client,
                          CredentialProvider& creds,
                          ProgressSubscriber& subscriber,
                          EventBus& bus,
                          StatusSink& sink,
                          MiningSettings settings);

        ~SessionController() noexcept;

        SessionController(const SessionController&) = delete;
        SessionController& operator=(const SessionController&) = delete;

        // No-op while a session runs. Throws AuthError, TransportError or
        // CampaignUnavailable; the run flag is reset before rethrowing.
        [[nodiscard]] auto start(StartRequest request) -> boost::asio::awaitable<void>;

        // Idempotent; safe from any thread and from inside a loop.
        void stop();

        [[nodiscard]] MiningStatus status() const
        {
            return shared_.status.snapshot();
        }

        [[nodiscard]] bool is_running() const noexcept
        {
            return flags_->running.load(std::memory_order_acquire);
        }

        [[nodiscard]] std::uint64_t session_id() const noexcept
        {
            return flags_->current_id.load(std::memory_order_acquire);
        }

        [[nodiscard]] const MiningSettings& settings() const noexcept
        {
            return settings_;
        }

    private:
        struct Session;

        auto bootstrap(std::shared_ptr<Session> session, StartRequest request) -> boost::asio::awaitable<void>;
        void spawn_loops(const std::shared_ptr<Session>& session);

        // Stop the session identified by handle (once) and deliver note.
        void finish(const SessionHandle& handle, Notification note);

        boost::asio::any_io_executor executor_;
        CatalogClient& client_;
        CredentialProvider& creds_;
        ProgressSubscriber& subscriber_;
        EventBus& bus_;
        StatusSink& sink_;
        const MiningSettings settings_;

        std::shared_ptr<SessionFlags> flags_;
        SharedState shared_;
        CampaignCatalog catalog_;

        std::mutex session_mutex_; // protects session_ and the start/stop flag transitions
        std::shared_ptr<Session> session_;
        std::atomic<std::uint64_t> finished_id_{ 0 };
    };

} // namespace drop_miner
