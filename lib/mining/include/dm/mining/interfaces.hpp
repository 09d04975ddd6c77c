/*
Module Name:
- interfaces.hpp

Abstract:
- Seams between the engine and the outside world. The engine only ever calls
  these abstract operations; lib/twitch provides the production adapters and
  the tests provide in-memory fakes.

Error contract:
- Every operation may throw AuthError, TransportError or ParseError.
- Implementations bound every network call with a timeout of their own.
*/
#pragma once

// C++ Standard Library
#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

// Boost.Asio
#include <boost/asio/awaitable.hpp>

// Project
#include <dm/mining/model.hpp>

namespace drop_miner
{

    class CredentialProvider
    {
    public:
        virtual ~CredentialProvider() = default;

        /// Bearer credential for the next network call. Throws AuthError.
        [[nodiscard]] virtual auto get_token() -> boost::asio::awaitable<std::string> = 0;
    };

    class CatalogClient
    {
    public:
        virtual ~CatalogClient() = default;

        /// Raw campaign listing; the catalog normalizes and filters it.
        [[nodiscard]] virtual auto list_active_campaigns(std::string_view token)
            -> boost::asio::awaitable<std::vector<Campaign>> = 0;

        /// nullopt when the channel is offline.
        [[nodiscard]] virtual auto probe_channel(std::string_view token, std::string_view channel_id)
            -> boost::asio::awaitable<std::optional<LiveStatus>> = 0;

        /// Up to limit live, drops-enabled channels streaming the game.
        [[nodiscard]] virtual auto list_live_channels(std::string_view token,
                                                      std::string_view game_id,
                                                      std::string_view game_name,
                                                      std::size_t limit)
            -> boost::asio::awaitable<std::vector<MiningChannel>> = 0;

        [[nodiscard]] virtual auto fetch_inventory(std::string_view token)
            -> boost::asio::awaitable<Inventory> = 0;

        [[nodiscard]] virtual auto resolve_user_id(std::string_view token)
            -> boost::asio::awaitable<std::string> = 0;

        /// Telemetry endpoint that accepts watch signals for the channel.
        [[nodiscard]] virtual auto resolve_watch_endpoint(std::string_view channel_login)
            -> boost::asio::awaitable<std::string> = 0;

        /// true only on an explicit acknowledgement (204 No Content).
        [[nodiscard]] virtual auto submit_watch_signal(const WatchSignal& signal,
                                                       std::chrono::milliseconds timeout)
            -> boost::asio::awaitable<bool> = 0;

        [[nodiscard]] virtual auto submit_claim(std::string_view token, std::string_view claim_token)
            -> boost::asio::awaitable<ClaimOutcome> = 0;

        [[nodiscard]] virtual auto fetch_channel_points(std::string_view token, std::string_view channel_login)
            -> boost::asio::awaitable<std::optional<ChannelPointsContext>> = 0;

        /// Returns the balance after claiming.
        [[nodiscard]] virtual auto claim_channel_points(std::string_view token,
                                                        std::string_view channel_id,
                                                        std::string_view claim_id)
            -> boost::asio::awaitable<int> = 0;
    };

    /// Realtime progress source. Events are published on the EventBus topic
    /// k_drop_progress_topic; reconnecting is the subscriber's own business.
    class ProgressSubscriber
    {
    public:
        virtual ~ProgressSubscriber() = default;

        /// Begin delivering events for user_id. Returns without waiting for the connection.
        virtual void connect(std::string user_id, std::string token) = 0;

        /// Stop delivering events. Idempotent.
        virtual void disconnect() noexcept = 0;
    };

    /// UI layer. Calls may come from any engine thread.
    class StatusSink
    {
    public:
        virtual ~StatusSink() = default;

        virtual void publish_status(const MiningStatus& status) = 0;
        virtual void notify(const Notification& note) = 0;
    };

} // namespace drop_miner
