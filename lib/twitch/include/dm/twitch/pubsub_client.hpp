/*
Module Name:
- pubsub_client.hpp

Abstract:
- TLS WebSocket client for Twitch PubSub. LISTENs on the viewer's drop
  events topic and republishes progress pushes on the EventBus.
- connect() returns at once; a supervisor coroutine owns the socket and
  reconnects with jittered exponential backoff until disconnect().
- Keepalive: PING every four minutes; a PONG must follow within ten seconds
  or the link is dropped and rebuilt.

Why:
- The engine treats realtime progress as a hint. Losing the socket must never
  stall mining, so every failure here ends in a log line and a reconnect.
*/
#pragma once

// C++ Standard Library
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

// Boost.Asio
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/ssl/context.hpp>

// Project
#include <dm/mining/event_bus.hpp>
#include <dm/mining/interfaces.hpp>
#include <dm/mining/model.hpp>

namespace drop_miner::twitch
{

    class PubSubClient final : public ProgressSubscriber
    {
    public:
        PubSubClient(boost::asio::any_io_executor executor,
                     boost::asio::ssl::context& ssl_context,
                     EventBus& bus);

        /// Stops the supervisor; pending I/O completes on the executor.
        ~PubSubClient() override;

        PubSubClient(const PubSubClient&) = delete;
        PubSubClient& operator=(const PubSubClient&) = delete;

        /// Replaces any previous link.
        void connect(std::string user_id, std::string token) override;
        void disconnect() noexcept override;

        /// True between a successful LISTEN response and the next drop.
        [[nodiscard]] bool listening() const noexcept;

    private:
        class Link;

        boost::asio::any_io_executor executor_;
        boost::asio::ssl::context* ssl_context_; // non-null
        EventBus* bus_;                          // non-null

        mutable std::mutex mutex_; // protects link_
        std::shared_ptr<Link> link_;
    };

    namespace pubsub
    {

        enum class FrameKind
        {
            pong,
            reconnect,
            response,
            message,
            other,
        };

        struct Frame
        {
            FrameKind kind{ FrameKind::other };
            std::string error;                    ///< RESPONSE error code, empty on success
            std::string topic;                    ///< MESSAGE topic
            std::string event_type;               ///< inner message type ("drop-progress", "drop-claim")
            std::optional<ProgressEvent> progress; ///< set for drop-progress messages
        };

        [[nodiscard]] std::string drop_events_topic(std::string_view user_id);

        [[nodiscard]] std::string make_listen_frame(std::string_view topic,
                                                    std::string_view token,
                                                    std::string_view nonce);

        [[nodiscard]] std::string make_ping_frame();

        /// Decode one text frame. Malformed input yields FrameKind::other.
        [[nodiscard]] Frame parse_frame(std::string_view text);

        /// Delay before reconnect attempt number attempts (which is then incremented).
        [[nodiscard]] std::chrono::milliseconds next_backoff(unsigned& attempts,
                                                             std::chrono::milliseconds base,
                                                             std::chrono::milliseconds cap);

    } // namespace pubsub

} // namespace drop_miner::twitch
