/*
Module Name:
- gql_catalog_client.hpp

Abstract:
- CatalogClient for Twitch: the GraphQL gateway for campaigns, inventory,
  liveness, open-pool streams, drop claims and channel points; the OAuth
  validate endpoint for the viewer id; the channel page for the spade
  (telemetry) URL that accepts watch signals.
- Errors are mapped onto the engine taxonomy: 401 -> AuthError, transport
  failure or other non-2xx -> TransportError, unexpected shape -> ParseError.
- Response parsing lives in free functions so it can be tested offline.
*/
#pragma once

// C++ Standard Library
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

// Boost.Asio
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/ssl/context.hpp>

// Project
#include <dm/mining/interfaces.hpp>
#include <dm/mining/model.hpp>
#include <dm/net/http/http_client.hpp>

namespace drop_miner::twitch {

inline constexpr std::string_view k_client_id  = "kd1unb4b3q4t58fwlpcbzcbnm76a8fp";
inline constexpr std::string_view k_web_origin = "https://www.twitch.tv";

class GqlCatalogClient final : public CatalogClient
{
public:
    GqlCatalogClient(boost::asio::any_io_executor executor, boost::asio::ssl::context& ssl_ctx);
    ~GqlCatalogClient() override;

    GqlCatalogClient(const GqlCatalogClient&)            = delete;
    GqlCatalogClient& operator=(const GqlCatalogClient&) = delete;

    auto list_active_campaigns(std::string_view token)
        -> boost::asio::awaitable<std::vector<Campaign>> override;

    auto probe_channel(std::string_view token, std::string_view channel_id)
        -> boost::asio::awaitable<std::optional<LiveStatus>> override;

    auto list_live_channels(std::string_view token,
                            std::string_view game_id,
                            std::string_view game_name,
                            std::size_t      limit)
        -> boost::asio::awaitable<std::vector<MiningChannel>> override;

    auto fetch_inventory(std::string_view token) -> boost::asio::awaitable<Inventory> override;

    auto resolve_user_id(std::string_view token) -> boost::asio::awaitable<std::string> override;

    auto resolve_watch_endpoint(std::string_view channel_login)
        -> boost::asio::awaitable<std::string> override;

    auto submit_watch_signal(const WatchSignal& signal, std::chrono::milliseconds timeout)
        -> boost::asio::awaitable<bool> override;

    auto submit_claim(std::string_view token, std::string_view claim_token)
        -> boost::asio::awaitable<ClaimOutcome> override;

    auto fetch_channel_points(std::string_view token, std::string_view channel_login)
        -> boost::asio::awaitable<std::optional<ChannelPointsContext>> override;

    auto claim_channel_points(std::string_view token,
                              std::string_view channel_id,
                              std::string_view claim_id) -> boost::asio::awaitable<int> override;

    // Close pooled connections.
    void shutdown() noexcept;

private:
    // POST one GraphQL document; returns the parsed response root.
    auto post_gql(std::string_view token, const std::string& body, std::string_view operation)
        -> boost::asio::awaitable<http_client::json>;

    // GET an absolute URL; returns the body of a 2xx response.
    auto fetch_text(std::string_view url) -> boost::asio::awaitable<std::string>;

    std::string                          device_id_;
    std::unique_ptr<http_client::client> http_;
};

namespace gql {

    using http_client::json;

    // "YYYY-MM-DDTHH:MM:SS[.fff]Z"
    [[nodiscard]] std::optional<time_point> parse_rfc3339(std::string_view ts) noexcept;

    // ViewerDropsDashboard response.
    [[nodiscard]] std::vector<Campaign> parse_campaigns(const json& root, time_point now);

    // Inventory response.
    [[nodiscard]] Inventory parse_inventory(const json& root, time_point now);

    // ChannelStatus response; nullopt when the channel is offline.
    [[nodiscard]] std::optional<LiveStatus> parse_channel_status(const json& root);

    // GameStreams response.
    [[nodiscard]] std::vector<MiningChannel> parse_game_streams(const json&      root,
                                                                std::string_view game_id,
                                                                std::string_view game_name);

    [[nodiscard]] ClaimOutcome parse_claim_outcome(const json& root);

    [[nodiscard]] std::optional<ChannelPointsContext> parse_channel_points(const json& root);

    // First GraphQL error message, if any.
    [[nodiscard]] std::optional<std::string> first_error(const json& root);

    [[nodiscard]] std::optional<std::string> extract_spade_url(std::string_view page);
    [[nodiscard]] std::optional<std::string> extract_settings_url(std::string_view page);

    // Minified minute-watched event, Base64 encoded.
    [[nodiscard]] std::string encode_watch_payload(const WatchSignal& signal);

    [[nodiscard]] std::string base64_encode(std::string_view data);
    [[nodiscard]] std::string form_urlencode(std::string_view s);

} // namespace gql

} // namespace drop_miner::twitch
