// C++ Standard Library
#include <array>
#include <chrono>
#include <iostream>
#include <optional>
#include <random>
#include <string>
#include <string_view>
#include <system_error>

// Boost.Beast
#include <boost/beast/http/verb.hpp>

// OpenSSL
#include <openssl/evp.h>

// Glaze
#include <glaze/json.hpp>

// GSL
#include <gsl/gsl>

// Project
#include <dm/mining/errors.hpp>
#include <dm/twitch/gql_catalog_client.hpp>
#include <dm/twitch/json_nav.hpp>
#include <dm/utils/attributes.hpp>

namespace drop_miner::twitch {

using http_client::json;
using namespace json_nav;
namespace http = boost::beast::http;

namespace { // endpoints, request shapes and JSON navigation

    struct EndPoint {
        std::string_view host, port, target;
    };

    constexpr EndPoint gql_endpoint{"gql.twitch.tv", "443", "/gql"};
    constexpr EndPoint oauth_validate{"id.twitch.tv", "443", "/oauth2/validate"};

    constexpr std::string_view k_dashboard_hash
        = "5a4da2ab3d5b47c9f9ce864e727b2cb346af1e3ea8b897fe8f704a97ff017619";
    constexpr std::string_view k_inventory_hash
        = "d86775d0ef16a63a33ad52e80eaff963b2d5b72fada7c991504a57496e1d8e4b";
    constexpr std::string_view k_claim_points_hash
        = "46aaeebe02c99afdf4fc97c7c0cba964124bf6b0af229395f1f6d1feed05b3d0";

    constexpr std::string_view k_channel_status_query = R"(
        query ChannelStatus($channelID: ID!) {
            user(id: $channelID) {
                id
                login
                stream { id viewersCount }
            }
        })";

    constexpr std::string_view k_game_streams_query = R"(
        query GameStreams($gameID: ID!, $first: Int!) {
            game(id: $gameID) {
                streams(first: $first, options: {systemFilters: [DROPS_ENABLED]}) {
                    edges { node { id viewersCount broadcaster { id login } } }
                }
            }
        })";

    constexpr std::string_view k_claim_drop_mutation = R"(
        mutation ClaimDrop($input: ClaimDropRewardsInput!) {
            claimDropRewards(input: $input) { status }
        })";

    constexpr std::string_view k_channel_points_query = R"(
        query ChannelPointsContext($channelLogin: String!) {
            user(login: $channelLogin) {
                id
                channel {
                    id
                    self { communityPoints { balance availableClaim { id } } }
                }
            }
        })";

    // Standard watch bonus; the query does not report it.
    constexpr int k_default_bonus_points = 50;

    // Request bodies, serialised by Glaze reflection.
    struct PersistedQuery {
        int         version{1};
        std::string sha256Hash;
    };

    struct Extensions {
        PersistedQuery persistedQuery;
    };

    template<class Vars>
    struct PersistedRequest {
        std::string operationName;
        Vars        variables;
        Extensions  extensions;
    };

    template<class Vars>
    struct QueryRequest {
        std::string operationName;
        std::string query;
        Vars        variables;
    };

    struct RewardCampaignVars {
        bool fetchRewardCampaigns{false};
    };

    struct ChannelIdVars {
        std::string channelID;
    };

    struct GameStreamsVars {
        std::string gameID;
        int         first{0};
    };

    struct ClaimDropInput {
        std::string dropInstanceID;
    };

    struct ClaimDropVars {
        ClaimDropInput input;
    };

    struct ChannelLoginVars {
        std::string channelLogin;
    };

    struct ClaimPointsInput {
        std::string channelID;
        std::string claimID;
    };

    struct ClaimPointsVars {
        ClaimPointsInput input;
    };

    struct MinuteWatchedProperties {
        std::string broadcast_id;
        std::string channel_id;
        std::string channel;
        bool        hidden{false};
        bool        live{true};
        std::string location{"channel"};
        bool        logged_in{true};
        bool        muted{false};
        std::string player{"site"};
        std::string user_id;
    };

    struct SpadeEvent {
        std::string             event{"minute-watched"};
        MinuteWatchedProperties properties;
    };

    Extensions persisted(std::string_view hash)
    {
        return Extensions{PersistedQuery{1, std::string{hash}}};
    }

    inline int parse_digits(const char* p, int n) noexcept
    {
        int v = 0;
        for (int i = 0; i < n; ++i) {
            if (DM_UNLIKELY(p[i] < '0' || p[i] > '9'))
                return -1;
            v = v * 10 + (p[i] - '0');
        }
        return v;
    }

    Drop parse_drop(const json& d)
    {
        Drop drop{};
        drop.id               = string_of(member(&d, "id"));
        drop.name             = string_of(member(&d, "name"));
        drop.required_minutes = int_of(member(&d, "requiredMinutesWatched"));
        if (const auto* edges = array_of(member(&d, "benefitEdges"))) {
            for (const auto& edge : *edges) {
                const json* b = member(&edge, "benefit");
                if (!b)
                    continue;
                drop.benefits.push_back(Benefit{string_of(member(b, "id")),
                                                string_of(member(b, "name")),
                                                string_of(member(b, "imageAssetURL"))});
            }
        }
        if (const json* self = member(&d, "self")) {
            DropProgress p{};
            p.drop_id          = drop.id;
            p.current_minutes  = int_of(member(self, "currentMinutesWatched"));
            p.required_minutes = drop.required_minutes;
            p.claimed          = bool_of(member(self, "isClaimed"));
            if (auto instance = string_of(member(self, "dropInstanceID")); !instance.empty())
                p.claim_token = std::move(instance);
            p.last_updated = wall_clock::now();
            drop.progress  = std::move(p);
        }
        return drop;
    }

    // One campaign record; nullopt for expired or game-less campaigns.
    std::optional<Campaign> parse_campaign_record(const json& c, time_point now)
    {
        if (string_of(member(&c, "status")) == "EXPIRED")
            return std::nullopt;
        const json* game = member(&c, "game");
        if (!game)
            return std::nullopt;

        Campaign out{};
        out.id        = string_of(member(&c, "id"));
        out.name      = string_of(member(&c, "name"));
        out.game_id   = string_of(member(game, "id"));
        out.game_name = string_of(member(game, "displayName"));
        if (out.game_name.empty())
            out.game_name = string_of(member(game, "name"));

        out.start_at = gql::parse_rfc3339(string_of(member(&c, "startAt"))).value_or(now);
        out.end_at   = gql::parse_rfc3339(string_of(member(&c, "endAt")))
                         .value_or(now + std::chrono::hours{24 * 365});

        if (const json* allow = member(&c, "allow")) {
            out.allow_list_enforced = bool_of(member(allow, "isEnabled"));
            if (const auto* channels = array_of(member(allow, "channels"))) {
                for (const auto& ch : *channels) {
                    auto login = string_of(member(&ch, "login"));
                    if (login.empty())
                        login = string_of(member(&ch, "name"));
                    out.allowed_channels.push_back(AllowedChannel{string_of(member(&ch, "id")), std::move(login)});
                }
            }
        }

        if (const auto* drops = array_of(member(&c, "timeBasedDrops"))) {
            for (const auto& d : *drops) {
                auto drop = parse_drop(d);
                if (drop.progress)
                    drop.progress->campaign_id = out.id;
                out.drops.push_back(std::move(drop));
            }
        }
        return out;
    }

    std::string make_device_id()
    {
        static constexpr char hex[] = "0123456789abcdef";
        static thread_local std::mt19937 rng{std::random_device{}()};
        std::uniform_int_distribution<int> dist(0, 15);
        std::string id(32, '0');
        for (auto& c : id)
            c = hex[dist(rng)];
        return id;
    }

    const http_client::client::RequestOptions& gql_options()
    {
        static const http_client::client::RequestOptions opts{
            .total_timeout = std::chrono::seconds{20},
        };
        return opts;
    }

    const http_client::client::RequestOptions& page_options()
    {
        static const http_client::client::RequestOptions opts{
            .total_timeout = std::chrono::seconds{20},
            .accept        = "text/html,application/javascript,*/*",
        };
        return opts;
    }

} // namespace

namespace gql {

    std::optional<time_point> parse_rfc3339(std::string_view ts) noexcept
    {
        // Fractional seconds are accepted and dropped.
        if (ts.size() < 20 || ts.back() != 'Z')
            return std::nullopt;
        const char* p = ts.data();
        if (p[4] != '-' || p[7] != '-' || p[10] != 'T' || p[13] != ':' || p[16] != ':')
            return std::nullopt;
        if (ts.size() > 20 && p[19] != '.')
            return std::nullopt;

        const int y  = parse_digits(p, 4);
        const int mo = parse_digits(p + 5, 2);
        const int d  = parse_digits(p + 8, 2);
        const int hh = parse_digits(p + 11, 2);
        const int mm = parse_digits(p + 14, 2);
        const int ss = parse_digits(p + 17, 2);
        if (y < 0 || mo < 1 || mo > 12 || d < 1 || d > 31 || hh < 0 || hh > 23 || mm < 0 || mm > 59
            || ss < 0 || ss > 60) {
            return std::nullopt;
        }

        const std::chrono::year_month_day date{std::chrono::year{y},
                                               std::chrono::month{static_cast<unsigned>(mo)},
                                               std::chrono::day{static_cast<unsigned>(d)}};
        if (!date.ok())
            return std::nullopt;
        const auto secs = std::chrono::sys_days{date} + std::chrono::hours{hh} + std::chrono::minutes{mm}
                        + std::chrono::seconds{ss};
        return std::chrono::time_point_cast<wall_clock::duration>(secs);
    }

    std::vector<Campaign> parse_campaigns(const json& root, time_point now)
    {
        std::vector<Campaign> out;
        const auto* list = array_of(at_path(root, {"data", "currentUser", "dropCampaigns"}));
        if (!list) {
            if (!at_path(root, {"data", "currentUser"}))
                throw ParseError("ViewerDropsDashboard: no currentUser in response");
            return out;
        }
        out.reserve(list->size());
        for (const auto& c : *list) {
            if (auto campaign = parse_campaign_record(c, now))
                out.push_back(std::move(*campaign));
        }
        return out;
    }

    Inventory parse_inventory(const json& root, time_point now)
    {
        const json* inventory = at_path(root, {"data", "currentUser", "inventory"});
        if (!inventory) {
            if (!at_path(root, {"data", "currentUser"}))
                throw ParseError("Inventory: no currentUser in response");
            return {};
        }

        Inventory out{};
        if (const auto* list = array_of(member(inventory, "dropCampaignsInProgress"))) {
            for (const auto& c : *list) {
                if (auto campaign = parse_campaign_record(c, now))
                    out.campaigns.push_back(std::move(*campaign));
            }
        }
        if (const auto* events = array_of(member(inventory, "gameEventDrops"))) {
            for (const auto& e : *events) {
                auto id      = string_of(member(&e, "id"));
                auto awarded = parse_rfc3339(string_of(member(&e, "lastAwardedAt")));
                if (!id.empty() && awarded)
                    out.claimed_benefits.push_back(ClaimedBenefit{std::move(id), *awarded});
            }
        }
        return out;
    }

    std::optional<LiveStatus> parse_channel_status(const json& root)
    {
        const json* stream = at_path(root, {"data", "user", "stream"});
        if (!stream)
            return std::nullopt;
        return LiveStatus{int_of(member(stream, "viewersCount")), string_of(member(stream, "id"))};
    }

    std::vector<MiningChannel> parse_game_streams(const json&      root,
                                                  std::string_view game_id,
                                                  std::string_view game_name)
    {
        std::vector<MiningChannel> out;
        const auto* edges = array_of(at_path(root, {"data", "game", "streams", "edges"}));
        if (!edges)
            return out;
        out.reserve(edges->size());
        for (const auto& edge : *edges) {
            const json* node        = member(&edge, "node");
            const json* broadcaster = member(node, "broadcaster");
            if (!broadcaster)
                continue;
            MiningChannel ch{};
            ch.id              = string_of(member(broadcaster, "id"));
            ch.login           = string_of(member(broadcaster, "login"));
            ch.game_id         = std::string{game_id};
            ch.game_name       = std::string{game_name};
            ch.viewers         = int_of(member(node, "viewersCount"));
            ch.drops_enabled   = true;
            ch.online          = true;
            ch.from_allow_list = false;
            if (!ch.id.empty() && !ch.login.empty())
                out.push_back(std::move(ch));
        }
        return out;
    }

    ClaimOutcome parse_claim_outcome(const json& root)
    {
        if (first_error(root))
            return ClaimOutcome::invalid_token;
        const json* result = at_path(root, {"data", "claimDropRewards"});
        if (!result)
            return ClaimOutcome::failed;
        const auto status = string_of(member(result, "status"));
        if (status.find("ALREADY_CLAIMED") != std::string::npos)
            return ClaimOutcome::already_claimed;
        return ClaimOutcome::claimed;
    }

    std::optional<ChannelPointsContext> parse_channel_points(const json& root)
    {
        const json* points = at_path(root, {"data", "user", "channel", "self", "communityPoints"});
        if (!points)
            return std::nullopt;
        ChannelPointsContext ctx{};
        ctx.balance = int_of(member(points, "balance"));
        if (const json* claim = member(points, "availableClaim")) {
            if (auto id = string_of(member(claim, "id")); !id.empty()) {
                ctx.claim_id        = std::move(id);
                ctx.points_on_claim = k_default_bonus_points;
            }
        }
        return ctx;
    }

    std::optional<std::string> first_error(const json& root)
    {
        const auto* errors = array_of(member(&root, "errors"));
        if (!errors || errors->empty())
            return std::nullopt;
        auto msg = string_of(member(&errors->front(), "message"));
        return msg.empty() ? std::string{"unknown GraphQL error"} : msg;
    }

    std::optional<std::string> extract_spade_url(std::string_view page)
    {
        constexpr std::string_view prefix = "https://video-edge-";
        for (std::string_view key : {std::string_view{"\"spade_url\""}, std::string_view{"\"spadeurl\""}}) {
            for (auto pos = page.find(key); pos != std::string_view::npos; pos = page.find(key, pos + 1)) {
                auto p = pos + key.size();
                while (p < page.size() && (page[p] == ' ' || page[p] == ':'))
                    ++p;
                if (p >= page.size() || page[p] != '"')
                    continue;
                const auto end = page.find('"', p + 1);
                if (end == std::string_view::npos)
                    break;
                const auto url = page.substr(p + 1, end - p - 1);
                if (url.substr(0, prefix.size()) == prefix)
                    return std::string{url};
            }
        }
        return std::nullopt;
    }

    std::optional<std::string> extract_settings_url(std::string_view page)
    {
        constexpr std::string_view marker = "/config/settings.";
        const auto pos = page.find(marker);
        if (pos == std::string_view::npos)
            return std::nullopt;
        const auto start = page.rfind("src=\"", pos);
        const auto end   = page.find(".js", pos);
        if (start == std::string_view::npos || end == std::string_view::npos)
            return std::nullopt;
        const auto url = page.substr(start + 5, end + 3 - (start + 5));
        if (url.substr(0, 8) != "https://" || url.find('"') != std::string_view::npos)
            return std::nullopt;
        return std::string{url};
    }

    std::string encode_watch_payload(const WatchSignal& signal)
    {
        std::array<SpadeEvent, 1> events{};
        auto& props        = events[0].properties;
        props.broadcast_id = signal.broadcast_id;
        props.channel_id   = signal.channel_id;
        props.channel      = signal.channel_login;
        props.user_id      = signal.user_id;
        return base64_encode(to_json(events));
    }

    std::string base64_encode(std::string_view data)
    {
        if (data.empty())
            return {};
        std::string out(4 * ((data.size() + 2) / 3) + 1, '\0');
        const int   n = ::EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                                        reinterpret_cast<const unsigned char*>(data.data()),
                                        gsl::narrow_cast<int>(data.size()));
        out.resize(static_cast<std::size_t>(n));
        return out;
    }

    // Percent-encode for application/x-www-form-urlencoded (no '+' for spaces).
    std::string form_urlencode(std::string_view s)
    {
        static constexpr char hex[] = "0123456789ABCDEF";
        std::string out;
        out.reserve(s.size() * 3);
        for (unsigned char c : s) {
            const bool unreserved = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z')
                || (c >= '0' && c <= '9') || c == '-' || c == '_' || c == '.' || c == '~';
            if (DM_LIKELY(unreserved))
                out.push_back(static_cast<char>(c));
            else {
                out.push_back('%');
                out.push_back(hex[(c >> 4) & 0xF]);
                out.push_back(hex[c & 0xF]);
            }
        }
        return out;
    }

} // namespace gql

GqlCatalogClient::GqlCatalogClient(boost::asio::any_io_executor executor,
                                   boost::asio::ssl::context&   ssl_ctx)
    : device_id_{make_device_id()}
    , http_{std::make_unique<http_client::client>(executor, ssl_ctx)}
{
}

GqlCatalogClient::~GqlCatalogClient() = default;

void GqlCatalogClient::shutdown() noexcept
{
    http_->shutdown();
}

auto GqlCatalogClient::post_gql(std::string_view token, const std::string& body, std::string_view operation)
    -> boost::asio::awaitable<json>
{
    const std::string auth = "OAuth " + std::string{token};
    std::array<http_client::http_header, 6> hdrs{{{"Client-ID", k_client_id},
                                                  {"Authorization", auth},
                                                  {"Origin", k_web_origin},
                                                  {"Referer", k_web_origin},
                                                  {"Accept-Language", "en-US"},
                                                  {"X-Device-Id", device_id_}}};

    http_client::response res;
    try {
        res = co_await http_->request(http::verb::post, gql_endpoint.host, gql_endpoint.port,
                                      gql_endpoint.target, body, hdrs, &gql_options());
    } catch (const boost::system::system_error& e) {
        throw TransportError(std::string{operation} + ": " + e.what());
    } catch (const std::system_error& e) {
        throw TransportError(std::string{operation} + ": " + e.what());
    }

    if (res.status == 401)
        throw AuthError(std::string{operation} + ": token rejected (401)");
    if (!res.ok())
        throw TransportError(std::string{operation} + ": gql returned " + std::to_string(res.status));

    auto parsed = http_client::parse_json(res.body);
    if (!parsed)
        throw ParseError(std::string{operation} + ": malformed JSON response");
    co_return std::move(*parsed);
}

auto GqlCatalogClient::fetch_text(std::string_view url) -> boost::asio::awaitable<std::string>
{
    http_client::response res;
    try {
        res = co_await http_->request_url(http::verb::get, url, {}, {}, &page_options());
    } catch (const boost::system::system_error& e) {
        throw TransportError(std::string{url} + ": " + e.what());
    } catch (const std::system_error& e) {
        throw TransportError(std::string{url} + ": " + e.what());
    }
    if (!res.ok())
        throw TransportError(std::string{url} + " returned " + std::to_string(res.status));
    co_return std::move(res.body);
}

auto GqlCatalogClient::list_active_campaigns(std::string_view token)
    -> boost::asio::awaitable<std::vector<Campaign>>
{
    const auto body = to_json(PersistedRequest<RewardCampaignVars>{
        .operationName = "ViewerDropsDashboard",
        .variables     = {},
        .extensions    = persisted(k_dashboard_hash),
    });
    const auto root = co_await post_gql(token, body, "ViewerDropsDashboard");
    if (auto err = gql::first_error(root))
        throw TransportError("ViewerDropsDashboard: " + *err);
    co_return gql::parse_campaigns(root, wall_clock::now());
}

auto GqlCatalogClient::fetch_inventory(std::string_view token) -> boost::asio::awaitable<Inventory>
{
    const auto body = to_json(PersistedRequest<RewardCampaignVars>{
        .operationName = "Inventory",
        .variables     = {},
        .extensions    = persisted(k_inventory_hash),
    });
    const auto root = co_await post_gql(token, body, "Inventory");
    if (auto err = gql::first_error(root))
        throw TransportError("Inventory: " + *err);
    co_return gql::parse_inventory(root, wall_clock::now());
}

auto GqlCatalogClient::probe_channel(std::string_view token, std::string_view channel_id)
    -> boost::asio::awaitable<std::optional<LiveStatus>>
{
    Expects(!channel_id.empty());
    const auto body = to_json(QueryRequest<ChannelIdVars>{
        .operationName = "ChannelStatus",
        .query         = std::string{k_channel_status_query},
        .variables     = {std::string{channel_id}},
    });
    const auto root = co_await post_gql(token, body, "ChannelStatus");
    if (auto err = gql::first_error(root))
        throw TransportError("ChannelStatus: " + *err);
    co_return gql::parse_channel_status(root);
}

auto GqlCatalogClient::list_live_channels(std::string_view token,
                                          std::string_view game_id,
                                          std::string_view game_name,
                                          std::size_t      limit)
    -> boost::asio::awaitable<std::vector<MiningChannel>>
{
    if (game_id.empty())
        throw ParseError("GameStreams: campaign for " + std::string{game_name} + " has no game id");
    const auto body = to_json(QueryRequest<GameStreamsVars>{
        .operationName = "GameStreams",
        .query         = std::string{k_game_streams_query},
        .variables     = {std::string{game_id}, gsl::narrow_cast<int>(limit)},
    });
    const auto root = co_await post_gql(token, body, "GameStreams");
    if (auto err = gql::first_error(root))
        throw TransportError("GameStreams: " + *err);
    co_return gql::parse_game_streams(root, game_id, game_name);
}

auto GqlCatalogClient::resolve_user_id(std::string_view token) -> boost::asio::awaitable<std::string>
{
    const std::string auth = "OAuth " + std::string{token};
    std::array<http_client::http_header, 1> hdrs{{{"Authorization", auth}}};

    http_client::response res;
    try {
        res = co_await http_->request(http::verb::get, oauth_validate.host, oauth_validate.port,
                                      oauth_validate.target, {}, hdrs, &gql_options());
    } catch (const boost::system::system_error& e) {
        throw TransportError(std::string{"oauth validate: "} + e.what());
    } catch (const std::system_error& e) {
        throw TransportError(std::string{"oauth validate: "} + e.what());
    }
    if (res.status == 401)
        throw AuthError("access token is invalid or expired");
    if (!res.ok())
        throw TransportError("oauth validate returned " + std::to_string(res.status));

    auto parsed = http_client::parse_json(res.body);
    if (!parsed)
        throw ParseError("oauth validate: malformed JSON response");
    auto user_id = string_of(member(&*parsed, "user_id"));
    if (user_id.empty())
        throw ParseError("oauth validate: no user_id in response");
    co_return user_id;
}

auto GqlCatalogClient::resolve_watch_endpoint(std::string_view channel_login)
    -> boost::asio::awaitable<std::string>
{
    const auto page = co_await fetch_text(std::string{k_web_origin} + "/" + std::string{channel_login});
    if (auto url = gql::extract_spade_url(page))
        co_return *url;

    if (auto settings = gql::extract_settings_url(page)) {
        const auto script = co_await fetch_text(*settings);
        if (auto url = gql::extract_spade_url(script))
            co_return *url;
    }
    throw TransportError("no watch endpoint found for " + std::string{channel_login});
}

auto GqlCatalogClient::submit_watch_signal(const WatchSignal& signal, std::chrono::milliseconds timeout)
    -> boost::asio::awaitable<bool>
{
    Expects(!signal.endpoint.empty());

    const std::string body = "data=" + gql::form_urlencode(gql::encode_watch_payload(signal));

    http_client::client::RequestOptions opts{};
    opts.total_timeout = timeout;
    opts.accept        = "*/*";
    opts.content_type  = "application/x-www-form-urlencoded";

    http_client::response res;
    try {
        res = co_await http_->request_url(http::verb::post, signal.endpoint, body, {}, &opts);
    } catch (const boost::system::system_error& e) {
        throw TransportError("watch signal: " + std::string{e.what()});
    } catch (const std::system_error& e) {
        throw TransportError("watch signal: " + std::string{e.what()});
    }

    if (res.status == 204)
        co_return true;
    std::cerr << "[GQL] watch signal for " << signal.channel_login << " returned " << res.status << '\n';
    co_return false;
}

auto GqlCatalogClient::submit_claim(std::string_view token, std::string_view claim_token)
    -> boost::asio::awaitable<ClaimOutcome>
{
    const auto body = to_json(QueryRequest<ClaimDropVars>{
        .operationName = "ClaimDrop",
        .query         = std::string{k_claim_drop_mutation},
        .variables     = {ClaimDropInput{std::string{claim_token}}},
    });
    const auto root = co_await post_gql(token, body, "ClaimDrop");
    if (auto err = gql::first_error(root))
        std::cerr << "[GQL] claim rejected: " << *err << '\n';
    co_return gql::parse_claim_outcome(root);
}

auto GqlCatalogClient::fetch_channel_points(std::string_view token, std::string_view channel_login)
    -> boost::asio::awaitable<std::optional<ChannelPointsContext>>
{
    const auto body = to_json(QueryRequest<ChannelLoginVars>{
        .operationName = "ChannelPointsContext",
        .query         = std::string{k_channel_points_query},
        .variables     = {std::string{channel_login}},
    });
    const auto root = co_await post_gql(token, body, "ChannelPointsContext");
    if (auto err = gql::first_error(root))
        throw TransportError("ChannelPointsContext: " + *err);
    co_return gql::parse_channel_points(root);
}

auto GqlCatalogClient::claim_channel_points(std::string_view token,
                                            std::string_view channel_id,
                                            std::string_view claim_id) -> boost::asio::awaitable<int>
{
    const auto body = to_json(PersistedRequest<ClaimPointsVars>{
        .operationName = "ClaimCommunityPoints",
        .variables     = {ClaimPointsInput{std::string{channel_id}, std::string{claim_id}}},
        .extensions    = persisted(k_claim_points_hash),
    });
    const auto root = co_await post_gql(token, body, "ClaimCommunityPoints");
    if (auto err = gql::first_error(root))
        throw TransportError("ClaimCommunityPoints: " + *err);

    const json* result = at_path(root, {"data", "claimCommunityPoints"});
    if (!result)
        throw ParseError("ClaimCommunityPoints: no result in response");
    if (const json* error = member(result, "error"))
        throw TransportError("ClaimCommunityPoints: " + string_of(member(error, "code")));
    co_return int_of(member(result, "currentPoints"));
}

} // namespace drop_miner::twitch
