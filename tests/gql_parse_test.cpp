// C++ Standard Library
#include <chrono>
#include <string>
#include <string_view>

// GoogleTest
#include <gtest/gtest.h>

// Project
#include <dm/mining/errors.hpp>
#include <dm/twitch/gql_catalog_client.hpp>

using namespace drop_miner;
using namespace drop_miner::twitch;

namespace
{
    http_client::json parse(std::string_view text)
    {
        auto j = http_client::parse_json(text);
        EXPECT_TRUE(j.has_value()) << "fixture is not valid JSON";
        return j ? *j : http_client::json{};
    }

    constexpr std::string_view k_dashboard = R"({
        "data": { "currentUser": { "dropCampaigns": [
            {
                "id": "camp-1", "name": "Rust Twitch Drops", "status": "ACTIVE",
                "startAt": "2024-01-01T00:00:00Z", "endAt": "2024-01-08T00:00:00.123Z",
                "game": { "id": "263490", "displayName": "Rust", "name": "rust" },
                "allow": { "isEnabled": true, "channels": [ { "id": "11", "login": "streamer_a" }, { "id": "12", "name": "streamer_b" } ] },
                "timeBasedDrops": [
                    { "id": "drop-1", "name": "Hoodie", "requiredMinutesWatched": 120,
                      "benefitEdges": [ { "benefit": { "id": "ben-1", "name": "Drops Hoodie", "imageAssetURL": "https://img/1.png" } } ],
                      "self": { "currentMinutesWatched": 30, "isClaimed": false, "dropInstanceID": "inst-1" } },
                    { "id": "drop-2", "name": "Badge", "requiredMinutesWatched": 0 }
                ]
            },
            { "id": "camp-2", "name": "Old", "status": "EXPIRED", "game": { "id": "1", "displayName": "Old" } },
            { "id": "camp-3", "name": "Gameless", "status": "ACTIVE", "game": null }
        ] } }
    })";
} // namespace

TEST(GqlTimestamps, ParsesUtcSeconds)
{
    const auto t = gql::parse_rfc3339("2024-01-01T00:00:00Z");
    ASSERT_TRUE(t.has_value());
    EXPECT_EQ(std::chrono::duration_cast<std::chrono::seconds>(t->time_since_epoch()).count(), 1704067200);

    const auto frac = gql::parse_rfc3339("2024-01-01T00:00:05.250Z");
    ASSERT_TRUE(frac.has_value());
    EXPECT_EQ(std::chrono::duration_cast<std::chrono::seconds>(frac->time_since_epoch()).count(), 1704067205);

    const auto leap = gql::parse_rfc3339("2024-02-29T12:30:00Z");
    ASSERT_TRUE(leap.has_value());
    EXPECT_EQ(std::chrono::duration_cast<std::chrono::seconds>(leap->time_since_epoch()).count(), 1709209800);
}

TEST(GqlTimestamps, RejectsMalformedInput)
{
    EXPECT_FALSE(gql::parse_rfc3339("").has_value());
    EXPECT_FALSE(gql::parse_rfc3339("2024-01-01 00:00:00Z").has_value());
    EXPECT_FALSE(gql::parse_rfc3339("2024-13-01T00:00:00Z").has_value());
    EXPECT_FALSE(gql::parse_rfc3339("2023-02-29T00:00:00Z").has_value());
    EXPECT_FALSE(gql::parse_rfc3339("2024-01-01T00:00:00+02:00").has_value());
}

TEST(GqlCampaigns, DashboardIsMappedOntoCampaigns)
{
    const auto campaigns = gql::parse_campaigns(parse(k_dashboard), wall_clock::now());

    ASSERT_EQ(campaigns.size(), 1u);
    const auto& c = campaigns[0];
    EXPECT_EQ(c.id, "camp-1");
    EXPECT_EQ(c.game_id, "263490");
    EXPECT_EQ(c.game_name, "Rust");
    EXPECT_TRUE(c.is_access_controlled());
    ASSERT_EQ(c.allowed_channels.size(), 2u);
    EXPECT_EQ(c.allowed_channels[1].login, "streamer_b");

    ASSERT_EQ(c.drops.size(), 2u);
    const auto& hoodie = c.drops[0];
    EXPECT_EQ(hoodie.required_minutes, 120);
    EXPECT_EQ(hoodie.display_name(), "Drops Hoodie");
    ASSERT_TRUE(hoodie.progress.has_value());
    EXPECT_EQ(hoodie.progress->current_minutes, 30);
    EXPECT_EQ(hoodie.progress->campaign_id, "camp-1");
    EXPECT_EQ(hoodie.progress->claim_token, std::optional<std::string>{ "inst-1" });
    EXPECT_FALSE(c.drops[1].is_mineable());
    EXPECT_FALSE(c.drops[1].progress.has_value());
}

TEST(GqlCampaigns, MissingUserIsAParseError)
{
    EXPECT_THROW((void)gql::parse_campaigns(parse(R"({"data":{}})"), wall_clock::now()), ParseError);
    EXPECT_TRUE(gql::parse_campaigns(parse(R"({"data":{"currentUser":{}}})"), wall_clock::now()).empty());
}

TEST(GqlInventory, CampaignsAndAwardedBenefits)
{
    constexpr std::string_view text = R"({
        "data": { "currentUser": { "inventory": {
            "dropCampaignsInProgress": [
                { "id": "camp-1", "name": "Rust", "status": "ACTIVE", "game": { "id": "1", "displayName": "Rust" },
                  "timeBasedDrops": [ { "id": "drop-1", "requiredMinutesWatched": 60,
                                        "self": { "currentMinutesWatched": 60, "isClaimed": true } } ] }
            ],
            "gameEventDrops": [
                { "id": "ben-9", "lastAwardedAt": "2024-02-01T12:00:00Z" },
                { "id": "ben-bad", "lastAwardedAt": "yesterday" }
            ]
        } } }
    })";

    const auto inv = gql::parse_inventory(parse(text), wall_clock::now());

    ASSERT_EQ(inv.campaigns.size(), 1u);
    ASSERT_TRUE(inv.campaigns[0].drops[0].progress.has_value());
    EXPECT_TRUE(inv.campaigns[0].drops[0].progress->claimed);
    ASSERT_EQ(inv.claimed_benefits.size(), 1u);
    EXPECT_EQ(inv.claimed_benefits[0].benefit_id, "ben-9");

    EXPECT_THROW((void)gql::parse_inventory(parse(R"({"errors":[]})"), wall_clock::now()), ParseError);
}

TEST(GqlChannels, StatusAndGameStreams)
{
    const auto live = gql::parse_channel_status(parse(R"({"data":{"user":{"id":"5","stream":{"id":"b-77","viewersCount":321}}}})"));
    ASSERT_TRUE(live.has_value());
    EXPECT_EQ(live->broadcast_id, "b-77");
    EXPECT_EQ(live->viewers, 321);

    EXPECT_FALSE(gql::parse_channel_status(parse(R"({"data":{"user":{"id":"5","stream":null}}})")).has_value());

    const auto streams = gql::parse_game_streams(parse(R"({"data":{"game":{"streams":{"edges":[
            {"node":{"id":"s1","viewersCount":40,"broadcaster":{"id":"7","login":"seven"}}},
            {"node":{"id":"s2","viewersCount":10,"broadcaster":null}}
        ]}}}})"),
                                                 "263490",
                                                 "Rust");
    ASSERT_EQ(streams.size(), 1u);
    EXPECT_EQ(streams[0].login, "seven");
    EXPECT_EQ(streams[0].game_name, "Rust");
    EXPECT_EQ(streams[0].viewers, 40);
    EXPECT_FALSE(streams[0].from_allow_list);
}

TEST(GqlClaims, OutcomeMapping)
{
    EXPECT_EQ(gql::parse_claim_outcome(parse(R"({"data":{"claimDropRewards":{"status":"ELIGIBLE_FOR_ALL"}}})")),
              ClaimOutcome::claimed);
    EXPECT_EQ(gql::parse_claim_outcome(parse(R"({"data":{"claimDropRewards":{"status":"DROP_INSTANCE_ALREADY_CLAIMED"}}})")),
              ClaimOutcome::already_claimed);
    EXPECT_EQ(gql::parse_claim_outcome(parse(R"({"errors":[{"message":"service error"}],"data":null})")),
              ClaimOutcome::invalid_token);
    EXPECT_EQ(gql::parse_claim_outcome(parse(R"({"data":{"claimDropRewards":null}})")), ClaimOutcome::failed);
}

TEST(GqlChannelPoints, AvailableClaimIsReported)
{
    const auto ctx = gql::parse_channel_points(parse(
        R"({"data":{"user":{"id":"5","channel":{"id":"5","self":{"communityPoints":{"balance":1200,"availableClaim":{"id":"claim-3"}}}}}}})"));
    ASSERT_TRUE(ctx.has_value());
    EXPECT_EQ(ctx->balance, 1200);
    EXPECT_EQ(ctx->claim_id, std::optional<std::string>{ "claim-3" });
    EXPECT_GT(ctx->points_on_claim, 0);

    const auto idle = gql::parse_channel_points(parse(
        R"({"data":{"user":{"channel":{"self":{"communityPoints":{"balance":5,"availableClaim":null}}}}}})"));
    ASSERT_TRUE(idle.has_value());
    EXPECT_FALSE(idle->claim_id.has_value());
}

TEST(GqlErrors, FirstErrorMessage)
{
    EXPECT_EQ(gql::first_error(parse(R"({"errors":[{"message":"a"},{"message":"b"}]})")), std::optional<std::string>{ "a" });
    EXPECT_FALSE(gql::first_error(parse(R"({"data":{}})")).has_value());
}

TEST(SpadeEndpoint, ExtractedFromPageOrSettings)
{
    EXPECT_EQ(gql::extract_spade_url(R"(<script>{"spade_url":"https://video-edge-abc.ord02.twitch.tv/v1/segment"}</script>)"),
              std::optional<std::string>{ "https://video-edge-abc.ord02.twitch.tv/v1/segment" });
    EXPECT_FALSE(gql::extract_spade_url(R"({"spadeUrl":"https://example.com/x","spade_url":"https://evil.test/"})").has_value());

    EXPECT_EQ(gql::extract_settings_url(R"(<script src="https://static.twitchcdn.net/config/settings.abc123.js"></script>)"),
              std::optional<std::string>{ "https://static.twitchcdn.net/config/settings.abc123.js" });
    EXPECT_FALSE(gql::extract_settings_url("<html></html>").has_value());
}

TEST(WatchPayload, EncodingHelpers)
{
    EXPECT_EQ(gql::base64_encode("hello"), "aGVsbG8=");
    EXPECT_EQ(gql::base64_encode(""), "");
    EXPECT_EQ(gql::form_urlencode("a+b=c"), "a%2Bb%3Dc");
    EXPECT_EQ(gql::form_urlencode("safe-_.~"), "safe-_.~");

    const WatchSignal signal{ "https://video-edge-x/spade", "42", "someone", "b-1", "1001" };
    const auto payload = gql::encode_watch_payload(signal);
    EXPECT_FALSE(payload.empty());
    EXPECT_EQ(payload.find_first_not_of("ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/="),
              std::string::npos);
}
