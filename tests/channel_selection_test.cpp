// GoogleTest
#include <gtest/gtest.h>

// Boost.Asio
#include <boost/asio/io_context.hpp>

// Project
#include <dm/mining/channel_discovery.hpp>
#include <dm/mining/channel_scorer.hpp>

#include "fakes.hpp"

using namespace drop_miner;
using namespace drop_miner::fakes;

TEST(ChannelScorer, MostViewersWinsAmongEquals)
{
    MiningSettings settings;
    const std::vector<MiningChannel> channels{ make_channel("small", "Rust", 100),
                                               make_channel("big", "Rust", 5000),
                                               make_channel("mid", "Rust", 900) };

    const auto best = select_best(channels, settings);

    ASSERT_TRUE(best.has_value());
    EXPECT_EQ(best->id, "big");

    const auto ranked = rank_channels(channels, settings);
    ASSERT_EQ(ranked.size(), 3u);
    EXPECT_EQ(ranked[1].id, "mid");
    EXPECT_EQ(ranked[2].id, "small");
}

TEST(ChannelScorer, ComponentsAddUp)
{
    MiningSettings settings;
    settings.priority_games = { "Valorant", "Rust" };

    EXPECT_EQ(score_channel(make_channel("x", "Rust", 250), settings), 10000 - 100 + 25);
    EXPECT_EQ(score_channel(make_channel("x", "Dota 2", 50000, true), settings), 5000 + 1000);
    EXPECT_EQ(score_channel(make_channel("x", "Dota 2", -5), settings), 0);
}

TEST(ChannelScorer, PriorityOutranksAudience)
{
    MiningSettings settings;
    settings.priority_games = { "Rust" };

    const auto best =
        select_best({ make_channel("huge", "Dota 2", 100000, true), make_channel("tiny", "Rust", 0) }, settings);

    ASSERT_TRUE(best.has_value());
    EXPECT_EQ(best->id, "tiny");
}

TEST(ChannelScorer, OfflineAndDropsDisabledChannelsAreRemoved)
{
    MiningSettings settings;
    auto offline = make_channel("offline", "Rust", 9000);
    offline.online = false;
    auto disabled = make_channel("disabled", "Rust", 9000);
    disabled.drops_enabled = false;

    const auto ranked = rank_channels({ offline, disabled, make_channel("ok", "Rust", 1) }, settings);

    ASSERT_EQ(ranked.size(), 1u);
    EXPECT_EQ(ranked[0].id, "ok");
    EXPECT_FALSE(select_best({ offline }, settings).has_value());
}

class ChannelDiscoveryTest : public ::testing::Test
{
protected:
    static Campaign acl_campaign(int channels)
    {
        auto c = make_campaign("acl", "Rust");
        c.allow_list_enforced = true;
        for (int i = 0; i < channels; ++i)
        {
            const auto id = "allowed" + std::to_string(i);
            c.allowed_channels.push_back(AllowedChannel{ id, "login_" + id });
        }
        return c;
    }

    boost::asio::io_context io;
    FakeCatalogClient client;
    FakeCredentials creds;
    MiningSettings settings;
    ChannelDiscovery discovery{ client, creds };
};

TEST_F(ChannelDiscoveryTest, OfflineAllowListYieldsNothing)
{
    const std::vector<Campaign> campaigns{ acl_campaign(3) };

    std::vector<MiningChannel> found;
    EXPECT_NO_THROW(found = run_sync(io, discovery.discover_eligible(campaigns, settings)));

    EXPECT_TRUE(found.empty());
    EXPECT_EQ(client.probed.size(), 3u);
}

TEST_F(ChannelDiscoveryTest, AllowListProbingStopsAtCap)
{
    settings.acl_live_channel_cap = 2;
    const std::vector<Campaign> campaigns{ acl_campaign(5) };
    for (int i = 0; i < 5; ++i)
    {
        client.live["allowed" + std::to_string(i)] = LiveStatus{ 10 * i, "b" + std::to_string(i) };
    }

    const auto found = run_sync(io, discovery.discover_eligible(campaigns, settings));

    ASSERT_EQ(found.size(), 2u);
    EXPECT_TRUE(found[0].from_allow_list);
    EXPECT_EQ(found[0].game_name, "Rust");
    EXPECT_EQ(client.probed.size(), 2u);
}

TEST_F(ChannelDiscoveryTest, OpenCampaignsUseTheGamePoolWithoutDuplicates)
{
    client.open_pool = { make_channel("p1", "Rust", 10), make_channel("p2", "Rust", 20), make_channel("v1", "Valorant", 5) };
    const std::vector<Campaign> campaigns{ make_campaign("c1", "Rust"), make_campaign("c2", "Rust"), make_campaign("c3", "Valorant") };

    const auto found = run_sync(io, discovery.discover_eligible(campaigns, settings));

    ASSERT_EQ(found.size(), 3u);
    EXPECT_TRUE(client.probed.empty());
}

TEST_F(ChannelDiscoveryTest, FirstEligiblePrefersAllowListCampaigns)
{
    auto acl = acl_campaign(2);
    client.live["allowed1"] = LiveStatus{ 3, "b1" };
    client.open_pool = { make_channel("p1", "Valorant", 10000) };
    const std::vector<Campaign> campaigns{ make_campaign("open", "Valorant"), acl };

    const auto first = run_sync(io, discovery.find_first_eligible(campaigns));

    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->channel.id, "allowed1");
    EXPECT_EQ(first->campaign.id, "acl");
}

TEST_F(ChannelDiscoveryTest, FirstEligibleFallsBackToOpenPool)
{
    client.open_pool = { make_channel("p1", "Valorant", 10) };
    const std::vector<Campaign> campaigns{ acl_campaign(2), make_campaign("open", "Valorant") };

    const auto first = run_sync(io, discovery.find_first_eligible(campaigns));

    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->channel.id, "p1");
    EXPECT_EQ(first->campaign.id, "open");
}

TEST_F(ChannelDiscoveryTest, NothingLiveAnywhere)
{
    const std::vector<Campaign> campaigns{ acl_campaign(2), make_campaign("open", "Valorant") };
    EXPECT_FALSE(run_sync(io, discovery.find_first_eligible(campaigns)).has_value());
}
