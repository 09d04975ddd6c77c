// C++ Standard Library
#include <memory>

// GoogleTest
#include <gtest/gtest.h>

// Boost.Asio
#include <boost/asio/io_context.hpp>

// Project
#include <dm/mining/channel_points.hpp>
#include <dm/mining/claim_service.hpp>
#include <dm/mining/loop_timer.hpp>

#include "fakes.hpp"

using namespace drop_miner;
using namespace drop_miner::fakes;

class ClaimServiceTest : public ::testing::Test
{
protected:
    DropProgress ready_progress(const Drop& d, std::optional<std::string> token = std::nullopt)
    {
        DropProgress p{};
        p.drop_id = d.id;
        p.campaign_id = campaign.id;
        p.current_minutes = d.required_minutes;
        p.required_minutes = d.required_minutes;
        p.claim_token = std::move(token);
        return p;
    }

    boost::asio::io_context io;
    FakeCatalogClient client;
    FakeCredentials creds;
    RecordingStatusSink sink;
    MiningSettings settings;
    SharedState shared;
    LiveSession session;
    Drop drop = make_drop("d1", 60, 60);
    Campaign campaign = make_campaign("c1", "Rust", { drop });
    ClaimService claims{ client, creds, shared, sink, settings };
};

TEST(ClaimToken, DerivedFromUserCampaignAndDrop)
{
    EXPECT_EQ(derive_claim_token("1001", "c1", "d1"), "1001#c1#d1");
}

TEST_F(ClaimServiceTest, ClaimedDropIsAnnouncedAndReported)
{
    EXPECT_TRUE(run_sync(io, claims.handle_ready(session.handle, campaign, drop, ready_progress(drop))));

    ASSERT_EQ(client.claims.size(), 1u);
    EXPECT_EQ(client.claims[0], "1001#c1#d1");
    EXPECT_EQ(sink.notes_of<DropReady>().size(), 1u);
    ASSERT_EQ(sink.notes_of<DropClaimed>().size(), 1u);
    EXPECT_EQ(sink.notes_of<DropClaimed>()[0].drop_name, "Reward d1");
    EXPECT_TRUE(shared.progress.get("d1")->claimed);
}

TEST_F(ClaimServiceTest, InstanceIdIsPreferredOverDerivedToken)
{
    EXPECT_TRUE(run_sync(io, claims.handle_ready(session.handle, campaign, drop, ready_progress(drop, "instance-9"))));
    ASSERT_EQ(client.claims.size(), 1u);
    EXPECT_EQ(client.claims[0], "instance-9");
}

TEST_F(ClaimServiceTest, AlreadyClaimedIsSilentButSticky)
{
    client.claim_outcome = ClaimOutcome::already_claimed;

    EXPECT_TRUE(run_sync(io, claims.handle_ready(session.handle, campaign, drop, ready_progress(drop))));

    EXPECT_TRUE(sink.notes_of<DropClaimed>().empty());
    EXPECT_TRUE(shared.progress.get("d1")->claimed);
}

TEST_F(ClaimServiceTest, InvalidTokenRetiresTheDrop)
{
    client.claim_outcome = ClaimOutcome::invalid_token;

    EXPECT_TRUE(run_sync(io, claims.handle_ready(session.handle, campaign, drop, ready_progress(drop))));
    EXPECT_TRUE(shared.progress.get("d1")->claimed);
}

TEST_F(ClaimServiceTest, FailedClaimIsAttemptedOnlyOnce)
{
    client.claim_outcome = ClaimOutcome::failed;

    EXPECT_FALSE(run_sync(io, claims.handle_ready(session.handle, campaign, drop, ready_progress(drop))));
    EXPECT_FALSE(run_sync(io, claims.handle_ready(session.handle, campaign, drop, ready_progress(drop))));

    EXPECT_EQ(client.claims.size(), 1u);
    EXPECT_EQ(sink.notes_of<DropReady>().size(), 1u);
    EXPECT_FALSE(shared.progress.get("d1").has_value());

    claims.reset();
    EXPECT_FALSE(run_sync(io, claims.handle_ready(session.handle, campaign, drop, ready_progress(drop))));
    EXPECT_EQ(client.claims.size(), 2u);
}

TEST_F(ClaimServiceTest, AutoClaimDisabledOnlyAnnounces)
{
    settings.auto_claim_drops = false;

    EXPECT_FALSE(run_sync(io, claims.handle_ready(session.handle, campaign, drop, ready_progress(drop))));

    EXPECT_TRUE(client.claims.empty());
    EXPECT_EQ(sink.notes_of<DropReady>().size(), 1u);
}

TEST_F(ClaimServiceTest, AuthErrorPropagates)
{
    creds.reject = true;
    EXPECT_THROW(run_sync(io, claims.handle_ready(session.handle, campaign, drop, ready_progress(drop))), AuthError);
}

class ChannelPointsTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        (void)shared.status.update_if_current(session.handle, [](MiningStatus& s) {
            s.active = true;
            s.channel = make_channel("ch1", "Rust", 100);
        });
    }

    ChannelPointsHarvester make_harvester()
    {
        return ChannelPointsHarvester{
            client, creds, shared, sink, std::make_shared<LoopTimer>(io.get_executor()), settings, session.handle
        };
    }

    boost::asio::io_context io;
    FakeCatalogClient client;
    FakeCredentials creds;
    RecordingStatusSink sink;
    MiningSettings settings;
    SharedState shared;
    LiveSession session;
};

TEST_F(ChannelPointsTest, WaitingBonusIsClaimed)
{
    client.points = ChannelPointsContext{ 1000, "bonus-1", 50 };
    client.points_after_claim = 1050;
    settings.notify_on_points_claimed = true;
    auto harvester = make_harvester();

    const auto gained = run_sync(io, harvester.harvest_once());

    ASSERT_TRUE(gained.has_value());
    EXPECT_EQ(*gained, 50);
    EXPECT_EQ(client.points_claims, (std::vector<std::string>{ "bonus-1" }));
    ASSERT_EQ(sink.notes_of<ChannelPointsClaimed>().size(), 1u);
    EXPECT_EQ(sink.notes_of<ChannelPointsClaimed>()[0].channel, "login_ch1");
}

TEST_F(ChannelPointsTest, NothingWaitingMeansNoClaim)
{
    client.points = ChannelPointsContext{ 1000, std::nullopt, 0 };
    auto harvester = make_harvester();

    EXPECT_FALSE(run_sync(io, harvester.harvest_once()).has_value());
    EXPECT_TRUE(client.points_claims.empty());
}

TEST_F(ChannelPointsTest, DisabledSettingSkipsTheNetwork)
{
    settings.auto_claim_channel_points = false;
    client.points = ChannelPointsContext{ 1000, "bonus-1", 50 };
    auto harvester = make_harvester();

    EXPECT_FALSE(run_sync(io, harvester.harvest_once()).has_value());
    EXPECT_TRUE(client.points_claims.empty());
}
