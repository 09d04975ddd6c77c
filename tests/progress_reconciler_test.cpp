// C++ Standard Library
#include <chrono>
#include <memory>
#include <thread>

// GoogleTest
#include <gtest/gtest.h>

// Boost.Asio
#include <boost/asio/io_context.hpp>

// Project
#include <dm/mining/campaign_catalog.hpp>
#include <dm/mining/claim_service.hpp>
#include <dm/mining/loop_timer.hpp>
#include <dm/mining/progress_reconciler.hpp>

#include "fakes.hpp"

using namespace drop_miner;
using namespace drop_miner::fakes;

class ProgressReconcilerTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        (void)shared.status.update_if_current(session.handle, [](MiningStatus& s) {
            s.active = true;
            s.campaign_id = "c1";
            s.campaign_name = "Campaign c1";
            s.game_name = "Rust";
            s.channel = make_channel("ch1", "Rust", 100);
        });
    }

    std::unique_ptr<ProgressReconciler> make_reconciler()
    {
        return std::make_unique<ProgressReconciler>(client,
                                                    creds,
                                                    catalog,
                                                    claims,
                                                    shared,
                                                    sink,
                                                    std::make_shared<LoopTimer>(io.get_executor()),
                                                    settings,
                                                    session.handle,
                                                    target,
                                                    [this](const SessionHandle&, MiningComplete note) {
                                                        completed.push_back(std::move(note));
                                                    });
    }

    boost::asio::io_context io;
    FakeCatalogClient client;
    FakeCredentials creds;
    RecordingStatusSink sink;
    MiningSettings settings;
    SharedState shared;
    CampaignCatalog catalog{ client, creds, shared.progress, std::chrono::minutes{ 5 } };
    ClaimService claims{ client, creds, shared, sink, settings };
    LiveSession session;
    MiningTarget target{ "c1", "Campaign c1", "game-Rust", "Rust", true };
    std::vector<MiningComplete> completed;
};

TEST_F(ProgressReconcilerTest, ZeroMinuteDropIsNeverCurrent)
{
    client.inventory.campaigns = { make_campaign("c1", "Rust", { make_drop("badge", 0), make_drop("d1", 60, 10) }) };
    auto reconciler = make_reconciler();

    EXPECT_EQ(run_sync(io, reconciler->poll_once()), PollOutcome::in_progress);

    const auto status = shared.status.snapshot();
    ASSERT_TRUE(status.current_drop.has_value());
    EXPECT_EQ(status.current_drop->drop_id, "d1");
    EXPECT_EQ(status.current_drop->current_minutes, 10);
    EXPECT_TRUE(completed.empty());
}

TEST_F(ProgressReconcilerTest, OnlyZeroMinuteDropsMeansComplete)
{
    client.inventory.campaigns = { make_campaign("c1", "Rust", { make_drop("badge", 0) }) };
    auto reconciler = make_reconciler();

    EXPECT_EQ(run_sync(io, reconciler->poll_once()), PollOutcome::complete);
    ASSERT_EQ(completed.size(), 1u);
    EXPECT_EQ(completed[0].reason, "all drops complete");
}

TEST_F(ProgressReconcilerTest, HighestPercentageWins)
{
    client.inventory.campaigns = {
        make_campaign("c1", "Rust", { make_drop("d1", 120, 30), make_drop("d2", 60, 45), make_drop("d3", 240, 0) })
    };
    auto reconciler = make_reconciler();

    EXPECT_EQ(run_sync(io, reconciler->poll_once()), PollOutcome::in_progress);

    const auto status = shared.status.snapshot();
    ASSERT_TRUE(status.current_drop.has_value());
    EXPECT_EQ(status.current_drop->drop_id, "d2");
    EXPECT_DOUBLE_EQ(status.current_drop->percentage, 75.0);
    EXPECT_TRUE(status.current_drop->estimated_completion.has_value());
}

TEST_F(ProgressReconcilerTest, AllClaimedCompletesTheCampaign)
{
    client.inventory.campaigns = {
        make_campaign("c1", "Rust", { make_drop("d1", 60, 60, true), make_drop("d2", 120, 120, true) })
    };
    auto reconciler = make_reconciler();

    EXPECT_EQ(run_sync(io, reconciler->poll_once()), PollOutcome::complete);
    ASSERT_EQ(completed.size(), 1u);
    EXPECT_EQ(completed[0].game_name, "Rust");
    EXPECT_EQ(completed[0].campaign_name, "Campaign c1");
    EXPECT_EQ(completed[0].reason, "all drops complete");
}

TEST_F(ProgressReconcilerTest, VanishedCampaignCompletes)
{
    auto reconciler = make_reconciler();

    EXPECT_EQ(run_sync(io, reconciler->poll_once()), PollOutcome::complete);
    ASSERT_EQ(completed.size(), 1u);
    EXPECT_EQ(completed[0].reason, "campaign no longer active");
}

TEST_F(ProgressReconcilerTest, ReadyDropIsClaimedAndMiningMovesOn)
{
    auto ready = make_drop("d1", 60, 60);
    ready.progress->claim_token = "instance-1";
    client.inventory.campaigns = { make_campaign("c1", "Rust", { ready, make_drop("d2", 120, 10) }) };
    auto reconciler = make_reconciler();

    EXPECT_EQ(run_sync(io, reconciler->poll_once()), PollOutcome::in_progress);

    EXPECT_EQ(client.claims, (std::vector<std::string>{ "instance-1" }));
    EXPECT_TRUE(shared.progress.get("d1")->claimed);
    EXPECT_EQ(sink.notes_of<DropReady>().size(), 1u);
    EXPECT_EQ(sink.notes_of<DropClaimed>().size(), 1u);
    EXPECT_EQ(shared.status.snapshot().current_drop->drop_id, "d2");
}

TEST_F(ProgressReconcilerTest, AwardedBenefitMarksDropWithoutProgressClaimed)
{
    client.inventory.campaigns = { make_campaign("c1", "Rust", { make_drop("d1", 60, 0, false, false), make_drop("d2", 60, 5) }) };
    client.inventory.claimed_benefits = { ClaimedBenefit{ "benefit-d1", wall_clock::now() - std::chrono::hours{ 1 } } };
    auto reconciler = make_reconciler();

    EXPECT_EQ(run_sync(io, reconciler->poll_once()), PollOutcome::in_progress);

    ASSERT_TRUE(shared.progress.get("d1").has_value());
    EXPECT_TRUE(shared.progress.get("d1")->claimed);
    EXPECT_EQ(shared.status.snapshot().current_drop->drop_id, "d2");
}

TEST_F(ProgressReconcilerTest, TransportFailureSkipsTheTick)
{
    client.inventory_unreachable = true;
    auto reconciler = make_reconciler();

    EXPECT_EQ(run_sync(io, reconciler->poll_once()), PollOutcome::skipped);
    EXPECT_TRUE(completed.empty());
    EXPECT_TRUE(sink.statuses.empty());
}

TEST_F(ProgressReconcilerTest, UnreadableInventoryFallsBackToCatalog)
{
    client.inventory_unreadable = true;
    client.campaigns = { make_campaign("c1", "Rust", { make_drop("d1", 60, 20) }) };
    (void)run_sync(io, catalog.fetch_active_campaigns());
    auto reconciler = make_reconciler();

    EXPECT_EQ(run_sync(io, reconciler->poll_once()), PollOutcome::in_progress);
    EXPECT_EQ(shared.status.snapshot().current_drop->current_minutes, 20);
}

TEST_F(ProgressReconcilerTest, StaleSessionLeavesStatusUntouched)
{
    client.inventory.campaigns = { make_campaign("c1", "Rust", { make_drop("d1", 60, 10) }) };
    auto reconciler = make_reconciler();
    session.supersede();

    EXPECT_EQ(run_sync(io, reconciler->poll_once()), PollOutcome::stale);

    EXPECT_EQ(client.inventory_calls, 0);
    EXPECT_TRUE(sink.statuses.empty());
    const auto status = shared.status.snapshot();
    EXPECT_FALSE(status.current_drop.has_value());
    EXPECT_EQ(status.campaign_id, "c1");
}

TEST_F(ProgressReconcilerTest, StaleSessionIgnoresPushes)
{
    client.inventory.campaigns = { make_campaign("c1", "Rust", { make_drop("d1", 60, 10) }) };
    auto reconciler = make_reconciler();
    (void)run_sync(io, reconciler->poll_once());
    const auto published = sink.statuses.size();
    session.supersede();

    reconciler->on_push(ProgressEvent{ "d1", 40, 60 });

    EXPECT_EQ(sink.statuses.size(), published);
    EXPECT_EQ(shared.status.snapshot().current_drop->current_minutes, 10);
}

TEST_F(ProgressReconcilerTest, PushesNeverLowerTheCurrentDrop)
{
    client.inventory.campaigns = { make_campaign("c1", "Rust", { make_drop("d1", 60, 10) }) };
    auto reconciler = make_reconciler();
    (void)run_sync(io, reconciler->poll_once());

    reconciler->on_push(ProgressEvent{ "d1", 20, 60 });
    EXPECT_EQ(shared.status.snapshot().current_drop->current_minutes, 20);

    reconciler->on_push(ProgressEvent{ "d1", 15, 60 });
    const auto status = shared.status.snapshot();
    EXPECT_EQ(status.current_drop->current_minutes, 20);
    EXPECT_EQ(shared.progress.get("d1")->current_minutes, 20);
}

TEST_F(ProgressReconcilerTest, TargetSwitchMakesLoopStale)
{
    auto reconciler = make_reconciler();
    (void)shared.status.update_if_current(session.handle, [](MiningStatus& s) { s.campaign_id = "other"; });

    EXPECT_FALSE(reconciler->tracks_target());
    EXPECT_EQ(run_sync(io, reconciler->poll_once()), PollOutcome::stale);
}

TEST_F(ProgressReconcilerTest, PushForAnotherDropOfTheCampaignTakesOver)
{
    client.campaigns = { make_campaign("c1", "Rust", { make_drop("d1", 60, 10), make_drop("d2", 120, 5) }) };
    client.inventory.campaigns = client.campaigns;
    (void)run_sync(io, catalog.fetch_active_campaigns());
    auto reconciler = make_reconciler();
    (void)run_sync(io, reconciler->poll_once());
    ASSERT_EQ(shared.status.snapshot().current_drop->drop_id, "d1");

    reconciler->on_push(ProgressEvent{ "d2", 100, 120 });

    const auto status = shared.status.snapshot();
    ASSERT_TRUE(status.current_drop.has_value());
    EXPECT_EQ(status.current_drop->drop_id, "d2");
    EXPECT_EQ(status.current_drop->current_minutes, 100);
    EXPECT_EQ(status.current_drop->required_minutes, 120);
    EXPECT_EQ(status.current_drop->drop_name, "Reward d2");
    EXPECT_EQ(status.campaign_id, "c1");
    EXPECT_EQ(sink.statuses.back().current_drop->drop_id, "d2");
}

TEST_F(ProgressReconcilerTest, PushFromAnotherCachedCampaignTakesOverWithoutMovingTheTarget)
{
    client.campaigns = { make_campaign("c1", "Rust", { make_drop("d1", 60, 10) }),
                         make_campaign("c2", "Apex", { make_drop("d2", 120) }) };
    client.inventory.campaigns = { make_campaign("c1", "Rust", { make_drop("d1", 60, 10) }) };
    (void)run_sync(io, catalog.fetch_active_campaigns());
    auto reconciler = make_reconciler();
    (void)run_sync(io, reconciler->poll_once());
    ASSERT_EQ(shared.status.snapshot().current_drop->drop_id, "d1");

    reconciler->on_push(ProgressEvent{ "d2", 30, 120 });

    const auto status = shared.status.snapshot();
    ASSERT_TRUE(status.current_drop.has_value());
    EXPECT_EQ(status.current_drop->drop_id, "d2");
    EXPECT_EQ(status.current_drop->current_minutes, 30);
    EXPECT_EQ(status.current_drop->campaign_id, "c2");
    EXPECT_EQ(status.current_drop->campaign_name, "Campaign c2");
    EXPECT_EQ(status.current_drop->game_name, "Apex");
    EXPECT_EQ(status.campaign_id, "c1");
    EXPECT_EQ(status.game_name, "Rust");
    EXPECT_TRUE(reconciler->tracks_target());
    EXPECT_EQ(shared.progress.get("d2")->current_minutes, 30);
}

TEST_F(ProgressReconcilerTest, PushForZeroMinuteDropLeavesCurrentDropAlone)
{
    client.campaigns = { make_campaign("c1", "Rust", { make_drop("d1", 60, 10), make_drop("badge", 0) }) };
    client.inventory.campaigns = client.campaigns;
    (void)run_sync(io, catalog.fetch_active_campaigns());
    auto reconciler = make_reconciler();
    (void)run_sync(io, reconciler->poll_once());
    const auto published = sink.statuses.size();

    reconciler->on_push(ProgressEvent{ "badge", 5, 0 });

    const auto status = shared.status.snapshot();
    ASSERT_TRUE(status.current_drop.has_value());
    EXPECT_EQ(status.current_drop->drop_id, "d1");
    EXPECT_EQ(status.current_drop->current_minutes, 10);
    EXPECT_EQ(sink.statuses.size(), published);
}

TEST_F(ProgressReconcilerTest, ClosedCampaignIsNotMined)
{
    auto closed = make_campaign("c1", "Rust", { make_drop("d1", 60, 10) });
    closed.end_at = wall_clock::now() - std::chrono::minutes{ 1 };
    client.campaigns = { closed };
    client.inventory.campaigns = { closed };
    (void)run_sync(io, catalog.fetch_active_campaigns());
    auto reconciler = make_reconciler();

    EXPECT_EQ(run_sync(io, reconciler->poll_once()), PollOutcome::complete);
    ASSERT_EQ(completed.size(), 1u);
    EXPECT_EQ(completed[0].reason, "campaign no longer active");
    EXPECT_FALSE(shared.status.snapshot().current_drop.has_value());
}

TEST_F(ProgressReconcilerTest, CachedCampaignThatClosedSinceTheFetchIsNotMined)
{
    auto closing = make_campaign("c1", "Rust", { make_drop("d1", 60, 10) });
    closing.end_at = wall_clock::now() + std::chrono::milliseconds{ 100 };
    client.campaigns = { closing };
    client.inventory_unreadable = true;
    (void)run_sync(io, catalog.fetch_active_campaigns());
    ASSERT_EQ(catalog.cached_snapshot().size(), 1u);
    std::this_thread::sleep_for(std::chrono::milliseconds{ 200 });
    auto reconciler = make_reconciler();

    EXPECT_EQ(run_sync(io, reconciler->poll_once()), PollOutcome::complete);
    ASSERT_EQ(completed.size(), 1u);
    EXPECT_EQ(completed[0].reason, "campaign no longer active");
}
