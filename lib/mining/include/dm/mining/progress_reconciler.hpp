/*
Module Name:
- progress_reconciler.hpp

Abstract:
- Reconciles drop progress from two unreliable sources: realtime push events
  (fast, may be silent) and the polled inventory (slow, authoritative for
  claims). Both are merged into the ProgressMap with "keep highest" semantics.
- Chooses the current drop (highest percentage among mineable, unclaimed,
  unfinished drops of the target), hands finished drops to the ClaimService
  and detects campaign completion.
- Every status write is guarded by the session handle and by a check that the
  status still tracks this loop's target.
*/
#pragma once

// C++ Standard Library
#include <functional>
#include <memory>
#include <string_view>
#include <utility>

// Boost.Asio
#include <boost/asio/awaitable.hpp>

// Project
#include <dm/mining/campaign_catalog.hpp>
#include <dm/mining/claim_service.hpp>
#include <dm/mining/failover.hpp>
#include <dm/mining/interfaces.hpp>
#include <dm/mining/loop_timer.hpp>
#include <dm/mining/settings.hpp>
#include <dm/mining/shared_state.hpp>

namespace drop_miner
{

    enum class PollOutcome
    {
        in_progress, ///< a current drop was chosen
        complete,    ///< nothing left to mine; the session was finished
        skipped,     ///< transient failure, try again next tick
        stale,       ///< the session or its target changed; exit quietly
    };

    [[nodiscard]] std::string_view to_string(PollOutcome outcome) noexcept;

    // Called once when the target has nothing left to mine.
    using completion_fn_t = std::function<void(const SessionHandle& handle, MiningComplete note)>;

    class ProgressReconciler
    {
    public:
        ProgressReconciler(CatalogClient& client,
                           CredentialProvider& creds,
                           CampaignCatalog& catalog,
                           ClaimService& claims,
                           SharedState& shared,
                           StatusSink& sink,
                           std::shared_ptr<LoopTimer> timer,
                           const MiningSettings& settings,
                           SessionHandle handle,
                           MiningTarget target,
                           completion_fn_t on_complete);

        ProgressReconciler(const ProgressReconciler&) = delete;
        ProgressReconciler& operator=(const ProgressReconciler&) = delete;

        // Push path; called on the event bus executor.
        void on_push(const ProgressEvent& event);

        // Poll path, one iteration. Throws AuthError.
        [[nodiscard]] auto poll_once() -> boost::asio::awaitable<PollOutcome>;

        [[nodiscard]] auto run() -> boost::asio::awaitable<void>;

        // True while the shared status still describes this loop's target.
        [[nodiscard]] bool tracks_target() const;

    private:
        [[nodiscard]] bool tracks(const MiningStatus& s) const noexcept;
        [[nodiscard]] bool in_scope(const Campaign& c) const noexcept;

        // Benefit awarded inside the campaign window while no self progress exists.
        void apply_claimed_benefits(const std::vector<Campaign>& scoped, const Inventory& inventory);

        CatalogClient& client_;
        CredentialProvider& creds_;
        CampaignCatalog& catalog_;
        ClaimService& claims_;
        SharedState& shared_;
        StatusSink& sink_;
        std::shared_ptr<LoopTimer> timer_;
        const MiningSettings& settings_;
        const SessionHandle handle_;
        const MiningTarget target_;
        completion_fn_t on_complete_;
    };

} // namespace drop_miner
