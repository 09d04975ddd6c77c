/*
Module Name:
- failover.hpp

Abstract:
- Recovers a session whose watched channel stopped accepting watch signals.
- First scans the cached channel list (wrapping around, skipping the failing
  channel and channels still cooling down from an earlier failure), probing
  each candidate for a live broadcast. If the cache is exhausted it refetches
  campaigns, rediscovers and reranks channels for the mining target, replaces
  the channel cache and scans again.
- When no channel is found the session is terminated through the supplied
  callback; that outcome is a notification, not an exception.
*/
#pragma once

// C++ Standard Library
#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

// Boost.Asio
#include <boost/asio/awaitable.hpp>

// Project
#include <dm/mining/campaign_catalog.hpp>
#include <dm/mining/channel_discovery.hpp>
#include <dm/mining/interfaces.hpp>
#include <dm/mining/model.hpp>
#include <dm/mining/settings.hpp>
#include <dm/mining/shared_state.hpp>
#include <dm/utils/timer.hpp>
#include <dm/utils/transparent_string_hash.hpp>

namespace drop_miner
{

    // What the session is mining. pinned is set when the user asked for one campaign.
    struct MiningTarget
    {
        std::string campaign_id;
        std::string campaign_name;
        std::string game_id;
        std::string game_name;
        bool pinned{ false };
    };

    struct SwitchResult
    {
        MiningChannel channel;
        std::string broadcast_id;
        std::size_t index{ 0 }; ///< position of channel in the list it was picked from
    };

    struct RefreshedSwitch
    {
        SwitchResult selected;
        std::vector<MiningChannel> refreshed; ///< new channel cache, best first
    };

    // Called when recovery is exhausted; stops the session and reports why.
    using exhausted_fn_t = std::function<void(const SessionHandle& handle, std::string reason)>;

    class FailoverStateMachine
    {
    public:
        FailoverStateMachine(CatalogClient& client,
                             CredentialProvider& creds,
                             CampaignCatalog& catalog,
                             ChannelDiscovery& discovery,
                             SharedState& shared,
                             StatusSink& sink,
                             const MiningSettings& settings,
                             exhausted_fn_t on_exhausted);

        FailoverStateMachine(const FailoverStateMachine&) = delete;
        FailoverStateMachine& operator=(const FailoverStateMachine&) = delete;

        // First live candidate after last_index (wrapping), or nullopt.
        [[nodiscard]] auto try_switch(const std::vector<MiningChannel>& cached,
                                      std::string_view failing_id,
                                      std::optional<std::size_t> last_index)
            -> boost::asio::awaitable<std::optional<SwitchResult>>;

        // Rediscover channels for target and scan the fresh list.
        [[nodiscard]] auto try_switch_with_refresh(std::string_view failing_id, const MiningTarget& target)
            -> boost::asio::awaitable<std::optional<RefreshedSwitch>>;

        // Full recovery transition. Returns the new channel, or nullopt when the
        // session was terminated or is no longer current.
        [[nodiscard]] auto handle_failure(const SessionHandle& handle,
                                          const MiningChannel& failing,
                                          std::optional<std::size_t> last_index,
                                          const MiningTarget& target,
                                          std::string reason)
            -> boost::asio::awaitable<std::optional<SwitchResult>>;

        void mark_failed(std::string_view channel_id);
        [[nodiscard]] bool is_cooling_down(std::string_view channel_id) const;

        // Number of handle_failure() calls so far.
        [[nodiscard]] int attempts() const noexcept
        {
            return attempts_;
        }

    private:
        CatalogClient& client_;
        CredentialProvider& creds_;
        CampaignCatalog& catalog_;
        ChannelDiscovery& discovery_;
        SharedState& shared_;
        StatusSink& sink_;
        const MiningSettings& settings_;
        exhausted_fn_t on_exhausted_;

        int attempts_{ 0 };

        mutable std::mutex cooldown_mutex_; // protects cooldown_
        dm::StringMap<dm::Timer> cooldown_;
    };

} // namespace drop_miner
