/*
Module Name:
- model.hpp

Abstract:
- Value types shared by the engine, its collaborators and the UI layer:
  campaigns and their drops, per-drop progress, channels, the observable
  status snapshot, realtime progress events and UI notifications.
- All types are plain aggregates; locking lives in shared_state.hpp.
*/
#pragma once

// C++ Standard Library
#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace drop_miner
{

    using wall_clock = std::chrono::system_clock;
    using time_point = wall_clock::time_point;

    struct Benefit
    {
        std::string id;
        std::string name;
        std::string image_url;
    };

    struct DropProgress
    {
        std::string drop_id;
        std::string campaign_id;
        int current_minutes{ 0 };
        int required_minutes{ 0 };
        bool claimed{ false };
        std::optional<std::string> claim_token; ///< upstream drop instance id, when known
        time_point last_updated{};

        [[nodiscard]] bool satisfied() const noexcept
        {
            return required_minutes > 0 && current_minutes >= required_minutes;
        }
    };

    struct Drop
    {
        std::string id;
        std::string name;
        int required_minutes{ 0 };
        std::vector<Benefit> benefits;
        std::optional<DropProgress> progress;

        /// Zero-minute drops are event or badge triggered and cannot be watched for.
        [[nodiscard]] bool is_mineable() const noexcept
        {
            return required_minutes > 0;
        }

        /// First benefit name, falling back to the drop name.
        [[nodiscard]] std::string_view display_name() const noexcept;
        [[nodiscard]] std::string_view image_url() const noexcept;
    };

    struct AllowedChannel
    {
        std::string id;
        std::string login;
    };

    struct Campaign
    {
        std::string id;
        std::string name;
        std::string game_id;
        std::string game_name;
        time_point start_at{};
        time_point end_at{};
        std::vector<Drop> drops;
        std::vector<AllowedChannel> allowed_channels;
        bool allow_list_enforced{ false };

        [[nodiscard]] bool is_access_controlled() const noexcept
        {
            return allow_list_enforced && !allowed_channels.empty();
        }

        [[nodiscard]] bool is_active_at(time_point now) const noexcept
        {
            return start_at <= now && now <= end_at;
        }

        [[nodiscard]] const Drop* find_drop(std::string_view drop_id) const noexcept;
    };

    struct MiningChannel
    {
        std::string id;
        std::string login;
        std::string game_id;
        std::string game_name;
        int viewers{ 0 };
        bool drops_enabled{ true };
        bool online{ true };
        bool from_allow_list{ false };
    };

    /// Result of a liveness probe for a single channel.
    struct LiveStatus
    {
        int viewers{ 0 };
        std::string broadcast_id;
    };

    struct ClaimedBenefit
    {
        std::string benefit_id;
        time_point awarded_at{};
    };

    /// Reward inventory: in-progress campaigns (with self progress) and awarded benefits.
    struct Inventory
    {
        std::vector<Campaign> campaigns;
        std::vector<ClaimedBenefit> claimed_benefits;
    };

    /// Everything needed to emit one synthetic "minute watched" event.
    struct WatchSignal
    {
        std::string endpoint;
        std::string channel_id;
        std::string channel_login;
        std::string broadcast_id;
        std::string user_id;
    };

    enum class ClaimOutcome
    {
        claimed,
        already_claimed,
        invalid_token,
        failed,
    };

    [[nodiscard]] std::string_view to_string(ClaimOutcome outcome) noexcept;

    struct ChannelPointsContext
    {
        int balance{ 0 };
        std::optional<std::string> claim_id; ///< set when a bonus chest is waiting
        int points_on_claim{ 0 };
    };

    /// The drop surfaced to the UI as "currently being mined".
    struct CurrentDrop
    {
        std::string drop_id;
        std::string drop_name;
        std::string image_url;
        std::string campaign_id;
        std::string campaign_name;
        std::string game_name;
        int current_minutes{ 0 };
        int required_minutes{ 0 };
        double percentage{ 0.0 };
        std::optional<time_point> estimated_completion;
    };

    /// Build a CurrentDrop for drop in campaign with the given watched minutes.
    [[nodiscard]] CurrentDrop make_current_drop(const Campaign& campaign,
                                                const Drop& drop,
                                                int current_minutes,
                                                int required_minutes,
                                                time_point now);

    /// Percentage in [0, 100]; 0 when required is not positive.
    [[nodiscard]] double progress_percentage(int current_minutes, int required_minutes) noexcept;

    struct MiningStatus
    {
        bool active{ false };
        std::optional<MiningChannel> channel;
        std::string campaign_id;
        std::string campaign_name;
        std::string game_name;
        std::optional<CurrentDrop> current_drop;
        std::vector<MiningChannel> eligible_channels;
        time_point last_update{};
    };

    /// Realtime push update for one drop.
    struct ProgressEvent
    {
        std::string drop_id;
        int current_minutes{ 0 };
        int required_minutes{ 0 };
    };

    // Notifications delivered to the UI layer.

    struct DropReady
    {
        std::string drop_id;
        std::string drop_name;
        std::string campaign_name;
        std::string game_name;
    };

    struct DropClaimed
    {
        std::string drop_id;
        std::string drop_name;
        std::string campaign_name;
        std::string game_name;
    };

    struct ChannelSwitched
    {
        std::string from;
        std::string to;
        std::string reason;
    };

    struct MiningComplete
    {
        std::string game_name;
        std::string campaign_name;
        std::string reason;
    };

    struct NoChannelsAvailable
    {
        std::string reason;
    };

    struct ChannelPointsClaimed
    {
        std::string channel;
        int points{ 0 };
    };

    using Notification = std::variant<DropReady,
                                      DropClaimed,
                                      ChannelSwitched,
                                      MiningComplete,
                                      NoChannelsAvailable,
                                      ChannelPointsClaimed>;

    /// Stable event name ("drop-ready", "channel-switched", ...).
    [[nodiscard]] std::string_view notification_name(const Notification& note) noexcept;

} // namespace drop_miner
