/*
Module Name:
- settings.hpp

Abstract:
- User preferences consumed read-only by the engine. The session controller
  copies them at construction so a running session never sees partial edits.
*/
#pragma once

// C++ Standard Library
#include <chrono>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

// Project
#include <dm/utils/transparent_string_hash.hpp>

namespace drop_miner
{

    enum class PriorityMode
    {
        open,          ///< every non-excluded game is eligible
        priority_only, ///< only games in priority_games (when that list is non-empty)
    };

    [[nodiscard]] std::string_view to_string(PriorityMode mode) noexcept;

    struct MiningSettings
    {
        dm::StringSet excluded_games;
        std::vector<std::string> priority_games; ///< most important first
        PriorityMode priority_mode{ PriorityMode::open };

        bool auto_claim_drops{ true };
        bool auto_claim_channel_points{ true };

        bool notify_on_drop_available{ true };
        bool notify_on_drop_claimed{ true };
        bool notify_on_points_claimed{ false };
        bool notify_on_recovery_action{ true };

        std::chrono::milliseconds heartbeat_interval{ std::chrono::seconds{ 60 } };
        std::chrono::milliseconds poll_interval{ std::chrono::seconds{ 60 } };
        std::chrono::milliseconds watch_timeout{ std::chrono::seconds{ 15 } };
        std::chrono::milliseconds campaign_cache_ttl{ std::chrono::seconds{ 300 } };
        std::chrono::milliseconds failed_channel_cooldown{ std::chrono::seconds{ 600 } };

        int failure_threshold{ 3 };
        std::size_t acl_live_channel_cap{ 5 };
        std::size_t open_pool_limit{ 20 };

        /// Position of game_name in priority_games, or -1.
        [[nodiscard]] int priority_index(std::string_view game_name) const noexcept;
    };

} // namespace drop_miner
