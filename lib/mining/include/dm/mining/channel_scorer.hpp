/*
Module Name:
- channel_scorer.hpp

Abstract:
- Weighted ranking of discovered channels:
    priority game  10000 - 100 * index
    allow-listed   5000
    audience       min(viewers / 10, 1000)
- Ties keep input order.
*/
#pragma once

// C++ Standard Library
#include <optional>
#include <vector>

// Project
#include <dm/mining/model.hpp>
#include <dm/mining/settings.hpp>

namespace drop_miner
{

    inline constexpr int k_priority_base_score = 10000;
    inline constexpr int k_priority_step = 100;
    inline constexpr int k_allow_list_score = 5000;
    inline constexpr int k_viewer_score_cap = 1000;

    [[nodiscard]] int score_channel(const MiningChannel& channel, const MiningSettings& settings) noexcept;

    // Online, drops-enabled channels, best first.
    [[nodiscard]] std::vector<MiningChannel> rank_channels(std::vector<MiningChannel> channels,
                                                           const MiningSettings& settings);

    [[nodiscard]] std::optional<MiningChannel> select_best(const std::vector<MiningChannel>& channels,
                                                           const MiningSettings& settings);

} // namespace drop_miner
