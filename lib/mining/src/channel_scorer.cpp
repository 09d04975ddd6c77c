// C++ Standard Library
#include <algorithm>
#include <iostream>
#include <utility>

// Project
#include <dm/mining/channel_scorer.hpp>

namespace drop_miner
{

    int score_channel(const MiningChannel& channel, const MiningSettings& settings) noexcept
    {
        int score = 0;
        if (const int idx = settings.priority_index(channel.game_name); idx >= 0)
        {
            score += k_priority_base_score - k_priority_step * idx;
        }
        if (channel.from_allow_list)
        {
            score += k_allow_list_score;
        }
        score += std::min(std::max(channel.viewers, 0) / 10, k_viewer_score_cap);
        return score;
    }

    std::vector<MiningChannel> rank_channels(std::vector<MiningChannel> channels, const MiningSettings& settings)
    {
        std::erase_if(channels, [](const MiningChannel& c) { return !c.online || !c.drops_enabled; });

        std::vector<std::pair<int, MiningChannel>> scored;
        scored.reserve(channels.size());
        for (auto& c : channels)
        {
            const int s = score_channel(c, settings);
            scored.emplace_back(s, std::move(c));
        }
        std::stable_sort(scored.begin(), scored.end(), [](const auto& a, const auto& b) { return a.first > b.first; });

        std::vector<MiningChannel> out;
        out.reserve(scored.size());
        for (auto& [s, c] : scored)
        {
            out.push_back(std::move(c));
        }
        return out;
    }

    std::optional<MiningChannel> select_best(const std::vector<MiningChannel>& channels, const MiningSettings& settings)
    {
        auto ranked = rank_channels(channels, settings);
        if (ranked.empty())
        {
            return std::nullopt;
        }
        std::cout << "[Scorer] best of " << ranked.size() << ": " << ranked.front().login << " (score "
                  << score_channel(ranked.front(), settings) << ")\n";
        return std::move(ranked.front());
    }

} // namespace drop_miner
