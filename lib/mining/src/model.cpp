// C++ Standard Library
#include <algorithm>
#include <type_traits>

// Project
#include <dm/mining/model.hpp>
#include <dm/mining/settings.hpp>

namespace drop_miner
{

    std::string_view Drop::display_name() const noexcept
    {
        if (!benefits.empty() && !benefits.front().name.empty())
        {
            return benefits.front().name;
        }
        return name;
    }

    std::string_view Drop::image_url() const noexcept
    {
        if (!benefits.empty())
        {
            return benefits.front().image_url;
        }
        return {};
    }

    const Drop* Campaign::find_drop(std::string_view drop_id) const noexcept
    {
        auto it = std::find_if(drops.begin(), drops.end(), [drop_id](const Drop& d) { return d.id == drop_id; });
        return it == drops.end() ? nullptr : &*it;
    }

    double progress_percentage(int current_minutes, int required_minutes) noexcept
    {
        if (required_minutes <= 0)
        {
            return 0.0;
        }
        const double pct = 100.0 * static_cast<double>(current_minutes) / static_cast<double>(required_minutes);
        return std::clamp(pct, 0.0, 100.0);
    }

    CurrentDrop make_current_drop(const Campaign& campaign,
                                  const Drop& drop,
                                  int current_minutes,
                                  int required_minutes,
                                  time_point now)
    {
        CurrentDrop out{
            .drop_id = drop.id,
            .drop_name = std::string{ drop.display_name() },
            .image_url = std::string{ drop.image_url() },
            .campaign_id = campaign.id,
            .campaign_name = campaign.name,
            .game_name = campaign.game_name,
            .current_minutes = current_minutes,
            .required_minutes = required_minutes,
            .percentage = progress_percentage(current_minutes, required_minutes),
            .estimated_completion = std::nullopt,
        };
        if (current_minutes > 0 && current_minutes < required_minutes)
        {
            out.estimated_completion = now + std::chrono::minutes{ required_minutes - current_minutes };
        }
        return out;
    }

    std::string_view to_string(ClaimOutcome outcome) noexcept
    {
        switch (outcome)
        {
        case ClaimOutcome::claimed:
            return "claimed";
        case ClaimOutcome::already_claimed:
            return "already-claimed";
        case ClaimOutcome::invalid_token:
            return "invalid-token";
        case ClaimOutcome::failed:
            return "failed";
        }
        return "unknown";
    }

    std::string_view notification_name(const Notification& note) noexcept
    {
        return std::visit(
            [](const auto& n) -> std::string_view {
                using T = std::decay_t<decltype(n)>;
                if constexpr (std::is_same_v<T, DropReady>)
                    return "drop-ready";
                else if constexpr (std::is_same_v<T, DropClaimed>)
                    return "drop-claimed";
                else if constexpr (std::is_same_v<T, ChannelSwitched>)
                    return "channel-switched";
                else if constexpr (std::is_same_v<T, MiningComplete>)
                    return "mining-complete";
                else if constexpr (std::is_same_v<T, NoChannelsAvailable>)
                    return "mining-stopped-no-channels";
                else
                    return "channel-points-claimed";
            },
            note);
    }

    std::string_view to_string(PriorityMode mode) noexcept
    {
        switch (mode)
        {
        case PriorityMode::open:
            return "open";
        case PriorityMode::priority_only:
            return "priority-only";
        }
        return "open";
    }

    int MiningSettings::priority_index(std::string_view game_name) const noexcept
    {
        auto it = std::find(priority_games.begin(), priority_games.end(), game_name);
        return it == priority_games.end() ? -1 : static_cast<int>(it - priority_games.begin());
    }

} // namespace drop_miner
