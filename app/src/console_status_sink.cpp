// C++ Standard Library
#include <chrono>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <variant>

// App
#include <app/console_status_sink.hpp>

namespace app
{

    using namespace drop_miner;

    namespace
    {

        struct NoteText
        {
            std::string operator()(const DropReady& n) const
            {
                return "drop ready: " + n.drop_name + " (" + n.game_name + ", " + n.campaign_name + ")";
            }

            std::string operator()(const DropClaimed& n) const
            {
                return "drop claimed: " + n.drop_name + " (" + n.game_name + ", " + n.campaign_name + ")";
            }

            std::string operator()(const ChannelSwitched& n) const
            {
                return "switched " + n.from + " -> " + n.to + ": " + n.reason;
            }

            std::string operator()(const MiningComplete& n) const
            {
                return "mining complete for " + n.game_name + " / " + n.campaign_name + ": " + n.reason;
            }

            std::string operator()(const NoChannelsAvailable& n) const
            {
                return "mining stopped: " + n.reason;
            }

            std::string operator()(const ChannelPointsClaimed& n) const
            {
                return "+" + std::to_string(n.points) + " channel points on " + n.channel;
            }
        };

    } // namespace

    ConsoleStatusSink::ConsoleStatusSink(terminal_fn_t on_terminal) :
        on_terminal_(std::move(on_terminal))
    {
    }

    std::string ConsoleStatusSink::describe(const MiningStatus& status)
    {
        if (!status.active)
        {
            return "idle";
        }

        std::ostringstream out;
        if (status.channel)
        {
            out << "watching " << status.channel->login << " (" << status.channel->viewers << " viewers)";
        }
        else
        {
            out << "searching";
        }
        out << " | " << status.game_name << " / " << status.campaign_name;

        if (const auto& drop = status.current_drop)
        {
            out << " | " << drop->drop_name << ' ' << drop->current_minutes << '/' << drop->required_minutes
                << " min (" << std::fixed << std::setprecision(1) << drop->percentage << "%)";
            if (drop->estimated_completion)
            {
                const auto left = std::chrono::duration_cast<std::chrono::minutes>(
                    *drop->estimated_completion - wall_clock::now());
                if (left.count() > 0)
                {
                    out << " ~" << left.count() << " min left";
                }
            }
        }
        out << " | " << status.eligible_channels.size() << " eligible";
        return out.str();
    }

    std::string ConsoleStatusSink::describe(const Notification& note)
    {
        return std::visit(NoteText{}, note);
    }

    bool ConsoleStatusSink::is_terminal(const Notification& note) noexcept
    {
        return std::holds_alternative<MiningComplete>(note) || std::holds_alternative<NoChannelsAvailable>(note);
    }

    void ConsoleStatusSink::publish_status(const MiningStatus& status)
    {
        auto line = describe(status);
        std::lock_guard lk(mutex_);
        if (line == last_line_)
        {
            return;
        }
        std::cout << "[Status] " << line << '\n';
        last_line_ = std::move(line);
    }

    void ConsoleStatusSink::notify(const Notification& note)
    {
        {
            std::lock_guard lk(mutex_);
            std::cout << "[Notify] " << notification_name(note) << ": " << describe(note) << '\n';
        }
        if (on_terminal_ && is_terminal(note))
        {
            on_terminal_(note);
        }
    }

} // namespace app
