/*
Module Name:
- console_status_sink.hpp

Abstract:
- StatusSink that renders engine status and notifications on the console.
- Status lines are printed only when their rendering changes, so the
  60-second poll does not flood the terminal.
- Terminal notifications (mining-complete, mining-stopped-no-channels) are
  forwarded to an optional callback so main() can shut down.
*/
#pragma once

// C++ Standard Library
#include <functional>
#include <mutex>
#include <string>

// Project
#include <dm/mining/interfaces.hpp>
#include <dm/mining/model.hpp>

namespace app
{

    class ConsoleStatusSink final : public drop_miner::StatusSink
    {
    public:
        using terminal_fn_t = std::function<void(const drop_miner::Notification&)>;

        explicit ConsoleStatusSink(terminal_fn_t on_terminal = {});

        void publish_status(const drop_miner::MiningStatus& status) override;
        void notify(const drop_miner::Notification& note) override;

        [[nodiscard]] static std::string describe(const drop_miner::MiningStatus& status);
        [[nodiscard]] static std::string describe(const drop_miner::Notification& note);

        [[nodiscard]] static bool is_terminal(const drop_miner::Notification& note) noexcept;

    private:
        std::mutex mutex_; // serialises console output and last_line_
        std::string last_line_;
        terminal_fn_t on_terminal_;
    };

} // namespace app
