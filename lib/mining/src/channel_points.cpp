// C++ Standard Library
#include <iostream>
#include <utility>

// Project
#include <dm/mining/channel_points.hpp>
#include <dm/mining/errors.hpp>

namespace drop_miner
{

    ChannelPointsHarvester::ChannelPointsHarvester(CatalogClient& client,
                                                   CredentialProvider& creds,
                                                   SharedState& shared,
                                                   StatusSink& sink,
                                                   std::shared_ptr<LoopTimer> timer,
                                                   const MiningSettings& settings,
                                                   SessionHandle handle) :
        client_(client),
        creds_(creds),
        shared_(shared),
        sink_(sink),
        timer_(std::move(timer)),
        settings_(settings),
        handle_(std::move(handle))
    {
        Expects(timer_ != nullptr);
    }

    auto ChannelPointsHarvester::harvest_once() -> boost::asio::awaitable<std::optional<int>>
    {
        if (!settings_.auto_claim_channel_points || !handle_.is_current())
        {
            co_return std::nullopt;
        }
        const auto channel = shared_.status.snapshot().channel;
        if (!channel)
        {
            co_return std::nullopt;
        }

        const auto token = co_await creds_.get_token();
        const auto context = co_await client_.fetch_channel_points(token, channel->login);
        if (!context || !context->claim_id)
        {
            co_return std::nullopt;
        }

        const int before = context->balance;
        const int after = co_await client_.claim_channel_points(token, channel->id, *context->claim_id);
        const int gained = after > before ? after - before : context->points_on_claim;
        std::cout << "[Points] claimed bonus on " << channel->login << ": +" << gained << " (balance " << after << ")\n";

        if (settings_.notify_on_points_claimed && handle_.is_current())
        {
            sink_.notify(ChannelPointsClaimed{ channel->login, gained });
        }
        co_return gained;
    }

    auto ChannelPointsHarvester::run() -> boost::asio::awaitable<void>
    {
        if (!settings_.auto_claim_channel_points)
        {
            co_return;
        }
        while (handle_.is_current())
        {
            try
            {
                (void)co_await harvest_once();
            }
            catch (const AuthError&)
            {
                throw;
            }
            catch (const MiningError& e)
            {
                std::cerr << "[Points] " << e.what() << '\n';
            }
            if (!co_await timer_->sleep(settings_.poll_interval))
            {
                break;
            }
        }
        std::cout << "[Points] loop for session " << handle_.id() << " exited\n";
    }

} // namespace drop_miner
