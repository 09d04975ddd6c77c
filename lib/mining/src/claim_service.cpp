// C++ Standard Library
#include <iostream>

// Project
#include <dm/mining/claim_service.hpp>
#include <dm/mining/errors.hpp>

namespace drop_miner
{

    std::string derive_claim_token(std::string_view user_id, std::string_view campaign_id, std::string_view drop_id)
    {
        std::string token;
        token.reserve(user_id.size() + campaign_id.size() + drop_id.size() + 2);
        token.append(user_id).append("#").append(campaign_id).append("#").append(drop_id);
        return token;
    }

    void ClaimService::reset()
    {
        std::lock_guard lk(mutex_);
        announced_.clear();
        attempted_.clear();
    }

    auto ClaimService::handle_ready(const SessionHandle& handle,
                                    const Campaign& campaign,
                                    const Drop& drop,
                                    const DropProgress& progress) -> boost::asio::awaitable<bool>
    {
        if (progress.claimed)
        {
            co_return true;
        }

        bool announce = false;
        bool attempt = false;
        {
            std::lock_guard lk(mutex_);
            announce = announced_.insert(drop.id).second;
            if (settings_.auto_claim_drops)
            {
                attempt = attempted_.insert(drop.id).second;
            }
        }

        if (announce && handle.is_current())
        {
            std::cout << "[Claims] " << drop.display_name() << " is ready to claim\n";
            if (settings_.notify_on_drop_available)
            {
                sink_.notify(DropReady{ drop.id, std::string{ drop.display_name() }, campaign.name, campaign.game_name });
            }
        }
        if (!attempt)
        {
            co_return false;
        }

        ClaimOutcome outcome = ClaimOutcome::failed;
        try
        {
            const auto token = co_await creds_.get_token();
            std::string claim_token;
            if (progress.claim_token && !progress.claim_token->empty())
            {
                claim_token = *progress.claim_token;
            }
            else
            {
                const auto user_id = co_await shared_.identity.user_id(client_, creds_);
                claim_token = derive_claim_token(user_id, campaign.id, drop.id);
            }
            outcome = co_await client_.submit_claim(token, claim_token);
        }
        catch (const AuthError&)
        {
            throw;
        }
        catch (const MiningError& e)
        {
            std::cerr << "[Claims] claim of " << drop.display_name() << " failed: " << e.what() << '\n';
            co_return false;
        }

        std::cout << "[Claims] " << drop.display_name() << ": " << to_string(outcome) << '\n';
        if (outcome == ClaimOutcome::failed)
        {
            co_return false;
        }

        shared_.progress.mark_claimed(drop.id, campaign.id);
        if (outcome == ClaimOutcome::claimed && settings_.notify_on_drop_claimed && handle.is_current())
        {
            sink_.notify(DropClaimed{ drop.id, std::string{ drop.display_name() }, campaign.name, campaign.game_name });
        }
        co_return true;
    }

} // namespace drop_miner
