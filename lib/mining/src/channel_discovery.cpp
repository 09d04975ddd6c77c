// C++ Standard Library
#include <iostream>

// Project
#include <dm/mining/channel_discovery.hpp>
#include <dm/mining/errors.hpp>
#include <dm/utils/transparent_string_hash.hpp>

namespace drop_miner
{

    auto ChannelDiscovery::probe_allow_list(const Campaign& c, std::size_t cap)
        -> boost::asio::awaitable<std::vector<MiningChannel>>
    {
        std::vector<MiningChannel> live;
        for (const auto& allowed : c.allowed_channels)
        {
            if (live.size() >= cap)
            {
                break;
            }
            std::optional<LiveStatus> status;
            try
            {
                const auto token = co_await creds_.get_token();
                status = co_await client_.probe_channel(token, allowed.id);
            }
            catch (const AuthError&)
            {
                throw;
            }
            catch (const MiningError& e)
            {
                std::cerr << "[Discovery] probe of " << allowed.login << " failed: " << e.what() << '\n';
                continue;
            }
            if (!status)
            {
                continue;
            }
            live.push_back(MiningChannel{
                .id = allowed.id,
                .login = allowed.login,
                .game_id = c.game_id,
                .game_name = c.game_name,
                .viewers = status->viewers,
                .drops_enabled = true,
                .online = true,
                .from_allow_list = true,
            });
        }
        co_return live;
    }

    auto ChannelDiscovery::query_open_pool(const Campaign& c, std::size_t limit)
        -> boost::asio::awaitable<std::vector<MiningChannel>>
    {
        try
        {
            const auto token = co_await creds_.get_token();
            auto channels = co_await client_.list_live_channels(token, c.game_id, c.game_name, limit);
            for (auto& ch : channels)
            {
                ch.from_allow_list = false;
                if (ch.game_name.empty())
                {
                    ch.game_name = c.game_name;
                }
            }
            co_return channels;
        }
        catch (const AuthError&)
        {
            throw;
        }
        catch (const MiningError& e)
        {
            std::cerr << "[Discovery] open pool query for " << c.game_name << " failed: " << e.what() << '\n';
        }
        co_return std::vector<MiningChannel>{};
    }

    auto ChannelDiscovery::discover_eligible(const std::vector<Campaign>& campaigns, const MiningSettings& settings)
        -> boost::asio::awaitable<std::vector<MiningChannel>>
    {
        std::vector<MiningChannel> out;
        dm::StringSet seen;

        for (const auto& c : campaigns)
        {
            std::vector<MiningChannel> found;
            if (c.is_access_controlled())
            {
                found = co_await probe_allow_list(c, settings.acl_live_channel_cap);
            }
            else
            {
                found = co_await query_open_pool(c, settings.open_pool_limit);
            }
            for (auto& ch : found)
            {
                if (!ch.online || !ch.drops_enabled)
                {
                    continue;
                }
                if (seen.insert(ch.id).second)
                {
                    out.push_back(std::move(ch));
                }
            }
        }
        std::cout << "[Discovery] " << out.size() << " eligible channels across " << campaigns.size()
                  << " campaigns\n";
        co_return out;
    }

    auto ChannelDiscovery::find_first_eligible(const std::vector<Campaign>& campaigns)
        -> boost::asio::awaitable<std::optional<EligibleChannel>>
    {
        for (const auto& c : campaigns)
        {
            if (!c.is_access_controlled())
            {
                continue;
            }
            auto live = co_await probe_allow_list(c, 1);
            if (!live.empty())
            {
                co_return EligibleChannel{ std::move(live.front()), c };
            }
        }
        for (const auto& c : campaigns)
        {
            if (c.is_access_controlled())
            {
                continue;
            }
            auto live = co_await query_open_pool(c, 1);
            for (auto& ch : live)
            {
                if (ch.online && ch.drops_enabled)
                {
                    co_return EligibleChannel{ std::move(ch), c };
                }
            }
        }
        co_return std::nullopt;
    }

} // namespace drop_miner
