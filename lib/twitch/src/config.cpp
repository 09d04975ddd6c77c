// C++ Standard Library
#include <chrono>
#include <cstdint>
#include <initializer_list>
#include <string_view>
#include <utility>
#include <vector>

// TOML++
#include <toml++/toml.hpp>

// Project
#include <dm/twitch/config.hpp>

namespace env
{

    namespace
    {
        std::string dotted(std::initializer_list<std::string_view> keys)
        {
            std::string out;
            for (auto key : keys)
            {
                if (!out.empty())
                    out.push_back('.');
                out.append(key);
            }
            return out;
        }

        // Node at dotted key path, or nullptr when any part is absent.
        const toml::node* find_node(const toml::table& root, std::initializer_list<std::string_view> keys)
        {
            const toml::node* node = &root;
            for (auto key : keys)
            {
                const auto* table_ptr = node->as_table();
                if (!table_ptr)
                    return nullptr;
                node = table_ptr->get(key);
                if (!node)
                    return nullptr;
            }
            return node;
        }

        // Return a non-empty string at dotted key path or throw EnvError.
        std::string fetch_string(const toml::table& root,
                                 std::initializer_list<std::string_view> keys,
                                 const std::string& source)
        {
            const toml::node* node = find_node(root, keys);
            if (!node)
                throw EnvError("Missing key '" + dotted(keys) + "' in " + source);
            if (auto opt = node->value<std::string>(); opt && !opt->empty())
                return *opt;
            throw EnvError("Invalid value for '" + dotted(keys) + "' in " + source);
        }

        std::string fetch_optional_string(const toml::table& root,
                                          std::initializer_list<std::string_view> keys,
                                          const std::string& source)
        {
            const toml::node* node = find_node(root, keys);
            if (!node)
                return {};
            if (!node->is_string())
                throw EnvError("Expected a string for '" + dotted(keys) + "' in " + source);
            return *node->value<std::string>();
        }

        bool fetch_bool(const toml::table& root,
                        std::initializer_list<std::string_view> keys,
                        bool fallback,
                        const std::string& source)
        {
            const toml::node* node = find_node(root, keys);
            if (!node)
                return fallback;
            if (!node->is_boolean())
                throw EnvError("Expected true or false for '" + dotted(keys) + "' in " + source);
            return *node->value<bool>();
        }

        // Strictly positive integer, or fallback when absent.
        std::int64_t fetch_positive(const toml::table& root,
                                    std::initializer_list<std::string_view> keys,
                                    std::int64_t fallback,
                                    const std::string& source)
        {
            const toml::node* node = find_node(root, keys);
            if (!node)
                return fallback;
            if (!node->is_integer())
                throw EnvError("Expected an integer for '" + dotted(keys) + "' in " + source);
            const auto v = *node->value<std::int64_t>();
            if (v <= 0)
                throw EnvError("'" + dotted(keys) + "' must be positive in " + source);
            return v;
        }

        std::chrono::milliseconds fetch_seconds(const toml::table& root,
                                                std::initializer_list<std::string_view> keys,
                                                std::chrono::milliseconds fallback,
                                                const std::string& source)
        {
            const auto fallback_s = std::chrono::duration_cast<std::chrono::seconds>(fallback).count();
            return std::chrono::seconds{ fetch_positive(root, keys, fallback_s, source) };
        }

        std::vector<std::string> fetch_string_list(const toml::table& root,
                                                   std::initializer_list<std::string_view> keys,
                                                   const std::string& source)
        {
            std::vector<std::string> out;
            const toml::node* node = find_node(root, keys);
            if (!node)
                return out;
            const auto* arr = node->as_array();
            if (!arr)
                throw EnvError("Expected an array of strings for '" + dotted(keys) + "' in " + source);
            out.reserve(arr->size());
            for (const auto& el : *arr)
            {
                auto s = el.value<std::string>();
                if (!s || !el.is_string())
                    throw EnvError("Expected an array of strings for '" + dotted(keys) + "' in " + source);
                if (!s->empty())
                    out.push_back(std::move(*s));
            }
            return out;
        }

        drop_miner::PriorityMode fetch_priority_mode(const toml::table& root, const std::string& source)
        {
            const auto mode = fetch_optional_string(root, { "mining", "priority_mode" }, source);
            if (mode.empty() || mode == "open")
                return drop_miner::PriorityMode::open;
            if (mode == "priority-only")
                return drop_miner::PriorityMode::priority_only;
            throw EnvError("Unknown mining.priority_mode '" + mode + "' in " + source);
        }

        Config from_table(const toml::table& tbl, std::filesystem::path path, const std::string& source)
        {
            AuthConfig auth_cfg{
                .access_token = fetch_string(tbl, { "twitch", "auth", "access_token" }, source),
            };

            TargetConfig target_cfg{
                .campaign_id = fetch_optional_string(tbl, { "mining", "campaign_id" }, source),
                .channel_id = fetch_optional_string(tbl, { "mining", "channel_id" }, source),
            };

            const drop_miner::MiningSettings defaults{};
            drop_miner::MiningSettings m{};
            for (auto& game : fetch_string_list(tbl, { "mining", "excluded_games" }, source))
                m.excluded_games.insert(std::move(game));
            m.priority_games = fetch_string_list(tbl, { "mining", "priority_games" }, source);
            m.priority_mode = fetch_priority_mode(tbl, source);
            m.auto_claim_drops = fetch_bool(tbl, { "mining", "auto_claim_drops" }, defaults.auto_claim_drops, source);
            m.auto_claim_channel_points = fetch_bool(
                tbl, { "mining", "auto_claim_channel_points" }, defaults.auto_claim_channel_points, source);

            m.heartbeat_interval = fetch_seconds(tbl, { "mining", "heartbeat_interval_seconds" }, defaults.heartbeat_interval, source);
            m.poll_interval = fetch_seconds(tbl, { "mining", "poll_interval_seconds" }, defaults.poll_interval, source);
            m.watch_timeout = fetch_seconds(tbl, { "mining", "watch_timeout_seconds" }, defaults.watch_timeout, source);
            m.campaign_cache_ttl = fetch_seconds(tbl, { "mining", "campaign_cache_ttl_seconds" }, defaults.campaign_cache_ttl, source);
            m.failed_channel_cooldown = fetch_seconds(
                tbl, { "mining", "failed_channel_cooldown_seconds" }, defaults.failed_channel_cooldown, source);

            m.failure_threshold = static_cast<int>(fetch_positive(tbl, { "mining", "failure_threshold" }, defaults.failure_threshold, source));
            m.acl_live_channel_cap = static_cast<std::size_t>(
                fetch_positive(tbl, { "mining", "acl_live_channel_cap" }, static_cast<std::int64_t>(defaults.acl_live_channel_cap), source));
            m.open_pool_limit = static_cast<std::size_t>(
                fetch_positive(tbl, { "mining", "open_pool_limit" }, static_cast<std::int64_t>(defaults.open_pool_limit), source));

            m.notify_on_drop_available = fetch_bool(tbl, { "notifications", "drop_available" }, defaults.notify_on_drop_available, source);
            m.notify_on_drop_claimed = fetch_bool(tbl, { "notifications", "drop_claimed" }, defaults.notify_on_drop_claimed, source);
            m.notify_on_points_claimed = fetch_bool(tbl, { "notifications", "points_claimed" }, defaults.notify_on_points_claimed, source);
            m.notify_on_recovery_action = fetch_bool(tbl, { "notifications", "recovery_action" }, defaults.notify_on_recovery_action, source);

            if (m.watch_timeout > m.heartbeat_interval)
                throw EnvError("mining.watch_timeout_seconds must not exceed heartbeat_interval_seconds in " + source);

            return Config(std::move(path), std::move(auth_cfg), std::move(target_cfg), std::move(m));
        }
    } // namespace

    Config Config::load_file(const std::filesystem::path& path)
    {
        if (path.string().empty())
            throw EnvError("Config file path must not be empty");

        const auto path_str = path.string();
        toml::table tbl;
        try
        {
            tbl = toml::parse_file(path_str);
        }
        catch (const toml::parse_error& e)
        {
            throw EnvError("TOML parse error in '" + path_str + "': " + std::string{ e.what() });
        }
        catch (const std::filesystem::filesystem_error& e)
        {
            throw EnvError("Cannot read config file '" + path_str + "': " + std::string{ e.what() });
        }
        return from_table(tbl, std::filesystem::absolute(path), path_str);
    }

    Config Config::load()
    {
        const auto default_path = std::filesystem::current_path() / "config.toml";
        if (!std::filesystem::exists(default_path))
            throw EnvError("Config file not found at '" + default_path.string() + "'");
        return load_file(default_path);
    }

    Config Config::parse(std::string_view text, std::string_view source)
    {
        const std::string source_str{ source };
        toml::table tbl;
        try
        {
            tbl = toml::parse(text, source);
        }
        catch (const toml::parse_error& e)
        {
            throw EnvError("TOML parse error in '" + source_str + "': " + std::string{ e.what() });
        }
        return from_table(tbl, {}, source_str);
    }

    EnvError::EnvError(const std::string& msg) noexcept :
        std::runtime_error{ msg }
    {
    }

} // namespace env
