/*
Module Name:
- config.hpp

Abstract:
- Immutable configuration for drop_miner loaded from a single TOML file.
- Surfaces the auth section, the start request (campaign and channel) and the
  engine's MiningSettings, plus the absolute file path.
- Fails fast with EnvError on a missing required key, a wrong type or an
  out-of-range value. Optional keys fall back to the engine defaults.
*/
#pragma once

// C++ Standard Library
#include <filesystem>
#include <stdexcept>
#include <string>
#include <string_view>

// Project
#include <dm/mining/settings.hpp>

namespace env
{

    /// Configuration-loading failure.
    class EnvError final : public std::runtime_error
    {
    public:
        explicit EnvError(const std::string& msg) noexcept;
    };

    /// Twitch OAuth token. Acquiring or refreshing it is the user's business.
    struct AuthConfig
    {
        std::string access_token;
    };

    /// What to mine. Empty campaign_id selects automatic mode.
    struct TargetConfig
    {
        std::string campaign_id;
        std::string channel_id;
    };

    class Config
    {
    public:
        /// Load from the file at path.
        /// Pre: !path.empty()
        static Config load_file(const std::filesystem::path& path);

        /// Load from "./config.toml".
        static Config load();

        /// Parse TOML text; source names the origin in error messages.
        static Config parse(std::string_view text, std::string_view source = "<string>");

        [[nodiscard]] const AuthConfig& auth() const noexcept
        {
            return auth_;
        }
        [[nodiscard]] const TargetConfig& target() const noexcept
        {
            return target_;
        }
        [[nodiscard]] const drop_miner::MiningSettings& mining() const noexcept
        {
            return mining_;
        }
        [[nodiscard]] const std::filesystem::path& path() const noexcept
        {
            return path_;
        }

    private:
        Config(std::filesystem::path path,
               AuthConfig auth_cfg,
               TargetConfig target_cfg,
               drop_miner::MiningSettings mining_cfg) :
            path_{ std::move(path) },
            auth_{ std::move(auth_cfg) },
            target_{ std::move(target_cfg) },
            mining_{ std::move(mining_cfg) }
        {
        }

        std::filesystem::path path_;
        AuthConfig auth_;
        TargetConfig target_;
        drop_miner::MiningSettings mining_;
    };

} // namespace env
