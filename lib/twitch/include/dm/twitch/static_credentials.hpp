#pragma once

// C++ Standard Library
#include <string>
#include <utility>

// Boost.Asio
#include <boost/asio/awaitable.hpp>

// Project
#include <dm/mining/errors.hpp>
#include <dm/mining/interfaces.hpp>

namespace drop_miner::twitch
{

    // Hands out the token from the configuration file.
    class StaticCredentialProvider final : public CredentialProvider
    {
    public:
        explicit StaticCredentialProvider(std::string token) :
            token_(strip_prefix(std::move(token)))
        {
        }

        auto get_token() -> boost::asio::awaitable<std::string> override
        {
            if (token_.empty())
            {
                throw AuthError("no access token configured");
            }
            co_return token_;
        }

    private:
        // Accept "oauth:<token>" as pasted from chat tooling.
        static std::string strip_prefix(std::string token)
        {
            if (token.rfind("oauth:", 0) == 0)
            {
                token.erase(0, 6);
            }
            return token;
        }

        const std::string token_;
    };

} // namespace drop_miner::twitch
