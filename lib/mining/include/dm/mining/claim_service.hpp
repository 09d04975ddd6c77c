/*
Module Name:
- claim_service.hpp

Abstract:
- Announces drops that reached their watch threshold and, when enabled,
  claims them. Each drop is announced once and attempted once per session.
- already-claimed and invalid-token outcomes mark the drop claimed so it
  never becomes a mining target again.
*/
#pragma once

// C++ Standard Library
#include <mutex>
#include <string>
#include <string_view>
#include <utility>

// Boost.Asio
#include <boost/asio/awaitable.hpp>

// Project
#include <dm/mining/interfaces.hpp>
#include <dm/mining/model.hpp>
#include <dm/mining/settings.hpp>
#include <dm/mining/shared_state.hpp>
#include <dm/utils/transparent_string_hash.hpp>

namespace drop_miner
{

    // "<user>#<campaign>#<drop>", used when no drop instance id is known.
    [[nodiscard]] std::string derive_claim_token(std::string_view user_id,
                                                 std::string_view campaign_id,
                                                 std::string_view drop_id);

    class ClaimService
    {
    public:
        ClaimService(CatalogClient& client,
                     CredentialProvider& creds,
                     SharedState& shared,
                     StatusSink& sink,
                     const MiningSettings& settings) noexcept :
            client_(client),
            creds_(creds),
            shared_(shared),
            sink_(sink),
            settings_(settings)
        {
        }

        // Handle a drop whose progress satisfies its requirement.
        // Returns true when the drop is now known to be claimed. Throws AuthError.
        [[nodiscard]] auto handle_ready(const SessionHandle& handle,
                                        const Campaign& campaign,
                                        const Drop& drop,
                                        const DropProgress& progress) -> boost::asio::awaitable<bool>;

        // Forget announcements and attempts (new session).
        void reset();

    private:
        CatalogClient& client_;
        CredentialProvider& creds_;
        SharedState& shared_;
        StatusSink& sink_;
        const MiningSettings& settings_;

        std::mutex mutex_; // protects announced_ and attempted_
        dm::StringSet announced_;
        dm::StringSet attempted_;
    };

} // namespace drop_miner
