/*
Module Name:
- shared_state.hpp

Abstract:
- Mutable state shared by the concurrently running session loops. Each object
  carries its own std::shared_mutex: readers take a shared_lock, writers a
  unique_lock. Compound "read, compute, write" status updates happen under a
  single writer lock through StatusStore::update_if_current().
- SessionHandle is the cancellation token every loop carries. A loop whose
  handle is no longer current exits on its next tick without touching state.
*/
#pragma once

// C++ Standard Library
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

// Boost.Asio
#include <boost/asio/awaitable.hpp>

// GSL
#include <gsl/gsl>

// Project
#include <dm/mining/interfaces.hpp>
#include <dm/mining/model.hpp>
#include <dm/utils/transparent_string_hash.hpp>

namespace drop_miner
{

    struct SessionFlags
    {
        std::atomic<bool> running{ false };
        std::atomic<std::uint64_t> current_id{ 0 };
    };

    class SessionHandle
    {
    public:
        SessionHandle(std::shared_ptr<const SessionFlags> flags, std::uint64_t id) noexcept :
            flags_(std::move(flags)),
            id_(id)
        {
            Expects(flags_ != nullptr);
        }

        // True while the run flag is set and no newer session has started.
        [[nodiscard]] bool is_current() const noexcept
        {
            return flags_->running.load(std::memory_order_acquire) &&
                   flags_->current_id.load(std::memory_order_acquire) == id_;
        }

        [[nodiscard]] std::uint64_t id() const noexcept
        {
            return id_;
        }

    private:
        std::shared_ptr<const SessionFlags> flags_;
        std::uint64_t id_;
    };

    // Per-drop progress keyed by drop id. Merges keep the highest progress
    // seen from either source and never un-claim a drop.
    class ProgressMap
    {
    public:
        // Merge update into the stored record and return the result.
        DropProgress merge(const DropProgress& update);

        // Mark a drop claimed, creating the record when absent.
        void mark_claimed(std::string_view drop_id, std::string_view campaign_id);

        [[nodiscard]] std::optional<DropProgress> get(std::string_view drop_id) const;
        [[nodiscard]] std::vector<DropProgress> snapshot() const;
        [[nodiscard]] std::size_t size() const;

        // Explicit reset is the only way minutes may go down.
        void reset(std::string_view drop_id);
        void clear();

    private:
        mutable std::shared_mutex mutex_;
        dm::StringMap<DropProgress> entries_;
    };

    // Channels found by the last discovery run, best first.
    class ChannelCache
    {
    public:
        void replace(std::vector<MiningChannel> channels)
        {
            std::unique_lock lk(mutex_);
            channels_ = std::move(channels);
        }

        [[nodiscard]] std::vector<MiningChannel> snapshot() const
        {
            std::shared_lock lk(mutex_);
            return channels_;
        }

        void clear()
        {
            std::unique_lock lk(mutex_);
            channels_.clear();
        }

    private:
        mutable std::shared_mutex mutex_;
        std::vector<MiningChannel> channels_;
    };

    class StatusStore
    {
    public:
        [[nodiscard]] MiningStatus snapshot() const
        {
            std::shared_lock lk(mutex_);
            return status_;
        }

        // Apply fn to the status under the writer lock if handle is still current.
        // fn may return bool; false leaves the status untouched.
        // Returns the new snapshot, or nullopt when nothing was written.
        template<class Fn>
        std::optional<MiningStatus> update_if_current(const SessionHandle& handle, Fn&& fn)
        {
            std::unique_lock lk(mutex_);
            if (!handle.is_current())
            {
                return std::nullopt;
            }
            if constexpr (std::is_same_v<std::invoke_result_t<Fn&, MiningStatus&>, bool>)
            {
                MiningStatus draft = status_;
                if (!fn(draft))
                {
                    return std::nullopt;
                }
                status_ = std::move(draft);
            }
            else
            {
                fn(status_);
            }
            status_.last_update = wall_clock::now();
            return status_;
        }

        // Replace with the empty, inactive status and return it.
        MiningStatus reset()
        {
            std::unique_lock lk(mutex_);
            status_ = MiningStatus{};
            status_.last_update = wall_clock::now();
            return status_;
        }

    private:
        mutable std::shared_mutex mutex_;
        MiningStatus status_;
    };

    // Viewer user id, resolved once per session.
    class IdentityCache
    {
    public:
        [[nodiscard]] auto user_id(CatalogClient& client, CredentialProvider& creds)
            -> boost::asio::awaitable<std::string>;

        [[nodiscard]] std::optional<std::string> cached() const;
        void clear();

    private:
        mutable std::mutex mutex_;
        std::optional<std::string> user_id_;
    };

    struct SharedState
    {
        StatusStore status;
        ChannelCache channels;
        ProgressMap progress;
        IdentityCache identity;
    };

} // namespace drop_miner
