/*
Module Name:
- errors.hpp

Abstract:
- Exception types raised by the mining engine and by catalog client adapters.
- AuthError is never retried by the engine; TransportError is retried on the
  next scheduled tick; ParseError is logged and treated as an empty result.
*/
#pragma once

// C++ Standard Library
#include <stdexcept>
#include <string>

namespace drop_miner
{

    /// Root of all engine failures.
    class MiningError : public std::runtime_error
    {
    public:
        explicit MiningError(const std::string& msg) :
            std::runtime_error{ msg }
        {
        }
    };

    /// No usable credential. The caller must re-authenticate.
    class AuthError final : public MiningError
    {
    public:
        using MiningError::MiningError;
    };

    /// Network failure, timeout or non-success status.
    class TransportError final : public MiningError
    {
    public:
        using MiningError::MiningError;
    };

    /// Response did not have the expected shape.
    class ParseError final : public MiningError
    {
    public:
        using MiningError::MiningError;
    };

    /// A specific campaign was requested but is not active (or is filtered out).
    class CampaignUnavailable final : public MiningError
    {
    public:
        using MiningError::MiningError;
    };

} // namespace drop_miner
