/*
Module Name:
- transparent_string_hash.hpp

Abstract:
- Transparent hash and equality for string keyed maps (drop ids, channel ids,
  event topics) so lookups by std::string_view do not allocate.
- Provides StringMap<V> and StringSet aliases used across the engine.
*/
#pragma once

// C++ Standard Library
#include <concepts>
#include <cstddef>
#include <functional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>

namespace dm
{

    struct TransparentStringHash
    {
        using is_transparent = void; // opts in to heterogeneous lookup

        template<std::convertible_to<std::string_view> S>
        std::size_t operator()(const S& s) const noexcept
        {
            return std::hash<std::string_view>{}(std::string_view{ s });
        }
    };

    struct TransparentStringEq
    {
        using is_transparent = void;

        template<std::convertible_to<std::string_view> A, std::convertible_to<std::string_view> B>
        bool operator()(const A& a, const B& b) const noexcept
        {
            return std::string_view{ a } == std::string_view{ b };
        }
    };

    template<class V>
    using StringMap = std::unordered_map<std::string, V, TransparentStringHash, TransparentStringEq>;

    using StringSet = std::unordered_set<std::string, TransparentStringHash, TransparentStringEq>;

} // namespace dm
