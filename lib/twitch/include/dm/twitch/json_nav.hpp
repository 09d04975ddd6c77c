/*
Module Name:
- json_nav.hpp

Abstract:
- Null-safe navigation over Glaze's generic JSON value. Upstream payloads are
  loosely typed (fields go missing, turn null or change type), so readers
  take pointers and fall back to empty values instead of throwing.
- to_json() serialises reflected request structs for the wire.
*/
#pragma once

// C++ Standard Library
#include <initializer_list>
#include <string>
#include <string_view>

// Glaze
#include <glaze/json.hpp>

// Project
#include <dm/mining/errors.hpp>
#include <dm/net/http/http_client.hpp>

namespace drop_miner::twitch::json_nav {

using http_client::json;

// Member of an object, or nullptr when absent or null.
inline const json* member(const json* j, std::string_view key)
{
    if (!j || !j->is_object())
        return nullptr;
    const auto& obj = j->get_object();
    auto it = obj.find(key);
    if (it == obj.end() || it->second.is_null())
        return nullptr;
    return &it->second;
}

inline const json* at_path(const json& root, std::initializer_list<std::string_view> keys)
{
    const json* node = &root;
    for (auto key : keys) {
        node = member(node, key);
        if (!node)
            return nullptr;
    }
    return node;
}

inline std::string string_of(const json* j)
{
    return (j && j->is_string()) ? j->get_string() : std::string{};
}

inline int int_of(const json* j)
{
    return (j && j->is_number()) ? static_cast<int>(j->get_number()) : 0;
}

inline bool bool_of(const json* j)
{
    return j && j->is_boolean() && j->get_boolean();
}

inline const json::array_t* array_of(const json* j)
{
    return (j && j->is_array()) ? &j->get_array() : nullptr;
}

template<class T>
std::string to_json(const T& value)
{
    std::string buffer;
    if (auto ec = glz::write_json(value, buffer); ec) {
        throw ParseError("cannot encode outgoing JSON");
    }
    return buffer;
}

} // namespace drop_miner::twitch::json_nav
