#pragma once

#include <json/json.h>

#include <optional>
#include <string>
#include <string_view>

namespace batchwire {
// =============================================================================
// json_utils
// -----------------------------------------------------------------------------
// Thin wrappers over jsoncpp used by the wire codec (metadata headers) and by
// the JSON-backed payload container. Serialization is always compact so the
// output can be carried inside a single header line.
// =============================================================================

auto to_compact_json(const Json::Value& value) -> std::string;

// Returns std::nullopt and fills `errors` (when non-null) if `text` is not a
// single valid JSON document.
auto parse_json(std::string_view text, std::string* errors = nullptr)
    -> std::optional<Json::Value>;

// Structural equality where numbers compare by value: jsoncpp reads back a
// serialized unsigned integer as a signed one, and 2 equals 2.0.
auto json_equivalent(const Json::Value& lhs, const Json::Value& rhs) -> bool;

}  // namespace batchwire
