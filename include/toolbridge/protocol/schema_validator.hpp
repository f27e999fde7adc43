#pragma once

#include <toolbridge/core/result.hpp>

#include <string>

#include <nlohmann/json.hpp>

namespace toolbridge {

// ---------------------------------------------------------------------------
// Argument validation against a capability's input schema.
//
// Supported JSON Schema keywords:
//   type (string or array of strings), properties, required, enum,
//   items, additionalProperties (boolean or schema), minimum, maximum,
//   minLength, maxLength
//
// Unknown keywords are ignored. The error string names the offending
// location, e.g. "$.headers.Accept: expected string, got number".
// ---------------------------------------------------------------------------
[[nodiscard]] Result<void, std::string> ValidateAgainstSchema(
    const nlohmann::json& value, const nlohmann::json& schema);

} // namespace toolbridge
