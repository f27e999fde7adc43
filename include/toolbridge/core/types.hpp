#pragma once

#include <toolbridge/core/result.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace toolbridge {

/// Provider namespace reserved for the dispatcher's built-in methods.
constexpr const char* kReservedNamespace = "rpc";

/// True for [a-z][a-z0-9_]* of at most 64 characters.
bool IsValidIdentifier(std::string_view text);

// ---------------------------------------------------------------------------
// ProviderName: validated capability provider name.
//
// Rules:
//   - Non-empty, max 64 characters
//   - Lowercase ASCII letters, digits and underscores, starting with a letter
//   - Never the reserved "rpc" namespace
// ---------------------------------------------------------------------------
class ProviderName {
public:
    static Result<ProviderName, std::string> Create(std::string_view name);

    [[nodiscard]] const std::string& Value() const noexcept { return value_; }

    bool operator==(const ProviderName& other) const { return value_ == other.value_; }
    bool operator!=(const ProviderName& other) const { return value_ != other.value_; }

private:
    explicit ProviderName(std::string value) : value_(std::move(value)) {}
    std::string value_;
};

// ---------------------------------------------------------------------------
// MethodRef: an envelope method split into provider and operation.
//
//   "home_assistant.get_state" -> {"home_assistant", "get_state"}
//   "system_info"              -> {"system_info", nullopt}  (shorthand)
//
// Splits on the first '.'. Empty segments are rejected.
// ---------------------------------------------------------------------------
struct MethodRef {
    std::string provider;
    std::optional<std::string> operation;

    static Result<MethodRef, std::string> Parse(std::string_view method);

    [[nodiscard]] std::string ToString() const {
        return operation ? provider + "." + *operation : provider;
    }
};

/// "<provider>.<operation>"
inline std::string QualifiedName(std::string_view provider,
                                 std::string_view operation) {
    std::string out(provider);
    out += '.';
    out.append(operation.data(), operation.size());
    return out;
}

} // namespace toolbridge
