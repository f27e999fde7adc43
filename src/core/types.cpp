#include <toolbridge/core/types.hpp>

namespace toolbridge {

namespace {

constexpr size_t kMaxIdentifierLength = 64;

bool IsLower(char c) { return c >= 'a' && c <= 'z'; }
bool IsDigit(char c) { return c >= '0' && c <= '9'; }

} // anonymous namespace

bool IsValidIdentifier(std::string_view text) {
    if (text.empty() || text.size() > kMaxIdentifierLength) {
        return false;
    }
    if (!IsLower(text.front())) {
        return false;
    }
    for (char c : text) {
        if (!IsLower(c) && !IsDigit(c) && c != '_') {
            return false;
        }
    }
    return true;
}

Result<ProviderName, std::string> ProviderName::Create(std::string_view name) {
    using R = Result<ProviderName, std::string>;
    if (name.empty()) {
        return R::Err("provider name must not be empty");
    }
    if (!IsValidIdentifier(name)) {
        return R::Err("invalid provider name '" + std::string(name) +
                      "': expected [a-z][a-z0-9_]*, at most 64 characters");
    }
    if (name == kReservedNamespace) {
        return R::Err("provider name '" + std::string(name) + "' is reserved");
    }
    return R::Ok(ProviderName(std::string(name)));
}

Result<MethodRef, std::string> MethodRef::Parse(std::string_view method) {
    using R = Result<MethodRef, std::string>;
    if (method.empty()) {
        return R::Err("method name must not be empty");
    }

    const auto dot = method.find('.');
    if (dot == std::string_view::npos) {
        return R::Ok(MethodRef{std::string(method), std::nullopt});
    }

    auto provider = method.substr(0, dot);
    auto operation = method.substr(dot + 1);
    if (provider.empty()) {
        return R::Err("method '" + std::string(method) + "' has an empty provider segment");
    }
    if (operation.empty()) {
        return R::Err("method '" + std::string(method) + "' has an empty operation segment");
    }
    return R::Ok(MethodRef{std::string(provider), std::string(operation)});
}

} // namespace toolbridge
