#include <toolbridge/protocol/schema_validator.hpp>

#include <cmath>

namespace toolbridge {

namespace {

using VoidResult = Result<void, std::string>;

const char* TypeName(const nlohmann::json& value) {
    switch (value.type()) {
        case nlohmann::json::value_t::object:          return "object";
        case nlohmann::json::value_t::array:           return "array";
        case nlohmann::json::value_t::string:          return "string";
        case nlohmann::json::value_t::boolean:         return "boolean";
        case nlohmann::json::value_t::number_integer:
        case nlohmann::json::value_t::number_unsigned: return "integer";
        case nlohmann::json::value_t::number_float:    return "number";
        case nlohmann::json::value_t::null:            return "null";
        default:                                       return "unknown";
    }
}

bool MatchesType(const nlohmann::json& value, const std::string& type) {
    if (type == "object")  return value.is_object();
    if (type == "array")   return value.is_array();
    if (type == "string")  return value.is_string();
    if (type == "boolean") return value.is_boolean();
    if (type == "null")    return value.is_null();
    if (type == "number")  return value.is_number();
    if (type == "integer") {
        if (value.is_number_integer()) return true;
        if (value.is_number_float()) {
            const double d = value.get<double>();
            return std::isfinite(d) && std::floor(d) == d;
        }
        return false;
    }
    // Unknown type names never match.
    return false;
}

VoidResult Fail(const std::string& path, const std::string& message) {
    return VoidResult::Err(path + ": " + message);
}

VoidResult CheckType(const nlohmann::json& value, const nlohmann::json& type,
                     const std::string& path) {
    if (type.is_string()) {
        if (!MatchesType(value, type.get<std::string>())) {
            return Fail(path, "expected " + type.get<std::string>() + ", got " +
                                  TypeName(value));
        }
        return VoidResult::Ok();
    }
    if (type.is_array()) {
        std::string expected;
        for (const auto& t : type) {
            if (!t.is_string()) continue;
            if (MatchesType(value, t.get<std::string>())) {
                return VoidResult::Ok();
            }
            if (!expected.empty()) expected += " or ";
            expected += t.get<std::string>();
        }
        return Fail(path, "expected " + expected + ", got " + TypeName(value));
    }
    return VoidResult::Ok();
}

VoidResult Validate(const nlohmann::json& value, const nlohmann::json& schema,
                    const std::string& path) {
    if (!schema.is_object()) {
        return VoidResult::Ok();
    }

    if (auto it = schema.find("type"); it != schema.end()) {
        auto r = CheckType(value, *it, path);
        if (r.IsErr()) return r;
    }

    if (auto it = schema.find("enum"); it != schema.end() && it->is_array()) {
        bool found = false;
        for (const auto& candidate : *it) {
            if (candidate == value) {
                found = true;
                break;
            }
        }
        if (!found) {
            return Fail(path, "must be one of " + it->dump());
        }
    }

    if (value.is_number()) {
        const double d = value.get<double>();
        if (auto it = schema.find("minimum"); it != schema.end() && it->is_number() &&
            d < it->get<double>()) {
            return Fail(path, "must be >= " + it->dump());
        }
        if (auto it = schema.find("maximum"); it != schema.end() && it->is_number() &&
            d > it->get<double>()) {
            return Fail(path, "must be <= " + it->dump());
        }
    }

    if (value.is_string()) {
        const auto length = value.get_ref<const std::string&>().size();
        if (auto it = schema.find("minLength"); it != schema.end() &&
            it->is_number_integer() &&
            static_cast<long long>(length) < it->get<long long>()) {
            return Fail(path, "must be at least " + it->dump() + " characters");
        }
        if (auto it = schema.find("maxLength"); it != schema.end() &&
            it->is_number_integer() &&
            static_cast<long long>(length) > it->get<long long>()) {
            return Fail(path, "must be at most " + it->dump() + " characters");
        }
    }

    if (value.is_object()) {
        if (auto it = schema.find("required"); it != schema.end() && it->is_array()) {
            for (const auto& name : *it) {
                if (name.is_string() && !value.contains(name.get<std::string>())) {
                    return Fail(path, "missing required property '" +
                                          name.get<std::string>() + "'");
                }
            }
        }

        const auto properties = schema.find("properties");
        const bool has_properties =
            properties != schema.end() && properties->is_object();
        const auto additional = schema.find("additionalProperties");
        const bool closed = additional != schema.end() &&
                            additional->is_boolean() && !additional->get<bool>();

        for (auto member = value.begin(); member != value.end(); ++member) {
            const std::string child_path = path + "." + member.key();
            if (has_properties) {
                auto prop = properties->find(member.key());
                if (prop != properties->end()) {
                    auto r = Validate(member.value(), *prop, child_path);
                    if (r.IsErr()) return r;
                    continue;
                }
            }
            if (closed) {
                return Fail(child_path, "unexpected property");
            }
            if (additional != schema.end() && additional->is_object()) {
                auto r = Validate(member.value(), *additional, child_path);
                if (r.IsErr()) return r;
            }
        }
    }

    if (value.is_array()) {
        if (auto it = schema.find("items"); it != schema.end() && it->is_object()) {
            for (size_t i = 0; i < value.size(); ++i) {
                auto r = Validate(value[i], *it, path + "[" + std::to_string(i) + "]");
                if (r.IsErr()) return r;
            }
        }
    }

    return VoidResult::Ok();
}

} // anonymous namespace

Result<void, std::string> ValidateAgainstSchema(const nlohmann::json& value,
                                                const nlohmann::json& schema) {
    return Validate(value, schema, "$");
}

} // namespace toolbridge
