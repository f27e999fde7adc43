#pragma once

#include <cassert>
#include <optional>
#include <ostream>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace toolbridge {

// ---------------------------------------------------------------------------
// Result<T, E>: a discriminated union that holds either a value or an error.
// ---------------------------------------------------------------------------
template <typename T, typename E>
class Result {
public:
    static Result Ok(const T& value) { return Result(OkTag{}, value); }
    static Result Ok(T&& value) { return Result(OkTag{}, std::move(value)); }

    static Result Err(const E& error) { return Result(ErrTag{}, error); }
    static Result Err(E&& error) { return Result(ErrTag{}, std::move(error)); }

    [[nodiscard]] bool IsOk() const noexcept { return storage_.index() == 0; }
    [[nodiscard]] bool IsErr() const noexcept { return storage_.index() == 1; }
    explicit operator bool() const noexcept { return IsOk(); }

    [[nodiscard]] const T& Value() const& {
        assert(IsOk() && "Value() called on an Err Result");
        return std::get<0>(storage_);
    }

    [[nodiscard]] const E& Error() const& {
        assert(IsErr() && "Error() called on an Ok Result");
        return std::get<1>(storage_);
    }

    [[nodiscard]] T Value() && {
        assert(IsOk() && "Value() called on an Err Result");
        return std::get<0>(std::move(storage_));
    }

    [[nodiscard]] E Error() && {
        assert(IsErr() && "Error() called on an Ok Result");
        return std::get<1>(std::move(storage_));
    }

    [[nodiscard]] T ValueOr(T default_value) const& {
        if (IsOk()) {
            return std::get<0>(storage_);
        }
        return default_value;
    }

    // fn: T -> Result<U, E>
    template <typename Fn>
    auto AndThen(Fn&& fn) && -> std::invoke_result_t<Fn, T&&> {
        using ReturnType = std::invoke_result_t<Fn, T&&>;
        if (IsOk()) {
            return std::forward<Fn>(fn)(std::get<0>(std::move(storage_)));
        }
        return ReturnType::Err(std::get<1>(std::move(storage_)));
    }

private:
    struct OkTag {};
    struct ErrTag {};

    Result(OkTag, const T& value) : storage_(std::in_place_index<0>, value) {}
    Result(OkTag, T&& value) : storage_(std::in_place_index<0>, std::move(value)) {}
    Result(ErrTag, const E& error) : storage_(std::in_place_index<1>, error) {}
    Result(ErrTag, E&& error) : storage_(std::in_place_index<1>, std::move(error)) {}

    std::variant<T, E> storage_;
};

// ---------------------------------------------------------------------------
// Result<void, E>: specialization for operations that succeed with no value.
// ---------------------------------------------------------------------------
template <typename E>
class Result<void, E> {
public:
    static Result Ok() { return Result(OkTag{}); }

    static Result Err(const E& error) { return Result(ErrTag{}, error); }
    static Result Err(E&& error) { return Result(ErrTag{}, std::move(error)); }

    [[nodiscard]] bool IsOk() const noexcept { return !error_.has_value(); }
    [[nodiscard]] bool IsErr() const noexcept { return error_.has_value(); }
    explicit operator bool() const noexcept { return IsOk(); }

    [[nodiscard]] const E& Error() const& {
        assert(IsErr() && "Error() called on an Ok Result");
        return *error_;
    }

    [[nodiscard]] E Error() && {
        assert(IsErr() && "Error() called on an Ok Result");
        return std::move(*error_);
    }

private:
    struct OkTag {};
    struct ErrTag {};

    explicit Result(OkTag) : error_(std::nullopt) {}
    Result(ErrTag, const E& error) : error_(error) {}
    Result(ErrTag, E&& error) : error_(std::move(error)) {}

    std::optional<E> error_;
};

// ---------------------------------------------------------------------------
// ErrorCode: the stable failure taxonomy shared by every transport.
// ---------------------------------------------------------------------------
enum class ErrorCode {
    MalformedRequest,
    CapabilityNotFound,
    InvalidArguments,
    ExecutionTimeout,
    ExecutionFailed,
    RegistryFault,
    InternalTransportError,
};

/// Integer code carried in the wire envelope ("error.code").
[[nodiscard]] int WireCode(ErrorCode code) noexcept;

/// Inverse of WireCode. Returns nullopt for codes outside the taxonomy.
[[nodiscard]] std::optional<ErrorCode> ErrorCodeFromWire(int wire_code) noexcept;

/// HTTP status the gateway answers with for a failure of this kind.
[[nodiscard]] int HttpStatusFor(ErrorCode code) noexcept;

/// Stable human-readable name, e.g. "CapabilityNotFound".
[[nodiscard]] const char* ErrorCodeName(ErrorCode code) noexcept;

// ---------------------------------------------------------------------------
// Error: structured error returned upward by the registry, the providers
// and the dispatcher. Aggregate errors (shutdown_all) list their parts in
// `causes`.
// ---------------------------------------------------------------------------
struct Error {
    std::string operation;
    std::string message;
    ErrorCode code = ErrorCode::ExecutionFailed;
    std::optional<std::string> detail;
    std::vector<Error> causes;

    /// Build an error that wraps several independent failures.
    static Error Aggregate(const std::string& operation,
                           std::vector<Error> causes,
                           ErrorCode code = ErrorCode::RegistryFault);

    [[nodiscard]] int WireCode() const noexcept {
        return toolbridge::WireCode(code);
    }

    [[nodiscard]] int HttpStatus() const noexcept {
        return HttpStatusFor(code);
    }

    [[nodiscard]] std::string CodeName() const {
        return ErrorCodeName(code);
    }

    /// "operation: message (detail)" followed by one indented line per cause.
    [[nodiscard]] std::string ToString() const;

    friend std::ostream& operator<<(std::ostream& os, const Error& e) {
        return os << e.ToString();
    }

    bool operator==(const Error& other) const {
        return operation == other.operation &&
               message == other.message &&
               code == other.code &&
               detail == other.detail &&
               causes == other.causes;
    }

    bool operator!=(const Error& other) const {
        return !(*this == other);
    }
};

} // namespace toolbridge
