#pragma once

#include <cassert>
#include <optional>
#include <ostream>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace pocketbase {

// ---------------------------------------------------------------------------
// Result<T, E>: a discriminated union that holds either a value or an error.
// ---------------------------------------------------------------------------
template <typename T, typename E>
class Result {
public:
    // -- Factories ----------------------------------------------------------

    static Result Ok(const T& value) { return Result(OkTag{}, value); }
    static Result Ok(T&& value) { return Result(OkTag{}, std::move(value)); }

    static Result Err(const E& error) { return Result(ErrTag{}, error); }
    static Result Err(E&& error) { return Result(ErrTag{}, std::move(error)); }

    // -- Query --------------------------------------------------------------

    [[nodiscard]] bool IsOk() const noexcept { return storage_.index() == 0; }
    [[nodiscard]] bool IsErr() const noexcept { return storage_.index() == 1; }
    explicit operator bool() const noexcept { return IsOk(); }

    // -- Access -------------------------------------------------------------

    [[nodiscard]] const T& Value() const& {
        assert(IsOk() && "Value() called on an Err Result");
        return std::get<0>(storage_);
    }

    [[nodiscard]] T& Value() & {
        assert(IsOk() && "Value() called on an Err Result");
        return std::get<0>(storage_);
    }

    [[nodiscard]] T Value() && {
        assert(IsOk() && "Value() called on an Err Result");
        return std::get<0>(std::move(storage_));
    }

    [[nodiscard]] const E& Error() const& {
        assert(IsErr() && "Error() called on an Ok Result");
        return std::get<1>(storage_);
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

    // -- Monadic ------------------------------------------------------------

    // fn: T -> Result<U, E>
    template <typename Fn>
    auto AndThen(Fn&& fn) && -> std::invoke_result_t<Fn, T&&> {
        using ReturnType = std::invoke_result_t<Fn, T&&>;
        if (IsOk()) {
            return std::forward<Fn>(fn)(std::get<0>(std::move(storage_)));
        }
        return ReturnType::Err(std::get<1>(std::move(storage_)));
    }

    // fn: T -> U
    template <typename Fn>
    auto Map(Fn&& fn) && -> Result<std::invoke_result_t<Fn, T&&>, E> {
        using U = std::invoke_result_t<Fn, T&&>;
        if (IsOk()) {
            return Result<U, E>::Ok(std::forward<Fn>(fn)(std::get<0>(std::move(storage_))));
        }
        return Result<U, E>::Err(std::get<1>(std::move(storage_)));
    }

    // fn: E -> E2
    template <typename Fn>
    auto MapError(Fn&& fn) && -> Result<T, std::invoke_result_t<Fn, E&&>> {
        using E2 = std::invoke_result_t<Fn, E&&>;
        if (IsOk()) {
            return Result<T, E2>::Ok(std::get<0>(std::move(storage_)));
        }
        return Result<T, E2>::Err(std::forward<Fn>(fn)(std::get<1>(std::move(storage_))));
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
// ErrorKind: what went wrong, independent of which operation failed.
//
// Every operation family reports a subset of these; see StatusPolicy for
// which HTTP statuses map onto which kind per family.
// ---------------------------------------------------------------------------
enum class ErrorKind {
    BadRequest,
    InvalidCredentials,
    EmptyField,
    IdentityMustBeEmail,
    Unauthorized,
    Forbidden,
    NotFound,
    TooManyRequests,
    Unreachable,
    ParseError,
    Unexpected,
    InvalidArgument,
};

// ---------------------------------------------------------------------------
// FieldError: one entry of the `data` map in a PocketBase error body.
// ---------------------------------------------------------------------------
struct FieldError {
    std::string name;
    std::string code;
    std::string message;

    bool operator==(const FieldError& other) const {
        return name == other.name && code == other.code &&
               message == other.message;
    }
    bool operator!=(const FieldError& other) const { return !(*this == other); }
};

// ---------------------------------------------------------------------------
// Error: structured error type for every client operation.
// ---------------------------------------------------------------------------
struct Error {
    std::string operation;
    std::string endpoint;
    std::optional<int> http_status;
    std::string message;
    ErrorKind kind = ErrorKind::Unexpected;
    std::vector<FieldError> field_errors;

    // Only meaningful for ErrorKind::EmptyField.
    bool empty_identity = false;
    bool empty_password = false;

    /// Build an Error for a non-success HTTP status that has already been
    /// classified. The message is the default text for `kind`, suffixed with
    /// `server_message` when the server supplied one.
    static Error FromStatus(const std::string& operation,
                            const std::string& endpoint,
                            int status_code,
                            ErrorKind kind,
                            const std::string& server_message = "");

    [[nodiscard]] bool Is(ErrorKind k) const noexcept { return kind == k; }

    [[nodiscard]] int ExitCode() const;
    [[nodiscard]] std::string KindName() const;
    [[nodiscard]] std::string ToString() const;
    [[nodiscard]] std::string ToJson() const;

    friend std::ostream& operator<<(std::ostream& os, const Error& e) {
        return os << e.ToString();
    }

    bool operator==(const Error& other) const {
        return operation == other.operation &&
               endpoint == other.endpoint &&
               http_status == other.http_status &&
               message == other.message &&
               kind == other.kind &&
               field_errors == other.field_errors &&
               empty_identity == other.empty_identity &&
               empty_password == other.empty_password;
    }

    bool operator!=(const Error& other) const {
        return !(*this == other);
    }
};

/// Default human-readable description for an error kind.
const char* DefaultMessage(ErrorKind kind);

} // namespace pocketbase
