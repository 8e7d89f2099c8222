#pragma once

#include <cassert>
#include <optional>
#include <ostream>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

#include <nlohmann/json.hpp>

namespace op_mcp {

// ---------------------------------------------------------------------------
// Result<T, E>: holds either a value or an error, never both.
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
        assert(IsOk() && "Value() on an error result");
        return std::get<0>(storage_);
    }

    [[nodiscard]] const E& Error() const& {
        assert(IsErr() && "Error() on an ok result");
        return std::get<1>(storage_);
    }

    [[nodiscard]] T Value() && {
        assert(IsOk() && "Value() on an error result");
        return std::get<0>(std::move(storage_));
    }

    [[nodiscard]] E Error() && {
        assert(IsErr() && "Error() on an ok result");
        return std::get<1>(std::move(storage_));
    }

    [[nodiscard]] T ValueOr(T fallback) const& {
        return IsOk() ? std::get<0>(storage_) : std::move(fallback);
    }

    // fn: const T& -> Result<U, E>
    template <typename Fn>
    auto AndThen(Fn&& fn) const& -> std::invoke_result_t<Fn, const T&> {
        using Next = std::invoke_result_t<Fn, const T&>;
        if (IsErr()) {
            return Next::Err(std::get<1>(storage_));
        }
        return std::forward<Fn>(fn)(std::get<0>(storage_));
    }

    // fn: const T& -> U
    template <typename Fn>
    auto Map(Fn&& fn) const& -> Result<std::invoke_result_t<Fn, const T&>, E> {
        using U = std::invoke_result_t<Fn, const T&>;
        if (IsErr()) {
            return Result<U, E>::Err(std::get<1>(storage_));
        }
        return Result<U, E>::Ok(std::forward<Fn>(fn)(std::get<0>(storage_)));
    }

private:
    struct OkTag {};
    struct ErrTag {};

    Result(OkTag, const T& v) : storage_(std::in_place_index<0>, v) {}
    Result(OkTag, T&& v) : storage_(std::in_place_index<0>, std::move(v)) {}
    Result(ErrTag, const E& e) : storage_(std::in_place_index<1>, e) {}
    Result(ErrTag, E&& e) : storage_(std::in_place_index<1>, std::move(e)) {}

    std::variant<T, E> storage_;
};

// Result<void, E>: success carries no value.
template <typename E>
class Result<void, E> {
public:
    static Result Ok() { return Result(); }
    static Result Err(const E& error) { return Result(error); }
    static Result Err(E&& error) { return Result(std::move(error)); }

    [[nodiscard]] bool IsOk() const noexcept { return !error_.has_value(); }
    [[nodiscard]] bool IsErr() const noexcept { return error_.has_value(); }
    explicit operator bool() const noexcept { return IsOk(); }

    [[nodiscard]] const E& Error() const& {
        assert(IsErr() && "Error() on an ok result");
        return *error_;
    }

private:
    Result() = default;
    explicit Result(const E& e) : error_(e) {}
    explicit Result(E&& e) : error_(std::move(e)) {}

    std::optional<E> error_;
};

// ---------------------------------------------------------------------------
// ErrorCategory: closed taxonomy of every failure the server can report.
// ---------------------------------------------------------------------------
enum class ErrorCategory {
    ParseError,
    InvalidRequest,
    MethodNotFound,
    InvalidParams,
    Validation,
    ToolNotFound,
    NotInitialized,
    ServerClosed,
    Unauthorized,
    UpstreamTransient,
    UpstreamAuth,
    UpstreamNotFound,
    UpstreamProtocol,
    Timeout,
    ClientClosed,
    Config,
    Internal,
};

// ---------------------------------------------------------------------------
// Error: structured error carried through Result<T, Error>.
// ---------------------------------------------------------------------------
struct Error {
    std::string operation;
    std::string endpoint;
    std::optional<int> http_status;
    std::string message;
    std::optional<std::string> backend_message;
    ErrorCategory category = ErrorCategory::Internal;

    /// Classify a non-2xx backend response. The backend's own error text
    /// (`{"_type":"Error","message":...}`) is kept in backend_message.
    static Error FromHttpStatus(const std::string& operation,
                                const std::string& endpoint,
                                int status_code,
                                const std::string& response_body = "");

    static Error Make(ErrorCategory category, std::string operation,
                      std::string message);

    /// Only transient backend failures are retried.
    [[nodiscard]] bool IsRetryable() const noexcept {
        return category == ErrorCategory::UpstreamTransient;
    }

    /// JSON-RPC error code for this category.
    [[nodiscard]] int JsonRpcCode() const noexcept;

    [[nodiscard]] std::string CategoryName() const;
    [[nodiscard]] std::string ToString() const;

    /// {"category":..,"operation":..,"message":..} plus optional fields.
    [[nodiscard]] nlohmann::json ToJson() const;

    friend std::ostream& operator<<(std::ostream& os, const Error& e) {
        return os << e.ToString();
    }

    bool operator==(const Error& other) const {
        return operation == other.operation && endpoint == other.endpoint &&
               http_status == other.http_status && message == other.message &&
               backend_message == other.backend_message &&
               category == other.category;
    }
    bool operator!=(const Error& other) const { return !(*this == other); }
};

std::string CategoryName(ErrorCategory category);

} // namespace op_mcp
