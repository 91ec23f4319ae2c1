#pragma once

#include <system_error>
#include <stdexcept>
#include <string>
#include <utility>

namespace shardex {

// Unified error categories
enum class ErrorCode {
    SUCCESS = 0,

    // Order entry errors
    ORDER_INVALID = 1000,
    ORDER_DUPLICATE,
    ORDER_NOT_FOUND,

    // Pre-trade risk errors
    RISK_LIMIT_EXCEEDED = 2000,
    POSITION_LIMIT_EXCEEDED,

    // Resource errors
    MEMORY_POOL_EXHAUSTED = 3000,
    SHARD_BUSY,

    // Configuration errors
    FILE_NOT_FOUND = 4000,
    CONFIG_INVALID,
    CONFIG_INTEGRITY_FAILED,

    // System errors
    INTERNAL_INVARIANT_VIOLATION = 5000
};

class ErrorCategory : public std::error_category {
public:
    const char* name() const noexcept override { return "shardex"; }
    std::string message(int ev) const override;
};

const ErrorCategory& error_category();
std::error_code make_error_code(ErrorCode ec);

// Result monad for error propagation
template<typename T>
class Result {
public:
    Result(T&& value) : value_(std::move(value)), has_value_(true) {}
    Result(const T& value) : value_(value), has_value_(true) {}
    Result(ErrorCode error) : error_(make_error_code(error)), has_value_(false) {}
    Result(std::error_code error) : error_(error), has_value_(false) {}

    bool has_value() const noexcept { return has_value_; }
    bool has_error() const noexcept { return !has_value_; }
    explicit operator bool() const noexcept { return has_value_; }

    const T& value() const& {
        if (!has_value_) throw std::runtime_error("Accessing value of error result: " + error_.message());
        return value_;
    }

    T&& value() && {
        if (!has_value_) throw std::runtime_error("Accessing value of error result: " + error_.message());
        return std::move(value_);
    }

    const std::error_code& error() const { return error_; }

    bool is(ErrorCode code) const { return has_error() && error_ == make_error_code(code); }

    template<typename F>
    auto map(F&& func) const -> Result<decltype(func(std::declval<const T&>()))> {
        if (has_value_) {
            return Result<decltype(func(value_))>(func(value_));
        }
        return Result<decltype(func(value_))>(error_);
    }

private:
    T value_{};
    std::error_code error_;
    bool has_value_;
};

// Specialization for void
template<>
class Result<void> {
public:
    Result() : has_value_(true) {}
    Result(ErrorCode error) : error_(make_error_code(error)), has_value_(false) {}
    Result(std::error_code error) : error_(error), has_value_(false) {}

    bool has_value() const noexcept { return has_value_; }
    bool has_error() const noexcept { return !has_value_; }
    explicit operator bool() const noexcept { return has_value_; }
    const std::error_code& error() const { return error_; }

    bool is(ErrorCode code) const { return has_error() && error_ == make_error_code(code); }

private:
    std::error_code error_;
    bool has_value_;
};

} // namespace shardex

// Make ErrorCode compatible with std::error_code
namespace std {
template<>
struct is_error_code_enum<shardex::ErrorCode> : true_type {};
}
