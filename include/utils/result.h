#pragma once

#include <optional>
#include <string>
#include <utility>

namespace zwatch {

/**
 * @brief Result type for recoverable per-frame operations
 *
 * Holds either a value or an error message. Used where a failure must be
 * reported to the caller without unwinding the frame loop.
 */
template<typename T>
class Result {
private:
    std::optional<T> value_;
    std::string error_;

    explicit Result(T value) : value_(std::move(value)) {}
    explicit Result(std::string error, bool) : error_(std::move(error)) {}

public:
    static Result<T> success(T value) { return Result(std::move(value)); }
    static Result<T> error(const std::string& msg) { return Result(msg, true); }

    bool isSuccess() const { return value_.has_value(); }
    bool isError() const { return !value_.has_value(); }
    const T& getValue() const { return *value_; }
    const std::string& getError() const { return error_; }

    T&& moveValue() { return std::move(*value_); }
};

/**
 * @brief Specialization for void type
 */
template<>
class Result<void> {
private:
    bool success_;
    std::string error_;

    explicit Result(bool success) : success_(success) {}
    explicit Result(std::string error) : success_(false), error_(std::move(error)) {}

public:
    static Result<void> success() { return Result(true); }
    static Result<void> error(const std::string& msg) { return Result(msg); }

    bool isSuccess() const { return success_; }
    bool isError() const { return !success_; }
    const std::string& getError() const { return error_; }
};

} // namespace zwatch
