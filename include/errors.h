#pragma once

#include <stdexcept>
#include <string>

namespace zwatch {

/**
 * @brief Error raised by a stream source
 *
 * Transient errors are handled inside the source (backoff and reconnect).
 * Fatal errors (invalid URI, exhausted retries) reach the camera loop and stop it.
 */
class StreamError : public std::runtime_error {
public:
    enum class Kind {
        TRANSIENT,
        FATAL
    };

    StreamError(Kind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    Kind kind() const { return kind_; }
    bool isFatal() const { return kind_ == Kind::FATAL; }

    static std::string kindToString(Kind kind) {
        return kind == Kind::FATAL ? "fatal" : "transient";
    }

private:
    Kind kind_;
};

/**
 * @brief Invalid runtime or zone configuration, fatal at startup
 */
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message)
        : std::runtime_error(message) {}
};

} // namespace zwatch
