#pragma once

#include <string>

namespace zwatch {
namespace utils {

/**
 * @brief Get the lowercase scheme of a URI ("rtsp", "http", ...)
 *
 * @param uri Source URI
 * @return std::string Scheme without "://", empty if the URI has none
 */
std::string uriScheme(const std::string& uri);

/**
 * @brief Replace the user-info part of a URI with "***"
 *
 * Used for every log line that mentions a stream URI.
 *
 * @param uri Source URI, possibly carrying user:password@
 * @return std::string URI safe to log
 */
std::string maskCredentials(const std::string& uri);

/**
 * @brief Embed credentials into a network URI
 *
 * The URI is returned unchanged when username is empty, when the URI has no
 * scheme, or when it already carries user-info.
 *
 * @param uri Network URI (rtsp://host/...)
 * @param username User name
 * @param password Password, may be empty
 * @return std::string URI with user[:password]@ inserted after the scheme
 */
std::string withCredentials(const std::string& uri, const std::string& username, const std::string& password);

} // namespace utils
} // namespace zwatch
