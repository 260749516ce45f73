#include "utils/url_utils.h"
#include <algorithm>
#include <cctype>

namespace zwatch {
namespace utils {

std::string uriScheme(const std::string& uri) {
    const auto pos = uri.find("://");
    if (pos == std::string::npos || pos == 0) {
        return "";
    }
    std::string scheme = uri.substr(0, pos);
    std::transform(scheme.begin(), scheme.end(), scheme.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return scheme;
}

std::string maskCredentials(const std::string& uri) {
    const auto schemeEnd = uri.find("://");
    if (schemeEnd == std::string::npos) {
        return uri;
    }
    const auto authorityStart = schemeEnd + 3;
    const auto authorityEnd = uri.find('/', authorityStart);
    const auto at = uri.rfind('@', authorityEnd == std::string::npos ? uri.size() : authorityEnd);
    if (at == std::string::npos || at < authorityStart) {
        return uri;
    }
    return uri.substr(0, authorityStart) + "***@" + uri.substr(at + 1);
}

std::string withCredentials(const std::string& uri, const std::string& username, const std::string& password) {
    if (username.empty()) {
        return uri;
    }
    const auto schemeEnd = uri.find("://");
    if (schemeEnd == std::string::npos) {
        return uri;
    }
    const auto authorityStart = schemeEnd + 3;
    const auto authorityEnd = uri.find('/', authorityStart);
    const std::string authority = uri.substr(authorityStart,
        authorityEnd == std::string::npos ? std::string::npos : authorityEnd - authorityStart);
    if (authority.find('@') != std::string::npos) {
        return uri;
    }

    std::string userInfo = username;
    if (!password.empty()) {
        userInfo += ":" + password;
    }
    return uri.substr(0, authorityStart) + userInfo + "@" + uri.substr(authorityStart);
}

} // namespace utils
} // namespace zwatch
