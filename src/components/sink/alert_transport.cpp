#include "components/sink/alert_transport.h"
#include "logger.h"
#include "utils/url_utils.h"
#include <chrono>
#include <thread>

namespace zwatch {

void HttpAlertTransport::ensureCurlInit() {
    static std::once_flag initFlag;
    std::call_once(initFlag, []() { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

HttpAlertTransport::HttpAlertTransport(const AlertConfig& config)
    : config_(config) {
    ensureCurlInit();
}

HttpAlertTransport::~HttpAlertTransport() {
    // curl_global_cleanup() is per process and is left to exit
}

size_t HttpAlertTransport::writeCallback(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t total_size = size * nmemb;
    auto* response = static_cast<std::string*>(userp);
    response->append(static_cast<char*>(contents), total_size);
    return total_size;
}

CURL* HttpAlertTransport::createCurlHandle() {
    CURL* curl = curl_easy_init();
    if (!curl) {
        setLastError("Failed to initialize CURL");
        return nullptr;
    }

    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(config_.timeoutMs));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(config_.timeoutMs));
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 3L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    if (!config_.verifyTls) {
        // Accept self-signed receiver certificates
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 0L);
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 0L);
    }

    return curl;
}

std::optional<std::string> HttpAlertTransport::perform(const std::string& method, const std::string& url,
                                                       const std::string& body, const std::string& token,
                                                       long& httpCode) {
    const std::string displayUrl = utils::maskCredentials(url);

    for (int attempt = 1; attempt <= config_.retryCount; ++attempt) {
        CURL* curl = createCurlHandle();
        if (!curl) {
            return std::nullopt;
        }

        std::string response_data;
        curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
        if (method == "POST") {
            curl_easy_setopt(curl, CURLOPT_POST, 1L);
            curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
        } else {
            curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
        }
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_data);

        struct curl_slist* headers = nullptr;
        headers = curl_slist_append(headers, "Content-Type: application/json");
        if (!token.empty()) {
            std::string auth_header = "Authorization: Bearer " + token;
            headers = curl_slist_append(headers, auth_header.c_str());
        }
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);

        CURLcode res = curl_easy_perform(curl);

        httpCode = 0;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &httpCode);

        curl_slist_free_all(headers);
        curl_easy_cleanup(curl);

        if (res == CURLE_OK) {
            return response_data;
        }

        setLastError(std::string("CURL error: ") + curl_easy_strerror(res));
        LOG_WARN("HttpAlertTransport", method + " " + displayUrl + " attempt " + std::to_string(attempt) +
                 "/" + std::to_string(config_.retryCount) + " failed: " + curl_easy_strerror(res));
        if (attempt < config_.retryCount) {
            std::this_thread::sleep_for(std::chrono::milliseconds(config_.retryDelayMs));
        }
    }
    return std::nullopt;
}

std::optional<std::string> HttpAlertTransport::fetchToken() {
    if (config_.loginUrl.empty()) {
        return config_.apiKey;
    }
    if (!token_.empty()) {
        return token_;
    }

    nlohmann::json credentials;
    credentials["username"] = config_.username;
    credentials["password"] = config_.password;

    LOG_DEBUG("HttpAlertTransport", "POST " + utils::maskCredentials(config_.loginUrl));
    long httpCode = 0;
    auto response = perform("POST", config_.loginUrl, credentials.dump(), "", httpCode);
    if (!response) {
        return std::nullopt;
    }
    if (httpCode != 200) {
        setLastError("Login returned HTTP " + std::to_string(httpCode));
        LOG_ERROR("HttpAlertTransport", "Authentication failed: HTTP " + std::to_string(httpCode));
        return std::nullopt;
    }

    try {
        auto reply = nlohmann::json::parse(*response);
        token_ = reply.value("token", "");
    } catch (const nlohmann::json::exception& e) {
        setLastError(std::string("Invalid login reply: ") + e.what());
        LOG_ERROR("HttpAlertTransport", getLastError());
        return std::nullopt;
    }

    if (token_.empty()) {
        setLastError("Login reply carries no token");
        LOG_ERROR("HttpAlertTransport", "Login reply carries no token");
        return std::nullopt;
    }
    return token_;
}

bool HttpAlertTransport::send(const AlertRequest& request) {
    auto token = fetchToken();
    if (!token) {
        return false;
    }

    const std::string body = config_.method == "POST" ? request.payload.dump() : std::string();
    long httpCode = 0;
    auto response = perform(config_.method, config_.url, body, *token, httpCode);
    if (!response) {
        return false;
    }

    if (httpCode == 401) {
        token_.clear();
    }
    if (httpCode < 200 || httpCode >= 300) {
        setLastError("HTTP error code: " + std::to_string(httpCode));
        LOG_ERROR("HttpAlertTransport", config_.method + " " + utils::maskCredentials(config_.url) +
                  " returned " + std::to_string(httpCode));
        return false;
    }
    return true;
}

void HttpAlertTransport::setLastError(const std::string& error) {
    std::lock_guard<std::mutex> lock(errorMutex_);
    lastError_ = error;
}

std::string HttpAlertTransport::getLastError() const {
    std::lock_guard<std::mutex> lock(errorMutex_);
    return lastError_;
}

} // namespace zwatch
