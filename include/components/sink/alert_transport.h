#pragma once

#include "pipeline_config.h"
#include <curl/curl.h>
#include <mutex>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace zwatch {

/**
 * @brief One zone-entry alert waiting for delivery
 */
struct AlertRequest {
    std::string cameraId;
    std::string zoneId;
    int trackId = 0;
    int64_t timestampMs = 0;
    nlohmann::json payload;           ///< Event as written to the event log
};

/**
 * @brief Delivers alerts to an external receiver
 *
 * Called from the alert worker thread only.
 */
class AlertTransport {
public:
    virtual ~AlertTransport() = default;

    /**
     * @brief Deliver one alert
     *
     * @return true if the receiver accepted it
     */
    virtual bool send(const AlertRequest& request) = 0;

    virtual std::string name() const = 0;

    virtual std::string getLastError() const { return ""; }
};

/**
 * @brief libcurl transport for AlertConfig endpoints
 *
 * With a login URL the transport first POSTs {"username", "password"} and
 * reads "token" from the JSON reply. The token is cached until the receiver
 * answers 401. Without one, apiKey (if set) is sent as the bearer token.
 */
class HttpAlertTransport : public AlertTransport {
public:
    explicit HttpAlertTransport(const AlertConfig& config);
    ~HttpAlertTransport() override;

    bool send(const AlertRequest& request) override;

    std::string name() const override { return "http"; }

    std::string getLastError() const override;

private:
    static void ensureCurlInit();
    static size_t writeCallback(void* contents, size_t size, size_t nmemb, void* userp);

    CURL* createCurlHandle();

    /**
     * @brief Perform one request, retrying transport errors
     *
     * @param[out] httpCode Response status, 0 if no response arrived
     * @return std::optional<std::string> Response body, nullopt on transport failure
     */
    std::optional<std::string> perform(const std::string& method, const std::string& url,
                                       const std::string& body, const std::string& token,
                                       long& httpCode);

    std::optional<std::string> fetchToken();

    void setLastError(const std::string& error);

    AlertConfig config_;
    std::string token_;
    mutable std::mutex errorMutex_;
    std::string lastError_;
};

} // namespace zwatch
