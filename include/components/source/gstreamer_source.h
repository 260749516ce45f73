#pragma once

#include "component.h"
#include "components/source/capture_backend.h"
#include "pipeline_config.h"
#include "pipeline_types.h"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace zwatch {

enum class SourceProtocol {
    RTSP,
    HTTP,
    V4L2,
    FILE
};

enum class ConnectionState {
    DISCONNECTED,
    CONNECTING,
    STREAMING,
    RECONNECTING,
    FAILED,
    CLOSED
};

std::string connectionStateToString(ConnectionState state);

/**
 * @brief Video stream source with reconnection
 *
 * Frames are pulled by the camera loop through nextFrame(). Failed reads are
 * transient: they advance the frame counter and, after a configured number of
 * consecutive failures, the backend is torn down and reopened with bounded
 * exponential backoff. Backoff waits are interrupted by requestStop().
 */
class GStreamerSource : public SourceComponent {
public:
    /**
     * @brief Construct a new GStreamer Source
     *
     * @param id Component ID
     * @param cameraId Owning camera
     * @param config Source configuration
     * @param backend Decoder backend, OpenCvCaptureBackend when null
     */
    GStreamerSource(const std::string& id, const std::string& cameraId,
                    const SourceConfig& config,
                    std::unique_ptr<CaptureBackend> backend = nullptr);

    ~GStreamerSource() override;

    /**
     * @brief Validate the URI and make the first connection attempt
     *
     * A failed first attempt is not an error here; nextFrame() retries it.
     *
     * @throws StreamError (fatal) if the URI is empty or has an unsupported scheme
     */
    void open();

    /**
     * @brief Block until the next frame is available
     *
     * @return std::optional<Frame> The frame, nullopt when a stop was requested
     *         or a non-looping file reached its end
     * @throws StreamError (fatal) when reconnection retries are exhausted
     */
    std::optional<Frame> nextFrame();

    /**
     * @brief Ask a blocked nextFrame() to return; safe from any thread
     */
    void requestStop();

    bool stopRequested() const { return stopRequested_; }

    /**
     * @brief Clear a previous stop request so a closed source can be reopened
     *
     * Must not be called while another thread is inside nextFrame().
     */
    void resetStop();

    /**
     * @brief Release the backend; called from the thread that reads frames
     */
    void close();

    bool initialize() override;
    bool start() override;
    bool stop() override;

    nlohmann::json getStatus() const override;

    ConnectionState getState() const;

    /**
     * @brief URI with credentials masked, for logs and status
     */
    std::string getDisplayUri() const;

    SourceProtocol getProtocol() const { return protocol_; }

    /**
     * @brief GStreamer pipeline description for the configured source
     */
    std::string buildPipeline() const;

    static SourceProtocol parseSourceProtocol(const std::string& uri);

private:
    bool connect();

    /**
     * @return true when reconnected, false when a stop was requested
     * @throws StreamError (fatal) when retries are exhausted
     */
    bool reconnectWithBackoff();

    /**
     * @return true if a stop was requested during the wait
     */
    bool waitForStop(std::chrono::milliseconds delay);

    void setState(ConnectionState state);
    void setLastError(const std::string& error);
    Frame makeFrame(cv::Mat image);

    SourceConfig config_;
    std::string uri_;                  ///< URI with credentials injected
    std::string displayUri_;           ///< URI with credentials masked
    SourceProtocol protocol_;
    std::string pipeline_;
    std::unique_ptr<CaptureBackend> backend_;

    std::atomic<bool> stopRequested_;
    std::mutex stopMutex_;
    std::condition_variable stopCV_;

    // Loop-thread state
    uint64_t sequence_;
    uint64_t pendingDropped_;
    int consecutiveFailures_;
    int attempt_;
    uint64_t framesSinceConnect_;      ///< Frames read since the last successful connect
    bool opened_;

    // Statistics, guarded by statusMutex_
    mutable std::mutex statusMutex_;
    ConnectionState state_;
    uint64_t framesDelivered_;
    uint64_t framesDropped_;
    uint64_t reconnectCount_;
    double avgFps_;
    std::chrono::steady_clock::time_point fpsWindowStart_;
    int fpsWindowFrames_;
};

} // namespace zwatch
