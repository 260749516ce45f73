#pragma once

#include <opencv2/core.hpp>
#include <opencv2/videoio.hpp>
#include <string>

namespace zwatch {

/**
 * @brief Decoder seam used by GStreamerSource
 *
 * The production backend wraps cv::VideoCapture; tests provide scripted backends.
 */
class CaptureBackend {
public:
    virtual ~CaptureBackend() = default;

    /**
     * @brief Open the stream
     *
     * @param pipeline GStreamer pipeline description for the source
     * @param uri Plain URI or path, used when the pipeline cannot be opened
     * @return true if the stream is open
     */
    virtual bool open(const std::string& pipeline, const std::string& uri) = 0;

    /**
     * @brief Read the next frame, blocking
     *
     * @return true if a non-empty frame was decoded
     */
    virtual bool read(cv::Mat& frame) = 0;

    virtual void release() = 0;

    virtual bool isOpened() const = 0;

    /**
     * @brief Name of the backend that opened the stream, for status output
     */
    virtual std::string backendName() const = 0;
};

/**
 * @brief cv::VideoCapture backend: GStreamer pipeline first, FFmpeg on the URI as fallback
 */
class OpenCvCaptureBackend : public CaptureBackend {
public:
    bool open(const std::string& pipeline, const std::string& uri) override;
    bool read(cv::Mat& frame) override;
    void release() override;
    bool isOpened() const override;
    std::string backendName() const override { return backendName_; }

private:
    cv::VideoCapture cap_;
    std::string backendName_ = "none";
};

} // namespace zwatch
