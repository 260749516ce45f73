#include "components/source/capture_backend.h"
#include "logger.h"

namespace zwatch {

bool OpenCvCaptureBackend::open(const std::string& pipeline, const std::string& uri) {
    release();

    if (!pipeline.empty()) {
        try {
            cap_.open(pipeline, cv::CAP_GSTREAMER);
        } catch (const cv::Exception& e) {
            LOG_DEBUG("OpenCvCaptureBackend", std::string("GStreamer open raised: ") + e.what());
        }
        if (cap_.isOpened()) {
            backendName_ = "gstreamer";
            return true;
        }
        cap_.release();
    }

    try {
        cap_.open(uri, cv::CAP_FFMPEG);
    } catch (const cv::Exception& e) {
        LOG_DEBUG("OpenCvCaptureBackend", std::string("FFmpeg open raised: ") + e.what());
    }
    if (cap_.isOpened()) {
        backendName_ = "ffmpeg";
        return true;
    }

    backendName_ = "none";
    return false;
}

bool OpenCvCaptureBackend::read(cv::Mat& frame) {
    if (!cap_.isOpened()) {
        return false;
    }
    try {
        return cap_.read(frame) && !frame.empty();
    } catch (const cv::Exception& e) {
        LOG_DEBUG("OpenCvCaptureBackend", std::string("Read raised: ") + e.what());
        return false;
    }
}

void OpenCvCaptureBackend::release() {
    if (cap_.isOpened()) {
        cap_.release();
    }
}

bool OpenCvCaptureBackend::isOpened() const {
    return cap_.isOpened();
}

} // namespace zwatch
