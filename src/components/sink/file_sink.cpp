#include "components/sink/file_sink.h"
#include "logger.h"
#include <opencv2/imgproc.hpp>
#include <filesystem>

namespace zwatch {

FileSink::FileSink(const std::string& id, const std::string& cameraId, const std::string& filePath,
                   double fps, const std::string& fourcc)
    : SinkComponent(id, cameraId),
      filePath_(filePath),
      fps_(fps),
      fourcc_(fourcc),
      frameCount_(0) {
}

FileSink::~FileSink() {
    stop();
}

bool FileSink::initialize() {
    if (filePath_.empty()) {
        lastError_ = "No output path configured";
        return false;
    }
    if (fourcc_.size() != 4) {
        lastError_ = "FourCC must have 4 characters: " + fourcc_;
        LOG_ERROR(logSource("FileSink"), lastError_);
        return false;
    }

    std::filesystem::path path(filePath_);
    if (!path.parent_path().empty()) {
        std::error_code ec;
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            lastError_ = "Cannot create directory for " + filePath_ + ": " + ec.message();
            LOG_ERROR(logSource("FileSink"), lastError_);
            return false;
        }
    }
    return true;
}

bool FileSink::start() {
    running_ = true;
    return true;
}

bool FileSink::stop() {
    running_ = false;
    std::lock_guard<std::mutex> lock(videoWriterMutex_);
    if (videoWriter_.isOpened()) {
        videoWriter_.release();
        LOG_INFO(logSource("FileSink"), "Closed " + filePath_ + " after " + std::to_string(frameCount_) + " frames");
    }
    return true;
}

bool FileSink::openWriter(const cv::Size& size) {
    const int fourcc = cv::VideoWriter::fourcc(fourcc_[0], fourcc_[1], fourcc_[2], fourcc_[3]);
    videoWriter_.open(filePath_, fourcc, fps_, size);
    if (!videoWriter_.isOpened()) {
        lastError_ = "Failed to open video writer for " + filePath_;
        LOG_ERROR(logSource("FileSink"), lastError_);
        return false;
    }
    frameSize_ = size;
    LOG_INFO(logSource("FileSink"), "Recording annotated video to " + filePath_ + " (" +
             std::to_string(size.width) + "x" + std::to_string(size.height) + ")");
    return true;
}

void FileSink::onFrame(const FrameSnapshot& snapshot) {
    if (!running_ || snapshot.frame.image.empty()) {
        return;
    }

    cv::Mat outputFrame = annotateFrame(snapshot);

    std::lock_guard<std::mutex> lock(videoWriterMutex_);
    if (!videoWriter_.isOpened()) {
        if (!lastError_.empty() || !openWriter(outputFrame.size())) {
            return;
        }
    }
    if (outputFrame.size() != frameSize_) {
        cv::Mat resized;
        cv::resize(outputFrame, resized, frameSize_);
        outputFrame = resized;
    }
    videoWriter_.write(outputFrame);
    frameCount_++;
}

nlohmann::json FileSink::getStatus() const {
    auto status = Component::getStatus();
    status["type"] = "file";
    status["file"] = filePath_;
    status["fourcc"] = fourcc_;
    status["fps"] = fps_;
    std::lock_guard<std::mutex> lock(videoWriterMutex_);
    status["frames_written"] = frameCount_;
    return status;
}

} // namespace zwatch
