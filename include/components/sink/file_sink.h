#pragma once

#include "component.h"
#include "components/sink/frame_annotator.h"
#include <opencv2/videoio.hpp>
#include <string>
#include <mutex>

namespace zwatch {

/**
 * @brief Writes annotated frames to a video file (debug output)
 *
 * The writer is opened on the first frame, using that frame's size.
 */
class FileSink : public SinkComponent {
public:
    /**
     * @brief Construct a new File Sink
     *
     * @param id Component ID
     * @param cameraId Owning camera
     * @param filePath Output video path
     * @param fps Frame rate written into the container
     * @param fourcc FourCC codec code
     */
    FileSink(const std::string& id, const std::string& cameraId, const std::string& filePath,
             double fps = 25.0, const std::string& fourcc = "mp4v");

    ~FileSink() override;

    bool initialize() override;
    bool start() override;
    bool stop() override;

    void onEvents(const std::vector<ZoneEvent>&) override {}
    void onFrame(const FrameSnapshot& snapshot) override;

    nlohmann::json getStatus() const override;

    std::string getFilePath() const { return filePath_; }

private:
    bool openWriter(const cv::Size& size);

    std::string filePath_;                ///< Path to output file
    double fps_;                          ///< Frames per second
    std::string fourcc_;                  ///< FourCC codec code
    cv::Size frameSize_;                  ///< Size the writer was opened with

    mutable std::mutex videoWriterMutex_; ///< Mutex for video writer access
    cv::VideoWriter videoWriter_;         ///< OpenCV video writer
    size_t frameCount_;                   ///< Number of frames written
};

} // namespace zwatch
