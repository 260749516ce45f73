#include "components/sink/display_sink.h"
#include "logger.h"
#include <opencv2/highgui.hpp>

namespace zwatch {

DisplaySink::DisplaySink(const std::string& id, const std::string& cameraId, const std::string& windowName)
    : SinkComponent(id, cameraId),
      windowName_(windowName),
      windowOpen_(false) {
}

DisplaySink::~DisplaySink() {
    stop();
}

bool DisplaySink::start() {
    running_ = true;
    return true;
}

bool DisplaySink::stop() {
    running_ = false;
    if (windowOpen_) {
        try {
            cv::destroyWindow(windowName_);
        } catch (const cv::Exception& e) {
            LOG_WARN(logSource("DisplaySink"), std::string("Failed to close window: ") + e.what());
        }
        windowOpen_ = false;
    }
    return true;
}

void DisplaySink::onFrame(const FrameSnapshot& snapshot) {
    if (!running_ || snapshot.frame.image.empty()) {
        return;
    }

    cv::imshow(windowName_, annotateFrame(snapshot));
    windowOpen_ = true;

    const int key = cv::waitKey(1) & 0xFF;
    if ((key == 'q' || key == 27) && quitCallback_) {
        LOG_INFO(logSource("DisplaySink"), "Quit requested from display window");
        quitCallback_();
    }
}

} // namespace zwatch
