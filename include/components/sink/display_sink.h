#pragma once

#include "component.h"
#include "components/sink/frame_annotator.h"
#include <functional>
#include <string>

namespace zwatch {

/**
 * @brief Shows annotated frames in a window (interactive runs)
 *
 * Pressing 'q' or ESC in the window invokes the quit callback.
 */
class DisplaySink : public SinkComponent {
public:
    DisplaySink(const std::string& id, const std::string& cameraId, const std::string& windowName);

    ~DisplaySink() override;

    bool start() override;
    bool stop() override;

    void onEvents(const std::vector<ZoneEvent>&) override {}
    void onFrame(const FrameSnapshot& snapshot) override;

    void setQuitCallback(std::function<void()> callback) { quitCallback_ = std::move(callback); }

private:
    std::string windowName_;
    bool windowOpen_;
    std::function<void()> quitCallback_;
};

} // namespace zwatch
