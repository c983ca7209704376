#pragma once

#include "AsyncQueue.hpp"
#include "Config.hpp"
#include "RobotTypes.hpp"
#include <map>
#include <memory>
#include <optional>
#include <string>

#include <opencv2/core.hpp>

namespace companion {

class EvdevTouchReader;
class FramebufferSink;

/**
 * @brief Touch / window event reported by the display
 */
struct TouchEvent {
    enum class Kind { TOUCH_START, TOUCH_END, QUIT };

    Kind kind = Kind::TOUCH_START;
    int x = 0;
    int y = 0;
    double duration = 0.0;  // seconds, TOUCH_END only
};

/**
 * @brief Abstract emotion screen with touch input
 */
class Display {
public:
    virtual ~Display() = default;

    /**
     * @brief Request an emotion
     *
     * Changes closer together than the change delay are queued and applied
     * by update(); @p force bypasses both the delay and the same-emotion check.
     */
    virtual void show_emotion(const std::string& emotion, bool force = false) = 0;
    virtual std::string current_emotion() const = 0;

    /** Apply queued emotion changes and pump window events */
    virtual void update(double delta_time) = 0;

    virtual std::optional<TouchEvent> get_touch_event() = 0;
};

/**
 * @brief Emotion images on the robot's screen
 *
 * Images are read from "<emotions_dir>/<emotion>.png" and scaled to the
 * screen size; a coloured placeholder stands in for missing files.
 *
 * Outputs: the Linux framebuffer (framebuffer_device) and, unless headless,
 * an OpenCV highgui window. Touch comes from the evdev touchscreen
 * (touch_device, or the first node with a touchscreen name) and from mouse
 * clicks in the window; both land in the same event queue.
 */
class OpenCVDisplay : public Display {
public:
    OpenCVDisplay(const DisplaySettings& settings, bool headless);
    ~OpenCVDisplay() override;

    void show_emotion(const std::string& emotion, bool force = false) override;
    std::string current_emotion() const override { return current_; }
    void update(double delta_time) override;
    std::optional<TouchEvent> get_touch_event() override;

    bool has_emotion(const std::string& emotion) const { return emotions_.count(emotion) > 0; }
    const std::string& target_emotion() const { return target_; }
    bool has_framebuffer() const;
    bool has_touchscreen() const;

private:
    static void on_mouse(int event, int x, int y, int flags, void* userdata);

    void load_emotions();
    cv::Mat create_placeholder(const std::string& emotion) const;
    void render(const std::string& emotion);
    void open_panel_devices();
    void poll_touchscreen();

    const DisplaySettings& settings_;
    bool window_ = false;
    std::map<std::string, cv::Mat> emotions_;
    std::string current_ = "neutral";
    std::string target_ = "neutral";
    Clock::time_point last_change_{};
    std::optional<Clock::time_point> touch_started_;
    AsyncQueue<TouchEvent> touch_events_;
    std::unique_ptr<FramebufferSink> framebuffer_;
    std::unique_ptr<EvdevTouchReader> touchscreen_;
};

} // namespace companion
