#pragma once

#include "Display.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace companion {

/**
 * @brief Touchscreen read straight from its evdev node (/dev/input/eventN)
 *
 * BTN_TOUCH press and release become TOUCH_START / TOUCH_END; the touch
 * duration comes from the kernel event timestamps. ABS_X / ABS_Y (and
 * their multi-touch variants) only update the last known position.
 */
class EvdevTouchReader {
public:
    EvdevTouchReader() = default;
    ~EvdevTouchReader();

    EvdevTouchReader(const EvdevTouchReader&) = delete;
    EvdevTouchReader& operator=(const EvdevTouchReader&) = delete;

    /** Open @p device non-blocking */
    bool open(const std::string& device);
    void close();
    bool is_open() const { return fd_ != -1; }
    const std::string& device() const { return device_; }

    /** Drain every queued input_event and return the touch events among them */
    std::vector<TouchEvent> read_pending();

    /**
     * @brief Feed one raw input event
     * @param timestamp Event time in seconds
     */
    std::optional<TouchEvent> process(uint16_t type, uint16_t code, int32_t value, double timestamp);

    /**
     * @brief First /dev/input/eventN whose device name contains a touch keyword
     * @return empty string when no touchscreen is found
     */
    static std::string find_touch_device();

private:
    int fd_ = -1;
    std::string device_;
    int x_ = 0;
    int y_ = 0;
    std::optional<double> pressed_at_;
};

} // namespace companion
