#include "TouchInput.hpp"

#include <cctype>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <iostream>
#include <linux/input.h>
#include <sys/ioctl.h>
#include <unistd.h>

namespace companion {

namespace {

// Driver names of the small SPI / I2C panels used on the robot
const char* TOUCH_KEYWORDS[] = {"touch", "pitft", "ep0110", "ft5", "stmpe", "ads7846", "ili", "tsc"};
constexpr int MAX_EVENT_NODES = 32;

} // namespace

EvdevTouchReader::~EvdevTouchReader() {
    close();
}

bool EvdevTouchReader::open(const std::string& device) {
    close();
    fd_ = ::open(device.c_str(), O_RDONLY | O_NONBLOCK);
    if (fd_ == -1) {
        std::cerr << "⚠ Touch device " << device << " unavailable: " << strerror(errno) << std::endl;
        return false;
    }
    device_ = device;
    std::cout << "✓ Touch input: " << device << std::endl;
    return true;
}

void EvdevTouchReader::close() {
    if (fd_ != -1) {
        ::close(fd_);
        fd_ = -1;
    }
    pressed_at_.reset();
}

std::vector<TouchEvent> EvdevTouchReader::read_pending() {
    std::vector<TouchEvent> touches;
    if (fd_ == -1) return touches;

    input_event events[64];
    while (true) {
        ssize_t n = ::read(fd_, events, sizeof(events));
        if (n <= 0) {
            if (n == -1 && errno != EAGAIN && errno != EWOULDBLOCK) {
                std::cerr << "❌ Touch read failed: " << strerror(errno) << std::endl;
            }
            break;
        }

        const size_t count = static_cast<size_t>(n) / sizeof(input_event);
        for (size_t i = 0; i < count; ++i) {
            const input_event& ev = events[i];
            const double timestamp = ev.input_event_sec + ev.input_event_usec / 1e6;
            if (auto touch = process(ev.type, ev.code, ev.value, timestamp)) {
                touches.push_back(*touch);
            }
        }
        if (static_cast<size_t>(n) < sizeof(events)) break;
    }
    return touches;
}

std::optional<TouchEvent> EvdevTouchReader::process(uint16_t type, uint16_t code, int32_t value,
                                                    double timestamp) {
    if (type == EV_ABS) {
        if (code == ABS_X || code == ABS_MT_POSITION_X) {
            x_ = value;
        } else if (code == ABS_Y || code == ABS_MT_POSITION_Y) {
            y_ = value;
        }
        return std::nullopt;
    }

    if (type != EV_KEY || code != BTN_TOUCH) {
        return std::nullopt;
    }

    if (value == 1) {
        pressed_at_ = timestamp;
        return TouchEvent{TouchEvent::Kind::TOUCH_START, x_, y_, 0.0};
    }
    if (value == 0) {
        double duration = pressed_at_ ? timestamp - *pressed_at_ : 0.0;
        pressed_at_.reset();
        return TouchEvent{TouchEvent::Kind::TOUCH_END, x_, y_, duration < 0.0 ? 0.0 : duration};
    }
    return std::nullopt;  // autorepeat
}

std::string EvdevTouchReader::find_touch_device() {
    for (int i = 0; i < MAX_EVENT_NODES; ++i) {
        const std::string path = "/dev/input/event" + std::to_string(i);
        int fd = ::open(path.c_str(), O_RDONLY | O_NONBLOCK);
        if (fd == -1) continue;

        char name[256] = {0};
        int ok = ioctl(fd, EVIOCGNAME(sizeof(name) - 1), name);
        ::close(fd);
        if (ok < 0) continue;

        std::string lowered(name);
        for (auto& c : lowered) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        for (const char* keyword : TOUCH_KEYWORDS) {
            if (lowered.find(keyword) != std::string::npos) {
                std::cout << "Touchscreen found: " << name << " (" << path << ")" << std::endl;
                return path;
            }
        }
    }
    return "";
}

} // namespace companion
