#include "Display.hpp"
#include "FakeDevices.hpp"
#include "Framebuffer.hpp"
#include "TouchInput.hpp"

#include <cstdint>
#include <cstdio>
#include <fcntl.h>
#include <fstream>
#include <linux/input.h>
#include <sys/stat.h>
#include <unistd.h>
#include <vector>

using namespace companion;
using namespace companion::testing;

namespace {

input_event make_event(uint16_t type, uint16_t code, int32_t value, long sec, long usec) {
    input_event ev{};
    ev.input_event_sec = sec;
    ev.input_event_usec = usec;
    ev.type = type;
    ev.code = code;
    ev.value = value;
    return ev;
}

/** A finger down at (x, y) for 0.25 s, as a touch controller reports it */
std::vector<input_event> tap(int x, int y) {
    return {
        make_event(EV_ABS, ABS_X, x, 100, 0),
        make_event(EV_ABS, ABS_Y, y, 100, 0),
        make_event(EV_KEY, BTN_TOUCH, 1, 100, 0),
        make_event(EV_SYN, SYN_REPORT, 0, 100, 0),
        make_event(EV_KEY, BTN_TOUCH, 0, 100, 250000),
        make_event(EV_SYN, SYN_REPORT, 0, 100, 250000),
    };
}

bool write_events(const std::string& fifo, const std::vector<input_event>& events) {
    int fd = open(fifo.c_str(), O_WRONLY | O_NONBLOCK);
    if (fd == -1) return false;
    const size_t bytes = events.size() * sizeof(input_event);
    ssize_t written = write(fd, events.data(), bytes);
    close(fd);
    return written == static_cast<ssize_t>(bytes);
}

void create_blank_file(const std::string& path, size_t bytes) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    std::vector<char> zeros(bytes, 0);
    out.write(zeros.data(), static_cast<std::streamsize>(zeros.size()));
}

uint16_t first_pixel(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    unsigned char bytes[2] = {0, 0};
    in.read(reinterpret_cast<char*>(bytes), 2);
    return static_cast<uint16_t>(bytes[0] | (bytes[1] << 8));
}

} // namespace

int main() {
    std::cout << "=== Display Test ===" << std::endl;
    const std::string suffix = std::to_string(getpid());

    // Test 1: Press and release become a timed touch
    {
        EvdevTouchReader reader;
        std::vector<TouchEvent> touches;
        for (const auto& ev : tap(120, 80)) {
            const double t = ev.input_event_sec + ev.input_event_usec / 1e6;
            if (auto touch = reader.process(ev.type, ev.code, ev.value, t)) {
                touches.push_back(*touch);
            }
        }
        assert_true(touches.size() == 2, "press and release reported");
        assert_true(touches[0].kind == TouchEvent::Kind::TOUCH_START, "press is TOUCH_START");
        assert_true(touches[1].kind == TouchEvent::Kind::TOUCH_END, "release is TOUCH_END");
        assert_true(touches[1].x == 120 && touches[1].y == 80, "position from absolute axes");
        assert_true(touches[1].duration > 0.24 && touches[1].duration < 0.26, "duration from event times");

        auto stray = reader.process(EV_KEY, BTN_TOUCH, 0, 200.0);
        assert_true(stray && stray->duration == 0.0, "release without press has no duration");
        assert_true(!reader.process(EV_KEY, BTN_TOUCH, 2, 200.0), "autorepeat ignored");
        assert_true(!reader.process(EV_KEY, KEY_A, 1, 200.0), "other keys ignored");
    }

    // Test 2: Events arrive through the device node
    {
        const std::string fifo = "/tmp/companion_test_touch_" + suffix;
        unlink(fifo.c_str());
        assert_true(mkfifo(fifo.c_str(), 0600) == 0, "stand-in touch node created");

        EvdevTouchReader reader;
        assert_true(reader.open(fifo), "touch node opened");
        assert_true(reader.read_pending().empty(), "nothing pending before a touch");
        assert_true(write_events(fifo, tap(10, 20)), "touch written");

        auto touches = reader.read_pending();
        assert_true(touches.size() == 2 && touches[1].kind == TouchEvent::Kind::TOUCH_END,
                    "touch read from the node");
        reader.close();
        assert_true(!reader.open("/nonexistent/event9"), "missing node reported");
        unlink(fifo.c_str());
    }

    // Test 3: Framebuffer receives RGB565 pixels
    {
        const std::string fb = "/tmp/companion_test_fb_" + suffix;
        create_blank_file(fb, 32 * 24 * 2);

        FramebufferSink sink;
        assert_true(sink.open(fb, 32, 24), "file-backed framebuffer opened");
        assert_true(sink.bits_per_pixel() == 16, "16 bpp without screen info");

        cv::Mat red(48, 64, CV_8UC3, cv::Scalar(0, 0, 255));
        assert_true(sink.show(red), "frame written");
        sink.close();
        assert_true(first_pixel(fb) == 0xF800, "red packed as RGB565");

        FramebufferSink small;
        assert_true(!small.open(fb, 320, 240), "undersized framebuffer rejected");
        std::remove(fb.c_str());
    }

    // Test 4: Panel display renders to the framebuffer and reads the touchscreen
    {
        const std::string fb = "/tmp/companion_test_panel_fb_" + suffix;
        const std::string fifo = "/tmp/companion_test_panel_touch_" + suffix;
        create_blank_file(fb, 160 * 120 * 2);
        unlink(fifo.c_str());
        mkfifo(fifo.c_str(), 0600);

        DisplaySettings settings;
        settings.width = 160;
        settings.height = 120;
        settings.emotions_dir = "/nonexistent/emotions";
        settings.emotion_change_delay = 0.0;
        settings.framebuffer_device = fb;
        settings.touch_device = fifo;

        OpenCVDisplay display(settings, true);
        assert_true(display.has_framebuffer(), "framebuffer attached without a window");
        assert_true(display.has_touchscreen(), "touchscreen attached without a window");

        display.show_emotion("happy", true);
        assert_true(first_pixel(fb) == 0x07E0, "happy placeholder shown on the panel");

        assert_true(!display.get_touch_event().has_value(), "no touch yet");
        write_events(fifo, tap(50, 60));
        auto start = display.get_touch_event();
        auto end = display.get_touch_event();
        assert_true(start && start->kind == TouchEvent::Kind::TOUCH_START, "headless display reports the press");
        assert_true(end && end->kind == TouchEvent::Kind::TOUCH_END && end->duration > 0.2,
                    "headless display reports the timed release");

        std::remove(fb.c_str());
        unlink(fifo.c_str());
    }

    return report("Display");
}
