#include "Display.hpp"
#include "Framebuffer.hpp"
#include "TouchInput.hpp"
#include "Utils.hpp"
#include <cctype>
#include <iostream>

#include <opencv2/highgui.hpp>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

namespace companion {

namespace {
const char* WINDOW_NAME = "Companion";
const char* EMOTIONS[] = {"neutral", "happy", "scared", "excited", "curious",
                          "sleepy", "love", "cry", "shocked", "sing"};
}

OpenCVDisplay::OpenCVDisplay(const DisplaySettings& settings, bool headless)
    : settings_(settings),
      framebuffer_(std::make_unique<FramebufferSink>()),
      touchscreen_(std::make_unique<EvdevTouchReader>()) {
    load_emotions();
    open_panel_devices();

    if (settings_.show_window && !headless) {
        try {
            cv::namedWindow(WINDOW_NAME, cv::WINDOW_AUTOSIZE);
            cv::setMouseCallback(WINDOW_NAME, &OpenCVDisplay::on_mouse, this);
            window_ = true;
        } catch (const cv::Exception& e) {
            std::cerr << "⚠ Display window unavailable, running headless: " << e.what() << std::endl;
            window_ = false;
        }
    }

    render(current_);
    std::cout << "✓ Display ready (" << settings_.width << "x" << settings_.height
              << (window_ ? ", window" : ", no window")
              << (has_framebuffer() ? ", framebuffer" : "")
              << (has_touchscreen() ? ", touchscreen" : "") << ")" << std::endl;
}

OpenCVDisplay::~OpenCVDisplay() {
    if (window_) {
        cv::destroyWindow(WINDOW_NAME);
    }
}

void OpenCVDisplay::open_panel_devices() {
    if (!settings_.framebuffer_device.empty()) {
        framebuffer_->open(settings_.framebuffer_device, settings_.width, settings_.height);
    }

    std::string touch_device = settings_.touch_device;
    if (touch_device.empty()) {
        touch_device = EvdevTouchReader::find_touch_device();
    }
    if (touch_device.empty()) {
        std::cout << "⚠ No touchscreen found" << std::endl;
    } else {
        touchscreen_->open(touch_device);
    }
}

bool OpenCVDisplay::has_framebuffer() const {
    return framebuffer_->is_open();
}

bool OpenCVDisplay::has_touchscreen() const {
    return touchscreen_->is_open();
}

void OpenCVDisplay::load_emotions() {
    const cv::Size size(settings_.width, settings_.height);
    for (const char* emotion : EMOTIONS) {
        const std::string path = settings_.emotions_dir + "/" + emotion + ".png";
        cv::Mat image;
        if (utils::file_exists(path)) {
            image = cv::imread(path, cv::IMREAD_COLOR);
        }

        if (image.empty()) {
            emotions_[emotion] = create_placeholder(emotion);
        } else {
            cv::resize(image, emotions_[emotion], size);
        }
    }
}

cv::Mat OpenCVDisplay::create_placeholder(const std::string& emotion) const {
    // BGR
    static const std::map<std::string, cv::Scalar> colors = {
        {"neutral", cv::Scalar(255, 0, 0)},
        {"happy", cv::Scalar(0, 255, 0)},
        {"scared", cv::Scalar(0, 0, 255)},
        {"excited", cv::Scalar(0, 255, 255)},
        {"curious", cv::Scalar(255, 255, 255)},
    };
    auto it = colors.find(emotion);
    cv::Scalar color = it != colors.end() ? it->second : cv::Scalar(255, 255, 255);

    cv::Mat surface(settings_.height, settings_.width, CV_8UC3, color);
    std::string label = emotion;
    for (auto& c : label) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));

    int baseline = 0;
    cv::Size text = cv::getTextSize(label, cv::FONT_HERSHEY_SIMPLEX, 1.2, 2, &baseline);
    cv::putText(surface, label,
                cv::Point((settings_.width - text.width) / 2, (settings_.height + text.height) / 2),
                cv::FONT_HERSHEY_SIMPLEX, 1.2, cv::Scalar(0, 0, 0), 2);
    return surface;
}

void OpenCVDisplay::render(const std::string& emotion) {
    auto it = emotions_.find(emotion);
    if (it == emotions_.end()) return;

    if (framebuffer_->is_open()) {
        framebuffer_->show(it->second);
    }
    if (window_) {
        cv::imshow(WINDOW_NAME, it->second);
    }
}

void OpenCVDisplay::show_emotion(const std::string& emotion, bool force) {
    if (!has_emotion(emotion)) {
        std::cerr << "⚠ Unknown emotion: " << emotion << std::endl;
        return;
    }
    if (!force && (emotion == current_ || emotion == target_)) {
        return;
    }

    if (!force && utils::seconds_since(last_change_) < settings_.emotion_change_delay) {
        target_ = emotion;
        return;
    }

    current_ = emotion;
    target_ = emotion;
    last_change_ = Clock::now();
    render(emotion);
}

void OpenCVDisplay::update(double /*delta_time*/) {
    if (target_ != current_ && utils::seconds_since(last_change_) >= settings_.emotion_change_delay) {
        show_emotion(target_, true);
    }

    if (window_) {
        int key = cv::waitKey(1);
        if (key == 'q' || key == 'Q') {
            touch_events_.push(TouchEvent{TouchEvent::Kind::QUIT, 0, 0, 0.0});
        }
    }
}

std::optional<TouchEvent> OpenCVDisplay::get_touch_event() {
    poll_touchscreen();
    return touch_events_.try_pop();
}

void OpenCVDisplay::poll_touchscreen() {
    if (!touchscreen_->is_open()) return;
    for (const auto& event : touchscreen_->read_pending()) {
        touch_events_.push(event);
    }
}

void OpenCVDisplay::on_mouse(int event, int x, int y, int /*flags*/, void* userdata) {
    auto* self = static_cast<OpenCVDisplay*>(userdata);
    if (event == cv::EVENT_LBUTTONDOWN) {
        self->touch_started_ = Clock::now();
        self->touch_events_.push(TouchEvent{TouchEvent::Kind::TOUCH_START, x, y, 0.0});
    } else if (event == cv::EVENT_LBUTTONUP && self->touch_started_) {
        double duration = utils::seconds_since(*self->touch_started_);
        self->touch_started_.reset();
        self->touch_events_.push(TouchEvent{TouchEvent::Kind::TOUCH_END, x, y, duration});
    }
}

} // namespace companion
