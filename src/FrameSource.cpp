#include "FrameSource.hpp"
#include <iostream>

namespace companion {

VideoCaptureSource::VideoCaptureSource(const CameraSettings& settings)
    : settings_(settings), width_(settings.width) {
    std::cout << "Opening camera " << settings_.index << "..." << std::endl;

    if (try_open(cv::CAP_V4L2, true)) {
        std::cout << "✓ Camera opened (V4L2+MJPEG): " << width_ << "x"
                  << static_cast<int>(capture_.get(cv::CAP_PROP_FRAME_HEIGHT)) << std::endl;
        return;
    }
    if (try_open(cv::CAP_ANY, false)) {
        std::cout << "✓ Camera opened (default backend): " << width_ << "x"
                  << static_cast<int>(capture_.get(cv::CAP_PROP_FRAME_HEIGHT)) << std::endl;
        return;
    }
    std::cerr << "❌ Unable to open camera " << settings_.index << std::endl;
}

VideoCaptureSource::~VideoCaptureSource() {
    release();
}

bool VideoCaptureSource::try_open(int api, bool mjpeg) {
    try {
        if (!capture_.open(settings_.index, api)) {
            return false;
        }
        if (mjpeg) {
            capture_.set(cv::CAP_PROP_FOURCC, cv::VideoWriter::fourcc('M', 'J', 'P', 'G'));
        }
        capture_.set(cv::CAP_PROP_FRAME_WIDTH, settings_.width);
        capture_.set(cv::CAP_PROP_FRAME_HEIGHT, settings_.height);
        capture_.set(cv::CAP_PROP_FPS, settings_.fps);
        capture_.set(cv::CAP_PROP_BUFFERSIZE, 1);

        // Read one frame to confirm the device delivers
        cv::Mat first_frame;
        if (capture_.read(first_frame) && !first_frame.empty()) {
            width_ = first_frame.cols;
            return true;
        }
    } catch (const cv::Exception& e) {
        std::cerr << "⚠ Camera backend failed: " << e.what() << std::endl;
    }
    capture_.release();
    return false;
}

bool VideoCaptureSource::read(cv::Mat& frame) {
    if (!capture_.isOpened()) return false;
    return capture_.read(frame) && !frame.empty();
}

void VideoCaptureSource::grab(int count) {
    for (int i = 0; i < count && capture_.isOpened(); ++i) {
        capture_.grab();
    }
}

void VideoCaptureSource::release() {
    if (capture_.isOpened()) {
        capture_.release();
        std::cout << "Camera released" << std::endl;
    }
}

std::unique_ptr<FrameSource> open_camera(const CameraSettings& settings) {
    auto camera = std::make_unique<VideoCaptureSource>(settings);
    if (!camera->is_opened()) {
        return nullptr;
    }
    return camera;
}

} // namespace companion
