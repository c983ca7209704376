#pragma once

#include "Config.hpp"
#include <memory>

#include <opencv2/core.hpp>
#include <opencv2/videoio.hpp>

namespace companion {

/**
 * @brief Abstract camera
 */
class FrameSource {
public:
    virtual ~FrameSource() = default;

    /** @return false when no frame could be read */
    virtual bool read(cv::Mat& frame) = 0;

    /** Drop @p count buffered frames so the next read is fresh */
    virtual void grab(int count) = 0;

    virtual int frame_width() const = 0;
    virtual void release() = 0;
};

/**
 * @brief cv::VideoCapture camera (V4L2 + MJPEG first, default backend as fallback)
 */
class VideoCaptureSource : public FrameSource {
public:
    explicit VideoCaptureSource(const CameraSettings& settings);
    ~VideoCaptureSource() override;

    bool is_opened() const { return capture_.isOpened(); }

    bool read(cv::Mat& frame) override;
    void grab(int count) override;
    int frame_width() const override { return width_; }
    void release() override;

private:
    bool try_open(int api, bool mjpeg);

    const CameraSettings& settings_;
    cv::VideoCapture capture_;
    int width_;
};

/**
 * @brief Open the configured camera
 * @return nullptr if no backend delivers a frame
 */
std::unique_ptr<FrameSource> open_camera(const CameraSettings& settings);

} // namespace companion
