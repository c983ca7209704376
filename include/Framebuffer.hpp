#pragma once

#include <cstddef>
#include <string>

#include <opencv2/core.hpp>

namespace companion {

/**
 * @brief Linux framebuffer (/dev/fbN) written through a shared mapping
 *
 * Geometry comes from FBIOGET_VSCREENINFO / FBIOGET_FSCREENINFO. When the
 * node does not answer those ioctls (e.g. a plain file standing in for the
 * panel) the fallback size is used at 16 bpp RGB565.
 */
class FramebufferSink {
public:
    FramebufferSink() = default;
    ~FramebufferSink();

    FramebufferSink(const FramebufferSink&) = delete;
    FramebufferSink& operator=(const FramebufferSink&) = delete;

    bool open(const std::string& device, int fallback_width, int fallback_height);
    void close();
    bool is_open() const { return map_ != nullptr; }

    /** Scale a BGR image to the panel and write it out */
    bool show(const cv::Mat& bgr);

    int width() const { return width_; }
    int height() const { return height_; }
    int bits_per_pixel() const { return bits_per_pixel_; }

private:
    int fd_ = -1;
    unsigned char* map_ = nullptr;
    size_t map_size_ = 0;
    int width_ = 0;
    int height_ = 0;
    int bits_per_pixel_ = 16;
    size_t line_length_ = 0;
};

} // namespace companion
