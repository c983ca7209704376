#include "Framebuffer.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <iostream>
#include <linux/fb.h>
#include <sys/ioctl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>

#include <opencv2/imgproc.hpp>

namespace companion {

FramebufferSink::~FramebufferSink() {
    close();
}

bool FramebufferSink::open(const std::string& device, int fallback_width, int fallback_height) {
    close();

    fd_ = ::open(device.c_str(), O_RDWR);
    if (fd_ == -1) {
        std::cerr << "⚠ Framebuffer " << device << " unavailable: " << strerror(errno) << std::endl;
        return false;
    }

    fb_var_screeninfo var{};
    fb_fix_screeninfo fix{};
    if (ioctl(fd_, FBIOGET_VSCREENINFO, &var) == 0 && ioctl(fd_, FBIOGET_FSCREENINFO, &fix) == 0) {
        width_ = static_cast<int>(var.xres);
        height_ = static_cast<int>(var.yres);
        bits_per_pixel_ = static_cast<int>(var.bits_per_pixel);
        line_length_ = fix.line_length;
    } else {
        width_ = fallback_width;
        height_ = fallback_height;
        bits_per_pixel_ = 16;
        line_length_ = static_cast<size_t>(fallback_width) * 2;
    }

    if (bits_per_pixel_ != 16 && bits_per_pixel_ != 24 && bits_per_pixel_ != 32) {
        std::cerr << "❌ Unsupported framebuffer depth: " << bits_per_pixel_ << " bpp" << std::endl;
        close();
        return false;
    }

    map_size_ = line_length_ * static_cast<size_t>(height_);
    struct stat st{};
    if (fstat(fd_, &st) == 0 && S_ISREG(st.st_mode) && static_cast<size_t>(st.st_size) < map_size_) {
        std::cerr << "❌ Framebuffer file " << device << " is smaller than " << map_size_ << " bytes" << std::endl;
        close();
        return false;
    }

    void* map = mmap(nullptr, map_size_, PROT_READ | PROT_WRITE, MAP_SHARED, fd_, 0);
    if (map == MAP_FAILED) {
        std::cerr << "❌ Framebuffer mmap failed: " << strerror(errno) << std::endl;
        close();
        return false;
    }
    map_ = static_cast<unsigned char*>(map);

    std::cout << "✓ Framebuffer: " << device << " (" << width_ << "x" << height_ << ", "
              << bits_per_pixel_ << " bpp)" << std::endl;
    return true;
}

void FramebufferSink::close() {
    if (map_) {
        munmap(map_, map_size_);
        map_ = nullptr;
    }
    if (fd_ != -1) {
        ::close(fd_);
        fd_ = -1;
    }
    map_size_ = 0;
}

bool FramebufferSink::show(const cv::Mat& bgr) {
    if (!map_ || bgr.empty()) return false;

    try {
        cv::Mat scaled;
        if (bgr.cols != width_ || bgr.rows != height_) {
            cv::resize(bgr, scaled, cv::Size(width_, height_));
        } else {
            scaled = bgr;
        }

        cv::Mat pixels;
        switch (bits_per_pixel_) {
            case 16: cv::cvtColor(scaled, pixels, cv::COLOR_BGR2BGR565); break;
            case 32: cv::cvtColor(scaled, pixels, cv::COLOR_BGR2BGRA); break;
            default: pixels = scaled; break;
        }

        const size_t row_bytes = static_cast<size_t>(pixels.cols) * pixels.elemSize();
        for (int y = 0; y < pixels.rows; ++y) {
            std::memcpy(map_ + static_cast<size_t>(y) * line_length_, pixels.ptr(y), row_bytes);
        }
        return true;
    } catch (const cv::Exception& e) {
        std::cerr << "❌ Framebuffer update failed: " << e.what() << std::endl;
        return false;
    }
}

} // namespace companion
