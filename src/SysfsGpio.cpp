#include "SysfsGpio.hpp"
#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <fcntl.h>
#include <iostream>
#include <thread>
#include <unistd.h>

namespace companion {

namespace {

bool write_file(const std::string& path, const std::string& value) {
    int fd = open(path.c_str(), O_WRONLY);
    if (fd == -1) {
        return false;
    }
    ssize_t written = ::write(fd, value.c_str(), value.size());
    close(fd);
    return written == static_cast<ssize_t>(value.size());
}

bool path_exists(const std::string& path) {
    return access(path.c_str(), F_OK) == 0;
}

} // namespace

// ============================================================================
// GPIO
// ============================================================================

SysfsGpio::SysfsGpio(int pin, Mode mode) : pin_(pin) {
    const std::string dir = "/sys/class/gpio/gpio" + std::to_string(pin);

    if (!path_exists(dir)) {
        if (!write_file("/sys/class/gpio/export", std::to_string(pin))) {
            std::cerr << "❌ GPIO" << pin << " export failed: " << strerror(errno) << std::endl;
            return;
        }
        // udev needs a moment to fix permissions on the new node
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    if (!write_file(dir + "/direction", mode == Mode::OUTPUT ? "low" : "in")) {
        std::cerr << "❌ GPIO" << pin << " direction failed: " << strerror(errno) << std::endl;
        return;
    }

    fd_ = open((dir + "/value").c_str(), mode == Mode::OUTPUT ? O_RDWR : O_RDONLY);
    if (fd_ == -1) {
        std::cerr << "❌ GPIO" << pin << " open failed: " << strerror(errno) << std::endl;
    }
}

SysfsGpio::~SysfsGpio() {
    if (fd_ != -1) {
        close(fd_);
        fd_ = -1;
    }
}

bool SysfsGpio::write(bool high) {
    if (fd_ == -1) return false;
    const char value = high ? '1' : '0';
    return pwrite(fd_, &value, 1, 0) == 1;
}

int SysfsGpio::read() {
    if (fd_ == -1) return -1;
    char value = 0;
    if (pread(fd_, &value, 1, 0) != 1) {
        return -1;
    }
    return value == '1' ? 1 : 0;
}

// ============================================================================
// PWM
// ============================================================================

SysfsPwm::SysfsPwm(int chip, int channel, int frequency_hz) {
    const std::string chip_dir = "/sys/class/pwm/pwmchip" + std::to_string(chip);
    base_ = chip_dir + "/pwm" + std::to_string(channel);
    period_ns_ = 1000000000L / std::max(1, frequency_hz);

    if (!path_exists(base_)) {
        if (!write_file(chip_dir + "/export", std::to_string(channel))) {
            std::cerr << "❌ PWM " << base_ << " export failed: " << strerror(errno) << std::endl;
            return;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    // duty must not exceed period, so reset duty before changing period
    write_file(base_ + "/duty_cycle", "0");
    if (!write_file(base_ + "/period", std::to_string(period_ns_)) ||
        !write_file(base_ + "/enable", "1")) {
        std::cerr << "❌ PWM " << base_ << " setup failed: " << strerror(errno) << std::endl;
        return;
    }

    duty_fd_ = open((base_ + "/duty_cycle").c_str(), O_WRONLY);
    if (duty_fd_ == -1) {
        std::cerr << "❌ PWM " << base_ << " open failed: " << strerror(errno) << std::endl;
    }
}

SysfsPwm::~SysfsPwm() {
    if (duty_fd_ != -1) {
        set_duty_cycle(0);
        close(duty_fd_);
        duty_fd_ = -1;
        write_file(base_ + "/enable", "0");
    }
}

bool SysfsPwm::set_duty_cycle(int percent) {
    if (duty_fd_ == -1) return false;
    percent = std::clamp(percent, 0, 100);
    const std::string value = std::to_string(period_ns_ / 100 * percent);
    return pwrite(duty_fd_, value.c_str(), value.size(), 0) == static_cast<ssize_t>(value.size());
}

} // namespace companion
