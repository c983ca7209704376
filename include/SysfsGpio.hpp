#pragma once

#include <string>

namespace companion {

/**
 * @brief One GPIO line driven through /sys/class/gpio
 *
 * The value file stays open for the lifetime of the object so that
 * toggling a pin is a single pwrite().
 */
class SysfsGpio {
public:
    enum class Mode { OUTPUT, INPUT };

    SysfsGpio(int pin, Mode mode);
    ~SysfsGpio();

    SysfsGpio(const SysfsGpio&) = delete;
    SysfsGpio& operator=(const SysfsGpio&) = delete;

    bool is_open() const { return fd_ != -1; }
    int pin() const { return pin_; }

    bool write(bool high);
    /** @return 1 / 0, or -1 on read error */
    int read();

private:
    int pin_;
    int fd_ = -1;
};

/**
 * @brief One PWM channel driven through /sys/class/pwm/pwmchipN
 */
class SysfsPwm {
public:
    SysfsPwm(int chip, int channel, int frequency_hz);
    ~SysfsPwm();

    SysfsPwm(const SysfsPwm&) = delete;
    SysfsPwm& operator=(const SysfsPwm&) = delete;

    bool is_open() const { return duty_fd_ != -1; }

    /** @param percent 0-100, clamped */
    bool set_duty_cycle(int percent);

private:
    std::string base_;
    long period_ns_ = 0;
    int duty_fd_ = -1;
};

} // namespace companion
