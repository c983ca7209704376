#pragma once

#include "Config.hpp"
#include "SysfsGpio.hpp"
#include <memory>
#include <string>

namespace companion {

/**
 * @brief Abstract two-wheel differential drive
 *
 * A speed of 0 means "use the configured default speed". All calls are
 * non-blocking except brake(), which holds the brake for 100 ms.
 */
class MotorDriver {
public:
    virtual ~MotorDriver() = default;

    virtual void forward(int speed = 0) = 0;
    virtual void backward(int speed = 0) = 0;
    virtual void turn_left(int speed = 0) = 0;
    virtual void turn_right(int speed = 0) = 0;
    virtual void stop() = 0;
    virtual void brake() = 0;

    virtual bool enabled() const = 0;

    /**
     * @brief Nudge the straight-line trim factor of one wheel
     * @param side "left" or "right"
     */
    virtual void adjust_calibration(const std::string& side, double delta) = 0;
    virtual bool save_calibration() = 0;

    virtual void cleanup() = 0;
};

/**
 * @brief L298N H-bridge: direction pins over sysfs GPIO, enable lines over sysfs PWM
 */
class L298NMotorDriver : public MotorDriver {
public:
    explicit L298NMotorDriver(const MotorSettings& settings);
    ~L298NMotorDriver() override;

    void forward(int speed = 0) override;
    void backward(int speed = 0) override;
    void turn_left(int speed = 0) override;
    void turn_right(int speed = 0) override;
    void stop() override;
    void brake() override;

    bool enabled() const override { return enabled_; }

    void adjust_calibration(const std::string& side, double delta) override;
    bool save_calibration() override;
    bool load_calibration();

    void cleanup() override;

    double left_factor() const { return left_factor_; }
    double right_factor() const { return right_factor_; }

private:
    // One wheel: in1/in2 polarity plus duty cycle
    void drive(SysfsGpio& in1, SysfsGpio& in2, SysfsPwm& pwm, bool in1_high, bool in2_high, int duty);
    int resolve(int speed) const { return speed > 0 ? speed : settings_.default_speed; }

    const MotorSettings& settings_;
    std::unique_ptr<SysfsGpio> left_in1_, left_in2_, right_in1_, right_in2_;
    std::unique_ptr<SysfsPwm> left_pwm_, right_pwm_;
    double left_factor_;
    double right_factor_;
    bool enabled_ = false;
};

/**
 * @brief Factory: L298N driver when enabled and the GPIO lines open, else nullptr
 */
std::unique_ptr<MotorDriver> create_motor_driver(const MotorSettings& settings);

} // namespace companion
