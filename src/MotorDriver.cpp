#include "MotorDriver.hpp"
#include "Utils.hpp"
#include <algorithm>
#include <fstream>
#include <iostream>

#include <nlohmann/json.hpp>

namespace companion {

namespace {
constexpr double MIN_TRIM = 0.5;
constexpr double MAX_TRIM = 1.5;
}

L298NMotorDriver::L298NMotorDriver(const MotorSettings& settings)
    : settings_(settings),
      left_factor_(settings.left_speed_factor),
      right_factor_(settings.right_speed_factor) {
    left_in1_ = std::make_unique<SysfsGpio>(settings.left_pin1, SysfsGpio::Mode::OUTPUT);
    left_in2_ = std::make_unique<SysfsGpio>(settings.left_pin2, SysfsGpio::Mode::OUTPUT);
    right_in1_ = std::make_unique<SysfsGpio>(settings.right_pin1, SysfsGpio::Mode::OUTPUT);
    right_in2_ = std::make_unique<SysfsGpio>(settings.right_pin2, SysfsGpio::Mode::OUTPUT);
    left_pwm_ = std::make_unique<SysfsPwm>(settings.pwm_chip, settings.left_pwm_channel, settings.pwm_frequency_hz);
    right_pwm_ = std::make_unique<SysfsPwm>(settings.pwm_chip, settings.right_pwm_channel, settings.pwm_frequency_hz);

    enabled_ = left_in1_->is_open() && left_in2_->is_open() &&
               right_in1_->is_open() && right_in2_->is_open() &&
               left_pwm_->is_open() && right_pwm_->is_open();

    if (!enabled_) {
        std::cerr << "❌ Motor driver GPIO/PWM unavailable - motors disabled" << std::endl;
        return;
    }

    load_calibration();
    stop();
    std::cout << "✓ Motors ready (speed: " << settings_.default_speed << "%, trim L="
              << left_factor_ << " R=" << right_factor_ << ")" << std::endl;
}

L298NMotorDriver::~L298NMotorDriver() {
    cleanup();
}

void L298NMotorDriver::drive(SysfsGpio& in1, SysfsGpio& in2, SysfsPwm& pwm,
                             bool in1_high, bool in2_high, int duty) {
    in1.write(in1_high);
    in2.write(in2_high);
    pwm.set_duty_cycle(duty);
}

void L298NMotorDriver::forward(int speed) {
    if (!enabled_) return;
    int s = resolve(speed);
    int left = std::min(100, static_cast<int>(s * left_factor_));
    int right = std::min(100, static_cast<int>(s * right_factor_));

    // Wheels are mounted mirrored: left runs reverse polarity to go forward
    drive(*left_in1_, *left_in2_, *left_pwm_, false, true, left);
    drive(*right_in1_, *right_in2_, *right_pwm_, true, false, right);
}

void L298NMotorDriver::backward(int speed) {
    if (!enabled_) return;
    int s = resolve(speed);
    int left = std::min(100, static_cast<int>(s * left_factor_));
    int right = std::min(100, static_cast<int>(s * right_factor_));

    drive(*left_in1_, *left_in2_, *left_pwm_, true, false, left);
    drive(*right_in1_, *right_in2_, *right_pwm_, false, true, right);
}

void L298NMotorDriver::turn_left(int speed) {
    if (!enabled_) return;
    int s = resolve(speed);
    drive(*left_in1_, *left_in2_, *left_pwm_, true, false, s);
    drive(*right_in1_, *right_in2_, *right_pwm_, true, false, s);
}

void L298NMotorDriver::turn_right(int speed) {
    if (!enabled_) return;
    int s = resolve(speed);
    drive(*left_in1_, *left_in2_, *left_pwm_, false, true, s);
    drive(*right_in1_, *right_in2_, *right_pwm_, false, true, s);
}

void L298NMotorDriver::stop() {
    if (!enabled_) return;
    drive(*left_in1_, *left_in2_, *left_pwm_, false, false, 0);
    drive(*right_in1_, *right_in2_, *right_pwm_, false, false, 0);
}

void L298NMotorDriver::brake() {
    if (!enabled_) return;
    // ENA high with IN1 == IN2 shorts the motor: dynamic braking
    drive(*left_in1_, *left_in2_, *left_pwm_, false, false, 100);
    drive(*right_in1_, *right_in2_, *right_pwm_, false, false, 100);
    utils::sleep_seconds(0.1);
    stop();
}

void L298NMotorDriver::adjust_calibration(const std::string& side, double delta) {
    if (side == "left") {
        left_factor_ = std::clamp(left_factor_ + delta, MIN_TRIM, MAX_TRIM);
    } else if (side == "right") {
        right_factor_ = std::clamp(right_factor_ + delta, MIN_TRIM, MAX_TRIM);
    } else {
        std::cerr << "⚠ Unknown motor side: " << side << std::endl;
        return;
    }
    std::cout << "Motor trim: L=" << left_factor_ << " R=" << right_factor_ << std::endl;
}

bool L298NMotorDriver::save_calibration() {
    try {
        utils::ensure_parent_directory(settings_.calibration_path);
        std::ofstream out(settings_.calibration_path);
        if (!out.is_open()) {
            std::cerr << "❌ Cannot write motor trim: " << settings_.calibration_path << std::endl;
            return false;
        }
        nlohmann::json j;
        j["left_speed_factor"] = left_factor_;
        j["right_speed_factor"] = right_factor_;
        out << j.dump(2) << std::endl;
        std::cout << "✓ Motor trim saved: " << settings_.calibration_path << std::endl;
        return true;
    } catch (const std::exception& e) {
        std::cerr << "❌ save_calibration exception: " << e.what() << std::endl;
        return false;
    }
}

bool L298NMotorDriver::load_calibration() {
    std::ifstream in(settings_.calibration_path);
    if (!in.is_open()) {
        return false;
    }
    try {
        nlohmann::json j = nlohmann::json::parse(in);
        left_factor_ = std::clamp(j.value("left_speed_factor", left_factor_), MIN_TRIM, MAX_TRIM);
        right_factor_ = std::clamp(j.value("right_speed_factor", right_factor_), MIN_TRIM, MAX_TRIM);
        return true;
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "⚠ Ignoring motor trim file: " << e.what() << std::endl;
        return false;
    }
}

void L298NMotorDriver::cleanup() {
    if (!enabled_) return;
    stop();
    enabled_ = false;
    left_pwm_.reset();
    right_pwm_.reset();
    std::cout << "Motor driver cleaned up" << std::endl;
}

std::unique_ptr<MotorDriver> create_motor_driver(const MotorSettings& settings) {
    if (!settings.enabled) {
        std::cout << "⚠ Motors disabled in config" << std::endl;
        return nullptr;
    }
    auto driver = std::make_unique<L298NMotorDriver>(settings);
    if (!driver->enabled()) {
        return nullptr;
    }
    return driver;
}

} // namespace companion
