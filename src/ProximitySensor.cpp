#include "ProximitySensor.hpp"
#include "Utils.hpp"
#include <iostream>
#include <thread>

namespace companion {

namespace {
constexpr double MIN_VALID_CM = 0.5;
constexpr double MAX_VALID_CM = 400.0;
constexpr double CM_PER_SECOND_ROUND_TRIP = 17150.0;  // speed of sound / 2
constexpr double MIN_TRIGGER_SPACING_S = 0.02;        // avoid echo cross-talk
constexpr int STATUS_LOG_INTERVAL = 50;
}

UltrasonicArray::UltrasonicArray(const UltrasonicSettings& settings) : settings_(settings) {
    std::cout << "  Initializing ultrasonic sensor array..." << std::endl;

    for (const auto& pins : settings.sensors) {
        if (pins.trig_pin == 0 || pins.echo_pin == 0) {
            continue;
        }
        Sensor sensor;
        sensor.name = pins.name;
        sensor.trig = std::make_unique<SysfsGpio>(pins.trig_pin, SysfsGpio::Mode::OUTPUT);
        sensor.echo = std::make_unique<SysfsGpio>(pins.echo_pin, SysfsGpio::Mode::INPUT);
        if (!sensor.trig->is_open() || !sensor.echo->is_open()) {
            std::cerr << "  ⚠ " << pins.name << ": GPIO unavailable" << std::endl;
            continue;
        }
        sensor.trig->write(false);
        std::cout << "  " << pins.name << ": TRIG=" << pins.trig_pin << " ECHO=" << pins.echo_pin << std::endl;
        sensors_.push_back(std::move(sensor));
    }

    enabled_ = !sensors_.empty();
    if (enabled_) {
        std::cout << "✓ Ultrasonic sensors: " << sensors_.size() << "/" << settings.sensors.size()
                  << " enabled, threshold " << settings.distance_threshold << " cm" << std::endl;
    } else {
        std::cerr << "❌ No ultrasonic sensors available" << std::endl;
    }
}

UltrasonicArray::~UltrasonicArray() {
    cleanup();
}

double UltrasonicArray::measure(Sensor& sensor) {
    sensor.trig->write(false);
    std::this_thread::sleep_for(std::chrono::microseconds(2));
    sensor.trig->write(true);
    std::this_thread::sleep_for(std::chrono::microseconds(10));
    sensor.trig->write(false);

    auto deadline = Clock::now() + std::chrono::duration_cast<Clock::duration>(
                                       std::chrono::duration<double>(settings_.echo_timeout));

    auto pulse_start = Clock::now();
    while (sensor.echo->read() == 0) {
        pulse_start = Clock::now();
        if (pulse_start > deadline) {
            sensor.last_distance = -1.0;
            return -1.0;
        }
    }

    auto pulse_end = Clock::now();
    while (sensor.echo->read() == 1) {
        pulse_end = Clock::now();
        if (pulse_end > deadline) {
            sensor.last_distance = -1.0;
            return -1.0;
        }
    }

    double distance = std::chrono::duration<double>(pulse_end - pulse_start).count() * CM_PER_SECOND_ROUND_TRIP;
    sensor.last_distance = (distance > MIN_VALID_CM && distance < MAX_VALID_CM) ? distance : -1.0;
    return sensor.last_distance;
}

bool UltrasonicArray::is_object_near(bool use_cached) {
    if (!enabled_) return false;

    double since_last = utils::seconds_since(last_measure_);
    if (use_cached && since_last < settings_.measure_interval) {
        return cached_near_;
    }
    if (since_last < MIN_TRIGGER_SPACING_S) {
        return cached_near_;
    }
    last_measure_ = Clock::now();

    std::string trigger;
    bool near = false;
    for (auto& sensor : sensors_) {
        double d = measure(sensor);
        if (d >= 0 && d <= settings_.distance_threshold) {
            near = true;
            trigger = sensor.name;
            break;  // first hit is enough
        }
    }
    cached_near_ = near;

    if (++check_count_ % STATUS_LOG_INTERVAL == 0) {
        std::cout << "Sensor check: " << (near ? trigger : "clear") << std::endl;
    }
    return near;
}

ProximityStatus UltrasonicArray::get_status() {
    ProximityStatus status;
    for (auto& sensor : sensors_) {
        double d = enabled_ ? measure(sensor) : -1.0;
        status.distances[sensor.name] = d;
        if (d >= 0 && d <= settings_.distance_threshold) {
            status.triggered.push_back(sensor.name);
        }
    }
    return status;
}

void UltrasonicArray::cleanup() {
    if (!enabled_) return;
    enabled_ = false;
    sensors_.clear();
    std::cout << "Ultrasonic sensors cleaned up" << std::endl;
}

std::unique_ptr<ProximitySensor> create_proximity_sensor(const UltrasonicSettings& settings) {
    if (!settings.enabled) {
        std::cout << "⚠ Ultrasonic disabled in config" << std::endl;
        return nullptr;
    }
    auto sensor = std::make_unique<UltrasonicArray>(settings);
    if (!sensor->enabled()) {
        return nullptr;
    }
    return sensor;
}

} // namespace companion
