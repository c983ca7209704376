#pragma once

#include "Config.hpp"
#include "RobotTypes.hpp"
#include "SysfsGpio.hpp"
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace companion {

/**
 * @brief Snapshot of the last ultrasonic sweep
 */
struct ProximityStatus {
    std::map<std::string, double> distances;  // cm, -1 = no valid echo
    std::vector<std::string> triggered;       // sensors at or under threshold
};

/**
 * @brief Abstract obstacle sensor
 */
class ProximitySensor {
public:
    virtual ~ProximitySensor() = default;

    /**
     * @brief True when any sensor reads at or under the distance threshold
     * @param use_cached Accept a result younger than the cache window
     */
    virtual bool is_object_near(bool use_cached = false) = 0;
    virtual ProximityStatus get_status() = 0;
    virtual bool enabled() const = 0;
    virtual void cleanup() = 0;
};

/**
 * @brief HC-SR04 array on sysfs GPIO
 */
class UltrasonicArray : public ProximitySensor {
public:
    explicit UltrasonicArray(const UltrasonicSettings& settings);
    ~UltrasonicArray() override;

    bool is_object_near(bool use_cached = false) override;
    ProximityStatus get_status() override;
    bool enabled() const override { return enabled_; }
    void cleanup() override;

private:
    struct Sensor {
        std::string name;
        std::unique_ptr<SysfsGpio> trig;
        std::unique_ptr<SysfsGpio> echo;
        double last_distance = -1.0;
    };

    /** @return distance in cm within the valid range, else -1 */
    double measure(Sensor& sensor);

    const UltrasonicSettings& settings_;
    std::vector<Sensor> sensors_;
    Clock::time_point last_measure_{};
    bool cached_near_ = false;
    bool enabled_ = false;
    int check_count_ = 0;
};

/**
 * @brief Factory: nullptr when disabled in config or no sensor opens
 */
std::unique_ptr<ProximitySensor> create_proximity_sensor(const UltrasonicSettings& settings);

} // namespace companion
