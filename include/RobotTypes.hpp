#pragma once

/**
 * @file RobotTypes.hpp
 * @brief Shared value types for the behavior engine
 */

#include <array>
#include <chrono>
#include <optional>
#include <string>

#include <opencv2/core.hpp>

namespace companion {

using Clock = std::chrono::steady_clock;

enum class ActionKind {
    MOVE,
    ROTATE
};

enum class Direction {
    LEFT,
    RIGHT,
    FORWARD,
    BACKWARD,
    NONE
};

const char* to_string(ActionKind kind);
const char* to_string(Direction direction);

/**
 * @brief One detected face as reported by a FaceRecognizer
 *
 * Landmark order follows YuNet: right eye, left eye, nose tip,
 * right mouth corner, left mouth corner.
 */
struct FaceObservation {
    cv::Rect box;
    std::array<cv::Point2f, 5> landmarks{};
    std::optional<std::string> identity;  // unset = stranger / not recognized
    float similarity = 0.0f;
    float confidence = 0.0f;

    float center_x() const { return box.x + box.width / 2.0f; }
    float eye_distance() const;
};

} // namespace companion
