#include "RobotTypes.hpp"

#include <cmath>

namespace companion {

const char* to_string(ActionKind kind) {
    switch (kind) {
        case ActionKind::MOVE: return "move";
        case ActionKind::ROTATE: return "rotate";
    }
    return "unknown";
}

const char* to_string(Direction direction) {
    switch (direction) {
        case Direction::LEFT: return "left";
        case Direction::RIGHT: return "right";
        case Direction::FORWARD: return "forward";
        case Direction::BACKWARD: return "backward";
        case Direction::NONE: return "none";
    }
    return "unknown";
}

float FaceObservation::eye_distance() const {
    cv::Point2f delta = landmarks[0] - landmarks[1];
    return std::sqrt(delta.x * delta.x + delta.y * delta.y);
}

} // namespace companion
