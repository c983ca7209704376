#include "SearchController.hpp"
#include "ActionRecorder.hpp"
#include "Display.hpp"
#include "FaceRecognizer.hpp"
#include "FrameSource.hpp"
#include "MotorDriver.hpp"
#include "Utils.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>

namespace companion {

const char* to_string(SearchAction action) {
    switch (action) {
        case SearchAction::ROTATE_LEFT: return "rotate_left";
        case SearchAction::ROTATE_RIGHT: return "rotate_right";
        case SearchAction::COMPLETE: return "complete";
    }
    return "unknown";
}

SearchController::SearchController(const Config& config, ActionRecorder& recorder)
    : config_(config), recorder_(recorder) {}

void SearchController::reset() {
    step_ = 0;
    cycle_ = 0;
    last_rotation_ = Clock::time_point{};
    face_found_ = false;
}

bool SearchController::is_in_rotation_pause() const {
    if (last_rotation_ == Clock::time_point{}) return false;
    return utils::seconds_since(last_rotation_) < config_.search.rotate_pause;
}

void SearchController::update_rotation_time() {
    last_rotation_ = Clock::now();
}

SearchStep SearchController::get_next_search_action() const {
    const double deg45 = config_.search.deg45_duration;
    const std::string progress = " (" + std::to_string(cycle_ + 1) + "/" + std::to_string(config_.search.cycles) + ")";

    switch (step_) {
        case 0:
            return {SearchAction::ROTATE_LEFT, deg45, "Scan: rotate left 45 degrees"};
        case 1:
            return {SearchAction::ROTATE_RIGHT, deg45 * 2, "Scan: rotate right 90 degrees" + progress};
        case 2:
            return {SearchAction::ROTATE_LEFT, deg45 * 2, "Scan: rotate left 90 degrees" + progress};
        case 3:
            return {SearchAction::ROTATE_RIGHT, deg45, "Scan: return to center"};
        default:
            return {SearchAction::COMPLETE, 0.0, "Scan complete"};
    }
}

void SearchController::advance_step() {
    switch (step_) {
        case 0:
            step_ = 1;
            break;
        case 1:
            step_ = 2;
            break;
        case 2:
            ++cycle_;
            step_ = cycle_ >= config_.search.cycles ? 3 : 1;
            break;
        case 3:
            step_ = COMPLETE_STEP;
            break;
        default:
            break;
    }
}

bool SearchController::detect_face_in_search(FrameSource* camera, FaceRecognizer* recognizer) {
    if (!camera || !recognizer) return false;

    cv::Mat frame;
    if (!camera->read(frame)) return false;

    if (!recognizer->detect_faces_only(frame).empty()) {
        face_found_ = true;
        return true;
    }
    return false;
}

bool SearchController::rotate_and_detect(Direction direction, double duration, MotorDriver* motor,
                                         FrameSource* camera, FaceRecognizer* recognizer) {
    if (config_.debug) {
        std::cout << "Start rotation: " << to_string(direction) << ", target " << duration << "s" << std::endl;
    }

    const bool drive = motor && motor->enabled();
    if (drive) {
        if (direction == Direction::LEFT) {
            motor->turn_left(config_.search.rotate_speed);
        } else {
            motor->turn_right(config_.search.rotate_speed);
        }
    }

    const auto start = Clock::now();
    bool found = false;
    try {
        while (utils::seconds_since(start) < duration) {
            // Loop rate is bounded by the camera frame rate
            if (detect_face_in_search(camera, recognizer)) {
                found = true;
                if (config_.debug) {
                    std::cout << "Face found during rotation; stopping" << std::endl;
                }
                break;
            }
            if (!camera || !recognizer) {
                utils::sleep_seconds(config_.search.detect_poll_interval);
            }
        }
    } catch (const std::exception& e) {
        if (drive) motor->stop();
        recorder_.record(ActionKind::ROTATE, direction, utils::seconds_since(start));
        throw;
    }

    if (drive) motor->stop();

    double elapsed = utils::seconds_since(start);
    recorder_.record(ActionKind::ROTATE, direction, elapsed);
    if (config_.debug) {
        std::cout << "Search rotation finished: " << to_string(direction) << " " << elapsed << "s" << std::endl;
    }
    return found;
}

bool SearchController::is_centered(float face_center_x, int frame_width, double tolerance) {
    const double offset = face_center_x - frame_width / 2.0;
    return std::fabs(offset) <= frame_width * tolerance;
}

bool SearchController::center_face(const FaceObservation& face, MotorDriver* motor, FrameSource* camera,
                                   FaceRecognizer* recognizer, Display* display) {
    if (!config_.face_center.enabled) return true;

    if (!motor || !motor->enabled()) {
        if (config_.debug) {
            std::cout << "Motor not enabled; skipping face centering" << std::endl;
        }
        return true;
    }

    const int frame_width = camera ? camera->frame_width() : config_.camera.width;
    const float center_x = frame_width / 2.0f;
    const double tolerance_px = frame_width * config_.face_center.tolerance;

    FaceObservation current = face;
    const int max_passes = std::max(1, config_.face_center.max_passes);
    for (int pass = 0; pass < max_passes; ++pass) {
        const float offset = current.center_x() - center_x;
        if (std::fabs(offset) <= tolerance_px) {
            std::cout << "✓ Face centered, offset=" << static_cast<int>(offset) << "px" << std::endl;
            return true;
        }

        Direction direction = offset > 0 ? Direction::RIGHT : Direction::LEFT;
        std::cout << (pass == 0 ? "" : "Correction: ") << "face is " << static_cast<int>(std::fabs(offset))
                  << "px to the " << to_string(direction) << ", rotating" << std::endl;

        CenterPass result = center_pass(direction, *motor, camera, recognizer, display, center_x, tolerance_px);
        if (result.centered) return true;

        if (!result.last_face) {
            std::cout << "⚠ Face lost during centering" << std::endl;
            return false;
        }
        current = *result.last_face;
        utils::sleep_seconds(0.1);
    }

    std::cout << "Reached max corrections (" << max_passes << "); centering finished" << std::endl;
    return true;
}

SearchController::CenterPass SearchController::center_pass(Direction direction, MotorDriver& motor,
                                                           FrameSource* camera, FaceRecognizer* recognizer,
                                                           Display* display, float center_x,
                                                           double tolerance_px) {
    const auto& fc = config_.face_center;
    const int max_steps = static_cast<int>(fc.timeout / (fc.step_duration + fc.step_pause));

    CenterPass result;
    double rotated = 0.0;

    for (int step = 0; step < max_steps; ++step) {
        if (direction == Direction::RIGHT) {
            motor.turn_right(fc.speed);
        } else {
            motor.turn_left(fc.speed);
        }
        utils::sleep_seconds(fc.step_duration);
        motor.stop();
        rotated += fc.step_duration;
        utils::sleep_seconds(fc.step_pause);

        cv::Mat frame;
        if (!camera || !recognizer || !camera->read(frame)) continue;

        auto faces = recognizer->detect_and_recognize(frame);
        const FaceObservation* largest = get_largest_face(faces);
        if (!largest) continue;  // keep turning to reacquire

        result.last_face = *largest;
        const float offset = largest->center_x() - center_x;
        if (config_.debug) {
            std::cout << "Centering: offset=" << static_cast<int>(offset) << "px, tolerance=+/-"
                      << static_cast<int>(tolerance_px) << "px" << std::endl;
        }

        if (std::fabs(offset) <= tolerance_px) {
            std::cout << "✓ Face centered, offset=" << static_cast<int>(offset) << "px, time=" << rotated << "s" << std::endl;
            result.centered = true;
            break;
        }

        Direction now = offset > 0 ? Direction::RIGHT : Direction::LEFT;
        if (now != direction) {
            std::cout << "Overshoot detected; preparing reverse correction" << std::endl;
            result.overshot = true;
            break;
        }

        if (display) display->update(fc.step_duration + fc.step_pause);
    }

    recorder_.record(ActionKind::ROTATE, direction, rotated);
    return result;
}

} // namespace companion
