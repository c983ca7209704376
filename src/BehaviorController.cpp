#include "BehaviorController.hpp"
#include "ActionRecorder.hpp"
#include "AudioPlayer.hpp"
#include "Display.hpp"
#include "FaceRecognizer.hpp"
#include "FrameSource.hpp"
#include "MotorDriver.hpp"
#include "ProximitySensor.hpp"
#include "Utils.hpp"
#include <cmath>
#include <iostream>

namespace companion {

namespace {
constexpr double STUCK_DELTA = 0.02;
constexpr int STUCK_STEPS = 3;
}

BehaviorController::BehaviorController(const Config& config,
                                       MotorDriver* motor,
                                       FrameSource* camera,
                                       ProximitySensor* proximity,
                                       FaceRecognizer* recognizer,
                                       ActionRecorder& recorder,
                                       Display& display,
                                       AudioPlayer& audio)
    : config_(config),
      motor_(motor),
      camera_(camera),
      proximity_(proximity),
      recognizer_(recognizer),
      recorder_(recorder),
      display_(display),
      audio_(audio) {}

double BehaviorController::offset_ratio(float face_center_x, int frame_width) {
    if (frame_width <= 0) return 0.0;
    return (face_center_x - frame_width / 2.0) / frame_width;
}

int BehaviorController::frame_width() const {
    int width = camera_ ? camera_->frame_width() : 0;
    return width > 0 ? width : config_.camera.width;
}

bool BehaviorController::read_fresh_frame(cv::Mat& frame, int flush) {
    if (!camera_) return false;
    camera_->grab(flush);
    return camera_->read(frame);
}

void BehaviorController::rotate_burst(Direction direction, int speed, double duration) {
    recorder_.start_action(ActionKind::ROTATE, direction);
    if (direction == Direction::RIGHT) {
        motor_->turn_right(speed);
    } else {
        motor_->turn_left(speed);
    }
    utils::sleep_seconds(duration);
    motor_->stop();
    recorder_.stop_action();
}

void BehaviorController::move_burst(Direction direction, int speed, double duration) {
    recorder_.start_action(ActionKind::MOVE, direction);
    if (direction == Direction::FORWARD) {
        motor_->forward(speed);
    } else {
        motor_->backward(speed);
    }
    utils::sleep_seconds(duration);
    motor_->stop();
    recorder_.stop_action();
}

// ============================================================================
// Approach
// ============================================================================

double BehaviorController::approach_familiar_person() {
    if (!motor_ || !motor_->enabled()) {
        std::cout << "Motor not enabled; skipping approach" << std::endl;
        return 0.0;
    }

    if (!config_.approach.visual_distance_enabled) {
        std::cout << "Visual distance check disabled; fixed forward move" << std::endl;
        double fixed = config_.motor.move_duration;
        if (fixed > 0) {
            move_burst(Direction::FORWARD, 0, fixed);
        }
        return fixed;
    }

    std::cout << "Approaching familiar person..." << std::endl;
    motor_->stop();
    utils::sleep_seconds(0.15);

    const double interval = config_.approach.check_interval;
    const auto start = Clock::now();
    bool blocked = false;
    bool moving = false;

    while (utils::seconds_since(start) < config_.approach.max_approach_time) {
        bool obstacle = proximity_ && proximity_->is_object_near(true);

        if (obstacle) {
            if (moving) {
                motor_->brake();
                recorder_.stop_action();
                moving = false;
            }
            if (!blocked) {
                std::cout << "🛑 Blocked! Waiting..." << std::endl;
                display_.show_emotion("cry");
                audio_.play_sound("obstacle");
                blocked = true;
            }
            utils::sleep_seconds(interval);
            display_.update(interval);
            continue;
        }

        if (blocked) {
            std::cout << "Path clear! Resuming..." << std::endl;
            display_.show_emotion("happy");
            blocked = false;
            utils::sleep_seconds(0.2);
        }

        bool close_enough = false;
        cv::Mat frame;
        if (recognizer_ && read_fresh_frame(frame, 2)) {
            auto faces = recognizer_->detect_faces_only(frame);
            if (const FaceObservation* face = get_largest_face(faces)) {
                float eye_distance = face->eye_distance();
                if (config_.debug) {
                    std::cout << "[Distance] eyes " << eye_distance << "px (threshold "
                              << config_.approach.face_close_eye_distance << "), width " << face->box.width
                              << "px (threshold " << config_.approach.face_close_threshold << ")" << std::endl;
                }
                if (eye_distance >= config_.approach.face_close_eye_distance) {
                    std::cout << "[Vision] Eye distance close enough: " << eye_distance << "px" << std::endl;
                    close_enough = true;
                } else if (face->box.width >= config_.approach.face_close_threshold) {
                    std::cout << "[Vision] Face wide enough: " << face->box.width << "px" << std::endl;
                    close_enough = true;
                }
            }
        }

        if (close_enough) {
            break;
        }

        if (!moving) {
            recorder_.start_action(ActionKind::MOVE, Direction::FORWARD);
            motor_->forward();
            moving = true;
        }

        utils::sleep_seconds(0.01);
        display_.update(0.01);
    }

    if (moving) {
        motor_->stop();
        recorder_.stop_action();
    }

    double total = utils::seconds_since(start);
    std::cout << "Approach finished in " << total << "s" << std::endl;
    return total;
}

bool BehaviorController::check_obstacle_while_moving() {
    if (proximity_ && proximity_->is_object_near()) {
        if (config_.debug) {
            std::cout << "Obstacle detected while moving" << std::endl;
        }
        return true;
    }
    return false;
}

bool BehaviorController::check_face_too_close() {
    if (!config_.approach.visual_distance_enabled || !camera_ || !recognizer_) {
        return false;
    }

    cv::Mat frame;
    if (!camera_->read(frame)) return false;

    auto faces = recognizer_->detect_faces_only(frame);
    const FaceObservation* face = get_largest_face(faces);
    if (!face) return false;

    const int threshold = config_.approach.face_close_threshold;
    if (face->box.width >= threshold || face->box.height >= threshold) {
        std::cout << "Face too close! width=" << face->box.width << "px (threshold " << threshold << "px)" << std::endl;
        return true;
    }
    return false;
}

// ============================================================================
// Stranger tracking
// ============================================================================

void BehaviorController::track_face_position(const FaceObservation& face) {
    if (!motor_ || !motor_->enabled()) {
        if (config_.debug) {
            std::cout << "[Track] Motor not enabled; skipping tracking" << std::endl;
        }
        return;
    }

    const double ratio = offset_ratio(face.center_x(), frame_width());
    const Direction direction = ratio > 0 ? Direction::RIGHT : Direction::LEFT;

    if (config_.debug) {
        std::cout << "[Track] offset=" << ratio * 100.0 << "%, tolerance=+/-"
                  << config_.face_center.tolerance * 100.0 << "%" << std::endl;
    }

    if (std::fabs(ratio) <= config_.face_center.tolerance) {
        face_centered_ = true;
        offset_confirm_count_ = 0;
        last_offset_direction_.reset();
        return;
    }

    if (face_centered_) {
        if (last_offset_direction_ && *last_offset_direction_ == direction) {
            ++offset_confirm_count_;
        } else {
            offset_confirm_count_ = 1;
            last_offset_direction_ = direction;
        }

        if (config_.debug) {
            std::cout << "[Track] Confirming offset: " << offset_confirm_count_ << "/"
                      << config_.face_center.confirm_count << " (" << to_string(direction) << ")" << std::endl;
        }
        if (offset_confirm_count_ < config_.face_center.confirm_count) {
            return;
        }

        face_centered_ = false;
        offset_confirm_count_ = 0;
    }

    track_until_centered(direction);
}

void BehaviorController::track_until_centered(Direction initial_direction) {
    const auto& fc = config_.face_center;
    Direction direction = initial_direction;
    std::optional<double> last_offset;
    int stuck_count = 0;

    for (int i = 0; i < fc.max_track_rotations; ++i) {
        rotate_burst(direction, fc.speed, fc.step_duration);
        utils::sleep_seconds(fc.step_pause);

        cv::Mat frame;
        if (!recognizer_ || !read_fresh_frame(frame, 3)) {
            if (config_.debug) {
                std::cout << "[Track] Failed to read camera" << std::endl;
            }
            return;
        }

        auto faces = recognizer_->detect_and_recognize(frame);
        const FaceObservation* face = get_largest_face(faces);
        if (!face) {
            if (config_.debug) {
                std::cout << "[Track] Face lost; stopping tracking" << std::endl;
            }
            return;
        }

        const double ratio = offset_ratio(face->center_x(), frame_width());
        if (last_offset) {
            if (std::fabs(ratio - *last_offset) < STUCK_DELTA) {
                if (++stuck_count >= STUCK_STEPS) {
                    std::cout << "⚠ [Track] Stuck: offset barely changes" << std::endl;
                }
            } else {
                stuck_count = 0;
            }
        }
        last_offset = ratio;

        if (std::fabs(ratio) <= fc.tolerance) {
            if (config_.debug) {
                std::cout << "[Track] Centered, recorded actions: " << recorder_.get_action_count() << std::endl;
            }
            face_centered_ = true;
            offset_confirm_count_ = 0;
            last_offset_direction_.reset();
            return;
        }

        direction = ratio > 0 ? Direction::RIGHT : Direction::LEFT;
    }

    std::cout << "⚠ [Track] Reached max rotations: " << fc.max_track_rotations << std::endl;
}

// ============================================================================
// Familiar follow
// ============================================================================

bool BehaviorController::follow_familiar_person() {
    if (!motor_ || !motor_->enabled() || !recognizer_) {
        return false;
    }

    cv::Mat frame;
    if (!read_fresh_frame(frame, 2)) {
        return false;
    }

    auto faces = recognizer_->detect_faces_only(frame);
    const FaceObservation* face = get_largest_face(faces);
    if (!face) {
        return false;
    }

    const auto& follow = config_.follow;
    const double raw_offset = offset_ratio(face->center_x(), frame_width());
    const double raw_eye_distance = face->eye_distance();

    if (!smooth_eye_distance_ || !smooth_offset_) {
        smooth_eye_distance_ = raw_eye_distance;
        smooth_offset_ = raw_offset;
    } else {
        const double alpha = follow.smoothing_alpha;
        smooth_eye_distance_ = *smooth_eye_distance_ * (1.0 - alpha) + raw_eye_distance * alpha;
        smooth_offset_ = *smooth_offset_ * (1.0 - alpha) + raw_offset * alpha;
    }
    const double eye_distance = *smooth_eye_distance_;
    const double offset = *smooth_offset_;

    if (consecutive_actions_ > follow.max_consecutive_actions) {
        if (config_.debug) {
            std::cout << "[Follow] Too many corrections (" << consecutive_actions_ << "); cooling down "
                      << follow.cooldown << "s" << std::endl;
        }
        utils::sleep_seconds(follow.cooldown);
        reset_follow_state();
        return true;
    }

    bool acted = false;
    if (std::fabs(offset) > config_.face_center.tolerance) {
        Direction direction = offset > 0 ? Direction::RIGHT : Direction::LEFT;
        if (config_.debug) {
            std::cout << "[Follow] Rotate " << to_string(direction) << " (offset " << offset * 100.0 << "%)" << std::endl;
        }
        rotate_burst(direction, config_.face_center.speed, follow.rotate_burst);
        acted = true;
    } else {
        const double target = config_.approach.face_close_eye_distance;
        const double margin = target * follow.deadband_ratio;

        if (eye_distance < target - margin) {
            if (config_.debug) {
                std::cout << "[Follow] Too far (eyes " << eye_distance << "px) -> forward" << std::endl;
            }
            move_burst(Direction::FORWARD, follow.speed, follow.move_burst);
            acted = true;
        } else if (eye_distance > target + margin) {
            if (config_.debug) {
                std::cout << "[Follow] Too close (eyes " << eye_distance << "px) -> backward" << std::endl;
            }
            move_burst(Direction::BACKWARD, follow.speed, follow.move_burst);
            acted = true;
        }
    }

    consecutive_actions_ = acted ? consecutive_actions_ + 1 : 0;
    return true;
}

void BehaviorController::reset_follow_state() {
    smooth_eye_distance_.reset();
    smooth_offset_.reset();
    consecutive_actions_ = 0;
}

} // namespace companion
