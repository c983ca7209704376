#include "ActionRecorder.hpp"
#include "MotorDriver.hpp"
#include "Utils.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>

namespace companion {

ActionRecorder::ActionRecorder(const Config& config) : config_(config) {}

// ============================================================================
// Recording
// ============================================================================

void ActionRecorder::start_action(ActionKind kind, Direction direction) {
    std::lock_guard<std::mutex> lock(mutex_);
    // History is frozen once start_returning() has taken the lock
    if (returning_) return;
    if (current_) {
        finish_current_action_locked();
    }
    current_ = PendingAction{kind, direction, Clock::now()};
}

void ActionRecorder::stop_action() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (current_) {
        finish_current_action_locked();
    }
}

void ActionRecorder::finish_current_action_locked() {
    if (!current_) return;
    double duration = utils::seconds_since(current_->started_at);
    append_locked(current_->kind, current_->direction, duration);
    current_.reset();
}

void ActionRecorder::append_locked(ActionKind kind, Direction direction, double duration) {
    if (returning_ || duration < MIN_ACTION_DURATION) {
        return;
    }
    history_.push_back(Action{kind, direction, duration, Clock::now()});
}

void ActionRecorder::record(ActionKind kind, Direction direction, double duration) {
    std::lock_guard<std::mutex> lock(mutex_);
    append_locked(kind, direction, duration);
}

std::optional<PendingAction> ActionRecorder::get_current_action() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_;
}

// ============================================================================
// History
// ============================================================================

void ActionRecorder::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    history_.clear();
    current_.reset();
}

bool ActionRecorder::has_actions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return !history_.empty();
}

int ActionRecorder::get_action_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<int>(history_.size());
}

std::vector<Action> ActionRecorder::history() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return history_;
}

Direction ActionRecorder::get_reverse_direction(Direction direction) {
    switch (direction) {
        case Direction::LEFT: return Direction::RIGHT;
        case Direction::RIGHT: return Direction::LEFT;
        case Direction::FORWARD: return Direction::BACKWARD;
        case Direction::BACKWARD: return Direction::FORWARD;
        case Direction::NONE: return Direction::NONE;
    }
    return direction;
}

// ============================================================================
// Return to origin
// ============================================================================

bool ActionRecorder::start_returning() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (current_) {
        finish_current_action_locked();
    }
    if (history_.empty()) {
        return false;
    }

    std::cout << "Starting return-to-origin: " << history_.size() << " actions to reverse" << std::endl;
    return_index_ = static_cast<int>(history_.size()) - 1;
    returning_ = true;
    return true;
}

std::optional<ReturnAction> ActionRecorder::get_next_return_action() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!returning_ || return_index_ < 0 || return_index_ >= static_cast<int>(history_.size())) {
        return std::nullopt;
    }

    const Action& action = history_[static_cast<size_t>(return_index_)];
    ReturnAction reversed;
    reversed.kind = action.kind;
    reversed.direction = get_reverse_direction(action.direction);
    reversed.original_direction = action.direction;
    reversed.duration = action.duration;
    reversed.index = return_index_;
    reversed.total = static_cast<int>(history_.size());
    return reversed;
}

bool ActionRecorder::execute_return_action(MotorDriver* motor, const ObstacleCallback& obstacle_callback) {
    auto action = get_next_return_action();
    if (!action) {
        finish_returning();
        return true;
    }

    if (config_.debug) {
        std::cout << "  Return " << (action->total - action->index) << "/" << action->total << ": "
                  << to_string(action->kind) << " " << to_string(action->direction)
                  << " " << action->duration << "s" << std::endl;
    }

    if (!motor || !motor->enabled()) {
        utils::sleep_seconds(action->duration);
    } else if (action->kind == ActionKind::ROTATE) {
        replay_rotation(*motor, *action);
    } else {
        replay_move(*motor, *action, obstacle_callback);
    }

    utils::sleep_seconds(config_.return_settle_delay);

    bool complete = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        --return_index_;
        complete = return_index_ < 0;
    }
    if (complete) {
        finish_returning();
    }
    return complete;
}

void ActionRecorder::replay_rotation(MotorDriver& motor, const ReturnAction& action) {
    const double step = config_.search.step_duration;
    const double pause = config_.search.step_pause;
    const int speed = config_.search.rotate_speed;

    // Full pulses first, then one shorter pulse for the remainder
    int full_steps = static_cast<int>(std::floor(action.duration / step));
    double remainder = action.duration - full_steps * step;

    auto pulse = [&](double on_time) {
        if (action.direction == Direction::LEFT) {
            motor.turn_left(speed);
        } else {
            motor.turn_right(speed);
        }
        utils::sleep_seconds(on_time);
        motor.stop();
        utils::sleep_seconds(pause);
    };

    for (int i = 0; i < full_steps; ++i) {
        pulse(step);
    }
    if (remainder >= 0.01) {
        pulse(remainder);
    }
}

void ActionRecorder::replay_move(MotorDriver& motor, const ReturnAction& action,
                                 const ObstacleCallback& obstacle_callback) {
    auto drive = [&]() {
        if (action.direction == Direction::FORWARD) {
            motor.forward();
        } else {
            motor.backward();
        }
    };

    double remaining = action.duration;
    double blocked_for = 0.0;
    bool moving = false;

    while (remaining > 0.0) {
        if (obstacle_callback && obstacle_callback()) {
            if (moving) {
                motor.stop();
                moving = false;
                std::cout << "⚠ Obstacle on the way home - pausing" << std::endl;
            }
            if (blocked_for >= config_.return_obstacle_max_wait) {
                std::cerr << "⚠ Obstacle did not clear, skipping rest of move ("
                          << remaining << "s)" << std::endl;
                break;
            }
            utils::sleep_seconds(OBSTACLE_POLL_INTERVAL);
            blocked_for += OBSTACLE_POLL_INTERVAL;
            continue;
        }

        if (!moving) {
            drive();
            moving = true;
        }
        double slice = std::min(OBSTACLE_POLL_INTERVAL, remaining);
        utils::sleep_seconds(slice);
        remaining -= slice;
    }
    motor.stop();
}

void ActionRecorder::finish_returning() {
    std::cout << "✓ Returned to origin" << std::endl;
    std::lock_guard<std::mutex> lock(mutex_);
    returning_ = false;
    return_index_ = -1;
    history_.clear();
    current_.reset();
}

void ActionRecorder::cancel_returning() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (returning_) {
        std::cout << "Return cancelled" << std::endl;
    }
    returning_ = false;
    return_index_ = -1;
    history_.clear();
    current_.reset();
}

} // namespace companion
