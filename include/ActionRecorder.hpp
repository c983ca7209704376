#pragma once

#include "Config.hpp"
#include "RobotTypes.hpp"
#include <atomic>
#include <functional>
#include <mutex>
#include <optional>
#include <vector>

namespace companion {

class MotorDriver;

/**
 * @brief One primitive motion in the history
 */
struct Action {
    ActionKind kind = ActionKind::MOVE;
    Direction direction = Direction::NONE;
    double duration = 0.0;  // seconds
    Clock::time_point timestamp;
};

/**
 * @brief Reversed action about to be replayed on the way home
 */
struct ReturnAction {
    ActionKind kind = ActionKind::MOVE;
    Direction direction = Direction::NONE;           // already reversed
    Direction original_direction = Direction::NONE;
    double duration = 0.0;
    int index = 0;
    int total = 0;
};

/**
 * @brief In-flight action: kind + direction and when it started
 */
struct PendingAction {
    ActionKind kind = ActionKind::MOVE;
    Direction direction = Direction::NONE;
    Clock::time_point started_at;
};

/**
 * @brief Reversible log of every motion since wake-up
 *
 * Movers bracket each motor command with start_action()/stop_action(); the
 * measured duration is appended when it reaches MIN_ACTION_DURATION. On
 * "go home" the history is replayed newest first with each direction
 * reversed, one action per execute_return_action() call.
 *
 * Thread-safe: one mutex guards the in-flight slot and the history.
 */
class ActionRecorder {
public:
    static constexpr double MIN_ACTION_DURATION = 0.05;
    static constexpr double OBSTACLE_POLL_INTERVAL = 0.1;

    using ObstacleCallback = std::function<bool()>;

    explicit ActionRecorder(const Config& config);

    // Recording
    void start_action(ActionKind kind, Direction direction);
    void stop_action();
    void record(ActionKind kind, Direction direction, double duration);
    std::optional<PendingAction> get_current_action() const;

    // History
    void clear();
    bool has_actions() const;
    int get_action_count() const;
    std::vector<Action> history() const;

    static Direction get_reverse_direction(Direction direction);

    // Return to origin
    bool start_returning();
    bool is_returning() const { return returning_; }
    std::optional<ReturnAction> get_next_return_action() const;

    /**
     * @brief Replay the next reversed action (blocking for its duration)
     * @param motor May be null or disabled: the replay is then a plain sleep
     * @param obstacle_callback Polled during moves; true pauses the move
     * @return true once the last action has been replayed (history cleared)
     */
    bool execute_return_action(MotorDriver* motor, const ObstacleCallback& obstacle_callback = nullptr);

    void finish_returning();
    void cancel_returning();

private:
    // Caller holds mutex_
    void finish_current_action_locked();
    void append_locked(ActionKind kind, Direction direction, double duration);

    void replay_rotation(MotorDriver& motor, const ReturnAction& action);
    void replay_move(MotorDriver& motor, const ReturnAction& action, const ObstacleCallback& obstacle_callback);

    const Config& config_;
    mutable std::mutex mutex_;
    std::vector<Action> history_;
    std::optional<PendingAction> current_;
    std::atomic<bool> returning_{false};
    int return_index_ = -1;
};

} // namespace companion
