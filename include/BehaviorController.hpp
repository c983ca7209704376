#pragma once

#include "Config.hpp"
#include "RobotTypes.hpp"
#include <optional>

namespace companion {

class ActionRecorder;
class AudioPlayer;
class Display;
class FaceRecognizer;
class FrameSource;
class MotorDriver;
class ProximitySensor;

/**
 * @brief Closed-loop visual servoing: approach, stranger tracking, familiar follow
 *
 * Every motor burst issued here is bracketed by start_action()/stop_action()
 * so the way home can be replayed. Any collaborator except the display and
 * audio may be null; the affected behavior is then skipped.
 */
class BehaviorController {
public:
    BehaviorController(const Config& config,
                       MotorDriver* motor,
                       FrameSource* camera,
                       ProximitySensor* proximity,
                       FaceRecognizer* recognizer,
                       ActionRecorder& recorder,
                       Display& display,
                       AudioPlayer& audio);

    /**
     * @brief Drive forward until the person is close, pausing for obstacles
     * @return Seconds spent in the approach
     */
    double approach_familiar_person();

    /** Obstacle poll used while replaying moves home */
    bool check_obstacle_while_moving();

    /** True when the largest face is at least face_close_threshold wide or tall */
    bool check_face_too_close();

    /**
     * @brief Keep a face centered with debounced step corrections
     *
     * Once the face has been centered, a correction only starts after
     * confirm_count consecutive off-center frames in the same direction.
     */
    void track_face_position(const FaceObservation& face);

    /**
     * @brief One follow iteration: rotate toward the face or hold distance
     * @return true when a face was present
     */
    bool follow_familiar_person();

    void reset_follow_state();

    /** Signed horizontal offset of @p face_center_x as a fraction of the frame width */
    static double offset_ratio(float face_center_x, int frame_width);

    bool face_centered() const { return face_centered_; }
    int offset_confirm_count() const { return offset_confirm_count_; }
    int consecutive_actions() const { return consecutive_actions_; }
    std::optional<double> smoothed_offset() const { return smooth_offset_; }
    std::optional<double> smoothed_eye_distance() const { return smooth_eye_distance_; }

private:
    int frame_width() const;
    bool read_fresh_frame(cv::Mat& frame, int flush);
    void rotate_burst(Direction direction, int speed, double duration);
    void move_burst(Direction direction, int speed, double duration);
    void track_until_centered(Direction initial_direction);

    const Config& config_;
    MotorDriver* motor_;
    FrameSource* camera_;
    ProximitySensor* proximity_;
    FaceRecognizer* recognizer_;
    ActionRecorder& recorder_;
    Display& display_;
    AudioPlayer& audio_;

    // Tracking
    bool face_centered_ = false;
    int offset_confirm_count_ = 0;
    std::optional<Direction> last_offset_direction_;

    // Follow
    std::optional<double> smooth_eye_distance_;
    std::optional<double> smooth_offset_;
    int consecutive_actions_ = 0;
};

} // namespace companion
