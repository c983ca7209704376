#pragma once

#include "Config.hpp"
#include "RobotTypes.hpp"
#include <optional>
#include <string>

namespace companion {

class ActionRecorder;
class Display;
class FaceRecognizer;
class FrameSource;
class MotorDriver;

enum class SearchAction {
    ROTATE_LEFT,
    ROTATE_RIGHT,
    COMPLETE
};

const char* to_string(SearchAction action);

struct SearchStep {
    SearchAction action = SearchAction::COMPLETE;
    double duration = 0.0;
    std::string message;
};

/**
 * @brief Sweep search for a person plus face centering
 *
 * Sweep: left 45 deg, then (right 90, left 90) x cycles, then right 45 back
 * to the start heading. Angles are open-loop rotation times derived from
 * deg45_duration. Every rotation is followed by a rotate_pause during which
 * the dispatcher keeps polling for a face.
 */
class SearchController {
public:
    static constexpr int COMPLETE_STEP = 4;

    SearchController(const Config& config, ActionRecorder& recorder);

    void reset();

    bool is_in_rotation_pause() const;
    void update_rotation_time();

    SearchStep get_next_search_action() const;
    void advance_step();
    bool is_search_complete() const { return step_ > 3; }

    int step() const { return step_; }
    int cycle() const { return cycle_; }
    bool face_found() const { return face_found_; }

    /** Grab one frame and run the cheap detector */
    bool detect_face_in_search(FrameSource* camera, FaceRecognizer* recognizer);

    /**
     * @brief Rotate for up to @p duration while polling for a face
     * @return true if a face was seen (motor stopped at once)
     */
    bool rotate_and_detect(Direction direction, double duration, MotorDriver* motor,
                           FrameSource* camera, FaceRecognizer* recognizer);

    /**
     * @brief Turn in small pulses until @p face sits inside the tolerance window
     * @return false only when the face was lost during a pass
     */
    bool center_face(const FaceObservation& face, MotorDriver* motor, FrameSource* camera,
                     FaceRecognizer* recognizer, Display* display);

    static bool is_centered(float face_center_x, int frame_width, double tolerance);

private:
    struct CenterPass {
        bool centered = false;
        bool overshot = false;
        std::optional<FaceObservation> last_face;
    };

    CenterPass center_pass(Direction direction, MotorDriver& motor, FrameSource* camera,
                           FaceRecognizer* recognizer, Display* display,
                           float center_x, double tolerance_px);

    const Config& config_;
    ActionRecorder& recorder_;

    int step_ = 0;
    int cycle_ = 0;
    Clock::time_point last_rotation_{};
    bool face_found_ = false;
};

} // namespace companion
