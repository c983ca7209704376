#pragma once

/**
 * @file RobotController.hpp
 * @brief Behavior state machine driving the companion robot
 */

#include "ActionRecorder.hpp"
#include "AsyncQueue.hpp"
#include "AudioPlayer.hpp"
#include "BehaviorController.hpp"
#include "Config.hpp"
#include "Display.hpp"
#include "FaceRecognizer.hpp"
#include "FrameSource.hpp"
#include "InteractionHandler.hpp"
#include "MotorDriver.hpp"
#include "ProximitySensor.hpp"
#include "RecognitionHandler.hpp"
#include "SearchController.hpp"
#include "VoiceListener.hpp"

#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace companion {

enum class RobotState {
    IDLE,              // Asleep, waiting for a wake phrase or touch
    SEARCHING,         // Sweeping for a face
    TRACKING,          // Face in view, debouncing familiar / stranger
    FAMILIAR_STAY,     // Following a known person
    STRANGER_OBSERVE,  // Touched by a stranger: one backward flinch
    SHOCKED,           // Watching a stranger
    RETURNING          // Replaying the way home
};

const char* to_string(RobotState state);

/**
 * @brief Hardware and perception collaborators handed to the controller
 *
 * Display and audio are required (the controller constructor throws
 * std::invalid_argument without them). Every other device may be null; the
 * controller then runs with that capability missing.
 */
struct RobotDevices {
    std::unique_ptr<Display> display;
    std::unique_ptr<AudioPlayer> audio;
    std::unique_ptr<MotorDriver> motor;
    std::unique_ptr<FrameSource> camera;
    std::unique_ptr<ProximitySensor> proximity;
    std::unique_ptr<FaceRecognizer> recognizer;
};

/**
 * @brief Single-threaded cooperative dispatcher
 *
 * Voice and debug input arrive from their own threads through post_*()
 * and are drained on the control thread once per tick. All actuation
 * happens inside tick().
 */
class RobotController {
public:
    using StateCallback = std::function<void(RobotState from, RobotState to)>;

    RobotController(const Config& config, RobotDevices devices);
    ~RobotController();

    bool initialize();

    /** Tick until stop() or a quit request, then clean up */
    void run();
    void stop();

    /**
     * @brief Run one control iteration
     * @return false once a quit was requested
     */
    bool tick();

    void cleanup();

    void change_state(RobotState new_state);
    void set_state_callback(StateCallback callback) { state_callback_ = std::move(callback); }

    void attach_voice_listener(std::unique_ptr<VoiceListener> listener);

    // Thread-safe event entry points
    void post_voice_wake(const std::string& transcript);
    void post_voice_command(const std::string& command, const std::string& transcript);
    void post_debug_command(const std::string& line);

    RobotState state() const { return state_; }
    double time_in_state() const;
    bool is_running() const { return running_; }
    bool quit_requested() const { return quit_requested_; }
    long frame_count() const { return frame_count_; }

    ActionRecorder& action_recorder() { return recorder_; }
    RecognitionHandler& recognition() { return recognition_; }
    SearchController& search() { return search_; }
    InteractionHandler& interaction() { return interaction_; }
    BehaviorController& behavior() { return behavior_; }
    Display& display() { return *devices_.display; }

private:
    struct VoiceEvent {
        bool wake = false;
        std::string command;
        std::string transcript;
    };

    // Per-state updates
    void update_idle();
    void update_searching();
    void update_tracking();
    void update_familiar_stay();
    void update_shocked();
    void update_stranger_observe();
    void update_returning();
    void start_returning();

    // Events
    void on_voice_wake(const std::string& transcript);
    void on_voice_command(const std::string& command, const std::string& transcript);
    void handle_debug_command(const std::string& command);
    void handle_touch(const TouchEvent& event);
    void wake_and_search();

    // Cross-cutting checks
    void process_debug_commands();
    void process_voice_events();
    void process_touch_events();
    void check_return_obstacle();
    void check_proximity_alert();

    void start_registration();
    void on_registration_complete();
    void resume_voice();

    bool face_enabled() const { return devices_.camera && devices_.recognizer; }
    bool motor_enabled() const { return devices_.motor && devices_.motor->enabled(); }
    bool proximity_enabled() const { return devices_.proximity && devices_.proximity->enabled(); }

    const Config& config_;
    RobotDevices devices_;
    std::unique_ptr<VoiceListener> voice_;

    ActionRecorder recorder_;
    RecognitionHandler recognition_;
    SearchController search_;
    InteractionHandler interaction_;
    BehaviorController behavior_;

    // State Management
    std::atomic<RobotState> state_{RobotState::IDLE};
    Clock::time_point state_start_time_{};
    bool state_entry_done_ = false;
    std::optional<Clock::time_point> flinch_finished_at_;
    StateCallback state_callback_;

    std::atomic<bool> running_{false};
    std::atomic<bool> quit_requested_{false};
    bool cleaned_up_ = false;
    long frame_count_ = 0;

    AsyncQueue<VoiceEvent> voice_events_;
    AsyncQueue<std::string> debug_commands_;
};

} // namespace companion
