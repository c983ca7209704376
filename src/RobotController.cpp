/**
 * @file RobotController.cpp
 * @brief Behavior state machine driving the companion robot
 */

#include "RobotController.hpp"
#include "Utils.hpp"
#include <iostream>
#include <stdexcept>

namespace companion {

const char* to_string(RobotState state) {
    switch (state) {
        case RobotState::IDLE: return "IDLE";
        case RobotState::SEARCHING: return "SEARCHING";
        case RobotState::TRACKING: return "TRACKING";
        case RobotState::FAMILIAR_STAY: return "FAMILIAR_STAY";
        case RobotState::STRANGER_OBSERVE: return "STRANGER_OBSERVE";
        case RobotState::SHOCKED: return "SHOCKED";
        case RobotState::RETURNING: return "RETURNING";
    }
    return "UNKNOWN";
}

namespace {

RobotDevices require_output_devices(RobotDevices devices) {
    if (!devices.display || !devices.audio) {
        throw std::invalid_argument("RobotController needs a display and an audio player");
    }
    return devices;
}

} // namespace

RobotController::RobotController(const Config& config, RobotDevices devices)
    : config_(config),
      devices_(require_output_devices(std::move(devices))),
      recorder_(config),
      recognition_(config),
      search_(config, recorder_),
      interaction_(config),
      behavior_(config,
                devices_.motor.get(),
                devices_.camera.get(),
                devices_.proximity.get(),
                devices_.recognizer.get(),
                recorder_,
                *devices_.display,
                *devices_.audio),
      state_start_time_(Clock::now()) {}

RobotController::~RobotController() {
    cleanup();
}

bool RobotController::initialize() {
    std::cout << "Motor: " << (motor_enabled() ? "enabled" : "disabled") << std::endl;
    std::cout << "Proximity: " << (proximity_enabled() ? "enabled" : "disabled") << std::endl;
    if (face_enabled()) {
        std::cout << "Face recognition: " << devices_.recognizer->name() << " ("
                  << devices_.recognizer->known_person_count() << " known people)" << std::endl;
    } else {
        std::cout << "⚠ Face recognition disabled (no camera or models)" << std::endl;
    }

    if (voice_ && !voice_->start()) {
        std::cerr << "⚠ Voice listener failed to start - voice control disabled" << std::endl;
        voice_.reset();
    }

    std::cout << "State: IDLE (sleepy)" << std::endl;
    state_ = RobotState::IDLE;
    state_start_time_ = Clock::now();
    devices_.display->show_emotion("sleepy", true);
    return true;
}

void RobotController::attach_voice_listener(std::unique_ptr<VoiceListener> listener) {
    voice_ = std::move(listener);
}

void RobotController::run() {
    running_ = true;
    while (running_) {
        try {
            if (!tick()) break;
        } catch (const std::exception& e) {
            std::cerr << "❌ Exception in main loop: " << e.what() << std::endl;
            if (devices_.motor) devices_.motor->stop();
            utils::sleep_seconds(0.1);
        }
        utils::sleep_seconds(config_.tick_interval);
    }

    std::cout << "⚠ Main loop exited (state=" << to_string(state_) << ", frames=" << frame_count_ << ")" << std::endl;
    cleanup();
}

void RobotController::stop() {
    std::cout << "🛑 RobotController::stop() called" << std::endl;
    running_ = false;
    voice_events_.close();
    debug_commands_.close();
}

void RobotController::cleanup() {
    if (cleaned_up_) return;
    cleaned_up_ = true;

    std::cout << "Cleaning up resources..." << std::endl;
    if (voice_) {
        voice_->stop();
    }
    if (devices_.motor) {
        devices_.motor->stop();
        devices_.motor->cleanup();
    }
    if (devices_.camera) {
        devices_.camera->release();
    }
    if (devices_.proximity) {
        devices_.proximity->cleanup();
    }
    if (devices_.audio) {
        devices_.audio->stop_all();
    }
    std::cout << "✓ Cleanup complete" << std::endl;
}

void RobotController::change_state(RobotState new_state) {
    RobotState old_state = state_;
    if (new_state == old_state) return;

    if (config_.debug) {
        std::cout << "\n==================================================" << std::endl;
        std::cout << "State transition: " << to_string(old_state) << " -> " << to_string(new_state) << std::endl;
        std::cout << "==================================================" << std::endl;
    }

    state_ = new_state;
    state_start_time_ = Clock::now();
    state_entry_done_ = false;

    if (state_callback_) {
        state_callback_(old_state, new_state);
    }
}

double RobotController::time_in_state() const {
    return utils::seconds_since(state_start_time_);
}

// ============================================================================
// Main tick
// ============================================================================

bool RobotController::tick() {
    process_debug_commands();
    if (quit_requested_) return false;

    Display& display = *devices_.display;

    // Spin and other blocking actions own the robot until they finish
    if (interaction_.blocking_action_active()) {
        interaction_.update_blocking_action();
        display.update(config_.tick_interval);
        return !quit_requested_;
    }

    switch (state_.load()) {
        case RobotState::IDLE: update_idle(); break;
        case RobotState::SEARCHING: update_searching(); break;
        case RobotState::TRACKING: update_tracking(); break;
        case RobotState::FAMILIAR_STAY: update_familiar_stay(); break;
        case RobotState::STRANGER_OBSERVE: update_stranger_observe(); break;
        case RobotState::SHOCKED: update_shocked(); break;
        case RobotState::RETURNING: update_returning(); break;
    }

    if (recorder_.is_returning()) {
        check_return_obstacle();
        process_voice_events();
        display.update(config_.tick_interval);
        return !quit_requested_;
    }

    if (interaction_.voice_wake_active() && !recognition_.is_registering()) {
        if (interaction_.check_voice_wake_emotion_timeout() && state_ == RobotState::IDLE) {
            display.show_emotion("sleepy");
            if (config_.debug) {
                std::cout << "Emotion restored to sleepy" << std::endl;
            }
        }
    }

    if (interaction_.check_awake_timeout()) {
        std::cout << "💤 Awake period over - voice commands need a wake phrase" << std::endl;
    }

    if (interaction_.check_audio_finished(*devices_.audio)) {
        std::cout << "Audio playback finished; resuming voice recognition" << std::endl;
        resume_voice();
    }

    check_proximity_alert();
    process_voice_events();
    process_touch_events();
    if (quit_requested_) return false;

    if (recognition_.is_registering() && face_enabled()) {
        cv::Mat frame;
        if (devices_.camera->read(frame)) {
            recognition_.handle_registration(frame, *devices_.recognizer,
                                             [this]() { on_registration_complete(); });
        }
    }

    ++frame_count_;
    display.update(config_.tick_interval);
    return !quit_requested_;
}

// ============================================================================
// State updates
// ============================================================================

void RobotController::update_idle() {
    // Voice-wake and proximity emotions run out on their own timers
    if (recognition_.is_registering() || interaction_.voice_wake_active() ||
        interaction_.ultrasonic_scared_active()) {
        return;
    }
    if (devices_.display->current_emotion() != "sleepy") {
        devices_.display->show_emotion("sleepy");
    }
}

void RobotController::update_searching() {
    interaction_.update_activity();

    if (search_.is_in_rotation_pause()) {
        if (search_.detect_face_in_search(devices_.camera.get(), devices_.recognizer.get())) {
            recognition_.reset_counters();
            change_state(RobotState::TRACKING);
        }
        return;
    }

    SearchStep next = search_.get_next_search_action();
    if (next.action == SearchAction::COMPLETE) {
        std::cout << "Search complete; no face found; returning to start position" << std::endl;
        start_returning();
        return;
    }

    std::cout << next.message << std::endl;
    Direction direction = next.action == SearchAction::ROTATE_LEFT ? Direction::LEFT : Direction::RIGHT;
    bool found = search_.rotate_and_detect(direction, next.duration, devices_.motor.get(),
                                           devices_.camera.get(), devices_.recognizer.get());
    if (found) {
        recognition_.reset_counters();
        change_state(RobotState::TRACKING);
        return;
    }

    search_.update_rotation_time();
    search_.advance_step();
}

void RobotController::update_tracking() {
    interaction_.update_activity();

    if (!face_enabled()) {
        start_returning();
        return;
    }
    if (recognition_.should_skip_recognition_frame(frame_count_)) {
        return;
    }

    cv::Mat frame;
    if (!devices_.camera->read(frame)) {
        return;
    }

    auto faces = devices_.recognizer->detect_and_recognize(frame);
    const FaceObservation* largest = get_largest_face(faces);
    if (!largest) {
        if (recognition_.on_face_lost()) {
            if (recognition_.is_registering()) {
                std::cout << "⚠ Nobody to register; registration cancelled" << std::endl;
                recognition_.cancel_registration();
            }
            std::cout << "Face lost; continuing search..." << std::endl;
            recognition_.reset_counters();
            change_state(RobotState::SEARCHING);
        }
        return;
    }

    recognition_.on_face_detected();

    // Samples are being collected; identity is decided once registration completes
    if (recognition_.is_registering()) {
        return;
    }

    const FaceObservation face = *largest;
    const RecognitionLabel label = face.identity ? RecognitionLabel::FAMILIAR : RecognitionLabel::STRANGER;
    recognition_.update_counter(label);

    if (config_.debug) {
        std::cout << (face.identity ? "Familiar: " + *face.identity : std::string("Stranger"))
                  << " (similarity " << face.similarity << ") | count " << recognition_.get_count(label)
                  << "/" << config_.recognition.confirm_count << std::endl;
    }

    if (!recognition_.is_confirmed(label)) {
        return;
    }

    std::cout << "Centering face..." << std::endl;
    search_.center_face(face, devices_.motor.get(), devices_.camera.get(),
                        devices_.recognizer.get(), devices_.display.get());

    if (label == RecognitionLabel::FAMILIAR) {
        std::cout << "✓ Confirmed familiar: " << *face.identity << "! Approaching..." << std::endl;
        devices_.display->show_emotion("happy");
        devices_.audio->play_sound("happy");

        behavior_.approach_familiar_person();

        recognition_.reset_counters();
        interaction_.start_familiar_interaction();
        change_state(RobotState::FAMILIAR_STAY);
    } else {
        std::cout << "⚠ Confirmed stranger! Entering shocked mode" << std::endl;
        devices_.display->show_emotion("shocked");

        recognition_.reset_counters();
        interaction_.start_stranger_observation();
        change_state(RobotState::SHOCKED);
    }
}

void RobotController::update_familiar_stay() {
    Display& display = *devices_.display;
    if (interaction_.is_playing_audio()) {
        display.show_emotion("sing");
    } else if (interaction_.is_excited()) {
        display.show_emotion("excited");
    } else {
        display.show_emotion("happy");
    }

    if (interaction_.check_familiar_timeout()) {
        start_returning();
        behavior_.reset_follow_state();
        return;
    }

    if (!face_enabled()) {
        return;
    }

    if (behavior_.follow_familiar_person()) {
        interaction_.refresh_familiar_interaction();
        interaction_.update_activity();
    }
}

void RobotController::update_shocked() {
    if (!state_entry_done_) {
        state_entry_done_ = true;
        if (!recognition_.is_registering()) {
            devices_.display->show_emotion("shocked");
            devices_.audio->play_sound("thinking");
        }
    }

    interaction_.update_activity();

    if (interaction_.check_stranger_timeout()) {
        std::cout << "Stranger observation timed out; returning to start position" << std::endl;
        start_returning();
        return;
    }

    if (!config_.interaction.stranger_track_enabled || !face_enabled() ||
        recognition_.should_skip_recognition_frame(frame_count_)) {
        return;
    }

    cv::Mat frame;
    if (!devices_.camera->read(frame)) {
        return;
    }

    auto faces = devices_.recognizer->detect_and_recognize(frame);
    const FaceObservation* face = get_largest_face(faces);
    if (!face) {
        if (recognition_.on_face_lost()) {
            std::cout << "Stranger left; returning to start position" << std::endl;
            start_returning();
        }
        return;
    }

    recognition_.on_face_detected();
    behavior_.track_face_position(*face);
}

void RobotController::update_stranger_observe() {
    if (!state_entry_done_) {
        state_entry_done_ = true;
        flinch_finished_at_.reset();
        if (!recognition_.is_registering()) {
            devices_.display->show_emotion("scared");
            devices_.audio->play_sound("scared");
        }
    }

    interaction_.update_activity();

    if (!flinch_finished_at_) {
        std::cout << "Scared! Moving backward..." << std::endl;
        const double duration = config_.interaction.flinch_duration;

        recorder_.start_action(ActionKind::MOVE, Direction::BACKWARD);
        if (motor_enabled()) {
            devices_.motor->backward();
            utils::sleep_seconds(duration);
            devices_.motor->stop();
        } else {
            utils::sleep_seconds(duration);
        }
        recorder_.stop_action();

        flinch_finished_at_ = Clock::now();
        interaction_.refresh_stranger_observation();
    }

    if (utils::seconds_since(*flinch_finished_at_) > config_.interaction.flinch_settle) {
        std::cout << "Scared sequence finished; back to shocked" << std::endl;
        flinch_finished_at_.reset();
        change_state(RobotState::SHOCKED);
    }
}

void RobotController::update_returning() {
    interaction_.update_activity();

    bool done = recorder_.execute_return_action(
        devices_.motor.get(),
        [this]() { return behavior_.check_obstacle_while_moving(); });

    if (done) {
        std::cout << "✓ Back at the start position" << std::endl;
        change_state(RobotState::IDLE);
        devices_.display->show_emotion("sleepy");
    }
}

void RobotController::start_returning() {
    if (state_ == RobotState::FAMILIAR_STAY) {
        devices_.audio->play_sound("bye");
    }
    if (recognition_.is_registering()) {
        recognition_.cancel_registration();
    }
    interaction_.end_familiar_interaction();
    interaction_.end_stranger_observation();

    if (!recorder_.start_returning()) {
        if (config_.debug) {
            std::cout << "No action history; going straight to IDLE" << std::endl;
        }
        change_state(RobotState::IDLE);
        devices_.display->show_emotion("sleepy");
        return;
    }

    std::cout << "Returning home (" << recorder_.get_action_count() << " actions)" << std::endl;
    change_state(RobotState::RETURNING);
    devices_.display->show_emotion("neutral");
}

// ============================================================================
// Cross-cutting checks
// ============================================================================

void RobotController::check_return_obstacle() {
    if (!proximity_enabled() || !devices_.proximity->is_object_near()) {
        return;
    }
    if (devices_.motor) {
        devices_.motor->stop();
    }
    if (config_.debug) {
        std::cout << "🛑 Obstacle detected while returning; pausing" << std::endl;
    }
    devices_.audio->play_sound("obstacle");
    utils::sleep_seconds(config_.ultrasonic.return_pause);
}

void RobotController::check_proximity_alert() {
    if (!proximity_enabled() || recognition_.is_registering() || state_ != RobotState::IDLE) {
        return;
    }

    Display& display = *devices_.display;
    if (devices_.proximity->is_object_near()) {
        if (!interaction_.ultrasonic_scared_active()) {
            if (devices_.motor) {
                devices_.motor->stop();
            }
            display.show_emotion("scared");
            devices_.audio->play_sound("scared");
            if (config_.debug) {
                ProximityStatus status = devices_.proximity->get_status();
                std::string triggered;
                for (const auto& name : status.triggered) {
                    triggered += (triggered.empty() ? "" : ", ") + name;
                }
                std::cout << "🛑 Proximity alert! Triggered sensors: " << triggered << std::endl;
            }
        }
        interaction_.trigger_ultrasonic_scared();
        return;
    }

    if (interaction_.check_ultrasonic_recovery(config_.ultrasonic.recovery_delay)) {
        display.show_emotion("sleepy");
        if (config_.debug) {
            std::cout << "Object cleared; restoring sleepy" << std::endl;
        }
    }
}

// ============================================================================
// Voice
// ============================================================================

void RobotController::post_voice_wake(const std::string& transcript) {
    voice_events_.push(VoiceEvent{true, "", transcript});
}

void RobotController::post_voice_command(const std::string& command, const std::string& transcript) {
    voice_events_.push(VoiceEvent{false, command, transcript});
}

void RobotController::process_voice_events() {
    for (auto& event : voice_events_.drain()) {
        if (event.wake) {
            on_voice_wake(event.transcript);
        } else {
            on_voice_command(event.command, event.transcript);
        }
    }
}

void RobotController::on_voice_wake(const std::string& transcript) {
    if (recognition_.is_registering() || recorder_.is_returning() || state_ != RobotState::IDLE) {
        return;
    }
    std::cout << "Wake phrase detected: " << transcript << std::endl;
    wake_and_search();
}

void RobotController::wake_and_search() {
    std::cout << "Woken up! Entering SEARCHING" << std::endl;
    recorder_.clear();
    interaction_.wake_up();

    change_state(RobotState::SEARCHING);
    devices_.display->show_emotion("curious");
    devices_.audio->play_sound("awake");
    search_.reset();
}

void RobotController::on_voice_command(const std::string& command, const std::string& transcript) {
    if (recorder_.is_returning()) {
        if (config_.debug) {
            std::cout << "Returning; ignoring command: " << command << std::endl;
        }
        return;
    }
    if (!interaction_.is_awake()) {
        if (config_.debug) {
            std::cout << "Not awake; ignoring command: " << command << std::endl;
        }
        return;
    }

    std::cout << "Voice command: " << command << " (transcript: " << transcript << ")" << std::endl;

    interaction_.refresh_awake();
    interaction_.refresh_familiar_interaction();
    interaction_.refresh_stranger_observation();

    const bool familiar_only = command == "sing" || command == "spin" || command == "back";
    if (familiar_only && state_ != RobotState::FAMILIAR_STAY) {
        if (config_.debug) {
            std::cout << "Command '" << command << "' only works with a familiar person (state: "
                      << to_string(state_) << ")" << std::endl;
        }
        return;
    }

    if (command == "sing") {
        interaction_.do_sing(*devices_.display, *devices_.audio, voice_.get());
    } else if (command == "spin") {
        interaction_.do_spin(*devices_.display, *devices_.audio, devices_.motor.get(), voice_.get());
    } else if (command == "back") {
        std::cout << "'Back' command received; starting return..." << std::endl;
        start_returning();
    } else if (command == "friends") {
        std::cout << "'Friends' command received; starting registration..." << std::endl;
        start_registration();
    } else {
        std::cerr << "⚠ Unknown voice command: " << command << std::endl;
    }
}

void RobotController::resume_voice() {
    if (voice_) voice_->resume();
    interaction_.stop_playing_audio();
}

// ============================================================================
// Registration
// ============================================================================

void RobotController::start_registration() {
    if (!face_enabled()) {
        std::cerr << "❌ Face recognition unavailable - cannot register" << std::endl;
        return;
    }
    if (recognition_.start_registration()) {
        devices_.display->show_emotion("curious");
    }
}

void RobotController::on_registration_complete() {
    devices_.display->show_emotion("happy");
    devices_.audio->play_sound("friends");

    std::cout << "✓ Registration complete; re-identifying in TRACKING" << std::endl;
    recognition_.reset_counters();
    change_state(RobotState::TRACKING);

    if (config_.registration.auto_recovery) {
        interaction_.start_voice_wake_emotion();
    }
}

// ============================================================================
// Touch
// ============================================================================

void RobotController::process_touch_events() {
    while (auto event = devices_.display->get_touch_event()) {
        handle_touch(*event);
        if (quit_requested_) return;
    }
}

void RobotController::handle_touch(const TouchEvent& event) {
    if (event.kind == TouchEvent::Kind::QUIT) {
        std::cout << "Quit requested from display" << std::endl;
        quit_requested_ = true;
        return;
    }
    if (event.kind != TouchEvent::Kind::TOUCH_END) {
        return;
    }

    Display& display = *devices_.display;

    if (interaction_.is_playing_audio()) {
        std::cout << "Touch detected; stopping audio playback" << std::endl;
        devices_.audio->stop_all();
        resume_voice();
        if (state_ == RobotState::FAMILIAR_STAY) {
            display.show_emotion("happy");
        } else if (state_ == RobotState::IDLE) {
            display.show_emotion("sleepy");
        }
        return;
    }

    if (config_.debug) {
        std::cout << "Touch duration: " << event.duration << "s" << std::endl;
    }

    bool excited = false;
    if (event.duration >= config_.interaction.min_touch_duration) {
        display.show_emotion("excited");
        devices_.audio->play_sound("excited");
        excited = true;
    }

    if (state_ == RobotState::SHOCKED) {
        std::cout << "Stranger touch detected! Entering scared state" << std::endl;
        change_state(RobotState::STRANGER_OBSERVE);
        return;
    }

    if (interaction_.familiar_active()) {
        interaction_.refresh_familiar_interaction();
        if (excited) {
            std::cout << "Familiar touch detected! Excited for "
                      << config_.interaction.excited_duration << "s" << std::endl;
            interaction_.start_excited_window();
        }
    }

    if (excited && state_ == RobotState::IDLE) {
        std::cout << "Touch wake!" << std::endl;
        wake_and_search();
    }
}

// ============================================================================
// Debug console
// ============================================================================

void RobotController::post_debug_command(const std::string& line) {
    debug_commands_.push(line);
}

void RobotController::process_debug_commands() {
    for (const auto& command : debug_commands_.drain()) {
        handle_debug_command(command);
    }
}

void RobotController::handle_debug_command(const std::string& command) {
    MotorDriver* motor = devices_.motor.get();

    if (command == "1") {
        std::cout << "SIM: wake 'hey'" << std::endl;
        on_voice_wake("hey");
    } else if (command == "2") {
        std::cout << "SIM: 'sing'" << std::endl;
        on_voice_command("sing", "sing");
    } else if (command == "3") {
        std::cout << "SIM: 'spin'" << std::endl;
        on_voice_command("spin", "spin");
    } else if (command == "4") {
        std::cout << "SIM: 'friends'" << std::endl;
        on_voice_command("friends", "friends");
    } else if (command == "5") {
        std::cout << "SIM: 'back'" << std::endl;
        on_voice_command("back", "back");
    } else if (command == "[" || command == "]" || command == "-" || command == "=") {
        if (!motor) return;
        const std::string side = (command == "[" || command == "]") ? "left" : "right";
        const double delta = (command == "]" || command == "=") ? 0.05 : -0.05;
        motor->adjust_calibration(side, delta);
    } else if (command == "s") {
        if (motor && !motor->save_calibration()) {
            std::cerr << "❌ Failed to save motor trim" << std::endl;
        }
    } else if (command == "q") {
        std::cout << "Exiting..." << std::endl;
        quit_requested_ = true;
    } else {
        std::cout << "Unknown debug command: " << command << std::endl;
    }
}

} // namespace companion
