#pragma once

#include "Config.hpp"
#include "RobotTypes.hpp"

namespace companion {

class AudioPlayer;
class Display;
class MotorDriver;
class VoiceListener;

/**
 * @brief One-shot timeout: check() fires once when the timeout elapses
 */
class InteractionTimer {
public:
    explicit InteractionTimer(double timeout = 0.0) : timeout_(timeout) {}

    void start() { active_ = true; started_at_ = Clock::now(); }
    void start(double timeout) { timeout_ = timeout; start(); }

    // Restarts the countdown only if the timer is running
    void refresh() {
        if (active_) started_at_ = Clock::now();
    }

    bool check();
    void clear() { active_ = false; }

    bool is_active() const { return active_; }
    double elapsed() const;
    double timeout() const { return timeout_; }

private:
    bool active_ = false;
    Clock::time_point started_at_{};
    double timeout_;
};

/**
 * @brief Interaction timers, latches and the sing / spin routines
 */
class InteractionHandler {
public:
    explicit InteractionHandler(const Config& config);

    // ---- Awake ----
    void wake_up();
    void update_activity();
    /** Restart the awake period (voice command while awake) */
    void refresh_awake();

    /**
     * @brief True once when the awake period has expired
     *
     * With activity extension the robot stays awake while there has been
     * activity within the last awake_timeout seconds.
     */
    bool check_awake_timeout();
    void sleep() { awake_ = false; }
    bool is_awake() const { return awake_; }

    // ---- Voice-wake emotion ----
    void start_voice_wake_emotion() { voice_wake_.start(); }
    bool check_voice_wake_emotion_timeout() { return voice_wake_.check(); }
    bool voice_wake_active() const { return voice_wake_.is_active(); }

    // ---- Song playback ----
    void start_playing_audio() { playing_audio_ = true; }
    bool is_playing_audio() const { return playing_audio_; }
    /** True once when a song marked as playing has finished */
    bool check_audio_finished(const AudioPlayer& audio);
    void stop_playing_audio() { playing_audio_ = false; }

    // ---- Familiar interaction ----
    void start_familiar_interaction();
    void refresh_familiar_interaction() { familiar_.refresh(); }
    bool check_familiar_timeout();
    void end_familiar_interaction() { familiar_.clear(); }
    bool familiar_active() const { return familiar_.is_active(); }

    // ---- Stranger observation ----
    void start_stranger_observation();
    void refresh_stranger_observation() { stranger_.refresh(); }
    bool check_stranger_timeout();
    void end_stranger_observation() { stranger_.clear(); }
    bool stranger_active() const { return stranger_.is_active(); }

    // ---- Ultrasonic scare ----
    void trigger_ultrasonic_scared();
    bool check_ultrasonic_recovery(double recovery_delay);
    bool ultrasonic_scared_active() const { return ultrasonic_scared_.is_active(); }

    // ---- Excited window (opened by an excited touch) ----
    void start_excited_window();
    bool is_excited() const;

    // ---- Interaction routines ----
    void do_sing(Display& display, AudioPlayer& audio, VoiceListener* voice);

    /**
     * @brief Start a spin in place; the blocking latch stays set until
     *        update_blocking_action() sees spin_duration elapse
     *
     * The spin is not recorded in the action history: it ends facing the
     * same way it started.
     */
    void do_spin(Display& display, AudioPlayer& audio, MotorDriver* motor, VoiceListener* voice);

    /**
     * @brief Advance the running blocking action
     * @return true while the action is still running
     */
    bool update_blocking_action();
    bool blocking_action_active() const { return blocking_action_active_; }

private:
    void finish_spin();

    const Config& config_;

    bool awake_ = false;
    Clock::time_point awake_time_{};
    Clock::time_point last_activity_time_{};

    InteractionTimer voice_wake_;
    InteractionTimer familiar_;
    InteractionTimer stranger_;
    InteractionTimer ultrasonic_scared_;
    Clock::time_point excited_until_{};

    bool playing_audio_ = false;

    bool blocking_action_active_ = false;
    Clock::time_point spin_started_at_{};
    MotorDriver* spin_motor_ = nullptr;
    VoiceListener* spin_voice_ = nullptr;
};

} // namespace companion
