#include "InteractionHandler.hpp"
#include "AudioPlayer.hpp"
#include "Display.hpp"
#include "MotorDriver.hpp"
#include "Utils.hpp"
#include "VoiceListener.hpp"
#include <iostream>

namespace companion {

bool InteractionTimer::check() {
    if (!active_) return false;
    if (elapsed() >= timeout_) {
        active_ = false;
        return true;
    }
    return false;
}

double InteractionTimer::elapsed() const {
    return active_ ? utils::seconds_since(started_at_) : 0.0;
}

InteractionHandler::InteractionHandler(const Config& config)
    : config_(config),
      voice_wake_(config.interaction.voice_wake_duration),
      familiar_(config.interaction.familiar_idle_timeout),
      stranger_(config.interaction.stranger_track_timeout),
      ultrasonic_scared_(config.ultrasonic.recovery_delay) {}

void InteractionHandler::wake_up() {
    awake_ = true;
    awake_time_ = Clock::now();
    last_activity_time_ = awake_time_;
}

void InteractionHandler::update_activity() {
    last_activity_time_ = Clock::now();
}

void InteractionHandler::refresh_awake() {
    if (awake_) awake_time_ = Clock::now();
}

bool InteractionHandler::check_awake_timeout() {
    if (!awake_) return false;

    const double timeout = config_.interaction.awake_timeout;
    const double inactive = utils::seconds_since(last_activity_time_);
    if (config_.interaction.awake_activity_extend && inactive < timeout) {
        return false;
    }

    if (utils::seconds_since(awake_time_) >= timeout) {
        awake_ = false;
        if (config_.debug) {
            std::cout << "Sleep timeout (" << inactive << "s inactive)" << std::endl;
        }
        return true;
    }
    return false;
}

bool InteractionHandler::check_audio_finished(const AudioPlayer& audio) {
    if (playing_audio_ && !audio.is_music_playing()) {
        playing_audio_ = false;
        return true;
    }
    return false;
}

void InteractionHandler::start_familiar_interaction() {
    familiar_.start();
    std::cout << "Enter familiar interaction (timeout: " << familiar_.timeout() << "s)" << std::endl;
}

bool InteractionHandler::check_familiar_timeout() {
    double idle = familiar_.elapsed();
    if (familiar_.check()) {
        std::cout << "Familiar interaction timed out (" << idle << "s)" << std::endl;
        return true;
    }
    return false;
}

void InteractionHandler::start_stranger_observation() {
    stranger_.start();
    std::cout << "Enter stranger observation (timeout: " << stranger_.timeout() << "s)" << std::endl;
}

bool InteractionHandler::check_stranger_timeout() {
    if (stranger_.check()) {
        std::cout << "Stranger observation timed out" << std::endl;
        return true;
    }
    return false;
}

void InteractionHandler::trigger_ultrasonic_scared() {
    ultrasonic_scared_.start();
}

bool InteractionHandler::check_ultrasonic_recovery(double recovery_delay) {
    if (!ultrasonic_scared_.is_active()) return false;
    if (ultrasonic_scared_.elapsed() >= recovery_delay) {
        ultrasonic_scared_.clear();
        return true;
    }
    return false;
}

void InteractionHandler::start_excited_window() {
    excited_until_ = Clock::now() + std::chrono::duration_cast<Clock::duration>(
        std::chrono::duration<double>(config_.interaction.excited_duration));
}

bool InteractionHandler::is_excited() const {
    return Clock::now() < excited_until_;
}

void InteractionHandler::do_sing(Display& display, AudioPlayer& audio, VoiceListener* voice) {
    std::cout << "Action: sing" << std::endl;

    if (voice) voice->pause();
    display.show_emotion("sing");

    const std::string& song = config_.interaction.sing_audio_file;
    if (utils::file_exists(song) && audio.play_file(song, false)) {
        start_playing_audio();
        return;
    }

    std::cerr << "⚠ Sing audio unavailable: " << song << std::endl;
    audio.play_sound("happy");
    if (voice) voice->resume();
}

void InteractionHandler::do_spin(Display& display, AudioPlayer& audio, MotorDriver* motor, VoiceListener* voice) {
    std::cout << "Action: spin" << std::endl;

    blocking_action_active_ = true;
    spin_voice_ = voice;
    if (voice) voice->pause();

    display.show_emotion("excited");
    audio.play_sound("excited");

    if (!motor || !motor->enabled()) {
        std::cout << "Motor not enabled; cannot spin" << std::endl;
        spin_motor_ = nullptr;
        finish_spin();
        return;
    }

    spin_motor_ = motor;
    spin_started_at_ = Clock::now();
    motor->turn_right(config_.interaction.spin_speed);
}

bool InteractionHandler::update_blocking_action() {
    if (!blocking_action_active_) return false;

    if (spin_motor_ && utils::seconds_since(spin_started_at_) < config_.interaction.spin_duration) {
        return true;
    }

    finish_spin();
    return false;
}

void InteractionHandler::finish_spin() {
    if (spin_motor_) {
        spin_motor_->stop();
        spin_motor_ = nullptr;
    }
    if (spin_voice_) {
        spin_voice_->resume();
        spin_voice_ = nullptr;
    }
    blocking_action_active_ = false;
    start_voice_wake_emotion();
}

} // namespace companion
