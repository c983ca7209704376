#include "Config.hpp"

#include <fstream>
#include <iostream>
#include <sstream>

#include <nlohmann/json.hpp>

namespace companion {

namespace {

using nlohmann::json;

template <typename T>
void read(const json& section, const char* key, T& field) {
    field = section.value(key, field);
}

void read_camera(const json& j, CameraSettings& c) {
    read(j, "index", c.index);
    read(j, "width", c.width);
    read(j, "height", c.height);
    read(j, "fps", c.fps);
}

void read_motor(const json& j, MotorSettings& m) {
    read(j, "enabled", m.enabled);
    read(j, "default_speed", m.default_speed);
    read(j, "move_duration", m.move_duration);
    read(j, "left_speed_factor", m.left_speed_factor);
    read(j, "right_speed_factor", m.right_speed_factor);
    read(j, "calibration_path", m.calibration_path);
    read(j, "left_pin1", m.left_pin1);
    read(j, "left_pin2", m.left_pin2);
    read(j, "right_pin1", m.right_pin1);
    read(j, "right_pin2", m.right_pin2);
    read(j, "pwm_chip", m.pwm_chip);
    read(j, "left_pwm_channel", m.left_pwm_channel);
    read(j, "right_pwm_channel", m.right_pwm_channel);
    read(j, "pwm_frequency_hz", m.pwm_frequency_hz);
}

void read_search(const json& j, SearchSettings& s) {
    read(j, "cycles", s.cycles);
    read(j, "rotate_pause", s.rotate_pause);
    read(j, "rotate_speed", s.rotate_speed);
    read(j, "deg45_duration", s.deg45_duration);
    read(j, "step_duration", s.step_duration);
    read(j, "step_pause", s.step_pause);
    read(j, "detect_poll_interval", s.detect_poll_interval);
}

void read_face_center(const json& j, FaceCenterSettings& f) {
    read(j, "enabled", f.enabled);
    read(j, "tolerance", f.tolerance);
    read(j, "speed", f.speed);
    read(j, "timeout", f.timeout);
    read(j, "step_duration", f.step_duration);
    read(j, "step_pause", f.step_pause);
    read(j, "confirm_count", f.confirm_count);
    read(j, "max_passes", f.max_passes);
    read(j, "max_track_rotations", f.max_track_rotations);
}

void read_approach(const json& j, ApproachSettings& a) {
    read(j, "visual_distance_enabled", a.visual_distance_enabled);
    read(j, "face_close_threshold", a.face_close_threshold);
    read(j, "face_close_eye_distance", a.face_close_eye_distance);
    read(j, "max_approach_time", a.max_approach_time);
    read(j, "check_interval", a.check_interval);
}

void read_follow(const json& j, FollowSettings& f) {
    read(j, "smoothing_alpha", f.smoothing_alpha);
    read(j, "deadband_ratio", f.deadband_ratio);
    read(j, "speed", f.speed);
    read(j, "rotate_burst", f.rotate_burst);
    read(j, "move_burst", f.move_burst);
    read(j, "max_consecutive_actions", f.max_consecutive_actions);
    read(j, "cooldown", f.cooldown);
}

void read_recognition(const json& j, RecognitionSettings& r) {
    read(j, "confirm_count", r.confirm_count);
    read(j, "no_face_reset_count", r.no_face_reset_count);
    read(j, "recognition_interval", r.recognition_interval);
    read(j, "threshold", r.threshold);
    read(j, "margin", r.margin);
}

void read_registration(const json& j, RegistrationSettings& r) {
    read(j, "samples_per_person", r.samples_per_person);
    read(j, "sample_interval", r.sample_interval);
    read(j, "auto_recovery", r.auto_recovery);
}

void read_interaction(const json& j, InteractionSettings& i) {
    read(j, "familiar_idle_timeout", i.familiar_idle_timeout);
    read(j, "stranger_track_timeout", i.stranger_track_timeout);
    read(j, "stranger_track_enabled", i.stranger_track_enabled);
    read(j, "awake_timeout", i.awake_timeout);
    read(j, "awake_activity_extend", i.awake_activity_extend);
    read(j, "voice_wake_duration", i.voice_wake_duration);
    read(j, "excited_duration", i.excited_duration);
    read(j, "min_touch_duration", i.min_touch_duration);
    read(j, "flinch_duration", i.flinch_duration);
    read(j, "flinch_settle", i.flinch_settle);
    read(j, "spin_duration", i.spin_duration);
    read(j, "spin_speed", i.spin_speed);
    read(j, "sing_audio_file", i.sing_audio_file);
}

void read_ultrasonic(const json& j, UltrasonicSettings& u) {
    read(j, "enabled", u.enabled);
    read(j, "distance_threshold", u.distance_threshold);
    read(j, "echo_timeout", u.echo_timeout);
    read(j, "measure_interval", u.measure_interval);
    read(j, "recovery_delay", u.recovery_delay);
    read(j, "return_pause", u.return_pause);

    if (j.contains("sensors") && j["sensors"].is_array()) {
        u.sensors.clear();
        for (const auto& s : j["sensors"]) {
            UltrasonicSensorPins pins;
            pins.name = s.value("name", std::string("sensor"));
            pins.trig_pin = s.value("trig", 0);
            pins.echo_pin = s.value("echo", 0);
            u.sensors.push_back(pins);
        }
    }
}

void read_voice(const json& j, VoiceSettings& v) {
    read(j, "enabled", v.enabled);
    read(j, "transcript_fifo", v.transcript_fifo);
    read(j, "listen_timeout", v.listen_timeout);

    if (j.contains("wake_phrases") && j["wake_phrases"].is_array()) {
        v.wake_phrases = j["wake_phrases"].get<std::vector<std::string>>();
    }

    // Array of {"name": ..., "phrases": [...]} keeps the match order explicit
    if (j.contains("commands") && j["commands"].is_array()) {
        v.commands.clear();
        for (const auto& c : j["commands"]) {
            v.commands.emplace_back(
                c.value("name", std::string()),
                c.value("phrases", std::vector<std::string>{}));
        }
    }
}

void read_audio(const json& j, AudioSettings& a) {
    read(j, "sounds_dir", a.sounds_dir);
    read(j, "device", a.device);
    read(j, "min_interval", a.min_interval);
}

void read_display(const json& j, DisplaySettings& d) {
    read(j, "width", d.width);
    read(j, "height", d.height);
    read(j, "emotions_dir", d.emotions_dir);
    read(j, "emotion_change_delay", d.emotion_change_delay);
    read(j, "show_window", d.show_window);
    read(j, "framebuffer_device", d.framebuffer_device);
    read(j, "touch_device", d.touch_device);
}

void read_models(const json& j, ModelSettings& m) {
    read(j, "yunet_path", m.yunet_path);
    read(j, "sface_path", m.sface_path);
    read(j, "detect_score_threshold", m.detect_score_threshold);
    read(j, "detect_nms_threshold", m.detect_nms_threshold);
    read(j, "detect_top_k", m.detect_top_k);
    read(j, "min_face_size", m.min_face_size);
    read(j, "face_database_path", m.face_database_path);
}

template <typename Section, typename Reader>
void read_section(const json& root, const char* name, Section& section, Reader reader) {
    if (root.contains(name) && root[name].is_object()) {
        reader(root[name], section);
    }
}

} // namespace

bool apply_config_json(const std::string& json_text, Config& config) {
    try {
        json root = json::parse(json_text);
        if (!root.is_object()) {
            std::cerr << "⚠ Config root is not an object - using defaults" << std::endl;
            return false;
        }

        read(root, "debug", config.debug);
        read(root, "tick_interval", config.tick_interval);
        read(root, "return_settle_delay", config.return_settle_delay);
        read(root, "return_obstacle_max_wait", config.return_obstacle_max_wait);

        read_section(root, "camera", config.camera, read_camera);
        read_section(root, "motor", config.motor, read_motor);
        read_section(root, "search", config.search, read_search);
        read_section(root, "face_center", config.face_center, read_face_center);
        read_section(root, "approach", config.approach, read_approach);
        read_section(root, "follow", config.follow, read_follow);
        read_section(root, "recognition", config.recognition, read_recognition);
        read_section(root, "registration", config.registration, read_registration);
        read_section(root, "interaction", config.interaction, read_interaction);
        read_section(root, "ultrasonic", config.ultrasonic, read_ultrasonic);
        read_section(root, "voice", config.voice, read_voice);
        read_section(root, "audio", config.audio, read_audio);
        read_section(root, "display", config.display, read_display);
        read_section(root, "models", config.models, read_models);
        return true;
    } catch (const json::exception& e) {
        std::cerr << "❌ Config parse error: " << e.what() << std::endl;
        return false;
    }
}

bool load_config(const std::string& path, Config& config) {
    std::ifstream config_file(path);
    if (!config_file.is_open()) {
        std::cout << "⚠ No config at " << path << " - using built-in defaults" << std::endl;
        return true;
    }

    std::stringstream buffer;
    buffer << config_file.rdbuf();
    if (!apply_config_json(buffer.str(), config)) {
        std::cerr << "⚠ Ignoring " << path << " - using built-in defaults" << std::endl;
        return false;
    }

    std::cout << "✓ Loaded config: " << path << std::endl;
    return true;
}

} // namespace companion
