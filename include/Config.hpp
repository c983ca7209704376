#pragma once

/**
 * @file Config.hpp
 * @brief Immutable runtime configuration for the companion robot
 *
 * Defaults match the tuning used on the reference hardware. A JSON file
 * may override any field; missing keys keep their defaults.
 */

#include <map>
#include <string>
#include <utility>
#include <vector>

namespace companion {

struct CameraSettings {
    int index = 0;
    int width = 640;
    int height = 480;
    int fps = 30;
};

struct MotorSettings {
    bool enabled = true;
    int default_speed = 60;        // percent
    double move_duration = 2.0;    // fixed forward burst when visual distance is off
    double left_speed_factor = 0.90;
    double right_speed_factor = 1.0;
    std::string calibration_path = "data/motor_trim.json";

    // L298N wiring (BCM numbers) and PWM channels
    int left_pin1 = 16;
    int left_pin2 = 20;
    int right_pin1 = 13;
    int right_pin2 = 19;
    int pwm_chip = 0;
    int left_pwm_channel = 0;
    int right_pwm_channel = 1;
    int pwm_frequency_hz = 1000;
};

struct SearchSettings {
    int cycles = 4;
    double rotate_pause = 0.5;     // mandatory pause after every sweep rotation
    int rotate_speed = 36;
    double deg45_duration = 1.5;
    double step_duration = 0.15;   // stepped rotation pulse (also used by return replay)
    double step_pause = 0.08;
    double detect_poll_interval = 0.033;
};

struct FaceCenterSettings {
    bool enabled = true;
    double tolerance = 0.16;       // fraction of frame width
    int speed = 50;
    double timeout = 3.0;
    double step_duration = 0.15;
    double step_pause = 0.50;
    int confirm_count = 3;
    int max_passes = 3;
    int max_track_rotations = 20;
};

struct ApproachSettings {
    bool visual_distance_enabled = true;
    int face_close_threshold = 190;        // face width in px
    double face_close_eye_distance = 85.0; // px between the eyes
    double max_approach_time = 10.0;
    double check_interval = 0.1;
};

struct FollowSettings {
    double smoothing_alpha = 0.7;
    double deadband_ratio = 0.15;
    int speed = 55;
    double rotate_burst = 0.1;
    double move_burst = 0.15;
    int max_consecutive_actions = 6;
    double cooldown = 0.8;
};

struct RecognitionSettings {
    int confirm_count = 3;
    int no_face_reset_count = 30;
    int recognition_interval = 2;
    double threshold = 0.6;
    double margin = 0.0;
};

struct RegistrationSettings {
    int samples_per_person = 5;
    int sample_interval = 3;
    bool auto_recovery = true;
};

struct InteractionSettings {
    double familiar_idle_timeout = 20.0;
    double stranger_track_timeout = 55.0;
    bool stranger_track_enabled = true;
    double awake_timeout = 30.0;
    bool awake_activity_extend = true;
    double voice_wake_duration = 5.0;
    double excited_duration = 5.0;
    double min_touch_duration = 0.1;
    double flinch_duration = 1.5;
    double flinch_settle = 0.5;
    double spin_duration = 4.5;
    int spin_speed = 60;
    std::string sing_audio_file = "resources/sounds/sing.wav";
};

struct UltrasonicSensorPins {
    std::string name;
    int trig_pin = 0;
    int echo_pin = 0;
};

struct UltrasonicSettings {
    bool enabled = true;
    double distance_threshold = 8.0;   // cm
    double echo_timeout = 0.04;
    double measure_interval = 0.1;
    double recovery_delay = 2.0;
    double return_pause = 0.5;
    std::vector<UltrasonicSensorPins> sensors = {
        {"front", 6, 5},
        {"left", 22, 27},
        {"right", 4, 17},
    };
};

struct VoiceSettings {
    bool enabled = true;
    std::vector<std::string> wake_phrases = {"hey", "hello"};
    // Ordered: the first command whose phrase matches wins
    std::vector<std::pair<std::string, std::vector<std::string>>> commands = {
        {"sing", {"sing", "sing a song", "play music", "music"}},
        {"spin", {"spin", "turn around", "rotate", "dance"}},
        {"friends", {"of course"}},
        {"back", {"back", "go back", "return", "go home"}},
    };
    std::string transcript_fifo = "/tmp/companion_voice";
    double listen_timeout = 2.0;
};

struct AudioSettings {
    std::string sounds_dir = "resources/sounds";
    std::string device = "default";
    double min_interval = 2.0;
};

struct DisplaySettings {
    int width = 320;
    int height = 240;
    std::string emotions_dir = "resources/emotions";
    double emotion_change_delay = 0.3;
    bool show_window = false;
    std::string framebuffer_device = "/dev/fb0";  // empty = no framebuffer output
    std::string touch_device;                      // empty = first touchscreen found
};

struct ModelSettings {
    std::string yunet_path = "models/face_detection_yunet_2023mar.onnx";
    std::string sface_path = "models/face_recognition_sface_2021dec.onnx";
    double detect_score_threshold = 0.75;
    double detect_nms_threshold = 0.3;
    int detect_top_k = 5000;
    int min_face_size = 60;
    std::string face_database_path = "data/face_features.yml";
};

struct Config {
    bool debug = true;
    double tick_interval = 0.01;
    double return_settle_delay = 0.1;
    double return_obstacle_max_wait = 10.0;

    CameraSettings camera;
    MotorSettings motor;
    SearchSettings search;
    FaceCenterSettings face_center;
    ApproachSettings approach;
    FollowSettings follow;
    RecognitionSettings recognition;
    RegistrationSettings registration;
    InteractionSettings interaction;
    UltrasonicSettings ultrasonic;
    VoiceSettings voice;
    AudioSettings audio;
    DisplaySettings display;
    ModelSettings models;
};

/**
 * @brief Overlay a JSON config file onto @p config
 * @return false if the file exists but cannot be parsed (defaults are kept)
 */
bool load_config(const std::string& path, Config& config);

/**
 * @brief Parse a JSON document onto @p config (used by load_config and tests)
 */
bool apply_config_json(const std::string& json_text, Config& config);

} // namespace companion
