#pragma once

/**
 * @file FakeDevices.hpp
 * @brief Scripted in-memory collaborators for the behavior tests
 */

#include "AudioPlayer.hpp"
#include "Config.hpp"
#include "Display.hpp"
#include "FaceRecognizer.hpp"
#include "FrameSource.hpp"
#include "MotorDriver.hpp"
#include "ProximitySensor.hpp"
#include "RobotTypes.hpp"
#include "VoiceListener.hpp"

#include <deque>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include <opencv2/core.hpp>

namespace companion {
namespace testing {

static int fails = 0;

static void assert_true(bool cond, const char* msg) {
    if (!cond) {
        std::cerr << "[FAIL] " << msg << std::endl;
        ++fails;
    } else {
        std::cout << "[PASS] " << msg << std::endl;
    }
}

static int report(const char* suite) {
    if (fails == 0) {
        std::cout << "=== " << suite << ": all checks passed ===" << std::endl;
        return 0;
    }
    std::cerr << "=== " << suite << ": " << fails << " check(s) failed ===" << std::endl;
    return 1;
}

/** Config with every wait shortened so flows finish in milliseconds */
inline Config fast_config() {
    Config config;
    config.debug = false;
    config.tick_interval = 0.001;
    config.return_settle_delay = 0.0;
    config.return_obstacle_max_wait = 0.3;

    config.search.cycles = 4;
    config.search.rotate_pause = 0.0;
    config.search.deg45_duration = 0.06;
    config.search.step_duration = 0.02;
    config.search.step_pause = 0.0;
    config.search.detect_poll_interval = 0.001;

    config.face_center.step_duration = 0.001;
    config.face_center.step_pause = 0.0;
    config.face_center.timeout = 0.02;

    config.approach.max_approach_time = 0.3;
    config.approach.check_interval = 0.005;

    config.follow.rotate_burst = 0.001;
    config.follow.move_burst = 0.001;
    config.follow.cooldown = 0.001;

    config.interaction.flinch_duration = 0.06;
    config.interaction.flinch_settle = 0.0;
    config.interaction.spin_duration = 0.05;
    config.interaction.sing_audio_file = "/nonexistent/sing.wav";

    config.ultrasonic.return_pause = 0.0;
    return config;
}

/**
 * @brief Face centered at @p center_x with the eyes @p eye_distance apart
 */
inline FaceObservation make_face(float center_x, int width, float eye_distance,
                                 std::optional<std::string> identity = std::nullopt) {
    FaceObservation face;
    face.box = cv::Rect(static_cast<int>(center_x - width / 2.0f), 100, width, width);
    const float eye_y = 100.0f + width * 0.35f;
    face.landmarks[0] = cv::Point2f(center_x - eye_distance / 2.0f, eye_y);
    face.landmarks[1] = cv::Point2f(center_x + eye_distance / 2.0f, eye_y);
    face.landmarks[2] = cv::Point2f(center_x, eye_y + width * 0.2f);
    face.identity = std::move(identity);
    face.similarity = face.identity ? 0.9f : 0.3f;
    face.confidence = 0.95f;
    return face;
}

class FakeMotor : public MotorDriver {
public:
    void forward(int speed = 0) override { log("forward", speed); }
    void backward(int speed = 0) override { log("backward", speed); }
    void turn_left(int speed = 0) override { log("left", speed); }
    void turn_right(int speed = 0) override { log("right", speed); }
    void stop() override { commands.push_back("stop"); }
    void brake() override { commands.push_back("brake"); }
    bool enabled() const override { return is_enabled; }

    void adjust_calibration(const std::string& side, double delta) override {
        (side == "left" ? left_trim : right_trim) += delta;
    }
    bool save_calibration() override { ++saves; return true; }
    void cleanup() override { cleaned_up = true; }

    int count(const std::string& command) const {
        int n = 0;
        for (const auto& c : commands) n += (c == command);
        return n;
    }

    std::vector<std::string> commands;
    std::vector<int> speeds;
    bool is_enabled = true;
    double left_trim = 0.0;
    double right_trim = 0.0;
    int saves = 0;
    bool cleaned_up = false;

private:
    void log(const char* command, int speed) {
        commands.push_back(command);
        speeds.push_back(speed);
    }
};

class FakeCamera : public FrameSource {
public:
    bool read(cv::Mat& frame) override {
        ++reads;
        if (!available) return false;
        frame = cv::Mat::zeros(48, 64, CV_8UC3);
        return true;
    }
    void grab(int count) override { grabs += count; }
    int frame_width() const override { return width; }
    void release() override { released = true; }

    bool available = true;
    int width = 640;
    int reads = 0;
    int grabs = 0;
    bool released = false;
};

/**
 * @brief Replays queued detection results, then repeats @p fallback
 */
class FakeRecognizer : public FaceRecognizer {
public:
    std::vector<FaceObservation> detect_and_recognize(const cv::Mat&) override { return next(); }
    std::vector<FaceObservation> detect_faces_only(const cv::Mat&) override { return next(); }

    std::pair<bool, std::string> register_person(const cv::Mat&, const std::string& name,
                                                 int num_samples) override {
        ++register_calls;
        registered_name = name;
        if (!register_succeeds) return {false, "No face detected"};
        return {true, "Collected " + std::to_string(register_calls) + "/" + std::to_string(num_samples)};
    }

    int known_person_count() const override { return 1; }
    std::string name() const override { return "fake"; }
    bool is_initialized() const override { return true; }

    std::deque<std::vector<FaceObservation>> script;
    std::vector<FaceObservation> fallback;
    int detect_calls = 0;
    int register_calls = 0;
    bool register_succeeds = true;
    std::string registered_name;

private:
    std::vector<FaceObservation> next() {
        ++detect_calls;
        if (script.empty()) return fallback;
        auto faces = script.front();
        script.pop_front();
        return faces;
    }
};

class FakeProximity : public ProximitySensor {
public:
    bool is_object_near(bool use_cached = false) override {
        ++polls;
        if (use_cached) ++cached_polls;
        if (!near_script.empty()) {
            bool value = near_script.front();
            near_script.pop_front();
            return value;
        }
        return near;
    }
    ProximityStatus get_status() override {
        ProximityStatus status;
        status.distances["front"] = near ? 5.0 : 100.0;
        if (near) status.triggered.push_back("front");
        return status;
    }
    bool enabled() const override { return true; }
    void cleanup() override { cleaned_up = true; }

    bool near = false;
    std::deque<bool> near_script;
    int polls = 0;
    int cached_polls = 0;
    bool cleaned_up = false;
};

class FakeDisplay : public Display {
public:
    void show_emotion(const std::string& emotion, bool force = false) override {
        if (!force && emotion == current) return;
        current = emotion;
        shown.push_back(emotion);
    }
    std::string current_emotion() const override { return current; }
    void update(double) override { ++updates; }
    std::optional<TouchEvent> get_touch_event() override {
        if (events.empty()) return std::nullopt;
        TouchEvent event = events.front();
        events.pop_front();
        return event;
    }

    void touch(double duration) {
        events.push_back(TouchEvent{TouchEvent::Kind::TOUCH_END, 10, 10, duration});
    }

    bool has_shown(const std::string& emotion) const {
        for (const auto& e : shown) {
            if (e == emotion) return true;
        }
        return false;
    }

    std::string current = "neutral";
    std::vector<std::string> shown;
    std::deque<TouchEvent> events;
    int updates = 0;
};

class FakeAudio : public AudioPlayer {
public:
    void play_sound(const std::string& name, bool = false) override { sounds.push_back(name); }
    bool play_file(const std::string& path, bool) override {
        files.push_back(path);
        music_playing = true;
        return true;
    }
    bool is_music_playing() const override { return music_playing; }
    void stop_all() override {
        ++stops;
        music_playing = false;
    }

    bool has_played(const std::string& name) const {
        for (const auto& s : sounds) {
            if (s == name) return true;
        }
        return false;
    }

    std::vector<std::string> sounds;
    std::vector<std::string> files;
    bool music_playing = false;
    int stops = 0;
};

class FakeSpeechSource : public SpeechSource {
public:
    bool open() override { return opens_ok; }
    std::optional<std::string> listen(double) override { return std::nullopt; }
    void close() override {}

    bool opens_ok = true;
};

} // namespace testing
} // namespace companion
