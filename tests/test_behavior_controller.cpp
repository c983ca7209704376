#include "ActionRecorder.hpp"
#include "BehaviorController.hpp"
#include "FakeDevices.hpp"

#include <cmath>

using namespace companion;
using namespace companion::testing;

namespace {

struct Rig {
    explicit Rig(const Config& cfg) : config(cfg), recorder(config) {}

    BehaviorController make(bool with_motor = true, bool with_camera = true,
                            bool with_proximity = true, bool with_recognizer = true) {
        return BehaviorController(config,
                                  with_motor ? &motor : nullptr,
                                  with_camera ? &camera : nullptr,
                                  with_proximity ? &proximity : nullptr,
                                  with_recognizer ? &recognizer : nullptr,
                                  recorder, display, audio);
    }

    Config config;
    ActionRecorder recorder;
    FakeMotor motor;
    FakeCamera camera;
    FakeProximity proximity;
    FakeRecognizer recognizer;
    FakeDisplay display;
    FakeAudio audio;
};

const FaceObservation FAR_FACE = make_face(320, 100, 40, std::string("alice"));
const FaceObservation CLOSE_FACE = make_face(320, 150, 90, std::string("alice"));

}  // namespace

int main() {
    std::cout << "=== BehaviorController Test ===" << std::endl;
    Config config = fast_config();

    // Test 1: Approach without a motor is skipped
    {
        Rig rig(config);
        auto behavior = rig.make(false);
        assert_true(behavior.approach_familiar_person() == 0.0, "no motor -> approach returns 0");
        assert_true(rig.recognizer.detect_calls == 0, "no detection without motor");
    }

    // Test 2: Visual distance disabled -> fixed forward move
    {
        Config fixed = config;
        fixed.approach.visual_distance_enabled = false;
        fixed.motor.move_duration = 0.06;
        Rig rig(fixed);
        auto behavior = rig.make();
        behavior.approach_familiar_person();
        auto history = rig.recorder.history();
        assert_true(history.size() == 1 && history[0].direction == Direction::FORWARD,
                    "fixed forward move recorded");
        assert_true(rig.motor.count("forward") == 1 && rig.motor.count("stop") == 1, "forward then stop");
    }

    // Test 3: Stops immediately when the eyes are already close
    {
        Rig rig(config);
        rig.recognizer.fallback = {CLOSE_FACE};
        auto behavior = rig.make();
        behavior.approach_familiar_person();
        assert_true(rig.motor.count("forward") == 0, "no forward drive when already close");
        assert_true(!rig.recorder.has_actions(), "nothing recorded");
    }

    // Test 4: Drives forward until the face is close, recording one move
    {
        Rig rig(config);
        for (int i = 0; i < 10; ++i) rig.recognizer.script.push_back({FAR_FACE});
        rig.recognizer.fallback = {CLOSE_FACE};
        auto behavior = rig.make();
        behavior.approach_familiar_person();
        assert_true(rig.motor.count("forward") == 1, "forward command issued once for a continuous approach");
        auto history = rig.recorder.history();
        assert_true(history.size() == 1 && history[0].kind == ActionKind::MOVE &&
                    history[0].direction == Direction::FORWARD, "approach recorded as one forward move");
        assert_true(rig.camera.grabs >= 20, "stale frames flushed before each check");
    }

    // Test 5: Face width also ends the approach
    {
        Rig rig(config);
        rig.recognizer.fallback = {make_face(320, 200, 40)};
        auto behavior = rig.make();
        behavior.approach_familiar_person();
        assert_true(rig.motor.count("forward") == 0, "wide face stops the approach");
    }

    // Test 6: Obstacle pauses the approach and resumes when clear
    {
        Rig rig(config);
        rig.proximity.near_script = {false, true, true};
        rig.recognizer.script = {{FAR_FACE}, {FAR_FACE}};
        rig.recognizer.fallback = {CLOSE_FACE};
        auto behavior = rig.make();
        behavior.approach_familiar_person();

        assert_true(rig.motor.count("brake") == 1, "brake once when the obstacle appears");
        assert_true(rig.display.has_shown("cry"), "cry shown while blocked");
        assert_true(rig.display.current == "happy", "happy restored after the path clears");
        assert_true(rig.audio.sounds.size() == 1 && rig.audio.sounds[0] == "obstacle", "obstacle sound plays once");
        assert_true(rig.motor.count("forward") == 2, "forward resumed after the obstacle");
        assert_true(rig.proximity.cached_polls >= 4, "approach uses cached proximity readings");
    }

    // Test 7: Approach is bounded by max_approach_time
    {
        Rig rig(config);
        auto behavior = rig.make(true, true, true, false);
        double elapsed = behavior.approach_familiar_person();
        assert_true(elapsed >= config.approach.max_approach_time && elapsed < 1.5, "approach time bounded");
        auto history = rig.recorder.history();
        assert_true(history.size() == 1 && history[0].duration >= 0.25, "bounded approach recorded");
    }

    // Test 8: Face too close / obstacle checks
    {
        Rig rig(config);
        auto behavior = rig.make();
        rig.recognizer.fallback = {make_face(320, 200, 40)};
        assert_true(behavior.check_face_too_close(), "200px face is too close");
        rig.recognizer.fallback = {make_face(320, 100, 40)};
        assert_true(!behavior.check_face_too_close(), "100px face is fine");

        rig.proximity.near = true;
        assert_true(behavior.check_obstacle_while_moving(), "obstacle reported while moving");
        rig.proximity.near = false;
        assert_true(!behavior.check_obstacle_while_moving(), "clear path reported");

        auto blind = rig.make(true, true, false, true);
        assert_true(!blind.check_obstacle_while_moving(), "no sensor -> never blocked");
    }

    // Test 9: Tracking debounce after the face has been centered
    {
        Rig rig(config);
        rig.recognizer.fallback = {make_face(320, 100, 40)};
        auto behavior = rig.make();

        behavior.track_face_position(make_face(320, 100, 40));
        assert_true(behavior.face_centered(), "centered face marks centered");

        const FaceObservation off = make_face(520, 100, 40);
        behavior.track_face_position(off);
        behavior.track_face_position(off);
        assert_true(rig.motor.commands.empty(), "two off-center frames do not move");
        assert_true(behavior.offset_confirm_count() == 2, "confirm count accumulates");

        behavior.track_face_position(off);
        assert_true(rig.motor.count("right") == 1, "third frame triggers a correction toward the face");
        assert_true(behavior.face_centered(), "centered again after correction");
    }

    // Test 10: Direction change restarts the confirmation
    {
        Rig rig(config);
        auto behavior = rig.make();
        behavior.track_face_position(make_face(320, 100, 40));
        behavior.track_face_position(make_face(520, 100, 40));
        behavior.track_face_position(make_face(520, 100, 40));
        behavior.track_face_position(make_face(100, 100, 40));
        assert_true(behavior.offset_confirm_count() == 1, "opposite direction restarts confirmation");
        assert_true(rig.motor.commands.empty(), "no motion while confirming");
    }

    // Test 11: Tracking bounded by max rotations; face loss stops it
    {
        Rig rig(config);
        rig.recognizer.fallback = {make_face(520, 100, 40)};
        auto behavior = rig.make();
        behavior.track_face_position(make_face(520, 100, 40));
        assert_true(rig.motor.count("right") == config.face_center.max_track_rotations,
                    "stuck face stops after max_track_rotations steps");

        Rig lost(config);
        auto lost_behavior = lost.make();
        lost_behavior.track_face_position(make_face(100, 100, 40));
        assert_true(lost.motor.count("left") == 1, "face lost after first step ends tracking");
    }

    // Test 12: Follow rotates toward an off-center face first
    {
        Rig rig(config);
        auto behavior = rig.make();
        assert_true(!behavior.follow_familiar_person(), "no face -> follow reports false");

        rig.recognizer.fallback = {make_face(520, 100, 20)};
        assert_true(behavior.follow_familiar_person(), "face present -> true");
        assert_true(rig.motor.count("right") == 1 && rig.motor.count("forward") == 0,
                    "rotation has priority over distance");
        assert_true(behavior.consecutive_actions() == 1, "correction counted");
    }

    // Test 13: Distance deadband around the target eye distance
    {
        Rig rig(config);
        auto behavior = rig.make();

        rig.recognizer.fallback = {make_face(320, 100, 40)};
        behavior.follow_familiar_person();
        assert_true(rig.motor.count("forward") == 1, "too far -> forward burst");
        assert_true(rig.motor.speeds.back() == config.follow.speed, "follow speed used");

        behavior.reset_follow_state();
        rig.recognizer.fallback = {make_face(320, 100, 120)};
        behavior.follow_familiar_person();
        assert_true(rig.motor.count("backward") == 1, "too close -> backward burst");

        behavior.reset_follow_state();
        rig.recognizer.fallback = {make_face(320, 100, 85)};
        size_t before = rig.motor.commands.size();
        behavior.follow_familiar_person();
        assert_true(rig.motor.commands.size() == before, "inside the deadband -> no motion");
        assert_true(behavior.consecutive_actions() == 0, "idle frame resets the correction streak");
    }

    // Test 14: EMA smoothing weights the newest sample by alpha
    {
        Rig rig(config);
        auto behavior = rig.make();
        rig.recognizer.script = {{make_face(520, 100, 85)}, {make_face(320, 100, 85)}};
        behavior.follow_familiar_person();
        behavior.follow_familiar_person();
        auto smoothed = behavior.smoothed_offset();
        const double first = (520.0 - 320.0) / 640.0;
        const double expected = first * (1.0 - config.follow.smoothing_alpha);
        assert_true(smoothed && std::fabs(*smoothed - expected) < 1e-6, "offset smoothed with alpha 0.7");
    }

    // Test 15: Too many consecutive corrections force a cooldown
    {
        Rig rig(config);
        rig.recognizer.fallback = {make_face(520, 100, 85)};
        auto behavior = rig.make();
        for (int i = 0; i <= config.follow.max_consecutive_actions; ++i) {
            behavior.follow_familiar_person();
        }
        assert_true(behavior.consecutive_actions() == config.follow.max_consecutive_actions + 1,
                    "streak counted past the limit");
        size_t before = rig.motor.commands.size();
        assert_true(behavior.follow_familiar_person(), "cooldown call still reports the face");
        assert_true(rig.motor.commands.size() == before, "no motion during cooldown");
        assert_true(behavior.consecutive_actions() == 0 && !behavior.smoothed_offset(),
                    "cooldown resets the follow state");
    }

    return report("BehaviorController");
}
