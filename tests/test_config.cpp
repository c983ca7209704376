#include "Config.hpp"
#include "FakeDevices.hpp"

#include <cstdio>
#include <fstream>

using namespace companion;
using namespace companion::testing;

int main() {
    std::cout << "=== Config Test ===" << std::endl;

    // Test 1: Defaults
    {
        Config config;
        assert_true(config.search.cycles == 4, "4 search cycles by default");
        assert_true(config.recognition.confirm_count == 3, "3-frame debounce by default");
        assert_true(config.recognition.no_face_reset_count == 30, "30-frame face loss reset by default");
        assert_true(config.face_center.tolerance == 0.16, "0.16 centering tolerance by default");
        assert_true(config.ultrasonic.sensors.size() == 3, "three ultrasonic sensors by default");
        assert_true(config.voice.commands.front().first == "sing", "sing is the first voice command");
    }

    // Test 2: Partial overlay keeps the remaining defaults
    {
        Config config;
        bool ok = apply_config_json(R"({
            "debug": false,
            "search": {"cycles": 2, "rotate_speed": 40},
            "approach": {"face_close_eye_distance": 70.5},
            "unknown_section": {"x": 1},
            "interaction": {"awake_timeout": 12}
        })", config);
        assert_true(ok, "valid JSON applied");
        assert_true(!config.debug, "top-level flag overridden");
        assert_true(config.search.cycles == 2 && config.search.rotate_speed == 40, "section fields overridden");
        assert_true(config.search.deg45_duration == 1.5, "unlisted field keeps its default");
        assert_true(config.approach.face_close_eye_distance == 70.5, "floating point field read");
        assert_true(config.interaction.awake_timeout == 12.0, "integer JSON read into a double field");
        assert_true(config.motor.default_speed == 60, "untouched section keeps defaults");
    }

    // Test 3: Voice commands and sensors replace the defaults
    {
        Config config;
        bool ok = apply_config_json(R"({
            "voice": {
                "wake_phrases": ["wall-e"],
                "commands": [{"name": "back", "phrases": ["go home"]}]
            },
            "ultrasonic": {"sensors": [{"name": "front", "trig": 6, "echo": 5}]}
        })", config);
        assert_true(ok, "list sections applied");
        assert_true(config.voice.wake_phrases.size() == 1 && config.voice.wake_phrases[0] == "wall-e",
                    "wake phrases replaced");
        assert_true(config.voice.commands.size() == 1 && config.voice.commands[0].first == "back",
                    "command table replaced");
        assert_true(config.ultrasonic.sensors.size() == 1 && config.ultrasonic.sensors[0].echo_pin == 5,
                    "sensor list replaced");
    }

    // Test 4: Parse and type errors keep defaults
    {
        Config config;
        assert_true(!apply_config_json("{ not json", config), "malformed JSON rejected");
        assert_true(!apply_config_json("[1, 2, 3]", config), "non-object root rejected");
        assert_true(!apply_config_json(R"({"search": {"cycles": "many"}})", config), "type mismatch rejected");
        assert_true(config.search.cycles == 4, "defaults intact after failures");
    }

    // Test 5: Loading from disk
    {
        Config config;
        assert_true(load_config("/nonexistent/robot.json", config), "missing file falls back to defaults");

        const std::string path = "/tmp/companion_test_config.json";
        {
            std::ofstream out(path);
            out << R"({"tick_interval": 0.02, "display": {"show_window": true}})";
        }
        assert_true(load_config(path, config), "config file loaded");
        assert_true(config.tick_interval == 0.02 && config.display.show_window, "file values applied");

        {
            std::ofstream out(path);
            out << "{";
        }
        Config broken;
        assert_true(!load_config(path, broken), "unparseable file reported");
        std::remove(path.c_str());
    }

    return report("Config");
}
