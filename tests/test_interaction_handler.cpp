#include "InteractionHandler.hpp"
#include "FakeDevices.hpp"
#include "Utils.hpp"

#include <cstdio>
#include <fstream>

using namespace companion;
using namespace companion::testing;

namespace {

std::unique_ptr<VoiceListener> make_listener(const Config& config) {
    return std::make_unique<VoiceListener>(config.voice, std::make_unique<FakeSpeechSource>(), nullptr, nullptr);
}

}  // namespace

int main() {
    std::cout << "=== InteractionHandler Test ===" << std::endl;
    Config config = fast_config();
    config.interaction.awake_timeout = 0.1;
    config.interaction.familiar_idle_timeout = 0.05;
    config.interaction.stranger_track_timeout = 0.05;
    config.interaction.voice_wake_duration = 0.05;
    config.interaction.excited_duration = 0.05;

    // Test 1: InteractionTimer fires once
    {
        InteractionTimer timer(0.05);
        assert_true(!timer.check(), "inactive timer never fires");
        timer.refresh();
        assert_true(!timer.is_active(), "refresh does not arm an inactive timer");

        timer.start();
        assert_true(!timer.check(), "fresh timer has not expired");
        utils::sleep_seconds(0.06);
        assert_true(timer.check(), "timer fires after its timeout");
        assert_true(!timer.check() && !timer.is_active(), "timer fires once and deactivates");
    }

    // Test 2: Awake timeout honours the activity extension
    {
        InteractionHandler handler(config);
        assert_true(!handler.check_awake_timeout(), "asleep robot has no awake timeout");

        handler.wake_up();
        assert_true(handler.is_awake(), "wake_up sets awake");
        utils::sleep_seconds(0.06);
        handler.update_activity();
        utils::sleep_seconds(0.06);
        assert_true(!handler.check_awake_timeout(), "recent activity keeps the robot awake");
        utils::sleep_seconds(0.06);
        assert_true(handler.check_awake_timeout(), "inactivity past the timeout puts it to sleep");
        assert_true(!handler.is_awake(), "awake cleared");
        assert_true(!handler.check_awake_timeout(), "timeout reported once");
    }

    // Test 3: Without extension the awake period is absolute
    {
        Config strict = config;
        strict.interaction.awake_activity_extend = false;
        InteractionHandler handler(strict);
        handler.wake_up();
        utils::sleep_seconds(0.06);
        handler.update_activity();
        utils::sleep_seconds(0.06);
        assert_true(handler.check_awake_timeout(), "activity ignored without extension");
    }

    // Test 4: Familiar and stranger timers
    {
        Config timers = config;
        timers.interaction.familiar_idle_timeout = 0.1;
        InteractionHandler handler(timers);
        handler.start_familiar_interaction();
        assert_true(handler.familiar_active(), "familiar interaction active");
        assert_true(!handler.check_familiar_timeout(), "not yet timed out");
        utils::sleep_seconds(0.06);
        handler.refresh_familiar_interaction();
        utils::sleep_seconds(0.06);
        assert_true(!handler.check_familiar_timeout(), "refresh pushes the timeout out");
        utils::sleep_seconds(0.06);
        assert_true(handler.check_familiar_timeout(), "familiar timeout fires");
        assert_true(!handler.familiar_active(), "familiar interaction ended by timeout");

        handler.start_stranger_observation();
        handler.end_stranger_observation();
        utils::sleep_seconds(0.06);
        assert_true(!handler.check_stranger_timeout(), "ended observation never times out");
    }

    // Test 5: Audio finished and ultrasonic recovery
    {
        InteractionHandler handler(config);
        FakeAudio audio;
        assert_true(!handler.check_audio_finished(audio), "nothing playing -> not finished");

        handler.start_playing_audio();
        audio.music_playing = true;
        assert_true(!handler.check_audio_finished(audio), "song still playing");
        audio.music_playing = false;
        assert_true(handler.check_audio_finished(audio), "song finished reported");
        assert_true(!handler.is_playing_audio(), "playing flag cleared");

        handler.trigger_ultrasonic_scared();
        assert_true(!handler.check_ultrasonic_recovery(0.05), "no recovery before the delay");
        utils::sleep_seconds(0.06);
        assert_true(handler.check_ultrasonic_recovery(0.05), "recovery after the delay");
        assert_true(!handler.ultrasonic_scared_active(), "scare cleared after recovery");
    }

    // Test 6: Excited window
    {
        InteractionHandler handler(config);
        assert_true(!handler.is_excited(), "not excited initially");
        handler.start_excited_window();
        assert_true(handler.is_excited(), "excited right after a touch");
        utils::sleep_seconds(0.06);
        assert_true(!handler.is_excited(), "excited window closes");
    }

    // Test 7: Sing without a song file falls back to the happy effect
    {
        InteractionHandler handler(config);
        FakeDisplay display;
        FakeAudio audio;
        auto voice = make_listener(config);

        handler.do_sing(display, audio, voice.get());
        assert_true(display.current == "sing", "sing emotion shown");
        assert_true(audio.files.empty() && audio.has_played("happy"), "happy effect instead of the song");
        assert_true(!voice->is_paused(), "listening resumed when there is no song");
        assert_true(!handler.is_playing_audio(), "not marked as playing");
    }

    // Test 8: Sing with a song file plays it and keeps listening paused
    {
        const std::string song = "/tmp/companion_test_sing.wav";
        { std::ofstream(song) << "RIFF"; }
        Config with_song = config;
        with_song.interaction.sing_audio_file = song;

        InteractionHandler handler(with_song);
        FakeDisplay display;
        FakeAudio audio;
        auto voice = make_listener(with_song);

        handler.do_sing(display, audio, voice.get());
        assert_true(audio.files.size() == 1 && audio.files[0] == song, "song played");
        assert_true(handler.is_playing_audio(), "marked as playing");
        assert_true(voice->is_paused(), "listening paused during the song");
        std::remove(song.c_str());
    }

    // Test 9: Spin holds the blocking latch for spin_duration
    {
        InteractionHandler handler(config);
        FakeDisplay display;
        FakeAudio audio;
        FakeMotor motor;
        auto voice = make_listener(config);

        handler.do_spin(display, audio, &motor, voice.get());
        assert_true(handler.blocking_action_active(), "latch set during spin");
        assert_true(voice->is_paused(), "listening paused during spin");
        assert_true(display.current == "excited" && audio.has_played("excited"), "excited emotion and sound");
        assert_true(motor.commands.size() == 1 && motor.commands[0] == "right" &&
                    motor.speeds[0] == config.interaction.spin_speed, "spins right at spin_speed");

        assert_true(handler.update_blocking_action(), "spin still running");
        utils::sleep_seconds(config.interaction.spin_duration + 0.01);
        assert_true(!handler.update_blocking_action(), "spin finished");
        assert_true(motor.commands.back() == "stop", "motor stopped after spin");
        assert_true(!handler.blocking_action_active(), "latch cleared");
        assert_true(!voice->is_paused(), "listening resumed");
        assert_true(handler.voice_wake_active(), "voice-wake emotion timer started");
    }

    // Test 10: Spin without a motor finishes at once
    {
        InteractionHandler handler(config);
        FakeDisplay display;
        FakeAudio audio;
        handler.do_spin(display, audio, nullptr, nullptr);
        assert_true(!handler.blocking_action_active(), "no motor -> no blocking action");
        assert_true(handler.voice_wake_active(), "voice-wake timer still started");
    }

    return report("InteractionHandler");
}
