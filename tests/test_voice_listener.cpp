#include "VoiceListener.hpp"
#include "FakeDevices.hpp"
#include "Utils.hpp"

#include <atomic>
#include <fcntl.h>
#include <mutex>
#include <stdexcept>
#include <unistd.h>

using namespace companion;
using namespace companion::testing;

int main() {
    std::cout << "=== VoiceListener Test ===" << std::endl;
    Config config = fast_config();

    // Test 1: Normalization
    {
        assert_true(VoiceListener::normalize_phrase("  Hey,   Robot!! ") == "hey robot", "punctuation and spaces collapsed");
        assert_true(VoiceListener::normalize_phrase("go_back-home") == "go back home", "underscore and hyphen split words");
        assert_true(VoiceListener::normalize_phrase("...").empty(), "punctuation-only transcript is empty");
    }

    std::vector<std::string> wakes;
    std::vector<std::pair<std::string, std::string>> commands;
    std::mutex mutex;
    VoiceListener listener(
        config.voice, std::make_unique<FakeSpeechSource>(),
        [&](const std::string& transcript) {
            std::lock_guard<std::mutex> lock(mutex);
            wakes.push_back(transcript);
        },
        [&](const std::string& command, const std::string& transcript) {
            std::lock_guard<std::mutex> lock(mutex);
            commands.emplace_back(command, transcript);
        });

    // Test 2: Command matching in configuration order
    {
        assert_true(listener.match_command("Can you SING a song?") == std::string("sing"), "sing matched");
        assert_true(listener.match_command("please turn around") == std::string("spin"), "spin matched by phrase");
        assert_true(listener.match_command("Of course!") == std::string("friends"), "friends matched");
        assert_true(listener.match_command("go home now") == std::string("back"), "back matched");
        assert_true(listener.match_command("play music and dance") == std::string("sing"),
                    "first command in configuration order wins");
        assert_true(!listener.match_command("what time is it").has_value(), "no command in small talk");
    }

    // Test 3: Wake phrases
    {
        assert_true(listener.contains_wake_phrase("Hello there"), "hello wakes");
        assert_true(listener.contains_wake_phrase("HEY!"), "hey wakes");
        assert_true(!listener.contains_wake_phrase("good morning"), "no wake phrase");
        assert_true(!listener.contains_wake_phrase(""), "empty transcript never wakes");
    }

    // Test 4: Commands take precedence over wake phrases
    {
        listener.process_transcript("hey, spin for me");
        listener.process_transcript("hello robot");
        listener.process_transcript("nothing useful");
        assert_true(commands.size() == 1 && commands[0].first == "spin", "command dispatched");
        assert_true(wakes.size() == 1 && wakes[0] == "hello robot", "wake dispatched only without a command");
    }

    // Test 5: A throwing callback does not escape the listener
    {
        VoiceListener throwing(config.voice, std::make_unique<FakeSpeechSource>(),
                               [](const std::string&) { throw std::runtime_error("wake failed"); },
                               [](const std::string&, const std::string&) { throw std::runtime_error("command failed"); });
        bool survived = true;
        try {
            throwing.process_transcript("hey");
            throwing.process_transcript("sing");
        } catch (const std::exception&) {
            survived = false;
        }
        assert_true(survived, "callback exceptions are contained");
    }

    // Test 6: Start fails when the source cannot open
    {
        auto source = std::make_unique<FakeSpeechSource>();
        source->opens_ok = false;
        VoiceListener broken(config.voice, std::move(source), nullptr, nullptr);
        assert_true(!broken.start(), "start reports an unavailable source");
        assert_true(!broken.is_running(), "listener not running");
    }

    // Test 7: Transcripts arrive through the named pipe
    {
        Config fifo_config = config;
        fifo_config.voice.transcript_fifo = "/tmp/companion_test_voice_" + std::to_string(getpid());
        fifo_config.voice.listen_timeout = 0.05;

        std::atomic<int> fifo_wakes{0};
        std::atomic<int> fifo_commands{0};
        VoiceListener fifo_listener(
            fifo_config.voice,
            std::make_unique<FifoSpeechSource>(fifo_config.voice.transcript_fifo),
            [&](const std::string&) { ++fifo_wakes; },
            [&](const std::string&, const std::string&) { ++fifo_commands; });

        assert_true(fifo_listener.start(), "FIFO listener starts");

        int fd = open(fifo_config.voice.transcript_fifo.c_str(), O_WRONLY | O_NONBLOCK);
        assert_true(fd != -1, "transcript pipe writable");
        if (fd != -1) {
            const std::string lines = "hey robot\nsing a song\n";
            ssize_t written = write(fd, lines.data(), lines.size());
            assert_true(written == static_cast<ssize_t>(lines.size()), "transcripts written");
            close(fd);
        }

        for (int i = 0; i < 100 && (fifo_wakes < 1 || fifo_commands < 1); ++i) {
            utils::sleep_seconds(0.01);
        }
        assert_true(fifo_wakes == 1, "wake received through the pipe");
        assert_true(fifo_commands == 1, "command received through the pipe");

        fifo_listener.pause();
        assert_true(fifo_listener.is_paused(), "pause sets paused");
        fifo_listener.resume();
        fifo_listener.stop();
        assert_true(!fifo_listener.is_running(), "listener stopped");
        unlink(fifo_config.voice.transcript_fifo.c_str());
    }

    return report("VoiceListener");
}
