#pragma once

#include "Config.hpp"
#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <thread>

namespace companion {

/**
 * @brief Source of recognized utterances (speech-to-text runs elsewhere)
 */
class SpeechSource {
public:
    virtual ~SpeechSource() = default;

    virtual bool open() = 0;

    /**
     * @brief Wait up to @p timeout_s for the next transcript
     * @return std::nullopt on timeout
     */
    virtual std::optional<std::string> listen(double timeout_s) = 0;

    virtual void close() = 0;
};

/**
 * @brief Transcripts written one per line into a named pipe
 *
 * Any speech engine can feed the robot with e.g.
 * `vosk-transcriber ... > /tmp/companion_voice`.
 */
class FifoSpeechSource : public SpeechSource {
public:
    explicit FifoSpeechSource(std::string path);
    ~FifoSpeechSource() override;

    bool open() override;
    std::optional<std::string> listen(double timeout_s) override;
    void close() override;

private:
    std::optional<std::string> take_line();

    std::string path_;
    int read_fd_ = -1;
    int keepalive_fd_ = -1;  // our own writer so poll() never sees HUP
    std::string pending_;
};

/**
 * @brief Listener thread turning transcripts into wake / command callbacks
 *
 * Matching is substring based on normalized text; commands are checked
 * before wake phrases, in configuration order. Callbacks run on the
 * listener thread and must only post events.
 */
class VoiceListener {
public:
    using WakeCallback = std::function<void(const std::string& transcript)>;
    using CommandCallback = std::function<void(const std::string& command, const std::string& transcript)>;

    VoiceListener(const VoiceSettings& settings,
                  std::unique_ptr<SpeechSource> source,
                  WakeCallback on_wake,
                  CommandCallback on_command);
    ~VoiceListener();

    bool start();
    void stop();
    void pause();
    void resume();
    bool is_paused() const { return paused_; }
    bool is_running() const { return running_; }

    /** Lower-case, punctuation / '_' / '-' to spaces, whitespace collapsed */
    static std::string normalize_phrase(const std::string& phrase);

    /** @return the first command with a phrase contained in @p transcript */
    std::optional<std::string> match_command(const std::string& transcript) const;
    bool contains_wake_phrase(const std::string& transcript) const;

    /**
     * @brief Dispatch one transcript to the callbacks
     *
     * Exceptions thrown by a callback are logged and swallowed so the
     * listener thread survives.
     */
    void process_transcript(const std::string& transcript);

private:
    void listen_loop();

    const VoiceSettings& settings_;
    std::unique_ptr<SpeechSource> source_;
    WakeCallback on_wake_;
    CommandCallback on_command_;

    std::thread thread_;
    std::atomic<bool> running_{false};
    std::atomic<bool> paused_{false};
};

} // namespace companion
