#pragma once

#include "AsyncQueue.hpp"
#include "Config.hpp"
#include "RobotTypes.hpp"
#include <atomic>
#include <map>
#include <memory>
#include <string>
#include <thread>

namespace companion {

/**
 * @brief Abstract sound output: short named effects plus one long track
 */
class AudioPlayer {
public:
    virtual ~AudioPlayer() = default;

    /**
     * @brief Play a named effect ("happy", "scared", ...)
     *
     * Skipped while a track plays or within the cooldown window unless
     * @p force is set.
     */
    virtual void play_sound(const std::string& name, bool force = false) = 0;

    /**
     * @brief Play a long track (song)
     * @return false if the file is missing or another track is playing
     */
    virtual bool play_file(const std::string& path, bool blocking = false) = 0;

    virtual bool is_music_playing() const = 0;
    virtual void stop_all() = 0;
};

/**
 * @brief WAV playback through ALSA, decoded with libsndfile
 *
 * Effects run on a worker thread fed by a queue; a track runs on its own
 * thread so an effect can still be forced over it (the ALSA "default"
 * device mixes through dmix).
 */
class AlsaAudioPlayer : public AudioPlayer {
public:
    explicit AlsaAudioPlayer(const AudioSettings& settings);
    ~AlsaAudioPlayer() override;

    void play_sound(const std::string& name, bool force = false) override;
    bool play_file(const std::string& path, bool blocking = false) override;
    bool is_music_playing() const override { return music_playing_; }
    void stop_all() override;

private:
    void effect_worker();
    void join_music();

    /** Stream one file to the PCM device until done or @p stop is raised */
    bool play_pcm(const std::string& path, const std::atomic<bool>& stop);

    const AudioSettings& settings_;
    std::map<std::string, std::string> sounds_;  // name -> wav path
    Clock::time_point last_play_{};

    AsyncQueue<std::string> effect_queue_;
    std::thread effect_thread_;
    std::atomic<bool> running_{true};
    std::atomic<bool> stop_effects_{false};

    std::thread music_thread_;
    std::atomic<bool> music_playing_{false};
    std::atomic<bool> stop_music_{false};
};

} // namespace companion
