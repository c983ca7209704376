#include "AudioPlayer.hpp"
#include "Utils.hpp"
#include <iostream>
#include <vector>

#include <alsa/asoundlib.h>
#include <sndfile.h>

namespace companion {

namespace {
const char* SOUND_NAMES[] = {"happy", "scared", "excited", "awake",
                             "thinking", "obstacle", "friends", "bye"};
constexpr sf_count_t CHUNK_FRAMES = 1024;
constexpr unsigned int LATENCY_US = 100000;
}

AlsaAudioPlayer::AlsaAudioPlayer(const AudioSettings& settings) : settings_(settings) {
    for (const char* name : SOUND_NAMES) {
        const std::string path = settings_.sounds_dir + "/" + name + ".wav";
        if (utils::file_exists(path)) {
            sounds_[name] = path;
        }
    }

    effect_thread_ = std::thread(&AlsaAudioPlayer::effect_worker, this);
    std::cout << "✓ Audio ready (" << sounds_.size() << " effects, device "
              << settings_.device << ")" << std::endl;
}

AlsaAudioPlayer::~AlsaAudioPlayer() {
    running_ = false;
    stop_all();
    effect_queue_.close();
    if (effect_thread_.joinable()) {
        effect_thread_.join();
    }
    join_music();
}

void AlsaAudioPlayer::play_sound(const std::string& name, bool force) {
    if (!force && music_playing_) {
        return;
    }
    if (!force && utils::seconds_since(last_play_) < settings_.min_interval) {
        return;
    }

    auto it = sounds_.find(name);
    if (it == sounds_.end()) {
        return;
    }

    stop_effects_ = false;
    effect_queue_.push(it->second);
    last_play_ = Clock::now();
}

bool AlsaAudioPlayer::play_file(const std::string& path, bool blocking) {
    if (!utils::file_exists(path)) {
        std::cerr << "⚠ Audio file not found: " << path << std::endl;
        return false;
    }
    if (music_playing_) {
        std::cerr << "⚠ Other audio is playing, ignoring: " << path << std::endl;
        return false;
    }

    join_music();
    stop_music_ = false;
    music_playing_ = true;
    last_play_ = Clock::now();

    if (blocking) {
        bool ok = play_pcm(path, stop_music_);
        music_playing_ = false;
        return ok;
    }

    music_thread_ = std::thread([this, path]() {
        play_pcm(path, stop_music_);
        music_playing_ = false;
    });
    return true;
}

void AlsaAudioPlayer::stop_all() {
    stop_effects_ = true;
    effect_queue_.clear();
    stop_music_ = true;
    join_music();
}

void AlsaAudioPlayer::join_music() {
    if (music_thread_.joinable()) {
        music_thread_.join();
    }
}

void AlsaAudioPlayer::effect_worker() {
    while (running_) {
        auto path = effect_queue_.pop(200);
        if (!path) continue;
        play_pcm(*path, stop_effects_);
    }
}

bool AlsaAudioPlayer::play_pcm(const std::string& path, const std::atomic<bool>& stop) {
    SF_INFO info{};
    SNDFILE* file = sf_open(path.c_str(), SFM_READ, &info);
    if (!file) {
        std::cerr << "❌ Failed to open audio " << path << ": " << sf_strerror(nullptr) << std::endl;
        return false;
    }

    snd_pcm_t* pcm = nullptr;
    int err = snd_pcm_open(&pcm, settings_.device.c_str(), SND_PCM_STREAM_PLAYBACK, 0);
    if (err < 0) {
        std::cerr << "❌ ALSA open failed (" << settings_.device << "): " << snd_strerror(err) << std::endl;
        sf_close(file);
        return false;
    }

    err = snd_pcm_set_params(pcm, SND_PCM_FORMAT_S16_LE, SND_PCM_ACCESS_RW_INTERLEAVED,
                             static_cast<unsigned int>(info.channels),
                             static_cast<unsigned int>(info.samplerate), 1, LATENCY_US);
    if (err < 0) {
        std::cerr << "❌ ALSA params failed: " << snd_strerror(err) << std::endl;
        snd_pcm_close(pcm);
        sf_close(file);
        return false;
    }

    std::vector<short> buffer(static_cast<size_t>(CHUNK_FRAMES * info.channels));
    bool ok = true;
    while (!stop) {
        sf_count_t frames = sf_readf_short(file, buffer.data(), CHUNK_FRAMES);
        if (frames <= 0) break;

        const short* data = buffer.data();
        sf_count_t remaining = frames;
        while (remaining > 0 && !stop) {
            snd_pcm_sframes_t written = snd_pcm_writei(pcm, data, static_cast<snd_pcm_uframes_t>(remaining));
            if (written < 0) {
                written = snd_pcm_recover(pcm, static_cast<int>(written), 1);
                if (written < 0) {
                    std::cerr << "❌ ALSA write failed: " << snd_strerror(static_cast<int>(written)) << std::endl;
                    ok = false;
                    break;
                }
                continue;
            }
            data += written * info.channels;
            remaining -= written;
        }
        if (!ok) break;
    }

    if (stop) {
        snd_pcm_drop(pcm);
    } else {
        snd_pcm_drain(pcm);
    }
    snd_pcm_close(pcm);
    sf_close(file);
    return ok;
}

} // namespace companion
