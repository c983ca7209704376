#include "VoiceListener.hpp"
#include <cctype>
#include <chrono>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <iostream>
#include <poll.h>
#include <sstream>
#include <sys/stat.h>
#include <unistd.h>

namespace companion {

// ============================================================================
// FifoSpeechSource
// ============================================================================

FifoSpeechSource::FifoSpeechSource(std::string path) : path_(std::move(path)) {}

FifoSpeechSource::~FifoSpeechSource() {
    close();
}

bool FifoSpeechSource::open() {
    struct stat info;
    if (stat(path_.c_str(), &info) != 0) {
        if (mkfifo(path_.c_str(), 0666) != 0) {
            std::cerr << "❌ mkfifo " << path_ << " failed: " << strerror(errno) << std::endl;
            return false;
        }
    } else if (!S_ISFIFO(info.st_mode)) {
        std::cerr << "❌ " << path_ << " exists and is not a FIFO" << std::endl;
        return false;
    }

    read_fd_ = ::open(path_.c_str(), O_RDONLY | O_NONBLOCK);
    if (read_fd_ == -1) {
        std::cerr << "❌ Failed to open " << path_ << ": " << strerror(errno) << std::endl;
        return false;
    }
    keepalive_fd_ = ::open(path_.c_str(), O_WRONLY | O_NONBLOCK);
    return true;
}

void FifoSpeechSource::close() {
    if (keepalive_fd_ != -1) {
        ::close(keepalive_fd_);
        keepalive_fd_ = -1;
    }
    if (read_fd_ != -1) {
        ::close(read_fd_);
        read_fd_ = -1;
    }
}

std::optional<std::string> FifoSpeechSource::take_line() {
    auto newline = pending_.find('\n');
    if (newline == std::string::npos) {
        return std::nullopt;
    }
    std::string line = pending_.substr(0, newline);
    pending_.erase(0, newline + 1);
    return line;
}

std::optional<std::string> FifoSpeechSource::listen(double timeout_s) {
    if (auto line = take_line()) {
        return line;
    }
    if (read_fd_ == -1) {
        return std::nullopt;
    }

    struct pollfd pfd{read_fd_, POLLIN, 0};
    int ready = poll(&pfd, 1, static_cast<int>(timeout_s * 1000));
    if (ready <= 0 || !(pfd.revents & POLLIN)) {
        return std::nullopt;
    }

    char buffer[512];
    ssize_t n = read(read_fd_, buffer, sizeof(buffer));
    if (n > 0) {
        pending_.append(buffer, static_cast<size_t>(n));
    }
    return take_line();
}

// ============================================================================
// VoiceListener
// ============================================================================

VoiceListener::VoiceListener(const VoiceSettings& settings,
                             std::unique_ptr<SpeechSource> source,
                             WakeCallback on_wake,
                             CommandCallback on_command)
    : settings_(settings),
      source_(std::move(source)),
      on_wake_(std::move(on_wake)),
      on_command_(std::move(on_command)) {}

VoiceListener::~VoiceListener() {
    stop();
}

bool VoiceListener::start() {
    if (running_) return true;
    if (!source_ || !source_->open()) {
        std::cerr << "❌ Voice input unavailable" << std::endl;
        return false;
    }

    running_ = true;
    thread_ = std::thread(&VoiceListener::listen_loop, this);
    std::cout << "✓ Voice listener started" << std::endl;
    return true;
}

void VoiceListener::stop() {
    running_ = false;
    if (thread_.joinable()) {
        thread_.join();
    }
    if (source_) {
        source_->close();
    }
}

void VoiceListener::pause() {
    paused_ = true;
    std::cout << "Voice listening paused" << std::endl;
}

void VoiceListener::resume() {
    paused_ = false;
    std::cout << "Voice listening resumed" << std::endl;
}

std::string VoiceListener::normalize_phrase(const std::string& phrase) {
    std::string cleaned;
    cleaned.reserve(phrase.size());
    for (unsigned char c : phrase) {
        if (std::ispunct(c)) {
            cleaned.push_back(' ');
        } else {
            cleaned.push_back(static_cast<char>(std::tolower(c)));
        }
    }

    std::istringstream words(cleaned);
    std::string word, result;
    while (words >> word) {
        if (!result.empty()) result.push_back(' ');
        result += word;
    }
    return result;
}

std::optional<std::string> VoiceListener::match_command(const std::string& transcript) const {
    const std::string normalized = normalize_phrase(transcript);
    if (normalized.empty()) return std::nullopt;

    for (const auto& command : settings_.commands) {
        for (const auto& phrase : command.second) {
            const std::string p = normalize_phrase(phrase);
            if (!p.empty() && normalized.find(p) != std::string::npos) {
                return command.first;
            }
        }
    }
    return std::nullopt;
}

bool VoiceListener::contains_wake_phrase(const std::string& transcript) const {
    const std::string normalized = normalize_phrase(transcript);
    if (normalized.empty()) return false;

    for (const auto& phrase : settings_.wake_phrases) {
        const std::string p = normalize_phrase(phrase);
        if (!p.empty() && normalized.find(p) != std::string::npos) {
            return true;
        }
    }
    return false;
}

void VoiceListener::process_transcript(const std::string& transcript) {
    if (auto command = match_command(transcript)) {
        std::cout << "🎤 Command: " << *command << " (\"" << transcript << "\")" << std::endl;
        if (on_command_) {
            try {
                on_command_(*command, transcript);
            } catch (const std::exception& e) {
                std::cerr << "❌ Command callback failed: " << e.what() << std::endl;
            }
        }
        return;
    }

    if (contains_wake_phrase(transcript)) {
        std::cout << "🎤 Wake: \"" << transcript << "\"" << std::endl;
        if (on_wake_) {
            try {
                on_wake_(transcript);
            } catch (const std::exception& e) {
                std::cerr << "❌ Wake callback failed: " << e.what() << std::endl;
            }
        }
    }
}

void VoiceListener::listen_loop() {
    while (running_) {
        if (paused_) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
            continue;
        }

        auto transcript = source_->listen(settings_.listen_timeout);
        if (!transcript || transcript->empty()) {
            continue;
        }

        // Speech captured while paused (e.g. our own song) is discarded
        if (paused_) {
            continue;
        }
        process_transcript(*transcript);
    }
}

} // namespace companion
