#include "RecognitionHandler.hpp"
#include "FaceRecognizer.hpp"
#include "Utils.hpp"
#include <algorithm>
#include <iostream>

namespace companion {

const char* to_string(RecognitionLabel label) {
    switch (label) {
        case RecognitionLabel::FAMILIAR: return "familiar";
        case RecognitionLabel::STRANGER: return "stranger";
    }
    return "unknown";
}

RecognitionHandler::RecognitionHandler(const Config& config) : config_(config) {
    reset_counters();
}

void RecognitionHandler::update_counter(RecognitionLabel label) {
    for (auto& counter : counters_) {
        if (counter.first == label) {
            counter.second = std::min(config_.recognition.confirm_count, counter.second + 1);
        } else if (counter.second > 0) {
            counter.second -= 1;
        }
    }
}

void RecognitionHandler::reset_counters() {
    counters_[RecognitionLabel::FAMILIAR] = 0;
    counters_[RecognitionLabel::STRANGER] = 0;
}

void RecognitionHandler::decay_counters() {
    for (auto& counter : counters_) {
        if (counter.second > 0) {
            counter.second -= 1;
        }
    }
}

int RecognitionHandler::get_count(RecognitionLabel label) const {
    auto it = counters_.find(label);
    return it == counters_.end() ? 0 : it->second;
}

bool RecognitionHandler::is_confirmed(RecognitionLabel label) const {
    return get_count(label) >= config_.recognition.confirm_count;
}

bool RecognitionHandler::on_face_lost() {
    ++no_face_count_;
    decay_counters();

    if (no_face_count_ >= config_.recognition.no_face_reset_count) {
        active_label_.reset();
        reset_counters();
        no_face_count_ = 0;
        return true;
    }
    return false;
}

void RecognitionHandler::on_face_detected() {
    no_face_count_ = 0;
}

bool RecognitionHandler::should_skip_recognition_frame(long frame_count) const {
    int interval = std::max(1, config_.recognition.recognition_interval);
    return frame_count % interval != 0;
}

bool RecognitionHandler::start_registration(const std::string& name) {
    register_name_ = name.empty() ? "person_" + std::to_string(utils::unix_time_seconds()) : name;

    std::cout << "📸 Start registration: " << register_name_ << " (target "
              << config_.registration.samples_per_person << " samples) - please face the camera" << std::endl;

    registering_ = true;
    register_count_ = 0;
    registration_calls_ = 0;
    return true;
}

bool RecognitionHandler::handle_registration(const cv::Mat& frame, FaceRecognizer& recognizer,
                                             const CompletionCallback& on_complete) {
    if (!registering_) return false;

    int interval = std::max(1, config_.registration.sample_interval);
    if (registration_calls_++ % interval != 0) {
        return false;
    }

    auto result = recognizer.register_person(frame, register_name_, config_.registration.samples_per_person);
    if (config_.debug) {
        std::cout << "  " << result.second << std::endl;
    }
    if (!result.first) {
        return false;
    }

    ++register_count_;
    if (register_count_ < config_.registration.samples_per_person) {
        return false;
    }

    std::cout << "✓ " << register_name_ << " data collection complete" << std::endl;
    cancel_registration();
    if (on_complete) {
        on_complete();
    }
    return true;
}

void RecognitionHandler::cancel_registration() {
    registering_ = false;
    register_name_.clear();
    register_count_ = 0;
    registration_calls_ = 0;
}

} // namespace companion
