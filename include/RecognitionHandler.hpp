#pragma once

#include "Config.hpp"
#include <functional>
#include <map>
#include <optional>
#include <string>

#include <opencv2/core.hpp>

namespace companion {

class FaceRecognizer;

enum class RecognitionLabel {
    FAMILIAR,
    STRANGER
};

const char* to_string(RecognitionLabel label);

/**
 * @brief Debounced familiar / stranger classification and registration bookkeeping
 *
 * Every recognized frame votes for one label: that counter rises (saturating
 * at confirm_count) and every other counter falls (floored at 0). A label is
 * confirmed when its counter reaches confirm_count.
 */
class RecognitionHandler {
public:
    using CompletionCallback = std::function<void()>;

    explicit RecognitionHandler(const Config& config);

    // Counters
    void update_counter(RecognitionLabel label);
    void reset_counters();
    void decay_counters();
    int get_count(RecognitionLabel label) const;
    bool is_confirmed(RecognitionLabel label) const;

    /**
     * @brief Count a frame without a face
     * @return true when no_face_reset_count consecutive misses were reached
     *         (active label, counters and miss counter are then cleared)
     */
    bool on_face_lost();
    void on_face_detected();
    int no_face_count() const { return no_face_count_; }

    void set_active_label(std::optional<RecognitionLabel> label) { active_label_ = label; }
    std::optional<RecognitionLabel> get_active_label() const { return active_label_; }

    /** Run recognition only on every recognition_interval-th frame */
    bool should_skip_recognition_frame(long frame_count) const;

    // Registration
    bool start_registration(const std::string& name = "");

    /**
     * @brief Offer a frame to the active registration
     *
     * Only every sample_interval-th call asks the recognizer for a sample.
     * @return true on the call that completes registration
     */
    bool handle_registration(const cv::Mat& frame, FaceRecognizer& recognizer,
                             const CompletionCallback& on_complete = nullptr);
    void cancel_registration();

    bool is_registering() const { return registering_; }
    const std::string& register_name() const { return register_name_; }
    int register_count() const { return register_count_; }

private:
    const Config& config_;
    std::map<RecognitionLabel, int> counters_;
    std::optional<RecognitionLabel> active_label_;
    int no_face_count_ = 0;

    bool registering_ = false;
    std::string register_name_;
    int register_count_ = 0;
    long registration_calls_ = 0;
};

} // namespace companion
