#pragma once

#include "Config.hpp"
#include "FaceDatabase.hpp"
#include "RobotTypes.hpp"
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <opencv2/core.hpp>

namespace companion {

/**
 * @brief Abstract interface for face detection and identity recognition
 *
 * Lets the behavior engine run against OpenCV models on the robot and
 * scripted fakes in tests.
 */
class FaceRecognizer {
public:
    virtual ~FaceRecognizer() = default;

    /**
     * @brief Detect faces and attach identities from the face database
     * @param frame BGR frame
     * @return All faces above the confidence/size limits (may be empty)
     */
    virtual std::vector<FaceObservation> detect_and_recognize(const cv::Mat& frame) = 0;

    /**
     * @brief Detection only, no embedding (cheap path used while rotating)
     */
    virtual std::vector<FaceObservation> detect_faces_only(const cv::Mat& frame) = 0;

    /**
     * @brief Capture one registration sample of the largest face
     * @param num_samples Total samples the caller is collecting (for messages)
     * @return (success, human readable message)
     */
    virtual std::pair<bool, std::string> register_person(const cv::Mat& frame,
                                                         const std::string& name,
                                                         int num_samples) = 0;

    virtual int known_person_count() const = 0;

    virtual std::string name() const = 0;

    virtual bool is_initialized() const = 0;
};

/**
 * @brief Largest face by box area, or nullptr when @p faces is empty
 */
const FaceObservation* get_largest_face(const std::vector<FaceObservation>& faces);

/**
 * @brief YuNet detection + SFace recognition through OpenCV's objdetect module
 */
class OpenCVFaceRecognizer : public FaceRecognizer {
public:
    explicit OpenCVFaceRecognizer(const Config& config);
    ~OpenCVFaceRecognizer() override;

    std::vector<FaceObservation> detect_and_recognize(const cv::Mat& frame) override;
    std::vector<FaceObservation> detect_faces_only(const cv::Mat& frame) override;
    std::pair<bool, std::string> register_person(const cv::Mat& frame,
                                                 const std::string& name,
                                                 int num_samples) override;
    int known_person_count() const override { return database_.person_count(); }
    std::string name() const override { return "OpenCV YuNet/SFace"; }
    bool is_initialized() const override { return initialized_; }

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
    FaceDatabase database_;
    const Config& config_;
    bool initialized_ = false;
};

/**
 * @brief Factory function to create the face recognizer
 * @return nullptr if the detection/recognition models cannot be loaded
 */
std::unique_ptr<FaceRecognizer> create_face_recognizer(const Config& config);

} // namespace companion
