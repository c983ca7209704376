#include "FaceRecognizer.hpp"
#include "Utils.hpp"
#include <iostream>

#include <opencv2/imgproc.hpp>
#include <opencv2/objdetect/face.hpp>

namespace companion {

const FaceObservation* get_largest_face(const std::vector<FaceObservation>& faces) {
    const FaceObservation* largest = nullptr;
    for (const auto& face : faces) {
        if (!largest || face.box.area() > largest->box.area()) {
            largest = &face;
        }
    }
    return largest;
}

// ============================================================================
// OpenCV YuNet + SFace implementation
// ============================================================================

class OpenCVFaceRecognizer::Impl {
public:
    explicit Impl(const ModelSettings& models) : models_(models) {
        if (!utils::file_exists(models.yunet_path)) {
            std::cerr << "❌ YuNet model not found: " << models.yunet_path << std::endl;
            return;
        }
        if (!utils::file_exists(models.sface_path)) {
            std::cerr << "❌ SFace model not found: " << models.sface_path << std::endl;
            return;
        }

        try {
            detector_ = cv::FaceDetectorYN::create(
                models.yunet_path, "", cv::Size(320, 320),
                static_cast<float>(models.detect_score_threshold),
                static_cast<float>(models.detect_nms_threshold),
                models.detect_top_k);
            recognizer_ = cv::FaceRecognizerSF::create(models.sface_path, "");
            initialized_ = detector_ && recognizer_;
        } catch (const cv::Exception& e) {
            std::cerr << "❌ Failed to load face models: " << e.what() << std::endl;
            initialized_ = false;
        }

        if (initialized_) {
            std::cout << "✓ YuNet detector + SFace recognizer initialized" << std::endl;
        }
    }

    /**
     * @brief Run YuNet and return the raw 15-column rows as observations
     *
     * Row layout: x, y, w, h, 5 landmark (x, y) pairs, score.
     */
    std::vector<FaceObservation> detect(const cv::Mat& frame, cv::Mat& raw) {
        std::vector<FaceObservation> result;
        if (!initialized_ || frame.empty()) {
            return result;
        }

        detector_->setInputSize(frame.size());
        detector_->detect(frame, raw);
        if (raw.empty()) {
            return result;
        }

        for (int i = 0; i < raw.rows; ++i) {
            const float* row = raw.ptr<float>(i);
            FaceObservation face;
            face.box = cv::Rect(static_cast<int>(row[0]), static_cast<int>(row[1]),
                                static_cast<int>(row[2]), static_cast<int>(row[3]));
            for (int k = 0; k < 5; ++k) {
                face.landmarks[k] = cv::Point2f(row[4 + 2 * k], row[5 + 2 * k]);
            }
            face.confidence = row[14];

            if (face.confidence < models_.detect_score_threshold) continue;
            if (face.box.width < models_.min_face_size || face.box.height < models_.min_face_size) continue;

            result.push_back(face);
            kept_rows_.push_back(i);
        }
        return result;
    }

    // L2-normalized SFace embedding of the face at raw row @p row
    cv::Mat embed(const cv::Mat& frame, const cv::Mat& raw, int row) {
        cv::Mat aligned, feature;
        recognizer_->alignCrop(frame, raw.row(row), aligned);
        recognizer_->feature(aligned, feature);

        cv::Mat embedding = feature.reshape(1, 1).clone();
        double n = cv::norm(embedding);
        if (n > 0) {
            embedding /= n;
        }
        return embedding;
    }

    std::vector<int> kept_rows_;
    bool initialized_ = false;

private:
    const ModelSettings& models_;
    cv::Ptr<cv::FaceDetectorYN> detector_;
    cv::Ptr<cv::FaceRecognizerSF> recognizer_;
};

OpenCVFaceRecognizer::OpenCVFaceRecognizer(const Config& config)
    : impl_(std::make_unique<Impl>(config.models)),
      database_(config.models.face_database_path),
      config_(config) {
    initialized_ = impl_->initialized_;
    if (initialized_) {
        database_.load();
    }
}

OpenCVFaceRecognizer::~OpenCVFaceRecognizer() = default;

std::vector<FaceObservation> OpenCVFaceRecognizer::detect_faces_only(const cv::Mat& frame) {
    cv::Mat raw;
    impl_->kept_rows_.clear();
    return impl_->detect(frame, raw);
}

std::vector<FaceObservation> OpenCVFaceRecognizer::detect_and_recognize(const cv::Mat& frame) {
    cv::Mat raw;
    impl_->kept_rows_.clear();
    std::vector<FaceObservation> faces = impl_->detect(frame, raw);

    for (size_t i = 0; i < faces.size(); ++i) {
        try {
            cv::Mat embedding = impl_->embed(frame, raw, impl_->kept_rows_[i]);
            FaceMatch match = database_.search(embedding,
                                               static_cast<float>(config_.recognition.threshold),
                                               static_cast<float>(config_.recognition.margin));
            faces[i].identity = match.name;
            faces[i].similarity = match.similarity;

            if (config_.debug) {
                std::cout << "[Recognition] " << (match.name ? *match.name : "unknown")
                          << " similarity=" << match.similarity << std::endl;
            }
        } catch (const cv::Exception& e) {
            std::cerr << "⚠ Embedding failed: " << e.what() << std::endl;
        }
    }
    return faces;
}

std::pair<bool, std::string> OpenCVFaceRecognizer::register_person(const cv::Mat& frame,
                                                                   const std::string& name,
                                                                   int num_samples) {
    cv::Mat raw;
    impl_->kept_rows_.clear();
    std::vector<FaceObservation> faces = impl_->detect(frame, raw);
    if (faces.empty()) {
        return {false, "No face detected"};
    }

    const FaceObservation* largest = get_largest_face(faces);
    int row = impl_->kept_rows_[static_cast<size_t>(largest - faces.data())];

    try {
        database_.add_person(name, impl_->embed(frame, raw, row));
    } catch (const cv::Exception& e) {
        return {false, std::string("Embedding failed: ") + e.what()};
    }
    database_.save();

    int count = database_.embedding_count(name);
    if (count >= num_samples) {
        return {true, "Registration complete! Total samples: " + std::to_string(count)};
    }
    return {true, "Collected " + std::to_string(count) + "/" + std::to_string(num_samples)};
}

// ============================================================================
// Factory Function
// ============================================================================

std::unique_ptr<FaceRecognizer> create_face_recognizer(const Config& config) {
    auto recognizer = std::make_unique<OpenCVFaceRecognizer>(config);
    if (recognizer->is_initialized()) {
        std::cout << "✓ Using " << recognizer->name() << " (" << recognizer->known_person_count()
                  << " known people)" << std::endl;
        return recognizer;
    }

    std::cerr << "❌ No face recognizer available - face features disabled" << std::endl;
    return nullptr;
}

} // namespace companion
