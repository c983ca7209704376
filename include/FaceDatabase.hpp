#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include <opencv2/core.hpp>

namespace companion {

/**
 * @brief Result of a face database lookup
 */
struct FaceMatch {
    std::optional<std::string> name;  // unset when below threshold or ambiguous
    float similarity = 0.0f;          // best similarity in [0, 1]
};

/**
 * @brief Per-person embedding store with cosine-similarity search
 *
 * Each person keeps every registered embedding; a query scores a person by
 * the best of their embeddings. Persisted as YAML through cv::FileStorage.
 */
class FaceDatabase {
public:
    explicit FaceDatabase(std::string db_path = "");

    void add_person(const std::string& name, const cv::Mat& embedding);
    void remove_person(const std::string& name);
    void clear();

    int person_count() const { return static_cast<int>(people_.size()); }
    int embedding_count(const std::string& name) const;
    std::vector<std::string> persons() const;

    /**
     * @brief Find the best matching person
     *
     * A match requires similarity >= @p threshold and, with two or more
     * people enrolled, a lead of at least @p margin over the runner-up.
     */
    FaceMatch search(const cv::Mat& query, float threshold, float margin) const;

    /** Cosine similarity mapped from [-1, 1] to [0, 1] */
    static float similarity(const cv::Mat& a, const cv::Mat& b);

    bool load();
    bool save() const;

    const std::string& path() const { return db_path_; }

private:
    std::string db_path_;
    std::map<std::string, std::vector<cv::Mat>> people_;
};

} // namespace companion
