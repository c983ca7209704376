#include "FaceDatabase.hpp"
#include "Utils.hpp"
#include <algorithm>
#include <iostream>

namespace companion {

FaceDatabase::FaceDatabase(std::string db_path) : db_path_(std::move(db_path)) {}

void FaceDatabase::add_person(const std::string& name, const cv::Mat& embedding) {
    cv::Mat row;
    embedding.reshape(1, 1).convertTo(row, CV_32F);
    people_[name].push_back(row.clone());
}

void FaceDatabase::remove_person(const std::string& name) {
    people_.erase(name);
}

void FaceDatabase::clear() {
    people_.clear();
}

int FaceDatabase::embedding_count(const std::string& name) const {
    auto it = people_.find(name);
    return it == people_.end() ? 0 : static_cast<int>(it->second.size());
}

std::vector<std::string> FaceDatabase::persons() const {
    std::vector<std::string> names;
    for (const auto& entry : people_) {
        names.push_back(entry.first);
    }
    return names;
}

float FaceDatabase::similarity(const cv::Mat& a, const cv::Mat& b) {
    cv::Mat va, vb;
    a.reshape(1, 1).convertTo(va, CV_32F);
    b.reshape(1, 1).convertTo(vb, CV_32F);
    if (va.cols != vb.cols || va.empty()) {
        return 0.0f;
    }

    double cosine = va.dot(vb) / (cv::norm(va) * cv::norm(vb) + 1e-8);
    return static_cast<float>((cosine + 1.0) / 2.0);
}

FaceMatch FaceDatabase::search(const cv::Mat& query, float threshold, float margin) const {
    FaceMatch result;
    if (people_.empty()) {
        return result;
    }

    std::string best_name;
    float best = 0.0f;
    float second_best = 0.0f;

    for (const auto& entry : people_) {
        float person_best = 0.0f;
        for (const auto& embedding : entry.second) {
            person_best = std::max(person_best, similarity(query, embedding));
        }

        if (person_best > best) {
            second_best = best;
            best = person_best;
            best_name = entry.first;
        } else if (person_best > second_best) {
            second_best = person_best;
        }
    }

    bool margin_ok = people_.size() <= 1 || (best - second_best) >= margin;
    result.similarity = best;
    if (best >= threshold && margin_ok) {
        result.name = best_name;
    }
    return result;
}

bool FaceDatabase::load() {
    people_.clear();
    if (db_path_.empty() || !utils::file_exists(db_path_)) {
        std::cout << "⚠ Face database not found, starting empty: " << db_path_ << std::endl;
        return false;
    }

    try {
        cv::FileStorage fs(db_path_, cv::FileStorage::READ);
        if (!fs.isOpened()) {
            std::cerr << "❌ Failed to open face database: " << db_path_ << std::endl;
            return false;
        }

        cv::FileNode people = fs["people"];
        for (auto it = people.begin(); it != people.end(); ++it) {
            cv::FileNode person = *it;
            std::string name = static_cast<std::string>(person["name"]);
            cv::FileNode embeddings = person["embeddings"];
            for (auto e = embeddings.begin(); e != embeddings.end(); ++e) {
                cv::Mat embedding;
                *e >> embedding;
                if (!embedding.empty()) {
                    people_[name].push_back(embedding);
                }
            }
        }
    } catch (const cv::Exception& e) {
        std::cerr << "❌ Failed to load face database: " << e.what() << std::endl;
        people_.clear();
        return false;
    }

    std::cout << "✓ Face database loaded: " << db_path_ << " (" << people_.size() << " people)" << std::endl;
    for (const auto& entry : people_) {
        std::cout << "   - " << entry.first << ": " << entry.second.size() << " embeddings" << std::endl;
    }
    return true;
}

bool FaceDatabase::save() const {
    if (db_path_.empty()) {
        return false;
    }
    utils::ensure_parent_directory(db_path_);

    try {
        cv::FileStorage fs(db_path_, cv::FileStorage::WRITE);
        if (!fs.isOpened()) {
            std::cerr << "❌ Failed to write face database: " << db_path_ << std::endl;
            return false;
        }

        fs << "people" << "[";
        for (const auto& entry : people_) {
            fs << "{" << "name" << entry.first << "embeddings" << "[";
            for (const auto& embedding : entry.second) {
                fs << embedding;
            }
            fs << "]" << "}";
        }
        fs << "]";
    } catch (const cv::Exception& e) {
        std::cerr << "❌ Failed to save face database: " << e.what() << std::endl;
        return false;
    }
    return true;
}

} // namespace companion
