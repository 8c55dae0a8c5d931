#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace fw::classify {

// What a classifier gets to see about a file. The content itself is never sent.
struct FileCandidate {
    std::string filename{};              // path relative to the organized folder; unique per call
    std::filesystem::path path{};
    uintmax_t size{};
    std::string extension{};
};

struct Decision {
    std::string filename{};
    bool include{false};
    std::string rationale{};
};

class Classifier {
public:
    virtual ~Classifier() = default;

    /// Decides, per file, whether it belongs to the described category.
    /// May throw; callers treat any failure as "exclude everything".
    virtual std::vector<Decision> classify(const std::vector<FileCandidate>& files, const std::string& category) = 0;
};

// Conservative default when no decision service is configured.
class RejectAllClassifier final : public Classifier {
public:
    std::vector<Decision> classify(const std::vector<FileCandidate>& files, const std::string& category) override;
};

// Accepts {"files": [...]} or a bare array. Each decision needs "filename" and a boolean
// "include"; "reasoning" or "rationale" is optional. Throws std::invalid_argument otherwise.
std::vector<Decision> parseDecisions(const nlohmann::json& j);

void to_json(nlohmann::json& j, const FileCandidate& f);
void to_json(nlohmann::json& j, const Decision& d);

}
