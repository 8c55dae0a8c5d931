#include "classify/Classifier.hpp"

#include <stdexcept>
#include <nlohmann/json.hpp>

using namespace fw::classify;

std::vector<Decision> RejectAllClassifier::classify(const std::vector<FileCandidate>& files, const std::string&) {
    std::vector<Decision> out;
    out.reserve(files.size());
    for (const auto& f : files)
        out.push_back({f.filename, false, "No classifier configured; files are left in place"});
    return out;
}

std::vector<Decision> fw::classify::parseDecisions(const nlohmann::json& j) {
    const auto& arr = j.is_object() && j.contains("files") ? j.at("files") : j;
    if (!arr.is_array()) throw std::invalid_argument("classifier response is not a list of decisions");

    std::vector<Decision> out;
    out.reserve(arr.size());

    for (const auto& d : arr) {
        if (!d.is_object() || !d.contains("filename") || !d["filename"].is_string())
            throw std::invalid_argument("classifier decision without a filename");
        if (!d.contains("include") || !d["include"].is_boolean())
            throw std::invalid_argument("classifier decision without a boolean include for " + d["filename"].get<std::string>());

        Decision dec;
        dec.filename = d["filename"].get<std::string>();
        dec.include = d["include"].get<bool>();
        if (d.contains("reasoning") && d["reasoning"].is_string()) dec.rationale = d["reasoning"].get<std::string>();
        else if (d.contains("rationale") && d["rationale"].is_string()) dec.rationale = d["rationale"].get<std::string>();
        out.push_back(std::move(dec));
    }

    return out;
}

void fw::classify::to_json(nlohmann::json& j, const FileCandidate& f) {
    j = {
        {"filename", f.filename},
        {"path", f.path.string()},
        {"size", f.size},
        {"extension", f.extension}
    };
}

void fw::classify::to_json(nlohmann::json& j, const Decision& d) {
    j = {
        {"filename", d.filename},
        {"include", d.include},
        {"reasoning", d.rationale}
    };
}
