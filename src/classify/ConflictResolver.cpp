#include "classify/ConflictResolver.hpp"
#include "fs/model/Path.hpp"

#include <stdexcept>
#include <nlohmann/json.hpp>

using namespace fw::classify;

std::string fw::classify::to_string(const ConflictAction action) {
    switch (action) {
        case ConflictAction::Skip: return "skip";
        case ConflictAction::Rename: return "rename";
        case ConflictAction::Replace: return "replace";
        default: return "unknown";
    }
}

ConflictAction fw::classify::actionFromString(const std::string& raw) {
    const auto s = fs::model::toLower(raw);
    if (s == "skip") return ConflictAction::Skip;
    if (s == "rename") return ConflictAction::Rename;
    if (s == "replace") return ConflictAction::Replace;
    throw std::invalid_argument("Unknown conflict action: " + raw);
}

Resolution fw::classify::parseResolution(const nlohmann::json& j) {
    if (!j.is_object() || !j.contains("action") || !j["action"].is_string())
        throw std::invalid_argument("conflict resolution without an action");

    Resolution r;
    r.action = actionFromString(j["action"].get<std::string>());
    if (j.contains("reasoning") && j["reasoning"].is_string()) r.rationale = j["reasoning"].get<std::string>();

    if (r.action == ConflictAction::Rename) {
        if (j.contains("new_name") && j["new_name"].is_string())
            r.new_name = j["new_name"].get<std::string>();
        else if (j.contains("new_path") && j["new_path"].is_string())
            r.new_name = std::filesystem::path(j["new_path"].get<std::string>()).filename().string();
    }

    return r;
}

void fw::classify::to_json(nlohmann::json& j, const ConflictFile& f) {
    j = {
        {"filename", f.name},
        {"size", f.size}
    };
}
