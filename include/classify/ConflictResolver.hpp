#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <nlohmann/json_fwd.hpp>

namespace fw::classify {

enum class ConflictAction { Skip, Rename, Replace };

std::string to_string(ConflictAction action);
ConflictAction actionFromString(const std::string& s);

struct ConflictFile {
    std::string name{};
    std::filesystem::path path{};
    uintmax_t size{};
};

struct Resolution {
    ConflictAction action{ConflictAction::Skip};
    std::optional<std::string> new_name{};   // Rename only; a generated "<stem>_N<ext>" is used when absent
    std::string rationale{};
};

class ConflictResolver {
public:
    virtual ~ConflictResolver() = default;

    /// Called when `incoming` would land on an existing file. May throw; callers then skip.
    virtual Resolution resolve(const ConflictFile& existing, const ConflictFile& incoming) = 0;
};

class SkipConflictResolver final : public ConflictResolver {
public:
    Resolution resolve(const ConflictFile&, const ConflictFile&) override {
        return {ConflictAction::Skip, std::nullopt, "Destination exists; keeping the existing file"};
    }
};

// {"action": "skip|rename|replace", "reasoning"?: str, "new_name"? | "new_path"?: str}
// new_path is reduced to its final component. Throws std::invalid_argument when malformed.
Resolution parseResolution(const nlohmann::json& j);

void to_json(nlohmann::json& j, const ConflictFile& f);

}
