#pragma once

#include "fs/model/Entry.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace fw::plan::model {

enum class ItemErrorKind { Security, NotFound, Conflict, IOFailure, InvalidName };

enum class PlanState { Proposed, Validated, Committed, PartiallyCommitted };

std::string to_string(ItemErrorKind kind);
std::string to_string(PlanState state);

struct AppliedItem {
    std::string current_name{}, proposed_name{};
    fs::model::EntryKind kind{fs::model::EntryKind::File};
    std::optional<std::string> target_folder{};   // set by moves into a subfolder
};

struct SkippedItem {
    std::string name{}, reason{};
};

struct ItemError {
    std::string current_name{}, proposed_name{};
    ItemErrorKind kind{ItemErrorKind::IOFailure};
    std::string message{};
};

// Every input item lands in exactly one of applied, skipped or errors.
struct PlanExecutionResult {
    bool dry_run{true};
    std::filesystem::path folder;
    PlanState state{PlanState::Proposed};
    std::vector<AppliedItem> applied;
    std::vector<SkippedItem> skipped;
    std::vector<ItemError> errors;

    [[nodiscard]] bool success() const { return errors.empty(); }
    [[nodiscard]] std::size_t total() const { return applied.size() + skipped.size() + errors.size(); }

    // Validated for a dry run, Committed or PartiallyCommitted after a real run.
    void finalizeState();
};

void to_json(nlohmann::json& j, const AppliedItem& item);
void to_json(nlohmann::json& j, const SkippedItem& item);
void to_json(nlohmann::json& j, const ItemError& err);
void to_json(nlohmann::json& j, const PlanExecutionResult& r);

}
