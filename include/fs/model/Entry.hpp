#pragma once

#include <cstdint>
#include <ctime>
#include <filesystem>
#include <optional>
#include <string>
#include <nlohmann/json_fwd.hpp>

namespace fw::fs::model {

enum class EntryKind { File, Directory };

std::string to_string(EntryKind kind);
EntryKind kindFromString(const std::string& s);

// Point-in-time snapshot of one filesystem node. Never cached across calls.
struct Entry {
    std::string name{};
    EntryKind kind{EntryKind::File};
    std::optional<uintmax_t> size_bytes{};     // files only
    std::time_t modified_at{};
    std::optional<std::string> extension{};    // files only, lower-cased, with leading dot

    [[nodiscard]] bool isDirectory() const { return kind == EntryKind::Directory; }

    // Reads metadata through the given status; fills size/extension for regular files.
    static Entry fromStatus(const std::string& name, const std::filesystem::path& resolved);
};

void to_json(nlohmann::json& j, const Entry& entry);
void from_json(const nlohmann::json& j, Entry& entry);

}
