#include "fs/model/Entry.hpp"
#include "fs/model/Path.hpp"
#include "engine/errors.hpp"

#include <nlohmann/json.hpp>

using namespace fw::fs::model;

std::string fw::fs::model::to_string(const EntryKind kind) {
    switch (kind) {
    case EntryKind::File: return "file";
    case EntryKind::Directory: return "dir";
    }
    return "file";
}

EntryKind fw::fs::model::kindFromString(const std::string& s) {
    if (s == "dir" || s == "directory") return EntryKind::Directory;
    if (s == "file" || s.empty() || s == "unknown") return EntryKind::File;
    throw engine::InvalidRequestError("Unknown entry kind: " + s);
}

Entry Entry::fromStatus(const std::string& name, const std::filesystem::path& resolved) {
    namespace stdfs = std::filesystem;

    const auto st = stdfs::status(resolved); // throws on EACCES and friends
    if (!stdfs::exists(st))
        throw stdfs::filesystem_error("Entry vanished", resolved, std::make_error_code(std::errc::no_such_file_or_directory));

    Entry e;
    e.name = name;
    e.modified_at = toTimeT(stdfs::last_write_time(resolved));

    if (stdfs::is_directory(st)) {
        e.kind = EntryKind::Directory;
        return e;
    }

    e.kind = EntryKind::File;
    if (stdfs::is_regular_file(st)) e.size_bytes = stdfs::file_size(resolved);
    else e.size_bytes = 0;
    e.extension = toLower(splitExtension(name).second);
    return e;
}

void fw::fs::model::to_json(nlohmann::json& j, const Entry& entry) {
    j = {
        {"name", entry.name},
        {"type", to_string(entry.kind)},
        {"modified", entry.modified_at}
    };

    if (entry.size_bytes) j["size"] = *entry.size_bytes;
    else j["size"] = nullptr;

    if (entry.extension) j["extension"] = *entry.extension;
    else j["extension"] = nullptr;
}

void fw::fs::model::from_json(const nlohmann::json& j, Entry& entry) {
    entry.name = j.at("name").get<std::string>();
    entry.kind = kindFromString(j.value("type", "file"));
    entry.modified_at = j.value("modified", static_cast<std::time_t>(0));
    if (j.contains("size") && !j["size"].is_null()) entry.size_bytes = j["size"].get<uintmax_t>();
    if (j.contains("extension") && !j["extension"].is_null()) entry.extension = j["extension"].get<std::string>();
}
