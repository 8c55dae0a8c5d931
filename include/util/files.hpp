#pragma once

#include <filesystem>

namespace fw::util {

// Renames without ever replacing an existing destination. Uses renameat2(RENAME_NOREPLACE)
// and falls back to an exists check + rename on filesystems that do not support it.
// Throws std::filesystem::filesystem_error (EEXIST when the destination appeared).
void renameNoReplace(const std::filesystem::path& from, const std::filesystem::path& to);

// renameNoReplace that falls back to copy + remove across filesystems.
void moveNoReplace(const std::filesystem::path& from, const std::filesystem::path& to);

// Copies a regular file, failing with EEXIST instead of overwriting.
void copyNoReplace(const std::filesystem::path& from, const std::filesystem::path& to);

// mkdir -p. Returns false when the directory already existed.
bool ensureDirectory(const std::filesystem::path& dir);

}
