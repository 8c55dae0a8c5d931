#pragma once

#include "config/Config.hpp"

#include <filesystem>
#include <string>
#include <string_view>

namespace fw::crypto::hash {

// Streams the file through BLAKE2b-256 in chunks and returns the lowercase hex digest.
// Throws std::runtime_error when the file cannot be opened or a read fails midway.
std::string blake2b(const std::filesystem::path& filepath, std::size_t chunkSize = config::DEFAULT_HASH_CHUNK_BYTES);

std::string blake2b(std::string_view data);

}
