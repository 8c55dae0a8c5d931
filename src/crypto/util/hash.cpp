#include "crypto/util/hash.hpp"

#include <sodium.h>
#include <fstream>
#include <sstream>
#include <iomanip>
#include <stdexcept>
#include <vector>

namespace {

void ensureSodium() {
    static const int rc = sodium_init();
    if (rc < 0) throw std::runtime_error("libsodium failed to initialize");
}

std::string toHex(const unsigned char* bytes, const std::size_t len) {
    std::ostringstream result;
    for (size_t i = 0; i < len; ++i)
        result << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(bytes[i]);
    return result.str();
}

}

namespace fw::crypto::hash {

std::string blake2b(const std::filesystem::path& filepath, const std::size_t chunkSize) {
    ensureSodium();

    constexpr size_t hash_len = crypto_generichash_BYTES;
    unsigned char hash[hash_len];

    std::ifstream file(filepath, std::ios::binary);
    if (!file) throw std::runtime_error("Failed to open file for hashing: " + filepath.string());

    crypto_generichash_state state;
    crypto_generichash_init(&state, nullptr, 0, hash_len);

    std::vector<char> buffer(chunkSize == 0 ? config::DEFAULT_HASH_CHUNK_BYTES : chunkSize);
    while (file) {
        file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        if (const auto got = file.gcount(); got > 0)
            crypto_generichash_update(&state, reinterpret_cast<const unsigned char*>(buffer.data()), static_cast<unsigned long long>(got));
    }

    if (file.bad()) throw std::runtime_error("Read error while hashing: " + filepath.string());

    crypto_generichash_final(&state, hash, hash_len);
    return toHex(hash, hash_len);
}

std::string blake2b(const std::string_view data) {
    ensureSodium();

    constexpr size_t hash_len = crypto_generichash_BYTES;
    unsigned char hash[hash_len];
    crypto_generichash(hash, hash_len, reinterpret_cast<const unsigned char*>(data.data()), data.size(), nullptr, 0);
    return toHex(hash, hash_len);
}

}
