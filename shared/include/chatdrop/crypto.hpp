/**
 * ChatDrop - Crypto helpers built on libsodium.
 */
#pragma once

#include <cstddef>
#include <filesystem>
#include <span>
#include <string>

namespace chatdrop::crypto
{

    void ensure_sodium_init();

    // Lowercase hex encoding of byte_count bytes from the libsodium CSPRNG.
    std::string random_hex(std::size_t byte_count);

    // BLAKE2b-256 digest, hex encoded.
    std::string hash_bytes(std::span<const std::byte> data);

    std::string hash_file(const std::filesystem::path &path);

} // namespace chatdrop::crypto
