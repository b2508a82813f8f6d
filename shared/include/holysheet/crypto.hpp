/**
 * HolySheet - libsodium backed identifiers and digests.
 */
#pragma once

#include <cstddef>
#include <span>
#include <string>
#include <string_view>

namespace holysheet::crypto
{

    // Lowercase hex of `bytes` random bytes. Used for ids minted by the in-memory store.
    std::string random_id(std::size_t bytes = 16);

    // BLAKE2b-256 digest in lowercase hex.
    std::string hash_bytes(std::span<const std::byte> data);

    std::string hash_string(std::string_view text);

} // namespace holysheet::crypto
