/**
 * LinkDrop - Crypto helpers built on libsodium.
 */
#pragma once

#include <cstddef>
#include <span>
#include <string>
#include <string_view>

namespace linkdrop::crypto
{

    // 16 random bytes: 128 bits of entropy, 22 characters once encoded.
    inline constexpr std::size_t kTokenBytes = 16;

    void ensure_sodium_init();

    // Unguessable URL-safe identifier (base64url, no padding).
    std::string generate_token(std::size_t entropy_bytes = kTokenBytes);

    // Random lowercase hex identifier for internal handles such as upload ids.
    std::string generate_hex_id(std::size_t entropy_bytes = 12);

    std::string hash_password(std::string_view password);

    bool verify_password(std::string_view password, std::string_view password_hash);

    std::string hash_bytes(std::span<const std::byte> data);

} // namespace linkdrop::crypto
