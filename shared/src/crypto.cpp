#include "linkdrop/crypto.hpp"

#include <cstring>
#include <mutex>
#include <stdexcept>
#include <vector>

#include <sodium.h>

#include "linkdrop/encoding/base64.hpp"

namespace linkdrop::crypto
{

    namespace
    {

        std::string to_hex(std::span<const unsigned char> data)
        {
            std::string result(data.size() * 2 + 1, '\0');
            sodium_bin2hex(result.data(), result.size(), data.data(), data.size());
            result.resize(data.size() * 2);
            return result;
        }

        std::once_flag &sodium_once_flag()
        {
            static std::once_flag flag;
            return flag;
        }

    } // namespace

    void ensure_sodium_init()
    {
        std::call_once(sodium_once_flag(), []()
                       {
            if (sodium_init() < 0)
            {
                throw std::runtime_error("libsodium initialization failed");
            } });
    }

    std::string generate_token(std::size_t entropy_bytes)
    {
        if (entropy_bytes < kTokenBytes)
        {
            throw std::invalid_argument("Tokens need at least 128 bits of entropy");
        }
        ensure_sodium_init();
        std::vector<std::byte> bytes(entropy_bytes);
        randombytes_buf(bytes.data(), bytes.size());
        auto token = encoding::encode_base64(bytes, encoding::Base64Variant::UrlSafeNoPadding);
        sodium_memzero(bytes.data(), bytes.size());
        return token;
    }

    std::string generate_hex_id(std::size_t entropy_bytes)
    {
        ensure_sodium_init();
        std::vector<unsigned char> bytes(entropy_bytes);
        randombytes_buf(bytes.data(), bytes.size());
        return to_hex(bytes);
    }

    std::string hash_password(std::string_view password)
    {
        ensure_sodium_init();
        std::string hash;
        hash.resize(crypto_pwhash_STRBYTES);
        if (crypto_pwhash_str(hash.data(), password.data(), password.size(), crypto_pwhash_OPSLIMIT_INTERACTIVE,
                              crypto_pwhash_MEMLIMIT_INTERACTIVE) != 0)
        {
            throw std::runtime_error("crypto_pwhash_str failed");
        }
        hash.resize(std::strlen(hash.c_str()));
        return hash;
    }

    bool verify_password(std::string_view password, std::string_view password_hash)
    {
        ensure_sodium_init();
        const std::string hash_string(password_hash);
        return crypto_pwhash_str_verify(hash_string.c_str(), password.data(), password.size()) == 0;
    }

    std::string hash_bytes(std::span<const std::byte> data)
    {
        ensure_sodium_init();
        std::vector<unsigned char> digest(crypto_generichash_BYTES);
        if (crypto_generichash(digest.data(), digest.size(),
                               reinterpret_cast<const unsigned char *>(data.data()), data.size(), nullptr, 0) != 0)
        {
            throw std::runtime_error("crypto_generichash failed");
        }
        return to_hex(digest);
    }

} // namespace linkdrop::crypto
