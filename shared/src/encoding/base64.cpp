#include "linkdrop/encoding/base64.hpp"

#include <cstring>
#include <stdexcept>

#include <sodium.h>

#include "linkdrop/crypto.hpp"

namespace linkdrop::encoding
{

    namespace
    {

        int sodium_variant(Base64Variant variant) noexcept
        {
            switch (variant)
            {
            case Base64Variant::UrlSafeNoPadding:
                return sodium_base64_VARIANT_URLSAFE_NO_PADDING;
            case Base64Variant::Standard:
            default:
                return sodium_base64_VARIANT_ORIGINAL;
            }
        }

    } // namespace

    std::string encode_base64(std::span<const std::byte> data, Base64Variant variant)
    {
        crypto::ensure_sodium_init();
        const auto sodium_id = sodium_variant(variant);
        std::string output(sodium_base64_encoded_len(data.size(), sodium_id), '\0');
        sodium_bin2base64(output.data(), output.size(), reinterpret_cast<const unsigned char *>(data.data()),
                          data.size(), sodium_id);
        output.resize(std::strlen(output.c_str()));
        return output;
    }

    std::vector<std::byte> decode_base64(std::string_view input, Base64Variant variant)
    {
        crypto::ensure_sodium_init();
        std::vector<std::byte> output((input.size() * 3) / 4 + 3);
        std::size_t decoded = 0;
        if (sodium_base642bin(reinterpret_cast<unsigned char *>(output.data()), output.size(), input.data(),
                              input.size(), " \r\n\t", &decoded, nullptr, sodium_variant(variant)) != 0)
        {
            return {};
        }
        output.resize(decoded);
        return output;
    }

} // namespace linkdrop::encoding
