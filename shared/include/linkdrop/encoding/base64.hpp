#pragma once

#include <cstddef>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace linkdrop::encoding
{

    enum class Base64Variant
    {
        Standard,
        UrlSafeNoPadding
    };

    std::string encode_base64(std::span<const std::byte> data, Base64Variant variant = Base64Variant::Standard);

    // Returns an empty vector when the input is not valid for the variant.
    std::vector<std::byte> decode_base64(std::string_view input, Base64Variant variant = Base64Variant::Standard);

} // namespace linkdrop::encoding
