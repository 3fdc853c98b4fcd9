#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace linkdrop::server
{

    // Without a configured key hash the service is open and every caller
    // counts as authenticated.
    class AccessControl
    {
    public:
        explicit AccessControl(std::optional<std::string> key_hash);

        bool open() const noexcept { return !key_hash_; }

        bool verify(std::string_view key) const;

    private:
        std::optional<std::string> key_hash_;
    };

} // namespace linkdrop::server
