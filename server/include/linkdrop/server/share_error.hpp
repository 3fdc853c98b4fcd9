#pragma once

#include <stdexcept>
#include <string>

#include "linkdrop/error_codes.hpp"

namespace linkdrop::server
{

    class ShareError : public std::runtime_error
    {
    public:
        ShareError(linkdrop::ErrorCode code, std::string message);

        linkdrop::ErrorCode code() const noexcept { return code_; }

    private:
        linkdrop::ErrorCode code_;
    };

} // namespace linkdrop::server
