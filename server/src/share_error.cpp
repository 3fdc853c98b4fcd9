#include "linkdrop/server/share_error.hpp"

#include <utility>

namespace linkdrop::server
{

    ShareError::ShareError(linkdrop::ErrorCode code, std::string message)
        : std::runtime_error(std::move(message)), code_(code) {}

} // namespace linkdrop::server
