#include "linkdrop/server/access_control.hpp"

#include <stdexcept>

#include "linkdrop/crypto.hpp"

namespace linkdrop::server
{

    AccessControl::AccessControl(std::optional<std::string> key_hash) : key_hash_(std::move(key_hash))
    {
        if (key_hash_ && key_hash_->empty())
        {
            throw std::invalid_argument("Access key hash must not be empty");
        }
    }

    bool AccessControl::verify(std::string_view key) const
    {
        if (!key_hash_)
        {
            return true;
        }
        return crypto::verify_password(key, *key_hash_);
    }

} // namespace linkdrop::server
