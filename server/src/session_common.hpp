#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "linkdrop/protocol.hpp"
#include "linkdrop/server/share_record.hpp"

namespace linkdrop::server::session_common
{

    linkdrop::protocol::ResponseEnvelope make_ok_response(nlohmann::json payload,
                                                          const std::optional<std::string> &request_id);

    linkdrop::protocol::ResponseEnvelope make_continue_response(nlohmann::json payload,
                                                                const std::optional<std::string> &request_id);

    linkdrop::protocol::ShareSummary to_summary(const ShareRecord &record);

    linkdrop::protocol::ShareCreated to_created(const ShareRecord &record);

} // namespace linkdrop::server::session_common
