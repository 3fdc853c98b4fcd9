#include "linkdrop/server/session.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "linkdrop/server/share_error.hpp"
#include "session_common.hpp"

namespace linkdrop::server
{

    void Session::handle_list_shares(const linkdrop::protocol::RequestEnvelope &envelope)
    {
        if (!require_authentication(envelope))
        {
            return;
        }
        try
        {
            nlohmann::json shares = nlohmann::json::array();
            for (const auto &record : services_.registry.list_active(services_.clock.now()))
            {
                shares.push_back(session_common::to_summary(record));
            }
            nlohmann::json payload;
            payload["shares"] = std::move(shares);
            send_response(session_common::make_ok_response(std::move(payload), envelope.request_id));
        }
        catch (const std::exception &ex)
        {
            send_failure(ex, "list shares", envelope.request_id);
        }
    }

    void Session::handle_delete_share(const linkdrop::protocol::RequestEnvelope &envelope)
    {
        if (!require_authentication(envelope))
        {
            return;
        }
        try
        {
            const auto request = envelope.payload.get<linkdrop::protocol::DeleteShareRequest>();
            const auto record = services_.registry.delete_by_id(request.id);
            if (!record)
            {
                throw ShareError(linkdrop::ErrorCode::NotFound, "Not found");
            }

            std::error_code ec;
            services_.storage.remove(services_.storage.path_for(*record), ec);
            if (ec)
            {
                spdlog::error("Share {} deleted but its file remains: {}", record->token, ec.message());
            }
            spdlog::info("{} deleted share {} ({})", remote_endpoint(), record->id, record->filename);

            nlohmann::json payload;
            payload["id"] = record->id;
            payload["deleted"] = true;
            send_response(session_common::make_ok_response(std::move(payload), envelope.request_id));
        }
        catch (const std::exception &ex)
        {
            send_failure(ex, "delete share", envelope.request_id);
        }
    }

} // namespace linkdrop::server
