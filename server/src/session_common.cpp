#include "session_common.hpp"

#include "linkdrop/error_codes.hpp"
#include "linkdrop/timestamp.hpp"

namespace linkdrop::server::session_common
{

    namespace
    {

        linkdrop::protocol::ResponseEnvelope make_response(linkdrop::protocol::ResponseKind kind, nlohmann::json payload,
                                                           const std::optional<std::string> &request_id)
        {
            linkdrop::protocol::ResponseEnvelope envelope;
            envelope.kind = kind;
            envelope.payload = std::move(payload);
            envelope.message = "";
            envelope.error = linkdrop::ErrorCode::Ok;
            envelope.request_id = request_id;
            return envelope;
        }

    } // namespace

    linkdrop::protocol::ResponseEnvelope make_ok_response(nlohmann::json payload,
                                                          const std::optional<std::string> &request_id)
    {
        return make_response(linkdrop::protocol::ResponseKind::Ok, std::move(payload), request_id);
    }

    linkdrop::protocol::ResponseEnvelope make_continue_response(nlohmann::json payload,
                                                                const std::optional<std::string> &request_id)
    {
        return make_response(linkdrop::protocol::ResponseKind::Continue, std::move(payload), request_id);
    }

    linkdrop::protocol::ShareSummary to_summary(const ShareRecord &record)
    {
        return linkdrop::protocol::ShareSummary{
            .id = record.id,
            .filename = record.filename,
            .token = record.token,
            .expires_at = format_iso8601_utc(record.expires_at),
            .max_downloads = record.max_downloads,
            .download_count = record.download_count,
            .created_at = format_iso8601_utc(record.created_at),
        };
    }

    linkdrop::protocol::ShareCreated to_created(const ShareRecord &record)
    {
        return linkdrop::protocol::ShareCreated{
            .token = record.token,
            .expires_at = format_iso8601_utc(record.expires_at),
            .max_downloads = record.max_downloads,
        };
    }

} // namespace linkdrop::server::session_common
