#include "linkdrop/server/session.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "linkdrop/crypto.hpp"
#include "linkdrop/encoding/base64.hpp"
#include "linkdrop/server/share_error.hpp"
#include "session_common.hpp"

namespace linkdrop::server
{

    void Session::handle_upload_init(const linkdrop::protocol::RequestEnvelope &envelope)
    {
        if (!require_authentication(envelope))
        {
            return;
        }
        try
        {
            const auto request = envelope.payload.get<linkdrop::protocol::UploadInitRequest>();
            auto upload = services_.upload_pipeline.begin(UploadRequest{
                .filename = request.filename,
                .declared_size = request.declared_size,
                .max_downloads = request.max_downloads,
                .expiration_days = request.expiration_days,
            });

            const linkdrop::protocol::UploadInitResponse response{
                .upload_id = upload->id(),
                .chunk_size = kUploadChunkSize,
                .max_size = services_.upload_pipeline.max_upload_size(),
            };
            spdlog::info("{} started upload {} ({})", remote_endpoint(), upload->id(), upload->filename());
            uploads_.emplace(upload->id(), std::move(upload));
            send_response(session_common::make_ok_response(response, envelope.request_id));
        }
        catch (const std::exception &ex)
        {
            send_failure(ex, "upload init", envelope.request_id);
        }
    }

    void Session::handle_upload_chunk(const linkdrop::protocol::RequestEnvelope &envelope)
    {
        if (!require_authentication(envelope))
        {
            return;
        }
        std::string upload_id;
        try
        {
            const auto request = envelope.payload.get<linkdrop::protocol::UploadChunkRequest>();
            upload_id = request.upload_id;
            auto it = uploads_.find(upload_id);
            if (it == uploads_.end())
            {
                throw ShareError(linkdrop::ErrorCode::NotFound, "Unknown upload");
            }

            const auto data = linkdrop::encoding::decode_base64(request.data_base64);
            if (data.empty() && !request.data_base64.empty())
            {
                throw ShareError(linkdrop::ErrorCode::InvalidPayload, "Chunk is not valid base64");
            }
            if (request.chunk_hash && linkdrop::crypto::hash_bytes(data) != *request.chunk_hash)
            {
                throw ShareError(linkdrop::ErrorCode::InvalidPayload, "Chunk hash mismatch");
            }

            it->second->append(data);

            nlohmann::json payload;
            payload["upload_id"] = upload_id;
            payload["uploaded"] = it->second->uploaded();
            send_response(session_common::make_ok_response(std::move(payload), envelope.request_id));
        }
        catch (const std::exception &ex)
        {
            // An append failure aborts the upload; forget it so later chunks
            // get a clean NotFound.
            auto it = uploads_.find(upload_id);
            if (it != uploads_.end() && !it->second->active())
            {
                uploads_.erase(it);
            }
            send_failure(ex, "upload chunk", envelope.request_id);
        }
    }

    void Session::handle_upload_commit(const linkdrop::protocol::RequestEnvelope &envelope)
    {
        if (!require_authentication(envelope))
        {
            return;
        }
        try
        {
            const auto request = envelope.payload.get<linkdrop::protocol::UploadRef>();
            auto it = uploads_.find(request.upload_id);
            if (it == uploads_.end())
            {
                throw ShareError(linkdrop::ErrorCode::NotFound, "Unknown upload");
            }
            // The session leaves the map whatever the outcome; a failed commit
            // has already aborted it.
            auto upload = std::move(it->second);
            uploads_.erase(it);

            const auto record = upload->commit();
            send_response(session_common::make_ok_response(session_common::to_created(record), envelope.request_id));
        }
        catch (const std::exception &ex)
        {
            send_failure(ex, "upload commit", envelope.request_id);
        }
    }

    void Session::handle_upload_abort(const linkdrop::protocol::RequestEnvelope &envelope)
    {
        if (!require_authentication(envelope))
        {
            return;
        }
        try
        {
            const auto request = envelope.payload.get<linkdrop::protocol::UploadRef>();
            auto it = uploads_.find(request.upload_id);
            if (it == uploads_.end())
            {
                throw ShareError(linkdrop::ErrorCode::NotFound, "Unknown upload");
            }
            it->second->abort("cancelled by client");
            uploads_.erase(it);

            nlohmann::json payload;
            payload["upload_id"] = request.upload_id;
            payload["aborted"] = true;
            send_response(session_common::make_ok_response(std::move(payload), envelope.request_id));
        }
        catch (const std::exception &ex)
        {
            send_failure(ex, "upload abort", envelope.request_id);
        }
    }

    void Session::handle_upload_progress(const linkdrop::protocol::RequestEnvelope &envelope)
    {
        if (!require_authentication(envelope))
        {
            return;
        }
        try
        {
            const auto request = envelope.payload.get<linkdrop::protocol::UploadRef>();
            const auto progress = services_.progress.find(request.upload_id, services_.clock.now());
            if (!progress)
            {
                throw ShareError(linkdrop::ErrorCode::NotFound, "Not found");
            }
            const linkdrop::protocol::UploadProgressResponse response{
                .total = progress->total,
                .uploaded = progress->uploaded,
                .status = std::string(to_string(progress->status)),
            };
            send_response(session_common::make_ok_response(response, envelope.request_id));
        }
        catch (const std::exception &ex)
        {
            send_failure(ex, "upload progress", envelope.request_id);
        }
    }

} // namespace linkdrop::server
