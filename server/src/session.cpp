#include "linkdrop/server/session.hpp"

#include <asio/read.hpp>
#include <asio/write.hpp>
#include <nlohmann/json.hpp>

#include <stdexcept>
#include <string>

#include "linkdrop/error_codes.hpp"
#include "linkdrop/framing.hpp"
#include "linkdrop/server/share_error.hpp"
#include "linkdrop/version.hpp"
#include "session_common.hpp"

#include <spdlog/spdlog.h>

namespace linkdrop::server
{

    Session::Session(asio::ip::tcp::socket socket, ServerServices services)
        : socket_(std::move(socket)), services_(services), authenticated_(services.access_control.open()) {}

    Session::~Session()
    {
        on_disconnect();
    }

    void Session::start()
    {
        spdlog::info("Client connected from {}", remote_endpoint());
        read_frame_header();
    }

    void Session::stop()
    {
        if (stopped_)
        {
            return;
        }
        stopped_ = true;
        std::error_code ec;
        spdlog::info("Closing connection for {}", remote_endpoint());
        socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
        socket_.close(ec);
        on_disconnect();
    }

    void Session::read_frame_header()
    {
        auto self = shared_from_this();
        asio::async_read(socket_, asio::buffer(header_buffer_),
                         [this, self](const std::error_code &ec, std::size_t /*bytes_transferred*/)
                         {
                             if (ec)
                             {
                                 stop();
                                 return;
                             }
                             std::uint32_t payload_size = 0;
                             try
                             {
                                 payload_size = linkdrop::protocol::decode_frame_length(header_buffer_);
                             }
                             catch (const std::length_error &ex)
                             {
                                 spdlog::warn("{} sent an oversized frame", remote_endpoint());
                                 send_response(linkdrop::protocol::ResponseEnvelope{
                                                   .kind = linkdrop::protocol::ResponseKind::Error,
                                                   .error = linkdrop::ErrorCode::InvalidPayload,
                                                   .message = ex.what(),
                                               },
                                               [this]
                                               { stop(); });
                                 return;
                             }
                             if (payload_size == 0)
                             {
                                 read_frame_header();
                                 return;
                             }
                             buffer_.resize(payload_size);
                             read_frame_payload(payload_size);
                         });
    }

    void Session::read_frame_payload(std::size_t size)
    {
        auto self = shared_from_this();
        asio::async_read(socket_, asio::buffer(buffer_.data(), size),
                         [this, self](const std::error_code &ec, std::size_t /*bytes_transferred*/)
                         {
                             if (ec)
                             {
                                 stop();
                                 return;
                             }
                             try
                             {
                                 const auto json = nlohmann::json::parse(buffer_.begin(), buffer_.end());
                                 process_message(json);
                             }
                             catch (const nlohmann::json::exception &ex)
                             {
                                 send_error(linkdrop::ErrorCode::InvalidPayload, ex.what());
                             }
                             read_frame_header();
                         });
    }

    void Session::process_message(const nlohmann::json &json)
    {
        linkdrop::protocol::RequestEnvelope envelope;
        try
        {
            envelope = json.get<linkdrop::protocol::RequestEnvelope>();
        }
        catch (const std::exception &ex)
        {
            send_error(linkdrop::ErrorCode::InvalidCommand, ex.what());
            return;
        }

        spdlog::debug("{} -> command {}", remote_endpoint(), linkdrop::protocol::to_string(envelope.command));

        switch (envelope.command)
        {
        case linkdrop::protocol::Command::Authenticate:
            handle_authenticate(envelope);
            break;
        case linkdrop::protocol::Command::Status:
            handle_status(envelope);
            break;
        case linkdrop::protocol::Command::UploadInit:
            handle_upload_init(envelope);
            break;
        case linkdrop::protocol::Command::UploadChunk:
            handle_upload_chunk(envelope);
            break;
        case linkdrop::protocol::Command::UploadCommit:
            handle_upload_commit(envelope);
            break;
        case linkdrop::protocol::Command::UploadAbort:
            handle_upload_abort(envelope);
            break;
        case linkdrop::protocol::Command::UploadProgress:
            handle_upload_progress(envelope);
            break;
        case linkdrop::protocol::Command::ListShares:
            handle_list_shares(envelope);
            break;
        case linkdrop::protocol::Command::DeleteShare:
            handle_delete_share(envelope);
            break;
        case linkdrop::protocol::Command::FetchShare:
            handle_fetch_share(envelope);
            break;
        case linkdrop::protocol::Command::Ping:
            send_response(session_common::make_ok_response(nlohmann::json::object(), envelope.request_id));
            break;
        default:
            send_error(linkdrop::ErrorCode::Unsupported, "Command not supported", envelope.request_id);
            break;
        }
    }

    void Session::send_response(const linkdrop::protocol::ResponseEnvelope &envelope, WriteCallback on_written)
    {
        if (stopped_)
        {
            return;
        }
        outbound_.push_back(OutboundFrame{
            .bytes = linkdrop::protocol::encode_frame(nlohmann::json(envelope)),
            .on_written = std::move(on_written),
        });
        if (!writing_)
        {
            write_next();
        }
    }

    void Session::write_next()
    {
        if (outbound_.empty() || stopped_)
        {
            return;
        }
        writing_ = true;
        auto self = shared_from_this();
        asio::async_write(socket_, asio::buffer(outbound_.front().bytes),
                          [this, self](const std::error_code &ec, std::size_t /*bytes_transferred*/)
                          {
                              writing_ = false;
                              if (ec)
                              {
                                  stop();
                                  return;
                              }
                              if (stopped_ || outbound_.empty())
                              {
                                  return;
                              }
                              auto callback = std::move(outbound_.front().on_written);
                              outbound_.pop_front();
                              if (callback)
                              {
                                  callback();
                              }
                              if (!writing_)
                              {
                                  write_next();
                              }
                          });
    }

    void Session::send_error(linkdrop::ErrorCode code, std::string message, std::optional<std::string> request_id)
    {
        linkdrop::protocol::ResponseEnvelope envelope;
        envelope.kind = linkdrop::protocol::ResponseKind::Error;
        envelope.error = code;
        envelope.message = std::move(message);
        envelope.request_id = std::move(request_id);
        send_response(envelope);
    }

    // Client errors are reported verbatim. Anything else is logged by category
    // only and reaches the client as a generic internal error.
    void Session::send_failure(const std::exception &ex, std::string_view operation,
                               const std::optional<std::string> &request_id)
    {
        const auto *share_error = dynamic_cast<const ShareError *>(&ex);
        if (share_error != nullptr && linkdrop::is_client_error(share_error->code()))
        {
            send_error(share_error->code(), share_error->what(), request_id);
            return;
        }
        if (const auto *payload_error = dynamic_cast<const linkdrop::protocol::PayloadError *>(&ex))
        {
            send_error(linkdrop::ErrorCode::InvalidPayload, payload_error->what(), request_id);
            return;
        }
        if (dynamic_cast<const nlohmann::json::exception *>(&ex) != nullptr)
        {
            send_error(linkdrop::ErrorCode::InvalidPayload, "Malformed payload", request_id);
            return;
        }
        spdlog::error("{} for {} failed: {}", operation, remote_endpoint(),
                      linkdrop::to_string(linkdrop::ErrorCode::InternalError));
        spdlog::debug("{} failure detail: {}", operation, ex.what());
        send_error(linkdrop::ErrorCode::InternalError, "Internal error", request_id);
    }

    bool Session::require_authentication(const linkdrop::protocol::RequestEnvelope &envelope)
    {
        if (authenticated_)
        {
            return true;
        }
        send_error(linkdrop::ErrorCode::Unauthenticated, "Auth required", envelope.request_id);
        return false;
    }

    void Session::handle_authenticate(const linkdrop::protocol::RequestEnvelope &envelope)
    {
        try
        {
            const auto request = envelope.payload.get<linkdrop::protocol::AuthenticateRequest>();
            if (!authenticated_ && !services_.access_control.verify(request.key))
            {
                spdlog::warn("Rejected access key from {}", remote_endpoint());
                send_error(linkdrop::ErrorCode::AuthenticationFailed, "Invalid access key", envelope.request_id);
                return;
            }
            authenticated_ = true;
            nlohmann::json payload;
            payload["authenticated"] = true;
            send_response(session_common::make_ok_response(std::move(payload), envelope.request_id));
            spdlog::info("Session authenticated ({})", remote_endpoint());
        }
        catch (const std::exception &ex)
        {
            send_failure(ex, "authenticate", envelope.request_id);
        }
    }

    void Session::handle_status(const linkdrop::protocol::RequestEnvelope &envelope)
    {
        const linkdrop::protocol::StatusResponse status{
            .authenticated = authenticated_,
            .version = std::string(linkdrop::version()),
            .max_upload_size = services_.upload_pipeline.max_upload_size(),
        };
        send_response(session_common::make_ok_response(status, envelope.request_id));
    }

    void Session::on_disconnect()
    {
        outbound_.clear();
        // Dropping the upload sessions removes their partial files; dropping the
        // download tickets runs any pending deletion of exhausted shares.
        uploads_.clear();
        downloads_.clear();
    }

    std::string Session::remote_endpoint() const
    {
        std::error_code ec;
        const auto endpoint = socket_.remote_endpoint(ec);
        if (ec)
        {
            return "unknown";
        }
        return endpoint.address().to_string(ec) + ":" + std::to_string(endpoint.port());
    }

} // namespace linkdrop::server
