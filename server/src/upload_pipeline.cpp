#include "linkdrop/server/upload_pipeline.hpp"

#include <chrono>
#include <vector>

#include <spdlog/spdlog.h>

#include "linkdrop/crypto.hpp"
#include "linkdrop/server/share_error.hpp"

namespace linkdrop::server
{

    namespace
    {

        void validate(const UploadRequest &request)
        {
            if (request.max_downloads &&
                (*request.max_downloads < kMinDownloadLimit || *request.max_downloads > kMaxDownloadLimit))
            {
                throw ShareError(ErrorCode::InvalidPayload, "max_downloads must be between 1 and 1000");
            }
            if (request.expiration_days < kMinExpirationDays || request.expiration_days > kMaxExpirationDays)
            {
                throw ShareError(ErrorCode::InvalidPayload, "expiration_days must be between 1 and 30");
            }
        }

    } // namespace

    UploadSession::UploadSession(UploadPipeline &pipeline, std::string id, std::string filename,
                                 UploadRequest request, std::filesystem::path partial_path, std::ofstream output)
        : pipeline_(pipeline),
          id_(std::move(id)),
          filename_(std::move(filename)),
          request_(std::move(request)),
          partial_path_(std::move(partial_path)),
          output_(std::move(output))
    {
    }

    UploadSession::~UploadSession()
    {
        abort("session closed before commit");
    }

    void UploadSession::append(std::span<const std::byte> data)
    {
        if (state_ != State::Open)
        {
            throw ShareError(ErrorCode::Conflict, "Upload is no longer active");
        }
        const auto next_total = uploaded_ + static_cast<std::uint64_t>(data.size());
        if (next_total > pipeline_.max_upload_size_)
        {
            fail(ErrorCode::TooLarge, "File exceeds the maximum upload size");
        }

        output_.write(reinterpret_cast<const char *>(data.data()), static_cast<std::streamsize>(data.size()));
        if (!output_)
        {
            fail(ErrorCode::InternalError, "Write to partial file failed");
        }
        uploaded_ = next_total;
        pipeline_.progress_.update(id_, uploaded_);
    }

    ShareRecord UploadSession::commit()
    {
        if (state_ != State::Open)
        {
            throw ShareError(ErrorCode::Conflict, "Upload is no longer active");
        }
        output_.close();
        if (output_.fail())
        {
            fail(ErrorCode::InternalError, "Closing partial file failed");
        }
        if (request_.declared_size && *request_.declared_size != uploaded_)
        {
            fail(ErrorCode::InvalidPayload, "Received " + std::to_string(uploaded_) + " of " +
                                                std::to_string(*request_.declared_size) + " declared bytes");
        }

        const auto now = pipeline_.clock_.now();
        const auto ttl = std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::hours{24} * static_cast<int>(request_.expiration_days));

        ShareRecord record;
        try
        {
            record = pipeline_.registry_.create(filename_, ttl, request_.max_downloads, now);
        }
        catch (const ShareError &ex)
        {
            fail(ex.code(), ex.what());
        }

        try
        {
            pipeline_.storage_.publish(partial_path_, record);
        }
        catch (const ShareError &ex)
        {
            // The record must not outlive a file that never appeared.
            try
            {
                pipeline_.registry_.delete_by_id(record.id);
            }
            catch (const std::exception &cleanup)
            {
                spdlog::error("Cannot roll back share {}: {}", record.token, cleanup.what());
            }
            fail(ex.code(), ex.what());
        }

        state_ = State::Committed;
        pipeline_.progress_.complete(id_, now);
        spdlog::info("Upload {} published as share {} ({} bytes, expires {})", id_, record.token, uploaded_,
                     format_iso8601_utc(record.expires_at));
        return record;
    }

    void UploadSession::abort(std::string_view reason) noexcept
    {
        if (state_ != State::Open)
        {
            return;
        }
        state_ = State::Aborted;
        output_.close();
        std::error_code ec;
        pipeline_.storage_.remove(partial_path_, ec);
        if (ec)
        {
            spdlog::error("Cannot remove partial upload {}: {}", id_, ec.message());
        }
        try
        {
            pipeline_.progress_.fail(id_, pipeline_.clock_.now());
            spdlog::info("Upload {} aborted: {}", id_, reason);
        }
        catch (const std::exception &ex)
        {
            spdlog::error("Cannot record failure of upload {}: {}", id_, ex.what());
        }
    }

    void UploadSession::fail(linkdrop::ErrorCode code, const std::string &message)
    {
        abort(message);
        throw ShareError(code, message);
    }

    UploadPipeline::UploadPipeline(ShareRegistry &registry, ShareStorage &storage, ProgressStore &progress,
                                   const Clock &clock, std::uint64_t max_upload_size)
        : registry_(registry), storage_(storage), progress_(progress), clock_(clock), max_upload_size_(max_upload_size)
    {
    }

    std::unique_ptr<UploadSession> UploadPipeline::begin(const UploadRequest &request)
    {
        auto filename = ShareStorage::sanitize_filename(request.filename);
        validate(request);

        auto upload_id = crypto::generate_hex_id();
        if (request.declared_size && *request.declared_size > max_upload_size_)
        {
            spdlog::info("Upload {} rejected: declared {} bytes, limit {}", upload_id, *request.declared_size,
                         max_upload_size_);
            throw ShareError(ErrorCode::TooLarge, "File exceeds the maximum upload size");
        }

        auto partial_path = storage_.incoming_path(upload_id);
        progress_.begin(upload_id, request.declared_size.value_or(0));
        std::ofstream output(partial_path, std::ios::binary | std::ios::trunc);
        if (!output.is_open())
        {
            progress_.fail(upload_id, clock_.now());
            throw ShareError(ErrorCode::InternalError, "Cannot create partial file");
        }

        spdlog::debug("Upload {} started for {}", upload_id, filename);
        return std::unique_ptr<UploadSession>(new UploadSession(*this, std::move(upload_id), std::move(filename),
                                                                request, std::move(partial_path),
                                                                std::move(output)));
    }

    ShareRecord UploadPipeline::upload(const UploadRequest &request, std::istream &input)
    {
        auto session = begin(request);
        std::vector<std::byte> buffer(kUploadChunkSize);
        while (input)
        {
            input.read(reinterpret_cast<char *>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
            const auto read_count = static_cast<std::size_t>(input.gcount());
            if (read_count > 0)
            {
                session->append(std::span<const std::byte>(buffer.data(), read_count));
            }
        }
        if (input.bad())
        {
            session->abort("input stream failed");
            throw ShareError(ErrorCode::InternalError, "Upload stream failed");
        }
        return session->commit();
    }

} // namespace linkdrop::server
