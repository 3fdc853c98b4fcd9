#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <istream>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>

#include "linkdrop/error_codes.hpp"
#include "linkdrop/server/clock.hpp"
#include "linkdrop/server/progress_store.hpp"
#include "linkdrop/server/share_record.hpp"
#include "linkdrop/server/share_registry.hpp"
#include "linkdrop/server/share_storage.hpp"

namespace linkdrop::server
{

    inline constexpr std::size_t kUploadChunkSize = 1u << 20; // 1 MiB

    inline constexpr std::uint32_t kMinDownloadLimit = 1;
    inline constexpr std::uint32_t kMaxDownloadLimit = 1000;
    inline constexpr std::uint32_t kMinExpirationDays = 1;
    inline constexpr std::uint32_t kMaxExpirationDays = 30;

    struct UploadRequest
    {
        std::string filename;
        std::optional<std::uint64_t> declared_size{};
        std::optional<std::uint32_t> max_downloads{};
        std::uint32_t expiration_days{1};
    };

    class UploadPipeline;

    /**
     * One upload in flight. Owns the partial file until commit() publishes it.
     * Destroying an uncommitted session aborts it: the partial file is removed
     * and the progress entry is marked failed.
     */
    class UploadSession
    {
    public:
        ~UploadSession();

        UploadSession(const UploadSession &) = delete;
        UploadSession &operator=(const UploadSession &) = delete;

        const std::string &id() const noexcept { return id_; }
        const std::string &filename() const noexcept { return filename_; }
        std::uint64_t uploaded() const noexcept { return uploaded_; }
        bool active() const noexcept { return state_ == State::Open; }

        // Throws ShareError(TooLarge) once the running total passes the
        // ceiling; the session is aborted before the exception leaves.
        void append(std::span<const std::byte> data);

        ShareRecord commit();

        void abort(std::string_view reason) noexcept;

    private:
        friend class UploadPipeline;

        enum class State
        {
            Open,
            Committed,
            Aborted
        };

        UploadSession(UploadPipeline &pipeline, std::string id, std::string filename, UploadRequest request,
                      std::filesystem::path partial_path, std::ofstream output);

        [[noreturn]] void fail(linkdrop::ErrorCode code, const std::string &message);

        UploadPipeline &pipeline_;
        std::string id_;
        std::string filename_;
        UploadRequest request_;
        std::filesystem::path partial_path_;
        std::ofstream output_;
        std::uint64_t uploaded_{};
        State state_{State::Open};
    };

    class UploadPipeline
    {
    public:
        UploadPipeline(ShareRegistry &registry, ShareStorage &storage, ProgressStore &progress, const Clock &clock,
                       std::uint64_t max_upload_size);

        std::uint64_t max_upload_size() const noexcept { return max_upload_size_; }

        // Validates the request and opens the partial file. Rejects a declared
        // size above the ceiling with ShareError(TooLarge) before any byte is read.
        std::unique_ptr<UploadSession> begin(const UploadRequest &request);

        // Reads the stream in kUploadChunkSize chunks and publishes the share.
        ShareRecord upload(const UploadRequest &request, std::istream &input);

    private:
        friend class UploadSession;

        ShareRegistry &registry_;
        ShareStorage &storage_;
        ProgressStore &progress_;
        const Clock &clock_;
        std::uint64_t max_upload_size_;
    };

} // namespace linkdrop::server
