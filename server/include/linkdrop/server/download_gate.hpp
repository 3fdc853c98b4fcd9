#pragma once

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <string>

#include "linkdrop/server/clock.hpp"
#include "linkdrop/server/share_record.hpp"
#include "linkdrop/server/share_registry.hpp"
#include "linkdrop/server/share_storage.hpp"

namespace linkdrop::server
{

    /**
     * An admitted download: the open file plus the work that must happen once
     * the response has been fully transmitted.
     *
     * complete() runs the completion hook exactly once. A ticket destroyed
     * before complete() (for example because the connection dropped) runs it
     * from the destructor, so a share that used up its last download never
     * leaves its file behind.
     */
    class DownloadTicket
    {
    public:
        using CompletionHook = std::function<void()>;

        DownloadTicket(ShareRecord record, DownloadOutcomeKind outcome, std::ifstream stream, std::uint64_t size,
                       CompletionHook on_complete);
        ~DownloadTicket();

        DownloadTicket(DownloadTicket &&other) noexcept;
        DownloadTicket &operator=(DownloadTicket &&other) = delete;
        DownloadTicket(const DownloadTicket &) = delete;
        DownloadTicket &operator=(const DownloadTicket &) = delete;

        const ShareRecord &record() const noexcept { return record_; }
        std::uint64_t size() const noexcept { return size_; }
        bool last_download() const noexcept { return outcome_ == DownloadOutcomeKind::LastDownload; }
        std::ifstream &stream() noexcept { return stream_; }

        void complete() noexcept;

    private:
        ShareRecord record_;
        DownloadOutcomeKind outcome_;
        std::ifstream stream_;
        std::uint64_t size_{};
        CompletionHook on_complete_;
        bool completed_{false};
    };

    class DownloadGate
    {
    public:
        DownloadGate(ShareRegistry &registry, ShareStorage &storage, const Clock &clock);

        // Throws ShareError with NotFound, Expired or LimitReached when the
        // share cannot be served. Success consumes one download.
        DownloadTicket open(const std::string &token);
        DownloadTicket open(const std::string &token, TimePoint now);

    private:
        ShareRegistry &registry_;
        ShareStorage &storage_;
        const Clock &clock_;
    };

} // namespace linkdrop::server
