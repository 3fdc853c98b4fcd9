#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "linkdrop/timestamp.hpp"

namespace linkdrop::server
{

    struct ShareRecord
    {
        std::int64_t id{};
        std::string filename;
        std::string token;
        TimePoint expires_at{};
        std::optional<std::uint32_t> max_downloads{};
        std::uint32_t download_count{};
        TimePoint created_at{};

        bool expired_at(TimePoint now) const noexcept { return now >= expires_at; }

        bool exhausted() const noexcept { return max_downloads && download_count >= *max_downloads; }
    };

    enum class DownloadOutcomeKind
    {
        NotFound,
        Expired,
        LimitReached,
        Continuing,
        LastDownload
    };

    struct DownloadOutcome
    {
        DownloadOutcomeKind kind{DownloadOutcomeKind::NotFound};
        // State after the increment for Continuing/LastDownload, the untouched
        // record for Expired/LimitReached.
        std::optional<ShareRecord> record;
    };

} // namespace linkdrop::server
