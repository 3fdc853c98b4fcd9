#include "linkdrop/server/cleanup_sweeper.hpp"

#include <spdlog/spdlog.h>

namespace linkdrop::server
{

    CleanupSweeper::CleanupSweeper(ShareRegistry &registry, ShareStorage &storage, ProgressStore &progress,
                                   const Clock &clock)
        : registry_(registry), storage_(storage), progress_(progress), clock_(clock)
    {
    }

    SweepReport CleanupSweeper::sweep()
    {
        return sweep(clock_.now());
    }

    SweepReport CleanupSweeper::sweep(TimePoint now)
    {
        SweepReport report;
        const auto removed = registry_.sweep_expired_or_exhausted(now);
        report.shares_removed = removed.size();
        for (const auto &record : removed)
        {
            std::error_code ec;
            if (storage_.remove(storage_.path_for(record), ec))
            {
                ++report.files_removed;
            }
            else if (ec)
            {
                ++report.file_errors;
                spdlog::error("Sweep could not delete file of share {}: {}", record.token, ec.message());
            }
        }

        report.progress_evicted = progress_.purge_expired(now);
        report.partials_removed = remove_orphaned_partials();

        if (report.shares_removed > 0 || report.partials_removed > 0)
        {
            spdlog::info("Sweep removed {} shares ({} files, {} errors), {} orphaned partial uploads",
                         report.shares_removed, report.files_removed, report.file_errors, report.partials_removed);
        }
        else
        {
            spdlog::debug("Sweep found nothing to remove");
        }
        return report;
    }

    // Partial files whose upload is no longer running were left by a crash.
    std::size_t CleanupSweeper::remove_orphaned_partials()
    {
        std::size_t removed = 0;
        for (const auto &upload_id : storage_.list_partial_uploads())
        {
            if (progress_.is_active(upload_id))
            {
                continue;
            }
            std::error_code ec;
            if (storage_.remove(storage_.incoming_path(upload_id), ec))
            {
                ++removed;
            }
            else if (ec)
            {
                spdlog::error("Sweep could not delete partial upload {}: {}", upload_id, ec.message());
            }
        }
        return removed;
    }

} // namespace linkdrop::server
