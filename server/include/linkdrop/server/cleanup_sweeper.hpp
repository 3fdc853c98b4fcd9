#pragma once

#include <cstddef>

#include "linkdrop/server/clock.hpp"
#include "linkdrop/server/progress_store.hpp"
#include "linkdrop/server/share_registry.hpp"
#include "linkdrop/server/share_storage.hpp"

namespace linkdrop::server
{

    struct SweepReport
    {
        std::size_t shares_removed{};
        std::size_t files_removed{};
        std::size_t file_errors{};
        std::size_t progress_evicted{};
        std::size_t partials_removed{};
    };

    /**
     * Reclaims shares that expired by time or linger after exhausting their
     * download limit, together with their files. Enforcing the limit is the
     * download gate's job; the sweeper only cleans up.
     */
    class CleanupSweeper
    {
    public:
        CleanupSweeper(ShareRegistry &registry, ShareStorage &storage, ProgressStore &progress, const Clock &clock);

        SweepReport sweep();
        SweepReport sweep(TimePoint now);

    private:
        std::size_t remove_orphaned_partials();

        ShareRegistry &registry_;
        ShareStorage &storage_;
        ProgressStore &progress_;
        const Clock &clock_;
    };

} // namespace linkdrop::server
