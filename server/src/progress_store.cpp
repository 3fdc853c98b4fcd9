#include "linkdrop/server/progress_store.hpp"

#include <algorithm>

namespace linkdrop::server
{

    std::string_view to_string(UploadStatus status) noexcept
    {
        switch (status)
        {
        case UploadStatus::Starting:
            return "starting";
        case UploadStatus::Uploading:
            return "uploading";
        case UploadStatus::Completed:
            return "completed";
        case UploadStatus::Failed:
            return "failed";
        }
        return "unknown";
    }

    ProgressStore::ProgressStore(std::chrono::seconds retention) : retention_(retention) {}

    void ProgressStore::begin(const std::string &upload_id, std::uint64_t total)
    {
        std::lock_guard lock(mutex_);
        entries_[upload_id] = Entry{
            .progress = UploadProgress{.upload_id = upload_id, .total = total, .uploaded = 0,
                                       .status = UploadStatus::Starting},
            .evict_at = std::nullopt,
        };
    }

    void ProgressStore::update(const std::string &upload_id, std::uint64_t uploaded)
    {
        std::lock_guard lock(mutex_);
        auto it = entries_.find(upload_id);
        if (it == entries_.end() || it->second.evict_at)
        {
            return;
        }
        auto &progress = it->second.progress;
        progress.uploaded = std::max(progress.uploaded, uploaded);
        progress.status = UploadStatus::Uploading;
    }

    void ProgressStore::complete(const std::string &upload_id, TimePoint now)
    {
        finish(upload_id, UploadStatus::Completed, now);
    }

    void ProgressStore::fail(const std::string &upload_id, TimePoint now)
    {
        finish(upload_id, UploadStatus::Failed, now);
    }

    void ProgressStore::finish(const std::string &upload_id, UploadStatus status, TimePoint now)
    {
        std::lock_guard lock(mutex_);
        auto it = entries_.find(upload_id);
        if (it == entries_.end() || it->second.evict_at)
        {
            return;
        }
        it->second.progress.status = status;
        it->second.evict_at = now + retention_;
    }

    std::optional<UploadProgress> ProgressStore::find(const std::string &upload_id, TimePoint now)
    {
        std::lock_guard lock(mutex_);
        auto it = entries_.find(upload_id);
        if (it == entries_.end())
        {
            return std::nullopt;
        }
        if (it->second.evict_at && now >= *it->second.evict_at)
        {
            entries_.erase(it);
            return std::nullopt;
        }
        return it->second.progress;
    }

    std::size_t ProgressStore::purge_expired(TimePoint now)
    {
        std::lock_guard lock(mutex_);
        return std::erase_if(entries_, [now](const auto &item)
                             { return item.second.evict_at && now >= *item.second.evict_at; });
    }

    bool ProgressStore::is_active(const std::string &upload_id) const
    {
        std::lock_guard lock(mutex_);
        auto it = entries_.find(upload_id);
        return it != entries_.end() && !it->second.evict_at;
    }

    std::size_t ProgressStore::size() const
    {
        std::lock_guard lock(mutex_);
        return entries_.size();
    }

} // namespace linkdrop::server
