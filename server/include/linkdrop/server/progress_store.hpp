#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "linkdrop/timestamp.hpp"

namespace linkdrop::server
{

    enum class UploadStatus
    {
        Starting,
        Uploading,
        Completed,
        Failed
    };

    std::string_view to_string(UploadStatus status) noexcept;

    struct UploadProgress
    {
        std::string upload_id;
        std::uint64_t total{};
        std::uint64_t uploaded{};
        UploadStatus status{UploadStatus::Starting};
    };

    /**
     * In-memory progress of uploads, keyed by upload id.
     *
     * Entries reaching a terminal status get an eviction deadline of
     * now + retention. Expired entries are dropped when looked up and by
     * purge_expired(); nothing else removes them.
     */
    class ProgressStore
    {
    public:
        explicit ProgressStore(std::chrono::seconds retention);

        void begin(const std::string &upload_id, std::uint64_t total);

        // Ignores values lower than the current count.
        void update(const std::string &upload_id, std::uint64_t uploaded);

        void complete(const std::string &upload_id, TimePoint now);
        void fail(const std::string &upload_id, TimePoint now);

        std::optional<UploadProgress> find(const std::string &upload_id, TimePoint now);

        std::size_t purge_expired(TimePoint now);

        bool is_active(const std::string &upload_id) const;

        std::size_t size() const;

    private:
        struct Entry
        {
            UploadProgress progress;
            std::optional<TimePoint> evict_at;
        };

        void finish(const std::string &upload_id, UploadStatus status, TimePoint now);

        std::chrono::seconds retention_;
        mutable std::mutex mutex_;
        std::unordered_map<std::string, Entry> entries_;
    };

} // namespace linkdrop::server
