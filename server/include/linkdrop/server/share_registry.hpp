#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "linkdrop/server/share_record.hpp"

struct sqlite3;

namespace linkdrop::server
{

    using TokenSource = std::function<std::string()>;

    /**
     * Persisted share metadata backed by SQLite.
     *
     * The registry owns its connection. Every mutating call is a single
     * BEGIN IMMEDIATE transaction executed under mutex_, so callers never
     * observe intermediate states and never share a statement.
     */
    class ShareRegistry
    {
    public:
        explicit ShareRegistry(const std::filesystem::path &database_path,
                               TokenSource token_source = {});
        ~ShareRegistry();

        ShareRegistry(const ShareRegistry &) = delete;
        ShareRegistry &operator=(const ShareRegistry &) = delete;

        ShareRecord create(const std::string &filename, std::chrono::seconds ttl,
                           std::optional<std::uint32_t> max_downloads, TimePoint now);

        std::optional<ShareRecord> get(const std::string &token) const;

        std::optional<ShareRecord> find_by_id(std::int64_t id) const;

        std::vector<ShareRecord> list_active(TimePoint now) const;

        DownloadOutcome increment_and_maybe_delete(const std::string &token, TimePoint now);

        std::optional<ShareRecord> delete_by_id(std::int64_t id);

        std::vector<ShareRecord> sweep_expired_or_exhausted(TimePoint now);

    private:
        void initialize_schema();

        sqlite3 *db_{nullptr};
        TokenSource token_source_;
        mutable std::mutex mutex_;
    };

} // namespace linkdrop::server
