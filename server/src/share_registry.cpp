#include "linkdrop/server/share_registry.hpp"

#include <memory>
#include <utility>

#include <spdlog/spdlog.h>
#include <sqlite3.h>

#include "linkdrop/crypto.hpp"
#include "linkdrop/server/share_error.hpp"

namespace linkdrop::server
{

    namespace
    {
        constexpr int kMaxTokenAttempts = 8;
        constexpr int kBusyTimeoutMs = 5000;

        constexpr auto kSchema = R"SQL(
CREATE TABLE IF NOT EXISTS shares (
    id             INTEGER PRIMARY KEY AUTOINCREMENT,
    filename       TEXT    NOT NULL,
    token          TEXT    NOT NULL UNIQUE,
    expires_at     INTEGER NOT NULL,
    max_downloads  INTEGER,
    download_count INTEGER NOT NULL DEFAULT 0,
    created_at     INTEGER NOT NULL
);
CREATE INDEX IF NOT EXISTS idx_shares_expires_at ON shares(expires_at);
)SQL";

        constexpr auto kSelectColumns =
            "SELECT id, filename, token, expires_at, max_downloads, download_count, created_at FROM shares ";

        constexpr auto kExpiredOrExhausted =
            "WHERE expires_at <= ?1 OR (max_downloads IS NOT NULL AND download_count >= max_downloads)";

        [[noreturn]] void throw_sqlite(sqlite3 *db, const std::string &context)
        {
            throw ShareError(ErrorCode::InternalError, context + ": " + sqlite3_errmsg(db));
        }

        void exec(sqlite3 *db, const char *sql, const char *context)
        {
            char *errmsg = nullptr;
            if (sqlite3_exec(db, sql, nullptr, nullptr, &errmsg) != SQLITE_OK)
            {
                std::string message = errmsg ? errmsg : "unknown SQLite error";
                sqlite3_free(errmsg);
                throw ShareError(ErrorCode::InternalError, std::string(context) + ": " + message);
            }
        }

        class Statement
        {
        public:
            Statement(sqlite3 *db, const std::string &sql) : db_(db)
            {
                sqlite3_stmt *raw = nullptr;
                if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &raw, nullptr) != SQLITE_OK)
                {
                    throw_sqlite(db_, "prepare");
                }
                stmt_.reset(raw);
            }

            void bind(int index, std::int64_t value)
            {
                check(sqlite3_bind_int64(stmt_.get(), index, value));
            }

            void bind(int index, const std::string &value)
            {
                check(sqlite3_bind_text(stmt_.get(), index, value.c_str(), static_cast<int>(value.size()),
                                        SQLITE_TRANSIENT));
            }

            void bind(int index, std::optional<std::uint32_t> value)
            {
                check(value ? sqlite3_bind_int64(stmt_.get(), index, *value) : sqlite3_bind_null(stmt_.get(), index));
            }

            // true while a row is available, false once the statement is done.
            bool step()
            {
                const auto rc = sqlite3_step(stmt_.get());
                if (rc == SQLITE_ROW)
                {
                    return true;
                }
                if (rc == SQLITE_DONE)
                {
                    return false;
                }
                throw_sqlite(db_, "step");
            }

            // Like step() for statements without result rows; reports constraint
            // violations instead of throwing.
            bool execute_unless_constraint()
            {
                const auto rc = sqlite3_step(stmt_.get());
                if (rc == SQLITE_DONE)
                {
                    return true;
                }
                if ((rc & 0xFF) == SQLITE_CONSTRAINT)
                {
                    return false;
                }
                throw_sqlite(db_, "step");
            }

            std::int64_t column_int64(int column) const
            {
                return sqlite3_column_int64(stmt_.get(), column);
            }

            ShareRecord record() const
            {
                ShareRecord record;
                record.id = sqlite3_column_int64(stmt_.get(), 0);
                record.filename = column_text(1);
                record.token = column_text(2);
                record.expires_at = from_unix_seconds(sqlite3_column_int64(stmt_.get(), 3));
                if (sqlite3_column_type(stmt_.get(), 4) != SQLITE_NULL)
                {
                    record.max_downloads = static_cast<std::uint32_t>(sqlite3_column_int64(stmt_.get(), 4));
                }
                record.download_count = static_cast<std::uint32_t>(sqlite3_column_int64(stmt_.get(), 5));
                record.created_at = from_unix_seconds(sqlite3_column_int64(stmt_.get(), 6));
                return record;
            }

        private:
            std::string column_text(int column) const
            {
                const auto *text = sqlite3_column_text(stmt_.get(), column);
                return text ? reinterpret_cast<const char *>(text) : std::string{};
            }

            void check(int rc)
            {
                if (rc != SQLITE_OK)
                {
                    throw_sqlite(db_, "bind");
                }
            }

            struct Finalizer
            {
                void operator()(sqlite3_stmt *stmt) const noexcept { sqlite3_finalize(stmt); }
            };

            sqlite3 *db_;
            std::unique_ptr<sqlite3_stmt, Finalizer> stmt_;
        };

        // Rolls back unless commit() was reached.
        class Transaction
        {
        public:
            explicit Transaction(sqlite3 *db) : db_(db)
            {
                exec(db_, "BEGIN IMMEDIATE", "begin transaction");
            }

            ~Transaction()
            {
                if (!committed_)
                {
                    sqlite3_exec(db_, "ROLLBACK", nullptr, nullptr, nullptr);
                }
            }

            Transaction(const Transaction &) = delete;
            Transaction &operator=(const Transaction &) = delete;

            void commit()
            {
                exec(db_, "COMMIT", "commit transaction");
                committed_ = true;
            }

        private:
            sqlite3 *db_;
            bool committed_{false};
        };

        std::optional<ShareRecord> select_by_token(sqlite3 *db, const std::string &token)
        {
            Statement select(db, std::string(kSelectColumns) + "WHERE token = ?1");
            select.bind(1, token);
            if (!select.step())
            {
                return std::nullopt;
            }
            return select.record();
        }

        std::optional<ShareRecord> select_by_id(sqlite3 *db, std::int64_t id)
        {
            Statement select(db, std::string(kSelectColumns) + "WHERE id = ?1");
            select.bind(1, id);
            if (!select.step())
            {
                return std::nullopt;
            }
            return select.record();
        }

        void delete_record(sqlite3 *db, std::int64_t id)
        {
            Statement remove(db, "DELETE FROM shares WHERE id = ?1");
            remove.bind(1, id);
            remove.step();
        }

    } // namespace

    ShareRegistry::ShareRegistry(const std::filesystem::path &database_path, TokenSource token_source)
        : token_source_(std::move(token_source))
    {
        if (!token_source_)
        {
            token_source_ = []
            { return crypto::generate_token(); };
        }
        if (database_path.has_parent_path())
        {
            std::filesystem::create_directories(database_path.parent_path());
        }
        const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
        if (sqlite3_open_v2(database_path.string().c_str(), &db_, flags, nullptr) != SQLITE_OK)
        {
            const std::string message = db_ ? sqlite3_errmsg(db_) : "out of memory";
            sqlite3_close(db_);
            db_ = nullptr;
            throw ShareError(ErrorCode::InternalError, "Cannot open share database: " + message);
        }
        try
        {
            initialize_schema();
        }
        catch (const std::exception &)
        {
            sqlite3_close(db_);
            db_ = nullptr;
            throw;
        }
    }

    ShareRegistry::~ShareRegistry()
    {
        if (db_)
        {
            sqlite3_close(db_);
        }
    }

    void ShareRegistry::initialize_schema()
    {
        sqlite3_busy_timeout(db_, kBusyTimeoutMs);
        exec(db_, "PRAGMA journal_mode = WAL", "journal mode");
        exec(db_, kSchema, "create schema");
    }

    ShareRecord ShareRegistry::create(const std::string &filename, std::chrono::seconds ttl,
                                      std::optional<std::uint32_t> max_downloads, TimePoint now)
    {
        std::lock_guard lock(mutex_);
        const auto created = from_unix_seconds(to_unix_seconds(now));
        const auto expires = created + ttl;

        for (int attempt = 0; attempt < kMaxTokenAttempts; ++attempt)
        {
            Transaction tx(db_);
            ShareRecord record{
                .id = 0,
                .filename = filename,
                .token = token_source_(),
                .expires_at = expires,
                .max_downloads = max_downloads,
                .download_count = 0,
                .created_at = created,
            };

            Statement insert(db_, "INSERT INTO shares (filename, token, expires_at, max_downloads, created_at) "
                                  "VALUES (?1, ?2, ?3, ?4, ?5)");
            insert.bind(1, record.filename);
            insert.bind(2, record.token);
            insert.bind(3, to_unix_seconds(record.expires_at));
            insert.bind(4, record.max_downloads);
            insert.bind(5, to_unix_seconds(record.created_at));
            if (!insert.execute_unless_constraint())
            {
                spdlog::warn("Share token collision, retrying with a fresh token");
                continue;
            }
            record.id = sqlite3_last_insert_rowid(db_);
            tx.commit();
            return record;
        }
        throw ShareError(ErrorCode::InternalError, "Could not allocate a unique share token");
    }

    std::optional<ShareRecord> ShareRegistry::get(const std::string &token) const
    {
        std::lock_guard lock(mutex_);
        return select_by_token(db_, token);
    }

    std::optional<ShareRecord> ShareRegistry::find_by_id(std::int64_t id) const
    {
        std::lock_guard lock(mutex_);
        return select_by_id(db_, id);
    }

    std::vector<ShareRecord> ShareRegistry::list_active(TimePoint now) const
    {
        std::lock_guard lock(mutex_);
        Statement select(db_, std::string(kSelectColumns) + "WHERE expires_at > ?1 ORDER BY id");
        select.bind(1, to_unix_seconds(now));
        std::vector<ShareRecord> records;
        while (select.step())
        {
            records.push_back(select.record());
        }
        return records;
    }

    DownloadOutcome ShareRegistry::increment_and_maybe_delete(const std::string &token, TimePoint now)
    {
        std::lock_guard lock(mutex_);
        Transaction tx(db_);

        auto current = select_by_token(db_, token);
        if (!current)
        {
            return {.kind = DownloadOutcomeKind::NotFound, .record = std::nullopt};
        }
        if (current->expired_at(now))
        {
            return {.kind = DownloadOutcomeKind::Expired, .record = std::move(current)};
        }
        if (current->exhausted())
        {
            return {.kind = DownloadOutcomeKind::LimitReached, .record = std::move(current)};
        }

        Statement update(db_, "UPDATE shares SET download_count = download_count + 1 WHERE id = ?1");
        update.bind(1, current->id);
        update.step();

        ShareRecord updated = *current;
        {
            Statement reread(db_, "SELECT download_count FROM shares WHERE id = ?1");
            reread.bind(1, current->id);
            if (!reread.step())
            {
                throw ShareError(ErrorCode::InternalError, "Share vanished inside its own transaction");
            }
            updated.download_count = static_cast<std::uint32_t>(reread.column_int64(0));
        }

        auto kind = DownloadOutcomeKind::Continuing;
        if (updated.exhausted())
        {
            delete_record(db_, updated.id);
            kind = DownloadOutcomeKind::LastDownload;
        }
        tx.commit();
        return {.kind = kind, .record = std::move(updated)};
    }

    std::optional<ShareRecord> ShareRegistry::delete_by_id(std::int64_t id)
    {
        std::lock_guard lock(mutex_);
        Transaction tx(db_);
        auto record = select_by_id(db_, id);
        if (!record)
        {
            return std::nullopt;
        }
        delete_record(db_, id);
        tx.commit();
        return record;
    }

    std::vector<ShareRecord> ShareRegistry::sweep_expired_or_exhausted(TimePoint now)
    {
        std::lock_guard lock(mutex_);
        Transaction tx(db_);
        const auto cutoff = to_unix_seconds(now);

        std::vector<ShareRecord> removed;
        {
            Statement select(db_, std::string(kSelectColumns) + kExpiredOrExhausted);
            select.bind(1, cutoff);
            while (select.step())
            {
                removed.push_back(select.record());
            }
        }
        if (!removed.empty())
        {
            Statement remove(db_, std::string("DELETE FROM shares ") + kExpiredOrExhausted);
            remove.bind(1, cutoff);
            remove.step();
        }
        tx.commit();
        return removed;
    }

} // namespace linkdrop::server
