#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <optional>
#include <string>
#include <vector>

#include "linkdrop/crypto.hpp"
#include "linkdrop/server/access_control.hpp"
#include "linkdrop/server/config.hpp"
#include "linkdrop/server/progress_store.hpp"
#include "linkdrop/server/share_error.hpp"
#include "linkdrop/server/share_registry.hpp"
#include "linkdrop/server/share_storage.hpp"

using namespace linkdrop;
using namespace linkdrop::server;
using namespace std::chrono_literals;

namespace
{

    const TimePoint kEpoch = from_unix_seconds(1700000000);

    void cleanup_path(const std::filesystem::path &path)
    {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }

    std::filesystem::path fresh_root(const std::string &name)
    {
        const auto root = std::filesystem::temp_directory_path() / name;
        cleanup_path(root);
        std::filesystem::create_directories(root);
        return root;
    }

    template <typename Fn>
    std::optional<ErrorCode> share_error_of(Fn &&fn)
    {
        try
        {
            fn();
        }
        catch (const ShareError &ex)
        {
            return ex.code();
        }
        return std::nullopt;
    }

    void test_storage_layout()
    {
        const auto root = fresh_root("linkdrop_storage_test");
        ShareStorage storage(root);
        assert(std::filesystem::is_directory(root / "files"));
        assert(std::filesystem::is_directory(root / "incoming"));

        assert(ShareStorage::sanitize_filename("report.pdf") == "report.pdf");
        assert(ShareStorage::sanitize_filename("../../etc/passwd") == "passwd");
        assert(ShareStorage::sanitize_filename("C:\\Users\\me\\photo.jpg") == "photo.jpg");
        assert(share_error_of([]
                              { (void)ShareStorage::sanitize_filename(""); }) == ErrorCode::InvalidPayload);
        assert(share_error_of([]
                              { (void)ShareStorage::sanitize_filename("dir/.."); }) == ErrorCode::InvalidPayload);
        assert(share_error_of([]
                              { (void)ShareStorage::sanitize_filename("dir/"); }) == ErrorCode::InvalidPayload);

        assert(storage.path_for("tok", "a.txt") == root / "files" / "tok-a.txt");
        assert(storage.incoming_path("abc") == root / "incoming" / "abc.part");

        {
            std::ofstream(storage.incoming_path("u1")) << "x";
            std::ofstream(storage.incoming_dir() / "stray.tmp") << "y";
        }
        const auto partials = storage.list_partial_uploads();
        assert(partials.size() == 1);
        assert(partials.front() == "u1");

        ShareRecord record{.id = 1, .filename = "a.txt", .token = "tok"};
        assert(!storage.exists(record));
        storage.publish(storage.incoming_path("u1"), record);
        assert(storage.exists(record));
        assert(!std::filesystem::exists(storage.incoming_path("u1")));

        std::error_code ec;
        assert(storage.remove(storage.path_for(record), ec));
        assert(!ec);
        // Removing twice is not an error.
        assert(!storage.remove(storage.path_for(record), ec));
        assert(!ec);

        cleanup_path(root);
    }

    void test_registry_create_and_get()
    {
        const auto root = fresh_root("linkdrop_registry_test");
        ShareRegistry registry(root / "shares.db");

        const auto record = registry.create("a.txt", 24h, 3u, kEpoch);
        assert(record.id > 0);
        assert(record.token.size() == 22);
        assert(record.download_count == 0);
        assert(record.max_downloads == 3u);
        assert(record.created_at == kEpoch);
        assert(record.expires_at == kEpoch + 24h);

        const auto fetched = registry.get(record.token);
        assert(fetched.has_value());
        assert(fetched->id == record.id);
        assert(fetched->filename == "a.txt");
        assert(fetched->expires_at == record.expires_at);
        assert(fetched->max_downloads == 3u);

        const auto by_id = registry.find_by_id(record.id);
        assert(by_id && by_id->token == record.token);

        const auto unlimited = registry.create("b.txt", 1h, std::nullopt, kEpoch);
        assert(!unlimited.max_downloads);
        assert(!registry.get(unlimited.token)->max_downloads);

        assert(!registry.get("missing"));
        cleanup_path(root);
    }

    void test_registry_retries_token_collisions()
    {
        const auto root = fresh_root("linkdrop_registry_collision_test");
        std::vector<std::string> tokens = {"dup", "dup", "dup", "fresh"};
        std::size_t next = 0;
        ShareRegistry registry(root / "shares.db", [&]
                               { return tokens[next++]; });

        const auto first = registry.create("a", 1h, std::nullopt, kEpoch);
        assert(first.token == "dup");
        const auto second = registry.create("b", 1h, std::nullopt, kEpoch);
        assert(second.token == "fresh");
        assert(next == 4);

        ShareRegistry stuck(root / "stuck.db", []
                            { return std::string("same"); });
        (void)stuck.create("a", 1h, std::nullopt, kEpoch);
        assert(share_error_of([&]
                              { (void)stuck.create("b", 1h, std::nullopt, kEpoch); }) == ErrorCode::InternalError);
        cleanup_path(root);
    }

    void test_registry_persists_across_reopen()
    {
        const auto root = fresh_root("linkdrop_registry_reopen_test");
        std::string token;
        {
            ShareRegistry registry(root / "shares.db");
            token = registry.create("kept.bin", 2h, 5u, kEpoch).token;
            (void)registry.increment_and_maybe_delete(token, kEpoch);
        }
        ShareRegistry reopened(root / "shares.db");
        const auto record = reopened.get(token);
        assert(record.has_value());
        assert(record->download_count == 1);
        assert(record->max_downloads == 5u);
        cleanup_path(root);
    }

    void test_registry_increment_outcomes()
    {
        const auto root = fresh_root("linkdrop_registry_increment_test");
        ShareRegistry registry(root / "shares.db");

        const auto limited = registry.create("two.txt", 1h, 2u, kEpoch);
        auto outcome = registry.increment_and_maybe_delete(limited.token, kEpoch);
        assert(outcome.kind == DownloadOutcomeKind::Continuing);
        assert(outcome.record->download_count == 1);

        outcome = registry.increment_and_maybe_delete(limited.token, kEpoch);
        assert(outcome.kind == DownloadOutcomeKind::LastDownload);
        assert(outcome.record->download_count == 2);
        // The record is gone as part of the same transaction.
        assert(!registry.get(limited.token));

        outcome = registry.increment_and_maybe_delete(limited.token, kEpoch);
        assert(outcome.kind == DownloadOutcomeKind::NotFound);

        const auto expiring = registry.create("old.txt", 1h, 1u, kEpoch);
        outcome = registry.increment_and_maybe_delete(expiring.token, kEpoch + 1h);
        assert(outcome.kind == DownloadOutcomeKind::Expired);
        assert(registry.get(expiring.token)->download_count == 0);

        const auto unlimited = registry.create("many.txt", 1h, std::nullopt, kEpoch);
        for (int i = 0; i < 50; ++i)
        {
            outcome = registry.increment_and_maybe_delete(unlimited.token, kEpoch);
            assert(outcome.kind == DownloadOutcomeKind::Continuing);
        }
        assert(registry.get(unlimited.token)->download_count == 50);
        cleanup_path(root);
    }

    void test_registry_list_delete_and_sweep()
    {
        const auto root = fresh_root("linkdrop_registry_sweep_test");
        ShareRegistry registry(root / "shares.db");

        const auto short_lived = registry.create("short.txt", 1h, std::nullopt, kEpoch);
        const auto long_lived = registry.create("long.txt", 48h, std::nullopt, kEpoch);
        const auto doomed = registry.create("doomed.txt", 48h, std::nullopt, kEpoch);

        auto active = registry.list_active(kEpoch + 2h);
        assert(active.size() == 2);
        assert(active[0].id == long_lived.id);
        assert(active[1].id == doomed.id);

        const auto deleted = registry.delete_by_id(doomed.id);
        assert(deleted && deleted->token == doomed.token);
        assert(!registry.delete_by_id(doomed.id));
        assert(!registry.find_by_id(doomed.id));

        const auto swept = registry.sweep_expired_or_exhausted(kEpoch + 1h);
        assert(swept.size() == 1);
        assert(swept.front().id == short_lived.id);
        assert(!registry.get(short_lived.token));
        assert(registry.get(long_lived.token));

        assert(registry.sweep_expired_or_exhausted(kEpoch + 1h).empty());
        cleanup_path(root);
    }

    void test_progress_store()
    {
        ProgressStore store(std::chrono::seconds(300));
        store.begin("u1", 100);
        auto progress = store.find("u1", kEpoch);
        assert(progress && progress->status == UploadStatus::Starting);
        assert(progress->total == 100);

        store.update("u1", 40);
        store.update("u1", 10);
        progress = store.find("u1", kEpoch);
        assert(progress->uploaded == 40);
        assert(progress->status == UploadStatus::Uploading);
        assert(store.is_active("u1"));

        store.complete("u1", kEpoch);
        store.update("u1", 90);
        store.fail("u1", kEpoch);
        progress = store.find("u1", kEpoch + 299s);
        assert(progress->status == UploadStatus::Completed);
        assert(progress->uploaded == 40);
        assert(!store.is_active("u1"));
        assert(to_string(progress->status) == "completed");

        // Lookup at the deadline drops the entry.
        assert(!store.find("u1", kEpoch + 300s));
        assert(store.size() == 0);

        store.begin("u2", 0);
        store.begin("u3", 0);
        store.fail("u2", kEpoch);
        assert(store.purge_expired(kEpoch + 299s) == 0);
        assert(store.purge_expired(kEpoch + 300s) == 1);
        assert(store.size() == 1);
        assert(store.is_active("u3"));
        assert(!store.find("unknown", kEpoch));
    }

    void test_access_control()
    {
        const AccessControl open_access(std::nullopt);
        assert(open_access.open());
        assert(open_access.verify("anything"));

        const AccessControl guarded(crypto::hash_password("s3cret"));
        assert(!guarded.open());
        assert(guarded.verify("s3cret"));
        assert(!guarded.verify("guess"));

        bool caught = false;
        try
        {
            const AccessControl empty(std::string{});
        }
        catch (const std::invalid_argument &)
        {
            caught = true;
        }
        assert(caught);
    }

    void test_config_parsing()
    {
        unsetenv("LINKDROP_DATABASE_PATH");
        unsetenv("LINKDROP_ACCESS_KEY_HASH");

        const char *args[] = {"linkdrop_server", "--port", "9000", "--root", "/srv/drop", "--max-upload-size", "1024",
                              "--sweep-interval", "60", "--log-level", "debug"};
        auto command_line = parse_arguments(static_cast<int>(std::size(args)), const_cast<char **>(args));
        const auto &config = command_line.config;
        assert(config.port == 9000);
        assert(config.root == "/srv/drop");
        assert(config.max_upload_size == 1024);
        assert(config.sweep_interval == std::chrono::seconds(60));
        assert(config.log_level == spdlog::level::debug);
        assert(config.resolved_database_path() == std::filesystem::path("/srv/drop") / "linkdrop.db");
        assert(!command_line.show_help);

        setenv("LINKDROP_DATABASE_PATH", "/var/lib/linkdrop/shares.db", 1);
        command_line = parse_arguments(5, const_cast<char **>(args));
        assert(command_line.config.resolved_database_path() == "/var/lib/linkdrop/shares.db");
        unsetenv("LINKDROP_DATABASE_PATH");

        const char *hash_args[] = {"linkdrop_server", "--hash-key", "k"};
        command_line = parse_arguments(3, const_cast<char **>(hash_args));
        assert(command_line.key_to_hash == std::string("k"));

        const char *bad_args[][3] = {
            {"linkdrop_server", "--port", "70000"},
            {"linkdrop_server", "--port", "12x"},
            {"linkdrop_server", "--bogus", "1"},
        };
        for (const auto &bad : bad_args)
        {
            bool caught = false;
            try
            {
                (void)parse_arguments(3, const_cast<char **>(bad));
            }
            catch (const std::runtime_error &)
            {
                caught = true;
            }
            assert(caught);
        }
    }

} // namespace

void run_server_component_tests()
{
    test_storage_layout();
    test_registry_create_and_get();
    test_registry_retries_token_collisions();
    test_registry_persists_across_reopen();
    test_registry_increment_outcomes();
    test_registry_list_delete_and_sweep();
    test_progress_store();
    test_access_control();
    test_config_parsing();
}
