#include <cassert>
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <latch>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <span>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "linkdrop/server/cleanup_sweeper.hpp"
#include "linkdrop/server/clock.hpp"
#include "linkdrop/server/download_gate.hpp"
#include "linkdrop/server/progress_store.hpp"
#include "linkdrop/server/share_error.hpp"
#include "linkdrop/server/share_registry.hpp"
#include "linkdrop/server/share_storage.hpp"
#include "linkdrop/server/upload_pipeline.hpp"

using namespace linkdrop;
using namespace linkdrop::server;
using namespace std::chrono_literals;

namespace
{

    class ManualClock final : public Clock
    {
    public:
        explicit ManualClock(TimePoint start) : now_(start) {}

        TimePoint now() const override
        {
            std::lock_guard lock(mutex_);
            return now_;
        }

        void advance(std::chrono::seconds delta)
        {
            std::lock_guard lock(mutex_);
            now_ += delta;
        }

    private:
        mutable std::mutex mutex_;
        TimePoint now_;
    };

    std::filesystem::path fresh_root(const std::string &name)
    {
        const auto root = std::filesystem::temp_directory_path() / name;
        std::error_code ec;
        std::filesystem::remove_all(root, ec);
        std::filesystem::create_directories(root);
        return root;
    }

    struct Fixture
    {
        explicit Fixture(const std::string &name, std::uint64_t max_upload_size = 8u << 20)
            : root(fresh_root(name)),
              clock(from_unix_seconds(1700000000)),
              storage(root),
              registry(root / "linkdrop.db"),
              progress(std::chrono::seconds(300)),
              pipeline(registry, storage, progress, clock, max_upload_size),
              gate(registry, storage, clock),
              sweeper(registry, storage, progress, clock)
        {
        }

        ~Fixture()
        {
            std::error_code ec;
            std::filesystem::remove_all(root, ec);
        }

        ShareRecord share(const std::string &content, std::optional<std::uint32_t> max_downloads = std::nullopt,
                          std::uint32_t expiration_days = 1, const std::string &filename = "file.bin")
        {
            std::istringstream input(content);
            return pipeline.upload(UploadRequest{
                                       .filename = filename,
                                       .declared_size = content.size(),
                                       .max_downloads = max_downloads,
                                       .expiration_days = expiration_days,
                                   },
                                   input);
        }

        std::size_t partial_files() const
        {
            return static_cast<std::size_t>(std::distance(std::filesystem::directory_iterator(storage.incoming_dir()),
                                                          std::filesystem::directory_iterator{}));
        }

        std::filesystem::path root;
        ManualClock clock;
        ShareStorage storage;
        ShareRegistry registry;
        ProgressStore progress;
        UploadPipeline pipeline;
        DownloadGate gate;
        CleanupSweeper sweeper;
    };

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

    std::string read_all(DownloadTicket &ticket)
    {
        return std::string(std::istreambuf_iterator<char>(ticket.stream()), std::istreambuf_iterator<char>());
    }

    std::span<const std::byte> bytes_of(const std::string &text)
    {
        return std::as_bytes(std::span<const char>(text.data(), text.size()));
    }

    void test_upload_then_download()
    {
        Fixture fx("linkdrop_lifecycle_roundtrip");
        std::string content(3 * kUploadChunkSize + 17, 'x');
        content[0] = 'a';
        content.back() = 'z';

        const auto record = fx.share(content, 2u, 1, "../docs/report.txt");
        assert(record.filename == "report.txt");
        assert(record.token.size() == 22);
        assert(record.expires_at == fx.clock.now() + 24h);
        assert(fx.storage.exists(record));
        assert(std::filesystem::file_size(fx.storage.path_for(record)) == content.size());
        assert(fx.partial_files() == 0);

        auto ticket = fx.gate.open(record.token);
        assert(!ticket.last_download());
        assert(ticket.size() == content.size());
        assert(read_all(ticket) == content);
        ticket.complete();

        assert(fx.registry.get(record.token)->download_count == 1);
        assert(fx.storage.exists(record));
    }

    void test_upload_progress_reporting()
    {
        Fixture fx("linkdrop_lifecycle_progress");
        auto upload = fx.pipeline.begin(UploadRequest{.filename = "six.txt", .declared_size = 6});
        const auto id = upload->id();

        auto progress = fx.progress.find(id, fx.clock.now());
        assert(progress && progress->status == UploadStatus::Starting);
        assert(progress->total == 6);

        upload->append(bytes_of("abc"));
        progress = fx.progress.find(id, fx.clock.now());
        assert(progress->uploaded == 3);
        assert(progress->status == UploadStatus::Uploading);

        upload->append(bytes_of("def"));
        const auto record = upload->commit();
        assert(!upload->active());

        progress = fx.progress.find(id, fx.clock.now());
        assert(progress->status == UploadStatus::Completed);
        assert(progress->uploaded == progress->total);

        fx.clock.advance(299s);
        assert(fx.progress.find(id, fx.clock.now()));
        fx.clock.advance(1s);
        assert(!fx.progress.find(id, fx.clock.now()));

        std::ifstream published(fx.storage.path_for(record));
        std::string text;
        published >> text;
        assert(text == "abcdef");
    }

    void test_declared_size_mismatch()
    {
        Fixture fx("linkdrop_lifecycle_mismatch");
        auto upload = fx.pipeline.begin(UploadRequest{.filename = "short.txt", .declared_size = 10});
        const auto id = upload->id();
        upload->append(bytes_of("four"));

        assert(share_error_of([&]
                              { (void)upload->commit(); }) == ErrorCode::InvalidPayload);
        assert(fx.partial_files() == 0);
        assert(fx.progress.find(id, fx.clock.now())->status == UploadStatus::Failed);
        assert(fx.registry.list_active(fx.clock.now()).empty());
    }

    void test_upload_validation()
    {
        Fixture fx("linkdrop_lifecycle_validation");
        const auto begin_code = [&](UploadRequest request)
        {
            return share_error_of([&]
                                  { (void)fx.pipeline.begin(request); });
        };
        assert(begin_code(UploadRequest{.filename = ".."}) == ErrorCode::InvalidPayload);
        assert(begin_code(UploadRequest{.filename = "a", .max_downloads = 0u}) == ErrorCode::InvalidPayload);
        assert(begin_code(UploadRequest{.filename = "a", .max_downloads = 1001u}) == ErrorCode::InvalidPayload);
        assert(begin_code(UploadRequest{.filename = "a", .expiration_days = 0}) == ErrorCode::InvalidPayload);
        assert(begin_code(UploadRequest{.filename = "a", .expiration_days = 31}) == ErrorCode::InvalidPayload);
        assert(fx.progress.size() == 0);
        assert(fx.partial_files() == 0);

        const auto record = fx.share("x", 1000u, 30);
        assert(record.expires_at == fx.clock.now() + std::chrono::hours(24 * 30));
    }

    // A 1536-byte payload against a 1 KiB ceiling stands in for 150 MiB against 100 MiB.
    void test_upload_ceiling()
    {
        constexpr std::uint64_t kCeiling = 1024;
        Fixture fx("linkdrop_lifecycle_ceiling", kCeiling);
        const std::string oversized(1536, 'o');

        // Declared too large: rejected before any byte is read.
        assert(share_error_of([&]
                              { (void)fx.pipeline.begin(UploadRequest{.filename = "big.bin", .declared_size = 1536}); }) ==
               ErrorCode::TooLarge);
        assert(fx.progress.size() == 0);
        assert(fx.partial_files() == 0);

        // No declared size: caught while streaming.
        {
            std::istringstream input(oversized);
            assert(share_error_of([&]
                                  { (void)fx.pipeline.upload(UploadRequest{.filename = "big.bin"}, input); }) ==
                   ErrorCode::TooLarge);
        }
        assert(fx.partial_files() == 0);

        // Understated declared size: caught on the chunk that crosses the ceiling.
        auto upload = fx.pipeline.begin(UploadRequest{.filename = "big.bin", .declared_size = 100});
        const auto id = upload->id();
        upload->append(bytes_of(std::string(1000, 'a')));
        assert(share_error_of([&]
                              { upload->append(bytes_of(std::string(100, 'b'))); }) == ErrorCode::TooLarge);
        assert(!upload->active());
        assert(fx.partial_files() == 0);
        assert(fx.progress.find(id, fx.clock.now())->status == UploadStatus::Failed);
        assert(share_error_of([&]
                              { upload->append(bytes_of("c")); }) == ErrorCode::Conflict);

        // Exactly at the ceiling is accepted.
        const auto record = fx.share(std::string(kCeiling, 'k'));
        assert(fx.storage.exists(record));

        assert(fx.registry.list_active(fx.clock.now()).size() == 1);
    }

    void test_dropped_upload_cleans_up()
    {
        Fixture fx("linkdrop_lifecycle_dropped");
        auto upload = fx.pipeline.begin(UploadRequest{.filename = "gone.bin"});
        const auto id = upload->id();
        upload->append(bytes_of("partial"));
        assert(fx.partial_files() == 1);

        upload.reset();
        assert(fx.partial_files() == 0);
        assert(fx.progress.find(id, fx.clock.now())->status == UploadStatus::Failed);
        assert(fx.registry.list_active(fx.clock.now()).empty());
    }

    void test_sequential_download_cap()
    {
        Fixture fx("linkdrop_lifecycle_cap");
        const auto record = fx.share("payload", 3u);
        const auto path = fx.storage.path_for(record);

        std::vector<DownloadTicket> tickets;
        tickets.push_back(fx.gate.open(record.token));
        tickets.push_back(fx.gate.open(record.token));
        assert(!tickets.back().last_download());
        tickets.push_back(fx.gate.open(record.token));
        assert(tickets.back().last_download());
        assert(tickets.back().record().download_count == 3);

        // The record is gone at once; the file only when the last response is done.
        assert(!fx.registry.get(record.token));
        assert(std::filesystem::exists(path));
        assert(read_all(tickets.back()) == "payload");
        tickets[0].complete();
        tickets[1].complete();
        assert(std::filesystem::exists(path));
        tickets[2].complete();
        assert(!std::filesystem::exists(path));

        assert(share_error_of([&]
                              { (void)fx.gate.open(record.token); }) == ErrorCode::NotFound);
    }

    void test_concurrent_single_download()
    {
        Fixture fx("linkdrop_lifecycle_race");
        const auto record = fx.share("only once", 1u);

        std::vector<std::optional<DownloadTicket>> tickets(2);
        std::vector<std::optional<ErrorCode>> errors(2);
        std::latch start(2);
        std::vector<std::thread> threads;
        for (std::size_t i = 0; i < 2; ++i)
        {
            threads.emplace_back([&, i]
                                 {
                start.arrive_and_wait();
                try
                {
                    tickets[i].emplace(fx.gate.open(record.token));
                }
                catch (const ShareError &ex)
                {
                    errors[i] = ex.code();
                } });
        }
        for (auto &thread : threads)
        {
            thread.join();
        }

        const auto served = static_cast<int>(tickets[0].has_value()) + static_cast<int>(tickets[1].has_value());
        assert(served == 1);
        const auto &loser = tickets[0] ? errors[1] : errors[0];
        assert(loser == ErrorCode::LimitReached || loser == ErrorCode::NotFound);

        auto &winner = tickets[0] ? *tickets[0] : *tickets[1];
        assert(read_all(winner) == "only once");
        winner.complete();
        assert(!fx.storage.exists(record));
        assert(!fx.registry.get(record.token));
    }

    void test_concurrent_download_cap()
    {
        constexpr std::uint32_t kLimit = 5;
        constexpr std::size_t kAttempts = 16;
        Fixture fx("linkdrop_lifecycle_concurrent_cap");
        const auto record = fx.share("shared bytes", kLimit);

        std::vector<std::optional<DownloadTicket>> tickets(kAttempts);
        std::vector<std::optional<ErrorCode>> errors(kAttempts);
        std::latch start(static_cast<std::ptrdiff_t>(kAttempts));
        std::vector<std::thread> threads;
        for (std::size_t i = 0; i < kAttempts; ++i)
        {
            threads.emplace_back([&, i]
                                 {
                start.arrive_and_wait();
                try
                {
                    tickets[i].emplace(fx.gate.open(record.token));
                }
                catch (const ShareError &ex)
                {
                    errors[i] = ex.code();
                } });
        }
        for (auto &thread : threads)
        {
            thread.join();
        }

        std::size_t served = 0;
        std::size_t last = 0;
        for (std::size_t i = 0; i < kAttempts; ++i)
        {
            if (tickets[i])
            {
                ++served;
                last += tickets[i]->last_download() ? 1 : 0;
            }
            else
            {
                assert(errors[i] == ErrorCode::LimitReached || errors[i] == ErrorCode::NotFound);
            }
        }
        assert(served == kLimit);
        assert(last == 1);

        for (auto &ticket : tickets)
        {
            if (ticket)
            {
                ticket->complete();
            }
        }
        assert(!fx.storage.exists(record));
    }

    void test_disconnect_still_deletes_exhausted_file()
    {
        Fixture fx("linkdrop_lifecycle_disconnect");
        const auto record = fx.share("bye", 1u);
        {
            auto ticket = fx.gate.open(record.token);
            assert(ticket.last_download());
            assert(fx.storage.exists(record));
        }
        assert(!fx.storage.exists(record));
    }

    void test_expiry_precedence()
    {
        Fixture fx("linkdrop_lifecycle_expiry");
        const auto record = fx.share("short lived", 5u, 1);
        fx.gate.open(record.token).complete();
        assert(fx.registry.get(record.token)->download_count == 1);

        fx.clock.advance(25h);
        for (int i = 0; i < 3; ++i)
        {
            assert(share_error_of([&]
                                  { (void)fx.gate.open(record.token); }) == ErrorCode::Expired);
        }
        assert(fx.registry.get(record.token)->download_count == 1);
        assert(fx.storage.exists(record));
        assert(fx.registry.list_active(fx.clock.now()).empty());

        const auto report = fx.sweeper.sweep();
        assert(report.shares_removed == 1);
        assert(report.files_removed == 1);
        assert(!fx.registry.get(record.token));
        assert(!fx.storage.exists(record));
    }

    void test_expiry_boundary()
    {
        Fixture fx("linkdrop_lifecycle_boundary");
        const auto record = fx.share("edge", std::nullopt, 1);
        fx.clock.advance(std::chrono::seconds(24h) - 1s);
        fx.gate.open(record.token).complete();
        fx.clock.advance(1s);
        assert(share_error_of([&]
                              { (void)fx.gate.open(record.token); }) == ErrorCode::Expired);
    }

    void test_unlimited_downloads()
    {
        Fixture fx("linkdrop_lifecycle_unlimited");
        const auto record = fx.share("forever-ish", std::nullopt, 1);
        for (int i = 0; i < 5; ++i)
        {
            auto ticket = fx.gate.open(record.token);
            assert(!ticket.last_download());
            assert(read_all(ticket) == "forever-ish");
            ticket.complete();
            fx.clock.advance(4h);
        }
        const auto current = fx.registry.get(record.token);
        assert(current.has_value());
        assert(current->download_count == 5);
        assert(fx.storage.exists(record));
    }

    void test_missing_file_keeps_downloads()
    {
        Fixture fx("linkdrop_lifecycle_missing");
        const auto record = fx.registry.create("ghost.txt", 1h, 2u, fx.clock.now());
        assert(share_error_of([&]
                              { (void)fx.gate.open(record.token); }) == ErrorCode::NotFound);
        assert(fx.registry.get(record.token)->download_count == 0);
        assert(share_error_of([&]
                              { (void)fx.gate.open("no-such-token"); }) == ErrorCode::NotFound);

        // Something that cannot be streamed in place of the file leaves a
        // single-download share untouched instead of consuming it.
        const auto last = fx.registry.create("blocked.txt", 1h, 1u, fx.clock.now());
        std::filesystem::create_directories(fx.storage.path_for(last));
        assert(share_error_of([&]
                              { (void)fx.gate.open(last.token); }) == ErrorCode::NotFound);
        const auto untouched = fx.registry.get(last.token);
        assert(untouched.has_value());
        assert(untouched->download_count == 0);
    }

    void test_sweep_removes_only_expired()
    {
        Fixture fx("linkdrop_lifecycle_sweep");
        const auto first = fx.share("one", std::nullopt, 1, "one.txt");
        const auto second = fx.share("two", 4u, 1, "two.txt");
        const auto kept = fx.share("three", std::nullopt, 3, "three.txt");

        // A crash leftover and a live upload in the incoming directory.
        std::ofstream(fx.storage.incoming_path("stale")) << "junk";
        auto live = fx.pipeline.begin(UploadRequest{.filename = "live.bin"});
        live->append(bytes_of("in flight"));

        fx.clock.advance(48h);
        const auto report = fx.sweeper.sweep();
        assert(report.shares_removed == 2);
        assert(report.files_removed == 2);
        assert(report.file_errors == 0);
        assert(report.partials_removed == 1);
        // The three completed uploads are past their retention window.
        assert(report.progress_evicted == 3);

        assert(!fx.registry.get(first.token));
        assert(!fx.registry.get(second.token));
        assert(!fx.storage.exists(first));
        assert(!fx.storage.exists(second));
        assert(fx.registry.get(kept.token));
        assert(fx.storage.exists(kept));
        assert(std::filesystem::exists(fx.storage.incoming_path(live->id())));
        assert(fx.progress.is_active(live->id()));

        // A record whose file is already gone is still reclaimed.
        const auto orphan = fx.registry.create("orphan.txt", 1h, std::nullopt, fx.clock.now());
        fx.clock.advance(2h);
        const auto second_report = fx.sweeper.sweep();
        assert(second_report.shares_removed == 1);
        assert(second_report.files_removed == 0);
        assert(second_report.file_errors == 0);
        assert(!fx.registry.get(orphan.token));
        assert(fx.registry.get(kept.token));
    }

    void test_concurrent_token_uniqueness()
    {
        constexpr std::size_t kThreads = 8;
        constexpr std::size_t kPerThread = 50;
        Fixture fx("linkdrop_lifecycle_tokens");

        std::mutex tokens_mutex;
        std::set<std::string> tokens;
        std::vector<std::thread> threads;
        for (std::size_t t = 0; t < kThreads; ++t)
        {
            threads.emplace_back([&]
                                 {
                for (std::size_t i = 0; i < kPerThread; ++i)
                {
                    const auto record = fx.registry.create("f", 1h, std::nullopt, fx.clock.now());
                    std::lock_guard lock(tokens_mutex);
                    tokens.insert(record.token);
                } });
        }
        for (auto &thread : threads)
        {
            thread.join();
        }
        assert(tokens.size() == kThreads * kPerThread);
        assert(fx.registry.list_active(fx.clock.now()).size() == kThreads * kPerThread);
    }

} // namespace

void run_share_lifecycle_tests()
{
    test_upload_then_download();
    test_upload_progress_reporting();
    test_declared_size_mismatch();
    test_upload_validation();
    test_upload_ceiling();
    test_dropped_upload_cleans_up();
    test_sequential_download_cap();
    test_concurrent_single_download();
    test_concurrent_download_cap();
    test_disconnect_still_deletes_exhausted_file();
    test_expiry_precedence();
    test_expiry_boundary();
    test_unlimited_downloads();
    test_missing_file_keeps_downloads();
    test_sweep_removes_only_expired();
    test_concurrent_token_uniqueness();
}
