#include "linkdrop/server/download_gate.hpp"

#include <spdlog/spdlog.h>

#include "linkdrop/server/share_error.hpp"

namespace linkdrop::server
{

    namespace
    {

        [[noreturn]] void reject(DownloadOutcomeKind kind)
        {
            switch (kind)
            {
            case DownloadOutcomeKind::Expired:
                throw ShareError(ErrorCode::Expired, "Expired");
            case DownloadOutcomeKind::LimitReached:
                throw ShareError(ErrorCode::LimitReached, "Limit reached");
            default:
                throw ShareError(ErrorCode::NotFound, "Not found");
            }
        }

    } // namespace

    DownloadTicket::DownloadTicket(ShareRecord record, DownloadOutcomeKind outcome, std::ifstream stream,
                                   std::uint64_t size, CompletionHook on_complete)
        : record_(std::move(record)),
          outcome_(outcome),
          stream_(std::move(stream)),
          size_(size),
          on_complete_(std::move(on_complete))
    {
    }

    DownloadTicket::DownloadTicket(DownloadTicket &&other) noexcept
        : record_(std::move(other.record_)),
          outcome_(other.outcome_),
          stream_(std::move(other.stream_)),
          size_(other.size_),
          on_complete_(std::move(other.on_complete_)),
          completed_(other.completed_)
    {
        other.completed_ = true;
    }

    DownloadTicket::~DownloadTicket()
    {
        complete();
    }

    void DownloadTicket::complete() noexcept
    {
        if (completed_)
        {
            return;
        }
        completed_ = true;
        stream_.close();
        if (!on_complete_)
        {
            return;
        }
        try
        {
            on_complete_();
        }
        catch (const std::exception &ex)
        {
            spdlog::error("Download completion for share {} failed: {}", record_.token, ex.what());
        }
    }

    DownloadGate::DownloadGate(ShareRegistry &registry, ShareStorage &storage, const Clock &clock)
        : registry_(registry), storage_(storage), clock_(clock)
    {
    }

    DownloadTicket DownloadGate::open(const std::string &token)
    {
        return open(token, clock_.now());
    }

    DownloadTicket DownloadGate::open(const std::string &token, TimePoint now)
    {
        const auto current = registry_.get(token);
        if (!current)
        {
            reject(DownloadOutcomeKind::NotFound);
        }
        if (current->expired_at(now))
        {
            spdlog::debug("Share {} requested after expiry", token);
            reject(DownloadOutcomeKind::Expired);
        }
        if (current->exhausted())
        {
            reject(DownloadOutcomeKind::LimitReached);
        }
        // The file is opened before accounting so a desynchronized share does
        // not burn a download. An open stream survives a later unlink.
        const auto path = storage_.path_for(*current);
        std::ifstream stream(path, std::ios::binary);
        std::error_code ec;
        const auto size = std::filesystem::file_size(path, ec);
        if (!stream.is_open() || ec)
        {
            spdlog::warn("Share {} has a record but no file", token);
            throw ShareError(ErrorCode::NotFound, "File missing");
        }

        auto outcome = registry_.increment_and_maybe_delete(token, now);
        if (outcome.kind == DownloadOutcomeKind::NotFound && current->max_downloads)
        {
            // A capped share that vanished since the first lookup was taken
            // by a concurrent last download.
            reject(DownloadOutcomeKind::LimitReached);
        }
        if (outcome.kind != DownloadOutcomeKind::Continuing && outcome.kind != DownloadOutcomeKind::LastDownload)
        {
            reject(outcome.kind);
        }

        auto record = std::move(*outcome.record);
        DownloadTicket::CompletionHook hook;
        if (outcome.kind == DownloadOutcomeKind::LastDownload)
        {
            spdlog::info("Share {} reached its download limit of {}", token, record.download_count);
            hook = [&storage = storage_, path, token]
            {
                std::error_code remove_ec;
                storage.remove(path, remove_ec);
                if (remove_ec)
                {
                    spdlog::error("Cannot delete exhausted share {}: {}", token, remove_ec.message());
                    return;
                }
                spdlog::debug("Deleted file of exhausted share {}", token);
            };
        }
        return DownloadTicket(std::move(record), outcome.kind, std::move(stream), size, std::move(hook));
    }

} // namespace linkdrop::server
