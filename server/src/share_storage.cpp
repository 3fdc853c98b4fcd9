#include "linkdrop/server/share_storage.hpp"

#include <spdlog/spdlog.h>

#include "linkdrop/server/share_error.hpp"

namespace linkdrop::server
{

    namespace
    {
        constexpr auto kFilesDir = "files";
        constexpr auto kIncomingDir = "incoming";
        constexpr auto kPartialSuffix = ".part";
    } // namespace

    ShareStorage::ShareStorage(std::filesystem::path root) : base_(std::move(root))
    {
        std::filesystem::create_directories(base_ / kFilesDir);
        std::filesystem::create_directories(base_ / kIncomingDir);
    }

    std::filesystem::path ShareStorage::root() const
    {
        return base_;
    }

    std::filesystem::path ShareStorage::files_dir() const
    {
        return base_ / kFilesDir;
    }

    std::filesystem::path ShareStorage::incoming_dir() const
    {
        return base_ / kIncomingDir;
    }

    std::string ShareStorage::sanitize_filename(const std::string &requested)
    {
        // Clients on Windows send backslash separated names.
        std::string normalized = requested;
        for (auto &ch : normalized)
        {
            if (ch == '\\')
            {
                ch = '/';
            }
        }
        const auto name = std::filesystem::path(normalized).filename().string();
        if (name.empty() || name == "." || name == "..")
        {
            throw ShareError(ErrorCode::InvalidPayload, "No file name");
        }
        return name;
    }

    std::filesystem::path ShareStorage::path_for(const std::string &token, const std::string &filename) const
    {
        return files_dir() / (token + "-" + filename);
    }

    std::filesystem::path ShareStorage::path_for(const ShareRecord &record) const
    {
        return path_for(record.token, record.filename);
    }

    std::filesystem::path ShareStorage::incoming_path(const std::string &upload_id) const
    {
        return incoming_dir() / (upload_id + kPartialSuffix);
    }

    bool ShareStorage::exists(const ShareRecord &record) const
    {
        std::error_code ec;
        return std::filesystem::is_regular_file(path_for(record), ec);
    }

    void ShareStorage::publish(const std::filesystem::path &partial, const ShareRecord &record) const
    {
        std::error_code ec;
        std::filesystem::rename(partial, path_for(record), ec);
        if (ec)
        {
            throw ShareError(ErrorCode::InternalError, "Cannot publish upload: " + ec.message());
        }
    }

    bool ShareStorage::remove(const std::filesystem::path &path, std::error_code &ec) const noexcept
    {
        ec.clear();
        return std::filesystem::remove(path, ec);
    }

    std::vector<std::string> ShareStorage::list_partial_uploads() const
    {
        std::vector<std::string> upload_ids;
        std::error_code ec;
        for (const auto &entry : std::filesystem::directory_iterator(incoming_dir(), ec))
        {
            if (entry.is_regular_file() && entry.path().extension() == kPartialSuffix)
            {
                upload_ids.push_back(entry.path().stem().string());
            }
        }
        if (ec)
        {
            spdlog::warn("Cannot list incoming directory: {}", ec.message());
        }
        return upload_ids;
    }

} // namespace linkdrop::server
