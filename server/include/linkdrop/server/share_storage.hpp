#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <system_error>
#include <vector>

#include "linkdrop/server/share_record.hpp"

namespace linkdrop::server
{

    /**
     * Layout of the upload directory.
     *
     * Published files live at files/{token}-{filename}; uploads in flight are
     * written to incoming/{upload_id}.part and renamed on commit.
     */
    class ShareStorage
    {
    public:
        explicit ShareStorage(std::filesystem::path root);

        std::filesystem::path root() const;
        std::filesystem::path files_dir() const;
        std::filesystem::path incoming_dir() const;

        // Keeps only the final path component. Throws ShareError(InvalidPayload)
        // when nothing usable remains.
        static std::string sanitize_filename(const std::string &requested);

        std::filesystem::path path_for(const std::string &token, const std::string &filename) const;
        std::filesystem::path path_for(const ShareRecord &record) const;

        std::filesystem::path incoming_path(const std::string &upload_id) const;

        bool exists(const ShareRecord &record) const;

        // Moves a completed partial file to its published location.
        void publish(const std::filesystem::path &partial, const ShareRecord &record) const;

        // Missing files are not an error: returns false with ec cleared.
        bool remove(const std::filesystem::path &path, std::error_code &ec) const noexcept;

        // Upload ids of every partial file currently in the incoming directory.
        std::vector<std::string> list_partial_uploads() const;

    private:
        std::filesystem::path base_;
    };

} // namespace linkdrop::server
