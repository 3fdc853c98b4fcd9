#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include <spdlog/common.h>

namespace linkdrop::server
{

    struct ServerConfig
    {
        std::string address{"0.0.0.0"};
        std::uint16_t port{0};
        std::filesystem::path root;
        std::optional<std::filesystem::path> database_path;
        std::size_t worker_threads{0};
        std::uint64_t max_upload_size{100ULL << 20};
        std::chrono::seconds sweep_interval{std::chrono::hours{1}};
        std::chrono::seconds progress_retention{std::chrono::minutes{5}};
        std::optional<std::string> access_key_hash;
        std::optional<std::filesystem::path> log_file;
        spdlog::level::level_enum log_level{spdlog::level::info};

        std::filesystem::path resolved_database_path() const;
    };

    struct CommandLine
    {
        ServerConfig config;
        bool show_help{false};
        std::optional<std::string> key_to_hash;
    };

    // Throws std::runtime_error on unknown arguments, missing values or
    // invalid numbers. Environment variables LINKDROP_DATABASE_PATH and
    // LINKDROP_ACCESS_KEY_HASH act as defaults for the matching options.
    CommandLine parse_arguments(int argc, char *argv[]);

    std::string usage(const char *program_name);

} // namespace linkdrop::server
