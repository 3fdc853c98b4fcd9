#include "linkdrop/server/config.hpp"

#include <cstdlib>
#include <limits>
#include <stdexcept>
#include <string>

namespace linkdrop::server
{

    namespace
    {

        std::string require_value(int &index, int argc, char *argv[], const std::string &option)
        {
            if (index + 1 >= argc)
            {
                throw std::runtime_error("Missing value for " + option);
            }
            ++index;
            return std::string(argv[index]);
        }

        std::uint64_t parse_unsigned(const std::string &value, const std::string &option)
        {
            try
            {
                std::size_t consumed = 0;
                const auto parsed = std::stoull(value, &consumed);
                if (consumed != value.size() || value.front() == '-')
                {
                    throw std::invalid_argument(value);
                }
                return parsed;
            }
            catch (const std::logic_error &)
            {
                throw std::runtime_error("Invalid value for " + option + ": " + value);
            }
        }

        std::optional<std::string> environment(const char *name)
        {
            const char *value = std::getenv(name);
            if (value == nullptr || *value == '\0')
            {
                return std::nullopt;
            }
            return std::string(value);
        }

    } // namespace

    std::filesystem::path ServerConfig::resolved_database_path() const
    {
        return database_path.value_or(root / "linkdrop.db");
    }

    std::string usage(const char *program_name)
    {
        return std::string("Usage: ") + program_name +
               " --port <PORT> --root <DIR> [--address <ADDRESS>] [--database <FILE>] [--threads <N>]\n"
               "       [--max-upload-size <BYTES>] [--sweep-interval <SECONDS>] [--progress-retention <SECONDS>]\n"
               "       [--access-key-hash <HASH>] [--log <FILE>] [--log-level <LEVEL>]\n"
               "       " +
               program_name + " --hash-key <KEY>\n";
    }

    CommandLine parse_arguments(int argc, char *argv[])
    {
        CommandLine command_line;
        auto &config = command_line.config;

        if (auto database = environment("LINKDROP_DATABASE_PATH"))
        {
            config.database_path = std::filesystem::path(*database);
        }
        config.access_key_hash = environment("LINKDROP_ACCESS_KEY_HASH");

        for (int i = 1; i < argc; ++i)
        {
            const std::string arg = argv[i];
            if (arg == "--port")
            {
                const auto port = parse_unsigned(require_value(i, argc, argv, arg), arg);
                if (port == 0 || port > std::numeric_limits<std::uint16_t>::max())
                {
                    throw std::runtime_error("Port out of range");
                }
                config.port = static_cast<std::uint16_t>(port);
            }
            else if (arg == "--root")
            {
                config.root = std::filesystem::path(require_value(i, argc, argv, arg));
            }
            else if (arg == "--address")
            {
                config.address = require_value(i, argc, argv, arg);
            }
            else if (arg == "--database")
            {
                config.database_path = std::filesystem::path(require_value(i, argc, argv, arg));
            }
            else if (arg == "--threads")
            {
                config.worker_threads = static_cast<std::size_t>(parse_unsigned(require_value(i, argc, argv, arg), arg));
            }
            else if (arg == "--max-upload-size")
            {
                config.max_upload_size = parse_unsigned(require_value(i, argc, argv, arg), arg);
            }
            else if (arg == "--sweep-interval")
            {
                const auto seconds = parse_unsigned(require_value(i, argc, argv, arg), arg);
                if (seconds == 0)
                {
                    throw std::runtime_error("Sweep interval must be positive");
                }
                config.sweep_interval = std::chrono::seconds(static_cast<std::int64_t>(seconds));
            }
            else if (arg == "--progress-retention")
            {
                config.progress_retention =
                    std::chrono::seconds(static_cast<std::int64_t>(parse_unsigned(require_value(i, argc, argv, arg), arg)));
            }
            else if (arg == "--access-key-hash")
            {
                config.access_key_hash = require_value(i, argc, argv, arg);
            }
            else if (arg == "--log")
            {
                config.log_file = std::filesystem::path(require_value(i, argc, argv, arg));
            }
            else if (arg == "--log-level")
            {
                const auto value = require_value(i, argc, argv, arg);
                const auto level = spdlog::level::from_str(value);
                if (level == spdlog::level::off && value != "off")
                {
                    throw std::runtime_error("Unknown log level: " + value);
                }
                config.log_level = level;
            }
            else if (arg == "--hash-key")
            {
                command_line.key_to_hash = require_value(i, argc, argv, arg);
            }
            else if (arg == "--help" || arg == "-h")
            {
                command_line.show_help = true;
            }
            else
            {
                throw std::runtime_error("Unknown argument: " + arg);
            }
        }

        if (!command_line.show_help && !command_line.key_to_hash && (config.port == 0 || config.root.empty()))
        {
            throw std::runtime_error("--port and --root are required");
        }
        return command_line;
    }

} // namespace linkdrop::server
