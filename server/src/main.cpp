#include <cstdlib>
#include <iostream>
#include <memory>
#include <vector>

#include "linkdrop/crypto.hpp"
#include "linkdrop/server/config.hpp"
#include "linkdrop/server/server.hpp"
#include "linkdrop/version.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace
{

    void configure_logging(const linkdrop::server::ServerConfig &config)
    {
        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
        if (config.log_file)
        {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.log_file->string(), true));
        }
        auto logger = std::make_shared<spdlog::logger>("server", sinks.begin(), sinks.end());
        logger->set_level(config.log_level);
        logger->set_pattern("%Y-%m-%d %H:%M:%S [%^%l%$] %v");
        spdlog::set_default_logger(logger);
    }

} // namespace

int main(int argc, char *argv[])
{
    using linkdrop::server::Server;

    linkdrop::server::CommandLine command_line;
    try
    {
        command_line = linkdrop::server::parse_arguments(argc, argv);
    }
    catch (const std::exception &ex)
    {
        std::cerr << ex.what() << "\n"
                  << linkdrop::server::usage(argv[0]);
        return EXIT_FAILURE;
    }

    if (command_line.show_help)
    {
        std::cout << "LinkDrop server " << linkdrop::version() << "\n"
                  << linkdrop::server::usage(argv[0]);
        return EXIT_SUCCESS;
    }

    if (command_line.key_to_hash)
    {
        try
        {
            std::cout << linkdrop::crypto::hash_password(*command_line.key_to_hash) << std::endl;
        }
        catch (const std::exception &ex)
        {
            std::cerr << "Hashing failed: " << ex.what() << std::endl;
            return EXIT_FAILURE;
        }
        return EXIT_SUCCESS;
    }

    auto config = std::move(command_line.config);
    try
    {
        configure_logging(config);
        spdlog::info("Starting LinkDrop server {} on {}:{}", linkdrop::version(), config.address, config.port);

        Server server(std::move(config));
        server.run();
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Server failed: " << ex.what() << std::endl;
        spdlog::error("Fatal error: {}", ex.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
