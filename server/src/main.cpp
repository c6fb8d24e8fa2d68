#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "chatdrop/server/config.hpp"
#include "chatdrop/server/server.hpp"
#include "chatdrop/version.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace
{

    void print_usage(const char *program_name)
    {
        std::cout << "ChatDrop upload server " << chatdrop::version() << "\n"
                  << "Usage: " << program_name
                  << " [--config <FILE>] --port <PORT> --root <STORAGE_ROOT> [--address <ADDRESS>] [--threads <N>]\n"
                     "       [--max-size <BYTES>] [--idle-timeout <seconds>] [--log <FILE>] [--log-level <LEVEL>]\n";
    }

    std::optional<std::string> read_option(int &index, int argc, char *argv[])
    {
        if (index + 1 >= argc)
        {
            return std::nullopt;
        }
        ++index;
        return std::string(argv[index]);
    }

    std::optional<std::filesystem::path> find_config_argument(int argc, char *argv[])
    {
        for (int i = 1; i + 1 < argc; ++i)
        {
            if (std::string(argv[i]) == "--config")
            {
                return std::filesystem::path(argv[i + 1]);
            }
        }
        return std::nullopt;
    }

} // namespace

int main(int argc, char *argv[])
{
    using chatdrop::server::Server;
    using chatdrop::server::ServerConfig;

    ServerConfig config;

    // The file is applied first so that command-line options override it.
    if (const auto config_path = find_config_argument(argc, argv))
    {
        try
        {
            chatdrop::server::apply_config_file(*config_path, config);
        }
        catch (const std::exception &ex)
        {
            std::cerr << "Invalid configuration " << config_path->string() << ": " << ex.what() << std::endl;
            return EXIT_FAILURE;
        }
    }

    try
    {
        for (int i = 1; i < argc; ++i)
        {
            const std::string arg = argv[i];
            if (arg == "--help" || arg == "-h")
            {
                print_usage(argv[0]);
                return EXIT_SUCCESS;
            }
            auto value = read_option(i, argc, argv);
            if (!value)
            {
                std::cerr << "Missing value for " << arg << std::endl;
                print_usage(argv[0]);
                return EXIT_FAILURE;
            }
            if (arg == "--config")
            {
                continue;
            }
            else if (arg == "--port")
            {
                config.port = static_cast<std::uint16_t>(std::stoi(*value));
            }
            else if (arg == "--root")
            {
                config.storage_root = std::filesystem::path(*value);
            }
            else if (arg == "--address")
            {
                config.address = *value;
            }
            else if (arg == "--threads")
            {
                config.worker_threads = static_cast<std::size_t>(std::stoul(*value));
            }
            else if (arg == "--max-size")
            {
                config.limits.max_artifact_bytes = std::stoull(*value);
            }
            else if (arg == "--idle-timeout")
            {
                config.limits.idle_timeout = std::chrono::seconds(std::stoll(*value));
            }
            else if (arg == "--log")
            {
                config.log_file = std::filesystem::path(*value);
            }
            else if (arg == "--log-level")
            {
                config.log_level = *value;
            }
            else
            {
                std::cerr << "Unknown argument: " << arg << std::endl;
                print_usage(argv[0]);
                return EXIT_FAILURE;
            }
        }
    }
    catch (const std::logic_error &ex)
    {
        std::cerr << "Invalid numeric argument: " << ex.what() << std::endl;
        print_usage(argv[0]);
        return EXIT_FAILURE;
    }

    if (config.port == 0 || config.storage_root.empty())
    {
        print_usage(argv[0]);
        return EXIT_FAILURE;
    }

    try
    {
        chatdrop::server::validate_config(config);
    }
    catch (const std::invalid_argument &ex)
    {
        std::cerr << "Invalid configuration: " << ex.what() << std::endl;
        return EXIT_FAILURE;
    }

    try
    {
        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
        if (config.log_file)
        {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.log_file->string(), true));
        }
        auto logger = std::make_shared<spdlog::logger>("server", sinks.begin(), sinks.end());
        logger->set_level(spdlog::level::from_str(config.log_level));
        logger->set_pattern("%Y-%m-%d %H:%M:%S [%^%l%$] %v");
        spdlog::set_default_logger(logger);
        spdlog::info("Starting ChatDrop server {} on {}:{}", chatdrop::version(), config.address, config.port);

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
