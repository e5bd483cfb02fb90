#include <iostream>
#include <string>
#include <vector>
#include "chunkstream/core/logger.hpp"
#include "chunkstream/core/config.hpp"
#include "chunkstream/core/cli.hpp"
#include "chunkstream/core/utils.hpp"
#include "chunkstream/core/command_registry.hpp"
#include "chunkstream/crypto/hash.hpp"

int main(int argc, char* argv[]) {
    chunkstream::core::CommandLineParser parser("chunkstream");

    if (!parser.parse(argc, argv)) {
        std::cerr << "Error: " << parser.get_error() << "\n\n";
        parser.print_help();
        return 1;
    }

    if (parser.has_option("help")) {
        parser.print_help();
        chunkstream::core::CommandRegistry().print_help();
        return 0;
    }

    if (parser.has_option("version")) {
        parser.print_version();
        return 0;
    }

    auto& config = chunkstream::core::Config::instance();
    config.set_defaults();

    std::string config_file = parser.get_option("config");
    if (chunkstream::core::utils::FileUtils::exists(config_file)) {
        if (!config.load_from_file(config_file)) {
            std::cerr << "Error: could not read " << config_file << "\n";
            return 1;
        }
    } else if (parser.has_option("config")) {
        std::cerr << "Error: config file not found: " << config_file << "\n";
        return 1;
    }

    auto log_level = parser.has_option("verbose")
        ? chunkstream::core::LogLevel::Debug
        : chunkstream::core::Logger::parse_level(config.get_string("log.level", "info"));
    chunkstream::core::Logger::initialize(config.get_string("log.file", "chunkstream.log"), log_level);

    if (!chunkstream::crypto::initialize()) {
        LOG_CRITICAL("Failed to initialize libsodium");
        return 1;
    }

    LOG_INFO("chunkstream starting up");

    chunkstream::core::CommandRegistry command_registry;

    auto& args = parser.get_positional_args();
    if (args.empty()) {
        parser.print_help();
        command_registry.print_help();
        return 0;
    }

    std::string command = args[0];

    auto result = command_registry.execute_command(command, args);

    if (!result.success) {
        std::cerr << "Error: " << result.message << "\n";
        if (!command_registry.has_command(command)) {
            std::cout << "\nAvailable commands:\n";
            command_registry.print_help();
        }
    }

    chunkstream::core::Logger::shutdown();
    return result.exit_code;
}
