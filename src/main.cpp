#include <iostream>
#include <string>
#include "pqshare/core/logger.hpp"
#include "pqshare/core/config.hpp"
#include "pqshare/core/cli.hpp"
#include "pqshare/core/utils.hpp"
#include "pqshare/core/command_registry.hpp"
#include "pqshare/crypto/random.hpp"

int main(int argc, char* argv[]) {
    std::string error;
    auto invocation = pqshare::core::CommandLine::parse(argc, argv, error);
    if (!invocation) {
        std::cerr << "Error: " << error << "\n\n";
        pqshare::core::CommandLine::print_usage(std::cerr);
        return 1;
    }

    if (invocation->show_help) {
        pqshare::core::CommandLine::print_usage(std::cout);
        pqshare::core::CommandRegistry().print_help();
        return 0;
    }

    if (invocation->show_version) {
        pqshare::core::CommandLine::print_version(std::cout);
        return 0;
    }

    auto& config = pqshare::core::Config::instance();
    config.set_defaults();

    if (pqshare::core::utils::FileUtils::exists(invocation->config_file)) {
        config.load_from_file(invocation->config_file);
    }
    // Command-line options override the file for this run
    pqshare::core::CommandLine::apply(*invocation, config);

    pqshare::core::Logger::initialize(config.get_string("log.file", "pqshare.log"),
                                      pqshare::core::parse_log_level(config.get_string("log.level", "info")));

    if (!pqshare::crypto::SecureRandom::initialize()) {
        LOG_CRITICAL("libsodium failed to initialize");
        return 1;
    }

    LOG_INFO("pqshare starting up");

    pqshare::core::CommandRegistry command_registry;

    const auto& args = invocation->args;
    if (args.empty()) {
        pqshare::core::CommandLine::print_usage(std::cout);
        command_registry.print_help();
        return 0;
    }

    const std::string& command = invocation->command();

    auto result = command_registry.execute_command(command, args);

    if (!result.success) {
        std::cerr << "Error: " << result.message << "\n";
        if (!command_registry.has_command(command)) {
            std::cout << "\nAvailable commands:\n";
            command_registry.print_help();
        }
    }

    pqshare::core::Logger::shutdown();
    return result.exit_code;
}
