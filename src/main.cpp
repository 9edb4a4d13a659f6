#include <iostream>
#include <string>
#include <vector>
#include "uplink/core/logger.hpp"
#include "uplink/core/config.hpp"
#include "uplink/core/cli.hpp"
#include "uplink/core/utils.hpp"
#include "uplink/core/command_registry.hpp"

int main(int argc, char* argv[]) {
    uplink::core::CommandLineParser parser("uplink");
    parser.add_option("m", "mime", "MIME type of the uploaded file", true);
    parser.add_option("", "chunk-size", "Requested chunk size in bytes", true);
    parser.add_option("p", "parallel", "Concurrent chunk uploads", true);
    parser.add_option("o", "owner", "Owner id for the session", true);
    parser.add_option("s", "session", "Continue an existing session", true);
    parser.add_option("b", "bucket", "Destination bucket override", true);
    
    if (!parser.parse(argc, argv)) {
        std::cerr << "Error: " << parser.get_error() << "\n\n";
        parser.print_help();
        return 1;
    }
    
    if (parser.has_option("help")) {
        parser.print_help();
        uplink::core::CommandRegistry().print_help();
        return 0;
    }
    
    if (parser.has_option("version")) {
        parser.print_version();
        return 0;
    }
    
    auto& config = uplink::core::Config::instance();
    config.set_defaults();
    
    auto config_file = uplink::core::utils::FileUtils::expand_home(parser.get_option("config", "~/.uplink.conf"));
    if (uplink::core::utils::FileUtils::exists(config_file)) {
        if (!config.load_from_file(config_file.string())) {
            std::cerr << "Error: failed to read configuration from " << config_file.string() << "\n";
            return 1;
        }
    }
    
    auto log_level = parser.has_option("verbose") ?
        uplink::core::LogLevel::Debug :
        uplink::core::Logger::parse_level(config.get_string("log.level"), uplink::core::LogLevel::Info);
    auto log_file = parser.get_option("log-file", config.get_string("log.file", "uplink.log"));
    uplink::core::Logger::initialize(log_file, log_level);
    
    LOG_DEBUG("uplink starting up");
    
    uplink::core::CommandRegistry command_registry;
    
    auto& args = parser.get_positional_args();
    if (args.empty()) {
        parser.print_help();
        command_registry.print_help();
        return 0;
    }
    
    std::string command = args[0];
    
    auto result = command_registry.execute_command(command, args, parser);
    
    if (!result.success) {
        std::cerr << "Error: " << result.message << "\n";
        if (!command_registry.has_command(command)) {
            std::cout << "\nAvailable commands:\n";
            command_registry.print_help();
        }
    }
    
    uplink::core::Logger::shutdown();
    return result.exit_code;
}
