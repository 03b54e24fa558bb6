#include <iostream>
#include <string>
#include <vector>
#include <unistd.h>

#include "fpb/common/config.hpp"
#include "fpb/common/constants.hpp"
#include "fpb/common/logger.hpp"
#include "fpb/common/terminal.hpp"
#include "fpb/process/supervisor.hpp"

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " <" << fpb::constants::system::WRAPPED_PROGRAM << "-args>\n";
}

int main(int argc, char** argv) {
    if (argc < 2) {
        print_usage(argc > 0 ? argv[0] : fpb::constants::system::APPLICATION_NAME);
        return fpb::constants::exit_codes::FAILURE;
    }
    
    try {
        auto& config = fpb::common::Config::instance();
        
        fpb::common::Logger::instance().initialize(config.global().log_level);
        
        fpb::process::SupervisorOptions options;
        options.args.assign(argv + 1, argv + argc);
        options.input_fd = STDIN_FILENO;
        options.use_colors = fpb::common::supportsColor(STDERR_FILENO);
        
        fpb::process::ProcessSupervisor supervisor(config.global(), std::move(options), std::cerr);
        auto outcome = supervisor.run();
        
        if (outcome.error_code) {
            std::cerr << "Error: "
                      << fpb::process::SupervisorErrorCodeHelper::getMessage(*outcome.error_code)
                      << " (" << config.global().wrapped_program << ")";
            if (outcome.error_message) {
                std::cerr << ": " << *outcome.error_message;
            }
            std::cerr << std::endl;
        }
        
        fpb::common::Logger::instance().shutdown();
        return outcome.exit_code;
        
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return fpb::constants::exit_codes::FAILURE;
    }
}
