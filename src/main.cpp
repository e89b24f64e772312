#include <iostream>
#include <string>

#include "app/redact_command.hpp"
#include "util/logger.hpp"

int main(int argc, char** argv) {
    redactor::app::CommandOptions options;
    try {
        options = redactor::app::parseArguments(argc, argv);
    } catch (const redactor::app::UsageError& ex) {
        std::cerr << "redact: " << ex.what() << "\n\n" << redactor::app::usageText(argv[0]);
        return redactor::app::EXIT_CONFIG_ERROR;
    }

    if (options.help) {
        std::cout << redactor::app::usageText(argv[0]);
        return redactor::app::EXIT_OK;
    }

    try {
        return redactor::app::runRedactCommand(options, std::cout);
    } catch (const std::exception& ex) {
        redactor::util::logger::critical(std::string("[main] ") + ex.what());
        return redactor::app::EXIT_CONFIG_ERROR;
    }
}
