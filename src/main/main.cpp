#include "main/replicate_main.hpp"
#include "common/logger.hpp"
#include <iostream>
#include <string>

int main(int argc, char** argv) {
    // Check for help flag first, before any initialization
    if (argc > 1 && (std::string(argv[1]) == "--help" || std::string(argv[1]) == "-h")) {
        printReplicateUsage();
        return 0;
    }

    // Check for version flag
    if (argc > 1 && (std::string(argv[1]) == "--version" || std::string(argv[1]) == "-v")) {
        std::cout << "robocurse version 1.0.0\n";
        return 0;
    }

    if (argc < 2) {
        std::cerr << "Error: No configuration specified" << std::endl;
        printReplicateUsage();
        return 1;
    }

    try {
        return replicateMain(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Error in main: " << e.what() << std::endl;
        if (Logger::isInitialized()) {
            Logger::error("Error in main: " + std::string(e.what()));
        }
        return 1;
    }
}
