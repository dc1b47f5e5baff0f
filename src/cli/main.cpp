// File: src/cli/main.cpp
//
// Entry point of the kte command-line driver
//
// Usage: kte_cli [--config <file.yaml>] [--sqlite <db_path>] [--print-config]

#include "cli/kte_cli.hpp"
#include "core/errors.hpp"
#include <iostream>
#include <string>

using namespace kte;

static void PrintUsage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n\n"
              << "Options:\n"
              << "  --config <file>    Load engine configuration from YAML\n"
              << "  --sqlite <path>    Use the SQLite backend at <path>\n"
              << "  --print-config     Print the effective configuration and exit\n"
              << "  --help             Show this help\n";
}

int main(int argc, char** argv) {
    EngineConfig config = EngineConfig::Default();
    bool print_config = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            auto loaded = EngineConfig::LoadFromFile(argv[++i]);
            if (!loaded) {
                std::cerr << "Fatal error: could not load configuration " << argv[i] << "\n";
                return 1;
            }
            config = *loaded;
        } else if (arg == "--sqlite" && i + 1 < argc) {
            config.storage.backend = "sqlite";
            config.storage.db_path = argv[++i];
        } else if (arg == "--print-config") {
            print_config = true;
        } else if (arg == "--help" || arg == "-h") {
            PrintUsage(argv[0]);
            return 0;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            PrintUsage(argv[0]);
            return 1;
        }
    }

    auto errors = config.GetValidationErrors();
    if (!errors.empty()) {
        std::cerr << "Invalid configuration:\n";
        for (const auto& error : errors) {
            std::cerr << "  - " << error << "\n";
        }
        return 1;
    }

    if (print_config) {
        std::cout << config.ToYamlString();
        return 0;
    }

    try {
        KteCli cli(config, std::cout);
        cli.Run(std::cin);
    } catch (const EngineError& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
