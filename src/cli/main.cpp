// main.cpp - Entry point for safepy-run
// Runs one program through the sandbox and prints the JSON result

#include <safepy/safepy.h>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <cmath>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <string>

namespace {

void PrintUsage(const char* program) {
    std::cout << "Usage: " << program << " [options] [FILE|-]\n"
              << "\nOptions:\n"
              << "  --config=PATH        Path to config file (default: ./config/safepy.yaml)\n"
              << "  --setup=FILE         Run FILE unrestricted first, then restrict\n"
              << "  --timeout=SECONDS    Override the execution time budget\n"
              << "  --schema             Print the tool schema and exit\n"
              << "  --verbose            Debug logging\n"
              << "  --help               Show this help message\n"
              << "\nCode is read from FILE, or from stdin when FILE is '-' or missing.\n"
              << "The result is printed as {\"status\", \"stdout\", \"stderr\"} JSON.\n"
              << std::endl;
}

bool ReadFile(const std::string& path, std::string& content) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return false;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    content = buffer.str();
    return true;
}

bool StartsWith(const char* arg, const char* prefix) {
    return std::strncmp(arg, prefix, std::strlen(prefix)) == 0;
}

} // anonymous namespace

int main(int argc, char** argv) {
    std::string config_path;
    std::string setup_path;
    std::string input_path = "-";
    double timeout_override = 0.0;
    bool print_schema = false;
    bool verbose = false;

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        if (std::strcmp(arg, "--help") == 0 || std::strcmp(arg, "-h") == 0) {
            PrintUsage(argv[0]);
            return 0;
        } else if (StartsWith(arg, "--config=")) {
            config_path = arg + std::strlen("--config=");
        } else if (StartsWith(arg, "--setup=")) {
            setup_path = arg + std::strlen("--setup=");
        } else if (StartsWith(arg, "--timeout=")) {
            try {
                timeout_override = std::stod(arg + std::strlen("--timeout="));
            } catch (const std::exception&) {
                std::cerr << "Invalid --timeout value: " << arg << std::endl;
                return 2;
            }
            if (!std::isfinite(timeout_override) || timeout_override <= 0.0) {
                std::cerr << "--timeout must be a positive number" << std::endl;
                return 2;
            }
        } else if (std::strcmp(arg, "--schema") == 0) {
            print_schema = true;
        } else if (std::strcmp(arg, "--verbose") == 0) {
            verbose = true;
        } else if (arg[0] == '-' && arg[1] != '\0') {
            std::cerr << "Unknown option: " << arg << std::endl;
            PrintUsage(argv[0]);
            return 2;
        } else {
            input_path = arg;
        }
    }

    if (print_schema) {
        std::cout << safepy::ToolSchema::ForSandbox().ToJson().dump(2) << std::endl;
        return 0;
    }

    // Console logging until the config says otherwise
    safepy::InitLogging(verbose ? "debug" : "info");

    // Configuration
    safepy::ConfigManager config_manager;
    if (config_path.empty()) {
        config_path = safepy::ConfigManager::FindConfigFile();
    }
    config_manager.Load(config_path);
    safepy::SafepyConfig config = config_manager.GetConfig();
    if (timeout_override > 0.0 && !safepy::TimeoutFromSeconds(timeout_override, config.sandbox.timeout)) {
        spdlog::error("Invalid --timeout value: {}", timeout_override);
        return 2;
    }

    safepy::InitLogging(verbose ? "debug" : config.log_level, config.log_file);
    spdlog::info("safepy-run v{}", safepy::GetVersionString());

    std::string code;
    if (input_path == "-") {
        code.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
    } else if (!ReadFile(input_path, code)) {
        spdlog::error("Failed to open input file: {}", input_path);
        return 2;
    }

    if (!safepy::Initialize()) {
        spdlog::error("Failed to initialize safepy");
        return 1;
    }

    int exit_code = 0;
    {
        safepy::Sandbox sandbox(config.sandbox);

        if (!setup_path.empty()) {
            std::string setup_code;
            if (!ReadFile(setup_path, setup_code)) {
                spdlog::error("Failed to open setup file: {}", setup_path);
                safepy::Shutdown();
                return 2;
            }
            safepy::ExecutionResult setup_result = sandbox.Setup(setup_code);
            if (!setup_result.IsSuccess()) {
                std::cerr << setup_result.error << std::endl;
            }
        }

        safepy::ExecutionResult result = sandbox.Execute(code);
        std::cout << result.ToJson().dump(2) << std::endl;
        exit_code = result.IsSuccess() ? 0 : 1;

        if (sandbox.DetachedWorkerCount() > 0) {
            // A detached worker still runs Python; finalizing under it is unsafe
            spdlog::warn("Exiting without interpreter shutdown, a worker is still running");
            std::cout.flush();
            std::_Exit(exit_code);
        }
    }

    safepy::Shutdown();
    return exit_code;
}
