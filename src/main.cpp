#include "common/common.hpp"
#include "gc/controller.hpp"
#include "shell/shell.hpp"
#include <iostream>
#include <fstream>
#include <sstream>
#include <string>

// Read file into string
std::string readFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Could not open file: " + path);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

// Parse "t0,t1,t2"
Thresholds parseThresholds(const std::string& text) {
    Thresholds thresholds = DEFAULT_THRESHOLDS;
    std::stringstream stream(text);
    std::string item;
    int i = 0;
    while (std::getline(stream, item, ',')) {
        if (i >= NUM_GENERATIONS) {
            throw InvalidConfiguration("expected " + std::to_string(NUM_GENERATIONS) + " thresholds");
        }
        if (item.empty() || item.find_first_not_of("0123456789") != std::string::npos) {
            throw InvalidConfiguration("threshold '" + item + "' is not a number");
        }
        thresholds[i++] = static_cast<size_t>(std::stoull(item));
    }
    if (i != NUM_GENERATIONS) {
        throw InvalidConfiguration("expected " + std::to_string(NUM_GENERATIONS) + " thresholds");
    }
    GenerationTracker::validateThresholds(thresholds);
    return thresholds;
}

// Run script file
int runFile(const std::string& path, const GCConfig& config, bool verbose) {
    try {
        std::string source = readFile(path);
        Shell shell(std::cout, config);
        shell.setEcho(verbose);

        if (!shell.runScript(source)) {
            return 1;
        }

        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}

// Interactive REPL
void repl(const GCConfig& config, bool verbose) {
    Shell shell(std::cout, config);
    shell.setEcho(verbose);
    std::string line;

    std::cout << "rcgc shell - Type 'exit' to quit" << std::endl;

    while (true) {
        std::cout << "> ";
        std::cout.flush();

        if (!std::getline(std::cin, line)) {
            std::cout << std::endl;
            break;
        }

        // Check for exit command
        if (line == "exit" || line == "quit") {
            break;
        }

        // Skip empty lines
        if (line.empty()) {
            continue;
        }

        shell.runLine(line);
    }

    std::cout << "Goodbye!" << std::endl;
}

// Print usage
void printUsage(const char* program) {
    std::cerr << "Usage: " << program << " [options] [script]" << std::endl;
    std::cerr << "  Options:" << std::endl;
    std::cerr << "    -t, --threshold  Collection thresholds t0,t1,t2 (default: 700,10,10)" << std::endl;
    std::cerr << "    -d, --disable    Start with automatic collection disabled" << std::endl;
    std::cerr << "    -g, --debug      Debug flags: stats,collectable,uncollectable,saveall,leak" << std::endl;
    std::cerr << "    -r, --raise      Report resurrected objects as errors" << std::endl;
    std::cerr << "    -v, --verbose    Echo every command executed" << std::endl;
    std::cerr << "    -h, --help       Print this help message" << std::endl;
    std::cerr << "  Run without arguments to start REPL" << std::endl;
}

int main(int argc, char* argv[]) {
    bool verbose = false;
    GCConfig config;
    std::string scriptPath = "";
    bool stopFlags = false;

    try {
        for (int i = 1; i < argc; i++) {
            std::string arg = argv[i];
            if (!stopFlags && (arg == "-v" || arg == "--verbose")) {
                verbose = true;
            } else if (!stopFlags && (arg == "-d" || arg == "--disable")) {
                config.enabled = false;
            } else if (!stopFlags && (arg == "-r" || arg == "--raise")) {
                config.resurrectionPolicy = ResurrectionPolicy::RAISE;
            } else if (!stopFlags && (arg == "-t" || arg == "--threshold")) {
                if (i + 1 < argc) {
                    config.thresholds = parseThresholds(argv[++i]);
                } else {
                    std::cerr << "Error: -t option requires an argument" << std::endl;
                    return 1;
                }
            } else if (!stopFlags && (arg == "-g" || arg == "--debug")) {
                if (i + 1 < argc) {
                    config.debugFlags = parseDebugFlagList(argv[++i]);
                } else {
                    std::cerr << "Error: -g option requires an argument" << std::endl;
                    return 1;
                }
            } else if (!stopFlags && (arg == "-h" || arg == "--help")) {
                printUsage(argv[0]);
                return 0;
            } else if (!stopFlags && arg == "--") {
                stopFlags = true;
            } else if (!stopFlags && arg[0] == '-') {
                std::cerr << "Unknown option: " << arg << std::endl;
                printUsage(argv[0]);
                return 1;
            } else {
                if (scriptPath.empty()) {
                    scriptPath = arg;
                } else {
                    std::cerr << "Too many arguments" << std::endl;
                    printUsage(argv[0]);
                    return 1;
                }
            }
        }
    } catch (const std::exception& e) {
        std::cerr << e.what() << std::endl;
        printUsage(argv[0]);
        return 1;
    }

    if (scriptPath.empty()) {
        // No script - start REPL
        repl(config, verbose);
        return 0;
    }
    return runFile(scriptPath, config, verbose);
}
