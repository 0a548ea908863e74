#include "modelctl_cli.h"
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

/**
 * @file main.cpp
 * @brief Entry point for the modelctl application
 *
 * Arguments are parsed here; the commands themselves are implemented
 * in the ModelctlCLI class.
 */

void printUsage(const char* programName) {
    std::cout << "Usage: " << programName << " <command> [arguments]\n\n";
    std::cout << "Commands:\n";
    std::cout << "  show <model> [-v|--verbose]          Show information for a model\n";
    std::cout << "  list [prefix]                        List local models\n";
    std::cout << "  create <model> [-f|--file path]      Create a model from a Modelfile\n";
    std::cout << "         [--from model]                Save a copy of an existing model instead\n";
    std::cout << "  push <model> [--insecure]            Push a model to its registry\n";
    std::cout << "  delete|rm <model>...                 Stop and remove models\n";
    std::cout << "  logs [-n|--tail N] [-f|--follow]     Display server logs\n";
    std::cout << "       [--app]                         Display the app log instead\n";
    std::cout << "  version                              Show client and server versions\n";
    std::cout << "  help                                 Show this help message\n\n";
    std::cout << "Examples:\n";
    std::cout << "  " << programName << " show llama3.2                 # Model summary\n";
    std::cout << "  " << programName << " show llama3.2 --verbose       # Include metadata and tensors\n";
    std::cout << "  " << programName << " create pirate -f ./Modelfile  # Build a model from a Modelfile\n";
    std::cout << "  " << programName << " logs --tail 20 --follow       # Stream the server log\n";
    std::cout << "\nEnvironment:\n";
    std::cout << "  MODELCTL_HOST      Address of the model server (default 127.0.0.1:11434)\n";
    std::cout << "  MODELCTL_LOG_DIR   Directory holding server.log and app.log\n";
    std::cout << "  MODELCTL_CONFIG    Path of the YAML configuration file\n";
}

bool parseLineCount(const std::string& text, int& value) {
    if (text.empty()) {
        return false;
    }
    char* end = nullptr;
    long parsed = std::strtol(text.c_str(), &end, 10);
    if (*end != '\0' || parsed < 0 || parsed > 1000000000L) {
        return false;
    }
    value = static_cast<int>(parsed);
    return true;
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        printUsage(argv[0]);
        return 1;
    }

    std::string command = argv[1];
    if (command == "help" || command == "-h" || command == "--help") {
        printUsage(argv[0]);
        return 0;
    }

    std::string modelName;
    std::string prefix;
    bool verbose = false;
    LogOptions logOptions;
    std::string modelfilePath;
    std::string sourceModel;
    bool insecure = false;
    std::vector<std::string> modelNames;

    // Parse command arguments
    if (command == "show") {
        for (int i = 2; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "-v" || arg == "--verbose") {
                verbose = true;
            } else if (modelName.empty() && arg[0] != '-') {
                modelName = arg;
            } else {
                std::cerr << "Error: unexpected argument '" << arg << "'\n";
                return 1;
            }
        }
        if (modelName.empty()) {
            std::cerr << "Error: show requires a model name\n";
            return 1;
        }
    } else if (command == "list" || command == "ls") {
        if (argc > 3) {
            std::cerr << "Error: list accepts at most one prefix\n";
            return 1;
        }
        if (argc == 3) {
            prefix = argv[2];
        }
    } else if (command == "create") {
        for (int i = 2; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "-f" || arg == "--file" || arg == "--from") {
                if (i + 1 >= argc) {
                    std::cerr << "Error: " << arg << " requires a value\n";
                    return 1;
                }
                if (arg == "--from") {
                    sourceModel = argv[++i];
                } else {
                    modelfilePath = argv[++i];
                }
            } else if (modelName.empty() && arg[0] != '-') {
                modelName = arg;
            } else {
                std::cerr << "Error: unexpected argument '" << arg << "'\n";
                return 1;
            }
        }
        if (modelName.empty()) {
            std::cerr << "Error: create requires a model name\n";
            return 1;
        }
        if (!modelfilePath.empty() && !sourceModel.empty()) {
            std::cerr << "Error: --file and --from cannot be used together\n";
            return 1;
        }
    } else if (command == "push") {
        for (int i = 2; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--insecure") {
                insecure = true;
            } else if (modelName.empty() && arg[0] != '-') {
                modelName = arg;
            } else {
                std::cerr << "Error: unexpected argument '" << arg << "'\n";
                return 1;
            }
        }
        if (modelName.empty()) {
            std::cerr << "Error: push requires a model name\n";
            return 1;
        }
    } else if (command == "delete" || command == "rm") {
        for (int i = 2; i < argc; ++i) {
            modelNames.push_back(argv[i]);
        }
        if (modelNames.empty()) {
            std::cerr << "Error: delete requires at least one model name\n";
            return 1;
        }
    } else if (command == "logs") {
        for (int i = 2; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "-f" || arg == "--follow") {
                logOptions.follow = true;
            } else if (arg == "--app") {
                logOptions.appLog = true;
            } else if (arg == "-n" || arg == "--tail") {
                if (i + 1 >= argc || !parseLineCount(argv[i + 1], logOptions.tail)) {
                    std::cerr << "Error: " << arg << " requires a non-negative line count\n";
                    return 1;
                }
                ++i;
            } else if (arg.rfind("--tail=", 0) == 0) {
                if (!parseLineCount(arg.substr(7), logOptions.tail)) {
                    std::cerr << "Error: --tail requires a non-negative line count\n";
                    return 1;
                }
            } else {
                std::cerr << "Error: unexpected argument '" << arg << "'\n";
                return 1;
            }
        }
    } else if (command != "version") {
        std::cerr << "Error: unknown command '" << command << "'\n\n";
        printUsage(argv[0]);
        return 1;
    }

    ModelctlCLI app;
    app.initialize();

    int exitCode = 0;
    if (command == "show") {
        exitCode = app.showModel(modelName, verbose);
    } else if (command == "list" || command == "ls") {
        exitCode = app.listModels(prefix);
    } else if (command == "create") {
        exitCode = app.createModel(modelName, modelfilePath, sourceModel);
    } else if (command == "push") {
        exitCode = app.pushModel(modelName, insecure);
    } else if (command == "delete" || command == "rm") {
        exitCode = app.deleteModels(modelNames);
    } else if (command == "logs") {
        exitCode = app.showLogs(logOptions);
    } else {
        exitCode = app.showVersion();
    }

    app.cleanup();
    return exitCode;
}
