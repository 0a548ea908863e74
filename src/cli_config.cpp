#include "cli_config.h"
#include "app_paths.h"
#include <yaml-cpp/yaml.h>
#include <cstdlib>
#include <filesystem>
#include <iostream>

namespace fs = std::filesystem;

const char* ConfigLoader::DEFAULT_HOST = "127.0.0.1";
const char* ConfigLoader::DEFAULT_PORT = "11434";

namespace {

const int DEFAULT_POLL_INTERVAL_MS = 250;
const long DEFAULT_REQUEST_TIMEOUT = 30;

std::string trimmed(const std::string& text) {
    const char* whitespace = " \t\r\n";
    size_t start = text.find_first_not_of(whitespace);
    if (start == std::string::npos) {
        return "";
    }
    size_t end = text.find_last_not_of(whitespace);
    std::string result = text.substr(start, end - start + 1);

    // Tolerate quoted values copied from shell snippets
    if (result.size() >= 2 && (result.front() == '"' || result.front() == '\'') && result.back() == result.front()) {
        result = result.substr(1, result.size() - 2);
    }
    return result;
}

std::string environmentValue(const char* name) {
    const char* value = std::getenv(name);
    return value ? trimmed(value) : std::string();
}

// Reads a positive number; a bad value is reported and the old value kept
template <typename T>
void readPositive(const YAML::Node& root, const char* key, const std::string& path, T& value) {
    if (!root[key]) {
        return;
    }
    try {
        T parsed = root[key].as<T>();
        if (parsed <= 0) {
            std::cerr << "Warning: " << path << ": " << key << " must be positive, using " << value << std::endl;
            return;
        }
        value = parsed;
    } catch (const YAML::BadConversion& e) {
        std::cerr << "Warning: " << path << ": invalid " << key << " (" << e.what() << "), using " << value
                  << std::endl;
    }
}

} // namespace

CliConfig::CliConfig()
    : host(ConfigLoader::normalizeHost("")),
      logDirectory(AppPaths::defaultLogDirectory()),
      pollIntervalMs(DEFAULT_POLL_INTERVAL_MS),
      requestTimeout(DEFAULT_REQUEST_TIMEOUT) {}

CliConfig ConfigLoader::load() {
    CliConfig config;

    for (const auto& path : candidatePaths()) {
        std::error_code ec;
        if (!fs::exists(path, ec)) {
            continue;
        }

        std::string errorMessage;
        if (!loadFile(path, config, errorMessage)) {
            std::cerr << "Warning: " << errorMessage << std::endl;
        }
        break;
    }

    applyEnvironment(config);
    return config;
}

bool ConfigLoader::loadFile(const std::string& path, CliConfig& config, std::string& errorMessage) {
    try {
        YAML::Node root = YAML::LoadFile(path);
        if (root.IsNull()) {
            // Empty file
            config.sourcePath = path;
            return true;
        }
        if (!root.IsMap()) {
            errorMessage = "config file " + path + " must contain a mapping";
            return false;
        }

        if (root["host"]) {
            config.host = normalizeHost(root["host"].as<std::string>());
        }
        if (root["log_directory"]) {
            std::string directory = trimmed(root["log_directory"].as<std::string>());
            if (!directory.empty()) {
                config.logDirectory = directory;
            }
        }
        readPositive(root, "poll_interval_ms", path, config.pollIntervalMs);
        readPositive(root, "request_timeout", path, config.requestTimeout);
    } catch (const YAML::Exception& e) {
        errorMessage = "failed to read config file " + path + ": " + e.what();
        return false;
    }

    config.sourcePath = path;
    return true;
}

void ConfigLoader::applyEnvironment(CliConfig& config) {
    std::string host = environmentValue("MODELCTL_HOST");
    if (!host.empty()) {
        config.host = normalizeHost(host);
    }

    std::string logDirectory = environmentValue("MODELCTL_LOG_DIR");
    if (!logDirectory.empty()) {
        config.logDirectory = logDirectory;
    }
}

std::string ConfigLoader::normalizeHost(const std::string& host) {
    std::string value = trimmed(host);
    std::string scheme = "http";
    std::string defaultPort = DEFAULT_PORT;

    size_t schemeEnd = value.find("://");
    if (schemeEnd != std::string::npos) {
        scheme = value.substr(0, schemeEnd);
        value = value.substr(schemeEnd + 3);
        if (scheme == "http") {
            defaultPort = "80";
        } else if (scheme == "https") {
            defaultPort = "443";
        }
    }

    std::string path;
    size_t slash = value.find('/');
    if (slash != std::string::npos) {
        path = value.substr(slash);
        value = value.substr(0, slash);
        while (!path.empty() && path.back() == '/') {
            path.pop_back();
        }
    }

    if (value.empty() || value.front() == ':') {
        value = DEFAULT_HOST + value;
    }

    bool hasPort;
    if (value.front() == '[') {
        size_t closing = value.find(']');
        hasPort = closing != std::string::npos && value.find(':', closing) != std::string::npos;
    } else {
        hasPort = value.find(':') != std::string::npos;
    }
    if (!hasPort) {
        value += ":" + defaultPort;
    }

    return scheme + "://" + value + path;
}

std::vector<std::string> ConfigLoader::candidatePaths() {
    std::vector<std::string> paths;

    std::string explicitPath = environmentValue("MODELCTL_CONFIG");
    if (!explicitPath.empty()) {
        paths.push_back(explicitPath);
    }
    paths.push_back((fs::path(AppPaths::configDirectory()) / "config.yaml").string());
    paths.push_back("config.yaml");
    return paths;
}
