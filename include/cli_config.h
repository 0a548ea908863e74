#ifndef CLI_CONFIG_H
#define CLI_CONFIG_H

#include <string>
#include <vector>

/**
 * @brief Settings read from config.yaml and the environment
 */
struct CliConfig {
    std::string host;           ///< Server URL (e.g., "http://127.0.0.1:11434")
    std::string logDirectory;   ///< Directory holding server.log and app.log
    int pollIntervalMs;         ///< Log follow poll interval in milliseconds
    long requestTimeout;        ///< HTTP request timeout in seconds
    std::string sourcePath;     ///< Config file that was loaded, empty if none

    /**
     * @brief Constructor with built-in defaults
     */
    CliConfig();
};

/**
 * @brief Loads CliConfig from YAML files and environment variables
 *
 * Example config.yaml:
 * @code
 * host: http://127.0.0.1:11434
 * log_directory: /home/user/.modelctl/logs
 * poll_interval_ms: 250
 * request_timeout: 30
 * @endcode
 */
class ConfigLoader {
public:
    static const char* DEFAULT_HOST;
    static const char* DEFAULT_PORT;

    /**
     * @brief Load the first config file found, then apply environment overrides
     * @return Effective configuration
     */
    static CliConfig load();

    /**
     * @brief Read settings from a YAML file into config
     * @param path Path of the YAML file
     * @param config Configuration to update; keys missing from the file keep their value
     * @param errorMessage Output: reason for failure
     * @return False if the file could not be read or parsed
     */
    static bool loadFile(const std::string& path, CliConfig& config, std::string& errorMessage);

    /**
     * @brief Apply MODELCTL_HOST and MODELCTL_LOG_DIR overrides
     * @param config Configuration to update
     */
    static void applyEnvironment(CliConfig& config);

    /**
     * @brief Turn a host setting into a base URL
     * @param host "host", "host:port" or "scheme://host[:port]"
     * @return URL with scheme and port (e.g., "0.0.0.0" -> "http://0.0.0.0:11434")
     */
    static std::string normalizeHost(const std::string& host);

    /**
     * @brief Config file locations in search order
     * @return $MODELCTL_CONFIG (if set), the user config file, ./config.yaml
     */
    static std::vector<std::string> candidatePaths();
};

#endif // CLI_CONFIG_H
