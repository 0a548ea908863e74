#ifndef MODELCTL_CLI_H
#define MODELCTL_CLI_H

#include <atomic>
#include <memory>
#include <string>
#include <vector>
#include "cancellation_token.h"
#include "cli_config.h"
#include "model_client.h"

/**
 * @brief Options of the logs command
 */
struct LogOptions {
    bool follow = false;    ///< Keep streaming appended lines until interrupted
    int tail = 0;           ///< Number of existing lines to show (0: all)
    bool appLog = false;    ///< Show app.log instead of server.log
};

/**
 * @brief Main application class for modelctl
 */
class ModelctlCLI {
public:
    /// Exit code for a failed command
    static const int EXIT_FAILED;
    /// Exit code when the model server cannot be reached
    static const int EXIT_UNREACHABLE;

    /**
     * @brief Load configuration, initialize HTTP and install signal handlers
     */
    void initialize();

    /**
     * @brief Cleanup resources before exit
     */
    void cleanup();

    /**
     * @brief Print the description of a model
     * @param modelName The model to describe
     * @param verbose Include metadata and tensors
     * @return Exit code (0 for success, non-zero for error)
     */
    int showModel(const std::string& modelName, bool verbose);

    /**
     * @brief Print the locally available models
     * @param prefix Only list models whose name starts with this prefix
     * @return Exit code (0 for success, non-zero for error)
     */
    int listModels(const std::string& prefix);

    /**
     * @brief Create a model from a Modelfile, or as a copy of an existing model
     * @param modelName Name of the new model
     * @param modelfilePath Modelfile to read (empty: ./Modelfile)
     * @param sourceModel If not empty, copy this model instead of reading a Modelfile
     * @return Exit code (0 for success, non-zero for error)
     */
    int createModel(const std::string& modelName, const std::string& modelfilePath,
                    const std::string& sourceModel);

    /**
     * @brief Push a model to its registry
     * @param modelName The model to push
     * @param insecure Allow a registry without TLS
     * @return Exit code (0 for success, non-zero for error)
     */
    int pushModel(const std::string& modelName, bool insecure);

    /**
     * @brief Stop and delete models, stopping at the first failure
     * @param modelNames Models to delete
     * @return Exit code (0 for success, non-zero for error)
     */
    int deleteModels(const std::vector<std::string>& modelNames);

    /**
     * @brief Print a log file, optionally following it until interrupted
     * @param options Which log, how many lines, follow or not
     * @return Exit code (0 for success, non-zero for error)
     */
    int showLogs(const LogOptions& options);

    /**
     * @brief Print the client and server versions
     * @return Exit code (0 for success, non-zero for error)
     */
    int showVersion();

    /**
     * @brief Stop a running log follow (used by the signal handlers)
     */
    void requestStop();

private:
    CliConfig m_config;
    std::unique_ptr<ModelClient> m_client;
    CancellationToken m_followCancel;
    std::atomic<bool> m_following{false};
    static ModelctlCLI* s_instance; // For signal handling

    /**
     * @brief Make sure the server answers before talking to it
     * @return True if the server is reachable, false otherwise (error already printed)
     */
    bool ensureServerConnection();

    /**
     * @brief Signal handler: stops a log follow, otherwise terminates
     * @param signal Signal number
     */
    static void signalHandler(int signal);
};

#endif // MODELCTL_CLI_H
