#ifndef MODEL_CLIENT_H
#define MODEL_CLIENT_H

#include <functional>
#include <string>
#include <vector>
#include "model_description.h"
#include "modelfile.h"

struct HttpResponse;

/**
 * @brief One status line streamed by a create or push
 */
struct ProgressUpdate {
    std::string status;         ///< e.g. "pushing manifest", "success"
    std::string digest;         ///< Layer being transferred, if any
    long long total = 0;        ///< Bytes to transfer, 0 if unknown
    long long completed = 0;    ///< Bytes transferred so far
};

using ProgressCallback = std::function<void(const ProgressUpdate&)>;

/**
 * @brief Client for the model server HTTP API
 */
class ModelClient {
public:
    /**
     * @brief Constructor
     * @param baseUrl Server URL without the API path (e.g., "http://127.0.0.1:11434")
     */
    explicit ModelClient(const std::string& baseUrl);

    /**
     * @brief Check if the model server answers
     * @return True if server is running, false otherwise
     */
    bool isServerRunning() const;

    /**
     * @brief Get the server version
     * @param version Output: version string reported by the server
     * @param errorMessage Output: reason for failure
     * @return True on success
     */
    bool getVersion(std::string& version, std::string& errorMessage) const;

    /**
     * @brief Fetch the description of a model
     * @param modelName The model to describe (e.g., "llama3:8b")
     * @param verbose Ask the server for full metadata and tensors
     * @param description Output: decoded model description
     * @param errorMessage Output: reason for failure
     * @return True on success
     */
    bool showModel(const std::string& modelName, bool verbose,
                   ModelDescription& description, std::string& errorMessage) const;

    /**
     * @brief List locally available models
     * @param models Output: models reported by the server
     * @param errorMessage Output: reason for failure
     * @return True on success
     */
    bool listModels(std::vector<ModelSummary>& models, std::string& errorMessage) const;

    /**
     * @brief Create a model on the server
     * @param request Name, base model and settings of the new model
     * @param onProgress Called for every status the server streams back
     * @param errorMessage Output: reason for failure
     * @return True once the server reports the model as created
     */
    bool createModel(const CreateRequest& request, const ProgressCallback& onProgress,
                     std::string& errorMessage) const;

    /**
     * @brief Upload a model to its registry
     * @param modelName The model to push (e.g., "myuser/mymodel:latest")
     * @param insecure Allow a registry without TLS
     * @param onProgress Called for every status the server streams back
     * @param errorMessage Output: reason for failure
     * @return True on success
     */
    bool pushModel(const std::string& modelName, bool insecure, const ProgressCallback& onProgress,
                   std::string& errorMessage) const;

    /**
     * @brief Ask the server to unload a model from memory
     * @param modelName The model to unload
     * @param errorMessage Output: server's reason for failure
     * @return True if the server accepted the request
     */
    bool unloadModel(const std::string& modelName, std::string& errorMessage) const;

    /**
     * @brief Stop a model if it is running, then delete it
     * @param modelName The model to delete
     * @param errorMessage Output: reason for failure
     * @return True on success
     */
    bool deleteModel(const std::string& modelName, std::string& errorMessage) const;

    const std::string& baseUrl() const { return m_baseUrl; }

    /**
     * @brief Decode a show response body
     * @param jsonData The JSON body
     * @param description Output: decoded model description
     * @param errorMessage Output: reason for failure
     * @return True if the body was valid JSON object
     */
    static bool parseShowResponse(const std::string& jsonData, ModelDescription& description,
                                  std::string& errorMessage);

    /**
     * @brief Decode a model list response body
     * @param jsonData The JSON body
     * @param models Output: decoded models
     * @param errorMessage Output: reason for failure
     * @return True if the body was a valid JSON object
     */
    static bool parseModelList(const std::string& jsonData, std::vector<ModelSummary>& models,
                               std::string& errorMessage);

    /**
     * @brief Extract the message of an error response ({"error": "..."})
     * @param jsonData The JSON body
     * @param statusCode HTTP status of the response
     * @return Server message, or a generic status description
     */
    static std::string extractErrorMessage(const std::string& jsonData, long statusCode);

    /**
     * @brief Build the JSON body of a create request
     *
     * Parameter values are sent as booleans or numbers when they parse as one.
     * "stop" and any parameter given more than once become arrays.
     */
    static std::string createPayload(const CreateRequest& request);

    /**
     * @brief Decode one streamed progress line
     * @param line One JSON object
     * @param update Output: decoded status
     * @param errorMessage Output: the server's error, or a parse failure
     * @return False if the line carries an error or is not valid JSON
     */
    static bool parseProgressLine(const std::string& line, ProgressUpdate& update, std::string& errorMessage);

    /**
     * @brief Describe a failed push
     * @param statusCode HTTP status of the response (0 for an error inside the stream)
     * @param serverMessage Message reported by the server
     */
    static std::string pushErrorMessage(long statusCode, const std::string& serverMessage);

    /**
     * @brief Where a pushed model can be found
     * @return An ollama.com page for the default registry, otherwise the name itself
     */
    static std::string pushDestination(const std::string& modelName);

    /**
     * @brief Check whether a server error only says the model does not exist
     */
    static bool isModelNotFound(const std::string& serverMessage);

    /**
     * @brief Describe a failure to stop a model before deleting it
     */
    static std::string stopErrorMessage(const std::string& modelName, const std::string& serverMessage);

private:
    std::string m_baseUrl;

    std::string apiUrl(const std::string& path) const;

    /**
     * @brief POST a request whose answer is a stream of progress lines
     * @param response Output: status and error body of the response
     * @return False on transport failure, a non-2xx status or an error line
     */
    bool streamProgress(const std::string& path, const std::string& payload, const ProgressCallback& onProgress,
                        HttpResponse& response, std::string& errorMessage) const;
};

#endif // MODEL_CLIENT_H
