#ifndef MODELFILE_H
#define MODELFILE_H

#include <string>
#include <utility>
#include <vector>
#include "model_description.h"

/**
 * @brief Ordered model parameters as (name, value) pairs; a name may repeat (e.g. "stop")
 */
using ParameterList = std::vector<std::pair<std::string, std::string>>;

/**
 * @brief Everything needed to ask the server to create a model
 */
struct CreateRequest {
    std::string model;                  ///< Name of the model to create
    std::string from;                   ///< Existing model the new one is based on
    ParameterList parameters;
    std::string system;
    std::string templateText;
    std::vector<std::string> licenses;
    std::vector<ChatMessage> messages;
};

/**
 * @brief Reading Modelfiles and building create requests
 *
 * A Modelfile holds one instruction per line:
 *
 *     # comment
 *     FROM llama3.2
 *     PARAMETER temperature 0.7
 *     SYSTEM """You are
 *     a pirate."""
 *     MESSAGE user Hello
 *
 * Instructions are case insensitive. Values may be wrapped in "..." or,
 * to span lines, in """...""".
 */
class Modelfile {
public:
    /// File name used when no --file option is given
    static const char* DEFAULT_NAME;

    /**
     * @brief Locate the Modelfile to read
     * @param requested Path given on the command line, empty for DEFAULT_NAME
     * @param workingDirectory Directory relative paths are resolved against
     * @param path Output: absolute path of the file, empty on failure
     * @param errorMessage Output: reason for failure
     * @return True if the file exists and is a regular file
     */
    static bool resolvePath(const std::string& requested, const std::string& workingDirectory,
                            std::string& path, std::string& errorMessage);

    /**
     * @brief Parse Modelfile text into a create request
     *
     * The request's model name is left untouched.
     *
     * @param text Contents of the Modelfile
     * @param request Output: from, parameters, system, template, licenses and messages
     * @param errorMessage Output: reason for failure, prefixed with the line number
     * @return True on success
     */
    static bool parse(const std::string& text, CreateRequest& request, std::string& errorMessage);

    /**
     * @brief Read and parse a Modelfile
     * @param path Path of the Modelfile
     * @param request Output: parsed request
     * @param errorMessage Output: reason for failure
     * @return True on success
     */
    static bool load(const std::string& path, CreateRequest& request, std::string& errorMessage);

    /**
     * @brief Build the request that saves a copy of an existing model under a new name
     *
     * The copy is based on the parent of the source model when it has one that
     * is a model name, otherwise on the source model itself.
     */
    static CreateRequest derivedRequest(const std::string& name, const std::string& sourceModel,
                                        const std::string& parentModel, const std::string& system,
                                        const ParameterList& parameters,
                                        const std::vector<ChatMessage>& messages);

    /**
     * @brief Split the "key value" lines of a show response into parameters
     *
     * Values wrapped in double quotes are unquoted.
     */
    static ParameterList parseParameterText(const std::string& text);

    /**
     * @brief Check whether a FROM value names a file instead of a model
     * @return True for absolute, relative, home-relative and drive letter paths
     */
    static bool isFilePath(const std::string& value);
};

#endif // MODELFILE_H
