#include "model_client.h"
#include "http_client.h"
#include "number_format.h"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <charconv>
#include <map>

using json = nlohmann::json;

namespace {

std::string stringField(const json& object, const char* key) {
    if (object.contains(key) && object[key].is_string()) {
        return object[key].get<std::string>();
    }
    return "";
}

std::string elementText(const json& element) {
    if (element.is_string()) {
        return element.get<std::string>();
    }
    if (element.is_boolean()) {
        return element.get<bool>() ? "true" : "false";
    }
    if (element.is_number()) {
        return NumberFormat::formatGeneral(element.get<double>());
    }
    return element.dump();
}

// Arrays become "[a b c]"; null entries carry no value and are skipped
bool toMetadataValue(const json& value, MetadataValue& result) {
    if (value.is_string()) {
        result = MetadataValue(value.get<std::string>());
    } else if (value.is_boolean()) {
        result = MetadataValue(value.get<bool>());
    } else if (value.is_number()) {
        result = MetadataValue(value.get<double>());
    } else if (value.is_array()) {
        std::string text = "[";
        bool first = true;
        for (const auto& element : value) {
            if (!first) {
                text += " ";
            }
            text += elementText(element);
            first = false;
        }
        text += "]";
        result = MetadataValue(text);
    } else if (value.is_object()) {
        result = MetadataValue(value.dump());
    } else {
        return false;
    }
    return true;
}

MetadataMap parseMetadata(const json& object) {
    MetadataMap metadata;
    if (!object.is_object()) {
        return metadata;
    }
    for (auto it = object.begin(); it != object.end(); ++it) {
        MetadataValue value;
        if (toMetadataValue(it.value(), value)) {
            metadata[it.key()] = value;
        }
    }
    return metadata;
}

// Booleans and numbers are sent typed, anything else as a string
json parameterValue(const std::string& value) {
    if (value == "true") {
        return true;
    }
    if (value == "false") {
        return false;
    }
    if (!value.empty() && (std::isdigit(static_cast<unsigned char>(value[0])) || value[0] == '-')) {
        const char* first = value.data();
        const char* last = value.data() + value.size();

        long long integer = 0;
        auto intResult = std::from_chars(first, last, integer);
        if (intResult.ec == std::errc() && intResult.ptr == last) {
            return integer;
        }

        double number = 0.0;
        auto doubleResult = std::from_chars(first, last, number);
        if (doubleResult.ec == std::errc() && doubleResult.ptr == last) {
            return number;
        }
    }
    return value;
}

long long integerField(const json& object, const char* key) {
    if (object.contains(key) && object[key].is_number()) {
        return object[key].get<long long>();
    }
    return 0;
}

bool containsText(const std::string& text, const char* fragment) {
    return text.find(fragment) != std::string::npos;
}

} // namespace

ModelClient::ModelClient(const std::string& baseUrl) : m_baseUrl(baseUrl) {
    while (!m_baseUrl.empty() && m_baseUrl.back() == '/') {
        m_baseUrl.pop_back();
    }
}

std::string ModelClient::apiUrl(const std::string& path) const {
    return m_baseUrl + "/api" + path;
}

bool ModelClient::isServerRunning() const {
    HttpResponse response;
    return HttpClient::get(apiUrl("/version"), response) && response.ok();
}

bool ModelClient::getVersion(std::string& version, std::string& errorMessage) const {
    HttpResponse response;
    if (!HttpClient::get(apiUrl("/version"), response)) {
        errorMessage = "could not connect to " + m_baseUrl + ": " + response.error;
        return false;
    }
    if (!response.ok()) {
        errorMessage = extractErrorMessage(response.data, response.statusCode);
        return false;
    }

    try {
        json parsedJson = json::parse(response.data);
        version = stringField(parsedJson, "version");
    } catch (const json::exception& e) {
        errorMessage = std::string("invalid version response: ") + e.what();
        return false;
    }
    return true;
}

bool ModelClient::showModel(const std::string& modelName, bool verbose,
                            ModelDescription& description, std::string& errorMessage) const {
    if (modelName.empty()) {
        errorMessage = "model name is required";
        return false;
    }

    json payload;
    payload["model"] = modelName;
    payload["verbose"] = verbose;

    HttpResponse response;
    if (!HttpClient::post(apiUrl("/show"), payload.dump(), response)) {
        errorMessage = "could not connect to " + m_baseUrl + ": " + response.error;
        return false;
    }
    if (!response.ok()) {
        errorMessage = extractErrorMessage(response.data, response.statusCode);
        return false;
    }

    return parseShowResponse(response.data, description, errorMessage);
}

bool ModelClient::listModels(std::vector<ModelSummary>& models, std::string& errorMessage) const {
    HttpResponse response;
    if (!HttpClient::get(apiUrl("/tags"), response)) {
        errorMessage = "could not connect to " + m_baseUrl + ": " + response.error;
        return false;
    }
    if (!response.ok()) {
        errorMessage = extractErrorMessage(response.data, response.statusCode);
        return false;
    }

    return parseModelList(response.data, models, errorMessage);
}

bool ModelClient::streamProgress(const std::string& path, const std::string& payload,
                                 const ProgressCallback& onProgress, HttpResponse& response,
                                 std::string& errorMessage) const {
    std::string streamError;
    bool received = HttpClient::postStream(apiUrl(path), payload, [&](const std::string& line) {
        if (!streamError.empty()) {
            return;
        }
        ProgressUpdate update;
        if (parseProgressLine(line, update, streamError) && onProgress) {
            onProgress(update);
        }
    }, response);

    if (!received) {
        errorMessage = "could not connect to " + m_baseUrl + ": " + response.error;
        return false;
    }
    if (!response.ok()) {
        errorMessage = extractErrorMessage(response.data, response.statusCode);
        return false;
    }
    if (!streamError.empty()) {
        errorMessage = streamError;
        return false;
    }
    return true;
}

bool ModelClient::createModel(const CreateRequest& request, const ProgressCallback& onProgress,
                              std::string& errorMessage) const {
    if (request.model.empty()) {
        errorMessage = "model name is required";
        return false;
    }

    HttpResponse response;
    return streamProgress("/create", createPayload(request), onProgress, response, errorMessage);
}

bool ModelClient::pushModel(const std::string& modelName, bool insecure, const ProgressCallback& onProgress,
                            std::string& errorMessage) const {
    if (modelName.empty()) {
        errorMessage = "model name is required";
        return false;
    }

    json payload;
    payload["model"] = modelName;
    payload["insecure"] = insecure;
    payload["stream"] = true;

    HttpResponse response;
    if (!streamProgress("/push", payload.dump(), onProgress, response, errorMessage)) {
        if (response.error.empty()) {
            errorMessage = pushErrorMessage(response.ok() ? 0 : response.statusCode, errorMessage);
        }
        return false;
    }
    return true;
}

bool ModelClient::unloadModel(const std::string& modelName, std::string& errorMessage) const {
    // An empty generate request with keep_alive 0 evicts the model
    json payload;
    payload["model"] = modelName;
    payload["keep_alive"] = 0;
    payload["stream"] = false;

    HttpResponse response;
    if (!HttpClient::post(apiUrl("/generate"), payload.dump(), response)) {
        errorMessage = "could not connect to " + m_baseUrl + ": " + response.error;
        return false;
    }
    if (!response.ok()) {
        errorMessage = extractErrorMessage(response.data, response.statusCode);
        return false;
    }
    return true;
}

bool ModelClient::deleteModel(const std::string& modelName, std::string& errorMessage) const {
    if (modelName.empty()) {
        errorMessage = "model name is required";
        return false;
    }

    std::string stopError;
    if (!unloadModel(modelName, stopError) && !isModelNotFound(stopError)) {
        errorMessage = stopErrorMessage(modelName, stopError);
        return false;
    }

    json payload;
    payload["model"] = modelName;

    HttpResponse response;
    if (!HttpClient::del(apiUrl("/delete"), payload.dump(), response)) {
        errorMessage = "could not connect to " + m_baseUrl + ": " + response.error;
        return false;
    }
    if (!response.ok()) {
        errorMessage = extractErrorMessage(response.data, response.statusCode);
        return false;
    }
    return true;
}

bool ModelClient::parseShowResponse(const std::string& jsonData, ModelDescription& description,
                                    std::string& errorMessage) {
    description = ModelDescription();

    try {
        json parsedJson = json::parse(jsonData);
        if (!parsedJson.is_object()) {
            errorMessage = "unexpected show response: not a JSON object";
            return false;
        }

        if (parsedJson.contains("details") && parsedJson["details"].is_object()) {
            const json& details = parsedJson["details"];
            description.details.family = stringField(details, "family");
            description.details.parameterSize = stringField(details, "parameter_size");
            description.details.quantizationLevel = stringField(details, "quantization_level");
            description.details.format = stringField(details, "format");
            description.details.parentModel = stringField(details, "parent_model");
        }

        if (parsedJson.contains("model_info")) {
            description.modelInfo = parseMetadata(parsedJson["model_info"]);
        }
        if (parsedJson.contains("projector_info")) {
            description.projectorInfo = parseMetadata(parsedJson["projector_info"]);
        }

        description.parameters = stringField(parsedJson, "parameters");
        description.system = stringField(parsedJson, "system");
        description.license = stringField(parsedJson, "license");
        description.modifiedAt = stringField(parsedJson, "modified_at");

        if (parsedJson.contains("tensors") && parsedJson["tensors"].is_array()) {
            for (const auto& tensorJson : parsedJson["tensors"]) {
                if (!tensorJson.is_object()) {
                    continue;
                }
                TensorInfo tensor;
                tensor.name = stringField(tensorJson, "name");
                tensor.type = stringField(tensorJson, "type");
                if (tensorJson.contains("shape") && tensorJson["shape"].is_array()) {
                    for (const auto& dim : tensorJson["shape"]) {
                        // Dimensions are unsigned; negative or fractional values are dropped
                        if (dim.is_number_unsigned()) {
                            tensor.shape.push_back(dim.get<std::uint64_t>());
                        }
                    }
                }
                description.tensors.push_back(tensor);
            }
        }

        if (parsedJson.contains("messages") && parsedJson["messages"].is_array()) {
            for (const auto& messageJson : parsedJson["messages"]) {
                if (!messageJson.is_object()) {
                    continue;
                }
                description.messages.push_back({stringField(messageJson, "role"),
                                                stringField(messageJson, "content")});
            }
        }

        if (parsedJson.contains("capabilities") && parsedJson["capabilities"].is_array()) {
            for (const auto& capabilityJson : parsedJson["capabilities"]) {
                if (!capabilityJson.is_string()) {
                    continue;
                }
                std::string capability = capabilityJson.get<std::string>();
                std::transform(capability.begin(), capability.end(), capability.begin(),
                               [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
                description.capabilities.push_back(capability);
            }
        }
    } catch (const json::exception& e) {
        errorMessage = std::string("failed to parse show response: ") + e.what();
        return false;
    }

    return true;
}

bool ModelClient::parseModelList(const std::string& jsonData, std::vector<ModelSummary>& models,
                                 std::string& errorMessage) {
    models.clear();

    try {
        json parsedJson = json::parse(jsonData);
        if (!parsedJson.is_object()) {
            errorMessage = "unexpected model list response: not a JSON object";
            return false;
        }

        if (parsedJson.contains("models") && parsedJson["models"].is_array()) {
            for (const auto& modelJson : parsedJson["models"]) {
                ModelSummary model;
                model.name = stringField(modelJson, "name");
                if (model.name.empty()) {
                    model.name = stringField(modelJson, "model");
                }
                model.digest = stringField(modelJson, "digest");
                model.modifiedAt = stringField(modelJson, "modified_at");
                if (modelJson.contains("size") && modelJson["size"].is_number()) {
                    model.size = modelJson["size"].get<long long>();
                }
                models.push_back(model);
            }
        }
    } catch (const json::exception& e) {
        errorMessage = std::string("failed to parse model list: ") + e.what();
        return false;
    }

    return true;
}

std::string ModelClient::extractErrorMessage(const std::string& jsonData, long statusCode) {
    try {
        json parsedJson = json::parse(jsonData);
        std::string message = stringField(parsedJson, "error");
        if (!message.empty()) {
            return message;
        }
    } catch (const json::exception&) {
        // Not JSON; fall back to the raw body below
    }

    std::string body = jsonData;
    while (!body.empty() && std::isspace(static_cast<unsigned char>(body.back()))) {
        body.pop_back();
    }
    if (!body.empty()) {
        return body;
    }
    return "server returned HTTP status " + std::to_string(statusCode);
}

std::string ModelClient::createPayload(const CreateRequest& request) {
    json payload;
    payload["model"] = request.model;
    payload["from"] = request.from;
    payload["stream"] = true;

    if (!request.system.empty()) {
        payload["system"] = request.system;
    }
    if (!request.templateText.empty()) {
        payload["template"] = request.templateText;
    }
    if (request.licenses.size() == 1) {
        payload["license"] = request.licenses.front();
    } else if (request.licenses.size() > 1) {
        payload["license"] = request.licenses;
    }

    if (!request.parameters.empty()) {
        std::map<std::string, int> counts;
        for (const auto& parameter : request.parameters) {
            ++counts[parameter.first];
        }

        json parameters = json::object();
        for (const auto& parameter : request.parameters) {
            const std::string& name = parameter.first;
            if (name == "stop") {
                parameters[name].push_back(parameter.second);
            } else if (counts[name] > 1) {
                parameters[name].push_back(parameterValue(parameter.second));
            } else {
                parameters[name] = parameterValue(parameter.second);
            }
        }
        payload["parameters"] = parameters;
    }

    if (!request.messages.empty()) {
        json messages = json::array();
        for (const auto& message : request.messages) {
            messages.push_back({{"role", message.role}, {"content", message.content}});
        }
        payload["messages"] = messages;
    }

    return payload.dump();
}

bool ModelClient::parseProgressLine(const std::string& line, ProgressUpdate& update, std::string& errorMessage) {
    update = ProgressUpdate();

    try {
        json parsedJson = json::parse(line);
        if (!parsedJson.is_object()) {
            errorMessage = "unexpected progress response: not a JSON object";
            return false;
        }

        std::string serverError = stringField(parsedJson, "error");
        if (!serverError.empty()) {
            errorMessage = serverError;
            return false;
        }

        update.status = stringField(parsedJson, "status");
        update.digest = stringField(parsedJson, "digest");
        update.total = integerField(parsedJson, "total");
        update.completed = integerField(parsedJson, "completed");
    } catch (const json::exception& e) {
        errorMessage = std::string("failed to parse progress: ") + e.what();
        return false;
    }
    return true;
}

std::string ModelClient::pushErrorMessage(long statusCode, const std::string& serverMessage) {
    if (statusCode == 401 || containsText(serverMessage, "access denied")) {
        return "you are not authorized to push to this namespace, create the model under a namespace you own";
    }
    return serverMessage;
}

std::string ModelClient::pushDestination(const std::string& modelName) {
    std::string host = "registry.ollama.ai";
    std::string path = modelName;

    // A first component with a dot or a port is a registry host
    size_t slash = modelName.find('/');
    if (slash != std::string::npos) {
        std::string first = modelName.substr(0, slash);
        if (first.find('.') != std::string::npos || first.find(':') != std::string::npos) {
            host = first;
            path = modelName.substr(slash + 1);
        }
    }

    auto endsWith = [](const std::string& text, const std::string& suffix) {
        return text.size() >= suffix.size() && text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
    };
    if (!endsWith(host, ".ollama.ai") && !endsWith(host, ".ollama.com")) {
        return modelName;
    }

    const std::string libraryPrefix = "library/";
    if (path.compare(0, libraryPrefix.size(), libraryPrefix) == 0) {
        path = path.substr(libraryPrefix.size());
    }
    if (endsWith(path, ":latest")) {
        path = path.substr(0, path.size() - 7);
    }
    return "https://ollama.com/" + path;
}

bool ModelClient::isModelNotFound(const std::string& serverMessage) {
    return containsText(serverMessage, "not found");
}

std::string ModelClient::stopErrorMessage(const std::string& modelName, const std::string& serverMessage) {
    std::string message = "unable to stop existing running model \"" + modelName + "\"";
    if (!serverMessage.empty()) {
        message += ": " + serverMessage;
    }
    return message;
}
