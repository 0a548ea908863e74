#include "modelfile.h"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

const char* Modelfile::DEFAULT_NAME = "Modelfile";

namespace {

const char* WHITESPACE = " \t\r";
const std::string TRIPLE_QUOTE = "\"\"\"";

std::string trim(const std::string& text) {
    size_t begin = text.find_first_not_of(WHITESPACE);
    if (begin == std::string::npos) {
        return "";
    }
    size_t end = text.find_last_not_of(WHITESPACE);
    return text.substr(begin, end - begin + 1);
}

std::string toLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

std::string toUpper(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return text;
}

std::vector<std::string> splitLines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream stream(text);
    std::string line;
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        lines.push_back(line);
    }
    return lines;
}

// "word rest of line" -> "word", "rest of line"
void splitWord(const std::string& text, std::string& word, std::string& rest) {
    size_t end = text.find_first_of(WHITESPACE);
    if (end == std::string::npos) {
        word = text;
        rest.clear();
        return;
    }
    word = text.substr(0, end);
    rest = trim(text.substr(end));
}

// "..." with \" and \\ escapes
bool unquote(const std::string& text, std::string& value, std::string& errorMessage) {
    value.clear();
    for (size_t i = 1; i < text.size(); ++i) {
        char c = text[i];
        if (c == '\\' && i + 1 < text.size() && (text[i + 1] == '"' || text[i + 1] == '\\')) {
            value += text[++i];
        } else if (c == '"') {
            if (!trim(text.substr(i + 1)).empty()) {
                errorMessage = "unexpected text after closing quote";
                return false;
            }
            return true;
        } else {
            value += c;
        }
    }
    errorMessage = "unterminated quoted string";
    return false;
}

bool closeTripleQuote(const std::string& line, size_t end, std::string& value, std::string& errorMessage) {
    value += line.substr(0, end);
    if (!trim(line.substr(end + TRIPLE_QUOTE.size())).empty()) {
        errorMessage = "unexpected text after closing " + TRIPLE_QUOTE;
        return false;
    }
    return true;
}

// Reads the value starting on lines[index]; a """ value advances index to its closing line
bool readValue(const std::vector<std::string>& lines, size_t& index, const std::string& text,
               std::string& value, std::string& errorMessage) {
    value.clear();

    if (text.compare(0, TRIPLE_QUOTE.size(), TRIPLE_QUOTE) == 0) {
        std::string body = text.substr(TRIPLE_QUOTE.size());
        size_t end = body.find(TRIPLE_QUOTE);
        if (end != std::string::npos) {
            return closeTripleQuote(body, end, value, errorMessage);
        }
        value = body;
        while (++index < lines.size()) {
            value += "\n";
            end = lines[index].find(TRIPLE_QUOTE);
            if (end != std::string::npos) {
                return closeTripleQuote(lines[index], end, value, errorMessage);
            }
            value += lines[index];
        }
        errorMessage = "unterminated " + TRIPLE_QUOTE + " string";
        return false;
    }

    if (!text.empty() && text[0] == '"') {
        return unquote(text, value, errorMessage);
    }

    value = text;
    return true;
}

bool isMessageRole(const std::string& role) {
    return role == "system" || role == "user" || role == "assistant";
}

} // namespace

bool Modelfile::resolvePath(const std::string& requested, const std::string& workingDirectory,
                            std::string& path, std::string& errorMessage) {
    path.clear();

    fs::path candidate = requested.empty() ? fs::path(DEFAULT_NAME) : fs::path(requested);
    if (candidate.is_relative()) {
        candidate = fs::path(workingDirectory) / candidate;
    }
    candidate = candidate.lexically_normal();

    std::error_code ec;
    fs::file_status status = fs::status(candidate, ec);
    if (!fs::exists(status)) {
        errorMessage = "Modelfile not found: " + candidate.string();
        return false;
    }
    if (fs::is_directory(status)) {
        errorMessage = "Modelfile is a directory: " + candidate.string();
        return false;
    }

    path = candidate.string();
    return true;
}

bool Modelfile::parse(const std::string& text, CreateRequest& request, std::string& errorMessage) {
    request.from.clear();
    request.parameters.clear();
    request.system.clear();
    request.templateText.clear();
    request.licenses.clear();
    request.messages.clear();

    std::vector<std::string> lines = splitLines(text);
    for (size_t i = 0; i < lines.size(); ++i) {
        std::string line = trim(lines[i]);
        if (line.empty() || line[0] == '#') {
            continue;
        }

        const size_t lineNumber = i + 1;
        std::string word;
        std::string rest;
        splitWord(line, word, rest);
        const std::string instruction = toUpper(word);

        std::string failure;
        std::string value;
        if (instruction == "PARAMETER" || instruction == "MESSAGE") {
            std::string key;
            std::string valueText;
            splitWord(rest, key, valueText);
            key = toLower(key);
            if (key.empty()) {
                failure = "missing name for " + instruction;
            } else if (readValue(lines, i, valueText, value, failure)) {
                if (value.empty()) {
                    failure = "missing value for " + instruction + " " + key;
                } else if (instruction == "PARAMETER") {
                    request.parameters.emplace_back(key, value);
                } else if (!isMessageRole(key)) {
                    failure = "unknown message role \"" + key + "\"";
                } else {
                    request.messages.push_back({key, value});
                }
            }
        } else if (instruction == "FROM" || instruction == "SYSTEM" || instruction == "TEMPLATE" ||
                   instruction == "LICENSE") {
            if (readValue(lines, i, rest, value, failure)) {
                if (value.empty()) {
                    failure = "missing value for " + instruction;
                } else if (instruction == "FROM") {
                    if (!request.from.empty()) {
                        failure = "FROM given more than once";
                    }
                    request.from = value;
                } else if (instruction == "SYSTEM") {
                    request.system = value;
                } else if (instruction == "TEMPLATE") {
                    request.templateText = value;
                } else {
                    request.licenses.push_back(value);
                }
            }
        } else if (instruction == "ADAPTER") {
            failure = "ADAPTER is not supported";
        } else {
            failure = "unknown instruction \"" + word + "\"";
        }

        if (!failure.empty()) {
            errorMessage = "line " + std::to_string(lineNumber) + ": " + failure;
            return false;
        }
    }

    if (request.from.empty()) {
        errorMessage = "no FROM line in Modelfile";
        return false;
    }
    if (isFilePath(request.from)) {
        errorMessage = "FROM " + request.from + ": creating a model from local files is not supported";
        return false;
    }
    return true;
}

bool Modelfile::load(const std::string& path, CreateRequest& request, std::string& errorMessage) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        errorMessage = "failed to open " + path;
        return false;
    }

    std::ostringstream contents;
    contents << file.rdbuf();
    if (file.bad()) {
        errorMessage = "failed to read " + path;
        return false;
    }

    if (!parse(contents.str(), request, errorMessage)) {
        errorMessage = path + ": " + errorMessage;
        return false;
    }
    return true;
}

CreateRequest Modelfile::derivedRequest(const std::string& name, const std::string& sourceModel,
                                        const std::string& parentModel, const std::string& system,
                                        const ParameterList& parameters,
                                        const std::vector<ChatMessage>& messages) {
    CreateRequest request;
    request.model = name;
    request.from = (!parentModel.empty() && !isFilePath(parentModel)) ? parentModel : sourceModel;
    request.system = system;
    request.parameters = parameters;
    request.messages = messages;
    return request;
}

ParameterList Modelfile::parseParameterText(const std::string& text) {
    ParameterList parameters;
    for (const auto& rawLine : splitLines(text)) {
        std::string key;
        std::string value;
        splitWord(trim(rawLine), key, value);
        if (key.empty() || value.empty()) {
            continue;
        }

        std::string unquoted;
        std::string ignored;
        if (value.size() >= 2 && value[0] == '"' && unquote(value, unquoted, ignored)) {
            value = unquoted;
        }
        parameters.emplace_back(key, value);
    }
    return parameters;
}

bool Modelfile::isFilePath(const std::string& value) {
    if (value.empty()) {
        return false;
    }
    if (value[0] == '/' || value[0] == '.' || value[0] == '~') {
        return true;
    }
    if (value.find('\\') != std::string::npos) {
        return true;
    }
    // Drive letter, e.g. "D:/models"
    return value.size() >= 3 && std::isalpha(static_cast<unsigned char>(value[0])) && value[1] == ':' &&
           value[2] == '/';
}
