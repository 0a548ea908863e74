#include "http_client.h"
#include "version.h"
#include <curl/curl.h>

namespace {

// State shared with the streaming write callback
struct StreamingData {
    CURL* curl = nullptr;
    const std::function<void(const std::string&)>* callback = nullptr;
    HttpResponse* response = nullptr;
    std::string buffer;
};

bool isSuccessStatus(CURL* curl) {
    long statusCode = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &statusCode);
    return statusCode >= 200 && statusCode < 300;
}

void emitLine(StreamingData* data, std::string line) {
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    if (!line.empty()) {
        (*data->callback)(line);
    }
}

} // namespace

long HttpClient::s_timeoutSeconds = 30;
const char* HttpClient::USER_AGENT = "modelctl/" MODELCTL_VERSION;

void HttpClient::initialize() {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

void HttpClient::cleanup() {
    curl_global_cleanup();
}

void HttpClient::setTimeout(long seconds) {
    if (seconds > 0) {
        s_timeoutSeconds = seconds;
    }
}

size_t HttpClient::writeCallback(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t realsize = size * nmemb;
    HttpResponse* response = static_cast<HttpResponse*>(userp);
    response->data.append(static_cast<char*>(contents), realsize);
    return realsize;
}

size_t HttpClient::streamingWriteCallback(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t realsize = size * nmemb;
    StreamingData* data = static_cast<StreamingData*>(userp);

    // Error bodies are kept whole for the caller to decode
    if (!isSuccessStatus(data->curl)) {
        data->response->data.append(static_cast<char*>(contents), realsize);
        return realsize;
    }

    data->buffer.append(static_cast<char*>(contents), realsize);
    size_t pos = 0;
    while ((pos = data->buffer.find('\n')) != std::string::npos) {
        std::string line = data->buffer.substr(0, pos);
        data->buffer.erase(0, pos + 1);
        emitLine(data, line);
    }
    return realsize;
}

bool HttpClient::get(const std::string& url, HttpResponse& response) {
    return perform("GET", url, "", {}, nullptr, response);
}

bool HttpClient::post(const std::string& url, const std::string& payload, HttpResponse& response) {
    return perform("POST", url, payload, {"Content-Type: application/json"}, nullptr, response);
}

bool HttpClient::del(const std::string& url, const std::string& payload, HttpResponse& response) {
    return perform("DELETE", url, payload, {"Content-Type: application/json"}, nullptr, response);
}

bool HttpClient::postStream(const std::string& url, const std::string& payload,
                            const std::function<void(const std::string&)>& lineCallback,
                            HttpResponse& response) {
    return perform("POST", url, payload, {"Content-Type: application/json"}, &lineCallback, response);
}

bool HttpClient::perform(const std::string& method, const std::string& url, const std::string& payload,
                         const std::vector<std::string>& headers,
                         const std::function<void(const std::string&)>* lineCallback,
                         HttpResponse& response) {
    // Clear any previous response data
    response.data.clear();
    response.statusCode = 0;
    response.error.clear();

    CURL* curl = curl_easy_init();
    if (!curl) {
        response.error = "failed to initialize HTTP client";
        return false;
    }

    StreamingData streamData;
    streamData.curl = curl;
    streamData.callback = lineCallback;
    streamData.response = &response;

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    if (lineCallback) {
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, streamingWriteCallback);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &streamData);
        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, s_timeoutSeconds);
    } else {
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response);
        curl_easy_setopt(curl, CURLOPT_TIMEOUT, s_timeoutSeconds);
    }
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, USER_AGENT);

    if (method == "DELETE") {
        curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, "DELETE");
    }
    if (method == "POST" || method == "DELETE") {
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, payload.c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(payload.size()));
    }

    struct curl_slist* headerList = nullptr;
    for (const auto& header : headers) {
        headerList = curl_slist_append(headerList, header.c_str());
    }
    if (headerList) {
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headerList);
    }

    CURLcode res = curl_easy_perform(curl);

    if (headerList) {
        curl_slist_free_all(headerList);
    }

    if (res != CURLE_OK) {
        response.error = curl_easy_strerror(res);
        curl_easy_cleanup(curl);
        return false;
    }

    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.statusCode);
    // A last line without a newline
    if (lineCallback && response.ok() && !streamData.buffer.empty()) {
        emitLine(&streamData, streamData.buffer);
    }
    curl_easy_cleanup(curl);
    return true;
}
