#ifndef HTTP_CLIENT_H
#define HTTP_CLIENT_H

#include <functional>
#include <string>
#include <vector>

/**
 * @brief Structure to hold HTTP response data
 */
struct HttpResponse {
    std::string data;       ///< Response body
    long statusCode = 0;    ///< HTTP status code, 0 if no response was received
    std::string error;      ///< Transport error description, empty on success

    /**
     * @brief Check whether a response with a 2xx status arrived
     */
    bool ok() const { return error.empty() && statusCode >= 200 && statusCode < 300; }
};

/**
 * @brief HTTP client for talking to the model server using libcurl
 */
class HttpClient {
public:
    /**
     * @brief Initialize the HTTP client (calls curl_global_init)
     */
    static void initialize();

    /**
     * @brief Cleanup the HTTP client (calls curl_global_cleanup)
     */
    static void cleanup();

    /**
     * @brief Set the timeout applied to every request
     * @param seconds Timeout in seconds
     */
    static void setTimeout(long seconds);

    /**
     * @brief Make a GET request to the specified URL
     * @param url The URL to request
     * @param response Reference to HttpResponse object to store the response
     * @return true if a response was received (any status), false on transport failure
     */
    static bool get(const std::string& url, HttpResponse& response);

    /**
     * @brief Make a POST request with a JSON payload
     * @param url The URL to request
     * @param payload JSON payload to send
     * @param response Reference to HttpResponse object to store the response
     * @return true if a response was received (any status), false on transport failure
     */
    static bool post(const std::string& url, const std::string& payload, HttpResponse& response);

    /**
     * @brief Make a DELETE request with a JSON payload
     * @param url The URL to request
     * @param payload JSON payload to send
     * @param response Reference to HttpResponse object to store the response
     * @return true if a response was received (any status), false on transport failure
     */
    static bool del(const std::string& url, const std::string& payload, HttpResponse& response);

    /**
     * @brief Make a POST request whose 2xx body is a stream of newline separated JSON objects
     *
     * Each complete line of a successful response is passed to lineCallback as it
     * arrives. The request timeout does not apply, only the connect timeout.
     * The body of a non-2xx response is not split; it is left in response.data.
     *
     * @param url The URL to request
     * @param payload JSON payload to send
     * @param lineCallback Called for every non-empty line
     * @param response Reference to HttpResponse object to store the status and error body
     * @return true if a response was received (any status), false on transport failure
     */
    static bool postStream(const std::string& url, const std::string& payload,
                           const std::function<void(const std::string&)>& lineCallback,
                           HttpResponse& response);

private:
    static long s_timeoutSeconds;
    static const char* USER_AGENT;

    /**
     * @brief Perform a request and fill in the response
     * @param method "GET", "POST" or "DELETE"
     * @param url The URL to request
     * @param payload Request body (POST and DELETE only)
     * @param headers Custom headers (format: "Header: Value")
     * @param lineCallback If set, 2xx bodies are split into lines and passed here
     * @param response Reference to HttpResponse object to store the response
     * @return true if a response was received, false on transport failure
     */
    static bool perform(const std::string& method, const std::string& url, const std::string& payload,
                        const std::vector<std::string>& headers,
                        const std::function<void(const std::string&)>* lineCallback,
                        HttpResponse& response);

    /**
     * @brief Callback function for libcurl to write response data
     */
    static size_t writeCallback(void* contents, size_t size, size_t nmemb, void* userp);

    /**
     * @brief Callback function for libcurl that splits a successful body into lines
     */
    static size_t streamingWriteCallback(void* contents, size_t size, size_t nmemb, void* userp);
};

#endif // HTTP_CLIENT_H
