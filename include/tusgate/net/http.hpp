#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace tusgate::net {

// HTTP methods
enum class HttpMethod {
    GET,
    POST,
    PUT,
    DELETE
};

bool is_success_status(int status);
bool is_retryable_status(int status);
bool is_auth_error_status(int status);

// False for values containing CR, LF or NUL, which would end a header line
bool is_safe_header_value(const std::string& value);

// HTTP headers (case-insensitive)
class HttpHeaders {
public:
    void set(const std::string& name, const std::string& value);
    void add(const std::string& name, const std::string& value);

    std::optional<std::string> get(const std::string& name) const;
    bool has(const std::string& name) const;

    // Iteration
    using HeaderPair = std::pair<std::string, std::string>;
    std::vector<HeaderPair> all() const;

    // Common headers
    void set_content_type(const std::string& content_type);
    void set_content_length(size_t length);
    void set_bearer_token(const std::string& token);

    std::optional<std::string> content_type() const;

private:
    // Headers stored as lowercase name -> values
    std::map<std::string, std::vector<std::string>> headers_;

    static std::string normalize_name(const std::string& name);
};

// HTTP request
struct HttpRequest {
    HttpMethod method = HttpMethod::GET;
    std::string url;
    HttpHeaders headers;
    std::vector<uint8_t> body;

    // Timeouts
    std::chrono::milliseconds connect_timeout{30000};
    std::chrono::milliseconds total_timeout{300000};  // 5 minutes default

    bool verify_ssl = true;

    // A resumable upload answers 308 without a Location; never chase it
    bool follow_redirects = true;

    // Retry options (handled by HttpClient::execute_with_retry)
    int max_retries = 3;
    std::chrono::milliseconds initial_retry_delay{1000};
    double retry_backoff_multiplier = 2.0;

    // Range request, start and end inclusive
    std::optional<std::pair<uint64_t, uint64_t>> byte_range;

    // Convenience constructors
    static HttpRequest get(const std::string& url);
    static HttpRequest post(const std::string& url, const std::vector<uint8_t>& body);
    static HttpRequest post(const std::string& url, const std::string& body);
    static HttpRequest put(const std::string& url, std::vector<uint8_t> body);
    static HttpRequest del(const std::string& url);

    // Set JSON body
    void set_json_body(const std::string& json);
};

// HTTP response
struct HttpResponse {
    int status_code = 0;
    HttpHeaders headers;
    std::vector<uint8_t> body;

    std::chrono::milliseconds total_time{0};

    bool ok() const { return is_success_status(status_code); }
    std::string body_string() const;

    // Error info (for failed requests)
    std::string error;
    bool is_network_error = false;  // True if error was network-level, not HTTP status
};

// HTTP client configuration
// Pool size and timeouts can be overridden via environment variables:
//   TUSGATE_CONNECTION_POOL_SIZE - Connections per host (default: 10)
//   TUSGATE_REQUEST_TIMEOUT - Request timeout in seconds (default: 30)
struct HttpClientConfig {
    size_t max_connections_per_host = 32;
    size_t max_total_connections = 256;

    std::chrono::milliseconds default_total_timeout{300000};

    // Response size limits (0 = unlimited)
    size_t max_response_size = 64 * 1024 * 1024;

    bool verify_ssl_by_default = true;
    std::string default_ca_bundle;

    std::string user_agent = "tusgate/1.0";

    std::chrono::seconds health_check_interval{30};

    bool verbose = false;
};

// HTTP client with connection pooling and retry logic
class HttpClient {
public:
    explicit HttpClient(const HttpClientConfig& config = {});
    ~HttpClient();

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    // Synchronous request
    HttpResponse execute(const HttpRequest& request);

    // Synchronous request with automatic retry on network errors and 429/5xx
    HttpResponse execute_with_retry(const HttpRequest& request);

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

// URL encoding/decoding
std::string url_encode(const std::string& str);
std::string url_decode(const std::string& str);

// Base64 (standard alphabet, padded)
std::string base64_encode(const std::vector<uint8_t>& data);
std::string base64_encode(const std::string& str);
std::vector<uint8_t> base64_decode(const std::string& encoded);

// Base64url (URL-safe alphabet, no padding) for JWT segments
std::string base64url_encode(const std::vector<uint8_t>& data);

} // namespace tusgate::net
