#include "tusgate/net/http.hpp"
#include "tusgate/core/constants.hpp"
#include "tusgate/core/log.hpp"
#include <curl/curl.h>
#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <condition_variable>
#include <cstdlib>
#include <cstring>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <thread>

namespace tusgate::net {

// ============================================================================
// Environment-based configuration helpers
// ============================================================================

static size_t get_connection_pool_size() {
    if (const char* env = std::getenv("TUSGATE_CONNECTION_POOL_SIZE")) {
        try {
            size_t size = std::stoul(env);
            if (size >= 1 && size <= 1000) {
                return size;
            }
            log_warn("TUSGATE_CONNECTION_POOL_SIZE=%s out of range [1,1000], using default", env);
        } catch (const std::exception&) {
            log_warn("invalid TUSGATE_CONNECTION_POOL_SIZE=%s, using default", env);
        }
    }
    return 10;
}

static std::chrono::seconds get_request_timeout() {
    if (const char* env = std::getenv("TUSGATE_REQUEST_TIMEOUT")) {
        try {
            unsigned long secs = std::stoul(env);
            if (secs >= 5 && secs <= 3600) {
                return std::chrono::seconds(secs);
            }
            log_warn("TUSGATE_REQUEST_TIMEOUT=%s out of range [5,3600], using default", env);
        } catch (const std::exception&) {
            log_warn("invalid TUSGATE_REQUEST_TIMEOUT=%s, using default", env);
        }
    }
    return std::chrono::seconds(constants::DEFAULT_HTTP_REQUEST_TIMEOUT_SECONDS);
}

// ============================================================================
// Utility functions
// ============================================================================

bool is_success_status(int status) {
    return status >= 200 && status < 300;
}

bool is_retryable_status(int status) {
    // Retry on server errors and rate limiting
    return status == 429 || status == 500 || status == 502 || status == 503 || status == 504;
}

bool is_auth_error_status(int status) {
    return status == 401 || status == 403;
}

bool is_safe_header_value(const std::string& value) {
    return value.find_first_of(std::string("\r\n\0", 3)) == std::string::npos;
}

std::string url_encode(const std::string& str) {
    std::ostringstream encoded;
    encoded << std::hex << std::uppercase;

    for (unsigned char c : str) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            encoded << c;
        } else {
            encoded << '%' << std::setw(2) << std::setfill('0') << static_cast<int>(c);
        }
    }

    return encoded.str();
}

static int hex_digit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    return -1;
}

std::string url_decode(const std::string& str) {
    std::string decoded;
    decoded.reserve(str.size());

    for (size_t i = 0; i < str.size(); ++i) {
        if (str[i] == '%' && i + 2 < str.size()) {
            int h1 = hex_digit(str[i + 1]);
            int h2 = hex_digit(str[i + 2]);
            if (h1 >= 0 && h2 >= 0) {
                int value = (h1 << 4) | h2;
                // Drop embedded NULs (%00)
                if (value != 0) {
                    decoded += static_cast<char>(value);
                }
                i += 2;
                continue;
            }
        } else if (str[i] == '+') {
            decoded += ' ';
            continue;
        }
        decoded += str[i];
    }

    return decoded;
}

static const char* base64_chars =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

std::string base64_encode(const std::vector<uint8_t>& data) {
    std::string result;
    result.reserve((data.size() + 2) / 3 * 4);

    size_t i = 0;
    while (i < data.size()) {
        uint32_t octet_a = i < data.size() ? data[i++] : 0;
        uint32_t octet_b = i < data.size() ? data[i++] : 0;
        uint32_t octet_c = i < data.size() ? data[i++] : 0;

        uint32_t triple = (octet_a << 16) + (octet_b << 8) + octet_c;

        result += base64_chars[(triple >> 18) & 0x3F];
        result += base64_chars[(triple >> 12) & 0x3F];
        result += (i > data.size() + 1) ? '=' : base64_chars[(triple >> 6) & 0x3F];
        result += (i > data.size()) ? '=' : base64_chars[triple & 0x3F];
    }

    return result;
}

std::string base64_encode(const std::string& str) {
    return base64_encode(std::vector<uint8_t>(str.begin(), str.end()));
}

std::vector<uint8_t> base64_decode(const std::string& encoded) {
    std::vector<uint8_t> result;
    result.reserve(encoded.size() * 3 / 4);

    std::vector<int> decode_table(256, -1);
    for (int i = 0; i < 64; ++i) {
        decode_table[static_cast<unsigned char>(base64_chars[i])] = i;
    }
    // Accept the URL-safe alphabet too
    decode_table['-'] = 62;
    decode_table['_'] = 63;

    uint32_t val = 0;
    int bits = 0;

    for (char c : encoded) {
        if (c == '=' || c == '\n' || c == '\r') continue;
        if (decode_table[static_cast<unsigned char>(c)] < 0) continue;

        val = (val << 6) | decode_table[static_cast<unsigned char>(c)];
        bits += 6;

        if (bits >= 8) {
            bits -= 8;
            result.push_back(static_cast<uint8_t>((val >> bits) & 0xFF));
        }
    }

    return result;
}

std::string base64url_encode(const std::vector<uint8_t>& data) {
    std::string result = base64_encode(data);
    for (auto& ch : result) {
        if (ch == '+') ch = '-';
        else if (ch == '/') ch = '_';
    }
    while (!result.empty() && result.back() == '=') result.pop_back();
    return result;
}

// ============================================================================
// HttpHeaders
// ============================================================================

std::string HttpHeaders::normalize_name(const std::string& name) {
    std::string result = name;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

void HttpHeaders::set(const std::string& name, const std::string& value) {
    headers_[normalize_name(name)] = {value};
}

void HttpHeaders::add(const std::string& name, const std::string& value) {
    headers_[normalize_name(name)].push_back(value);
}

std::optional<std::string> HttpHeaders::get(const std::string& name) const {
    auto it = headers_.find(normalize_name(name));
    if (it != headers_.end() && !it->second.empty()) {
        return it->second[0];
    }
    return std::nullopt;
}

bool HttpHeaders::has(const std::string& name) const {
    return headers_.find(normalize_name(name)) != headers_.end();
}

std::vector<HttpHeaders::HeaderPair> HttpHeaders::all() const {
    std::vector<HeaderPair> result;
    for (const auto& [name, values] : headers_) {
        for (const auto& value : values) {
            result.emplace_back(name, value);
        }
    }
    return result;
}

void HttpHeaders::set_content_type(const std::string& content_type) {
    set("Content-Type", content_type);
}

void HttpHeaders::set_content_length(size_t length) {
    set("Content-Length", std::to_string(length));
}

void HttpHeaders::set_bearer_token(const std::string& token) {
    set("Authorization", "Bearer " + token);
}

std::optional<std::string> HttpHeaders::content_type() const {
    return get("Content-Type");
}

// ============================================================================
// HttpRequest / HttpResponse
// ============================================================================

HttpRequest HttpRequest::get(const std::string& url) {
    HttpRequest req;
    req.method = HttpMethod::GET;
    req.url = url;
    return req;
}

HttpRequest HttpRequest::post(const std::string& url, const std::vector<uint8_t>& body) {
    HttpRequest req;
    req.method = HttpMethod::POST;
    req.url = url;
    req.body = body;
    return req;
}

HttpRequest HttpRequest::post(const std::string& url, const std::string& body) {
    return post(url, std::vector<uint8_t>(body.begin(), body.end()));
}

HttpRequest HttpRequest::put(const std::string& url, std::vector<uint8_t> body) {
    HttpRequest req;
    req.method = HttpMethod::PUT;
    req.url = url;
    req.body = std::move(body);
    return req;
}

HttpRequest HttpRequest::del(const std::string& url) {
    HttpRequest req;
    req.method = HttpMethod::DELETE;
    req.url = url;
    return req;
}

void HttpRequest::set_json_body(const std::string& json) {
    body = std::vector<uint8_t>(json.begin(), json.end());
    headers.set_content_type("application/json; charset=UTF-8");
}

std::string HttpResponse::body_string() const {
    return std::string(body.begin(), body.end());
}

// ============================================================================
// CURL callback functions
// ============================================================================

// Context for bounded response accumulation
struct WriteCallbackContext {
    std::vector<uint8_t>* response;
    size_t max_size;
    size_t current_size;
    bool size_exceeded;
};

static size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* ctx = static_cast<WriteCallbackContext*>(userdata);
    size_t bytes = size * nmemb;

    if (ctx->max_size > 0 && ctx->current_size + bytes > ctx->max_size) {
        ctx->size_exceeded = true;
        return 0;  // abort transfer
    }

    ctx->response->insert(ctx->response->end(), ptr, ptr + bytes);
    ctx->current_size += bytes;
    return bytes;
}

static size_t header_callback(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* headers = static_cast<HttpHeaders*>(userdata);
    size_t bytes = size * nitems;

    std::string line(buffer, bytes);

    while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
        line.pop_back();
    }

    // Skip empty lines and status line
    if (line.empty() || line.starts_with("HTTP/")) {
        return bytes;
    }

    size_t colon = line.find(':');
    if (colon != std::string::npos) {
        std::string name = line.substr(0, colon);
        std::string value = line.substr(colon + 1);

        size_t start = value.find_first_not_of(" \t");
        value = (start != std::string::npos) ? value.substr(start) : std::string();

        headers->add(name, value);
    }

    return bytes;
}

struct ReadData {
    const uint8_t* data;
    size_t size;
    size_t pos;
};

static size_t read_callback(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* rd = static_cast<ReadData*>(userdata);
    size_t max_bytes = size * nitems;
    size_t remaining = rd->size - rd->pos;
    size_t to_copy = std::min(max_bytes, remaining);

    if (to_copy > 0) {
        std::memcpy(buffer, rd->data + rd->pos, to_copy);
        rd->pos += to_copy;
    }

    return to_copy;
}

// ============================================================================
// HttpClient Implementation
// ============================================================================

class HttpClient::Impl {
public:
    explicit Impl(const HttpClientConfig& config)
        : config_(config) {
        static std::once_flag curl_init_flag;
        std::call_once(curl_init_flag, []() {
            curl_global_init(CURL_GLOBAL_ALL);
        });

        size_t env_pool_size = get_connection_pool_size();
        if (config_.max_total_connections == 256) {
            config_.max_total_connections = env_pool_size * 10;
        }
        if (config_.max_connections_per_host == 32) {
            config_.max_connections_per_host = env_pool_size;
        }

        auto env_timeout = get_request_timeout();
        if (config_.default_total_timeout == std::chrono::milliseconds{300000}) {
            config_.default_total_timeout = std::chrono::duration_cast<std::chrono::milliseconds>(env_timeout);
        }

        health_check_running_ = true;
        health_check_thread_ = std::thread([this]() { health_check_loop(); });
    }

    ~Impl() {
        shutdown();
    }

    void shutdown() {
        {
            std::lock_guard<std::mutex> lock(pool_mutex_);
            if (!health_check_running_) return;
            health_check_running_ = false;
        }
        pool_cv_.notify_all();

        if (health_check_thread_.joinable()) {
            health_check_thread_.join();
        }

        std::lock_guard<std::mutex> lock(pool_mutex_);
        for (CURL* handle : idle_handles_) {
            curl_easy_cleanup(handle);
        }
        idle_handles_.clear();
    }

private:
    CURL* acquire_handle() {
        std::lock_guard<std::mutex> lock(pool_mutex_);

        if (!idle_handles_.empty()) {
            CURL* handle = idle_handles_.back();
            idle_handles_.pop_back();
            active_handles_++;
            return handle;
        }

        if (active_handles_ < config_.max_total_connections) {
            CURL* handle = curl_easy_init();
            if (handle) {
                active_handles_++;
            }
            return handle;
        }

        return nullptr;  // At capacity
    }

    void release_handle(CURL* handle) {
        if (!handle) return;

        std::lock_guard<std::mutex> lock(pool_mutex_);
        active_handles_--;

        if (!health_check_running_) {
            curl_easy_cleanup(handle);
            return;
        }

        curl_easy_reset(handle);

        if (idle_handles_.size() < config_.max_total_connections) {
            idle_handles_.push_back(handle);
        } else {
            curl_easy_cleanup(handle);
        }
    }

    void health_check_loop() {
        while (true) {
            std::unique_lock<std::mutex> lock(pool_mutex_);
            pool_cv_.wait_for(lock, config_.health_check_interval, [this] {
                return !health_check_running_;
            });

            if (!health_check_running_) break;

            // Trim excess idle connections
            while (idle_handles_.size() > config_.max_connections_per_host) {
                CURL* handle = idle_handles_.back();
                idle_handles_.pop_back();
                curl_easy_cleanup(handle);
            }
        }
    }

public:
    HttpResponse execute(const HttpRequest& request) {
        HttpResponse response;

        CURL* curl = acquire_handle();
        if (!curl) {
            response.error = "Failed to acquire connection from pool";
            response.is_network_error = true;
            return response;
        }

        curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());

        switch (request.method) {
            case HttpMethod::GET:
                curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
                break;
            case HttpMethod::POST:
                curl_easy_setopt(curl, CURLOPT_POST, 1L);
                break;
            case HttpMethod::PUT:
                curl_easy_setopt(curl, CURLOPT_UPLOAD, 1L);
                break;
            case HttpMethod::DELETE:
                curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, "DELETE");
                break;
        }

        struct curl_slist* headers_list = nullptr;
        for (const auto& [name, value] : request.headers.all()) {
            std::string header = name + ": " + value;
            headers_list = curl_slist_append(headers_list, header.c_str());
        }
        // curl adds "Expect: 100-continue" to large PUTs; GCS does not need the round-trip
        headers_list = curl_slist_append(headers_list, "Expect:");

        if (!config_.user_agent.empty()) {
            curl_easy_setopt(curl, CURLOPT_USERAGENT, config_.user_agent.c_str());
        }

        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers_list);

        ReadData read_data{request.body.data(), request.body.size(), 0};

        if (!request.body.empty()) {
            if (request.method == HttpMethod::PUT) {
                curl_easy_setopt(curl, CURLOPT_READFUNCTION, read_callback);
                curl_easy_setopt(curl, CURLOPT_READDATA, &read_data);
                curl_easy_setopt(curl, CURLOPT_INFILESIZE_LARGE,
                                 static_cast<curl_off_t>(request.body.size()));
            } else {
                curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.data());
                curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE,
                                 static_cast<curl_off_t>(request.body.size()));
            }
        } else if (request.method == HttpMethod::PUT) {
            curl_easy_setopt(curl, CURLOPT_INFILESIZE_LARGE, static_cast<curl_off_t>(0));
        } else if (request.method == HttpMethod::POST) {
            curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, 0L);
        }

        std::vector<uint8_t> response_body;
        WriteCallbackContext write_ctx{&response_body, config_.max_response_size, 0, false};
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &write_ctx);

        curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
        curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response.headers);

        // Per-request timeouts win unless left at the struct defaults
        auto total_timeout = request.total_timeout == std::chrono::milliseconds{300000}
            ? config_.default_total_timeout : request.total_timeout;
        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS,
                         static_cast<long>(request.connect_timeout.count()));
        curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS,
                         static_cast<long>(total_timeout.count()));

        bool ssl_verify_enabled = request.verify_ssl && config_.verify_ssl_by_default;
        if (!ssl_verify_enabled) {
            static std::once_flag ssl_warning_flag;
            std::call_once(ssl_warning_flag, []() {
                log_warn("SSL verification disabled via configuration. "
                         "This exposes backend connections to man-in-the-middle attacks.");
            });
        }
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, ssl_verify_enabled ? 1L : 0L);
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, ssl_verify_enabled ? 2L : 0L);

        if (!config_.default_ca_bundle.empty()) {
            curl_easy_setopt(curl, CURLOPT_CAINFO, config_.default_ca_bundle.c_str());
        }

        std::string range;
        if (request.byte_range) {
            range = std::to_string(request.byte_range->first) + "-" +
                    std::to_string(request.byte_range->second);
            curl_easy_setopt(curl, CURLOPT_RANGE, range.c_str());
        }

        if (request.follow_redirects) {
            curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
            curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 10L);
        } else {
            curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 0L);
        }

        if (config_.verbose) {
            curl_easy_setopt(curl, CURLOPT_VERBOSE, 1L);
        }

        auto start_time = std::chrono::steady_clock::now();
        CURLcode res = curl_easy_perform(curl);
        auto end_time = std::chrono::steady_clock::now();

        response.total_time = std::chrono::duration_cast<std::chrono::milliseconds>(
            end_time - start_time);

        if (write_ctx.size_exceeded) {
            response.error = "Response body exceeded maximum size limit of " +
                             std::to_string(config_.max_response_size) + " bytes";
            response.status_code = 413;
        } else if (res == CURLE_OK) {
            long status = 0;
            curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
            response.status_code = static_cast<int>(status);
            response.body = std::move(response_body);
        } else {
            response.error = curl_easy_strerror(res);
            response.is_network_error = true;
        }

        curl_slist_free_all(headers_list);
        release_handle(curl);

        return response;
    }

    HttpResponse execute_with_retry(const HttpRequest& request) {
        int retries = 0;
        auto delay = request.initial_retry_delay;

        while (true) {
            HttpResponse response = execute(request);

            if (!response.is_network_error && !is_retryable_status(response.status_code)) {
                return response;
            }

            if (retries >= request.max_retries) {
                return response;
            }

            std::this_thread::sleep_for(delay);

            delay = std::chrono::milliseconds(
                static_cast<long>(delay.count() * request.retry_backoff_multiplier));
            retries++;
        }
    }

private:
    HttpClientConfig config_;

    // Connection pool
    std::mutex pool_mutex_;
    std::condition_variable pool_cv_;
    std::vector<CURL*> idle_handles_;
    size_t active_handles_ = 0;
    std::atomic<bool> health_check_running_{false};
    std::thread health_check_thread_;
};

// ============================================================================
// HttpClient
// ============================================================================

HttpClient::HttpClient(const HttpClientConfig& config)
    : impl_(std::make_unique<Impl>(config)) {}

HttpClient::~HttpClient() = default;

HttpResponse HttpClient::execute(const HttpRequest& request) {
    return impl_->execute(request);
}

HttpResponse HttpClient::execute_with_retry(const HttpRequest& request) {
    return impl_->execute_with_retry(request);
}

} // namespace tusgate::net
