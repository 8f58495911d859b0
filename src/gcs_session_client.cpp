#include "tusgate/storage/gcs_session_client.hpp"
#include "tusgate/core/constants.hpp"
#include "tusgate/core/errors.hpp"
#include "tusgate/core/log.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace tusgate {

// ============================================================================
// Header helpers
// ============================================================================

const char* to_string(ChunkStatus status) {
    switch (status) {
        case ChunkStatus::Complete: return "complete";
        case ChunkStatus::Continue: return "continue";
        case ChunkStatus::Transient: return "transient";
    }
    return "transient";
}

std::string format_content_range(uint64_t range_start, uint64_t length, uint64_t declared_size) {
    if (length == 0) {
        return "bytes */" + std::to_string(declared_size);
    }
    return "bytes " + std::to_string(range_start) + "-" +
           std::to_string(range_start + length - 1) + "/" + std::to_string(declared_size);
}

static std::optional<uint64_t> parse_u64(const std::string& s) {
    if (s.empty() || !std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c); })) {
        return std::nullopt;
    }
    try {
        return std::stoull(s);
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

std::optional<uint64_t> parse_range_header(const std::string& value) {
    // "bytes=0-N"
    auto eq = value.find('=');
    auto dash = value.rfind('-');
    if (eq == std::string::npos || dash == std::string::npos || dash < eq) {
        return std::nullopt;
    }
    auto last = parse_u64(value.substr(dash + 1));
    if (!last) return std::nullopt;
    return *last + 1;
}

std::optional<uint64_t> parse_content_range_total(const std::string& value) {
    // "bytes a-b/total"; total may be '*'
    auto slash = value.rfind('/');
    if (slash == std::string::npos) return std::nullopt;
    return parse_u64(value.substr(slash + 1));
}

static std::string describe_failure(const net::HttpResponse& response) {
    if (!response.error.empty()) return response.error;
    return response.body_string();
}

// ============================================================================
// GcsChunkedReader - ranged GETs against ?alt=media
// ============================================================================

class GcsChunkedReader : public ChunkedReader {
public:
    GcsChunkedReader(std::string url, size_t chunk_size, bool verify_ssl,
                     std::shared_ptr<net::HttpClient> http,
                     std::shared_ptr<TokenProvider> tokens,
                     std::string object_key)
        : url_(std::move(url)), chunk_size_(chunk_size), verify_ssl_(verify_ssl),
          http_(std::move(http)), tokens_(std::move(tokens)), object_key_(std::move(object_key)) {}

    // Fetches the first chunk so a missing object is reported at open time
    void prime() {
        pending_ = fetch();
    }

    std::optional<std::vector<uint8_t>> next_chunk() override {
        if (pending_) {
            auto chunk = std::move(pending_);
            pending_.reset();
            return chunk;
        }
        return fetch();
    }

    std::optional<uint64_t> total_size() const override { return total_; }
    uint64_t bytes_read() const override { return offset_; }

private:
    std::optional<std::vector<uint8_t>> fetch() {
        if (total_ && offset_ >= *total_) {
            return std::nullopt;
        }

        net::HttpRequest request = net::HttpRequest::get(url_);
        request.verify_ssl = verify_ssl_;
        request.byte_range = std::make_pair(offset_, offset_ + chunk_size_ - 1);
        auto token = tokens_->get_access_token();
        if (!token.token.empty()) request.headers.set_bearer_token(token.token);

        auto response = http_->execute_with_retry(request);

        if (response.status_code == 416) {
            // Range not satisfiable: zero-length object, or we are past the end
            if (!total_) total_ = offset_;
            return std::nullopt;
        }
        if (response.status_code == 404) {
            throw NoContentError(object_key_);
        }
        if (net::is_auth_error_status(response.status_code)) {
            throw BackendAuthError("download of " + object_key_ + " rejected: HTTP " +
                                   std::to_string(response.status_code));
        }
        if (!response.ok()) {
            throw BackendRequestError(response.status_code, describe_failure(response));
        }

        if (response.status_code == 206) {
            if (auto cr = response.headers.get("Content-Range")) {
                if (auto total = parse_content_range_total(*cr)) total_ = *total;
            }
        } else {
            // Full body: server ignored the range
            total_ = offset_ + response.body.size();
        }

        offset_ += response.body.size();
        if (response.body.empty()) {
            if (!total_) total_ = offset_;
            return std::nullopt;
        }
        return std::move(response.body);
    }

    std::string url_;
    size_t chunk_size_;
    bool verify_ssl_;
    std::shared_ptr<net::HttpClient> http_;
    std::shared_ptr<TokenProvider> tokens_;
    std::string object_key_;

    uint64_t offset_ = 0;
    std::optional<uint64_t> total_;
    std::optional<std::vector<uint8_t>> pending_;
};

// ============================================================================
// GcsSessionClient
// ============================================================================

GcsSessionClient::Config::Config()
    : download_chunk_size(constants::DEFAULT_CHUNK_SIZE) {}

GcsSessionClient::GcsSessionClient(const Config& config,
                                   std::shared_ptr<net::HttpClient> http,
                                   std::shared_ptr<TokenProvider> tokens,
                                   std::shared_ptr<BucketResolver> buckets)
    : config_(config), http_(std::move(http)), tokens_(std::move(tokens)),
      buckets_(std::move(buckets)) {
    if (config_.download_chunk_size == 0) {
        config_.download_chunk_size = constants::DEFAULT_CHUNK_SIZE;
    }
}

std::string GcsSessionClient::session_init_url(const std::string& bucket,
                                               const std::string& object_key) const {
    std::string base = config_.endpoint.empty() ? "https://storage.googleapis.com" : config_.endpoint;
    return base + "/upload/storage/v1/b/" + net::url_encode(bucket) +
           "/o?uploadType=resumable&name=" + net::url_encode(object_key);
}

std::string GcsSessionClient::object_url(const std::string& bucket,
                                         const std::string& object_key) const {
    std::string base = config_.endpoint.empty() ? "https://storage.googleapis.com" : config_.endpoint;
    return base + "/storage/v1/b/" + net::url_encode(bucket) + "/o/" + net::url_encode(object_key);
}

void GcsSessionClient::authorize(net::HttpRequest& request) {
    auto token = tokens_->get_access_token();
    if (!token.token.empty()) {
        request.headers.set_bearer_token(token.token);
    }
}

std::string GcsSessionClient::open_session(const RequestContext& ctx,
                                           const std::string& object_key,
                                           const std::string& content_type,
                                           uint64_t declared_size,
                                           const std::map<std::string, std::string>& metadata) {
    std::string bucket = buckets_->resolve_bucket(ctx);

    nlohmann::json body = {
        {"name", object_key},
        {"contentType", content_type},
        {"metadata", metadata},
    };

    net::HttpRequest request = net::HttpRequest::post(session_init_url(bucket, object_key),
                                                      std::string());
    request.set_json_body(body.dump());
    request.headers.set("X-Upload-Content-Type", content_type);
    request.headers.set("X-Upload-Content-Length", std::to_string(declared_size));
    request.verify_ssl = config_.verify_ssl;
    request.follow_redirects = false;
    authorize(request);

    auto response = http_->execute_with_retry(request);

    if (net::is_auth_error_status(response.status_code)) {
        throw BackendAuthError("session init rejected: HTTP " +
                               std::to_string(response.status_code) + ": " +
                               response.body_string());
    }
    if (!response.ok()) {
        throw BackendRequestError(response.status_code, describe_failure(response));
    }

    auto location = response.headers.get("Location");
    if (!location || location->empty()) {
        throw BackendRequestError(response.status_code,
                                  "session init response carried no Location header");
    }

    log_debug("opened resumable session for %s/%s (%llu bytes)",
              bucket.c_str(), object_key.c_str(),
              static_cast<unsigned long long>(declared_size));
    return *location;
}

ChunkResult GcsSessionClient::append_chunk(const std::string& session_uri,
                                           std::span<const uint8_t> data,
                                           uint64_t range_start,
                                           uint64_t declared_size) {
    net::HttpRequest request = net::HttpRequest::put(
        session_uri, std::vector<uint8_t>(data.begin(), data.end()));
    request.headers.set("Content-Range", format_content_range(range_start, data.size(), declared_size));
    request.verify_ssl = config_.verify_ssl;
    request.follow_redirects = false;
    authorize(request);

    // No client-level retry: the state machine owns the retry budget
    auto response = http_->execute(request);
    log_debug("chunk %s: HTTP %d in %lld ms",
              format_content_range(range_start, data.size(), declared_size).c_str(),
              response.status_code, static_cast<long long>(response.total_time.count()));

    ChunkResult result;
    result.http_status = response.status_code;

    if (response.is_network_error) {
        result.status = ChunkStatus::Transient;
        result.accepted_offset = range_start;
        result.error_message = response.error;
        return result;
    }

    switch (response.status_code) {
        case 200:
        case 201:
            result.status = ChunkStatus::Complete;
            result.accepted_offset = declared_size;
            return result;
        case 308: {
            result.status = ChunkStatus::Continue;
            result.accepted_offset = 0;
            if (auto range = response.headers.get("Range")) {
                if (auto accepted = parse_range_header(*range)) {
                    result.accepted_offset = *accepted;
                } else {
                    // Unparseable acknowledgement tells us nothing
                    result.status = ChunkStatus::Transient;
                    result.accepted_offset = range_start;
                    result.error_message = "malformed Range header: " + *range;
                }
            }
            return result;
        }
        default:
            break;
    }

    if (net::is_auth_error_status(response.status_code)) {
        throw BackendAuthError("chunk upload rejected: HTTP " +
                               std::to_string(response.status_code));
    }

    result.status = ChunkStatus::Transient;
    result.accepted_offset = range_start;
    result.error_message = describe_failure(response);
    return result;
}

void GcsSessionClient::delete_object(const RequestContext& ctx, const std::string& object_key) {
    try {
        std::string bucket = buckets_->resolve_bucket(ctx);
        net::HttpRequest request = net::HttpRequest::del(object_url(bucket, object_key));
        request.verify_ssl = config_.verify_ssl;
        authorize(request);

        auto response = http_->execute_with_retry(request);
        if (response.status_code == 404) {
            log_debug("delete of %s: already gone", object_key.c_str());
        } else if (!response.ok()) {
            log_warn("delete of %s failed: HTTP %d %s", object_key.c_str(),
                     response.status_code, describe_failure(response).c_str());
        }
    } catch (const BridgeError& e) {
        log_warn("delete of %s failed: %s", object_key.c_str(), e.what());
    }
}

std::unique_ptr<ChunkedReader> GcsSessionClient::open_download(const RequestContext& ctx,
                                                               const std::string& object_key) {
    std::string bucket = buckets_->resolve_bucket(ctx);
    auto reader = std::make_unique<GcsChunkedReader>(
        object_url(bucket, object_key) + "?alt=media",
        config_.download_chunk_size, config_.verify_ssl, http_, tokens_, object_key);
    reader->prime();
    return reader;
}

// ============================================================================
// Factory
// ============================================================================

std::unique_ptr<BackendSessionClient> SessionClientFactory::create(
    const std::string& type,
    const std::map<std::string, std::string>& config,
    std::shared_ptr<net::HttpClient> http,
    std::shared_ptr<TokenProvider> tokens,
    std::shared_ptr<BucketResolver> buckets) {

    auto get = [&](const std::string& key, const std::string& def = "") {
        auto it = config.find(key);
        return it != config.end() ? it->second : def;
    };

    if (type == "gcs") {
        GcsSessionClient::Config cfg;
        cfg.endpoint = get("endpoint");
        cfg.verify_ssl = get("verify_ssl", "true") != "false";
        std::string chunk = get("chunk_size");
        if (!chunk.empty()) {
            try {
                cfg.download_chunk_size = std::stoul(chunk);
            } catch (const std::exception&) {
                log_warn("invalid chunk_size '%s', using default", chunk.c_str());
            }
        }
        return std::make_unique<GcsSessionClient>(cfg, std::move(http), std::move(tokens),
                                                  std::move(buckets));
    }

    return nullptr;
}

} // namespace tusgate
