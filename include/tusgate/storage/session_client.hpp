#pragma once

#include "tusgate/core/context.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace tusgate {

namespace net { class HttpClient; }
class TokenProvider;
class BucketResolver;

// How the backend answered a chunk PUT
enum class ChunkStatus {
    Complete,   // object committed
    Continue,   // more bytes expected; accepted_offset is authoritative
    Transient   // retryable failure; nothing learned about the offset
};

const char* to_string(ChunkStatus status);

struct ChunkResult {
    ChunkStatus status = ChunkStatus::Transient;
    uint64_t accepted_offset = 0;
    int http_status = 0;
    std::string error_message;
};

// Pull-based reader over a stored object, one bounded chunk per call
class ChunkedReader {
public:
    virtual ~ChunkedReader() = default;

    // Next chunk, or nullopt once the object is exhausted
    virtual std::optional<std::vector<uint8_t>> next_chunk() = 0;

    // Total object size, known after the first chunk
    virtual std::optional<uint64_t> total_size() const = 0;

    virtual uint64_t bytes_read() const = 0;
};

// Backend side of the bridge: resumable sessions and chunked reads
class BackendSessionClient {
public:
    virtual ~BackendSessionClient() = default;

    virtual std::string type_name() const = 0;

    // Starts a resumable session for an object of declared_size bytes.
    // Returns the opaque session URI. Throws BackendAuthError/BackendRequestError.
    virtual std::string open_session(const RequestContext& ctx,
                                     const std::string& object_key,
                                     const std::string& content_type,
                                     uint64_t declared_size,
                                     const std::map<std::string, std::string>& metadata) = 0;

    // PUTs data at range_start. Only auth failures throw.
    virtual ChunkResult append_chunk(const std::string& session_uri,
                                     std::span<const uint8_t> data,
                                     uint64_t range_start,
                                     uint64_t declared_size) = 0;

    // Best effort; never throws
    virtual void delete_object(const RequestContext& ctx, const std::string& object_key) = 0;

    // Throws NoContentError when the object does not exist
    virtual std::unique_ptr<ChunkedReader> open_download(const RequestContext& ctx,
                                                         const std::string& object_key) = 0;
};

// "bytes 0-99/1000", or "bytes */1000" for an empty body
std::string format_content_range(uint64_t range_start, uint64_t length, uint64_t declared_size);

// Backend acknowledgement "bytes=0-N" -> accepted offset N+1.
// nullopt when the header is missing or malformed.
std::optional<uint64_t> parse_range_header(const std::string& value);

// Download "Content-Range: bytes a-b/total" -> total
std::optional<uint64_t> parse_content_range_total(const std::string& value);

// Creates a session client from a backend type and its settings
class SessionClientFactory {
public:
    // type "gcs"; config keys: endpoint, verify_ssl, chunk_size
    static std::unique_ptr<BackendSessionClient> create(
        const std::string& type,
        const std::map<std::string, std::string>& config,
        std::shared_ptr<net::HttpClient> http,
        std::shared_ptr<TokenProvider> tokens,
        std::shared_ptr<BucketResolver> buckets);
};

} // namespace tusgate
