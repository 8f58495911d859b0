#pragma once

#include "tusgate/core/context.hpp"
#include "tusgate/net/http.hpp"
#include "tusgate/upload/byte_stream.hpp"

#include <functional>
#include <map>
#include <string>

namespace tusgate {

class BridgeError;
class DownloadStreamer;
class UploadMachine;

struct ProtocolRequest {
    std::string method;             // upper case
    net::HttpHeaders headers;
    ByteSource* body = nullptr;     // may be null for bodiless requests
};

struct ProtocolResponse {
    int status = 200;
    net::HttpHeaders headers;
    std::string body;
};

// Client-facing TUS 1.0.0 endpoint for one file slot, plus the legacy
// single-request upload (X-Upload-* headers), download and remove.
class TusProtocolAdapter {
public:
    struct Config {
        std::string base_url;    // prefix for Location, e.g. "https://host"
    };

    TusProtocolAdapter(UploadMachine& machine, DownloadStreamer& streamer, const Config& config);

    ProtocolResponse create(const RequestContext& ctx, const std::string& slot_id,
                            const ProtocolRequest& req);
    ProtocolResponse head(const RequestContext& ctx, const std::string& slot_id,
                          const ProtocolRequest& req);
    ProtocolResponse patch(const RequestContext& ctx, const std::string& slot_id,
                           const ProtocolRequest& req);
    ProtocolResponse options(const RequestContext& ctx, const ProtocolRequest& req);
    ProtocolResponse upload(const RequestContext& ctx, const std::string& slot_id,
                            const ProtocolRequest& req);
    ProtocolResponse remove(const RequestContext& ctx, const std::string& slot_id,
                            const ProtocolRequest& req);

    // send_headers runs once the object is found, before any body byte
    void download(const RequestContext& ctx, const std::string& slot_id, ByteSink& sink,
                  const std::function<void(const ProtocolResponse&)>& send_headers);

    // Routes a bodied/bodiless request by method (everything except GET) and
    // turns errors into status responses.
    ProtocolResponse dispatch(const RequestContext& ctx, const std::string& slot_id,
                              const ProtocolRequest& req);

    ProtocolResponse error_response(const BridgeError& error) const;

    // "/files/{slot}" style Location for a slot
    std::string location_for(const std::string& slot_id) const;

private:
    void add_common_headers(ProtocolResponse& resp, const std::string& exposed) const;

    UploadMachine& machine_;
    DownloadStreamer& streamer_;
    Config config_;
};

// Upload-Metadata: comma separated "key base64value" pairs; the value may be absent
std::map<std::string, std::string> parse_upload_metadata(const std::string& header);

// attachment; filename="..." (ASCII, escaped) plus the RFC 5987 filename*
std::string content_disposition(const std::string& filename);

// Strict decimal parse of a header value; throws InvalidHeaderError
uint64_t parse_header_u64(const std::string& name, const std::string& value);

} // namespace tusgate
