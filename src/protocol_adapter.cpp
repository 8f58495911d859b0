#include "tusgate/server/protocol_adapter.hpp"
#include "tusgate/core/constants.hpp"
#include "tusgate/core/errors.hpp"
#include "tusgate/core/log.hpp"
#include "tusgate/upload/download_streamer.hpp"
#include "tusgate/upload/upload_machine.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace tusgate {

namespace {

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t");
    return s.substr(start, end - start + 1);
}

std::string decode_b64_text(const std::string& value) {
    auto bytes = net::base64_decode(value);
    return std::string(bytes.begin(), bytes.end());
}

std::string require_header(const ProtocolRequest& req, const std::string& name) {
    auto value = req.headers.get(name);
    if (!value) {
        throw MissingHeaderError(name);
    }
    return *value;
}

// TUS bodies carry this content type; it says nothing about the object
bool is_tus_body_type(const std::string& content_type) {
    return content_type.rfind("application/offset+octet-stream", 0) == 0;
}

// The filename ends up in Content-Disposition on download
std::string checked_filename(const std::string& header, std::string filename) {
    for (unsigned char c : filename) {
        if (c < 0x20 || c == 0x7f) {
            throw InvalidHeaderError(header, "filename contains control characters");
        }
    }
    return filename;
}

class EmptyByteSource : public ByteSource {
public:
    size_t read(uint8_t*, size_t) override { return 0; }
};

}  // namespace

std::map<std::string, std::string> parse_upload_metadata(const std::string& header) {
    std::map<std::string, std::string> out;
    std::stringstream ss(header);
    std::string pair;
    while (std::getline(ss, pair, ',')) {
        pair = trim(pair);
        if (pair.empty()) continue;
        auto space = pair.find(' ');
        if (space == std::string::npos) {
            out[pair] = "";
        } else {
            out[pair.substr(0, space)] = decode_b64_text(trim(pair.substr(space + 1)));
        }
    }
    return out;
}

std::string content_disposition(const std::string& filename) {
    // Quoted-string fallback: ASCII only, quotes and backslashes escaped
    std::string quoted;
    for (unsigned char c : filename) {
        if (c < 0x20 || c >= 0x7f) {
            quoted += '_';
            continue;
        }
        if (c == '"' || c == '\\') quoted += '\\';
        quoted += static_cast<char>(c);
    }
    return "attachment; filename=\"" + quoted + "\"; filename*=UTF-8''" + net::url_encode(filename);
}

uint64_t parse_header_u64(const std::string& name, const std::string& value) {
    std::string v = trim(value);
    if (v.empty() || v.size() > 20 ||
        !std::all_of(v.begin(), v.end(), [](unsigned char c) { return std::isdigit(c); })) {
        throw InvalidHeaderError(name, value);
    }
    try {
        return std::stoull(v);
    } catch (const std::out_of_range&) {
        throw InvalidHeaderError(name, value);
    }
}

TusProtocolAdapter::TusProtocolAdapter(UploadMachine& machine, DownloadStreamer& streamer,
                                       const Config& config)
    : machine_(machine), streamer_(streamer), config_(config) {
    while (!config_.base_url.empty() && config_.base_url.back() == '/') {
        config_.base_url.pop_back();
    }
}

std::string TusProtocolAdapter::location_for(const std::string& slot_id) const {
    return config_.base_url + "/files/" + slot_id;
}

void TusProtocolAdapter::add_common_headers(ProtocolResponse& resp,
                                            const std::string& exposed) const {
    resp.headers.set("Tus-Resumable", constants::TUS_VERSION);
    resp.headers.set("Access-Control-Expose-Headers", exposed);
}

// --- Create ---

ProtocolResponse TusProtocolAdapter::create(const RequestContext& ctx, const std::string& slot_id,
                                            const ProtocolRequest& req) {
    // Some clients cannot send PATCH and tunnel it through POST
    if (auto override_method = req.headers.get("X-HTTP-Method-Override")) {
        std::string m = *override_method;
        std::transform(m.begin(), m.end(), m.begin(), [](unsigned char c) { return std::toupper(c); });
        if (m == "PATCH") {
            return patch(ctx, slot_id, req);
        }
    }

    UploadDescriptor desc;
    desc.declared_size = parse_header_u64("Upload-Length", require_header(req, "Upload-Length"));
    require_header(req, "Tus-Resumable");

    desc.md5 = req.headers.get("Upload-Md5").value_or("");
    desc.extension = req.headers.get("Upload-Extension").value_or("");

    if (auto meta_header = req.headers.get("Upload-Metadata")) {
        auto meta = parse_upload_metadata(*meta_header);
        if (meta.count("filename")) desc.filename = checked_filename("Upload-Metadata", meta["filename"]);
        else if (meta.count("name")) desc.filename = checked_filename("Upload-Metadata", meta["name"]);
        if (meta.count("filetype")) desc.content_type = meta["filetype"];
    }
    if (desc.content_type.empty()) {
        auto ct = req.headers.content_type();
        if (ct && !is_tus_body_type(*ct)) desc.content_type = *ct;
    }
    if (desc.filename.empty()) {
        desc.filename = random_hex_token();
    }
    if (desc.extension.empty()) {
        desc.extension = extension_of(desc.filename);
    }

    auto session = machine_.begin(ctx, slot_id, desc);

    // Nothing to Patch: commit the empty object now
    if (desc.declared_size == 0) {
        EmptyByteSource empty;
        machine_.append(ctx, slot_id, 0, empty, 0);
    }

    ProtocolResponse resp;
    resp.status = 201;
    resp.headers.set("Location", location_for(slot_id));
    resp.headers.set("Upload-Expires",
                     format_iso8601(session.session_expiry(machine_.policy().session_ttl)));
    add_common_headers(resp, "Location,Upload-Expires,Tus-Resumable");
    return resp;
}

// --- Head ---

ProtocolResponse TusProtocolAdapter::head(const RequestContext&, const std::string& slot_id,
                                          const ProtocolRequest&) {
    auto session = machine_.status(slot_id);

    ProtocolResponse resp;
    resp.status = 200;
    resp.headers.set("Upload-Offset", std::to_string(session.bytes_accepted));
    if (session.declared_size) {
        resp.headers.set("Upload-Length", std::to_string(*session.declared_size));
    }
    if (session.in_progress()) {
        resp.headers.set("Upload-Expires",
                         format_iso8601(session.session_expiry(machine_.policy().session_ttl)));
    }
    resp.headers.set("Cache-Control", "no-store");
    add_common_headers(resp, "Upload-Offset,Upload-Length,Upload-Expires,Tus-Resumable");
    return resp;
}

// --- Patch ---

ProtocolResponse TusProtocolAdapter::patch(const RequestContext& ctx, const std::string& slot_id,
                                           const ProtocolRequest& req) {
    uint64_t length = parse_header_u64("Content-Length", require_header(req, "Content-Length"));
    uint64_t offset = parse_header_u64("Upload-Offset", require_header(req, "Upload-Offset"));

    EmptyByteSource empty;
    ByteSource& body = req.body ? *req.body : empty;

    uint64_t accepted = machine_.append(ctx, slot_id, offset, body, length);
    auto session = machine_.status(slot_id);

    ProtocolResponse resp;
    // 200 once the object is committed, 204 while more bytes are expected
    resp.status = session.state == UploadState::Finalized ? 200 : 204;
    resp.headers.set("Upload-Offset", std::to_string(accepted));
    resp.headers.set("Upload-Expires",
                     format_iso8601(session.session_expiry(machine_.policy().session_ttl)));
    add_common_headers(resp, "Upload-Offset,Upload-Expires,Tus-Resumable");
    return resp;
}

// --- Options ---

ProtocolResponse TusProtocolAdapter::options(const RequestContext&, const ProtocolRequest&) {
    ProtocolResponse resp;
    resp.status = 204;
    resp.headers.set("Tus-Version", constants::TUS_VERSION);
    resp.headers.set("Tus-Max-Size", std::to_string(machine_.policy().max_size));
    resp.headers.set("Tus-Extension", constants::TUS_EXTENSIONS);
    add_common_headers(resp, "Tus-Version,Tus-Max-Size,Tus-Extension,Tus-Resumable");
    return resp;
}

// --- Legacy single-request upload ---

ProtocolResponse TusProtocolAdapter::upload(const RequestContext& ctx, const std::string& slot_id,
                                            const ProtocolRequest& req) {
    UploadDescriptor desc;
    desc.declared_size = parse_header_u64("X-Upload-Size", require_header(req, "X-Upload-Size"));
    desc.md5 = req.headers.get("X-Upload-MD5Hash").value_or("");
    desc.extension = req.headers.get("X-Upload-Extension").value_or("");
    if (auto name = req.headers.get("X-Upload-Filename")) {
        desc.filename = checked_filename("X-Upload-Filename", *name);
    } else if (auto name_b64 = req.headers.get("X-Upload-Filename-B64")) {
        desc.filename = checked_filename("X-Upload-Filename-B64", decode_b64_text(*name_b64));
    } else {
        desc.filename = random_hex_token();
    }
    if (desc.extension.empty()) {
        desc.extension = extension_of(desc.filename);
    }
    desc.content_type = req.headers.content_type().value_or("");

    EmptyByteSource empty;
    ByteSource& body = req.body ? *req.body : empty;

    auto session = machine_.upload(ctx, slot_id, desc, body);

    if (session.state != UploadState::Finalized) {
        // Body ended early; the session stays open for Patch from Upload-Offset
        ProtocolResponse resp;
        resp.status = 400;
        resp.body = "request body ended at " + std::to_string(session.bytes_accepted) +
                    " of " + std::to_string(desc.declared_size) + " bytes";
        resp.headers.set("Upload-Offset", std::to_string(session.bytes_accepted));
        resp.headers.set("Location", location_for(slot_id));
        add_common_headers(resp, "Location,Upload-Offset,Tus-Resumable");
        return resp;
    }

    ProtocolResponse resp;
    resp.status = 201;
    resp.headers.set("Location", location_for(slot_id));
    resp.headers.set("Upload-Offset", std::to_string(session.bytes_accepted));
    add_common_headers(resp, "Location,Upload-Offset,Tus-Resumable");
    return resp;
}

// --- Remove ---

ProtocolResponse TusProtocolAdapter::remove(const RequestContext& ctx, const std::string& slot_id,
                                            const ProtocolRequest&) {
    machine_.remove(ctx, slot_id);
    ProtocolResponse resp;
    resp.status = 204;
    add_common_headers(resp, "Tus-Resumable");
    return resp;
}

// --- Download ---

void TusProtocolAdapter::download(const RequestContext& ctx, const std::string& slot_id,
                                  ByteSink& sink,
                                  const std::function<void(const ProtocolResponse&)>& send_headers) {
    streamer_.stream(ctx, slot_id, sink, [&](const DownloadInfo& info) {
        ProtocolResponse resp;
        resp.status = 200;
        resp.headers.set_content_type(info.content_type);
        resp.headers.set("Content-Disposition", content_disposition(info.filename));
        if (info.size) {
            resp.headers.set_content_length(static_cast<size_t>(*info.size));
        }
        add_common_headers(resp, "Content-Disposition,Content-Length,Tus-Resumable");
        send_headers(resp);
    });
}

// --- Dispatch ---

ProtocolResponse TusProtocolAdapter::error_response(const BridgeError& error) const {
    ProtocolResponse resp;
    resp.status = error.http_status();
    resp.body = error.what();
    resp.headers.set_content_type("text/plain; charset=utf-8");
    if (auto* mismatch = dynamic_cast<const OffsetMismatchError*>(&error)) {
        resp.headers.set("Upload-Offset", std::to_string(mismatch->expected()));
    }
    add_common_headers(resp, "Upload-Offset,Tus-Resumable");
    return resp;
}

ProtocolResponse TusProtocolAdapter::dispatch(const RequestContext& ctx, const std::string& slot_id,
                                              const ProtocolRequest& req) {
    try {
        if (req.method == "OPTIONS") return options(ctx, req);
        if (req.method == "POST") return create(ctx, slot_id, req);
        if (req.method == "HEAD") return head(ctx, slot_id, req);
        if (req.method == "PATCH") return patch(ctx, slot_id, req);
        if (req.method == "PUT") return upload(ctx, slot_id, req);
        if (req.method == "DELETE") return remove(ctx, slot_id, req);

        ProtocolResponse resp;
        resp.status = 405;
        resp.headers.set("Allow", "OPTIONS, POST, HEAD, PATCH, PUT, DELETE, GET");
        add_common_headers(resp, "Tus-Resumable");
        return resp;
    } catch (const BridgeError& e) {
        if (e.http_status() >= 500) {
            log_error("%s %s [%s]: %s", req.method.c_str(), slot_id.c_str(),
                      ctx.request_id.c_str(), e.what());
        } else {
            log_debug("%s %s [%s]: %s", req.method.c_str(), slot_id.c_str(),
                      ctx.request_id.c_str(), e.what());
        }
        return error_response(e);
    }
}

} // namespace tusgate
