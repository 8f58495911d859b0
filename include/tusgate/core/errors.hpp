#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace tusgate {

// Base for every error the bridge surfaces to a client. Carries the HTTP
// status the protocol adapter answers with.
class BridgeError : public std::runtime_error {
public:
    BridgeError(int http_status, const std::string& message)
        : std::runtime_error(message), http_status_(http_status) {}

    int http_status() const { return http_status_; }

private:
    int http_status_;
};

// --- Client protocol violations ---

class MissingHeaderError : public BridgeError {
public:
    explicit MissingHeaderError(const std::string& header)
        : BridgeError(400, "missing required header: " + header), header_(header) {}

    const std::string& header() const { return header_; }

private:
    std::string header_;
};

class InvalidHeaderError : public BridgeError {
public:
    InvalidHeaderError(const std::string& header, const std::string& value)
        : BridgeError(400, "invalid value for " + header + ": '" + value + "'") {}
};

// Patch offset disagrees with the recorded accepted offset
class OffsetMismatchError : public BridgeError {
public:
    OffsetMismatchError(uint64_t expected, uint64_t got)
        : BridgeError(409, "upload offset mismatch: expected " + std::to_string(expected) +
                           ", got " + std::to_string(got)),
          expected_(expected) {}

    uint64_t expected() const { return expected_; }

private:
    uint64_t expected_;
};

class UploadTooLargeError : public BridgeError {
public:
    UploadTooLargeError(uint64_t size, uint64_t max_size)
        : BridgeError(413, "upload size " + std::to_string(size) +
                           " exceeds maximum " + std::to_string(max_size)) {}
};

// --- Missing sessions / objects ---

class NoUploadError : public BridgeError {
public:
    explicit NoUploadError(const std::string& slot_id)
        : BridgeError(404, "no upload session for " + slot_id) {}
};

class NoContentError : public BridgeError {
public:
    explicit NoContentError(const std::string& slot_id)
        : BridgeError(404, "no stored object for " + slot_id) {}
};

// Session failed or expired; the client has to Create again
class UploadGoneError : public BridgeError {
public:
    explicit UploadGoneError(const std::string& message)
        : BridgeError(410, message) {}
};

// --- Backend failures ---

class BackendAuthError : public BridgeError {
public:
    explicit BackendAuthError(const std::string& message)
        : BridgeError(502, "backend authentication failed: " + message) {}
};

class BackendRequestError : public BridgeError {
public:
    BackendRequestError(int backend_status, const std::string& body)
        : BridgeError(502, "backend request failed (HTTP " + std::to_string(backend_status) +
                           "): " + body),
          backend_status_(backend_status), body_(body) {}

    int backend_status() const { return backend_status_; }
    const std::string& body() const { return body_; }

private:
    int backend_status_;
    std::string body_;
};

class MaxRetriesExceeded : public BridgeError {
public:
    explicit MaxRetriesExceeded(int attempts)
        : BridgeError(502, "backend rejected chunk " + std::to_string(attempts) +
                           " times in a row, giving up"),
          attempts_(attempts) {}

    int attempts() const { return attempts_; }

private:
    int attempts_;
};

} // namespace tusgate
