#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace tusgate {

enum class UploadState {
    Uninitialized,
    Initiating,
    Appending,
    Finalizing,
    Finalized,
    Failed
};

const char* to_string(UploadState state);
std::optional<UploadState> upload_state_from_string(const std::string& name);

// What a client declares when it starts an upload
struct UploadDescriptor {
    uint64_t declared_size = 0;
    std::string content_type;
    std::string filename;
    std::string extension;
    std::string md5;
};

// Per-slot upload record
struct UploadSession {
    std::string slot_id;
    std::string tenant_id;      // owner of the backend objects, for sweeps
    UploadState state = UploadState::Uninitialized;

    std::optional<uint64_t> declared_size;
    uint64_t bytes_accepted = 0;   // backend-confirmed

    std::string backend_session_uri;
    std::string pending_object_key;
    std::string finalized_object_key;
    uint64_t finalized_size = 0;

    std::string content_type;
    std::string filename;
    std::string extension;
    std::string md5;

    std::chrono::system_clock::time_point session_created;
    std::chrono::system_clock::time_point last_activity;

    // Initiating or Appending
    bool in_progress() const;

    std::chrono::system_clock::time_point session_expiry(std::chrono::seconds ttl) const;
    bool expired(std::chrono::system_clock::time_point now, std::chrono::seconds ttl) const;
};

// 32 lowercase hex characters from a CSPRNG
std::string random_hex_token();

// "report.final.pdf" -> "pdf"; empty when there is no dot
std::string extension_of(const std::string& filename);

// ISO-8601 in UTC with an explicit offset, e.g. "1994-11-06T08:49:37+00:00"
std::string format_iso8601(std::chrono::system_clock::time_point tp);

int64_t to_epoch_seconds(std::chrono::system_clock::time_point tp);
std::chrono::system_clock::time_point from_epoch_seconds(int64_t seconds);

} // namespace tusgate
