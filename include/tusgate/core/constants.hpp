#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>

namespace tusgate::constants {

// Client-facing protocol
constexpr const char* TUS_VERSION = "1.0.0";
constexpr const char* TUS_EXTENSIONS = "creation,expiration";
constexpr uint64_t DEFAULT_MAX_UPLOAD_SIZE = 1073741824;               // 1 GiB

// Server defaults
constexpr uint16_t DEFAULT_SERVER_PORT = 8080;
constexpr const char* DEFAULT_LISTEN_ADDRESS = "0.0.0.0";
constexpr size_t DEFAULT_WORKER_THREADS = 16;
constexpr const char* DEFAULT_CONTENT_TYPE = "application/octet-stream";

// Upload state machine
constexpr size_t DEFAULT_CHUNK_SIZE = 524288;                          // 512 KiB
constexpr int DEFAULT_MAX_RETRIES = 5;
constexpr std::chrono::milliseconds DEFAULT_RETRY_BACKOFF{500};

// Non-final chunks of a GCS resumable upload must be multiples of 256 KiB
constexpr size_t BACKEND_CHUNK_GRANULARITY = 262144;

// Backend sessions live for a week
constexpr std::chrono::hours DEFAULT_SESSION_TTL{24 * 7};
constexpr std::chrono::seconds DEFAULT_SWEEP_INTERVAL{3600};

// OAuth2
constexpr const char* DEFAULT_TOKEN_URI = "https://oauth2.googleapis.com/token";
constexpr const char* STORAGE_SCOPE = "https://www.googleapis.com/auth/devstorage.read_write";
constexpr std::chrono::minutes TOKEN_REFRESH_MARGIN{5};

// HTTP request defaults
constexpr int DEFAULT_HTTP_REQUEST_TIMEOUT_SECONDS = 30;

} // namespace tusgate::constants
