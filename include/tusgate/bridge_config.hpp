#pragma once

#include "tusgate/core/constants.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>

namespace tusgate {

/// Object-storage backend settings.
struct BackendConfig {
    std::string type = "gcs";
    std::map<std::string, std::string> params;  // bucket, project_id, credentials_file,
                                                // endpoint, token, verify_ssl

    std::string param(const std::string& key, const std::string& def = "") const;

    /// Returns error message or empty string on success.
    std::string validate() const;
};

/// Configuration for the tusgate daemon.
struct BridgeConfig {
    // Listener
    std::string listen_address = constants::DEFAULT_LISTEN_ADDRESS;
    uint16_t port = constants::DEFAULT_SERVER_PORT;
    size_t worker_threads = constants::DEFAULT_WORKER_THREADS;
    std::string base_url;          // Location prefix; default http://{listen}:{port}
    std::string default_tenant;    // used when a request carries no X-Tenant-Id

    BackendConfig backend;

    // Session state (SQLite). Empty keeps sessions in memory only.
    std::filesystem::path state_dir;

    // Upload policy
    size_t chunk_size = constants::DEFAULT_CHUNK_SIZE;
    uint64_t max_upload_size = constants::DEFAULT_MAX_UPLOAD_SIZE;
    int max_retries = constants::DEFAULT_MAX_RETRIES;
    std::chrono::milliseconds retry_backoff = constants::DEFAULT_RETRY_BACKOFF;
    std::chrono::seconds session_ttl = constants::DEFAULT_SESSION_TTL;
    std::chrono::seconds sweep_interval = constants::DEFAULT_SWEEP_INTERVAL;

    // Daemon
    bool daemonize = false;
    bool verbose = false;
    std::filesystem::path pid_file;
    std::filesystem::path log_file;

    // Prometheus metrics (textfile collector)
    std::filesystem::path metrics_file;    // e.g. /var/lib/node_exporter/textfile/tusgate.prom
    size_t metrics_interval_secs = 15;

    /// Parse configuration from command line arguments.
    /// Returns empty optional on error (prints usage to stderr).
    static std::optional<BridgeConfig> from_args(int argc, char* argv[]);

    /// Load configuration from a JSON file, overlaying onto current values.
    bool load_json(const std::filesystem::path& path);

    /// Fill in derived defaults (base_url, credentials from environment).
    void apply_defaults();

    /// Validate required fields. Returns error message or empty string.
    std::string validate() const;
};

}  // namespace tusgate
