#include "tusgate/bridge_config.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

namespace tusgate {

// --- BackendConfig ---

std::string BackendConfig::param(const std::string& key, const std::string& def) const {
    auto it = params.find(key);
    return it != params.end() ? it->second : def;
}

std::string BackendConfig::validate() const {
    if (type.empty()) return "backend type is required";
    if (type != "gcs") return "unknown backend type: " + type;
    if (param("bucket").empty()) return "gcs backend requires 'bucket'";
    return {};
}

// --- BridgeConfig ---

namespace {

// Parse a --backend-X flag. Returns true if the flag was handled.
bool parse_backend_flag(const std::string& suffix, const char* value, BackendConfig& backend) {
    if (suffix == "type") {
        backend.type = value;
    } else if (suffix == "bucket") {
        backend.params["bucket"] = value;
    } else if (suffix == "project-id") {
        backend.params["project_id"] = value;
    } else if (suffix == "credentials-file") {
        backend.params["credentials_file"] = value;
    } else if (suffix == "endpoint") {
        backend.params["endpoint"] = value;
    } else if (suffix == "token") {
        backend.params["token"] = value;
    } else if (suffix == "ca-bundle") {
        backend.params["ca_bundle"] = value;
    } else {
        return false;
    }
    return true;
}

const char* usage_text() {
    return
        "Usage: tusgate --backend-bucket <name> [options]\n"
        "\n"
        "Listener:\n"
        "  --listen <addr>                  Listen address (default: 0.0.0.0)\n"
        "  --port <N>                       Listen port (default: 8080)\n"
        "  --workers <N>                    Request worker threads (default: 16)\n"
        "  --base-url <url>                 Public URL prefix used in Location headers\n"
        "  --default-tenant <id>            Tenant for requests without X-Tenant-Id\n"
        "\n"
        "Backend (--backend-*):\n"
        "  --backend-type <type>            Backend type (default: gcs)\n"
        "  --backend-bucket <name>          Base bucket name; tenants get <tenant>_<bucket>\n"
        "  --backend-project-id <id>        Project for bucket creation\n"
        "  --backend-credentials-file <p>   Service account key (or GOOGLE_APPLICATION_CREDENTIALS)\n"
        "  --backend-endpoint <url>         Custom endpoint (emulators)\n"
        "  --backend-token <token>          Static bearer token (emulators)\n"
        "  --backend-ca-bundle <path>       CA bundle for backend TLS\n"
        "  --backend-no-verify-ssl          Skip SSL verification\n"
        "\n"
        "Uploads:\n"
        "  --config <path>                  JSON config file\n"
        "  --state-dir <path>               Persist sessions in <path>/sessions.db\n"
        "  --chunk-size <bytes>             Backend chunk size (default: 524288)\n"
        "  --max-size <bytes>               Largest accepted upload (default: 1073741824)\n"
        "  --max-retries <N>                Consecutive chunk failures before giving up (default: 5)\n"
        "  --retry-backoff-ms <ms>          Initial retry backoff (default: 500)\n"
        "  --session-ttl-hours <N>          Resumable session lifetime (default: 168)\n"
        "  --sweep-interval <secs>          Abandoned-session sweep interval (default: 3600)\n"
        "\n"
        "Daemon:\n"
        "  --daemon                         Run as daemon\n"
        "  --verbose                        Verbose output\n"
        "  --pid-file <path>                PID file path\n"
        "  --log-file <path>                Log file path\n"
        "  --metrics-file <path>            Prometheus .prom file for node_exporter textfile collector\n"
        "  --metrics-interval <secs>        Metrics write interval (default: 15)\n"
        "  --help                           Show this help\n";
}

}  // namespace

std::optional<BridgeConfig> BridgeConfig::from_args(int argc, char* argv[]) {
    BridgeConfig config;

    auto next_arg = [&](int& i, const char* name) -> const char* {
        if (i + 1 >= argc) {
            std::cerr << "Error: " << name << " requires an argument\n";
            return nullptr;
        }
        return argv[++i];
    };

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        try {
            if (arg == "--backend-no-verify-ssl") {
                config.backend.params["verify_ssl"] = "false";
                continue;
            }

            if (arg.compare(0, 10, "--backend-") == 0) {
                auto* v = next_arg(i, arg.c_str());
                if (!v) return std::nullopt;
                if (!parse_backend_flag(arg.substr(10), v, config.backend)) {
                    std::cerr << "Error: unknown option: " << arg << "\n";
                    return std::nullopt;
                }
                continue;
            }

            if (arg == "--listen") {
                auto* v = next_arg(i, "--listen");
                if (!v) return std::nullopt;
                config.listen_address = v;
            } else if (arg == "--port") {
                auto* v = next_arg(i, "--port");
                if (!v) return std::nullopt;
                unsigned long port = std::stoul(v);
                if (port > 65535) {
                    std::cerr << "Error: --port out of range: " << v << "\n";
                    return std::nullopt;
                }
                config.port = static_cast<uint16_t>(port);
            } else if (arg == "--workers") {
                auto* v = next_arg(i, "--workers");
                if (!v) return std::nullopt;
                config.worker_threads = std::stoull(v);
            } else if (arg == "--base-url") {
                auto* v = next_arg(i, "--base-url");
                if (!v) return std::nullopt;
                config.base_url = v;
            } else if (arg == "--default-tenant") {
                auto* v = next_arg(i, "--default-tenant");
                if (!v) return std::nullopt;
                config.default_tenant = v;
            } else if (arg == "--config") {
                auto* v = next_arg(i, "--config");
                if (!v) return std::nullopt;
                if (!config.load_json(v)) return std::nullopt;
            } else if (arg == "--state-dir") {
                auto* v = next_arg(i, "--state-dir");
                if (!v) return std::nullopt;
                config.state_dir = v;
            } else if (arg == "--chunk-size") {
                auto* v = next_arg(i, "--chunk-size");
                if (!v) return std::nullopt;
                config.chunk_size = std::stoull(v);
            } else if (arg == "--max-size") {
                auto* v = next_arg(i, "--max-size");
                if (!v) return std::nullopt;
                config.max_upload_size = std::stoull(v);
            } else if (arg == "--max-retries") {
                auto* v = next_arg(i, "--max-retries");
                if (!v) return std::nullopt;
                config.max_retries = std::stoi(v);
            } else if (arg == "--retry-backoff-ms") {
                auto* v = next_arg(i, "--retry-backoff-ms");
                if (!v) return std::nullopt;
                config.retry_backoff = std::chrono::milliseconds(std::stoull(v));
            } else if (arg == "--session-ttl-hours") {
                auto* v = next_arg(i, "--session-ttl-hours");
                if (!v) return std::nullopt;
                config.session_ttl = std::chrono::hours(std::stoull(v));
            } else if (arg == "--sweep-interval") {
                auto* v = next_arg(i, "--sweep-interval");
                if (!v) return std::nullopt;
                config.sweep_interval = std::chrono::seconds(std::stoull(v));
            } else if (arg == "--daemon") {
                config.daemonize = true;
            } else if (arg == "--verbose") {
                config.verbose = true;
            } else if (arg == "--pid-file") {
                auto* v = next_arg(i, "--pid-file");
                if (!v) return std::nullopt;
                config.pid_file = v;
            } else if (arg == "--log-file") {
                auto* v = next_arg(i, "--log-file");
                if (!v) return std::nullopt;
                config.log_file = v;
            } else if (arg == "--metrics-file") {
                auto* v = next_arg(i, "--metrics-file");
                if (!v) return std::nullopt;
                config.metrics_file = v;
            } else if (arg == "--metrics-interval") {
                auto* v = next_arg(i, "--metrics-interval");
                if (!v) return std::nullopt;
                config.metrics_interval_secs = std::stoull(v);
            } else if (arg == "--help" || arg == "-h") {
                std::cerr << usage_text();
                return std::nullopt;
            } else {
                std::cerr << "Error: unknown option: " << arg << "\n";
                return std::nullopt;
            }
        } catch (const std::logic_error&) {
            // std::invalid_argument / std::out_of_range from the numeric parsers
            std::cerr << "Error: invalid numeric value for " << arg << "\n";
            return std::nullopt;
        }
    }

    config.apply_defaults();
    return config;
}

bool BridgeConfig::load_json(const std::filesystem::path& path) {
    try {
        std::ifstream ifs(path);
        if (!ifs) {
            std::cerr << "Error: cannot open config file: " << path << "\n";
            return false;
        }
        auto j = nlohmann::json::parse(ifs);

        if (j.contains("listen")) listen_address = j["listen"].get<std::string>();
        if (j.contains("port")) port = j["port"].get<uint16_t>();
        if (j.contains("workers")) worker_threads = j["workers"].get<size_t>();
        if (j.contains("base_url")) base_url = j["base_url"].get<std::string>();
        if (j.contains("default_tenant")) default_tenant = j["default_tenant"].get<std::string>();
        if (j.contains("state_dir")) state_dir = j["state_dir"].get<std::string>();
        if (j.contains("chunk_size")) chunk_size = j["chunk_size"].get<size_t>();
        if (j.contains("max_size")) max_upload_size = j["max_size"].get<uint64_t>();
        if (j.contains("max_retries")) max_retries = j["max_retries"].get<int>();
        if (j.contains("retry_backoff_ms"))
            retry_backoff = std::chrono::milliseconds(j["retry_backoff_ms"].get<uint64_t>());
        if (j.contains("session_ttl_hours"))
            session_ttl = std::chrono::hours(j["session_ttl_hours"].get<uint64_t>());
        if (j.contains("sweep_interval"))
            sweep_interval = std::chrono::seconds(j["sweep_interval"].get<uint64_t>());
        if (j.contains("verbose")) verbose = j["verbose"].get<bool>();
        if (j.contains("pid_file")) pid_file = j["pid_file"].get<std::string>();
        if (j.contains("log_file")) log_file = j["log_file"].get<std::string>();
        if (j.contains("metrics_file")) metrics_file = j["metrics_file"].get<std::string>();
        if (j.contains("metrics_interval")) metrics_interval_secs = j["metrics_interval"].get<size_t>();

        if (j.contains("backend") && j["backend"].is_object()) {
            auto& jb = j["backend"];
            if (jb.contains("type")) backend.type = jb["type"].get<std::string>();
            for (auto& [key, val] : jb.items()) {
                if (key == "type") continue;
                if (val.is_boolean()) {
                    backend.params[key] = val.get<bool>() ? "true" : "false";
                } else {
                    backend.params[key] = val.get<std::string>();
                }
            }
        }

        return true;
    } catch (const std::exception& e) {
        std::cerr << "Error parsing config: " << e.what() << "\n";
        return false;
    }
}

void BridgeConfig::apply_defaults() {
    if (base_url.empty()) {
        std::string host = listen_address == "0.0.0.0" ? "localhost" : listen_address;
        base_url = "http://" + host + ":" + std::to_string(port);
    }

    if (backend.param("credentials_file").empty() && backend.param("token").empty()) {
        if (const char* v = std::getenv("GOOGLE_APPLICATION_CREDENTIALS")) {
            backend.params["credentials_file"] = v;
        }
    }
}

std::string BridgeConfig::validate() const {
    auto err = backend.validate();
    if (!err.empty()) return "backend: " + err;
    if (worker_threads == 0) return "workers must be > 0";
    if (chunk_size < constants::BACKEND_CHUNK_GRANULARITY)
        return "chunk_size must be at least " + std::to_string(constants::BACKEND_CHUNK_GRANULARITY);
    if (chunk_size % constants::BACKEND_CHUNK_GRANULARITY != 0)
        return "chunk_size must be a multiple of " + std::to_string(constants::BACKEND_CHUNK_GRANULARITY);
    if (max_upload_size == 0) return "max_size must be > 0";
    if (max_retries < 1) return "max_retries must be >= 1";
    if (session_ttl.count() <= 0) return "session_ttl must be > 0";
    if (!state_dir.empty() && std::filesystem::exists(state_dir) &&
        !std::filesystem::is_directory(state_dir))
        return "state_dir is not a directory: " + state_dir.string();
    return {};
}

}  // namespace tusgate
