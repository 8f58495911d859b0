#include "tusgate/bridge_config.hpp"
#include "tusgate/core/log.hpp"
#include "tusgate/metrics.hpp"
#include "tusgate/net/http.hpp"
#include "tusgate/server/http_server.hpp"
#include "tusgate/server/protocol_adapter.hpp"
#include "tusgate/storage/bucket_resolver.hpp"
#include "tusgate/storage/credentials.hpp"
#include "tusgate/storage/session_client.hpp"
#include "tusgate/upload/cleanup_queue.hpp"
#include "tusgate/upload/download_streamer.hpp"
#include "tusgate/upload/events.hpp"
#include "tusgate/upload/session_store.hpp"
#include "tusgate/upload/upload_machine.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <fcntl.h>
#include <fstream>
#include <iostream>
#include <sys/stat.h>
#include <thread>
#include <unistd.h>

namespace {
volatile std::sig_atomic_t g_shutdown_requested = 0;

void signal_handler(int sig) {
    (void)sig;
    g_shutdown_requested = 1;
}

bool daemonize() {
    pid_t pid = fork();
    if (pid < 0) return false;
    if (pid > 0) _exit(0);  // Parent exits

    if (setsid() < 0) return false;

    // Second fork to prevent acquiring a controlling terminal
    pid = fork();
    if (pid < 0) return false;
    if (pid > 0) _exit(0);

    // stdout/stderr are redirected to the log file after this returns
    close(STDIN_FILENO);
    open("/dev/null", O_RDONLY);  // stdin = fd 0

    return true;
}

void write_pid_file(const std::filesystem::path& path) {
    std::ofstream ofs(path);
    if (ofs) {
        ofs << getpid() << "\n";
    }
}

bool is_secret_param(const std::string& key) {
    return key.find("token") != std::string::npos || key.find("credential") != std::string::npos;
}
}  // namespace

int main(int argc, char* argv[]) {
    auto config_opt = tusgate::BridgeConfig::from_args(argc, argv);
    if (!config_opt) {
        return 1;
    }
    auto config = std::move(*config_opt);

    auto err = config.validate();
    if (!err.empty()) {
        std::cerr << "Configuration error: " << err << "\n";
        return 1;
    }

    if (config.daemonize) {
        if (!daemonize()) {
            std::cerr << "Failed to daemonize" << std::endl;
            return 1;
        }
    }

    // Redirect log output if log file specified (after daemonize)
    if (!config.log_file.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(config.log_file.parent_path(), ec);
        FILE* log = fopen(config.log_file.c_str(), "a");
        if (log) {
            dup2(fileno(log), STDOUT_FILENO);
            dup2(fileno(log), STDERR_FILENO);
            fclose(log);
        }
    }

    tusgate::set_verbose_logging(config.verbose);

    std::cout << "tusgate starting..." << std::endl;
    std::cout << "  listen: " << config.listen_address << ":" << config.port << std::endl;
    std::cout << "  base-url: " << config.base_url << std::endl;
    std::cout << "  backend-type: " << config.backend.type << std::endl;
    for (auto& [k, v] : config.backend.params) {
        std::cout << "  backend-" << k << ": " << (is_secret_param(k) ? "****" : v) << std::endl;
    }
    std::cout << "  state-dir: "
              << (config.state_dir.empty() ? "(memory only)" : config.state_dir.string()) << std::endl;
    std::cout << "  chunk-size: " << config.chunk_size << std::endl;
    std::cout << "  max-size: " << config.max_upload_size << std::endl;
    std::cout << "  max-retries: " << config.max_retries << std::endl;
    std::cout << "  session-ttl: "
              << std::chrono::duration_cast<std::chrono::hours>(config.session_ttl).count()
              << "h" << std::endl;

    if (!config.pid_file.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(config.pid_file.parent_path(), ec);
        write_pid_file(config.pid_file);
    }

    struct sigaction sa;
    sa.sa_handler = signal_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);

    // --- Backend stack ---

    tusgate::net::HttpClientConfig http_config;
    http_config.verify_ssl_by_default = config.backend.param("verify_ssl", "true") != "false";
    http_config.default_ca_bundle = config.backend.param("ca_bundle");
    http_config.verbose = config.verbose;
    auto http = std::make_shared<tusgate::net::HttpClient>(http_config);

    std::shared_ptr<tusgate::TokenProvider> tokens = tusgate::make_token_provider(
        config.backend.param("token"), config.backend.param("credentials_file"), http);
    if (auto* sa_tokens = dynamic_cast<tusgate::ServiceAccountTokenProvider*>(tokens.get())) {
        err = sa_tokens->validate();
        if (!err.empty()) {
            std::cerr << "Failed to load credentials: " << err << std::endl;
            return 1;
        }
    }

    tusgate::GcsBucketResolver::Config bucket_config;
    bucket_config.base_bucket = config.backend.param("bucket");
    bucket_config.project_id = config.backend.param("project_id");
    bucket_config.endpoint = config.backend.param("endpoint");
    bucket_config.verify_ssl = http_config.verify_ssl_by_default;
    auto buckets = std::make_shared<tusgate::GcsBucketResolver>(bucket_config, http, tokens);

    auto backend_params = config.backend.params;
    backend_params["chunk_size"] = std::to_string(config.chunk_size);
    auto backend = tusgate::SessionClientFactory::create(config.backend.type, backend_params,
                                                         http, tokens, buckets);
    if (!backend) {
        std::cerr << "Unknown backend type: " << config.backend.type << std::endl;
        return 1;
    }

    // --- Upload core ---

    tusgate::SessionStore store;
    if (!config.state_dir.empty()) {
        err = store.open(config.state_dir);
        if (!err.empty()) {
            std::cerr << "Failed to open session store: " << err << std::endl;
            return 1;
        }
        std::cout << "  restored sessions: " << store.size() << std::endl;
    }

    tusgate::CleanupQueue cleanup(*backend);
    cleanup.start();

    tusgate::UploadPolicy policy;
    policy.chunk_size = config.chunk_size;
    policy.max_retries = config.max_retries;
    policy.retry_backoff = config.retry_backoff;
    policy.max_size = config.max_upload_size;
    policy.session_ttl = config.session_ttl;

    tusgate::LoggingEventSink events;
    tusgate::UploadMachine machine(*backend, store, cleanup, &events, policy);
    tusgate::DownloadStreamer streamer(*backend, store);

    tusgate::TusProtocolAdapter::Config adapter_config;
    adapter_config.base_url = config.base_url;
    tusgate::TusProtocolAdapter adapter(machine, streamer, adapter_config);

    tusgate::HttpServer::Config server_config;
    server_config.listen_address = config.listen_address;
    server_config.port = config.port;
    server_config.worker_threads = config.worker_threads;
    server_config.default_tenant = config.default_tenant;
    server_config.max_body_bytes = config.max_upload_size;
    tusgate::HttpServer server(server_config, adapter);

    // --- Metrics ---

    std::unique_ptr<tusgate::MetricsExporter> metrics;
    if (!config.metrics_file.empty()) {
        char hostname[256] = {};
        gethostname(hostname, sizeof(hostname) - 1);
        metrics = std::make_unique<tusgate::MetricsExporter>(
            config.metrics_file, std::chrono::seconds(config.metrics_interval_secs),
            std::map<std::string, std::string>{{"instance", hostname}});
        metrics->set_machine(&machine);
        metrics->set_streamer(&streamer);
        metrics->set_cleanup(&cleanup);
        metrics->set_store(&store);
        metrics->set_server(&server);
        auto* exporter = metrics.get();
        server.set_request_observer([exporter](std::chrono::duration<double> elapsed) {
            exporter->request_duration().Observe(elapsed.count());
        });
        metrics->start();
        std::cout << "  metrics-file: " << config.metrics_file << std::endl;
    }

    err = server.start();
    if (!err.empty()) {
        std::cerr << "Failed to start server: " << err << std::endl;
        if (metrics) metrics->stop();
        cleanup.stop();
        return 1;
    }

    std::cout << "tusgate running (PID " << getpid() << ")" << std::endl;

    // Wait until shutdown signal; sweep abandoned sessions on the interval.
    auto next_sweep = std::chrono::steady_clock::now() + config.sweep_interval;
    while (!g_shutdown_requested) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        if (std::chrono::steady_clock::now() >= next_sweep) {
            size_t expired = machine.expire_abandoned(std::chrono::system_clock::now());
            if (expired > 0) {
                tusgate::log_info("Expired %zu abandoned upload session(s)", expired);
            }
            next_sweep = std::chrono::steady_clock::now() + config.sweep_interval;
        }
    }

    server.stop();
    cleanup.stop();
    if (metrics) metrics->stop();

    if (!config.pid_file.empty()) {
        unlink(config.pid_file.c_str());
    }

    std::cout << "tusgate exited cleanly" << std::endl;
    return 0;
}
