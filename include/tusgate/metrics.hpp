#pragma once

#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include <prometheus/counter.h>
#include <prometheus/gauge.h>
#include <prometheus/histogram.h>
#include <prometheus/registry.h>

namespace tusgate {

class CleanupQueue;
class DownloadStreamer;
class HttpServer;
class SessionStore;
class UploadMachine;

/// Exports tusgate metrics to a Prometheus textfile for node_exporter pickup.
///
/// Counters are fed from the stats snapshots of the upload machine, download
/// streamer, cleanup queue and HTTP server as deltas since the last write.
/// The file is replaced atomically (temp + rename).
class MetricsExporter {
public:
    MetricsExporter(const std::filesystem::path& prom_file_path,
                    std::chrono::seconds write_interval,
                    const std::map<std::string, std::string>& labels);
    ~MetricsExporter();

    MetricsExporter(const MetricsExporter&) = delete;
    MetricsExporter& operator=(const MetricsExporter&) = delete;

    // Sources for snapshots (not owned)
    void set_machine(UploadMachine* machine) { machine_ = machine; }
    void set_streamer(DownloadStreamer* streamer) { streamer_ = streamer; }
    void set_cleanup(CleanupQueue* cleanup) { cleanup_ = cleanup; }
    void set_store(SessionStore* store) { store_ = store; }
    void set_server(HttpServer* server) { server_ = server; }

    void start();

    /// Stop the writer thread (writes one final snapshot).
    void stop();

    /// Pull the current stats and write the file once.
    void write_now();

    prometheus::Histogram& request_duration() { return *request_duration_; }

private:
    void writer_loop();
    void update_metrics();
    void write_file();

    std::filesystem::path prom_file_path_;
    std::chrono::seconds write_interval_;

    std::shared_ptr<prometheus::Registry> registry_;

    UploadMachine* machine_ = nullptr;
    DownloadStreamer* streamer_ = nullptr;
    CleanupQueue* cleanup_ = nullptr;
    SessionStore* store_ = nullptr;
    HttpServer* server_ = nullptr;

    // Previous snapshot values for delta computation
    struct Previous {
        uint64_t uploads_completed = 0;
        uint64_t uploads_failed = 0;
        uint64_t upload_bytes = 0;
        uint64_t chunks_complete = 0;
        uint64_t chunks_continue = 0;
        uint64_t chunks_transient = 0;
        uint64_t sessions_opened = 0;
        uint64_t sessions_expired = 0;
        uint64_t objects_removed = 0;
        uint64_t downloads_completed = 0;
        uint64_t downloads_failed = 0;
        uint64_t download_bytes = 0;
        uint64_t cleanup_deletes = 0;
        uint64_t requests_served = 0;
        uint64_t bad_requests = 0;
    };
    Previous prev_;
    std::mutex update_mutex_;

    // --- Counters ---
    prometheus::Counter* uploads_success_;
    prometheus::Counter* uploads_failure_;
    prometheus::Counter* upload_bytes_total_;
    prometheus::Counter* chunks_complete_;
    prometheus::Counter* chunks_continue_;
    prometheus::Counter* chunks_transient_;
    prometheus::Counter* sessions_opened_;
    prometheus::Counter* sessions_expired_;
    prometheus::Counter* objects_removed_;
    prometheus::Counter* downloads_success_;
    prometheus::Counter* downloads_failure_;
    prometheus::Counter* download_bytes_total_;
    prometheus::Counter* cleanup_deletes_;
    prometheus::Counter* requests_served_;
    prometheus::Counter* requests_bad_;

    // --- Gauges ---
    prometheus::Gauge* sessions_active_;
    prometheus::Gauge* sessions_total_;
    prometheus::Gauge* cleanup_pending_;

    // --- Histograms ---
    prometheus::Histogram* request_duration_;

    std::thread writer_thread_;
    std::mutex cv_mutex_;
    std::condition_variable cv_;
    bool running_ = false;
};

}  // namespace tusgate
