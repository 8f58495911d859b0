#include "tusgate/metrics.hpp"
#include "tusgate/core/log.hpp"
#include "tusgate/server/http_server.hpp"
#include "tusgate/upload/cleanup_queue.hpp"
#include "tusgate/upload/download_streamer.hpp"
#include "tusgate/upload/session_store.hpp"
#include "tusgate/upload/upload_machine.hpp"

#include <fstream>
#include <prometheus/text_serializer.h>

namespace tusgate {

namespace {

// Advance a counter by the growth of a monotonically increasing source value
void bump(prometheus::Counter* counter, uint64_t current, uint64_t& previous) {
    if (current > previous) {
        counter->Increment(static_cast<double>(current - previous));
        previous = current;
    }
}

}  // namespace

MetricsExporter::MetricsExporter(const std::filesystem::path& prom_file_path,
                                 std::chrono::seconds write_interval,
                                 const std::map<std::string, std::string>& labels)
    : prom_file_path_(prom_file_path)
    , write_interval_(write_interval)
    , registry_(std::make_shared<prometheus::Registry>()) {

    // --- Counters ---

    auto& uploads_family = prometheus::BuildCounter()
        .Name("tusgate_uploads_total")
        .Help("Uploads that reached a terminal state")
        .Labels(labels)
        .Register(*registry_);
    uploads_success_ = &uploads_family.Add({{"result", "success"}});
    uploads_failure_ = &uploads_family.Add({{"result", "failure"}});

    upload_bytes_total_ = &prometheus::BuildCounter()
        .Name("tusgate_upload_bytes_total")
        .Help("Bytes confirmed by the backend")
        .Labels(labels)
        .Register(*registry_)
        .Add({});

    auto& chunks_family = prometheus::BuildCounter()
        .Name("tusgate_chunk_appends_total")
        .Help("Backend chunk appends by outcome")
        .Labels(labels)
        .Register(*registry_);
    chunks_complete_ = &chunks_family.Add({{"status", "complete"}});
    chunks_continue_ = &chunks_family.Add({{"status", "continue"}});
    chunks_transient_ = &chunks_family.Add({{"status", "transient"}});

    auto& sessions_family = prometheus::BuildCounter()
        .Name("tusgate_sessions_total")
        .Help("Resumable session lifecycle events")
        .Labels(labels)
        .Register(*registry_);
    sessions_opened_ = &sessions_family.Add({{"event", "opened"}});
    sessions_expired_ = &sessions_family.Add({{"event", "expired"}});
    objects_removed_ = &sessions_family.Add({{"event", "removed"}});

    auto& downloads_family = prometheus::BuildCounter()
        .Name("tusgate_downloads_total")
        .Help("Downloads by result")
        .Labels(labels)
        .Register(*registry_);
    downloads_success_ = &downloads_family.Add({{"result", "success"}});
    downloads_failure_ = &downloads_family.Add({{"result", "failure"}});

    download_bytes_total_ = &prometheus::BuildCounter()
        .Name("tusgate_download_bytes_total")
        .Help("Bytes streamed to clients")
        .Labels(labels)
        .Register(*registry_)
        .Add({});

    cleanup_deletes_ = &prometheus::BuildCounter()
        .Name("tusgate_cleanup_deletes_total")
        .Help("Best-effort object deletes issued")
        .Labels(labels)
        .Register(*registry_)
        .Add({});

    auto& requests_family = prometheus::BuildCounter()
        .Name("tusgate_http_requests_total")
        .Help("HTTP requests handled by the front end")
        .Labels(labels)
        .Register(*registry_);
    requests_served_ = &requests_family.Add({{"result", "served"}});
    requests_bad_ = &requests_family.Add({{"result", "bad_request"}});

    // --- Gauges ---

    auto gauge_reg = [&](const std::string& name, const std::string& help) -> prometheus::Gauge& {
        return prometheus::BuildGauge()
            .Name(name)
            .Help(help)
            .Labels(labels)
            .Register(*registry_)
            .Add({});
    };

    sessions_active_ = &gauge_reg("tusgate_sessions_active", "Sessions accepting Patch requests");
    sessions_total_ = &gauge_reg("tusgate_sessions_tracked", "Upload slots tracked by the store");
    cleanup_pending_ = &gauge_reg("tusgate_cleanup_queue_pending", "Deletes waiting in the cleanup queue");

    // --- Histograms ---

    request_duration_ = &prometheus::BuildHistogram()
        .Name("tusgate_request_duration_seconds")
        .Help("HTTP request duration in seconds")
        .Labels(labels)
        .Register(*registry_)
        .Add({}, prometheus::Histogram::BucketBoundaries{
            0.005, 0.01, 0.05, 0.1, 0.25, 0.5, 1, 2.5, 5, 10, 30, 60, 300});
}

MetricsExporter::~MetricsExporter() {
    stop();
}

void MetricsExporter::start() {
    {
        std::lock_guard lock(cv_mutex_);
        if (running_) return;
        running_ = true;
    }
    writer_thread_ = std::thread(&MetricsExporter::writer_loop, this);
}

void MetricsExporter::stop() {
    bool was_running = false;
    {
        std::lock_guard lock(cv_mutex_);
        was_running = running_;
        running_ = false;
    }
    if (was_running) {
        cv_.notify_all();
        if (writer_thread_.joinable()) {
            writer_thread_.join();
        }
    }
    // Always write a final snapshot
    write_now();
}

void MetricsExporter::write_now() {
    update_metrics();
    write_file();
}

void MetricsExporter::writer_loop() {
    while (true) {
        {
            std::unique_lock lock(cv_mutex_);
            cv_.wait_for(lock, write_interval_, [this] { return !running_; });
            if (!running_) break;
        }
        write_now();
    }
}

void MetricsExporter::update_metrics() {
    std::lock_guard lock(update_mutex_);

    if (machine_) {
        auto s = machine_->stats();
        bump(uploads_success_, s.uploads_completed, prev_.uploads_completed);
        bump(uploads_failure_, s.uploads_failed, prev_.uploads_failed);
        bump(upload_bytes_total_, s.bytes_accepted, prev_.upload_bytes);
        bump(chunks_complete_, s.chunks_complete, prev_.chunks_complete);
        bump(chunks_continue_, s.chunks_continue, prev_.chunks_continue);
        bump(chunks_transient_, s.chunks_transient, prev_.chunks_transient);
        bump(sessions_opened_, s.sessions_opened, prev_.sessions_opened);
        bump(sessions_expired_, s.sessions_expired, prev_.sessions_expired);
        bump(objects_removed_, s.objects_removed, prev_.objects_removed);
    }

    if (streamer_) {
        auto s = streamer_->stats();
        bump(downloads_success_, s.downloads_completed, prev_.downloads_completed);
        bump(downloads_failure_, s.downloads_failed, prev_.downloads_failed);
        bump(download_bytes_total_, s.bytes_sent, prev_.download_bytes);
    }

    if (cleanup_) {
        bump(cleanup_deletes_, cleanup_->deletes_issued(), prev_.cleanup_deletes);
        cleanup_pending_->Set(static_cast<double>(cleanup_->pending()));
    }

    if (store_) {
        sessions_active_->Set(static_cast<double>(
            store_->count_in_state(UploadState::Initiating) +
            store_->count_in_state(UploadState::Appending)));
        sessions_total_->Set(static_cast<double>(store_->size()));
    }

    if (server_) {
        auto s = server_->stats();
        bump(requests_served_, s.requests_served, prev_.requests_served);
        bump(requests_bad_, s.bad_requests, prev_.bad_requests);
    }
}

void MetricsExporter::write_file() {
    auto tmp_path = prom_file_path_;
    tmp_path += ".tmp";

    prometheus::TextSerializer serializer;
    auto metrics = registry_->Collect();

    std::ofstream ofs(tmp_path, std::ios::trunc);
    if (!ofs) {
        log_debug("metrics: cannot open %s", tmp_path.c_str());
        return;
    }
    ofs << serializer.Serialize(metrics);
    ofs.close();
    if (!ofs.good()) return;

    std::error_code ec;
    std::filesystem::rename(tmp_path, prom_file_path_, ec);
    if (ec) {
        log_debug("metrics: rename to %s failed: %s", prom_file_path_.c_str(), ec.message().c_str());
    }
}

}  // namespace tusgate
