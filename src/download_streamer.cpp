#include "tusgate/upload/download_streamer.hpp"
#include "tusgate/core/constants.hpp"
#include "tusgate/core/errors.hpp"
#include "tusgate/core/log.hpp"
#include "tusgate/storage/session_client.hpp"
#include "tusgate/upload/session_store.hpp"

namespace tusgate {

DownloadStreamer::DownloadStreamer(BackendSessionClient& backend, SessionStore& store)
    : backend_(backend), store_(store) {}

DownloadInfo DownloadStreamer::stream(const RequestContext& ctx, const std::string& slot_id,
                                      ByteSink& sink, const HeadersCallback& on_headers,
                                      const ProgressCallback& on_progress) {
    auto slot = store_.find(slot_id);
    if (!slot) {
        throw NoContentError(slot_id);
    }
    const auto s = slot->snapshot();

    DownloadInfo info;
    info.object_key = !s.finalized_object_key.empty() ? s.finalized_object_key : s.pending_object_key;
    if (info.object_key.empty()) {
        throw NoContentError(slot_id);
    }
    info.content_type = s.content_type.empty() ? constants::DEFAULT_CONTENT_TYPE : s.content_type;
    info.filename = s.filename;
    if (info.filename.empty()) {
        info.filename = s.extension.empty() ? slot_id : slot_id + "." + s.extension;
    }

    RequestContext owner = ctx;
    owner.tenant_id = s.tenant_id;

    uint64_t sent = 0;
    try {
        auto reader = backend_.open_download(owner, info.object_key);
        info.size = reader->total_size();
        if (!info.size && !s.finalized_object_key.empty()) {
            info.size = s.finalized_size;
        }

        if (on_headers) on_headers(info);

        while (auto chunk = reader->next_chunk()) {
            sink.write(*chunk);
            sent += chunk->size();
            if (on_progress) on_progress(sent, reader->total_size());
        }
    } catch (const std::exception& e) {
        log_warn("slot %s: download of %s aborted after %llu bytes: %s", slot_id.c_str(),
                 info.object_key.c_str(), static_cast<unsigned long long>(sent), e.what());
        std::lock_guard lock(stats_mutex_);
        stats_.downloads_failed++;
        stats_.bytes_sent += sent;
        throw;
    }

    {
        std::lock_guard lock(stats_mutex_);
        stats_.downloads_completed++;
        stats_.bytes_sent += sent;
    }
    log_debug("slot %s: streamed %llu bytes of %s", slot_id.c_str(),
              static_cast<unsigned long long>(sent), info.object_key.c_str());
    return info;
}

DownloadStreamer::Stats DownloadStreamer::stats() const {
    std::lock_guard lock(stats_mutex_);
    return stats_;
}

} // namespace tusgate
