#pragma once

#include "tusgate/core/context.hpp"
#include "tusgate/upload/byte_stream.hpp"

#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>

namespace tusgate {

class BackendSessionClient;
class SessionStore;

struct DownloadInfo {
    std::string object_key;
    std::string content_type;
    std::string filename;
    std::optional<uint64_t> size;
};

// Streams a slot's stored object to a client sink, one backend chunk at a
// time. The next chunk is only requested after the sink accepted the
// previous one.
class DownloadStreamer {
public:
    struct Stats {
        uint64_t downloads_completed = 0;
        uint64_t downloads_failed = 0;
        uint64_t bytes_sent = 0;
    };

    // Invoked once, after the object was found and before the first byte
    using HeadersCallback = std::function<void(const DownloadInfo&)>;
    using ProgressCallback = std::function<void(uint64_t sent, std::optional<uint64_t> total)>;

    DownloadStreamer(BackendSessionClient& backend, SessionStore& store);

    // Throws NoContentError when the slot has no stored object
    DownloadInfo stream(const RequestContext& ctx, const std::string& slot_id, ByteSink& sink,
                        const HeadersCallback& on_headers = {},
                        const ProgressCallback& on_progress = {});

    Stats stats() const;

private:
    BackendSessionClient& backend_;
    SessionStore& store_;

    mutable std::mutex stats_mutex_;
    Stats stats_;
};

} // namespace tusgate
