#pragma once

#include "tusgate/core/constants.hpp"
#include "tusgate/core/context.hpp"
#include "tusgate/upload/byte_stream.hpp"
#include "tusgate/upload/upload_session.hpp"

#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>

namespace tusgate {

class BackendSessionClient;
class CleanupQueue;
class SessionStore;
class UploadSlot;
class UploadEventSink;

struct UploadPolicy {
    size_t chunk_size = constants::DEFAULT_CHUNK_SIZE;
    int max_retries = constants::DEFAULT_MAX_RETRIES;
    std::chrono::milliseconds retry_backoff = constants::DEFAULT_RETRY_BACKOFF;
    uint64_t max_size = constants::DEFAULT_MAX_UPLOAD_SIZE;
    std::chrono::seconds session_ttl = constants::DEFAULT_SESSION_TTL;
    size_t granularity = constants::BACKEND_CHUNK_GRANULARITY;
};

// Drives one slot's upload through
//   Uninitialized -> Initiating -> Appending -> Finalizing -> Finalized
// with Failed as the terminal error state. Every mutating operation holds the
// slot's operation lock for its whole duration.
class UploadMachine {
public:
    struct Stats {
        uint64_t sessions_opened = 0;
        uint64_t uploads_completed = 0;
        uint64_t uploads_failed = 0;
        uint64_t bytes_accepted = 0;
        uint64_t chunks_complete = 0;
        uint64_t chunks_continue = 0;
        uint64_t chunks_transient = 0;
        uint64_t sessions_expired = 0;
        uint64_t objects_removed = 0;
    };

    UploadMachine(BackendSessionClient& backend,
                  SessionStore& store,
                  CleanupQueue& cleanup,
                  UploadEventSink* events,
                  const UploadPolicy& policy = {});

    // Opens a fresh backend session for the slot, replacing any previous one.
    // Throws UploadTooLargeError, BackendAuthError, BackendRequestError.
    UploadSession begin(const RequestContext& ctx, const std::string& slot_id,
                        const UploadDescriptor& descriptor);

    // Streams up to length bytes from source into the backend session starting
    // at client_offset. Returns the backend-confirmed offset afterwards, which
    // may trail client_offset + length; the client resumes from there.
    uint64_t append(const RequestContext& ctx, const std::string& slot_id,
                    uint64_t client_offset, ByteSource& source, uint64_t length);

    // begin() followed by a single append() of the whole body, atomically
    UploadSession upload(const RequestContext& ctx, const std::string& slot_id,
                         const UploadDescriptor& descriptor, ByteSource& source);

    // Deletes the committed object and forgets the slot. Throws NoContentError.
    void remove(const RequestContext& ctx, const std::string& slot_id);

    // Read-only snapshot. Throws NoUploadError.
    UploadSession status(const std::string& slot_id) const;

    // Sweeps sessions whose TTL has passed; returns how many were retired
    size_t expire_abandoned(std::chrono::system_clock::time_point now);

    Stats stats() const;
    const UploadPolicy& policy() const { return policy_; }

private:
    UploadSession begin_locked(const RequestContext& ctx, UploadSlot& slot,
                               const UploadDescriptor& descriptor);
    uint64_t append_locked(const RequestContext& ctx, UploadSlot& slot,
                           uint64_t client_offset, ByteSource& source, uint64_t length);
    void finalize(const RequestContext& ctx, UploadSlot& slot);
    void fail(UploadSlot& slot);

    BackendSessionClient& backend_;
    SessionStore& store_;
    CleanupQueue& cleanup_;
    UploadEventSink* events_;
    UploadPolicy policy_;

    mutable std::mutex stats_mutex_;
    Stats stats_;
};

} // namespace tusgate
