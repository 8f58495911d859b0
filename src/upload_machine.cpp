#include "tusgate/upload/upload_machine.hpp"
#include "tusgate/core/errors.hpp"
#include "tusgate/core/log.hpp"
#include "tusgate/storage/session_client.hpp"
#include "tusgate/upload/cleanup_queue.hpp"
#include "tusgate/upload/events.hpp"
#include "tusgate/upload/session_store.hpp"

#include <algorithm>
#include <map>
#include <thread>

namespace tusgate {

namespace {

std::string make_object_key(const RequestContext& ctx) {
    if (ctx.tenant_id.empty()) {
        return random_hex_token();
    }
    return ctx.tenant_id + "/" + random_hex_token();
}

}  // namespace

UploadMachine::UploadMachine(BackendSessionClient& backend,
                             SessionStore& store,
                             CleanupQueue& cleanup,
                             UploadEventSink* events,
                             const UploadPolicy& policy)
    : backend_(backend), store_(store), cleanup_(cleanup), events_(events), policy_(policy) {
    if (policy_.chunk_size == 0) policy_.chunk_size = constants::DEFAULT_CHUNK_SIZE;
    if (policy_.max_retries < 1) policy_.max_retries = 1;
}

// --- begin ---

UploadSession UploadMachine::begin(const RequestContext& ctx, const std::string& slot_id,
                                   const UploadDescriptor& descriptor) {
    if (descriptor.declared_size > policy_.max_size) {
        throw UploadTooLargeError(descriptor.declared_size, policy_.max_size);
    }

    auto slot = store_.get_or_create(slot_id);
    auto lock = slot->lock_operations();
    while (slot->retired()) {
        // Removed while we waited; start over on the replacement slot
        lock.unlock();
        slot = store_.get_or_create(slot_id);
        lock = slot->lock_operations();
    }
    return begin_locked(ctx, *slot, descriptor);
}

UploadSession UploadMachine::begin_locked(const RequestContext& ctx, UploadSlot& slot,
                                          const UploadDescriptor& descriptor) {
    if (descriptor.declared_size > policy_.max_size) {
        throw UploadTooLargeError(descriptor.declared_size, policy_.max_size);
    }

    // One backend session per slot: retire the previous in-flight object first
    auto previous = slot.snapshot();
    if (!previous.pending_object_key.empty()) {
        RequestContext owner = ctx;
        owner.tenant_id = previous.tenant_id;
        backend_.delete_object(owner, previous.pending_object_key);
    }

    std::string object_key = make_object_key(ctx);
    std::string content_type = descriptor.content_type.empty()
        ? constants::DEFAULT_CONTENT_TYPE : descriptor.content_type;
    auto now = std::chrono::system_clock::now();

    slot.mutate([&](UploadSession& s) {
        s.tenant_id = ctx.tenant_id;
        s.state = UploadState::Initiating;
        s.declared_size = descriptor.declared_size;
        s.bytes_accepted = 0;
        s.backend_session_uri.clear();
        s.pending_object_key = object_key;
        s.content_type = content_type;
        s.filename = descriptor.filename;
        s.extension = descriptor.extension;
        s.md5 = descriptor.md5;
        s.session_created = now;
    });

    std::map<std::string, std::string> metadata = {
        {"CREATOR", ctx.principal},
        {"REQUEST", ctx.request_id},
        {"NAME", descriptor.filename},
    };

    std::string session_uri;
    try {
        session_uri = backend_.open_session(ctx, object_key, content_type,
                                            descriptor.declared_size, metadata);
    } catch (const BridgeError& e) {
        log_error("slot %s: cannot open backend session: %s", slot.slot_id().c_str(), e.what());
        fail(slot);
        throw;
    }

    slot.mutate([&](UploadSession& s) {
        s.backend_session_uri = session_uri;
        s.state = UploadState::Appending;
    });

    {
        std::lock_guard lock(stats_mutex_);
        stats_.sessions_opened++;
    }

    log_info("slot %s: upload session opened for %s (%llu bytes)", slot.slot_id().c_str(),
             object_key.c_str(), static_cast<unsigned long long>(descriptor.declared_size));

    if (events_) {
        try {
            events_->on_upload_initiated(ctx, slot.slot_id());
        } catch (const std::exception& e) {
            log_warn("slot %s: upload-initiated listener failed: %s", slot.slot_id().c_str(), e.what());
        }
    }

    return slot.snapshot();
}

// --- append ---

uint64_t UploadMachine::append(const RequestContext& ctx, const std::string& slot_id,
                               uint64_t client_offset, ByteSource& source, uint64_t length) {
    auto slot = store_.find(slot_id);
    if (!slot) {
        throw NoUploadError(slot_id);
    }
    auto lock = slot->lock_operations();
    if (slot->retired()) {
        throw NoUploadError(slot_id);
    }
    return append_locked(ctx, *slot, client_offset, source, length);
}

uint64_t UploadMachine::append_locked(const RequestContext& ctx, UploadSlot& slot,
                                      uint64_t client_offset, ByteSource& source,
                                      uint64_t length) {
    const auto s = slot.snapshot();

    switch (s.state) {
        case UploadState::Uninitialized:
            throw NoUploadError(slot.slot_id());
        case UploadState::Failed:
            throw UploadGoneError("upload for " + slot.slot_id() + " failed; create a new one");
        case UploadState::Initiating:
        case UploadState::Finalizing:
            throw UploadGoneError("upload for " + slot.slot_id() + " was interrupted; create a new one");
        case UploadState::Finalized:
            // A re-sent final Patch whose response got lost
            if (client_offset == s.bytes_accepted) {
                return s.bytes_accepted;
            }
            throw OffsetMismatchError(s.bytes_accepted, client_offset);
        case UploadState::Appending:
            break;
    }

    if (s.expired(std::chrono::system_clock::now(), policy_.session_ttl)) {
        fail(slot);
        throw UploadGoneError("upload session for " + slot.slot_id() + " expired");
    }

    if (client_offset != s.bytes_accepted) {
        throw OffsetMismatchError(s.bytes_accepted, client_offset);
    }

    const uint64_t declared = s.declared_size.value_or(0);
    const std::string& session_uri = s.backend_session_uri;

    // Bytes beyond the declared size are never read
    uint64_t client_remaining = std::min<uint64_t>(length, declared - client_offset);

    std::vector<uint8_t> buf;
    buf.reserve(policy_.chunk_size);
    uint64_t buf_start = client_offset;   // object offset of buf[0]

    auto top_up = [&]() {
        if (client_remaining == 0 || buf.size() >= policy_.chunk_size) return;
        size_t want = static_cast<size_t>(
            std::min<uint64_t>(policy_.chunk_size - buf.size(), client_remaining));
        size_t got = read_append(source, buf, want);
        client_remaining -= got;
        if (got < want) {
            // Short body: accept what arrived
            client_remaining = 0;
        }
    };

    int failures = 0;
    auto backoff = policy_.retry_backoff;

    while (true) {
        top_up();

        const bool is_tail = buf_start + buf.size() == declared;
        size_t send_len = buf.size();
        if (!is_tail && policy_.granularity > 0) {
            send_len -= send_len % policy_.granularity;
        }
        if (send_len == 0 && !is_tail) {
            // Leftover below backend granularity; the client re-sends it
            break;
        }

        std::span<const uint8_t> chunk(buf.data(), send_len);
        ChunkResult result = backend_.append_chunk(session_uri, chunk, buf_start, declared);

        if (result.status == ChunkStatus::Complete) {
            {
                std::lock_guard lock(stats_mutex_);
                stats_.chunks_complete++;
                stats_.bytes_accepted += declared - buf_start;
            }
            slot.mutate([&](UploadSession& rec) {
                rec.bytes_accepted = declared;
                rec.state = UploadState::Finalizing;
            });
            finalize(ctx, slot);
            return declared;
        }

        if (result.status == ChunkStatus::Continue) {
            uint64_t accepted = result.accepted_offset;
            {
                std::lock_guard lock(stats_mutex_);
                stats_.chunks_continue++;
            }

            if (accepted < buf_start || accepted > declared) {
                // Backend lost confirmed bytes or claims more than exist
                log_warn("slot %s: backend acknowledged offset %llu outside [%llu, %llu]",
                         slot.slot_id().c_str(), static_cast<unsigned long long>(accepted),
                         static_cast<unsigned long long>(buf_start),
                         static_cast<unsigned long long>(declared));
            } else if (accepted > buf_start) {
                uint64_t progress = accepted - buf_start;
                {
                    std::lock_guard lock(stats_mutex_);
                    stats_.bytes_accepted += progress;
                }

                if (progress <= buf.size()) {
                    buf.erase(buf.begin(), buf.begin() + static_cast<std::ptrdiff_t>(progress));
                } else {
                    // Backend already holds bytes this request has not delivered yet
                    uint64_t excess = progress - buf.size();
                    buf.clear();
                    uint64_t skipped = skip(source, std::min(excess, client_remaining));
                    client_remaining -= skipped;
                }
                buf_start = accepted;
                slot.mutate([&](UploadSession& rec) { rec.bytes_accepted = accepted; });

                failures = 0;
                backoff = policy_.retry_backoff;
                continue;
            }
            // No progress or a regressed offset: counts against the retry budget
        } else {
            std::lock_guard lock(stats_mutex_);
            stats_.chunks_transient++;
        }

        ++failures;
        log_warn("slot %s: chunk at %llu not accepted (HTTP %d%s%s), attempt %d/%d",
                 slot.slot_id().c_str(), static_cast<unsigned long long>(buf_start),
                 result.http_status, result.error_message.empty() ? "" : ": ",
                 result.error_message.c_str(), failures, policy_.max_retries);

        if (failures >= policy_.max_retries) {
            fail(slot);
            throw MaxRetriesExceeded(failures);
        }

        std::this_thread::sleep_for(backoff);
        backoff *= 2;
    }

    return buf_start;
}

// --- finalize ---

void UploadMachine::finalize(const RequestContext& ctx, UploadSlot& slot) {
    const auto before = slot.snapshot();
    const std::string retired = before.finalized_object_key;

    slot.mutate([](UploadSession& s) {
        s.finalized_object_key = s.pending_object_key;
        s.finalized_size = s.declared_size.value_or(s.bytes_accepted);
        s.pending_object_key.clear();
        s.backend_session_uri.clear();
        s.state = UploadState::Finalized;
    });

    if (!retired.empty() && retired != before.pending_object_key) {
        RequestContext owner = ctx;
        owner.tenant_id = before.tenant_id;
        cleanup_.schedule(owner, retired);
    }

    {
        std::lock_guard lock(stats_mutex_);
        stats_.uploads_completed++;
    }

    log_info("slot %s: upload finalized as %s (%llu bytes)", slot.slot_id().c_str(),
             before.pending_object_key.c_str(),
             static_cast<unsigned long long>(before.declared_size.value_or(0)));

    if (events_) {
        try {
            events_->on_upload_finalized(ctx, slot.slot_id());
        } catch (const std::exception& e) {
            log_warn("slot %s: upload-finalized listener failed: %s", slot.slot_id().c_str(), e.what());
        }
    }
}

void UploadMachine::fail(UploadSlot& slot) {
    slot.mutate([](UploadSession& s) { s.state = UploadState::Failed; });
    std::lock_guard lock(stats_mutex_);
    stats_.uploads_failed++;
}

// --- upload (single request) ---

UploadSession UploadMachine::upload(const RequestContext& ctx, const std::string& slot_id,
                                    const UploadDescriptor& descriptor, ByteSource& source) {
    if (descriptor.declared_size > policy_.max_size) {
        throw UploadTooLargeError(descriptor.declared_size, policy_.max_size);
    }

    auto slot = store_.get_or_create(slot_id);
    auto lock = slot->lock_operations();
    while (slot->retired()) {
        lock.unlock();
        slot = store_.get_or_create(slot_id);
        lock = slot->lock_operations();
    }
    begin_locked(ctx, *slot, descriptor);
    append_locked(ctx, *slot, 0, source, descriptor.declared_size);
    return slot->snapshot();
}

// --- remove ---

void UploadMachine::remove(const RequestContext& ctx, const std::string& slot_id) {
    auto slot = store_.find(slot_id);
    if (!slot) {
        throw NoContentError(slot_id);
    }
    auto lock = slot->lock_operations();
    const auto s = slot->snapshot();
    if (slot->retired() || s.finalized_object_key.empty()) {
        throw NoContentError(slot_id);
    }

    RequestContext owner = ctx;
    owner.tenant_id = s.tenant_id;
    backend_.delete_object(owner, s.finalized_object_key);
    if (!s.pending_object_key.empty()) {
        backend_.delete_object(owner, s.pending_object_key);
    }
    store_.remove(slot_id);

    {
        std::lock_guard stats_lock(stats_mutex_);
        stats_.objects_removed++;
    }
    log_info("slot %s: removed %s", slot_id.c_str(), s.finalized_object_key.c_str());
}

// --- status ---

UploadSession UploadMachine::status(const std::string& slot_id) const {
    auto slot = store_.find(slot_id);
    if (!slot) {
        throw NoUploadError(slot_id);
    }
    auto s = slot->snapshot();
    if (s.state == UploadState::Uninitialized) {
        throw NoUploadError(slot_id);
    }
    return s;
}

// --- sweep ---

size_t UploadMachine::expire_abandoned(std::chrono::system_clock::time_point now) {
    size_t retired = 0;

    for (const auto& slot : store_.all_slots()) {
        // Busy slots are live by definition
        auto lock = slot->try_lock_operations();
        if (!lock.owns_lock()) continue;

        const auto s = slot->snapshot();
        bool abandoned = s.state == UploadState::Initiating ||
                         s.state == UploadState::Appending ||
                         s.state == UploadState::Failed;
        if (!abandoned || !s.expired(now, policy_.session_ttl)) continue;

        RequestContext owner{s.tenant_id, "", "sweep"};
        if (!s.pending_object_key.empty()) {
            backend_.delete_object(owner, s.pending_object_key);
        }

        if (!s.finalized_object_key.empty()) {
            slot->mutate([](UploadSession& rec) {
                rec.pending_object_key.clear();
                rec.backend_session_uri.clear();
                rec.declared_size = rec.finalized_size;
                rec.bytes_accepted = rec.finalized_size;
                rec.state = UploadState::Finalized;
            });
        } else {
            store_.remove(slot->slot_id());
        }

        log_info("slot %s: abandoned %s session expired", slot->slot_id().c_str(), to_string(s.state));
        ++retired;
    }

    if (retired > 0) {
        std::lock_guard lock(stats_mutex_);
        stats_.sessions_expired += retired;
    }
    return retired;
}

UploadMachine::Stats UploadMachine::stats() const {
    std::lock_guard lock(stats_mutex_);
    return stats_;
}

} // namespace tusgate
