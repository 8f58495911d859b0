#pragma once

#include "tusgate/upload/upload_session.hpp"

#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

struct sqlite3;
struct sqlite3_stmt;

namespace tusgate {

class SessionStore;

// One file slot. The operation mutex serializes mutating requests
// (create/patch/upload/remove); the state mutex guards the record itself and
// is only held for copies, so Head never waits on an in-flight append.
class UploadSlot {
public:
    UploadSlot(std::string slot_id, SessionStore* store);

    const std::string& slot_id() const { return slot_id_; }

    std::unique_lock<std::mutex> lock_operations() {
        return std::unique_lock<std::mutex>(op_mutex_);
    }
    std::unique_lock<std::mutex> try_lock_operations() {
        return std::unique_lock<std::mutex>(op_mutex_, std::try_to_lock);
    }

    UploadSession snapshot() const;

    // Applies f to the record under the state mutex, stamps last_activity and
    // writes the result through to the store.
    template <typename F>
    void mutate(F&& f) {
        UploadSession copy;
        {
            std::lock_guard lock(state_mutex_);
            f(session_);
            session_.last_activity = std::chrono::system_clock::now();
            if (retired_) return;
            copy = session_;
        }
        persist(copy);
    }

    // Set once the slot is dropped from the store; a retired slot is never
    // written back.
    bool retired() const;
    void retire();

    // Loaded from disk; no write-through
    void restore(const UploadSession& session);

private:
    void persist(const UploadSession& session);

    std::string slot_id_;
    SessionStore* store_;
    std::mutex op_mutex_;
    mutable std::mutex state_mutex_;
    UploadSession session_;
    bool retired_ = false;
};

// Slot registry, optionally backed by SQLite ({state_dir}/sessions.db)
class SessionStore {
public:
    SessionStore();
    ~SessionStore();

    SessionStore(const SessionStore&) = delete;
    SessionStore& operator=(const SessionStore&) = delete;

    // Opens the database and loads existing sessions. Returns an error
    // message, empty on success.
    std::string open(const std::filesystem::path& state_dir);
    bool persistent() const { return db_ != nullptr; }

    std::shared_ptr<UploadSlot> get_or_create(const std::string& slot_id);
    std::shared_ptr<UploadSlot> find(const std::string& slot_id) const;
    void remove(const std::string& slot_id);
    std::vector<std::shared_ptr<UploadSlot>> all_slots() const;

    size_t size() const;
    size_t count_in_state(UploadState state) const;

    // Write-through from UploadSlot::mutate
    void save(const UploadSession& session);

private:
    void load_all();
    void erase_row(const std::string& slot_id);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<UploadSlot>> slots_;

    std::mutex db_mutex_;
    sqlite3* db_ = nullptr;
    sqlite3_stmt* stmt_upsert_ = nullptr;
    sqlite3_stmt* stmt_delete_ = nullptr;
};

} // namespace tusgate
