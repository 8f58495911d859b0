#include "tusgate/upload/session_store.hpp"
#include "tusgate/core/log.hpp"

#include <sqlite3.h>

#include <chrono>
#include <thread>

namespace tusgate {

namespace {

constexpr const char* SESSIONS_SCHEMA = R"(
CREATE TABLE IF NOT EXISTS upload_sessions (
    slot_id TEXT PRIMARY KEY,
    tenant_id TEXT NOT NULL DEFAULT '',
    state TEXT NOT NULL,
    declared_size INTEGER,
    bytes_accepted INTEGER NOT NULL DEFAULT 0,
    backend_session_uri TEXT NOT NULL DEFAULT '',
    pending_object_key TEXT NOT NULL DEFAULT '',
    finalized_object_key TEXT NOT NULL DEFAULT '',
    finalized_size INTEGER NOT NULL DEFAULT 0,
    content_type TEXT NOT NULL DEFAULT '',
    filename TEXT NOT NULL DEFAULT '',
    extension TEXT NOT NULL DEFAULT '',
    md5 TEXT NOT NULL DEFAULT '',
    session_created INTEGER NOT NULL,
    last_activity INTEGER NOT NULL
) WITHOUT ROWID;
)";

// Execute a SQL statement with retry on SQLITE_BUSY
bool sql_exec(sqlite3* db, const char* sql) {
    for (int attempt = 0; attempt < 10; ++attempt) {
        char* err = nullptr;
        int rc = sqlite3_exec(db, sql, nullptr, nullptr, &err);
        if (rc == SQLITE_OK) return true;
        if (rc == SQLITE_BUSY || rc == SQLITE_LOCKED) {
            if (err) sqlite3_free(err);
            std::this_thread::sleep_for(std::chrono::milliseconds(10 * (attempt + 1)));
            continue;
        }
        if (err) {
            log_error("SQL error: %s (rc=%d)", err, rc);
            sqlite3_free(err);
        }
        return false;
    }
    log_error("SQL timed out after retries");
    return false;
}

// Step a prepared statement with SQLITE_BUSY retry
int sql_step_retry(sqlite3_stmt* stmt) {
    for (int attempt = 0; attempt < 10; ++attempt) {
        int rc = sqlite3_step(stmt);
        if (rc != SQLITE_BUSY && rc != SQLITE_LOCKED) return rc;
        sqlite3_reset(stmt);
        std::this_thread::sleep_for(std::chrono::milliseconds(10 * (attempt + 1)));
    }
    return SQLITE_BUSY;
}

std::string column_text(sqlite3_stmt* stmt, int col) {
    const unsigned char* text = sqlite3_column_text(stmt, col);
    return text ? reinterpret_cast<const char*>(text) : "";
}

}  // namespace

// --- UploadSlot ---

UploadSlot::UploadSlot(std::string slot_id, SessionStore* store)
    : slot_id_(std::move(slot_id)), store_(store) {
    session_.slot_id = slot_id_;
}

UploadSession UploadSlot::snapshot() const {
    std::lock_guard lock(state_mutex_);
    return session_;
}

void UploadSlot::restore(const UploadSession& session) {
    std::lock_guard lock(state_mutex_);
    session_ = session;
    session_.slot_id = slot_id_;
}

bool UploadSlot::retired() const {
    std::lock_guard lock(state_mutex_);
    return retired_;
}

void UploadSlot::retire() {
    std::lock_guard lock(state_mutex_);
    retired_ = true;
}

void UploadSlot::persist(const UploadSession& session) {
    if (store_) store_->save(session);
}

// --- SessionStore ---

SessionStore::SessionStore() = default;

SessionStore::~SessionStore() {
    if (stmt_upsert_) sqlite3_finalize(stmt_upsert_);
    if (stmt_delete_) sqlite3_finalize(stmt_delete_);

    if (db_) {
        sqlite3_exec(db_, "PRAGMA wal_checkpoint(TRUNCATE)", nullptr, nullptr, nullptr);
        sqlite3_close(db_);
    }
}

std::string SessionStore::open(const std::filesystem::path& state_dir) {
    std::error_code ec;
    std::filesystem::create_directories(state_dir, ec);
    if (ec) {
        return "Cannot create state dir " + state_dir.string() + ": " + ec.message();
    }

    auto db_path = state_dir / "sessions.db";
    int rc = sqlite3_open(db_path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        std::string err = "Cannot open session database: " + std::string(sqlite3_errmsg(db_));
        sqlite3_close(db_);
        db_ = nullptr;
        return err;
    }

    sql_exec(db_, "PRAGMA journal_mode=WAL");
    sql_exec(db_, "PRAGMA synchronous=NORMAL");
    sql_exec(db_, "PRAGMA busy_timeout=5000");
    if (!sql_exec(db_, SESSIONS_SCHEMA)) {
        return "Cannot create session schema in " + db_path.string();
    }

    if (sqlite3_prepare_v2(db_,
            "INSERT OR REPLACE INTO upload_sessions (slot_id, tenant_id, state, declared_size, "
            "bytes_accepted, backend_session_uri, pending_object_key, finalized_object_key, "
            "finalized_size, content_type, filename, extension, md5, session_created, last_activity) "
            "VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10, ?11, ?12, ?13, ?14, ?15)",
            -1, &stmt_upsert_, nullptr) != SQLITE_OK ||
        sqlite3_prepare_v2(db_,
            "DELETE FROM upload_sessions WHERE slot_id = ?1",
            -1, &stmt_delete_, nullptr) != SQLITE_OK) {
        return "Cannot prepare session statements: " + std::string(sqlite3_errmsg(db_));
    }

    load_all();
    return "";
}

void SessionStore::load_all() {
    sqlite3_stmt* stmt = nullptr;
    sqlite3_prepare_v2(db_,
        "SELECT slot_id, tenant_id, state, declared_size, bytes_accepted, backend_session_uri, "
        "pending_object_key, finalized_object_key, finalized_size, content_type, filename, "
        "extension, md5, session_created, last_activity FROM upload_sessions",
        -1, &stmt, nullptr);

    size_t loaded = 0;
    std::lock_guard lock(mutex_);
    while (stmt && sql_step_retry(stmt) == SQLITE_ROW) {
        UploadSession s;
        s.slot_id = column_text(stmt, 0);
        s.tenant_id = column_text(stmt, 1);
        auto state = upload_state_from_string(column_text(stmt, 2));
        if (!state) {
            log_warn("session %s has unknown state '%s', skipping",
                     s.slot_id.c_str(), column_text(stmt, 2).c_str());
            continue;
        }
        s.state = *state;
        if (sqlite3_column_type(stmt, 3) != SQLITE_NULL) {
            s.declared_size = static_cast<uint64_t>(sqlite3_column_int64(stmt, 3));
        }
        s.bytes_accepted = static_cast<uint64_t>(sqlite3_column_int64(stmt, 4));
        s.backend_session_uri = column_text(stmt, 5);
        s.pending_object_key = column_text(stmt, 6);
        s.finalized_object_key = column_text(stmt, 7);
        s.finalized_size = static_cast<uint64_t>(sqlite3_column_int64(stmt, 8));
        s.content_type = column_text(stmt, 9);
        s.filename = column_text(stmt, 10);
        s.extension = column_text(stmt, 11);
        s.md5 = column_text(stmt, 12);
        s.session_created = from_epoch_seconds(sqlite3_column_int64(stmt, 13));
        s.last_activity = from_epoch_seconds(sqlite3_column_int64(stmt, 14));

        // Finalizing is only recorded after the backend committed the object;
        // finish the pointer swap that a crash interrupted.
        if (s.state == UploadState::Finalizing) {
            if (!s.finalized_object_key.empty() && s.finalized_object_key != s.pending_object_key) {
                log_warn("session %s: previous object %s orphaned by interrupted finalize",
                         s.slot_id.c_str(), s.finalized_object_key.c_str());
            }
            s.finalized_object_key = s.pending_object_key;
            s.finalized_size = s.declared_size.value_or(s.bytes_accepted);
            s.pending_object_key.clear();
            s.backend_session_uri.clear();
            s.state = UploadState::Finalized;
        }

        auto slot = std::make_shared<UploadSlot>(s.slot_id, this);
        slot->restore(s);
        slots_[s.slot_id] = std::move(slot);
        ++loaded;
    }
    if (stmt) sqlite3_finalize(stmt);

    log_info("Loaded %zu upload sessions", loaded);
}

void SessionStore::save(const UploadSession& s) {
    if (!db_) return;

    std::lock_guard lock(db_mutex_);
    sqlite3_reset(stmt_upsert_);
    sqlite3_bind_text(stmt_upsert_, 1, s.slot_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt_upsert_, 2, s.tenant_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt_upsert_, 3, to_string(s.state), -1, SQLITE_STATIC);
    if (s.declared_size) {
        sqlite3_bind_int64(stmt_upsert_, 4, static_cast<int64_t>(*s.declared_size));
    } else {
        sqlite3_bind_null(stmt_upsert_, 4);
    }
    sqlite3_bind_int64(stmt_upsert_, 5, static_cast<int64_t>(s.bytes_accepted));
    sqlite3_bind_text(stmt_upsert_, 6, s.backend_session_uri.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt_upsert_, 7, s.pending_object_key.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt_upsert_, 8, s.finalized_object_key.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt_upsert_, 9, static_cast<int64_t>(s.finalized_size));
    sqlite3_bind_text(stmt_upsert_, 10, s.content_type.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt_upsert_, 11, s.filename.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt_upsert_, 12, s.extension.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt_upsert_, 13, s.md5.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt_upsert_, 14, to_epoch_seconds(s.session_created));
    sqlite3_bind_int64(stmt_upsert_, 15, to_epoch_seconds(s.last_activity));

    if (sql_step_retry(stmt_upsert_) != SQLITE_DONE) {
        log_error("Failed to persist session %s: %s", s.slot_id.c_str(), sqlite3_errmsg(db_));
    }
}

void SessionStore::erase_row(const std::string& slot_id) {
    if (!db_) return;

    std::lock_guard lock(db_mutex_);
    sqlite3_reset(stmt_delete_);
    sqlite3_bind_text(stmt_delete_, 1, slot_id.c_str(), -1, SQLITE_TRANSIENT);
    if (sql_step_retry(stmt_delete_) != SQLITE_DONE) {
        log_error("Failed to delete session %s: %s", slot_id.c_str(), sqlite3_errmsg(db_));
    }
}

std::shared_ptr<UploadSlot> SessionStore::get_or_create(const std::string& slot_id) {
    std::lock_guard lock(mutex_);
    auto it = slots_.find(slot_id);
    if (it != slots_.end()) return it->second;
    auto slot = std::make_shared<UploadSlot>(slot_id, this);
    slots_.emplace(slot_id, slot);
    return slot;
}

std::shared_ptr<UploadSlot> SessionStore::find(const std::string& slot_id) const {
    std::lock_guard lock(mutex_);
    auto it = slots_.find(slot_id);
    return it != slots_.end() ? it->second : nullptr;
}

void SessionStore::remove(const std::string& slot_id) {
    {
        std::lock_guard lock(mutex_);
        auto it = slots_.find(slot_id);
        if (it != slots_.end()) {
            it->second->retire();
            slots_.erase(it);
        }
    }
    erase_row(slot_id);
}

std::vector<std::shared_ptr<UploadSlot>> SessionStore::all_slots() const {
    std::lock_guard lock(mutex_);
    std::vector<std::shared_ptr<UploadSlot>> out;
    out.reserve(slots_.size());
    for (const auto& [id, slot] : slots_) out.push_back(slot);
    return out;
}

size_t SessionStore::size() const {
    std::lock_guard lock(mutex_);
    return slots_.size();
}

size_t SessionStore::count_in_state(UploadState state) const {
    auto slots = all_slots();
    size_t n = 0;
    for (const auto& slot : slots) {
        if (slot->snapshot().state == state) ++n;
    }
    return n;
}

} // namespace tusgate
