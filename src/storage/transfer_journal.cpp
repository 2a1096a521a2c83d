#include "chunkrelay/storage/transfer_journal.hpp"
#include "chunkrelay/core/logger.hpp"
#include <sqlite3.h>

namespace chunkrelay::storage {

using transfer::TransferState;

namespace {

TransferState state_from_string(const std::string& text) {
    for (auto state : {TransferState::IDLE, TransferState::RUNNING, TransferState::RETRYING,
                       TransferState::COMPLETED, TransferState::FAILED, TransferState::CANCELLED}) {
        if (text == transfer::to_string(state)) {
            return state;
        }
    }
    return TransferState::FAILED;
}

std::string column_text(sqlite3_stmt* stmt, int column) {
    auto* text = sqlite3_column_text(stmt, column);
    return text ? reinterpret_cast<const char*>(text) : "";
}

int64_t to_millis(std::chrono::system_clock::time_point time) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(time.time_since_epoch()).count();
}

}

TransferJournal::TransferJournal(const std::filesystem::path& database_path)
    : db_path_(database_path), db_(nullptr) {
}

TransferJournal::~TransferJournal() {
    if (db_) {
        sqlite3_close(db_);
    }
}

bool TransferJournal::initialize() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (db_path_.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(db_path_.parent_path(), ec);
    }

    int result = sqlite3_open(db_path_.string().c_str(), &db_);
    if (result != SQLITE_OK) {
        LOG_ERROR("Cannot open journal {}: {}", db_path_.string(), db_ ? sqlite3_errmsg(db_) : "out of memory");
        return false;
    }

    // Several processes may append at once.
    sqlite3_busy_timeout(db_, 5000);

    return create_tables();
}

bool TransferJournal::create_tables() {
    const char* create_transfers_table = R"(
        CREATE TABLE IF NOT EXISTS transfers (
            session_id TEXT PRIMARY KEY,
            object_id TEXT NOT NULL,
            destination TEXT NOT NULL,
            state TEXT NOT NULL,
            bytes_transferred INTEGER NOT NULL,
            total_bytes INTEGER,
            elapsed_ms INTEGER NOT NULL,
            attempts INTEGER NOT NULL,
            error_kind TEXT,
            error_message TEXT,
            digest TEXT,
            finished_at INTEGER NOT NULL
        );
        CREATE INDEX IF NOT EXISTS idx_transfers_finished_at ON transfers(finished_at);
    )";

    char* error_msg = nullptr;
    int result = sqlite3_exec(db_, create_transfers_table, nullptr, nullptr, &error_msg);
    if (result != SQLITE_OK) {
        LOG_ERROR("Cannot create journal tables: {}", error_msg ? error_msg : "unknown error");
        sqlite3_free(error_msg);
        return false;
    }

    return true;
}

bool TransferJournal::record(const transfer::TransferSpec& spec, const transfer::TransferOutcome& outcome) {
    JournalEntry entry;
    entry.session_id = outcome.session_id;
    entry.object_id = spec.object_id;
    entry.destination = spec.destination;
    entry.state = outcome.state;
    entry.bytes_transferred = outcome.bytes_transferred;
    entry.total_bytes = outcome.total_bytes;
    entry.elapsed = outcome.elapsed;
    entry.attempts = outcome.error.attempts;
    if (!outcome.success()) {
        entry.error_kind = transfer::to_string(outcome.error.kind);
        entry.error_message = outcome.error.message;
    }
    entry.digest = outcome.digest;
    entry.finished_at = std::chrono::system_clock::now();
    return record(entry);
}

bool TransferJournal::record(const JournalEntry& entry) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return false;
    }

    const char* insert_sql = R"(
        INSERT OR REPLACE INTO transfers
        (session_id, object_id, destination, state, bytes_transferred, total_bytes, elapsed_ms,
         attempts, error_kind, error_message, digest, finished_at)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?);
    )";

    sqlite3_stmt* stmt;
    int result = sqlite3_prepare_v2(db_, insert_sql, -1, &stmt, nullptr);
    if (result != SQLITE_OK) {
        LOG_ERROR("Cannot prepare journal insert: {}", sqlite3_errmsg(db_));
        return false;
    }

    std::string state = transfer::to_string(entry.state);

    sqlite3_bind_text(stmt, 1, entry.session_id.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 2, entry.object_id.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 3, entry.destination.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 4, state.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_int64(stmt, 5, static_cast<sqlite3_int64>(entry.bytes_transferred));
    if (entry.total_bytes) {
        sqlite3_bind_int64(stmt, 6, static_cast<sqlite3_int64>(*entry.total_bytes));
    } else {
        sqlite3_bind_null(stmt, 6);
    }
    sqlite3_bind_int64(stmt, 7, entry.elapsed.count());
    sqlite3_bind_int(stmt, 8, static_cast<int>(entry.attempts));
    sqlite3_bind_text(stmt, 9, entry.error_kind.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 10, entry.error_message.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 11, entry.digest.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_int64(stmt, 12, to_millis(entry.finished_at));

    result = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (result != SQLITE_DONE) {
        LOG_ERROR("Cannot record session {}: {}", entry.session_id, sqlite3_errmsg(db_));
        return false;
    }

    return true;
}

std::vector<JournalEntry> TransferJournal::query(const std::string& sql,
                                                 const std::string& parameter,
                                                 int64_t limit) const {
    std::vector<JournalEntry> entries;

    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return entries;
    }

    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR("Cannot prepare journal query: {}", sqlite3_errmsg(db_));
        return entries;
    }

    if (!parameter.empty()) {
        sqlite3_bind_text(stmt, 1, parameter.c_str(), -1, SQLITE_STATIC);
    } else {
        sqlite3_bind_int64(stmt, 1, limit);
    }

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        JournalEntry entry;
        entry.session_id = column_text(stmt, 0);
        entry.object_id = column_text(stmt, 1);
        entry.destination = column_text(stmt, 2);
        entry.state = state_from_string(column_text(stmt, 3));
        entry.bytes_transferred = static_cast<uint64_t>(sqlite3_column_int64(stmt, 4));
        if (sqlite3_column_type(stmt, 5) != SQLITE_NULL) {
            entry.total_bytes = static_cast<uint64_t>(sqlite3_column_int64(stmt, 5));
        }
        entry.elapsed = std::chrono::milliseconds(sqlite3_column_int64(stmt, 6));
        entry.attempts = static_cast<uint32_t>(sqlite3_column_int(stmt, 7));
        entry.error_kind = column_text(stmt, 8);
        entry.error_message = column_text(stmt, 9);
        entry.digest = column_text(stmt, 10);
        entry.finished_at = std::chrono::system_clock::time_point(
            std::chrono::milliseconds(sqlite3_column_int64(stmt, 11)));
        entries.push_back(std::move(entry));
    }

    sqlite3_finalize(stmt);
    return entries;
}

std::optional<JournalEntry> TransferJournal::find(const std::string& session_id) const {
    auto entries = query(R"(
        SELECT session_id, object_id, destination, state, bytes_transferred, total_bytes, elapsed_ms,
               attempts, error_kind, error_message, digest, finished_at
        FROM transfers WHERE session_id = ?;
    )", session_id, 0);

    if (entries.empty()) {
        return std::nullopt;
    }
    return entries.front();
}

std::vector<JournalEntry> TransferJournal::recent(size_t limit) const {
    return query(R"(
        SELECT session_id, object_id, destination, state, bytes_transferred, total_bytes, elapsed_ms,
               attempts, error_kind, error_message, digest, finished_at
        FROM transfers ORDER BY finished_at DESC, rowid DESC LIMIT ?;
    )", "", static_cast<int64_t>(limit));
}

size_t TransferJournal::count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return 0;
    }

    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db_, "SELECT COUNT(*) FROM transfers;", -1, &stmt, nullptr) != SQLITE_OK) {
        return 0;
    }

    size_t total = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        total = static_cast<size_t>(sqlite3_column_int64(stmt, 0));
    }
    sqlite3_finalize(stmt);
    return total;
}

size_t TransferJournal::remove_older_than(std::chrono::hours max_age) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return 0;
    }

    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db_, "DELETE FROM transfers WHERE finished_at < ?;", -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR("Cannot prepare journal cleanup: {}", sqlite3_errmsg(db_));
        return 0;
    }

    sqlite3_bind_int64(stmt, 1, to_millis(std::chrono::system_clock::now() - max_age));
    int result = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (result != SQLITE_DONE) {
        LOG_ERROR("Journal cleanup failed: {}", sqlite3_errmsg(db_));
        return 0;
    }
    return static_cast<size_t>(sqlite3_changes(db_));
}

} // namespace chunkrelay::storage
