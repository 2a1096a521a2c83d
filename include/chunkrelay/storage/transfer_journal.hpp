#pragma once

#include "../transfer/transfer_session.hpp"
#include <chrono>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

struct sqlite3;

namespace chunkrelay::storage {

struct JournalEntry {
    std::string session_id;
    std::string object_id;
    std::string destination;
    transfer::TransferState state = transfer::TransferState::IDLE;
    uint64_t bytes_transferred = 0;
    std::optional<uint64_t> total_bytes;
    std::chrono::milliseconds elapsed{0};
    uint32_t attempts = 0;
    std::string error_kind;
    std::string error_message;
    std::string digest;
    std::chrono::system_clock::time_point finished_at;
};

// History of finished sessions, kept in sqlite.
class TransferJournal {
public:
    explicit TransferJournal(const std::filesystem::path& database_path);
    ~TransferJournal();

    TransferJournal(const TransferJournal&) = delete;
    TransferJournal& operator=(const TransferJournal&) = delete;

    bool initialize();

    bool record(const transfer::TransferSpec& spec, const transfer::TransferOutcome& outcome);
    bool record(const JournalEntry& entry);

    std::optional<JournalEntry> find(const std::string& session_id) const;

    // Newest first.
    std::vector<JournalEntry> recent(size_t limit = 20) const;

    size_t count() const;
    size_t remove_older_than(std::chrono::hours max_age);

private:
    std::filesystem::path db_path_;
    sqlite3* db_;
    mutable std::mutex mutex_;

    bool create_tables();
    std::vector<JournalEntry> query(const std::string& sql, const std::string& parameter, int64_t limit) const;
};

} // namespace chunkrelay::storage
