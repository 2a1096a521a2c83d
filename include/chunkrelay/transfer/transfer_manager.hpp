#pragma once

#include "transfer_session.hpp"
#include <boost/asio/thread_pool.hpp>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace chunkrelay::storage {
class TransferJournal;
}

namespace chunkrelay::transfer {

// Everything one session needs. The manager takes ownership of the source and
// the sink; the metadata source is shared and must outlive the manager.
struct TransferJob {
    std::string session_id; // generated when empty
    TransferSpec spec;
    MetadataSource* metadata = nullptr;
    std::unique_ptr<ChunkSource> source;
    std::unique_ptr<storage::DestinationSink> sink;
};

// Runs independent sessions concurrently on a thread pool. Sessions share
// nothing but the metadata source and the progress reporter.
class TransferManager {
public:
    TransferManager(TransferOptions options,
                    uint32_t max_concurrent_transfers,
                    storage::TransferJournal* journal = nullptr,
                    ProgressReporter* progress = nullptr);
    ~TransferManager();

    TransferManager(const TransferManager&) = delete;
    TransferManager& operator=(const TransferManager&) = delete;

    // Returns the session id, or a PERMANENT error for an incomplete job.
    TransferResult submit(TransferJob job, std::string& session_id);

    bool has_session(const std::string& session_id) const;
    std::optional<TransferState> get_state(const std::string& session_id) const;

    TransferResult cancel(const std::string& session_id);
    void cancel_all();

    // Blocks until the session reached a terminal state.
    std::optional<TransferOutcome> wait(const std::string& session_id);
    std::vector<TransferOutcome> wait_all();

    // Drops a finished session together with its source and sink. PERMANENT
    // for an unknown session or one still queued or running.
    TransferResult forget(const std::string& session_id);

    uint32_t get_active_transfer_count() const;

private:
    struct Entry {
        std::unique_ptr<ChunkSource> source;
        std::unique_ptr<storage::DestinationSink> sink;
        std::unique_ptr<TransferSession> session;
        std::stop_source stop;
        std::optional<TransferOutcome> outcome;
    };

    TransferOptions options_;
    storage::TransferJournal* journal_;
    ProgressReporter* progress_;

    std::unordered_map<std::string, std::shared_ptr<Entry>> sessions_;
    std::vector<std::string> submission_order_;
    mutable std::mutex sessions_mutex_;
    std::condition_variable finished_cv_;

    // Declared last so the workers are joined before the sessions go away.
    boost::asio::thread_pool pool_;

    void run_entry(const std::shared_ptr<Entry>& entry);
    static std::string generate_session_id();
};

} // namespace chunkrelay::transfer
