#include "chunkrelay/transfer/transfer_manager.hpp"
#include "chunkrelay/storage/transfer_journal.hpp"
#include "chunkrelay/core/logger.hpp"
#include <boost/asio/post.hpp>
#include <algorithm>
#include <iomanip>
#include <random>
#include <sstream>

namespace chunkrelay::transfer {

TransferManager::TransferManager(TransferOptions options,
                                 uint32_t max_concurrent_transfers,
                                 storage::TransferJournal* journal,
                                 ProgressReporter* progress)
    : options_(std::move(options))
    , journal_(journal)
    , progress_(progress)
    , pool_(std::max<uint32_t>(1, max_concurrent_transfers))
{
}

TransferManager::~TransferManager() {
    cancel_all();
    pool_.join();
}

TransferResult TransferManager::submit(TransferJob job, std::string& session_id) {
    if (!job.metadata || !job.source || !job.sink) {
        return TransferResult::permanent("Transfer job needs a metadata source, a chunk source and a sink");
    }

    auto entry = std::make_shared<Entry>();
    entry->source = std::move(job.source);
    entry->sink = std::move(job.sink);

    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);

        session_id = job.session_id.empty() ? generate_session_id() : job.session_id;
        if (sessions_.count(session_id)) {
            return TransferResult::permanent("Session " + session_id + " already exists");
        }

        entry->session = std::make_unique<TransferSession>(session_id, std::move(job.spec), options_,
                                                           *job.metadata, *entry->source, *entry->sink,
                                                           progress_);
        sessions_[session_id] = entry;
        submission_order_.push_back(session_id);
    }

    LOG_DEBUG("Queued session {}", session_id);
    boost::asio::post(pool_, [this, entry] { run_entry(entry); });
    return TransferResult::ok();
}

void TransferManager::run_entry(const std::shared_ptr<Entry>& entry) {
    auto outcome = entry->session->run(entry->stop.get_token());

    if (journal_ && !journal_->record(entry->session->get_spec(), outcome)) {
        LOG_WARN("Session {} finished but could not be journaled", outcome.session_id);
    }

    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        entry->outcome = std::move(outcome);
    }
    finished_cv_.notify_all();
}

bool TransferManager::has_session(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    return sessions_.find(session_id) != sessions_.end();
}

std::optional<TransferState> TransferManager::get_state(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(sessions_mutex_);

    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        return std::nullopt;
    }
    if (it->second->outcome) {
        return it->second->outcome->state;
    }
    return it->second->session->get_state();
}

TransferResult TransferManager::cancel(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(sessions_mutex_);

    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        return TransferResult::permanent("Session not found");
    }
    if (it->second->outcome) {
        return TransferResult::permanent("Session " + session_id + " already finished");
    }

    // A queued session that never started observes the stop at its first step.
    it->second->stop.request_stop();
    LOG_INFO("Cancellation requested for session {}", session_id);
    return TransferResult::ok();
}

void TransferManager::cancel_all() {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    for (auto& [session_id, entry] : sessions_) {
        if (!entry->outcome) {
            entry->stop.request_stop();
        }
    }
}

std::optional<TransferOutcome> TransferManager::wait(const std::string& session_id) {
    std::unique_lock<std::mutex> lock(sessions_mutex_);

    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        return std::nullopt;
    }

    auto entry = it->second;
    finished_cv_.wait(lock, [&] { return entry->outcome.has_value(); });
    return entry->outcome;
}

std::vector<TransferOutcome> TransferManager::wait_all() {
    std::vector<std::string> ids;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        ids = submission_order_;
    }

    std::vector<TransferOutcome> outcomes;
    for (const auto& id : ids) {
        if (auto outcome = wait(id)) {
            outcomes.push_back(std::move(*outcome));
        }
    }
    return outcomes;
}

TransferResult TransferManager::forget(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(sessions_mutex_);

    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        return TransferResult::permanent("Session not found");
    }
    if (!it->second->outcome) {
        return TransferResult::permanent("Session " + session_id + " has not finished");
    }

    sessions_.erase(it);
    submission_order_.erase(std::remove(submission_order_.begin(), submission_order_.end(), session_id),
                            submission_order_.end());
    LOG_DEBUG("Forgot session {}", session_id);
    return TransferResult::ok();
}

uint32_t TransferManager::get_active_transfer_count() const {
    std::lock_guard<std::mutex> lock(sessions_mutex_);

    uint32_t active_count = 0;
    for (const auto& [session_id, entry] : sessions_) {
        if (!entry->outcome) {
            active_count++;
        }
    }
    return active_count;
}

std::string TransferManager::generate_session_id() {
    static std::random_device rd;
    static std::mt19937 gen(rd());
    static std::uniform_int_distribution<uint32_t> dis(0, UINT32_MAX);

    std::ostringstream oss;
    oss << "session_" << std::hex << std::setw(8) << std::setfill('0') << dis(gen);
    return oss.str();
}

} // namespace chunkrelay::transfer
