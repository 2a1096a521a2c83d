#include "chunkrelay/transfer/performance_monitor.hpp"
#include <algorithm>
#include <iterator>

namespace chunkrelay::transfer {

void PerformanceMonitor::on_progress(const ProgressEvent& event) noexcept {
    std::lock_guard<std::mutex> lock(mutex_);

    auto [it, inserted] = sessions_.try_emplace(event.session_id);
    auto& session = it->second;
    if (inserted) {
        session.start_time = event.timestamp;
    }

    if (event.total_bytes) {
        session.total_bytes = event.total_bytes;
    }
    session.last_update = event.timestamp;

    if (event.stage == ProgressStage::FETCH) {
        session.bytes_read = std::max(session.bytes_read, event.bytes_so_far);
        return;
    }

    session.bytes_saved = std::max(session.bytes_saved, event.bytes_so_far);
    session.history.emplace_back(event.timestamp, session.bytes_saved);
    cleanup_old_history(session);
}

std::optional<SessionStats> PerformanceMonitor::get_session_stats(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        return std::nullopt;
    }
    return make_stats(session_id, it->second);
}

SessionStats PerformanceMonitor::make_stats(const std::string& session_id, const SessionData& session) const {
    SessionStats stats;
    stats.session_id = session_id;
    stats.total_bytes = session.total_bytes;
    stats.bytes_read = session.bytes_read;
    stats.bytes_saved = session.bytes_saved;
    if (session.total_bytes && *session.total_bytes > 0) {
        stats.percentage_complete = static_cast<double>(session.bytes_saved) * 100.0 /
                                    static_cast<double>(*session.total_bytes);
    }
    stats.current_speed_bps = current_speed(session);
    stats.average_speed_bps = average_speed(session);
    stats.start_time = session.start_time;
    stats.last_update = session.last_update;

    uint64_t speed = stats.current_speed_bps > 0 ? stats.current_speed_bps : stats.average_speed_bps;
    stats.estimated_time_remaining = calculate_eta(session, speed);
    return stats;
}

uint64_t PerformanceMonitor::current_speed(const SessionData& session) {
    if (session.history.size() < 2) {
        return 0;
    }

    // Oldest sample inside the speed window against the newest one.
    auto window_start = session.history.back().first - SPEED_WINDOW;
    auto first = std::find_if(session.history.begin(), session.history.end(),
                              [&](const auto& sample) { return sample.first >= window_start; });
    if (first == session.history.end() || first == std::prev(session.history.end())) {
        first = std::prev(session.history.end(), 2);
    }

    const auto& last = session.history.back();
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(last.first - first->first);
    if (elapsed.count() <= 0) {
        return 0;
    }
    return (last.second - first->second) * 1000 / static_cast<uint64_t>(elapsed.count());
}

uint64_t PerformanceMonitor::average_speed(const SessionData& session) {
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(session.last_update - session.start_time);
    if (elapsed.count() <= 0) {
        return 0;
    }
    return session.bytes_saved * 1000 / static_cast<uint64_t>(elapsed.count());
}

std::chrono::milliseconds PerformanceMonitor::calculate_eta(const SessionData& session, uint64_t speed) {
    if (!session.total_bytes || session.bytes_saved >= *session.total_bytes) {
        return std::chrono::milliseconds(0);
    }

    if (speed == 0) {
        return std::chrono::milliseconds(0); // Can't calculate ETA
    }

    uint64_t remaining_bytes = *session.total_bytes - session.bytes_saved;
    return std::chrono::milliseconds(remaining_bytes * 1000 / speed);
}

void PerformanceMonitor::cleanup_old_history(SessionData& session) {
    auto cutoff = session.last_update - HISTORY_WINDOW;

    while (session.history.size() > 2 && session.history.front().first < cutoff) {
        session.history.pop_front();
    }
}

} // namespace chunkrelay::transfer
