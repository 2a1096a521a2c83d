#pragma once

#include "progress_reporter.hpp"
#include <chrono>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace chunkrelay::transfer {

struct SessionStats {
    std::string session_id;
    std::optional<uint64_t> total_bytes;
    uint64_t bytes_read = 0;
    uint64_t bytes_saved = 0;
    double percentage_complete = 0.0;
    uint64_t current_speed_bps = 0;
    uint64_t average_speed_bps = 0;
    std::chrono::milliseconds estimated_time_remaining{0};
    std::chrono::steady_clock::time_point start_time;
    std::chrono::steady_clock::time_point last_update;
};

// Speed and ETA per session, fed by progress events. Speed is measured on
// saved bytes since that is the rate the transfer actually completes at.
class PerformanceMonitor : public ProgressReporter {
public:
    PerformanceMonitor() = default;

    void on_progress(const ProgressEvent& event) noexcept override;

    std::optional<SessionStats> get_session_stats(const std::string& session_id) const;

private:
    struct SessionData {
        std::optional<uint64_t> total_bytes;
        uint64_t bytes_read = 0;
        uint64_t bytes_saved = 0;
        std::chrono::steady_clock::time_point start_time;
        std::chrono::steady_clock::time_point last_update;

        // (timestamp, bytes saved by then)
        std::deque<std::pair<std::chrono::steady_clock::time_point, uint64_t>> history;
    };

    std::unordered_map<std::string, SessionData> sessions_;
    mutable std::mutex mutex_;

    SessionStats make_stats(const std::string& session_id, const SessionData& session) const;
    static uint64_t current_speed(const SessionData& session);
    static uint64_t average_speed(const SessionData& session);
    static std::chrono::milliseconds calculate_eta(const SessionData& session, uint64_t speed);
    static void cleanup_old_history(SessionData& session);

    static constexpr std::chrono::seconds HISTORY_WINDOW{30};
    static constexpr std::chrono::seconds SPEED_WINDOW{5};
};

} // namespace chunkrelay::transfer
