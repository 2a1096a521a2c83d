#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace chunkrelay::transfer {

class PerformanceMonitor;
struct SessionStats;

enum class ProgressStage {
    FETCH,
    DRAIN
};

const char* to_string(ProgressStage stage);

struct ProgressEvent {
    std::string session_id;
    ProgressStage stage;
    uint64_t bytes_so_far;
    std::optional<uint64_t> total_bytes;
    std::chrono::steady_clock::time_point timestamp;
};

// Observational only. Implementations are called from the pipeline threads and
// must return quickly without blocking on anything the pipeline holds.
class ProgressReporter {
public:
    virtual ~ProgressReporter() = default;
    virtual void on_progress(const ProgressEvent& event) noexcept = 0;
};

// Logs at most one line per stage per interval, plus the last event of a stage.
class LoggingProgressReporter : public ProgressReporter {
public:
    explicit LoggingProgressReporter(std::chrono::milliseconds interval = std::chrono::seconds(2));

    void on_progress(const ProgressEvent& event) noexcept override;

private:
    std::chrono::milliseconds interval_;
    std::chrono::steady_clock::time_point last_fetch_log_;
    std::chrono::steady_clock::time_point last_drain_log_;
    std::mutex mutex_;
};

// Two-line terminal meter, one line per stage, redrawn in place.
class ConsoleProgressReporter : public ProgressReporter {
public:
    explicit ConsoleProgressReporter(std::ostream& out,
                                     std::chrono::milliseconds interval = std::chrono::milliseconds(200));

    void on_progress(const ProgressEvent& event) noexcept override;

    // The saving meter shows speed and time left from this monitor. It must
    // see each event before this reporter does.
    void set_monitor(const PerformanceMonitor* monitor);

    // Draws the final state and moves below the meters.
    void finish();

    static std::string render_meter(const char* label,
                                    uint64_t bytes,
                                    const std::optional<uint64_t>& total,
                                    size_t width = 30);

    // "1.50 MB/s, 12s left"; empty until a speed is known.
    static std::string render_rate(const SessionStats& stats);

private:
    std::ostream& out_;
    std::chrono::milliseconds interval_;
    std::mutex mutex_;
    const PerformanceMonitor* monitor_ = nullptr;
    std::string session_id_;
    uint64_t read_bytes_ = 0;
    uint64_t saved_bytes_ = 0;
    std::optional<uint64_t> total_;
    std::chrono::steady_clock::time_point last_draw_;
    bool drawn_ = false;

    void draw();
};

// Fans events out to several reporters.
class CompositeProgressReporter : public ProgressReporter {
public:
    void add(ProgressReporter* reporter);
    void on_progress(const ProgressEvent& event) noexcept override;

private:
    std::vector<ProgressReporter*> reporters_;
};

} // namespace chunkrelay::transfer
