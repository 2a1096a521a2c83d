#include "chunkrelay/transfer/progress_reporter.hpp"
#include "chunkrelay/transfer/performance_monitor.hpp"
#include "chunkrelay/core/logger.hpp"
#include "chunkrelay/core/utils.hpp"
#include <algorithm>
#include <fmt/format.h>

namespace chunkrelay::transfer {

using chunkrelay::core::utils::StringUtils;

const char* to_string(ProgressStage stage) {
    switch (stage) {
        case ProgressStage::FETCH: return "reading";
        case ProgressStage::DRAIN: return "saving";
    }
    return "unknown";
}

LoggingProgressReporter::LoggingProgressReporter(std::chrono::milliseconds interval)
    : interval_(interval)
{
}

void LoggingProgressReporter::on_progress(const ProgressEvent& event) noexcept {
    bool finished = event.total_bytes && event.bytes_so_far >= *event.total_bytes;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& last = (event.stage == ProgressStage::FETCH) ? last_fetch_log_ : last_drain_log_;
        if (!finished && event.timestamp - last < interval_) {
            return;
        }
        last = event.timestamp;
    }

    if (event.total_bytes && *event.total_bytes > 0) {
        double percent = static_cast<double>(event.bytes_so_far) * 100.0 /
                         static_cast<double>(*event.total_bytes);
        LOG_INFO("[{}] {}: {} / {} ({:.1f}%)", event.session_id, to_string(event.stage),
                 StringUtils::format_bytes(event.bytes_so_far),
                 StringUtils::format_bytes(*event.total_bytes), percent);
    } else {
        LOG_INFO("[{}] {}: {}", event.session_id, to_string(event.stage),
                 StringUtils::format_bytes(event.bytes_so_far));
    }
}

ConsoleProgressReporter::ConsoleProgressReporter(std::ostream& out, std::chrono::milliseconds interval)
    : out_(out)
    , interval_(interval)
{
}

void ConsoleProgressReporter::on_progress(const ProgressEvent& event) noexcept {
    std::lock_guard<std::mutex> lock(mutex_);

    session_id_ = event.session_id;
    if (event.total_bytes) {
        total_ = event.total_bytes;
    }
    if (event.stage == ProgressStage::FETCH) {
        read_bytes_ = std::max(read_bytes_, event.bytes_so_far);
    } else {
        saved_bytes_ = std::max(saved_bytes_, event.bytes_so_far);
    }

    if (drawn_ && event.timestamp - last_draw_ < interval_) {
        return;
    }
    last_draw_ = event.timestamp;
    draw();
}

void ConsoleProgressReporter::set_monitor(const PerformanceMonitor* monitor) {
    std::lock_guard<std::mutex> lock(mutex_);
    monitor_ = monitor;
}

void ConsoleProgressReporter::finish() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!drawn_) {
        return;
    }
    draw();
    out_ << "\n";
    out_.flush();
    drawn_ = false;
}

void ConsoleProgressReporter::draw() {
    if (drawn_) {
        // Back to the start of the "reading" line.
        out_ << "\x1b[1A\r";
    }
    out_ << render_meter(to_string(ProgressStage::FETCH), read_bytes_, total_) << "\x1b[K\n"
         << render_meter(to_string(ProgressStage::DRAIN), saved_bytes_, total_);
    if (monitor_) {
        if (auto stats = monitor_->get_session_stats(session_id_)) {
            auto rate = render_rate(*stats);
            if (!rate.empty()) {
                out_ << "  " << rate;
            }
        }
    }
    out_ << "\x1b[K";
    out_.flush();
    drawn_ = true;
}

std::string ConsoleProgressReporter::render_meter(const char* label,
                                                  uint64_t bytes,
                                                  const std::optional<uint64_t>& total,
                                                  size_t width) {
    if (!total) {
        return fmt::format("{:<8}[{}] {}", label, std::string(width, '?'), StringUtils::format_bytes(bytes));
    }

    double fraction = (*total == 0) ? 1.0
                    : std::min(1.0, static_cast<double>(bytes) / static_cast<double>(*total));
    auto filled = static_cast<size_t>(fraction * static_cast<double>(width));

    return fmt::format("{:<8}[{}{}] {:5.1f}% {} / {}", label,
                       std::string(filled, '#'), std::string(width - filled, '.'),
                       fraction * 100.0, StringUtils::format_bytes(bytes),
                       StringUtils::format_bytes(*total));
}

std::string ConsoleProgressReporter::render_rate(const SessionStats& stats) {
    auto speed = stats.current_speed_bps > 0 ? stats.current_speed_bps : stats.average_speed_bps;
    if (speed == 0) {
        return "";
    }

    auto text = StringUtils::format_bytes(speed) + "/s";
    if (stats.estimated_time_remaining.count() > 0) {
        text += ", " + StringUtils::format_duration(stats.estimated_time_remaining) + " left";
    }
    return text;
}

void CompositeProgressReporter::add(ProgressReporter* reporter) {
    if (reporter) {
        reporters_.push_back(reporter);
    }
}

void CompositeProgressReporter::on_progress(const ProgressEvent& event) noexcept {
    for (auto* reporter : reporters_) {
        reporter->on_progress(event);
    }
}

} // namespace chunkrelay::transfer
