#pragma once

#include <chrono>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>

#include <unistd.h>

namespace nanocollapse {
namespace log_utils {

// QUIET: errors only. NORMAL: run summary. VERBOSE: per-file details and progress.
enum class Verbosity : int {
    QUIET = 0,
    NORMAL = 1,
    VERBOSE = 2
};

inline bool enabled(Verbosity current, Verbosity needed) {
    return static_cast<int>(current) >= static_cast<int>(needed);
}

inline std::string format_duration_ms(int64_t ms) {
    if (ms < 0) ms = 0;
    if (ms < 1000) {
        return std::to_string(ms) + " ms";
    }

    const int64_t total_seconds = ms / 1000;
    if (total_seconds < 60) {
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(1)
            << (static_cast<double>(ms) / 1000.0) << " s";
        return oss.str();
    }

    const int64_t seconds = total_seconds % 60;
    const int64_t total_minutes = total_seconds / 60;
    if (total_minutes < 60) {
        return std::to_string(total_minutes) + "m " + std::to_string(seconds) + "s";
    }

    const int64_t minutes = total_minutes % 60;
    const int64_t hours = total_minutes / 60;
    return std::to_string(hours) + "h " + std::to_string(minutes) + "m " +
           std::to_string(seconds) + "s";
}

template <typename Clock, typename DurA, typename DurB>
inline int64_t elapsed_ms(
    const std::chrono::time_point<Clock, DurA>& start,
    const std::chrono::time_point<Clock, DurB>& end) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(end - start).count();
}

// Items per second, two decimals.
inline std::string format_rate(uint64_t count, int64_t ms) {
    const double seconds = static_cast<double>(ms > 0 ? ms : 1) / 1000.0;
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << (static_cast<double>(count) / seconds);
    return oss.str();
}

/**
 * @brief Single-line progress counter on stderr
 *
 * Rewrites the line in place with '\r' when stderr is a terminal, otherwise
 * prints one line per update so log files stay readable.
 */
class ProgressLine {
public:
    ProgressLine(std::string unit, uint64_t every, bool active)
        : unit_(std::move(unit)), every_(every > 0 ? every : 1),
          active_(active), is_tty_(isatty(STDERR_FILENO) != 0) {}

    void update(uint64_t count) {
        if (!active_ || count % every_ != 0) return;
        if (is_tty_) {
            std::cerr << "\r  Collapsed " << count << " " << unit_ << "..." << std::flush;
        } else {
            std::cerr << "  Collapsed " << count << " " << unit_ << "...\n";
        }
        shown_ = true;
    }

    void clear() {
        if (active_ && is_tty_ && shown_) {
            std::cerr << "\r                                                  \r" << std::flush;
        }
        shown_ = false;
    }

private:
    std::string unit_;
    uint64_t every_;
    bool active_;
    bool is_tty_;
    bool shown_ = false;
};

}  // namespace log_utils
}  // namespace nanocollapse
