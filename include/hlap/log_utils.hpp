#pragma once

#include <chrono>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

namespace hlap {
namespace log_utils {

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
inline std::string format_elapsed(
    const std::chrono::time_point<Clock, DurA>& start,
    const std::chrono::time_point<Clock, DurB>& end) {
    const auto ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(end - start).count();
    return format_duration_ms(ms);
}

// Stderr logger shared by the pipeline and OpenMP workers in bulk mode.
// info() always prints, detail() only with verbose set.
class Log {
public:
    static Log& instance() {
        static Log log;
        return log;
    }

    void set_verbose(bool verbose) { verbose_ = verbose; }

    void info(const std::string& msg) {
        std::lock_guard<std::mutex> lock(mutex_);
        std::cerr << msg << "\n";
    }

    void detail(const std::string& msg) {
        if (!verbose_) return;
        std::lock_guard<std::mutex> lock(mutex_);
        std::cerr << "  " << msg << "\n";
    }

    void warn(const std::string& msg) {
        std::lock_guard<std::mutex> lock(mutex_);
        std::cerr << "Warning: " << msg << "\n";
    }

    void error(const std::string& msg) {
        std::lock_guard<std::mutex> lock(mutex_);
        std::cerr << "Error: " << msg << "\n";
    }

private:
    Log() = default;
    std::mutex mutex_;
    bool verbose_ = false;
};

}  // namespace log_utils
}  // namespace hlap
