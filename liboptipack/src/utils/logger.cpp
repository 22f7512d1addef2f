#include "../../include/logger.hpp"
#include <vector>

namespace optipack {

std::vector<std::unique_ptr<ILogSink>> Logger::sinks_;
std::mutex Logger::mtx_;
std::atomic<LogLevel> Logger::threshold_{LogLevel::Debug};

void Logger::add_sink(std::unique_ptr<ILogSink> sink) {
    std::lock_guard lock(mtx_);
    if (sink) {
        sinks_.push_back(std::move(sink));
    }
}

void Logger::clear_sinks() {
    std::lock_guard lock(mtx_);
    sinks_.clear();
}

void Logger::set_level(const LogLevel level) noexcept {
    threshold_.store(level, std::memory_order_relaxed);
}

LogLevel Logger::level() noexcept {
    return threshold_.load(std::memory_order_relaxed);
}

void Logger::log(const LogLevel level,
                 const std::string_view msg,
                 const std::string_view tag) {
    const LogLevel threshold = threshold_.load(std::memory_order_relaxed);
    if (level == LogLevel::None || threshold == LogLevel::None || level < threshold) {
        return;
    }
    std::lock_guard lock(mtx_);
    for (const auto& sink : sinks_) {
        if (sink) {
            sink->log(level, msg, tag);
        }
    }
}

} // namespace optipack
