#ifndef OPTIPACK_FILE_LOG_SINK_HPP
#define OPTIPACK_FILE_LOG_SINK_HPP

#include "../../../liboptipack/include/log_sink.hpp"
#include "../../../liboptipack/include/logger.hpp"
#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <mutex>
#include <string>

class FileLogSink final : public optipack::ILogSink {
public:
    explicit FileLogSink(const std::filesystem::path& filename, const bool append = true)
        : out_(filename, append ? std::ios::app : std::ios::trunc) {}

    [[nodiscard]] bool is_open() const { return out_.is_open(); }

    void log(const optipack::LogLevel level,
             const std::string_view message,
             const std::string_view tag) override {
        if (!out_.is_open()) return;

        const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
        std::tm tm{};
        localtime_r(&now, &tm);

        std::lock_guard lock(mtx_);
        out_ << std::put_time(&tm, "%Y-%m-%d %H:%M:%S ");
        out_ << "[" << optipack::Logger::level_to_string(level) << "]";
        if (!tag.empty()) out_ << "[" << tag << "]";
        out_ << " " << message << "\n";
        out_.flush();
    }

private:
    std::ofstream out_;
    std::mutex mtx_;
};

#endif // OPTIPACK_FILE_LOG_SINK_HPP
