#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include "../../include/random_utils.hpp"
#include <fstream>
#include <stdexcept>
#include <system_error>

namespace optipack {

    FILE* open_file(const std::filesystem::path& path, const char* mode) {
        return std::fopen(path.string().c_str(), mode);
    }

    ByteBuffer read_file(const std::filesystem::path& path) {
        std::ifstream in(path, std::ios::binary | std::ios::ate);
        if (!in) {
            throw std::runtime_error("Cannot open file for reading: " + path.string());
        }
        const std::streamsize size = in.tellg();
        in.seekg(0, std::ios::beg);
        ByteBuffer data(static_cast<std::size_t>(size));
        if (size > 0 && !in.read(reinterpret_cast<char*>(data.data()), size)) {
            throw std::runtime_error("Cannot read file: " + path.string());
        }
        return data;
    }

    void write_file(const std::filesystem::path& path, const ByteView data) {
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw std::runtime_error("Cannot open file for writing: " + path.string());
        }
        out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
        out.flush();
        if (!out) {
            throw std::runtime_error("Write failed: " + path.string());
        }
    }

    std::filesystem::path make_temp_dir(const std::string& prefix) {
        const auto base_tmp = std::filesystem::temp_directory_path() / ("optipack-" + prefix);

        std::error_code ec;
        std::filesystem::create_directories(base_tmp, ec);

        auto dir = base_tmp / (prefix + "_" + RandomUtils::random_suffix());
        std::filesystem::create_directories(dir, ec);
        if (ec) {
            Logger::log(LogLevel::Error,
                "Failed to create temp dir: " + dir.string() + " (" + ec.message() + ")",
                "file_utils");
            throw std::runtime_error("Cannot create temp dir: " + dir.string());
        }
        return dir;
    }

    void cleanup_temp_dir(const std::filesystem::path& dir, const std::string_view tag) {
        std::error_code ec;
        std::filesystem::remove_all(dir, ec);
        if (ec) {
            Logger::log(LogLevel::Warning, "Can't remove temp dir: " + dir.string() + " (" + ec.message() + ")", tag);
        } else {
            Logger::log(LogLevel::Debug, "Removed temp dir: " + dir.string(), tag);
        }
    }

} // namespace optipack
