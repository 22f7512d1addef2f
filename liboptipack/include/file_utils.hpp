#ifndef OPTIPACK_FILE_UTILS_HPP
#define OPTIPACK_FILE_UTILS_HPP

#include "byte_buffer.hpp"
#include <cstdio>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

namespace optipack {

    /**
     * @brief RAII wrapper for FILE pointers to ensure they are closed.
     */
    struct FileCloser {
        void operator()(FILE *f) const { if (f) std::fclose(f); }
    };
    using unique_FILE = std::unique_ptr<FILE, FileCloser>;

    /**
     * @brief Opens a file using a filesystem path.
     * @param path The path to the file.
     * @param mode The standard C fopen mode string (e.g., "rb", "wb").
     * @return FILE* pointer or nullptr if open failed.
     */
    FILE *open_file(const std::filesystem::path &path, const char *mode);

    /**
     * @brief Reads a whole file.
     * @throws std::runtime_error if the file cannot be read.
     */
    ByteBuffer read_file(const std::filesystem::path &path);

    /**
     * @brief Writes a whole file, replacing it.
     * @throws std::runtime_error on I/O failure.
     */
    void write_file(const std::filesystem::path &path, ByteView data);

    /**
     * @brief Creates a unique temporary directory for processing.
     *
     * Pattern: "<tmp>/optipack-{prefix}/{prefix}_{random_suffix}".
     *
     * @param prefix A short prefix (e.g., "tiff", "bmp").
     * @return Filesystem path to the newly created temporary directory.
     * @throws std::runtime_error if the directory cannot be created.
     */
    std::filesystem::path make_temp_dir(const std::string &prefix);

    /**
     * @brief Recursively removes a directory and logs any errors.
     * @param dir The path to the directory to be removed.
     * @param tag The logger tag (e.g., "tiff_optimizer").
     */
    void cleanup_temp_dir(const std::filesystem::path &dir,
                          std::string_view tag = "file_utils");

    /**
     * @brief Temporary directory removed when the object goes out of scope.
     */
    class ScopedTempDir {
    public:
        explicit ScopedTempDir(const std::string &prefix, std::string tag = "file_utils")
            : path_(make_temp_dir(prefix)), tag_(std::move(tag)) {}
        ~ScopedTempDir() { cleanup_temp_dir(path_, tag_); }

        ScopedTempDir(const ScopedTempDir&) = delete;
        ScopedTempDir& operator=(const ScopedTempDir&) = delete;

        [[nodiscard]] const std::filesystem::path &path() const noexcept { return path_; }

    private:
        std::filesystem::path path_;
        std::string tag_;
    };

} // namespace optipack

#endif // OPTIPACK_FILE_UTILS_HPP
