#ifndef OPTIPACK_ARTIFACT_STORE_HPP
#define OPTIPACK_ARTIFACT_STORE_HPP

#include "byte_buffer.hpp"
#include <filesystem>
#include <string>

namespace optipack {

    /**
     * @brief Write-once on-disk storage for finished archives.
     *
     * Artifacts live at `<dir>/<id>.zip`, where id is 32 lowercase hex
     * characters. Files are written under a temporary name and renamed
     * into place, so a reader never observes a partial artifact.
     */
    class ArtifactStore {
    public:
        /**
         * @brief Opens (and creates) the storage directory.
         *
         * Artifacts left over from a previous process are deleted: jobs do
         * not survive a restart, so nothing can address them.
         *
         * @throws std::runtime_error if the directory cannot be created.
         */
        explicit ArtifactStore(std::filesystem::path dir);

        /**
         * @brief Stores an artifact under a fresh id.
         * @return The artifact id.
         * @throws std::runtime_error on I/O failure.
         */
        std::string store(ByteView bytes);

        /**
         * @brief Reads a stored artifact.
         * @throws NotFoundError if the id is malformed or nothing is stored under it.
         */
        [[nodiscard]] ByteBuffer load(const std::string& id) const;

        [[nodiscard]] bool contains(const std::string& id) const;

        /**
         * @brief Deletes an artifact.
         * @return true if a file was removed.
         */
        bool remove(const std::string& id);

        [[nodiscard]] const std::filesystem::path& directory() const noexcept { return dir_; }

        [[nodiscard]] static bool is_valid_id(const std::string& id) noexcept;

    private:
        [[nodiscard]] std::filesystem::path path_for(const std::string& id) const;

        std::filesystem::path dir_;
    };

} // namespace optipack

#endif // OPTIPACK_ARTIFACT_STORE_HPP
