/**
 * @file archive.hpp
 * @brief In-memory archive read and write primitives built on libarchive.
 */

#ifndef OPTIPACK_ARCHIVE_HPP
#define OPTIPACK_ARCHIVE_HPP

#include "byte_buffer.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace optipack {

    /**
     * @brief One regular file inside an archive.
     */
    struct ArchiveMember {
        std::string name;  ///< Relative path, '/' separated
        ByteBuffer bytes;
    };

    /**
     * @brief Checks that the payload is a readable archive container.
     *
     * Walks every header without decompressing member data. ZIP, tar
     * (plain or with any compression filter) and 7z are accepted.
     *
     * @param data The uploaded payload.
     * @return Number of regular-file members.
     * @throws ArchiveError if the payload is empty or cannot be parsed.
     */
    std::size_t validate_archive(ByteView data);

    /**
     * @brief Extracts every regular file, in archive order.
     *
     * Directories, links and members whose path would escape the archive
     * root are skipped with a warning.
     *
     * @throws ArchiveError on a malformed container or unreadable member data.
     */
    std::vector<ArchiveMember> extract_entries(ByteView data);

    /**
     * @brief Writes members to a ZIP (deflate, level 9) in memory.
     *
     * Member paths, including sub-directories, are stored as given.
     *
     * @throws ArchiveError if libarchive fails.
     */
    ByteBuffer create_archive(const std::vector<ArchiveMember>& members);

    /**
     * @brief Normalises an archive entry name, rejecting path traversal.
     *
     * Backslashes become '/', leading slashes and "." components are
     * removed.
     *
     * @return The safe relative name, or an empty string if the name is
     * empty, contains NUL, or climbs out of the root with "..".
     */
    std::string sanitize_entry_name(std::string_view name);

} // namespace optipack

#endif // OPTIPACK_ARCHIVE_HPP
