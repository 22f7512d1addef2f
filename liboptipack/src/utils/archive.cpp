#include "../../include/archive.hpp"
#include "../../include/errors.hpp"
#include "../../include/logger.hpp"
#include <archive.h>
#include <archive_entry.h>
#include <ctime>
#include <filesystem>
#include <memory>
#include <string>

namespace optipack {

namespace fs = std::filesystem;

static const char* archive_tag() {
    return "archive";
}

namespace {

struct ReadArchiveDeleter {
    void operator()(archive* a) const { if (a) archive_read_free(a); }
};
struct WriteArchiveDeleter {
    void operator()(archive* a) const { if (a) archive_write_free(a); }
};
struct EntryDeleter {
    void operator()(archive_entry* e) const { if (e) archive_entry_free(e); }
};

using unique_read_archive = std::unique_ptr<archive, ReadArchiveDeleter>;
using unique_write_archive = std::unique_ptr<archive, WriteArchiveDeleter>;
using unique_entry = std::unique_ptr<archive_entry, EntryDeleter>;

std::string error_of(archive* a) {
    const char* msg = archive_error_string(a);
    return msg ? msg : "unknown libarchive error";
}

unique_read_archive open_reader(const ByteView data) {
    if (data.empty()) {
        throw ArchiveError("archive is empty");
    }
    unique_read_archive a(archive_read_new());
    if (!a) throw ArchiveError("archive_read_new failed");

    archive_read_support_filter_all(a.get());
    archive_read_support_format_zip(a.get());
    archive_read_support_format_tar(a.get());
    archive_read_support_format_7zip(a.get());
    archive_read_set_options(a.get(), "hdrcharset=UTF-8");

    const int r = archive_read_open_memory(a.get(), data.data(), data.size());
    if (r == ARCHIVE_WARN) {
        Logger::log(LogLevel::Warning, "LIBARCHIVE WARN: " + error_of(a.get()), archive_tag());
    } else if (r != ARCHIVE_OK) {
        throw ArchiveError("cannot open archive: " + error_of(a.get()));
    }
    return a;
}

// ARCHIVE_EOF ends the walk, ARCHIVE_WARN is tolerated, anything else is fatal
bool next_header(archive* a, archive_entry** entry) {
    const int r = archive_read_next_header(a, entry);
    if (r == ARCHIVE_EOF) return false;
    if (r == ARCHIVE_WARN) {
        Logger::log(LogLevel::Warning, "LIBARCHIVE WARN: " + error_of(a), archive_tag());
        return true;
    }
    if (r != ARCHIVE_OK) {
        throw ArchiveError("malformed archive: " + error_of(a));
    }
    return true;
}

void skip_data(archive* a) {
    if (archive_read_data_skip(a) != ARCHIVE_OK) {
        throw ArchiveError("malformed archive: " + error_of(a));
    }
}

la_ssize_t append_to_buffer(archive*, void* client_data, const void* buffer, const size_t length) {
    auto* out = static_cast<ByteBuffer*>(client_data);
    const auto* bytes = static_cast<const unsigned char*>(buffer);
    out->insert(out->end(), bytes, bytes + length);
    return static_cast<la_ssize_t>(length);
}

} // namespace

std::string sanitize_entry_name(const std::string_view name) {
    if (name.empty()) return {};
    if (name.find('\0') != std::string_view::npos) return {};

    std::string s(name);
    for (auto& c : s) { if (c == '\\') c = '/'; }
    while (!s.empty() && s.front() == '/') s.erase(s.begin());

    const fs::path normalized = fs::path(s).lexically_normal();
    std::string out;
    for (const auto& part : normalized) {
        const std::string p = part.generic_string();
        if (p.empty() || p == ".") continue;
        if (p == "..") return {};
        if (!out.empty()) out += '/';
        out += p;
    }
    return out;
}

std::size_t validate_archive(const ByteView data) {
    const auto a = open_reader(data);
    archive_entry* entry = nullptr;
    std::size_t files = 0;
    while (next_header(a.get(), &entry)) {
        if (archive_entry_filetype(entry) == AE_IFREG) ++files;
        skip_data(a.get());
    }
    Logger::log(LogLevel::Debug, "Archive validated, regular files: " + std::to_string(files), archive_tag());
    return files;
}

std::vector<ArchiveMember> extract_entries(const ByteView data) {
    const auto a = open_reader(data);
    archive_entry* entry = nullptr;
    std::vector<ArchiveMember> members;
    std::vector<unsigned char> chunk(64 * 1024);

    while (next_header(a.get(), &entry)) {
        const char* current = archive_entry_pathname(entry);
        if (!current || archive_entry_filetype(entry) != AE_IFREG) {
            skip_data(a.get());
            continue;
        }

        std::string name = sanitize_entry_name(current);
        if (name.empty()) {
            Logger::log(LogLevel::Warning, "Skipping suspicious archive entry (path traversal): " + std::string(current), archive_tag());
            skip_data(a.get());
            continue;
        }

        ArchiveMember member;
        member.name = std::move(name);
        if (archive_entry_size_is_set(entry) && archive_entry_size(entry) > 0) {
            member.bytes.reserve(static_cast<std::size_t>(archive_entry_size(entry)));
        }
        for (;;) {
            const la_ssize_t n = archive_read_data(a.get(), chunk.data(), chunk.size());
            if (n == 0) break;
            if (n < 0) {
                if (n == ARCHIVE_WARN) {
                    Logger::log(LogLevel::Warning, "LIBARCHIVE WARN: " + error_of(a.get()), archive_tag());
                    continue;
                }
                throw ArchiveError("cannot read entry '" + member.name + "': " + error_of(a.get()));
            }
            member.bytes.insert(member.bytes.end(), chunk.begin(), chunk.begin() + n);
        }
        members.push_back(std::move(member));
    }

    Logger::log(LogLevel::Debug, "Extracted files: " + std::to_string(members.size()), archive_tag());
    return members;
}

ByteBuffer create_archive(const std::vector<ArchiveMember>& members) {
    unique_write_archive a(archive_write_new());
    if (!a) throw ArchiveError("archive_write_new failed");

    if (archive_write_set_format_zip(a.get()) != ARCHIVE_OK) {
        throw ArchiveError("archive_write_set_format_zip: " + error_of(a.get()));
    }
    archive_write_set_format_option(a.get(), "zip", "compression", "deflate");
    archive_write_set_format_option(a.get(), "zip", "compression-level", "9");
    archive_write_set_bytes_in_last_block(a.get(), 1);

    ByteBuffer out;
    if (archive_write_open(a.get(), &out, nullptr, append_to_buffer, nullptr) != ARCHIVE_OK) {
        throw ArchiveError("archive_write_open: " + error_of(a.get()));
    }

    const std::time_t now = std::time(nullptr);
    for (const auto& m : members) {
        unique_entry entry(archive_entry_new());
        if (!entry) throw ArchiveError("archive_entry_new failed");
        archive_entry_set_pathname(entry.get(), m.name.c_str());
        archive_entry_set_size(entry.get(), static_cast<la_int64_t>(m.bytes.size()));
        archive_entry_set_filetype(entry.get(), AE_IFREG);
        archive_entry_set_perm(entry.get(), 0644);
        archive_entry_set_mtime(entry.get(), now, 0);

        if (archive_write_header(a.get(), entry.get()) != ARCHIVE_OK) {
            throw ArchiveError("archive_write_header(" + m.name + "): " + error_of(a.get()));
        }
        if (!m.bytes.empty()) {
            const la_ssize_t written = archive_write_data(a.get(), m.bytes.data(), m.bytes.size());
            if (written < 0 || static_cast<std::size_t>(written) != m.bytes.size()) {
                throw ArchiveError("archive_write_data(" + m.name + "): " + error_of(a.get()));
            }
        }
    }

    if (archive_write_close(a.get()) != ARCHIVE_OK) {
        throw ArchiveError("archive_write_close: " + error_of(a.get()));
    }

    Logger::log(LogLevel::Debug,
                "Created archive with " + std::to_string(members.size()) + " entries, " +
                std::to_string(out.size()) + " bytes",
                archive_tag());
    return out;
}

} // namespace optipack
