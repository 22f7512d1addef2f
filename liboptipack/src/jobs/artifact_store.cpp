#include "../../include/artifact_store.hpp"
#include "../../include/errors.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include "../../include/random_utils.hpp"
#include <algorithm>
#include <stdexcept>
#include <system_error>

namespace fs = std::filesystem;

namespace optipack {

static const char* store_tag() {
    return "ArtifactStore";
}

ArtifactStore::ArtifactStore(fs::path dir) : dir_(std::move(dir)) {
    std::error_code ec;
    fs::create_directories(dir_, ec);
    if (ec) {
        throw std::runtime_error("cannot create artifact directory " + dir_.string() + ": " + ec.message());
    }

    // leftovers of a previous process (finished or half-written)
    std::size_t purged = 0;
    for (const auto& entry : fs::directory_iterator(dir_, ec)) {
        if (!entry.is_regular_file(ec)) continue;
        const auto ext = entry.path().extension();
        if ((ext == ".zip" || ext == ".part") && is_valid_id(entry.path().stem().string())) {
            if (fs::remove(entry.path(), ec)) ++purged;
        }
    }
    if (purged > 0) {
        Logger::log(LogLevel::Info, "Purged " + std::to_string(purged) + " stale artifact(s) from " + dir_.string(),
                    store_tag());
    }
}

fs::path ArtifactStore::path_for(const std::string& id) const {
    return dir_ / (id + ".zip");
}

bool ArtifactStore::is_valid_id(const std::string& id) noexcept {
    return id.size() == 32 && std::ranges::all_of(id, [](const char c) {
        return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
    });
}

std::string ArtifactStore::store(const ByteView bytes) {
    std::string id;
    do {
        id = RandomUtils::random_hex_id();
    } while (contains(id));

    const fs::path part = dir_ / (id + ".part");
    std::error_code ec;
    try {
        write_file(part, bytes);
    } catch (const std::runtime_error&) {
        fs::remove(part, ec);
        throw;
    }

    fs::rename(part, path_for(id), ec);
    if (ec) {
        fs::remove(part, ec);
        throw std::runtime_error("cannot publish artifact " + id + ": " + ec.message());
    }
    Logger::log(LogLevel::Debug, "Stored artifact " + id + " (" + std::to_string(bytes.size()) + " bytes)",
                store_tag());
    return id;
}

ByteBuffer ArtifactStore::load(const std::string& id) const {
    if (!contains(id)) {
        throw NotFoundError("unknown artifact: " + id);
    }
    try {
        return read_file(path_for(id));
    } catch (const std::runtime_error& e) {
        // removed between the check and the read
        throw NotFoundError("artifact " + id + " is no longer available: " + e.what());
    }
}

bool ArtifactStore::contains(const std::string& id) const {
    if (!is_valid_id(id)) return false;
    std::error_code ec;
    return fs::is_regular_file(path_for(id), ec);
}

bool ArtifactStore::remove(const std::string& id) {
    if (!is_valid_id(id)) return false;
    std::error_code ec;
    const bool removed = fs::remove(path_for(id), ec);
    if (ec) {
        Logger::log(LogLevel::Warning, "Failed to remove artifact " + id + ": " + ec.message(), store_tag());
    }
    return removed;
}

} // namespace optipack
