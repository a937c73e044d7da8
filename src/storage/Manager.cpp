#include "storage/Manager.hpp"
#include "storage/Error.hpp"
#include "storage/FileHandle.hpp"
#include "storage/Sanitizer.hpp"
#include "config/Config.hpp"
#include "config/util.hpp"
#include "util/mime.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <cerrno>
#include <fcntl.h>
#include <sys/stat.h>
#include <system_error>
#include <unistd.h>

#include <fmt/format.h>

using namespace rh::storage;
using namespace rh::storage::model;
using namespace std::chrono;

namespace fs = std::filesystem;

namespace {

system_clock::time_point toTimePoint(const struct statx_timestamp& ts) {
    return system_clock::time_point(
        duration_cast<system_clock::duration>(seconds(ts.tv_sec) + nanoseconds(ts.tv_nsec)));
}

}

Manager::Manager(fs::path root, const uintmax_t maxUploadBytes, std::vector<std::string> allowedExtensions)
    : root_(std::move(root)), maxUploadBytes_(maxUploadBytes), allowedExtensions_(std::move(allowedExtensions)) {}

Manager::Manager(const config::StorageConfig& cfg)
    : Manager(fs::absolute(cfg.root), cfg.max_upload_size_bytes, config::normalizeExtensions(cfg.allowed_extensions)) {}

void Manager::ensureRoot() const {
    if (fs::is_directory(root_)) return;
    fs::create_directories(root_);
    log::Registry::storage()->info("[Manager] Created uploads directory: {}", root_.string());
}

bool Manager::isAllowed(const std::string_view filename) const {
    const auto ext = util::extensionOf(filename);
    return !ext.empty() && std::ranges::find(allowedExtensions_, ext) != allowedExtensions_.end();
}

std::vector<StoredFile> Manager::list() const {
    std::vector<StoredFile> files;

    for (const auto& entry : fs::directory_iterator(root_)) {
        const auto name = entry.path().filename().string();
        if (!isAllowed(name)) continue;
        // Entries can vanish between readdir and statx
        if (auto f = describe(entry.path())) files.push_back(std::move(*f));
    }

    std::ranges::sort(files, [](const StoredFile& a, const StoredFile& b) {
        if (a.createdAt != b.createdAt) return a.createdAt > b.createdAt;
        return a.storedName > b.storedName;
    });

    return files;
}

StoredFile Manager::store(const std::string& displayName, const uintmax_t sizeBytes, const std::string_view content) {
    if (sizeBytes > maxUploadBytes_)
        throw Error(Error::Reason::TooLarge, "File too large. Limit is " + config::bytesToFractionalMbStr(maxUploadBytes_));

    if (!isAllowed(displayName))
        throw Error(Error::Reason::UnsupportedType, fmt::format("Extension {} not allowed", util::extensionOf(displayName)));

    Sanitizer::validate(displayName);

    if (content.size() != sizeBytes)
        throw std::invalid_argument("Declared size does not match content size for " + displayName);

    for (unsigned int attempt = 0; attempt < MAX_CREATE_ATTEMPTS; ++attempt) {
        const auto storedName = Identity::encode(displayName, stamps_.next());
        const auto path = root_ / storedName;

        const auto guard = locks_.acquire(storedName);
        try {
            writeExclusive(path, content);
        } catch (const std::system_error& e) {
            if (e.code() == std::errc::file_exists) {
                log::Registry::storage()->debug("[Manager] Stored name {} already taken, retrying", storedName);
                continue;
            }
            log::Registry::storage()->error("[Manager] Failed to write {}: {}", path.string(), e.what());
            throw;
        }

        log::Registry::audit()->info("upload stored_name={} size={}", storedName, sizeBytes);

        if (auto f = describe(path)) return std::move(*f);

        // Removed by a concurrent delete right after the write
        return StoredFile{
            .storedName = storedName,
            .displayName = displayName,
            .sizeBytes = sizeBytes,
            .createdAt = system_clock::now(),
            .mimeType = util::mimeTypeFor(storedName)
        };
    }

    throw std::runtime_error("Could not allocate a unique stored name for " + displayName);
}

void Manager::remove(const std::string& storedName) {
    const auto path = resolve(storedName);
    const auto guard = locks_.acquire(storedName);

    const auto st = fs::symlink_status(path);
    if (!fs::is_regular_file(st)) throw Error(Error::Reason::NotFound, "File not found");

    if (!fs::remove(path)) throw Error(Error::Reason::NotFound, "File not found");

    log::Registry::audit()->info("delete stored_name={}", storedName);
}

std::shared_ptr<FileHandle> Manager::open(const std::string& storedName) const {
    return std::make_shared<FileHandle>(resolve(storedName));
}

StoredFile Manager::stat(const std::string& storedName) const {
    if (auto f = describe(resolve(storedName))) return std::move(*f);
    throw Error(Error::Reason::NotFound, "File not found");
}

fs::path Manager::resolve(const std::string& storedName) const {
    Sanitizer::validate(storedName);
    if (!isAllowed(storedName)) throw Error(Error::Reason::NotFound, "File not found");
    return root_ / storedName;
}

std::optional<StoredFile> Manager::describe(const fs::path& path) const {
    struct statx stx{};
    if (::statx(AT_FDCWD, path.c_str(), AT_STATX_SYNC_AS_STAT,
                STATX_TYPE | STATX_SIZE | STATX_MTIME | STATX_BTIME, &stx) != 0) {
        if (errno == ENOENT || errno == ENOTDIR) return std::nullopt;
        throw std::system_error(errno, std::generic_category(), "Failed to stat " + path.string());
    }

    if (!S_ISREG(stx.stx_mode)) return std::nullopt;

    const auto name = path.filename().string();
    return StoredFile{
        .storedName = name,
        .displayName = Identity::decode(name),
        .sizeBytes = static_cast<uintmax_t>(stx.stx_size),
        .createdAt = toTimePoint((stx.stx_mask & STATX_BTIME) ? stx.stx_btime : stx.stx_mtime),
        .mimeType = util::mimeTypeFor(name)
    };
}

void Manager::writeExclusive(const fs::path& path, const std::string_view content) {
    const int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644);
    if (fd < 0) throw std::system_error(errno, std::generic_category(), "Failed to create " + path.string());

    std::size_t written = 0;
    while (written < content.size()) {
        const auto n = ::write(fd, content.data() + written, content.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            const int err = errno;
            ::close(fd);
            throw std::system_error(err, std::generic_category(), "Failed to write " + path.string());
        }
        written += static_cast<std::size_t>(n);
    }

    if (::close(fd) != 0)
        throw std::system_error(errno, std::generic_category(), "Failed to close " + path.string());
}
