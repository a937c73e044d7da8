#pragma once

#include "storage/model/StoredFile.hpp"
#include "storage/Identity.hpp"
#include "storage/NameLockTable.hpp"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rh::config {
struct StorageConfig;
}

namespace rh::storage {

class FileHandle;

// Sole owner of the upload root. The directory itself is the source of truth:
// nothing is cached, every call re-reads the filesystem.
class Manager {
public:
    Manager(std::filesystem::path root, uintmax_t maxUploadBytes, std::vector<std::string> allowedExtensions);
    explicit Manager(const config::StorageConfig& cfg);

    // Creates the root (and parents) when missing. Throws on failure.
    void ensureRoot() const;

    // Allow-listed entries, newest first
    [[nodiscard]] std::vector<model::StoredFile> list() const;

    model::StoredFile store(const std::string& displayName, uintmax_t sizeBytes, std::string_view content);

    void remove(const std::string& storedName);

    [[nodiscard]] std::shared_ptr<FileHandle> open(const std::string& storedName) const;

    [[nodiscard]] model::StoredFile stat(const std::string& storedName) const;

    [[nodiscard]] bool isAllowed(std::string_view filename) const;

    [[nodiscard]] const std::filesystem::path& root() const noexcept { return root_; }
    [[nodiscard]] uintmax_t maxUploadBytes() const noexcept { return maxUploadBytes_; }
    [[nodiscard]] const std::vector<std::string>& allowedExtensions() const noexcept { return allowedExtensions_; }

private:
    static constexpr unsigned int MAX_CREATE_ATTEMPTS = 16;

    std::filesystem::path root_;
    uintmax_t maxUploadBytes_;
    std::vector<std::string> allowedExtensions_;

    StampSource stamps_;
    NameLockTable locks_;

    // Sanitizes, then checks the extension; throws NotFound for anything hidden
    [[nodiscard]] std::filesystem::path resolve(const std::string& storedName) const;

    [[nodiscard]] std::optional<model::StoredFile> describe(const std::filesystem::path& path) const;

    static void writeExclusive(const std::filesystem::path& path, std::string_view content);
};

}
