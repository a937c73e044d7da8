#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <vector>

namespace rh::storage {

// Read-only descriptor on one stored file. Reads are positional (pread), so a
// handle carries no cursor and concurrent streams never share one.
class FileHandle {
public:
    explicit FileHandle(const std::filesystem::path& path);
    ~FileHandle();

    FileHandle(const FileHandle&) = delete;
    FileHandle& operator=(const FileHandle&) = delete;

    [[nodiscard]] uint64_t size() const noexcept { return size_; }

    // Returns bytes copied; fewer than len only at end of file
    std::size_t readAt(uint64_t offset, void* buf, std::size_t len) const;

    [[nodiscard]] std::vector<uint8_t> read(uint64_t offset, std::size_t len) const;

private:
    std::filesystem::path path_;
    int fd_{-1};
    uint64_t size_{0};
};

}
