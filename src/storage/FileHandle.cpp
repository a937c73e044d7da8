#include "storage/FileHandle.hpp"
#include "storage/Error.hpp"

#include <cerrno>
#include <fcntl.h>
#include <sys/stat.h>
#include <system_error>
#include <unistd.h>

using namespace rh::storage;

FileHandle::FileHandle(const std::filesystem::path& path) : path_(path) {
    fd_ = ::open(path_.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd_ < 0) {
        if (errno == ENOENT) throw Error(Error::Reason::NotFound, "File not found");
        throw std::system_error(errno, std::generic_category(), "Failed to open " + path_.string());
    }

    struct stat st{};
    if (::fstat(fd_, &st) != 0) {
        const int err = errno;
        ::close(fd_);
        throw std::system_error(err, std::generic_category(), "Failed to stat " + path_.string());
    }

    if (!S_ISREG(st.st_mode)) {
        ::close(fd_);
        throw Error(Error::Reason::NotFound, "File not found");
    }

    size_ = static_cast<uint64_t>(st.st_size);
}

FileHandle::~FileHandle() {
    if (fd_ >= 0) ::close(fd_);
}

std::size_t FileHandle::readAt(const uint64_t offset, void* buf, const std::size_t len) const {
    std::size_t done = 0;
    auto* out = static_cast<char*>(buf);
    while (done < len) {
        const auto n = ::pread(fd_, out + done, len - done, static_cast<off_t>(offset + done));
        if (n < 0) {
            if (errno == EINTR) continue;
            throw std::system_error(errno, std::generic_category(), "Failed to read " + path_.string());
        }
        if (n == 0) break;
        done += static_cast<std::size_t>(n);
    }
    return done;
}

std::vector<uint8_t> FileHandle::read(const uint64_t offset, const std::size_t len) const {
    std::vector<uint8_t> out(len);
    out.resize(readAt(offset, out.data(), len));
    return out;
}
