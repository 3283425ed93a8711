#include "filefuse/file_io.h"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <utility>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace filefuse {

std::string describeErrno(int errorNumber) {
    return std::strerror(errorNumber);
}

BufferedReader::BufferedReader(const std::filesystem::path &path, std::size_t capacity)
    : buffer_(capacity) {
    fd_ = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd_ < 0) {
        lastErrno_ = errno;
    }
}

BufferedReader::~BufferedReader() {
    release();
}

BufferedReader::BufferedReader(BufferedReader &&other) noexcept
    : fd_(std::exchange(other.fd_, -1)),
      lastErrno_(other.lastErrno_),
      buffer_(std::move(other.buffer_)),
      position_(std::exchange(other.position_, 0)),
      filled_(std::exchange(other.filled_, 0)) {}

BufferedReader &BufferedReader::operator=(BufferedReader &&other) noexcept {
    if (this != &other) {
        release();
        fd_ = std::exchange(other.fd_, -1);
        lastErrno_ = other.lastErrno_;
        buffer_ = std::move(other.buffer_);
        position_ = std::exchange(other.position_, 0);
        filled_ = std::exchange(other.filled_, 0);
    }
    return *this;
}

std::optional<std::uint64_t> BufferedReader::size() {
    struct stat info {};
    if (::fstat(fd_, &info) != 0) {
        lastErrno_ = errno;
        return std::nullopt;
    }
    return static_cast<std::uint64_t>(info.st_size);
}

std::optional<std::size_t> BufferedReader::read(std::span<char> out) {
    if (position_ == filled_) {
        position_ = 0;
        filled_ = 0;
        // Large reads bypass the buffer entirely.
        if (out.size() >= buffer_.size()) {
            return readRaw(out.data(), out.size());
        }
        auto refilled = readRaw(buffer_.data(), buffer_.size());
        if (!refilled) {
            return std::nullopt;
        }
        filled_ = *refilled;
        if (filled_ == 0) {
            return 0;
        }
    }

    const auto count = std::min(out.size(), filled_ - position_);
    std::memcpy(out.data(), buffer_.data() + position_, count);
    position_ += count;
    return count;
}

std::optional<std::size_t> BufferedReader::readRaw(char *destination, std::size_t size) {
    while (true) {
        const ssize_t received = ::read(fd_, destination, size);
        if (received < 0) {
            if (errno == EINTR) {
                continue;
            }
            lastErrno_ = errno;
            return std::nullopt;
        }
        return static_cast<std::size_t>(received);
    }
}

void BufferedReader::release() noexcept {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

BufferedWriter::BufferedWriter(const std::filesystem::path &path, std::size_t capacity)
    : buffer_(capacity) {
    fd_ = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd_ < 0) {
        lastErrno_ = errno;
    }
}

BufferedWriter::~BufferedWriter() {
    release();
}

BufferedWriter::BufferedWriter(BufferedWriter &&other) noexcept
    : fd_(std::exchange(other.fd_, -1)),
      lastErrno_(other.lastErrno_),
      buffer_(std::move(other.buffer_)),
      used_(std::exchange(other.used_, 0)) {}

BufferedWriter &BufferedWriter::operator=(BufferedWriter &&other) noexcept {
    if (this != &other) {
        release();
        fd_ = std::exchange(other.fd_, -1);
        lastErrno_ = other.lastErrno_;
        buffer_ = std::move(other.buffer_);
        used_ = std::exchange(other.used_, 0);
    }
    return *this;
}

bool BufferedWriter::write(std::span<const char> data) {
    if (data.size() > buffer_.size() - used_) {
        if (!flush()) {
            return false;
        }
    }
    if (data.size() >= buffer_.size()) {
        return writeAll(data.data(), data.size());
    }
    std::memcpy(buffer_.data() + used_, data.data(), data.size());
    used_ += data.size();
    return true;
}

bool BufferedWriter::flush() {
    if (used_ == 0) {
        return true;
    }
    const bool written = writeAll(buffer_.data(), used_);
    used_ = 0;
    return written;
}

bool BufferedWriter::close() {
    if (fd_ < 0) {
        return false;
    }
    bool success = flush();
    if (::close(fd_) != 0 && success) {
        lastErrno_ = errno;
        success = false;
    }
    fd_ = -1;
    return success;
}

bool BufferedWriter::writeAll(const char *data, std::size_t size) {
    if (fd_ < 0) {
        lastErrno_ = EBADF;
        return false;
    }
    std::size_t writtenTotal = 0;
    while (writtenTotal < size) {
        const ssize_t written = ::write(fd_, data + writtenTotal, size - writtenTotal);
        if (written < 0) {
            if (errno == EINTR) {
                continue;
            }
            lastErrno_ = errno;
            return false;
        }
        writtenTotal += static_cast<std::size_t>(written);
    }
    return true;
}

void BufferedWriter::release() noexcept {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

}  // namespace filefuse
