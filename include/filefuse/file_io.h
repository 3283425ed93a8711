#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace filefuse {

std::string describeErrno(int errorNumber);

// Read side of a file descriptor with a user-sized buffer in front of it.
// A single read() may return fewer bytes than requested; zero means end of
// file.
class BufferedReader {
   public:
    BufferedReader(const std::filesystem::path &path, std::size_t capacity);
    ~BufferedReader();

    BufferedReader(const BufferedReader &) = delete;
    BufferedReader &operator=(const BufferedReader &) = delete;
    BufferedReader(BufferedReader &&other) noexcept;
    BufferedReader &operator=(BufferedReader &&other) noexcept;

    [[nodiscard]] bool isOpen() const noexcept { return fd_ >= 0; }
    [[nodiscard]] int lastErrno() const noexcept { return lastErrno_; }

    // Size from fstat(), independent of the read position.
    std::optional<std::uint64_t> size();

    std::optional<std::size_t> read(std::span<char> out);

   private:
    std::optional<std::size_t> readRaw(char *destination, std::size_t size);
    void release() noexcept;

    int fd_{-1};
    int lastErrno_{0};
    std::vector<char> buffer_;
    std::size_t position_{0};
    std::size_t filled_{0};
};

// Creates or truncates the target. Data sits in the buffer until it fills up
// or flush()/close() is called; the destructor closes without flushing.
class BufferedWriter {
   public:
    BufferedWriter(const std::filesystem::path &path, std::size_t capacity);
    ~BufferedWriter();

    BufferedWriter(const BufferedWriter &) = delete;
    BufferedWriter &operator=(const BufferedWriter &) = delete;
    BufferedWriter(BufferedWriter &&other) noexcept;
    BufferedWriter &operator=(BufferedWriter &&other) noexcept;

    [[nodiscard]] bool isOpen() const noexcept { return fd_ >= 0; }
    [[nodiscard]] int lastErrno() const noexcept { return lastErrno_; }

    bool write(std::span<const char> data);
    bool flush();
    bool close();

   private:
    bool writeAll(const char *data, std::size_t size);
    void release() noexcept;

    int fd_{-1};
    int lastErrno_{0};
    std::vector<char> buffer_;
    std::size_t used_{0};
};

}  // namespace filefuse
