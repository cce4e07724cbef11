#pragma once
// Read-only memory-mapped file, used to load snapshots and graphs without
// copying the whole file through read()

#include <sys/mman.h>
#include <sys/stat.h>
#include <fcntl.h>
#include <unistd.h>
#include <cstddef>
#include <cstdint>
#include <string>

namespace kosha {

class MappedRegion {
public:
    MappedRegion() = default;
    ~MappedRegion() { close(); }

    MappedRegion(MappedRegion&& other) noexcept
        : fd_(other.fd_), data_(other.data_), size_(other.size_) {
        other.fd_ = -1;
        other.data_ = nullptr;
        other.size_ = 0;
    }

    MappedRegion& operator=(MappedRegion&& other) noexcept {
        if (this != &other) {
            close();
            fd_ = other.fd_;
            data_ = other.data_;
            size_ = other.size_;
            other.fd_ = -1;
            other.data_ = nullptr;
            other.size_ = 0;
        }
        return *this;
    }

    MappedRegion(const MappedRegion&) = delete;
    MappedRegion& operator=(const MappedRegion&) = delete;

    bool open(const std::string& path) {
        close();
        fd_ = ::open(path.c_str(), O_RDONLY);
        if (fd_ < 0) return false;

        struct stat st;
        if (fstat(fd_, &st) < 0) {
            close();
            return false;
        }
        size_ = static_cast<size_t>(st.st_size);

        // mmap with size 0 is undefined behavior
        if (size_ == 0) {
            close();
            return false;
        }

        data_ = mmap(nullptr, size_, PROT_READ, MAP_PRIVATE, fd_, 0);
        if (data_ == MAP_FAILED) {
            data_ = nullptr;
            close();
            return false;
        }

        // Loads read front to back once
        madvise(data_, size_, MADV_SEQUENTIAL);
        return true;
    }

    void close() {
        if (data_) {
            munmap(data_, size_);
            data_ = nullptr;
        }
        if (fd_ >= 0) {
            ::close(fd_);
            fd_ = -1;
        }
        size_ = 0;
    }

    bool valid() const { return data_ != nullptr; }
    const uint8_t* data() const { return static_cast<const uint8_t*>(data_); }
    size_t size() const { return size_; }

private:
    int fd_ = -1;
    void* data_ = nullptr;
    size_t size_ = 0;
};

} // namespace kosha
