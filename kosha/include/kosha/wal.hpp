#pragma once
// Write-Ahead Log: every acknowledged write, in order
//
// Design:
// - Append-only between checkpoints; truncated once a snapshot covers it
// - Self-describing entries: magic, length, sequence, CRC32 of the body
// - File locking: flock around appends, so two processes pointed at one
//   data dir cannot interleave entries
// - Crash recovery: entries with a bad checksum are skipped, a torn tail
//   is cut off at open so later appends land on a clean boundary

#include "codec.hpp"
#include "types.hpp"
#include <cerrno>
#include <cstring>
#include <functional>
#include <iostream>
#include <optional>
#include <sys/file.h>
#include <sys/stat.h>
#include <fcntl.h>
#include <unistd.h>

namespace kosha {

enum class WalOp : uint8_t {
    Put = 1,         // Full record
    Delete = 2,      // Id only
    Checkpoint = 3,  // Snapshot marker: sequence covered
};

constexpr uint8_t WAL_FORMAT_V1 = 1;

// Fixed-size entry header
struct WalEntryHeader {
    uint32_t magic;       // 0x4B57414C "KWAL"
    uint32_t length;      // Header + body
    uint64_t sequence;    // Monotonic
    uint64_t timestamp;   // Unix millis
    WalOp op;
    uint8_t format;
    uint8_t reserved[2];
    uint32_t checksum;    // CRC32 of body
};

static_assert(sizeof(WalEntryHeader) == 32, "WalEntryHeader must be 32 bytes");

constexpr uint32_t WAL_MAGIC = 0x4B57414C;
constexpr size_t WAL_MAX_ENTRY = 256 * 1024 * 1024;

struct WalEntry {
    WalOp op = WalOp::Put;
    uint64_t sequence = 0;
    Timestamp timestamp = 0;
    Record record;          // Put
    std::string id;         // Put and Delete
};

// RAII flock
class ScopedFileLock {
public:
    ScopedFileLock(int fd, bool exclusive) : fd_(fd) {
        if (fd_ >= 0) flock(fd_, exclusive ? LOCK_EX : LOCK_SH);
    }

    ~ScopedFileLock() {
        if (fd_ >= 0) flock(fd_, LOCK_UN);
    }

    ScopedFileLock(const ScopedFileLock&) = delete;
    ScopedFileLock& operator=(const ScopedFileLock&) = delete;

private:
    int fd_;
};

inline std::vector<uint8_t> serialize_put(const Record& rec) {
    std::vector<uint8_t> data;
    ByteWriter w(data);
    encode_record(w, rec);
    return data;
}

inline std::vector<uint8_t> serialize_delete(const std::string& id) {
    std::vector<uint8_t> data;
    ByteWriter w(data);
    w.str(id);
    return data;
}

class WriteAheadLog {
public:
    WriteAheadLog(const std::string& path, bool fsync_each)
        : path_(path), fsync_each_(fsync_each) {}

    ~WriteAheadLog() { close(); }

    WriteAheadLog(const WriteAheadLog&) = delete;
    WriteAheadLog& operator=(const WriteAheadLog&) = delete;

    bool open() {
        fd_ = ::open(path_.c_str(), O_RDWR | O_CREAT, 0644);
        if (fd_ < 0) {
            std::cerr << "[wal] Failed to open " << path_ << ": " << std::strerror(errno) << "\n";
            return false;
        }

        ScopedFileLock lock(fd_, true);
        off_t valid_end = scan();
        struct stat st;
        if (fstat(fd_, &st) == 0 && st.st_size > valid_end) {
            std::cerr << "[wal] Dropping torn tail: " << (st.st_size - valid_end)
                      << " bytes after offset " << valid_end << "\n";
            if (ftruncate(fd_, valid_end) < 0) {
                std::cerr << "[wal] ftruncate failed: " << std::strerror(errno) << "\n";
                return false;
            }
            ::fsync(fd_);
        }

        std::cerr << "[wal] Opened " << path_ << ", last_seq=" << last_seq_ << "\n";
        return true;
    }

    void close() {
        if (fd_ >= 0) {
            ::close(fd_);
            fd_ = -1;
        }
    }

    bool is_open() const { return fd_ >= 0; }

    // Returns sequence number, or 0 on failure
    uint64_t append_put(const Record& rec) {
        return append(WalOp::Put, serialize_put(rec));
    }

    uint64_t append_delete(const std::string& id) {
        return append(WalOp::Delete, serialize_delete(id));
    }

    uint64_t append_checkpoint(uint64_t covered) {
        std::vector<uint8_t> data;
        ByteWriter w(data);
        w.put<uint64_t>(covered);
        return append(WalOp::Checkpoint, data);
    }

    // Replay Put/Delete entries with sequence > since_seq, in file order.
    // Returns the number of entries handed to the callback.
    size_t replay(uint64_t since_seq, const std::function<void(const WalEntry&)>& callback) {
        if (fd_ < 0) return 0;

        ScopedFileLock lock(fd_, false);
        lseek(fd_, 0, SEEK_SET);

        size_t count = 0;
        WalEntryHeader header;
        std::vector<uint8_t> data;

        while (read_entry(header, data)) {
            if (crc32(data.data(), data.size()) != header.checksum) {
                std::cerr << "[wal] Checksum mismatch at seq " << header.sequence << ", skipped\n";
                skipped_++;
                continue;
            }
            if (header.sequence <= since_seq || header.op == WalOp::Checkpoint) continue;

            WalEntry entry;
            entry.op = header.op;
            entry.sequence = header.sequence;
            entry.timestamp = static_cast<Timestamp>(header.timestamp);
            try {
                ByteReader r(data.data(), data.size(), "wal entry");
                if (header.op == WalOp::Put) {
                    entry.record = decode_record(r);
                    entry.id = entry.record.id;
                } else if (header.op == WalOp::Delete) {
                    entry.id = r.str();
                } else {
                    std::cerr << "[wal] Unknown op " << static_cast<int>(header.op)
                              << " at seq " << header.sequence << ", skipped\n";
                    skipped_++;
                    continue;
                }
            } catch (const std::runtime_error& e) {
                std::cerr << "[wal] Undecodable entry at seq " << header.sequence
                          << ": " << e.what() << ", skipped\n";
                skipped_++;
                continue;
            }

            callback(entry);
            count++;
        }

        return count;
    }

    // Empty the log after a snapshot covers it. Sequence numbers continue.
    bool truncate() {
        if (fd_ < 0) return false;

        ScopedFileLock lock(fd_, true);
        if (ftruncate(fd_, 0) < 0) return false;
        lseek(fd_, 0, SEEK_SET);
        ::fsync(fd_);
        entries_ = 0;

        std::cerr << "[wal] Truncated, last_seq=" << last_seq_ << "\n";
        return true;
    }

    // After loading a snapshot that covers seq, never hand out seq again
    void ensure_sequence_at_least(uint64_t seq) {
        if (last_seq_ < seq) last_seq_ = seq;
    }

    // Replaces fsync on the append path
    using SyncFn = int (*)(int);
    void set_sync(SyncFn fn) { sync_ = fn; }

    uint64_t last_sequence() const { return last_seq_; }
    size_t entries() const { return entries_; }   // Since open or last truncate
    size_t skipped() const { return skipped_; }
    const std::string& path() const { return path_; }

private:
    uint64_t append(WalOp op, const std::vector<uint8_t>& data) {
        if (fd_ < 0) return 0;

        WalEntryHeader header;
        header.magic = WAL_MAGIC;
        header.length = static_cast<uint32_t>(sizeof(WalEntryHeader) + data.size());
        header.sequence = last_seq_ + 1;
        header.timestamp = static_cast<uint64_t>(now());
        header.op = op;
        header.format = WAL_FORMAT_V1;
        std::memset(header.reserved, 0, sizeof(header.reserved));
        header.checksum = crc32(data.data(), data.size());

        // One buffer, one write: a crash leaves either the whole entry or a torn tail
        std::vector<uint8_t> buf(sizeof(header) + data.size());
        std::memcpy(buf.data(), &header, sizeof(header));
        if (!data.empty()) std::memcpy(buf.data() + sizeof(header), data.data(), data.size());

        {
            ScopedFileLock lock(fd_, true);

            off_t end = lseek(fd_, 0, SEEK_END);
            if (end < 0) return 0;

            size_t written = 0;
            while (written < buf.size()) {
                ssize_t n = ::write(fd_, buf.data() + written, buf.size() - written);
                if (n < 0) {
                    if (errno == EINTR) continue;
                    std::cerr << "[wal] Write failed: " << std::strerror(errno) << "\n";
                    // Cut back to the last good entry
                    if (ftruncate(fd_, end) < 0) {
                        std::cerr << "[wal] Rollback truncate failed\n";
                    }
                    return 0;
                }
                written += static_cast<size_t>(n);
            }

            if (fsync_each_ && sync_(fd_) != 0) {
                std::cerr << "[wal] fsync failed: " << std::strerror(errno) << "\n";
                // The entry is not durable: a failed append must not replay
                if (ftruncate(fd_, end) < 0) {
                    std::cerr << "[wal] Rollback truncate failed\n";
                }
                return 0;
            }
        }

        last_seq_ = header.sequence;
        entries_++;
        return header.sequence;
    }

    // Next complete entry at the current offset; false at EOF, bad magic
    // or a short read
    bool read_entry(WalEntryHeader& header, std::vector<uint8_t>& data) {
        ssize_t n = ::read(fd_, &header, sizeof(header));
        if (n == 0) return false;
        if (n != static_cast<ssize_t>(sizeof(header))) {
            std::cerr << "[wal] Incomplete header, stopping\n";
            return false;
        }
        if (header.magic != WAL_MAGIC) {
            std::cerr << "[wal] Invalid magic, stopping\n";
            return false;
        }
        if (header.length < sizeof(header) || header.length - sizeof(header) > WAL_MAX_ENTRY) {
            std::cerr << "[wal] Bad entry length at seq " << header.sequence << ", stopping\n";
            return false;
        }
        size_t data_size = header.length - sizeof(header);
        data.resize(data_size);
        if (data_size > 0 &&
            ::read(fd_, data.data(), data_size) != static_cast<ssize_t>(data_size)) {
            std::cerr << "[wal] Incomplete entry at seq " << header.sequence << ", stopping\n";
            return false;
        }
        return true;
    }

    // Walk the file once: highest sequence and the end of the last whole entry
    off_t scan() {
        lseek(fd_, 0, SEEK_SET);
        off_t valid_end = 0;
        WalEntryHeader header;
        std::vector<uint8_t> data;
        entries_ = 0;
        while (read_entry(header, data)) {
            valid_end = lseek(fd_, 0, SEEK_CUR);
            if (header.sequence > last_seq_) last_seq_ = header.sequence;
            entries_++;
        }
        return valid_end;
    }

    std::string path_;
    bool fsync_each_;
    SyncFn sync_ = ::fsync;
    int fd_ = -1;
    uint64_t last_seq_ = 0;
    size_t entries_ = 0;
    size_t skipped_ = 0;
};

} // namespace kosha
