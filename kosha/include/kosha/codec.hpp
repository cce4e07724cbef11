#pragma once
// Little binary codec shared by the WAL, snapshot and graph files
//
// Fixed-width fields are written in host byte order; files are not
// portable across endianness. ByteReader throws std::runtime_error on
// truncated input so corrupt files surface as one failure path.

#include "types.hpp"
#include <cstdio>
#include <cstring>
#include <stdexcept>
#include <string>
#include <vector>

namespace kosha {

class ByteWriter {
public:
    explicit ByteWriter(std::vector<uint8_t>& out) : out_(out) {}

    void raw(const void* ptr, size_t size) {
        const uint8_t* bytes = static_cast<const uint8_t*>(ptr);
        out_.insert(out_.end(), bytes, bytes + size);
    }

    template <typename T>
    void put(T value) { raw(&value, sizeof(value)); }

    // u32 length + bytes
    void str(const std::string& s) {
        put<uint32_t>(static_cast<uint32_t>(s.size()));
        raw(s.data(), s.size());
    }

    // u64 length + bytes (payloads can exceed 4GB in principle)
    void blob(const std::string& s) {
        put<uint64_t>(s.size());
        raw(s.data(), s.size());
    }

    void floats(const float* data, size_t count) {
        raw(data, count * sizeof(float));
    }

    size_t size() const { return out_.size(); }

private:
    std::vector<uint8_t>& out_;
};

class ByteReader {
public:
    ByteReader(const uint8_t* data, size_t len, const char* what)
        : data_(data), len_(len), what_(what) {}

    void raw(void* ptr, size_t size) {
        need(size);
        std::memcpy(ptr, data_ + pos_, size);
        pos_ += size;
    }

    template <typename T>
    T get() {
        T value;
        raw(&value, sizeof(value));
        return value;
    }

    std::string str() {
        uint32_t n = get<uint32_t>();
        need(n);
        std::string s(reinterpret_cast<const char*>(data_ + pos_), n);
        pos_ += n;
        return s;
    }

    std::string blob() {
        uint64_t n = get<uint64_t>();
        need(n);
        std::string s(reinterpret_cast<const char*>(data_ + pos_), static_cast<size_t>(n));
        pos_ += static_cast<size_t>(n);
        return s;
    }

    void floats(float* out, size_t count) { raw(out, count * sizeof(float)); }

    // Pointer to the next n bytes without copying
    const uint8_t* view(size_t n) {
        need(n);
        const uint8_t* p = data_ + pos_;
        pos_ += n;
        return p;
    }

    size_t position() const { return pos_; }
    size_t remaining() const { return len_ - pos_; }
    bool done() const { return pos_ == len_; }

private:
    void need(uint64_t size) const {
        if (size > len_ - pos_) {
            char buf[256];
            std::snprintf(buf, sizeof(buf),
                "%s: unexpected end at offset %zu, need %llu bytes, have %zu bytes",
                what_, pos_, static_cast<unsigned long long>(size), len_ - pos_);
            throw std::runtime_error(buf);
        }
    }

    const uint8_t* data_;
    size_t len_;
    size_t pos_ = 0;
    const char* what_;
};

// ═══════════════════════════════════════════════════════════════════════════
// Record codec (WAL put entries and snapshot bodies)
// ═══════════════════════════════════════════════════════════════════════════

inline void encode_record(ByteWriter& w, const Record& r) {
    w.str(r.id);
    w.put<int64_t>(r.created);
    w.put<uint32_t>(static_cast<uint32_t>(r.vector.size()));
    w.floats(r.vector.data(), r.vector.size());
    w.blob(r.payload);
    w.put<uint32_t>(static_cast<uint32_t>(r.tags.size()));
    for (const auto& tag : r.tags) w.str(tag);
}

// Ordinal is not persisted; the store assigns a fresh one on load
inline Record decode_record(ByteReader& r) {
    Record rec;
    rec.id = r.str();
    rec.created = r.get<int64_t>();
    uint32_t dim = r.get<uint32_t>();
    if (static_cast<uint64_t>(dim) * sizeof(float) > r.remaining()) {
        throw std::runtime_error("record decode: vector exceeds entry");
    }
    rec.vector.resize(dim);
    r.floats(rec.vector.data(), dim);
    rec.payload = r.blob();
    uint32_t tag_count = r.get<uint32_t>();
    if (tag_count > r.remaining() / sizeof(uint32_t)) {
        throw std::runtime_error("record decode: tag count exceeds entry");
    }
    rec.tags.reserve(tag_count);
    for (uint32_t i = 0; i < tag_count; ++i) rec.tags.push_back(r.str());
    return rec;
}

} // namespace kosha
