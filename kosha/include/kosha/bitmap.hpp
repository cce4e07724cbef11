#pragma once
// Owning wrapper around a CRoaring bitmap
//
// Used for index tombstones and tag postings. Move-only; copy() is explicit
// so accidental deep copies of large postings don't hide in value semantics.

#include <roaring/roaring.h>
#include <cstdint>
#include <stdexcept>
#include <utility>
#include <vector>

namespace kosha {

class Bitmap {
public:
    Bitmap() : bm_(roaring_bitmap_create()) {
        if (!bm_) throw std::bad_alloc();
    }

    ~Bitmap() {
        if (bm_) roaring_bitmap_free(bm_);
    }

    Bitmap(Bitmap&& other) noexcept : bm_(other.bm_) { other.bm_ = nullptr; }

    Bitmap& operator=(Bitmap&& other) noexcept {
        if (this != &other) {
            if (bm_) roaring_bitmap_free(bm_);
            bm_ = other.bm_;
            other.bm_ = nullptr;
        }
        return *this;
    }

    Bitmap(const Bitmap&) = delete;
    Bitmap& operator=(const Bitmap&) = delete;

    Bitmap copy() const { return Bitmap(roaring_bitmap_copy(bm_)); }

    void add(uint32_t v) { roaring_bitmap_add(bm_, v); }
    void remove(uint32_t v) { roaring_bitmap_remove(bm_, v); }
    bool contains(uint32_t v) const { return roaring_bitmap_contains(bm_, v); }
    uint64_t cardinality() const { return roaring_bitmap_get_cardinality(bm_); }
    bool empty() const { return roaring_bitmap_is_empty(bm_); }
    void clear() { roaring_bitmap_clear(bm_); }

    void and_with(const Bitmap& other) { roaring_bitmap_and_inplace(bm_, other.bm_); }
    void or_with(const Bitmap& other) { roaring_bitmap_or_inplace(bm_, other.bm_); }
    void andnot_with(const Bitmap& other) { roaring_bitmap_andnot_inplace(bm_, other.bm_); }

    size_t memory_bytes() const { return roaring_bitmap_size_in_bytes(bm_); }

    // Portable format, readable by any CRoaring build
    std::vector<uint8_t> serialize() const {
        std::vector<uint8_t> buf(roaring_bitmap_portable_size_in_bytes(bm_));
        roaring_bitmap_portable_serialize(bm_, reinterpret_cast<char*>(buf.data()));
        return buf;
    }

    static Bitmap deserialize(const uint8_t* data, size_t len) {
        roaring_bitmap_t* bm = roaring_bitmap_portable_deserialize_safe(
            reinterpret_cast<const char*>(data), len);
        if (!bm) throw std::runtime_error("roaring bitmap: corrupt portable serialization");
        return Bitmap(bm);
    }

private:
    explicit Bitmap(roaring_bitmap_t* bm) : bm_(bm) {
        if (!bm_) throw std::bad_alloc();
    }

    roaring_bitmap_t* bm_;
};

} // namespace kosha
