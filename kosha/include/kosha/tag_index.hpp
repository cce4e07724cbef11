#pragma once
// Tag Index: inverted index from tag to record ordinal
//
//   - String interning: each unique tag stored once, referenced by tag_id
//   - Postings: tag_id -> roaring bitmap of record ordinals
//
// Filters are compiled once per query into a TagSelection, an owned pair of
// bitmaps, so per-candidate checks take no lock.

#include "bitmap.hpp"
#include "types.hpp"
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace kosha {

// Tag clauses of a query filter. Empty clauses are ignored.
struct TagFilter {
    std::vector<std::string> all_tags;   // Record must carry every one
    std::vector<std::string> any_tags;   // Record must carry at least one
    std::vector<std::string> none_tags;  // Record must carry none

    bool empty() const {
        return all_tags.empty() && any_tags.empty() && none_tags.empty();
    }
};

class TagSelection {
public:
    TagSelection() = default;

    bool matches(uint32_t ordinal) const {
        if (allow_ && !allow_->contains(ordinal)) return false;
        if (deny_ && deny_->contains(ordinal)) return false;
        return true;
    }

    // True when nothing can match (a required tag is unknown, etc.)
    bool impossible() const { return allow_ && allow_->empty(); }

private:
    friend class TagIndex;
    std::optional<Bitmap> allow_;  // nullopt = every ordinal
    std::optional<Bitmap> deny_;
};

class TagIndex {
public:
    TagIndex() = default;

    TagIndex(const TagIndex&) = delete;
    TagIndex& operator=(const TagIndex&) = delete;

    void add(uint32_t ordinal, const std::vector<std::string>& tags) {
        if (tags.empty()) return;
        std::unique_lock lock(mutex_);
        for (const auto& tag : tags) {
            postings_[intern(tag)].add(ordinal);
        }
    }

    void remove(uint32_t ordinal, const std::vector<std::string>& tags) {
        if (tags.empty()) return;
        std::unique_lock lock(mutex_);
        for (const auto& tag : tags) {
            auto it = string_to_id_.find(tag);
            if (it == string_to_id_.end()) continue;
            postings_[it->second].remove(ordinal);
        }
    }

    TagSelection compile(const TagFilter& filter) const {
        TagSelection sel;
        if (filter.empty()) return sel;

        std::shared_lock lock(mutex_);

        if (!filter.all_tags.empty()) {
            Bitmap acc;
            bool first = true;
            for (const auto& tag : filter.all_tags) {
                const Bitmap* posting = find(tag);
                if (!posting) {
                    acc.clear();
                    first = false;
                    break;
                }
                if (first) {
                    acc = posting->copy();
                    first = false;
                } else {
                    acc.and_with(*posting);
                }
            }
            sel.allow_ = std::move(acc);
        }

        if (!filter.any_tags.empty()) {
            Bitmap any;
            for (const auto& tag : filter.any_tags) {
                if (const Bitmap* posting = find(tag)) any.or_with(*posting);
            }
            if (sel.allow_) {
                sel.allow_->and_with(any);
            } else {
                sel.allow_ = std::move(any);
            }
        }

        if (!filter.none_tags.empty()) {
            Bitmap deny;
            for (const auto& tag : filter.none_tags) {
                if (const Bitmap* posting = find(tag)) deny.or_with(*posting);
            }
            sel.deny_ = std::move(deny);
        }

        return sel;
    }

    bool has_tag(uint32_t ordinal, const std::string& tag) const {
        std::shared_lock lock(mutex_);
        const Bitmap* posting = find(tag);
        return posting && posting->contains(ordinal);
    }

    size_t cardinality(const std::string& tag) const {
        std::shared_lock lock(mutex_);
        const Bitmap* posting = find(tag);
        return posting ? posting->cardinality() : 0;
    }

    size_t tag_count() const {
        std::shared_lock lock(mutex_);
        return id_to_string_.size();
    }

    size_t memory_usage() const {
        std::shared_lock lock(mutex_);
        size_t bytes = 0;
        for (const auto& s : id_to_string_) bytes += s.size() + sizeof(std::string);
        bytes += string_to_id_.size() * (sizeof(std::string) + sizeof(uint32_t) + 32);
        for (const auto& bm : postings_) bytes += bm.memory_bytes();
        return bytes;
    }

private:
    // Caller holds the unique lock
    uint32_t intern(const std::string& tag) {
        auto it = string_to_id_.find(tag);
        if (it != string_to_id_.end()) return it->second;

        uint32_t id = static_cast<uint32_t>(id_to_string_.size());
        string_to_id_.emplace(tag, id);
        id_to_string_.push_back(tag);
        postings_.emplace_back();
        return id;
    }

    // Caller holds a lock
    const Bitmap* find(const std::string& tag) const {
        auto it = string_to_id_.find(tag);
        if (it == string_to_id_.end()) return nullptr;
        return &postings_[it->second];
    }

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, uint32_t> string_to_id_;
    std::vector<std::string> id_to_string_;
    std::vector<Bitmap> postings_;
};

} // namespace kosha
