#pragma once
// Vector Store: authoritative owner of records
//
// Reads run concurrently under a shared lock; writes are serialized.
// Every put validates before mutating, so a rejected put leaves the
// store exactly as it was.

#include "error.hpp"
#include "types.hpp"
#include <algorithm>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace kosha {

enum class PutOutcome : uint8_t {
    Inserted = 0,   // New id
    Unchanged = 1,  // Same (id, vector, payload, tags) already stored
    Replaced = 2,   // Id existed with different content
};

inline const char* put_outcome_name(PutOutcome o) {
    switch (o) {
        case PutOutcome::Inserted: return "inserted";
        case PutOutcome::Unchanged: return "unchanged";
        case PutOutcome::Replaced: return "replaced";
    }
    return "inserted";
}

struct PutReceipt {
    PutOutcome outcome = PutOutcome::Inserted;
    RecordPtr record;    // Record now stored under the id
    RecordPtr previous;  // Set when outcome == Replaced
};

// Shared by the store and by callers that validate before logging a write
inline Status validate_record(const std::string& id, const Vector& vector, size_t dimension) {
    if (id.empty()) {
        return Status::fail(ErrorKind::Validation, "id must not be empty");
    }
    if (id.size() > MAX_ID_BYTES) {
        return Status::fail(ErrorKind::Validation,
            "id exceeds " + std::to_string(MAX_ID_BYTES) + " bytes");
    }
    if (vector.size() != dimension) {
        return Status::fail(ErrorKind::Validation,
            "dimension mismatch: expected " + std::to_string(dimension) +
            ", got " + std::to_string(vector.size()));
    }
    if (!all_finite(vector)) {
        return Status::fail(ErrorKind::Validation, "vector contains NaN or Inf");
    }
    return Status::ok();
}

class VectorStore;

// Lazy, finite, restartable walk over the store. The id list is captured at
// creation; records deleted since are skipped when reached.
class RecordCursor {
public:
    bool next(RecordPtr& out);
    void reset() { pos_ = 0; }
    size_t size_hint() const { return ids_.size(); }

private:
    friend class VectorStore;
    RecordCursor(const VectorStore* store, std::vector<std::string> ids)
        : store_(store), ids_(std::move(ids)) {}

    const VectorStore* store_;
    std::vector<std::string> ids_;
    size_t pos_ = 0;
};

class VectorStore {
public:
    explicit VectorStore(size_t dimension) : dimension_(dimension) {}

    VectorStore(const VectorStore&) = delete;
    VectorStore& operator=(const VectorStore&) = delete;

    Result<PutReceipt> put(const std::string& id, Vector vector, std::string payload,
                           std::vector<std::string> tags = {}, Timestamp created = 0) {
        Status valid = validate_record(id, vector, dimension_);
        if (!valid) return Result<PutReceipt>::fail(valid.error());
        tags = normalize_tags(std::move(tags));

        std::unique_lock lock(mutex_);

        PutReceipt receipt;
        auto it = records_.find(id);
        if (it != records_.end()) {
            if (it->second->same_content(vector, payload, tags)) {
                receipt.outcome = PutOutcome::Unchanged;
                receipt.record = it->second;
                return Result<PutReceipt>::ok(std::move(receipt));
            }
            receipt.outcome = PutOutcome::Replaced;
            receipt.previous = it->second;
        }

        auto rec = std::make_shared<Record>();
        rec->id = id;
        rec->vector = std::move(vector);
        rec->payload = std::move(payload);
        rec->tags = std::move(tags);
        rec->ordinal = next_ordinal_++;
        rec->created = created != 0 ? created : now();

        if (receipt.previous) payload_bytes_ -= receipt.previous->payload.size();
        payload_bytes_ += rec->payload.size();

        receipt.record = rec;
        records_[id] = std::move(rec);
        return Result<PutReceipt>::ok(std::move(receipt));
    }

    // Put back a record previously taken from this store (write rollback)
    void restore(RecordPtr rec) {
        if (!rec) return;
        std::unique_lock lock(mutex_);
        auto it = records_.find(rec->id);
        if (it != records_.end()) payload_bytes_ -= it->second->payload.size();
        payload_bytes_ += rec->payload.size();
        records_[rec->id] = std::move(rec);
    }

    std::optional<Record> get(const std::string& id) const {
        RecordPtr rec = find(id);
        if (!rec) return std::nullopt;
        return *rec;
    }

    // Shared handle; nullptr when absent
    RecordPtr find(const std::string& id) const {
        std::shared_lock lock(mutex_);
        auto it = records_.find(id);
        return it == records_.end() ? nullptr : it->second;
    }

    bool remove(const std::string& id) {
        return take(id) != nullptr;
    }

    // Remove and return the record; nullptr when absent
    RecordPtr take(const std::string& id) {
        std::unique_lock lock(mutex_);
        auto it = records_.find(id);
        if (it == records_.end()) return nullptr;
        RecordPtr rec = std::move(it->second);
        records_.erase(it);
        payload_bytes_ -= rec->payload.size();
        return rec;
    }

    RecordCursor iterate() const {
        std::vector<std::string> ids;
        {
            std::shared_lock lock(mutex_);
            ids.reserve(records_.size());
            for (const auto& [id, rec] : records_) ids.push_back(id);
        }
        return RecordCursor(this, std::move(ids));
    }

    // Consistent point-in-time copy, ordered by ordinal (insertion order)
    std::vector<RecordPtr> snapshot() const {
        std::vector<RecordPtr> out;
        {
            std::shared_lock lock(mutex_);
            out.reserve(records_.size());
            for (const auto& [id, rec] : records_) out.push_back(rec);
        }
        std::sort(out.begin(), out.end(), [](const RecordPtr& a, const RecordPtr& b) {
            return a->ordinal < b->ordinal;
        });
        return out;
    }

    bool contains(const std::string& id) const {
        std::shared_lock lock(mutex_);
        return records_.count(id) > 0;
    }

    size_t size() const {
        std::shared_lock lock(mutex_);
        return records_.size();
    }

    size_t dimension() const { return dimension_; }

    size_t payload_bytes() const {
        std::shared_lock lock(mutex_);
        return payload_bytes_;
    }

    void clear() {
        std::unique_lock lock(mutex_);
        records_.clear();
        payload_bytes_ = 0;
    }

private:
    size_t dimension_;
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, RecordPtr> records_;
    uint32_t next_ordinal_ = 1;
    size_t payload_bytes_ = 0;
};

inline bool RecordCursor::next(RecordPtr& out) {
    while (pos_ < ids_.size()) {
        RecordPtr rec = store_->find(ids_[pos_++]);
        if (rec) {
            out = std::move(rec);
            return true;
        }
    }
    return false;
}

} // namespace kosha
