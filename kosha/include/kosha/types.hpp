#pragma once
// Core types: vectors, metrics, records
//
// A Record is immutable once stored. The store hands out
// shared_ptr<const Record>; replacing an id stores a new Record.

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <memory>
#include <optional>
#include <string>
#include <vector>

// POSIX headers for atomic file persistence (must be outside namespace)
#include <unistd.h>
#include <fcntl.h>
#include <sys/stat.h>

namespace kosha {

// Timestamp as Unix millis
using Timestamp = int64_t;

inline Timestamp now() {
    auto duration = std::chrono::system_clock::now().time_since_epoch();
    return std::chrono::duration_cast<std::chrono::milliseconds>(duration).count();
}

using Vector = std::vector<float>;

// Ids longer than this are rejected at the store boundary
constexpr size_t MAX_ID_BYTES = 512;

// ═══════════════════════════════════════════════════════════════════════════
// Similarity metrics
// ═══════════════════════════════════════════════════════════════════════════

enum class Metric : uint8_t {
    Cosine = 0,     // score in [-1, 1]; index distance = 1 - dot(normalized)
    Euclidean = 1,  // score = 1 / (1 + L2); index distance = squared L2
};

inline const char* metric_name(Metric m) {
    return m == Metric::Euclidean ? "euclidean" : "cosine";
}

inline std::optional<Metric> parse_metric(const std::string& name) {
    if (name == "cosine") return Metric::Cosine;
    if (name == "euclidean" || name == "l2") return Metric::Euclidean;
    return std::nullopt;
}

inline float dot(const float* a, const float* b, size_t dim) {
    float sum = 0.0f;
    for (size_t i = 0; i < dim; ++i) sum += a[i] * b[i];
    return sum;
}

inline float l2_squared(const float* a, const float* b, size_t dim) {
    float sum = 0.0f;
    for (size_t i = 0; i < dim; ++i) {
        float d = a[i] - b[i];
        sum += d * d;
    }
    return sum;
}

inline float norm(const Vector& v) {
    return std::sqrt(dot(v.data(), v.data(), v.size()));
}

// Scale to unit length. A zero vector stays zero.
inline void normalize(Vector& v) {
    float n = norm(v);
    if (n > 0.0f) {
        for (float& x : v) x /= n;
    }
}

inline bool all_finite(const Vector& v) {
    for (float x : v) {
        if (!std::isfinite(x)) return false;
    }
    return true;
}

// Exact similarity between two raw (unnormalized) vectors
inline float similarity(Metric metric, const Vector& a, const Vector& b) {
    size_t dim = std::min(a.size(), b.size());
    if (metric == Metric::Euclidean) {
        return 1.0f / (1.0f + std::sqrt(l2_squared(a.data(), b.data(), dim)));
    }
    float na = norm(a);
    float nb = norm(b);
    if (na == 0.0f || nb == 0.0f) return 0.0f;
    return dot(a.data(), b.data(), dim) / (na * nb);
}

// Convert an index-space distance back to a score
inline float score_from_distance(Metric metric, float distance) {
    if (metric == Metric::Euclidean) {
        return 1.0f / (1.0f + std::sqrt(std::max(distance, 0.0f)));
    }
    return 1.0f - distance;
}

// ═══════════════════════════════════════════════════════════════════════════
// Records
// ═══════════════════════════════════════════════════════════════════════════

struct Record {
    std::string id;
    Vector vector;
    std::string payload;             // Opaque bytes
    std::vector<std::string> tags;   // Sorted, unique
    uint32_t ordinal = 0;            // Assigned by the store, keys the tag index
    Timestamp created = 0;

    bool same_content(const Vector& v, const std::string& p,
                      const std::vector<std::string>& t) const {
        return vector == v && payload == p && tags == t;
    }
};

using RecordPtr = std::shared_ptr<const Record>;

// Sort, dedupe and drop empty tags
inline std::vector<std::string> normalize_tags(std::vector<std::string> tags) {
    tags.erase(std::remove_if(tags.begin(), tags.end(),
                              [](const std::string& t) { return t.empty(); }),
               tags.end());
    std::sort(tags.begin(), tags.end());
    tags.erase(std::unique(tags.begin(), tags.end()), tags.end());
    return tags;
}

// ═══════════════════════════════════════════════════════════════════════════
// Utility functions
// ═══════════════════════════════════════════════════════════════════════════

inline uint32_t crc32(const uint8_t* data, size_t length) {
    uint32_t crc = 0xFFFFFFFF;
    for (size_t i = 0; i < length; ++i) {
        crc ^= data[i];
        for (int j = 0; j < 8; ++j) {
            crc = (crc >> 1) ^ (0xEDB88320 & -(crc & 1));
        }
    }
    return ~crc;
}

// FNV-1a, used for feature hashing and socket path derivation
inline uint64_t fnv1a(const char* data, size_t length) {
    uint64_t h = 14695981039346656037ULL;
    for (size_t i = 0; i < length; ++i) {
        h ^= static_cast<uint8_t>(data[i]);
        h *= 1099511628211ULL;
    }
    return h;
}

// ═══════════════════════════════════════════════════════════════════════════
// Atomic file persistence: write temp → fsync → rename → fsync dir
// ═══════════════════════════════════════════════════════════════════════════

inline bool fsync_dir(const std::string& path) {
    auto slash = path.find_last_of('/');
    std::string dir = (slash == std::string::npos) ? "." : path.substr(0, slash);
    int dfd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY);
    if (dfd < 0) return false;
    int rc = ::fsync(dfd);
    ::close(dfd);
    return rc == 0;
}

// Writer takes FILE* and returns true on success
template <typename Writer>
bool safe_save(const std::string& path, Writer&& write_fn) {
    std::string tmp = path + ".tmp." + std::to_string(::getpid());
    FILE* f = ::fopen(tmp.c_str(), "wb");
    if (!f) return false;

    bool ok = write_fn(f) && ::fflush(f) == 0 && ::fsync(::fileno(f)) == 0;
    ::fclose(f);
    if (!ok) {
        ::remove(tmp.c_str());
        return false;
    }

    if (::rename(tmp.c_str(), path.c_str()) != 0) {
        ::remove(tmp.c_str());
        return false;
    }

    return fsync_dir(path);
}

} // namespace kosha
