#pragma once
// Durable snapshots of the store and of the current graph generation
//
// records.snap  header + encoded records, CRC32 over the body
// index.graph   header + HnswGraph::serialize(), CRC32 over the body
//
// Both carry the WAL sequence they cover. Files are written with
// safe_save (temp → fsync → rename → fsync dir) and read through mmap.

#include "codec.hpp"
#include "error.hpp"
#include "hnsw.hpp"
#include "mmap.hpp"
#include "types.hpp"
#include <cerrno>
#include <cstring>
#include <iostream>
#include <memory>
#include <string>
#include <sys/stat.h>
#include <vector>

namespace kosha {

constexpr uint32_t SNAPSHOT_MAGIC = 0x4B534E50;    // "KSNP"
constexpr uint32_t SNAPSHOT_VERSION = 1;
constexpr uint32_t GRAPH_FILE_MAGIC = 0x4B475246;  // "KGRF"
constexpr uint32_t GRAPH_FILE_VERSION = 1;

struct SnapshotHeader {
    uint32_t magic;
    uint32_t version;
    uint32_t dimension;
    uint8_t metric;
    uint8_t reserved[3];
    uint64_t record_count;
    uint64_t last_sequence;  // WAL sequence covered
    uint64_t body_bytes;
    uint32_t checksum;       // CRC32 of body
    uint32_t reserved2;
};

static_assert(sizeof(SnapshotHeader) == 48, "SnapshotHeader must be 48 bytes");

struct GraphFileHeader {
    uint32_t magic;
    uint32_t version;
    uint64_t last_sequence;
    uint64_t body_bytes;
    uint32_t checksum;
    uint32_t reserved;
};

static_assert(sizeof(GraphFileHeader) == 32, "GraphFileHeader must be 32 bytes");

struct LoadedSnapshot {
    uint64_t last_sequence = 0;
    size_t dimension = 0;
    Metric metric = Metric::Cosine;
    std::vector<Record> records;  // Snapshot order (ordinal order at write time)
};

struct LoadedGraph {
    uint64_t last_sequence = 0;
    std::unique_ptr<HnswGraph> graph;
};

inline bool file_exists(const std::string& path) {
    struct stat st;
    return ::stat(path.c_str(), &st) == 0;
}

inline bool write_snapshot(const std::string& path, size_t dimension, Metric metric,
                           const std::vector<RecordPtr>& records, uint64_t last_sequence) {
    std::vector<uint8_t> body;
    ByteWriter w(body);
    for (const auto& rec : records) encode_record(w, *rec);

    SnapshotHeader header{};
    header.magic = SNAPSHOT_MAGIC;
    header.version = SNAPSHOT_VERSION;
    header.dimension = static_cast<uint32_t>(dimension);
    header.metric = static_cast<uint8_t>(metric);
    header.record_count = records.size();
    header.last_sequence = last_sequence;
    header.body_bytes = body.size();
    header.checksum = crc32(body.data(), body.size());

    bool ok = safe_save(path, [&](FILE* f) {
        if (fwrite(&header, sizeof(header), 1, f) != 1) return false;
        return body.empty() || fwrite(body.data(), 1, body.size(), f) == body.size();
    });
    if (!ok) {
        std::cerr << "[snapshot] Failed to write " << path << ": " << std::strerror(errno) << "\n";
    }
    return ok;
}

// NotFound when the file is absent (fresh data dir), Io when it is corrupt
inline Result<LoadedSnapshot> load_snapshot(const std::string& path) {
    if (!file_exists(path)) {
        return Result<LoadedSnapshot>::fail(ErrorKind::NotFound, "no snapshot at " + path);
    }

    MappedRegion region;
    if (!region.open(path)) {
        return Result<LoadedSnapshot>::fail(ErrorKind::Io, "cannot map " + path);
    }
    if (region.size() < sizeof(SnapshotHeader)) {
        return Result<LoadedSnapshot>::fail(ErrorKind::Io, "snapshot truncated: " + path);
    }

    SnapshotHeader header;
    std::memcpy(&header, region.data(), sizeof(header));
    if (header.magic != SNAPSHOT_MAGIC) {
        return Result<LoadedSnapshot>::fail(ErrorKind::Io, "snapshot has invalid magic: " + path);
    }
    if (header.version != SNAPSHOT_VERSION) {
        return Result<LoadedSnapshot>::fail(ErrorKind::Io,
            "snapshot version " + std::to_string(header.version) + " unsupported");
    }
    if (header.body_bytes != region.size() - sizeof(header)) {
        return Result<LoadedSnapshot>::fail(ErrorKind::Io, "snapshot length mismatch: " + path);
    }

    const uint8_t* body = region.data() + sizeof(header);
    if (crc32(body, header.body_bytes) != header.checksum) {
        return Result<LoadedSnapshot>::fail(ErrorKind::Io, "snapshot checksum mismatch: " + path);
    }

    LoadedSnapshot snap;
    snap.last_sequence = header.last_sequence;
    snap.dimension = header.dimension;
    snap.metric = static_cast<Metric>(header.metric);
    try {
        ByteReader r(body, header.body_bytes, "snapshot");
        snap.records.reserve(header.record_count);
        for (uint64_t i = 0; i < header.record_count; ++i) {
            snap.records.push_back(decode_record(r));
        }
        if (!r.done()) throw std::runtime_error("snapshot: trailing bytes after last record");
    } catch (const std::runtime_error& e) {
        return Result<LoadedSnapshot>::fail(ErrorKind::Io, e.what());
    }

    return Result<LoadedSnapshot>::ok(std::move(snap));
}

inline bool write_graph_file(const std::string& path, const std::vector<uint8_t>& graph,
                             uint64_t last_sequence) {
    GraphFileHeader header{};
    header.magic = GRAPH_FILE_MAGIC;
    header.version = GRAPH_FILE_VERSION;
    header.last_sequence = last_sequence;
    header.body_bytes = graph.size();
    header.checksum = crc32(graph.data(), graph.size());

    bool ok = safe_save(path, [&](FILE* f) {
        if (fwrite(&header, sizeof(header), 1, f) != 1) return false;
        return graph.empty() || fwrite(graph.data(), 1, graph.size(), f) == graph.size();
    });
    if (!ok) {
        std::cerr << "[snapshot] Failed to write " << path << ": " << std::strerror(errno) << "\n";
    }
    return ok;
}

inline Result<LoadedGraph> load_graph_file(const std::string& path) {
    if (!file_exists(path)) {
        return Result<LoadedGraph>::fail(ErrorKind::NotFound, "no graph at " + path);
    }

    MappedRegion region;
    if (!region.open(path) || region.size() < sizeof(GraphFileHeader)) {
        return Result<LoadedGraph>::fail(ErrorKind::Io, "cannot map " + path);
    }

    GraphFileHeader header;
    std::memcpy(&header, region.data(), sizeof(header));
    if (header.magic != GRAPH_FILE_MAGIC || header.version != GRAPH_FILE_VERSION) {
        return Result<LoadedGraph>::fail(ErrorKind::Io, "graph file has invalid header: " + path);
    }
    if (header.body_bytes != region.size() - sizeof(header)) {
        return Result<LoadedGraph>::fail(ErrorKind::Io, "graph file length mismatch: " + path);
    }

    const uint8_t* body = region.data() + sizeof(header);
    if (crc32(body, header.body_bytes) != header.checksum) {
        return Result<LoadedGraph>::fail(ErrorKind::Io, "graph file checksum mismatch: " + path);
    }

    LoadedGraph loaded;
    loaded.last_sequence = header.last_sequence;
    try {
        loaded.graph = HnswGraph::deserialize(body, header.body_bytes);
    } catch (const std::runtime_error& e) {
        return Result<LoadedGraph>::fail(ErrorKind::Io, e.what());
    }
    return Result<LoadedGraph>::ok(std::move(loaded));
}

} // namespace kosha
