#pragma once
// Engine: the service facade
//
// Owns the vector store, tag index, HNSW index, query engine, WAL and the
// embedder. Every call returns Result/Status; nothing throws across this
// boundary.
//
// Write path (under write_mutex_):
//   validate → capacity → WAL append → store put → tags → index insert
// A failed index insert rolls the store back and logs a compensating entry.
//
// Delete tombstones the index before the record leaves the store, so a
// concurrent query sees either the record or nothing.

#include "config.hpp"
#include "embedder.hpp"
#include "error.hpp"
#include "hnsw.hpp"
#include "log.hpp"
#include "query_engine.hpp"
#include "snapshot.hpp"
#include "tag_index.hpp"
#include "types.hpp"
#include "vector_store.hpp"
#include "wal.hpp"
#ifdef KOSHA_WITH_ONNX
#include "onnx_embedder.hpp"
#endif
#include <algorithm>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace kosha {

namespace fs = std::filesystem;

struct IndexReceipt {
    std::string id;
    PutOutcome outcome = PutOutcome::Inserted;
    uint64_t sequence = 0;     // WAL sequence, 0 when nothing was logged
    uint64_t generation = 0;
};

struct CheckpointReport {
    uint64_t sequence = 0;
    size_t records = 0;
    size_t graph_bytes = 0;
    bool graph_saved = false;
    bool wal_truncated = false;
    int64_t elapsed_ms = 0;
};

struct EngineStats {
    size_t records = 0;
    size_t payload_bytes = 0;
    IndexStats index;
    size_t tags = 0;
    size_t tag_memory_bytes = 0;
    size_t consistency_gaps = 0;
    uint64_t searches = 0;
    uint64_t partial_searches = 0;
    uint64_t writes = 0;
    uint64_t deletes = 0;
    uint64_t wal_sequence = 0;
    size_t wal_entries = 0;
    size_t wal_skipped = 0;
    size_t replayed = 0;
    bool restored_graph = false;
    Timestamp last_checkpoint = 0;
    std::string embedder;
    size_t dimension = 0;
    Metric metric = Metric::Cosine;
};

struct HealthReport {
    std::string status = "online";
    bool index_loaded = false;
    uint64_t generation = 0;
    IndexState state = IndexState::Active;
    size_t count = 0;
    std::string embedder;
    bool embedder_ready = false;
};

// Build the embedder named by config.embedder
inline Result<std::unique_ptr<Embedder>> create_embedder(const EngineConfig& config) {
    using R = Result<std::unique_ptr<Embedder>>;
    if (config.embedder == "hash") {
        return R::ok(std::make_unique<HashingEmbedder>(config.dimension));
    }
#ifdef KOSHA_WITH_ONNX
    if (config.embedder == "onnx") {
        std::string error;
        auto onnx = OnnxEmbedder::load(config.model_dir, OnnxEmbedder::Config{}, error);
        if (!onnx) return R::fail(ErrorKind::DependencyFailure, error);
        return R::ok(std::move(onnx));
    }
#endif
    return R::fail(ErrorKind::DependencyFailure,
                   "embedder '" + config.embedder + "' is not available in this build");
}

class Engine {
public:
    Engine(EngineConfig config, std::unique_ptr<Embedder> embedder)
        : config_(std::move(config)),
          embedder_(std::move(embedder)),
          store_(config_.dimension),
          index_(config_.dimension, config_.metric, config_.index),
          query_(store_, index_, tags_, config_.query) {}

    ~Engine() {
        if (open_.load()) {
            Status st = close(true);
            if (!st) std::cerr << "[engine] close failed: " << st.error().describe() << "\n";
        }
    }

    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    // ═══════════════════════════════════════════════════════════════════
    // Lifecycle
    // ═══════════════════════════════════════════════════════════════════

    // Load snapshot, replay WAL, then reuse the persisted graph or rebuild
    Status open() {
        if (open_.load()) return Status::fail(ErrorKind::Validation, "engine already open");

        Status valid = config_.validate();
        if (!valid) return valid;
        if (!embedder_) return Status::fail(ErrorKind::DependencyFailure, "no embedder");
        if (embedder_->dimension() != config_.dimension) {
            return Status::fail(ErrorKind::Validation,
                "embedder '" + embedder_->name() + "' produces dim " +
                std::to_string(embedder_->dimension()) + ", engine configured for " +
                std::to_string(config_.dimension));
        }

        if (config_.persistence.enabled) {
            Status st = recover();
            if (!st) return st;
        }

        last_checkpoint_.store(now());
        open_.store(true);
        std::cerr << "[engine] Opened " << config_.data_dir << ": " << store_.size()
                  << " records, generation " << index_.generation()
                  << (restored_graph_ ? " (graph restored)" : "")
                  << ", replayed " << replayed_ << "\n";
        return Status::ok();
    }

    // Checkpoint (unless told otherwise) and release the WAL.
    // close(false) leaves disk state as a crash would.
    Status close(bool checkpoint_first = true) {
        if (!open_.load()) return Status::ok();
        Status result = Status::ok();
        if (checkpoint_first && wal_) {
            auto report = checkpoint();
            if (!report) result = report.status();
        }
        {
            std::lock_guard<std::mutex> lock(write_mutex_);
            if (wal_) wal_->close();
            open_.store(false);
        }
        std::cerr << "[engine] Closed " << config_.data_dir << "\n";
        return result;
    }

    bool is_open() const { return open_.load(); }

    // ═══════════════════════════════════════════════════════════════════
    // Writes
    // ═══════════════════════════════════════════════════════════════════

    Result<IndexReceipt> index_document(const std::string& id, const std::string& content,
                                        const std::string& payload,
                                        std::vector<std::string> tags = {}) {
        if (!open_.load()) return Result<IndexReceipt>::fail(not_open());
        // Embed before any lock is taken
        auto embedded = embedder_->embed(content);
        if (!embedded) return Result<IndexReceipt>::fail(embedded.error());
        return index_vector(id, embedded.take(), payload, std::move(tags));
    }

    Result<IndexReceipt> index_vector(const std::string& id, const Vector& vector,
                                      const std::string& payload,
                                      std::vector<std::string> tags = {}) {
        if (!open_.load()) return Result<IndexReceipt>::fail(not_open());
        tags = normalize_tags(std::move(tags));

        auto receipt = write(id, vector, payload, tags);
        if (!receipt && receipt.kind() == ErrorKind::ResourceExhaustion &&
            config_.compaction.policy == CompactionPolicy::OnCapacity &&
            index_.stats().tombstones > 0) {
            std::cerr << "[engine] Capacity reached, compacting before retry\n";
            auto rebuilt = rebuild_index();
            if (rebuilt) receipt = write(id, vector, payload, tags);
        }
        return receipt;
    }

    Status delete_document(const std::string& id) {
        if (!open_.load()) return Status::fail(not_open());

        std::lock_guard<std::mutex> lock(write_mutex_);
        if (!store_.contains(id)) {
            return Status::fail(ErrorKind::NotFound, "no record with id '" + id + "'");
        }
        if (wal_ && wal_->append_delete(id) == 0) {
            return Status::fail(ErrorKind::Io, "WAL append failed for delete of '" + id + "'");
        }

        index_.remove(id);
        RecordPtr rec = store_.take(id);
        if (rec) tags_.remove(rec->ordinal, rec->tags);
        deletes_.fetch_add(1, std::memory_order_relaxed);
        log_debug("engine", "deleted '%s'", id.c_str());
        return Status::ok();
    }

    // ═══════════════════════════════════════════════════════════════════
    // Reads
    // ═══════════════════════════════════════════════════════════════════

    Result<Record> get_document(const std::string& id) const {
        if (!open_.load()) return Result<Record>::fail(not_open());
        auto rec = store_.get(id);
        if (!rec) return Result<Record>::fail(ErrorKind::NotFound, "no record with id '" + id + "'");
        return Result<Record>::ok(std::move(*rec));
    }

    // Text query: request.vector is filled from the embedder
    Result<SearchResult> search(const std::string& query, SearchRequest request) {
        if (!open_.load()) return Result<SearchResult>::fail(not_open());
        auto embedded = embedder_->embed(query);
        if (!embedded) return Result<SearchResult>::fail(embedded.error());
        request.vector = embedded.take();
        return search_vector(request);
    }

    Result<SearchResult> search_vector(const SearchRequest& request) const {
        if (!open_.load()) return Result<SearchResult>::fail(not_open());
        auto result = query_.search(request);
        searches_.fetch_add(1, std::memory_order_relaxed);
        if (result && result.value().partial) {
            partial_searches_.fetch_add(1, std::memory_order_relaxed);
        }
        return result;
    }

    // ═══════════════════════════════════════════════════════════════════
    // Maintenance
    // ═══════════════════════════════════════════════════════════════════

    // Fresh generation from the store; queries and writes continue meanwhile
    Result<RebuildReport> rebuild_index() {
        if (!open_.load()) return Result<RebuildReport>::fail(not_open());

        std::vector<RecordPtr> snapshot;
        {
            // Snapshot and rebuild start are one step relative to writes,
            // so every later write reaches the catch-up queue
            std::lock_guard<std::mutex> lock(write_mutex_);
            Status st = index_.begin_rebuild();
            if (!st) return Result<RebuildReport>::fail(st.error());
            snapshot = store_.snapshot();
        }
        return index_.finish_rebuild(snapshot);
    }

    Result<CheckpointReport> checkpoint() {
        if (!open_.load()) return Result<CheckpointReport>::fail(not_open());
        if (!wal_) {
            return Result<CheckpointReport>::fail(ErrorKind::Validation, "persistence is disabled");
        }
        std::lock_guard<std::mutex> serial(checkpoint_mutex_);
        auto start = std::chrono::steady_clock::now();

        CheckpointReport report;
        std::vector<RecordPtr> records;
        std::vector<uint8_t> graph;
        {
            std::lock_guard<std::mutex> lock(write_mutex_);
            records = store_.snapshot();
            report.sequence = wal_->last_sequence();
            if (config_.persistence.save_graph) graph = index_.serialize();
        }

        if (!write_snapshot(config_.snapshot_path(), config_.dimension, config_.metric,
                            records, report.sequence)) {
            return Result<CheckpointReport>::fail(ErrorKind::Io,
                                                  "cannot write " + config_.snapshot_path());
        }
        report.records = records.size();

        if (!graph.empty()) {
            // A stale graph file is harmless: its sequence no longer matches
            report.graph_saved = write_graph_file(config_.graph_path(), graph, report.sequence);
            report.graph_bytes = graph.size();
        }

        {
            std::lock_guard<std::mutex> lock(write_mutex_);
            // Only cut the log when nothing was written behind the snapshot
            if (wal_->last_sequence() == report.sequence) {
                if (wal_->append_checkpoint(report.sequence) == 0 || !wal_->truncate()) {
                    std::cerr << "[engine] WAL not truncated after checkpoint\n";
                } else {
                    report.wal_truncated = true;
                }
            }
        }

        last_checkpoint_.store(now());
        report.elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start).count();
        std::cerr << "[engine] Checkpoint at seq " << report.sequence << ": "
                  << report.records << " records, graph "
                  << (report.graph_saved ? std::to_string(report.graph_bytes) + " bytes" : "skipped")
                  << ", " << report.elapsed_ms << "ms\n";
        return Result<CheckpointReport>::ok(report);
    }

    // WAL has grown past the entry threshold, or the interval has passed
    // with anything logged since
    bool checkpoint_due() const {
        if (!wal_ || !open_.load()) return false;
        size_t entries = 0;
        {
            std::lock_guard<std::mutex> lock(write_mutex_);
            entries = wal_->entries();
        }
        if (entries == 0) return false;
        if (entries >= config_.persistence.checkpoint_wal_entries) return true;
        Timestamp elapsed = now() - last_checkpoint_.load();
        return elapsed >= config_.persistence.checkpoint_interval_s * 1000;
    }

    // Ratio policy: rebuild once tombstones dominate. Returns whether a
    // rebuild ran.
    Result<bool> compact_if_needed() {
        if (!open_.load()) return Result<bool>::fail(not_open());
        if (config_.compaction.policy != CompactionPolicy::Ratio) return Result<bool>::ok(false);

        IndexStats s = index_.stats();
        if (s.slots == 0 || s.tombstones < config_.compaction.min_tombstones) {
            return Result<bool>::ok(false);
        }
        double ratio = static_cast<double>(s.tombstones) / static_cast<double>(s.slots);
        if (ratio < config_.compaction.ratio) return Result<bool>::ok(false);

        std::cerr << "[engine] Compacting: " << s.tombstones << "/" << s.slots
                  << " slots tombstoned\n";
        auto rebuilt = rebuild_index();
        if (!rebuilt) {
            // Someone else is already rebuilding
            if (rebuilt.kind() == ErrorKind::Validation) return Result<bool>::ok(false);
            return Result<bool>::fail(rebuilt.error());
        }
        return Result<bool>::ok(true);
    }

    // ═══════════════════════════════════════════════════════════════════
    // Introspection
    // ═══════════════════════════════════════════════════════════════════

    EngineStats stats() const {
        EngineStats s;
        s.records = store_.size();
        s.payload_bytes = store_.payload_bytes();
        s.index = index_.stats();
        s.tags = tags_.tag_count();
        s.tag_memory_bytes = tags_.memory_usage();
        s.consistency_gaps = query_.consistency_gaps();
        s.searches = searches_.load(std::memory_order_relaxed);
        s.partial_searches = partial_searches_.load(std::memory_order_relaxed);
        s.writes = writes_.load(std::memory_order_relaxed);
        s.deletes = deletes_.load(std::memory_order_relaxed);
        {
            std::lock_guard<std::mutex> lock(write_mutex_);
            if (wal_) {
                s.wal_sequence = wal_->last_sequence();
                s.wal_entries = wal_->entries();
                s.wal_skipped = wal_->skipped();
            }
        }
        s.replayed = replayed_;
        s.restored_graph = restored_graph_;
        s.last_checkpoint = last_checkpoint_.load();
        s.embedder = embedder_ ? embedder_->name() : "";
        s.dimension = config_.dimension;
        s.metric = config_.metric;
        return s;
    }

    HealthReport health() const {
        HealthReport h;
        h.index_loaded = open_.load();
        h.generation = index_.generation();
        h.state = index_.state();
        h.count = store_.size();
        h.embedder = embedder_ ? embedder_->name() : "";
        h.embedder_ready = embedder_ && embedder_->ready();
        if (!h.index_loaded) h.status = "closed";
        return h;
    }

    const EngineConfig& config() const { return config_; }

    // Direct access for maintenance and tests
    VectorStore& store() { return store_; }
    HnswIndex& index() { return index_; }
    const TagIndex& tags() const { return tags_; }

private:
    static Error not_open() { return Error{ErrorKind::Validation, "engine is not open"}; }

    Result<IndexReceipt> write(const std::string& id, const Vector& vector,
                               const std::string& payload, const std::vector<std::string>& tags) {
        Status valid = validate_record(id, vector, config_.dimension);
        if (!valid) return Result<IndexReceipt>::fail(valid.error());

        std::lock_guard<std::mutex> lock(write_mutex_);

        IndexReceipt receipt;
        receipt.id = id;

        RecordPtr existing = store_.find(id);
        if (existing && existing->same_content(vector, payload, tags)) {
            receipt.outcome = PutOutcome::Unchanged;
            receipt.generation = index_.generation();
            return Result<IndexReceipt>::ok(std::move(receipt));
        }

        if (!index_.has_capacity()) {
            IndexStats s = index_.stats();
            return Result<IndexReceipt>::fail(ErrorKind::ResourceExhaustion,
                "index capacity " + std::to_string(s.capacity) + " reached (" +
                std::to_string(s.tombstones) + " tombstoned slots reclaimable by rebuild)");
        }

        Record rec;
        rec.id = id;
        rec.vector = vector;
        rec.payload = payload;
        rec.tags = tags;
        rec.created = now();

        if (wal_) {
            receipt.sequence = wal_->append_put(rec);
            if (receipt.sequence == 0) {
                return Result<IndexReceipt>::fail(ErrorKind::Io,
                                                  "WAL append failed for '" + id + "'");
            }
        }

        auto put = store_.put(id, rec.vector, rec.payload, rec.tags, rec.created);
        if (!put) {
            compensate(id, existing);
            return Result<IndexReceipt>::fail(put.error());
        }
        const PutReceipt& placed = put.value();
        if (placed.previous) tags_.remove(placed.previous->ordinal, placed.previous->tags);
        tags_.add(placed.record->ordinal, placed.record->tags);

        Status inserted = index_.insert(id, vector);
        if (!inserted) {
            // Roll back so every live record stays reachable
            tags_.remove(placed.record->ordinal, placed.record->tags);
            store_.take(id);
            if (placed.previous) {
                store_.restore(placed.previous);
                tags_.add(placed.previous->ordinal, placed.previous->tags);
            }
            compensate(id, existing);
            std::cerr << "[engine] Insert of '" << id << "' rolled back: "
                      << inserted.error().message << "\n";
            return Result<IndexReceipt>::fail(inserted.error());
        }

        receipt.outcome = placed.outcome;
        receipt.generation = index_.generation();
        writes_.fetch_add(1, std::memory_order_relaxed);
        log_debug("engine", "%s '%s' seq=%llu", put_outcome_name(placed.outcome), id.c_str(),
                  static_cast<unsigned long long>(receipt.sequence));
        return Result<IndexReceipt>::ok(std::move(receipt));
    }

    // Undo a logged put that never took effect: replay must land on the
    // state before it
    void compensate(const std::string& id, const RecordPtr& previous) {
        if (!wal_) return;
        uint64_t seq = previous ? wal_->append_put(*previous) : wal_->append_delete(id);
        if (seq == 0) {
            std::cerr << "[engine] Compensating WAL entry for '" << id
                      << "' failed; replay may resurrect it\n";
        }
    }

    Status recover() {
        std::error_code ec;
        fs::create_directories(config_.data_dir, ec);
        if (ec) {
            return Status::fail(ErrorKind::Io,
                                "cannot create " + config_.data_dir + ": " + ec.message());
        }

        uint64_t covered = 0;
        auto snap = load_snapshot(config_.snapshot_path());
        if (snap) {
            LoadedSnapshot& loaded = snap.value();
            if (loaded.dimension != config_.dimension || loaded.metric != config_.metric) {
                return Status::fail(ErrorKind::Validation,
                    "snapshot holds dim " + std::to_string(loaded.dimension) + "/" +
                    metric_name(loaded.metric) + " data, engine configured for dim " +
                    std::to_string(config_.dimension) + "/" + metric_name(config_.metric));
            }
            covered = loaded.last_sequence;
            for (auto& rec : loaded.records) {
                auto put = store_.put(rec.id, std::move(rec.vector), std::move(rec.payload),
                                      std::move(rec.tags), rec.created);
                if (!put) {
                    return Status::fail(ErrorKind::Io,
                                        "snapshot record '" + rec.id + "': " + put.error().message);
                }
                tags_.add(put.value().record->ordinal, put.value().record->tags);
            }
            std::cerr << "[engine] Snapshot: " << store_.size() << " records through seq "
                      << covered << "\n";
        } else if (snap.kind() != ErrorKind::NotFound) {
            return snap.status();
        }

        wal_ = std::make_unique<WriteAheadLog>(config_.wal_path(), config_.persistence.wal_fsync);
        if (!wal_->open()) {
            wal_.reset();
            return Status::fail(ErrorKind::Io, "cannot open WAL " + config_.wal_path());
        }
        wal_->ensure_sequence_at_least(covered);

        bool graph_live = false;
        if (config_.persistence.save_graph) {
            auto graph = load_graph_file(config_.graph_path());
            if (graph && graph.value().last_sequence == covered) {
                Status st = index_.install(std::move(graph.value().graph));
                if (st) {
                    graph_live = true;
                } else {
                    std::cerr << "[engine] Persisted graph unusable: " << st.error().message << "\n";
                }
            } else if (graph) {
                std::cerr << "[engine] Persisted graph covers seq " << graph.value().last_sequence
                          << ", snapshot covers " << covered << "; rebuilding\n";
            } else if (graph.kind() != ErrorKind::NotFound) {
                std::cerr << "[engine] " << graph.error().message << "; rebuilding\n";
            }
        }

        replayed_ = wal_->replay(covered, [&](const WalEntry& entry) {
            apply_replayed(entry, graph_live);
        });

        bool consistent = graph_live && index_matches_store();
        if (graph_live && !consistent) {
            std::cerr << "[engine] Restored graph disagrees with store; rebuilding\n";
        }
        if (!consistent && (store_.size() > 0 || index_.size() > 0)) {
            Status st = index_.begin_rebuild();
            if (!st) return st;
            auto rebuilt = index_.finish_rebuild(store_.snapshot());
            if (!rebuilt) return rebuilt.status();
        }
        restored_graph_ = consistent;
        return Status::ok();
    }

    void apply_replayed(const WalEntry& entry, bool graph_live) {
        if (entry.op == WalOp::Delete) {
            if (graph_live) index_.remove(entry.id);
            RecordPtr rec = store_.take(entry.id);
            if (rec) tags_.remove(rec->ordinal, rec->tags);
            return;
        }

        const Record& r = entry.record;
        auto put = store_.put(r.id, r.vector, r.payload, r.tags, r.created);
        if (!put) {
            std::cerr << "[engine] Replay of seq " << entry.sequence << " rejected: "
                      << put.error().message << "\n";
            return;
        }
        const PutReceipt& placed = put.value();
        if (placed.outcome == PutOutcome::Unchanged) return;
        if (placed.previous) tags_.remove(placed.previous->ordinal, placed.previous->tags);
        tags_.add(placed.record->ordinal, placed.record->tags);
        if (graph_live) {
            Status st = index_.insert(r.id, r.vector);
            if (!st) log_debug("engine", "replay insert '%s': %s", r.id.c_str(), st.error().message.c_str());
        }
    }

    bool index_matches_store() const {
        std::vector<std::string> live = index_.live_ids();
        if (live.size() != store_.size()) return false;
        for (const auto& id : live) {
            if (!store_.contains(id)) return false;
        }
        return true;
    }

    EngineConfig config_;
    std::unique_ptr<Embedder> embedder_;

    VectorStore store_;
    TagIndex tags_;
    HnswIndex index_;
    QueryEngine query_;
    std::unique_ptr<WriteAheadLog> wal_;

    mutable std::mutex write_mutex_;  // Orders WAL, store, tags and index
    std::mutex checkpoint_mutex_;
    std::atomic<bool> open_{false};
    std::atomic<Timestamp> last_checkpoint_{0};

    mutable std::atomic<uint64_t> searches_{0};
    mutable std::atomic<uint64_t> partial_searches_{0};
    std::atomic<uint64_t> writes_{0};
    std::atomic<uint64_t> deletes_{0};
    size_t replayed_ = 0;
    bool restored_graph_ = false;
};

} // namespace kosha
