#pragma once
// Engine configuration
//
// Built once at startup, in layers: defaults → JSON file → environment →
// command-line flags. Read-only once the engine is open.

#include "error.hpp"
#include "hnsw.hpp"
#include "query_engine.hpp"
#include "types.hpp"
#include <nlohmann/json.hpp>
#include <cstdlib>
#include <fstream>
#include <string>
#include <unistd.h>

namespace kosha {

using json = nlohmann::json;

enum class CompactionPolicy : uint8_t {
    Never = 0,       // Only an explicit rebuild reclaims tombstones
    Ratio = 1,       // Maintenance rebuilds past a tombstone ratio
    OnCapacity = 2,  // Rebuild when an insert would exhaust capacity, then retry once
};

inline const char* compaction_policy_name(CompactionPolicy p) {
    switch (p) {
        case CompactionPolicy::Never: return "never";
        case CompactionPolicy::Ratio: return "ratio";
        case CompactionPolicy::OnCapacity: return "on_capacity";
    }
    return "ratio";
}

inline std::optional<CompactionPolicy> parse_compaction_policy(const std::string& s) {
    if (s == "never") return CompactionPolicy::Never;
    if (s == "ratio") return CompactionPolicy::Ratio;
    if (s == "on_capacity") return CompactionPolicy::OnCapacity;
    return std::nullopt;
}

struct CompactionConfig {
    CompactionPolicy policy = CompactionPolicy::Ratio;
    double ratio = 0.2;           // tombstones / slots
    size_t min_tombstones = 64;
};

struct PersistenceConfig {
    bool enabled = true;
    bool wal_fsync = true;                 // fsync every append before acknowledging
    size_t checkpoint_wal_entries = 10000; // Checkpoint once the WAL holds this many
    int64_t checkpoint_interval_s = 300;   // ...or this long after the last one
    bool save_graph = true;                // Persist the graph so restarts skip a rebuild
};

struct DaemonConfig {
    std::string socket_path;      // Empty = derived from data_dir
    size_t workers = 4;
    int64_t maintenance_interval_s = 30;
};

// /tmp/kosha-<hash>.<ext>, one per data directory
inline std::string runtime_path(const std::string& data_dir, const char* ext) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%016llx",
                  static_cast<unsigned long long>(fnv1a(data_dir.data(), data_dir.size())));
    return "/tmp/kosha-" + std::string(buf, 12) + "." + ext;
}

struct EngineConfig {
    std::string data_dir = "./kosha-data";
    std::string model_dir = "/tmp/kosha/models";
    std::string embedder = "hash";    // "hash" | "onnx"
    size_t dimension = 384;
    Metric metric = Metric::Cosine;

    IndexConfig index;
    QueryConfig query;
    PersistenceConfig persistence;
    CompactionConfig compaction;
    DaemonConfig daemon;

    std::string snapshot_path() const { return data_dir + "/records.snap"; }
    std::string graph_path() const { return data_dir + "/index.graph"; }
    std::string wal_path() const { return data_dir + "/wal.log"; }

    std::string socket_path() const {
        return daemon.socket_path.empty() ? runtime_path(data_dir, "sock") : daemon.socket_path;
    }
    std::string lock_path() const { return runtime_path(data_dir, "lock"); }

    // Overlay the keys present in a JSON document. Absent keys keep their value.
    Status merge_json(const json& j) {
        try {
            if (!j.is_object()) {
                return Status::fail(ErrorKind::Validation, "config root must be an object");
            }
            data_dir = j.value("data_dir", data_dir);
            model_dir = j.value("model_dir", model_dir);
            embedder = j.value("embedder", embedder);
            dimension = j.value("dimension", dimension);
            if (j.contains("metric")) {
                auto m = parse_metric(j["metric"].get<std::string>());
                if (!m) return Status::fail(ErrorKind::Validation, "unknown metric " + j["metric"].dump());
                metric = *m;
            }

            if (j.contains("index")) {
                const auto& x = j["index"];
                index.M = x.value("M", index.M);
                index.ef_construction = x.value("ef_construction", index.ef_construction);
                index.ef_search = x.value("ef_search", index.ef_search);
                index.max_level = x.value("max_level", index.max_level);
                index.capacity = x.value("capacity", index.capacity);
                index.seed = x.value("seed", index.seed);
                index.quantize = x.value("quantize", index.quantize);
            }
            if (j.contains("query")) {
                const auto& x = j["query"];
                query.min_overfetch = x.value("min_overfetch", query.min_overfetch);
                query.max_effort = x.value("max_effort", query.max_effort);
            }
            if (j.contains("persistence")) {
                const auto& x = j["persistence"];
                persistence.enabled = x.value("enabled", persistence.enabled);
                persistence.wal_fsync = x.value("wal_fsync", persistence.wal_fsync);
                persistence.checkpoint_wal_entries =
                    x.value("checkpoint_wal_entries", persistence.checkpoint_wal_entries);
                persistence.checkpoint_interval_s =
                    x.value("checkpoint_interval_s", persistence.checkpoint_interval_s);
                persistence.save_graph = x.value("save_graph", persistence.save_graph);
            }
            if (j.contains("compaction")) {
                const auto& x = j["compaction"];
                if (x.contains("policy")) {
                    auto p = parse_compaction_policy(x["policy"].get<std::string>());
                    if (!p) {
                        return Status::fail(ErrorKind::Validation,
                                            "unknown compaction policy " + x["policy"].dump());
                    }
                    compaction.policy = *p;
                }
                compaction.ratio = x.value("ratio", compaction.ratio);
                compaction.min_tombstones = x.value("min_tombstones", compaction.min_tombstones);
            }
            if (j.contains("daemon")) {
                const auto& x = j["daemon"];
                daemon.socket_path = x.value("socket_path", daemon.socket_path);
                daemon.workers = x.value("workers", daemon.workers);
                daemon.maintenance_interval_s =
                    x.value("maintenance_interval_s", daemon.maintenance_interval_s);
            }
        } catch (const json::exception& e) {
            return Status::fail(ErrorKind::Validation, std::string("config: ") + e.what());
        }
        return Status::ok();
    }

    Status merge_file(const std::string& path) {
        std::ifstream f(path);
        if (!f) return Status::fail(ErrorKind::Io, "cannot read config " + path);
        json j = json::parse(f, nullptr, false);
        if (j.is_discarded()) {
            return Status::fail(ErrorKind::Validation, "config " + path + " is not valid JSON");
        }
        return merge_json(j);
    }

    // KOSHA_DATA_DIR, KOSHA_MODEL_DIR, KOSHA_DIM, KOSHA_METRIC, KOSHA_SOCKET, KOSHA_EMBEDDER
    Status merge_env() {
        if (const char* v = std::getenv("KOSHA_DATA_DIR")) data_dir = v;
        if (const char* v = std::getenv("KOSHA_MODEL_DIR")) model_dir = v;
        if (const char* v = std::getenv("KOSHA_SOCKET")) daemon.socket_path = v;
        if (const char* v = std::getenv("KOSHA_EMBEDDER")) embedder = v;
        if (const char* v = std::getenv("KOSHA_DIM")) {
            char* end = nullptr;
            unsigned long long d = std::strtoull(v, &end, 10);
            if (!end || *end != '\0' || end == v) {
                return Status::fail(ErrorKind::Validation, std::string("KOSHA_DIM is not a number: ") + v);
            }
            dimension = static_cast<size_t>(d);
        }
        if (const char* v = std::getenv("KOSHA_METRIC")) {
            auto m = parse_metric(v);
            if (!m) return Status::fail(ErrorKind::Validation, std::string("KOSHA_METRIC unknown: ") + v);
            metric = *m;
        }
        return Status::ok();
    }

    Status validate() const {
        auto bad = [](const std::string& msg) { return Status::fail(ErrorKind::Validation, msg); };
        if (dimension == 0) return bad("dimension must be > 0");
        if (dimension > 65536) return bad("dimension must be <= 65536");
        if (data_dir.empty()) return bad("data_dir must be set");
        if (embedder != "hash" && embedder != "onnx") return bad("embedder must be 'hash' or 'onnx'");
        if (index.M < 2) return bad("index.M must be >= 2");
        if (index.ef_construction < index.M) return bad("index.ef_construction must be >= M");
        if (index.ef_search == 0) return bad("index.ef_search must be > 0");
        if (index.capacity == 0 || index.capacity > 0xFFFFFFFFull) {
            return bad("index.capacity must be in [1, 2^32)");
        }
        if (index.max_level == 0 || index.max_level > 64) return bad("index.max_level must be in [1, 64]");
        if (query.max_effort < index.ef_search) return bad("query.max_effort must be >= index.ef_search");
        if (compaction.ratio <= 0.0 || compaction.ratio > 1.0) return bad("compaction.ratio must be in (0, 1]");
        if (daemon.workers == 0) return bad("daemon.workers must be > 0");
        return Status::ok();
    }

    json to_json() const {
        return json{
            {"data_dir", data_dir},
            {"model_dir", model_dir},
            {"embedder", embedder},
            {"dimension", dimension},
            {"metric", metric_name(metric)},
            {"index", {
                {"M", index.M},
                {"ef_construction", index.ef_construction},
                {"ef_search", index.ef_search},
                {"max_level", index.max_level},
                {"capacity", index.capacity},
                {"seed", index.seed},
                {"quantize", index.quantize},
            }},
            {"query", {
                {"min_overfetch", query.min_overfetch},
                {"max_effort", query.max_effort},
            }},
            {"persistence", {
                {"enabled", persistence.enabled},
                {"wal_fsync", persistence.wal_fsync},
                {"checkpoint_wal_entries", persistence.checkpoint_wal_entries},
                {"checkpoint_interval_s", persistence.checkpoint_interval_s},
                {"save_graph", persistence.save_graph},
            }},
            {"compaction", {
                {"policy", compaction_policy_name(compaction.policy)},
                {"ratio", compaction.ratio},
                {"min_tombstones", compaction.min_tombstones},
            }},
            {"daemon", {
                {"socket_path", socket_path()},
                {"workers", daemon.workers},
                {"maintenance_interval_s", daemon.maintenance_interval_s},
            }},
        };
    }
};

} // namespace kosha
