#pragma once
// RPC Handler: JSON-RPC methods over the engine facade
//
// Used by koshad's worker pool; every method maps one engine call.
// handle() is thread-safe as long as the engine is.

#include "protocol.hpp"
#include "../engine.hpp"
#include "../version.hpp"
#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <string>
#include <unistd.h>
#include <utility>
#include <vector>

namespace kosha::rpc {

using json = nlohmann::json;

// ═══════════════════════════════════════════════════════════════════════════
// Parameter readers: empty string on success, otherwise the complaint
// ═══════════════════════════════════════════════════════════════════════════

inline std::string read_string(const json& p, const char* key, std::string& out, bool required) {
    if (!p.contains(key)) return required ? std::string("Missing required parameter: ") + key : "";
    if (!p[key].is_string()) return std::string("Parameter '") + key + "' must be a string";
    out = p[key].get<std::string>();
    return "";
}

inline std::string read_int(const json& p, const char* key, int64_t& out) {
    if (!p.contains(key)) return "";
    if (!p[key].is_number_integer()) return std::string("Parameter '") + key + "' must be an integer";
    out = p[key].get<int64_t>();
    return "";
}

inline std::string read_bool(const json& p, const char* key, bool& out) {
    if (!p.contains(key)) return "";
    if (!p[key].is_boolean()) return std::string("Parameter '") + key + "' must be a boolean";
    out = p[key].get<bool>();
    return "";
}

inline std::string read_strings(const json& p, const char* key, std::vector<std::string>& out) {
    if (!p.contains(key)) return "";
    if (!p[key].is_array()) return std::string("Parameter '") + key + "' must be an array of strings";
    out.clear();
    for (const auto& v : p[key]) {
        if (!v.is_string()) return std::string("Parameter '") + key + "' must be an array of strings";
        out.push_back(v.get<std::string>());
    }
    return "";
}

inline std::string read_vector(const json& p, const char* key, Vector& out) {
    if (!p.contains(key)) return std::string("Missing required parameter: ") + key;
    if (!p[key].is_array()) return std::string("Parameter '") + key + "' must be an array of numbers";
    out.clear();
    out.reserve(p[key].size());
    for (const auto& v : p[key]) {
        if (!v.is_number()) return std::string("Parameter '") + key + "' must be an array of numbers";
        out.push_back(v.get<float>());
    }
    return "";
}

// Payload is opaque: strings pass through, any other JSON is stored as its text
inline std::string read_payload(const json& p) {
    if (!p.contains("payload") || p["payload"].is_null()) return "";
    if (p["payload"].is_string()) return p["payload"].get<std::string>();
    return p["payload"].dump();
}

inline std::string read_filter(const json& p, Filter& out) {
    if (!p.contains("filter") || p["filter"].is_null()) return "";
    const json& f = p["filter"];
    if (!f.is_object()) return "Parameter 'filter' must be an object";
    std::string err;
    if (!(err = read_strings(f, "all_tags", out.tags.all_tags)).empty()) return err;
    if (!(err = read_strings(f, "any_tags", out.tags.any_tags)).empty()) return err;
    if (!(err = read_strings(f, "none_tags", out.tags.none_tags)).empty()) return err;
    return read_string(f, "id_prefix", out.id_prefix, false);
}

// ═══════════════════════════════════════════════════════════════════════════
// Result encoders
// ═══════════════════════════════════════════════════════════════════════════

inline json to_json(const SearchResult& r) {
    json hits = json::array();
    for (const auto& h : r.hits) {
        hits.push_back({
            {"id", sanitize_utf8(h.id)},
            {"score", h.score},
            {"payload", sanitize_utf8(h.payload)},
            {"tags", h.tags}
        });
    }
    return {
        {"hits", hits},
        {"partial", r.partial},
        {"generation", r.generation},
        {"stats", {
            {"visited", r.stats.visited},
            {"distance_computations", r.stats.distance_computations},
            {"consistency_gaps", r.stats.consistency_gaps},
            {"filtered_out", r.stats.filtered_out},
            {"rounds", r.stats.rounds},
            {"elapsed_us", r.stats.elapsed_us}
        }}
    };
}

inline json to_json(const EngineStats& s) {
    return {
        {"records", s.records},
        {"payload_bytes", s.payload_bytes},
        {"index", {
            {"size", s.index.size},
            {"slots", s.index.slots},
            {"tombstones", s.index.tombstones},
            {"capacity", s.index.capacity},
            {"memory_bytes", s.index.memory_bytes},
            {"generation", s.index.generation},
            {"state", index_state_name(s.index.state)}
        }},
        {"tags", s.tags},
        {"tag_memory_bytes", s.tag_memory_bytes},
        {"consistency_gaps", s.consistency_gaps},
        {"searches", s.searches},
        {"partial_searches", s.partial_searches},
        {"writes", s.writes},
        {"deletes", s.deletes},
        {"wal", {
            {"sequence", s.wal_sequence},
            {"entries", s.wal_entries},
            {"skipped", s.wal_skipped},
            {"replayed_at_open", s.replayed}
        }},
        {"restored_graph", s.restored_graph},
        {"last_checkpoint", s.last_checkpoint},
        {"embedder", s.embedder},
        {"dimension", s.dimension},
        {"metric", metric_name(s.metric)}
    };
}

inline json to_json(const HealthReport& h) {
    return {
        {"status", h.status},
        {"index_loaded", h.index_loaded},
        {"generation", h.generation},
        {"state", index_state_name(h.state)},
        {"count", h.count},
        {"embedder", h.embedder},
        {"embedder_ready", h.embedder_ready}
    };
}

struct HandlerContext {
    std::string socket_path;
    std::function<void()> on_shutdown;  // Daemon stops its loop after the reply
};

class Handler {
public:
    using Method = std::function<json(const json& params, const json& id)>;

    explicit Handler(Engine& engine, HandlerContext context = {})
        : engine_(engine),
          context_(std::move(context)),
          start_time_(std::chrono::steady_clock::now()) {
        register_methods();
    }

    // One request line in, one response line out
    std::string handle(const std::string& request_str) {
        json response;
        json request = json::parse(request_str, nullptr, false);
        if (request.is_discarded()) {
            response = make_error(json(), error::PARSE_ERROR, "JSON parse error");
        } else {
            try {
                response = handle_request(request);
            } catch (const std::exception& e) {
                response = make_error(request.is_object() ? request.value("id", json()) : json(),
                                      error::INTERNAL_ERROR,
                                      std::string("Internal error: ") + e.what());
            }
        }
        return response.dump(-1, ' ', false, json::error_handler_t::replace);
    }

    json handle_request(const json& request) {
        std::string error_msg;
        if (!validate_request(request, error_msg)) {
            json id = request.is_object() ? request.value("id", json()) : json();
            return make_error(id, error::INVALID_REQUEST, error_msg);
        }

        auto info = parse_request(request);
        auto it = methods_.find(info.method);
        if (it == methods_.end()) {
            return make_error(info.id, error::METHOD_NOT_FOUND, "Unknown method: " + info.method);
        }
        requests_.fetch_add(1, std::memory_order_relaxed);
        return it->second.fn(info.params, info.id);
    }

    std::vector<std::string> method_names() const {
        std::vector<std::string> names;
        for (const auto& [name, entry] : methods_) names.push_back(name);
        return names;
    }

    uint64_t requests() const { return requests_.load(std::memory_order_relaxed); }

private:
    struct Entry {
        std::string description;
        Method fn;
    };

    void add(const std::string& name, std::string description, Method fn) {
        methods_[name] = Entry{std::move(description), std::move(fn)};
    }

    void register_methods() {
        add("initialize", "Version handshake; reports protocol and engine shape",
            [this](const json& p, const json& id) { return m_initialize(p, id); });
        add("index_document", "Embed content and upsert {id, content, payload?, tags?}",
            [this](const json& p, const json& id) { return m_index_document(p, id); });
        add("index_vector", "Upsert a caller-supplied vector {id, vector, payload?, tags?}",
            [this](const json& p, const json& id) { return m_index_vector(p, id); });
        add("delete_document", "Remove a record {id}",
            [this](const json& p, const json& id) { return m_delete_document(p, id); });
        add("get_document", "Fetch a record {id, include_vector?}",
            [this](const json& p, const json& id) { return m_get_document(p, id); });
        add("search", "k nearest records to {query | vector}, with optional filter and budget",
            [this](const json& p, const json& id) { return m_search(p, id); });
        add("rebuild_index", "Build a fresh index generation from the store and swap it in",
            [this](const json& p, const json& id) { return m_rebuild_index(p, id); });
        add("checkpoint", "Write snapshot and graph, then truncate the WAL",
            [this](const json& p, const json& id) { return m_checkpoint(p, id); });
        add("stats", "Engine, index and WAL counters",
            [this](const json& p, const json& id) { return m_stats(p, id); });
        add("health", "Liveness and index state",
            [this](const json& p, const json& id) { return m_health(p, id); });
        add("rpc.methods", "List available methods",
            [this](const json& p, const json& id) { return m_methods(p, id); });
        add("shutdown", "Checkpoint and stop the daemon",
            [this](const json& p, const json& id) { return m_shutdown(p, id); });
    }

    // ═══════════════════════════════════════════════════════════════════
    // Methods
    // ═══════════════════════════════════════════════════════════════════

    json m_initialize(const json& params, const json& id) {
        int64_t major = KOSHA_PROTOCOL_VERSION_MAJOR;
        int64_t minor = KOSHA_PROTOCOL_VERSION_MINOR;
        std::string err = read_int(params, "protocol_major", major);
        if (err.empty()) err = read_int(params, "protocol_minor", minor);
        if (!err.empty()) return make_error(id, error::INVALID_PARAMS, err);

        const EngineConfig& cfg = engine_.config();
        return make_result(id, {
            {"server", "koshad"},
            {"software_version", KOSHA_VERSION},
            {"protocol_major", KOSHA_PROTOCOL_VERSION_MAJOR},
            {"protocol_minor", KOSHA_PROTOCOL_VERSION_MINOR},
            {"compatible", version::protocol_compatible(static_cast<int>(major),
                                                        static_cast<int>(minor))},
            {"dimension", cfg.dimension},
            {"metric", metric_name(cfg.metric)},
            {"embedder", cfg.embedder}
        });
    }

    json m_index_document(const json& params, const json& id) {
        std::string doc_id, content;
        std::vector<std::string> tags;
        std::string err = read_string(params, "id", doc_id, true);
        if (err.empty()) err = read_string(params, "content", content, true);
        if (err.empty()) err = read_strings(params, "tags", tags);
        if (!err.empty()) return make_error(id, error::INVALID_PARAMS, err);

        auto receipt = engine_.index_document(doc_id, content, read_payload(params), std::move(tags));
        if (!receipt) return make_error(id, receipt.error());
        return make_result(id, receipt_json(receipt.value()));
    }

    json m_index_vector(const json& params, const json& id) {
        std::string doc_id;
        Vector vector;
        std::vector<std::string> tags;
        std::string err = read_string(params, "id", doc_id, true);
        if (err.empty()) err = read_vector(params, "vector", vector);
        if (err.empty()) err = read_strings(params, "tags", tags);
        if (!err.empty()) return make_error(id, error::INVALID_PARAMS, err);

        auto receipt = engine_.index_vector(doc_id, vector, read_payload(params), std::move(tags));
        if (!receipt) return make_error(id, receipt.error());
        return make_result(id, receipt_json(receipt.value()));
    }

    json m_delete_document(const json& params, const json& id) {
        std::string doc_id;
        std::string err = read_string(params, "id", doc_id, true);
        if (!err.empty()) return make_error(id, error::INVALID_PARAMS, err);

        Status st = engine_.delete_document(doc_id);
        if (!st) return make_error(id, st.error());
        return make_result(id, {{"id", doc_id}, {"deleted", true}});
    }

    json m_get_document(const json& params, const json& id) {
        std::string doc_id;
        bool include_vector = false;
        std::string err = read_string(params, "id", doc_id, true);
        if (err.empty()) err = read_bool(params, "include_vector", include_vector);
        if (!err.empty()) return make_error(id, error::INVALID_PARAMS, err);

        auto rec = engine_.get_document(doc_id);
        if (!rec) return make_error(id, rec.error());

        const Record& r = rec.value();
        json out = {
            {"id", sanitize_utf8(r.id)},
            {"payload", sanitize_utf8(r.payload)},
            {"tags", r.tags},
            {"created", r.created},
            {"dimension", r.vector.size()}
        };
        if (include_vector) out["vector"] = r.vector;
        return make_result(id, out);
    }

    json m_search(const json& params, const json& id) {
        SearchRequest req;
        std::string query;
        int64_t effort = 0, timeout_ms = 0, max_distance = 0;

        std::string err = read_string(params, "query", query, false);
        if (err.empty()) err = read_int(params, "k", req.k);
        if (err.empty()) err = read_int(params, "effort", effort);
        if (err.empty()) err = read_int(params, "timeout_ms", timeout_ms);
        if (err.empty()) err = read_int(params, "max_distance_computations", max_distance);
        if (err.empty()) err = read_bool(params, "exact", req.exact);
        if (err.empty()) err = read_filter(params, req.filter);
        bool has_vector = params.contains("vector");
        if (err.empty() && has_vector) err = read_vector(params, "vector", req.vector);
        if (err.empty() && query.empty() && !has_vector) err = "Provide 'query' or 'vector'";
        if (err.empty() && (effort < 0 || timeout_ms < 0 || max_distance < 0)) {
            err = "effort, timeout_ms and max_distance_computations must be >= 0";
        }
        if (!err.empty()) return make_error(id, error::INVALID_PARAMS, err);

        req.effort = static_cast<size_t>(effort);
        req.timeout = std::chrono::milliseconds(timeout_ms);
        req.max_distance_computations = static_cast<size_t>(max_distance);

        auto result = has_vector ? engine_.search_vector(req) : engine_.search(query, req);
        if (!result) return make_error(id, result.error());
        return make_result(id, to_json(result.value()));
    }

    json m_rebuild_index(const json& params, const json& id) {
        (void)params;
        auto report = engine_.rebuild_index();
        if (!report) return make_error(id, report.error());
        const RebuildReport& r = report.value();
        return make_result(id, {
            {"generation", r.generation},
            {"records", r.records},
            {"reclaimed", r.reclaimed},
            {"caught_up", r.caught_up},
            {"elapsed_ms", r.elapsed_ms}
        });
    }

    json m_checkpoint(const json& params, const json& id) {
        (void)params;
        auto report = engine_.checkpoint();
        if (!report) return make_error(id, report.error());
        const CheckpointReport& r = report.value();
        return make_result(id, {
            {"sequence", r.sequence},
            {"records", r.records},
            {"graph_saved", r.graph_saved},
            {"graph_bytes", r.graph_bytes},
            {"wal_truncated", r.wal_truncated},
            {"elapsed_ms", r.elapsed_ms}
        });
    }

    json m_stats(const json& params, const json& id) {
        (void)params;
        json out = to_json(engine_.stats());
        auto uptime_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time_).count();
        out["daemon"] = {
            {"pid", static_cast<int>(getpid())},
            {"uptime_ms", uptime_ms},
            {"requests", requests()},
            {"socket_path", context_.socket_path}
        };
        return make_result(id, out);
    }

    json m_health(const json& params, const json& id) {
        (void)params;
        json out = to_json(engine_.health());
        out["software_version"] = KOSHA_VERSION;
        return make_result(id, out);
    }

    json m_methods(const json& params, const json& id) {
        (void)params;
        json list = json::array();
        for (const auto& [name, entry] : methods_) {
            list.push_back({{"name", name}, {"description", entry.description}});
        }
        return make_result(id, {{"methods", list}});
    }

    json m_shutdown(const json& params, const json& id) {
        (void)params;
        if (context_.on_shutdown) context_.on_shutdown();
        return make_result(id, {{"status", "ok"}});
    }

    static json receipt_json(const IndexReceipt& r) {
        return {
            {"id", sanitize_utf8(r.id)},
            {"outcome", put_outcome_name(r.outcome)},
            {"sequence", r.sequence},
            {"generation", r.generation}
        };
    }

    Engine& engine_;
    HandlerContext context_;
    std::chrono::steady_clock::time_point start_time_;
    std::map<std::string, Entry> methods_;  // Sorted for rpc.methods
    std::atomic<uint64_t> requests_{0};
};

} // namespace kosha::rpc
