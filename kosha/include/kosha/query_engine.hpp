#pragma once
// Query Engine: candidate search, resolution, filtering, ranking
//
// The index answers with ids and distances; the store is authoritative.
// A candidate whose record is gone is a consistency gap: counted, logged,
// skipped. Final order is score descending, then id ascending, so equal
// inputs against the same generation always produce the same output.

#include "error.hpp"
#include "hnsw.hpp"
#include "log.hpp"
#include "tag_index.hpp"
#include "types.hpp"
#include "vector_store.hpp"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <functional>
#include <string>
#include <vector>

namespace kosha {

struct QueryConfig {
    size_t min_overfetch = 10;  // Extra candidates requested beyond k
    size_t max_effort = 4096;   // Ceiling for effort doubling on filtered queries
};

struct Filter {
    TagFilter tags;
    std::string id_prefix;
    std::function<bool(const Record&)> predicate;  // Optional caller check

    bool empty() const { return tags.empty() && id_prefix.empty() && !predicate; }
};

struct SearchRequest {
    Vector vector;
    int64_t k = 10;
    size_t effort = 0;                        // 0 = index default
    Filter filter;
    std::chrono::milliseconds timeout{0};     // 0 = no deadline
    size_t max_distance_computations = 0;     // 0 = unlimited
    bool exact = false;                       // Brute-force scan instead of ANN
};

struct SearchHit {
    std::string id;
    float score = 0.0f;
    std::string payload;
    std::vector<std::string> tags;
};

struct SearchStats {
    size_t visited = 0;
    size_t distance_computations = 0;
    size_t consistency_gaps = 0;
    size_t filtered_out = 0;
    size_t rounds = 0;
    int64_t elapsed_us = 0;
};

struct SearchResult {
    std::vector<SearchHit> hits;
    bool partial = false;
    uint64_t generation = 0;
    SearchStats stats;
};

inline bool hit_before(const SearchHit& a, const SearchHit& b) {
    if (a.score != b.score) return a.score > b.score;
    return a.id < b.id;
}

class QueryEngine {
public:
    QueryEngine(const VectorStore& store, const HnswIndex& index, const TagIndex& tags,
                QueryConfig config = {})
        : store_(store), index_(index), tags_(tags), config_(config) {}

    Result<SearchResult> search(const SearchRequest& request) const {
        Status valid = validate(request);
        if (!valid) return Result<SearchResult>::fail(valid.error());
        if (request.exact) return search_exact(request);

        auto start = std::chrono::steady_clock::now();
        size_t k = static_cast<size_t>(request.k);
        size_t effort = request.effort ? request.effort : index_.config().ef_search;
        size_t fetch = k + std::max(k, config_.min_overfetch);
        SearchBudget budget = SearchBudget::within(request.timeout,
                                                   request.max_distance_computations);
        TagSelection selection = tags_.compile(request.filter.tags);

        SearchResult out;
        size_t remaining = request.max_distance_computations;
        while (true) {
            budget.max_distance_computations = remaining;
            auto found = index_.search(request.vector, fetch, std::max(effort, fetch), budget);
            if (!found) return Result<SearchResult>::fail(found.error());
            const IndexSearchResult& r = found.value();

            out.generation = r.generation;
            out.stats.rounds++;
            out.stats.visited += r.visited;
            out.stats.distance_computations += r.distance_computations;
            if (request.max_distance_computations) {
                remaining -= std::min(remaining, r.distance_computations);
            }
            out.hits.clear();
            out.stats.consistency_gaps = 0;
            out.stats.filtered_out = 0;

            for (const auto& n : r.neighbors) {
                RecordPtr rec = store_.find(n.id);
                if (!rec) {
                    out.stats.consistency_gaps++;
                    log_debug("query", "consistency gap: index returned '%s' missing from store",
                              n.id.c_str());
                    continue;
                }
                if (!passes(*rec, request.filter, selection)) {
                    out.stats.filtered_out++;
                    continue;
                }
                out.hits.push_back(make_hit(*rec, request.vector));
            }

            if (r.partial) {
                out.partial = true;
                break;
            }

            // The beam converged without reaching every live entry it was
            // asked for: part of the graph is unreachable from the entry point
            if (r.neighbors.size() < std::min(fetch, r.live)) {
                if (out.hits.size() < k) {
                    finish_with_scan(request, selection, budget, remaining, out);
                }
                break;
            }

            bool exhausted = fetch >= r.live;
            if (out.hits.size() >= k || exhausted || effort >= config_.max_effort) break;
            if (request.max_distance_computations && remaining == 0) {
                out.partial = true;
                break;
            }

            // Filters or gaps ate too many candidates: widen the beam and retry
            fetch = std::min(fetch * 2, std::max(r.live, k));
            effort = std::min(effort * 2, config_.max_effort);
            log_debug("query", "widening: %zu hits of %zu, fetch=%zu effort=%zu",
                      out.hits.size(), k, fetch, effort);
        }

        total_gaps_.fetch_add(out.stats.consistency_gaps, std::memory_order_relaxed);
        finish(out, k, start);
        return Result<SearchResult>::ok(std::move(out));
    }

    // Brute-force scan with the same filters and ordering; ground truth for recall
    Result<SearchResult> search_exact(const SearchRequest& request) const {
        Status valid = validate(request);
        if (!valid) return Result<SearchResult>::fail(valid.error());

        auto start = std::chrono::steady_clock::now();
        TagSelection selection = tags_.compile(request.filter.tags);

        SearchResult out;
        out.generation = index_.generation();
        out.stats.rounds = 1;
        scan(request, selection, out);

        finish(out, static_cast<size_t>(request.k), start);
        return Result<SearchResult>::ok(std::move(out));
    }

    size_t consistency_gaps() const { return total_gaps_.load(std::memory_order_relaxed); }
    const QueryConfig& config() const { return config_; }

private:
    void scan(const SearchRequest& request, const TagSelection& selection,
              SearchResult& out) const {
        for (const auto& rec : store_.snapshot()) {
            out.stats.visited++;
            if (!passes(*rec, request.filter, selection)) {
                out.stats.filtered_out++;
                continue;
            }
            out.stats.distance_computations++;
            out.hits.push_back(make_hit(*rec, request.vector));
        }
    }

    // Replaces the beam's hits with a full scan when the budget allows one
    void finish_with_scan(const SearchRequest& request, const TagSelection& selection,
                          const SearchBudget& budget, size_t remaining,
                          SearchResult& out) const {
        bool over_budget =
            (request.max_distance_computations && remaining < store_.size()) ||
            (budget.has_deadline() && SearchBudget::Clock::now() >= budget.deadline);
        if (over_budget) {
            out.partial = true;
            return;
        }
        log_debug("query", "beam reached %zu of %zu wanted; finishing with a scan",
                  out.hits.size(), static_cast<size_t>(request.k));
        out.hits.clear();
        out.stats.filtered_out = 0;
        out.stats.consistency_gaps = 0;
        out.stats.rounds++;
        scan(request, selection, out);
    }

    Status validate(const SearchRequest& request) const {
        if (request.k <= 0) {
            return Status::fail(ErrorKind::Validation,
                "k must be > 0, got " + std::to_string(request.k));
        }
        if (request.vector.size() != store_.dimension()) {
            return Status::fail(ErrorKind::Validation,
                "dimension mismatch: expected " + std::to_string(store_.dimension()) +
                ", got " + std::to_string(request.vector.size()));
        }
        if (!all_finite(request.vector)) {
            return Status::fail(ErrorKind::Validation, "query contains NaN or Inf");
        }
        return Status::ok();
    }

    static bool passes(const Record& rec, const Filter& filter, const TagSelection& selection) {
        if (!selection.matches(rec.ordinal)) return false;
        if (!filter.id_prefix.empty() &&
            rec.id.compare(0, filter.id_prefix.size(), filter.id_prefix) != 0) {
            return false;
        }
        if (filter.predicate && !filter.predicate(rec)) return false;
        return true;
    }

    // Scores are recomputed from the stored float vector, so quantized
    // generations rank the final candidates exactly
    SearchHit make_hit(const Record& rec, const Vector& query) const {
        SearchHit hit;
        hit.id = rec.id;
        hit.score = similarity(index_.metric(), query, rec.vector);
        hit.payload = rec.payload;
        hit.tags = rec.tags;
        return hit;
    }

    static void finish(SearchResult& out, size_t k,
                       std::chrono::steady_clock::time_point start) {
        std::sort(out.hits.begin(), out.hits.end(), hit_before);
        if (out.hits.size() > k) out.hits.resize(k);
        out.stats.elapsed_us = std::chrono::duration_cast<std::chrono::microseconds>(
            std::chrono::steady_clock::now() - start).count();
    }

    const VectorStore& store_;
    const HnswIndex& index_;
    const TagIndex& tags_;
    QueryConfig config_;
    mutable std::atomic<size_t> total_gaps_{0};
};

} // namespace kosha
