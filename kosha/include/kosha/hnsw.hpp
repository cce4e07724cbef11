#pragma once
// HNSW (Hierarchical Navigable Small World) index
//
// HnswGraph is one generation: an arena of at most `capacity` slots.
// Slots are never reused; remove() only sets a tombstone bit, and the node
// keeps routing queries until the next rebuild drops it.
//
// HnswIndex owns the current generation behind an atomically swapped
// shared_ptr. Queries load the pointer and take the generation's shared
// lock; a rebuild builds the next generation off to the side and swaps it
// in after replaying the writes that arrived meanwhile.

#include "bitmap.hpp"
#include "codec.hpp"
#include "error.hpp"
#include "log.hpp"
#include "quantized.hpp"
#include "types.hpp"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <cmath>
#include <iostream>
#include <memory>
#include <mutex>
#include <queue>
#include <random>
#include <shared_mutex>
#include <stdexcept>
#include <unordered_map>
#include <unordered_set>

namespace kosha {

struct IndexConfig {
    size_t M = 16;                 // Links per node per layer (2*M on layer 0)
    size_t ef_construction = 200;  // Beam width while inserting
    size_t ef_search = 64;         // Default query effort
    size_t max_level = 16;
    size_t capacity = 1000000;     // Slots per generation, tombstones included
    uint64_t seed = 42;
    bool quantize = false;         // Store int8 codes instead of float32
};

// Early-stop limits for one search. Defaults are unlimited.
struct SearchBudget {
    using Clock = std::chrono::steady_clock;

    Clock::time_point deadline = Clock::time_point::max();
    size_t max_distance_computations = 0;  // 0 = unlimited

    static SearchBudget unlimited() { return SearchBudget{}; }

    static SearchBudget within(std::chrono::milliseconds timeout, size_t max_distance = 0) {
        SearchBudget b;
        if (timeout.count() > 0) {
            auto now = Clock::now();
            // Deadlines past the clock's range stay unlimited
            auto headroom = std::chrono::duration_cast<std::chrono::milliseconds>(
                Clock::time_point::max() - now);
            if (timeout < headroom) b.deadline = now + timeout;
        }
        b.max_distance_computations = max_distance;
        return b;
    }

    bool has_deadline() const { return deadline != Clock::time_point::max(); }
};

struct Neighbor {
    std::string id;
    float distance;
    float score;
};

struct IndexSearchResult {
    std::vector<Neighbor> neighbors;  // Ascending distance
    bool partial = false;             // Budget ran out before the beam converged
    size_t visited = 0;
    size_t distance_computations = 0;
    uint64_t generation = 0;
    size_t live = 0;                  // Live entries in the generation searched
};

// Distance pair for priority queues
struct DistPair {
    float distance;
    uint32_t slot;

    bool operator<(const DistPair& o) const { return distance < o.distance; }
    bool operator>(const DistPair& o) const { return distance > o.distance; }
};

// Counts distance computations against a SearchBudget
class BudgetMeter {
public:
    explicit BudgetMeter(const SearchBudget& budget) : budget_(budget) {}

    // False once the budget is spent; the caller must not compute further
    bool charge() {
        if (exhausted_) return false;
        if (budget_.max_distance_computations &&
            computations_ >= budget_.max_distance_computations) {
            exhausted_ = true;
            return false;
        }
        // Clock reads are sampled, not per computation
        if (budget_.has_deadline() && (computations_ % 32) == 0 &&
            SearchBudget::Clock::now() >= budget_.deadline) {
            exhausted_ = true;
            return false;
        }
        ++computations_;
        return true;
    }

    bool exhausted() const { return exhausted_; }
    size_t computations() const { return computations_; }

private:
    SearchBudget budget_;
    size_t computations_ = 0;
    bool exhausted_ = false;
};

// ═══════════════════════════════════════════════════════════════════════════
// HnswGraph: one generation
// ═══════════════════════════════════════════════════════════════════════════

constexpr uint32_t GRAPH_MAGIC = 0x4B484E53;  // "KHNS"
constexpr uint32_t GRAPH_VERSION = 1;

class HnswGraph {
public:
    HnswGraph(size_t dimension, Metric metric, IndexConfig config, uint64_t generation)
        : dim_(dimension), metric_(metric), config_(config), generation_(generation),
          level_mult_(1.0 / std::log(static_cast<double>(std::max<size_t>(config.M, 2)))),
          rng_(config.seed) {}

    HnswGraph(const HnswGraph&) = delete;
    HnswGraph& operator=(const HnswGraph&) = delete;

    // Insert a prepared vector (normalized for cosine). Writers must be
    // serialized by the caller; queries may run concurrently.
    Status insert(const std::string& id, const float* vec) {
        int level = random_level();
        std::vector<std::vector<uint32_t>> chosen(level + 1);

        // Phase 1: neighbor search under the shared lock
        {
            std::shared_lock lock(mutex_);
            if (ids_.size() >= config_.capacity) {
                return Status::fail(ErrorKind::ResourceExhaustion,
                    "index capacity of " + std::to_string(config_.capacity) +
                    " slots reached (" + std::to_string(tombstones_.cardinality()) +
                    " tombstoned); rebuild to reclaim");
            }

            if (top_level_ >= 0) {
                Query q = make_query(vec);
                BudgetMeter meter(SearchBudget::unlimited());
                uint32_t curr = entry_;
                float curr_dist = distance_to(q, curr);
                for (int l = top_level_; l > level; --l) {
                    greedy(q, curr, curr_dist, l, meter);
                }
                for (int l = std::min(level, top_level_); l >= 0; --l) {
                    auto found = search_layer(q, curr, curr_dist, config_.ef_construction,
                                              l, meter, false, nullptr);
                    chosen[l] = select_neighbors(found, config_.M);
                    if (!found.empty()) {
                        curr = found.front().slot;
                        curr_dist = found.front().distance;
                    }
                }
            }
        }

        // Phase 2: link under a short exclusive lock
        std::unique_lock lock(mutex_);

        auto existing = slot_of_.find(id);
        if (existing != slot_of_.end()) {
            tombstones_.add(existing->second);
            slot_of_.erase(existing);
        }

        uint32_t slot = static_cast<uint32_t>(ids_.size());
        ids_.push_back(id);
        levels_.push_back(static_cast<uint8_t>(level));
        if (config_.quantize) {
            codes_.resize(codes_.size() + dim_);
            params_.push_back(quantize(vec, dim_, &codes_[static_cast<size_t>(slot) * dim_]));
        } else {
            vectors_.insert(vectors_.end(), vec, vec + dim_);
        }
        links_.emplace_back(level + 1);

        for (int l = 0; l <= level; ++l) {
            links_[slot][l] = chosen[l];
            for (uint32_t nb : chosen[l]) {
                auto& back = links_[nb][l];
                back.push_back(slot);
                if (back.size() > max_links(l)) shrink(nb, l);
            }
        }

        slot_of_[id] = slot;
        if (top_level_ < 0 || level > top_level_) {
            entry_ = slot;
            top_level_ = level;
        }
        return Status::ok();
    }

    bool remove(const std::string& id) {
        std::unique_lock lock(mutex_);
        auto it = slot_of_.find(id);
        if (it == slot_of_.end()) return false;
        tombstones_.add(it->second);
        slot_of_.erase(it);
        return true;
    }

    bool contains(const std::string& id) const {
        std::shared_lock lock(mutex_);
        return slot_of_.count(id) > 0;
    }

    IndexSearchResult search(const float* query, size_t k, size_t ef,
                             const SearchBudget& budget) const {
        IndexSearchResult out;
        out.generation = generation_;

        std::shared_lock lock(mutex_);
        out.live = slot_of_.size();
        if (top_level_ < 0 || slot_of_.empty() || k == 0) return out;

        Query q = make_query(query);
        BudgetMeter meter(budget);

        uint32_t curr = entry_;
        float curr_dist = 0.0f;
        if (meter.charge()) {
            curr_dist = distance_to(q, curr);
            for (int l = top_level_; l > 0 && !meter.exhausted(); --l) {
                greedy(q, curr, curr_dist, l, meter);
            }
        }

        std::vector<DistPair> found;
        if (meter.computations() > 0) {
            found = search_layer(q, curr, curr_dist, std::max(ef, k), 0, meter, true,
                                 &out.visited);
        }

        out.partial = meter.exhausted();
        out.distance_computations = meter.computations();
        if (found.size() > k) found.resize(k);
        out.neighbors.reserve(found.size());
        for (const auto& dp : found) {
            out.neighbors.push_back({ids_[dp.slot], dp.distance,
                                     score_from_distance(metric_, dp.distance)});
        }
        return out;
    }

    size_t size() const {
        std::shared_lock lock(mutex_);
        return slot_of_.size();
    }

    size_t slots() const {
        std::shared_lock lock(mutex_);
        return ids_.size();
    }

    size_t tombstones() const {
        std::shared_lock lock(mutex_);
        return tombstones_.cardinality();
    }

    bool full() const {
        std::shared_lock lock(mutex_);
        return ids_.size() >= config_.capacity;
    }

    uint64_t generation() const { return generation_; }
    size_t dimension() const { return dim_; }
    Metric metric() const { return metric_; }
    const IndexConfig& config() const { return config_; }

    std::vector<std::string> live_ids() const {
        std::shared_lock lock(mutex_);
        std::vector<std::string> out;
        out.reserve(slot_of_.size());
        for (const auto& [id, slot] : slot_of_) out.push_back(id);
        return out;
    }

    size_t memory_bytes() const {
        std::shared_lock lock(mutex_);
        size_t bytes = vectors_.capacity() * sizeof(float) + codes_.capacity() +
                       params_.capacity() * sizeof(QuantParams) + levels_.capacity();
        for (const auto& id : ids_) bytes += id.capacity() + sizeof(std::string);
        for (const auto& per_slot : links_) {
            for (const auto& layer : per_slot) bytes += layer.capacity() * sizeof(uint32_t);
        }
        bytes += slot_of_.size() * (sizeof(std::string) + sizeof(uint32_t) + 32);
        bytes += tombstones_.memory_bytes();
        return bytes;
    }

    // ═══════════════════════════════════════════════════════════════════════
    // Persistence
    // ═══════════════════════════════════════════════════════════════════════

    void serialize(std::vector<uint8_t>& data) const {
        std::shared_lock lock(mutex_);
        ByteWriter w(data);

        w.put<uint32_t>(GRAPH_MAGIC);
        w.put<uint32_t>(GRAPH_VERSION);
        w.put<uint64_t>(dim_);
        w.put<uint8_t>(static_cast<uint8_t>(metric_));
        w.put<uint8_t>(config_.quantize ? 1 : 0);
        w.put<uint64_t>(config_.M);
        w.put<uint64_t>(config_.ef_construction);
        w.put<uint64_t>(config_.ef_search);
        w.put<uint64_t>(config_.max_level);
        w.put<uint64_t>(config_.capacity);
        w.put<uint64_t>(config_.seed);
        w.put<uint64_t>(generation_);

        w.put<uint64_t>(ids_.size());
        w.put<uint32_t>(entry_);
        w.put<int32_t>(top_level_);

        for (size_t slot = 0; slot < ids_.size(); ++slot) {
            w.str(ids_[slot]);
            w.put<uint8_t>(levels_[slot]);
            if (config_.quantize) {
                w.raw(&codes_[slot * dim_], dim_);
                w.put<float>(params_[slot].scale);
                w.put<float>(params_[slot].offset);
            } else {
                w.floats(&vectors_[slot * dim_], dim_);
            }
            for (const auto& layer : links_[slot]) {
                w.put<uint32_t>(static_cast<uint32_t>(layer.size()));
                w.raw(layer.data(), layer.size() * sizeof(uint32_t));
            }
        }

        std::vector<uint8_t> tomb = tombstones_.serialize();
        w.put<uint64_t>(tomb.size());
        w.raw(tomb.data(), tomb.size());
    }

    // Throws std::runtime_error on malformed input
    static std::unique_ptr<HnswGraph> deserialize(const uint8_t* data, size_t len) {
        ByteReader r(data, len, "graph deserialize");

        if (r.get<uint32_t>() != GRAPH_MAGIC) {
            throw std::runtime_error("graph deserialize: invalid magic");
        }
        if (r.get<uint32_t>() != GRAPH_VERSION) {
            throw std::runtime_error("graph deserialize: unsupported version");
        }

        size_t dim = r.get<uint64_t>();
        auto metric = static_cast<Metric>(r.get<uint8_t>());
        if (metric != Metric::Cosine && metric != Metric::Euclidean) {
            throw std::runtime_error("graph deserialize: unknown metric");
        }

        IndexConfig config;
        config.quantize = r.get<uint8_t>() != 0;
        config.M = r.get<uint64_t>();
        config.ef_construction = r.get<uint64_t>();
        config.ef_search = r.get<uint64_t>();
        config.max_level = r.get<uint64_t>();
        config.capacity = r.get<uint64_t>();
        config.seed = r.get<uint64_t>();
        uint64_t generation = r.get<uint64_t>();

        auto g = std::make_unique<HnswGraph>(dim, metric, config, generation);

        uint64_t slot_count = r.get<uint64_t>();
        g->entry_ = r.get<uint32_t>();
        g->top_level_ = r.get<int32_t>();
        if (slot_count > r.remaining()) {
            throw std::runtime_error("graph deserialize: slot count exceeds file");
        }

        g->ids_.reserve(slot_count);
        g->levels_.reserve(slot_count);
        g->links_.reserve(slot_count);
        for (uint64_t slot = 0; slot < slot_count; ++slot) {
            g->ids_.push_back(r.str());
            uint8_t level = r.get<uint8_t>();
            g->levels_.push_back(level);
            if (config.quantize) {
                const uint8_t* codes = r.view(dim);
                g->codes_.insert(g->codes_.end(), reinterpret_cast<const int8_t*>(codes),
                                 reinterpret_cast<const int8_t*>(codes) + dim);
                QuantParams p;
                p.scale = r.get<float>();
                p.offset = r.get<float>();
                g->params_.push_back(p);
            } else {
                size_t at = g->vectors_.size();
                g->vectors_.resize(at + dim);
                r.floats(&g->vectors_[at], dim);
            }
            std::vector<std::vector<uint32_t>> layers(level + 1);
            for (auto& layer : layers) {
                uint32_t count = r.get<uint32_t>();
                if (count > r.remaining() / sizeof(uint32_t)) {
                    throw std::runtime_error("graph deserialize: link count exceeds file");
                }
                layer.resize(count);
                r.raw(layer.data(), count * sizeof(uint32_t));
            }
            g->links_.push_back(std::move(layers));
        }

        uint64_t tomb_len = r.get<uint64_t>();
        const uint8_t* tomb = r.view(tomb_len);
        g->tombstones_ = Bitmap::deserialize(tomb, tomb_len);

        // Structural checks: every link must point at a slot tall enough
        for (size_t slot = 0; slot < g->links_.size(); ++slot) {
            for (size_t l = 0; l < g->links_[slot].size(); ++l) {
                for (uint32_t nb : g->links_[slot][l]) {
                    if (nb >= slot_count || g->levels_[nb] < l) {
                        throw std::runtime_error("graph deserialize: dangling link");
                    }
                }
            }
        }
        if (slot_count > 0 &&
            (g->entry_ >= slot_count || g->top_level_ != g->levels_[g->entry_])) {
            throw std::runtime_error("graph deserialize: bad entry point");
        }
        if (slot_count == 0) g->top_level_ = -1;

        for (uint32_t slot = 0; slot < slot_count; ++slot) {
            if (g->tombstones_.contains(slot)) continue;
            if (!g->slot_of_.emplace(g->ids_[slot], slot).second) {
                throw std::runtime_error("graph deserialize: duplicate live id " + g->ids_[slot]);
            }
        }
        return g;
    }

private:
    struct Query {
        const float* v;
        float sum;  // Σv, needed by the quantized dot product
    };

    Query make_query(const float* v) const {
        float sum = 0.0f;
        if (config_.quantize) {
            for (size_t i = 0; i < dim_; ++i) sum += v[i];
        }
        return Query{v, sum};
    }

    size_t max_links(int layer) const {
        return layer == 0 ? config_.M * 2 : config_.M;
    }

    int random_level() {
        std::uniform_real_distribution<double> dist(0.0, 1.0);
        double r = dist(rng_);
        if (r <= 0.0) r = 1e-12;
        int level = static_cast<int>(-std::log(r) * level_mult_);
        return std::min(level, static_cast<int>(std::min<size_t>(config_.max_level, 255)));
    }

    float distance_to(const Query& q, uint32_t slot) const {
        if (config_.quantize) {
            const int8_t* c = &codes_[static_cast<size_t>(slot) * dim_];
            if (metric_ == Metric::Cosine) {
                return 1.0f - dot_quantized(q.v, q.sum, c, dim_, params_[slot]);
            }
            return l2_squared_quantized(q.v, c, dim_, params_[slot]);
        }
        const float* v = &vectors_[static_cast<size_t>(slot) * dim_];
        if (metric_ == Metric::Cosine) return 1.0f - dot(q.v, v, dim_);
        return l2_squared(q.v, v, dim_);
    }

    // Stored vector of a slot, decoded into scratch when quantized
    const float* vector_of(uint32_t slot, std::vector<float>& scratch) const {
        if (!config_.quantize) return &vectors_[static_cast<size_t>(slot) * dim_];
        scratch.resize(dim_);
        dequantize(&codes_[static_cast<size_t>(slot) * dim_], dim_, params_[slot], scratch.data());
        return scratch.data();
    }

    float distance_between(uint32_t a, uint32_t b) const {
        std::vector<float> scratch;
        const float* va = vector_of(a, scratch);
        return distance_to(make_query(va), b);
    }

    void greedy(const Query& q, uint32_t& curr, float& curr_dist, int layer,
                BudgetMeter& meter) const {
        bool changed = true;
        while (changed && !meter.exhausted()) {
            changed = false;
            for (uint32_t nb : links_[curr][layer]) {
                if (!meter.charge()) break;
                float d = distance_to(q, nb);
                if (d < curr_dist) {
                    curr = nb;
                    curr_dist = d;
                    changed = true;
                }
            }
        }
    }

    // Best-first beam on one layer. With skip_deleted, tombstoned nodes are
    // traversed but kept out of the result set.
    std::vector<DistPair> search_layer(const Query& q, uint32_t start, float start_dist,
                                       size_t ef, int layer, BudgetMeter& meter,
                                       bool skip_deleted, size_t* visited_count) const {
        std::unordered_set<uint32_t> visited;
        std::priority_queue<DistPair, std::vector<DistPair>, std::greater<DistPair>> candidates;
        std::priority_queue<DistPair> results;

        visited.insert(start);
        candidates.push({start_dist, start});
        if (!skip_deleted || !tombstones_.contains(start)) results.push({start_dist, start});

        while (!candidates.empty() && !meter.exhausted()) {
            DistPair c = candidates.top();
            if (results.size() >= ef && c.distance > results.top().distance) break;
            candidates.pop();

            for (uint32_t nb : links_[c.slot][layer]) {
                if (!visited.insert(nb).second) continue;
                if (!meter.charge()) break;

                float d = distance_to(q, nb);
                if (results.size() < ef || d < results.top().distance) {
                    candidates.push({d, nb});
                    if (!skip_deleted || !tombstones_.contains(nb)) {
                        results.push({d, nb});
                        if (results.size() > ef) results.pop();
                    }
                }
            }
        }

        if (visited_count) *visited_count += visited.size();

        std::vector<DistPair> out;
        out.reserve(results.size());
        while (!results.empty()) {
            out.push_back(results.top());
            results.pop();
        }
        std::reverse(out.begin(), out.end());
        return out;
    }

    // Keep a candidate only if it is closer to the base than to every
    // neighbor already kept, then top up from the pruned candidates so
    // clusters of equal vectors stay linked. Input is sorted by distance
    // to the base.
    std::vector<uint32_t> select_neighbors(const std::vector<DistPair>& candidates,
                                           size_t limit) const {
        std::vector<uint32_t> kept;
        std::vector<uint32_t> pruned;
        kept.reserve(limit);
        for (const auto& c : candidates) {
            if (kept.size() >= limit) break;
            bool good = true;
            for (uint32_t r : kept) {
                if (distance_between(c.slot, r) < c.distance) {
                    good = false;
                    break;
                }
            }
            if (good) kept.push_back(c.slot);
            else pruned.push_back(c.slot);
        }
        for (uint32_t s : pruned) {
            if (kept.size() >= limit) break;
            kept.push_back(s);
        }
        return kept;
    }

    // Caller holds the unique lock
    void shrink(uint32_t node, int layer) {
        auto& list = links_[node][layer];
        std::vector<float> scratch;
        Query base = make_query(vector_of(node, scratch));

        std::vector<DistPair> cands;
        cands.reserve(list.size());
        for (uint32_t s : list) cands.push_back({distance_to(base, s), s});
        std::sort(cands.begin(), cands.end());

        list = select_neighbors(cands, max_links(layer));
    }

    size_t dim_;
    Metric metric_;
    IndexConfig config_;
    uint64_t generation_;
    double level_mult_;
    std::mt19937_64 rng_;  // Writer-only

    mutable std::shared_mutex mutex_;
    std::vector<std::string> ids_;                       // slot -> id
    std::vector<uint8_t> levels_;                        // slot -> top layer
    std::vector<std::vector<std::vector<uint32_t>>> links_;  // slot -> layer -> neighbors
    std::vector<float> vectors_;                         // slot * dim, float mode
    std::vector<int8_t> codes_;                          // slot * dim, quantized mode
    std::vector<QuantParams> params_;
    std::unordered_map<std::string, uint32_t> slot_of_;  // live id -> slot
    Bitmap tombstones_;
    uint32_t entry_ = 0;
    int top_level_ = -1;
};

// ═══════════════════════════════════════════════════════════════════════════
// HnswIndex: generation management
// ═══════════════════════════════════════════════════════════════════════════

enum class IndexState : uint8_t {
    Active = 0,
    Rebuilding = 1,
};

inline const char* index_state_name(IndexState s) {
    return s == IndexState::Rebuilding ? "rebuilding" : "active";
}

struct RebuildReport {
    uint64_t generation = 0;
    size_t records = 0;     // Live entries in the new generation
    size_t reclaimed = 0;   // Tombstoned slots dropped
    size_t caught_up = 0;   // Writes replayed at swap time
    int64_t elapsed_ms = 0;
};

struct IndexStats {
    size_t size = 0;
    size_t slots = 0;
    size_t tombstones = 0;
    size_t capacity = 0;
    size_t memory_bytes = 0;
    uint64_t generation = 0;
    IndexState state = IndexState::Active;
};

class HnswIndex {
public:
    HnswIndex(size_t dimension, Metric metric, IndexConfig config)
        : dim_(dimension), metric_(metric), config_(config),
          current_(std::make_shared<HnswGraph>(dimension, metric, config, 1)) {}

    HnswIndex(const HnswIndex&) = delete;
    HnswIndex& operator=(const HnswIndex&) = delete;

    // Searchable as soon as this returns
    Status insert(const std::string& id, const Vector& vector) {
        Status valid = check_vector(vector);
        if (!valid) return valid;
        Vector prepared = prepare(vector);

        std::lock_guard<std::mutex> lock(write_mutex_);
        Status st = current()->insert(id, prepared.data());
        if (st && state_.load() == IndexState::Rebuilding) {
            catch_up_.push_back({false, id, std::move(prepared)});
        }
        return st;
    }

    bool remove(const std::string& id) {
        std::lock_guard<std::mutex> lock(write_mutex_);
        bool removed = current()->remove(id);
        if (removed && state_.load() == IndexState::Rebuilding) {
            catch_up_.push_back({true, id, {}});
        }
        return removed;
    }

    bool contains(const std::string& id) const { return current()->contains(id); }

    Result<IndexSearchResult> search(const Vector& query, size_t k, size_t effort,
                                     const SearchBudget& budget = SearchBudget::unlimited()) const {
        Status valid = check_vector(query);
        if (!valid) return Result<IndexSearchResult>::fail(valid.error());
        if (k == 0) return Result<IndexSearchResult>::fail(ErrorKind::Validation, "k must be > 0");

        Vector prepared = prepare(query);
        auto gen = current();
        size_t ef = effort ? effort : config_.ef_search;
        return Result<IndexSearchResult>::ok(gen->search(prepared.data(), k, ef, budget));
    }

    Result<RebuildReport> rebuild(const std::vector<RecordPtr>& snapshot) {
        Status st = begin_rebuild();
        if (!st) return Result<RebuildReport>::fail(st.error());
        return finish_rebuild(snapshot);
    }

    // Marks the index REBUILDING; writes from here on are also queued for
    // catch-up. The caller takes its snapshot after this returns.
    Status begin_rebuild() {
        std::lock_guard<std::mutex> lock(write_mutex_);
        if (state_.load() == IndexState::Rebuilding) {
            return Status::fail(ErrorKind::Validation, "rebuild already in progress");
        }
        state_.store(IndexState::Rebuilding);
        catch_up_.clear();
        return Status::ok();
    }

    Result<RebuildReport> finish_rebuild(const std::vector<RecordPtr>& snapshot) {
        if (state_.load() != IndexState::Rebuilding) {
            return Result<RebuildReport>::fail(ErrorKind::Internal, "no rebuild in progress");
        }
        auto start = std::chrono::steady_clock::now();
        auto old = current();
        auto fresh = std::make_shared<HnswGraph>(dim_, metric_, config_, old->generation() + 1);

        // Built without any index lock; queries keep using the old generation
        for (const auto& rec : snapshot) {
            Status valid = check_vector(rec->vector);
            Status st = valid ? fresh->insert(rec->id, prepare(rec->vector).data()) : valid;
            if (!st) {
                abort_rebuild();
                std::cerr << "[index] rebuild aborted: " << st.error().message << "\n";
                return Result<RebuildReport>::fail(st.error());
            }
        }

        RebuildReport report;
        {
            std::lock_guard<std::mutex> lock(write_mutex_);
            for (const auto& op : catch_up_) {
                if (op.remove) {
                    fresh->remove(op.id);
                    continue;
                }
                Status st = fresh->insert(op.id, op.vector.data());
                if (!st) {
                    catch_up_.clear();
                    state_.store(IndexState::Active);
                    std::cerr << "[index] rebuild aborted during catch-up: "
                              << st.error().message << "\n";
                    return Result<RebuildReport>::fail(st.error());
                }
            }
            report.caught_up = catch_up_.size();
            report.reclaimed = old->tombstones();
            catch_up_.clear();

            std::atomic_store(&current_, fresh);
            state_.store(IndexState::Active);
        }

        report.generation = fresh->generation();
        report.records = fresh->size();
        report.elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start).count();
        std::cerr << "[index] generation " << report.generation << ": " << report.records
                  << " live, reclaimed " << report.reclaimed << ", caught up "
                  << report.caught_up << " in " << report.elapsed_ms << "ms\n";
        return Result<RebuildReport>::ok(report);
    }

    // Replace the current generation with one loaded from disk
    Status install(std::unique_ptr<HnswGraph> graph) {
        if (!graph) return Status::fail(ErrorKind::Internal, "null graph");
        if (graph->dimension() != dim_ || graph->metric() != metric_) {
            return Status::fail(ErrorKind::Validation,
                "graph built for dim " + std::to_string(graph->dimension()) + "/" +
                metric_name(graph->metric()) + ", engine uses dim " +
                std::to_string(dim_) + "/" + metric_name(metric_));
        }
        // Query-time knobs may differ; the shape of the graph may not
        const IndexConfig& c = graph->config();
        if (c.M != config_.M || c.ef_construction != config_.ef_construction ||
            c.max_level != config_.max_level || c.capacity != config_.capacity ||
            c.quantize != config_.quantize) {
            return Status::fail(ErrorKind::Validation,
                "graph built with M=" + std::to_string(c.M) + " capacity=" +
                std::to_string(c.capacity) + ", engine uses M=" + std::to_string(config_.M) +
                " capacity=" + std::to_string(config_.capacity));
        }
        std::lock_guard<std::mutex> lock(write_mutex_);
        if (state_.load() == IndexState::Rebuilding) {
            return Status::fail(ErrorKind::Validation, "rebuild in progress");
        }
        std::shared_ptr<HnswGraph> shared(std::move(graph));
        std::atomic_store(&current_, shared);
        return Status::ok();
    }

    std::vector<uint8_t> serialize() const {
        std::vector<uint8_t> data;
        current()->serialize(data);
        return data;
    }

    std::vector<std::string> live_ids() const { return current()->live_ids(); }

    bool has_capacity() const { return !current()->full(); }

    IndexStats stats() const {
        auto gen = current();
        IndexStats s;
        s.size = gen->size();
        s.slots = gen->slots();
        s.tombstones = gen->tombstones();
        s.capacity = config_.capacity;
        s.memory_bytes = gen->memory_bytes();
        s.generation = gen->generation();
        s.state = state_.load();
        return s;
    }

    size_t size() const { return current()->size(); }
    uint64_t generation() const { return current()->generation(); }
    IndexState state() const { return state_.load(); }
    size_t dimension() const { return dim_; }
    Metric metric() const { return metric_; }
    const IndexConfig& config() const { return config_; }

private:
    struct PendingOp {
        bool remove;
        std::string id;
        Vector vector;  // Prepared
    };

    std::shared_ptr<HnswGraph> current() const { return std::atomic_load(&current_); }

    Status check_vector(const Vector& v) const {
        if (v.size() != dim_) {
            return Status::fail(ErrorKind::Validation,
                "dimension mismatch: expected " + std::to_string(dim_) +
                ", got " + std::to_string(v.size()));
        }
        if (!all_finite(v)) {
            return Status::fail(ErrorKind::Validation, "vector contains NaN or Inf");
        }
        return Status::ok();
    }

    Vector prepare(const Vector& v) const {
        Vector out = v;
        if (metric_ == Metric::Cosine) normalize(out);
        return out;
    }

    void abort_rebuild() {
        std::lock_guard<std::mutex> lock(write_mutex_);
        catch_up_.clear();
        state_.store(IndexState::Active);
    }

    size_t dim_;
    Metric metric_;
    IndexConfig config_;

    mutable std::mutex write_mutex_;  // Serializes writers of the current generation
    std::shared_ptr<HnswGraph> current_;
    std::atomic<IndexState> state_{IndexState::Active};
    std::vector<PendingOp> catch_up_;  // Guarded by write_mutex_
};

} // namespace kosha
