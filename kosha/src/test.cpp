#include <kosha/config.hpp>
#include <kosha/engine.hpp>
#include <kosha/job_queue.hpp>
#include <kosha/maintenance.hpp>
#include <kosha/rpc/handler.hpp>
#include <kosha/socket_client.hpp>
#include <kosha/socket_server.hpp>
#include <algorithm>
#include <atomic>
#include <iostream>
#include <cassert>
#include <cerrno>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <random>
#include <set>
#include <thread>
#include <chrono>
#include <cstring>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

using namespace kosha;
using json = nlohmann::json;

Vector random_vector(std::mt19937& rng, size_t dim) {
    std::normal_distribution<float> dist(0.0f, 1.0f);
    Vector v(dim);
    for (auto& x : v) x = dist(rng);
    return v;
}

std::string fresh_dir(const std::string& name) {
    std::string dir = "/tmp/kosha_test_" + name + "_" + std::to_string(getpid());
    std::error_code ec;
    std::filesystem::remove_all(dir, ec);
    return dir;
}

EngineConfig test_config(const std::string& dir, size_t dim, bool persistent) {
    EngineConfig config;
    config.data_dir = dir;
    config.dimension = dim;
    config.persistence.enabled = persistent;
    config.persistence.wal_fsync = false;
    config.persistence.checkpoint_wal_entries = 1000000;
    config.compaction.policy = CompactionPolicy::Never;
    return config;
}

std::unique_ptr<Engine> open_engine(const EngineConfig& config) {
    auto engine = std::make_unique<Engine>(config, std::make_unique<HashingEmbedder>(config.dimension));
    Status st = engine->open();
    if (!st) std::cerr << "open failed: " << st.error().describe() << "\n";
    assert(st);
    return engine;
}

SearchRequest request_for(const Vector& v, int64_t k) {
    SearchRequest req;
    req.vector = v;
    req.k = k;
    return req;
}

// Fraction of exact top-k ids that the ANN path also returned
double recall_at(const Engine& engine, const std::vector<Vector>& queries, int64_t k) {
    size_t found = 0, total = 0;
    for (const auto& q : queries) {
        auto approx = engine.search_vector(request_for(q, k));
        SearchRequest exact_req = request_for(q, k);
        exact_req.exact = true;
        auto exact = engine.search_vector(exact_req);
        assert(approx && exact);

        std::set<std::string> got;
        for (const auto& h : approx.value().hits) got.insert(h.id);
        for (const auto& h : exact.value().hits) {
            total++;
            if (got.count(h.id)) found++;
        }
    }
    return total == 0 ? 1.0 : static_cast<double>(found) / static_cast<double>(total);
}

// ═══════════════════════════════════════════════════════════════════════════
// Store and tags
// ═══════════════════════════════════════════════════════════════════════════

void test_vector_store() {
    std::cout << "Testing VectorStore put/get/remove..." << std::endl;

    VectorStore store(3);
    auto r1 = store.put("a", {1, 2, 3}, "pa", {"x", "x", ""});
    assert(r1 && r1.value().outcome == PutOutcome::Inserted);
    assert(r1.value().record->tags == std::vector<std::string>{"x"});

    auto r2 = store.put("a", {1, 2, 3}, "pa", {"x"});
    assert(r2 && r2.value().outcome == PutOutcome::Unchanged);

    auto r3 = store.put("a", {1, 2, 3}, "pb", {"x"});
    assert(r3 && r3.value().outcome == PutOutcome::Replaced);
    assert(r3.value().previous->payload == "pa");
    assert(store.payload_bytes() == 2);

    // Rejected puts leave the store untouched
    auto bad_dim = store.put("b", {1, 2}, "");
    assert(!bad_dim && bad_dim.kind() == ErrorKind::Validation);
    auto bad_id = store.put("", {1, 2, 3}, "");
    assert(!bad_id && bad_id.kind() == ErrorKind::Validation);
    auto bad_value = store.put("c", {1, NAN, 3}, "");
    assert(!bad_value && bad_value.kind() == ErrorKind::Validation);
    assert(store.size() == 1);

    store.put("b", {0, 1, 0}, "");
    store.put("c", {0, 0, 1}, "");
    auto cursor = store.iterate();
    assert(cursor.size_hint() == 3);
    store.remove("b");
    size_t seen = 0;
    RecordPtr rec;
    while (cursor.next(rec)) {
        assert(rec->id != "b");
        seen++;
    }
    assert(seen == 2);
    cursor.reset();
    seen = 0;
    while (cursor.next(rec)) seen++;
    assert(seen == 2);

    assert(!store.get("b").has_value());
    assert(store.get("c")->vector == (Vector{0, 0, 1}));
    assert(!store.remove("b"));

    store.clear();
    assert(store.size() == 0);
    assert(store.payload_bytes() == 0);

    std::cout << "  PASS" << std::endl;
}

void test_tag_index() {
    std::cout << "Testing TagIndex filters..." << std::endl;

    TagIndex tags;
    tags.add(1, {"red", "round"});
    tags.add(2, {"red", "square"});
    tags.add(3, {"blue", "round"});
    assert(tags.tag_count() == 4);
    assert(tags.cardinality("red") == 2);

    TagFilter all;
    all.all_tags = {"red", "round"};
    auto s1 = tags.compile(all);
    assert(s1.matches(1) && !s1.matches(2) && !s1.matches(3));

    TagFilter any;
    any.any_tags = {"square", "blue"};
    auto s2 = tags.compile(any);
    assert(!s2.matches(1) && s2.matches(2) && s2.matches(3));

    TagFilter none;
    none.none_tags = {"red"};
    auto s3 = tags.compile(none);
    assert(!s3.matches(1) && !s3.matches(2) && s3.matches(3));

    TagFilter unknown;
    unknown.all_tags = {"green"};
    assert(tags.compile(unknown).impossible());

    tags.remove(1, {"red", "round"});
    assert(!tags.has_tag(1, "red"));
    assert(tags.cardinality("red") == 1);

    std::cout << "  PASS" << std::endl;
}

void test_hashing_embedder() {
    std::cout << "Testing HashingEmbedder..." << std::endl;

    HashingEmbedder embedder(384);
    auto a = embedder.embed("The quick brown fox");
    auto b = embedder.embed("the QUICK brown fox!");
    auto c = embedder.embed("a quick brown fox jumps");
    auto d = embedder.embed("quarterly stock market report");
    assert(a && b && c && d);
    assert(a.value().size() == 384);
    assert(a.value() == b.value());
    assert(std::fabs(norm(a.value()) - 1.0f) < 1e-4f);

    float related = similarity(Metric::Cosine, a.value(), c.value());
    float unrelated = similarity(Metric::Cosine, a.value(), d.value());
    assert(related > unrelated);
    assert(related > 0.5f);

    HashingEmbedder broken(0);
    auto fail = broken.embed("x");
    assert(!fail && fail.kind() == ErrorKind::DependencyFailure);

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// HNSW
// ═══════════════════════════════════════════════════════════════════════════

void test_hnsw_self_retrieval() {
    std::cout << "Testing HNSW self-retrieval..." << std::endl;

    std::mt19937 rng(7);
    const size_t dim = 32;
    HnswIndex index(dim, Metric::Cosine, IndexConfig{});
    std::vector<Vector> vectors;
    for (int i = 0; i < 500; ++i) {
        vectors.push_back(random_vector(rng, dim));
        assert(index.insert("v" + std::to_string(i), vectors.back()));
        // Searchable as soon as insert returns
        auto r = index.search(vectors.back(), 1, 200);
        assert(r && !r.value().neighbors.empty());
        assert(r.value().neighbors[0].id == "v" + std::to_string(i));
    }
    assert(index.size() == 500);

    size_t hits = 0;
    for (int i = 0; i < 500; ++i) {
        auto r = index.search(vectors[i], 1, 64);
        assert(r);
        if (r.value().neighbors[0].id == "v" + std::to_string(i)) hits++;
    }
    assert(hits >= 490);

    std::cout << "  PASS" << std::endl;
}

void test_hnsw_tombstones_and_capacity() {
    std::cout << "Testing HNSW tombstones/capacity..." << std::endl;

    std::mt19937 rng(11);
    IndexConfig config;
    config.capacity = 8;
    HnswIndex index(4, Metric::Euclidean, config);
    std::vector<Vector> vectors;
    for (int i = 0; i < 8; ++i) {
        vectors.push_back(random_vector(rng, 4));
        assert(index.insert("n" + std::to_string(i), vectors.back()));
    }
    assert(!index.has_capacity());
    Status full = index.insert("n8", random_vector(rng, 4));
    assert(!full && full.kind() == ErrorKind::ResourceExhaustion);

    assert(index.remove("n3"));
    assert(!index.remove("n3"));
    assert(!index.contains("n3"));
    auto r = index.search(vectors[3], 8, 64);
    assert(r);
    for (const auto& n : r.value().neighbors) assert(n.id != "n3");
    assert(r.value().neighbors.size() == 7);

    IndexStats s = index.stats();
    assert(s.size == 7 && s.slots == 8 && s.tombstones == 1);

    // Rebuild drops the tombstone and frees a slot
    std::vector<RecordPtr> snapshot;
    for (int i = 0; i < 8; ++i) {
        if (i == 3) continue;
        auto rec = std::make_shared<Record>();
        rec->id = "n" + std::to_string(i);
        rec->vector = vectors[i];
        snapshot.push_back(rec);
    }
    auto report = index.rebuild(snapshot);
    assert(report && report.value().reclaimed == 1);
    assert(index.generation() == 2);
    assert(index.has_capacity());
    assert(index.insert("n8", random_vector(rng, 4)));

    Status wrong = index.insert("w", Vector{1, 2});
    assert(!wrong && wrong.kind() == ErrorKind::Validation);

    std::cout << "  PASS" << std::endl;
}

void test_hnsw_serialize() {
    std::cout << "Testing HNSW graph serialize/deserialize..." << std::endl;

    std::mt19937 rng(3);
    HnswIndex index(16, Metric::Cosine, IndexConfig{});
    std::vector<Vector> vectors;
    for (int i = 0; i < 100; ++i) {
        vectors.push_back(random_vector(rng, 16));
        index.insert("s" + std::to_string(i), vectors.back());
    }
    index.remove("s5");

    std::vector<uint8_t> bytes = index.serialize();
    auto graph = HnswGraph::deserialize(bytes.data(), bytes.size());
    assert(graph->size() == 99);
    assert(graph->tombstones() == 1);
    assert(!graph->contains("s5"));

    HnswIndex restored(16, Metric::Cosine, IndexConfig{});
    assert(restored.install(std::move(graph)));
    for (int i = 0; i < 100; i += 10) {
        auto a = index.search(vectors[i], 5, 64);
        auto b = restored.search(vectors[i], 5, 64);
        assert(a && b);
        assert(a.value().neighbors.size() == b.value().neighbors.size());
        for (size_t j = 0; j < a.value().neighbors.size(); ++j) {
            assert(a.value().neighbors[j].id == b.value().neighbors[j].id);
        }
    }

    bool threw = false;
    try {
        bytes.resize(bytes.size() / 2);
        HnswGraph::deserialize(bytes.data(), bytes.size());
    } catch (const std::runtime_error&) {
        threw = true;
    }
    assert(threw);

    HnswIndex other_dim(8, Metric::Cosine, IndexConfig{});
    std::vector<uint8_t> again = index.serialize();
    Status mismatch = other_dim.install(HnswGraph::deserialize(again.data(), again.size()));
    assert(!mismatch && mismatch.kind() == ErrorKind::Validation);

    std::cout << "  PASS" << std::endl;
}

void test_quantized_recall() {
    std::cout << "Testing quantized index recall..." << std::endl;

    std::mt19937 rng(21);
    EngineConfig config = test_config(fresh_dir("quant"), 32, false);
    config.index.quantize = true;
    auto engine = open_engine(config);

    for (int i = 0; i < 300; ++i) {
        assert(engine->index_vector("q" + std::to_string(i), random_vector(rng, 32), ""));
    }
    std::vector<Vector> queries;
    for (int i = 0; i < 30; ++i) queries.push_back(random_vector(rng, 32));
    double recall = recall_at(*engine, queries, 10);
    assert(recall >= 0.8);

    // Final scores come from the float vectors, not the codes
    Vector query = random_vector(rng, 32);
    auto r = engine->search_vector(request_for(query, 3));
    assert(r);
    for (const auto& h : r.value().hits) {
        auto rec = engine->get_document(h.id);
        assert(rec);
        assert(std::fabs(h.score - similarity(Metric::Cosine, query, rec.value().vector)) < 1e-5f);
    }

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// Query semantics
// ═══════════════════════════════════════════════════════════════════════════

void test_query_ordering() {
    std::cout << "Testing query ordering (A/B/C)..." << std::endl;

    auto engine = open_engine(test_config(fresh_dir("abc"), 2, false));
    assert(engine->index_vector("A", {1, 0}, "alpha"));
    assert(engine->index_vector("B", {0, 1}, "beta"));
    assert(engine->index_vector("C", {1, 1}, "gamma"));

    auto r = engine->search_vector(request_for({1.0f, 0.1f}, 2));
    assert(r);
    const auto& hits = r.value().hits;
    assert(hits.size() == 2);
    assert(hits[0].id == "A" && hits[1].id == "C");
    assert(hits[0].payload == "alpha");
    assert(hits[0].score > hits[1].score);
    assert(hits[0].score <= 1.0f && hits[1].score >= -1.0f);

    assert(engine->delete_document("A"));
    auto after = engine->search_vector(request_for({1.0f, 0.1f}, 2));
    assert(after && after.value().hits.size() == 2);
    assert(after.value().hits[0].id == "C" && after.value().hits[1].id == "B");

    // Equal scores fall back to id order
    assert(engine->index_vector("z", {0, 2}, ""));
    assert(engine->index_vector("y", {0, 3}, ""));
    auto tie = engine->search_vector(request_for({0, 1}, 3));
    assert(tie && tie.value().hits.size() == 3);
    assert(tie.value().hits[0].id == "B");
    assert(tie.value().hits[1].id == "y");
    assert(tie.value().hits[2].id == "z");

    // A deleted record never answers, even as the nearest match
    auto second = open_engine(test_config(fresh_dir("abc_delete"), 2, false));
    assert(second->index_vector("A", {1, 0}, "alpha"));
    assert(second->index_vector("B", {0, 1}, "beta"));
    assert(second->index_vector("C", {1, 1}, "gamma"));
    assert(second->delete_document("B"));
    auto without_b = second->search_vector(request_for({0, 1}, 1));
    assert(without_b && without_b.value().hits.size() == 1);
    assert(without_b.value().hits[0].id == "C");

    std::cout << "  PASS" << std::endl;
}

void test_euclidean_ordering() {
    std::cout << "Testing Euclidean ordering..." << std::endl;

    EngineConfig config = test_config(fresh_dir("l2"), 2, false);
    config.metric = Metric::Euclidean;
    auto engine = open_engine(config);
    engine->index_vector("origin", {0, 0}, "");
    engine->index_vector("one", {1, 0}, "");
    engine->index_vector("three", {3, 0}, "");

    auto r = engine->search_vector(request_for({0.9f, 0.0f}, 3));
    assert(r);
    const auto& hits = r.value().hits;
    assert(hits.size() == 3);
    assert(hits[0].id == "one" && hits[1].id == "origin" && hits[2].id == "three");
    assert(std::fabs(hits[0].score - 1.0f / 1.1f) < 1e-4f);
    assert(std::fabs(hits[2].score - 1.0f / 3.1f) < 1e-4f);

    std::cout << "  PASS" << std::endl;
}

void test_k_and_validation() {
    std::cout << "Testing k bounds and dimension checks..." << std::endl;

    auto engine = open_engine(test_config(fresh_dir("k"), 3, false));
    engine->index_vector("a", {1, 0, 0}, "");
    engine->index_vector("b", {0, 1, 0}, "");
    engine->index_vector("c", {0, 0, 1}, "");

    auto many = engine->search_vector(request_for({1, 1, 1}, 10));
    assert(many && many.value().hits.size() == 3);
    assert(!many.value().partial);

    auto zero = engine->search_vector(request_for({1, 1, 1}, 0));
    assert(!zero && zero.kind() == ErrorKind::Validation);
    auto negative = engine->search_vector(request_for({1, 1, 1}, -1));
    assert(!negative && negative.kind() == ErrorKind::Validation);

    auto short_query = engine->search_vector(request_for({1, 1}, 1));
    assert(!short_query && short_query.kind() == ErrorKind::Validation);
    auto nan_query = engine->search_vector(request_for({1, NAN, 1}, 1));
    assert(!nan_query && nan_query.kind() == ErrorKind::Validation);

    auto long_vec = engine->index_vector("d", {1, 2, 3, 4}, "");
    assert(!long_vec && long_vec.kind() == ErrorKind::Validation);
    auto rejected = engine->get_document("d");
    assert(!rejected && rejected.kind() == ErrorKind::NotFound);
    assert(engine->stats().records == 3);
    assert(engine->index().size() == 3);

    EngineConfig empty_config = test_config(fresh_dir("empty"), 3, false);
    auto empty = open_engine(empty_config);
    auto none = empty->search_vector(request_for({1, 0, 0}, 5));
    assert(none && none.value().hits.empty());

    std::cout << "  PASS" << std::endl;
}

void test_delete_and_idempotent_put() {
    std::cout << "Testing delete visibility/idempotent put..." << std::endl;

    std::string dir = fresh_dir("idem");
    auto engine = open_engine(test_config(dir, 3, true));

    auto first = engine->index_vector("doc", {1, 0, 0}, "p", {"t"});
    assert(first && first.value().outcome == PutOutcome::Inserted);
    assert(first.value().sequence > 0);
    size_t wal_before = engine->stats().wal_entries;

    auto again = engine->index_vector("doc", {1, 0, 0}, "p", {"t", "t"});
    assert(again && again.value().outcome == PutOutcome::Unchanged);
    assert(again.value().sequence == 0);
    assert(engine->stats().wal_entries == wal_before);
    assert(engine->index().stats().slots == 1);

    auto replaced = engine->index_vector("doc", {0, 1, 0}, "p2");
    assert(replaced && replaced.value().outcome == PutOutcome::Replaced);
    assert(engine->index().size() == 1);
    auto got = engine->get_document("doc");
    assert(got && got.value().payload == "p2" && got.value().tags.empty());

    assert(engine->delete_document("doc"));
    auto gone = engine->get_document("doc");
    assert(!gone && gone.kind() == ErrorKind::NotFound);
    Status twice = engine->delete_document("doc");
    assert(!twice && twice.kind() == ErrorKind::NotFound);
    auto r = engine->search_vector(request_for({0, 1, 0}, 5));
    assert(r && r.value().hits.empty());

    std::cout << "  PASS" << std::endl;
}

void test_filters() {
    std::cout << "Testing search filters..." << std::endl;

    std::mt19937 rng(5);
    auto engine = open_engine(test_config(fresh_dir("filter"), 8, false));
    for (int i = 0; i < 200; ++i) {
        std::vector<std::string> tags = {i % 2 == 0 ? "even" : "odd"};
        if (i % 40 == 0) tags.push_back("rare");
        std::string prefix = i < 100 ? "lo/" : "hi/";
        engine->index_vector(prefix + std::to_string(i), random_vector(rng, 8),
                             std::to_string(i), tags);
    }

    Vector q = random_vector(rng, 8);

    SearchRequest rare = request_for(q, 5);
    rare.filter.tags.all_tags = {"rare"};
    auto r1 = engine->search_vector(rare);
    assert(r1 && r1.value().hits.size() == 5);
    for (const auto& h : r1.value().hits) {
        assert(std::find(h.tags.begin(), h.tags.end(), "rare") != h.tags.end());
    }

    SearchRequest odd_hi = request_for(q, 10);
    odd_hi.filter.tags.none_tags = {"even"};
    odd_hi.filter.id_prefix = "hi/";
    auto r2 = engine->search_vector(odd_hi);
    assert(r2 && r2.value().hits.size() == 10);
    for (const auto& h : r2.value().hits) {
        assert(h.id.compare(0, 3, "hi/") == 0);
        assert(std::stoi(h.payload) % 2 == 1);
    }

    SearchRequest pred = request_for(q, 3);
    pred.filter.predicate = [](const Record& rec) { return rec.payload.size() == 1; };
    auto r3 = engine->search_vector(pred);
    assert(r3 && r3.value().hits.size() == 3);
    for (const auto& h : r3.value().hits) assert(h.payload.size() == 1);

    SearchRequest nothing = request_for(q, 3);
    nothing.filter.tags.all_tags = {"missing"};
    auto r4 = engine->search_vector(nothing);
    assert(r4 && r4.value().hits.empty());

    // Exact scan agrees on filtered ground truth
    rare.exact = true;
    auto r5 = engine->search_vector(rare);
    assert(r5 && r5.value().hits.size() == 5);
    for (size_t i = 0; i < 5; ++i) assert(r5.value().hits[i].id == r1.value().hits[i].id);

    std::cout << "  PASS" << std::endl;
}

void test_consistency_gap() {
    std::cout << "Testing consistency gap skip..." << std::endl;

    VectorStore store(2);
    TagIndex tags;
    HnswIndex index(2, Metric::Cosine, IndexConfig{});
    QueryEngine query(store, index, tags);

    for (const auto& [id, v] : std::vector<std::pair<std::string, Vector>>{
             {"a", {1, 0}}, {"b", {0.9f, 0.1f}}, {"c", {0, 1}}}) {
        auto put = store.put(id, v, "");
        assert(put);
        assert(index.insert(id, v));
    }

    // Index still references "a"; the store no longer does
    store.remove("a");
    auto r = query.search(request_for({1, 0}, 3));
    assert(r);
    assert(r.value().hits.size() == 2);
    assert(r.value().hits[0].id == "b");
    assert(r.value().stats.consistency_gaps == 1);
    assert(query.consistency_gaps() == 1);

    std::cout << "  PASS" << std::endl;
}

void test_search_budget() {
    std::cout << "Testing search budget partial results..." << std::endl;

    std::mt19937 rng(9);
    auto engine = open_engine(test_config(fresh_dir("budget"), 16, false));
    for (int i = 0; i < 300; ++i) {
        engine->index_vector("b" + std::to_string(i), random_vector(rng, 16), "");
    }

    SearchRequest tight = request_for(random_vector(rng, 16), 10);
    tight.max_distance_computations = 5;
    auto r = engine->search_vector(tight);
    assert(r);
    assert(r.value().partial);
    assert(r.value().hits.size() <= 10);
    assert(r.value().stats.distance_computations <= 5);
    assert(engine->stats().partial_searches == 1);

    SearchRequest loose = request_for(tight.vector, 10);
    loose.timeout = std::chrono::milliseconds(10000);
    auto full = engine->search_vector(loose);
    assert(full && !full.value().partial && full.value().hits.size() == 10);

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// Rebuild, capacity, compaction
// ═══════════════════════════════════════════════════════════════════════════

void test_duplicate_contents() {
    std::cout << "Testing search over repeated contents..." << std::endl;

    auto engine = open_engine(test_config(fresh_dir("dups"), 64, false));
    const std::vector<std::string> texts = {
        "variant calling pipeline", "genome assembly notes", "quarterly stock report"};
    for (int i = 0; i < 600; ++i) {
        assert(engine->index_document("d" + std::to_string(i), texts[i % 3], ""));
    }

    auto q = engine->search("variant calling pipeline", request_for({}, 1000));
    assert(q && !q.value().partial);
    assert(q.value().hits.size() == 600);
    assert(q.value().hits[0].score > 0.99f);

    for (int i = 0; i < 600; ++i) {
        if (i % 10 != 0) assert(engine->delete_document("d" + std::to_string(i)));
    }
    auto survivors = engine->search("genome assembly notes", request_for({}, 1000));
    assert(survivors && survivors.value().hits.size() == 60);
    for (const auto& h : survivors.value().hits) {
        assert(std::stoi(h.id.substr(1)) % 10 == 0);
    }

    // Tight clusters of near-identical vectors
    std::mt19937 rng(17);
    std::uniform_real_distribution<float> noise(-0.001f, 0.001f);
    std::vector<Vector> centers = {random_vector(rng, 64), random_vector(rng, 64),
                                   random_vector(rng, 64)};
    auto clusters = open_engine(test_config(fresh_dir("clusters"), 64, false));
    for (int i = 0; i < 900; ++i) {
        Vector v = centers[i % 3];
        for (auto& x : v) x += noise(rng);
        assert(clusters->index_vector("n" + std::to_string(i), v, ""));
    }
    auto all = clusters->search_vector(request_for(centers[0], 2000));
    assert(all && all.value().hits.size() == 900);
    std::set<std::string> unique;
    for (const auto& h : all.value().hits) unique.insert(h.id);
    assert(unique.size() == 900);

    std::cout << "  PASS" << std::endl;
}

void test_budget_limits() {
    std::cout << "Testing budget across widening rounds..." << std::endl;

    // Deadlines beyond the clock's range mean no deadline
    auto forever = SearchBudget::within(std::chrono::milliseconds(10000000000000LL));
    assert(!forever.has_deadline());
    auto minute = SearchBudget::within(std::chrono::milliseconds(60000));
    assert(minute.has_deadline());
    assert(minute.deadline > SearchBudget::Clock::now());

    std::mt19937 rng(23);
    auto engine = open_engine(test_config(fresh_dir("budget_rounds"), 16, false));
    for (int i = 0; i < 300; ++i) {
        std::vector<std::string> tags;
        if (i % 30 == 0) tags.push_back("rare");
        engine->index_vector("r" + std::to_string(i), random_vector(rng, 16), "", tags);
    }
    Vector q = random_vector(rng, 16);

    SearchRequest patient = request_for(q, 10);
    patient.timeout = std::chrono::milliseconds(10000000000000LL);
    auto long_wait = engine->search_vector(patient);
    assert(long_wait && !long_wait.value().partial);
    assert(long_wait.value().hits.size() == 10);

    SearchRequest filtered = request_for(q, 10);
    filtered.filter.tags.all_tags = {"rare"};
    auto unlimited = engine->search_vector(filtered);
    assert(unlimited && unlimited.value().hits.size() == 10);
    assert(unlimited.value().stats.rounds >= 2);
    size_t total = unlimited.value().stats.distance_computations;

    // One computation short of what the widening rounds needed in total
    filtered.max_distance_computations = total - 1;
    auto capped = engine->search_vector(filtered);
    assert(capped);
    assert(capped.value().partial);
    assert(capped.value().stats.distance_computations <= total - 1);

    std::cout << "  PASS" << std::endl;
}

void test_rebuild_recall() {
    std::cout << "Testing rebuild keeps recall..." << std::endl;

    std::mt19937 rng(13);
    auto engine = open_engine(test_config(fresh_dir("rebuild"), 24, false));
    for (int i = 0; i < 400; ++i) {
        engine->index_vector("r" + std::to_string(i), random_vector(rng, 24), "");
    }
    for (int i = 0; i < 400; i += 4) {
        assert(engine->delete_document("r" + std::to_string(i)));
    }

    std::vector<Vector> queries;
    for (int i = 0; i < 40; ++i) queries.push_back(random_vector(rng, 24));
    double before = recall_at(*engine, queries, 10);

    auto report = engine->rebuild_index();
    assert(report);
    assert(report.value().generation == 2);
    assert(report.value().records == 300);
    assert(report.value().reclaimed == 100);

    IndexStats s = engine->index().stats();
    assert(s.tombstones == 0 && s.size == 300 && s.slots == 300);
    assert(s.state == IndexState::Active);

    double after = recall_at(*engine, queries, 10);
    assert(after >= 0.9);
    assert(after + 0.05 >= before);

    std::cout << "  PASS" << std::endl;
}

void test_capacity_and_compaction() {
    std::cout << "Testing capacity exhaustion/compaction..." << std::endl;

    std::mt19937 rng(17);
    auto fill = [&](Engine& engine) {
        for (int i = 0; i < 10; ++i) {
            assert(engine.index_vector("c" + std::to_string(i), random_vector(rng, 4), ""));
        }
        assert(engine.delete_document("c0"));
        assert(engine.delete_document("c1"));
    };

    {
        EngineConfig config = test_config(fresh_dir("cap_never"), 4, false);
        config.index.capacity = 10;
        config.index.ef_construction = 16;
        auto engine = open_engine(config);
        fill(*engine);
        auto full = engine->index_vector("c10", random_vector(rng, 4), "");
        assert(!full && full.kind() == ErrorKind::ResourceExhaustion);
        assert(engine->stats().records == 8);
        assert(!engine->get_document("c10"));

        // Identical re-put needs no slot
        auto same = engine->get_document("c2");
        assert(same);
        assert(engine->index_vector("c2", same.value().vector, "", {}));

        assert(engine->rebuild_index());
        assert(engine->index_vector("c10", random_vector(rng, 4), ""));
    }

    {
        EngineConfig config = test_config(fresh_dir("cap_on"), 4, false);
        config.index.capacity = 10;
        config.index.ef_construction = 16;
        config.compaction.policy = CompactionPolicy::OnCapacity;
        auto engine = open_engine(config);
        fill(*engine);
        auto retried = engine->index_vector("c10", random_vector(rng, 4), "");
        assert(retried);
        assert(retried.value().generation == 2);
        assert(engine->index().stats().tombstones == 0);

        assert(engine->index_vector("c11", random_vector(rng, 4), ""));
        // Ten live records and no tombstones: nothing to reclaim
        auto full = engine->index_vector("c12", random_vector(rng, 4), "");
        assert(!full && full.kind() == ErrorKind::ResourceExhaustion);
    }

    {
        EngineConfig config = test_config(fresh_dir("cap_ratio"), 4, false);
        config.index.capacity = 10;
        config.index.ef_construction = 16;
        config.compaction.policy = CompactionPolicy::Ratio;
        config.compaction.ratio = 0.2;
        config.compaction.min_tombstones = 2;
        auto engine = open_engine(config);
        fill(*engine);
        auto compacted = engine->compact_if_needed();
        assert(compacted && compacted.value());
        assert(engine->index().stats().tombstones == 0);
        auto idle = engine->compact_if_needed();
        assert(idle && !idle.value());
    }

    std::cout << "  PASS" << std::endl;
}

void test_concurrent_rebuild() {
    std::cout << "Testing concurrent queries/writes during rebuild..." << std::endl;

    std::mt19937 rng(23);
    const size_t dim = 16;
    auto engine = open_engine(test_config(fresh_dir("concurrent"), dim, false));
    for (int i = 0; i < 500; ++i) {
        engine->index_vector("base" + std::to_string(i), random_vector(rng, dim), "");
    }

    std::atomic<bool> stop{false};
    std::atomic<size_t> queries{0};
    std::atomic<size_t> failures{0};

    std::vector<std::thread> readers;
    for (int t = 0; t < 4; ++t) {
        readers.emplace_back([&, t]() {
            std::mt19937 local(100 + t);
            while (!stop.load()) {
                auto r = engine->search_vector(request_for(random_vector(local, dim), 10));
                if (!r || r.value().hits.size() != 10) failures++;
                queries++;
            }
        });
    }

    std::thread writer([&]() {
        std::mt19937 local(200);
        for (int i = 0; i < 300; ++i) {
            if (!engine->index_vector("new" + std::to_string(i), random_vector(local, dim), "")) {
                failures++;
            }
            if (i % 3 == 0 && !engine->delete_document("base" + std::to_string(i))) {
                failures++;
            }
        }
    });

    for (int round = 0; round < 3; ++round) {
        auto report = engine->rebuild_index();
        assert(report);
    }

    writer.join();
    stop = true;
    for (auto& t : readers) t.join();

    assert(failures.load() == 0);
    assert(queries.load() > 0);
    assert(engine->index().state() == IndexState::Active);

    // Every live record is reachable from the current generation
    size_t live = 0;
    for (const auto& rec : engine->store().snapshot()) {
        assert(engine->index().contains(rec->id));
        live++;
    }
    assert(live == 700);
    assert(engine->index().size() == live);
    assert(engine->index().generation() == 4);

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// Persistence
// ═══════════════════════════════════════════════════════════════════════════

void test_wal_direct() {
    std::cout << "Testing WriteAheadLog append/replay/truncate..." << std::endl;

    std::string dir = fresh_dir("wal");
    std::filesystem::create_directories(dir);
    std::string path = dir + "/wal.log";

    {
        WriteAheadLog wal(path, false);
        assert(wal.open());
        Record rec;
        rec.id = "w1";
        rec.vector = {1, 2};
        rec.payload = "payload";
        rec.tags = {"t"};
        assert(wal.append_put(rec) == 1);
        assert(wal.append_delete("w0") == 2);
        assert(wal.entries() == 2);
    }

    WriteAheadLog wal(path, false);
    assert(wal.open());
    assert(wal.last_sequence() == 2);

    std::vector<WalEntry> entries;
    assert(wal.replay(0, [&](const WalEntry& e) { entries.push_back(e); }) == 2);
    assert(entries[0].op == WalOp::Put && entries[0].record.payload == "payload");
    assert(entries[0].record.vector == (Vector{1, 2}));
    assert(entries[1].op == WalOp::Delete && entries[1].id == "w0");
    assert(wal.replay(1, [](const WalEntry&) {}) == 1);

    assert(wal.truncate());
    assert(wal.entries() == 0);
    assert(wal.replay(0, [](const WalEntry&) {}) == 0);
    assert(wal.append_delete("w1") == 3);

    std::cout << "  PASS" << std::endl;
}

void test_wal_sync_failure() {
    std::cout << "Testing WAL rollback on fsync failure..." << std::endl;

    std::string dir = fresh_dir("wal_sync");
    std::filesystem::create_directories(dir);
    std::string path = dir + "/wal.log";

    Record rec;
    rec.id = "durable";
    rec.vector = {1, 0};
    {
        WriteAheadLog wal(path, true);
        assert(wal.open());
        assert(wal.append_put(rec) == 1);
        auto size_before = std::filesystem::file_size(path);

        wal.set_sync([](int) { errno = EIO; return -1; });
        Record lost = rec;
        lost.id = "lost";
        assert(wal.append_put(lost) == 0);
        assert(wal.append_delete("durable") == 0);
        assert(std::filesystem::file_size(path) == size_before);
        assert(wal.last_sequence() == 1);
    }

    WriteAheadLog wal(path, true);
    assert(wal.open());
    std::vector<std::string> replayed;
    assert(wal.replay(0, [&](const WalEntry& e) { replayed.push_back(e.id); }) == 1);
    assert(replayed[0] == "durable");
    assert(wal.append_delete("durable") == 2);

    std::cout << "  PASS" << std::endl;
}

void test_wal_recovery() {
    std::cout << "Testing WAL recovery after crash..." << std::endl;

    std::mt19937 rng(29);
    std::string dir = fresh_dir("recovery");
    EngineConfig config = test_config(dir, 8, true);
    std::vector<Vector> vectors;
    {
        auto engine = open_engine(config);
        for (int i = 0; i < 50; ++i) {
            vectors.push_back(random_vector(rng, 8));
            assert(engine->index_vector("w" + std::to_string(i), vectors.back(),
                                        "p" + std::to_string(i), {"batch"}));
        }
        for (int i = 0; i < 5; ++i) assert(engine->delete_document("w" + std::to_string(i)));
        assert(engine->close(false));
    }

    auto engine = open_engine(config);
    EngineStats s = engine->stats();
    assert(s.records == 45);
    assert(s.replayed == 55);
    assert(!s.restored_graph);
    assert(s.wal_sequence == 55);
    assert(!engine->get_document("w0"));

    auto got = engine->get_document("w10");
    assert(got && got.value().payload == "p10");
    assert(got.value().tags == std::vector<std::string>{"batch"});

    auto r = engine->search_vector(request_for(vectors[20], 1));
    assert(r && r.value().hits[0].id == "w20");

    auto next = engine->index_vector("after", random_vector(rng, 8), "");
    assert(next && next.value().sequence == 56);

    std::cout << "  PASS" << std::endl;
}

void test_checkpoint_restart() {
    std::cout << "Testing checkpoint and graph reuse on restart..." << std::endl;

    std::mt19937 rng(31);
    std::string dir = fresh_dir("checkpoint");
    EngineConfig config = test_config(dir, 8, true);
    std::vector<Vector> vectors;
    uint64_t generation = 0;
    {
        auto engine = open_engine(config);
        for (int i = 0; i < 60; ++i) {
            vectors.push_back(random_vector(rng, 8));
            engine->index_vector("k" + std::to_string(i), vectors.back(), "");
        }
        engine->delete_document("k0");
        assert(engine->rebuild_index());
        generation = engine->index().generation();

        auto report = engine->checkpoint();
        assert(report);
        assert(report.value().records == 59);
        assert(report.value().graph_saved);
        assert(report.value().wal_truncated);
        assert(engine->stats().wal_entries == 0);
        assert(engine->close(true));
    }
    assert(std::filesystem::exists(config.snapshot_path()));
    assert(std::filesystem::exists(config.graph_path()));

    {
        auto engine = open_engine(config);
        EngineStats s = engine->stats();
        assert(s.records == 59);
        assert(s.replayed == 0);
        assert(s.restored_graph);
        assert(engine->index().generation() == generation);

        // Writes after the checkpoint land in the WAL and replay onto the graph
        engine->index_vector("extra", random_vector(rng, 8), "x");
        engine->delete_document("k1");
        assert(engine->close(false));
    }

    auto engine = open_engine(config);
    EngineStats s = engine->stats();
    assert(s.records == 59);
    assert(s.replayed == 2);
    assert(s.restored_graph);
    assert(engine->get_document("extra"));
    assert(!engine->get_document("k1"));
    auto r = engine->search_vector(request_for(vectors[30], 1));
    assert(r && r.value().hits[0].id == "k30");

    std::cout << "  PASS" << std::endl;
}

void test_graph_shape_change() {
    std::cout << "Testing persisted graph with a different shape..." << std::endl;

    std::mt19937 rng(41);
    HnswIndex built(8, Metric::Cosine, IndexConfig{});
    for (int i = 0; i < 20; ++i) built.insert("g" + std::to_string(i), random_vector(rng, 8));
    std::vector<uint8_t> bytes = built.serialize();

    IndexConfig smaller;
    smaller.capacity = 1000;
    HnswIndex other(8, Metric::Cosine, smaller);
    Status st = other.install(HnswGraph::deserialize(bytes.data(), bytes.size()));
    assert(!st && st.kind() == ErrorKind::Validation);
    assert(other.size() == 0);

    std::string dir = fresh_dir("graph_shape");
    EngineConfig config = test_config(dir, 8, true);
    std::vector<Vector> vectors;
    {
        auto engine = open_engine(config);
        for (int i = 0; i < 40; ++i) {
            vectors.push_back(random_vector(rng, 8));
            engine->index_vector("s" + std::to_string(i), vectors.back(), "");
        }
        assert(engine->checkpoint());
        assert(engine->close(false));
    }

    config.index.M = 8;
    config.index.capacity = 5000;
    auto engine = open_engine(config);
    EngineStats s = engine->stats();
    assert(!s.restored_graph);
    assert(s.records == 40);
    assert(s.index.capacity == 5000);
    auto r = engine->search_vector(request_for(vectors[7], 1));
    assert(r && r.value().hits[0].id == "s7");

    std::cout << "  PASS" << std::endl;
}

void test_torn_wal_tail() {
    std::cout << "Testing torn WAL tail..." << std::endl;

    std::mt19937 rng(37);
    std::string dir = fresh_dir("torn");
    EngineConfig config = test_config(dir, 4, true);
    {
        auto engine = open_engine(config);
        for (int i = 0; i < 10; ++i) engine->index_vector("t" + std::to_string(i), random_vector(rng, 4), "");
        assert(engine->close(false));
    }

    // Half an entry header, as a crash mid-append leaves it
    {
        std::ofstream out(config.wal_path(), std::ios::binary | std::ios::app);
        const char partial[20] = {'L', 'A', 'W', 'K', 1, 2, 3};
        out.write(partial, sizeof(partial));
    }

    {
        auto engine = open_engine(config);
        assert(engine->stats().records == 10);
        assert(engine->index_vector("t10", random_vector(rng, 4), ""));
        assert(engine->close(false));
    }

    auto engine = open_engine(config);
    assert(engine->stats().records == 11);
    assert(engine->get_document("t10"));

    std::cout << "  PASS" << std::endl;
}

void test_snapshot_checks() {
    std::cout << "Testing snapshot dimension/corruption checks..." << std::endl;

    std::mt19937 rng(41);
    std::string dir = fresh_dir("snapcheck");
    EngineConfig config = test_config(dir, 4, true);
    {
        auto engine = open_engine(config);
        engine->index_vector("s", random_vector(rng, 4), "");
        assert(engine->close(true));
    }

    EngineConfig wider = config;
    wider.dimension = 8;
    Engine mismatch(wider, std::make_unique<HashingEmbedder>(8));
    Status st = mismatch.open();
    assert(!st && st.kind() == ErrorKind::Validation);

    // Flip a byte in the body: the checksum catches it
    {
        std::fstream f(config.snapshot_path(), std::ios::binary | std::ios::in | std::ios::out);
        f.seekg(-1, std::ios::end);
        char c = 0;
        f.read(&c, 1);
        c ^= 0x5A;
        f.seekp(-1, std::ios::end);
        f.write(&c, 1);
    }
    Engine corrupt(config, std::make_unique<HashingEmbedder>(4));
    Status bad = corrupt.open();
    assert(!bad && bad.kind() == ErrorKind::Io);

    Engine wrong_embedder(config, std::make_unique<HashingEmbedder>(16));
    Status dim = wrong_embedder.open();
    assert(!dim && dim.kind() == ErrorKind::Validation);

    std::cout << "  PASS" << std::endl;
}

void test_maintenance_tick() {
    std::cout << "Testing maintenance checkpoint/compaction..." << std::endl;

    std::mt19937 rng(43);
    EngineConfig config = test_config(fresh_dir("maint"), 4, true);
    config.persistence.checkpoint_wal_entries = 5;
    config.compaction.policy = CompactionPolicy::Ratio;
    config.compaction.min_tombstones = 2;
    config.compaction.ratio = 0.2;
    auto engine = open_engine(config);

    assert(!engine->checkpoint_due());
    for (int i = 0; i < 10; ++i) engine->index_vector("m" + std::to_string(i), random_vector(rng, 4), "");
    engine->delete_document("m0");
    engine->delete_document("m1");
    assert(engine->checkpoint_due());

    std::vector<MaintenanceEvent> events;
    Maintenance maintenance(*engine, std::chrono::milliseconds(50));
    maintenance.on_event([&](MaintenanceEvent e, const std::string&) { events.push_back(e); });
    maintenance.tick();

    auto s = maintenance.stats();
    assert(s.ticks == 1 && s.checkpoints == 1 && s.compactions == 1 && s.failures == 0);
    assert(!engine->checkpoint_due());
    assert(engine->index().stats().tombstones == 0);
    assert(events.size() == 2);
    assert(events[0] == MaintenanceEvent::Checkpointed);
    assert(events[1] == MaintenanceEvent::Compacted);

    maintenance.start();
    assert(maintenance.is_running());
    std::this_thread::sleep_for(std::chrono::milliseconds(120));
    maintenance.stop();
    assert(!maintenance.is_running());
    assert(maintenance.stats().ticks >= 2);

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// Config, workers, RPC
// ═══════════════════════════════════════════════════════════════════════════

void test_config_loading() {
    std::cout << "Testing config layering/validation..." << std::endl;

    EngineConfig config;
    assert(config.validate());

    Status ok = config.merge_json(json::parse(R"({
        "dimension": 64,
        "metric": "euclidean",
        "index": {"M": 8, "ef_construction": 100, "quantize": true},
        "compaction": {"policy": "on_capacity"},
        "daemon": {"workers": 2}
    })"));
    assert(ok);
    assert(config.dimension == 64);
    assert(config.metric == Metric::Euclidean);
    assert(config.index.M == 8 && config.index.quantize);
    assert(config.index.ef_search == 64);
    assert(config.compaction.policy == CompactionPolicy::OnCapacity);
    assert(config.daemon.workers == 2);
    assert(config.validate());

    assert(!config.merge_json(json::parse(R"({"metric": "manhattan"})")));
    Status wrong_type = config.merge_json(json::parse(R"({"dimension": "big"})"));
    assert(!wrong_type && wrong_type.kind() == ErrorKind::Validation);
    assert(!config.merge_json(json::array()));

    EngineConfig bad = config;
    bad.index.ef_construction = 4;
    assert(!bad.validate());
    bad = config;
    bad.dimension = 0;
    assert(!bad.validate());
    bad = config;
    bad.embedder = "word2vec";
    assert(!bad.validate());

    // Round trip through a file
    std::string dir = fresh_dir("config");
    std::filesystem::create_directories(dir);
    std::string path = dir + "/kosha.json";
    {
        std::ofstream out(path);
        out << config.to_json().dump(2);
    }
    EngineConfig loaded;
    assert(loaded.merge_file(path));
    assert(loaded.dimension == 64 && loaded.index.M == 8);
    assert(loaded.compaction.policy == CompactionPolicy::OnCapacity);

    Status missing = loaded.merge_file(dir + "/nope.json");
    assert(!missing && missing.kind() == ErrorKind::Io);
    {
        std::ofstream out(path);
        out << "{ not json";
    }
    Status garbled = loaded.merge_file(path);
    assert(!garbled && garbled.kind() == ErrorKind::Validation);

    setenv("KOSHA_DIM", "128", 1);
    setenv("KOSHA_METRIC", "cosine", 1);
    EngineConfig env;
    assert(env.merge_env());
    assert(env.dimension == 128 && env.metric == Metric::Cosine);
    setenv("KOSHA_DIM", "lots", 1);
    assert(!env.merge_env());
    unsetenv("KOSHA_DIM");
    unsetenv("KOSHA_METRIC");

    EngineConfig a, b;
    a.data_dir = "/var/lib/kosha/a";
    b.data_dir = "/var/lib/kosha/b";
    assert(a.socket_path() != b.socket_path());
    assert(a.socket_path() == runtime_path("/var/lib/kosha/a", "sock"));
    assert(a.socket_path().rfind("/tmp/kosha-", 0) == 0);
    a.daemon.socket_path = "/run/custom.sock";
    assert(a.socket_path() == "/run/custom.sock");

    std::cout << "  PASS" << std::endl;
}

void test_worker_pool() {
    std::cout << "Testing WorkerPool..." << std::endl;

    std::atomic<int> total{0};
    {
        WorkerPool<int> pool(4, [&](int& n) { total += n; });
        assert(pool.workers() == 4);
        for (int i = 1; i <= 100; ++i) pool.submit(i);
        pool.shutdown();
        assert(pool.pending() == 0);
    }
    assert(total.load() == 5050);

    JobQueue<std::string> queue;
    queue.push("a");
    queue.stop();
    std::string job;
    assert(queue.pop(job) && job == "a");
    assert(!queue.pop(job));

    std::cout << "  PASS" << std::endl;
}

json call(rpc::Handler& handler, const std::string& method, const json& params = json::object()) {
    json request = {{"jsonrpc", "2.0"}, {"id", 1}, {"method", method}, {"params", params}};
    return json::parse(handler.handle(request.dump()));
}

void test_rpc_handler() {
    std::cout << "Testing RPC handler..." << std::endl;

    auto engine = open_engine(test_config(fresh_dir("rpc"), 64, false));
    bool shutdown_called = false;
    rpc::HandlerContext ctx;
    ctx.socket_path = "/tmp/kosha-test.sock";
    ctx.on_shutdown = [&]() { shutdown_called = true; };
    rpc::Handler handler(*engine, ctx);

    json parse = json::parse(handler.handle("this is not json"));
    assert(parse["error"]["code"] == rpc::error::PARSE_ERROR);

    json invalid = json::parse(handler.handle(R"({"jsonrpc":"2.0","id":2,"method":"stats","params":[1]})"));
    assert(invalid["error"]["code"] == rpc::error::INVALID_REQUEST);
    assert(invalid["id"] == 2);

    json unknown = call(handler, "frobnicate");
    assert(unknown["error"]["code"] == rpc::error::METHOD_NOT_FOUND);

    json init = call(handler, "initialize", {{"protocol_major", KOSHA_PROTOCOL_VERSION_MAJOR},
                                             {"protocol_minor", 0}});
    assert(init["result"]["compatible"] == true);
    assert(init["result"]["dimension"] == 64);
    json old = call(handler, "initialize", {{"protocol_major", 0}});
    assert(old["result"]["compatible"] == false);

    json indexed = call(handler, "index_document", {
        {"id", "fox"}, {"content", "the quick brown fox"}, {"tags", {"animal"}},
        {"payload", {{"source", "test"}}}});
    assert(indexed["result"]["outcome"] == "inserted");
    call(handler, "index_document", {{"id", "market"}, {"content", "stock market report"}});

    json missing_content = call(handler, "index_document", {{"id", "x"}});
    assert(missing_content["error"]["code"] == rpc::error::INVALID_PARAMS);

    json found = call(handler, "search", {{"query", "quick fox"}, {"k", 1}});
    assert(found["result"]["hits"].size() == 1);
    assert(found["result"]["hits"][0]["id"] == "fox");
    assert(json::parse(found["result"]["hits"][0]["payload"].get<std::string>())["source"] == "test");

    json filtered = call(handler, "search", {{"query", "report"}, {"k", 5},
                                             {"filter", {{"all_tags", {"animal"}}}}});
    assert(filtered["result"]["hits"].size() == 1);
    assert(filtered["result"]["hits"][0]["id"] == "fox");

    json no_query = call(handler, "search", {{"k", 3}});
    assert(no_query["error"]["code"] == rpc::error::INVALID_PARAMS);
    json bad_k = call(handler, "search", {{"query", "x"}, {"k", "three"}});
    assert(bad_k["error"]["code"] == rpc::error::INVALID_PARAMS);
    json zero_k = call(handler, "search", {{"query", "x"}, {"k", 0}});
    assert(zero_k["error"]["code"] == rpc::error::VALIDATION);
    assert(zero_k["error"]["data"]["kind"] == "validation");

    json wrong_dim = call(handler, "index_vector", {{"id", "v"}, {"vector", {1.0, 2.0}}});
    assert(wrong_dim["error"]["code"] == rpc::error::VALIDATION);

    json got = call(handler, "get_document", {{"id", "fox"}, {"include_vector", true}});
    assert(got["result"]["tags"][0] == "animal");
    assert(got["result"]["vector"].size() == 64);
    json absent = call(handler, "get_document", {{"id", "wolf"}});
    assert(absent["error"]["code"] == rpc::error::NOT_FOUND);
    assert(absent["error"]["data"]["kind"] == "not_found");

    json deleted = call(handler, "delete_document", {{"id", "market"}});
    assert(deleted["result"]["deleted"] == true);

    json rebuilt = call(handler, "rebuild_index");
    assert(rebuilt["result"]["generation"] == 2);
    assert(rebuilt["result"]["records"] == 1);

    json no_persist = call(handler, "checkpoint");
    assert(no_persist["error"]["code"] == rpc::error::VALIDATION);

    json stats = call(handler, "stats");
    assert(stats["result"]["records"] == 1);
    assert(stats["result"]["index"]["generation"] == 2);
    assert(stats["result"]["daemon"]["socket_path"] == "/tmp/kosha-test.sock");

    json health = call(handler, "health");
    assert(health["result"]["status"] == "online");
    assert(health["result"]["embedder"] == "hash");

    json methods = call(handler, "rpc.methods");
    assert(methods["result"]["methods"].size() == handler.method_names().size());

    json bye = call(handler, "shutdown");
    assert(bye["result"]["status"] == "ok");
    assert(shutdown_called);

    // Invalid UTF-8 in a payload still yields valid JSON
    call(handler, "index_vector", {{"id", "bin"}, {"vector", Vector(64, 0.5f)}});
    engine->index_vector("bin", Vector(64, 0.5f), std::string("\xff\xfe ok", 5));
    std::string line = handler.handle(json({{"jsonrpc", "2.0"}, {"id", 9}, {"method", "get_document"},
                                            {"params", {{"id", "bin"}}}}).dump());
    json bin = json::parse(line);
    assert(bin["result"]["payload"].get<std::string>().find("ok") != std::string::npos);

    std::cout << "  PASS" << std::endl;
}

void test_socket_round_trip() {
    std::cout << "Testing socket server/client round trip..." << std::endl;

    auto engine = open_engine(test_config(fresh_dir("socket"), 32, false));
    std::string path = "/tmp/kosha_test_" + std::to_string(getpid()) + ".sock";
    SocketServer server(path);
    assert(server.start());

    std::atomic<bool> running{true};
    rpc::Handler handler(*engine, {path, [&]() { running = false; }});
    std::thread loop([&]() {
        while (running.load() || server.pending_writes() > 0) {
            for (auto& req : server.poll(10)) {
                server.respond(req.client_id, handler.handle(req.data));
            }
        }
    });

    SocketClient client(path);
    assert(client.connect_checked());

    auto put = client.call("index_document", {{"id", "hello"}, {"content", "hello socket world"}});
    assert(put && (*put)["result"]["outcome"] == "inserted");
    auto hit = client.call("search", {{"query", "hello world"}, {"k", 1}});
    assert(hit && (*hit)["result"]["hits"][0]["id"] == "hello");

    // A client that hangs up right after its request still gets the reply
    {
        int fd = ::socket(AF_UNIX, SOCK_STREAM, 0);
        assert(fd >= 0);
        sockaddr_un addr{};
        addr.sun_family = AF_UNIX;
        std::strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);
        assert(::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0);
        std::string req = R"({"jsonrpc":"2.0","id":7,"method":"health"})" "\n";
        assert(::write(fd, req.data(), req.size()) == static_cast<ssize_t>(req.size()));
        ::shutdown(fd, SHUT_WR);

        std::string reply;
        char buf[4096];
        ssize_t n;
        while ((n = ::read(fd, buf, sizeof(buf))) > 0) reply.append(buf, static_cast<size_t>(n));
        ::close(fd);
        assert(!reply.empty() && reply.back() == '\n');
        auto parsed = json::parse(reply);
        assert(parsed["id"] == 7 && parsed.contains("result"));
    }

    assert(client.request_shutdown());
    loop.join();
    server.stop();
    assert(client.wait_for_socket_gone(1000));

    SocketClient nobody(path);
    assert(!nobody.connect());
    assert(!nobody.last_error().empty());

    std::cout << "  PASS" << std::endl;
}

int main() {
    std::cout << "=== kosha Tests ===" << std::endl;

    test_vector_store();
    test_tag_index();
    test_hashing_embedder();
    test_hnsw_self_retrieval();
    test_hnsw_tombstones_and_capacity();
    test_hnsw_serialize();
    test_quantized_recall();
    test_query_ordering();
    test_euclidean_ordering();
    test_k_and_validation();
    test_delete_and_idempotent_put();
    test_filters();
    test_consistency_gap();
    test_search_budget();
    test_duplicate_contents();
    test_budget_limits();
    test_rebuild_recall();
    test_capacity_and_compaction();
    test_concurrent_rebuild();
    test_wal_direct();
    test_wal_sync_failure();
    test_wal_recovery();
    test_checkpoint_restart();
    test_graph_shape_change();
    test_torn_wal_tail();
    test_snapshot_checks();
    test_maintenance_tick();
    test_config_loading();
    test_worker_pool();
    test_rpc_handler();
    test_socket_round_trip();

    std::cout << "\n=== All tests passed ===" << std::endl;
    return 0;
}
