#pragma once
// Embedding adapter: text → fixed-length vector
//
// The core treats embedding as opaque and never retries. Implementations
// report an unusable model as DependencyFailure.

#include "error.hpp"
#include "types.hpp"
#include <cctype>
#include <string>
#include <vector>

namespace kosha {

class Embedder {
public:
    virtual ~Embedder() = default;

    virtual Result<Vector> embed(const std::string& text) = 0;

    virtual size_t dimension() const = 0;
    virtual std::string name() const = 0;
    virtual bool ready() const { return true; }
};

// Signed feature hashing of lower-cased word unigrams and bigrams.
// Deterministic and model-free: texts sharing words land near each other.
class HashingEmbedder : public Embedder {
public:
    explicit HashingEmbedder(size_t dimension) : dim_(dimension) {}

    Result<Vector> embed(const std::string& text) override {
        if (dim_ == 0) {
            return Result<Vector>::fail(ErrorKind::DependencyFailure, "hashing embedder has dimension 0");
        }

        Vector v(dim_, 0.0f);
        std::vector<std::string> words = split_words(text);
        for (size_t i = 0; i < words.size(); ++i) {
            add_feature(v, words[i], 1.0f);
            if (i + 1 < words.size()) {
                add_feature(v, words[i] + ' ' + words[i + 1], 0.5f);
            }
        }
        normalize(v);
        return Result<Vector>::ok(std::move(v));
    }

    size_t dimension() const override { return dim_; }
    std::string name() const override { return "hash"; }

    // ASCII alphanumerics and '_' form words; other bytes separate them.
    // Bytes >= 0x80 are kept so UTF-8 words survive intact.
    static std::vector<std::string> split_words(const std::string& text) {
        std::vector<std::string> words;
        std::string current;
        for (unsigned char c : text) {
            if (std::isalnum(c) || c == '_' || c >= 0x80) {
                current += static_cast<char>(std::tolower(c));
            } else if (!current.empty()) {
                words.push_back(std::move(current));
                current.clear();
            }
        }
        if (!current.empty()) words.push_back(std::move(current));
        return words;
    }

private:
    void add_feature(Vector& v, const std::string& feature, float weight) const {
        uint64_t h = fnv1a(feature.data(), feature.size());
        size_t bucket = static_cast<size_t>(h % dim_);
        float sign = (h >> 63) ? -1.0f : 1.0f;
        v[bucket] += sign * weight;
    }

    size_t dim_;
};

} // namespace kosha
