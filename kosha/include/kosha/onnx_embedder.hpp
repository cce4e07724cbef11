#pragma once
// ONNX Runtime sentence embedder (built with KOSHA_WITH_ONNX)
//
// Loads <model_dir>/model.onnx and <model_dir>/vocab.txt once at startup.
// Pipeline: WordPiece tokenization → transformer → attention-masked mean
// pooling → L2 normalization, matching sentence-transformers models such
// as all-MiniLM-L6-v2.

#include "embedder.hpp"
#include "log.hpp"
#include <onnxruntime/core/session/onnxruntime_cxx_api.h>
#include <array>
#include <cctype>
#include <fstream>
#include <memory>
#include <iostream>
#include <string>
#include <unordered_map>
#include <vector>

namespace kosha {

class WordPieceTokenizer {
public:
    struct Encoding {
        std::vector<int64_t> input_ids;
        std::vector<int64_t> attention_mask;
        std::vector<int64_t> token_type_ids;
    };

    bool load(const std::string& vocab_path) {
        std::ifstream file(vocab_path);
        if (!file) return false;

        vocab_.clear();
        std::string line;
        int64_t id = 0;
        while (std::getline(file, line)) {
            while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) line.pop_back();
            // Empty lines still consume an id so later ids stay aligned
            if (!line.empty()) vocab_.emplace(line, id);
            id++;
        }

        cls_id_ = lookup("[CLS]");
        sep_id_ = lookup("[SEP]");
        unk_id_ = lookup("[UNK]");
        return unk_id_ >= 0;
    }

    // Unpadded: [CLS] pieces... [SEP], at most max_length tokens
    Encoding encode(const std::string& text, size_t max_length) const {
        Encoding enc;
        size_t budget = max_length > 2 ? max_length - 2 : 0;

        if (cls_id_ >= 0) enc.input_ids.push_back(cls_id_);
        for (const auto& word : split(text)) {
            for (int64_t piece : wordpiece(word)) {
                if (budget == 0) break;
                enc.input_ids.push_back(piece);
                budget--;
            }
            if (budget == 0) break;
        }
        if (sep_id_ >= 0) enc.input_ids.push_back(sep_id_);

        enc.attention_mask.assign(enc.input_ids.size(), 1);
        enc.token_type_ids.assign(enc.input_ids.size(), 0);
        return enc;
    }

    size_t vocab_size() const { return vocab_.size(); }

private:
    int64_t lookup(const std::string& token) const {
        auto it = vocab_.find(token);
        return it != vocab_.end() ? it->second : -1;
    }

    // Whitespace separates; ASCII punctuation and each multi-byte UTF-8
    // character stand alone; ASCII letters are lower-cased
    static std::vector<std::string> split(const std::string& text) {
        std::vector<std::string> words;
        std::string current;
        auto flush = [&] {
            if (!current.empty()) {
                words.push_back(std::move(current));
                current.clear();
            }
        };

        for (size_t i = 0; i < text.size();) {
            unsigned char c = text[i];
            if (c < 0x80) {
                if (std::isspace(c) || std::iscntrl(c)) {
                    flush();
                } else if (std::ispunct(c)) {
                    flush();
                    words.emplace_back(1, static_cast<char>(c));
                } else {
                    current += static_cast<char>(std::tolower(c));
                }
                i++;
                continue;
            }
            size_t len = (c & 0xE0) == 0xC0 ? 2 : (c & 0xF0) == 0xE0 ? 3 : (c & 0xF8) == 0xF0 ? 4 : 1;
            flush();
            words.push_back(text.substr(i, len));
            i += len;
        }
        flush();
        return words;
    }

    // Greedy longest-match-first; continuation pieces carry "##"
    std::vector<int64_t> wordpiece(const std::string& word) const {
        int64_t whole = lookup(word);
        if (whole >= 0) return {whole};

        std::vector<int64_t> pieces;
        size_t start = 0;
        while (start < word.size()) {
            size_t end = word.size();
            int64_t found = -1;
            for (; end > start; --end) {
                std::string sub = word.substr(start, end - start);
                if (start > 0) sub = "##" + sub;
                found = lookup(sub);
                if (found >= 0) break;
            }
            if (found < 0) {
                // An unmatched word maps to a single [UNK]
                return {unk_id_};
            }
            pieces.push_back(found);
            start = end;
        }
        return pieces;
    }

    std::unordered_map<std::string, int64_t> vocab_;
    int64_t cls_id_ = -1;
    int64_t sep_id_ = -1;
    int64_t unk_id_ = -1;
};

class OnnxEmbedder : public Embedder {
public:
    struct Config {
        size_t max_seq_length = 256;
        int num_threads = 0;  // 0 = runtime default
        bool normalize = true;
    };

    // Returns nullptr and sets error when the model cache is unusable
    static std::unique_ptr<OnnxEmbedder> load(const std::string& model_dir, Config config,
                                              std::string& error) {
        std::unique_ptr<OnnxEmbedder> e(new OnnxEmbedder(config));
        std::string model_path = model_dir + "/model.onnx";
        std::string vocab_path = model_dir + "/vocab.txt";

        if (!e->tokenizer_.load(vocab_path)) {
            error = "cannot load vocabulary " + vocab_path;
            return nullptr;
        }

        try {
            Ort::SessionOptions opts;
            if (config.num_threads > 0) opts.SetIntraOpNumThreads(config.num_threads);
            opts.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_ALL);
            e->session_ = std::make_unique<Ort::Session>(e->env_, model_path.c_str(), opts);
            e->introspect();

            // Dynamic output shapes hide the hidden size until a first run
            auto sample = e->run("dimension check");
            if (!sample) {
                error = sample.error().message;
                return nullptr;
            }
            e->dim_ = sample.value().size();
        } catch (const Ort::Exception& ex) {
            error = std::string("ONNX error: ") + ex.what();
            return nullptr;
        }

        std::cerr << "[embed] Loaded " << model_path << " (dim " << e->dim_
                  << ", vocab " << e->tokenizer_.vocab_size() << ")\n";
        return e;
    }

    Result<Vector> embed(const std::string& text) override {
        try {
            return run(text);
        } catch (const Ort::Exception& ex) {
            return Result<Vector>::fail(ErrorKind::DependencyFailure,
                                        std::string("inference failed: ") + ex.what());
        }
    }

    size_t dimension() const override { return dim_; }
    std::string name() const override { return "onnx"; }
    bool ready() const override { return session_ != nullptr; }

private:
    explicit OnnxEmbedder(Config config)
        : env_(ORT_LOGGING_LEVEL_WARNING, "kosha"), config_(config) {}

    void introspect() {
        Ort::AllocatorWithDefaultOptions allocator;
        for (size_t i = 0; i < session_->GetInputCount(); ++i) {
            input_names_.push_back(session_->GetInputNameAllocated(i, allocator).get());
        }
        for (size_t i = 0; i < session_->GetOutputCount(); ++i) {
            output_names_.push_back(session_->GetOutputNameAllocated(i, allocator).get());
        }
        for (const auto& n : input_names_) input_cstr_.push_back(n.c_str());
        // Only the first output (token embeddings or pooled) is read
        if (!output_names_.empty()) output_cstr_.push_back(output_names_[0].c_str());
    }

    Result<Vector> run(const std::string& text) {
        if (!session_) {
            return Result<Vector>::fail(ErrorKind::DependencyFailure, "model not loaded");
        }

        auto enc = tokenizer_.encode(text, config_.max_seq_length);
        int64_t seq_len = static_cast<int64_t>(enc.input_ids.size());
        std::array<int64_t, 2> shape = {1, seq_len};
        auto memory_info = Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeDefault);

        std::vector<Ort::Value> inputs;
        for (const auto& name : input_names_) {
            std::vector<int64_t>* src = nullptr;
            if (name == "input_ids") src = &enc.input_ids;
            else if (name == "attention_mask") src = &enc.attention_mask;
            else if (name == "token_type_ids") src = &enc.token_type_ids;
            if (!src) {
                return Result<Vector>::fail(ErrorKind::DependencyFailure,
                                            "model expects unsupported input '" + name + "'");
            }
            inputs.push_back(Ort::Value::CreateTensor<int64_t>(
                memory_info, src->data(), src->size(), shape.data(), shape.size()));
        }

        auto outputs = session_->Run(Ort::RunOptions{nullptr},
                                     input_cstr_.data(), inputs.data(), inputs.size(),
                                     output_cstr_.data(), output_cstr_.size());
        if (outputs.empty()) {
            return Result<Vector>::fail(ErrorKind::DependencyFailure, "model produced no output");
        }

        auto out_shape = outputs[0].GetTensorTypeAndShapeInfo().GetShape();
        const float* data = outputs[0].GetTensorData<float>();
        Vector v;

        if (out_shape.size() == 2) {
            // Already pooled: [1, hidden]
            v.assign(data, data + out_shape[1]);
        } else if (out_shape.size() == 3) {
            // Token embeddings: [1, seq, hidden], mean over attended tokens
            int64_t hidden = out_shape[2];
            v.assign(static_cast<size_t>(hidden), 0.0f);
            float count = 0.0f;
            for (int64_t t = 0; t < out_shape[1]; ++t) {
                if (enc.attention_mask[static_cast<size_t>(t)] == 0) continue;
                count += 1.0f;
                for (int64_t d = 0; d < hidden; ++d) v[d] += data[t * hidden + d];
            }
            if (count > 0.0f) {
                for (float& x : v) x /= count;
            }
        } else {
            return Result<Vector>::fail(ErrorKind::DependencyFailure, "unexpected output rank");
        }

        if (config_.normalize) normalize(v);
        if (dim_ != 0 && v.size() != dim_) {
            return Result<Vector>::fail(ErrorKind::DependencyFailure,
                "model returned dim " + std::to_string(v.size()) + ", expected " + std::to_string(dim_));
        }
        return Result<Vector>::ok(std::move(v));
    }

    Ort::Env env_;
    std::unique_ptr<Ort::Session> session_;
    WordPieceTokenizer tokenizer_;
    Config config_;
    size_t dim_ = 0;

    // ONNX needs stable C-strings
    std::vector<std::string> input_names_;
    std::vector<std::string> output_names_;
    std::vector<const char*> input_cstr_;
    std::vector<const char*> output_cstr_;
};

} // namespace kosha
