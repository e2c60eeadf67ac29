// File: src/index/corpus_source.hpp
#pragma once

#include "core/types.hpp"
#include <mutex>
#include <vector>

namespace pitchsim {

/// Supplier of normalized corpus sequences.
///
/// The index calls LoadSequences() once per build. Implementations may
/// throw; the index records the failure and serves an empty corpus.
class CorpusSource {
public:
    virtual ~CorpusSource() = default;

    /// Load every corpus sequence
    virtual std::vector<Sequence> LoadSequences() = 0;
};

/// Corpus held in memory, for tests and embedders
class InMemoryCorpusSource : public CorpusSource {
public:
    InMemoryCorpusSource() = default;
    explicit InMemoryCorpusSource(std::vector<Sequence> sequences)
        : sequences_(std::move(sequences)) {}

    void Add(Sequence sequence) {
        std::lock_guard<std::mutex> lock(mutex_);
        sequences_.push_back(std::move(sequence));
    }

    std::vector<Sequence> LoadSequences() override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++load_count_;
        return sequences_;
    }

    /// Number of LoadSequences() calls so far
    size_t GetLoadCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return load_count_;
    }

private:
    mutable std::mutex mutex_;
    std::vector<Sequence> sequences_;
    size_t load_count_{0};
};

} // namespace pitchsim
