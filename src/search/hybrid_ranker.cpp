// File: src/search/hybrid_ranker.cpp
#include "search/hybrid_ranker.hpp"
#include <algorithm>
#include <map>
#include <stdexcept>

namespace pitchsim {

HybridRanker::HybridRanker()
    : HybridRanker(Config()) {}

HybridRanker::HybridRanker(const Config& config)
    : config_(config) {
    if (config_.alignment_weight < 0.0f || config_.lexical_weight < 0.0f) {
        throw std::invalid_argument("Hybrid weights must be non-negative");
    }
    if (config_.alignment_weight + config_.lexical_weight > 1.0f + kWeightSumTolerance) {
        throw std::invalid_argument("Hybrid weights must sum to at most 1");
    }
    if (config_.candidate_count == 0) {
        throw std::invalid_argument("Hybrid candidate count must be > 0");
    }
}

std::vector<HybridSequenceResult> HybridRanker::Fuse(
    const std::vector<AlignedSequenceResult>& aligned,
    const std::vector<LexicalSequenceResult>& lexical,
    size_t top_n) const {

    // Ordered by key so ties keep a stable order
    std::map<SequenceKey, HybridSequenceResult> merged;

    for (const auto& result : aligned) {
        auto& entry = merged[result.sequence.key];
        entry.sequence = result.sequence;
        entry.alignment_similarity = result.similarity;
        entry.path = result.path;
    }

    for (const auto& result : lexical) {
        auto it = merged.find(result.sequence.key);
        if (it == merged.end()) {
            it = merged.emplace(result.sequence.key, HybridSequenceResult{}).first;
            it->second.sequence = result.sequence;
        }
        it->second.lexical_similarity = result.similarity;
    }

    std::vector<HybridSequenceResult> ranked;
    ranked.reserve(merged.size());
    for (auto& [key, entry] : merged) {
        entry.similarity = std::min(1.0f, Combine(entry.alignment_similarity,
                                                  entry.lexical_similarity));
        ranked.push_back(std::move(entry));
    }

    std::stable_sort(ranked.begin(), ranked.end(),
                     [](const HybridSequenceResult& a, const HybridSequenceResult& b) {
                         return a.similarity > b.similarity;
                     });

    if (ranked.size() > top_n) {
        ranked.erase(ranked.begin() + top_n, ranked.end());
    }
    return ranked;
}

} // namespace pitchsim
