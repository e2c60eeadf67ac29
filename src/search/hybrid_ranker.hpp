// File: src/search/hybrid_ranker.hpp
#pragma once

#include "search/search_results.hpp"
#include <vector>

namespace pitchsim {

/// Fuses an aligned and a lexical ranking of the same corpus.
///
/// Candidates are merged by sequence key and scored
///   alignment_weight * alignment_similarity + lexical_weight * lexical_similarity
/// where a candidate missing from one ranking scores 0 on that side. The
/// weights sum to at most 1, so the fused score stays in [0, 1].
/// Agreement between the two rankings is rewarded over presence in either.
class HybridRanker {
public:
    struct Config {
        float alignment_weight{0.6f};
        float lexical_weight{0.4f};

        /// Results requested from each underlying search
        size_t candidate_count{50};
    };

    HybridRanker();

    /// @throws std::invalid_argument on a negative weight, weights summing
    ///         above 1 or a zero candidate count
    explicit HybridRanker(const Config& config);

    /// Merge two rankings
    /// @param aligned Results of the aligned search
    /// @param lexical Results of the lexical search
    /// @param top_n Maximum results
    /// @return Results sorted by fused score (descending), ties by key
    std::vector<HybridSequenceResult> Fuse(const std::vector<AlignedSequenceResult>& aligned,
                                           const std::vector<LexicalSequenceResult>& lexical,
                                           size_t top_n) const;

    /// Fused score of one candidate
    float Combine(float alignment_similarity, float lexical_similarity) const {
        return config_.alignment_weight * alignment_similarity +
               config_.lexical_weight * lexical_similarity;
    }

    const Config& GetConfig() const { return config_; }

    /// Slack allowed on the weight sum for float rounding (0.6f + 0.4f)
    static constexpr float kWeightSumTolerance = 1e-5f;

private:
    Config config_;
};

} // namespace pitchsim
