// File: src/search/search_results.hpp
#pragma once

#include "alignment/sequence_aligner.hpp"
#include "core/types.hpp"
#include <optional>
#include <string>
#include <vector>

namespace pitchsim {

/// Identity and metadata of a matched corpus sequence
struct SequenceSummary {
    SequenceKey key;
    std::string set_piece;
    std::string time;
    std::string team_id;
    size_t event_count{0};

    /// Lightweight copies (player lists reduced to key players)
    std::vector<Event> events;
};

/// Event-level lexical match
struct EventSearchResult {
    EventKey key;
    Event event;          // lightweight copy
    float similarity{0.0f};
};

/// Sequence ranked by alignment distance
struct AlignedSequenceResult {
    SequenceSummary sequence;
    float distance{0.0f};
    float similarity{0.0f};
    AlignmentPath path;
};

/// Sequence ranked by lexical similarity
struct LexicalSequenceResult {
    SequenceSummary sequence;
    float similarity{0.0f};
};

/// Sequence ranked by the fused score
struct HybridSequenceResult {
    SequenceSummary sequence;
    float similarity{0.0f};           // fused score
    float alignment_similarity{0.0f}; // 0 when absent from the aligned ranking
    float lexical_similarity{0.0f};   // 0 when absent from the lexical ranking

    /// Set only when the candidate came from the aligned ranking
    std::optional<AlignmentPath> path;
};

/// Cost of one aligned pair
struct StepDistance {
    size_t i;
    size_t j;
    float cost;
};

/// Direct comparison of two sequences
struct SequenceComparison {
    float distance{0.0f};
    float similarity{0.0f};
    AlignmentPath path;
    std::vector<StepDistance> step_distances;
    size_t length_a{0};
    size_t length_b{0};
};

} // namespace pitchsim
