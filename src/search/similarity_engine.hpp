// File: src/search/similarity_engine.hpp
#pragma once

#include "config/engine_config.hpp"
#include "index/corpus_index.hpp"
#include "search/hybrid_ranker.hpp"
#include "search/search_results.hpp"
#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <thread>
#include <vector>

namespace pitchsim {

/// SimilarityEngine - Unified interface for corpus similarity search
///
/// Owns the runtime configuration and the corpus index, and answers four
/// kinds of queries against the indexed corpus:
/// - similar events (lexical)
/// - similar sequences by alignment distance
/// - similar sequences by lexical similarity
/// - similar sequences by the fused hybrid score
///
/// The index is built on first use, by Build(), or in the background by
/// StartWarmup(). All search methods may be called concurrently. Searches
/// never throw for empty or malformed queries; they return empty lists.
class SimilarityEngine {
public:
    /// Index and configuration statistics
    struct Statistics {
        CorpusIndex::State state{CorpusIndex::State::EMPTY};
        size_t sequence_count{0};
        size_t event_count{0};
        size_t event_vocabulary_size{0};
        size_t sequence_vocabulary_size{0};
        size_t build_count{0};
        std::string last_error;
    };

    /// Constructor
    /// @param source Corpus supplier, called once per build
    /// @param config Engine configuration
    /// @throws std::invalid_argument if source is null or config is invalid
    explicit SimilarityEngine(std::shared_ptr<CorpusSource> source,
                              const EngineConfig& config = EngineConfig::Default());

    /// Destructor (waits for a running warm-up)
    ~SimilarityEngine();

    // Disable copy and move
    SimilarityEngine(const SimilarityEngine&) = delete;
    SimilarityEngine& operator=(const SimilarityEngine&) = delete;
    SimilarityEngine(SimilarityEngine&&) = delete;
    SimilarityEngine& operator=(SimilarityEngine&&) = delete;

    // ========================================================================
    // Lifecycle
    // ========================================================================

    /// Build the index now (no-op when already built)
    void Build();

    /// Build the index on a background thread
    /// @return false while a previous warm-up is still running
    bool StartWarmup();

    /// Discard the index; the next search or Build() rebuilds it
    void Reset();

    /// True once a build has completed (successfully or not)
    bool IsReady() const;

    Statistics GetStatistics() const;

    // ========================================================================
    // Search
    // ========================================================================

    /// Events lexically similar to `query`
    /// @param query Query event
    /// @param exclude Event to leave out of the results
    /// @param top_n Maximum results (configured default when unset)
    std::vector<EventSearchResult> SearchSimilarEvents(
        const Event& query,
        const std::optional<EventKey>& exclude = std::nullopt,
        std::optional<size_t> top_n = std::nullopt) const;

    /// Sequences ranked by alignment distance (ascending)
    /// @param query Query events
    /// @param exclude Sequence to leave out of the results
    /// @param top_n Maximum results (configured default when unset)
    /// @param cost Cost configuration overriding the engine's for this call
    std::vector<AlignedSequenceResult> SearchSimilarSequencesAligned(
        const std::vector<Event>& query,
        const std::optional<SequenceKey>& exclude = std::nullopt,
        std::optional<size_t> top_n = std::nullopt,
        const std::optional<EventCost::Config>& cost = std::nullopt) const;

    /// Sequences ranked by lexical similarity (descending)
    std::vector<LexicalSequenceResult> SearchSimilarSequencesLexical(
        const std::vector<Event>& query,
        const std::optional<SequenceKey>& exclude = std::nullopt,
        std::optional<size_t> top_n = std::nullopt) const;

    /// Sequences ranked by the fused alignment + lexical score (descending)
    std::vector<HybridSequenceResult> SearchSimilarSequencesHybrid(
        const std::vector<Event>& query,
        const std::optional<SequenceKey>& exclude = std::nullopt,
        std::optional<size_t> top_n = std::nullopt) const;

    /// Align two explicit sequences and report the cost of every step.
    /// Does not use the index.
    SequenceComparison CompareSequences(
        const std::vector<Event>& a,
        const std::vector<Event>& b,
        const std::optional<EventCost::Config>& cost = std::nullopt) const;

    /// Indexed sequence by key (builds the index if needed)
    std::optional<Sequence> GetSequence(const SequenceKey& key) const;

    // ========================================================================
    // Configuration
    // ========================================================================

    /// Copy of the current configuration
    EngineConfig GetConfig() const;

    /// Replace the configuration
    /// @return false (and keep the old one) if `config` is invalid
    bool SetConfig(const EngineConfig& config);

    /// Set a cost weight by component name
    /// @return false if the name is unknown or the value negative
    bool SetWeight(const std::string& name, float value);

    /// Toggle an optional sub-cost by name
    /// @return false if the name is unknown
    bool SetOptionalFeature(const std::string& name, bool enabled);

    /// Near-ball radius used by the next build
    /// @return false if negative
    bool SetNearBallRadius(float radius);

    /// @return false if zero
    bool SetDefaultTopN(size_t top_n);

    /// Cost configuration derived from `config`
    static EventCost::Config ToCostConfig(const EngineConfig& config);

    /// Map an alignment distance to [0, 1]:
    ///   max(0, 1 - (distance / path_length) / max_distance)
    /// An infinite distance or zero path length maps to 0.
    static float AlignmentSimilarity(float distance, size_t path_length, float max_distance);

private:
    std::unique_ptr<CorpusIndex> index_;

    mutable std::shared_mutex config_mutex_;
    EngineConfig config_;

    std::mutex warmup_mutex_;
    std::thread warmup_thread_;
    std::atomic<bool> warmup_running_{false};

    BuildOptions MakeBuildOptions(const EngineConfig& config) const;

    /// Snapshot built with the current configuration
    std::shared_ptr<const CorpusSnapshot> AcquireSnapshot(const EngineConfig& config) const;

    std::vector<AlignedSequenceResult> AlignedSearch(
        const CorpusSnapshot& snapshot,
        const EngineConfig& config,
        const EventCost::Config& cost,
        const std::vector<Event>& query,
        const std::optional<SequenceKey>& exclude,
        size_t top_n) const;

    std::vector<LexicalSequenceResult> LexicalSearch(
        const CorpusSnapshot& snapshot,
        const std::vector<Event>& query,
        const std::optional<SequenceKey>& exclude,
        size_t top_n) const;

    static SequenceSummary Summarize(const IndexedSequence& entry);
};

} // namespace pitchsim
