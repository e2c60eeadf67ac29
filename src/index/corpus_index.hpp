// File: src/index/corpus_index.hpp
#pragma once

#include "index/corpus_source.hpp"
#include "features/feature_extractor.hpp"
#include "lexical/lexical_index.hpp"
#include "text/text_encoder.hpp"
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace pitchsim {

/// One corpus sequence with everything a search needs precomputed
struct IndexedSequence {
    Sequence sequence;
    std::vector<FeatureRecord> features;   // one per event
    std::string text;                      // sequence token string
};

/// Position of one corpus event inside the snapshot
struct IndexedEventRef {
    size_t sequence_slot;   // index into CorpusSnapshot::sequences
    size_t event_index;
};

/// Settings captured when the index is built
struct BuildOptions {
    float near_ball_radius{FeatureExtractor::kDefaultNearBallRadius};
    LexicalIndex::Config lexical;
    bool verbose{false};
};

/// Immutable result of one build. Shared read-only between searches.
struct CorpusSnapshot {
    std::vector<IndexedSequence> sequences;
    std::unordered_map<SequenceKey, size_t, SequenceKey::Hash> slots;

    /// Event documents, in the order they were fitted into event_lexicon
    std::vector<IndexedEventRef> events;

    LexicalIndex event_lexicon;
    LexicalIndex sequence_lexicon;

    /// Extractor and encoder configured as they were at build time
    FeatureExtractor extractor;
    TextEncoder encoder;

    explicit CorpusSnapshot(const BuildOptions& options)
        : event_lexicon(options.lexical),
          sequence_lexicon(options.lexical),
          extractor(options.near_ball_radius),
          encoder(options.near_ball_radius) {}

    /// Indexed sequence by key, or nullptr
    const IndexedSequence* Find(const SequenceKey& key) const;

    /// Event behind an event document
    const Event& EventAt(const IndexedEventRef& ref) const {
        return sequences[ref.sequence_slot].sequence.events[ref.event_index];
    }

    size_t SequenceCount() const { return sequences.size(); }
    size_t EventCount() const { return events.size(); }
};

/// Build-once cache of the corpus.
///
/// The first EnsureBuilt() call loads the corpus and builds a snapshot;
/// concurrent callers block until that single build completes and all
/// observe the same snapshot. A failed build is logged and leaves the index
/// READY with an empty snapshot, so later searches return nothing instead
/// of retrying. Reset() discards the snapshot; the next EnsureBuilt()
/// rebuilds.
///
/// Thread-safe.
class CorpusIndex {
public:
    enum class State {
        EMPTY,
        BUILDING,
        READY,
    };

    /// @throws std::invalid_argument if source is null
    explicit CorpusIndex(std::shared_ptr<CorpusSource> source);

    CorpusIndex(const CorpusIndex&) = delete;
    CorpusIndex& operator=(const CorpusIndex&) = delete;

    /// Build if not built yet, otherwise return the current snapshot.
    /// Never returns nullptr.
    std::shared_ptr<const CorpusSnapshot> EnsureBuilt(const BuildOptions& options);

    /// Current snapshot, or nullptr if not READY
    std::shared_ptr<const CorpusSnapshot> Snapshot() const;

    /// Drop the snapshot. Waits for an in-flight build to finish first.
    void Reset();

    State GetState() const;
    bool IsReady() const { return GetState() == State::READY; }

    /// Error message of the last failed build ("" after a successful one)
    std::string GetLastError() const;

    /// Number of builds executed since construction
    size_t GetBuildCount() const;

private:
    std::shared_ptr<CorpusSource> source_;

    mutable std::mutex mutex_;
    std::condition_variable state_changed_;
    State state_{State::EMPTY};
    std::shared_ptr<const CorpusSnapshot> snapshot_;
    std::string last_error_;
    size_t build_count_{0};

    /// Load and index the corpus (may throw)
    std::shared_ptr<const CorpusSnapshot> BuildSnapshot(const BuildOptions& options);
};

const char* ToString(CorpusIndex::State state);

} // namespace pitchsim
