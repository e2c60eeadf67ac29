// File: src/search/similarity_engine.cpp
#include "search/similarity_engine.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <stdexcept>

namespace pitchsim {

SimilarityEngine::SimilarityEngine(std::shared_ptr<CorpusSource> source,
                                   const EngineConfig& config)
    : config_(config) {
    if (!source) {
        throw std::invalid_argument("CorpusSource cannot be null");
    }
    if (!config_.Validate()) {
        std::string message = "Invalid engine configuration";
        for (const auto& error : config_.GetValidationErrors()) {
            message += "; " + error;
        }
        throw std::invalid_argument(message);
    }
    index_ = std::make_unique<CorpusIndex>(std::move(source));
}

SimilarityEngine::~SimilarityEngine() {
    std::lock_guard<std::mutex> lock(warmup_mutex_);
    if (warmup_thread_.joinable()) {
        warmup_thread_.join();
    }
}

// ============================================================================
// Lifecycle
// ============================================================================

void SimilarityEngine::Build() {
    EngineConfig config = GetConfig();
    auto snapshot = AcquireSnapshot(config);
    if (config.logging.verbose) {
        std::cerr << "[Engine] Index ready: " << snapshot->SequenceCount()
                  << " sequences, " << snapshot->EventCount() << " events" << std::endl;
    }
}

bool SimilarityEngine::StartWarmup() {
    std::lock_guard<std::mutex> lock(warmup_mutex_);
    if (warmup_running_) {
        return false;
    }
    // Reap a finished warm-up so a reset index can be warmed again
    if (warmup_thread_.joinable()) {
        warmup_thread_.join();
    }
    warmup_running_ = true;
    warmup_thread_ = std::thread([this] {
        Build();
        warmup_running_ = false;
    });
    return true;
}

void SimilarityEngine::Reset() {
    index_->Reset();
    if (GetConfig().logging.verbose) {
        std::cerr << "[Engine] Index reset" << std::endl;
    }
}

bool SimilarityEngine::IsReady() const {
    return index_->IsReady();
}

SimilarityEngine::Statistics SimilarityEngine::GetStatistics() const {
    Statistics stats;
    stats.state = index_->GetState();
    stats.build_count = index_->GetBuildCount();
    stats.last_error = index_->GetLastError();

    auto snapshot = index_->Snapshot();
    if (snapshot) {
        stats.sequence_count = snapshot->SequenceCount();
        stats.event_count = snapshot->EventCount();
        stats.event_vocabulary_size = snapshot->event_lexicon.VocabularySize();
        stats.sequence_vocabulary_size = snapshot->sequence_lexicon.VocabularySize();
    }
    return stats;
}

// ============================================================================
// Search
// ============================================================================

std::vector<EventSearchResult> SimilarityEngine::SearchSimilarEvents(
    const Event& query,
    const std::optional<EventKey>& exclude,
    std::optional<size_t> top_n) const {

    EngineConfig config = GetConfig();
    auto snapshot = AcquireSnapshot(config);
    size_t limit = top_n.value_or(config.search.default_top_n);

    std::string text = snapshot->encoder.EncodeEvent(query);

    auto filter = [&snapshot, &exclude](size_t document) {
        if (!exclude) {
            return true;
        }
        const IndexedEventRef& ref = snapshot->events[document];
        const SequenceKey& key = snapshot->sequences[ref.sequence_slot].sequence.key;
        return !(key == exclude->sequence && ref.event_index == exclude->event_index);
    };

    std::vector<EventSearchResult> results;
    for (const auto& match : snapshot->event_lexicon.Search(text, limit, filter)) {
        const IndexedEventRef& ref = snapshot->events[match.document];
        EventSearchResult result;
        result.key = EventKey(snapshot->sequences[ref.sequence_slot].sequence.key, ref.event_index);
        result.event = LightweightEvent(snapshot->EventAt(ref));
        result.similarity = match.similarity;
        results.push_back(std::move(result));
    }
    return results;
}

std::vector<AlignedSequenceResult> SimilarityEngine::SearchSimilarSequencesAligned(
    const std::vector<Event>& query,
    const std::optional<SequenceKey>& exclude,
    std::optional<size_t> top_n,
    const std::optional<EventCost::Config>& cost) const {

    EngineConfig config = GetConfig();
    auto snapshot = AcquireSnapshot(config);
    return AlignedSearch(*snapshot, config, cost.value_or(ToCostConfig(config)),
                         query, exclude, top_n.value_or(config.search.default_top_n));
}

std::vector<LexicalSequenceResult> SimilarityEngine::SearchSimilarSequencesLexical(
    const std::vector<Event>& query,
    const std::optional<SequenceKey>& exclude,
    std::optional<size_t> top_n) const {

    EngineConfig config = GetConfig();
    auto snapshot = AcquireSnapshot(config);
    return LexicalSearch(*snapshot, query, exclude,
                         top_n.value_or(config.search.default_top_n));
}

std::vector<HybridSequenceResult> SimilarityEngine::SearchSimilarSequencesHybrid(
    const std::vector<Event>& query,
    const std::optional<SequenceKey>& exclude,
    std::optional<size_t> top_n) const {

    EngineConfig config = GetConfig();
    auto snapshot = AcquireSnapshot(config);

    HybridRanker::Config ranker_config;
    ranker_config.alignment_weight = config.hybrid.alignment_weight;
    ranker_config.lexical_weight = config.hybrid.lexical_weight;
    ranker_config.candidate_count = config.hybrid.candidate_count;
    HybridRanker ranker(ranker_config);

    auto aligned = AlignedSearch(*snapshot, config, ToCostConfig(config),
                                 query, exclude, ranker_config.candidate_count);
    auto lexical = LexicalSearch(*snapshot, query, exclude, ranker_config.candidate_count);

    return ranker.Fuse(aligned, lexical, top_n.value_or(config.search.default_top_n));
}

SequenceComparison SimilarityEngine::CompareSequences(
    const std::vector<Event>& a,
    const std::vector<Event>& b,
    const std::optional<EventCost::Config>& cost) const {

    EngineConfig config = GetConfig();
    FeatureExtractor extractor(config.search.near_ball_radius);
    EventCost event_cost(cost.value_or(ToCostConfig(config)));
    SequenceAligner aligner(config.alignment.radius);

    auto features_a = extractor.ExtractSequence(a);
    auto features_b = extractor.ExtractSequence(b);
    Alignment alignment = aligner.Align(features_a, features_b, event_cost);

    SequenceComparison comparison;
    comparison.distance = alignment.distance;
    comparison.similarity = AlignmentSimilarity(alignment.distance,
                                                std::max(a.size(), b.size()),
                                                config.search.max_distance);
    comparison.length_a = a.size();
    comparison.length_b = b.size();
    comparison.step_distances.reserve(alignment.path.size());
    for (const auto& [i, j] : alignment.path) {
        comparison.step_distances.push_back(
            StepDistance{i, j, event_cost.Compute(features_a[i], features_b[j])});
    }
    comparison.path = std::move(alignment.path);
    return comparison;
}

std::optional<Sequence> SimilarityEngine::GetSequence(const SequenceKey& key) const {
    auto snapshot = AcquireSnapshot(GetConfig());
    const IndexedSequence* entry = snapshot->Find(key);
    if (entry == nullptr) {
        return std::nullopt;
    }
    return entry->sequence;
}

// ============================================================================
// Configuration
// ============================================================================

EngineConfig SimilarityEngine::GetConfig() const {
    std::shared_lock<std::shared_mutex> lock(config_mutex_);
    return config_;
}

bool SimilarityEngine::SetConfig(const EngineConfig& config) {
    if (!config.Validate()) {
        return false;
    }
    std::unique_lock<std::shared_mutex> lock(config_mutex_);
    config_ = config;
    return true;
}

bool SimilarityEngine::SetWeight(const std::string& name, float value) {
    if (value < 0.0f) {
        return false;
    }
    std::unique_lock<std::shared_mutex> lock(config_mutex_);
    return config_.SetWeight(name, value);
}

bool SimilarityEngine::SetOptionalFeature(const std::string& name, bool enabled) {
    std::unique_lock<std::shared_mutex> lock(config_mutex_);
    return config_.SetFeature(name, enabled);
}

bool SimilarityEngine::SetNearBallRadius(float radius) {
    if (radius < 0.0f) {
        return false;
    }
    std::unique_lock<std::shared_mutex> lock(config_mutex_);
    config_.search.near_ball_radius = radius;
    return true;
}

bool SimilarityEngine::SetDefaultTopN(size_t top_n) {
    if (top_n == 0) {
        return false;
    }
    std::unique_lock<std::shared_mutex> lock(config_mutex_);
    config_.search.default_top_n = top_n;
    return true;
}

EventCost::Config SimilarityEngine::ToCostConfig(const EngineConfig& config) {
    EventCost::Config cost;
    cost.weights.ball_position = config.cost.ball_position;
    cost.weights.event_type = config.cost.event_type;
    cost.weights.player_formation = config.cost.player_formation;
    cost.weights.pass_type = config.cost.pass_type;
    cost.weights.shot_type = config.cost.shot_type;
    cost.weights.pressure_type = config.cost.pressure_type;
    cost.features.pass_type = config.features.pass_type;
    cost.features.shot_type = config.features.shot_type;
    cost.features.pressure_type = config.features.pressure_type;
    return cost;
}

float SimilarityEngine::AlignmentSimilarity(float distance, size_t path_length,
                                            float max_distance) {
    if (!std::isfinite(distance) || path_length == 0 || max_distance <= 0.0f) {
        return 0.0f;
    }
    float per_step = distance / static_cast<float>(path_length);
    return std::clamp(1.0f - per_step / max_distance, 0.0f, 1.0f);
}

// ============================================================================
// Helpers
// ============================================================================

BuildOptions SimilarityEngine::MakeBuildOptions(const EngineConfig& config) const {
    BuildOptions options;
    options.near_ball_radius = config.search.near_ball_radius;
    options.lexical.min_document_count = config.lexical.min_document_count;
    options.lexical.max_document_ratio = config.lexical.max_document_ratio;
    options.lexical.min_similarity = config.search.min_lexical_similarity;
    options.verbose = config.logging.verbose;
    return options;
}

std::shared_ptr<const CorpusSnapshot> SimilarityEngine::AcquireSnapshot(
    const EngineConfig& config) const {
    return index_->EnsureBuilt(MakeBuildOptions(config));
}

std::vector<AlignedSequenceResult> SimilarityEngine::AlignedSearch(
    const CorpusSnapshot& snapshot,
    const EngineConfig& config,
    const EventCost::Config& cost,
    const std::vector<Event>& query,
    const std::optional<SequenceKey>& exclude,
    size_t top_n) const {

    std::vector<AlignedSequenceResult> results;
    if (query.empty() || top_n == 0) {
        return results;
    }

    auto query_features = snapshot.extractor.ExtractSequence(query);
    EventCost event_cost(cost);
    SequenceAligner aligner(config.alignment.radius);

    struct Candidate {
        size_t slot;
        Alignment alignment;
    };
    std::vector<Candidate> candidates;
    candidates.reserve(snapshot.sequences.size());

    for (size_t slot = 0; slot < snapshot.sequences.size(); ++slot) {
        const IndexedSequence& entry = snapshot.sequences[slot];
        if (exclude && entry.sequence.key == *exclude) {
            continue;
        }
        Alignment alignment = aligner.Align(query_features, entry.features, event_cost);
        if (!std::isfinite(alignment.distance)) {
            continue;
        }
        candidates.push_back(Candidate{slot, std::move(alignment)});
    }

    std::stable_sort(candidates.begin(), candidates.end(),
                     [](const Candidate& a, const Candidate& b) {
                         return a.alignment.distance < b.alignment.distance;
                     });
    if (candidates.size() > top_n) {
        candidates.erase(candidates.begin() + top_n, candidates.end());
    }

    results.reserve(candidates.size());
    for (auto& candidate : candidates) {
        const IndexedSequence& entry = snapshot.sequences[candidate.slot];
        AlignedSequenceResult result;
        result.sequence = Summarize(entry);
        result.distance = candidate.alignment.distance;
        result.similarity = AlignmentSimilarity(
            candidate.alignment.distance,
            std::max(query.size(), entry.sequence.events.size()),
            config.search.max_distance);
        result.path = std::move(candidate.alignment.path);
        results.push_back(std::move(result));
    }
    return results;
}

std::vector<LexicalSequenceResult> SimilarityEngine::LexicalSearch(
    const CorpusSnapshot& snapshot,
    const std::vector<Event>& query,
    const std::optional<SequenceKey>& exclude,
    size_t top_n) const {

    std::vector<LexicalSequenceResult> results;
    if (query.empty()) {
        return results;
    }

    std::string text = snapshot.encoder.EncodeSequence(query);
    auto filter = [&snapshot, &exclude](size_t slot) {
        return !exclude || snapshot.sequences[slot].sequence.key != *exclude;
    };

    for (const auto& match : snapshot.sequence_lexicon.Search(text, top_n, filter)) {
        LexicalSequenceResult result;
        result.sequence = Summarize(snapshot.sequences[match.document]);
        result.similarity = match.similarity;
        results.push_back(std::move(result));
    }
    return results;
}

SequenceSummary SimilarityEngine::Summarize(const IndexedSequence& entry) {
    const Sequence& sequence = entry.sequence;
    SequenceSummary summary;
    summary.key = sequence.key;
    summary.set_piece = sequence.set_piece;
    summary.time = sequence.time;
    summary.team_id = sequence.team_id;
    summary.event_count = sequence.events.size();
    summary.events.reserve(sequence.events.size());
    for (const auto& event : sequence.events) {
        summary.events.push_back(LightweightEvent(event));
    }
    return summary;
}

} // namespace pitchsim
