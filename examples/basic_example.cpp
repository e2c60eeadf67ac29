// File: examples/basic_example.cpp
//
// Basic similarity search example using pitchsim.
// Demonstrates:
// - Normalizing raw feed records into canonical events
// - Building an in-memory corpus
// - Searching for similar sequences (alignment, lexical, hybrid)
// - Comparing two sequences step by step

#include "core/event_normalizer.hpp"
#include "search/similarity_engine.hpp"
#include <iostream>
#include <iomanip>
#include <vector>

using namespace pitchsim;

/// Raw record with a structured ball position and a few tracked players
RawEventRecord MakeRecord(const std::string& type, float x, float y,
                          int64_t player, int64_t receiver = 0) {
    RawEventRecord raw;
    raw.event_type = type;
    raw.ball_position = Position(x, y);
    raw.player_id = player;
    raw.secondary_player_id = receiver;
    raw.team_id = "home";

    raw.home_players.push_back(PlayerPosition{player, static_cast<int>(player % 100),
                                              Position(x, y)});
    if (receiver != 0) {
        raw.home_players.push_back(PlayerPosition{receiver, static_cast<int>(receiver % 100),
                                                  Position(x + 12.0f, y + 4.0f)});
    }
    raw.away_players.push_back(PlayerPosition{900, 4, Position(x + 3.0f, y - 2.0f)});
    return raw;
}

/// Build-up along one flank, ending in a shot
std::vector<RawEventRecord> Attack(float flank, bool scored) {
    std::vector<RawEventRecord> raws;
    raws.push_back(MakeRecord("PA", -20.0f, flank, 7, 8));
    raws.push_back(MakeRecord("PA", -5.0f, flank, 8, 10));
    raws.push_back(MakeRecord("CA", 15.0f, flank * 0.5f, 10));
    RawEventRecord shot = MakeRecord("SH", 38.0f, 0.0f, 10);
    shot.outcome = scored ? "G" : "S";
    raws.push_back(shot);
    return raws;
}

int main() {
    std::cout << "=== pitchsim Basic Similarity Search Example ===\n\n";
    std::cout << std::fixed << std::setprecision(3);

    // Step 1: Normalize a small corpus
    std::cout << "Step 1: Normalizing corpus...\n";

    auto source = std::make_shared<InMemoryCorpusSource>();
    source->Add(NormalizeSequence(SequenceKey("m1", 1), Attack(-15.0f, true), "O"));
    source->Add(NormalizeSequence(SequenceKey("m1", 2), Attack(15.0f, false), "O"));
    source->Add(NormalizeSequence(SequenceKey("m2", 1), Attack(-12.0f, false), "T"));

    std::vector<RawEventRecord> clearance;
    clearance.push_back(MakeRecord("CL", -45.0f, 5.0f, 4));
    clearance.push_back(MakeRecord("RE", -10.0f, 20.0f, 6));
    source->Add(NormalizeSequence(SequenceKey("m2", 2), clearance, "O"));
    std::cout << "  ✓ 4 sequences\n\n";

    // Step 2: Create the engine and build the index
    std::cout << "Step 2: Building index...\n";

    EngineConfig config = EngineConfig::Default();
    config.lexical.min_document_count = 1;
    SimilarityEngine engine(source, config);
    engine.Build();

    auto stats = engine.GetStatistics();
    std::cout << "  ✓ " << stats.sequence_count << " sequences, " << stats.event_count
              << " events, " << stats.sequence_vocabulary_size << " sequence terms\n\n";

    // Step 3: Query with a fresh attack
    std::cout << "Step 3: Searching for sequences similar to a new attack...\n";
    Sequence query = NormalizeSequence(SequenceKey("query", 0), Attack(-14.0f, true), "O");

    std::cout << "\n  Alignment:\n";
    for (const auto& r : engine.SearchSimilarSequencesAligned(query.events, std::nullopt, 3)) {
        std::cout << "    " << r.sequence.key.ToString() << "  distance=" << r.distance
                  << "  similarity=" << r.similarity << "\n";
    }

    std::cout << "\n  Lexical:\n";
    for (const auto& r : engine.SearchSimilarSequencesLexical(query.events, std::nullopt, 3)) {
        std::cout << "    " << r.sequence.key.ToString() << "  similarity=" << r.similarity << "\n";
    }

    std::cout << "\n  Hybrid:\n";
    for (const auto& r : engine.SearchSimilarSequencesHybrid(query.events, std::nullopt, 3)) {
        std::cout << "    " << r.sequence.key.ToString() << "  similarity=" << r.similarity
                  << " (dtw=" << r.alignment_similarity
                  << ", tfidf=" << r.lexical_similarity << ")\n";
    }

    // Step 4: Compare two corpus sequences directly
    std::cout << "\nStep 4: Comparing m1/1 with m1/2...\n";
    auto a = engine.GetSequence(SequenceKey("m1", 1));
    auto b = engine.GetSequence(SequenceKey("m1", 2));
    if (a && b) {
        SequenceComparison comparison = engine.CompareSequences(a->events, b->events);
        std::cout << "  Distance: " << comparison.distance
                  << "  Similarity: " << comparison.similarity << "\n";
        for (const auto& step : comparison.step_distances) {
            std::cout << "    (" << step.i << ", " << step.j << ") cost=" << step.cost << "\n";
        }
    }

    std::cout << "\n=== Example Complete ===\n";
    return 0;
}
