// File: tests/cli/corpus_cli_test.cpp
//
// Test suite for the pitchsim command interface

#include "cli/corpus_cli.hpp"
#include "fixtures/corpus_fixtures.hpp"
#include <gtest/gtest.h>
#include <sstream>
#include <stdexcept>

namespace pitchsim {
namespace {

// Test fixture for CLI tests
class CorpusCliTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto source = std::make_shared<InMemoryCorpusSource>(testing::MixedCorpus());
        engine_ = std::make_shared<SimilarityEngine>(source);
        cli_ = std::make_unique<CorpusCli>(engine_, out_);
    }

    /// Run one command and return what it printed
    std::string Run(const std::string& command) {
        out_.str("");
        cli_->ProcessCommand(command);
        return out_.str();
    }

    static bool Contains(const std::string& text, const std::string& fragment) {
        return text.find(fragment) != std::string::npos;
    }

    std::ostringstream out_;
    std::shared_ptr<SimilarityEngine> engine_;
    std::unique_ptr<CorpusCli> cli_;
};

// ============================================================================
// Construction & Dispatch Tests
// ============================================================================

TEST(CorpusCliConstructionTest, NullEngineThrows) {
    std::ostringstream out;
    EXPECT_THROW(CorpusCli(nullptr, out), std::invalid_argument);
}

TEST_F(CorpusCliTest, DefaultState) {
    EXPECT_TRUE(cli_->IsRunning());
    EXPECT_FALSE(cli_->IsVerboseEnabled());
    EXPECT_EQ(0u, cli_->GetCommandCount());
}

TEST_F(CorpusCliTest, BlankInputIgnored) {
    EXPECT_EQ("", Run("   "));
    EXPECT_EQ(0u, cli_->GetCommandCount());
}

TEST_F(CorpusCliTest, PlainTextRejected) {
    EXPECT_TRUE(Contains(Run("hello there"), "Commands start with '/'"));
    EXPECT_EQ(1u, cli_->GetCommandCount());
}

TEST_F(CorpusCliTest, UnknownCommand) {
    EXPECT_TRUE(Contains(Run("/dance"), "Unknown command: /dance"));
}

TEST_F(CorpusCliTest, HelpListsCommands) {
    std::string output = Run("/help");
    EXPECT_TRUE(Contains(output, "/similar-seq"));
    EXPECT_TRUE(Contains(output, "/compare"));
    EXPECT_TRUE(Contains(output, "player_formation"));
}

TEST_F(CorpusCliTest, QuitStopsRunning) {
    Run("/quit");
    EXPECT_FALSE(cli_->IsRunning());
}

TEST_F(CorpusCliTest, RunLoopStopsAtQuit) {
    std::istringstream in("/help\n\n/quit\n/build\n");
    cli_->Run(in);

    std::string output = out_.str();
    EXPECT_TRUE(Contains(output, "pitchsim> "));
    EXPECT_TRUE(Contains(output, "Goodbye."));
    EXPECT_FALSE(Contains(output, "Index ready"));
    EXPECT_EQ(2u, cli_->GetCommandCount());
}

TEST_F(CorpusCliTest, RunLoopStopsAtEndOfInput) {
    std::istringstream in("/build\n");
    cli_->Run(in);
    EXPECT_TRUE(Contains(out_.str(), "Index ready: 4 sequences, 11 events"));
    EXPECT_TRUE(Contains(out_.str(), "Goodbye."));
}

// ============================================================================
// Index Lifecycle Tests
// ============================================================================

TEST_F(CorpusCliTest, BuildStatsReset) {
    EXPECT_TRUE(Contains(Run("/stats"), "EMPTY"));
    EXPECT_TRUE(Contains(Run("/build"), "Index ready: 4 sequences, 11 events"));

    std::string stats = Run("/stats");
    EXPECT_TRUE(Contains(stats, "READY"));
    EXPECT_TRUE(Contains(stats, "Events:             11"));

    EXPECT_TRUE(Contains(Run("/reset"), "Index cleared"));
    EXPECT_TRUE(Contains(Run("/stats"), "EMPTY"));
}

// ============================================================================
// Configuration Tests
// ============================================================================

TEST_F(CorpusCliTest, ShowConfig) {
    std::string output = Run("/config");
    EXPECT_TRUE(Contains(output, "cost:"));
    EXPECT_TRUE(Contains(output, "hybrid:"));
}

TEST_F(CorpusCliTest, SetWeight) {
    EXPECT_TRUE(Contains(Run("/weight ball_position 2"), "Weight ball_position = 2.000"));
    EXPECT_FLOAT_EQ(2.0f, engine_->GetConfig().cost.ball_position);

    EXPECT_TRUE(Contains(Run("/weight spin 1"), "Unknown weight or negative value: spin"));
    EXPECT_TRUE(Contains(Run("/weight event_type -1"), "Unknown weight or negative value"));
    EXPECT_TRUE(Contains(Run("/weight event_type lots"), "Invalid weight: lots"));
    EXPECT_TRUE(Contains(Run("/weight event_type"), "Usage: /weight"));
    EXPECT_FLOAT_EQ(1.0f, engine_->GetConfig().cost.event_type);
}

TEST_F(CorpusCliTest, SetFeature) {
    EXPECT_TRUE(Contains(Run("/feature pass_type on"), "Feature pass_type enabled"));
    EXPECT_TRUE(engine_->GetConfig().features.pass_type);

    EXPECT_TRUE(Contains(Run("/feature pass_type off"), "Feature pass_type disabled"));
    EXPECT_FALSE(engine_->GetConfig().features.pass_type);

    EXPECT_TRUE(Contains(Run("/feature spin on"), "Unknown feature: spin"));
    EXPECT_TRUE(Contains(Run("/feature pass_type maybe"), "Usage: /feature"));
}

TEST_F(CorpusCliTest, ToggleVerbose) {
    EXPECT_TRUE(Contains(Run("/verbose"), "Verbose mode: ON"));
    EXPECT_TRUE(cli_->IsVerboseEnabled());
    EXPECT_TRUE(Contains(Run("/verbose"), "Verbose mode: OFF"));
    EXPECT_FALSE(cli_->IsVerboseEnabled());
}

// ============================================================================
// Query Tests
// ============================================================================

TEST_F(CorpusCliTest, ShowEvents) {
    std::string output = Run("/events m1 1");
    EXPECT_TRUE(Contains(output, "Sequence m1/1 (Open Play, 3 events)"));
    EXPECT_TRUE(Contains(output, "[0]"));
    EXPECT_TRUE(Contains(output, "[2]"));
    EXPECT_TRUE(Contains(output, "Shot"));
    EXPECT_TRUE(Contains(output, "GOAL"));
}

TEST_F(CorpusCliTest, MissingSequenceReported) {
    EXPECT_TRUE(Contains(Run("/events m9 9"), "Sequence not found: m9/9"));
    EXPECT_TRUE(Contains(Run("/similar-seq m9 9"), "Sequence not found: m9/9"));
    EXPECT_TRUE(Contains(Run("/events m1 x"), "Usage: /events"));
}

TEST_F(CorpusCliTest, SimilarEvents) {
    std::string output = Run("/similar-event m1 1 0 2");
    EXPECT_TRUE(Contains(output, "  1. "));
    EXPECT_TRUE(Contains(output, "similarity="));
    EXPECT_FALSE(Contains(output, "m1/1#0"));

    EXPECT_TRUE(Contains(Run("/similar-event m1 1 9"), "Event index out of range"));
    EXPECT_TRUE(Contains(Run("/similar-event m1 1"), "Usage: /similar-event"));
}

TEST_F(CorpusCliTest, SimilarSequencesByAlignment) {
    std::string output = Run("/similar-seq m1 1 dtw 2");
    EXPECT_TRUE(Contains(output, "  1. m2/1"));
    EXPECT_TRUE(Contains(output, "  2. "));
    EXPECT_FALSE(Contains(output, "  3. "));
    EXPECT_TRUE(Contains(output, "distance="));
    EXPECT_FALSE(Contains(output, "m1/1 "));
}

TEST_F(CorpusCliTest, SimilarSequencesLexical) {
    std::string output = Run("/similar-seq m1 1 tfidf");
    EXPECT_TRUE(Contains(output, "  1. m2/1"));
    EXPECT_TRUE(Contains(output, "similarity="));
}

TEST_F(CorpusCliTest, SimilarSequencesHybridByDefault) {
    std::string output = Run("/similar-seq m1 1 3");
    EXPECT_TRUE(Contains(output, "(dtw="));
    EXPECT_TRUE(Contains(output, "tfidf="));
    EXPECT_TRUE(Contains(output, "  3. "));
}

TEST_F(CorpusCliTest, SimilarSequencesBadArguments) {
    EXPECT_TRUE(Contains(Run("/similar-seq m1 1 dtw 0"), "Invalid result count: 0"));
    EXPECT_TRUE(Contains(Run("/similar-seq m1 1 cosine"), "Invalid result count: cosine"));
    EXPECT_TRUE(Contains(Run("/similar-seq m1"), "Usage: /similar-seq"));
}

TEST_F(CorpusCliTest, NoResultsMessage) {
    auto source = std::make_shared<InMemoryCorpusSource>(
        std::vector<Sequence>{testing::AttackSequence("solo", 1, 0.0f)});
    auto engine = std::make_shared<SimilarityEngine>(source);
    std::ostringstream out;
    CorpusCli cli(engine, out);

    cli.ProcessCommand("/similar-seq solo 1 dtw");
    EXPECT_NE(std::string::npos, out.str().find("No similar sequences found."));
}

TEST_F(CorpusCliTest, CompareSequences) {
    std::string self = Run("/compare m1 1 m1 1");
    EXPECT_TRUE(Contains(self, "Distance:   0.000"));
    EXPECT_TRUE(Contains(self, "Similarity: 1.000"));
    EXPECT_TRUE(Contains(self, "(2, 2)  Shot ~ Shot  cost=0.000"));

    std::string other = Run("/compare m1 1 m2 2");
    EXPECT_TRUE(Contains(other, "m1/1 (3 events) vs m2/2 (2 events)"));
    EXPECT_TRUE(Contains(other, "Path:"));

    EXPECT_TRUE(Contains(Run("/compare m1 1"), "Usage: /compare"));
}

} // namespace
} // namespace pitchsim
