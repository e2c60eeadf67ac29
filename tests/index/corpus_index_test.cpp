// File: tests/index/corpus_index_test.cpp
#include "index/corpus_index.hpp"
#include "fixtures/corpus_fixtures.hpp"
#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>

namespace pitchsim {
namespace {

using testing::AttackSequence;
using testing::MakeSequence;
using testing::MixedCorpus;

/// Source that fails every load
class FailingSource : public CorpusSource {
public:
    std::vector<Sequence> LoadSequences() override {
        ++calls;
        throw std::runtime_error("corpus unavailable");
    }

    std::atomic<int> calls{0};
};

/// Source that throws a value outside the std::exception hierarchy
class ThrowingValueSource : public CorpusSource {
public:
    std::vector<Sequence> LoadSequences() override {
        ++calls;
        throw 42;
    }

    std::atomic<int> calls{0};
};

/// Source that takes a while, so concurrent callers overlap the build
class SlowSource : public InMemoryCorpusSource {
public:
    explicit SlowSource(std::vector<Sequence> sequences)
        : InMemoryCorpusSource(std::move(sequences)) {}

    std::vector<Sequence> LoadSequences() override {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        return InMemoryCorpusSource::LoadSequences();
    }
};

class CorpusIndexTest : public ::testing::Test {
protected:
    void SetUp() override {
        source_ = std::make_shared<InMemoryCorpusSource>(MixedCorpus());
        index_ = std::make_unique<CorpusIndex>(source_);
    }

    std::shared_ptr<InMemoryCorpusSource> source_;
    std::unique_ptr<CorpusIndex> index_;
};

// ============================================================================
// Construction and State
// ============================================================================

TEST(CorpusIndexConstructionTest, NullSourceThrows) {
    EXPECT_THROW(CorpusIndex(nullptr), std::invalid_argument);
}

TEST_F(CorpusIndexTest, StartsEmpty) {
    EXPECT_EQ(CorpusIndex::State::EMPTY, index_->GetState());
    EXPECT_FALSE(index_->IsReady());
    EXPECT_EQ(nullptr, index_->Snapshot());
    EXPECT_EQ(0u, index_->GetBuildCount());
    EXPECT_EQ(0u, source_->GetLoadCount());
}

TEST_F(CorpusIndexTest, StateNames) {
    EXPECT_STREQ("EMPTY", ToString(CorpusIndex::State::EMPTY));
    EXPECT_STREQ("BUILDING", ToString(CorpusIndex::State::BUILDING));
    EXPECT_STREQ("READY", ToString(CorpusIndex::State::READY));
}

// ============================================================================
// Build Tests
// ============================================================================

TEST_F(CorpusIndexTest, BuildIndexesEverySequenceAndEvent) {
    auto snapshot = index_->EnsureBuilt(BuildOptions{});
    ASSERT_NE(nullptr, snapshot);

    EXPECT_TRUE(index_->IsReady());
    EXPECT_EQ(4u, snapshot->SequenceCount());
    EXPECT_EQ(3u + 3u + 3u + 2u, snapshot->EventCount());
    EXPECT_EQ(snapshot->EventCount(), snapshot->event_lexicon.DocumentCount());
    EXPECT_EQ(4u, snapshot->sequence_lexicon.DocumentCount());
    EXPECT_GT(snapshot->sequence_lexicon.VocabularySize(), 0u);
    EXPECT_TRUE(index_->GetLastError().empty());
}

TEST_F(CorpusIndexTest, SnapshotPrecomputesFeaturesAndText) {
    auto snapshot = index_->EnsureBuilt(BuildOptions{});

    const IndexedSequence* entry = snapshot->Find(SequenceKey("m1", 2));
    ASSERT_NE(nullptr, entry);
    EXPECT_EQ(entry->sequence.events.size(), entry->features.size());
    EXPECT_EQ(snapshot->encoder.EncodeSequence(entry->sequence.events), entry->text);

    EXPECT_EQ(nullptr, snapshot->Find(SequenceKey("m9", 1)));
}

TEST_F(CorpusIndexTest, EventRefsFollowSequenceOrder) {
    auto snapshot = index_->EnsureBuilt(BuildOptions{});

    const auto& first = snapshot->events.front();
    EXPECT_EQ(0u, first.sequence_slot);
    EXPECT_EQ(0u, first.event_index);

    const auto& last = snapshot->events.back();
    EXPECT_EQ(3u, last.sequence_slot);
    EXPECT_EQ(1u, last.event_index);
    EXPECT_EQ(EventType::RE, snapshot->EventAt(last).type);
}

TEST_F(CorpusIndexTest, BuildsOnlyOnce) {
    auto first = index_->EnsureBuilt(BuildOptions{});
    auto second = index_->EnsureBuilt(BuildOptions{});

    EXPECT_EQ(first.get(), second.get());
    EXPECT_EQ(1u, source_->GetLoadCount());
    EXPECT_EQ(1u, index_->GetBuildCount());
}

TEST(CorpusIndexConcurrencyTest, ConcurrentCallersShareOneBuild) {
    auto source = std::make_shared<SlowSource>(MixedCorpus());
    CorpusIndex index(source);

    constexpr int kThreads = 8;
    std::vector<std::shared_ptr<const CorpusSnapshot>> seen(kThreads);
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&index, &seen, t] {
            seen[t] = index.EnsureBuilt(BuildOptions{});
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(1u, source->GetLoadCount());
    EXPECT_EQ(1u, index.GetBuildCount());
    for (const auto& snapshot : seen) {
        ASSERT_NE(nullptr, snapshot);
        EXPECT_EQ(seen[0].get(), snapshot.get());
    }
}

TEST_F(CorpusIndexTest, ResetForcesRebuild) {
    auto before = index_->EnsureBuilt(BuildOptions{});
    index_->Reset();

    EXPECT_EQ(CorpusIndex::State::EMPTY, index_->GetState());
    EXPECT_EQ(nullptr, index_->Snapshot());

    // Old snapshot stays valid for anyone still holding it
    EXPECT_EQ(4u, before->SequenceCount());

    source_->Add(AttackSequence("m3", 1, 0.0f));
    auto after = index_->EnsureBuilt(BuildOptions{});
    EXPECT_EQ(5u, after->SequenceCount());
    EXPECT_EQ(2u, source_->GetLoadCount());
    EXPECT_EQ(2u, index_->GetBuildCount());
}

TEST_F(CorpusIndexTest, SkipsEmptyAndDuplicateSequences) {
    source_->Add(MakeSequence("m5", 1, {}));
    source_->Add(AttackSequence("m1", 1, 30.0f));   // same key as an existing chain

    auto snapshot = index_->EnsureBuilt(BuildOptions{});
    EXPECT_EQ(4u, snapshot->SequenceCount());
    EXPECT_EQ(nullptr, snapshot->Find(SequenceKey("m5", 1)));

    // First occurrence wins
    const IndexedSequence* kept = snapshot->Find(SequenceKey("m1", 1));
    ASSERT_NE(nullptr, kept);
    EXPECT_FLOAT_EQ(-15.0f, kept->sequence.events[0].ball.y);
}

TEST_F(CorpusIndexTest, CapturesBuildOptions) {
    BuildOptions options;
    options.near_ball_radius = 4.0f;
    options.lexical.min_document_count = 1;

    auto snapshot = index_->EnsureBuilt(options);
    EXPECT_FLOAT_EQ(4.0f, snapshot->extractor.GetNearBallRadius());
    EXPECT_EQ(1u, snapshot->sequence_lexicon.GetConfig().min_document_count);

    // Later options do not affect a built index
    BuildOptions other;
    other.near_ball_radius = 30.0f;
    auto same = index_->EnsureBuilt(other);
    EXPECT_FLOAT_EQ(4.0f, same->extractor.GetNearBallRadius());
}

// ============================================================================
// Failure Handling
// ============================================================================

TEST(CorpusIndexFailureTest, FailedBuildServesEmptyCorpus) {
    auto source = std::make_shared<FailingSource>();
    CorpusIndex index(source);

    auto snapshot = index.EnsureBuilt(BuildOptions{});
    ASSERT_NE(nullptr, snapshot);
    EXPECT_TRUE(index.IsReady());
    EXPECT_EQ(0u, snapshot->SequenceCount());
    EXPECT_EQ(0u, snapshot->EventCount());
    EXPECT_NE(std::string::npos, index.GetLastError().find("corpus unavailable"));

    // No retry until Reset()
    index.EnsureBuilt(BuildOptions{});
    EXPECT_EQ(1, source->calls.load());

    index.Reset();
    EXPECT_TRUE(index.GetLastError().empty());
    index.EnsureBuilt(BuildOptions{});
    EXPECT_EQ(2, source->calls.load());
}

TEST(CorpusIndexFailureTest, NonStandardExceptionStillCompletesBuild) {
    auto source = std::make_shared<ThrowingValueSource>();
    CorpusIndex index(source);

    auto snapshot = index.EnsureBuilt(BuildOptions{});
    ASSERT_NE(nullptr, snapshot);
    EXPECT_EQ(CorpusIndex::State::READY, index.GetState());
    EXPECT_EQ(0u, snapshot->SequenceCount());
    EXPECT_EQ("unknown error", index.GetLastError());

    // Neither call may block on a stale BUILDING state
    index.EnsureBuilt(BuildOptions{});
    index.Reset();
    EXPECT_EQ(CorpusIndex::State::EMPTY, index.GetState());
    index.EnsureBuilt(BuildOptions{});
    EXPECT_EQ(2, source->calls.load());
}

TEST(CorpusIndexFailureTest, EmptySourceBuildsEmptySnapshot) {
    auto source = std::make_shared<InMemoryCorpusSource>();
    CorpusIndex index(source);

    auto snapshot = index.EnsureBuilt(BuildOptions{});
    EXPECT_EQ(0u, snapshot->SequenceCount());
    EXPECT_EQ(0u, snapshot->sequence_lexicon.VocabularySize());
    EXPECT_TRUE(index.GetLastError().empty());
}

} // namespace
} // namespace pitchsim
