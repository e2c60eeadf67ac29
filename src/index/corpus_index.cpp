// File: src/index/corpus_index.cpp
#include "index/corpus_index.hpp"
#include <chrono>
#include <iostream>
#include <stdexcept>

namespace pitchsim {

const IndexedSequence* CorpusSnapshot::Find(const SequenceKey& key) const {
    auto it = slots.find(key);
    if (it == slots.end()) {
        return nullptr;
    }
    return &sequences[it->second];
}

const char* ToString(CorpusIndex::State state) {
    switch (state) {
        case CorpusIndex::State::EMPTY: return "EMPTY";
        case CorpusIndex::State::BUILDING: return "BUILDING";
        case CorpusIndex::State::READY: return "READY";
        default: return "UNKNOWN";
    }
}

CorpusIndex::CorpusIndex(std::shared_ptr<CorpusSource> source)
    : source_(std::move(source)) {
    if (!source_) {
        throw std::invalid_argument("CorpusSource cannot be null");
    }
}

std::shared_ptr<const CorpusSnapshot> CorpusIndex::EnsureBuilt(const BuildOptions& options) {
    std::unique_lock<std::mutex> lock(mutex_);
    state_changed_.wait(lock, [this] { return state_ != State::BUILDING; });
    if (state_ == State::READY) {
        return snapshot_;
    }

    state_ = State::BUILDING;
    lock.unlock();

    std::shared_ptr<const CorpusSnapshot> built;
    std::string error;
    try {
        built = BuildSnapshot(options);
    } catch (const std::exception& e) {
        error = e.what();
        std::cerr << "[CorpusIndex] Build failed: " << error << std::endl;
        built = std::make_shared<const CorpusSnapshot>(BuildOptions{});
    } catch (...) {
        // Any source failure must still leave BUILDING, or waiters block forever
        error = "unknown error";
        std::cerr << "[CorpusIndex] Build failed: " << error << std::endl;
        built = std::make_shared<const CorpusSnapshot>(BuildOptions{});
    }

    lock.lock();
    snapshot_ = built;
    last_error_ = error;
    ++build_count_;
    state_ = State::READY;
    lock.unlock();
    state_changed_.notify_all();

    return built;
}

std::shared_ptr<const CorpusSnapshot> CorpusIndex::Snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != State::READY) {
        return nullptr;
    }
    return snapshot_;
}

void CorpusIndex::Reset() {
    std::unique_lock<std::mutex> lock(mutex_);
    state_changed_.wait(lock, [this] { return state_ != State::BUILDING; });
    snapshot_.reset();
    last_error_.clear();
    state_ = State::EMPTY;
}

CorpusIndex::State CorpusIndex::GetState() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

std::string CorpusIndex::GetLastError() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_error_;
}

size_t CorpusIndex::GetBuildCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return build_count_;
}

std::shared_ptr<const CorpusSnapshot> CorpusIndex::BuildSnapshot(const BuildOptions& options) {
    auto start = std::chrono::steady_clock::now();
    auto snapshot = std::make_shared<CorpusSnapshot>(options);

    std::vector<Sequence> loaded = source_->LoadSequences();
    if (options.verbose) {
        std::cerr << "[CorpusIndex] Loaded " << loaded.size() << " sequences" << std::endl;
    }

    size_t skipped = 0;
    snapshot->sequences.reserve(loaded.size());
    for (auto& sequence : loaded) {
        if (sequence.Empty() || snapshot->slots.count(sequence.key) > 0) {
            ++skipped;
            continue;
        }

        IndexedSequence entry;
        entry.features = snapshot->extractor.ExtractSequence(sequence.events);
        entry.text = snapshot->encoder.EncodeSequence(sequence.events);
        entry.sequence = std::move(sequence);

        size_t slot = snapshot->sequences.size();
        snapshot->slots.emplace(entry.sequence.key, slot);
        for (size_t i = 0; i < entry.sequence.events.size(); ++i) {
            snapshot->events.push_back(IndexedEventRef{slot, i});
        }
        snapshot->sequences.push_back(std::move(entry));
    }

    if (skipped > 0 && options.verbose) {
        std::cerr << "[CorpusIndex] Skipped " << skipped
                  << " empty or duplicate sequences" << std::endl;
    }

    std::vector<std::string> event_documents;
    event_documents.reserve(snapshot->events.size());
    for (const auto& ref : snapshot->events) {
        event_documents.push_back(snapshot->encoder.EncodeEvent(snapshot->EventAt(ref)));
    }
    snapshot->event_lexicon.Fit(event_documents);

    std::vector<std::string> sequence_documents;
    sequence_documents.reserve(snapshot->sequences.size());
    for (const auto& entry : snapshot->sequences) {
        sequence_documents.push_back(entry.text);
    }
    snapshot->sequence_lexicon.Fit(sequence_documents);

    if (options.verbose) {
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);
        std::cerr << "[CorpusIndex] Indexed " << snapshot->SequenceCount() << " sequences, "
                  << snapshot->EventCount() << " events (vocabulary: "
                  << snapshot->event_lexicon.VocabularySize() << " event terms, "
                  << snapshot->sequence_lexicon.VocabularySize() << " sequence terms) in "
                  << elapsed.count() << " ms" << std::endl;
    }

    return snapshot;
}

} // namespace pitchsim
