// File: src/cli/corpus_cli.cpp
//
// Interactive CLI over the similarity engine
//
// Features:
// - Index lifecycle (build, reset, statistics)
// - Event and sequence similarity search (alignment, lexical, hybrid)
// - Direct comparison of two sequences
// - Runtime tuning of cost weights and optional sub-costs

#include "cli/corpus_cli.hpp"
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace pitchsim {

CorpusCli::CorpusCli(std::shared_ptr<SimilarityEngine> engine, std::ostream& out)
    : engine_(std::move(engine)), out_(out) {
    if (!engine_) {
        throw std::invalid_argument("SimilarityEngine cannot be null");
    }
    out_ << std::fixed << std::setprecision(3);
}

void CorpusCli::Run(std::istream& in) {
    out_ << "pitchsim - possession similarity search\n";
    out_ << "Type '/help' for available commands.\n\n";

    std::string line;
    while (running_) {
        out_ << prompt_ << std::flush;
        if (!std::getline(in, line)) {
            break;
        }
        ProcessCommand(line);
    }

    out_ << "\nGoodbye.\n";
}

void CorpusCli::ProcessCommand(const std::string& input) {
    std::vector<std::string> args = SplitArgs(input);
    if (args.empty()) {
        return;
    }

    ++command_count_;

    const std::string command = args.front();
    if (command.empty() || command[0] != '/') {
        out_ << "Commands start with '/'. Type '/help' for available commands.\n";
        return;
    }

    if (command == "/help") {
        ShowHelp();
    } else if (command == "/stats") {
        ShowStatistics();
    } else if (command == "/build") {
        BuildIndex();
    } else if (command == "/reset") {
        ResetIndex();
    } else if (command == "/config") {
        ShowConfig();
    } else if (command == "/weight") {
        SetWeight(args);
    } else if (command == "/feature") {
        SetFeature(args);
    } else if (command == "/events") {
        ShowEvents(args);
    } else if (command == "/similar-event") {
        SimilarEvents(args);
    } else if (command == "/similar-seq") {
        SimilarSequences(args);
    } else if (command == "/compare") {
        Compare(args);
    } else if (command == "/verbose") {
        ToggleVerbose();
    } else if (command == "/quit" || command == "/exit") {
        running_ = false;
    } else {
        out_ << "Unknown command: " << command << "\n";
        out_ << "Type '/help' for available commands.\n";
    }
}

bool CorpusCli::IsVerboseEnabled() const {
    return engine_->GetConfig().logging.verbose;
}

// ============================================================================
// Commands
// ============================================================================

void CorpusCli::ShowHelp() {
    out_ << R"(
Commands:
  /help                                   Show this help
  /stats                                  Index statistics
  /build                                  Build the index now
  /reset                                  Discard the index (rebuilt on next search)
  /config                                 Show the current configuration
  /weight <name> <value>                  Set a cost weight
  /feature <name> on|off                  Toggle an optional sub-cost
  /events <match> <seq>                   List the events of a sequence
  /similar-event <match> <seq> <index> [n]
                                          Events similar to one event
  /similar-seq <match> <seq> [dtw|tfidf|hybrid] [n]
                                          Sequences similar to one sequence
  /compare <match> <seq> <match> <seq>    Align two sequences step by step
  /verbose                                Toggle build logging
  /quit                                   Exit

Weights: ball_position, event_type, player_formation, pass_type, shot_type, pressure_type
Features: pass_type, shot_type, pressure_type
)";
}

void CorpusCli::ShowStatistics() {
    SimilarityEngine::Statistics stats = engine_->GetStatistics();
    out_ << "Index state:        " << ToString(stats.state) << "\n";
    out_ << "Sequences:          " << stats.sequence_count << "\n";
    out_ << "Events:             " << stats.event_count << "\n";
    out_ << "Event vocabulary:   " << stats.event_vocabulary_size << "\n";
    out_ << "Sequence vocabulary:" << " " << stats.sequence_vocabulary_size << "\n";
    out_ << "Builds:             " << stats.build_count << "\n";
    if (!stats.last_error.empty()) {
        out_ << "Last error:         " << stats.last_error << "\n";
    }
}

void CorpusCli::BuildIndex() {
    engine_->Build();
    SimilarityEngine::Statistics stats = engine_->GetStatistics();
    out_ << "Index ready: " << stats.sequence_count << " sequences, "
         << stats.event_count << " events\n";
    if (!stats.last_error.empty()) {
        out_ << "Build failed: " << stats.last_error << "\n";
    }
}

void CorpusCli::ResetIndex() {
    engine_->Reset();
    out_ << "Index cleared. It will be rebuilt on the next search.\n";
}

void CorpusCli::ShowConfig() {
    out_ << engine_->GetConfig().ToYamlString();
}

void CorpusCli::SetWeight(const std::vector<std::string>& args) {
    if (args.size() != 3) {
        out_ << "Usage: /weight <name> <value>\n";
        return;
    }

    float value = 0.0f;
    std::istringstream ss(args[2]);
    if (!(ss >> value) || !ss.eof()) {
        out_ << "Invalid weight: " << args[2] << "\n";
        return;
    }

    if (!engine_->SetWeight(args[1], value)) {
        out_ << "Unknown weight or negative value: " << args[1] << "\n";
        return;
    }
    out_ << "Weight " << args[1] << " = " << value << "\n";
}

void CorpusCli::SetFeature(const std::vector<std::string>& args) {
    if (args.size() != 3 || (args[2] != "on" && args[2] != "off")) {
        out_ << "Usage: /feature <name> on|off\n";
        return;
    }

    bool enabled = args[2] == "on";
    if (!engine_->SetOptionalFeature(args[1], enabled)) {
        out_ << "Unknown feature: " << args[1] << "\n";
        return;
    }
    out_ << "Feature " << args[1] << " " << (enabled ? "enabled" : "disabled") << "\n";
}

void CorpusCli::ShowEvents(const std::vector<std::string>& args) {
    auto key = ParseKey(args, 1);
    if (!key || args.size() != 3) {
        out_ << "Usage: /events <match> <seq>\n";
        return;
    }

    auto sequence = FindSequence(*key);
    if (!sequence) {
        return;
    }

    out_ << "Sequence " << key->ToString() << " (" << SetPieceLabel(sequence->set_piece)
         << ", " << sequence->events.size() << " events)\n";
    for (size_t i = 0; i < sequence->events.size(); ++i) {
        PrintEvent(i, sequence->events[i]);
    }
}

void CorpusCli::SimilarEvents(const std::vector<std::string>& args) {
    auto key = ParseKey(args, 1);
    size_t index = 0;
    std::istringstream ss(args.size() > 3 ? args[3] : "");
    if (!key || args.size() < 4 || args.size() > 5 || !(ss >> index) || !ss.eof()) {
        out_ << "Usage: /similar-event <match> <seq> <index> [n]\n";
        return;
    }

    std::optional<size_t> top_n;
    if (!ParseCount(args, 4, top_n)) {
        return;
    }

    auto sequence = FindSequence(*key);
    if (!sequence) {
        return;
    }
    if (index >= sequence->events.size()) {
        out_ << "Event index out of range (sequence has " << sequence->events.size()
             << " events)\n";
        return;
    }

    EventKey exclude(*key, index);
    auto results = engine_->SearchSimilarEvents(sequence->events[index], exclude, top_n);
    if (results.empty()) {
        out_ << "No similar events found.\n";
        return;
    }

    for (size_t i = 0; i < results.size(); ++i) {
        const auto& result = results[i];
        out_ << std::setw(3) << (i + 1) << ". " << result.key.ToString()
             << "  " << EventTypeLabel(result.event.type)
             << "  similarity=" << result.similarity << "\n";
    }
}

void CorpusCli::SimilarSequences(const std::vector<std::string>& args) {
    auto key = ParseKey(args, 1);
    if (!key || args.size() > 5) {
        out_ << "Usage: /similar-seq <match> <seq> [dtw|tfidf|hybrid] [n]\n";
        return;
    }

    std::string method = "hybrid";
    size_t count_offset = 3;
    if (args.size() > 3 && (args[3] == "dtw" || args[3] == "tfidf" || args[3] == "hybrid")) {
        method = args[3];
        count_offset = 4;
    } else if (args.size() > 4) {
        out_ << "Usage: /similar-seq <match> <seq> [dtw|tfidf|hybrid] [n]\n";
        return;
    }

    std::optional<size_t> top_n;
    if (!ParseCount(args, count_offset, top_n)) {
        return;
    }

    auto sequence = FindSequence(*key);
    if (!sequence) {
        return;
    }

    size_t found = 0;
    if (method == "dtw") {
        auto results = engine_->SearchSimilarSequencesAligned(sequence->events, *key, top_n);
        found = results.size();
        for (size_t i = 0; i < results.size(); ++i) {
            out_ << std::setw(3) << (i + 1) << ". ";
            PrintSequenceHeader(results[i].sequence);
            out_ << "  distance=" << results[i].distance
                 << "  similarity=" << results[i].similarity << "\n";
        }
    } else if (method == "tfidf") {
        auto results = engine_->SearchSimilarSequencesLexical(sequence->events, *key, top_n);
        found = results.size();
        for (size_t i = 0; i < results.size(); ++i) {
            out_ << std::setw(3) << (i + 1) << ". ";
            PrintSequenceHeader(results[i].sequence);
            out_ << "  similarity=" << results[i].similarity << "\n";
        }
    } else {
        auto results = engine_->SearchSimilarSequencesHybrid(sequence->events, *key, top_n);
        found = results.size();
        for (size_t i = 0; i < results.size(); ++i) {
            out_ << std::setw(3) << (i + 1) << ". ";
            PrintSequenceHeader(results[i].sequence);
            out_ << "  similarity=" << results[i].similarity
                 << " (dtw=" << results[i].alignment_similarity
                 << ", tfidf=" << results[i].lexical_similarity << ")\n";
        }
    }

    if (found == 0) {
        out_ << "No similar sequences found.\n";
    }
}

void CorpusCli::Compare(const std::vector<std::string>& args) {
    auto key_a = ParseKey(args, 1);
    auto key_b = ParseKey(args, 3);
    if (!key_a || !key_b || args.size() != 5) {
        out_ << "Usage: /compare <match> <seq> <match> <seq>\n";
        return;
    }

    auto a = FindSequence(*key_a);
    if (!a) {
        return;
    }
    auto b = FindSequence(*key_b);
    if (!b) {
        return;
    }

    SequenceComparison comparison = engine_->CompareSequences(a->events, b->events);
    out_ << key_a->ToString() << " (" << comparison.length_a << " events) vs "
         << key_b->ToString() << " (" << comparison.length_b << " events)\n";
    out_ << "Distance:   " << comparison.distance << "\n";
    out_ << "Similarity: " << comparison.similarity << "\n";
    out_ << "Path:\n";
    for (const auto& step : comparison.step_distances) {
        out_ << "  (" << step.i << ", " << step.j << ")  "
             << EventTypeLabel(a->events[step.i].type) << " ~ "
             << EventTypeLabel(b->events[step.j].type)
             << "  cost=" << step.cost << "\n";
    }
}

void CorpusCli::ToggleVerbose() {
    EngineConfig config = engine_->GetConfig();
    config.logging.verbose = !config.logging.verbose;
    if (!engine_->SetConfig(config)) {
        out_ << "Failed to update configuration\n";
        return;
    }
    out_ << "Verbose mode: " << (config.logging.verbose ? "ON" : "OFF") << "\n";
}

// ============================================================================
// Helpers
// ============================================================================

void CorpusCli::PrintSequenceHeader(const SequenceSummary& summary) {
    out_ << summary.key.ToString() << "  " << SetPieceLabel(summary.set_piece)
         << "  " << summary.time << "  team=" << summary.team_id
         << "  events=" << summary.event_count;
}

void CorpusCli::PrintEvent(size_t index, const Event& event) {
    out_ << "  [" << index << "] " << event.time << "  "
         << (event.type == EventType::UNKNOWN ? event.type_code : EventTypeLabel(event.type));
    if (!event.player_name.empty()) {
        out_ << "  " << event.player_name;
    }
    if (event.has_ball_position) {
        out_ << "  ball=(" << event.ball.x << ", " << event.ball.y << ")";
    }
    if (!event.outcome.empty()) {
        out_ << "  outcome=" << event.outcome;
    }
    if (event.is_goal) {
        out_ << "  GOAL";
    }
    out_ << "\n";
}

std::optional<SequenceKey> CorpusCli::ParseKey(const std::vector<std::string>& args,
                                               size_t offset) {
    if (args.size() < offset + 2) {
        return std::nullopt;
    }
    int64_t sequence_id = 0;
    std::istringstream ss(args[offset + 1]);
    if (!(ss >> sequence_id) || !ss.eof()) {
        return std::nullopt;
    }
    return SequenceKey(args[offset], sequence_id);
}

bool CorpusCli::ParseCount(const std::vector<std::string>& args, size_t offset,
                           std::optional<size_t>& count) {
    if (args.size() <= offset) {
        return true;
    }
    long long value = 0;
    std::istringstream ss(args[offset]);
    if (!(ss >> value) || !ss.eof() || value <= 0) {
        out_ << "Invalid result count: " << args[offset] << "\n";
        return false;
    }
    count = static_cast<size_t>(value);
    return true;
}

std::optional<Sequence> CorpusCli::FindSequence(const SequenceKey& key) {
    auto sequence = engine_->GetSequence(key);
    if (!sequence) {
        out_ << "Sequence not found: " << key.ToString() << "\n";
    }
    return sequence;
}

std::vector<std::string> CorpusCli::SplitArgs(const std::string& text) {
    std::vector<std::string> args;
    std::istringstream ss(text);
    std::string arg;
    while (ss >> arg) {
        args.push_back(arg);
    }
    return args;
}

} // namespace pitchsim
