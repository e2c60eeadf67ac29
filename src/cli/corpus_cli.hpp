// File: src/cli/corpus_cli.hpp
//
// pitchsim CLI class definition
// Extracted for testability

#ifndef PITCHSIM_CORPUS_CLI_HPP
#define PITCHSIM_CORPUS_CLI_HPP

#include "search/similarity_engine.hpp"
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace pitchsim {

/// Interactive command interface over a SimilarityEngine
///
/// Reads slash commands, runs the matching engine operation and prints the
/// results to the output stream given at construction.
class CorpusCli {
public:
    /// @throws std::invalid_argument if engine is null
    explicit CorpusCli(std::shared_ptr<SimilarityEngine> engine,
                       std::ostream& out = std::cout);

    /// Main run loop - reads commands until /quit or end of input
    void Run(std::istream& in);

    /// Process a single command line
    void ProcessCommand(const std::string& input);

    bool IsRunning() const { return running_; }
    bool IsVerboseEnabled() const;
    size_t GetCommandCount() const { return command_count_; }

private:
    std::shared_ptr<SimilarityEngine> engine_;
    std::ostream& out_;

    bool running_ = true;
    size_t command_count_ = 0;
    std::string prompt_ = "pitchsim> ";

    // Commands
    void ShowHelp();
    void ShowStatistics();
    void BuildIndex();
    void ResetIndex();
    void ShowConfig();
    void SetWeight(const std::vector<std::string>& args);
    void SetFeature(const std::vector<std::string>& args);
    void ShowEvents(const std::vector<std::string>& args);
    void SimilarEvents(const std::vector<std::string>& args);
    void SimilarSequences(const std::vector<std::string>& args);
    void Compare(const std::vector<std::string>& args);
    void ToggleVerbose();

    // Output helpers
    void PrintSequenceHeader(const SequenceSummary& summary);
    void PrintEvent(size_t index, const Event& event);

    /// Parse "<match> <seq>" starting at args[offset]
    std::optional<SequenceKey> ParseKey(const std::vector<std::string>& args, size_t offset);

    /// Parse an optional result count at args[offset]
    /// @return false (after reporting) if present but not a positive number
    bool ParseCount(const std::vector<std::string>& args, size_t offset,
                    std::optional<size_t>& count);

    /// Load an indexed sequence, reporting a missing key
    std::optional<Sequence> FindSequence(const SequenceKey& key);

    static std::vector<std::string> SplitArgs(const std::string& text);
};

} // namespace pitchsim

#endif // PITCHSIM_CORPUS_CLI_HPP
