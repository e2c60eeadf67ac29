// File: src/storage/sqlite_corpus_store.hpp
#pragma once

#include "index/corpus_source.hpp"
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <sqlite3.h>

namespace pitchsim {

/// Corpus of normalized sequences persisted in SQLite
///
/// Three tables hold the corpus:
/// - sequences: one row per (match_id, sequence_id)
/// - events: one row per event, keyed by its position in the sequence
/// - players: tracked home/away player positions of each event
///
/// LoadSequences() returns sequences ordered by (match_id, sequence_id) with
/// events in their stored order, which is what the index consumes. Saving a
/// sequence replaces any stored sequence with the same key.
class SqliteCorpusStore : public CorpusSource {
public:
    /// Configuration for SqliteCorpusStore
    struct Config {
        /// Path to the SQLite database file
        std::string db_path;

        /// Enable Write-Ahead Logging for better concurrency
        bool enable_wal{true};

        /// Synchronous mode: FULL, NORMAL, or OFF
        std::string synchronous{"NORMAL"};
    };

    /// @param config Configuration options
    /// @throws std::runtime_error if the database cannot be opened or the
    ///         schema cannot be created
    explicit SqliteCorpusStore(const Config& config);

    /// Destructor - closes database connection
    ~SqliteCorpusStore() override;

    // Prevent copying (SQLite connection is not copyable)
    SqliteCorpusStore(const SqliteCorpusStore&) = delete;
    SqliteCorpusStore& operator=(const SqliteCorpusStore&) = delete;

    /// Store one sequence in a single transaction
    /// @return true if committed
    bool Save(const Sequence& sequence);

    /// Store several sequences in one transaction
    /// @return Number of sequences stored (0 if the transaction was rolled back)
    size_t SaveBatch(const std::vector<Sequence>& sequences);

    /// Load one sequence
    std::optional<Sequence> Load(const SequenceKey& key);

    /// Load the whole corpus
    /// @throws std::runtime_error if a query fails
    std::vector<Sequence> LoadSequences() override;

    /// Delete one sequence
    /// @return true if a sequence was deleted
    bool Remove(const SequenceKey& key);

    /// Number of stored sequences
    size_t Count() const;

    /// Number of stored events
    size_t EventCount() const;

    /// Delete everything
    bool Clear();

    const Config& GetConfig() const { return config_; }

private:
    Config config_;
    sqlite3* db_{nullptr};
    mutable std::mutex mutex_;

    void InitializeDatabase();
    void CreateTables();
    bool ExecuteSQL(const std::string& sql) const;

    /// Insert one sequence; caller holds the lock and the transaction
    bool InsertSequence(const Sequence& sequence);
    bool DeleteSequence(const SequenceKey& key);

    /// Load the sequence with `key`, or all sequences; caller holds the lock
    /// @return std::nullopt if a query fails
    std::optional<std::vector<Sequence>> Query(const std::optional<SequenceKey>& key);

    size_t CountRows(const char* table) const;
};

} // namespace pitchsim
