// File: src/storage/sqlite_corpus_store.cpp
#include "storage/sqlite_corpus_store.hpp"
#include <map>
#include <sstream>
#include <stdexcept>

namespace pitchsim {

namespace {

std::string ColumnText(sqlite3_stmt* stmt, int column) {
    const unsigned char* text = sqlite3_column_text(stmt, column);
    if (text == nullptr) {
        return std::string();
    }
    return std::string(reinterpret_cast<const char*>(text),
                       static_cast<size_t>(sqlite3_column_bytes(stmt, column)));
}

void BindText(sqlite3_stmt* stmt, int index, const std::string& value) {
    sqlite3_bind_text(stmt, index, value.c_str(), static_cast<int>(value.size()),
                      SQLITE_TRANSIENT);
}

std::string JoinIds(const std::vector<int64_t>& ids) {
    std::ostringstream ss;
    for (size_t i = 0; i < ids.size(); ++i) {
        if (i > 0) {
            ss << ',';
        }
        ss << ids[i];
    }
    return ss.str();
}

std::vector<int64_t> SplitIds(const std::string& text) {
    std::vector<int64_t> ids;
    std::istringstream ss(text);
    std::string item;
    while (std::getline(ss, item, ',')) {
        if (item.empty()) {
            continue;
        }
        try {
            ids.push_back(std::stoll(item));
        } catch (const std::exception&) {
            // Malformed id: skip it, the rest of the list is still usable
        }
    }
    return ids;
}

enum Side : int {
    SIDE_HOME = 0,
    SIDE_AWAY = 1,
};

constexpr const char* kKeyFilter = " WHERE match_id = ? AND sequence_id = ?";

} // namespace

// ============================================================================
// Constructor and Destructor
// ============================================================================

SqliteCorpusStore::SqliteCorpusStore(const Config& config)
    : config_(config) {

    int rc = sqlite3_open(config_.db_path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        std::string error = sqlite3_errmsg(db_);
        sqlite3_close(db_);
        db_ = nullptr;
        throw std::runtime_error("Failed to open corpus database: " + error);
    }

    try {
        InitializeDatabase();
    } catch (const std::exception&) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }
}

SqliteCorpusStore::~SqliteCorpusStore() {
    if (db_) {
        sqlite3_close_v2(db_);
        db_ = nullptr;
    }
}

// ============================================================================
// Database Initialization
// ============================================================================

void SqliteCorpusStore::InitializeDatabase() {
    std::lock_guard<std::mutex> lock(mutex_);

    // Fail lock waits after 5 seconds instead of blocking forever
    sqlite3_busy_timeout(db_, 5000);

    if (config_.enable_wal) {
        ExecuteSQL("PRAGMA journal_mode=WAL;");
    }
    ExecuteSQL("PRAGMA synchronous=" + config_.synchronous + ";");

    CreateTables();
}

void SqliteCorpusStore::CreateTables() {
    const char* create_sequences = R"(
        CREATE TABLE IF NOT EXISTS sequences (
            match_id TEXT NOT NULL,
            sequence_id INTEGER NOT NULL,
            set_piece TEXT NOT NULL DEFAULT '',
            time TEXT NOT NULL DEFAULT '',
            team_id TEXT NOT NULL DEFAULT '',
            PRIMARY KEY (match_id, sequence_id)
        );
    )";

    const char* create_events = R"(
        CREATE TABLE IF NOT EXISTS events (
            match_id TEXT NOT NULL,
            sequence_id INTEGER NOT NULL,
            event_index INTEGER NOT NULL,
            event_id TEXT NOT NULL DEFAULT '',
            type_code TEXT NOT NULL DEFAULT '',
            set_piece TEXT NOT NULL DEFAULT '',
            time TEXT NOT NULL DEFAULT '',
            period INTEGER NOT NULL DEFAULT 1,
            team_id TEXT NOT NULL DEFAULT '',
            team_name TEXT NOT NULL DEFAULT '',
            player_id INTEGER NOT NULL DEFAULT 0,
            player_name TEXT NOT NULL DEFAULT '',
            secondary_player_id INTEGER NOT NULL DEFAULT 0,
            secondary_player_name TEXT NOT NULL DEFAULT '',
            key_player_ids TEXT NOT NULL DEFAULT '',
            has_ball_position INTEGER NOT NULL DEFAULT 0,
            ball_x REAL NOT NULL DEFAULT 0,
            ball_y REAL NOT NULL DEFAULT 0,
            ball_z REAL NOT NULL DEFAULT 0,
            pass_type TEXT NOT NULL DEFAULT '',
            shot_type TEXT NOT NULL DEFAULT '',
            pressure_type TEXT NOT NULL DEFAULT '',
            outcome TEXT NOT NULL DEFAULT '',
            is_goal INTEGER NOT NULL DEFAULT 0,
            PRIMARY KEY (match_id, sequence_id, event_index)
        );
    )";

    const char* create_players = R"(
        CREATE TABLE IF NOT EXISTS players (
            match_id TEXT NOT NULL,
            sequence_id INTEGER NOT NULL,
            event_index INTEGER NOT NULL,
            side INTEGER NOT NULL,
            slot INTEGER NOT NULL,
            player_id INTEGER NOT NULL DEFAULT 0,
            jersey_number INTEGER NOT NULL DEFAULT 0,
            x REAL NOT NULL DEFAULT 0,
            y REAL NOT NULL DEFAULT 0,
            z REAL NOT NULL DEFAULT 0,
            PRIMARY KEY (match_id, sequence_id, event_index, side, slot)
        );
    )";

    if (!ExecuteSQL(create_sequences) || !ExecuteSQL(create_events) ||
        !ExecuteSQL(create_players)) {
        throw std::runtime_error("Failed to create corpus tables");
    }
}

bool SqliteCorpusStore::ExecuteSQL(const std::string& sql) const {
    char* error_msg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &error_msg);

    if (rc != SQLITE_OK) {
        if (error_msg) {
            sqlite3_free(error_msg);
        }
        return false;
    }

    return true;
}

// ============================================================================
// Writes
// ============================================================================

bool SqliteCorpusStore::Save(const Sequence& sequence) {
    return SaveBatch({sequence}) == 1;
}

size_t SqliteCorpusStore::SaveBatch(const std::vector<Sequence>& sequences) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (sequences.empty()) {
        return 0;
    }

    if (!ExecuteSQL("BEGIN TRANSACTION;")) {
        return 0;
    }

    for (const auto& sequence : sequences) {
        if (!DeleteSequence(sequence.key) || !InsertSequence(sequence)) {
            ExecuteSQL("ROLLBACK;");
            return 0;
        }
    }

    if (!ExecuteSQL("COMMIT;")) {
        ExecuteSQL("ROLLBACK;");
        return 0;
    }
    return sequences.size();
}

bool SqliteCorpusStore::InsertSequence(const Sequence& sequence) {
    const SequenceKey& key = sequence.key;

    sqlite3_stmt* stmt;
    const char* sequence_sql =
        "INSERT INTO sequences (match_id, sequence_id, set_piece, time, team_id) "
        "VALUES (?, ?, ?, ?, ?);";
    if (sqlite3_prepare_v2(db_, sequence_sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return false;
    }
    BindText(stmt, 1, key.match_id);
    sqlite3_bind_int64(stmt, 2, key.sequence_id);
    BindText(stmt, 3, sequence.set_piece);
    BindText(stmt, 4, sequence.time);
    BindText(stmt, 5, sequence.team_id);
    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        return false;
    }

    const char* event_sql =
        "INSERT INTO events (match_id, sequence_id, event_index, event_id, type_code, "
        "set_piece, time, period, team_id, team_name, player_id, player_name, "
        "secondary_player_id, secondary_player_name, key_player_ids, has_ball_position, "
        "ball_x, ball_y, ball_z, pass_type, shot_type, pressure_type, outcome, is_goal) "
        "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?);";
    const char* player_sql =
        "INSERT INTO players (match_id, sequence_id, event_index, side, slot, player_id, "
        "jersey_number, x, y, z) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?);";

    sqlite3_stmt* event_stmt;
    if (sqlite3_prepare_v2(db_, event_sql, -1, &event_stmt, nullptr) != SQLITE_OK) {
        return false;
    }
    sqlite3_stmt* player_stmt;
    if (sqlite3_prepare_v2(db_, player_sql, -1, &player_stmt, nullptr) != SQLITE_OK) {
        sqlite3_finalize(event_stmt);
        return false;
    }

    bool ok = true;
    for (size_t index = 0; ok && index < sequence.events.size(); ++index) {
        const Event& e = sequence.events[index];

        BindText(event_stmt, 1, key.match_id);
        sqlite3_bind_int64(event_stmt, 2, key.sequence_id);
        sqlite3_bind_int64(event_stmt, 3, static_cast<int64_t>(index));
        BindText(event_stmt, 4, e.event_id);
        BindText(event_stmt, 5, e.type_code);
        BindText(event_stmt, 6, e.set_piece);
        BindText(event_stmt, 7, e.time);
        sqlite3_bind_int(event_stmt, 8, e.period);
        BindText(event_stmt, 9, e.team_id);
        BindText(event_stmt, 10, e.team_name);
        sqlite3_bind_int64(event_stmt, 11, e.player_id);
        BindText(event_stmt, 12, e.player_name);
        sqlite3_bind_int64(event_stmt, 13, e.secondary_player_id);
        BindText(event_stmt, 14, e.secondary_player_name);
        BindText(event_stmt, 15, JoinIds(e.key_player_ids));
        sqlite3_bind_int(event_stmt, 16, e.has_ball_position ? 1 : 0);
        sqlite3_bind_double(event_stmt, 17, e.ball.x);
        sqlite3_bind_double(event_stmt, 18, e.ball.y);
        sqlite3_bind_double(event_stmt, 19, e.ball.z);
        BindText(event_stmt, 20, e.pass_type);
        BindText(event_stmt, 21, e.shot_type);
        BindText(event_stmt, 22, e.pressure_type);
        BindText(event_stmt, 23, e.outcome);
        sqlite3_bind_int(event_stmt, 24, e.is_goal ? 1 : 0);

        ok = sqlite3_step(event_stmt) == SQLITE_DONE;
        sqlite3_reset(event_stmt);

        for (int side : {SIDE_HOME, SIDE_AWAY}) {
            const auto& players = side == SIDE_HOME ? e.home_players : e.away_players;
            for (size_t slot = 0; ok && slot < players.size(); ++slot) {
                const PlayerPosition& p = players[slot];
                BindText(player_stmt, 1, key.match_id);
                sqlite3_bind_int64(player_stmt, 2, key.sequence_id);
                sqlite3_bind_int64(player_stmt, 3, static_cast<int64_t>(index));
                sqlite3_bind_int(player_stmt, 4, side);
                sqlite3_bind_int64(player_stmt, 5, static_cast<int64_t>(slot));
                sqlite3_bind_int64(player_stmt, 6, p.player_id);
                sqlite3_bind_int(player_stmt, 7, p.jersey_number);
                sqlite3_bind_double(player_stmt, 8, p.position.x);
                sqlite3_bind_double(player_stmt, 9, p.position.y);
                sqlite3_bind_double(player_stmt, 10, p.position.z);

                ok = sqlite3_step(player_stmt) == SQLITE_DONE;
                sqlite3_reset(player_stmt);
            }
        }
    }

    sqlite3_finalize(event_stmt);
    sqlite3_finalize(player_stmt);
    return ok;
}

bool SqliteCorpusStore::DeleteSequence(const SequenceKey& key) {
    for (const char* table : {"players", "events", "sequences"}) {
        std::string sql = std::string("DELETE FROM ") + table + kKeyFilter + ";";
        sqlite3_stmt* stmt;
        if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
            return false;
        }
        BindText(stmt, 1, key.match_id);
        sqlite3_bind_int64(stmt, 2, key.sequence_id);
        int rc = sqlite3_step(stmt);
        sqlite3_finalize(stmt);
        if (rc != SQLITE_DONE) {
            return false;
        }
    }
    return true;
}

bool SqliteCorpusStore::Remove(const SequenceKey& key) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!ExecuteSQL("BEGIN TRANSACTION;")) {
        return false;
    }
    if (!DeleteSequence(key)) {
        ExecuteSQL("ROLLBACK;");
        return false;
    }
    int removed = sqlite3_changes(db_);  // rows deleted from sequences
    if (!ExecuteSQL("COMMIT;")) {
        ExecuteSQL("ROLLBACK;");
        return false;
    }
    return removed > 0;
}

bool SqliteCorpusStore::Clear() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!ExecuteSQL("BEGIN TRANSACTION;")) {
        return false;
    }
    if (!ExecuteSQL("DELETE FROM players; DELETE FROM events; DELETE FROM sequences;") ||
        !ExecuteSQL("COMMIT;")) {
        ExecuteSQL("ROLLBACK;");
        return false;
    }
    return true;
}

// ============================================================================
// Reads
// ============================================================================

std::optional<Sequence> SqliteCorpusStore::Load(const SequenceKey& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto sequences = Query(key);
    if (!sequences || sequences->empty()) {
        return std::nullopt;
    }
    return std::move(sequences->front());
}

std::vector<Sequence> SqliteCorpusStore::LoadSequences() {
    std::lock_guard<std::mutex> lock(mutex_);
    auto sequences = Query(std::nullopt);
    if (!sequences) {
        throw std::runtime_error(std::string("Failed to load corpus: ") + sqlite3_errmsg(db_));
    }
    return std::move(*sequences);
}

std::optional<std::vector<Sequence>> SqliteCorpusStore::Query(
    const std::optional<SequenceKey>& key) {

    std::string filter = key ? kKeyFilter : "";
    std::map<SequenceKey, Sequence> loaded;

    auto prepare = [this, &key](const std::string& sql, sqlite3_stmt** stmt) {
        if (sqlite3_prepare_v2(db_, sql.c_str(), -1, stmt, nullptr) != SQLITE_OK) {
            return false;
        }
        if (key) {
            BindText(*stmt, 1, key->match_id);
            sqlite3_bind_int64(*stmt, 2, key->sequence_id);
        }
        return true;
    };

    // Sequences
    sqlite3_stmt* stmt;
    if (!prepare("SELECT match_id, sequence_id, set_piece, time, team_id FROM sequences" +
                     filter + " ORDER BY match_id, sequence_id;", &stmt)) {
        return std::nullopt;
    }
    int rc;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        Sequence sequence;
        sequence.key = SequenceKey(ColumnText(stmt, 0), sqlite3_column_int64(stmt, 1));
        sequence.set_piece = ColumnText(stmt, 2);
        sequence.time = ColumnText(stmt, 3);
        sequence.team_id = ColumnText(stmt, 4);
        loaded.emplace(sequence.key, std::move(sequence));
    }
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        return std::nullopt;
    }

    // Events
    if (!prepare("SELECT match_id, sequence_id, event_index, event_id, type_code, set_piece, "
                 "time, period, team_id, team_name, player_id, player_name, "
                 "secondary_player_id, secondary_player_name, key_player_ids, "
                 "has_ball_position, ball_x, ball_y, ball_z, pass_type, shot_type, "
                 "pressure_type, outcome, is_goal FROM events" + filter +
                     " ORDER BY match_id, sequence_id, event_index;", &stmt)) {
        return std::nullopt;
    }
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        auto it = loaded.find(SequenceKey(ColumnText(stmt, 0), sqlite3_column_int64(stmt, 1)));
        if (it == loaded.end()) {
            continue;
        }

        Event e;
        e.event_id = ColumnText(stmt, 3);
        e.type_code = ColumnText(stmt, 4);
        e.type = ParseEventType(e.type_code);
        e.set_piece = ColumnText(stmt, 5);
        e.time = ColumnText(stmt, 6);
        e.period = sqlite3_column_int(stmt, 7);
        e.team_id = ColumnText(stmt, 8);
        e.team_name = ColumnText(stmt, 9);
        e.player_id = sqlite3_column_int64(stmt, 10);
        e.player_name = ColumnText(stmt, 11);
        e.secondary_player_id = sqlite3_column_int64(stmt, 12);
        e.secondary_player_name = ColumnText(stmt, 13);
        e.key_player_ids = SplitIds(ColumnText(stmt, 14));
        e.has_ball_position = sqlite3_column_int(stmt, 15) != 0;
        e.ball = Position(static_cast<float>(sqlite3_column_double(stmt, 16)),
                          static_cast<float>(sqlite3_column_double(stmt, 17)),
                          static_cast<float>(sqlite3_column_double(stmt, 18)));
        e.pass_type = ColumnText(stmt, 19);
        e.shot_type = ColumnText(stmt, 20);
        e.pressure_type = ColumnText(stmt, 21);
        e.outcome = ColumnText(stmt, 22);
        e.is_goal = sqlite3_column_int(stmt, 23) != 0;

        it->second.events.push_back(std::move(e));
    }
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        return std::nullopt;
    }

    // Players
    if (!prepare("SELECT match_id, sequence_id, event_index, side, player_id, jersey_number, "
                 "x, y, z FROM players" + filter +
                     " ORDER BY match_id, sequence_id, event_index, side, slot;", &stmt)) {
        return std::nullopt;
    }
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        auto it = loaded.find(SequenceKey(ColumnText(stmt, 0), sqlite3_column_int64(stmt, 1)));
        if (it == loaded.end()) {
            continue;
        }
        int64_t index = sqlite3_column_int64(stmt, 2);
        if (index < 0 || static_cast<size_t>(index) >= it->second.events.size()) {
            continue;
        }
        Event& e = it->second.events[static_cast<size_t>(index)];

        PlayerPosition p;
        p.player_id = sqlite3_column_int64(stmt, 4);
        p.jersey_number = sqlite3_column_int(stmt, 5);
        p.position = Position(static_cast<float>(sqlite3_column_double(stmt, 6)),
                              static_cast<float>(sqlite3_column_double(stmt, 7)),
                              static_cast<float>(sqlite3_column_double(stmt, 8)));
        if (sqlite3_column_int(stmt, 3) == SIDE_HOME) {
            e.home_players.push_back(p);
        } else {
            e.away_players.push_back(p);
        }
    }
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        return std::nullopt;
    }

    std::vector<Sequence> sequences;
    sequences.reserve(loaded.size());
    for (auto& [k, sequence] : loaded) {
        sequences.push_back(std::move(sequence));
    }
    return sequences;
}

size_t SqliteCorpusStore::Count() const {
    return CountRows("sequences");
}

size_t SqliteCorpusStore::EventCount() const {
    return CountRows("events");
}

size_t SqliteCorpusStore::CountRows(const char* table) const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::string sql = std::string("SELECT COUNT(*) FROM ") + table + ";";
    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        return 0;
    }

    size_t count = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        count = static_cast<size_t>(sqlite3_column_int64(stmt, 0));
    }
    sqlite3_finalize(stmt);
    return count;
}

} // namespace pitchsim
