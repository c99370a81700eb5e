// === src/StorageBackend/SqliteBackend.cpp ===
#include "SqliteBackend.hpp"
#include <cmath>
#include <iostream>
#include <memory>
#include <string>
#include <utility>
#include <vector>

// Create tables query (stats_* tables are added per difficulty in init)
static const char* kSchemaSQL = R"SQL(
CREATE TABLE IF NOT EXISTS scores (
  id          INTEGER PRIMARY KEY AUTOINCREMENT,
  player_name TEXT DEFAULT 'Anonymous',
  score       INTEGER NOT NULL,
  wave        INTEGER NOT NULL,
  accuracy    REAL,
  difficulty  TEXT,
  created_at  TIMESTAMP DEFAULT CURRENT_TIMESTAMP
);

CREATE INDEX IF NOT EXISTS idx_scores_score ON scores(score DESC);
CREATE INDEX IF NOT EXISTS idx_scores_player ON scores(player_name);
)SQL";

static const char* kScoreColumns =
    "SELECT id, player_name, score, wave, accuracy, difficulty, created_at FROM scores ";

using StmtPtr = std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)>;

static const char* table_for(Difficulty d) {
    switch (d) {
        case Difficulty::Beginner: return "stats_beginner";
        case Difficulty::Normal:   return "stats_normal";
        case Difficulty::Expert:   return "stats_expert";
    }
    throw StorageError("unknown difficulty bucket");
}

// Desc: prepare a statement or throw with the sqlite error text
// In: sqlite3* db, const std::string& sql
// Out: StmtPtr (finalized on scope exit)
static StmtPtr prepare(sqlite3* db, const std::string& sql) {
    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &raw, nullptr) != SQLITE_OK) {
        if (raw) sqlite3_finalize(raw);
        throw StorageError("[Storage] prepare failed: " + std::string(sqlite3_errmsg(db)));
    }
    return StmtPtr(raw, &sqlite3_finalize);
}

static void exec_or_throw(sqlite3* db, const std::string& sql, const char* where) {
    char* err = nullptr;
    if (sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
        std::string e = err ? err : "unknown";
        if (err) sqlite3_free(err);
        throw StorageError(std::string("[Storage] ") + where + ": " + e);
    }
}

static void step_done(sqlite3* db, sqlite3_stmt* st, const char* where) {
    if (sqlite3_step(st) != SQLITE_DONE) {
        throw StorageError(std::string("[Storage] ") + where + ": " + sqlite3_errmsg(db));
    }
}

static std::string column_string(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    return t ? std::string(reinterpret_cast<const char*>(t)) : std::string();
}

static ScoreRecord read_score_row(sqlite3_stmt* st) {
    ScoreRecord r;
    r.id          = sqlite3_column_int64(st, 0);
    r.player_name = column_string(st, 1);
    r.score       = sqlite3_column_int64(st, 2);
    r.wave        = sqlite3_column_int64(st, 3);
    if (sqlite3_column_type(st, 4) != SQLITE_NULL) r.accuracy = sqlite3_column_double(st, 4);
    if (sqlite3_column_type(st, 5) != SQLITE_NULL) r.difficulty = column_string(st, 5);
    r.created_at  = column_string(st, 6);
    return r;
}

// Desc: run a query expected to yield at most one score row
// In: sqlite3* db, StmtPtr& st (already bound)
// Out: std::optional<ScoreRecord>
static std::optional<ScoreRecord> fetch_one(sqlite3* db, StmtPtr& st) {
    const int rc = sqlite3_step(st.get());
    if (rc == SQLITE_ROW) return read_score_row(st.get());
    if (rc == SQLITE_DONE) return std::nullopt;
    throw StorageError("[Storage] query failed: " + std::string(sqlite3_errmsg(db)));
}


// Desc: create scores table and the three rolling-window tables
// In: std::string& err
// Out: bool (true on success)
bool SqliteBackend::init(std::string& err) {
    if (!db_) { err = "[Storage] no database handle"; return false; }
    std::lock_guard<std::mutex> lk(mu_);
    try {
        exec_or_throw(db_, kSchemaSQL, "schema");
        for (Difficulty d : kAllDifficulties) {
            const std::string t = table_for(d);
            exec_or_throw(db_,
                "CREATE TABLE IF NOT EXISTS " + t + " ("
                "  id         INTEGER PRIMARY KEY AUTOINCREMENT,"
                "  accuracy   REAL,"
                "  score      INTEGER NOT NULL DEFAULT 0,"
                "  wave       INTEGER NOT NULL DEFAULT 0,"
                "  created_at TIMESTAMP DEFAULT CURRENT_TIMESTAMP"
                ");"
                "CREATE INDEX IF NOT EXISTS idx_" + t + "_created ON " + t + "(created_at DESC);",
                "schema");
        }
    } catch (const StorageError& e) {
        err = e.what();
        return false;
    }
    return true;
}

int64_t SqliteBackend::saveScore(const NewScore& s) {
    std::lock_guard<std::mutex> lk(mu_);
    auto st = prepare(db_,
        "INSERT INTO scores (player_name, score, wave, accuracy, difficulty) "
        "VALUES (?, ?, ?, ?, ?);");

    const std::string name = s.player_name.empty() ? "Anonymous" : s.player_name;
    sqlite3_bind_text(st.get(), 1, name.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(st.get(), 2, static_cast<sqlite3_int64>(s.score));
    sqlite3_bind_int64(st.get(), 3, static_cast<sqlite3_int64>(s.wave));
    if (s.accuracy) sqlite3_bind_double(st.get(), 4, *s.accuracy);
    else            sqlite3_bind_null(st.get(), 4);
    if (s.difficulty) sqlite3_bind_text(st.get(), 5, s.difficulty->c_str(), -1, SQLITE_TRANSIENT);
    else              sqlite3_bind_null(st.get(), 5);

    step_done(db_, st.get(), "saveScore");
    return static_cast<int64_t>(sqlite3_last_insert_rowid(db_));
}

// Desc: leaderboard query, score DESC with id ASC as the stable tie order
// In: int limit, const std::optional<std::string>& difficulty
// Out: std::vector<ScoreRecord> (at most limit rows)
std::vector<ScoreRecord> SqliteBackend::topScores(int limit,
                                                  const std::optional<std::string>& difficulty) {
    std::vector<ScoreRecord> out;
    if (limit <= 0) return out;

    std::lock_guard<std::mutex> lk(mu_);
    std::string sql = kScoreColumns;
    if (difficulty) sql += "WHERE difficulty = ? ";
    sql += "ORDER BY score DESC, id ASC LIMIT ?;";

    auto st = prepare(db_, sql);
    int idx = 1;
    if (difficulty) sqlite3_bind_text(st.get(), idx++, difficulty->c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int(st.get(), idx, limit);

    int rc;
    while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
        out.push_back(read_score_row(st.get()));
    }
    if (rc != SQLITE_DONE) {
        throw StorageError("[Storage] topScores: " + std::string(sqlite3_errmsg(db_)));
    }
    return out;
}

std::optional<ScoreRecord> SqliteBackend::globalBest() {
    std::lock_guard<std::mutex> lk(mu_);
    auto st = prepare(db_, std::string(kScoreColumns) + "ORDER BY score DESC, id ASC LIMIT 1;");
    return fetch_one(db_, st);
}

std::optional<ScoreRecord> SqliteBackend::playerBest(const std::string& name) {
    std::lock_guard<std::mutex> lk(mu_);
    // '=' on TEXT uses BINARY collation, so the match is case-sensitive
    auto st = prepare(db_, std::string(kScoreColumns) +
                           "WHERE player_name = ? ORDER BY score DESC, id ASC LIMIT 1;");
    sqlite3_bind_text(st.get(), 1, name.c_str(), -1, SQLITE_TRANSIENT);
    return fetch_one(db_, st);
}

// Desc: insert a sample then trim the bucket to the newest window_size_ rows,
//       both inside one IMMEDIATE transaction
// In: Difficulty d, const StatSample& s
// Out: void; throws StorageError (transaction rolled back)
void SqliteBackend::appendSample(Difficulty d, const StatSample& s) {
    std::lock_guard<std::mutex> lk(mu_);
    const std::string table = table_for(d);

    exec_or_throw(db_, "BEGIN IMMEDIATE;", "appendSample begin");
    try {
        {
            auto ins = prepare(db_,
                "INSERT INTO " + table + " (accuracy, score, wave, created_at) "
                "VALUES (?, ?, ?, COALESCE(?, CURRENT_TIMESTAMP));");
            if (std::isfinite(s.accuracy)) sqlite3_bind_double(ins.get(), 1, s.accuracy);
            else                           sqlite3_bind_null(ins.get(), 1);
            sqlite3_bind_int64(ins.get(), 2, static_cast<sqlite3_int64>(s.score));
            sqlite3_bind_int64(ins.get(), 3, static_cast<sqlite3_int64>(s.wave));
            if (!s.created_at.empty())
                sqlite3_bind_text(ins.get(), 4, s.created_at.c_str(), -1, SQLITE_TRANSIENT);
            else
                sqlite3_bind_null(ins.get(), 4);
            step_done(db_, ins.get(), "appendSample insert");
        }
        {
            auto del = prepare(db_,
                "DELETE FROM " + table + " WHERE id NOT IN ("
                "  SELECT id FROM " + table +
                "  ORDER BY created_at DESC, id DESC LIMIT ?"
                ");");
            sqlite3_bind_int64(del.get(), 1, static_cast<sqlite3_int64>(window_size_));
            step_done(db_, del.get(), "appendSample prune");
            #ifdef DEBUG
            std::cerr << "[Storage] " << table << " pruned " << sqlite3_changes(db_) << " rows\n";
            #endif
        }
        exec_or_throw(db_, "COMMIT;", "appendSample commit");
    } catch (...) {
        sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, nullptr);
        throw;
    }
}

std::vector<StatSample> SqliteBackend::samples(Difficulty d) {
    std::lock_guard<std::mutex> lk(mu_);
    const std::string table = table_for(d);
    auto st = prepare(db_,
        "SELECT accuracy, score, wave, created_at FROM " + table +
        " ORDER BY created_at DESC, id DESC;");

    std::vector<StatSample> out;
    out.reserve(window_size_);
    int rc;
    while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
        StatSample s;
        s.accuracy   = (sqlite3_column_type(st.get(), 0) == SQLITE_NULL)
                       ? std::nan("")
                       : sqlite3_column_double(st.get(), 0);
        s.score      = sqlite3_column_int64(st.get(), 1);
        s.wave       = sqlite3_column_int64(st.get(), 2);
        s.created_at = column_string(st.get(), 3);
        out.push_back(std::move(s));
    }
    if (rc != SQLITE_DONE) {
        throw StorageError("[Storage] samples: " + std::string(sqlite3_errmsg(db_)));
    }
    return out;
}
