#pragma once
#include "StorageBackend.hpp"
#include <cstddef>
#include <mutex>
#include <sqlite3.h>

// SQLite adapter. Does not own the connection; the handle comes from startup
// (or a test) and must outlive this object. A single mutex serializes every
// operation so a snapshot never sees a half-pruned window.
class SqliteBackend final : public StorageBackend {
public:
    static constexpr size_t kDefaultWindowSize = 200;

    explicit SqliteBackend(sqlite3* db, size_t window_size = kDefaultWindowSize)
        : db_(db), window_size_(window_size) {}

    bool init(std::string& err) override;

    int64_t saveScore(const NewScore& s) override;
    std::vector<ScoreRecord> topScores(int limit,
                                       const std::optional<std::string>& difficulty) override;
    std::optional<ScoreRecord> globalBest() override;
    std::optional<ScoreRecord> playerBest(const std::string& name) override;

    void appendSample(Difficulty d, const StatSample& s) override;
    std::vector<StatSample> samples(Difficulty d) override;
    size_t windowSize() const override { return window_size_; }

private:
    sqlite3* db_{nullptr};
    size_t   window_size_;
    std::mutex mu_;
};
