#pragma once
#include "GameRecords.hpp"
#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

// Raised by backends when the underlying store fails.
class StorageError : public std::runtime_error {
public:
    explicit StorageError(const std::string& what) : std::runtime_error(what) {}
};

// Persistence seam used by the API layer. Every call is atomic on its own;
// there are no cross-call transactions.
class StorageBackend {
public:
    virtual ~StorageBackend() = default;

    // create tables / indexes; false with err filled on failure
    virtual bool init(std::string& err) = 0;

    // Score store (append-only)
    virtual int64_t saveScore(const NewScore& s) = 0;
    virtual std::vector<ScoreRecord> topScores(int limit,
                                               const std::optional<std::string>& difficulty) = 0;
    virtual std::optional<ScoreRecord> globalBest() = 0;
    virtual std::optional<ScoreRecord> playerBest(const std::string& name) = 0;

    // Rolling stats window: insert then keep the newest windowSize() rows
    virtual void appendSample(Difficulty d, const StatSample& s) = 0;
    // newest first
    virtual std::vector<StatSample> samples(Difficulty d) = 0;
    virtual size_t windowSize() const = 0;

    // Name-based entry points. Unknown difficulty: append is a no-op returning
    // false, snapshot is empty.
    bool appendStat(const std::string& difficulty, const StatSample& s);
    std::vector<StatSample> statSnapshot(const std::string& difficulty);
};
