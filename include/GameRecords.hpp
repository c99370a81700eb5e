#pragma once
#include <array>
#include <cstdint>
#include <optional>
#include <string>

enum class Difficulty : uint8_t { Beginner = 0, Normal = 1, Expert = 2 };

inline constexpr std::array<Difficulty, 3> kAllDifficulties = {
    Difficulty::Beginner, Difficulty::Normal, Difficulty::Expert
};

// Exact, case-sensitive match on "beginner" / "normal" / "expert".
std::optional<Difficulty> parse_difficulty(const std::string& s);
const char* difficulty_name(Difficulty d);

// Permanent leaderboard row.
struct ScoreRecord {
    int64_t id = 0;
    std::string player_name;
    int64_t score = 0;
    int64_t wave = 0;
    std::optional<double> accuracy;
    std::optional<std::string> difficulty;
    std::string created_at;     // "YYYY-MM-DD HH:MM:SS" (UTC)
};

// Submission payload before the store assigns id / created_at.
struct NewScore {
    std::string player_name;    // empty -> "Anonymous"
    int64_t score = 0;
    int64_t wave = 0;
    std::optional<double> accuracy;
    std::optional<std::string> difficulty;
};

// Rolling-window entry. accuracy is NaN when the stored value was NULL.
struct StatSample {
    double accuracy = 0.0;
    int64_t score = 0;
    int64_t wave = 0;
    std::string created_at;
};
