// === src/GameRecords/GameRecords.cpp ===
#include "GameRecords.hpp"

// Desc: map a difficulty string to its tier
// In: const std::string& s
// Out: std::optional<Difficulty> (nullopt if not one of the three tiers)
std::optional<Difficulty> parse_difficulty(const std::string& s) {
    if (s == "beginner") return Difficulty::Beginner;
    if (s == "normal")   return Difficulty::Normal;
    if (s == "expert")   return Difficulty::Expert;
    return std::nullopt;
}

const char* difficulty_name(Difficulty d) {
    switch (d) {
        case Difficulty::Beginner: return "beginner";
        case Difficulty::Normal:   return "normal";
        case Difficulty::Expert:   return "expert";
    }
    return "unknown";
}
