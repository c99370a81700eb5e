// === src/StorageBackend/StorageBackend.cpp ===
#include "StorageBackend.hpp"

bool StorageBackend::appendStat(const std::string& difficulty, const StatSample& s) {
    const auto d = parse_difficulty(difficulty);
    if (!d) return false;
    appendSample(*d, s);
    return true;
}

std::vector<StatSample> StorageBackend::statSnapshot(const std::string& difficulty) {
    const auto d = parse_difficulty(difficulty);
    if (!d) return {};
    return samples(*d);
}
