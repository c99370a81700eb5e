#pragma once
#include "ConfigManager.hpp"
#include "StorageBackend.hpp"
#include "StatsAggregator.hpp"
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>

// Bad request input; mapped to HTTP 400.
class ValidationError : public std::runtime_error {
public:
    explicit ValidationError(const std::string& what) : std::runtime_error(what) {}
};

struct ApiResponse {
    int status = 200;
    nlohmann::json body;
};

using QueryParams = std::multimap<std::string, std::string>;

nlohmann::json score_to_json(const ScoreRecord& r);
nlohmann::json report_to_json(const StatsReport& r);

// Transport-independent handling of the /api/ surface. The storage backend is
// injected once at startup and shared by every connection.
class ApiRouter {
public:
    ApiRouter(StorageBackend& store, const ConfigManager& config, int log_fd = -1);

    // Routes method + path (already URL-decoded) to a handler and maps
    // ValidationError -> 400, StorageError -> 500, no route -> 404.
    ApiResponse dispatch(const std::string& method,
                         const std::string& path,
                         const QueryParams& query,
                         const std::string& body);

    ApiResponse getScores(const std::optional<std::string>& limit,
                          const std::optional<std::string>& difficulty);
    ApiResponse getGlobalBest();
    ApiResponse getPlayerBest(const std::string& name);
    ApiResponse getStats(const std::optional<std::string>& difficulty);
    ApiResponse postScore(const std::string& body);

private:
    int parseLimit(const std::optional<std::string>& raw) const;
    void reportWindow(Difficulty d);

    StorageBackend& store_;
    const ConfigManager& config_;
    StatsOptions stats_opts_;
    int log_fd_;
};
