// === src/ApiRouter/ApiRouter.cpp ===
#include "ApiRouter.hpp"
#include "Logger.hpp"

#include <cctype>
#include <cmath>
#include <iostream>
#include <limits>

using nlohmann::json;

#define PLAYER_PREFIX "/api/scores/player/"

static ApiResponse error_response(int status, const std::string& msg) {
    return ApiResponse{status, json{{"error", msg}}};
}

static std::optional<std::string> first_param(const QueryParams& q, const char* key) {
    auto it = q.find(key);
    if (it == q.end()) return std::nullopt;
    return it->second;
}

json score_to_json(const ScoreRecord& r) {
    json j;
    j["id"]          = r.id;
    j["player_name"] = r.player_name;
    j["score"]       = r.score;
    j["wave"]        = r.wave;
    j["accuracy"]    = r.accuracy ? json(*r.accuracy) : json(nullptr);
    j["difficulty"]  = r.difficulty ? json(*r.difficulty) : json(nullptr);
    j["created_at"]  = r.created_at;
    return j;
}

static json optional_score(const std::optional<ScoreRecord>& r) {
    return r ? score_to_json(*r) : json(nullptr);
}

// Desc: serialize a report in the shape the game client renders
// In: const StatsReport& r
// Out: json
json report_to_json(const StatsReport& r) {
    json j;
    j["difficulty"] = r.difficulty;
    j["games"]      = r.games;
    j["accuracy"]   = {
        {"avg", r.accuracy.avg}, {"median", r.accuracy.median}, {"stdev", r.accuracy.stdev},
        {"min", r.accuracy.min}, {"max", r.accuracy.max}
    };
    j["percentiles"] = {
        {"p10", r.percentiles.p10}, {"p25", r.percentiles.p25}, {"p75", r.percentiles.p75},
        {"p90", r.percentiles.p90}, {"p95", r.percentiles.p95}
    };
    if (r.percentiles.p99) j["percentiles"]["p99"] = *r.percentiles.p99;
    j["distribution"] = {
        {"97-100", r.distribution.top}, {"95-97", r.distribution.great},
        {"90-95", r.distribution.good}, {"80-90", r.distribution.fair},
        {"below_80", r.distribution.low}
    };
    j["score"] = {{"avg", r.score_avg}, {"max", r.score_max}};
    j["wave"]  = {{"avg", r.wave_avg}, {"max", r.wave_max}};
    if (r.trend) j["trend"] = *r.trend;
    return j;
}

// Desc: read a non-negative integer field (score, wave)
// In: const json& data, const char* key
// Out: int64_t; throws ValidationError
static int64_t require_count(const json& data, const char* key) {
    const json& v = data.at(key);
    if (!v.is_number_integer()) {
        throw ValidationError(std::string("Field '") + key + "' must be an integer");
    }
    if (v.is_number_unsigned() &&
        v.get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
        throw ValidationError(std::string("Field '") + key + "' is too large");
    }
    const int64_t n = v.get<int64_t>();
    if (n < 0) throw ValidationError(std::string("Field '") + key + "' must be >= 0");
    return n;
}

static std::optional<std::string> optional_string(const json& data, const char* key) {
    if (!data.contains(key) || data[key].is_null()) return std::nullopt;
    if (!data[key].is_string()) {
        throw ValidationError(std::string("Field '") + key + "' must be a string");
    }
    return data[key].get<std::string>();
}


ApiRouter::ApiRouter(StorageBackend& store, const ConfigManager& config, int log_fd)
    : store_(store), config_(config), log_fd_(log_fd) {
    stats_opts_.include_p99 = config.includeP99();
}

ApiResponse ApiRouter::dispatch(const std::string& method,
                                const std::string& path,
                                const QueryParams& query,
                                const std::string& body) {
    try {
        if (method == "GET") {
            if (path == "/api/scores")
                return getScores(first_param(query, "limit"), first_param(query, "difficulty"));
            if (path == "/api/scores/best")
                return getGlobalBest();
            // name is everything after the prefix, slashes included
            if (path.rfind(PLAYER_PREFIX, 0) == 0)
                return getPlayerBest(path.substr(sizeof(PLAYER_PREFIX) - 1));
            if (path == "/api/stats")
                return getStats(first_param(query, "difficulty"));
            return error_response(404, "Not found");
        }
        if (method == "POST") {
            if (path == "/api/scores") return postScore(body);
            return error_response(404, "Not found");
        }
        return error_response(405, "Method Not Allowed");
    } catch (const ValidationError& e) {
        return error_response(400, e.what());
    } catch (const StorageError& e) {
        std::cerr << e.what() << "\n";
        log_write(log_fd_, std::string("[API] storage failure on ") + method + " " + path + ": " + e.what());
        return error_response(500, "Storage failure");
    }
}

// Desc: parse ?limit=, default from config, clamped to max_limit
// In: const std::optional<std::string>& raw
// Out: int; throws ValidationError on non-numeric or negative input
int ApiRouter::parseLimit(const std::optional<std::string>& raw) const {
    if (!raw) return config_.defaultLimit();
    const std::string& s = *raw;
    if (s.empty() || s.size() > 9) throw ValidationError("Invalid limit: '" + s + "'");
    for (char c : s) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            throw ValidationError("Invalid limit: '" + s + "'");
        }
    }
    const int n = std::stoi(s);
    return n > config_.maxLimit() ? config_.maxLimit() : n;
}

ApiResponse ApiRouter::getScores(const std::optional<std::string>& limit,
                                 const std::optional<std::string>& difficulty) {
    const int n = parseLimit(limit);
    std::optional<std::string> filter;
    if (difficulty && !difficulty->empty()) filter = difficulty;

    json arr = json::array();
    for (const auto& r : store_.topScores(n, filter)) arr.push_back(score_to_json(r));
    return ApiResponse{200, json{{"scores", arr}}};
}

ApiResponse ApiRouter::getGlobalBest() {
    return ApiResponse{200, json{{"best", optional_score(store_.globalBest())}}};
}

ApiResponse ApiRouter::getPlayerBest(const std::string& name) {
    return ApiResponse{200, json{{"best", optional_score(store_.playerBest(name))}}};
}

ApiResponse ApiRouter::getStats(const std::optional<std::string>& difficulty) {
    if (!difficulty || difficulty->empty()) {
        throw ValidationError("Missing difficulty (beginner, normal, expert)");
    }
    const auto d = parse_difficulty(*difficulty);
    if (!d) {
        throw ValidationError("Invalid difficulty '" + *difficulty + "' (beginner, normal, expert)");
    }
    const auto report = Stats::compute(store_.samples(*d), difficulty_name(*d), stats_opts_);
    return ApiResponse{200, json{{"stats", report ? report_to_json(*report) : json(nullptr)}}};
}

// Desc: validate and store a submission; feeds the rolling window when the
//       payload has a known difficulty and an accuracy
// In: const std::string& body (raw request body)
// Out: ApiResponse; throws ValidationError / StorageError
ApiResponse ApiRouter::postScore(const std::string& body) {
    json data = json::object();
    if (!body.empty()) {
        try { data = json::parse(body); }
        catch (const json::parse_error&) { throw ValidationError("Invalid JSON"); }
    }
    if (!data.is_object()) throw ValidationError("Invalid JSON");

    if (!data.contains("score") || !data.contains("wave")) {
        throw ValidationError("Missing required fields: score, wave");
    }

    NewScore s;
    s.score = require_count(data, "score");
    s.wave  = require_count(data, "wave");

    if (data.contains("accuracy") && !data["accuracy"].is_null()) {
        if (!data["accuracy"].is_number()) throw ValidationError("Field 'accuracy' must be a number");
        const double acc = data["accuracy"].get<double>();
        if (!std::isfinite(acc) || acc < 0.0 || acc > 100.0) {
            throw ValidationError("Field 'accuracy' must be between 0 and 100");
        }
        s.accuracy = acc;
    }
    s.difficulty = optional_string(data, "difficulty");
    if (auto name = optional_string(data, "player_name")) s.player_name = *name;

    const int64_t id = store_.saveScore(s);

    // Stats window update is a separate atomic step from the insert above.
    if (s.difficulty && s.accuracy) {
        if (auto d = parse_difficulty(*s.difficulty)) {
            StatSample sample;
            sample.accuracy = *s.accuracy;
            sample.score    = s.score;
            sample.wave     = s.wave;
            store_.appendSample(*d, sample);
            if (config_.logReports()) reportWindow(*d);
        }
    }

    return ApiResponse{200, json{
        {"id", id},
        {"saved", true},
        {"best", optional_score(store_.globalBest())}
    }};
}

// Desc: print the window report after a submission; a storage failure here
//       is logged only, the score and sample are already committed
// In: Difficulty d
// Out: void
void ApiRouter::reportWindow(Difficulty d) {
    std::optional<StatsReport> report;
    try {
        report = Stats::compute(store_.samples(d), difficulty_name(d), stats_opts_);
    } catch (const StorageError& e) {
        std::cerr << "[API] stats report skipped: " << e.what() << "\n";
        log_write(log_fd_, std::string("[API] stats report skipped: ") + e.what());
        return;
    }
    if (!report) return;
    const std::string text = Stats::format_report(*report);
    std::cout << text << std::flush;
    log_write(log_fd_, text);
}
