#pragma once
#include "GameRecords.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

struct AccuracySummary {
    double avg = 0.0;
    double median = 0.0;
    double stdev = 0.0;
    double min = 0.0;
    double max = 0.0;
};

struct PercentileSet {
    double p10 = 0.0;
    double p25 = 0.0;
    double p75 = 0.0;
    double p90 = 0.0;
    double p95 = 0.0;
    std::optional<double> p99;      // only when StatsOptions::include_p99
};

// Right-open accuracy bins; counts always sum to StatsReport::games.
struct AccuracyDistribution {
    size_t top = 0;        // [97, 100]
    size_t great = 0;      // [95, 97)
    size_t good = 0;       // [90, 95)
    size_t fair = 0;       // [80, 90)
    size_t low = 0;        // below 80

    size_t total() const { return top + great + good + fair + low; }
};

struct StatsReport {
    std::string difficulty;
    size_t games = 0;
    AccuracySummary accuracy;
    PercentileSet percentiles;
    AccuracyDistribution distribution;
    int64_t score_avg = 0;
    int64_t score_max = 0;
    double  wave_avg = 0.0;
    int64_t wave_max = 0;
    std::optional<double> trend;    // present only when games >= kTrendMinGames
};

struct StatsOptions {
    // p99 is max() below 10 samples; off unless configured
    bool include_p99 = false;
};

namespace Stats {

constexpr size_t kTrendWindow   = 10;
constexpr size_t kTrendMinGames = 2 * kTrendWindow;

// Interpolated percentile over ascending data; 0 for empty input.
double percentile(const std::vector<double>& sorted, double p);
double mean(const std::vector<double>& values);
double median(const std::vector<double>& sorted);
// sample standard deviation (n-1); 0 when fewer than two values
double sample_stdev(const std::vector<double>& values);
// one decimal, ties to even on the exact binary value
double round1(double v);

// Report over a newest-first window snapshot. nullopt when no sample has a
// finite accuracy.
std::optional<StatsReport> compute(const std::vector<StatSample>& newest_first,
                                   const std::string& difficulty,
                                   const StatsOptions& opts = StatsOptions{});

// Multi-line text for the operational log.
std::string format_report(const StatsReport& r);

} // namespace Stats
