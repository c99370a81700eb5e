// === src/StatsAggregator/StatsAggregator.cpp ===
#include "StatsAggregator.hpp"
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <iomanip>
#include <sstream>

namespace Stats {

// Desc: linear interpolation between order statistics
// In: const std::vector<double>& sorted (ascending), double p in [0,100]
// Out: double
double percentile(const std::vector<double>& sorted, double p) {
    if (sorted.empty()) return 0.0;
    const size_t n = sorted.size();
    const double k = static_cast<double>(n - 1) * p / 100.0;
    const size_t f = static_cast<size_t>(std::floor(k));
    const size_t c = std::min(f + 1, n - 1);
    return sorted[f] + (sorted[c] - sorted[f]) * (k - static_cast<double>(f));
}

double mean(const std::vector<double>& values) {
    if (values.empty()) return 0.0;
    double sum = 0.0;
    for (double v : values) sum += v;
    return sum / static_cast<double>(values.size());
}

double median(const std::vector<double>& sorted) {
    const size_t n = sorted.size();
    if (n == 0) return 0.0;
    if (n % 2 == 1) return sorted[n / 2];
    return (sorted[n / 2 - 1] + sorted[n / 2]) / 2.0;
}

double sample_stdev(const std::vector<double>& values) {
    const size_t n = values.size();
    if (n < 2) return 0.0;
    const double m = mean(values);
    double ss = 0.0;
    for (double v : values) ss += (v - m) * (v - m);
    return std::sqrt(ss / static_cast<double>(n - 1));
}

// Desc: one decimal, correctly rounded from the binary value, ties to even
// In: double v (finite)
// Out: double
double round1(double v) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.1f", v);
    return std::strtod(buf, nullptr);
}

static void bin_accuracy(AccuracyDistribution& d, double acc) {
    if (acc >= 97.0)      ++d.top;
    else if (acc >= 95.0) ++d.great;
    else if (acc >= 90.0) ++d.good;
    else if (acc >= 80.0) ++d.fair;
    else                  ++d.low;
}

// Desc: build the full report from a window snapshot
// In: newest-first samples, difficulty label, options
// Out: std::optional<StatsReport> (nullopt if no finite accuracy)
std::optional<StatsReport> compute(const std::vector<StatSample>& newest_first,
                                   const std::string& difficulty,
                                   const StatsOptions& opts) {
    // [1] keep samples carrying an accuracy, order preserved
    std::vector<const StatSample*> kept;
    kept.reserve(newest_first.size());
    for (const auto& s : newest_first) {
        if (std::isfinite(s.accuracy)) kept.push_back(&s);
    }
    if (kept.empty()) return std::nullopt;

    const size_t n = kept.size();
    std::vector<double> acc;
    acc.reserve(n);
    double score_sum = 0.0, wave_sum = 0.0;
    int64_t score_max = kept.front()->score, wave_max = kept.front()->wave;
    for (const StatSample* s : kept) {
        acc.push_back(s->accuracy);
        score_sum += static_cast<double>(s->score);
        wave_sum  += static_cast<double>(s->wave);
        score_max = std::max(score_max, s->score);
        wave_max  = std::max(wave_max, s->wave);
    }

    std::vector<double> sorted = acc;
    std::sort(sorted.begin(), sorted.end());

    StatsReport r;
    r.difficulty = difficulty;
    r.games = n;

    // [2] descriptive
    r.accuracy.avg    = round1(mean(acc));
    r.accuracy.median = round1(median(sorted));
    r.accuracy.stdev  = round1(sample_stdev(acc));
    r.accuracy.min    = round1(sorted.front());
    r.accuracy.max    = round1(sorted.back());

    // [3] percentiles
    r.percentiles.p10 = round1(percentile(sorted, 10));
    r.percentiles.p25 = round1(percentile(sorted, 25));
    r.percentiles.p75 = round1(percentile(sorted, 75));
    r.percentiles.p90 = round1(percentile(sorted, 90));
    r.percentiles.p95 = round1(percentile(sorted, 95));
    if (opts.include_p99) {
        r.percentiles.p99 = round1(n < 10 ? sorted.back() : percentile(sorted, 99));
    }

    // [4] distribution
    for (double a : acc) bin_accuracy(r.distribution, a);

    // [5] score / wave
    // default FE_TONEAREST: halves go to the even integer
    r.score_avg = static_cast<int64_t>(std::nearbyint(score_sum / static_cast<double>(n)));
    r.score_max = score_max;
    r.wave_avg  = round1(wave_sum / static_cast<double>(n));
    r.wave_max  = wave_max;

    // [6] trend: last 10 vs the 10 before, newest-first order
    if (n >= kTrendMinGames) {
        std::vector<double> recent(acc.begin(), acc.begin() + kTrendWindow);
        std::vector<double> previous(acc.begin() + kTrendWindow, acc.begin() + kTrendMinGames);
        r.trend = round1(mean(recent) - mean(previous));
    }
    return r;
}

std::string format_report(const StatsReport& r) {
    std::ostringstream os;
    os << std::fixed << std::setprecision(1);
    os << "[Stats] " << r.difficulty << " - " << r.games << " games\n"
       << "  accuracy  avg=" << r.accuracy.avg << "% median=" << r.accuracy.median
       << "% stdev=" << r.accuracy.stdev << " min=" << r.accuracy.min
       << "% max=" << r.accuracy.max << "%\n"
       << "  pct       p10=" << r.percentiles.p10 << " p25=" << r.percentiles.p25
       << " p75=" << r.percentiles.p75 << " p90=" << r.percentiles.p90
       << " p95=" << r.percentiles.p95;
    if (r.percentiles.p99) os << " p99=" << *r.percentiles.p99;
    os << "\n"
       << "  dist      97-100:" << r.distribution.top << " 95-97:" << r.distribution.great
       << " 90-95:" << r.distribution.good << " 80-90:" << r.distribution.fair
       << " <80:" << r.distribution.low << "\n"
       << "  score     avg=" << r.score_avg << " max=" << r.score_max << "\n"
       << "  wave      avg=" << r.wave_avg << " max=" << r.wave_max << "\n";
    if (r.trend) {
        os << "  trend     " << (*r.trend >= 0 ? "+" : "") << *r.trend << "%\n";
    }
    return os.str();
}

} // namespace Stats
