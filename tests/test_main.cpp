#include "ApiRouter.hpp"
#include "ConfigManager.hpp"
#include "HttpServer.hpp"
#include "SqliteBackend.hpp"
#include "StatsAggregator.hpp"
#include "requirements.hpp"

#include <chrono>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>
#include <httplib.h>
#include <nlohmann/json.hpp>

using nlohmann::json;

namespace {

int failures = 0;

void expect(bool cond, const std::string& msg) {
    if (!cond) {
        ++failures;
        std::cerr << "[FAIL] " << msg << "\n";
    }
}

bool near(double a, double b, double eps = 1e-9) {
    return std::fabs(a - b) <= eps;
}

// Fresh in-memory database per test, opened the same way startup does.
struct TestDb {
    StartupResult res;
    TestDb() {
        if (!Requirements::openDatabase(":memory:", res)) {
            std::cerr << "cannot open in-memory database: " << res.error << "\n";
        }
    }
    sqlite3* get() { return res.db.get(); }
};

StatSample sample(double acc, int64_t score = 0, int64_t wave = 0, const std::string& ts = "") {
    StatSample s;
    s.accuracy = acc;
    s.score = score;
    s.wave = wave;
    s.created_at = ts;
    return s;
}

std::vector<StatSample> samples_of(const std::vector<double>& accs) {
    std::vector<StatSample> out;
    for (double a : accs) out.push_back(sample(a));
    return out;
}

// Delegates to a real SQLite backend; individual reads can be made to fail.
class FlakyBackend : public StorageBackend {
public:
    explicit FlakyBackend(SqliteBackend& inner) : inner_(inner) {}

    bool fail_samples = false;     // samples() throws StorageError
    bool fail_top = false;         // topScores() throws a non-storage error

    bool init(std::string& err) override { return inner_.init(err); }
    int64_t saveScore(const NewScore& s) override { return inner_.saveScore(s); }
    std::vector<ScoreRecord> topScores(int limit,
                                       const std::optional<std::string>& difficulty) override {
        if (fail_top) throw std::logic_error("leaderboard exploded");
        return inner_.topScores(limit, difficulty);
    }
    std::optional<ScoreRecord> globalBest() override { return inner_.globalBest(); }
    std::optional<ScoreRecord> playerBest(const std::string& name) override {
        return inner_.playerBest(name);
    }
    void appendSample(Difficulty d, const StatSample& s) override { inner_.appendSample(d, s); }
    std::vector<StatSample> samples(Difficulty d) override {
        if (fail_samples) throw StorageError("[Storage] samples: disk I/O error");
        return inner_.samples(d);
    }
    size_t windowSize() const override { return inner_.windowSize(); }

private:
    SqliteBackend& inner_;
};

void test_percentile_matches_median() {
    const std::vector<double> odd = {1, 2, 3, 4, 5};
    const std::vector<double> even = {10, 20, 30, 40};
    const std::vector<double> uneven = {61.5, 70.25, 88, 90.5, 97, 99.75};

    expect(near(Stats::percentile(odd, 50), Stats::median(odd)), "p50 == median (odd)");
    expect(near(Stats::percentile(odd, 50), 3.0), "p50 of 1..5 is 3");
    expect(near(Stats::percentile(even, 50), Stats::median(even)), "p50 == median (even)");
    expect(near(Stats::percentile(even, 50), 25.0), "p50 of 10..40 is 25");
    expect(near(Stats::percentile(uneven, 50), Stats::median(uneven)), "p50 == median (6 values)");
}

void test_percentile_edges() {
    expect(near(Stats::percentile({42.0}, 95), 42.0), "single value percentile");
    expect(near(Stats::percentile({0.0, 100.0}, 10), 10.0), "interpolated p10 over two values");
    expect(near(Stats::percentile({0.0, 100.0}, 100), 100.0), "p100 clamps upper index");
    expect(near(Stats::percentile({}, 50), 0.0), "empty percentile is 0");
}

void test_sample_stdev() {
    expect(near(Stats::sample_stdev({88.0}), 0.0), "stdev of one sample is 0");
    expect(near(Stats::sample_stdev({2, 4, 4, 4, 5, 5, 7, 9}), std::sqrt(32.0 / 7.0)),
           "sample stdev uses n-1");
}

void test_compute_unavailable() {
    expect(!Stats::compute({}, "normal").has_value(), "empty window is unavailable");
    expect(!Stats::compute(samples_of({std::nan(""), std::nan("")}), "normal").has_value(),
           "window without accuracy is unavailable");

    const auto r = Stats::compute(samples_of({std::nan(""), 91.0}), "normal");
    expect(r.has_value() && r->games == 1, "samples without accuracy are filtered");
}

void test_compute_single_sample() {
    const auto r = Stats::compute({sample(93.25, 1200, 7)}, "beginner");
    expect(r.has_value(), "single sample report exists");
    if (!r) return;
    expect(r->games == 1, "single sample games");
    expect(near(r->accuracy.stdev, 0.0), "single sample stdev 0");
    expect(near(r->accuracy.avg, 93.2), "avg rounded to one decimal, half to even");
    expect(r->score_avg == 1200 && r->score_max == 1200, "score summary");
    expect(near(r->wave_avg, 7.0) && r->wave_max == 7, "wave summary");
    expect(!r->trend.has_value(), "no trend for one sample");
    expect(!r->percentiles.p99.has_value(), "p99 off by default");
}

void test_rounding_half_even() {
    expect(near(Stats::round1(93.25), 93.2), "exact tie rounds to even digit");
    expect(near(Stats::round1(93.35), 93.3), "0.35 is stored below the tie");
    expect(near(Stats::round1(0.35), 0.3), "0.35 rounds down");
    expect(near(Stats::round1(0.45), 0.5), "0.45 is stored above the tie");
    expect(near(Stats::round1(97.5), 97.5), "one decimal is unchanged");
    expect(near(Stats::round1(-2.25), -2.2), "negative tie to even");

    const auto two = Stats::compute({sample(90, 2, 1), sample(90, 3, 1)}, "normal");
    expect(two && two->score_avg == 2, "score avg 2.5 rounds to 2");
    const auto six = Stats::compute({sample(90, 3, 1), sample(90, 4, 1)}, "normal");
    expect(six && six->score_avg == 4, "score avg 3.5 rounds to 4");
}

void test_expert_distribution_scenario() {
    TestDb db;
    SqliteBackend store(db.get());
    std::string err;
    expect(store.init(err), "schema init: " + err);

    for (double a : {100, 100, 100, 90, 90, 80, 80, 80, 80, 70}) {
        expect(store.appendStat("expert", sample(a, 500, 3)), "append expert sample");
    }
    const auto r = Stats::compute(store.statSnapshot("expert"), "expert");
    expect(r.has_value(), "expert report exists");
    if (!r) return;

    expect(r->games == 10, "expert games");
    expect(r->distribution.top == 3, "97-100 bucket");
    expect(r->distribution.great == 0, "95-97 bucket");
    expect(r->distribution.good == 2, "90-95 bucket");
    expect(r->distribution.fair == 4, "80-90 bucket");
    expect(r->distribution.low == 1, "below 80 bucket");
    expect(r->distribution.total() == r->games, "distribution sums to games");

    expect(near(r->accuracy.avg, 87.0), "expert avg");
    expect(near(r->accuracy.median, 85.0), "expert median");
    expect(near(r->accuracy.min, 70.0) && near(r->accuracy.max, 100.0), "expert min/max");
    expect(near(r->percentiles.p10, 79.0), "expert p10");
    expect(near(r->percentiles.p25, 80.0), "expert p25");
    expect(near(r->percentiles.p75, 97.5), "expert p75");
    expect(near(r->percentiles.p90, 100.0), "expert p90");
    expect(near(r->percentiles.p95, 100.0), "expert p95");
}

void test_distribution_boundaries() {
    const auto r = Stats::compute(
        samples_of({97, 96.99, 95, 94.9, 90, 89.9, 80, 79.9, 0, 100}), "normal");
    expect(r.has_value(), "boundary report exists");
    if (!r) return;
    expect(r->distribution.top == 2, "97 and 100 land in top bin");
    expect(r->distribution.great == 2, "95 is right-open lower edge");
    expect(r->distribution.good == 2, "90 bin");
    expect(r->distribution.fair == 2, "80 bin");
    expect(r->distribution.low == 2, "below 80 bin");
    expect(r->distribution.total() == 10, "boundary counts sum to n");
}

void test_trend_threshold() {
    std::vector<double> accs;
    for (int i = 0; i < 10; ++i) accs.push_back(95.0);   // newest
    for (int i = 0; i < 9; ++i) accs.push_back(85.0);

    auto r19 = Stats::compute(samples_of(accs), "normal");
    expect(r19 && !r19->trend.has_value(), "no trend below 20 games");

    accs.push_back(85.0);
    auto r20 = Stats::compute(samples_of(accs), "normal");
    expect(r20 && r20->trend.has_value(), "trend present at 20 games");
    if (r20 && r20->trend) expect(near(*r20->trend, 10.0), "positive trend when recent is better");

    // older samples beyond index 20 do not move the trend
    for (int i = 0; i < 30; ++i) accs.push_back(10.0);
    auto r50 = Stats::compute(samples_of(accs), "normal");
    if (r50 && r50->trend) expect(near(*r50->trend, 10.0), "trend only uses newest 20");

    std::vector<double> worse(10, 80.0);
    worse.insert(worse.end(), 10, 90.0);
    auto rd = Stats::compute(samples_of(worse), "normal");
    if (rd && rd->trend) expect(near(*rd->trend, -10.0), "negative trend when recent is worse");
    else expect(false, "negative trend present");
}

void test_p99_option() {
    StatsOptions opts;
    opts.include_p99 = true;

    auto small = Stats::compute(samples_of({50, 60, 99.5}), "normal", opts);
    expect(small && small->percentiles.p99 && near(*small->percentiles.p99, 99.5),
           "p99 falls back to max below 10 samples");

    std::vector<double> accs;
    for (int i = 1; i <= 11; ++i) accs.push_back(i * 5.0);   // 5..55
    auto big = Stats::compute(samples_of(accs), "normal", opts);
    std::vector<double> sorted = accs;
    expect(big && big->percentiles.p99 &&
           near(*big->percentiles.p99, Stats::round1(Stats::percentile(sorted, 99))),
           "p99 interpolates from 10 samples on");
}

void test_window_keeps_newest_200() {
    TestDb db;
    SqliteBackend store(db.get());
    std::string err;
    expect(store.init(err), "schema init: " + err);

    for (Difficulty d : kAllDifficulties) {
        const std::string name = difficulty_name(d);
        for (int i = 0; i < 250; ++i) {
            store.appendStat(name, sample(80.0 + (i % 20), i, i / 10));
        }
        const auto snap = store.statSnapshot(name);
        expect(snap.size() == 200, name + " window holds 200 samples");
        if (snap.size() != 200) continue;
        expect(snap.front().score == 249, name + " newest sample first");
        expect(snap.back().score == 50, name + " oldest kept sample is #50");
        bool ordered = true;
        for (size_t i = 1; i < snap.size(); ++i) {
            if (snap[i - 1].score != snap[i].score + 1) ordered = false;
        }
        expect(ordered, name + " snapshot is newest-first and contiguous");
    }
}

void test_window_prunes_by_timestamp() {
    TestDb db;
    SqliteBackend store(db.get(), 3);
    std::string err;
    expect(store.init(err), "schema init: " + err);

    store.appendStat("beginner", sample(90, 1, 1, "2024-01-01 00:00:05"));
    store.appendStat("beginner", sample(91, 2, 1, "2024-01-01 00:00:06"));
    store.appendStat("beginner", sample(92, 3, 1, "2024-01-01 00:00:07"));
    // inserted last but oldest by timestamp: evicted immediately
    store.appendStat("beginner", sample(93, 4, 1, "2024-01-01 00:00:01"));

    const auto snap = store.statSnapshot("beginner");
    expect(snap.size() == 3, "window capped at configured size");
    if (snap.size() == 3) {
        expect(snap[0].score == 3 && snap[1].score == 2 && snap[2].score == 1,
               "eviction keeps newest by timestamp");
    }
    expect(store.statSnapshot("normal").empty(), "other buckets untouched");
}

void test_unknown_difficulty_ignored() {
    TestDb db;
    SqliteBackend store(db.get());
    std::string err;
    expect(store.init(err), "schema init: " + err);

    expect(!store.appendStat("hard", sample(90)), "unknown difficulty append is a no-op");
    expect(!store.appendStat("Normal", sample(90)), "difficulty match is case-sensitive");
    expect(store.statSnapshot("hard").empty(), "unknown difficulty snapshot empty");
    for (Difficulty d : kAllDifficulties) {
        expect(store.samples(d).empty(), "no bucket received the rejected sample");
    }
}

void test_score_store_queries() {
    TestDb db;
    SqliteBackend store(db.get());
    std::string err;
    expect(store.init(err), "schema init: " + err);

    expect(!store.globalBest().has_value(), "empty store has no global best");
    expect(!store.playerBest("Ann").has_value(), "empty store has no player best");

    NewScore a; a.player_name = "Ann"; a.score = 300; a.wave = 4; a.difficulty = "normal"; a.accuracy = 91.5;
    NewScore b; b.player_name = "ann"; b.score = 900; b.wave = 9; b.difficulty = "expert";
    NewScore c; c.score = 500; c.wave = 6; c.difficulty = "normal";
    NewScore d; d.player_name = "Ann"; d.score = 120; d.wave = 2;

    const int64_t id_a = store.saveScore(a);
    const int64_t id_b = store.saveScore(b);
    const int64_t id_c = store.saveScore(c);
    const int64_t id_d = store.saveScore(d);
    expect(id_a < id_b && id_b < id_c && id_c < id_d, "ids increase monotonically");

    const auto top = store.topScores(2, std::nullopt);
    expect(top.size() == 2, "topScores honors limit");
    if (top.size() == 2) {
        expect(top[0].score == 900 && top[1].score == 500, "topScores ordered by score desc");
    }

    const auto normal = store.topScores(10, std::string("normal"));
    expect(normal.size() == 2, "difficulty filter applied before limit");
    if (normal.size() == 2) {
        expect(normal[0].score == 500 && normal[1].score == 300, "filtered order");
        expect(normal[0].player_name == "Anonymous", "missing name stored as Anonymous");
        expect(normal[1].accuracy && near(*normal[1].accuracy, 91.5), "accuracy round-trips");
        expect(!normal[0].accuracy.has_value(), "absent accuracy stays null");
        expect(!normal[0].created_at.empty(), "created_at assigned by store");
    }
    expect(store.topScores(0, std::nullopt).empty(), "limit 0 returns nothing");

    const auto best = store.globalBest();
    expect(best && best->score == 900 && best->id == id_b, "global best");

    const auto ann = store.playerBest("Ann");
    expect(ann && ann->score == 300, "player best is case-sensitive (Ann)");
    const auto ann_lower = store.playerBest("ann");
    expect(ann_lower && ann_lower->score == 900, "player best is case-sensitive (ann)");
    expect(!store.playerBest("ANN").has_value(), "unknown player has no best");
}

ConfigManager quiet_config() {
    ConfigManager cfg;
    expect(cfg.loadFromString(R"({"stats": {"log_reports": false}})"), "quiet config loads");
    return cfg;
}

void test_api_round_trip() {
    TestDb db;
    SqliteBackend store(db.get());
    std::string err;
    expect(store.init(err), "schema init: " + err);
    ConfigManager cfg = quiet_config();
    ApiRouter router(store, cfg);

    auto post = router.dispatch("POST", "/api/scores", {},
        R"({"score":100,"wave":5,"accuracy":97.5,"difficulty":"normal"})");
    expect(post.status == 200, "POST /api/scores succeeds");
    expect(post.body.value("saved", false), "POST reports saved");
    expect(post.body.contains("id") && post.body["id"].is_number_integer(), "POST returns id");
    expect(post.body["best"].is_object() && post.body["best"]["score"] == 100, "POST returns best");

    QueryParams q{{"difficulty", "normal"}, {"limit", "1"}};
    auto get = router.dispatch("GET", "/api/scores", q, "");
    expect(get.status == 200, "GET /api/scores succeeds");
    const json& scores = get.body["scores"];
    expect(scores.is_array() && scores.size() == 1, "one score returned");
    if (scores.is_array() && scores.size() == 1) {
        expect(scores[0]["score"] == 100, "round-trip score");
        expect(scores[0]["wave"] == 5, "round-trip wave");
        expect(scores[0]["difficulty"] == "normal", "round-trip difficulty");
        expect(scores[0]["player_name"] == "Anonymous", "round-trip default name");
    }

    auto stats = router.dispatch("GET", "/api/stats", {{"difficulty", "normal"}}, "");
    expect(stats.status == 200, "GET /api/stats succeeds");
    expect(stats.body["stats"].is_object(), "stats report present after accuracy submission");
    if (stats.body["stats"].is_object()) {
        const json& s = stats.body["stats"];
        expect(s["games"] == 1, "stats counts the submission");
        expect(s["difficulty"] == "normal", "stats carries difficulty");
        expect(s["distribution"]["97-100"] == 1, "stats distribution key");
        expect(!s.contains("trend"), "trend omitted below 20 games");
    }
}

void test_api_missing_wave() {
    TestDb db;
    SqliteBackend store(db.get());
    std::string err;
    expect(store.init(err), "schema init: " + err);
    ConfigManager cfg = quiet_config();
    ApiRouter router(store, cfg);

    auto r = router.dispatch("POST", "/api/scores", {}, R"({"score":10,"accuracy":90,"difficulty":"beginner"})");
    expect(r.status == 400, "missing wave is rejected");
    expect(r.body.contains("error"), "400 carries an error message");
    expect(!store.globalBest().has_value(), "rejected submission creates no record");
    expect(store.statSnapshot("beginner").empty(), "rejected submission adds no sample");
}

void test_api_validation_and_routing() {
    TestDb db;
    SqliteBackend store(db.get());
    std::string err;
    expect(store.init(err), "schema init: " + err);
    ConfigManager cfg = quiet_config();
    ApiRouter router(store, cfg);

    expect(router.dispatch("POST", "/api/scores", {}, "{not json").status == 400, "malformed body");
    expect(router.dispatch("POST", "/api/scores", {}, "[1,2]").status == 400, "non-object body");
    expect(router.dispatch("POST", "/api/scores", {}, "").status == 400, "empty body misses fields");
    expect(router.dispatch("POST", "/api/scores", {}, R"({"score":"10","wave":1})").status == 400,
           "string score rejected");
    expect(router.dispatch("POST", "/api/scores", {}, R"({"score":-1,"wave":1})").status == 400,
           "negative score rejected");
    expect(router.dispatch("POST", "/api/scores", {}, R"({"score":1,"wave":1,"accuracy":101})").status == 400,
           "accuracy above 100 rejected");
    expect(!store.globalBest().has_value(), "no record after rejected posts");

    expect(router.dispatch("GET", "/api/stats", {}, "").status == 400, "stats without difficulty");
    expect(router.dispatch("GET", "/api/stats", {{"difficulty", "hard"}}, "").status == 400,
           "stats with unknown difficulty");
    auto empty = router.dispatch("GET", "/api/stats", {{"difficulty", "expert"}}, "");
    expect(empty.status == 200 && empty.body["stats"].is_null(), "stats null when window empty");

    expect(router.dispatch("GET", "/api/nothing", {}, "").status == 404, "unknown GET route");
    expect(router.dispatch("POST", "/api/stats", {}, "{}").status == 404, "unknown POST route");
    expect(router.dispatch("DELETE", "/api/scores", {}, "").status == 405, "unsupported method");
    expect(router.dispatch("GET", "/api/scores", {{"limit", "abc"}}, "").status == 400, "bad limit");

    // unknown difficulty is stored on the score but never reaches a window
    auto odd = router.dispatch("POST", "/api/scores", {},
        R"({"score":40,"wave":2,"accuracy":88,"difficulty":"nightmare","player_name":"Zed"})");
    expect(odd.status == 200, "unknown difficulty still saves the score");
    for (Difficulty d : kAllDifficulties) {
        expect(store.samples(d).empty(), "unknown difficulty skipped by window");
    }

    auto player = router.dispatch("GET", "/api/scores/player/Zed", {}, "");
    expect(player.status == 200 && player.body["best"]["score"] == 40, "player best route");
    auto nobody = router.dispatch("GET", "/api/scores/player/zed", {}, "");
    expect(nobody.status == 200 && nobody.body["best"].is_null(), "player best null when absent");

    auto best = router.dispatch("GET", "/api/scores/best", {}, "");
    expect(best.status == 200 && best.body["best"]["player_name"] == "Zed", "global best route");
}

void test_api_report_failure_keeps_save() {
    TestDb db;
    SqliteBackend inner(db.get());
    FlakyBackend store(inner);
    std::string err;
    expect(store.init(err), "schema init: " + err);
    ConfigManager cfg;     // log_reports on by default
    expect(cfg.logReports(), "reports enabled by default");
    ApiRouter router(store, cfg);

    store.fail_samples = true;
    auto r = router.dispatch("POST", "/api/scores", {},
        R"({"score":100,"wave":5,"accuracy":97.5,"difficulty":"normal"})");
    expect(r.status == 200, "report failure does not fail the submission");
    expect(r.body.value("saved", false), "submission reported saved");
    expect(inner.topScores(10, std::nullopt).size() == 1, "exactly one record stored");
    expect(inner.samples(Difficulty::Normal).size() == 1, "sample appended before the report");

    auto stats = router.dispatch("GET", "/api/stats", {{"difficulty", "normal"}}, "");
    expect(stats.status == 500, "stats read failure still maps to 500");
}

void test_api_player_name_is_path_remainder() {
    TestDb db;
    SqliteBackend store(db.get());
    std::string err;
    expect(store.init(err), "schema init: " + err);
    ConfigManager cfg = quiet_config();
    ApiRouter router(store, cfg);

    NewScore s; s.player_name = "team/alpha"; s.score = 70; s.wave = 3;
    store.saveScore(s);
    NewScore t; t.player_name = "alpha"; t.score = 10; t.wave = 1;
    store.saveScore(t);

    auto r = router.dispatch("GET", "/api/scores/player/team/alpha", {}, "");
    expect(r.status == 200 && r.body["best"].is_object() && r.body["best"]["score"] == 70,
           "name keeps slashes after the prefix");
    auto empty = router.dispatch("GET", "/api/scores/player/", {}, "");
    expect(empty.status == 200 && empty.body["best"].is_null(), "empty name has no best");
}

// Desc: start an HttpServer on an ephemeral loopback port for one test
struct LiveServer {
    HttpServer server;
    std::thread th;
    int port = -1;

    LiveServer(ApiRouter& router, const ConfigManager& cfg) : server(router, cfg, -1) {
        port = server.bindToAnyPort("127.0.0.1");
        if (port < 0) return;
        th = std::thread([this] { server.listenAfterBind(); });
        for (int i = 0; i < 200 && !server.isRunning(); ++i) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
    }
    ~LiveServer() {
        server.stop();
        if (th.joinable()) th.join();
    }
};

bool has_cors(const httplib::Response& res) {
    return res.get_header_value("Access-Control-Allow-Origin") == "*" &&
           res.get_header_value("Access-Control-Allow-Methods") == "GET, POST, OPTIONS" &&
           res.get_header_value("Access-Control-Allow-Headers") == "Content-Type";
}

void test_http_server_surface() {
    TestDb db;
    SqliteBackend inner(db.get());
    FlakyBackend store(inner);
    std::string err;
    expect(store.init(err), "schema init: " + err);

    namespace fs = std::filesystem;
    const fs::path web = fs::temp_directory_path() / "scorekeeper_test_static";
    fs::create_directories(web);
    {
        std::ofstream page(web / "index.html");
        page << "<h1>arena</h1>";
    }

    const json conf = {
        {"server", {{"static_dir", web.string()}}},
        {"stats", {{"log_reports", false}}}
    };
    ConfigManager cfg;
    expect(cfg.loadFromString(conf.dump()), "server config loads");
    ApiRouter router(store, cfg);

    LiveServer live(router, cfg);
    expect(live.port > 0, "server bound an ephemeral port");
    expect(live.server.isRunning(), "server is running");
    if (live.port <= 0 || !live.server.isRunning()) {
        fs::remove_all(web);
        return;
    }

    httplib::Client cli("127.0.0.1", live.port);

    auto post = cli.Post("/api/scores", R"({"score":250,"wave":4,"player_name":"Kai"})",
                         "application/json");
    expect(post && post->status == 200, "POST over HTTP succeeds");
    if (post) {
        expect(has_cors(*post), "POST response carries CORS headers");
        expect(json::parse(post->body).value("saved", false), "POST body is JSON");
    }

    auto get = cli.Get("/api/scores?limit=5");
    expect(get && get->status == 200, "GET over HTTP succeeds");
    if (get) {
        expect(has_cors(*get), "GET response carries CORS headers");
        expect(get->get_header_value("Content-Type").rfind("application/json", 0) == 0,
               "API responses are JSON");
        expect(json::parse(get->body)["scores"].size() == 1, "query string reaches the router");
    }

    auto bad = cli.Get("/api/stats?difficulty=hard");
    expect(bad && bad->status == 400 && has_cors(*bad), "400 keeps CORS headers");

    auto pre = cli.Options("/api/scores");
    expect(pre && pre->status == 200, "OPTIONS preflight is 200");
    if (pre) {
        expect(pre->body.empty(), "OPTIONS body is empty");
        expect(has_cors(*pre), "OPTIONS carries CORS headers");
    }

    auto stray = cli.Post("/upload", "{}", "application/json");
    expect(stray && stray->status == 405, "POST outside /api/ is 405");

    auto page = cli.Get("/index.html");
    expect(page && page->status == 200 && page->body == "<h1>arena</h1>", "static file served");

    store.fail_top = true;
    auto boom = cli.Get("/api/scores");
    expect(boom && boom->status == 500, "escaped exception becomes 500");
    if (boom) {
        expect(has_cors(*boom), "500 carries CORS headers");
        expect(json::parse(boom->body).contains("error"), "500 body is a JSON error");
    }
    store.fail_top = false;

    fs::remove_all(web);
}

void test_api_limit_default_and_cap() {
    TestDb db;
    SqliteBackend store(db.get());
    std::string err;
    expect(store.init(err), "schema init: " + err);
    ConfigManager cfg;
    expect(cfg.loadFromString(R"({"api": {"default_limit": 3, "max_limit": 5},
                                  "stats": {"log_reports": false}})"), "limit config loads");
    ApiRouter router(store, cfg);

    for (int i = 0; i < 8; ++i) {
        NewScore s; s.score = i * 10; s.wave = 1;
        store.saveScore(s);
    }
    auto def = router.dispatch("GET", "/api/scores", {}, "");
    expect(def.body["scores"].size() == 3, "default limit from config");
    auto capped = router.dispatch("GET", "/api/scores", {{"limit", "50"}}, "");
    expect(capped.body["scores"].size() == 5, "limit capped by max_limit");
}

void test_config_loading() {
    ConfigManager defaults;
    expect(defaults.getPort() == 8000 && defaults.windowSize() == 200, "config defaults");
    expect(defaults.defaultLimit() == 10, "default leaderboard limit");

    ConfigManager cfg;
    expect(cfg.loadFromString(R"({
        "server": {"host": "127.0.0.1", "port": 9100},
        "storage": {"db_path": "tmp/scores.db"},
        "stats": {"window_size": 50, "include_p99": true}
    })"), "valid config loads");
    expect(cfg.getHost() == "127.0.0.1" && cfg.getPort() == 9100, "server section");
    expect(cfg.getDbPath() == "tmp/scores.db", "storage section");
    expect(cfg.windowSize() == 50 && cfg.includeP99(), "stats section");

    ConfigManager bad;
    expect(!bad.loadFromString(R"({"server": {"port": 70000}})"), "port out of range");
    expect(!bad.loadFromString(R"({"api": {"default_limit": 20, "max_limit": 5}})"), "max below default");
    expect(!bad.loadFromString(R"({"stats": {"window_size": "big"}})"), "non-integer window");
    expect(!bad.loadFromString(R"({"stats": []})"), "section must be object");
    expect(!bad.loadFromString("{oops"), "invalid JSON config");
}

void test_format_report() {
    std::vector<double> accs(25, 96.0);
    const auto r = Stats::compute(samples_of(accs), "expert");
    expect(r.has_value(), "report for formatting");
    if (!r) return;
    const std::string text = Stats::format_report(*r);
    expect(text.find("expert - 25 games") != std::string::npos, "report header");
    expect(text.find("trend") != std::string::npos, "report includes trend at 25 games");
    expect(text.find("95-97:25") != std::string::npos, "report distribution line");
}

} // namespace

int main() {
    std::cout << "Running scorekeeper tests...\n";

    test_percentile_matches_median();
    test_percentile_edges();
    test_sample_stdev();
    test_compute_unavailable();
    test_compute_single_sample();
    test_expert_distribution_scenario();
    test_distribution_boundaries();
    test_trend_threshold();
    test_p99_option();
    test_rounding_half_even();
    test_format_report();

    test_window_keeps_newest_200();
    test_window_prunes_by_timestamp();
    test_unknown_difficulty_ignored();
    test_score_store_queries();

    test_api_round_trip();
    test_api_missing_wave();
    test_api_validation_and_routing();
    test_api_limit_default_and_cap();
    test_api_report_failure_keeps_save();
    test_api_player_name_is_path_remainder();

    test_http_server_surface();

    test_config_loading();

    if (failures == 0) {
        std::cout << "All tests passed.\n";
        return 0;
    }

    std::cerr << failures << " test(s) failed.\n";
    return 1;
}
