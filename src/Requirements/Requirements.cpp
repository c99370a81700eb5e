// requirements.cpp
#include "requirements.hpp"
#include <sys/stat.h>
#include <unistd.h>
#include <fcntl.h>
#include <cerrno>
#include <cstring>
#include <ctime>
#include <filesystem>

#define STARTUP_LOG_PATH "logs/startup.log"


// Desc: append a timestamped line to startup log file
// In: const std::string& msg
// Out: void
void Requirements::fileLog(const std::string& msg) {
    int fd = ::open(STARTUP_LOG_PATH, O_WRONLY | O_CREAT | O_APPEND, 0644);
    if (fd == -1) return;
    time_t now = ::time(nullptr);
    char buf[64];
    ctime_r(&now, buf);
    buf[std::strlen(buf) - 1] = '\0';
    std::string line = "[" + std::string(buf) + "] " + msg + "\n";
    ssize_t _wr = ::write(fd, line.c_str(), line.size());
    (void)_wr;
    ::close(fd);
}

// Desc: create directory if missing and record status
// In: const std::string& path, StartupResult& out
// Out: void
void Requirements::ensureDir(const std::string& path, StartupResult& out) {
    if (path.empty()) return;
    std::error_code ec;
    std::filesystem::create_directories(path, ec);
    if (ec) {
        out.logs.push_back("[ensureDir] failed: " + path + " (" + ec.message() + ")");
        return;
    }
    out.logs.push_back("[ensureDir] ok: " + path);
}

void Requirements::ensureParentDir(const std::string& file_path, StartupResult& out) {
    if (file_path == ":memory:") return;
    ensureDir(std::filesystem::path(file_path).parent_path().string(), out);
}

// Desc: load JSON config into StartupResult::config; a missing file keeps defaults
// In: const std::string& config_path, StartupResult& out
// Out: bool (true on success)
bool Requirements::loadConfig(const std::string& config_path, StartupResult& out) {
    if (::access(config_path.c_str(), F_OK) != 0) {
        out.logs.push_back("[config] " + config_path + " not found, using defaults");
        return true;
    }
    if (!out.config.loadFromFile(config_path)) {
        out.error = "[config] failed to load " + config_path;
        out.logs.push_back(out.error);
        return false;
    }
    out.logs.push_back("[config] loaded: " + config_path);
    return true;
}

// Desc: validate key config fields that depend on the environment
// In: const ConfigManager& cfg, StartupResult& out
// Out: bool (true if valid)
bool Requirements::validateConfig(const ConfigManager& cfg, StartupResult& out) {
    if (cfg.getPort() < 1 || cfg.getPort() > 65535) {
        out.error = "[config] port out of range: " + std::to_string(cfg.getPort());
        out.logs.push_back(out.error);
        return false;
    }

    const std::string& static_dir = cfg.getStaticDir();
    if (!static_dir.empty()) {
        struct stat st{};
        if (::stat(static_dir.c_str(), &st) == -1) {
            out.error = "[config] static_dir not found: " + static_dir + " (" + std::string(::strerror(errno)) + ")";
            out.logs.push_back(out.error);
            return false;
        }
        if (!S_ISDIR(st.st_mode)) {
            out.error = "[config] static_dir is not a directory: " + static_dir;
            out.logs.push_back(out.error);
            return false;
        }
        if (::access(static_dir.c_str(), R_OK | X_OK) != 0) {
            out.error = "[config] insufficient access on static_dir: " + static_dir + " (" + std::string(::strerror(errno)) + ")";
            out.logs.push_back(out.error);
            return false;
        }
    }

    out.logs.push_back("[config] listen: " + cfg.getHost() + ":" + std::to_string(cfg.getPort()));
    out.logs.push_back("[config] db_path: " + cfg.getDbPath());
    out.logs.push_back("[config] static_dir: " + (static_dir.empty() ? std::string("(disabled)") : static_dir));
    out.logs.push_back("[config] stats window: " + std::to_string(cfg.windowSize()));
    out.logs.push_back("[config] validation ok");
    return true;
}

// Desc: open/create SQLite DB and apply connection pragmas
// In: const std::string& db_path, StartupResult& out
// Out: bool (true on success)
bool Requirements::openDatabase(const std::string& db_path, StartupResult& out) {
    sqlite3* raw = nullptr;
    int rc = sqlite3_open_v2(db_path.c_str(), &raw,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                             nullptr);
    if (rc != SQLITE_OK) {
        out.error = std::string("[db] sqlite open failed: ") + (raw ? sqlite3_errmsg(raw) : "unknown");
        out.logs.push_back(out.error);
        if (raw) sqlite3_close(raw);
        return false;
    }
    sqlite3_busy_timeout(raw, 5000);
    sqlite3_exec(raw, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);
    sqlite3_exec(raw, "PRAGMA synchronous=NORMAL;", nullptr, nullptr, nullptr);
    sqlite3_wal_autocheckpoint(raw, 512);

    out.db.reset(raw);
    out.logs.push_back("[db] opened: " + db_path);
    return true;
}


// Desc: orchestrate startup: dirs, config, DB; log results
// In: const std::string& config_path, const std::string& db_override, int port_override
// Out: StartupResult (schema is created later by the storage backend)
StartupResult Requirements::run(const std::string& config_path,
                                const std::string& db_override,
                                int port_override) {
    StartupResult res;

    // 1) dirs
    ensureDir("logs", res);

    // 2) config load + overrides + validate
    if (!loadConfig(config_path, res)) {
        for (auto& l : res.logs) fileLog(l);
        return res;
    }
    if (!db_override.empty()) {
        res.config.setDbPath(db_override);
        res.logs.push_back("[config] db_path overridden: " + db_override);
    }
    if (port_override > 0) {
        res.config.setPort(port_override);
        res.logs.push_back("[config] port overridden: " + std::to_string(port_override));
    }
    if (!validateConfig(res.config, res)) {
        for (auto& l : res.logs) fileLog(l);
        return res;
    }
    ensureParentDir(res.config.getDbPath(), res);
    ensureParentDir(res.config.getLogPath(), res);

    // 3) DB open
    if (!openDatabase(res.config.getDbPath(), res)) {
        for (auto& l : res.logs) fileLog(l);
        return res;
    }

    // Ok
    res.ok = true;
    for (auto& l : res.logs) fileLog(l);
    return res;
}
