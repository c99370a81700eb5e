// include/ConfigManager.hpp
#pragma once
#include <string>
#include <cstdint>
#include <cstddef>

class ConfigManager {
public:
    explicit ConfigManager() = default;
    bool loadFromFile(const std::string& config_path);
    bool loadFromString(const std::string& json_text);

    const std::string& getHost()      const { return host_; }
    int                getPort()      const { return port_; }
    const std::string& getStaticDir() const { return static_dir_; }
    const std::string& getDbPath()    const { return db_path_; }
    const std::string& getLogPath()   const { return log_path_; }

    int    defaultLimit() const { return default_limit_; }
    int    maxLimit()     const { return max_limit_; }
    size_t windowSize()   const { return window_size_; }
    bool   includeP99()   const { return include_p99_; }
    bool   logReports()   const { return log_reports_; }

    // command line / environment overrides
    void setPort(int port)                 { port_ = port; }
    void setDbPath(const std::string& p)   { db_path_ = p; }

private:
    bool applyJson(const std::string& text, const std::string& origin);

    std::string host_       = "0.0.0.0";
    int         port_       = 8000;
    std::string static_dir_;
    std::string db_path_    = "data/game_data.db";
    std::string log_path_   = "logs/scorekeeper.log";
    int         default_limit_ = 10;
    int         max_limit_     = 100;
    size_t      window_size_   = 200;
    bool        include_p99_   = false;
    bool        log_reports_   = true;
};
