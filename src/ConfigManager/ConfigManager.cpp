// === ConfigManager.cpp ===
#include "ConfigManager.hpp"

#include <fstream>
#include <sstream>
#include <algorithm>
#include <cctype>
#include <iostream>
#include <nlohmann/json.hpp>
using nlohmann::json;

// Desc: trim leading and trailing spaces inplace
// In: std::string& t
// Out: void
static inline void trim_inplace(std::string& t) {
    t.erase(t.begin(), std::find_if(t.begin(), t.end(), [](unsigned char c){ return !std::isspace(c); }));
    t.erase(std::find_if(t.rbegin(), t.rend(), [](unsigned char c){ return !std::isspace(c); }).base(), t.end());
}

// Desc: read an optional non-empty string field of an object
// In: const json& obj, const char* key, std::string& out, const char* label
// Out: bool (false if present but invalid)
static bool read_string(const json& obj, const char* key, std::string& out, const char* label,
                        bool allow_empty = false) {
    if (!obj.contains(key)) return true;
    if (!obj[key].is_string()) {
        std::cerr << "[ConfigManager] '" << label << "' must be a string\n";
        return false;
    }
    std::string v = obj[key].get<std::string>();
    trim_inplace(v);
    if (v.empty() && !allow_empty) {
        std::cerr << "[ConfigManager] '" << label << "' must be non-empty\n";
        return false;
    }
    out = v;
    return true;
}

// Desc: read an optional integer field constrained to [lo, hi]
// In: const json& obj, const char* key, int64_t& out, bounds, const char* label
// Out: bool (false if present but invalid)
static bool read_int(const json& obj, const char* key, int64_t& out,
                     int64_t lo, int64_t hi, const char* label) {
    if (!obj.contains(key)) return true;
    if (!obj[key].is_number_integer()) {
        std::cerr << "[ConfigManager] '" << label << "' must be integer\n";
        return false;
    }
    const int64_t v = obj[key].get<int64_t>();
    if (v < lo || v > hi) {
        std::cerr << "[ConfigManager] '" << label << "' out of range [" << lo << ", " << hi
                  << "], got: " << v << "\n";
        return false;
    }
    out = v;
    return true;
}

static bool read_bool(const json& obj, const char* key, bool& out, const char* label) {
    if (!obj.contains(key)) return true;
    if (!obj[key].is_boolean()) {
        std::cerr << "[ConfigManager] '" << label << "' must be true or false\n";
        return false;
    }
    out = obj[key].get<bool>();
    return true;
}

// Desc: fetch a section object; absent section is valid (defaults stay)
// In: const json& j, const char* name, const json*& out
// Out: bool (false if present but not an object)
static bool section(const json& j, const char* name, const json*& out) {
    out = nullptr;
    if (!j.contains(name)) return true;
    if (!j[name].is_object()) {
        std::cerr << "[ConfigManager] '" << name << "' must be an object\n";
        return false;
    }
    out = &j[name];
    return true;
}


bool ConfigManager::loadFromFile(const std::string& config_path) {
    std::ifstream file(config_path);
    if (!file.is_open()) {
        std::cerr << "[ConfigManager] cannot open file: " << config_path << "\n";
        return false;
    }
    std::stringstream ss;
    ss << file.rdbuf();
    return applyJson(ss.str(), config_path);
}

bool ConfigManager::loadFromString(const std::string& json_text) {
    return applyJson(json_text, "<string>");
}

bool ConfigManager::applyJson(const std::string& text, const std::string& origin) {
    json j;
    try { j = json::parse(text); }
    catch (const std::exception& e) {
        std::cerr << "[ConfigManager] invalid JSON in " << origin << ": " << e.what() << "\n";
        return false;
    }
    if (!j.is_object()) {
        std::cerr << "[ConfigManager] top level of " << origin << " must be an object\n";
        return false;
    }

    const json* s = nullptr;

    // server
    if (!section(j, "server", s)) return false;
    if (s) {
        int64_t port = port_;
        if (!read_string(*s, "host", host_, "server.host")) return false;
        if (!read_int(*s, "port", port, 1, 65535, "server.port")) return false;
        if (!read_string(*s, "static_dir", static_dir_, "server.static_dir", true)) return false;
        port_ = static_cast<int>(port);
    }

    // storage
    if (!section(j, "storage", s)) return false;
    if (s) {
        if (!read_string(*s, "db_path", db_path_, "storage.db_path")) return false;
    }

    // api
    if (!section(j, "api", s)) return false;
    if (s) {
        int64_t def = default_limit_, mx = max_limit_;
        if (!read_int(*s, "default_limit", def, 1, 100000, "api.default_limit")) return false;
        if (!read_int(*s, "max_limit", mx, 1, 100000, "api.max_limit")) return false;
        if (mx < def) {
            std::cerr << "[ConfigManager] 'api.max_limit' must be >= 'api.default_limit'\n";
            return false;
        }
        default_limit_ = static_cast<int>(def);
        max_limit_     = static_cast<int>(mx);
    }

    // stats
    if (!section(j, "stats", s)) return false;
    if (s) {
        int64_t ws = static_cast<int64_t>(window_size_);
        if (!read_int(*s, "window_size", ws, 1, 100000, "stats.window_size")) return false;
        if (!read_bool(*s, "include_p99", include_p99_, "stats.include_p99")) return false;
        if (!read_bool(*s, "log_reports", log_reports_, "stats.log_reports")) return false;
        window_size_ = static_cast<size_t>(ws);
    }

    // logging
    if (!section(j, "logging", s)) return false;
    if (s) {
        if (!read_string(*s, "log_path", log_path_, "logging.log_path")) return false;
    }

    return true;
}
