#pragma once

#include <string>
#include <cstdint>
#include <map>
#include <vector>
#include <fstream>
#include <sstream>
#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <mutex>

namespace sniax {

/**
 * @brief A configured value is malformed or out of range
 */
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * @brief Runtime configuration for the enumeration engine
 *
 * Holds AXFR timing, probe ports, worker pool sizes and logging
 * settings. Defaults are loaded on construction; a config file and
 * then the command line override them. Thread-safe singleton.
 */
class Config {
public:
    static Config& instance() {
        static Config cfg;
        return cfg;
    }

    // Prevent copying
    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    // ==================== Getters ====================
    std::string get(const std::string& key, const std::string& default_val = "") const {
        std::lock_guard<std::mutex> lock(mtx_);
        auto it = values_.find(key);
        return (it != values_.end()) ? it->second : default_val;
    }

    int getInt(const std::string& key, int default_val = 0) const {
        std::string v = get(key);
        if (v.empty()) return default_val;
        try { return std::stoi(v); }
        catch (const std::invalid_argument&) { return default_val; }
        catch (const std::out_of_range&) { return default_val; }
    }

    /// Strict variant for values that size buffers, pools and ports.
    /// @throws ConfigError naming the key if the value is not an integer
    ///         in [min_val, max_val]
    int getIntInRange(const std::string& key, int default_val,
                      int min_val, int max_val) const {
        std::string v = get(key);
        if (v.empty()) return default_val;

        int parsed = 0;
        try {
            size_t used = 0;
            parsed = std::stoi(v, &used);
            if (used != v.size()) throw std::invalid_argument(v);
        } catch (const std::logic_error&) {
            throw ConfigError("config key " + key + ": \"" + v + "\" is not an integer");
        }
        if (parsed < min_val || parsed > max_val) {
            throw ConfigError("config key " + key + " = " + v + " is out of range [" +
                              std::to_string(min_val) + ", " + std::to_string(max_val) + "]");
        }
        return parsed;
    }

    bool getBool(const std::string& key, bool default_val = false) const {
        std::string v = get(key);
        if (v.empty()) return default_val;
        std::transform(v.begin(), v.end(), v.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return (v == "true" || v == "1" || v == "yes" || v == "on");
    }

    // ==================== Setters ====================
    void set(const std::string& key, const std::string& value) {
        std::lock_guard<std::mutex> lock(mtx_);
        values_[key] = value;
    }

    void setInt(const std::string& key, int value) {
        set(key, std::to_string(value));
    }

    void setBool(const std::string& key, bool value) {
        set(key, value ? "true" : "false");
    }

    // ==================== File I/O ====================
    bool loadFromFile(const std::string& path) {
        std::lock_guard<std::mutex> lock(mtx_);
        std::ifstream file(path);
        if (!file.is_open()) return false;

        std::string line;
        while (std::getline(file, line)) {
            // Skip comments and empty lines
            if (line.empty() || line[0] == '#' || line[0] == ';') continue;
            auto pos = line.find('=');
            if (pos == std::string::npos) continue;

            std::string key = line.substr(0, pos);
            std::string val = line.substr(pos + 1);
            // Trim whitespace
            key.erase(0, key.find_first_not_of(" \t"));
            key.erase(key.find_last_not_of(" \t") + 1);
            val.erase(0, val.find_first_not_of(" \t"));
            val.erase(val.find_last_not_of(" \t\r") + 1);

            values_[key] = val;
        }
        return true;
    }

    // ==================== Defaults ====================
    void loadDefaults() {
        std::lock_guard<std::mutex> lock(mtx_);
        values_["axfr.delay_ms"] = "1000";
        values_["axfr.attempts"] = "3";
        values_["axfr.backoff_ms"] = "2000";
        values_["axfr.read_size"] = "512";
        values_["axfr.port"] = "53";
        values_["sni.port"] = "443";
        values_["sni.parallel"] = "false";
        values_["scan.max_domains"] = "8";
        values_["scan.max_probes"] = "16";
        values_["log.level"] = "info";
        values_["log.file"] = "";
        values_["log.console"] = "true";
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mtx_);
        values_.clear();
    }

private:
    Config() { loadDefaults(); }

    mutable std::mutex mtx_;
    std::map<std::string, std::string> values_;
};

} // namespace sniax
