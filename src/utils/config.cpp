#include "utils/config.h"
#include <unordered_map>
#include <fstream>
#include <algorithm>
#include <stdexcept>
#include <mutex>
#include <cctype>
#include <cstdint>

namespace qkdsim {
namespace utils {

static uint32_t clampU32(int64_t v) {
    if (v < 0) return 0;
    if (v > static_cast<int64_t>(UINT32_MAX)) return UINT32_MAX;
    return static_cast<uint32_t>(v);
}

static bool parseSignedValue(const std::string& val, int64_t& out) {
    try {
        size_t pos = 0;
        long long v = std::stoll(val, &pos, 10);
        if (pos != val.size()) return false;
        out = static_cast<int64_t>(v);
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

static bool parseBoolValue(std::string val, bool& out) {
    std::transform(val.begin(), val.end(), val.begin(), ::tolower);
    if (val == "true" || val == "1" || val == "yes" || val == "on") {
        out = true;
        return true;
    }
    if (val == "false" || val == "0" || val == "no" || val == "off") {
        out = false;
        return true;
    }
    return false;
}

struct Config::Impl {
    std::unordered_map<std::string, std::string> data;
    std::string configPath;
    mutable std::mutex mtx;

    void put(const std::string& key, const std::string& value) {
        std::lock_guard<std::mutex> lock(mtx);
        data[key] = value;
    }

    bool find(const std::string& key, std::string& out) const {
        std::lock_guard<std::mutex> lock(mtx);
        auto it = data.find(key);
        if (it == data.end()) return false;
        out = it->second;
        return true;
    }
};

static std::string trimmed(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r");
    return s.substr(start, end - start + 1);
}

Config::Config() : impl_(std::make_unique<Impl>()) {
    loadDefaults();
}

Config& Config::instance() {
    static Config inst;
    return inst;
}

bool Config::loadDefaults() {
    set("protocol.rounds", 8);
    set("protocol.oracle", "ideal");
    set("protocol.batch_oracle", false);

    set("retry.max_attempts", 1);
    set("retry.round_growth", 2);

    set("log.level", "warn");
    set("log.file", "");
    set("log.console", true);
    set("log.allow_sensitive", false);
    set("log.max_file_size", static_cast<uint64_t>(10 * 1024 * 1024));
    set("log.max_files", 5);

    set("ui.tui", false);
    return true;
}

void Config::reset() {
    {
        std::lock_guard<std::mutex> lock(impl_->mtx);
        impl_->data.clear();
        impl_->configPath.clear();
    }
    loadDefaults();
}

bool Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) return false;

    std::lock_guard<std::mutex> lock(impl_->mtx);
    impl_->configPath = path;
    std::string line;

    while (std::getline(file, line)) {
        line = trimmed(line);
        if (line.empty() || line[0] == '#') continue;

        auto pos = line.find('=');
        if (pos != std::string::npos) {
            std::string key = trimmed(line.substr(0, pos));
            std::string value = trimmed(line.substr(pos + 1));
            if (!key.empty()) {
                impl_->data[key] = value;
            }
        }
    }
    return true;
}

bool Config::save(const std::string& path) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    std::string savePath = path.empty() ? impl_->configPath : path;
    if (savePath.empty()) return false;

    std::ofstream file(savePath);
    if (!file.is_open()) return false;

    file << "# QKDSim Configuration\n\n";

    std::vector<std::string> sortedKeys;
    for (const auto& [key, value] : impl_->data) {
        sortedKeys.push_back(key);
    }
    std::sort(sortedKeys.begin(), sortedKeys.end());

    std::string lastPrefix;
    for (const auto& key : sortedKeys) {
        auto pos = key.find('.');
        std::string prefix = pos != std::string::npos ? key.substr(0, pos) : "";
        if (prefix != lastPrefix && !lastPrefix.empty()) {
            file << "\n";
        }
        lastPrefix = prefix;
        file << key << "=" << impl_->data[key] << "\n";
    }
    return static_cast<bool>(file);
}

std::string Config::getString(const std::string& key, const std::string& def) const {
    std::string val;
    return impl_->find(key, val) ? val : def;
}

int64_t Config::getInt64(const std::string& key, int64_t def) const {
    std::string val;
    int64_t out = 0;
    if (!impl_->find(key, val) || !parseSignedValue(val, out)) return def;
    return out;
}

uint64_t Config::getUInt64(const std::string& key, uint64_t def) const {
    std::string val;
    uint64_t out = 0;
    if (!impl_->find(key, val) || !Config::parseUnsigned(val, out)) return def;
    return out;
}

bool Config::getBool(const std::string& key, bool def) const {
    std::string val;
    bool out = false;
    if (!impl_->find(key, val) || !parseBoolValue(val, out)) return def;
    return out;
}

bool Config::isUnsigned(const std::string& key) const {
    std::string val;
    uint64_t ignored = 0;
    return !impl_->find(key, val) || val.empty() || Config::parseUnsigned(val, ignored);
}

bool Config::isBool(const std::string& key) const {
    std::string val;
    bool ignored = false;
    return !impl_->find(key, val) || val.empty() || parseBoolValue(val, ignored);
}

void Config::set(const std::string& key, const std::string& value) {
    impl_->put(key, value);
}

void Config::set(const std::string& key, const char* value) {
    impl_->put(key, value ? value : "");
}

void Config::set(const std::string& key, int value) {
    impl_->put(key, std::to_string(value));
}

void Config::set(const std::string& key, int64_t value) {
    impl_->put(key, std::to_string(value));
}

void Config::set(const std::string& key, uint64_t value) {
    impl_->put(key, std::to_string(value));
}

void Config::set(const std::string& key, bool value) {
    impl_->put(key, value ? "true" : "false");
}

bool Config::parseUnsigned(const std::string& text, uint64_t& out) {
    if (text.empty() || !std::isdigit(static_cast<unsigned char>(text[0]))) return false;
    try {
        size_t pos = 0;
        unsigned long long v = std::stoull(text, &pos, 10);
        if (pos != text.size()) return false;
        out = static_cast<uint64_t>(v);
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

bool Config::has(const std::string& key) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->data.find(key) != impl_->data.end();
}

ProtocolConfig Config::getProtocolConfig() const {
    ProtocolConfig cfg;
    cfg.rounds = clampU32(getInt64("protocol.rounds", 8));
    cfg.oracle = getString("protocol.oracle", "ideal");
    cfg.batchOracle = getBool("protocol.batch_oracle", false);
    cfg.seeded = !getString("protocol.seed", "").empty();
    cfg.seed = getUInt64("protocol.seed", 0);
    return cfg;
}

RetryConfig Config::getRetryConfig() const {
    RetryConfig cfg;
    cfg.maxAttempts = clampU32(getInt64("retry.max_attempts", 1));
    cfg.roundGrowth = clampU32(getInt64("retry.round_growth", 2));
    return cfg;
}

LoggingConfig Config::getLoggingConfig() const {
    LoggingConfig cfg;
    cfg.level = getString("log.level", "warn");
    cfg.file = getString("log.file", "");
    cfg.console = getBool("log.console", true);
    cfg.allowSensitive = getBool("log.allow_sensitive", false);
    cfg.maxFileSize = getUInt64("log.max_file_size", cfg.maxFileSize);
    cfg.maxFiles = clampU32(getInt64("log.max_files", cfg.maxFiles));
    return cfg;
}

}
}
