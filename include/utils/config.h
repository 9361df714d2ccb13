#pragma once

#include <string>
#include <vector>
#include <memory>
#include <cstdint>

namespace qkdsim {
namespace utils {

struct ProtocolConfig {
    uint32_t rounds = 8;
    std::string oracle = "ideal";
    bool batchOracle = false;
    bool seeded = false;
    uint64_t seed = 0;
};

struct RetryConfig {
    uint32_t maxAttempts = 1;
    uint32_t roundGrowth = 2;
};

struct LoggingConfig {
    std::string level = "warn";
    std::string file;
    bool console = true;
    bool allowSensitive = false;
    uint64_t maxFileSize = 10 * 1024 * 1024;
    uint32_t maxFiles = 5;
};

class Config {
public:
    static Config& instance();

    bool load(const std::string& path);
    bool save(const std::string& path);
    bool loadDefaults();
    void reset();

    std::string getString(const std::string& key, const std::string& def = "") const;
    int64_t getInt64(const std::string& key, int64_t def = 0) const;
    uint64_t getUInt64(const std::string& key, uint64_t def = 0) const;
    bool getBool(const std::string& key, bool def = false) const;

    // True when the key is unset, empty, or holds a value the typed getter
    // reads without falling back to its default.
    bool isUnsigned(const std::string& key) const;
    bool isBool(const std::string& key) const;

    // Decimal only; a sign, a 0x prefix or trailing text makes the value invalid.
    static bool parseUnsigned(const std::string& text, uint64_t& out);

    void set(const std::string& key, const std::string& value);
    void set(const std::string& key, const char* value);
    void set(const std::string& key, int value);
    void set(const std::string& key, int64_t value);
    void set(const std::string& key, uint64_t value);
    void set(const std::string& key, bool value);

    bool has(const std::string& key) const;

    ProtocolConfig getProtocolConfig() const;
    RetryConfig getRetryConfig() const;
    LoggingConfig getLoggingConfig() const;

    bool isTuiEnabled() const { return getBool("ui.tui", false); }
    void setTuiEnabled(bool enabled) { set("ui.tui", enabled); }

private:
    Config();
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}
}
