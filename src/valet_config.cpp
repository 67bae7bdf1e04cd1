#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iostream>

#include <nlohmann/json.hpp>

#include "decimal.hpp"
#include "valet_config.hpp"

namespace {

bool parsePositive(const std::string& text, long& out) {
    if (text.empty() || text.size() > 9) {
        return false;
    }
    long value = 0;
    for (const char c : text) {
        if (c < '0' || c > '9') {
            return false;
        }
        value = value * 10 + (c - '0');
    }
    if (value <= 0) {
        return false;
    }
    out = value;
    return true;
}

/* Integer setting from the config file; floats and out-of-range values are rejected */
bool readInteger(const nlohmann::json& json, const char* key, std::int64_t min, std::int64_t max, std::int64_t& out) {
    const auto& value = json[key];
    if (!value.is_number_integer()) {
        std::cerr << "Config error: " << key << " must be an integer, got " << value.dump() << std::endl;
        return false;
    }
    const bool tooLarge = value.is_number_unsigned() && value.get<std::uint64_t>() > static_cast<std::uint64_t>(max);
    const auto number   = value.get<std::int64_t>();
    if (tooLarge || number < min || number > max) {
        std::cerr << "Config error: " << key << " must be between " << min << " and " << max << std::endl;
        return false;
    }
    out = number;
    return true;
}

}  // namespace

bool ValetConfig::loadFile(const std::string& path, ValetConfig& config) {
    nlohmann::json json;
    {
        std::ifstream f(path);
        if (!f.is_open()) {
            std::cerr << "Error: Cannot open config file: " << path << std::endl;
            return false;
        }
        try {
            f >> json;
        } catch (const nlohmann::json::parse_error& e) {
            std::cerr << "Config parse error: " << e.what() << std::endl;
            return false;
        }
    }

    if (!json.is_object()) {
        std::cerr << "Config error: top level of " << path << " must be an object" << std::endl;
        return false;
    }

    ValetConfig  updated = config;
    std::int64_t number  = 0;

    if (json.contains("base_url")) {
        if (!json["base_url"].is_string() || json["base_url"].get<std::string>().empty()) {
            std::cerr << "Config error: base_url must be a non-empty string" << std::endl;
            return false;
        }
        updated.baseUrl = json["base_url"].get<std::string>();
    }
    if (json.contains("lookback_days")) {
        if (!readInteger(json, "lookback_days", 1, maxLookbackDays, number)) {
            return false;
        }
        updated.lookbackDays = static_cast<int>(number);
    }
    if (json.contains("timeout_seconds")) {
        if (!readInteger(json, "timeout_seconds", 1, maxTimeoutSeconds, number)) {
            return false;
        }
        updated.timeoutSeconds = static_cast<long>(number);
    }
    if (json.contains("reciprocal_places")) {
        if (!readInteger(json, "reciprocal_places", 0, Decimal::maxDigits / 2, number)) {
            return false;
        }
        updated.reciprocalPlaces = static_cast<int>(number);
    }

    config = updated;
    return true;
}

bool ValetConfig::applyEnvironment(ValetConfig& config) {
    if (const char* url = std::getenv("BOCFX_BASE_URL"); url && *url) {
        config.baseUrl = url;
    }

    if (const char* days = std::getenv("BOCFX_LOOKBACK_DAYS"); days && *days) {
        long value = 0;
        if (!parsePositive(days, value) || value > maxLookbackDays) {
            std::cerr << "Error: BOCFX_LOOKBACK_DAYS must be an integer between 1 and " << maxLookbackDays << ", got \""
                      << days << "\"" << std::endl;
            return false;
        }
        config.lookbackDays = static_cast<int>(value);
    }

    if (const char* timeout = std::getenv("BOCFX_TIMEOUT"); timeout && *timeout) {
        long value = 0;
        if (!parsePositive(timeout, value) || value > maxTimeoutSeconds) {
            std::cerr << "Error: BOCFX_TIMEOUT must be an integer between 1 and " << maxTimeoutSeconds << ", got \""
                      << timeout << "\"" << std::endl;
            return false;
        }
        config.timeoutSeconds = value;
    }

    return true;
}
