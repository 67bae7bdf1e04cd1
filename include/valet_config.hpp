#pragma once

#include <string>

/**
 * @brief Settings for talking to the Bank of Canada Valet service.
 *
 * Precedence: built-in defaults, then a JSON config file, then environment variables.
 */
struct ValetConfig {
    static constexpr int  maxLookbackDays   = 366;
    static constexpr long maxTimeoutSeconds = 3600;

    std::string baseUrl = "https://www.bankofcanada.ca/valet";

    /**
     * @brief Calendar days requested before the start date so that a
     *        published observation exists across weekends and holidays.
     */
    int lookbackDays = 10;

    long timeoutSeconds = 30;

    /**
     * @brief Decimal places kept when a CAD/USD rate is computed as a reciprocal.
     */
    int reciprocalPlaces = 4;

    /**
     * @brief Overlay settings from a JSON file.
     * @param path   File with any of "base_url", "lookback_days", "timeout_seconds", "reciprocal_places"
     * @param config Updated in place; left untouched on failure
     * @return false if the file cannot be read or holds invalid values (wrong type, non-integer
     *         number, or outside 1..maxLookbackDays, 1..maxTimeoutSeconds, 0..9 places)
     */
    [[nodiscard]] static bool loadFile(const std::string& path, ValetConfig& config);

    /**
     * @brief Overlay BOCFX_BASE_URL, BOCFX_LOOKBACK_DAYS and BOCFX_TIMEOUT.
     * @return false if a variable is set to an invalid or out-of-range value
     */
    [[nodiscard]] static bool applyEnvironment(ValetConfig& config);
};
