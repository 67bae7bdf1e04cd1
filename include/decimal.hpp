#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

/**
 * @brief Exact fixed-point decimal number.
 *
 * value = units / 10^scale. Exchange rates are carried in this form from the
 * wire to the output so that no binary floating-point error is introduced.
 */
struct Decimal {
    static constexpr int maxDigits = 18;

    std::int64_t units = 0;
    int          scale = 0;

    /**
     * @brief Parse a plain decimal literal.
     * @param text Optional sign, integer digits, optional fraction (e.g., "1.4352", "-0.5")
     * @return The decimal, or std::nullopt if malformed or longer than maxDigits digits
     */
    [[nodiscard]] static std::optional<Decimal> parse(std::string_view text);

    /**
     * @brief Print with exactly `scale` fractional digits.
     * @example Decimal{14352, 4}.toString() == "1.4352"
     */
    [[nodiscard]] std::string toString() const;

    /**
     * @brief Compute 1 / value rounded half-up (ties away from zero) to `places` decimals.
     * @return std::nullopt for zero, or if scale + places exceeds maxDigits
     */
    [[nodiscard]] std::optional<Decimal> reciprocal(int places) const;
};

/* Representation equality: "1.40" and "1.4" are different values here */
inline bool operator==(const Decimal& a, const Decimal& b) {
    return a.units == b.units && a.scale == b.scale;
}

inline bool operator!=(const Decimal& a, const Decimal& b) {
    return !(a == b);
}
