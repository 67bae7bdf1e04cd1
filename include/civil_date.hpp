#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

/**
 * @brief Calendar date without time-of-day or timezone.
 *
 * Stored as days since 1970-01-01 so that ordering and day arithmetic are
 * plain integer operations.
 */
struct CivilDate {
    std::int32_t days = 0;

    [[nodiscard]] static CivilDate fromYmd(int year, unsigned month, unsigned day);

    /**
     * @brief Parse a strict ISO date.
     * @param text Date in YYYY-MM-DD form (e.g., "2025-01-15")
     * @return The date, or std::nullopt if the text is malformed or names a day that does not exist
     */
    [[nodiscard]] static std::optional<CivilDate> parse(std::string_view text);

    [[nodiscard]] int      year() const;
    [[nodiscard]] unsigned month() const;
    [[nodiscard]] unsigned day() const;

    /**
     * @brief Format as YYYY-MM-DD.
     */
    [[nodiscard]] std::string toString() const;

    [[nodiscard]] CivilDate addDays(std::int32_t n) const { return CivilDate{days + n}; }
};

inline bool operator==(const CivilDate& a, const CivilDate& b) { return a.days == b.days; }
inline bool operator!=(const CivilDate& a, const CivilDate& b) { return a.days != b.days; }
inline bool operator<(const CivilDate& a, const CivilDate& b) { return a.days < b.days; }
inline bool operator<=(const CivilDate& a, const CivilDate& b) { return a.days <= b.days; }
inline bool operator>(const CivilDate& a, const CivilDate& b) { return a.days > b.days; }
inline bool operator>=(const CivilDate& a, const CivilDate& b) { return a.days >= b.days; }
