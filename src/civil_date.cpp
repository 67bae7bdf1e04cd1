#include "civil_date.hpp"

#include <cstdio>

namespace {

bool isLeap(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

unsigned lastDayOfMonth(int year, unsigned month) {
    constexpr unsigned lengths[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    return (month == 2 && isLeap(year)) ? 29 : lengths[month - 1];
}

struct Ymd {
    int      year  = 1970;
    unsigned month = 1;
    unsigned day   = 1;
};

/* Proleptic Gregorian conversions (400-year era decomposition) */
Ymd fromDays(std::int32_t days) {
    const std::int32_t z   = days + 719468;
    const std::int32_t era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned     doe = static_cast<unsigned>(z - era * 146097);
    const unsigned     yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const unsigned     doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned     mp  = (5 * doy + 2) / 153;

    Ymd ymd;
    ymd.day   = doy - (153 * mp + 2) / 5 + 1;
    ymd.month = mp < 10 ? mp + 3 : mp - 9;
    ymd.year  = static_cast<int>(yoe) + era * 400 + (ymd.month <= 2 ? 1 : 0);
    return ymd;
}

bool readDigits(std::string_view text, std::size_t pos, std::size_t count, int& out) {
    out = 0;
    for (std::size_t i = pos; i < pos + count; ++i) {
        if (text[i] < '0' || text[i] > '9') {
            return false;
        }
        out = out * 10 + (text[i] - '0');
    }
    return true;
}

}  // namespace

CivilDate CivilDate::fromYmd(int year, unsigned month, unsigned day) {
    const int          y   = month <= 2 ? year - 1 : year;
    const std::int32_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned     yoe = static_cast<unsigned>(y - era * 400);
    const unsigned     doy = (153 * (month > 2 ? month - 3 : month + 9) + 2) / 5 + day - 1;
    const unsigned     doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return CivilDate{era * 146097 + static_cast<std::int32_t>(doe) - 719468};
}

std::optional<CivilDate> CivilDate::parse(std::string_view text) {
    if (text.size() != 10 || text[4] != '-' || text[7] != '-') {
        return std::nullopt;
    }

    int year  = 0;
    int month = 0;
    int day   = 0;
    if (!readDigits(text, 0, 4, year) || !readDigits(text, 5, 2, month) || !readDigits(text, 8, 2, day)) {
        return std::nullopt;
    }

    if (month < 1 || month > 12 || day < 1) {
        return std::nullopt;
    }
    if (static_cast<unsigned>(day) > lastDayOfMonth(year, static_cast<unsigned>(month))) {
        return std::nullopt;
    }

    return fromYmd(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
}

int CivilDate::year() const {
    return fromDays(days).year;
}

unsigned CivilDate::month() const {
    return fromDays(days).month;
}

unsigned CivilDate::day() const {
    return fromDays(days).day;
}

std::string CivilDate::toString() const {
    const auto ymd = fromDays(days);
    char       buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u", ymd.year, ymd.month, ymd.day);
    return buf;
}
