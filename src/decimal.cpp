#include "decimal.hpp"

namespace {

std::int64_t powerOfTen(int exponent) {
    std::int64_t result = 1;
    for (int i = 0; i < exponent; ++i) {
        result *= 10;
    }
    return result;
}

}  // namespace

std::optional<Decimal> Decimal::parse(std::string_view text) {
    std::size_t pos      = 0;
    bool        negative = false;

    if (pos < text.size() && (text[pos] == '-' || text[pos] == '+')) {
        negative = text[pos] == '-';
        ++pos;
    }

    Decimal     result;
    int         digits     = 0;
    std::size_t intDigits  = 0;
    bool        seenPoint  = false;
    std::size_t fracDigits = 0;

    for (; pos < text.size(); ++pos) {
        const char c = text[pos];
        if (c == '.') {
            if (seenPoint || intDigits == 0) {
                return std::nullopt;
            }
            seenPoint = true;
            continue;
        }
        if (c < '0' || c > '9') {
            return std::nullopt;
        }
        if (++digits > maxDigits) {
            return std::nullopt;
        }
        result.units = result.units * 10 + (c - '0');
        if (seenPoint) {
            ++fracDigits;
        } else {
            ++intDigits;
        }
    }

    if (intDigits == 0 || (seenPoint && fracDigits == 0)) {
        return std::nullopt;
    }

    result.scale = static_cast<int>(fracDigits);
    if (negative) {
        result.units = -result.units;
    }
    return result;
}

std::string Decimal::toString() const {
    const bool  negative = units < 0;
    std::string digits   = std::to_string(negative ? -units : units);

    if (scale > 0) {
        if (digits.size() <= static_cast<std::size_t>(scale)) {
            digits.insert(0, static_cast<std::size_t>(scale) + 1 - digits.size(), '0');
        }
        digits.insert(digits.size() - static_cast<std::size_t>(scale), 1, '.');
    }

    return negative ? "-" + digits : digits;
}

std::optional<Decimal> Decimal::reciprocal(int places) const {
    if (units == 0 || places < 0 || scale + places > maxDigits) {
        return std::nullopt;
    }

    // 1 / (units / 10^scale) = 10^scale / units, scaled up by 10^places
    const std::int64_t divisor   = units < 0 ? -units : units;
    const std::int64_t numerator = powerOfTen(scale + places);

    std::int64_t       quotient  = numerator / divisor;
    const std::int64_t remainder = numerator % divisor;
    if (remainder * 2 >= divisor) {
        ++quotient;
    }

    Decimal result;
    result.units = units < 0 ? -quotient : quotient;
    result.scale = places;
    return result;
}
