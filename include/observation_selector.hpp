#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "civil_date.hpp"
#include "fx_info.hpp"

namespace selector {

/**
 * @brief Raised when the observations cannot answer the query
 *        (empty input, or nothing published at or before the start date).
 */
struct SelectionError : std::runtime_error {
    explicit SelectionError(const std::string& what)
        : std::runtime_error(what) {}
};

/**
 * @brief Ordering of observations by date only; the rate is ignored.
 */
[[nodiscard]] inline bool byDate(const FxObservation& a, const FxObservation& b) {
    return a.date < b.date;
}

/**
 * @brief Select the observations answering a single-date or range query.
 * @param observations Published observations in any order. The window is expected to
 *                     start some days before `start` and, for a range, stop at `end`.
 * @param start        Requested date, or first date of the range.
 * @param end          Last date of the range; std::nullopt for a single date.
 * @return             Single-date: the latest observation dated on or before `start`.
 *                     Range: that observation followed by every later one, ascending.
 *                     The right edge is not trimmed, the fetch already bounds it.
 *
 * @throws std::invalid_argument if `end` is before `start`
 * @throws SelectionError if there is no observation dated on or before `start`
 */
[[nodiscard]] std::vector<FxObservation> select(std::vector<FxObservation> observations, const CivilDate& start,
                                                const std::optional<CivilDate>& end);

}  // namespace selector
