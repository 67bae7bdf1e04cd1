#include "observation_selector.hpp"

#include <algorithm>
#include <iterator>

namespace selector {

std::vector<FxObservation> select(std::vector<FxObservation> observations, const CivilDate& start,
                                  const std::optional<CivilDate>& end) {
    if (end && *end < start) {
        throw std::invalid_argument("end date " + end->toString() + " is before start date " + start.toString());
    }

    if (observations.empty()) {
        throw SelectionError("no observations available");
    }

    std::stable_sort(observations.begin(), observations.end(), byDate);

    // First observation dated after `start`; its predecessor is the range start
    const auto after = std::upper_bound(observations.begin(), observations.end(), start,
                                        [](const CivilDate& date, const FxObservation& obs) { return date < obs.date; });
    if (after == observations.begin()) {
        throw SelectionError("no observation on or before " + start.toString() + " (earliest is " +
                             observations.front().date.toString() + ")");
    }

    const auto rangeStart = std::prev(after);

    if (!end) {
        return {*rangeStart};
    }

    return std::vector<FxObservation>(rangeStart, observations.end());
}

}  // namespace selector
