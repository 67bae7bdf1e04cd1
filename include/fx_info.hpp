#pragma once

#include <optional>
#include <string>
#include <vector>

#include "civil_date.hpp"
#include "decimal.hpp"

enum class Direction
{
    UsdToCad,  // price of 1 USD in CAD
    CadToUsd,  // price of 1 CAD in USD
};

enum class ReverseStrategy
{
    Series,      // request the FXCADUSD series
    Reciprocal,  // request FXUSDCAD and invert each rate
};

struct FxObservation {
    /**
     * @brief Publication date
     * @example 2025-01-15
     */
    CivilDate date;

    /**
     * @brief Value of 1 unit of the base currency in the quote currency
     * @example 1.4352
     */
    Decimal rate;
};

struct FxQuery {
    /**
     * @brief Single date, or first date of the range
     */
    CivilDate start;

    /**
     * @brief Last date of the range; empty for a single-date query
     */
    std::optional<CivilDate> end;

    Direction direction = Direction::UsdToCad;
};

struct FxSeriesInfo {
    /**
     * @brief Valet series identifier
     * @example "FXUSDCAD", "FXCADUSD"
     */
    std::string seriesId = "";

    /**
     * @brief Series label from seriesDetail
     * @example "USD/CAD"
     */
    std::string label = "";

    /**
     * @brief Series description from seriesDetail
     * @example "US dollar to Canadian dollar daily exchange rate"
     */
    std::string description = "";

    std::vector<FxObservation> observations;
};
