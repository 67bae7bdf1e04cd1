#include <gtest/gtest.h>

#include <string>

#include "boc_valet.hpp"
#include "observation_selector.hpp"

namespace {

const std::string kUsdCadBody = R"json({
    "terms": {"url": "https://www.bankofcanada.ca/terms/"},
    "seriesDetail": {
        "FXUSDCAD": {
            "label": "USD/CAD",
            "description": "US dollar to Canadian dollar daily exchange rate",
            "dimension": {"key": "d", "name": "date"}
        }
    },
    "observations": [
        {"d": "2025-01-16", "FXUSDCAD": {"v": "1.4339"}},
        {"d": "2025-01-15", "FXUSDCAD": {"v": "1.4352"}},
        {"d": "2025-01-17", "FXUSDCAD": {"v": 1.4474}},
        {"d": "2025-01-20", "FXUSDCAD": {"v": "1.4375"}}
    ]
})json";

FxQuery query(const char* start, const char* end, Direction direction = Direction::UsdToCad) {
    FxQuery q;
    q.start = *CivilDate::parse(start);
    if (end) {
        q.end = *CivilDate::parse(end);
    }
    q.direction = direction;
    return q;
}

}  // namespace

TEST(BocValetTest, SeriesIds) {
    EXPECT_EQ(BocValet::seriesId(Direction::UsdToCad), "FXUSDCAD");
    EXPECT_EQ(BocValet::seriesId(Direction::CadToUsd), "FXCADUSD");
}

TEST(BocValetTest, BuildUrlSingleDateAppliesLookback) {
    ValetConfig config;
    EXPECT_EQ(BocValet::buildUrl(query("2025-01-15", nullptr), config),
              "https://www.bankofcanada.ca/valet/observations/FXUSDCAD/json?start_date=2025-01-05");
}

TEST(BocValetTest, BuildUrlRangeReverse) {
    ValetConfig config;
    config.baseUrl      = "http://localhost:8080/valet/";
    config.lookbackDays = 14;
    EXPECT_EQ(BocValet::buildUrl(query("2025-01-03", "2025-01-21", Direction::CadToUsd), config),
              "http://localhost:8080/valet/observations/FXCADUSD/json?start_date=2024-12-20&end_date=2025-01-21");
}

TEST(BocValetTest, ParseObservations) {
    const auto series = BocValet::parseObservations(kUsdCadBody, "FXUSDCAD");
    ASSERT_NE(series, nullptr);
    EXPECT_EQ(series->seriesId, "FXUSDCAD");
    EXPECT_EQ(series->label, "USD/CAD");
    EXPECT_EQ(series->description, "US dollar to Canadian dollar daily exchange rate");

    // Response order is kept
    ASSERT_EQ(series->observations.size(), 4u);
    EXPECT_EQ(series->observations[0].date.toString(), "2025-01-16");
    EXPECT_EQ(series->observations[0].rate.toString(), "1.4339");
    EXPECT_EQ(series->observations[2].date.toString(), "2025-01-17");
    EXPECT_EQ(series->observations[2].rate.toString(), "1.4474");
    EXPECT_EQ(series->observations[3].date.toString(), "2025-01-20");
}

TEST(BocValetTest, ParsedObservationsFeedSelector) {
    const auto series = BocValet::parseObservations(kUsdCadBody, "FXUSDCAD");
    ASSERT_NE(series, nullptr);

    const auto saturday = selector::select(series->observations, *CivilDate::parse("2025-01-18"), std::nullopt);
    ASSERT_EQ(saturday.size(), 1u);
    EXPECT_EQ(saturday[0].date.toString(), "2025-01-17");

    const auto range = selector::select(series->observations, *CivilDate::parse("2025-01-15"),
                                        *CivilDate::parse("2025-01-20"));
    ASSERT_EQ(range.size(), 4u);
    EXPECT_EQ(range.front().date.toString(), "2025-01-15");
    EXPECT_EQ(range.back().date.toString(), "2025-01-20");
}

TEST(BocValetTest, ParseAcceptsEitherFxKey) {
    const auto series = BocValet::parseObservations(kUsdCadBody, "FXCADUSD");
    ASSERT_NE(series, nullptr);
    EXPECT_EQ(series->seriesId, "FXCADUSD");
    EXPECT_TRUE(series->label.empty());
    ASSERT_EQ(series->observations.size(), 4u);
    EXPECT_EQ(series->observations[1].rate.toString(), "1.4352");
}

TEST(BocValetTest, ParseUnknownSeriesKeyFails) {
    EXPECT_EQ(BocValet::parseObservations(kUsdCadBody, "FXEURCAD"), nullptr);
}

TEST(BocValetTest, RowWithoutRateFailsWholeBody) {
    // A dropped row would otherwise look like a holiday and roll the answer back a day
    EXPECT_EQ(BocValet::parseObservations(R"({"observations": [
                  {"d": "2025-01-15", "FXUSDCAD": {"v": "1.4352"}},
                  {"d": "2025-01-16", "FXUSDCAD": {"v": null}},
                  {"d": "2025-01-17", "FXUSDCADX": {"v": "1.4474"}}
              ]})",
                                          "FXUSDCAD"),
              nullptr);

    EXPECT_EQ(BocValet::parseObservations(R"({"observations": [{"d": "2025-01-17", "FXUSDCADX": {"v": "1.4474"}}]})",
                                          "FXUSDCAD"),
              nullptr);
    EXPECT_EQ(BocValet::parseObservations(R"({"observations": [{"d": "2025-01-17"}]})", "FXUSDCAD"), nullptr);
    EXPECT_EQ(BocValet::parseObservations(R"({"observations": [{"d": "2025-01-17", "FXUSDCAD": "1.4474"}]})",
                                          "FXUSDCAD"),
              nullptr);
    EXPECT_EQ(BocValet::parseObservations(R"({"observations": [{"d": "2025-01-17", "FXUSDCAD": {}}]})", "FXUSDCAD"),
              nullptr);
    EXPECT_EQ(BocValet::parseObservations(R"({"observations": [{"d": "2025-01-17", "FXUSDCAD": {"v": true}}]})",
                                          "FXUSDCAD"),
              nullptr);
}

TEST(BocValetTest, NumericRatesUseShortestText) {
    const auto series =
        BocValet::parseObservations(R"({"observations": [{"d": "2025-01-17", "FXUSDCAD": {"v": 1.10}}]})", "FXUSDCAD");
    ASSERT_NE(series, nullptr);
    ASSERT_EQ(series->observations.size(), 1u);
    EXPECT_EQ(series->observations[0].rate.toString(), "1.1");

    EXPECT_EQ(BocValet::parseObservations(R"({"observations": [{"d": "2025-01-17", "FXUSDCAD": {"v": 0.00001}}]})",
                                          "FXUSDCAD"),
              nullptr);
}

TEST(BocValetTest, ParseRejectsMalformedBodies) {
    EXPECT_EQ(BocValet::parseObservations("not json", "FXUSDCAD"), nullptr);
    EXPECT_EQ(BocValet::parseObservations("[]", "FXUSDCAD"), nullptr);
    EXPECT_EQ(BocValet::parseObservations(R"({"observations": {}})", "FXUSDCAD"), nullptr);
    EXPECT_EQ(BocValet::parseObservations(R"({"observations": [{"FXUSDCAD": {"v": "1.4"}}]})", "FXUSDCAD"),
              nullptr);
    EXPECT_EQ(BocValet::parseObservations(R"({"observations": [{"d": "2025-02-30", "FXUSDCAD": {"v": "1.4"}}]})",
                                          "FXUSDCAD"),
              nullptr);
    EXPECT_EQ(BocValet::parseObservations(R"({"observations": [{"d": "2025-01-15", "FXUSDCAD": {"v": "n/a"}}]})",
                                          "FXUSDCAD"),
              nullptr);
}

TEST(BocValetTest, ParseEmptyObservations) {
    const auto series = BocValet::parseObservations(R"({"observations": []})", "FXUSDCAD");
    ASSERT_NE(series, nullptr);
    EXPECT_TRUE(series->observations.empty());
}

TEST(BocValetTest, InvertSeries) {
    const auto series = BocValet::parseObservations(kUsdCadBody, "FXUSDCAD");
    ASSERT_NE(series, nullptr);

    const auto inverted = BocValet::invertSeries(*series, 4);
    ASSERT_NE(inverted, nullptr);
    EXPECT_EQ(inverted->seriesId, "FXCADUSD");
    EXPECT_EQ(inverted->label, "CAD/USD");
    ASSERT_EQ(inverted->observations.size(), series->observations.size());
    EXPECT_EQ(inverted->observations[1].date.toString(), "2025-01-15");
    EXPECT_EQ(inverted->observations[1].rate.toString(), "0.6968");
}

TEST(BocValetTest, InvertSeriesRejectsZeroRate) {
    FxSeriesInfo series;
    series.seriesId = "FXUSDCAD";
    series.observations.push_back(FxObservation{*CivilDate::parse("2025-01-15"), *Decimal::parse("0.0000")});
    EXPECT_EQ(BocValet::invertSeries(series, 4), nullptr);
}

TEST(BocValetTest, ToJsonKeepsRatesExact) {
    const auto series = BocValet::parseObservations(kUsdCadBody, "FXUSDCAD");
    ASSERT_NE(series, nullptr);

    const auto doc = BocValet::toJson(*series);
    EXPECT_EQ(doc["series"].get<std::string>(), "FXUSDCAD");
    EXPECT_EQ(doc["label"].get<std::string>(), "USD/CAD");
    ASSERT_EQ(doc["observations"].size(), 4u);
    EXPECT_EQ(doc["observations"][1]["date"].get<std::string>(), "2025-01-15");
    EXPECT_EQ(doc["observations"][1]["rate"].get<std::string>(), "1.4352");
}

TEST(BocValetTest, DescribeHttpErrorPrettyPrintsJson) {
    const auto text =
        BocValet::describeHttpError(404, R"({"message":"Series not found","docs":"https://www.bankofcanada.ca/valet/docs"})");
    EXPECT_EQ(text, "BoC Valet returned HTTP 404:\n"
                    "{\n"
                    "  \"docs\": \"https://www.bankofcanada.ca/valet/docs\",\n"
                    "  \"message\": \"Series not found\"\n"
                    "}");
}

TEST(BocValetTest, DescribeHttpErrorEchoesNonJsonBody) {
    const auto text = BocValet::describeHttpError(503, "<html>Service Unavailable</html>");
    EXPECT_EQ(text.rfind("non-JSON response (503): ", 0), 0u);
    EXPECT_NE(text.find("\n<html>Service Unavailable</html>"), std::string::npos);
}

TEST(BocValetTest, LookbackOutOfRangeFailsWithoutFetching) {
    ValetConfig config;
    config.baseUrl      = "http://invalid.invalid";
    config.lookbackDays = 999999999;
    EXPECT_EQ(BocValet::getRates(query("2025-01-17", nullptr), config), nullptr);

    config.lookbackDays = 0;
    EXPECT_EQ(BocValet::getRates(query("2025-01-17", nullptr), config), nullptr);
}

TEST(BocValetTest, EndBeforeStartFailsWithoutFetching) {
    ValetConfig config;
    config.baseUrl = "http://invalid.invalid";
    EXPECT_EQ(BocValet::getRates(query("2025-01-17", "2025-01-15"), config), nullptr);
}

TEST(BocValetTest, TransportErrorYieldsNull) {
    BocValet::init();

    ValetConfig config;
    config.baseUrl        = "http://127.0.0.1:1/valet";
    config.timeoutSeconds = 2;
    EXPECT_EQ(BocValet::getObservations(query("2025-01-15", nullptr), config), nullptr);
    EXPECT_EQ(BocValet::getRates(query("2025-01-15", nullptr), config), nullptr);

    BocValet::close();
}
