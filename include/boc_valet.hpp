#pragma once

#include <memory>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "fx_info.hpp"
#include "valet_config.hpp"

class BocValet {
   public:
    static void init();
    static void close();

    BocValet()  = delete;
    ~BocValet() = delete;

    BocValet(const BocValet& other) = delete;
    BocValet(BocValet&& other)      = delete;

    BocValet& operator=(const BocValet& other) = delete;
    BocValet& operator=(BocValet&& other) = delete;

    /**
     * @brief Fetch, select and (optionally) invert the rates answering a query.
     * @param query    Start date, optional end date and direction
     * @param config   Service URL, look-back margin, timeout, reciprocal precision
     * @param strategy How CAD/USD is obtained when query.direction is CadToUsd
     * @return FxSeriesInfo holding only the selected observations; nullptr on any error
     *         (diagnostic written to std::cerr)
     */
    [[nodiscard]] static std::shared_ptr<FxSeriesInfo> getRates(const FxQuery& query, const ValetConfig& config,
                                                                ReverseStrategy strategy = ReverseStrategy::Series);

    /**
     * @brief Fetch the raw observation window for a query, unselected.
     * @return FxSeriesInfo; nullptr on transport, protocol or parse error
     */
    [[nodiscard]] static std::shared_ptr<FxSeriesInfo> getObservations(const FxQuery& query, const ValetConfig& config);

    /**
     * @brief Valet series for a direction.
     * @example "FXUSDCAD", "FXCADUSD"
     */
    [[nodiscard]] static std::string seriesId(Direction direction);

    /**
     * @brief Observations URL for a query, including the look-back margin.
     * @example ".../valet/observations/FXUSDCAD/json?start_date=2025-01-05&end_date=2025-01-17"
     */
    [[nodiscard]] static std::string buildUrl(const FxQuery& query, const ValetConfig& config);

    /**
     * @brief Parse a Valet observations response body.
     * @param body     JSON text
     * @param seriesId Key holding the rate in each observation row
     * @return FxSeriesInfo in response order; nullptr if the body does not match the schema,
     *         including any row without a rate
     */
    [[nodiscard]] static std::shared_ptr<FxSeriesInfo> parseObservations(const std::string& body,
                                                                         const std::string& seriesId);

    /**
     * @brief Render a non-success response: a JSON body is pretty-printed, anything else echoed raw.
     * @example "BoC Valet returned HTTP 404:\n{\n  \"message\": \"Series not found\"\n}"
     */
    [[nodiscard]] static std::string describeHttpError(long status, const std::string& body);

    /**
     * @brief Replace every rate with its reciprocal rounded to `places` decimals.
     * @return Inverted copy; nullptr if a rate is zero or too precise to invert
     */
    [[nodiscard]] static std::shared_ptr<FxSeriesInfo> invertSeries(const FxSeriesInfo& series, int places);

    /**
     * @brief Serialize a series; rates are written as strings to keep them exact.
     */
    [[nodiscard]] static nlohmann::json toJson(const FxSeriesInfo& series);

   private:
    struct HttpResponse {
        bool        transportOk = false;
        long        status      = 0;
        std::string body;
    };

    static constexpr std::string_view user_agent_ = "bocfx/1.0 (+https://www.bankofcanada.ca/valet/docs)";

    [[nodiscard]] static HttpResponse fetch(const std::string& url, long timeoutSeconds);

    static std::size_t write(void* contents, std::size_t size, std::size_t nmemb, void* userp);
};
