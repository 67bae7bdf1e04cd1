#include <iostream>
#include <utility>

#include <curl/curl.h>
#include <nlohmann/json.hpp>

#include "boc_valet.hpp"
#include "observation_selector.hpp"

namespace {

std::string invertedSeriesId(const std::string& seriesId) {
    if (seriesId == "FXUSDCAD") {
        return "FXCADUSD";
    }
    if (seriesId == "FXCADUSD") {
        return "FXUSDCAD";
    }
    return seriesId + "_INV";
}

std::string invertedLabel(const std::string& label) {
    const auto slash = label.find('/');
    if (slash == std::string::npos) {
        return label;
    }
    return label.substr(slash + 1) + "/" + label.substr(0, slash);
}

}  // namespace

void BocValet::init() {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

void BocValet::close() {
    curl_global_cleanup();
}

std::string BocValet::seriesId(Direction direction) {
    switch (direction) {
    case Direction::UsdToCad:
        return "FXUSDCAD";
    case Direction::CadToUsd:
        return "FXCADUSD";
    }
    return "FXUSDCAD";
}

std::string BocValet::buildUrl(const FxQuery& query, const ValetConfig& config) {
    std::string base = config.baseUrl;
    while (!base.empty() && base.back() == '/') {
        base.pop_back();
    }

    std::string url = base + "/observations/" + seriesId(query.direction) + "/json";
    url += "?start_date=" + query.start.addDays(-config.lookbackDays).toString();
    if (query.end) {
        url += "&end_date=" + query.end->toString();
    }
    return url;
}

std::shared_ptr<FxSeriesInfo> BocValet::getRates(const FxQuery& query, const ValetConfig& config,
                                                 ReverseStrategy strategy) {
    if (query.end && *query.end < query.start) {
        std::cerr << "Error: end date " << query.end->toString() << " is before start date "
                  << query.start.toString() << std::endl;
        return nullptr;
    }

    if (config.lookbackDays < 1 || config.lookbackDays > ValetConfig::maxLookbackDays) {
        std::cerr << "Error: look-back margin must be between 1 and " << ValetConfig::maxLookbackDays
                  << " days, got " << config.lookbackDays << std::endl;
        return nullptr;
    }

    const bool invert = query.direction == Direction::CadToUsd && strategy == ReverseStrategy::Reciprocal;

    FxQuery fetchQuery = query;
    if (invert) {
        fetchQuery.direction = Direction::UsdToCad;
    }

    auto series = getObservations(fetchQuery, config);
    if (!series) {
        return nullptr;
    }

    try {
        series->observations = selector::select(std::move(series->observations), query.start, query.end);
    } catch (const selector::SelectionError& e) {
        std::cerr << "Error: " << e.what() << "; increase the look-back margin (currently " << config.lookbackDays
                  << " days)" << std::endl;
        return nullptr;
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return nullptr;
    }

    if (invert) {
        return invertSeries(*series, config.reciprocalPlaces);
    }
    return series;
}

std::shared_ptr<FxSeriesInfo> BocValet::getObservations(const FxQuery& query, const ValetConfig& config) {
    const auto id       = seriesId(query.direction);
    const auto response = fetch(buildUrl(query, config), config.timeoutSeconds);
    if (!response.transportOk) {
        std::cerr << "Error: failure while accessing BoC Valet" << std::endl;
        return nullptr;
    }

    if (response.status < 200 || response.status >= 300) {
        std::cerr << describeHttpError(response.status, response.body) << std::endl;
        return nullptr;
    }

    return parseObservations(response.body, id);
}

std::string BocValet::describeHttpError(long status, const std::string& body) {
    try {
        const auto parsed = nlohmann::json::parse(body);
        return "BoC Valet returned HTTP " + std::to_string(status) + ":\n" + parsed.dump(2);
    } catch (const nlohmann::json::parse_error& e) {
        return "non-JSON response (" + std::to_string(status) + "): " + e.what() + "\n" + body;
    }
}

std::shared_ptr<FxSeriesInfo> BocValet::parseObservations(const std::string& body, const std::string& seriesId) {
    auto data      = std::make_shared<FxSeriesInfo>();
    data->seriesId = seriesId;

    try {
        const auto parsed = nlohmann::json::parse(body);
        if (!parsed.is_object() || !parsed.contains("observations") || !parsed["observations"].is_array()) {
            std::cerr << "failed to parse exchange data: missing \"observations\" array" << std::endl;
            return nullptr;
        }

        /**
         * @note SERIES-DETAIL
         * @example {"FXUSDCAD": {"label": "USD/CAD", "description": "US dollar to Canadian dollar daily exchange rate"}}
         */
        if (parsed.contains("seriesDetail") && parsed["seriesDetail"].contains(seriesId)) {
            const auto& detail = parsed["seriesDetail"][seriesId];
            if (detail.contains("label") && detail["label"].is_string()) {
                data->label = detail["label"].get<std::string>();
            }
            if (detail.contains("description") && detail["description"].is_string()) {
                data->description = detail["description"].get<std::string>();
            }
        }

        /**
         * @note OBSERVATIONS
         * @example [{"d": "2025-01-15", "FXUSDCAD": {"v": "1.4352"}}, ...]
         */
        for (const auto& row : parsed["observations"]) {
            if (!row.is_object() || !row.contains("d") || !row["d"].is_string()) {
                std::cerr << "failed to parse exchange data: observation without a date: " << row.dump() << std::endl;
                return nullptr;
            }

            const auto dateText = row["d"].get<std::string>();
            const auto date     = CivilDate::parse(dateText);
            if (!date) {
                std::cerr << "failed to parse exchange data: invalid date \"" << dateText << "\"" << std::endl;
                return nullptr;
            }

            // The rate sits under the series key; either FX direction is accepted
            std::string key = seriesId;
            if (!row.contains(key)) {
                key = invertedSeriesId(seriesId);
            }
            if (!row.contains(key) || !row[key].is_object() || !row[key].contains("v")) {
                std::cerr << "failed to parse exchange data: no " << seriesId << " value on " << dateText << std::endl;
                return nullptr;
            }

            // Numbers are read back through their shortest text form, so only string values are exact
            const auto& value = row[key]["v"];
            std::string rateText;
            if (value.is_string()) {
                rateText = value.get<std::string>();
            } else if (value.is_number()) {
                rateText = value.dump();
            } else {
                std::cerr << "failed to parse exchange data: rate on " << dateText << " is " << value.dump()
                          << std::endl;
                return nullptr;
            }

            const auto rate = Decimal::parse(rateText);
            if (!rate) {
                std::cerr << "failed to parse exchange data: invalid rate \"" << rateText << "\" on " << dateText
                          << std::endl;
                return nullptr;
            }

            data->observations.push_back(FxObservation{*date, *rate});
        }
    } catch (const nlohmann::json::parse_error& e) {
        std::cerr << "failed to parse exchange data: " << e.what() << std::endl;
        return nullptr;
    } catch (const nlohmann::json::type_error& e) {
        std::cerr << "failed to parse exchange data: " << e.what() << std::endl;
        return nullptr;
    }

    return data;
}

std::shared_ptr<FxSeriesInfo> BocValet::invertSeries(const FxSeriesInfo& series, int places) {
    auto data         = std::make_shared<FxSeriesInfo>();
    data->seriesId    = invertedSeriesId(series.seriesId);
    data->label       = invertedLabel(series.label);
    data->description = "Reciprocal of " + series.seriesId + " rounded to " + std::to_string(places) + " decimal places";
    data->observations.reserve(series.observations.size());

    for (const auto& obs : series.observations) {
        const auto inverted = obs.rate.reciprocal(places);
        if (!inverted) {
            std::cerr << "Error: cannot invert rate " << obs.rate.toString() << " on " << obs.date.toString()
                      << std::endl;
            return nullptr;
        }
        data->observations.push_back(FxObservation{obs.date, *inverted});
    }

    return data;
}

nlohmann::json BocValet::toJson(const FxSeriesInfo& series) {
    nlohmann::json observations = nlohmann::json::array();
    for (const auto& obs : series.observations) {
        observations.push_back(nlohmann::json{{"date", obs.date.toString()}, {"rate", obs.rate.toString()}});
    }

    return {
        {"series", series.seriesId},
        {"label", series.label},
        {"observations", observations},
    };
}

BocValet::HttpResponse BocValet::fetch(const std::string& url, long timeoutSeconds) {
    HttpResponse      response;
    const std::string userAgent(user_agent_);

    CURL* curl = curl_easy_init();
    if (!curl) {
        std::cerr << "curl_easy_init() failed" << std::endl;
        return response;
    }

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, userAgent.c_str());
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeoutSeconds);

    const CURLcode res = curl_easy_perform(curl);
    if (res != CURLE_OK) {
        std::cerr << "curl_easy_perform() failed: " << curl_easy_strerror(res) << std::endl;
    } else {
        response.transportOk = true;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);
    }
    curl_easy_cleanup(curl);

    return response;
}

std::size_t BocValet::write(void* contents, std::size_t size, std::size_t nmemb, void* userp) {
    static_cast<std::string*>(userp)->append(static_cast<char*>(contents), size * nmemb);
    return size * nmemb;
}
