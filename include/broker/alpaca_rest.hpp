#pragma once

#include "../config/plan_config.hpp"
#include "../util/string_utils.hpp"
#include "../util/time_utils.hpp"
#include "broker_api.hpp"

#include <algorithm>
#include <cstdlib>
#include <curl/curl.h>
#include <nlohmann/json.hpp>
#include <sstream>
#include <string>
#include <vector>

namespace mpt {
namespace broker {

using json = nlohmann::json;

/**
 * Alpaca endpoints and credentials, read once at startup.
 */
struct AlpacaSettings {
    static constexpr const char* PAPER_URL = "https://paper-api.alpaca.markets";
    static constexpr const char* LIVE_URL = "https://api.alpaca.markets";
    static constexpr const char* DATA_URL = "https://data.alpaca.markets";

    std::string trading_url = PAPER_URL;
    std::string data_url = DATA_URL;
    std::string key_id;
    std::string secret_key;

    /**
     * Credentials from APCA_API_KEY_ID / APCA_API_SECRET_KEY; endpoints
     * follow the plan environment unless APCA_API_BASE_URL /
     * APCA_DATA_BASE_URL override them.
     */
    static AlpacaSettings from_env(config::TradingEnv env) {
        AlpacaSettings s;
        s.trading_url = env == config::TradingEnv::Prod ? LIVE_URL : PAPER_URL;

        if (const char* v = std::getenv("APCA_API_BASE_URL"); v && *v)
            s.trading_url = v;
        if (const char* v = std::getenv("APCA_DATA_BASE_URL"); v && *v)
            s.data_url = v;
        if (const char* v = std::getenv("APCA_API_KEY_ID"))
            s.key_id = v;
        if (const char* v = std::getenv("APCA_API_SECRET_KEY"))
            s.secret_key = v;
        return s;
    }

    bool has_credentials() const { return !key_id.empty() && !secret_key.empty(); }
};

/**
 * Alpaca REST client
 *
 * Uses libcurl for HTTP requests and nlohmann::json for payloads.
 * One instance per process: forked workers construct their own after fork.
 * Not for hot paths - calendar, positions, warm-up and minute polling only.
 */
class AlpacaRest : public ICalendarSource,
                   public IPositionSource,
                   public IHistoryLoader,
                   public IMarketFeed,
                   public IScreener {
public:
    explicit AlpacaRest(AlpacaSettings settings) : settings_(std::move(settings)), curl_(nullptr) {
        curl_global_init(CURL_GLOBAL_DEFAULT);
        curl_ = curl_easy_init();
        if (!curl_) {
            throw BrokerError("Failed to initialize CURL");
        }
    }

    ~AlpacaRest() override {
        if (curl_) {
            curl_easy_cleanup(curl_);
        }
        curl_global_cleanup();
    }

    // Non-copyable
    AlpacaRest(const AlpacaRest&) = delete;
    AlpacaRest& operator=(const AlpacaRest&) = delete;

    // =========================================================================
    // Calendar
    // =========================================================================

    /**
     * First exchange session on or after `date`, looking one week ahead.
     * Open/close are New York wall-clock in the payload.
     */
    std::optional<CalendarDay> session_for(const util::CivilDate& date) override {
        const int64_t day = util::days_from_civil(date.year, date.month, date.day);
        const std::string start = util::format_date(date);
        const std::string end = util::format_date(util::civil_from_days(day + 7));

        json data = get_json(settings_.trading_url + "/v2/calendar?start=" + start + "&end=" + end);
        if (!data.is_array() || data.empty()) {
            return std::nullopt;
        }

        const json& first = data.front();
        auto d = util::parse_date(first.value("date", std::string()));
        auto open = util::parse_hhmm(first.value("open", std::string()));
        auto close = util::parse_hhmm(first.value("close", std::string()));
        if (!d || !open || !close) {
            throw BrokerError("Invalid calendar response: " + first.dump());
        }

        CalendarDay out;
        out.date = *d;
        out.window.open = util::eastern_to_utc_ns(*d, *open / 60, *open % 60);
        out.window.close = util::eastern_to_utc_ns(*d, *close / 60, *close % 60);
        return out;
    }

    // =========================================================================
    // Positions
    // =========================================================================

    std::vector<OpenPosition> list_open_positions() override {
        std::vector<OpenPosition> out;
        json data = get_json(settings_.trading_url + "/v2/positions");
        if (!data.is_array()) {
            throw BrokerError("Invalid positions response");
        }

        for (const auto& p : data) {
            OpenPosition pos;
            pos.symbol = util::normalize_symbol(p.value("symbol", std::string()));
            pos.qty = to_double(p, "qty");
            pos.cost_basis = to_double(p, "cost_basis");
            if (!pos.symbol.empty()) {
                out.push_back(pos);
            }
        }
        return out;
    }

    // =========================================================================
    // Historical warm-up
    // =========================================================================

    /**
     * Fetch the most recent minute bars per symbol (one request each).
     * Symbols that fail or return no bars are left out of the result.
     */
    WarmUpResult warm_up(const std::vector<std::string>& symbols, int max_count,
                         const util::CancellationToken& token) override {
        WarmUpResult result;
        const int limit = std::clamp(max_count, 1, 10000);
        const Timestamp start = util::wall_clock_ns() - 7 * 24 * 3600 * NS_PER_SECOND;

        for (const auto& symbol : symbols) {
            if (token.cancelled()) {
                break;
            }
            std::stringstream url;
            url << settings_.data_url << "/v2/stocks/" << symbol << "/bars?timeframe=1Min"
                << "&limit=" << limit << "&sort=desc"
                << "&start=" << util::format_utc(start);

            BarSeries series;
            try {
                json data = get_json(url.str());
                if (data.contains("bars") && data["bars"].is_array()) {
                    for (const auto& b : data["bars"]) {
                        series.push_back(parse_bar(b));
                    }
                }
            } catch (const BrokerError&) {
                continue; // caller reports symbols missing from the result
            }

            if (series.empty()) {
                continue;
            }
            std::reverse(series.begin(), series.end()); // oldest first
            result.emplace(symbol, std::move(series));
        }
        return result;
    }

    // =========================================================================
    // Live polling
    // =========================================================================

    std::vector<std::pair<std::string, Bar>> latest_bars(const std::vector<std::string>& symbols) override {
        std::vector<std::pair<std::string, Bar>> out;
        if (symbols.empty()) {
            return out;
        }

        json data = get_json(settings_.data_url + "/v2/stocks/bars/latest?symbols=" + util::join(symbols, ","));
        if (!data.contains("bars") || !data["bars"].is_object()) {
            return out;
        }
        for (auto it = data["bars"].begin(); it != data["bars"].end(); ++it) {
            out.emplace_back(it.key(), parse_bar(it.value()));
        }
        return out;
    }

    // =========================================================================
    // Screener
    // =========================================================================

    std::vector<std::string> most_actives(int top) override {
        std::vector<std::string> out;
        json data = get_json(settings_.data_url + "/v1beta1/screener/stocks/most-actives?by=volume&top=" +
                             std::to_string(std::max(1, top)));
        if (!data.contains("most_actives") || !data["most_actives"].is_array()) {
            return out;
        }
        for (const auto& item : data["most_actives"]) {
            std::string sym = util::normalize_symbol(item.value("symbol", std::string()));
            if (!sym.empty()) {
                out.push_back(sym);
            }
        }
        return out;
    }

private:
    AlpacaSettings settings_;
    CURL* curl_;

    // CURL write callback
    static size_t write_callback(void* contents, size_t size, size_t nmemb, std::string* output) {
        size_t total_size = size * nmemb;
        output->append(static_cast<char*>(contents), total_size);
        return total_size;
    }

    // Alpaca returns numbers as strings on the trading API
    static double to_double(const json& obj, const char* key) {
        if (!obj.contains(key) || obj[key].is_null()) {
            return 0.0;
        }
        const json& v = obj[key];
        if (v.is_string()) {
            return std::strtod(v.get<std::string>().c_str(), nullptr);
        }
        return v.get<double>();
    }

    static Bar parse_bar(const json& b) {
        Bar bar;
        auto ts = util::parse_rfc3339(b.value("t", std::string()));
        if (!ts) {
            throw BrokerError("Invalid bar timestamp: " + b.dump());
        }
        bar.timestamp = *ts;
        bar.open = b.value("o", 0.0);
        bar.high = b.value("h", 0.0);
        bar.low = b.value("l", 0.0);
        bar.close = b.value("c", 0.0);
        bar.volume = static_cast<uint64_t>(b.value("v", 0.0));
        return bar;
    }

    json get_json(const std::string& url) {
        std::string response = http_get(url);
        try {
            return json::parse(response);
        } catch (const json::exception& e) {
            throw BrokerError(std::string("Invalid JSON from ") + url + ": " + e.what());
        }
    }

    // HTTP GET request with Alpaca auth headers
    std::string http_get(const std::string& url) {
        std::string response;

        curl_easy_reset(curl_);
        curl_easy_setopt(curl_, CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, write_callback);
        curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &response);
        curl_easy_setopt(curl_, CURLOPT_TIMEOUT, 30L);
        curl_easy_setopt(curl_, CURLOPT_CONNECTTIMEOUT, 10L);
        curl_easy_setopt(curl_, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl_, CURLOPT_NOSIGNAL, 1L);

        // SSL options
        curl_easy_setopt(curl_, CURLOPT_SSL_VERIFYPEER, 1L);
        curl_easy_setopt(curl_, CURLOPT_SSL_VERIFYHOST, 2L);

        struct curl_slist* headers = nullptr;
        headers = curl_slist_append(headers, ("APCA-API-KEY-ID: " + settings_.key_id).c_str());
        headers = curl_slist_append(headers, ("APCA-API-SECRET-KEY: " + settings_.secret_key).c_str());
        headers = curl_slist_append(headers, "Accept: application/json");
        curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, headers);

        CURLcode res = curl_easy_perform(curl_);
        curl_slist_free_all(headers);

        if (res != CURLE_OK) {
            throw BrokerError(std::string("CURL error: ") + curl_easy_strerror(res));
        }

        long http_code = 0;
        curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &http_code);

        if (http_code != 200) {
            throw BrokerError("HTTP error " + std::to_string(http_code) + " from " + url + ": " + response);
        }

        return response;
    }
};

} // namespace broker
} // namespace mpt
