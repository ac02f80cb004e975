#pragma once

#include "../broker/broker_api.hpp"
#include "../config/defaults.hpp"
#include "../util/string_utils.hpp"

#include <algorithm>
#include <string>
#include <vector>

namespace mpt {
namespace scanner {

/**
 * Source of candidate symbols, run periodically by the scanner process.
 */
class IScanner {
public:
    virtual ~IScanner() = default;

    virtual const char* name() const = 0;

    // Candidate symbols, best first. May throw broker::BrokerError.
    virtual std::vector<std::string> scan() = 0;
};

/**
 * Fixed symbol list from the plan ({"symbols": [...]})
 */
class StaticScanner : public IScanner {
public:
    explicit StaticScanner(std::vector<std::string> symbols) {
        for (auto& s : symbols) {
            std::string sym = util::normalize_symbol(s);
            if (!sym.empty() && std::find(symbols_.begin(), symbols_.end(), sym) == symbols_.end()) {
                symbols_.push_back(sym);
            }
        }
    }

    const char* name() const override { return "static"; }
    std::vector<std::string> scan() override { return symbols_; }

private:
    std::vector<std::string> symbols_;
};

/**
 * Top-N most active symbols by volume from the screener ({"top": 20})
 */
class MostActivesScanner : public IScanner {
public:
    MostActivesScanner(broker::IScreener& screener, int top) : screener_(screener), top_(std::max(1, top)) {}

    const char* name() const override { return "most_actives"; }
    std::vector<std::string> scan() override { return screener_.most_actives(top_); }

    int top() const { return top_; }

private:
    broker::IScreener& screener_;
    int top_;
};

} // namespace scanner
} // namespace mpt
