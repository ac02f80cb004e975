#pragma once

/**
 * String utilities for symbol handling
 */

#include "../types.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <string>
#include <vector>

namespace mpt {
namespace util {

/**
 * Trim surrounding whitespace and uppercase a symbol ("  aapl " -> "AAPL").
 */
inline std::string normalize_symbol(std::string s) {
    s.erase(0, s.find_first_not_of(" \t\r\n"));
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

/**
 * Non-empty and short enough to travel in a queue message unchanged.
 */
inline bool valid_symbol(const std::string& s) {
    return !s.empty() && s.size() <= MAX_SYMBOL_LEN;
}

/**
 * Split a comma-separated string into a vector of normalized symbols.
 * Empty items are dropped.
 *
 * @param s Comma-separated string (e.g., "AAPL, msft")
 */
inline std::vector<std::string> split_symbols(const std::string& s) {
    std::vector<std::string> result;
    std::stringstream ss(s);
    std::string item;
    while (std::getline(ss, item, ',')) {
        item = normalize_symbol(item);
        if (!item.empty()) {
            result.push_back(item);
        }
    }
    return result;
}

/**
 * Join items with a separator (used to build multi-symbol REST queries).
 */
inline std::string join(const std::vector<std::string>& items, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0)
            out += sep;
        out += items[i];
    }
    return out;
}

} // namespace util
} // namespace mpt
