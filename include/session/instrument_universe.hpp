#pragma once

#include <algorithm>
#include <stdexcept>
#include <string>
#include <vector>

namespace mpt {
namespace session {

/**
 * Ordered set of unique symbols traded or watched this session.
 *
 * Insertion order is kept; duplicates are ignored. After finalize() the
 * set is frozen and any further add() throws std::logic_error.
 */
class InstrumentUniverse {
public:
    InstrumentUniverse() = default;

    /// @return true if the symbol was new
    bool add(const std::string& symbol) {
        if (finalized_) {
            throw std::logic_error("instrument universe is finalized, cannot add " + symbol);
        }
        if (symbol.empty() || contains(symbol)) {
            return false;
        }
        symbols_.push_back(symbol);
        return true;
    }

    template <typename Range>
    void add_all(const Range& symbols) {
        for (const auto& s : symbols) {
            add(s);
        }
    }

    void finalize() { finalized_ = true; }
    bool finalized() const { return finalized_; }

    bool contains(const std::string& symbol) const {
        return std::find(symbols_.begin(), symbols_.end(), symbol) != symbols_.end();
    }

    const std::vector<std::string>& symbols() const { return symbols_; }
    size_t size() const { return symbols_.size(); }
    bool empty() const { return symbols_.empty(); }

private:
    std::vector<std::string> symbols_;
    bool finalized_ = false;
};

} // namespace session
} // namespace mpt
