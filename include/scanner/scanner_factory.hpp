#pragma once

#include "../config/plan_config.hpp"
#include "scanner.hpp"

#include <memory>
#include <vector>

namespace mpt {
namespace scanner {

/**
 * Scanner Factory
 *
 * Creates scanners from the plan's "scanners" section. Unknown names and
 * bad parameters raise config::ConfigError.
 */
class ScannerFactory {
public:
    static std::unique_ptr<IScanner> create(const config::ComponentSpec& spec, broker::IScreener& screener) {
        try {
            if (spec.name == "static") {
                std::vector<std::string> symbols;
                if (spec.params.contains("symbols")) {
                    symbols = spec.params.at("symbols").get<std::vector<std::string>>();
                }
                return std::make_unique<StaticScanner>(std::move(symbols));
            }
            if (spec.name == "most_actives") {
                return std::make_unique<MostActivesScanner>(screener,
                                                            spec.params.value("top", config::data::MOST_ACTIVES_TOP));
            }
        } catch (const nlohmann::json::exception& e) {
            throw config::ConfigError("scanner " + spec.name + ": " + e.what());
        }
        throw config::ConfigError("unknown scanner: " + spec.name + " (known: " + util::join(names(), ", ") + ")");
    }

    static std::vector<std::unique_ptr<IScanner>> create_all(const std::vector<config::ComponentSpec>& specs,
                                                             broker::IScreener& screener) {
        std::vector<std::unique_ptr<IScanner>> out;
        for (const auto& spec : specs) {
            out.push_back(create(spec, screener));
        }
        return out;
    }

    /**
     * Fail early in the parent, before anything is forked.
     */
    static void validate(const std::vector<config::ComponentSpec>& specs) {
        NullScreener screener;
        create_all(specs, screener);
    }

    static std::vector<std::string> names() { return {"static", "most_actives"}; }

private:
    class NullScreener : public broker::IScreener {
    public:
        std::vector<std::string> most_actives(int) override { return {}; }
    };
};

} // namespace scanner
} // namespace mpt
