#pragma once

#include "../config/plan_config.hpp"
#include "bar_strategy.hpp"

#include <memory>
#include <vector>

namespace mpt {
namespace strategy {

/**
 * Strategy Factory
 *
 * Creates strategy instances from the plan's "strategies" section.
 * Unknown names and bad parameters raise config::ConfigError.
 */
class StrategyFactory {
public:
    static std::unique_ptr<IBarStrategy> create(const config::ComponentSpec& spec, logging::AsyncLogger& logger) {
        try {
            if (spec.name == "bar_logger") {
                return std::make_unique<BarLogger>(logger, spec.params.value("every", 1));
            }
            if (spec.name == "session_stats") {
                return std::make_unique<SessionStats>(logger);
            }
        } catch (const nlohmann::json::exception& e) {
            throw config::ConfigError("strategy " + spec.name + ": " + e.what());
        }
        throw config::ConfigError("unknown strategy: " + spec.name + " (known: " + util::join(names(), ", ") + ")");
    }

    static std::vector<std::unique_ptr<IBarStrategy>> create_all(const std::vector<config::ComponentSpec>& specs,
                                                                 logging::AsyncLogger& logger) {
        std::vector<std::unique_ptr<IBarStrategy>> out;
        for (const auto& spec : specs) {
            out.push_back(create(spec, logger));
        }
        return out;
    }

    /**
     * Fail early in the parent, before anything is forked.
     */
    static void validate(const std::vector<config::ComponentSpec>& specs) {
        logging::AsyncLogger scratch;
        create_all(specs, scratch);
    }

    static std::vector<std::string> names() { return {"bar_logger", "session_stats"}; }
};

} // namespace strategy
} // namespace mpt
