#pragma once

#include <optional>
#include <string>
#include <vector>

#include "datatypes.hpp"
#include "config.hpp"

namespace portfolio {

    enum class RiskLevel {
        Low,
        Medium,
        High
    };

    struct RiskAlert {
        std::string type;     // DAILY_LOSS_LIMIT, POSITION_SIZE_LIMIT, TOTAL_EXPOSURE_LIMIT
        std::string message;
        RiskLevel severity = RiskLevel::Medium;
        std::optional<long long> position_id;
    };

    struct RiskReport {
        std::vector<RiskAlert> alerts;
        RiskLevel status = RiskLevel::Low;

        bool blocksTrading() const { return status == RiskLevel::High; }
    };

    std::string toString(RiskLevel level);

    class RiskGate {
    public:
        // Stateless. A non-positive balance yields no alerts.
        static RiskReport evaluate(const core::Portfolio& portfolio,
                                   const std::vector<core::Position>& open_positions,
                                   const core::RiskConfig& limits);
    };

} // namespace portfolio
