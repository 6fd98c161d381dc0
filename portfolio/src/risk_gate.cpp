#include "risk_gate.hpp"
#include "logging.hpp"

#include <spdlog/fmt/fmt.h>

namespace portfolio {

    std::string toString(RiskLevel level) {
        switch (level) {
            case RiskLevel::Low: return "LOW";
            case RiskLevel::Medium: return "MEDIUM";
            case RiskLevel::High: return "HIGH";
        }
        return "UNKNOWN";
    }

    RiskReport RiskGate::evaluate(const core::Portfolio& portfolio,
                                  const std::vector<core::Position>& open_positions,
                                  const core::RiskConfig& limits) {
        RiskReport report;
        const double balance = portfolio.total_balance;
        if (balance <= 0.0) {
            return report;
        }

        double daily_loss_limit = balance * limits.max_daily_loss_pct / 100.0;
        if (portfolio.daily_pnl < -daily_loss_limit) {
            report.alerts.push_back({"DAILY_LOSS_LIMIT",
                                     fmt::format("Daily loss limit exceeded: {:.2f} vs limit {:.2f}",
                                                 portfolio.daily_pnl, -daily_loss_limit),
                                     RiskLevel::High, std::nullopt});
        }

        double total_exposure = 0.0;
        for (const auto& position : open_positions) {
            if (!position.is_open) continue;
            total_exposure += position.current_price.value_or(position.entry_price) * position.remaining_amount;
            if (!position.current_price) continue;

            double position_pct = (*position.current_price * position.remaining_amount) / balance * 100.0;
            if (position_pct > limits.max_position_size_pct) {
                report.alerts.push_back({"POSITION_SIZE_LIMIT",
                                         fmt::format("Position size limit exceeded: {:.1f}% vs limit {:.1f}%",
                                                     position_pct, limits.max_position_size_pct),
                                         RiskLevel::Medium, position.id});
            }
        }

        double exposure_pct = total_exposure / balance * 100.0;
        if (exposure_pct > limits.max_total_exposure_pct) {
            report.alerts.push_back({"TOTAL_EXPOSURE_LIMIT",
                                     fmt::format("Total exposure too high: {:.1f}% vs limit {:.1f}%",
                                                 exposure_pct, limits.max_total_exposure_pct),
                                     RiskLevel::High, std::nullopt});
        }

        for (const auto& alert : report.alerts) {
            if (alert.severity == RiskLevel::High) {
                report.status = RiskLevel::High;
                break;
            }
            report.status = RiskLevel::Medium;
        }

        if (!report.alerts.empty()) {
            auto logger = core::logging::getLogger();
            for (const auto& alert : report.alerts) {
                logger->warn("Risk alert [{}] {}: {}", toString(alert.severity), alert.type, alert.message);
            }
        }
        return report;
    }

} // namespace portfolio
