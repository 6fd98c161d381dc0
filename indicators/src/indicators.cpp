#include "indicators.hpp"

namespace indicators {

std::vector<double> closePrices(const core::TimeSeries<core::PriceBar>& bars) {
    std::vector<double> out;
    out.reserve(bars.size());
    for (const auto& bar : bars) out.push_back(bar.close);
    return out;
}

std::vector<double> highPrices(const core::TimeSeries<core::PriceBar>& bars) {
    std::vector<double> out;
    out.reserve(bars.size());
    for (const auto& bar : bars) out.push_back(bar.high);
    return out;
}

std::vector<double> lowPrices(const core::TimeSeries<core::PriceBar>& bars) {
    std::vector<double> out;
    out.reserve(bars.size());
    for (const auto& bar : bars) out.push_back(bar.low);
    return out;
}

std::vector<double> volumes(const core::TimeSeries<core::PriceBar>& bars) {
    std::vector<double> out;
    out.reserve(bars.size());
    for (const auto& bar : bars) out.push_back(bar.volume);
    return out;
}

} // namespace indicators
