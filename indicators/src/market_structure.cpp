#include "market_structure.hpp"
#include "indicators.hpp"
#include "logging.hpp"
#include "ta_libc.h"
#include <vector>
#include <cmath>
#include <algorithm>

namespace indicators {

    namespace {

        // Runs a single-output TA-Lib function over the trailing window only
        // and returns its last value.
        template<typename Fn>
        std::optional<double> lastWindowValue(const std::vector<double>& values, int period, Fn&& fn) {
            if (period <= 0 || values.size() < static_cast<size_t>(period)) {
                return std::nullopt;
            }
            const int end_idx = static_cast<int>(values.size()) - 1;
            const int start_idx = end_idx; // Only the latest output is needed
            double out = 0.0;
            int out_begin_idx = 0;
            int out_nb_element = 0;
            TA_RetCode ret_code = fn(start_idx, end_idx, values.data(), period, &out_begin_idx, &out_nb_element, &out);
            if (ret_code != TA_SUCCESS || out_nb_element != 1) {
                core::logging::getLogger()->error("TA-Lib window calculation failed with error code: {}", static_cast<int>(ret_code));
                return std::nullopt;
            }
            return out;
        }

        std::optional<double> windowMean(const std::vector<double>& values, int period) {
            return lastWindowValue(values, period,
                [](int s, int e, const double* in, int p, int* b, int* n, double* out) {
                    return TA_MA(s, e, in, p, TA_MAType_SMA, b, n, out);
                });
        }

    } // end anonymous namespace

    double trendStrength(const core::TimeSeries<core::PriceBar>& bars, int period) {
        if (period < 2 || bars.size() < static_cast<size_t>(period)) {
            return 0.0;
        }
        std::vector<double> closes = closePrices(bars);

        auto slope = lastWindowValue(closes, period,
            [](int s, int e, const double* in, int p, int* b, int* n, double* out) {
                return TA_LINEARREG_SLOPE(s, e, in, p, b, n, out);
            });
        auto mean = windowMean(closes, period);
        if (!slope || !mean || *mean == 0.0) {
            return 0.0;
        }

        double normalized = std::abs(*slope / *mean);
        return std::min(normalized * 1000.0, 1.0);
    }

    core::VolumeRegime volumeRegime(const core::TimeSeries<core::PriceBar>& bars, int period) {
        if (bars.size() < static_cast<size_t>(period)) {
            return core::VolumeRegime::Unknown;
        }
        std::vector<double> vols = volumes(bars);
        auto mean = windowMean(vols, period);
        if (!mean || *mean <= 0.0) {
            return core::VolumeRegime::Unknown;
        }

        double ratio = vols.back() / *mean;
        if (ratio > 1.5) return core::VolumeRegime::High;
        if (ratio > 0.8) return core::VolumeRegime::Medium;
        return core::VolumeRegime::Low;
    }

    std::optional<SupportResistance> supportResistance(const core::TimeSeries<core::PriceBar>& bars, int lookback) {
        if (lookback <= 0 || bars.size() < static_cast<size_t>(lookback)) {
            return std::nullopt;
        }
        std::vector<double> highs = highPrices(bars);
        std::vector<double> lows = lowPrices(bars);

        auto resistance = lastWindowValue(highs, lookback,
            [](int s, int e, const double* in, int p, int* b, int* n, double* out) {
                return TA_MAX(s, e, in, p, b, n, out);
            });
        auto support = lastWindowValue(lows, lookback,
            [](int s, int e, const double* in, int p, int* b, int* n, double* out) {
                return TA_MIN(s, e, in, p, b, n, out);
            });
        if (!resistance || !support) {
            return std::nullopt;
        }
        return SupportResistance{*support, *resistance};
    }

} // namespace indicators
