#pragma once

#include <vector>

namespace grid {

// Exponential average seeded with the first value, alpha = 2 / (period + 1).
std::vector<double> ema_series(const std::vector<double>& values, int period);

struct AdxSeries {
    std::vector<double> adx;       // NaN until enough bars
    std::vector<double> plus_di;
    std::vector<double> minus_di;
};

// Wilder-smoothed directional index; ADX is the simple mean of DX over period.
AdxSeries adx_series(const std::vector<double>& highs,
                     const std::vector<double>& lows,
                     const std::vector<double>& closes,
                     int period);

} // namespace grid
