#include "grid/indicators.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace grid {
namespace {

constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

// Mean of the finite values in [begin, end); NaN when there are none.
double finite_mean(const std::vector<double>& values, std::size_t begin, std::size_t end) {
    double sum = 0.0;
    std::size_t count = 0;
    for (std::size_t i = begin; i < end && i < values.size(); ++i) {
        if (std::isfinite(values[i])) {
            sum += values[i];
            ++count;
        }
    }
    return count == 0 ? kNaN : sum / static_cast<double>(count);
}

std::vector<double> wilder_smooth(const std::vector<double>& values, std::size_t period) {
    std::vector<double> smoothed(values.size(), kNaN);
    if (values.size() < period || period == 0) {
        return smoothed;
    }
    smoothed[period - 1] = finite_mean(values, 0, period);
    for (std::size_t i = period; i < values.size(); ++i) {
        smoothed[i] = smoothed[i - 1] - smoothed[i - 1] / static_cast<double>(period) + values[i];
    }
    return smoothed;
}

} // namespace

std::vector<double> ema_series(const std::vector<double>& values, int period) {
    std::vector<double> result;
    if (values.empty() || period <= 0) {
        return result;
    }
    result.reserve(values.size());
    const double alpha = 2.0 / (static_cast<double>(period) + 1.0);
    double ema = values.front();
    result.push_back(ema);
    for (std::size_t i = 1; i < values.size(); ++i) {
        ema = alpha * values[i] + (1.0 - alpha) * ema;
        result.push_back(ema);
    }
    return result;
}

AdxSeries adx_series(const std::vector<double>& highs,
                     const std::vector<double>& lows,
                     const std::vector<double>& closes,
                     int period) {
    const std::size_t n = std::min({highs.size(), lows.size(), closes.size()});
    AdxSeries result;
    result.adx.assign(n, kNaN);
    result.plus_di.assign(n, kNaN);
    result.minus_di.assign(n, kNaN);
    if (period <= 0 || n == 0) {
        return result;
    }
    const auto p = static_cast<std::size_t>(period);

    std::vector<double> tr(n, kNaN);
    std::vector<double> plus_dm(n, 0.0);
    std::vector<double> minus_dm(n, 0.0);
    for (std::size_t i = 1; i < n; ++i) {
        tr[i] = std::max({highs[i] - lows[i],
                          std::fabs(highs[i] - closes[i - 1]),
                          std::fabs(lows[i] - closes[i - 1])});

        double up = highs[i] - highs[i - 1];
        double down = lows[i - 1] - lows[i];
        up = up > 0.0 ? up : 0.0;
        down = down > 0.0 ? down : 0.0;
        if (up > 0.0 && down > 0.0) {
            if (up <= down) {
                up = 0.0;
            } else {
                down = 0.0;
            }
        }
        plus_dm[i] = up;
        minus_dm[i] = down;
    }

    const auto smoothed_tr = wilder_smooth(tr, p);
    const auto smoothed_plus = wilder_smooth(plus_dm, p);
    const auto smoothed_minus = wilder_smooth(minus_dm, p);

    std::vector<double> dx(n, kNaN);
    for (std::size_t i = 0; i < n; ++i) {
        if (!std::isfinite(smoothed_tr[i]) || smoothed_tr[i] == 0.0) {
            continue;
        }
        result.plus_di[i] = 100.0 * smoothed_plus[i] / smoothed_tr[i];
        result.minus_di[i] = 100.0 * smoothed_minus[i] / smoothed_tr[i];
        const double di_sum = result.plus_di[i] + result.minus_di[i];
        if (di_sum > 0.0) {
            dx[i] = 100.0 * std::fabs(result.plus_di[i] - result.minus_di[i]) / di_sum;
        }
    }

    // Rolling mean yields NaN whenever the window holds a NaN.
    for (std::size_t i = p - 1; i < n; ++i) {
        double sum = 0.0;
        bool complete = true;
        for (std::size_t j = i + 1 - p; j <= i; ++j) {
            if (!std::isfinite(dx[j])) {
                complete = false;
                break;
            }
            sum += dx[j];
        }
        if (complete) {
            result.adx[i] = sum / static_cast<double>(p);
        }
    }
    return result;
}

} // namespace grid
