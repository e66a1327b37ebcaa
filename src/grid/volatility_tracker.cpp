#include "grid/volatility_tracker.hpp"

#include <cmath>
#include <numeric>

namespace grid {

VolatilityTracker::VolatilityTracker(int period,
                                     std::size_t price_capacity,
                                     std::size_t history_capacity,
                                     std::size_t baseline_samples)
    : period_(period),
      price_capacity_(price_capacity),
      history_capacity_(history_capacity),
      baseline_samples_(baseline_samples) {}

bool VolatilityTracker::add_price(double price) {
    if (!(price > 0.0)) {
        return false;
    }

    prices_.push_back(price);
    while (prices_.size() > price_capacity_) {
        prices_.pop_front();
    }

    const auto window = static_cast<std::size_t>(period_);
    if (prices_.size() < window + 1) {
        return false;
    }

    double sum = 0.0;
    for (std::size_t i = prices_.size() - window; i < prices_.size(); ++i) {
        sum += std::fabs(prices_[i] - prices_[i - 1]);
    }
    current_ = sum / static_cast<double>(window);

    history_.push_back(current_);
    while (history_.size() > history_capacity_) {
        history_.pop_front();
    }

    if (!baseline_ && history_.size() >= baseline_samples_) {
        baseline_ = std::accumulate(history_.begin(), history_.end(), 0.0) / static_cast<double>(history_.size());
        return true;
    }
    return false;
}

void VolatilityTracker::restore_baseline(double baseline) {
    if (baseline > 0.0) {
        baseline_ = baseline;
    }
}

} // namespace grid
