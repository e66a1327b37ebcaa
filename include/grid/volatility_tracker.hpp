#pragma once

#include <cstddef>
#include <deque>
#include <optional>

namespace grid {

// Average absolute price delta over a short window, plus a baseline that is
// captured once from the first full history of those averages and then frozen.
class VolatilityTracker {
public:
    VolatilityTracker(int period = 14,
                      std::size_t price_capacity = 100,
                      std::size_t history_capacity = 50,
                      std::size_t baseline_samples = 20);

    // Returns true when this sample captured the baseline.
    bool add_price(double price);

    double current() const noexcept { return current_; }
    std::optional<double> baseline() const noexcept { return baseline_; }
    std::size_t sample_count() const noexcept { return history_.size(); }

    void restore_baseline(double baseline);

private:
    int period_;
    std::size_t price_capacity_;
    std::size_t history_capacity_;
    std::size_t baseline_samples_;
    std::deque<double> prices_;
    std::deque<double> history_;
    double current_ = 0.0;
    std::optional<double> baseline_;
};

} // namespace grid
