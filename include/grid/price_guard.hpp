#pragma once

#include <optional>
#include <string>

namespace grid {

enum class PriceVerdict { Accept, Reject };

struct PriceDecision {
    PriceVerdict verdict = PriceVerdict::Reject;
    std::string reason;

    bool accepted() const noexcept { return verdict == PriceVerdict::Accept; }
};

// Rejects non-finite or non-positive candidates, and candidates that move more
// than max_jump (fraction) away from the last known good price.
PriceDecision validate_price(double candidate,
                             std::optional<double> last_known,
                             double max_jump = 0.10);

// Holds the last accepted price; rejected candidates leave it untouched.
class PriceGuard {
public:
    explicit PriceGuard(double max_jump = 0.10) : max_jump_(max_jump) {}

    PriceDecision offer(double candidate);

    // Replaces the reference outright once an independent source confirmed a
    // new level. Non-positive or non-finite prices are ignored.
    void reanchor(double price);
    std::optional<double> last_good() const noexcept { return last_good_; }

private:
    double max_jump_;
    std::optional<double> last_good_;
};

} // namespace grid
