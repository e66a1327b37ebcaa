#include "grid/price_guard.hpp"

#include <cmath>
#include <sstream>

namespace grid {

PriceDecision validate_price(double candidate, std::optional<double> last_known, double max_jump) {
    if (!std::isfinite(candidate) || candidate <= 0.0) {
        return {PriceVerdict::Reject, "non-positive price"};
    }
    if (last_known && *last_known > 0.0) {
        const double change = std::fabs(candidate - *last_known) / *last_known;
        if (change > max_jump) {
            std::ostringstream oss;
            oss << "jump of " << change * 100.0 << "% from " << *last_known;
            return {PriceVerdict::Reject, oss.str()};
        }
    }
    return {PriceVerdict::Accept, {}};
}

PriceDecision PriceGuard::offer(double candidate) {
    auto decision = validate_price(candidate, last_good_, max_jump_);
    if (decision.accepted()) {
        last_good_ = candidate;
    }
    return decision;
}

void PriceGuard::reanchor(double price) {
    if (std::isfinite(price) && price > 0.0) {
        last_good_ = price;
    }
}

} // namespace grid
