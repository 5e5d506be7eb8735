#include "yieldcraft/pricing/DecayCurve.hpp"

#include <algorithm>
#include <cmath>

namespace yieldcraft {

DecayCurve::DecayCurve(double steepness, double midpoint)
    : k(steepness), p(midpoint) {}

double DecayCurve::logistic(double x) const {
    return 1.0 / (1.0 + std::exp(-k * (x - p)));
}

double DecayCurve::at(double x) const {
    x = std::clamp(x, 0.0, 1.0);

    double f_high = logistic(1.0);
    double f_low = logistic(0.0);
    double span = f_high - f_low;
    if (span <= 0.0) return 1.0;

    return std::clamp((logistic(x) - f_low) / span, 0.0, 1.0);
}

double DecayCurve::forLeadDays(int lead_days, int horizon_days) const {
    if (lead_days <= 0) return 0.0;
    if (horizon_days <= 0) return 1.0;
    return at(static_cast<double>(lead_days) / horizon_days);
}

}
