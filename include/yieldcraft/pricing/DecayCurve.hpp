#pragma once

namespace yieldcraft {

// Normalized logistic "cliff": holds near 1 for most of the horizon and
// collapses to 0 in the last `midpoint` fraction before departure.
class DecayCurve {
public:
    DecayCurve(double steepness, double midpoint);

    // x = remaining fraction of the horizon; clamped to [0, 1]. at(1) == 1, at(0) == 0.
    double at(double x) const;

    // 0 once departed (lead <= 0), 1 when the horizon is degenerate.
    double forLeadDays(int lead_days, int horizon_days) const;

private:
    double logistic(double x) const;

    double k;
    double p;
};

}
