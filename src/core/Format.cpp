#include "yieldcraft/core/Format.hpp"

#include <cmath>
#include <iomanip>
#include <sstream>

namespace yieldcraft {

double roundTo(double value, int decimals) {
    double scale = std::pow(10.0, decimals);
    return std::round(value * scale) / scale;
}

double roundToUnit(double value, double unit) {
    if (unit <= 0.0) return value;
    return std::round(value / unit) * unit;
}

double floorToUnit(double value, double unit) {
    if (unit <= 0.0) return value;
    return std::floor(value / unit) * unit;
}

std::string formatAmount(double value) {
    long long whole = std::llround(std::fabs(value));
    std::string digits = std::to_string(whole);

    std::string out;
    int count = 0;
    for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
        if (count > 0 && count % 3 == 0) out.insert(out.begin(), ',');
        out.insert(out.begin(), *it);
        ++count;
    }
    return out;
}

std::string formatSignedAmount(double value) {
    if (std::llround(value) == 0) return "0";
    return (value > 0.0 ? "+" : "-") + formatAmount(value);
}

std::string formatFixed(double value, int decimals) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(decimals) << value;
    return ss.str();
}

}
