#pragma once

#include <string>

namespace yieldcraft {

double roundTo(double value, int decimals);
double roundToUnit(double value, double unit);
double floorToUnit(double value, double unit);

// "12,345" (magnitude only, rounded to whole currency units)
std::string formatAmount(double value);

// "+5,000" / "-7,500" / "0"
std::string formatSignedAmount(double value);

std::string formatFixed(double value, int decimals);

}
