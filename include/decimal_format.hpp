#pragma once
#include <string>

namespace geocell::text {

// Fixed-point text with exactly `decimals` fraction digits. Rounds on the
// exact binary value, ties away from zero ("22.5" -> "23", "-0.125" at 2
// -> "-0.13"). A result that rounds to zero is printed without a sign.
std::string toFixed(double value, int decimals);

// Numeric value of toFixed(value, decimals).
double roundToDecimals(double value, int decimals);

// Fewest significant digits that still parse back to `value`.
std::string shortest(double value);

} // namespace geocell::text
