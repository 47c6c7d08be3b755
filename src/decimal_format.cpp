#include "decimal_format.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <string>

namespace geocell::text {

namespace {

// Enough fraction digits to print |v| exactly: 2^-k needs k decimal digits.
int exactFractionDigits(double v) {
    int exp = 0;
    std::frexp(v, &exp);
    return std::clamp(53 - exp, 0, 1100);
}

std::string printExact(double v, int digits) {
    int n = std::snprintf(nullptr, 0, "%.*f", digits, v);
    std::string out(static_cast<size_t>(n) + 1, '\0');
    std::snprintf(&out[0], out.size(), "%.*f", digits, v);
    out.resize(static_cast<size_t>(n));
    return out;
}

// Adds one to the last digit of a plain digit string, carrying left.
void incrementDigits(std::string& digits) {
    for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
        if (*it != '9') { ++*it; return; }
        *it = '0';
    }
    digits.insert(digits.begin(), '1');
}

} // namespace

std::string toFixed(double value, int decimals) {
    if (decimals < 0) decimals = 0;
    if (!std::isfinite(value)) return printExact(value, decimals);

    const bool negative = std::signbit(value);
    const double mag = std::fabs(value);

    std::string exact = printExact(mag, std::max(exactFractionDigits(mag), decimals + 1));
    auto sep = exact.find_first_not_of("0123456789");
    std::string intPart = exact.substr(0, sep);
    std::string frac = (sep == std::string::npos) ? std::string() : exact.substr(sep + 1);

    std::string digits = intPart + frac.substr(0, decimals);
    if (frac.size() > static_cast<size_t>(decimals) && frac[decimals] >= '5')
        incrementDigits(digits);

    // digits now holds intPart (maybe one longer after a carry) + `decimals` fraction digits.
    std::string out;
    const size_t intLen = digits.size() - static_cast<size_t>(decimals);
    out = digits.substr(0, intLen);
    if (decimals > 0) out += '.' + digits.substr(intLen);

    const bool zero = digits.find_first_not_of('0') == std::string::npos;
    if (negative && !zero) out.insert(out.begin(), '-');
    return out;
}

double roundToDecimals(double value, int decimals) {
    const std::string s = toFixed(value, decimals);
    return std::strtod(s.c_str(), nullptr);
}

std::string shortest(double value) {
    char buf[64];
    for (int p = 1; p <= 17; ++p) {
        std::snprintf(buf, sizeof(buf), "%.*g", p, value);
        if (std::strtod(buf, nullptr) == value) break;
    }
    return buf;
}

} // namespace geocell::text
