#include "number_parse.hpp"
#include "geohash_error.hpp"

#include <cerrno>
#include <climits>
#include <cmath>
#include <cstdlib>
#include <string>

namespace geocell::text
{
    static std::string trim(const std::string &s)
    {
        const char *ws = " \t\r\n\f\v";
        auto b = s.find_first_not_of(ws);
        if (b == std::string::npos)
            return std::string();
        auto e = s.find_last_not_of(ws);
        return s.substr(b, e - b + 1);
    }

    double parseDouble(const std::string &text, const std::string &what)
    {
        const std::string t = trim(text);
        if (t.empty())
            throw InvalidInput(what + " is empty");
        // strtod would take 0x1p3 and friends
        if (t.find_first_of("xX") != std::string::npos)
            throw InvalidInput(what + " is not a decimal number: " + text);

        char *end = nullptr;
        errno = 0;
        double v = std::strtod(t.c_str(), &end);
        if (end != t.c_str() + t.size())
            throw InvalidInput(what + " is not a number: " + text);
        if (!std::isfinite(v))
            throw InvalidInput(what + " is not finite: " + text);
        return v;
    }

    int parseInt(const std::string &text, const std::string &what)
    {
        const std::string t = trim(text);
        if (t.empty())
            throw InvalidInput(what + " is empty");

        char *end = nullptr;
        errno = 0;
        long v = std::strtol(t.c_str(), &end, 10);
        if (end != t.c_str() + t.size())
            throw InvalidInput(what + " is not an integer: " + text);
        if (errno == ERANGE || v < INT_MIN || v > INT_MAX)
            throw InvalidInput(what + " is out of range: " + text);
        return static_cast<int>(v);
    }
} // namespace geocell::text
