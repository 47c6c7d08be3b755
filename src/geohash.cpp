#include "geohash.hpp"
#include "decimal_format.hpp"
#include "number_parse.hpp"

#include <cctype>
#include <cmath>
#include <string>
#include <string_view>

namespace geocell
{
    namespace
    {
        constexpr std::string_view kBase32 = Geohash::kAlphabet;

        // Indexed [direction][length % 2]. Direction order matches the enum:
        // North, South, East, West.
        constexpr std::string_view kNeighbour[4][2] = {
            {"p0r21436x8zb9dcf5h7kjnmqesgutwvy", "bc01fg45238967deuvhjyznpkmstqrwx"},
            {"14365h7k9dcfesgujnmqp0r2twvyx8zb", "238967debc01fg45kmstqrwxuvhjyznp"},
            {"bc01fg45238967deuvhjyznpkmstqrwx", "p0r21436x8zb9dcf5h7kjnmqesgutwvy"},
            {"238967debc01fg45kmstqrwxuvhjyznp", "14365h7k9dcfesgujnmqp0r2twvyx8zb"},
        };

        // Last characters sitting on the parent cell's edge in that direction.
        constexpr std::string_view kBorder[4][2] = {
            {"prxz", "bcfguvyz"},
            {"028b", "0145hjnp"},
            {"bcfguvyz", "prxz"},
            {"0145hjnp", "028b"},
        };

        struct Interval
        {
            double lo, hi;
            double mid() const { return (lo + hi) / 2; }
        };

        int base32Index(char c)
        {
            auto p = kBase32.find(c);
            return p == std::string_view::npos ? -1 : static_cast<int>(p);
        }

        // geohash must already be normalised
        std::string step(const std::string &geohash, Direction d)
        {
            const int dir = static_cast<int>(d);
            const int type = static_cast<int>(geohash.size() % 2);
            const char lastCh = geohash.back();
            std::string parent = geohash.substr(0, geohash.size() - 1);

            // carry into the parent when leaving it
            if (!parent.empty() && kBorder[dir][type].find(lastCh) != std::string_view::npos)
                parent = step(parent, d);

            return parent + kBase32[kNeighbour[dir][type].find(lastCh)];
        }
    } // namespace

    Direction parseDirection(const std::string &text)
    {
        std::string t;
        t.reserve(text.size());
        for (char c : text)
            t += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));

        if (t == "n" || t == "north")
            return Direction::North;
        if (t == "s" || t == "south")
            return Direction::South;
        if (t == "e" || t == "east")
            return Direction::East;
        if (t == "w" || t == "west")
            return Direction::West;
        throw InvalidDirection("Invalid direction: '" + text + "'");
    }

    char directionLetter(Direction d)
    {
        switch (d)
        {
        case Direction::North:
            return 'n';
        case Direction::South:
            return 's';
        case Direction::East:
            return 'e';
        case Direction::West:
            return 'w';
        }
        return '?';
    }

    std::string Geohash::encode(double lat, double lon, int precision)
    {
        if (!std::isfinite(lat) || !std::isfinite(lon))
            throw InvalidInput("latitude/longitude must be finite");
        if (lat < -90.0 || lat > 90.0)
            throw InvalidInput("latitude out of range: " + std::to_string(lat));
        if (lon < -180.0 || lon > 180.0)
            throw InvalidInput("longitude out of range: " + std::to_string(lon));
        if (precision < 1 || precision > kMaxPrecision)
            throw InvalidInput("precision must be 1.." + std::to_string(kMaxPrecision) +
                               ", got " + std::to_string(precision));

        Interval latI{-90.0, 90.0};
        Interval lonI{-180.0, 180.0};
        bool evenBit = true; // even bits bisect longitude
        int idx = 0;
        int bit = 0;

        std::string geohash;
        geohash.reserve(static_cast<size_t>(precision));
        while (geohash.size() < static_cast<size_t>(precision))
        {
            Interval &iv = evenBit ? lonI : latI;
            const double v = evenBit ? lon : lat;
            const double mid = iv.mid();
            if (v >= mid)
            {
                idx = idx * 2 + 1;
                iv.lo = mid;
            }
            else
            {
                idx = idx * 2;
                iv.hi = mid;
            }
            evenBit = !evenBit;

            if (++bit == 5)
            {
                geohash += kBase32[static_cast<size_t>(idx)];
                bit = 0;
                idx = 0;
            }
        }
        return geohash;
    }

    std::string Geohash::encode(double lat, double lon)
    {
        for (int p = 1; p <= kMaxPrecision; ++p)
        {
            std::string hash = encode(lat, lon, p);
            LatLon posn = decode(hash);
            if (posn.lat == lat && posn.lon == lon)
                return hash;
        }
        return encode(lat, lon, kMaxPrecision);
    }

    std::string Geohash::encode(const std::string &lat, const std::string &lon,
                                const std::optional<std::string> &precision)
    {
        const double la = text::parseDouble(lat, "latitude");
        const double lo = text::parseDouble(lon, "longitude");
        if (precision)
            return encode(la, lo, text::parseInt(*precision, "precision"));
        return encode(la, lo);
    }

    BoundingBox Geohash::bounds(const std::string &geohash)
    {
        const std::string g = normalise(geohash);

        Interval latI{-90.0, 90.0};
        Interval lonI{-180.0, 180.0};
        bool evenBit = true;

        for (char c : g)
        {
            const int idx = base32Index(c);
            for (int n = 4; n >= 0; --n)
            {
                Interval &iv = evenBit ? lonI : latI;
                if ((idx >> n) & 1)
                    iv.lo = iv.mid();
                else
                    iv.hi = iv.mid();
                evenBit = !evenBit;
            }
        }

        return BoundingBox{{latI.lo, lonI.lo}, {latI.hi, lonI.hi}};
    }

    LatLon Geohash::decode(const std::string &geohash)
    {
        const BoundingBox b = bounds(geohash);
        const double latW = b.northeast.lat - b.southwest.lat;
        const double lonW = b.northeast.lon - b.southwest.lon;

        const double lat = (b.southwest.lat + b.northeast.lat) / 2;
        const double lon = (b.southwest.lon + b.northeast.lon) / 2;

        // floor(2 - log10(width)) decimal places per axis
        const int latDp = static_cast<int>(std::floor(2 - std::log10(latW)));
        const int lonDp = static_cast<int>(std::floor(2 - std::log10(lonW)));

        return LatLon{text::roundToDecimals(lat, latDp), text::roundToDecimals(lon, lonDp)};
    }

    std::string Geohash::adjacent(const std::string &geohash, Direction d)
    {
        return step(normalise(geohash), d);
    }

    std::string Geohash::adjacent(const std::string &geohash, const std::string &direction)
    {
        // geohash is checked first so "" with a bad direction reports the hash
        const std::string g = normalise(geohash);
        return step(g, parseDirection(direction));
    }

    Neighbours Geohash::neighbours(const std::string &geohash)
    {
        const std::string n = adjacent(geohash, Direction::North);
        const std::string s = adjacent(geohash, Direction::South);

        Neighbours out;
        out.n = n;
        out.ne = adjacent(n, Direction::East);
        out.e = adjacent(geohash, Direction::East);
        out.se = adjacent(s, Direction::East);
        out.s = s;
        out.sw = adjacent(s, Direction::West);
        out.w = adjacent(geohash, Direction::West);
        out.nw = adjacent(n, Direction::West);
        return out;
    }

    bool Geohash::isValid(const std::string &geohash)
    {
        if (geohash.empty() || geohash.size() > static_cast<size_t>(kMaxPrecision))
            return false;
        for (char c : geohash)
        {
            if (base32Index(static_cast<char>(std::tolower(static_cast<unsigned char>(c)))) < 0)
                return false;
        }
        return true;
    }

    std::string Geohash::normalise(const std::string &geohash)
    {
        if (geohash.empty())
            throw InvalidGeohash("Invalid geohash: empty string");
        // past 12 characters the cell width underflows to zero
        if (geohash.size() > static_cast<size_t>(kMaxPrecision))
            throw InvalidGeohash("Invalid geohash: longer than " + std::to_string(kMaxPrecision) +
                                 " characters");

        std::string g;
        g.reserve(geohash.size());
        for (char c : geohash)
        {
            const char lc = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
            if (base32Index(lc) < 0)
                throw InvalidGeohash("Invalid geohash: '" + geohash + "'");
            g += lc;
        }
        return g;
    }
} // namespace geocell
