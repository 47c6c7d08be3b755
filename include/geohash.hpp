#pragma once
#include <optional>
#include <string>
#include <string_view>

#include "geohash_error.hpp"

namespace geocell {

struct LatLon {
double lat{};
double lon{};
};

// southwest.lat <= northeast.lat and southwest.lon <= northeast.lon always hold.
struct BoundingBox {
LatLon southwest;
LatLon northeast;
};

enum class Direction { North, South, East, West };

struct Neighbours {
std::string n, ne, e, se, s, sw, w, nw;
};

// Accepts n/s/e/w or north/south/east/west, any case.
Direction parseDirection(const std::string& text);
char directionLetter(Direction d);


class Geohash {
public:
static constexpr int kMaxPrecision = 12;
static constexpr std::string_view kAlphabet = "0123456789bcdefghjkmnpqrstuvwxyz";

// Encodes to exactly `precision` characters (1..kMaxPrecision).
// Throws InvalidInput on NaN/inf, lat outside [-90,90], lon outside [-180,180]
// or a precision out of range.
static std::string encode(double lat, double lon, int precision);

// Picks the shortest precision whose decoded centroid equals (lat, lon)
// exactly, falling back to kMaxPrecision.
static std::string encode(double lat, double lon);

// Text forms, as received from a query string. Each argument is coerced
// with parseDouble / parseInt first.
static std::string encode(const std::string& lat, const std::string& lon,
                          const std::optional<std::string>& precision = std::nullopt);

// Hashes longer than kMaxPrecision are rejected with InvalidGeohash, as are
// empty ones and any character outside kAlphabet.
static BoundingBox bounds(const std::string& geohash);

// Cell centre, rounded to floor(2 - log10(cell width)) decimals per axis.
static LatLon decode(const std::string& geohash);

// Cell adjacent to `geohash` in direction `d`. A single-character hash on
// the edge of the world (e.g. "z" going east) maps straight through the
// lookup table with no wraparound or clamping check: adjacent("z", East)
// is "b". Callers near the poles or the antimeridian must expect this.
static std::string adjacent(const std::string& geohash, Direction d);
static std::string adjacent(const std::string& geohash, const std::string& direction);

// Diagonals are N-then-E, S-then-E, S-then-W, N-then-W.
static Neighbours neighbours(const std::string& geohash);

static bool isValid(const std::string& geohash);

// Lowercased copy; throws InvalidGeohash on empty or over-long input or a
// foreign character.
static std::string normalise(const std::string& geohash);
};
} // namespace geocell
