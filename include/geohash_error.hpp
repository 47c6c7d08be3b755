#pragma once
#include <stdexcept>
#include <string>

namespace geocell
{
    // Base for every error the codec raises. Callers that don't care about
    // the kind can catch this (or std::invalid_argument) once.
    class GeohashError : public std::invalid_argument
    {
    public:
        explicit GeohashError(const std::string &what) : std::invalid_argument(what) {}
    };

    // Non-numeric, non-finite or out-of-range lat/lon/precision.
    class InvalidInput : public GeohashError
    {
    public:
        explicit InvalidInput(const std::string &what) : GeohashError(what) {}
    };

    // Empty geohash, or a character outside the base-32 alphabet.
    class InvalidGeohash : public GeohashError
    {
    public:
        explicit InvalidGeohash(const std::string &what) : GeohashError(what) {}
    };

    // Direction token other than n/s/e/w.
    class InvalidDirection : public GeohashError
    {
    public:
        explicit InvalidDirection(const std::string &what) : GeohashError(what) {}
    };
} // namespace geocell
