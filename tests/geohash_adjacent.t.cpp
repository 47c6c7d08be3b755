#include <gtest/gtest.h>
#include "geohash.hpp"

#include <string>

namespace
{

using geocell::Direction;
using geocell::Geohash;
using geocell::InvalidDirection;
using geocell::InvalidGeohash;
using geocell::Neighbours;

TEST(GeohashAdjacent, SameParent)
{
    EXPECT_EQ(Geohash::adjacent("dqcjq", "n"), "dqcjw");
    EXPECT_EQ(Geohash::adjacent("dqcjq", "s"), "dqcjn");
    EXPECT_EQ(Geohash::adjacent("dqcjq", "w"), "dqcjm");
    EXPECT_EQ(Geohash::adjacent("dqcjq", "e"), "dqcjr");
}

TEST(GeohashAdjacent, CarriesIntoParent)
{
    EXPECT_EQ(Geohash::adjacent("u120fxz", "n"), "u12148p");
    EXPECT_EQ(Geohash::adjacent("u120fxz", "e"), "u120fzb");
    EXPECT_EQ(Geohash::adjacent("s0000", "w"), "ebpbp");
    EXPECT_EQ(Geohash::adjacent("s0000", "s"), "kpbpb");
    EXPECT_EQ(Geohash::adjacent("kpbpbp", "n"), "s00000");
}

TEST(GeohashAdjacent, CarriedCellSharesAnEdge)
{
    const auto here = Geohash::bounds("u120fxz");
    const auto north = Geohash::bounds(Geohash::adjacent("u120fxz", Direction::North));
    const auto east = Geohash::bounds(Geohash::adjacent("u120fxz", Direction::East));

    EXPECT_DOUBLE_EQ(north.southwest.lat, here.northeast.lat);
    EXPECT_DOUBLE_EQ(north.southwest.lon, here.southwest.lon);
    EXPECT_DOUBLE_EQ(east.southwest.lon, here.northeast.lon);
    EXPECT_DOUBLE_EQ(east.southwest.lat, here.southwest.lat);
}

TEST(GeohashAdjacent, CaseInsensitive)
{
    EXPECT_EQ(Geohash::adjacent("DQCJQ", "N"), "dqcjw");
    EXPECT_EQ(Geohash::adjacent("u120FXW", "East"), "u120fxx");
}

TEST(GeohashAdjacent, OppositeStepsCancel)
{
    for (const std::string g : {"u120fxw", "dqcw5", "xn774c", "gcpuvpk", "c23nb62w", "ezs42",
                                "u120fxz", "u120fb0", "9q8yyk8", "s0000", "kpbpbp"})
    {
        EXPECT_EQ(Geohash::adjacent(Geohash::adjacent(g, "n"), "s"), g);
        EXPECT_EQ(Geohash::adjacent(Geohash::adjacent(g, "s"), "n"), g);
        EXPECT_EQ(Geohash::adjacent(Geohash::adjacent(g, "e"), "w"), g);
        EXPECT_EQ(Geohash::adjacent(Geohash::adjacent(g, "w"), "e"), g);
    }
}

// Single-character cells on the world's edge go straight through the table.
TEST(GeohashAdjacent, WorldEdgeIsNotWrappedOrClamped)
{
    EXPECT_EQ(Geohash::adjacent("z", "e"), "b");
    EXPECT_EQ(Geohash::adjacent("z", "n"), "p");
    EXPECT_EQ(Geohash::adjacent("0", "w"), "p");
    EXPECT_EQ(Geohash::adjacent("0", "s"), "b");
    EXPECT_EQ(Geohash::adjacent("zzzz", "n"), "pbpb");
}

TEST(GeohashAdjacent, RejectsEmptyHash)
{
    EXPECT_THROW(Geohash::adjacent("", "n"), InvalidGeohash);
    EXPECT_THROW(Geohash::adjacent("", Direction::South), InvalidGeohash);
    EXPECT_THROW(Geohash::adjacent("", "x"), InvalidGeohash);
    EXPECT_THROW(Geohash::neighbours(""), InvalidGeohash);
}

TEST(GeohashAdjacent, RejectsForeignCharacter)
{
    EXPECT_THROW(Geohash::adjacent("u12a", "n"), InvalidGeohash);
    EXPECT_THROW(Geohash::adjacent("o", "e"), InvalidGeohash);
}

TEST(GeohashAdjacent, RejectsBadDirection)
{
    EXPECT_THROW(Geohash::adjacent("u120fxw", "x"), InvalidDirection);
    EXPECT_THROW(Geohash::adjacent("u120fxw", ""), InvalidDirection);
    EXPECT_THROW(Geohash::adjacent("u120fxw", "ne"), InvalidDirection);
}

TEST(GeohashDirection, Parse)
{
    EXPECT_EQ(geocell::parseDirection("n"), Direction::North);
    EXPECT_EQ(geocell::parseDirection("S"), Direction::South);
    EXPECT_EQ(geocell::parseDirection("east"), Direction::East);
    EXPECT_EQ(geocell::parseDirection("WEST"), Direction::West);
    EXPECT_THROW(geocell::parseDirection("up"), InvalidDirection);
}

TEST(GeohashDirection, LetterParsesBack)
{
    for (Direction d : {Direction::North, Direction::South, Direction::East, Direction::West})
        EXPECT_EQ(geocell::parseDirection(std::string(1, geocell::directionLetter(d))), d);
    EXPECT_EQ(geocell::directionLetter(Direction::West), 'w');
}

void expectNeighbours(const std::string &origin, const Neighbours &want)
{
    const Neighbours got = Geohash::neighbours(origin);
    EXPECT_EQ(got.n, want.n) << origin;
    EXPECT_EQ(got.ne, want.ne) << origin;
    EXPECT_EQ(got.e, want.e) << origin;
    EXPECT_EQ(got.se, want.se) << origin;
    EXPECT_EQ(got.s, want.s) << origin;
    EXPECT_EQ(got.sw, want.sw) << origin;
    EXPECT_EQ(got.w, want.w) << origin;
    EXPECT_EQ(got.nw, want.nw) << origin;
}

TEST(GeohashNeighbours, KnownCells)
{
    expectNeighbours("dqcw5", {"dqcw7", "dqcwk", "dqcwh", "dqctu", "dqctg", "dqctf", "dqcw4", "dqcw6"});
    expectNeighbours("xn774c", {"xn774f", "xn7754", "xn7751", "xn7750", "xn774b", "xn7748", "xn7749", "xn774d"});
    expectNeighbours("gcpuvpk", {"gcpuvps", "gcpuvpt", "gcpuvpm", "gcpuvpj", "gcpuvph", "gcpuvp5", "gcpuvp7", "gcpuvpe"});
    expectNeighbours("c23nb62w", {"c23nb62x", "c23nb62z", "c23nb62y", "c23nb62v", "c23nb62t", "c23nb62m", "c23nb62q", "c23nb62r"});
    expectNeighbours("u120fxw", {"u120fxy", "u120fxz", "u120fxx", "u120fxr", "u120fxq", "u120fxm", "u120fxt", "u120fxv"});
}

TEST(GeohashNeighbours, MatchesComposedAdjacent)
{
    const std::string g = "ezs42";
    const Neighbours nb = Geohash::neighbours(g);
    EXPECT_EQ(nb.n, Geohash::adjacent(g, "n"));
    EXPECT_EQ(nb.ne, Geohash::adjacent(Geohash::adjacent(g, "n"), "e"));
    EXPECT_EQ(nb.se, Geohash::adjacent(Geohash::adjacent(g, "s"), "e"));
    EXPECT_EQ(nb.sw, Geohash::adjacent(Geohash::adjacent(g, "s"), "w"));
    EXPECT_EQ(nb.nw, Geohash::adjacent(Geohash::adjacent(g, "n"), "w"));
    EXPECT_EQ(nb.w, Geohash::adjacent(g, "w"));
}

} // namespace
