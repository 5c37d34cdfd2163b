// SPDX-License-Identifier: GPL-2.0-or-later
/*
 * Unit tests for gamut checking
 *
 * Copyright (C) 2026 Authors
 *
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#include "colors/gamut.h"

#include <gtest/gtest.h>

using namespace Chromapick::Colors;
using Space::Type;

namespace {

TEST(ColorsGamut, displayRange)
{
    EXPECT_TRUE(is_in_gamut({0, 0, 0}));
    EXPECT_TRUE(is_in_gamut({255, 255, 255}));
    EXPECT_TRUE(is_in_gamut({255, 100, 100}));
    EXPECT_FALSE(is_in_gamut({-0.001, 0, 0}));
    EXPECT_FALSE(is_in_gamut({0, 255.001, 0}));
    EXPECT_FALSE(is_in_gamut({0, 0, 300}));
}

TEST(ColorsGamut, whitePointInEverySpace)
{
    auto d65 = Geom::Point(D65_WHITE_POINT.x, D65_WHITE_POINT.y);
    EXPECT_TRUE(chromaticity_in_gamut(d65, Type::RGB));
    EXPECT_TRUE(chromaticity_in_gamut(d65, Type::P3));
    EXPECT_TRUE(chromaticity_in_gamut(d65, Type::Rec2020));
}

TEST(ColorsGamut, widerSpaces)
{
    auto deep_red = Geom::Point(0.7, 0.29);
    EXPECT_FALSE(chromaticity_in_gamut(deep_red, Type::RGB));
    EXPECT_FALSE(chromaticity_in_gamut(deep_red, Type::P3));
    EXPECT_TRUE(chromaticity_in_gamut(deep_red, Type::Rec2020));

    auto green = Geom::Point(0.28, 0.65);
    EXPECT_FALSE(chromaticity_in_gamut(green, Type::RGB));
    EXPECT_TRUE(chromaticity_in_gamut(green, Type::P3));
    EXPECT_TRUE(chromaticity_in_gamut(green, Type::Rec2020));
}

TEST(ColorsGamut, edgesAreInside)
{
    EXPECT_TRUE(chromaticity_in_gamut({0.64, 0.33}, Type::RGB));
    EXPECT_TRUE(chromaticity_in_gamut({0.15, 0.06}, Type::RGB));
    EXPECT_TRUE(chromaticity_in_gamut({0.47, 0.464}, Type::RGB));
    EXPECT_FALSE(chromaticity_in_gamut({0.47, 0.466}, Type::RGB));
    EXPECT_FALSE(chromaticity_in_gamut({0.8, 0.8}, Type::RGB));
    EXPECT_FALSE(chromaticity_in_gamut({0, 0}, Type::Rec2020));
}

TEST(ColorsGamut, reservedSpacesUseSRGB)
{
    auto deep_red = Geom::Point(0.7, 0.29);
    EXPECT_FALSE(chromaticity_in_gamut(deep_red, Type::XYZ));
    EXPECT_FALSE(chromaticity_in_gamut(deep_red, Type::OKLCH));
    EXPECT_TRUE(chromaticity_in_gamut({0.3, 0.3}, Type::LAB));
}

TEST(ColorsGamut, polygonsAreClosed)
{
    for (auto const *polygon : {&CHROMATICITY_BOUNDARY, &SRGB_GAMUT, &P3_GAMUT, &REC2020_GAMUT}) {
        EXPECT_EQ(polygon->front(), polygon->back());
    }
}

} // namespace

/*
  Local Variables:
  mode:c++
  c-file-style:"stroustrup"
  c-file-offsets:((innamespace . 0)(inline-open . 0))
  indent-tabs-mode:nil
  fill-column:99
  End:
*/
// vim: expandtab:shiftwidth=4:tabstop=8:softtabstop=4 :
