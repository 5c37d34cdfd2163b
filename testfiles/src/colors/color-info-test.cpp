// SPDX-License-Identifier: GPL-2.0-or-later
/*
 * Unit tests for deriving all representations of a color
 *
 * Copyright (C) 2026 Authors
 *
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#include "colors/color-info.h"

#include <cmath>
#include <gtest/gtest.h>

#include "../test-utils.h"
#include "colors/formats.h"

using namespace Chromapick::Colors;
using Space::Type;

namespace {

TEST(ColorInfo, white)
{
    auto info = describe({255, 255, 255});
    EXPECT_EQ(info.space, Type::RGB);
    EXPECT_TRUE(VectorIsNear(values(info.xyz), {0.9505, 1.0, 1.089}, 1e-9));
    EXPECT_TRUE(VectorIsNear(values(info.xy), {0.312716, 0.329001, 1.0}, 1e-6));
    EXPECT_TRUE(VectorIsNear(values(info.hsl), {0, 0, 100}, 1e-9));
    EXPECT_TRUE(VectorIsNear(values(info.lab), {100, 0.00526, -0.010408}, 1e-5));
    EXPECT_NEAR(info.temperature, 6504.2, 0.01);
    EXPECT_EQ(info.css, "rgb(255, 255, 255)");
    EXPECT_TRUE(info.in_gamut);
}

TEST(ColorInfo, black)
{
    auto info = describe({0, 0, 0});
    EXPECT_TRUE(VectorIsNear(values(info.xyz), {0, 0, 0}, 1e-12));
    EXPECT_TRUE(VectorIsNear(values(info.xy), {0, 0, 0}, 1e-12));
    EXPECT_TRUE(VectorIsNear(values(info.lab), {0, 0, 0}, 1e-9));
    EXPECT_EQ(info.oklch.h, 0.0);
    EXPECT_TRUE(std::isfinite(info.temperature));
    EXPECT_EQ(info.css, "rgb(0, 0, 0)");
    EXPECT_TRUE(info.in_gamut);
}

TEST(ColorInfo, salmon)
{
    auto info = describe({255, 100, 100});
    EXPECT_TRUE(VectorIsNear(values(info.xyz), {0.480974, 0.312944, 0.155620}, 1e-6));
    EXPECT_TRUE(VectorIsNear(values(info.xy), {0.506535, 0.329575, 0.312944}, 1e-6));
    EXPECT_TRUE(VectorIsNear(values(info.lab), {62.7554, 58.9784, 31.2173}, 1e-3));
    EXPECT_TRUE(VectorIsNear(values(info.oklch), {0.627554, 0.667306, 27.8922}, 1e-3));
    EXPECT_NEAR(info.temperature, 1628.64, 0.01);

    EXPECT_EQ(hsl_string(info.hsl), "hsl(0, 100%, 70%)");
    EXPECT_EQ(lab_string(info.lab), "lab(62.8% 59.0 31.2)");
    EXPECT_EQ(oklch_string(info.oklch), "oklch(0.628 0.667 27.9)");
    EXPECT_EQ(info.css, "rgb(255, 100, 100)");
}

TEST(ColorInfo, wideSpace)
{
    auto info = describe({255, 100, 100}, Type::P3);
    EXPECT_EQ(info.space, Type::P3);
    EXPECT_TRUE(VectorIsNear(values(info.xyz), {0.545618, 0.327254, 0.138780}, 1e-6));
    EXPECT_TRUE(VectorIsNear(values(info.lab), {63.938, 70.9868, 37.173}, 1e-3));
    EXPECT_NEAR(info.temperature, 1705.53, 0.01);
    EXPECT_EQ(info.css, "color(display-p3 1.0000 0.3922 0.3922)");
    // HSL is computed from the channels and ignores the space
    EXPECT_EQ(hsl_string(info.hsl), "hsl(0, 100%, 70%)");
}

TEST(ColorInfo, outOfRange)
{
    auto info = describe({300, -20, 100});
    EXPECT_FALSE(info.in_gamut);
    EXPECT_EQ(info.rgb.r, 300);
    EXPECT_EQ(info.css, "rgb(255, 0, 100)");
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
