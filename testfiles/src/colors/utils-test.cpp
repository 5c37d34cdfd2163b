// SPDX-License-Identifier: GPL-2.0-or-later
/*
 * Unit tests for color utilities.
 *
 * Copyright (C) 2026 Authors
 *
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#include "colors/utils.h"

#include <gtest/gtest.h>

#include "../test-utils.h"
#include "colors/color.h"

using namespace Chromapick::Colors;

namespace {

TEST(ColorUtils, test_rgba_to_hex)
{
    EXPECT_EQ(rgba_to_hex(0xff00ff00, false), "#ff00ff");
    EXPECT_EQ(rgba_to_hex(0xff00ffff, true), "#ff00ffff");
    EXPECT_EQ(rgba_to_hex(0x000a0bff, false), "#000a0b");
}

TEST(ColorUtils, test_rgb_to_rgba)
{
    EXPECT_EQ(rgb_to_rgba({255, 100, 100}), 0xff6464ff);
    EXPECT_EQ(rgb_to_rgba({255, 100, 100}, 0.0), 0xff646400);
    // Clamped and rounded
    EXPECT_EQ(rgb_to_rgba({300, -20, 127.5}), 0xff0080ff);
    EXPECT_EQ(rgb_to_rgba({0.4, 254.6, 10.49}), 0x00ff0aff);
}

TEST(ColorUtils, test_parse_rgb_hex)
{
    auto rgb = parse_rgb("#ff6464");
    ASSERT_TRUE(rgb);
    EXPECT_TRUE(VectorIsNear(values(*rgb), {255, 100, 100}, 1e-9));

    rgb = parse_rgb("  #0A0b0C ");
    ASSERT_TRUE(rgb);
    EXPECT_TRUE(VectorIsNear(values(*rgb), {10, 11, 12}, 1e-9));

    rgb = parse_rgb("#f60");
    ASSERT_TRUE(rgb);
    EXPECT_TRUE(VectorIsNear(values(*rgb), {255, 102, 0}, 1e-9));
}

TEST(ColorUtils, test_parse_rgb_numbers)
{
    auto rgb = parse_rgb("255,100,100");
    ASSERT_TRUE(rgb);
    EXPECT_TRUE(VectorIsNear(values(*rgb), {255, 100, 100}, 1e-9));

    rgb = parse_rgb(" 12.5 , 0.25,  .5 ");
    ASSERT_TRUE(rgb);
    EXPECT_TRUE(VectorIsNear(values(*rgb), {12.5, 0.25, 0.5}, 1e-9));

    // Out of range values are kept, they are only clamped for display
    rgb = parse_rgb("300,-20,0");
    ASSERT_TRUE(rgb);
    EXPECT_TRUE(VectorIsNear(values(*rgb), {300, -20, 0}, 1e-9));
}

TEST(ColorUtils, test_parse_rgb_bad)
{
    EXPECT_FALSE(parse_rgb(""));
    EXPECT_FALSE(parse_rgb("red"));
    EXPECT_FALSE(parse_rgb("#ff64"));
    EXPECT_FALSE(parse_rgb("#ff646400"));
    EXPECT_FALSE(parse_rgb("#gg6464"));
    EXPECT_FALSE(parse_rgb("255,100"));
    EXPECT_FALSE(parse_rgb("255,100,100,1"));
    EXPECT_FALSE(parse_rgb("1.2.3,0,0"));
    EXPECT_FALSE(parse_rgb(".,0,0"));
    EXPECT_FALSE(parse_rgb("rgb(255, 100, 100)"));
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
