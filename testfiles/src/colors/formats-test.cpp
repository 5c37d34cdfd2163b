// SPDX-License-Identifier: GPL-2.0-or-later
/*
 * Unit tests for the css and export text formats
 *
 * Copyright (C) 2026 Authors
 *
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#include "colors/formats.h"

#include <gtest/gtest.h>

#include "../test-utils.h"

using namespace Chromapick::Colors;

namespace {

using Space::Type;

struct css : traced_data
{
    const RGBColor rgb;
    const Type space;
    const std::string out;
};

class cssColor : public testing::TestWithParam<css> {};

TEST_P(cssColor, print)
{
    css test = GetParam();
    auto scope = test.enable_scope();
    EXPECT_EQ(css_color(test.rgb, test.space), test.out);
}

// clang-format off
INSTANTIATE_TEST_SUITE_P(ColorsFormats, cssColor, testing::Values(
    _P(css, {255, 100, 100}, Type::RGB,     "rgb(255, 100, 100)"),
    _P(css, {255, 100, 100}, Type::P3,      "color(display-p3 1.0000 0.3922 0.3922)"),
    _P(css, {255, 100, 100}, Type::Rec2020, "color(rec2020 1.0000 0.3922 0.3922)"),
    _P(css, {0, 0, 0},       Type::P3,      "color(display-p3 0.0000 0.0000 0.0000)"),
    // Clamped then rounded
    _P(css, {300, -5, 127.5}, Type::RGB,    "rgb(255, 0, 128)"),
    _P(css, {300, -5, 127.6}, Type::P3,     "color(display-p3 1.0000 0.0000 0.5020)"),
    // Reserved spaces print as sRGB
    _P(css, {10, 20, 30},    Type::XYZ,     "rgb(10, 20, 30)"),
    _P(css, {10, 20, 30},    Type::LAB,     "rgb(10, 20, 30)"),
    _P(css, {10, 20, 30},    Type::OKLCH,   "rgb(10, 20, 30)")
));
// clang-format on

class cssColorLocale : public GlobalLocaleTestFixture {};

TEST_P(cssColorLocale, decimalPoint)
{
    EXPECT_EQ(css_color({255, 100, 100}, Type::P3), "color(display-p3 1.0000 0.3922 0.3922)");
    EXPECT_EQ(lab_string({62.755, 58.978, 31.217}), "lab(62.8% 59.0 31.2)");
}

INSTANTIATE_TEST_SUITE_P(ColorsFormats, cssColorLocale, testing::Values("C", "de_DE.UTF-8", "fr_FR.UTF-8"));

TEST(ColorsFormats, rgbString)
{
    EXPECT_EQ(rgb_string({255, 100, 100}), "rgb(255, 100, 100)");
    EXPECT_EQ(rgb_string({254.5, 0.49, 400}), "rgb(255, 0, 255)");
}

TEST(ColorsFormats, hslString)
{
    EXPECT_EQ(hsl_string({0, 100, 69.6}), "hsl(0, 100%, 70%)");
    EXPECT_EQ(hsl_string({210.4, 33.33, 50}), "hsl(210, 33%, 50%)");
}

TEST(ColorsFormats, labString)
{
    EXPECT_EQ(lab_string({100, 0, 0}), "lab(100.0% 0.0 0.0)");
    EXPECT_EQ(lab_string({53.24, 80.09, 67.2}), "lab(53.2% 80.1 67.2)");
    EXPECT_EQ(lab_string({32.3, -0.01, -79.19}), "lab(32.3% 0.0 -79.2)");
}

TEST(ColorsFormats, oklchString)
{
    EXPECT_EQ(oklch_string({0.62755, 0.66731, 27.892}), "oklch(0.628 0.667 27.9)");
    EXPECT_EQ(oklch_string({1, 0, 0}), "oklch(1.000 0.000 0.0)");
}

TEST(ColorsFormats, hexString)
{
    EXPECT_EQ(hex_string({255, 100, 100}), "#ff6464");
    EXPECT_EQ(hex_string({0, 0, 0}), "#000000");
    EXPECT_EQ(hex_string({300, -1, 15.2}), "#ff000f");
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
