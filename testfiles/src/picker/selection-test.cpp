// SPDX-License-Identifier: GPL-2.0-or-later
/*
 * Unit tests for picking colors from the diagram
 *
 * Copyright (C) 2026 Authors
 *
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#include "picker/selection.h"

#include <gtest/gtest.h>

#include "../test-utils.h"
#include "picker/diagram-geometry.h"

using namespace Chromapick::Colors;
using namespace Chromapick::Picker;
using Space::Type;

namespace {

TEST(PickerPick, whitePoint)
{
    auto result = pick({0.3127, 0.3290, 0.5}, Type::RGB);
    EXPECT_TRUE(VectorIsNear(values(result.rgb), {187.503, 187.524, 187.522}, 0.001));
    EXPECT_TRUE(result.in_gamut);
}

TEST(PickerPick, fullLuminanceWhite)
{
    // Rounding in the matrices lifts green and blue just past 255
    auto result = pick({0.3127, 0.3290, 1.0}, Type::RGB);
    EXPECT_TRUE(VectorIsNear(values(result.rgb), {254.982, 255, 255}, 0.001));
    EXPECT_FALSE(result.in_gamut);
}

TEST(PickerPick, outOfGamutIsClamped)
{
    auto result = pick({0.7, 0.29, 0.5}, Type::RGB);
    EXPECT_FALSE(result.in_gamut);
    EXPECT_TRUE(VectorIsNear(values(result.rgb), {255, 0, 0}, 1e-9));
}

TEST(PickerPick, widerSpace)
{
    auto red = Chromapick::Colors::xyColor{0.7, 0.29, 0.1};
    EXPECT_FALSE(pick(red, Type::RGB).in_gamut);
    EXPECT_FALSE(pick(red, Type::P3).in_gamut);

    auto result = pick(red, Type::Rec2020);
    EXPECT_TRUE(result.in_gamut);
    EXPECT_TRUE(VectorIsNear(values(result.rgb), {165.331, 2.560, 10.591}, 0.001));
}

TEST(PickerPick, degenerate)
{
    auto result = pick({0.3, 0.0, 0.5}, Type::RGB);
    EXPECT_TRUE(VectorIsNear(values(result.rgb), {0, 0, 0}, 1e-12));
    EXPECT_TRUE(result.in_gamut);
}

TEST(PickerSelection, fromRGB)
{
    auto sel = Selection::from_rgb({255, 100, 100});
    EXPECT_EQ(sel.space(), Type::RGB);
    EXPECT_EQ(sel.luminance(), 0.5);
    EXPECT_TRUE(sel.in_gamut());
    EXPECT_TRUE(VectorIsNear(values(sel.rgb()), {255, 100, 100}, 1e-12));
    EXPECT_TRUE(VectorIsNear(values(sel.chromaticity()), {0.506535, 0.329575, 0.312944}, 1e-6));
    EXPECT_EQ(sel.info().css, "rgb(255, 100, 100)");
    EXPECT_NEAR(sel.temperature(), 1628.64, 0.01);

    EXPECT_FALSE(Selection::from_rgb({256, 0, 0}).in_gamut());
    EXPECT_EQ(Selection::from_rgb({0, 0, 0}, Type::P3, 3.0).luminance(), 1.0);
    EXPECT_EQ(Selection::from_rgb({0, 0, 0}, Type::P3, -1).luminance(), 0.0);
}

TEST(PickerSelection, withChromaticity)
{
    auto start = Selection::from_rgb({255, 100, 100});
    auto sel = start.with_chromaticity(0.3127, 0.3290);

    EXPECT_TRUE(VectorIsNear(values(sel.chromaticity()), {0.3127, 0.3290, 0.5}, 1e-12));
    EXPECT_TRUE(VectorIsNear(values(sel.rgb()), {187.503, 187.524, 187.522}, 0.001));
    EXPECT_TRUE(sel.in_gamut());
    EXPECT_NEAR(sel.temperature(), 6505.08, 0.01);
    EXPECT_EQ(sel.info().css, "rgb(188, 188, 188)");

    // The starting selection is left alone
    EXPECT_TRUE(VectorIsNear(values(start.rgb()), {255, 100, 100}, 1e-12));
}

TEST(PickerSelection, withChromaticityOutOfGamut)
{
    auto sel = Selection::from_rgb({255, 100, 100}).with_chromaticity(0.7, 0.29);
    EXPECT_FALSE(sel.in_gamut());
    EXPECT_TRUE(VectorIsNear(values(sel.rgb()), {255, 0, 0}, 1e-9));
    EXPECT_EQ(sel.info().css, "rgb(255, 0, 0)");
    // Where the user clicked is kept, not the chromaticity of the clamped color
    EXPECT_EQ(sel.chromaticity().x, 0.7);
    EXPECT_EQ(sel.chromaticity().y, 0.29);
}

TEST(PickerSelection, withChromaticityClamps)
{
    auto sel = Selection::from_rgb({0, 0, 0}).with_chromaticity(-0.5, 2);
    EXPECT_EQ(sel.chromaticity().x, 0);
    EXPECT_EQ(sel.chromaticity().y, 1);
}

TEST(PickerSelection, withCanvasPoint)
{
    auto geom = DiagramGeometry();
    auto sel = Selection::from_rgb({255, 100, 100}).with_canvas_point({134.445, 259.85}, geom);
    EXPECT_NEAR(sel.chromaticity().x, 0.3127, 1e-9);
    EXPECT_NEAR(sel.chromaticity().y, 0.3290, 1e-9);
    EXPECT_TRUE(sel.in_gamut());

    // Off the diagram snaps to the bottom left corner, y = 0 is black
    sel = sel.with_canvas_point({-100, 1000}, geom);
    EXPECT_EQ(sel.chromaticity().x, 0);
    EXPECT_EQ(sel.chromaticity().y, 0);
    EXPECT_TRUE(VectorIsNear(values(sel.rgb()), {0, 0, 0}, 1e-12));
}

TEST(PickerSelection, withRGB)
{
    auto sel = Selection::from_rgb({0, 0, 0}, Type::P3, 0.8).with_rgb({255, 100, 100});
    EXPECT_EQ(sel.space(), Type::P3);
    EXPECT_EQ(sel.luminance(), 0.8);
    EXPECT_EQ(sel.info().css, "color(display-p3 1.0000 0.3922 0.3922)");
}

TEST(PickerSelection, withSpace)
{
    auto srgb = Selection::from_rgb({255, 100, 100});
    auto rec = srgb.with_space(Type::Rec2020);
    EXPECT_EQ(rec.space(), Type::Rec2020);
    EXPECT_TRUE(VectorIsNear(values(rec.rgb()), {255, 100, 100}, 1e-12));
    EXPECT_EQ(rec.info().css, "color(rec2020 1.0000 0.3922 0.3922)");
    EXPECT_EQ(srgb.space(), Type::RGB);

    // Picks now go through the wider space
    auto dim = Selection::from_rgb({0, 0, 0}, Type::RGB, 0.1);
    EXPECT_FALSE(dim.with_chromaticity(0.7, 0.29).in_gamut());
    EXPECT_TRUE(dim.with_space(Type::Rec2020).with_chromaticity(0.7, 0.29).in_gamut());
}

TEST(PickerSelection, withLuminance)
{
    auto sel = Selection::from_rgb({255, 100, 100}).with_luminance(1.5);
    EXPECT_EQ(sel.luminance(), 1.0);
    EXPECT_TRUE(VectorIsNear(values(sel.rgb()), {255, 100, 100}, 1e-12));

    sel = sel.with_chromaticity(0.3127, 0.3290);
    EXPECT_TRUE(VectorIsNear(values(sel.rgb()), {254.982, 255, 255}, 0.001));
    EXPECT_EQ(sel.chromaticity().Y, 1.0);

    EXPECT_EQ(sel.with_luminance(-2).luminance(), 0.0);
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
