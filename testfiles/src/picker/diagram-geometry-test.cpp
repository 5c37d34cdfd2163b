// SPDX-License-Identifier: GPL-2.0-or-later
/*
 * Unit tests for placing the diagram on the canvas
 *
 * Copyright (C) 2026 Authors
 *
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#include "picker/diagram-geometry.h"

#include <gtest/gtest.h>

using namespace Chromapick::Picker;

namespace {

TEST(DiagramGeometry, defaults)
{
    auto geom = DiagramGeometry();
    EXPECT_EQ(geom.canvas_size(), 400);
    EXPECT_EQ(geom.diagram_size(), 350);
    EXPECT_EQ(geom.offset(), Geom::Point(25, 25));
    EXPECT_EQ(geom.area(), Geom::Rect(25, 25, 375, 375));
}

TEST(DiagramGeometry, toCanvas)
{
    auto geom = DiagramGeometry();
    EXPECT_EQ(geom.to_canvas({0, 0}), Geom::Point(25, 375));
    EXPECT_EQ(geom.to_canvas({1, 1}), Geom::Point(375, 25));
    EXPECT_EQ(geom.to_canvas({1, 0}), Geom::Point(375, 375));

    auto white = geom.to_canvas({0.3127, 0.3290});
    EXPECT_NEAR(white.x(), 134.445, 1e-9);
    EXPECT_NEAR(white.y(), 259.85, 1e-9);
}

TEST(DiagramGeometry, toChromaticity)
{
    auto geom = DiagramGeometry();
    EXPECT_EQ(geom.to_chromaticity({25, 375}), Geom::Point(0, 0));
    EXPECT_EQ(geom.to_chromaticity({375, 25}), Geom::Point(1, 1));
    EXPECT_EQ(geom.to_chromaticity({200, 200}), Geom::Point(0.5, 0.5));

    auto xy = geom.to_chromaticity({134.445, 259.85});
    EXPECT_NEAR(xy.x(), 0.3127, 1e-9);
    EXPECT_NEAR(xy.y(), 0.3290, 1e-9);
}

TEST(DiagramGeometry, outsideSnapsToEdge)
{
    auto geom = DiagramGeometry();
    EXPECT_EQ(geom.to_chromaticity({0, 0}), Geom::Point(0, 1));
    EXPECT_EQ(geom.to_chromaticity({400, 400}), Geom::Point(1, 0));
    EXPECT_EQ(geom.to_chromaticity({-100, 200}), Geom::Point(0, 0.5));
}

TEST(DiagramGeometry, custom)
{
    auto geom = DiagramGeometry(200, 100, {50, 10});
    EXPECT_EQ(geom.area(), Geom::Rect(50, 10, 150, 110));
    EXPECT_EQ(geom.to_canvas({0.5, 0.25}), Geom::Point(100, 85));
    EXPECT_EQ(geom.to_chromaticity({100, 85}), Geom::Point(0.5, 0.25));
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
