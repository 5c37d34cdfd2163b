// SPDX-License-Identifier: GPL-2.0-or-later
/*
 * Unit tests for the CIE Lab conversion
 *
 * Copyright (C) 2026 Authors
 *
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#include "colors/spaces/lab.h"

#include <gtest/gtest.h>

#include "../test-utils.h"
#include "colors/gamut.h"
#include "colors/spaces/xyy.h"

using namespace Chromapick::Colors;

namespace {

TEST(ColorsSpacesLab, whitePoint)
{
    EXPECT_TRUE(VectorIsNear(values(xyz_to_lab(LAB_WHITE)), {100, 0, 0}, 1e-9));
    // The D65 chromaticity at full luminance is the same white within rounding
    EXPECT_TRUE(VectorIsNear(values(xyz_to_lab(xyy_to_xyz(D65_WHITE_POINT))), {100, 0, 0}, 0.02));
}

TEST(ColorsSpacesLab, black)
{
    EXPECT_TRUE(VectorIsNear(values(xyz_to_lab({0, 0, 0})), {0, 0, 0}, 1e-9));
}

TEST(ColorsSpacesLab, linearSegment)
{
    // Below 0.008856 the cube root is replaced by a straight line
    auto lab = xyz_to_lab({0.005 * LAB_WHITE.x, 0.005, 0.005 * LAB_WHITE.z});
    EXPECT_NEAR(lab.l, 116 * (7.787 * 0.005 + 16.0 / 116.0) - 16, 1e-9);
    EXPECT_NEAR(lab.a, 0, 1e-9);
    EXPECT_NEAR(lab.b, 0, 1e-9);
}

TEST(ColorsSpacesLab, primaries)
{
    // sRGB red and blue
    EXPECT_TRUE(VectorIsNear(values(xyz_to_lab({0.4124, 0.2126, 0.0193})), {53.24, 80.09, 67.20}, 0.05));
    EXPECT_TRUE(VectorIsNear(values(xyz_to_lab({0.1805, 0.0722, 0.9505})), {32.30, 79.19, -107.86}, 0.05));
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
