// SPDX-License-Identifier: GPL-2.0-or-later
/*
 * Unit tests for the correlated color temperature estimate
 *
 * Copyright (C) 2026 Authors
 *
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#include "colors/temperature.h"

#include <cmath>
#include <gtest/gtest.h>

#include "colors/gamut.h"

using namespace Chromapick::Colors;

namespace {

TEST(ColorsTemperature, illuminants)
{
    EXPECT_NEAR(color_temperature(D65_WHITE_POINT.x, D65_WHITE_POINT.y), 6505.08, 0.01);
    // Illuminant A and D50
    EXPECT_NEAR(color_temperature(0.44757, 0.40745), 2857.29, 0.01);
    EXPECT_NEAR(color_temperature(0.3457, 0.3585), 5001.01, 0.01);
}

TEST(ColorsTemperature, epicenter)
{
    // The numerator vanishes, leaving the constant term
    EXPECT_NEAR(color_temperature(0.3320, 0.2), 5520.33, 1e-9);
}

TEST(ColorsTemperature, notClamped)
{
    EXPECT_TRUE(std::isinf(color_temperature(0.4, 0.1858)));
    EXPECT_LT(color_temperature(0.174, 0.17), 0);
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
