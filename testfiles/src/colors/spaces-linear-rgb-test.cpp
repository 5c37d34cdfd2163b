// SPDX-License-Identifier: GPL-2.0-or-later
/*
 * Unit tests for the sRGB transfer function
 *
 * Copyright (C) 2026 Authors
 *
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#include "colors/spaces/linear-rgb.h"

#include <gtest/gtest.h>

#include "../test-utils.h"

using namespace Chromapick::Colors;

namespace {

TEST(ColorsSpacesLinearRGB, gammaCorrect)
{
    EXPECT_DOUBLE_EQ(gamma_correct(0), 0);
    EXPECT_NEAR(gamma_correct(1), 1, 1e-12);
    // Linear segment
    EXPECT_DOUBLE_EQ(gamma_correct(0.002), 0.002 * 12.92);
    EXPECT_NEAR(gamma_correct(0.5), 0.735357, 1e-6);
    EXPECT_NEAR(gamma_correct(0.2140), 0.5, 0.001);
}

TEST(ColorsSpacesLinearRGB, gammaUncorrect)
{
    EXPECT_DOUBLE_EQ(gamma_uncorrect(0), 0);
    EXPECT_NEAR(gamma_uncorrect(1), 1, 1e-12);
    EXPECT_DOUBLE_EQ(gamma_uncorrect(0.04), 0.04 / 12.92);
    EXPECT_NEAR(gamma_uncorrect(0.5), 0.214041, 1e-6);
}

TEST(ColorsSpacesLinearRGB, inverse)
{
    for (double v : {0.0, 0.001, 0.0031308, 0.0031309, 0.04045, 0.1, 0.5, 0.99, 1.0}) {
        EXPECT_NEAR(gamma_uncorrect(gamma_correct(v)), v, 1e-9) << v;
    }
    for (auto v : random_values(100)) {
        EXPECT_NEAR(gamma_uncorrect(gamma_correct(v)), v, 1e-9) << v;
    }
}

TEST(ColorsSpacesLinearRGB, linearToDisplay)
{
    EXPECT_TRUE(VectorIsNear(values(linear_to_display({0, 1, 0.5})), {0, 255, 187.516}, 0.001));
    // Clamping is the last step
    EXPECT_TRUE(VectorIsNear(values(linear_to_display({-0.2, 1.3, 0.002})), {0, 255, 6.5892}, 0.001));
}

TEST(ColorsSpacesLinearRGB, displayToLinear)
{
    EXPECT_TRUE(VectorIsNear(values(display_to_linear({0, 255, 127.5})), {0, 1, 0.214041}, 1e-6));
    // Nothing is clamped
    auto out = display_to_linear({-10, 300, 0});
    EXPECT_LT(out.r, 0);
    EXPECT_GT(out.g, 1);
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
