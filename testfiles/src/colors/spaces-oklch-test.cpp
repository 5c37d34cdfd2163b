// SPDX-License-Identifier: GPL-2.0-or-later
/*
 * Unit tests for the polar OKLCH approximation
 *
 * Copyright (C) 2026 Authors
 *
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#include "colors/spaces/oklch.h"

#include <gtest/gtest.h>

#include "../test-utils.h"

using namespace Chromapick::Colors;

namespace {

struct oklch : traced_data
{
    const LABColor lab;
    const OKLCHColor out;
};

class fromLab : public testing::TestWithParam<oklch> {};

TEST_P(fromLab, values)
{
    oklch test = GetParam();
    auto scope = test.enable_scope();
    EXPECT_TRUE(VectorIsNear(values(lab_to_oklch(test.lab)), values(test.out), 0.001));
}

// clang-format off
INSTANTIATE_TEST_SUITE_P(ColorsSpacesOkLch, fromLab, testing::Values(
    _P(oklch, {100, 0, 0},            {1, 0, 0}),
    _P(oklch, {0, 0, 0},              {0, 0, 0}),
    _P(oklch, {50, 30, 40},           {0.5, 0.5, 53.1301}),
    _P(oklch, {50, 0, 20},            {0.5, 0.2, 90}),
    _P(oklch, {50, -20, 0},           {0.5, 0.2, 180}),
    // Negative angles wrap into 0..360
    _P(oklch, {50, 0, -20},           {0.5, 0.2, 270}),
    _P(oklch, {50, 10, -10},          {0.5, 0.141421, 315}),
    _P(oklch, {62.755, 58.978, 31.217}, {0.62755, 0.667301, 27.8922})
));
// clang-format on

TEST(ColorsSpacesOkLch, grayHasNoHue)
{
    EXPECT_EQ(lab_to_oklch({40, 1e-10, -1e-10}).h, 0.0);
    EXPECT_EQ(lab_to_oklch({40, -0.0, -0.0}).h, 0.0);
    EXPECT_GT(lab_to_oklch({40, 0, 1e-6}).h, 89.9);
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
