// SPDX-License-Identifier: GPL-2.0-or-later
/*
 * Unit tests for the HSL conversion
 *
 * Copyright (C) 2026 Authors
 *
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#include "colors/spaces/hsl.h"

#include <gtest/gtest.h>

#include "../test-utils.h"

using namespace Chromapick::Colors;

namespace {

struct hsl : traced_data
{
    const RGBColor rgb;
    const HSLColor out;
};

class fromRGB : public testing::TestWithParam<hsl> {};

TEST_P(fromRGB, values)
{
    hsl test = GetParam();
    auto scope = test.enable_scope();
    EXPECT_TRUE(VectorIsNear(values(rgb_to_hsl(test.rgb)), values(test.out), 0.01));
}

// clang-format off
INSTANTIATE_TEST_SUITE_P(ColorsSpacesHSL, fromRGB, testing::Values(
    _P(hsl, {0, 0, 0},       {0, 0, 0}),
    _P(hsl, {255, 255, 255}, {0, 0, 100}),
    _P(hsl, {128, 128, 128}, {0, 0, 50.196}),
    _P(hsl, {255, 0, 0},     {0, 100, 50}),
    _P(hsl, {0, 255, 0},     {120, 100, 50}),
    _P(hsl, {0, 0, 255},     {240, 100, 50}),
    _P(hsl, {255, 100, 100}, {0, 100, 69.608}),
    _P(hsl, {255, 0, 128},   {329.882, 100, 50}),
    // Ties for the largest channel go to red, then green
    _P(hsl, {255, 255, 0},   {60, 100, 50}),
    _P(hsl, {0, 255, 255},   {180, 100, 50}),
    _P(hsl, {255, 0, 255},   {300, 100, 50}),
    _P(hsl, {51, 102, 153},  {210, 50, 40})
));
// clang-format on

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
