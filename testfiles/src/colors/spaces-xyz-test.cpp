// SPDX-License-Identifier: GPL-2.0-or-later
/*
 * Unit tests for the RGB to XYZ matrix conversions
 *
 * Copyright (C) 2026 Authors
 *
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#include "colors/spaces/xyz.h"

#include <gtest/gtest.h>

#include "../test-utils.h"

using namespace Chromapick::Colors;

namespace {

using Space::Type;

struct conv : traced_data
{
    const Type space;
    const RGBColor rgb;
    const XYZColor xyz;
};

class toXYZ : public testing::TestWithParam<conv> {};

TEST_P(toXYZ, fromRGB)
{
    conv test = GetParam();
    auto scope = test.enable_scope();
    EXPECT_TRUE(VectorIsNear(values(rgb_to_xyz(test.rgb, test.space)), values(test.xyz), 1e-9));
}

TEST_P(toXYZ, toRGB)
{
    conv test = GetParam();
    auto scope = test.enable_scope();
    EXPECT_TRUE(VectorIsNear(values(xyz_to_rgb(test.xyz, test.space)), values(test.rgb), 0.001));
}

// clang-format off
INSTANTIATE_TEST_SUITE_P(ColorsSpacesXYZ, toXYZ, testing::Values(
    _P(conv, Type::RGB,     {0, 0, 0}, {0, 0, 0}),
    // White is the sum of the matrix rows
    _P(conv, Type::RGB,     {1, 1, 1}, {0.9505, 1.0, 1.0890}),
    _P(conv, Type::RGB,     {1, 0, 0}, {0.4124, 0.2126, 0.0193}),
    _P(conv, Type::P3,      {1, 1, 1}, {0.9504, 1.0000, 1.0890}),
    _P(conv, Type::P3,      {0, 1, 0}, {0.2657, 0.6917, 0.0451}),
    _P(conv, Type::Rec2020, {1, 1, 1}, {0.9505, 1.0000, 1.0890}),
    _P(conv, Type::Rec2020, {0, 0, 1}, {0.1689, 0.0593, 1.0609})
));
// clang-format on

class roundTrip : public testing::TestWithParam<Type> {};

TEST_P(roundTrip, unitScale)
{
    auto space = GetParam();
    for (unsigned i = 0; i < 100; i++) {
        auto v = random_values(3);
        auto out = xyz_to_rgb(rgb_to_xyz({v[0], v[1], v[2]}, space), space);
        EXPECT_TRUE(VectorIsNear(values(out), v, 0.001));
    }
}

// The matrices are four place approximations of each other's inverse, at
// full display scale the error stays within a twentieth of a step.
TEST_P(roundTrip, displayScale)
{
    auto space = GetParam();
    for (auto const &rgb : {RGBColor{255, 100, 100}, RGBColor{0, 0, 0}, RGBColor{255, 255, 255},
                            RGBColor{12.5, 200, 77}, RGBColor{0, 128, 255}}) {
        auto out = xyz_to_rgb(rgb_to_xyz(rgb, space), space);
        EXPECT_TRUE(VectorIsNear(values(out), values(rgb), 0.05));
    }
}

INSTANTIATE_TEST_SUITE_P(ColorsSpacesXYZ, roundTrip, testing::Values(Type::RGB, Type::P3, Type::Rec2020));

TEST(ColorsSpacesXYZ, reservedSpacesUseSRGB)
{
    RGBColor rgb{0.2, 0.5, 0.7};
    auto srgb = values(rgb_to_xyz(rgb, Type::RGB));
    for (auto type : {Type::XYZ, Type::LAB, Type::OKLCH}) {
        EXPECT_TRUE(VectorIsNear(values(rgb_to_xyz(rgb, type)), srgb, 1e-12));
        EXPECT_TRUE(VectorIsNear(values(xyz_to_rgb({0.3, 0.4, 0.5}, type)),
                                 values(xyz_to_rgb({0.3, 0.4, 0.5}, Type::RGB)), 1e-12));
    }
}

TEST(ColorsSpacesXYZ, noClamping)
{
    // Saturated Rec2020 green is far outside sRGB
    auto out = xyz_to_rgb(rgb_to_xyz({0, 1, 0}, Type::Rec2020), Type::RGB);
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
