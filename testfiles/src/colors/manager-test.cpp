// SPDX-License-Identifier: GPL-2.0-or-later
/*
 * Unit tests for the color space registry
 *
 * Copyright (C) 2026 Authors
 *
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#include "colors/manager.h"

#include <gtest/gtest.h>

#include "colors/color.h"
#include "colors/gamut.h"
#include "colors/spaces/base.h"
#include "colors/spaces/definition.h"
#include "colors/spaces/enum.h"

using namespace Chromapick::Colors;

namespace {

class TestManager : public Manager
{
public:
    TestManager() = default;
    ~TestManager() = default;

    std::shared_ptr<Space::Definition> testAddSpace(Space::Definition *space)
    {
        return addSpace(space);
    }
};

Space::Matrix const IDENTITY = {{{1, 0, 0}, {0, 1, 0}, {0, 0, 1}}};

TEST(ColorManagerTest, defaultSpaces)
{
    auto &cm = Manager::get();
    ASSERT_EQ(cm.spaces().size(), 3);

    ASSERT_TRUE(cm.has(Space::Type::RGB));
    ASSERT_TRUE(cm.has(Space::Type::P3));
    ASSERT_TRUE(cm.has(Space::Type::Rec2020));
    ASSERT_FALSE(cm.has(Space::Type::XYZ));
    ASSERT_FALSE(cm.has(Space::Type::LAB));
    ASSERT_FALSE(cm.has(Space::Type::OKLCH));

    EXPECT_EQ(cm.find(Space::Type::RGB).getName(), "sRGB");
    EXPECT_EQ(cm.find(Space::Type::RGB).getCssIdent(), "");
    EXPECT_EQ(cm.find(Space::Type::P3).getCssIdent(), "display-p3");
    EXPECT_EQ(cm.find(Space::Type::Rec2020).getCssIdent(), "rec2020");
    EXPECT_EQ(cm.find(Space::Type::Rec2020).getGamut(), REC2020_GAMUT);
}

TEST(ColorManagerTest, matrices)
{
    auto const &srgb = Manager::get().find(Space::Type::RGB);
    EXPECT_EQ(srgb.getToXYZ()[0][0], 0.4124);
    EXPECT_EQ(srgb.getToXYZ()[1][1], 0.7152);
    EXPECT_EQ(srgb.getFromXYZ()[0][0], 3.2406);
    EXPECT_EQ(srgb.getFromXYZ()[2][2], 1.0570);

    auto const &p3 = Manager::get().find(Space::Type::P3);
    EXPECT_EQ(p3.getToXYZ()[2][0], 0.0);
    EXPECT_EQ(p3.getFromXYZ()[0][1], -0.9313);
}

TEST(ColorManagerTest, reservedFallBackToSRGB)
{
    auto &cm = Manager::get();
    EXPECT_EQ(&cm.find(Space::Type::XYZ), &cm.find(Space::Type::RGB));
    EXPECT_EQ(&cm.find(Space::Type::LAB), &cm.find(Space::Type::RGB));
    EXPECT_EQ(&cm.find(Space::Type::OKLCH), &cm.find(Space::Type::RGB));
}

TEST(ColorManagerTest, lookup)
{
    auto &cm = Manager::get();
    EXPECT_EQ(cm.lookup("sRGB"), Space::Type::RGB);
    EXPECT_EQ(cm.lookup("srgb"), Space::Type::RGB);
    EXPECT_EQ(cm.lookup("P3"), Space::Type::P3);
    EXPECT_EQ(cm.lookup("display-p3"), Space::Type::P3);
    EXPECT_EQ(cm.lookup("REC2020"), Space::Type::Rec2020);
    EXPECT_EQ(cm.lookup("oklch"), Space::Type::OKLCH);
    EXPECT_FALSE(cm.lookup("cmyk"));
    EXPECT_FALSE(cm.lookup(""));
}

TEST(ColorManagerTest, addSpace)
{
    auto cm = TestManager();
    ASSERT_FALSE(cm.has(Space::Type::XYZ));

    auto xyz = cm.testAddSpace(
        new Space::Definition(Space::Type::XYZ, "XYZ", "xyz-d65", IDENTITY, IDENTITY, SRGB_GAMUT));
    ASSERT_TRUE(xyz);
    EXPECT_TRUE(cm.has(Space::Type::XYZ));
    EXPECT_EQ(cm.spaces().size(), 4);
    EXPECT_EQ(&cm.find(Space::Type::XYZ), xyz.get());
    EXPECT_EQ(cm.lookup("xyz-d65"), Space::Type::XYZ);

    // The shared registry is untouched
    EXPECT_FALSE(Manager::get().has(Space::Type::XYZ));
}

TEST(ColorManagerTest, addSpaceTwice)
{
    auto cm = TestManager();
    EXPECT_THROW(cm.testAddSpace(new Space::Definition(Space::Type::RGB, "sRGB", "", IDENTITY, IDENTITY,
                                                       SRGB_GAMUT)),
                 ColorError);
    EXPECT_THROW(cm.testAddSpace(new Space::Definition(Space::Type::LAB, "LAB", "display-p3", IDENTITY,
                                                       IDENTITY, SRGB_GAMUT)),
                 ColorError);
    EXPECT_EQ(cm.spaces().size(), 3);
    EXPECT_FALSE(cm.has(Space::Type::LAB));
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
