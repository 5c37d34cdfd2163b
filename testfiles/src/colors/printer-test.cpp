// SPDX-License-Identifier: GPL-2.0-or-later
/*
 * Unit tests for printer base class
 *
 * Copyright (C) 2026 Authors
 *
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#include "colors/printer.h"

#include <gtest/gtest.h>

using namespace Chromapick::Colors;

namespace {

TEST(ColorsPrinter, PrinterBasics)
{
    auto oo = CssPrinter(3, "prefix", "", " ");
    oo << (int)1 << (double)3.3 << (double)0.0;
    ASSERT_EQ(std::string(oo), "prefix(1 3.3 0)");
}

TEST(ColorsPrinter, PrinterLocale)
{
    std::locale was;
    try {
        was = std::locale::global(std::locale("de_DE.utf8"));
    } catch (std::runtime_error &e) {
        GTEST_SKIP() << "Skipping all locale test, locale not available";
    }

    auto oo = CssPrinter(3, "prefix", "", " ");
    oo << 1.2 << 3.3 << 0.0234;
    EXPECT_EQ(std::string(oo), "prefix(1.2 3.3 0.023)");
    std::locale::global(was);
}

TEST(ColorsPrinter, NegativeZero)
{
    auto oo = CssFuncPrinter(2, "func");
    oo << -0.0001 << -0.0;
    EXPECT_EQ(std::string(oo), "func(0 0)");

    oo = CssFuncPrinter(2, "func");
    oo.setFixed(1) << -0.01 << -2.0;
    EXPECT_EQ(std::string(oo), "func(0.0 -2.0)");
}

TEST(ColorsPrinter, FixedPrecision)
{
    auto oo = CssFuncPrinter(3, "func");
    oo.setFixed(4) << 1.0 << 0.392156;
    oo.setFixed(1) << 27.89;
    EXPECT_EQ(std::string(oo), "func(1.0000 0.3922 27.9)");
}

TEST(ColorsPrinter, Percent)
{
    auto oo = CssLegacyPrinter(3, "hsl");
    oo << 120 << CssPercent{50} << CssPercent{12.5};
    EXPECT_EQ(std::string(oo), "hsl(120, 50%, 12.5%)");
}

TEST(ColorsPrinter, LegacyPrinter)
{
    auto oo = CssLegacyPrinter(3, "leg");
    oo << 1.0 << 3.3 << 0.0;
    ASSERT_EQ(std::string(oo), "leg(1, 3.3, 0)");
}

TEST(ColorsPrinter, FuncPrinter)
{
    auto oo = CssFuncPrinter(4, "func");
    oo << 1.0 << 3.3 << 0.0 << 1.2;
    ASSERT_EQ(std::string(oo), "func(1 3.3 0 1.2)");

    // Extra channels are dropped
    oo = CssFuncPrinter(4, "func");
    oo << 1.0 << 3.3 << 0.0 << 1.2 << 0.5;
    ASSERT_EQ(std::string(oo), "func(1 3.3 0 1.2)");
}

TEST(ColorsPrinter, ColorPrinter)
{
    auto oo = CssColorPrinter(3, "ident");
    oo << 1.0 << 3.3 << 0.0;
    ASSERT_EQ(std::string(oo), "color(ident 1 3.3 0)");
}

TEST(ColorsPrinter, MissingChannels)
{
    auto oo = CssColorPrinter(3, "ident");
    oo << 1.0;
    EXPECT_EQ(std::string(oo), "");
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
