// SPDX-License-Identifier: GPL-2.0-or-later
/*
 * Unit tests for the text report of a selection
 *
 * Copyright (C) 2026 Authors
 *
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#include "picker/report.h"

#include <algorithm>
#include <cmath>
#include <gtest/gtest.h>

#include "picker/selection.h"

using namespace Chromapick::Colors;
using namespace Chromapick::Picker;

namespace {

TEST(PickerReport, temperature)
{
    EXPECT_EQ(format_temperature(6505.08), "6505K");
    EXPECT_EQ(format_temperature(6504.5), "6505K");
    EXPECT_EQ(format_temperature(1628.64), "1629K");
    EXPECT_EQ(format_temperature(-159212.67), "-159213K");
    EXPECT_EQ(format_temperature(INFINITY), "inf");
}

TEST(PickerReport, lines)
{
    auto lines = report_lines(Selection::from_rgb({255, 100, 100}));
    ReportLines expected = {
        {"RGB", "rgb(255, 100, 100)"},
        {"HSL", "hsl(0, 100%, 70%)"},
        {"CSS", "rgb(255, 100, 100)"},
        {"LAB", "lab(62.8% 59.0 31.2)"},
        {"OKLCH", "oklch(0.628 0.667 27.9)"},
        {"HEX", "#ff6464"},
        {"Chromaticity", "x: 0.5065, y: 0.3296"},
        {"Temperature", "1629K"},
        {"Gamut", "In Gamut"},
    };
    EXPECT_EQ(lines, expected);
}

TEST(PickerReport, wideSpace)
{
    auto lines = report_lines(Selection::from_rgb({255, 100, 100}, Space::Type::P3));
    ASSERT_EQ(lines.size(), 9);
    EXPECT_EQ(lines[2].second, "color(display-p3 1.0000 0.3922 0.3922)");
    EXPECT_EQ(lines[0].second, "rgb(255, 100, 100)");
}

TEST(PickerReport, outOfGamut)
{
    auto lines = report_lines(Selection::from_rgb({0, 0, 0}).with_chromaticity(0.7, 0.29));
    EXPECT_EQ(lines[0].second, "rgb(255, 0, 0)");
    EXPECT_EQ(lines[5].second, "#ff0000");
    EXPECT_EQ(lines[6].second, "x: 0.7000, y: 0.2900");
    EXPECT_EQ(lines[8].second, "Out of Gamut");
}

TEST(PickerReport, format)
{
    auto text = format_report(Selection::from_rgb({255, 100, 100}));
    EXPECT_EQ(text.rfind("RGB:          rgb(255, 100, 100)\n", 0), 0);
    EXPECT_NE(text.find("\nChromaticity: x: 0.5065, y: 0.3296\n"), std::string::npos);
    EXPECT_NE(text.find("\nGamut:        In Gamut\n"), std::string::npos);
    EXPECT_EQ(std::count(text.begin(), text.end(), '\n'), 9);
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
