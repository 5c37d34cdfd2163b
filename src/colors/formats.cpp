// SPDX-License-Identifier: GPL-2.0-or-later
/*
 * Copyright (C) 2026 Authors
 *
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#include "formats.h"

#include <algorithm>
#include <cmath>

#include "colors/manager.h"
#include "colors/printer.h"
#include "colors/spaces/definition.h"
#include "colors/spaces/linear-rgb.h"
#include "colors/utils.h"

namespace Chromapick::Colors {

static int display_channel(double value)
{
    return (int)std::round(std::clamp(value, 0.0, RGB_SCALE));
}

/**
 * Print the color as a css color for the given space.
 *
 * sRGB prints in the legacy rgb() form with integer channels. Other RGB
 * spaces print as color() with the channels scaled to 0..1 and four decimals.
 * Reserved spaces print as sRGB.
 *
 * @arg rgb - Display color, clamped to 0..255 and rounded before printing.
 * @arg space - The space the channel values belong to.
 */
std::string css_color(RGBColor const &rgb, Space::Type space)
{
    auto const &def = Manager::get().find(space);
    if (def.getCssIdent().empty()) {
        return rgb_string(rgb);
    }

    static constexpr unsigned CSS_DECIMALS = 4;
    auto os = CssColorPrinter(3, def.getCssIdent());
    os.setFixed(CSS_DECIMALS);
    for (auto channel : {rgb.r, rgb.g, rgb.b}) {
        os << display_channel(channel) / RGB_SCALE;
    }
    return os;
}

std::string rgb_string(RGBColor const &rgb)
{
    auto os = CssLegacyPrinter(3, "rgb");
    return os << display_channel(rgb.r) << display_channel(rgb.g) << display_channel(rgb.b);
}

std::string hsl_string(HSLColor const &hsl)
{
    auto os = CssLegacyPrinter(3, "hsl");
    return os << (int)std::round(hsl.h) << CssPercent{std::round(hsl.s)} << CssPercent{std::round(hsl.l)};
}

std::string lab_string(LABColor const &lab)
{
    auto os = CssFuncPrinter(3, "lab");
    os.setFixed(1);
    return os << CssPercent{lab.l} << lab.a << lab.b;
}

std::string oklch_string(OKLCHColor const &oklch)
{
    auto os = CssFuncPrinter(3, "oklch");
    os.setFixed(3) << oklch.l << oklch.c;
    os.setFixed(1) << oklch.h;
    return os;
}

/**
 * Output the color as #rrggbb, channels are clamped and rounded.
 */
std::string hex_string(RGBColor const &rgb)
{
    return rgba_to_hex(rgb_to_rgba(rgb));
}

} // namespace Chromapick::Colors
