// SPDX-License-Identifier: GPL-2.0-or-later
/*
 * Copyright (C) 2026 Authors
 *
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#include "utils.h"

#include <glibmm/regex.h>
#include <glibmm/stringutils.h>
#include <iomanip>
#include <sstream>
#include <stdexcept>

#include "colors/color.h"
#include "colors/spaces/base.h"
#include "colors/spaces/linear-rgb.h"

namespace Chromapick::Colors {

/**
 * Pack a display color into a 32bit 0xRRGGBBAA integer. Channels are
 * clamped to 0..255 and rounded.
 */
uint32_t rgb_to_rgba(RGBColor const &rgb, double opacity)
{
    return CP_RGBA32_F_COMPOSE(SCALE_DOWN(rgb.r, 0, RGB_SCALE), SCALE_DOWN(rgb.g, 0, RGB_SCALE),
                               SCALE_DOWN(rgb.b, 0, RGB_SCALE), opacity);
}

/**
 * Output the RGBA value as a #RRGGBB hex color, if alpha is true
 * then the output will be #RRGGBBAA instead.
 */
std::string rgba_to_hex(uint32_t value, bool alpha)
{
    std::ostringstream oo;
    oo.imbue(std::locale("C"));
    oo << "#" << std::setfill('0') << std::setw(alpha ? 8 : 6) << std::hex << (alpha ? value : value >> 8);
    return oo.str();
}

/**
 * Parse a display color typed by a person.
 *
 * @arg value - One of "#RRGGBB", "#RGB" or "R,G,B" where R, G and B are
 *              decimal numbers on the 0..255 scale. Surrounding space is ignored.
 *
 * @returns The color, or an empty optional if the text is not understood.
 */
std::optional<RGBColor> parse_rgb(std::string const &value)
{
    static auto const regex_hex = Glib::Regex::create("^\\s*#([[:xdigit:]]{6}|[[:xdigit:]]{3})\\s*$",
                                                      Glib::Regex::CompileFlags::OPTIMIZE);
    static auto const regex_num = Glib::Regex::create(
        "^\\s*([-+]?[\\d.]+)\\s*,\\s*([-+]?[\\d.]+)\\s*,\\s*([-+]?[\\d.]+)\\s*$", Glib::Regex::CompileFlags::OPTIMIZE);

    // The match refers back into the text, keep it alive while fetching
    Glib::ustring const text = value;
    Glib::MatchInfo match;
    if (regex_hex->match(text, match)) {
        auto hex = match.fetch(1).raw();
        if (hex.size() == 3) {
            hex = {hex[0], hex[0], hex[1], hex[1], hex[2], hex[2]};
        }
        unsigned int rgb;
        std::istringstream ss(hex);
        ss >> std::hex >> rgb;
        return RGBColor{
            (double)((rgb >> 16) & 0xff),
            (double)((rgb >> 8) & 0xff),
            (double)(rgb & 0xff),
        };
    }
    if (regex_num->match(text, match)) {
        double channels[3];
        for (unsigned i = 0; i < 3; i++) {
            auto number = match.fetch(i + 1).raw();
            if (std::count(number.begin(), number.end(), '.') > 1 ||
                number.find_first_of("0123456789") == std::string::npos) {
                return {};
            }
            try {
                channels[i] = Glib::Ascii::strtod(number);
            } catch (std::out_of_range const &) {
                return {};
            }
        }
        return RGBColor{channels[0], channels[1], channels[2]};
    }
    return {};
}

} // namespace Chromapick::Colors
