// SPDX-License-Identifier: GPL-2.0-or-later
/*
 * Text forms of colors for display and export.
 *
 * Copyright (C) 2026 Authors
 *
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */
#ifndef SEEN_COLORS_FORMATS_H
#define SEEN_COLORS_FORMATS_H

#include <string>

#include "colors/color.h"
#include "colors/spaces/enum.h"

namespace Chromapick::Colors {

std::string css_color(RGBColor const &rgb, Space::Type space = Space::Type::RGB);

std::string rgb_string(RGBColor const &rgb);
std::string hsl_string(HSLColor const &hsl);
std::string lab_string(LABColor const &lab);
std::string oklch_string(OKLCHColor const &oklch);
std::string hex_string(RGBColor const &rgb);

} // namespace Chromapick::Colors

#endif // SEEN_COLORS_FORMATS_H
