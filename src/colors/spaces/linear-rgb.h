// SPDX-License-Identifier: GPL-2.0-or-later
/*
 * Authors: see git history
 *
 * Copyright (C) 2026 Authors
 *
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#ifndef SEEN_COLORS_SPACES_LINEAR_RGB_H
#define SEEN_COLORS_SPACES_LINEAR_RGB_H

#include "colors/color.h"

namespace Chromapick::Colors {

// The display scale of an RGBColor channel
constexpr double RGB_SCALE = 255.0;

double gamma_correct(double linear);
double gamma_uncorrect(double encoded);

RGBColor linear_to_display(RGBColor const &linear);
RGBColor display_to_linear(RGBColor const &display);

} // namespace Chromapick::Colors

#endif // SEEN_COLORS_SPACES_LINEAR_RGB_H
