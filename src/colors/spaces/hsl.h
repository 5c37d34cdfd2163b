// SPDX-License-Identifier: GPL-2.0-or-later
/*
 * Authors: see git history
 *
 * Copyright (C) 2026 Authors
 *
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#ifndef SEEN_COLORS_SPACES_HSL_H
#define SEEN_COLORS_SPACES_HSL_H

#include "colors/color.h"

namespace Chromapick::Colors {

HSLColor rgb_to_hsl(RGBColor const &rgb);

} // namespace Chromapick::Colors

#endif // SEEN_COLORS_SPACES_HSL_H
