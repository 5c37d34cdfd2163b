// SPDX-License-Identifier: GPL-2.0-or-later
/*
 * Authors: see git history
 *
 * Copyright (C) 2026 Authors
 *
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#ifndef SEEN_COLORS_SPACES_XYZ_H
#define SEEN_COLORS_SPACES_XYZ_H

#include "colors/color.h"
#include "enum.h"

namespace Chromapick::Colors {

XYZColor rgb_to_xyz(RGBColor const &rgb, Space::Type space = Space::Type::RGB);
RGBColor xyz_to_rgb(XYZColor const &xyz, Space::Type space = Space::Type::RGB);

} // namespace Chromapick::Colors

#endif // SEEN_COLORS_SPACES_XYZ_H
