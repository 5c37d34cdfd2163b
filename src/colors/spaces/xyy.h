// SPDX-License-Identifier: GPL-2.0-or-later
/*
 * Authors: see git history
 *
 * Copyright (C) 2026 Authors
 *
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#ifndef SEEN_COLORS_SPACES_XYY_H
#define SEEN_COLORS_SPACES_XYY_H

#include "colors/color.h"

namespace Chromapick::Colors {

xyColor xyz_to_xyy(XYZColor const &xyz);
XYZColor xyy_to_xyz(xyColor const &xyy);

} // namespace Chromapick::Colors

#endif // SEEN_COLORS_SPACES_XYY_H
