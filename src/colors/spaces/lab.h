// SPDX-License-Identifier: GPL-2.0-or-later
/*
 * Authors: see git history
 *
 * Copyright (C) 2026 Authors
 *
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#ifndef SEEN_COLORS_SPACES_LAB_H
#define SEEN_COLORS_SPACES_LAB_H

#include "colors/color.h"

namespace Chromapick::Colors {

// D65 reference white used for Lab
constexpr XYZColor LAB_WHITE = {0.95047, 1.0, 1.08883};

LABColor xyz_to_lab(XYZColor const &xyz);

} // namespace Chromapick::Colors

#endif // SEEN_COLORS_SPACES_LAB_H
