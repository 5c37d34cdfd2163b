// SPDX-License-Identifier: GPL-2.0-or-later
/*
 * Authors: see git history
 *
 * Copyright (C) 2026 Authors
 *
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#ifndef SEEN_COLORS_SPACES_OKLCH_H
#define SEEN_COLORS_SPACES_OKLCH_H

#include "colors/color.h"

namespace Chromapick::Colors {

/**
 * Polar form of a Lab color, reported in OKLCH's field names and scale.
 *
 * This is the CIE LCh of the Lab value with lightness and chroma divided by
 * 100, not a true OKLab based OKLCH.
 */
OKLCHColor lab_to_oklch(LABColor const &lab);

} // namespace Chromapick::Colors

#endif // SEEN_COLORS_SPACES_OKLCH_H
