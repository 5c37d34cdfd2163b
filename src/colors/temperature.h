// SPDX-License-Identifier: GPL-2.0-or-later
/*
 * Authors: see git history
 *
 * Copyright (C) 2026 Authors
 *
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */
#ifndef SEEN_COLORS_TEMPERATURE_H
#define SEEN_COLORS_TEMPERATURE_H

namespace Chromapick::Colors {

double color_temperature(double x, double y);

} // namespace Chromapick::Colors

#endif // SEEN_COLORS_TEMPERATURE_H
