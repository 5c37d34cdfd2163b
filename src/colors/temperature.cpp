// SPDX-License-Identifier: GPL-2.0-or-later
/*
 * Authors: see git history
 *
 * Copyright (C) 2026 Authors
 *
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#include "temperature.h"

namespace Chromapick::Colors {

/**
 * Estimate the correlated color temperature of a chromaticity, in Kelvin.
 *
 * Uses McCamy's cubic approximation (C. S. McCamy, "Correlated color
 * temperature as an explicit function of chromaticity coordinates", 1992).
 * It is only meaningful near the Planckian locus, and the result grows
 * without bound as y approaches 0.1858. Callers must accept values that are
 * huge, negative or not finite.
 */
double color_temperature(double x, double y)
{
    double n = (x - 0.3320) / (0.1858 - y);
    return 449 * n * n * n + 3525 * n * n + 6823.3 * n + 5520.33;
}

} // namespace Chromapick::Colors
