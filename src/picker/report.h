// SPDX-License-Identifier: GPL-2.0-or-later
/*
 * Authors: see git history
 *
 * Copyright (C) 2026 Authors
 *
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */
#ifndef SEEN_PICKER_REPORT_H
#define SEEN_PICKER_REPORT_H

#include <string>
#include <utility>
#include <vector>

namespace Chromapick::Picker {

class Selection;

using ReportLines = std::vector<std::pair<std::string, std::string>>;

// Every export format of the selection as (label, value) pairs, in display order
ReportLines report_lines(Selection const &selection);
std::string format_report(Selection const &selection);

std::string format_temperature(double kelvin);

} // namespace Chromapick::Picker

#endif // SEEN_PICKER_REPORT_H
