// SPDX-License-Identifier: GPL-2.0-or-later
/*
 * Authors: see git history
 *
 * Copyright (C) 2026 Authors
 *
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */
#ifndef SEEN_PICKER_SELECTION_H
#define SEEN_PICKER_SELECTION_H

#include <2geom/point.h>

#include "colors/color-info.h"
#include "colors/color.h"
#include "colors/spaces/enum.h"

namespace Chromapick::Picker {

class DiagramGeometry;

struct PickResult
{
    Colors::RGBColor rgb; // clamped for display
    bool in_gamut;        // of the color before clamping
};

PickResult pick(Colors::xyColor const &xyy, Colors::Space::Type space);

/**
 * The currently selected color. A selection never changes, every
 * interaction produces a new one.
 */
class Selection final
{
public:
    static Selection from_rgb(Colors::RGBColor const &rgb, Colors::Space::Type space = Colors::Space::Type::RGB,
                              double luminance = 0.5);

    Selection with_chromaticity(double x, double y) const;
    Selection with_canvas_point(Geom::Point const &pixel, DiagramGeometry const &geometry) const;
    Selection with_rgb(Colors::RGBColor const &rgb) const;
    Selection with_space(Colors::Space::Type space) const;
    Selection with_luminance(double luminance) const;

    Colors::RGBColor const &rgb() const { return _info.rgb; }
    Colors::xyColor const &chromaticity() const { return _xy; }
    Colors::Space::Type space() const { return _info.space; }
    double luminance() const { return _luminance; }
    bool in_gamut() const { return _in_gamut; }
    double temperature() const;

    Colors::ColorInfo const &info() const { return _info; }

private:
    Selection(Colors::RGBColor const &rgb, Colors::xyColor const &xy, Colors::Space::Type space, double luminance,
              bool in_gamut);

    Colors::xyColor _xy;
    double _luminance;
    bool _in_gamut;
    Colors::ColorInfo _info;
};

} // namespace Chromapick::Picker

#endif // SEEN_PICKER_SELECTION_H
