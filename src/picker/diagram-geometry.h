// SPDX-License-Identifier: GPL-2.0-or-later
/*
 * Authors: see git history
 *
 * Copyright (C) 2026 Authors
 *
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */
#ifndef SEEN_PICKER_DIAGRAM_GEOMETRY_H
#define SEEN_PICKER_DIAGRAM_GEOMETRY_H

#include <2geom/point.h>
#include <2geom/rect.h>

namespace Chromapick::Picker {

/**
 * Placement of the unit chromaticity square on the canvas. Canvas y grows
 * downwards while chromaticity y grows upwards.
 */
class DiagramGeometry
{
public:
    DiagramGeometry() = default;
    DiagramGeometry(int canvas_size, double diagram_size, Geom::Point const &offset);

    int canvas_size() const { return _canvas_size; }
    double diagram_size() const { return _diagram_size; }
    Geom::Point const &offset() const { return _offset; }

    // The area covered by chromaticities 0..1 in canvas pixels
    Geom::Rect area() const;

    Geom::Point to_canvas(Geom::Point const &xy) const;
    Geom::Point to_chromaticity(Geom::Point const &pixel) const;

private:
    int _canvas_size = 400;
    double _diagram_size = 350;
    Geom::Point _offset = {25, 25};
};

} // namespace Chromapick::Picker

#endif // SEEN_PICKER_DIAGRAM_GEOMETRY_H
