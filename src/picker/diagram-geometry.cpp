// SPDX-License-Identifier: GPL-2.0-or-later
/*
 * Authors: see git history
 *
 * Copyright (C) 2026 Authors
 *
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#include "diagram-geometry.h"

#include <algorithm>

namespace Chromapick::Picker {

DiagramGeometry::DiagramGeometry(int canvas_size, double diagram_size, Geom::Point const &offset)
    : _canvas_size(canvas_size)
    , _diagram_size(diagram_size)
    , _offset(offset)
{}

Geom::Rect DiagramGeometry::area() const
{
    return Geom::Rect(_offset, _offset + Geom::Point(_diagram_size, _diagram_size));
}

Geom::Point DiagramGeometry::to_canvas(Geom::Point const &xy) const
{
    return _offset + Geom::Point(xy.x(), 1 - xy.y()) * _diagram_size;
}

/**
 * Map a canvas pixel back to a chromaticity, pixels outside of the diagram
 * snap to its nearest edge.
 */
Geom::Point DiagramGeometry::to_chromaticity(Geom::Point const &pixel) const
{
    auto p = (pixel - _offset) / _diagram_size;
    return {std::clamp(p.x(), 0.0, 1.0), std::clamp(1 - p.y(), 0.0, 1.0)};
}

} // namespace Chromapick::Picker
