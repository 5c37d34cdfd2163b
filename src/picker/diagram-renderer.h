// SPDX-License-Identifier: GPL-2.0-or-later
/*
 * Authors: see git history
 *
 * Copyright (C) 2026 Authors
 *
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */
#ifndef SEEN_PICKER_DIAGRAM_RENDERER_H
#define SEEN_PICKER_DIAGRAM_RENDERER_H

#include <string>
#include <cairomm/context.h>
#include <cairomm/surface.h>

#include "diagram-geometry.h"

namespace Chromapick::Picker {

class Selection;

/**
 * Draws the chromaticity diagram: background, spectral locus, optional
 * gamut triangles, grid, axis labels, the selected color and the white point.
 */
class DiagramRenderer
{
public:
    explicit DiagramRenderer(DiagramGeometry const &geometry = {}, bool show_gamuts = true);

    DiagramGeometry const &geometry() const { return _geometry; }
    bool show_gamuts() const { return _show_gamuts; }
    void set_show_gamuts(bool show) { _show_gamuts = show; }

    void draw(Cairo::RefPtr<Cairo::Context> const &ctx, Selection const &selection) const;
    Cairo::RefPtr<Cairo::ImageSurface> render(Selection const &selection) const;
    void export_png(std::string const &filename, Selection const &selection) const;

private:
    DiagramGeometry _geometry;
    bool _show_gamuts;
};

} // namespace Chromapick::Picker

#endif // SEEN_PICKER_DIAGRAM_RENDERER_H
