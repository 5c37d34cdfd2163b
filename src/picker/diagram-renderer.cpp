// SPDX-License-Identifier: GPL-2.0-or-later
/*
 * Authors: see git history
 *
 * Copyright (C) 2026 Authors
 *
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#include "diagram-renderer.h"

#include <cmath>
#include <cstdint>
#include <vector>
#include <cairomm/pattern.h>

#include "colors/gamut.h"
#include "colors/spaces/linear-rgb.h"
#include "colors/utils.h"
#include "selection.h"

namespace Chromapick::Picker {

using namespace Colors;

namespace {

// 0xRRGGBBAA
constexpr uint32_t BACKGROUND_START = 0xf8fafcff;
constexpr uint32_t BACKGROUND_END = 0xe2e8f0ff;
constexpr uint32_t LOCUS_STROKE = 0x334155ff;
constexpr uint32_t LOCUS_FILL = 0x3b82f60d;
constexpr uint32_t GRID = 0xcbd5e1ff;
constexpr uint32_t LABEL = 0x475569ff;
constexpr uint32_t MARKER_RING = 0xffffffff;
constexpr uint32_t WHITE_POINT_OUTLINE = 0x64748bff;

// Translucent fill used under each gamut outline
constexpr uint32_t GAMUT_FILL_ALPHA = 0x20;

struct GamutStyle
{
    Space::Polygon const &polygon;
    uint32_t color;
};

void set_source(Cairo::RefPtr<Cairo::Context> const &ctx, uint32_t rgba)
{
    ctx->set_source_rgba(CP_RGBA32_R_F(rgba), CP_RGBA32_G_F(rgba), CP_RGBA32_B_F(rgba), CP_RGBA32_A_F(rgba));
}

void circle(Cairo::RefPtr<Cairo::Context> const &ctx, Geom::Point const &center, double radius)
{
    ctx->begin_new_path();
    ctx->arc(center.x(), center.y(), radius, 0, 2 * M_PI);
}

void polygon_path(Cairo::RefPtr<Cairo::Context> const &ctx, DiagramGeometry const &geometry,
                  Space::Polygon const &polygon)
{
    ctx->begin_new_path();
    bool first = true;
    for (auto const &xy : polygon) {
        auto p = geometry.to_canvas(xy);
        if (first) {
            ctx->move_to(p.x(), p.y());
            first = false;
        } else {
            ctx->line_to(p.x(), p.y());
        }
    }
}

void centered_text(Cairo::RefPtr<Cairo::Context> const &ctx, std::string const &text, double x, double y)
{
    Cairo::TextExtents extents;
    ctx->get_text_extents(text, extents);
    ctx->move_to(x - (extents.width / 2 + extents.x_bearing), y);
    ctx->show_text(text);
}

} // namespace

DiagramRenderer::DiagramRenderer(DiagramGeometry const &geometry, bool show_gamuts)
    : _geometry(geometry)
    , _show_gamuts(show_gamuts)
{}

void DiagramRenderer::draw(Cairo::RefPtr<Cairo::Context> const &ctx, Selection const &selection) const
{
    double const canvas = _geometry.canvas_size();
    auto const area = _geometry.area();

    ctx->save();

    // Background
    auto gradient = Cairo::LinearGradient::create(0, 0, canvas, canvas);
    gradient->add_color_stop_rgb(0, CP_RGBA32_R_F(BACKGROUND_START), CP_RGBA32_G_F(BACKGROUND_START),
                                 CP_RGBA32_B_F(BACKGROUND_START));
    gradient->add_color_stop_rgb(1, CP_RGBA32_R_F(BACKGROUND_END), CP_RGBA32_G_F(BACKGROUND_END),
                                 CP_RGBA32_B_F(BACKGROUND_END));
    ctx->set_source(gradient);
    ctx->rectangle(0, 0, canvas, canvas);
    ctx->fill();

    // Spectral locus, the fill goes over the outline
    polygon_path(ctx, _geometry, CHROMATICITY_BOUNDARY);
    set_source(ctx, LOCUS_STROKE);
    ctx->set_line_width(2);
    ctx->stroke_preserve();
    set_source(ctx, LOCUS_FILL);
    ctx->fill();

    if (_show_gamuts) {
        std::vector<double> const dashes{5, 5};
        for (auto const &gamut : {GamutStyle{SRGB_GAMUT, 0xef4444ff}, GamutStyle{P3_GAMUT, 0x10b981ff},
                                  GamutStyle{REC2020_GAMUT, 0x8b5cf6ff}}) {
            polygon_path(ctx, _geometry, gamut.polygon);
            set_source(ctx, gamut.color);
            ctx->set_line_width(2);
            ctx->set_dash(dashes, 0);
            ctx->stroke_preserve();
            set_source(ctx, (gamut.color & 0xffffff00) | GAMUT_FILL_ALPHA);
            ctx->fill();
            ctx->unset_dash();
        }
    }

    // Grid, ten divisions each way
    set_source(ctx, GRID);
    ctx->set_line_width(1);
    ctx->set_dash(std::vector<double>{2, 2}, 0);
    for (int i = 0; i <= 10; i++) {
        double x = area.left() + (i / 10.0) * area.width();
        double y = area.top() + (i / 10.0) * area.height();

        ctx->begin_new_path();
        ctx->move_to(x, area.top());
        ctx->line_to(x, area.bottom());
        ctx->stroke();

        ctx->begin_new_path();
        ctx->move_to(area.left(), y);
        ctx->line_to(area.right(), y);
        ctx->stroke();
    }
    ctx->unset_dash();

    // Axis labels
    set_source(ctx, LABEL);
    ctx->select_font_face("Sans", Cairo::ToyFontFace::Slant::NORMAL, Cairo::ToyFontFace::Weight::NORMAL);
    ctx->set_font_size(12);
    centered_text(ctx, "x", area.midpoint().x(), canvas - 5);
    ctx->save();
    ctx->translate(10, area.midpoint().y());
    ctx->rotate(-M_PI / 2);
    centered_text(ctx, "y", 0, 0);
    ctx->restore();

    // Selected color, shown in sRGB whatever the selected space
    auto const &xy = selection.chromaticity();
    auto const marker = _geometry.to_canvas({xy.x, xy.y});
    circle(ctx, marker, 12);
    set_source(ctx, MARKER_RING);
    ctx->fill_preserve();
    set_source(ctx, LOCUS_STROKE);
    ctx->set_line_width(2);
    ctx->stroke();

    circle(ctx, marker, 8);
    set_source(ctx, rgb_to_rgba(selection.rgb()));
    ctx->fill_preserve();
    set_source(ctx, MARKER_RING);
    ctx->set_line_width(1);
    ctx->stroke();

    // White point
    circle(ctx, _geometry.to_canvas({D65_WHITE_POINT.x, D65_WHITE_POINT.y}), 4);
    set_source(ctx, MARKER_RING);
    ctx->fill_preserve();
    set_source(ctx, WHITE_POINT_OUTLINE);
    ctx->set_line_width(1);
    ctx->stroke();

    ctx->restore();
}

Cairo::RefPtr<Cairo::ImageSurface> DiagramRenderer::render(Selection const &selection) const
{
    auto size = _geometry.canvas_size();
    auto surface = Cairo::ImageSurface::create(Cairo::ImageSurface::Format::ARGB32, size, size);
    auto ctx = Cairo::Context::create(surface);
    draw(ctx, selection);
    surface->flush();
    return surface;
}

void DiagramRenderer::export_png(std::string const &filename, Selection const &selection) const
{
    render(selection)->write_to_png(filename);
}

} // namespace Chromapick::Picker
