// SPDX-License-Identifier: GPL-2.0-or-later
/*
 * Unit tests for drawing the chromaticity diagram
 *
 * Copyright (C) 2026 Authors
 *
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#include "picker/diagram-renderer.h"

#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <gtest/gtest.h>
#include <glibmm/miscutils.h>
#include <unistd.h>

#include "picker/selection.h"

using namespace Chromapick::Colors;
using namespace Chromapick::Picker;

namespace {

// Premultiplied ARGB, which is the same as straight ARGB for opaque pixels
uint32_t pixel(Cairo::RefPtr<Cairo::ImageSurface> const &surface, int x, int y)
{
    auto data = surface->get_data() + y * surface->get_stride();
    return reinterpret_cast<uint32_t const *>(data)[x];
}

bool channels_near(uint32_t argb, uint32_t expected, int epsilon)
{
    for (int shift : {0, 8, 16, 24}) {
        if (std::abs(int((argb >> shift) & 0xff) - int((expected >> shift) & 0xff)) > epsilon) {
            return false;
        }
    }
    return true;
}

TEST(DiagramRenderer, surface)
{
    auto renderer = DiagramRenderer();
    auto surface = renderer.render(Selection::from_rgb({255, 0, 0}));
    ASSERT_TRUE(surface);
    EXPECT_EQ(surface->get_width(), 400);
    EXPECT_EQ(surface->get_height(), 400);
    EXPECT_EQ(surface->get_format(), Cairo::ImageSurface::Format::ARGB32);

    surface = DiagramRenderer(DiagramGeometry(200, 150, {25, 25})).render(Selection::from_rgb({0, 0, 0}));
    EXPECT_EQ(surface->get_width(), 200);
}

TEST(DiagramRenderer, background)
{
    auto surface = DiagramRenderer().render(Selection::from_rgb({255, 0, 0}));
    EXPECT_TRUE(channels_near(pixel(surface, 0, 0), 0xfff8fafc, 2));
    EXPECT_TRUE(channels_near(pixel(surface, 399, 399), 0xffe2e8f0, 2));
}

TEST(DiagramRenderer, markers)
{
    // sRGB red sits on the red corner, well away from the white point
    auto surface = DiagramRenderer().render(Selection::from_rgb({255, 0, 0}));
    EXPECT_EQ(pixel(surface, 134, 259), 0xffffffff);
    EXPECT_EQ(pixel(surface, 249, 259), 0xffff0000);

    surface = DiagramRenderer().render(Selection::from_rgb({0, 0, 255}));
    EXPECT_EQ(pixel(surface, 134, 259), 0xffffffff);
    // Blue primary at 0.15, 0.06 lands on 77.5, 354
    EXPECT_EQ(pixel(surface, 77, 353), 0xff0000ff);
}

TEST(DiagramRenderer, gamuts)
{
    auto selection = Selection::from_rgb({255, 0, 0});
    auto renderer = DiagramRenderer();
    EXPECT_TRUE(renderer.show_gamuts());
    auto with = renderer.render(selection);

    renderer.set_show_gamuts(false);
    auto without = renderer.render(selection);

    // Inside P3 but outside sRGB
    EXPECT_NE(pixel(with, 119, 144), pixel(without, 119, 144));
    // Outside every triangle
    EXPECT_EQ(pixel(with, 300, 50), pixel(without, 300, 50));
}

TEST(DiagramRenderer, exportPNG)
{
    auto filename = Glib::build_filename(Glib::get_tmp_dir(), "chromapick-test-" + std::to_string(getpid()) + ".png");
    DiagramRenderer().export_png(filename, Selection::from_rgb({255, 100, 100}));

    ASSERT_TRUE(std::filesystem::exists(filename));
    EXPECT_GT(std::filesystem::file_size(filename), 0);
    std::filesystem::remove(filename);
}

} // namespace

/*
  Local Variables:
  mode:c++
  c-file-style:"stroustrup"
  c-file-offsets:((innamespace . 0)(inline-open . 0))
  indent-tabs-mode:nil
  fill-column:99
  End:
*/
// vim: expandtab:shiftwidth=4:tabstop=8:softtabstop=4 :
