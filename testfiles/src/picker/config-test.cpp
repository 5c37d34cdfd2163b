// SPDX-License-Identifier: GPL-2.0-or-later
/*
 * Unit tests for reading the picker settings
 *
 * Copyright (C) 2026 Authors
 *
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#include "picker/config.h"

#include <fstream>
#include <gtest/gtest.h>
#include <glibmm/fileutils.h>
#include <glibmm/miscutils.h>
#include <unistd.h>

#include "../test-utils.h"

using namespace Chromapick::Colors;
using namespace Chromapick::Picker;

namespace {

void expect_defaults(Config const &config)
{
    EXPECT_TRUE(VectorIsNear(values(config.color), {255, 100, 100}, 1e-12));
    EXPECT_EQ(config.space, Space::Type::RGB);
    EXPECT_EQ(config.luminance, 0.5);
    EXPECT_TRUE(config.show_gamuts);
    EXPECT_EQ(config.geometry.canvas_size(), 400);
    EXPECT_EQ(config.geometry.diagram_size(), 350);
    EXPECT_EQ(config.geometry.offset(), Geom::Point(25, 25));
}

TEST(PickerConfig, defaults)
{
    expect_defaults(Config());
    expect_defaults(Config::load_from_data(""));
    expect_defaults(Config::load_from_data("[other]\nkey=value\n"));
}

TEST(PickerConfig, defaultPath)
{
    auto path = Config::default_path();
    EXPECT_EQ(Glib::path_get_basename(path), "chromapick.conf");
    EXPECT_EQ(Glib::path_get_basename(Glib::path_get_dirname(path)), "chromapick");
}

TEST(PickerConfig, everyKey)
{
    auto config = Config::load_from_data("[picker]\n"
                                         "color=#00ff80\n"
                                         "space=display-p3\n"
                                         "luminance=0.25\n"
                                         "show-gamuts=false\n"
                                         "\n"
                                         "[diagram]\n"
                                         "canvas-size=800\n"
                                         "diagram-size=700\n"
                                         "offset-x=50\n"
                                         "offset-y=40\n");

    EXPECT_TRUE(VectorIsNear(values(config.color), {0, 255, 128}, 1e-12));
    EXPECT_EQ(config.space, Space::Type::P3);
    EXPECT_EQ(config.luminance, 0.25);
    EXPECT_FALSE(config.show_gamuts);
    EXPECT_EQ(config.geometry.canvas_size(), 800);
    EXPECT_EQ(config.geometry.diagram_size(), 700);
    EXPECT_EQ(config.geometry.offset(), Geom::Point(50, 40));
}

TEST(PickerConfig, numericColor)
{
    auto config = Config::load_from_data("[picker]\ncolor=10, 20.5, 30\nspace=Rec2020\n");
    EXPECT_TRUE(VectorIsNear(values(config.color), {10, 20.5, 30}, 1e-12));
    EXPECT_EQ(config.space, Space::Type::Rec2020);
}

TEST(PickerConfig, badValuesKeepDefaults)
{
    auto config = Config::load_from_data("[picker]\n"
                                         "color=not a color\n"
                                         "space=cmyk\n"
                                         "luminance=1.5\n"
                                         "show-gamuts=perhaps\n"
                                         "\n"
                                         "[diagram]\n"
                                         "canvas-size=0\n"
                                         "diagram-size=wide\n");
    expect_defaults(config);

    config = Config::load_from_data("[picker]\nluminance=-0.1\n[diagram]\ndiagram-size=-5\n");
    expect_defaults(config);
}

TEST(PickerConfig, brokenFile)
{
    expect_defaults(Config::load_from_data("this is not a key file\n"));
}

TEST(PickerConfig, missingFile)
{
    auto filename = Glib::build_filename(Glib::get_tmp_dir(), "chromapick-missing-" + std::to_string(getpid()) + ".conf");
    expect_defaults(Config::load(filename));
}

TEST(PickerConfig, fromFile)
{
    auto filename = Glib::build_filename(Glib::get_tmp_dir(), "chromapick-test-" + std::to_string(getpid()) + ".conf");
    {
        std::ofstream out(filename);
        out << "[picker]\nspace=P3\nluminance=0.75\n";
    }
    auto config = Config::load(filename);
    std::remove(filename.c_str());

    EXPECT_EQ(config.space, Space::Type::P3);
    EXPECT_EQ(config.luminance, 0.75);
    EXPECT_TRUE(VectorIsNear(values(config.color), {255, 100, 100}, 1e-12));
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
