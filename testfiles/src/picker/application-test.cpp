// SPDX-License-Identifier: GPL-2.0-or-later
/*
 * Unit tests for the command line front end
 *
 * Copyright (C) 2026 Authors
 *
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#include "picker/application.h"

#include <cstdlib>
#include <filesystem>
#include <string>
#include <vector>
#include <giomm/init.h>
#include <glibmm/miscutils.h>
#include <gtest/gtest.h>
#include <unistd.h>

using namespace Chromapick::Picker;

namespace {

class PickerApplicationTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        Gio::init();
        // Never pick up the settings of whoever runs the tests
        _config = Glib::build_filename(Glib::get_tmp_dir(), "chromapick-none-" + std::to_string(getpid()) + ".conf");
    }

    int run(std::vector<std::string> args)
    {
        args.insert(args.begin(), "chromapick");
        args.push_back("--config=" + _config);

        std::vector<char *> argv;
        for (auto &arg : args) {
            argv.push_back(arg.data());
        }
        argv.push_back(nullptr);

        testing::internal::CaptureStdout();
        int ret = PickerApplication().run(argv.size() - 1, argv.data());
        _output = testing::internal::GetCapturedStdout();
        return ret;
    }

    std::string _config;
    std::string _output;
};

TEST(PickerParsePoint, values)
{
    EXPECT_EQ(parse_point("0.3127,0.329"), Geom::Point(0.3127, 0.329));
    EXPECT_EQ(parse_point(" 134 , 259.5 "), Geom::Point(134, 259.5));
    EXPECT_EQ(parse_point("-5,.5"), Geom::Point(-5, 0.5));
    EXPECT_EQ(parse_point("+1,2"), Geom::Point(1, 2));
}

TEST(PickerParsePoint, bad)
{
    EXPECT_FALSE(parse_point(""));
    EXPECT_FALSE(parse_point("1"));
    EXPECT_FALSE(parse_point("a,b"));
    EXPECT_FALSE(parse_point("1,2,3"));
    EXPECT_FALSE(parse_point("1.,2"));
}

TEST_F(PickerApplicationTest, version)
{
    EXPECT_EQ(run({"--version"}), EXIT_SUCCESS);
    EXPECT_EQ(_output.rfind("chromapick ", 0), 0);
}

TEST_F(PickerApplicationTest, defaultReport)
{
    EXPECT_EQ(run({}), EXIT_SUCCESS);
    EXPECT_NE(_output.find("rgb(255, 100, 100)"), std::string::npos);
    EXPECT_NE(_output.find("#ff6464"), std::string::npos);
}

TEST_F(PickerApplicationTest, pickChromaticity)
{
    EXPECT_EQ(run({"--xy=0.7,0.29", "--space=rec2020", "--luminance=0.1"}), EXIT_SUCCESS);
    EXPECT_NE(_output.find("x: 0.7000, y: 0.2900"), std::string::npos);
    EXPECT_NE(_output.find("color(rec2020 "), std::string::npos);
    EXPECT_NE(_output.find("In Gamut"), std::string::npos);

    EXPECT_EQ(run({"--xy=0.7,0.29"}), EXIT_SUCCESS);
    EXPECT_NE(_output.find("Out of Gamut"), std::string::npos);
}

TEST_F(PickerApplicationTest, pickCanvasPoint)
{
    EXPECT_EQ(run({"--canvas-point=134.445,259.85", "--rgb=#000"}), EXIT_SUCCESS);
    EXPECT_NE(_output.find("x: 0.3127, y: 0.3290"), std::string::npos);
    EXPECT_NE(_output.find("rgb(188, 188, 188)"), std::string::npos);
}

TEST_F(PickerApplicationTest, badArguments)
{
    EXPECT_EQ(run({"--space=cmyk"}), EXIT_FAILURE);
    EXPECT_EQ(run({"--luminance=2"}), EXIT_FAILURE);
    EXPECT_EQ(run({"--rgb=purple"}), EXIT_FAILURE);
    EXPECT_EQ(run({"--xy=north"}), EXIT_FAILURE);
    EXPECT_EQ(run({"--xy=0.3,0.3", "--canvas-point=10,10"}), EXIT_FAILURE);
    EXPECT_TRUE(_output.empty());
}

TEST_F(PickerApplicationTest, exportDiagram)
{
    auto filename = Glib::build_filename(Glib::get_tmp_dir(), "chromapick-cli-" + std::to_string(getpid()) + ".png");
    EXPECT_EQ(run({"--export=" + filename, "--no-gamuts"}), EXIT_SUCCESS);
    EXPECT_TRUE(std::filesystem::exists(filename));
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
