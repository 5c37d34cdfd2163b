// SPDX-License-Identifier: GPL-2.0-or-later
/*
 * Authors: see git history
 *
 * Copyright (C) 2026 Authors
 *
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */
#ifndef SEEN_COLORS_COLOR_H
#define SEEN_COLORS_COLOR_H

#include <exception>
#include <string>

namespace Chromapick::Colors {

/**
 * Display RGB, conventionally 0..255 per channel. Values outside of that
 * range are allowed and mean the color is not reproducible as given.
 */
struct RGBColor
{
    double r = 0.0;
    double g = 0.0;
    double b = 0.0;
};

/** CIE 1931 tristimulus values. */
struct XYZColor
{
    double x = 0.0;
    double y = 0.0;
    double z = 0.0;
};

/** Chromaticity coordinates x, y together with the luminance Y. */
struct xyColor
{
    double x = 0.0;
    double y = 0.0;
    double Y = 0.0;
};

struct LABColor
{
    double l = 0.0; // 0..100
    double a = 0.0;
    double b = 0.0;
};

struct OKLCHColor
{
    double l = 0.0; // 0..1
    double c = 0.0;
    double h = 0.0; // degrees
};

struct HSLColor
{
    double h = 0.0; // degrees
    double s = 0.0; // percent
    double l = 0.0; // percent
};

class ColorError : public std::exception
{
public:
    ColorError(std::string &&msg)
        : _msg(msg)
    {}
    char const *what() const noexcept override { return _msg.c_str(); }

private:
    std::string _msg;
};

} // namespace Chromapick::Colors

#endif // SEEN_COLORS_COLOR_H
