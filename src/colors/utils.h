// SPDX-License-Identifier: GPL-2.0-or-later
/*
 * Copyright (C) 2026 Authors
 *
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */
#ifndef SEEN_COLORS_UTILS_H
#define SEEN_COLORS_UTILS_H

#include <algorithm>
#include <cstdint>
#include <optional>
#include <string>

/* Useful composition macros */

constexpr double CP_COLOR_U_TO_F(uint32_t v)
{
    return v / 255.0;
}
constexpr uint32_t CP_COLOR_F_TO_U(double v)
{
    return (unsigned int)(std::clamp(v, 0.0, 1.0) * 255. + .5);
}
constexpr uint32_t CP_RGBA32_R_U(uint32_t v)
{
    return (v >> 24) & 0xff;
}
constexpr uint32_t CP_RGBA32_G_U(uint32_t v)
{
    return (v >> 16) & 0xff;
}
constexpr uint32_t CP_RGBA32_B_U(uint32_t v)
{
    return (v >> 8) & 0xff;
}
constexpr uint32_t CP_RGBA32_A_U(uint32_t v)
{
    return v & 0xff;
}
constexpr double CP_RGBA32_R_F(uint32_t v)
{
    return CP_COLOR_U_TO_F(CP_RGBA32_R_U(v));
}
constexpr double CP_RGBA32_G_F(uint32_t v)
{
    return CP_COLOR_U_TO_F(CP_RGBA32_G_U(v));
}
constexpr double CP_RGBA32_B_F(uint32_t v)
{
    return CP_COLOR_U_TO_F(CP_RGBA32_B_U(v));
}
constexpr double CP_RGBA32_A_F(uint32_t v)
{
    return CP_COLOR_U_TO_F(CP_RGBA32_A_U(v));
}

constexpr uint32_t CP_RGBA32_U_COMPOSE(uint32_t r, uint32_t g, uint32_t b, uint32_t a)
{
    return ((r & 0xff) << 24) | ((g & 0xff) << 16) | ((b & 0xff) << 8) | (a & 0xff);
}
constexpr uint32_t CP_RGBA32_F_COMPOSE(double r, double g, double b, double a)
{
    return CP_RGBA32_U_COMPOSE(CP_COLOR_F_TO_U(r), CP_COLOR_F_TO_U(g), CP_COLOR_F_TO_U(b), CP_COLOR_F_TO_U(a));
}

/**
 * Conversions between display colors and packed or textual forms, used by
 * the export formats and for reading colors from the command line and the
 * configuration file.
 */
namespace Chromapick::Colors {

struct RGBColor;

uint32_t rgb_to_rgba(RGBColor const &rgb, double opacity = 1.0);
std::string rgba_to_hex(uint32_t value, bool alpha = false);
std::optional<RGBColor> parse_rgb(std::string const &value);

} // namespace Chromapick::Colors

#endif // SEEN_COLORS_UTILS_H
