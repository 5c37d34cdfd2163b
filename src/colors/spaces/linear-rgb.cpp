// SPDX-License-Identifier: GPL-2.0-or-later
/** @file
 *//*
 * Authors: see git history
 *
 * Copyright (C) 2026 Authors
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#include "linear-rgb.h"

#include <algorithm>
#include <cmath>

#include "base.h"

namespace Chromapick::Colors {

/**
 * Apply the sRGB transfer function to a linear channel.
 *
 * @param linear Linear light, nominally 0..1.
 * @return The encoded channel.
 */
double gamma_correct(double linear)
{
    if (linear <= 0.0031308) {
        return 12.92 * linear;
    } else {
        return 1.055 * std::pow(linear, 1.0 / 2.4) - 0.055;
    }
}

/**
 * Remove the sRGB transfer function from an encoded channel.
 *
 * @param encoded Encoded channel, nominally 0..1.
 * @return Linear light.
 */
double gamma_uncorrect(double encoded)
{
    if (encoded > 0.04045) {
        return std::pow((encoded + 0.055) / 1.055, 2.4);
    } else {
        return encoded / 12.92;
    }
}

/**
 * Encode linear RGB for display: gamma, scale to 0..255, then clamp.
 * Clamping is the last step so callers that need the gamut information
 * must look at the unclamped value themselves.
 */
RGBColor linear_to_display(RGBColor const &linear)
{
    auto encode = [](double c) { return std::clamp(SCALE_UP(gamma_correct(c), 0, RGB_SCALE), 0.0, RGB_SCALE); };
    return {encode(linear.r), encode(linear.g), encode(linear.b)};
}

/**
 * Decode a display color on the 0..255 scale into linear RGB. Nothing is
 * clamped.
 */
RGBColor display_to_linear(RGBColor const &display)
{
    auto decode = [](double c) { return gamma_uncorrect(SCALE_DOWN(c, 0, RGB_SCALE)); };
    return {decode(display.r), decode(display.g), decode(display.b)};
}

} // namespace Chromapick::Colors
