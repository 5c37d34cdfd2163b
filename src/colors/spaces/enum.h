// SPDX-License-Identifier: GPL-2.0-or-later
/*
 * Authors: see git history
 *
 * Copyright (C) 2026 Authors
 *
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#ifndef SEEN_COLORS_SPACES_ENUM_H
#define SEEN_COLORS_SPACES_ENUM_H

#include <map>
#include <string>

namespace Chromapick::Colors::Space {

// Spaces the picker can target. Only the RGB family carries matrices, the
// others are reserved and fall back to sRGB wherever a matrix is needed.
enum class Type
{
    RGB,     // sRGB, the default
    P3,      // Display P3
    Rec2020, // ITU-R BT.2020
    XYZ,
    LAB,
    OKLCH
};

// Display names, also accepted (case insensitive) when parsing
inline std::map<Type, std::string> const typeNames = {
    {Type::RGB, "sRGB"},
    {Type::P3, "P3"},
    {Type::Rec2020, "Rec2020"},
    {Type::XYZ, "XYZ"},
    {Type::LAB, "LAB"},
    {Type::OKLCH, "OKLCH"},
};

} // namespace Chromapick::Colors::Space

#endif // SEEN_COLORS_SPACES_ENUM_H
