// SPDX-License-Identifier: GPL-2.0-or-later
/*
 * Authors: see git history
 *
 * Copyright (C) 2026 Authors
 *
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#ifndef SEEN_COLORS_SPACES_DEFINITION_H
#define SEEN_COLORS_SPACES_DEFINITION_H

#include <string>
#include <utility>

#include "base.h"
#include "enum.h"

namespace Chromapick::Colors::Space {

/**
 * An RGB color space known to the Manager: its conversion matrices and the
 * triangle its primaries span in chromaticity space.
 */
class Definition
{
public:
    Definition(Type type, std::string name, std::string css_ident, Matrix to_xyz, Matrix from_xyz,
               Polygon gamut)
        : _type(type)
        , _name(std::move(name))
        , _css_ident(std::move(css_ident))
        , _to_xyz(to_xyz)
        , _from_xyz(from_xyz)
        , _gamut(gamut)
    {}

    Type getType() const { return _type; }
    std::string const &getName() const { return _name; }
    // The identifier used inside css color(), empty for sRGB which prints as rgb()
    std::string const &getCssIdent() const { return _css_ident; }

    Matrix const &getToXYZ() const { return _to_xyz; }
    Matrix const &getFromXYZ() const { return _from_xyz; }
    Polygon const &getGamut() const { return _gamut; }

private:
    Type _type;
    std::string _name;
    std::string _css_ident;
    Matrix _to_xyz;
    Matrix _from_xyz;
    Polygon _gamut;
};

} // namespace Chromapick::Colors::Space

#endif // SEEN_COLORS_SPACES_DEFINITION_H
