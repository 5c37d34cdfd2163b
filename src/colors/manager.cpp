// SPDX-License-Identifier: GPL-2.0-or-later
/*
 * Manager - Look after the color spaces the picker can convert into.
 *
 * Copyright (C) 2026 Authors
 *
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#include "manager.h"

#include <algorithm>

#include "colors/color.h"
#include "colors/gamut.h"
#include "spaces/definition.h"

namespace Chromapick::Colors {

using Space::Matrix;

// clang-format off
/** Linear sRGB to XYZ, D65. */
Matrix const SRGB_TO_XYZ = {{{0.4124, 0.3576, 0.1805},
                             {0.2126, 0.7152, 0.0722},
                             {0.0193, 0.1192, 0.9505}}};

/** XYZ to linear sRGB, the inverse of SRGB_TO_XYZ to four places. */
Matrix const XYZ_TO_SRGB = {{{ 3.2406, -1.5372, -0.4986},
                             {-0.9689,  1.8758,  0.0415},
                             { 0.0557, -0.2040,  1.0570}}};

Matrix const P3_TO_XYZ = {{{0.4865, 0.2657, 0.1982},
                           {0.2290, 0.6917, 0.0793},
                           {0.0000, 0.0451, 1.0439}}};

Matrix const XYZ_TO_P3 = {{{ 2.4934, -0.9313, -0.4027},
                           {-0.8295,  1.7627,  0.0236},
                           { 0.0358, -0.0761,  0.9569}}};

Matrix const REC2020_TO_XYZ = {{{0.6370, 0.1446, 0.1689},
                                {0.2627, 0.6780, 0.0593},
                                {0.0000, 0.0281, 1.0609}}};

Matrix const XYZ_TO_REC2020 = {{{ 1.7167, -0.3557, -0.2534},
                                {-0.6667,  1.6165,  0.0158},
                                { 0.0176, -0.0428,  0.9421}}};
// clang-format on

Manager::Manager()
{
    for (auto const &[type, name] : Space::typeNames) {
        _names_lookup[name] = type;
    }

    addSpace(new Space::Definition(Space::Type::RGB, "sRGB", "", SRGB_TO_XYZ, XYZ_TO_SRGB, SRGB_GAMUT));
    addSpace(new Space::Definition(Space::Type::P3, "P3", "display-p3", P3_TO_XYZ, XYZ_TO_P3, P3_GAMUT));
    addSpace(new Space::Definition(Space::Type::Rec2020, "Rec2020", "rec2020", REC2020_TO_XYZ, XYZ_TO_REC2020,
                                   REC2020_GAMUT));
}

/**
 * Add the given space and assume ownership over it.
 *
 * @arg space - A pointer to the new color space definition, its css identifier
 *              becomes an alias when looking the space up by name.
 *
 * @returns The shared ptr which is now a global that can be used everywhere.
 */
std::shared_ptr<Space::Definition> Manager::addSpace(Space::Definition *space)
{
    std::shared_ptr<Space::Definition> owned(space);
    if (has(space->getType())) {
        throw ColorError("Can not add the same color space twice.");
    }
    auto const &ident = space->getCssIdent();
    if (!ident.empty()) {
        auto it = _names_lookup.find(ident);
        if (it != _names_lookup.end() && it->second != space->getType()) {
            throw ColorError("Can not add the same css identifier twice.");
        }
        _names_lookup[ident] = space->getType();
    }
    _spaces.push_back(std::move(owned));
    return _spaces.back();
}

/**
 * Returns true if the given type has its own definition, reserved types
 * such as XYZ or LAB do not.
 */
bool Manager::has(Space::Type type) const
{
    return std::any_of(_spaces.begin(), _spaces.end(), [type](auto &v) { return v->getType() == type; });
}

/**
 * Finds the color space definition for the given type. Types without a
 * definition of their own get the sRGB definition.
 *
 * @arg type - The type enum to match
 */
Space::Definition const &Manager::find(Space::Type type) const
{
    auto it = std::find_if(_spaces.begin(), _spaces.end(), [type](auto &v) { return v->getType() == type; });
    if (it == _spaces.end()) {
        it = std::find_if(_spaces.begin(), _spaces.end(),
                          [](auto &v) { return v->getType() == Space::Type::RGB; });
    }
    if (it == _spaces.end()) {
        throw ColorError("The sRGB color space is not registered.");
    }
    return **it;
}

/**
 * Find the space type for a name, case insensitive.
 *
 * @arg name - A display name such as "sRGB" or "Rec2020", or a css identifier
 *             such as "display-p3".
 */
std::optional<Space::Type> Manager::lookup(std::string const &name) const
{
    auto it = _names_lookup.find(name);
    if (it != _names_lookup.end()) {
        return it->second;
    }
    return {};
}

} // namespace Chromapick::Colors

/*
  Local Variables:
  mode:c++
  c-file-style:"stroustrup"
  c-file-offsets:((innamespace . 0)(inline-open . 0)(case-label . +))
  indent-tabs-mode:nil
  fill-column:99
  End:
*/
// vim: filetype=cpp:expandtab:shiftwidth=4:tabstop=8:softtabstop=4:fileencoding=utf-8:textwidth=99 :
