// SPDX-License-Identifier: GPL-2.0-or-later
/*
 * Authors: see git history
 *
 * Copyright (C) 2026 Authors
 *
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */
#ifndef SEEN_PICKER_CONFIG_H
#define SEEN_PICKER_CONFIG_H

#include <string>

#include <glibmm/keyfile.h>
#include <glibmm/refptr.h>

#include "colors/color.h"
#include "colors/spaces/enum.h"
#include "diagram-geometry.h"

namespace Chromapick::Picker {

/**
 * Start up settings for the picker, read from a key file:
 *
 *   [picker]
 *   color=255,100,100
 *   space=sRGB
 *   luminance=0.5
 *   show-gamuts=true
 *
 *   [diagram]
 *   canvas-size=400
 *   diagram-size=350
 *   offset-x=25
 *   offset-y=25
 */
struct Config
{
    Colors::RGBColor color = {255, 100, 100};
    Colors::Space::Type space = Colors::Space::Type::RGB;
    double luminance = 0.5;
    bool show_gamuts = true;
    DiagramGeometry geometry;

    static std::string default_path();

    static Config load(std::string const &filename);
    static Config load_from_data(std::string const &data);

private:
    static Config _read(Glib::RefPtr<Glib::KeyFile> const &keyfile);
};

} // namespace Chromapick::Picker

#endif // SEEN_PICKER_CONFIG_H
