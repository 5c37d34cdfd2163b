// SPDX-License-Identifier: GPL-2.0-or-later
/*
 * Authors: see git history
 *
 * Copyright (C) 2026 Authors
 *
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#include "config.h"

#include <filesystem>
#include <optional>
#include <glib.h>
#include <glibmm/miscutils.h>

#include "colors/manager.h"
#include "colors/utils.h"

namespace filesystem = std::filesystem;

namespace Chromapick::Picker {

namespace {

char const *const PICKER_GROUP = "picker";
char const *const DIAGRAM_GROUP = "diagram";

bool has_value(Glib::RefPtr<Glib::KeyFile> const &keyfile, char const *group, char const *key)
{
    return keyfile->has_group(group) && keyfile->has_key(group, key);
}

std::optional<double> read_double(Glib::RefPtr<Glib::KeyFile> const &keyfile, char const *group, char const *key)
{
    if (!has_value(keyfile, group, key)) {
        return {};
    }
    try {
        return keyfile->get_double(group, key);
    } catch (Glib::KeyFileError const &error) {
        g_warning("Ignoring [%s] %s: %s", group, key, error.what());
    }
    return {};
}

std::optional<std::string> read_string(Glib::RefPtr<Glib::KeyFile> const &keyfile, char const *group,
                                       char const *key)
{
    if (!has_value(keyfile, group, key)) {
        return {};
    }
    try {
        return keyfile->get_string(group, key).raw();
    } catch (Glib::KeyFileError const &error) {
        g_warning("Ignoring [%s] %s: %s", group, key, error.what());
    }
    return {};
}

} // namespace

/**
 * Where the configuration lives unless another file is asked for.
 */
std::string Config::default_path()
{
    return Glib::build_filename(Glib::get_user_config_dir(), "chromapick", "chromapick.conf");
}

/**
 * Read the configuration from a file. A missing file gives the defaults,
 * an unreadable one is reported and also gives the defaults.
 */
Config Config::load(std::string const &filename)
{
    auto keyfile = Glib::KeyFile::create();

    if (!filesystem::exists(filesystem::path(filename))) {
        g_debug("No configuration at %s, using defaults", filename.c_str());
        return {};
    }
    try {
        if (!keyfile->load_from_file(filename)) {
            return {};
        }
    } catch (Glib::Error const &error) {
        g_warning("Can't read configuration %s: %s", filename.c_str(), error.what());
        return {};
    }
    return _read(keyfile);
}

Config Config::load_from_data(std::string const &data)
{
    auto keyfile = Glib::KeyFile::create();
    try {
        if (!keyfile->load_from_data(data)) {
            return {};
        }
    } catch (Glib::Error const &error) {
        g_warning("Can't parse configuration: %s", error.what());
        return {};
    }
    return _read(keyfile);
}

/**
 * Apply every key found in the file over the defaults. A value that can't
 * be used is reported and the default kept.
 */
Config Config::_read(Glib::RefPtr<Glib::KeyFile> const &keyfile)
{
    Config config;

    if (auto text = read_string(keyfile, PICKER_GROUP, "color")) {
        if (auto rgb = Colors::parse_rgb(*text)) {
            config.color = *rgb;
        } else {
            g_warning("Ignoring [picker] color: '%s' is not a color", text->c_str());
        }
    }
    if (auto name = read_string(keyfile, PICKER_GROUP, "space")) {
        if (auto type = Colors::Manager::get().lookup(*name)) {
            config.space = *type;
        } else {
            g_warning("Ignoring [picker] space: unknown color space '%s'", name->c_str());
        }
    }
    if (auto luminance = read_double(keyfile, PICKER_GROUP, "luminance")) {
        if (*luminance >= 0 && *luminance <= 1) {
            config.luminance = *luminance;
        } else {
            g_warning("Ignoring [picker] luminance: %g is not between 0 and 1", *luminance);
        }
    }
    if (has_value(keyfile, PICKER_GROUP, "show-gamuts")) {
        try {
            config.show_gamuts = keyfile->get_boolean(PICKER_GROUP, "show-gamuts");
        } catch (Glib::KeyFileError const &error) {
            g_warning("Ignoring [picker] show-gamuts: %s", error.what());
        }
    }

    int canvas_size = config.geometry.canvas_size();
    double diagram_size = config.geometry.diagram_size();
    auto offset = config.geometry.offset();

    if (auto value = read_double(keyfile, DIAGRAM_GROUP, "canvas-size")) {
        if (*value >= 1) {
            canvas_size = (int)*value;
        } else {
            g_warning("Ignoring [diagram] canvas-size: %g is too small", *value);
        }
    }
    if (auto value = read_double(keyfile, DIAGRAM_GROUP, "diagram-size")) {
        if (*value > 0) {
            diagram_size = *value;
        } else {
            g_warning("Ignoring [diagram] diagram-size: %g is too small", *value);
        }
    }
    if (auto value = read_double(keyfile, DIAGRAM_GROUP, "offset-x")) {
        offset[Geom::X] = *value;
    }
    if (auto value = read_double(keyfile, DIAGRAM_GROUP, "offset-y")) {
        offset[Geom::Y] = *value;
    }
    config.geometry = DiagramGeometry(canvas_size, diagram_size, offset);

    return config;
}

} // namespace Chromapick::Picker
