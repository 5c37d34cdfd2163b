// SPDX-License-Identifier: GPL-2.0-or-later
/*
 * The chromapick command line.
 *
 * Options are handled locally, the application never registers or
 * activates. Everything happens in on_handle_local_options which returns
 * the exit status.
 *
 * Copyright (C) 2026 Authors
 *
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#include "application.h"

#include <cstdlib>
#include <exception>
#include <glib.h>
#include <iostream>
#include <stdexcept>
#include <glibmm/regex.h>
#include <glibmm/stringutils.h>

#include "colors/manager.h"
#include "colors/utils.h"
#include "config.h"
#include "diagram-renderer.h"
#include "report.h"
#include "selection.h"

#ifndef CHROMAPICK_VERSION
#define CHROMAPICK_VERSION "0.0"
#endif

namespace Chromapick::Picker {

/**
 * Parse a pair of numbers written as "X,Y".
 */
std::optional<Geom::Point> parse_point(std::string const &value)
{
    static auto const regex_point = Glib::Regex::create("^\\s*([-+]?\\d*\\.?\\d+)\\s*,\\s*([-+]?\\d*\\.?\\d+)\\s*$",
                                                        Glib::Regex::CompileFlags::OPTIMIZE);
    Glib::ustring const text = value;
    Glib::MatchInfo match;
    if (!regex_point->match(text, match)) {
        return {};
    }
    try {
        return Geom::Point(Glib::Ascii::strtod(match.fetch(1).raw()), Glib::Ascii::strtod(match.fetch(2).raw()));
    } catch (std::out_of_range const &) {
        return {};
    }
}

PickerApplication::PickerApplication()
{
    using T = Gio::Application;

    _gio_application = Gio::Application::create("org.chromapick.Chromapick", Gio::Application::Flags::NON_UNIQUE);
    auto *gapp = gio_app();

    gapp->set_option_context_summary("Pick a color on the CIE 1931 chromaticity diagram and print it in every format.");
    gapp->set_option_context_description("Examples:\n"
                                         "  chromapick --rgb=#ff6464 --space=P3\n"
                                         "  chromapick --xy=0.3127,0.329 --luminance=0.8 --export=diagram.png\n");

    // clang-format off
    gapp->add_main_option_entry(T::OptionType::BOOL,     "version",      'V',  "Print chromapick version",                            "");
    gapp->add_main_option_entry(T::OptionType::STRING,   "rgb",          'r',  "Start from this color",                               "#RRGGBB|R,G,B");
    gapp->add_main_option_entry(T::OptionType::STRING,   "space",        's',  "Color space: sRGB, P3 or Rec2020",                    "NAME");
    gapp->add_main_option_entry(T::OptionType::DOUBLE,   "luminance",    'l',  "Luminance Y used when picking, 0 to 1",               "Y");
    gapp->add_main_option_entry(T::OptionType::STRING,   "xy",           'x',  "Pick the color at this chromaticity",                 "X,Y");
    gapp->add_main_option_entry(T::OptionType::STRING,   "canvas-point", 'p',  "Pick the color at this pixel of the diagram",         "PX,PY");
    gapp->add_main_option_entry(T::OptionType::FILENAME, "export",       'o',  "Write the diagram to a PNG file",                     "FILENAME");
    gapp->add_main_option_entry(T::OptionType::BOOL,     "no-gamuts",    '\0', "Don't draw the gamut triangles",                      "");
    gapp->add_main_option_entry(T::OptionType::FILENAME, "config",       'c',  "Read settings from this file",                        "FILENAME");
    // clang-format on

    gapp->signal_handle_local_options().connect(sigc::mem_fun(*this, &PickerApplication::on_handle_local_options), true);
}

/*
 * Handle command line options.
 *
 * Options are processed in order: Print -> Configure -> Pick -> Report -> Export.
 */
int PickerApplication::on_handle_local_options(Glib::RefPtr<Glib::VariantDict> const &options)
{
    if (!options) {
        std::cerr << "PickerApplication::on_handle_local_options: options is null!" << std::endl;
        return EXIT_FAILURE;
    }

    // ===================== PRINT =====================
    if (options->contains("version")) {
        std::cout << "chromapick " << CHROMAPICK_VERSION << std::endl;
        return EXIT_SUCCESS;
    }

    // =================== CONFIGURE ===================
    std::string config_file = Config::default_path();
    if (options->contains("config")) {
        options->lookup_value("config", config_file);
    }
    auto config = Config::load(config_file);

    if (options->contains("space")) {
        Glib::ustring name;
        options->lookup_value("space", name);
        auto type = Colors::Manager::get().lookup(name.raw());
        if (!type) {
            std::cerr << "chromapick: unknown color space: " << name.raw() << std::endl;
            return EXIT_FAILURE;
        }
        config.space = *type;
    }

    if (options->contains("luminance")) {
        double luminance = 0;
        options->lookup_value("luminance", luminance);
        if (luminance < 0 || luminance > 1) {
            std::cerr << "chromapick: luminance must be between 0 and 1" << std::endl;
            return EXIT_FAILURE;
        }
        config.luminance = luminance;
    }

    if (options->contains("rgb")) {
        Glib::ustring text;
        options->lookup_value("rgb", text);
        auto rgb = Colors::parse_rgb(text.raw());
        if (!rgb) {
            std::cerr << "chromapick: not a color: " << text.raw() << std::endl;
            return EXIT_FAILURE;
        }
        config.color = *rgb;
    }

    if (options->contains("no-gamuts")) {
        config.show_gamuts = false;
    }

    // ====================== PICK =====================
    auto selection = Selection::from_rgb(config.color, config.space, config.luminance);

    if (options->contains("xy") && options->contains("canvas-point")) {
        std::cerr << "chromapick: --xy and --canvas-point can't be used together" << std::endl;
        return EXIT_FAILURE;
    }
    if (options->contains("xy")) {
        Glib::ustring text;
        options->lookup_value("xy", text);
        auto xy = parse_point(text.raw());
        if (!xy) {
            std::cerr << "chromapick: not a chromaticity: " << text.raw() << std::endl;
            return EXIT_FAILURE;
        }
        selection = selection.with_chromaticity(xy->x(), xy->y());
    }
    if (options->contains("canvas-point")) {
        Glib::ustring text;
        options->lookup_value("canvas-point", text);
        auto pixel = parse_point(text.raw());
        if (!pixel) {
            std::cerr << "chromapick: not a diagram point: " << text.raw() << std::endl;
            return EXIT_FAILURE;
        }
        selection = selection.with_canvas_point(*pixel, config.geometry);
    }

    // ===================== REPORT ====================
    std::cout << format_report(selection);

    // ===================== EXPORT ====================
    if (options->contains("export")) {
        std::string filename;
        options->lookup_value("export", filename);
        auto renderer = DiagramRenderer(config.geometry, config.show_gamuts);
        try {
            renderer.export_png(filename, selection);
        } catch (std::exception const &error) {
            std::cerr << "chromapick: can't export " << filename << ": " << error.what() << std::endl;
            return EXIT_FAILURE;
        }
        g_message("Diagram written to %s", filename.c_str());
    }

    return EXIT_SUCCESS;
}

} // namespace Chromapick::Picker

/*
  Local Variables:
  mode:c++
  c-file-style:"stroustrup"
  c-file-offsets:((innamespace . 0)(inline-open . 0)(case-label . +))
  indent-tabs-mode:nil
  fill-column:99
  End:
*/
// vim: filetype=cpp:expandtab:shiftwidth=4:tabstop=8:softtabstop=4 :
