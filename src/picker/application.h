// SPDX-License-Identifier: GPL-2.0-or-later
/*
 * The chromapick command line.
 *
 * Copyright (C) 2026 Authors
 *
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#ifndef SEEN_PICKER_APPLICATION_H
#define SEEN_PICKER_APPLICATION_H

#include <optional>
#include <string>

#include <2geom/point.h>
#include <giomm/application.h>
#include <glibmm/refptr.h>
#include <glibmm/variantdict.h>

namespace Chromapick::Picker {

class PickerApplication
{
public:
    PickerApplication();

    int run(int argc, char **argv) { return _gio_application->run(argc, argv); }
    Gio::Application *gio_app() { return _gio_application.get(); }

private:
    int on_handle_local_options(Glib::RefPtr<Glib::VariantDict> const &options);

    Glib::RefPtr<Gio::Application> _gio_application;
};

std::optional<Geom::Point> parse_point(std::string const &value);

} // namespace Chromapick::Picker

#endif // SEEN_PICKER_APPLICATION_H
