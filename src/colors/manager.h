// SPDX-License-Identifier: GPL-2.0-or-later
/*
 * Colors::Manager - Look after the color spaces the picker can convert into.
 *
 * Copyright (C) 2026 Authors
 *
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#ifndef SEEN_COLORS_MANAGER_H
#define SEEN_COLORS_MANAGER_H

#include <strings.h>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "spaces/enum.h"

namespace Chromapick::Colors {
namespace Space {
class Definition;
} // namespace Space

class Manager
{
private:
    Manager(Manager const &) = delete;
    void operator=(Manager const &) = delete;

public:

    static Manager &get()
    {
        static Manager instance;
        return instance;
    }

    std::vector<std::shared_ptr<Space::Definition>> const &spaces() const { return _spaces; }

    bool has(Space::Type type) const;
    Space::Definition const &find(Space::Type type) const;
    std::optional<Space::Type> lookup(std::string const &name) const;

protected:
    Manager();
    ~Manager() = default;

    std::shared_ptr<Space::Definition> addSpace(Space::Definition *space);

private:
    std::vector<std::shared_ptr<Space::Definition>> _spaces;

    struct cmpCaseInsensitive {
        bool operator()(const std::string& a, const std::string& b) const {
            return strcasecmp(a.c_str(), b.c_str()) < 0;
        }
    };
    std::map<std::string, Space::Type, cmpCaseInsensitive> _names_lookup;
};

} // namespace Chromapick::Colors

#endif // SEEN_COLORS_MANAGER_H

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
