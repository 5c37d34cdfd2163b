// SPDX-License-Identifier: GPL-2.0-or-later
/*
 * Copyright (C) 2026 Authors
 *
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#include "printer.h"

namespace Chromapick::Colors {

std::string CssPrinter::_format(double value) const
{
    std::ostringstream oo;
    oo.imbue(getloc());
    oo.precision(precision());
    oo << std::fixed << value;
    auto number = oo.str();

    if (!_fixed) {
        // Precision counts decimals here, drop the ones that add nothing
        while (number.find(".") != std::string::npos &&
               (number.substr(number.length() - 1, 1) == "0" || number.substr(number.length() - 1, 1) == "."))
            number.pop_back();
    }

    // Negative zero in any precision prints without the sign
    if (number[0] == '-' && number.find_first_not_of("-0.") == std::string::npos)
        number.erase(0, 1);

    return number;
}

void CssPrinter::_append(std::string const &number, char const *suffix)
{
    if (!_done && _count < _channels) {
        *this << (_count ? _sep : "") << number << suffix;
        _count++;
    }
}

CssPrinter &CssPrinter::operator<<(double value)
{
    _append(_format(value));
    return *this;
}

CssPrinter &CssPrinter::operator<<(int value)
{
    _append(std::to_string(value));
    return *this;
}

CssPrinter &CssPrinter::operator<<(CssPercent value)
{
    _append(_format(value.value), "%");
    return *this;
}

}; // namespace Chromapick::Colors

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
