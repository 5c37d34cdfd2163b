// SPDX-License-Identifier: GPL-2.0-or-later
/*
 * Copyright (C) 2026 Authors
 *
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */
#ifndef SEEN_COLORS_PRINTER_H
#define SEEN_COLORS_PRINTER_H

#include <glib.h>
#include <sstream>
#include <string>
#include <utility>

namespace Chromapick::Colors {

/** A channel printed as a percentage, "50%" */
struct CssPercent
{
    double value;
};

class CssPrinter : public std::ostringstream
{
public:
    CssPrinter(unsigned channels, std::string prefix, std::string ident = "", std::string sep = " ")
        : _channels(channels)
        , _sep(std::move(sep))
    {
        imbue(std::locale("C"));
        precision(3);
        *this << prefix << "(";
        if (!ident.empty()) {
            *this << ident;
            _count = 1;
            _channels += 1;
        }
    }

    // Numbers printed after this keep exactly this many decimals
    CssPrinter &setFixed(unsigned decimals)
    {
        _fixed = true;
        precision(decimals);
        return *this;
    }

    CssPrinter &operator<<(double);
    CssPrinter &operator<<(int);
    CssPrinter &operator<<(CssPercent);

    operator std::string()
    {
        if (!_done) {
            _done = true;
            *this << ")";
        }
        if (_count < _channels) {
            g_warning("Expected %u color channels but got %u", _channels, _count);
            return "";
        }
        return str();
    }

protected:
    std::string _format(double value) const;
    void _append(std::string const &number, char const *suffix = "");

    bool _fixed = false;
    bool _done = false;
    unsigned _count = 0;
    unsigned _channels = 0;
    std::string _sep;
};

class CssLegacyPrinter : public CssPrinter
{
public:
    CssLegacyPrinter(unsigned channels, std::string prefix)
        : CssPrinter(channels, std::move(prefix), "", ", ")
    {}
};

class CssFuncPrinter : public CssPrinter
{
public:
    CssFuncPrinter(unsigned channels, std::string prefix)
        : CssPrinter(channels, std::move(prefix))
    {}
};

class CssColorPrinter : public CssPrinter
{
public:
    CssColorPrinter(unsigned channels, std::string ident)
        : CssPrinter(channels, "color", std::move(ident))
    {}
};

} // namespace Chromapick::Colors

#endif // SEEN_COLORS_PRINTER_H
