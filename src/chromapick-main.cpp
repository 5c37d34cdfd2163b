// SPDX-License-Identifier: GPL-2.0-or-later
/**
 * @file
 * chromapick - A CIE 1931 chromaticity color picker.
 */
/*
 * Authors: see git history
 *
 * Copyright (C) 2026 Authors
 *
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#include <csignal>

#include "picker/application.h"

int main(int argc, char *argv[])
{
#if !defined(_WIN32)
    // Opt into handling EPIPE locally, rather than crashing.
    signal(SIGPIPE, SIG_IGN);
#endif

    return Chromapick::Picker::PickerApplication().run(argc, argv);
}
