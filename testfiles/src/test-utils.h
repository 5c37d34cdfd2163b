// SPDX-License-Identifier: GPL-2.0-or-later
/*
 * Shared test header for testing colors
 *
 * Copyright (C) 2026 Authors
 *
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#include <cmath>
#include <cstdlib>
#include <iomanip>
#include <locale>
#include <sstream>
#include <vector>
#include <gtest/gtest.h>

#include "colors/color.h"

namespace {

/**
 * Allow the correct tracing of the file and line where data came from when using P_TESTs.
 */
struct traced_data
{
    const char *_file;
    const int _line;

    ::testing::ScopedTrace enable_scope() const { return ::testing::ScopedTrace(_file, _line, ""); }
};
// Macro for the above tracing in P Tests
#define _P(type, ...)                   \
    type                                \
    {                                   \
        __FILE__, __LINE__, __VA_ARGS__ \
    }

/*
 * Flatten the color records so they can be compared channel by channel.
 */
inline std::vector<double> values(Chromapick::Colors::RGBColor const &c) { return {c.r, c.g, c.b}; }
inline std::vector<double> values(Chromapick::Colors::XYZColor const &c) { return {c.x, c.y, c.z}; }
inline std::vector<double> values(Chromapick::Colors::xyColor const &c) { return {c.x, c.y, c.Y}; }
inline std::vector<double> values(Chromapick::Colors::LABColor const &c) { return {c.l, c.a, c.b}; }
inline std::vector<double> values(Chromapick::Colors::OKLCHColor const &c) { return {c.l, c.c, c.h}; }
inline std::vector<double> values(Chromapick::Colors::HSLColor const &c) { return {c.h, c.s, c.l}; }

/**
 * Print a vector of doubles for debugging
 */
std::string print_values(const std::vector<double> &v)
{
    std::ostringstream oo;
    oo << "{";
    bool first = true;
    for (double const &item : v) {
        if (!first) {
            oo << ", ";
        }
        first = false;
        oo << std::setprecision(6) << item;
    }
    oo << "}";
    return oo.str();
}

inline static ::testing::AssertionResult IsNear(double a, double b, double epsilon = 0.01)
{
    if (std::fabs(a - b) < epsilon) {
        return ::testing::AssertionSuccess();
    }
    return ::testing::AssertionFailure() << a << " != " << b;
}

/**
 * Test each value in a values list is within a certain distance from each other.
 */
inline static ::testing::AssertionResult VectorIsNear(std::vector<double> const &A, std::vector<double> const &B, double epsilon)
{
    bool is_same = A.size() == B.size();
    for (size_t i = 0; is_same && i < A.size(); i++) {
        is_same = is_same and (std::fabs((A[i]) - (B[i])) < epsilon);
    }
    if (!is_same) {
        return ::testing::AssertionFailure() << "\n" << print_values(A) << "\n != \n" << print_values(B);
    }
    return ::testing::AssertionSuccess();
}

/**
 * Generate a count of random doubles between 0 and 1.
 */
inline static std::vector<double> random_values(unsigned ccount)
{
    std::vector<double> values;
    for (unsigned j = 0; j < ccount; j++) {
        values.emplace_back(static_cast<double>(std::rand()) / RAND_MAX);
    }
    return values;
}

/** Global locale testing fixture.
 *
 * Parametrized test fixtures which automatically sets up and restores global locale.
 * \code{.cpp}
 * class FooTestFixture : public GlobalLocaleTestFixture {};
 * TEST_P(FooTestFixture, Test1)
 * {
 *    test_logic
 * }
 * INSTANTIATE_TEST_SUITE_P(TestSuite,
 *                           FooTestFixture,
 *                           testing::Values("C", "de_DE.UTF8"));
 * \endcode
 */
class GlobalLocaleTestFixture : public ::testing::TestWithParam<char const *>
{
    std::locale backup;

protected:
    void SetUp() override
    {
        std::locale locale;
        try {
            locale = std::locale(GetParam());
        } catch (std::exception const &e) {
            GTEST_SKIP() << "Skipping locale '" << GetParam() << "' not available\n";
        }
        backup = std::locale::global(locale);
    }

    void TearDown() override { std::locale::global(backup); }
};

} // namespace

/*
  Local Variables:
  mode:c++
  c-file-style:"stroustrup"
  c-file-offsets:((innamespace . 0)(inline-open . 0))
  indent-tabs-mode:nil
  fill-column:99
  End:
*/
// vim: expandtab:shiftwidth=4:tabstop=8:softtabstop=4 :
