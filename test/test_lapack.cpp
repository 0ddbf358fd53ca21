//==============================================================================
// test_lapack.cpp
// Correctness test for the LAPACK(e) least-squares helper used by the
// damping-rate diagnostic.
//
// 1) Exact line y = 2 - 0.5 x is recovered to ~1e-12.
// 2) Symmetric residuals around a line do not bias the fit.
// 3) Malformed input throws std::invalid_argument.
//==============================================================================

#include <cassert>
#include "common.hpp"

int main()
{
    // Exact data on a line
    const vec_real x = linspace(0.0, 9.0, 10);
    vec_real y(x.size());
    for (size_t i=0; i<x.size(); ++i)
    {
        y[i] = 2.0 - 0.5 * x[i];
    }

    vec_real coeffs = fit_linear_least_squares(x, y);
    assert(coeffs.size() == 2);
    assert(almost_equal(coeffs[0], 2.0, 1e-12));
    assert(almost_equal(coeffs[1], -0.5, 1e-12));

    // Residuals +d, -d, -d, +d are orthogonal to both [1] and [x] for
    // x = 0, 1, 2, 3, so the least-squares line is unchanged.
    const vec_real xs {0.0, 1.0, 2.0, 3.0};
    const vec_real ys {1.0 + 0.1, 4.0 - 0.1, 7.0 - 0.1, 10.0 + 0.1};
    coeffs = fit_linear_least_squares(xs, ys);
    assert(almost_equal(coeffs[0], 1.0, 1e-12));
    assert(almost_equal(coeffs[1], 3.0, 1e-12));

    // Size mismatch / too few points
    bool threw = false;
    try { fit_linear_least_squares({0.0, 1.0}, {1.0}); }
    catch (const std::invalid_argument&) { threw = true; }
    assert(threw);

    threw = false;
    try { fit_linear_least_squares({0.0}, {1.0}); }
    catch (const std::invalid_argument&) { threw = true; }
    assert(threw);

    // linspace includes both end points
    const vec_real t = linspace(0.0, 20.0, 200);
    assert(t.size() == 200);
    assert(t.front() == 0.0 && t.back() == 20.0);

    return 0;
}
