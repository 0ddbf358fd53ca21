//==============================================================================
// common.cpp
// Utility functions: approximate equality, scheme names,
// uniform sampling, a linear least-squares helper via LAPACK, and JSON
// conversion of complex arrays.
//==============================================================================

#include "common.hpp"

//------------------------------------------------------------------------------
// Return true if complex numbers are equal within absolute tolerance `tol`.
// Uses component-wise check on real/imag parts to avoid NaN issues.
//------------------------------------------------------------------------------
bool almost_equal(complex_t a, complex_t b, double tol)
{
    return std::abs(a.real() - b.real()) < tol && std::abs(a.imag() - b.imag()) < tol;
}

//------------------------------------------------------------------------------
// Return true if |a - b| < tol (absolute tolerance).
//------------------------------------------------------------------------------
bool almost_equal(double a, double b, double tol)
{
    return std::abs(a - b) < tol;
}

Scheme scheme_from_string(const std::string& name)
{
    if (name == "Dopri5") return Scheme::Dopri5;
    if (name == "Bosh3")  return Scheme::Bosh3;
    throw std::invalid_argument("Unknown ODE solver '" + name + "' (expected Dopri5 or Bosh3)!");
}

std::string scheme_to_string(Scheme scheme)
{
    switch (scheme)
    {
        case Scheme::Dopri5: return "Dopri5";
        case Scheme::Bosh3:  return "Bosh3";
    }
    return "Unknown";
}

//------------------------------------------------------------------------------
// linspace: num samples on [start, stop], both end points included.
//------------------------------------------------------------------------------
vec_real linspace(real_t start, real_t stop, size_t num)
{
    vec_real out(num);
    if (num == 1)
    {
        out[0] = start;
        return out;
    }

    const real_t step = (stop - start) / static_cast<real_t>(num - 1);
    for (size_t i=0; i<num; ++i)
    {
        out[i] = start + step * static_cast<real_t>(i);
    }
    out[num-1] = stop;

    return out;
}

//------------------------------------------------------------------------------
// Fit y ≈ a + b x via LAPACK least squares (dgels) on the tall m×2 system
// [1 x_i] [a b]^T = y_i. Returns coefficients {a, b}.
//------------------------------------------------------------------------------
vec_real fit_linear_least_squares(const vec_real& x_vals, const vec_real& y_vals)
{
    if (x_vals.size() != y_vals.size())
    {
        throw std::invalid_argument("fit_linear_least_squares: x and y sizes differ!");
    }
    if (x_vals.size() < 2)
    {
        throw std::invalid_argument("fit_linear_least_squares: need at least two samples!");
    }

    const lapack_int m = static_cast<lapack_int>(x_vals.size());  // rows
    const lapack_int n = 2;                                        // cols
    const lapack_int nrhs = 1;
    const lapack_int lda = n;
    const lapack_int ldb = nrhs;

    vec_real A(static_cast<size_t>(m) * n);
    for (lapack_int i=0; i<m; ++i)
    {
        A[static_cast<size_t>(i)*n]     = 1.0;
        A[static_cast<size_t>(i)*n + 1] = x_vals[static_cast<size_t>(i)];
    }
    vec_real b = y_vals;        // LAPACK overwrites b with solution

    // Solve min ||A * coeffs - b|| (row-major). On success, b[0..1] = {a,b}.
    lapack_int info = LAPACKE_dgels(LAPACK_ROW_MAJOR, 'N', m, n, nrhs, A.data(), lda, b.data(), ldb);
    if (info != 0)
    {
        throw std::runtime_error("LAPACKE_dgels failed with info = " + std::to_string(info));
    }

    return {b[0], b[1]};
}

json complex_array_to_json(const vec_complex& data, const std::vector<size_t>& shape)
{
    vec_real re(data.size()), im(data.size());
    for (size_t i=0; i<data.size(); ++i)
    {
        re[i] = data[i].real();
        im[i] = data[i].imag();
    }

    json node;
    node["shape"] = shape;
    node["real"]  = re;
    node["imag"]  = im;
    return node;
}

vec_complex complex_array_from_json(const json& node)
{
    vec_real re = node.at("real").get<vec_real>();
    vec_real im = node.at("imag").get<vec_real>();
    if (re.size() != im.size())
    {
        throw std::invalid_argument("Complex array JSON has mismatched real/imag lengths!");
    }

    vec_complex out(re.size());
    for (size_t i=0; i<re.size(); ++i)
    {
        out[i] = complex_t(re[i], im[i]);
    }
    return out;
}
