//==============================================================================
// HermiteBasis.cpp
// Ladder coefficients, hyper-collision rates and pointwise evaluation of the
// asymmetric Hermite functions.
//==============================================================================

#include "HermiteBasis.hpp"

RecurrenceCoefficients::RecurrenceCoefficients(size_t Nn, size_t Nm, size_t Np)
    : sqrt_n_plus(hermite::sqrt_plus(Nn)), sqrt_n_minus(hermite::sqrt_minus(Nn)),
      sqrt_m_plus(hermite::sqrt_plus(Nm)), sqrt_m_minus(hermite::sqrt_minus(Nm)),
      sqrt_p_plus(hermite::sqrt_plus(Np)), sqrt_p_minus(hermite::sqrt_minus(Np))
{}

namespace hermite
{
    vec_real sqrt_plus(size_t N)
    {
        vec_real out(N);
        for (size_t i=0; i<N; ++i)
        {
            out[i] = std::sqrt(static_cast<real_t>(i + 1));
        }
        return out;
    }

    vec_real sqrt_minus(size_t N)
    {
        vec_real out(N);
        for (size_t i=0; i<N; ++i)
        {
            out[i] = std::sqrt(static_cast<real_t>(i));
        }
        return out;
    }

    real_t hypercollision(size_t n, size_t N)
    {
        if (N <= 3 || n <= 2) return 0.0;

        const real_t nr = static_cast<real_t>(n);
        const real_t Nr = static_cast<real_t>(N);
        return nr*(nr - 1.0)*(nr - 2.0) / ((Nr - 1.0)*(Nr - 2.0)*(Nr - 3.0));
    }

    vec_real collision_matrix(size_t Nn, size_t Nm, size_t Np)
    {
        vec_real col(Nn*Nm*Np);
        for (size_t p=0; p<Np; ++p)
        {
            for (size_t m=0; m<Nm; ++m)
            {
                for (size_t n=0; n<Nn; ++n)
                {
                    col[n + Nn*(m + Nm*p)] = hypercollision(n, Nn) + hypercollision(m, Nm)
                                           + hypercollision(p, Np);
                }
            }
        }
        return col;
    }

    //--------------------------------------------------------------------------
    // Ψ_0 = π^{-1/2} e^{-ξ²},  Ψ_1 = √2 ξ Ψ_0,
    // Ψ_{n+1} = (√2 ξ Ψ_n - √n Ψ_{n-1}) / √(n+1).
    // Derived from H_{n+1} = 2ξ H_n - 2n H_{n-1} with the basis normalisation.
    //--------------------------------------------------------------------------
    vec_real basis_functions(real_t xi, size_t N)
    {
        vec_real psi(N, 0.0);
        if (N == 0) return psi;

        psi[0] = std::exp(-xi*xi) / std::sqrt(M_PI);
        if (N > 1) psi[1] = std::sqrt(2.0) * xi * psi[0];

        for (size_t n=1; n+1<N; ++n)
        {
            const real_t nr = static_cast<real_t>(n);
            psi[n+1] = (std::sqrt(2.0) * xi * psi[n] - std::sqrt(nr) * psi[n-1]) / std::sqrt(nr + 1.0);
        }
        return psi;
    }
}
