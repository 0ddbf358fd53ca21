//==============================================================================
// MaxwellSolver.cpp
// Ampère/Faraday right-hand side in Fourier space and the current moment that
// couples the Hermite coefficients to the fields.
//==============================================================================

#include "MaxwellSolver.hpp"

namespace maxwell
{
    vec_complex cross_product(const vec_complex& a, const vec_complex& b)
    {
        if (a.size() != b.size() || a.size() % 3 != 0)
        {
            throw std::invalid_argument("cross_product: operands must both hold 3 equally sized blocks!");
        }

        vec_complex out(a.size());
        cross_product(a.data(), b.data(), out.data(), a.size() / 3);
        return out;
    }

    //--------------------------------------------------------------------------
    // plasma_current: only the (0,0,0) and the first moment along each axis
    // enter. A truncation of 1 along axis j removes the thermal part of J_j.
    //--------------------------------------------------------------------------
    void plasma_current(const SimulationParameters& params, const complex_t* Ck, complex_t* J)
    {
        const ModeCounts& mc = params.modes;
        const size_t N = mc.gridSize();
        const size_t Nnmp = mc.momentsPerSpecies();

        const std::array<size_t, 3> axisCount {mc.Nn, mc.Nm, mc.Np};
        const std::array<size_t, 3> firstMoment {mc.momentIndex(1 % mc.Nn, 0, 0),
                                                 mc.momentIndex(0, 1 % mc.Nm, 0),
                                                 mc.momentIndex(0, 0, 1 % mc.Np)};

        std::fill(J, J + 3*N, complex_t(0.0, 0.0));

        for (size_t s=0; s<mc.Ns; ++s)
        {
            const real_t weight = params.qs[s] * params.alphaProduct(s);
            const complex_t* C000 = Ck + (s*Nnmp) * N;

            for (size_t j=0; j<3; ++j)
            {
                const real_t u = params.drift(s, j);
                const real_t thermal = params.alpha(s, j) / std::sqrt(2.0);
                const complex_t* C1 = (axisCount[j] > 1) ? Ck + (s*Nnmp + firstMoment[j]) * N : nullptr;

                for (size_t i=0; i<N; ++i)
                {
                    complex_t value = u * C000[i];
                    if (C1 != nullptr) value += thermal * C1[i];
                    J[j*N + i] += weight * value;
                }
            }
        }
    }

    //--------------------------------------------------------------------------
    // field_rhs: curls come from the real nabla block crossed with E and B,
    // then the factors ∓i and the current are applied in place.
    //--------------------------------------------------------------------------
    void field_rhs(const SimulationParameters& params, const complex_t* Fk,
                   const complex_t* J, complex_t* dFk)
    {
        const size_t N = params.modes.gridSize();
        const real_t* nabla = params.grid.nablaVector().data();
        const real_t invOmega = 1.0 / params.Omega_ce();

        complex_t* dE = dFk;
        complex_t* dB = dFk + 3*N;

        cross_product(nabla, Fk + 3*N, dE, N);
        cross_product(nabla, Fk, dB, N);

        #if defined(USE_OPENMP) || defined(USE_HYBRID)
        #pragma omp parallel for schedule(static)
        #endif
        for (size_t i=0; i<3*N; ++i)
        {
            dB[i] *= -I_unit;
            dE[i] = I_unit * dE[i] - J[i] * invOmega;
        }
    }
}
