#pragma once
/**
 * @file MaxwellSolver.hpp
 * @brief Current moment of the Hermite coefficients and the spectral
 *        Maxwell curl equations.
 *
 * @details
 * Field blocks are stored component-major: a 3-vector field on a grid of
 * N points occupies 3N entries (x block, y block, z block), and the full
 * electromagnetic state Fk holds (Ex, Ey, Ez, Bx, By, Bz), i.e. 6N entries.
 *
 * In spectral space
 *   dB/dt = -i nabla × E,
 *   dE/dt =  i nabla × B - J / Omega_ce,
 * with the current
 *   J_j = Σ_s q_s α_x α_y α_z [ u_j C^s_000 + (α_j/√2) C^s_{e_j} ],
 * where C^s_{e_j} is the first Hermite moment along velocity axis j.
 */

#include "common.hpp"
#include "SimulationParameters.hpp"

namespace maxwell
{
    /**
     * @brief Pointwise cross product of two 3-vector fields with N points each.
     *
     * Either operand may be real, so the curl i k × F is formed by passing
     * the stacked nabla operator as a.
     */
    template <typename TA, typename TB>
    void cross_product(const TA* a, const TB* b, complex_t* out, size_t N)
    {
        #if defined(USE_OPENMP) || defined(USE_HYBRID)
        #pragma omp parallel for schedule(static)
        #endif
        for (size_t i=0; i<N; ++i)
        {
            const TA ax = a[i], ay = a[N + i], az = a[2*N + i];
            const TB bx = b[i], by = b[N + i], bz = b[2*N + i];

            out[i]       = ay*bz - az*by;
            out[N + i]   = az*bx - ax*bz;
            out[2*N + i] = ax*by - ay*bx;
        }
    }

    /**
     * @brief Vector overload; a and b hold 3N entries.
     * @throws std::invalid_argument if the sizes differ or are not divisible by 3.
     */
    vec_complex cross_product(const vec_complex& a, const vec_complex& b);

    /**
     * @brief Charge-weighted current density in Fourier space.
     * @param params Run parameters.
     * @param Ck     Spectral distribution coefficients [Ns Nn Nm Np, grid].
     * @param J      Output, 3 grid blocks (overwritten).
     */
    void plasma_current(const SimulationParameters& params, const complex_t* Ck, complex_t* J);

    /**
     * @brief Time derivative of the spectral field block.
     * @param params Run parameters (nabla, Omega_cs).
     * @param Fk     Spectral fields, 6 grid blocks.
     * @param J      Current density, 3 grid blocks.
     * @param dFk    Output, 6 grid blocks (overwritten).
     */
    void field_rhs(const SimulationParameters& params, const complex_t* Fk,
                   const complex_t* J, complex_t* dFk);
}
