#pragma once
/**
 * @file HermiteBasis.hpp
 * @brief Ladder coefficients, collision matrix and evaluation of the
 *        asymmetric Hermite basis Ψ_n(ξ) = (π 2^n n!)^{-1/2} H_n(ξ) e^{-ξ²}.
 *
 * @details
 * The velocity-space operators act on moment n through
 *   ξ Ψ_n     = √((n+1)/2) Ψ_{n+1} + √(n/2) Ψ_{n-1},
 *   dΨ_n/dξ   = -√(2(n+1)) Ψ_{n+1},
 * which only need √(n+1) ("plus") and √n ("minus") per index. The minus
 * coefficient at n = 0 is exactly zero, so no n = -1 moment is ever read.
 */

#include "common.hpp"

/**
 * @struct RecurrenceCoefficients
 * @brief √(index+1) and √index arrays for the three velocity axes.
 */
struct RecurrenceCoefficients
{
    vec_real sqrt_n_plus, sqrt_n_minus;
    vec_real sqrt_m_plus, sqrt_m_minus;
    vec_real sqrt_p_plus, sqrt_p_minus;

    RecurrenceCoefficients() = default;
    RecurrenceCoefficients(size_t Nn, size_t Nm, size_t Np);
};

namespace hermite
{
    /// √(i+1) for i = 0..N-1.
    vec_real sqrt_plus(size_t N);

    /// √i for i = 0..N-1 (first entry 0).
    vec_real sqrt_minus(size_t N);

    /**
     * @brief Hyper-collisional damping h(n,N) = n(n-1)(n-2)/((N-1)(N-2)(N-3)).
     * @return 0 for N ≤ 3 or n ≤ 2, so mass, momentum and energy are untouched.
     */
    real_t hypercollision(size_t n, size_t N);

    /**
     * @brief Per-moment collision rates col(n,m,p) = h(n,Nn)+h(m,Nm)+h(p,Np),
     *        flattened with n fastest.
     */
    vec_real collision_matrix(size_t Nn, size_t Nm, size_t Np);

    /**
     * @brief Values Ψ_0(ξ) … Ψ_{N-1}(ξ) by the stable normalised recurrence.
     */
    vec_real basis_functions(real_t xi, size_t N);
}
