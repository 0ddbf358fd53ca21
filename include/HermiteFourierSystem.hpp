#pragma once
/**
 * @file HermiteFourierSystem.hpp
 * @brief Right-hand side of the Hermite–Fourier moment hierarchy of the
 *        Vlasov equation.
 *
 * @details
 * For species s and moment (n, m, p) on every Fourier mode
 *
 *   dC/dt = - i Σ_j nabla_j [ α_j ( √(n_j/2) C_{n_j-1} + √((n_j+1)/2) C_{n_j+1} ) + u_j C ]
 *           - q_s Ω_cs · mask · 𝔽[ (E + v×B) · ∇_v f ]_{nmp}
 *           - ν col(n,m,p) C - D |k|² C .
 *
 * In moment space the velocity derivative and the velocity factor act as
 *   G_j C(n_j) = -(√(2 n_j)/α_j) C(n_j - 1),
 *   V_l D(n_l) = u_l D + α_l ( √(n_l/2) D(n_l-1) + √((n_l+1)/2) D(n_l+1) ),
 * and neighbours outside the truncation contribute zero. The Lorentz term is
 * evaluated pseudo-spectrally: products in real space, forward transform,
 * 2/3 dealias mask.
 */

#include "common.hpp"
#include "SimulationParameters.hpp"
#include "SpectralTransformer.hpp"

/**
 * @class HermiteFourierSystem
 * @brief Evaluator of dCk/dt for all species and moments.
 *
 * @section usage Usage
 * Construct once per run with the (immutable) parameters; call evaluate()
 * with the spectral coefficients and their real-space counterparts. The
 * internal product buffer is fully overwritten on every call.
 */
class HermiteFourierSystem
{
  private:
    const SimulationParameters& params;  ///< Run parameters (not owned).
    SpectralTransformer transformer;     ///< Forward transform of the Lorentz products.
    vec_complex product;                 ///< Real-space (E + v×B)·∇_v f per moment.
    vec_complex productK;                ///< Spectral counterpart of product.

    /// Real-space Lorentz force term for one species, written into product.
    void lorentzProducts(size_t s, const complex_t* C, const complex_t* F);

  public:
    explicit HermiteFourierSystem(const SimulationParameters& params);

    /**
     * @brief Evaluate dCk/dt.
     * @param Ck   Spectral coefficients [Ns Nn Nm Np, grid].
     * @param C    Real-space coefficients (inverse transform of Ck).
     * @param F    Real-space fields (Ex, Ey, Ez, Bx, By, Bz).
     * @param dCk  Output with the layout of Ck.
     */
    void evaluate(const complex_t* Ck, const complex_t* C, const complex_t* F, complex_t* dCk);
};
