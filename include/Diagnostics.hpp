#pragma once
/**
 * @file Diagnostics.hpp
 * @brief Energy budget, density fluctuations, damping rate and phase-space
 *        reconstruction from a finished trajectory.
 *
 * @details
 * Energies per unit volume at every output time:
 *   W_EM = ½ Σ_k (|E_k|² + |B_k|²),
 *   W_s  = α_x α_y α_z / (2 Ω_cs Ω_ce) Σ_j [ (u_j² + α_j²/2) C_000
 *          + √2 u_j α_j C_{e_j} + (α_j²/√2) C_{2e_j} ]_{k=0}.
 * Their sum is conserved by the collisionless, diffusion-free system.
 */

#include "common.hpp"
#include "SimulationParameters.hpp"
#include "Simulation.hpp"

namespace diagnostics
{
    /// Electromagnetic energy of one field sample (6 grid blocks).
    real_t em_energy(const SimulationParameters& params, const complex_t* Fk);

    /// Kinetic energy of species s for one distribution sample.
    real_t kinetic_energy(const SimulationParameters& params, const complex_t* Ck, size_t s);

    /// |dC^s_000| at the perturbed mode, times α_x α_y α_z, per sample.
    vec_real density_fluctuation(const SimulationParameters& params, const SimulationResult& result,
                                 size_t s, const std::array<long, 3>& mode);

    /**
     * @brief Slope of log(signal) versus time by least squares.
     * @throws std::invalid_argument if a sample is not positive.
     */
    real_t growth_rate(const vec_real& time, const vec_real& signal);

    /**
     * @brief f_s(x, v_x) on the real-space x grid (y = z = 0 plane) of sample t,
     *        with v_y = u_y and v_z = u_z.
     * @return Row-major array [vx.size(), Nx].
     */
    mat_real reconstruct_distribution(const SimulationParameters& params, const SimulationResult& result,
                                      size_t t, size_t s, const vec_real& vx);

    /**
     * @brief All diagnostics as a JSON object (energies, fluctuations,
     *        damping rate, "finite").
     */
    json evaluate(const SimulationParameters& params, const SimulationResult& result);
}
