#pragma once
/**
 * @file SimulationParameters.hpp
 * @brief Immutable, validated record of everything the right-hand side and
 *        the driver read during one run.
 *
 * @details
 * Produced once by the InitialConditionGenerator and afterwards only passed
 * by const reference. Per-species arrays use the layouts
 *   qs, Omega_cs         : [Ns]
 *   alpha_s, u_s         : [3 Ns], (x, y, z) per species
 *   collision_matrix     : [Nn Nm Np], n fastest
 *   Ck_0                 : [Ns Nn Nm Np, Ny, Nx, Nz]
 *   Fk_0                 : [6, Ny, Nx, Nz], (Ex, Ey, Ez, Bx, By, Bz)
 */

#include "common.hpp"
#include "SpectralGrid.hpp"
#include "HermiteBasis.hpp"

/**
 * @struct SimulationParameters
 * @brief Typed replacement of the parameter dictionary of one simulation.
 */
struct SimulationParameters
{
    ModeCounts modes;                ///< Array shapes of the run.
    real_t Lx, Ly, Lz;               ///< Domain lengths.
    vec_real qs;                     ///< Species charges.
    vec_real Omega_cs;               ///< Species cyclotron frequencies (Omega_cs[0] normalises Ampère's law).
    vec_real alpha_s;                ///< Thermal velocity scales.
    vec_real u_s;                    ///< Drift velocities.
    real_t nu;                       ///< Collision rate.
    real_t D;                        ///< Spectral diffusion coefficient.
    real_t t_max;                    ///< Final time.
    real_t ode_tolerance;            ///< rtol = atol of the adaptive integrator.
    SpectralGrid grid;               ///< Wavenumbers, nabla, |k|², dealias mask.
    RecurrenceCoefficients recurrence; ///< √(n+1), √n per velocity axis.
    vec_real collision_matrix;       ///< Per-moment damping factors.
    vec_complex Ck_0;                ///< Initial Hermite–Fourier coefficients.
    vec_complex Fk_0;                ///< Initial field coefficients.
    json metadata;                   ///< Initializer inputs with no role in the RHS (perturbation, B0, ...).

    /**
     * @brief Assemble the record, derive grid and recurrence data and validate.
     * @throws std::invalid_argument on any inconsistent size or value.
     */
    SimulationParameters(const ModeCounts& modes, real_t Lx, real_t Ly, real_t Lz,
                         vec_real qs, vec_real Omega_cs, vec_real alpha_s, vec_real u_s,
                         real_t nu, real_t D, real_t t_max, real_t ode_tolerance,
                         vec_real collision_matrix, vec_complex Ck_0, vec_complex Fk_0,
                         json metadata = json::object());

    /// Thermal scale of species s along axis j.
    real_t alpha(size_t s, size_t j) const { return alpha_s[3*s + j]; }

    /// Drift of species s along axis j.
    real_t drift(size_t s, size_t j) const { return u_s[3*s + j]; }

    /// α_x α_y α_z of species s.
    real_t alphaProduct(size_t s) const { return alpha(s,0) * alpha(s,1) * alpha(s,2); }

    /// Electron cyclotron frequency used to normalise the current.
    real_t Omega_ce() const { return Omega_cs[0]; }

    /// Re-run every consistency check.
    void validate() const;

    /// All parameters with the key names of the output record.
    json toJson() const;
};
