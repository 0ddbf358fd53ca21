#pragma once
/**
 * @file InitialConditionGenerator.hpp
 * @brief Construction of the parameter record and the initial Hermite–Fourier
 *        state of a Vlasov–Maxwell run.
 *
 * @details
 * The InitialConditionGenerator merges user supplied `Input_Parameters` over
 * a table of defaults (a Landau-damping setup with mobile ions), derives the
 * per-species arrays and builds:
 *  - Ck_0: Maxwellian background C_000(k=0) = 1/(α_x α_y α_z) per species,
 *    plus a density perturbation δn_s cos(k·x) at the mode (nx, ny, nz);
 *  - Fk_0: the electric field solving Gauss's law for that charge density,
 *    E_k = -i nabla ρ_k / (|k|² Omega_ce), and a uniform magnetic field B0.
 *
 * Conventions:
 *  - Species 0 is the electron species; its Omega_cs entry normalises Ampère's law.
 *  - Perturbation amplitudes are read from "dn1", "dn2", ... (1-based species).
 *  - Unknown keys are carried into the metadata untouched.
 */

#include "common.hpp"
#include "SimulationParameters.hpp"

/**
 * @class InitialConditionGenerator
 * @brief Builds an immutable SimulationParameters record from JSON input.
 *
 * @section requirements Requirements
 * - Per-species overrides (`qs`, `Omega_cs`) have Ns entries, `alpha_s` and
 *   `u_s` have 3 Ns entries.
 * - The perturbed mode must be resolved on the spatial grid.
 */
class InitialConditionGenerator
{
  private:
    ModeCounts modes;    ///< Shapes of the run.
    json parameters;     ///< Defaults with the user overrides applied.

    /// Per-species vector of length `expected`, or a shape error.
    vec_real speciesArray(const std::string& key, size_t expected) const;

    /// Ck_0 from the resolved parameters.
    vec_complex buildDistribution(const SpectralGrid& grid, const vec_real& alpha_s) const;

    /// Fk_0 consistent with the charge density of Ck_0.
    vec_complex buildFields(const SpectralGrid& grid, const vec_real& qs, const vec_real& alpha_s,
                            real_t Omega_ce, const vec_complex& Ck_0) const;

  public:
    /**
     * @brief Construct with mode counts and user overrides.
     * @param modes           Mode counts of the run.
     * @param inputParameters JSON object of overrides (may be empty or null).
     * @throws std::invalid_argument if the overrides are not a JSON object.
     */
    InitialConditionGenerator(const ModeCounts& modes, const json& inputParameters);

    /// Default physical parameters for the given mode counts.
    static json defaultParameters(const ModeCounts& modes);

    /// Defaults merged with the overrides, before derivation.
    const json& resolvedParameters() const { return parameters; }

    /// Integer wavenumber (nx, ny, nz) of the initial perturbation.
    std::array<long, 3> perturbedMode() const;

    /**
     * @brief Derive all arrays and the initial state.
     * @throws std::invalid_argument on inconsistent sizes or values.
     */
    SimulationParameters generate() const;
};
