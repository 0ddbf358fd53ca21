#pragma once
/**
 * @file VlasovMaxwellSystem.hpp
 * @brief Packed state vector and the full right-hand side (t, y) → dy/dt of
 *        the Hermite–Fourier Vlasov–Maxwell system.
 *
 * @details
 * The state is the concatenation [Ck | Fk] of the distribution block
 * (Ns Nn Nm Np × Ny Nx Nz) and the field block (6 × Ny Nx Nz). Every
 * evaluation
 *   1. splits y into Ck and Fk,
 *   2. inverse-transforms both to real space,
 *   3. evaluates the moment hierarchy and the Maxwell equations with current,
 *   4. writes the concatenated derivative into dydt.
 * The system is autonomous; t is accepted for the integrator interface only.
 */

#include "common.hpp"
#include "SimulationParameters.hpp"
#include "SpectralTransformer.hpp"
#include "HermiteFourierSystem.hpp"
#include "MaxwellSolver.hpp"

/**
 * @class VlasovMaxwellSystem
 * @brief Right-hand-side functor for the ODEStepper.
 *
 * @section notes Notes
 * Scratch buffers are owned per instance and fully overwritten on each call,
 * so results never depend on earlier evaluations. Independent runs must use
 * independent instances.
 */
class VlasovMaxwellSystem
{
  private:
    const SimulationParameters& params;   ///< Run parameters (not owned).
    SpectralTransformer momentTransformer; ///< Batch of Ns Nn Nm Np grid blocks.
    SpectralTransformer fieldTransformer;  ///< Batch of 6 grid blocks.
    HermiteFourierSystem hermite;          ///< Moment hierarchy evaluator.

    vec_complex C;      ///< Real-space distribution coefficients.
    vec_complex F;      ///< Real-space fields.
    vec_complex J;      ///< Spectral current density.

  public:
    explicit VlasovMaxwellSystem(const SimulationParameters& params);

    /// Length of the packed state.
    size_t stateSize() const { return params.modes.stateSize(); }

    /**
     * @brief Concatenate Ck and Fk into one state vector.
     * @throws std::invalid_argument on any length mismatch.
     */
    vec_complex pack(const vec_complex& Ck, const vec_complex& Fk) const;

    /**
     * @brief Split a state vector into Ck and Fk.
     * @throws std::invalid_argument on any length mismatch.
     */
    void unpack(const vec_complex& y, vec_complex& Ck, vec_complex& Fk) const;

    /**
     * @brief Evaluate dy/dt.
     * @throws std::invalid_argument if y does not have stateSize() entries.
     */
    void operator()(real_t t, const vec_complex& y, vec_complex& dydt);
};
