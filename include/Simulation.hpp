#pragma once
/**
 * @file Simulation.hpp
 * @brief Driver of one Vlasov–Maxwell run: initial state, adaptive time
 *        integration and the trajectory record.
 *
 * @details
 * A Simulation owns its immutable SimulationParameters. run() samples the
 * solution at `timesteps` uniformly spaced times on [0, t_max] and returns
 *  - Ck  with shape (timesteps, Ns Nn Nm Np, Ny, Nx, Nz),
 *  - Fk  with shape (timesteps, 6, Ny, Nx, Nz),
 *  - dCk = Ck with the background entry (n=m=p=0, k=0) of every species
 *    set to zero at every time,
 *  - time with shape (timesteps).
 */

#include "common.hpp"
#include "SimulationConfig.hpp"
#include "SimulationParameters.hpp"
#include "InitialConditionGenerator.hpp"
#include "VlasovMaxwellSystem.hpp"
#include "ODEStepper.hpp"

/**
 * @struct SimulationResult
 * @brief Flattened trajectory arrays with their shapes.
 */
struct SimulationResult
{
    vec_real time;                 ///< Output times.
    vec_complex Ck;                ///< Distribution coefficients, row-major in CkShape.
    vec_complex Fk;                ///< Field coefficients, row-major in FkShape.
    vec_complex dCk;               ///< Ck without the background entries.
    std::vector<size_t> CkShape;   ///< (timesteps, Ns Nn Nm Np, Ny, Nx, Nz).
    std::vector<size_t> FkShape;   ///< (timesteps, 6, Ny, Nx, Nz).
    StepperStatistics statistics;  ///< Integrator counters.
    real_t wallTime {0.0};         ///< Seconds spent in the integrator.

    /// Number of stored time samples.
    size_t samples() const { return time.size(); }

    /// Pointer to the distribution block of sample t.
    const complex_t* CkAt(size_t t) const;

    /// Pointer to the perturbation block of sample t.
    const complex_t* dCkAt(size_t t) const;

    /// Pointer to the field block of sample t.
    const complex_t* FkAt(size_t t) const;
};

/**
 * @class Simulation
 * @brief Builds parameters from a SimulationConfig and integrates them.
 */
class Simulation
{
  private:
    SimulationConfig config;        ///< Run-level settings.
    SimulationParameters params;    ///< Immutable physical parameters and initial state.

  public:
    /**
     * @brief Resolve parameters and the initial state.
     * @throws std::invalid_argument on inconsistent input.
     */
    explicit Simulation(const SimulationConfig& config);

    const SimulationParameters& parameters() const { return params; }
    const SimulationConfig& configuration() const { return config; }

    /**
     * @brief Integrate to t_max.
     * @throws std::runtime_error if the integrator exceeds its step budget.
     */
    SimulationResult run() const;

    /**
     * @brief Output record: trajectory, time and every parameter.
     * @details Complex arrays use {"shape", "real", "imag"} objects.
     */
    json toJson(const SimulationResult& result) const;
};
