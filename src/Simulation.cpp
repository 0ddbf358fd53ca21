//==============================================================================
// Simulation.cpp
// Driver of a single run: initializer → adaptive integration on the output
// time grid → reshaped trajectory and perturbation array.
//==============================================================================

#include "Simulation.hpp"

const complex_t* SimulationResult::CkAt(size_t t) const
{
    return Ck.data() + t * (Ck.size() / samples());
}

const complex_t* SimulationResult::dCkAt(size_t t) const
{
    return dCk.data() + t * (dCk.size() / samples());
}

const complex_t* SimulationResult::FkAt(size_t t) const
{
    return Fk.data() + t * (Fk.size() / samples());
}

Simulation::Simulation(const SimulationConfig& config_)
    : config(config_),
      params(InitialConditionGenerator(config_.modes, config_.InputParameters).generate())
{
    if (config.timesteps < 2)
    {
        throw std::invalid_argument("timesteps must be at least 2!");
    }
    if (!(config.dt > 0.0))
    {
        throw std::invalid_argument("dt must be positive!");
    }
}

//------------------------------------------------------------------------------
// run
// The RHS functor is created per call, so concurrent runs of different
// Simulation objects never share scratch buffers.
//------------------------------------------------------------------------------
SimulationResult Simulation::run() const
{
    const ModeCounts& mc = params.modes;

    VlasovMaxwellSystem system(params);
    ODEStepper stepper(config.solver, params.ode_tolerance, config.MaxSteps, config.Verbose);

    SimulationResult result;
    result.time = linspace(0.0, params.t_max, config.timesteps);

    const vec_complex y0 = system.pack(params.Ck_0, params.Fk_0);
    std::vector<vec_complex> trajectory;

    auto rhs = [&system](real_t t, const vec_complex& y, vec_complex& dydt) { system(t, y, dydt); };

    const auto start = std::chrono::high_resolution_clock::now();
    stepper.integrate(rhs, y0, result.time, trajectory, config.dt);
    const auto end = std::chrono::high_resolution_clock::now();

    result.wallTime = std::chrono::duration<real_t>(end - start).count();
    result.statistics = stepper.statistics();

    // Reshape [Ck | Fk] per sample into two time-major arrays.
    const size_t T = trajectory.size();
    const size_t nC = mc.distributionSize();
    const size_t nF = mc.fieldSize();

    result.Ck.resize(T * nC);
    result.Fk.resize(T * nF);
    for (size_t t=0; t<T; ++t)
    {
        std::copy(trajectory[t].begin(), trajectory[t].begin() + static_cast<std::ptrdiff_t>(nC),
                  result.Ck.begin() + static_cast<std::ptrdiff_t>(t * nC));
        std::copy(trajectory[t].begin() + static_cast<std::ptrdiff_t>(nC), trajectory[t].end(),
                  result.Fk.begin() + static_cast<std::ptrdiff_t>(t * nF));
    }

    result.CkShape = {T, mc.totalMoments(), mc.Ny, mc.Nx, mc.Nz};
    result.FkShape = {T, 6, mc.Ny, mc.Nx, mc.Nz};

    // Perturbation: drop the equilibrium (n=m=p=0, k=0) entry of every species.
    const size_t N = mc.gridSize();
    result.dCk = result.Ck;
    for (size_t t=0; t<T; ++t)
    {
        for (size_t s=0; s<mc.Ns; ++s)
        {
            result.dCk[t*nC + (s * mc.momentsPerSpecies())*N + params.grid.zeroMode()] = 0.0;
        }
    }

    if (config.Verbose)
    {
        std::cout << "Integration finished: " << result.statistics.acceptedSteps << " accepted, "
                  << result.statistics.rejectedSteps << " rejected steps, "
                  << result.statistics.rhsEvaluations << " RHS evaluations in "
                  << result.wallTime << " s" << std::endl;
    }

    return result;
}

json Simulation::toJson(const SimulationResult& result) const
{
    json out = params.toJson();

    out["timesteps"] = config.timesteps;
    out["dt"] = config.dt;
    out["Solver"] = scheme_to_string(config.solver);
    out["MaxSteps"] = config.MaxSteps;

    out["time"] = result.time;
    out["Ck"]  = complex_array_to_json(result.Ck, result.CkShape);
    out["Fk"]  = complex_array_to_json(result.Fk, result.FkShape);
    out["dCk"] = complex_array_to_json(result.dCk, result.CkShape);

    out["solver_statistics"] = {
        {"accepted_steps", result.statistics.acceptedSteps},
        {"rejected_steps", result.statistics.rejectedSteps},
        {"rhs_evaluations", result.statistics.rhsEvaluations},
        {"wall_time", result.wallTime}
    };

    return out;
}
