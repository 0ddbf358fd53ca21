//==============================================================================
// Diagnostics.cpp
// Post-processing of a trajectory: energies, density fluctuation of the
// perturbed mode, damping rate fit (LAPACK) and f(x, v_x) reconstruction.
//==============================================================================

#include "Diagnostics.hpp"
#include "HermiteBasis.hpp"
#include "SpectralTransformer.hpp"

namespace diagnostics
{
    real_t em_energy(const SimulationParameters& params, const complex_t* Fk)
    {
        const size_t total = params.modes.fieldSize();
        real_t energy = 0.0;
        for (size_t i=0; i<total; ++i)
        {
            energy += std::norm(Fk[i]);
        }
        return 0.5 * energy;
    }

    //--------------------------------------------------------------------------
    // kinetic_energy: ∫ v_j² Ψ_n dv_j = α_j [(u_j² + α_j²/2) δ_n0
    //                 + √2 u_j α_j δ_n1 + (α_j²/√2) δ_n2],
    // evaluated on the k = 0 mode. Moments beyond the truncation are absent.
    //--------------------------------------------------------------------------
    real_t kinetic_energy(const SimulationParameters& params, const complex_t* Ck, size_t s)
    {
        const ModeCounts& mc = params.modes;
        const size_t N = mc.gridSize();
        const size_t base = s * mc.momentsPerSpecies();
        const size_t zero = params.grid.zeroMode();
        const std::array<size_t, 3> count {mc.Nn, mc.Nm, mc.Np};

        auto moment = [&](size_t j, size_t order) -> complex_t
        {
            if (order >= count[j]) return complex_t(0.0, 0.0);
            std::array<size_t, 3> q {0, 0, 0};
            q[j] = order;
            return Ck[(base + mc.momentIndex(q[0], q[1], q[2]))*N + zero];
        };

        complex_t sum(0.0, 0.0);
        for (size_t j=0; j<3; ++j)
        {
            const real_t u = params.drift(s, j);
            const real_t a = params.alpha(s, j);
            sum += (u*u + 0.5*a*a) * moment(j, 0)
                 + std::sqrt(2.0) * u * a * moment(j, 1)
                 + (a*a / std::sqrt(2.0)) * moment(j, 2);
        }

        return 0.5 * params.alphaProduct(s) * sum.real() / (params.Omega_cs[s] * params.Omega_ce());
    }

    vec_real density_fluctuation(const SimulationParameters& params, const SimulationResult& result,
                                 size_t s, const std::array<long, 3>& mode)
    {
        const size_t N = params.modes.gridSize();
        const size_t idx = params.grid.modeIndex(mode[0], mode[1], mode[2]);
        const size_t offset = (s * params.modes.momentsPerSpecies())*N + idx;

        vec_real fluctuation(result.samples());
        for (size_t t=0; t<result.samples(); ++t)
        {
            fluctuation[t] = std::abs(result.dCkAt(t)[offset]) * params.alphaProduct(s);
        }
        return fluctuation;
    }

    real_t growth_rate(const vec_real& time, const vec_real& signal)
    {
        vec_real logSignal(signal.size());
        for (size_t i=0; i<signal.size(); ++i)
        {
            if (!(signal[i] > 0.0))
            {
                throw std::invalid_argument("growth_rate: signal must be positive to take its logarithm!");
            }
            logSignal[i] = std::log(signal[i]);
        }
        return fit_linear_least_squares(time, logSignal)[1];
    }

    //--------------------------------------------------------------------------
    // reconstruct_distribution
    // Back-transform one species block, then sum the Hermite series on the
    // x line through the origin. Ψ_m(0), Ψ_p(0) fix v_y = u_y, v_z = u_z.
    //--------------------------------------------------------------------------
    mat_real reconstruct_distribution(const SimulationParameters& params, const SimulationResult& result,
                                      size_t t, size_t s, const vec_real& vx)
    {
        const ModeCounts& mc = params.modes;
        if (t >= result.samples() || s >= mc.Ns)
        {
            throw std::out_of_range("reconstruct_distribution: sample or species index out of range!");
        }

        const size_t N = mc.gridSize();
        const size_t Nnmp = mc.momentsPerSpecies();

        SpectralTransformer transformer(mc.Nx, mc.Ny, mc.Nz, Nnmp);
        vec_complex C(Nnmp * N);
        transformer.backwardFFT(result.CkAt(t) + (s*Nnmp)*N, C.data());

        const vec_real psiY = hermite::basis_functions(0.0, mc.Nm);
        const vec_real psiZ = hermite::basis_functions(0.0, mc.Np);

        mat_real f(vx.size(), vec_real(mc.Nx, 0.0));
        for (size_t v=0; v<vx.size(); ++v)
        {
            const real_t xi = (vx[v] - params.drift(s, 0)) / params.alpha(s, 0);
            const vec_real psiX = hermite::basis_functions(xi, mc.Nn);

            for (size_t ix=0; ix<mc.Nx; ++ix)
            {
                const size_t point = params.grid.flatIndex(0, ix, 0);
                real_t value = 0.0;
                for (size_t p=0; p<mc.Np; ++p)
                {
                    for (size_t m=0; m<mc.Nm; ++m)
                    {
                        for (size_t n=0; n<mc.Nn; ++n)
                        {
                            value += C[mc.momentIndex(n, m, p)*N + point].real() * psiX[n] * psiY[m] * psiZ[p];
                        }
                    }
                }
                f[v][ix] = value;
            }
        }
        return f;
    }

    json evaluate(const SimulationParameters& params, const SimulationResult& result)
    {
        const size_t T = result.samples();
        const size_t Ns = params.modes.Ns;

        json out;
        vec_real emEnergy(T), kinetic(T, 0.0), total(T);
        std::vector<vec_real> kineticSpecies(Ns, vec_real(T));

        for (size_t t=0; t<T; ++t)
        {
            emEnergy[t] = em_energy(params, result.FkAt(t));
            for (size_t s=0; s<Ns; ++s)
            {
                kineticSpecies[s][t] = kinetic_energy(params, result.CkAt(t), s);
                kinetic[t] += kineticSpecies[s][t];
            }
            total[t] = emEnergy[t] + kinetic[t];
        }

        out["EM_energy"] = emEnergy;
        out["kinetic_energy"] = kinetic;
        out["total_energy"] = total;
        for (size_t s=0; s<Ns; ++s)
        {
            out["kinetic_energy_species" + std::to_string(s+1)] = kineticSpecies[s];
        }

        out["finite"] = std::all_of(total.begin(), total.end(), [](real_t e){ return std::isfinite(e); });

        const std::array<long, 3> mode {params.metadata.value("nx", 0L),
                                        params.metadata.value("ny", 0L),
                                        params.metadata.value("nz", 0L)};
        const bool perturbed = (mode[0] != 0 || mode[1] != 0 || mode[2] != 0);

        out["damping_rate"] = nullptr;
        if (perturbed)
        {
            for (size_t s=0; s<Ns; ++s)
            {
                out["density_fluctuation_species" + std::to_string(s+1)]
                    = density_fluctuation(params, result, s, mode);
            }

            const vec_real electrons = out["density_fluctuation_species1"].get<vec_real>();
            const bool positive = std::all_of(electrons.begin(), electrons.end(),
                                              [](real_t d){ return d > 0.0 && std::isfinite(d); });
            if (positive)
            {
                out["damping_rate"] = growth_rate(result.time, electrons);
            }
        }

        return out;
    }
}
