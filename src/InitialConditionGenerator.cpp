//==============================================================================
// InitialConditionGenerator.cpp
// Parameter defaults, derived per-species arrays and the initial state
// (Maxwellian background, density perturbation, Gauss-consistent field).
//==============================================================================

#include "InitialConditionGenerator.hpp"

//------------------------------------------------------------------------------
// Ctor: shallow merge of the overrides over the defaults. alpha_s and
// Omega_cs have no default entry; when given they win over mi_me/alpha_e.
//------------------------------------------------------------------------------
InitialConditionGenerator::InitialConditionGenerator(const ModeCounts& modes_, const json& inputParameters)
    : modes(modes_), parameters(defaultParameters(modes_))
{
    modes.validate();

    if (inputParameters.is_null()) return;
    if (!inputParameters.is_object())
    {
        throw std::invalid_argument("Input_Parameters must be a JSON object!");
    }

    for (const auto& item : inputParameters.items())
    {
        parameters[item.key()] = item.value();
    }
}

//------------------------------------------------------------------------------
// Defaults: electron–ion plasma, k_norm = 0.5 along x, weak Landau perturbation.
//------------------------------------------------------------------------------
json InitialConditionGenerator::defaultParameters(const ModeCounts& modes)
{
    vec_real qs(modes.Ns);
    for (size_t s=0; s<modes.Ns; ++s)
    {
        qs[s] = (s % 2 == 0) ? -1.0 : 1.0;
    }

    json defaults {
        {"Lx", 0.8886}, {"Ly", 1.0}, {"Lz", 1.0},
        {"mi_me", 1836.0}, {"Ti_Te", 1.0},
        {"qs", qs},
        {"alpha_e", vec_real {0.1, 0.1, 0.1}},
        {"u_s", vec_real(3*modes.Ns, 0.0)},
        {"nu", 1.0}, {"D", 0.0},
        {"t_max", 20.0}, {"ode_tolerance", 1e-8},
        {"nx", 1}, {"ny", 0}, {"nz", 0},
        {"B0", vec_real {0.0, 0.0, 0.0}}
    };

    for (size_t s=0; s<modes.Ns; ++s)
    {
        defaults["dn" + std::to_string(s+1)] = (s == 0) ? 0.01 : 0.0;
    }

    return defaults;
}

std::array<long, 3> InitialConditionGenerator::perturbedMode() const
{
    return {parameters.at("nx").get<long>(), parameters.at("ny").get<long>(), parameters.at("nz").get<long>()};
}

vec_real InitialConditionGenerator::speciesArray(const std::string& key, size_t expected) const
{
    const json& node = parameters.at(key);
    if (!node.is_array() || node.size() != expected)
    {
        throw std::invalid_argument("Parameter '" + key + "' must be an array of " + std::to_string(expected)
                                    + " numbers for Ns = " + std::to_string(modes.Ns) + "!");
    }
    return node.get<vec_real>();
}

//------------------------------------------------------------------------------
// buildDistribution
// Unit density per species: C_000(k=0) = 1/(α_x α_y α_z). The perturbation
// δn cos(k·x) puts δn/2 on each of the modes ±k.
//------------------------------------------------------------------------------
vec_complex InitialConditionGenerator::buildDistribution(const SpectralGrid& grid, const vec_real& alpha_s) const
{
    const size_t N = modes.gridSize();
    const size_t Nnmp = modes.momentsPerSpecies();
    vec_complex Ck(modes.distributionSize(), complex_t(0.0, 0.0));

    const std::array<long, 3> mode = perturbedMode();
    const bool perturbed = (mode[0] != 0 || mode[1] != 0 || mode[2] != 0);

    size_t plusIndex = 0, minusIndex = 0;
    if (perturbed)
    {
        try
        {
            plusIndex  = grid.modeIndex(mode[0], mode[1], mode[2]);
            minusIndex = grid.modeIndex(-mode[0], -mode[1], -mode[2]);
        }
        catch (const std::out_of_range& e)
        {
            throw std::invalid_argument(std::string("Perturbed mode: ") + e.what());
        }
    }

    for (size_t s=0; s<modes.Ns; ++s)
    {
        const real_t volume = alpha_s[3*s] * alpha_s[3*s+1] * alpha_s[3*s+2];
        complex_t* C000 = Ck.data() + (s*Nnmp) * N;

        C000[grid.zeroMode()] = 1.0 / volume;

        const std::string key = "dn" + std::to_string(s+1);
        const real_t dn = parameters.value(key, 0.0);
        if (perturbed && dn != 0.0)
        {
            C000[plusIndex]  += 0.5 * dn / volume;
            C000[minusIndex] += 0.5 * dn / volume;
        }
    }

    return Ck;
}

//------------------------------------------------------------------------------
// buildFields
// ρ_k = Σ_s q_s α³ C_000(k); E_k = -i nabla ρ_k / (|k|² Omega_ce) for k ≠ 0.
// B_{k=0} = B0, all other modes of B vanish.
//------------------------------------------------------------------------------
vec_complex InitialConditionGenerator::buildFields(const SpectralGrid& grid, const vec_real& qs,
                                                   const vec_real& alpha_s, real_t Omega_ce,
                                                   const vec_complex& Ck_0) const
{
    const size_t N = modes.gridSize();
    const size_t Nnmp = modes.momentsPerSpecies();
    vec_complex Fk(modes.fieldSize(), complex_t(0.0, 0.0));

    const vec_real& k2 = grid.k2Grid();
    for (size_t i=0; i<N; ++i)
    {
        if (k2[i] == 0.0) continue;

        complex_t rho(0.0, 0.0);
        for (size_t s=0; s<modes.Ns; ++s)
        {
            const real_t volume = alpha_s[3*s] * alpha_s[3*s+1] * alpha_s[3*s+2];
            rho += qs[s] * volume * Ck_0[(s*Nnmp)*N + i];
        }

        for (size_t j=0; j<3; ++j)
        {
            Fk[j*N + i] = -I_unit * grid.nabla(j)[i] * rho / (k2[i] * Omega_ce);
        }
    }

    const vec_real B0 = parameters.at("B0").get<vec_real>();
    if (B0.size() != 3)
    {
        throw std::invalid_argument("Parameter 'B0' must hold 3 components!");
    }
    for (size_t j=0; j<3; ++j)
    {
        Fk[(3 + j)*N + grid.zeroMode()] = B0[j];
    }

    return Fk;
}

//------------------------------------------------------------------------------
// generate
// Resolve per-species arrays, then build the record. alpha_e may be a scalar
// (isotropic) or a 3-array; ions scale it by √(Ti_Te/mi_me).
//------------------------------------------------------------------------------
SimulationParameters InitialConditionGenerator::generate() const
{
    const size_t Ns = modes.Ns;
    const real_t mi_me = parameters.at("mi_me").get<real_t>();
    const real_t Ti_Te = parameters.at("Ti_Te").get<real_t>();

    if (!(mi_me > 0.0) || !(Ti_Te > 0.0))
    {
        throw std::invalid_argument("mi_me and Ti_Te must be positive!");
    }

    vec_real alpha_e;
    const json& alphaNode = parameters.at("alpha_e");
    if (alphaNode.is_number())
    {
        alpha_e.assign(3, alphaNode.get<real_t>());
    }
    else
    {
        alpha_e = alphaNode.get<vec_real>();
        if (alpha_e.size() != 3)
        {
            throw std::invalid_argument("Parameter 'alpha_e' must be a number or hold 3 components!");
        }
    }

    vec_real alpha_s;
    if (parameters.contains("alpha_s"))
    {
        alpha_s = speciesArray("alpha_s", 3*Ns);
    }
    else
    {
        alpha_s.resize(3*Ns);
        const real_t ionScale = std::sqrt(Ti_Te / mi_me);
        for (size_t s=0; s<Ns; ++s)
        {
            for (size_t j=0; j<3; ++j)
            {
                alpha_s[3*s + j] = (s == 0) ? alpha_e[j] : alpha_e[j] * ionScale;
            }
        }
    }

    vec_real Omega_cs;
    if (parameters.contains("Omega_cs"))
    {
        Omega_cs = speciesArray("Omega_cs", Ns);
    }
    else
    {
        Omega_cs.assign(Ns, 1.0 / mi_me);
        Omega_cs[0] = 1.0;
    }

    const vec_real qs  = speciesArray("qs", Ns);
    const vec_real u_s = speciesArray("u_s", 3*Ns);

    const real_t Lx = parameters.at("Lx").get<real_t>();
    const real_t Ly = parameters.at("Ly").get<real_t>();
    const real_t Lz = parameters.at("Lz").get<real_t>();

    // Grid only for the initial state; the record builds its own.
    const SpectralGrid grid(Lx, Ly, Lz, modes.Nx, modes.Ny, modes.Nz);

    if (std::any_of(alpha_s.begin(), alpha_s.end(), [](real_t a){ return a == 0.0; }))
    {
        throw std::invalid_argument("Every entry of alpha_s must be nonzero!");
    }
    if (Omega_cs[0] == 0.0)
    {
        throw std::invalid_argument("Omega_cs[0] must be nonzero!");
    }

    vec_complex Ck_0 = buildDistribution(grid, alpha_s);
    vec_complex Fk_0 = buildFields(grid, qs, alpha_s, Omega_cs[0], Ck_0);

    const std::array<long, 3> mode = perturbedMode();
    const real_t kx = 2.0 * M_PI * static_cast<real_t>(mode[0]) / Lx;
    const real_t ky = 2.0 * M_PI * static_cast<real_t>(mode[1]) / Ly;
    const real_t kz = 2.0 * M_PI * static_cast<real_t>(mode[2]) / Lz;

    json metadata = parameters;
    metadata["alpha_e"] = alpha_e;
    metadata["k_norm"] = std::sqrt(kx*kx + ky*ky + kz*kz) * alpha_e[0] / std::sqrt(2.0);

    return SimulationParameters(modes, Lx, Ly, Lz,
                                qs, std::move(Omega_cs), std::move(alpha_s), u_s,
                                parameters.at("nu").get<real_t>(), parameters.at("D").get<real_t>(),
                                parameters.at("t_max").get<real_t>(),
                                parameters.at("ode_tolerance").get<real_t>(),
                                hermite::collision_matrix(modes.Nn, modes.Nm, modes.Np),
                                std::move(Ck_0), std::move(Fk_0), std::move(metadata));
}
