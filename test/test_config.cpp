//==============================================================================
// test_config.cpp
// Configuration parsing and initial-state construction:
//   1) SimulationConfig defaults and rejected inputs.
//   2) Derived per-species parameters and override validation.
//   3) Initial state: Maxwellian background, perturbation, Gauss's law, B0.
//   4) SimulationSuite ordering and lookup.
//==============================================================================

#include <cassert>
#include "common.hpp"
#include "SimulationConfig.hpp"
#include "InitialConditionGenerator.hpp"

int main()
{
    // -------------------------------------------------------------------------
    // 1) Config defaults and errors.
    // -------------------------------------------------------------------------
    {
        const SimulationConfig config(json::object());
        assert(config.modes.Nx == 33 && config.modes.Ny == 1 && config.modes.Nz == 1);
        assert(config.modes.Nn == 20 && config.modes.Nm == 1 && config.modes.Np == 1);
        assert(config.modes.Ns == 2);
        assert(config.timesteps == 200);
        assert(config.solver == Scheme::Dopri5);
        assert(config.InputParameters.is_object() && config.InputParameters.empty());

        const SimulationConfig bosh(json {{"Solver", "Bosh3"}, {"Nn", 6}});
        assert(bosh.solver == Scheme::Bosh3 && bosh.modes.Nn == 6);
        assert(bosh.toJson()["Solver"] == "Bosh3");

        bool threw = false;
        try { SimulationConfig bad(json {{"Solver", "Euler"}}); }
        catch (const std::invalid_argument&) { threw = true; }
        assert(threw);

        threw = false;
        try { SimulationConfig bad(json {{"timesteps", 1}}); }
        catch (const std::invalid_argument&) { threw = true; }
        assert(threw);

        threw = false;
        try { SimulationConfig bad(json {{"Ns", 0}}); }
        catch (const std::invalid_argument&) { threw = true; }
        assert(threw);

        threw = false;
        try { SimulationConfig::loadFromJson("does_not_exist.json"); }
        catch (const std::runtime_error&) { threw = true; }
        assert(threw);
    }

    ModeCounts modes;
    modes.Nx = 7; modes.Ny = 5; modes.Nz = 1;
    modes.Nn = 4; modes.Nm = 3; modes.Np = 2; modes.Ns = 2;
    const size_t G = modes.gridSize();

    // -------------------------------------------------------------------------
    // 2) Derived parameters.
    // -------------------------------------------------------------------------
    {
        const SimulationParameters params = InitialConditionGenerator(modes, json::object()).generate();
        assert(params.qs[0] == -1.0 && params.qs[1] == 1.0);
        assert(params.Omega_cs[0] == 1.0);
        assert(almost_equal(params.Omega_cs[1], 1.0/1836.0, 1e-15));
        assert(params.Omega_ce() == 1.0);
        for (size_t j=0; j<3; ++j)
        {
            assert(params.alpha(0, j) == 0.1);
            assert(almost_equal(params.alpha(1, j), 0.1*std::sqrt(1.0/1836.0), 1e-15));
            assert(params.drift(0, j) == 0.0 && params.drift(1, j) == 0.0);
        }
        assert(params.nu == 1.0 && params.D == 0.0);
        assert(params.t_max == 20.0 && params.ode_tolerance == 1e-8);
        assert(params.collision_matrix.size() == modes.momentsPerSpecies());

        const InitialConditionGenerator merged(modes, {{"nu", 0.3}});
        assert(merged.resolvedParameters()["nu"] == 0.3);
        assert(merged.resolvedParameters()["mi_me"] == 1836.0);

        // Scalar alpha_e and hotter ions.
        const SimulationParameters hot = InitialConditionGenerator(
            modes, {{"alpha_e", 0.2}, {"Ti_Te", 4.0}, {"mi_me", 100.0}}).generate();
        assert(hot.alpha(0, 2) == 0.2);
        assert(almost_equal(hot.alpha(1, 1), 0.2*std::sqrt(4.0/100.0), 1e-15));
        assert(almost_equal(hot.Omega_cs[1], 0.01, 1e-15));

        // Explicit alpha_s and Omega_cs win over the derived values.
        const SimulationParameters explicitSpecies = InitialConditionGenerator(
            modes, {{"alpha_s", {0.1, 0.2, 0.3, 0.01, 0.02, 0.03}}, {"Omega_cs", {2.0, 0.5}}}).generate();
        assert(explicitSpecies.alpha(0, 1) == 0.2 && explicitSpecies.alpha(1, 2) == 0.03);
        assert(explicitSpecies.Omega_ce() == 2.0 && explicitSpecies.Omega_cs[1] == 0.5);

        bool threw = false;
        try { InitialConditionGenerator(modes, {{"qs", {-1.0, 1.0, 1.0}}}).generate(); }
        catch (const std::invalid_argument&) { threw = true; }
        assert(threw);

        threw = false;
        try { InitialConditionGenerator(modes, {{"u_s", {0.0, 0.0, 0.0}}}).generate(); }
        catch (const std::invalid_argument&) { threw = true; }
        assert(threw);

        threw = false;
        try { InitialConditionGenerator(modes, {{"nu", -1.0}}).generate(); }
        catch (const std::invalid_argument&) { threw = true; }
        assert(threw);

        // Perturbed mode outside the grid.
        threw = false;
        try { InitialConditionGenerator(modes, {{"nx", 5}}).generate(); }
        catch (const std::invalid_argument&) { threw = true; }
        assert(threw);

        threw = false;
        try { InitialConditionGenerator bad(modes, json::array()); }
        catch (const std::invalid_argument&) { threw = true; }
        assert(threw);
    }

    // -------------------------------------------------------------------------
    // 3) Initial state with both species perturbed at (1, 2, 0) and a guide field.
    // -------------------------------------------------------------------------
    {
        json overrides {
            {"nx", 1}, {"ny", 2}, {"nz", 0},
            {"dn1", 0.02}, {"dn2", 0.01},
            {"B0", {0.0, 0.0, 0.5}}
        };
        const InitialConditionGenerator generator(modes, overrides);
        const std::array<long, 3> mode = generator.perturbedMode();
        assert(mode[0] == 1 && mode[1] == 2 && mode[2] == 0);

        const SimulationParameters params = generator.generate();
        const SpectralGrid& grid = params.grid;
        const size_t Nnmp = modes.momentsPerSpecies();
        const size_t zero = grid.zeroMode();
        const size_t plus = grid.modeIndex(1, 2, 0), minus = grid.modeIndex(-1, -2, 0);

        const vec_real dn {0.02, 0.01};
        for (size_t s=0; s<modes.Ns; ++s)
        {
            const real_t volume = params.alphaProduct(s);
            const complex_t* C000 = params.Ck_0.data() + (s*Nnmp)*G;
            assert(almost_equal(C000[zero] * volume, complex_t(1.0, 0.0), 1e-12));
            assert(almost_equal(C000[plus] * volume, complex_t(0.5*dn[s], 0.0), 1e-12));
            assert(almost_equal(C000[minus] * volume, complex_t(0.5*dn[s], 0.0), 1e-12));

            // Only C_000 is populated.
            for (size_t i=G; i<Nnmp*G; ++i) assert(params.Ck_0[(s*Nnmp)*G + i] == complex_t(0.0, 0.0));
        }

        // Gauss's law: i k·E = ρ / Omega_ce on every k ≠ 0.
        for (size_t i=0; i<G; ++i)
        {
            complex_t rho(0.0, 0.0);
            for (size_t s=0; s<modes.Ns; ++s)
            {
                rho += params.qs[s] * params.alphaProduct(s) * params.Ck_0[(s*Nnmp)*G + i];
            }

            complex_t divE(0.0, 0.0);
            for (size_t j=0; j<3; ++j) divE += I_unit * grid.nabla(j)[i] * params.Fk_0[j*G + i];

            if (i == zero) assert(divE == complex_t(0.0, 0.0));
            else assert(almost_equal(divE, rho / params.Omega_ce(), 1e-12));
        }
        assert(std::abs(params.Fk_0[plus]) > 0.0);

        // Uniform B0 on the zero mode only.
        assert(params.Fk_0[5*G + zero] == complex_t(0.5, 0.0));
        for (size_t i=3*G; i<6*G; ++i)
        {
            if (i != 5*G + zero) assert(params.Fk_0[i] == complex_t(0.0, 0.0));
        }

        // k_norm = |k| α_e,x / √2.
        const real_t kx = 2.0*M_PI/params.Lx, ky = 4.0*M_PI/params.Ly;
        assert(almost_equal(params.metadata["k_norm"].get<real_t>(),
                            std::sqrt(kx*kx + ky*ky) * 0.1 / std::sqrt(2.0), 1e-12));

        const json record = params.toJson();
        assert(record["dn2"] == 0.01);
        assert(record["Ck_0"]["shape"].get<std::vector<size_t>>() == (std::vector<size_t> {48, 5, 7, 1}));
    }

    // -------------------------------------------------------------------------
    // 4) Suite: sorted names, reversed order, unknown key.
    // -------------------------------------------------------------------------
    {
        const std::string path = "test_config_suite.json";
        {
            std::ofstream out(path);
            out << json {
                {"nu_1.0", {{"Nx", 9}, {"Input_Parameters", {{"nu", 1.0}}}}},
                {"nu_0.1", {{"Nx", 9}, {"Input_Parameters", {{"nu", 0.1}}}}},
                {"nu_10",  {{"Nx", 9}, {"Solver", "Bosh3"}}}
            }.dump();
        }

        const SimulationSuite suite(path);
        assert(suite.simulationNames.size() == 3);
        assert(suite.simulationNames[0] == "nu_0.1" && suite.simulationNames[2] == "nu_10");

        const SimulationSuite reversed(path, true);
        assert(reversed.simulationNames[0] == "nu_10");

        const SimulationConfig config = suite.generateSimulation("nu_0.1");
        assert(config.modes.Nx == 9);
        assert(config.InputParameters["nu"] == 0.1);
        assert(suite.generateSimulation("nu_10").solver == Scheme::Bosh3);

        bool threw = false;
        try { suite.generateSimulation("nu_100"); }
        catch (const std::out_of_range&) { threw = true; }
        assert(threw);

        std::filesystem::remove(path);

        threw = false;
        try { SimulationSuite missing(path); }
        catch (const std::filesystem::filesystem_error&) { threw = true; }
        assert(threw);
    }

    return 0;
}
