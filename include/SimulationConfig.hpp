#pragma once
/**
 * @file SimulationConfig.hpp
 * @brief Lightweight data structures for loading and organizing simulation parameters.
 *
 * @details
 * - **SimulationConfig**: container that initializes itself from a JSON object
 *   (or file) and exposes the run-level settings of the solver stack
 *   (mode counts, output sampling, integrator choice) together with the
 *   physical `Input_Parameters` handed to the InitialConditionGenerator.
 * - **SimulationSuite**: helper to manage a multi-run input dictionary
 *   (parameter sweeps) and derive the ordered list of runs.
 */

#include "common.hpp"
#include "SpectralGrid.hpp"

/**
 * @struct SimulationConfig
 * @brief Single-simulation configuration.
 *
 * @section fields Key Fields
 * - `Nx, Ny, Nz`      : Fourier modes per spatial axis.
 * - `Nn, Nm, Np`      : Hermite modes per velocity axis.
 * - `Ns`              : Number of species.
 * - `timesteps`       : Number of output samples on [0, t_max].
 * - `dt`              : First trial step of the adaptive integrator.
 * - `Solver`          : "Dopri5" or "Bosh3".
 * - `MaxSteps`        : Upper bound on internal integrator steps.
 * - `Verbose`         : Print per-sample progress.
 * - `InputParameters` : Physical overrides merged over the initializer defaults.
 */
struct SimulationConfig
{
    ModeCounts modes;
    size_t timesteps {200};
    real_t dt {0.01};
    Scheme solver {Scheme::Dopri5};
    size_t MaxSteps {1000000};
    bool   Verbose {false};
    json   InputParameters = json::object();

    SimulationConfig() = default;

    /**
     * @brief Construct from a JSON object. Absent keys keep their defaults.
     *
     * Expected layout:
     * ```
     * {
     *   "Nx": 33, "Ny": 1, "Nz": 1, "Nn": 20, "Nm": 1, "Np": 1, "Ns": 2,
     *   "timesteps": 200, "dt": 0.01, "Solver": "Dopri5",
     *   "MaxSteps": 1000000, "Verbose": false,
     *   "Input_Parameters": { "nu": 1.0, "t_max": 20, ... }
     * }
     * ```
     * @throws std::invalid_argument for an unknown solver or timesteps < 2.
     */
    SimulationConfig(const json& simConfigIn)
    {
        modes.Nx = simConfigIn.value("Nx", modes.Nx);
        modes.Ny = simConfigIn.value("Ny", modes.Ny);
        modes.Nz = simConfigIn.value("Nz", modes.Nz);
        modes.Nn = simConfigIn.value("Nn", modes.Nn);
        modes.Nm = simConfigIn.value("Nm", modes.Nm);
        modes.Np = simConfigIn.value("Np", modes.Np);
        modes.Ns = simConfigIn.value("Ns", modes.Ns);

        timesteps = simConfigIn.value("timesteps", timesteps);
        dt = simConfigIn.value("dt", dt);
        solver = scheme_from_string(simConfigIn.value("Solver", std::string("Dopri5")));
        MaxSteps = simConfigIn.value("MaxSteps", MaxSteps);
        Verbose = simConfigIn.value("Verbose", Verbose);

        if (simConfigIn.contains("Input_Parameters") && !simConfigIn["Input_Parameters"].is_null())
        {
            InputParameters = simConfigIn["Input_Parameters"];
        }

        modes.validate();
        if (timesteps < 2)
        {
            throw std::invalid_argument("timesteps must be at least 2!");
        }
    }

    /**
     * @brief Load configuration from a JSON file.
     * @throws std::runtime_error if file cannot be opened.
     */
    static SimulationConfig loadFromJson(const std::string& filename)
    {
        std::ifstream inFile(filename);
        if (!inFile)
        {
            throw std::runtime_error("Could not open config file: " + filename);
        }

        json j;
        inFile >> j;

        return SimulationConfig(j);
    }

    /// JSON view of the run-level settings (used in the output record).
    json toJson() const
    {
        return json {
            {"Nx", modes.Nx}, {"Ny", modes.Ny}, {"Nz", modes.Nz},
            {"Nn", modes.Nn}, {"Nm", modes.Nm}, {"Np", modes.Np}, {"Ns", modes.Ns},
            {"timesteps", timesteps}, {"dt", dt}, {"Solver", scheme_to_string(solver)},
            {"MaxSteps", MaxSteps}, {"Verbose", Verbose},
            {"Input_Parameters", InputParameters}
        };
    }

    /// Print a human-readable configuration summary to stdout.
    void print_config() const
    {
        std::cout << "Simulation configuration:" << std::endl;
        std::cout << "Nx, Ny, Nz: " << modes.Nx << ", " << modes.Ny << ", " << modes.Nz << std::endl;
        std::cout << "Nn, Nm, Np: " << modes.Nn << ", " << modes.Nm << ", " << modes.Np << std::endl;
        std::cout << "Ns: " << modes.Ns << std::endl;
        std::cout << "timesteps: " << timesteps << std::endl;
        std::cout << "dt: " << dt << std::endl;
        std::cout << "Solver: " << scheme_to_string(solver) << std::endl;
        std::cout << "MaxSteps: " << MaxSteps << std::endl;
        std::cout << "Verbose: " << Verbose << std::endl;
        std::cout << "Input_Parameters: " << InputParameters.dump() << std::endl;
    }
};

/**
 * @struct SimulationSuite
 * @brief Manage a set of simulations keyed by run name (parameter sweeps).
 *
 * @details
 * - Loads a dictionary of simulations from file (JSON with top-level keys = run names).
 * - Builds the ordered list `simulationNames` (lexicographic, or reversed).
 * - Provides `generateSimulation(name)` to instantiate a `SimulationConfig` for a key.
 *
 * Typical JSON format:
 * ```
 * {
 *   "nu_0.1": { ... single SimulationConfig JSON ... },
 *   "nu_1.0": { ... },
 *   ...
 * }
 * ```
 */
struct SimulationSuite
{
    json multiInputDict;                      ///< Entire multi-simulation JSON dictionary.
    std::vector<std::string> simulationNames; ///< Ordered list of run keys.

    /**
     * @brief Construct from file path.
     * @param filePath Path to the multi-simulation JSON file.
     * @param reversed If true, descending order of run names.
     *
     * @throws std::filesystem::filesystem_error if file not found.
     * @throws std::invalid_argument if the top level is not a JSON object.
     */
    SimulationSuite(const std::string& filePath, bool reversed=false)
    {
        if (!std::filesystem::exists(filePath))
        {
            throw std::filesystem::filesystem_error("File does not exist!", filePath, std::make_error_code(std::errc::no_such_file_or_directory));
        }

        std::ifstream inputFile(filePath);
        inputFile >> multiInputDict;

        if (!multiInputDict.is_object())
        {
            throw std::invalid_argument("Simulation suite '" + filePath + "' must be a JSON object of runs!");
        }

        for (const auto& run : multiInputDict.items())
        {
            simulationNames.push_back(run.key());
        }

        if (reversed)
        {
            std::sort(simulationNames.begin(), simulationNames.end(), [](auto& a, auto& b){return a>b;});
        }
        else
        {
            std::sort(simulationNames.begin(), simulationNames.end());
        }
    }

    /**
     * @brief Create a SimulationConfig for a given run key.
     * @throws std::out_of_range if key does not exist.
     */
    SimulationConfig generateSimulation(const std::string& name) const
    {
        if (multiInputDict.contains(name))
        {
            return SimulationConfig(multiInputDict.at(name));
        }
        else
        {
            throw std::out_of_range("Simulation key '" + name + "' not found in input dictionary.");
        }
    }
};
