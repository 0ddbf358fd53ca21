//==============================================================================
// main.cpp
// Entry point for running Hermite–Fourier Vlasov–Maxwell simulations.
// Modes:
//   - Single run (default) over one JSON config.
//   - Multiple run (parameter sweep over the runs inside a suite JSON).
//   - Benchmark mode (repeat one run and write a timing summary).
//
// Parallel backends (compile-time):
//   USE_MPI     : pure MPI (suite runs distributed round-robin over ranks)
//   USE_OPENMP  : shared-memory threading inside each RHS evaluation
//   USE_HYBRID  : MPI + OpenMP (MPI_Init_thread with FUNNELED)
//==============================================================================

#include "common.hpp"
#include "SimulationConfig.hpp"
#include "Simulation.hpp"
#include "Diagnostics.hpp"
#include "OutputWriter.hpp"

namespace
{
    //--------------------------------------------------------------------------
    // Run one configuration and assemble its output record. Diagnostics are
    // merged under their own keys; the electron phase space of the last
    // sample is written next to the record on request.
    //--------------------------------------------------------------------------
    json runSimulation(const SimulationConfig& config, bool withDiagnostics,
                       const std::filesystem::path& phaseSpacePath, real_t* wallTime = nullptr)
    {
        Simulation simulation(config);
        SimulationResult result = simulation.run();

        json record = simulation.toJson(result);
        if (withDiagnostics)
        {
            json diag = diagnostics::evaluate(simulation.parameters(), result);
            record.update(diag);
        }

        if (!phaseSpacePath.empty())
        {
            const SimulationParameters& params = simulation.parameters();
            const real_t a = params.alpha(0, 0);
            const vec_real vx = linspace(params.drift(0, 0) - 4.0*a, params.drift(0, 0) + 4.0*a, 201);
            OutputWriter::writeMatrix(phaseSpacePath.string(),
                                      diagnostics::reconstruct_distribution(params, result,
                                                                            result.samples()-1, 0, vx));
        }

        if (wallTime != nullptr) *wallTime = result.wallTime;
        return record;
    }

    std::string backendName()
    {
        #if defined(USE_MPI)
        return "MPI";
        #elif defined(USE_HYBRID)
        return "Hybrid";
        #elif defined(USE_OPENMP)
        return "OpenMP";
        #else
        return "Serial";
        #endif
    }
}

int main(int argc, char* argv[])
{
    //--------------------------------------------------------------------------
    // CLI flags (defaults)
    //   -s/--single-run        : run a single simulation (default)
    //   -m/--multiple-run      : run a sweep over the runs of a suite file
    //   -i/--input-path <path> : JSON input (single or suite)
    //   -o/--output-path <path>: result file (single run; default <input>_output.json)
    //   -r/--reversed-order    : traverse suite runs in reverse
    //   -b/--benchmark         : enable benchmark mode
    //   --benchmark-repetitions <n> : repetitions for benchmark (default 3)
    //   --no-diagnostics       : skip energy/fluctuation diagnostics
    //   --phase-space          : also write f_e(x, v_x) at t_max as CSV
    //--------------------------------------------------------------------------
    bool singleRun = true;
    bool reversed = false;
    bool benchmark = false;
    bool withDiagnostics = true;
    bool phaseSpace = false;
    int  benchmark_repetitions = 3;
    std::string inputPath{"data/landau_damping.json"};
    std::string outputPath;

    // Parse CLI args (very lightweight; no error if unknown flag)
    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];

        if (arg == "--single-run" || arg == "-s")
        {
            singleRun = true;
        }
        else if (arg == "--multiple-run" || arg == "-m")
        {
            singleRun = false;
        }
        else if (arg == "--input-path" || arg == "-i")
        {
            if (i+1 < argc) { inputPath = std::string(argv[++i]); }
        }
        else if (arg == "--output-path" || arg == "-o")
        {
            if (i+1 < argc) { outputPath = std::string(argv[++i]); }
        }
        else if (arg == "--reversed-order" || arg == "-r")
        {
            reversed = true;
        }
        else if (arg == "--benchmark" || arg == "-b")
        {
            benchmark = true;
        }
        else if (arg == "--benchmark-repetitions")
        {
            benchmark = true;
            if (i+1 < argc) { benchmark_repetitions = std::stoi(argv[++i]); }
        }
        else if (arg == "--no-diagnostics")
        {
            withDiagnostics = false;
        }
        else if (arg == "--phase-space")
        {
            phaseSpace = true;
        }
    }

    //--------------------------------------------------------------------------
    // Derive data directory from input file (absolute path, parent folder).
    // Used to store outputs next to the input.
    //--------------------------------------------------------------------------
    std::filesystem::path dataPath(inputPath);
    dataPath = std::filesystem::absolute(dataPath);
    const std::string inputStem = dataPath.stem().string();
    dataPath = dataPath.parent_path();

    //--------------------------------------------------------------------------
    // Initialize parallel runtime depending on backend.
    //--------------------------------------------------------------------------
    #if defined(USE_MPI)
    MPI_Init(&argc, &argv);
    #elif defined(USE_HYBRID)
    int required = MPI_THREAD_FUNNELED;
    int provided = -1;
    MPI_Init_thread(&argc, &argv, required, &provided);
    if (provided < required)
    {
        int rank;
        MPI_Comm_rank(MPI_COMM_WORLD, &rank);
        if (rank == 0) std::cout << "Not enough thread support!" << std::endl;
        MPI_Abort(MPI_COMM_WORLD, EXIT_FAILURE);
    }
    #endif

    // Rank/size setup; serial uses rank=0, size=1 for uniform logging
    #if defined(USE_MPI) || defined(USE_HYBRID)
    int rank, size;
    MPI_Comm_size(MPI_COMM_WORLD, &size);
    MPI_Comm_rank(MPI_COMM_WORLD, &rank);
    #else
    int rank = 0;
    int size = 1;
    #endif

    try
    {
        if (!std::filesystem::exists(inputPath))
        {
            throw std::invalid_argument("Invalid simulation input path: " + inputPath);
        }

        //======================================================================
        // BENCHMARK MODE
        // Repeat one run and collect wall times and step counts into a JSON
        // file whose name encodes the backend and resources.
        //======================================================================
        if (benchmark)
        {
            json benchmark_results;
            SimulationConfig config = SimulationConfig::loadFromJson(inputPath);
            config.Verbose = false;

            benchmark_results["Config"] = config.toJson();
            benchmark_results["Repetitions"] = benchmark_repetitions;
            benchmark_results["Kind"] = backendName();
            benchmark_results["Cores"] = size;
            #if defined(USE_OPENMP) || defined(USE_HYBRID)
            benchmark_results["Threads"] = omp_get_max_threads();
            #endif

            auto benchmarkOutputPath = dataPath / ("benchmark_" + inputStem + "_" + backendName() + ".json");

            if (rank == 0) { std::cout << "Starting benchmark run for " << inputStem << ".\n\n"; }

            for (int i=0; i<benchmark_repetitions; ++i)
            {
                if (rank == 0)
                    std::cout << "Repetition " << i+1 << "/" << benchmark_repetitions << "\n\n";

                real_t wallTime = 0.0;
                json record = runSimulation(config, false, {}, &wallTime);
                benchmark_results[std::to_string(i)] = {
                    {"wall_time", wallTime},
                    {"solver_statistics", record["solver_statistics"]}
                };
            }

            if (rank == 0)
            {
                std::cout << "Benchmark result stored in file: " << benchmarkOutputPath << "\n\n";
                OutputWriter::writeJsonToFile(benchmarkOutputPath.string(), benchmark_results, 2);
            }
        }
        //======================================================================
        // SINGLE RUN
        // Load one SimulationConfig, integrate, write the record.
        //======================================================================
        else if (singleRun)
        {
            SimulationConfig config = SimulationConfig::loadFromJson(inputPath);
            if (rank != 0) config.Verbose = false;

            if (outputPath.empty())
            {
                outputPath = (dataPath / (inputStem + "_output.json")).string();
            }

            if (rank == 0)
            {
                std::cout << "Starting single run for " << inputStem << ".\n\n";
                if (config.Verbose) config.print_config();
            }

            std::filesystem::path phasePath;
            if (phaseSpace && rank == 0) phasePath = dataPath / (inputStem + "_phase_space.csv");

            json result = runSimulation(config, withDiagnostics, phasePath);

            if (rank == 0)
            {
                std::cout << "Result stored in file: " << outputPath << "\n\n";
                OutputWriter::writeJsonToFile(outputPath, result);
            }
        }
        //======================================================================
        // MULTIPLE RUN (SUITE)
        // Runs are independent; run i is executed by rank i % size and each
        // record is written to <data>/<run>_output.json by its rank.
        //======================================================================
        else
        {
            SimulationSuite configSuite(inputPath, reversed);
            const size_t nRuns = configSuite.simulationNames.size();

            if (rank == 0)
                std::cout << "Starting multi run for " << nRuns << " simulations on "
                          << size << " rank(s).\n\n";

            for (size_t i=static_cast<size_t>(rank); i<nRuns; i+=static_cast<size_t>(size))
            {
                const std::string& name = configSuite.simulationNames[i];
                SimulationConfig config = configSuite.generateSimulation(name);

                std::cout << "Rank " << rank << ": simulation " << i+1 << "/" << nRuns
                          << " (" << name << ")\n";

                std::filesystem::path phasePath;
                if (phaseSpace) phasePath = dataPath / (name + "_phase_space.csv");

                json result = runSimulation(config, withDiagnostics, phasePath);

                auto runOutputPath = dataPath / (name + "_output.json");
                std::cout << "Rank " << rank << ": result stored in file: " << runOutputPath << "\n\n";
                OutputWriter::writeJsonToFile(runOutputPath.string(), result);
            }

            #if defined(USE_MPI) || defined(USE_HYBRID)
            MPI_Barrier(MPI_COMM_WORLD);
            #endif
        }

        //--------------------------------------------------------------------------
        // Normal termination & finalize MPI if needed.
        //--------------------------------------------------------------------------
        if (rank == 0) { std::cout << "Simulation finished successfully.\n\n"; }

        #if defined(USE_MPI) || defined(USE_HYBRID)
        MPI_Finalize();
        #endif

        return 0;
    }
    catch (const std::exception& e)
    {
        // Root-cause visibility; in MPI paths, abort all ranks.
        std::cerr << "Rank " << rank << " caught exception: " << e.what() << std::endl;

        #if defined(USE_MPI) || defined(USE_HYBRID)
        MPI_Abort(MPI_COMM_WORLD, EXIT_FAILURE);
        #endif

        return 1;
    }
}
