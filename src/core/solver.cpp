#include "smpsolib/core/solver.hpp"
#include "smpsolib/core/method.hpp"
#include "smpsolib/core/mutation.hpp"
#include "smpsolib/core/evaluator.hpp"
#include "smpsolib/core/observer.hpp"
#include "smpsolib/mh/smpso.hpp"
#include "smpsolib/utils/io.hpp"

// CLI11
#include <CLI/CLI.hpp>

namespace smpsolib {

    int SMPSOSolver::init(int argc, char* argv[]) {
        CLI::App app{"SMPSO Library - Multi-objective Particle Swarm Optimizer"};

        int maxEvaluations = 0;
        long long seed = -1;
        int runs = 0;
        bool parallel = false;
        bool debug = false;

        app.add_option("-p,--problem", problemName_, "Problem (BiConvex, ZDT1, ZDT2, ZDT3, Kursawe)")->required();
        app.add_option("-n,--variables", numberOfVariables_, "Number of decision variables (0: problem default)");
        app.add_option("-c,--config", configPath_, "Path to YAML configuration file")->check(CLI::ExistingFile);
        app.add_option("-e,--evaluations", maxEvaluations, "Max objective evaluations");
        app.add_option("-s,--seed", seed, "RNG Seed (default: random)");
        app.add_option("-r,--runs", runs, "Number of independent runs");
        app.add_option("-o,--output", outputPrefix_, "Prefix of the FUN/VAR output files");
        app.add_flag("--parallel", parallel, "Evaluate the swarm with OpenMP");
        app.add_flag("--debug", debug, "Print progress");

        try {
            app.parse(argc, argv);
        } catch (const CLI::ParseError &e) {
            // help and version requests exit with code 0
            return (app.exit(e) == 0) ? 1 : -1;
        }

        try {
            loadConfiguration();

            // command line overrides the configuration file
            if (app.count("--evaluations")) runData_.maxEvaluations = maxEvaluations;
            if (app.count("--seed"))        runData_.seed = seed;
            if (app.count("--runs"))        runData_.MAXRUNS = runs;
            if (parallel)                   runData_.parallel = 1;
            if (debug)                      runData_.debug = 1;

            core::ValidateRunData(runData_);
            problemInstance_ = core::createProblem(problemName_, numberOfVariables_);
            return 0;
        } catch (const std::exception &e) {
            std::cerr << "Initialization Error: " << e.what() << std::endl;
            return -1;
        }
    }

    void SMPSOSolver::loadConfiguration() {
        if (configPath_.empty()) return;
        core::ReadParametersYaml(configPath_, runData_);
    }

    void SMPSOSolver::run() {
        if (!problemInstance_)
            throw std::logic_error("SMPSOSolver::run called before a successful init");

        stats_.clear();
        std::cout << "Problem: " << problemInstance_->getName() << "\nRuns: ";

        // Base seed global
        unsigned int GLOBAL_SEED = (runData_.seed < 0)
            ? static_cast<unsigned int>(std::chrono::steady_clock::now().time_since_epoch().count())
            : static_cast<unsigned int>(runData_.seed);

        auto mutation = std::make_shared<core::PolynomialMutation>(runData_.mutationProbability,
                                                                   runData_.distributionIndex);

        std::shared_ptr<core::IEvaluator> evaluator;
        if (runData_.parallel) evaluator = std::make_shared<core::ParallelEvaluator>();
        else evaluator = std::make_shared<core::SequentialEvaluator>();

        for (int run = 0; run < runData_.MAXRUNS; run++)
        {
            std::cout << (run + 1) << " " << std::flush;

            core::TRunData runData = runData_;
            runData.seed = GLOBAL_SEED + run;

            mh::SMPSO algorithm(problemInstance_, runData, mutation, evaluator);
            if (runData.debug) {
                algorithm.addObserver(std::make_shared<core::ProgressObserver>(
                    std::max(runData.maxEvaluations / 10, runData.swarmSize)));
            }

            double start_time = core::get_time_in_seconds();
            algorithm.run();
            double end_time = core::get_time_in_seconds();

            TRunStats stats;
            stats.seed = static_cast<unsigned int>(runData.seed);
            stats.evaluations = algorithm.getEvaluations();
            stats.frontSize = algorithm.getLeaders().size();
            stats.time = end_time - start_time;
            stats_.push_back(stats);

            front_ = algorithm.getResult();
        }

        displayResults();

        if (!outputPrefix_.empty()) {
            utils::WriteFunctionValues(outputPrefix_ + "FUN.tsv", front_);
            utils::WriteVariables(outputPrefix_ + "VAR.tsv", front_);
        }
    }

    void SMPSOSolver::displayResults() const {
        double timeTotal = 0.0;
        double frontAverage = 0.0;
        for (const TRunStats &stats : stats_) {
            timeTotal += stats.time;
            frontAverage += static_cast<double>(stats.frontSize);
        }
        if (!stats_.empty()) {
            timeTotal /= stats_.size();
            frontAverage /= stats_.size();
        }

        std::cout << "\n\n=== FINAL RESULT ===\n";
        std::cout << "Evaluations per run: " << (stats_.empty() ? 0 : stats_.back().evaluations) << "\n";
        std::cout << "Average front size: " << frontAverage << "\n";
        std::cout << "Average time: " << std::fixed << std::setprecision(3) << timeTotal << "s\n";

        if (runData_.debug) {
            utils::WriteFrontScreen(problemInstance_->getName(), front_);
        }
    }

} // namespace smpsolib
