#pragma once

#include "smpsolib/core/common.hpp"

namespace smpsolib::core {

    //--------------------------------------------------------------------------
    // Struct: TSol
    // Description: A point of the search space together with its image in
    // objective space. Objectives are minimised.
    //--------------------------------------------------------------------------
    struct TSol
    {
        std::vector<double> vars;                      // decision variables
        std::vector<double> obj;                       // objective values

        TSol() = default;
    };

    //--------------------------------------------------------------------------
    // Struct: TBestSeen
    // Description: Personal best of one particle (decision + objective vector)
    //--------------------------------------------------------------------------
    struct TBestSeen
    {
        std::vector<double> vars;
        std::vector<double> obj;
    };

    //--------------------------------------------------------------------------
    // Struct: TRunData
    // Description: Configuration variables for the search process
    //--------------------------------------------------------------------------
    struct TRunData
    {
        int swarmSize = 100;                    // number of particles
        int maxEvaluations = 25000;             // stop condition (objective evaluations)
        int archiveSize = 100;                  // capacity of the leaders archive

        double c1Min = 1.5;                     // cognitive coefficient range
        double c1Max = 2.5;
        double c2Min = 1.5;                     // social coefficient range
        double c2Max = 2.5;

        double minWeight = 0.1;                 // inertia weight range (linear decay max -> min)
        double maxWeight = 0.1;

        double changeVelocity1 = -1.0;          // velocity factor when hitting the lower bound
        double changeVelocity2 = -1.0;          // velocity factor when hitting the upper bound

        double mutationProbability = -1.0;      // polynomial mutation probability (< 0 means 1/n)
        double distributionIndex = 20.0;        // polynomial mutation distribution index

        int parallel = 0;                       // evaluator (0 - sequential; 1 - OpenMP)
        int debug = 0;                          // define the run mode (0 - silent; 1 - print progress)
        int MAXRUNS = 1;                        // number of independent runs
        long long seed = -1;                    // RNG seed (-1 - time based)
    };

    //--------------------------------------------------------------------------
    // Enum: SwarmState
    // Description: Life cycle of the optimization loop
    //--------------------------------------------------------------------------
    enum class SwarmState
    {
        Uninitialized,
        Initialized,
        Running,
        Terminated
    };

} // namespace smpsolib::core
