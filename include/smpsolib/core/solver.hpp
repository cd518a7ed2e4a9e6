/**
 * SMPSO Library - Solver Interface
 * Command line driver: configuration, independent runs and result output
 */

#pragma once

#include "smpsolib/core/data.hpp"
#include "smpsolib/core/iproblem.hpp"

namespace smpsolib {

    //--------------------------------------------------------------------------
    // Struct: TRunStats
    // Description: outcome of one independent run
    //--------------------------------------------------------------------------
    struct TRunStats
    {
        unsigned int seed = 0;
        int evaluations = 0;
        std::size_t frontSize = 0;
        double time = 0.0;
    };

    /**
    * @brief Main solver class - orchestrates the optimization process
    */
    class SMPSOSolver {
    public:
        // -------------------------------------------------------------------------
        // PUBLIC INTERFACE
        // -------------------------------------------------------------------------

        // 0 - ready to run; > 0 - help printed; < 0 - error
        int init(int argc, char* argv[]);
        void run();

        // -------------------------------------------------------------------------
        // ACCESSORS
        // -------------------------------------------------------------------------
        const core::TRunData& getRunData() const { return runData_; }
        const std::vector<core::TSol>& getFront() const { return front_; }
        const std::vector<TRunStats>& getStatistics() const { return stats_; }

    private:
        void loadConfiguration();
        void displayResults() const;

        // -------------------------------------------------------------------------
        // MEMBER VARIABLES
        // -------------------------------------------------------------------------
        std::string problemName_;
        int numberOfVariables_ = 0;
        std::string configPath_;
        std::string outputPrefix_;
        core::TRunData runData_;
        std::shared_ptr<core::IProblem> problemInstance_;

        std::vector<core::TSol> front_;
        std::vector<TRunStats> stats_;
    };

} // namespace smpsolib
