#pragma once

#include "smpsolib/core/data.hpp"

namespace smpsolib::core {

    // -----------------------------------------------------------------------------
    // General Utilities
    // -----------------------------------------------------------------------------
    double randomico(double min, double max, std::mt19937 &rng);
    int irandomico(int min, int max, std::mt19937 &rng);
    double get_time_in_seconds();

    // -----------------------------------------------------------------------------
    // Configuration
    // -----------------------------------------------------------------------------

    /**
     * Method: ValidateRunData
     * Description: Reject configurations that cannot drive a run (throws std::invalid_argument)
     */
    void ValidateRunData(const TRunData &runData);

    /**
     * Method: ReadParametersYaml
     * Description: Overwrite the fields of runData found under the "SMPSO" key of a YAML file
     */
    void ReadParametersYaml(const std::string &paramFile, TRunData &runData);

} // namespace smpsolib::core
