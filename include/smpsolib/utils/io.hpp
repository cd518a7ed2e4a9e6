#pragma once

#include "smpsolib/core/data.hpp"

namespace smpsolib::utils {

    /**
     * Outputs the objective vectors of the front to the screen.
     */
    void WriteFrontScreen(const std::string &problemName, const std::vector<core::TSol> &front,
                          std::ostream &out = std::cout);

    /**
     * Outputs one objective vector per line (tab separated) in a text file.
     */
    void WriteFunctionValues(const std::string &fileName, const std::vector<core::TSol> &front);

    /**
     * Outputs one decision vector per line (tab separated) in a text file.
     */
    void WriteVariables(const std::string &fileName, const std::vector<core::TSol> &front);

} // namespace smpsolib::utils
