#pragma once

#include "smpsolib/core/data.hpp"
#include "smpsolib/core/iproblem.hpp"

namespace smpsolib::core {

    /**
     * Method: UpdatePosition
     * Description: x[j] += speed[j]; a variable leaving its box is put back on the
     * violated bound and its velocity multiplied by changeVelocity1 (lower bound)
     * or changeVelocity2 (upper bound).
     */
    void UpdatePosition(TSol &particle, std::vector<double> &speed, const IProblem &problem,
                        double changeVelocity1, double changeVelocity2);

} // namespace smpsolib::core
