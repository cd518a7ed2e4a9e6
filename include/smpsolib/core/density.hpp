#pragma once

#include "smpsolib/core/data.hpp"

namespace smpsolib::core {

    /**
     * Method: CrowdingDistance
     * Description: Density estimator of a solution set in objective space.
     * Returns one score per solution (same order as the input); extreme
     * solutions of every objective receive +infinity, interior solutions the
     * sum over objectives of the normalised side length of their cuboid.
     * Larger score means sparser region.
     */
    std::vector<double> CrowdingDistance(const std::vector<TSol> &set);

} // namespace smpsolib::core
