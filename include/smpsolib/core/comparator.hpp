#pragma once

#include "smpsolib/core/data.hpp"

namespace smpsolib::core {

    /**
     * @brief Pareto dominance test over objective vectors (minimisation)
     *
     * compare(a, b) returns -1 when a dominates b, 1 when b dominates a and
     * 0 when neither dominates the other (identical vectors included).
     */
    class DominanceComparator {
    public:
        int compare(const std::vector<double> &a, const std::vector<double> &b) const;

        int compare(const TSol &a, const TSol &b) const { return compare(a.obj, b.obj); }
    };

    /**
     * @brief Orders two crowding scores: the less crowded (larger score) wins
     *
     * Returns -1 when scoreA is preferred, 1 when scoreB is preferred, 0 on ties.
     */
    class CrowdingDistanceComparator {
    public:
        int compare(double scoreA, double scoreB) const;
    };

} // namespace smpsolib::core
