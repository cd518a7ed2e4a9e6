#include "smpsolib/core/comparator.hpp"

namespace smpsolib::core {

    int DominanceComparator::compare(const std::vector<double> &a, const std::vector<double> &b) const
    {
        if (a.size() != b.size())
            throw std::invalid_argument("cannot compare objective vectors of different sizes");

        bool aBetter = false;               // some objective of a is strictly lower
        bool bBetter = false;               // some objective of b is strictly lower

        for (std::size_t k = 0; k < a.size(); k++) {
            if (a[k] < b[k]) aBetter = true;
            else if (b[k] < a[k]) bBetter = true;

            if (aBetter && bBetter) return 0;
        }

        if (aBetter) return -1;
        if (bBetter) return 1;
        return 0;
    }

    int CrowdingDistanceComparator::compare(double scoreA, double scoreB) const
    {
        if (scoreA > scoreB) return -1;
        if (scoreA < scoreB) return 1;
        return 0;
    }

} // namespace smpsolib::core
