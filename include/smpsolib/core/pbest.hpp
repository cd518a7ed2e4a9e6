#pragma once

#include "smpsolib/core/data.hpp"
#include "smpsolib/core/comparator.hpp"

namespace smpsolib::core {

    /**
    * @brief Memory of the best point visited by each particle
    *
    * The stored record is replaced unless it dominates the current particle,
    * so mutually non-dominated positions move the personal best forward.
    */
    class PersonalBestTracker {
    public:
        void initialize(const std::vector<TSol> &swarm);

        // returns true when bestSeen(i) was replaced by current
        bool update(std::size_t i, const TSol &current);

        void update(const std::vector<TSol> &swarm);

        const TBestSeen& bestSeen(std::size_t i) const { return bestSeen_.at(i); }
        std::size_t size() const { return bestSeen_.size(); }

    private:
        std::vector<TBestSeen> bestSeen_;
        DominanceComparator dominance_;
    };

} // namespace smpsolib::core
