/**
 * SMPSO Library - Leaders archive
 * Capacity bounded set of mutually non-dominated solutions
 */

#pragma once

#include "smpsolib/core/data.hpp"
#include "smpsolib/core/comparator.hpp"

namespace smpsolib::core {

    /**
    * @brief Bounded archive of non-dominated solutions pruned by crowding distance
    *
    * Members are independent copies of the solutions handed to add(). The
    * crowding score of every member is kept in a vector parallel to the
    * members and recomputed whenever membership changes.
    */
    class BoundedArchive {
    public:
        explicit BoundedArchive(int capacity);

        // -------------------------------------------------------------------------
        // MUTATION
        // -------------------------------------------------------------------------

        /**
         * Copies s into the archive unless a member dominates it or has the same
         * objective vector. Members dominated by s are removed; when the capacity
         * is exceeded the most crowded member is evicted (first one on ties).
         * Returns true when s is a member after the call.
         */
        bool add(const TSol &s);

        void computeDensityEstimator();

        // -------------------------------------------------------------------------
        // SELECTION
        // -------------------------------------------------------------------------

        /**
         * Two distinct member indices drawn uniformly without replacement.
         * With a single member the same index is returned twice.
         */
        std::pair<std::size_t, std::size_t> selectTwoForTournament(std::mt19937 &rng) const;

        // crowding comparison of members i and j (-1: i less crowded)
        int compare(std::size_t i, std::size_t j) const;

        // -------------------------------------------------------------------------
        // ACCESSORS
        // -------------------------------------------------------------------------
        const std::vector<TSol>& members() const { return members_; }
        const TSol& member(std::size_t i) const { return members_.at(i); }
        double density(std::size_t i) const { return density_.at(i); }
        std::size_t size() const { return members_.size(); }
        bool empty() const { return members_.empty(); }
        int capacity() const { return capacity_; }

    private:
        int capacity_;
        std::vector<TSol> members_;
        std::vector<double> density_;

        DominanceComparator dominance_;
        CrowdingDistanceComparator crowding_;
    };

    /**
     * Method: SelectGlobalBest
     * Description: binary tournament between two distinct leaders, the less
     * crowded one wins (the first drawn on equal scores)
     */
    const TSol& SelectGlobalBest(const BoundedArchive &leaders, std::mt19937 &rng);

} // namespace smpsolib::core
