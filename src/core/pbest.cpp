#include "smpsolib/core/pbest.hpp"

namespace smpsolib::core {

    void PersonalBestTracker::initialize(const std::vector<TSol> &swarm)
    {
        bestSeen_.clear();
        bestSeen_.reserve(swarm.size());

        for (const TSol &particle : swarm) {
            bestSeen_.push_back(TBestSeen{particle.vars, particle.obj});
        }
    }

    bool PersonalBestTracker::update(std::size_t i, const TSol &current)
    {
        TBestSeen &best = bestSeen_.at(i);

        if (dominance_.compare(current.obj, best.obj) == 1) return false;

        best.vars = current.vars;
        best.obj = current.obj;
        return true;
    }

    void PersonalBestTracker::update(const std::vector<TSol> &swarm)
    {
        if (swarm.size() != bestSeen_.size())
            throw std::logic_error("swarm size differs from the number of tracked personal bests");

        for (std::size_t i = 0; i < swarm.size(); i++) {
            update(i, swarm[i]);
        }
    }

} // namespace smpsolib::core
