#pragma once

#include "smpsolib/core/data.hpp"
#include "smpsolib/core/iproblem.hpp"

namespace smpsolib::core {

    /**
     * Evaluates a whole swarm in place. The call blocks until every
     * particle has its objectives; the order of the swarm is preserved.
     */
    class IEvaluator {
        public:
            virtual ~IEvaluator() = default;

            virtual void evaluate(std::vector<TSol> &swarm, const IProblem &problem) const = 0;
    };

    class SequentialEvaluator : public IEvaluator {
        public:
            void evaluate(std::vector<TSol> &swarm, const IProblem &problem) const override;
    };

    // OpenMP parallel for over the particles
    class ParallelEvaluator : public IEvaluator {
        public:
            explicit ParallelEvaluator(int numThreads = 0) : numThreads_(numThreads) {}

            void evaluate(std::vector<TSol> &swarm, const IProblem &problem) const override;

        private:
            int numThreads_;                    // 0 - OpenMP default
    };

} // namespace smpsolib::core
