#include "smpsolib/core/evaluator.hpp"

#include <exception>
#include <omp.h>

namespace smpsolib::core {

    void SequentialEvaluator::evaluate(std::vector<TSol> &swarm, const IProblem &problem) const
    {
        for (TSol &particle : swarm) {
            problem.evaluate(particle);
        }
    }

    void ParallelEvaluator::evaluate(std::vector<TSol> &swarm, const IProblem &problem) const
    {
        const int size = static_cast<int>(swarm.size());
        const int threads = (numThreads_ > 0) ? numThreads_ : omp_get_max_threads();

        // exceptions cannot leave an OpenMP region: keep the first one and rethrow after the barrier
        std::exception_ptr failure = nullptr;

        #pragma omp parallel for schedule(static) num_threads(threads)
        for (int i = 0; i < size; i++) {
            try {
                problem.evaluate(swarm[i]);
            } catch (...) {
                #pragma omp critical
                {
                    if (!failure) failure = std::current_exception();
                }
            }
        }

        if (failure) std::rethrow_exception(failure);
    }

} // namespace smpsolib::core
