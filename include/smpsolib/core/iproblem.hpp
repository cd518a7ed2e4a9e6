#pragma once
#include "smpsolib/core/data.hpp"

namespace smpsolib::core {

    // Abstract interface of a box-constrained continuous multi-objective problem
    class IProblem {
        public:
            virtual ~IProblem() = default;

            virtual std::string getName() const = 0;

            virtual int getNumberOfVariables() const = 0;

            virtual int getNumberOfObjectives() const = 0;

            virtual double getLowerBound(int index) const = 0;

            virtual double getUpperBound(int index) const = 0;

            /**
             * Method: createSolution
             * Description: random point drawn uniformly inside the bounds, objectives sized but unset
             */
            virtual TSol createSolution(std::mt19937 &rng) const;

            /**
             * Method: evaluate
             * Description: fill s.obj in place. Must be safe to call concurrently on distinct solutions.
             */
            virtual void evaluate(TSol &s) const = 0;
        };

    /**
     * Method: ValidateBounds
     * Description: throw std::invalid_argument when the problem has no variables,
     * no objectives, or an inverted bound pair
     */
    void ValidateBounds(const IProblem &problem);

    // Fábrica de problemas registrados por nome (ZDT1, ZDT2, ZDT3, Kursawe, BiConvex)
    std::shared_ptr<IProblem> createProblem(const std::string &name, int numberOfVariables = 0);

}
