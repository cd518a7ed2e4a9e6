#include "smpsolib/core/position.hpp"

namespace smpsolib::core {

    void UpdatePosition(TSol &particle, std::vector<double> &speed, const IProblem &problem,
                        double changeVelocity1, double changeVelocity2)
    {
        for (int j = 0; j < problem.getNumberOfVariables(); j++) {
            particle.vars[j] += speed[j];

            if (particle.vars[j] < problem.getLowerBound(j)) {
                particle.vars[j] = problem.getLowerBound(j);
                speed[j] *= changeVelocity1;
            }

            if (particle.vars[j] > problem.getUpperBound(j)) {
                particle.vars[j] = problem.getUpperBound(j);
                speed[j] *= changeVelocity2;
            }
        }
    }

} // namespace smpsolib::core
