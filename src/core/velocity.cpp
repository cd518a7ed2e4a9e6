#include "smpsolib/core/velocity.hpp"

namespace smpsolib::core {

    TSpeedLimits ComputeSpeedLimits(const IProblem &problem)
    {
        const int n = problem.getNumberOfVariables();

        TSpeedLimits limits;
        limits.deltaMax.resize(n);
        limits.deltaMin.resize(n);

        for (int j = 0; j < n; j++) {
            limits.deltaMax[j] = (problem.getUpperBound(j) - problem.getLowerBound(j)) / 2.0;
            limits.deltaMin[j] = -limits.deltaMax[j];
        }
        return limits;
    }

    double ConstrictionCoefficient(double c1, double c2)
    {
        const double rho = c1 + c2;
        if (rho <= 4.0) return 1.0;

        // rho > 4 keeps rho^2 - 4 rho strictly positive
        return 2.0 / (2.0 - rho - std::sqrt(std::pow(rho, 2.0) - 4.0 * rho));
    }

    double VelocityConstriction(double value, double deltaMax, double deltaMin)
    {
        if (value > deltaMax) return deltaMax;
        if (value < deltaMin) return deltaMin;
        return value;
    }

    double InertiaWeight(int evaluations, int maxEvaluations, double minWeight, double maxWeight)
    {
        if (maxEvaluations <= 0) return maxWeight;

        double progress = static_cast<double>(evaluations) / maxEvaluations;
        progress = std::clamp(progress, 0.0, 1.0);

        return maxWeight - (maxWeight - minWeight) * progress;
    }

    void ComputeVelocity(std::vector<double> &speed,
                         const std::vector<double> &position,
                         const std::vector<double> &localBest,
                         const std::vector<double> &globalBest,
                         const TVelocityTerms &terms,
                         const TSpeedLimits &limits)
    {
        const double chi = ConstrictionCoefficient(terms.c1, terms.c2);

        for (std::size_t var = 0; var < speed.size(); var++) {
            double raw = chi * (terms.w * speed[var] +
                                terms.c1 * terms.r1 * (localBest[var] - position[var]) +
                                terms.c2 * terms.r2 * (globalBest[var] - position[var]));

            speed[var] = VelocityConstriction(raw, limits.deltaMax[var], limits.deltaMin[var]);
        }
    }

} // namespace smpsolib::core
