#pragma once

#include "smpsolib/core/data.hpp"
#include "smpsolib/core/iproblem.hpp"

namespace smpsolib::core {

    //--------------------------------------------------------------------------
    // Struct: TSpeedLimits
    // Description: per-variable velocity bounds, deltaMax = (upper - lower) / 2
    //--------------------------------------------------------------------------
    struct TSpeedLimits
    {
        std::vector<double> deltaMax;
        std::vector<double> deltaMin;
    };

    //--------------------------------------------------------------------------
    // Struct: TVelocityTerms
    // Description: random draws and weights of one particle for one generation
    //--------------------------------------------------------------------------
    struct TVelocityTerms
    {
        double r1 = 0.0;
        double r2 = 0.0;
        double c1 = 0.0;
        double c2 = 0.0;
        double w = 0.0;
    };

    TSpeedLimits ComputeSpeedLimits(const IProblem &problem);

    /**
     * Method: ConstrictionCoefficient
     * Description: Clerc-Kennedy constriction of the acceleration coefficients.
     * 1.0 when c1 + c2 <= 4, otherwise 2 / (2 - rho - sqrt(rho^2 - 4 rho)).
     */
    double ConstrictionCoefficient(double c1, double c2);

    /**
     * Method: VelocityConstriction
     * Description: clamp a raw velocity into [deltaMin, deltaMax]
     */
    double VelocityConstriction(double value, double deltaMax, double deltaMin);

    /**
     * Method: InertiaWeight
     * Description: linear decay from maxWeight (no evaluations) to minWeight (maxEvaluations)
     */
    double InertiaWeight(int evaluations, int maxEvaluations, double minWeight, double maxWeight);

    /**
     * Method: ComputeVelocity
     * Description: constricted and clamped velocity update of one particle, in place
     */
    void ComputeVelocity(std::vector<double> &speed,
                         const std::vector<double> &position,
                         const std::vector<double> &localBest,
                         const std::vector<double> &globalBest,
                         const TVelocityTerms &terms,
                         const TSpeedLimits &limits);

} // namespace smpsolib::core
