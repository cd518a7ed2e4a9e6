#include "smpsolib/core/mutation.hpp"
#include "smpsolib/core/method.hpp"

namespace smpsolib::core {

    PolynomialMutation::PolynomialMutation(double probability, double distributionIndex)
        : probability_(probability), distributionIndex_(distributionIndex)
    {
        if (probability_ > 1.0)
            throw std::invalid_argument("mutation probability must not exceed 1");
        if (distributionIndex_ < 0.0)
            throw std::invalid_argument("distribution index must not be negative");
    }

    void PolynomialMutation::execute(TSol &s, const IProblem &problem, std::mt19937 &rng) const
    {
        const int n = problem.getNumberOfVariables();
        const double probability = (probability_ < 0.0) ? 1.0 / n : probability_;
        const double mutPow = 1.0 / (distributionIndex_ + 1.0);

        for (int j = 0; j < n; j++) {
            if (randomico(0, 1, rng) > probability) continue;

            double y = s.vars[j];
            const double yl = problem.getLowerBound(j);
            const double yu = problem.getUpperBound(j);

            if (yl == yu) {
                s.vars[j] = yl;
                continue;
            }

            double delta1 = (y - yl) / (yu - yl);
            double delta2 = (yu - y) / (yu - yl);
            double rnd = randomico(0, 1, rng);
            double deltaq = 0.0;

            if (rnd <= 0.5) {
                double xy = 1.0 - delta1;
                double val = 2.0 * rnd + (1.0 - 2.0 * rnd) * std::pow(xy, distributionIndex_ + 1.0);
                deltaq = std::pow(val, mutPow) - 1.0;
            }
            else {
                double xy = 1.0 - delta2;
                double val = 2.0 * (1.0 - rnd) + 2.0 * (rnd - 0.5) * std::pow(xy, distributionIndex_ + 1.0);
                deltaq = 1.0 - std::pow(val, mutPow);
            }

            y = y + deltaq * (yu - yl);
            s.vars[j] = std::clamp(y, yl, yu);
        }
    }

} // namespace smpsolib::core
