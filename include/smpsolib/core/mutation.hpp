#pragma once

#include "smpsolib/core/data.hpp"
#include "smpsolib/core/iproblem.hpp"

namespace smpsolib::core {

    // Perturbation applied to each particle after the position update
    class IMutation {
        public:
            virtual ~IMutation() = default;

            virtual void execute(TSol &s, const IProblem &problem, std::mt19937 &rng) const = 0;
    };

    /**
     * Class: PolynomialMutation
     * Description: Deb's polynomial mutation, bounded by the problem box.
     * A negative probability means 1 / number of variables.
     */
    class PolynomialMutation : public IMutation {
        public:
            explicit PolynomialMutation(double probability = -1.0, double distributionIndex = 20.0);

            void execute(TSol &s, const IProblem &problem, std::mt19937 &rng) const override;

            double getProbability() const { return probability_; }
            double getDistributionIndex() const { return distributionIndex_; }

        private:
            double probability_;
            double distributionIndex_;
    };

} // namespace smpsolib::core
