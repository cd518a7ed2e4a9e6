#pragma once

#include "smpsolib/core/iproblem.hpp"

namespace smpsolib::core {

    //----------------- BOX-CONSTRAINED BENCHMARK PROBLEMS -----------------------

    /**
     * Class: FloatProblem
     * Description: stores the per-variable bounds shared by all benchmark problems
     */
    class FloatProblem : public IProblem {
        public:
            FloatProblem(std::vector<double> lowerBound, std::vector<double> upperBound, int numberOfObjectives);

            int getNumberOfVariables() const override { return static_cast<int>(lowerBound_.size()); }
            int getNumberOfObjectives() const override { return numberOfObjectives_; }
            double getLowerBound(int index) const override { return lowerBound_.at(index); }
            double getUpperBound(int index) const override { return upperBound_.at(index); }

        protected:
            std::vector<double> lowerBound_;
            std::vector<double> upperBound_;
            int numberOfObjectives_;
    };

    /**
     * Class: BiConvex
     * Description: f1 = x1^2 + x2^2, f2 = (x1-1)^2 + (x2-1)^2 over [0,1]^2
     */
    class BiConvex : public FloatProblem {
        public:
            BiConvex();
            std::string getName() const override { return "BiConvex"; }
            void evaluate(TSol &s) const override;
    };

    /**
     * Class: ZDT1
     * Description: convex Pareto front, n variables in [0,1]
     */
    class ZDT1 : public FloatProblem {
        public:
            explicit ZDT1(int numberOfVariables = 30);
            std::string getName() const override { return "ZDT1"; }
            void evaluate(TSol &s) const override;

        protected:
            double evalG(const TSol &s) const;
    };

    /**
     * Class: ZDT2
     * Description: non-convex Pareto front, n variables in [0,1]
     */
    class ZDT2 : public ZDT1 {
        public:
            explicit ZDT2(int numberOfVariables = 30) : ZDT1(numberOfVariables) {}
            std::string getName() const override { return "ZDT2"; }
            void evaluate(TSol &s) const override;
    };

    /**
     * Class: ZDT3
     * Description: disconnected Pareto front, n variables in [0,1]
     */
    class ZDT3 : public ZDT1 {
        public:
            explicit ZDT3(int numberOfVariables = 30) : ZDT1(numberOfVariables) {}
            std::string getName() const override { return "ZDT3"; }
            void evaluate(TSol &s) const override;
    };

    /**
     * Class: Kursawe
     * Description: n variables in [-5,5], two objectives
     */
    class Kursawe : public FloatProblem {
        public:
            explicit Kursawe(int numberOfVariables = 3);
            std::string getName() const override { return "Kursawe"; }
            void evaluate(TSol &s) const override;
    };

}
