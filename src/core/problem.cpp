#include "smpsolib/core/problem.hpp"
#include "smpsolib/core/method.hpp"

#include <numbers>

//-------------------------- IMPLEMENTATION --------------------------
namespace smpsolib::core {

    TSol IProblem::createSolution(std::mt19937 &rng) const
    {
        TSol s;
        s.vars.resize(getNumberOfVariables());
        s.obj.assign(getNumberOfObjectives(), 0.0);

        // random value between [lower, upper)
        for (int j = 0; j < getNumberOfVariables(); j++){
            s.vars[j] = randomico(getLowerBound(j), getUpperBound(j), rng);
        }
        return s;
    }

    void ValidateBounds(const IProblem &problem)
    {
        if (problem.getNumberOfVariables() <= 0)
            throw std::invalid_argument(problem.getName() + ": number of variables must be positive");
        if (problem.getNumberOfObjectives() <= 0)
            throw std::invalid_argument(problem.getName() + ": number of objectives must be positive");

        for (int j = 0; j < problem.getNumberOfVariables(); j++) {
            if (problem.getLowerBound(j) > problem.getUpperBound(j)) {
                std::ostringstream msg;
                msg << problem.getName() << ": lower bound " << problem.getLowerBound(j)
                    << " is greater than upper bound " << problem.getUpperBound(j)
                    << " for variable " << j;
                throw std::invalid_argument(msg.str());
            }
        }
    }

    FloatProblem::FloatProblem(std::vector<double> lowerBound, std::vector<double> upperBound, int numberOfObjectives)
        : lowerBound_(std::move(lowerBound)),
          upperBound_(std::move(upperBound)),
          numberOfObjectives_(numberOfObjectives)
    {
        if (lowerBound_.size() != upperBound_.size())
            throw std::invalid_argument("lower and upper bound vectors differ in length");
    }

    // -------------------------------------------------------------------------
    // BiConvex
    // -------------------------------------------------------------------------
    BiConvex::BiConvex()
        : FloatProblem({0.0, 0.0}, {1.0, 1.0}, 2)
    {}

    void BiConvex::evaluate(TSol &s) const
    {
        const double x1 = s.vars[0];
        const double x2 = s.vars[1];

        s.obj.resize(2);
        s.obj[0] = x1 * x1 + x2 * x2;
        s.obj[1] = (x1 - 1.0) * (x1 - 1.0) + (x2 - 1.0) * (x2 - 1.0);
    }

    // -------------------------------------------------------------------------
    // ZDT family
    // -------------------------------------------------------------------------
    ZDT1::ZDT1(int numberOfVariables)
        : FloatProblem(std::vector<double>(numberOfVariables, 0.0),
                       std::vector<double>(numberOfVariables, 1.0), 2)
    {
        if (numberOfVariables < 2)
            throw std::invalid_argument("ZDT problems need at least 2 variables");
    }

    double ZDT1::evalG(const TSol &s) const
    {
        const int n = getNumberOfVariables();
        double g = 0.0;
        for (int i = 1; i < n; i++)
            g += s.vars[i];

        return 1.0 + 9.0 * g / (n - 1);
    }

    void ZDT1::evaluate(TSol &s) const
    {
        const double f1 = s.vars[0];
        const double g = evalG(s);
        const double h = 1.0 - std::sqrt(f1 / g);

        s.obj.resize(2);
        s.obj[0] = f1;
        s.obj[1] = g * h;
    }

    void ZDT2::evaluate(TSol &s) const
    {
        const double f1 = s.vars[0];
        const double g = evalG(s);
        const double h = 1.0 - std::pow(f1 / g, 2.0);

        s.obj.resize(2);
        s.obj[0] = f1;
        s.obj[1] = g * h;
    }

    void ZDT3::evaluate(TSol &s) const
    {
        const double f1 = s.vars[0];
        const double g = evalG(s);
        const double h = 1.0 - std::sqrt(f1 / g) - (f1 / g) * std::sin(10.0 * std::numbers::pi * f1);

        s.obj.resize(2);
        s.obj[0] = f1;
        s.obj[1] = g * h;
    }

    // -------------------------------------------------------------------------
    // Kursawe
    // -------------------------------------------------------------------------
    Kursawe::Kursawe(int numberOfVariables)
        : FloatProblem(std::vector<double>(numberOfVariables, -5.0),
                       std::vector<double>(numberOfVariables, 5.0), 2)
    {
        if (numberOfVariables < 2)
            throw std::invalid_argument("Kursawe needs at least 2 variables");
    }

    void Kursawe::evaluate(TSol &s) const
    {
        const int n = getNumberOfVariables();
        double f1 = 0.0;
        double f2 = 0.0;

        for (int i = 0; i < n - 1; i++) {
            const double xi = s.vars[i] * s.vars[i];
            const double xj = s.vars[i + 1] * s.vars[i + 1];
            f1 += -10.0 * std::exp(-0.2 * std::sqrt(xi + xj));
        }

        for (int i = 0; i < n; i++) {
            f2 += std::pow(std::abs(s.vars[i]), 0.8) + 5.0 * std::sin(std::pow(s.vars[i], 3.0));
        }

        s.obj.resize(2);
        s.obj[0] = f1;
        s.obj[1] = f2;
    }

    // ---------------------------------------------------------
    // FÁBRICA
    // ---------------------------------------------------------
    std::shared_ptr<IProblem> createProblem(const std::string &name, int numberOfVariables)
    {
        std::shared_ptr<IProblem> problem;

        if (name == "BiConvex")     problem = std::make_shared<BiConvex>();
        else if (name == "ZDT1")    problem = std::make_shared<ZDT1>(numberOfVariables > 0 ? numberOfVariables : 30);
        else if (name == "ZDT2")    problem = std::make_shared<ZDT2>(numberOfVariables > 0 ? numberOfVariables : 30);
        else if (name == "ZDT3")    problem = std::make_shared<ZDT3>(numberOfVariables > 0 ? numberOfVariables : 30);
        else if (name == "Kursawe") problem = std::make_shared<Kursawe>(numberOfVariables > 0 ? numberOfVariables : 3);
        else throw std::invalid_argument("Unknown problem: " + name);

        ValidateBounds(*problem);
        return problem;
    }

}
