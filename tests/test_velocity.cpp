#include "doctest/doctest.h"
#include "test_types.hpp"
#include "smpsolib/core/velocity.hpp"
#include "smpsolib/core/position.hpp"

using namespace smpsolib::core;

TEST_SUITE("velocity") {

TEST_CASE("constriction is exactly one up to rho = 4") {
    CHECK(ConstrictionCoefficient(1.0, 1.0) == 1.0);
    CHECK(ConstrictionCoefficient(2.0, 2.0) == 1.0);
    CHECK(ConstrictionCoefficient(1.5, 1.5) == 1.0);
}

TEST_CASE("constriction above rho = 4 is a finite damping factor") {
    double chi = ConstrictionCoefficient(2.05, 2.05);
    CHECK(std::isfinite(chi));
    CHECK(chi == doctest::Approx(2.0 / (2.0 - 4.1 - std::sqrt(4.1 * 4.1 - 4.0 * 4.1))));
    CHECK(std::abs(chi) < 1.0);
    CHECK(std::abs(1.0 / chi) > 1.0);

    for (double rho = 4.01; rho <= 5.0; rho += 0.01) {
        double value = ConstrictionCoefficient(rho / 2.0, rho / 2.0);
        REQUIRE(std::isfinite(value));
        REQUIRE(value != 0.0);
    }
}

TEST_CASE("clamping passes through values inside the limits") {
    CHECK(VelocityConstriction(0.2, 0.5, -0.5) == 0.2);
    CHECK(VelocityConstriction(0.5, 0.5, -0.5) == 0.5);
    CHECK(VelocityConstriction(5.0, 0.5, -0.5) == 0.5);
    CHECK(VelocityConstriction(-5.0, 0.5, -0.5) == -0.5);
}

TEST_CASE("clamped velocity always lies in [deltaMin, deltaMax]") {
    std::mt19937 rng(5);
    std::uniform_real_distribution<double> dist(-100.0, 100.0);
    for (int t = 0; t < 1000; t++) {
        double v = VelocityConstriction(dist(rng), 2.5, -2.5);
        REQUIRE(v <= 2.5);
        REQUIRE(v >= -2.5);
    }
}

TEST_CASE("speed limits are half the range of each variable") {
    BoxProblem problem({0.0, -5.0, 2.0}, {1.0, 5.0, 2.0});
    TSpeedLimits limits = ComputeSpeedLimits(problem);
    REQUIRE(limits.deltaMax.size() == 3);
    CHECK(limits.deltaMax[0] == 0.5);
    CHECK(limits.deltaMax[1] == 5.0);
    CHECK(limits.deltaMax[2] == 0.0);
    CHECK(limits.deltaMin[0] == -0.5);
    CHECK(limits.deltaMin[1] == -5.0);
}

TEST_CASE("inertia weight decays linearly") {
    CHECK(InertiaWeight(0, 100, 0.1, 0.9) == doctest::Approx(0.9));
    CHECK(InertiaWeight(50, 100, 0.1, 0.9) == doctest::Approx(0.5));
    CHECK(InertiaWeight(100, 100, 0.1, 0.9) == doctest::Approx(0.1));
    CHECK(InertiaWeight(250, 100, 0.1, 0.9) == doctest::Approx(0.1));
    CHECK(InertiaWeight(37, 100, 0.1, 0.1) == doctest::Approx(0.1));
}

TEST_CASE("velocity update uses shared draws for every variable") {
    TSpeedLimits limits{{2.0, 2.0}, {-2.0, -2.0}};
    TVelocityTerms terms;
    terms.r1 = 0.5;
    terms.r2 = 0.5;
    terms.c1 = 1.0;
    terms.c2 = 1.0;
    terms.w = 0.1;

    std::vector<double> speed{1.0, 0.0};
    std::vector<double> position{0.0, 0.5};
    std::vector<double> localBest{1.0, 0.5};
    std::vector<double> globalBest{1.0, 0.0};

    ComputeVelocity(speed, position, localBest, globalBest, terms, limits);

    // 0.1 * 1 + 0.5 * 1 + 0.5 * 1
    CHECK(speed[0] == doctest::Approx(1.1));
    // 0 + 0 + 0.5 * (-0.5)
    CHECK(speed[1] == doctest::Approx(-0.25));
}

TEST_CASE("velocity update is clamped") {
    TSpeedLimits limits{{0.5}, {-0.5}};
    TVelocityTerms terms;
    terms.r1 = 1.0;
    terms.r2 = 1.0;
    terms.c1 = 1.5;
    terms.c2 = 1.5;
    terms.w = 0.1;

    std::vector<double> speed{0.0};
    ComputeVelocity(speed, {0.0}, {1.0}, {1.0}, terms, limits);
    CHECK(speed[0] == 0.5);

    ComputeVelocity(speed, {1.0}, {0.0}, {0.0}, terms, limits);
    CHECK(speed[0] == -0.5);
}

}

TEST_SUITE("position") {

TEST_CASE("free move adds the velocity") {
    BiConvex problem;
    TSol particle = make_sol({}, {0.2, 0.5});
    std::vector<double> speed{0.3, -0.1};

    UpdatePosition(particle, speed, problem, -1.0, -1.0);
    CHECK(particle.vars[0] == doctest::Approx(0.5));
    CHECK(particle.vars[1] == doctest::Approx(0.4));
    CHECK(speed[0] == 0.3);
    CHECK(speed[1] == -0.1);
}

TEST_CASE("bound violation clamps and reverses the velocity") {
    BiConvex problem;
    TSol particle = make_sol({}, {0.1, 0.9});
    std::vector<double> speed{-0.5, 0.3};

    UpdatePosition(particle, speed, problem, -1.0, -1.0);
    CHECK(particle.vars[0] == 0.0);
    CHECK(particle.vars[1] == 1.0);
    CHECK(speed[0] == doctest::Approx(0.5));
    CHECK(speed[1] == doctest::Approx(-0.3));
}

TEST_CASE("reversal factors dampen independently") {
    BiConvex problem;
    TSol particle = make_sol({}, {0.1, 0.9});
    std::vector<double> speed{-0.5, 0.3};

    UpdatePosition(particle, speed, problem, -0.5, 0.0);
    CHECK(speed[0] == doctest::Approx(0.25));
    CHECK(speed[1] == doctest::Approx(0.0));
}

TEST_CASE("positions always stay within bounds") {
    BoxProblem problem({-1.0, 0.0, 10.0}, {1.0, 3.0, 20.0});
    TSpeedLimits limits = ComputeSpeedLimits(problem);
    std::mt19937 rng(99);

    for (int t = 0; t < 500; t++) {
        TSol particle = problem.createSolution(rng);
        std::vector<double> speed(3);
        for (int j = 0; j < 3; j++)
            speed[j] = std::uniform_real_distribution<double>(limits.deltaMin[j] * 3, limits.deltaMax[j] * 3)(rng);

        UpdatePosition(particle, speed, problem, -1.0, -1.0);
        for (int j = 0; j < 3; j++) {
            REQUIRE(particle.vars[j] >= problem.getLowerBound(j));
            REQUIRE(particle.vars[j] <= problem.getUpperBound(j));
        }
    }
}

}
