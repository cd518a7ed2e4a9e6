#include "doctest/doctest.h"
#include "test_types.hpp"
#include "smpsolib/mh/smpso.hpp"

using namespace smpsolib::core;
using smpsolib::mh::SMPSO;

static TRunData scenario_config()
{
    TRunData runData;
    runData.swarmSize = 20;
    runData.maxEvaluations = 2000;
    runData.archiveSize = 100;
    runData.seed = 42;
    return runData;
}

static bool inside_box(const std::vector<TSol> &set, const IProblem &problem)
{
    for (const TSol &s : set)
        for (int j = 0; j < problem.getNumberOfVariables(); j++)
            if (s.vars[j] < problem.getLowerBound(j) || s.vars[j] > problem.getUpperBound(j)) return false;
    return true;
}

TEST_SUITE("smpso") {

TEST_CASE("bi-objective convex scenario") {
    auto problem = std::make_shared<BiConvex>();
    SMPSO algorithm(problem, scenario_config(), std::make_shared<PolynomialMutation>());

    algorithm.run();

    CHECK(algorithm.getState() == SwarmState::Terminated);
    CHECK(algorithm.getEvaluations() >= 2000);
    CHECK(algorithm.getName() == "SMPSO");

    std::vector<TSol> front = algorithm.getResult();
    REQUIRE_FALSE(front.empty());
    CHECK(front.size() <= 100);
    CHECK(mutually_non_dominated(front));
    CHECK(inside_box(front, *problem));
}

TEST_CASE("life cycle") {
    auto problem = std::make_shared<BiConvex>();
    SMPSO algorithm(problem, scenario_config(), std::make_shared<PolynomialMutation>());

    CHECK(algorithm.getState() == SwarmState::Uninitialized);
    CHECK(algorithm.getComputingTime() == 0.0);
    CHECK_THROWS_AS(algorithm.step(), std::logic_error);

    algorithm.initialize();
    CHECK(algorithm.getState() == SwarmState::Initialized);
    CHECK(algorithm.getEvaluations() == 20);
    CHECK(algorithm.getSwarm().size() == 20);
    CHECK(algorithm.getPersonalBests().size() == 20);
    CHECK_FALSE(algorithm.getLeaders().empty());
    CHECK(mutually_non_dominated(algorithm.getLeaders().members()));
    for (const auto &row : algorithm.getSpeed()) {
        REQUIRE(row.size() == 2);
        CHECK(row[0] == 0.0);
        CHECK(row[1] == 0.0);
    }
    CHECK_THROWS_AS(algorithm.initialize(), std::logic_error);

    algorithm.step();
    CHECK(algorithm.getState() == SwarmState::Running);
    CHECK(algorithm.getEvaluations() == 40);

    while (!algorithm.isStoppingConditionReached()) algorithm.step();
    CHECK(algorithm.getState() == SwarmState::Terminated);
    CHECK(algorithm.getEvaluations() == 2000);
    CHECK_THROWS_AS(algorithm.step(), std::logic_error);
}

TEST_CASE("every generation keeps the invariants") {
    auto problem = std::make_shared<ZDT1>(10);
    TRunData runData = scenario_config();
    runData.archiveSize = 15;
    runData.seed = 7;

    SMPSO algorithm(problem, runData, std::make_shared<PolynomialMutation>());
    algorithm.initialize();
    const TSpeedLimits &limits = algorithm.getSpeedLimits();

    while (algorithm.getState() != SwarmState::Terminated) {
        algorithm.step();

        REQUIRE(inside_box(algorithm.getSwarm(), *problem));
        REQUIRE(algorithm.getLeaders().size() <= 15);
        REQUIRE(mutually_non_dominated(algorithm.getLeaders().members()));

        for (const auto &row : algorithm.getSpeed()) {
            for (std::size_t j = 0; j < row.size(); j++) {
                // the bound reflection may flip the sign but never grows the magnitude
                REQUIRE(std::abs(row[j]) <= limits.deltaMax[j]);
            }
        }
    }
}

TEST_CASE("same seed reproduces the front") {
    auto problem = std::make_shared<ZDT2>(8);
    TRunData runData = scenario_config();
    runData.seed = 2718;

    SMPSO first(problem, runData, std::make_shared<PolynomialMutation>());
    SMPSO second(problem, runData, std::make_shared<PolynomialMutation>());
    first.run();
    second.run();

    std::vector<TSol> a = first.getResult();
    std::vector<TSol> b = second.getResult();
    REQUIRE(a.size() == b.size());
    for (std::size_t i = 0; i < a.size(); i++) {
        CHECK(a[i].obj == b[i].obj);
        CHECK(a[i].vars == b[i].vars);
    }
}

TEST_CASE("parallel evaluation runs the same search") {
    auto problem = std::make_shared<ZDT1>(6);
    TRunData runData = scenario_config();

    SMPSO sequential(problem, runData, std::make_shared<PolynomialMutation>(), std::make_shared<SequentialEvaluator>());
    SMPSO parallel(problem, runData, std::make_shared<PolynomialMutation>(), std::make_shared<ParallelEvaluator>(4));
    sequential.run();
    parallel.run();

    std::vector<TSol> a = sequential.getResult();
    std::vector<TSol> b = parallel.getResult();
    REQUIRE(a.size() == b.size());
    for (std::size_t i = 0; i < a.size(); i++) CHECK(a[i].obj == b[i].obj);
}

TEST_CASE("observers are notified once per generation and isolated") {
    auto problem = std::make_shared<BiConvex>();
    SMPSO algorithm(problem, scenario_config(), std::make_shared<NoMutation>());

    auto counter = std::make_shared<CountingObserver>();
    algorithm.addObserver(std::make_shared<ThrowingObserver>());
    algorithm.addObserver(std::make_shared<ThrowingIntObserver>());
    algorithm.addObserver(counter);
    algorithm.addObserver(nullptr);

    CHECK_NOTHROW(algorithm.run());
    CHECK(counter->calls == (2000 - 20) / 20);
    CHECK(counter->lastEvaluations == 2000);
    CHECK(counter->lastPopulation == 20);
}

TEST_CASE("budget exhausted by the initial swarm") {
    TRunData runData = scenario_config();
    runData.maxEvaluations = 20;

    SMPSO algorithm(std::make_shared<BiConvex>(), runData, std::make_shared<PolynomialMutation>());
    algorithm.run();
    CHECK(algorithm.getState() == SwarmState::Terminated);
    CHECK(algorithm.getEvaluations() == 20);
    CHECK_FALSE(algorithm.getResult().empty());
}

TEST_CASE("single leader archive still drives the swarm") {
    TRunData runData = scenario_config();
    runData.archiveSize = 1;
    runData.maxEvaluations = 400;

    SMPSO algorithm(std::make_shared<BiConvex>(), runData, std::make_shared<PolynomialMutation>());
    algorithm.run();
    CHECK(algorithm.getLeaders().size() == 1);
}

TEST_CASE("invalid configurations fail at construction") {
    auto problem = std::make_shared<BiConvex>();
    auto mutation = std::make_shared<PolynomialMutation>();

    TRunData noSwarm = scenario_config();
    noSwarm.swarmSize = 0;
    CHECK_THROWS_AS(SMPSO(problem, noSwarm, mutation), std::invalid_argument);

    TRunData noArchive = scenario_config();
    noArchive.archiveSize = 0;
    CHECK_THROWS_AS(SMPSO(problem, noArchive, mutation), std::invalid_argument);

    auto inverted = std::make_shared<BoxProblem>(std::vector<double>{0.0, 1.0}, std::vector<double>{1.0, 0.0});
    CHECK_THROWS_AS(SMPSO(inverted, scenario_config(), mutation), std::invalid_argument);

    CHECK_THROWS_AS(SMPSO(nullptr, scenario_config(), mutation), std::invalid_argument);
    CHECK_THROWS_AS(SMPSO(problem, scenario_config(), nullptr), std::invalid_argument);
}

TEST_CASE("evaluation failures propagate out of the loop") {
    SMPSO algorithm(std::make_shared<ThrowingProblem>(), scenario_config(), std::make_shared<PolynomialMutation>());
    CHECK_THROWS_AS(algorithm.run(), std::runtime_error);
}

}
