#include "smpsolib/mh/smpso.hpp"

// Dependências internas
#include "smpsolib/core/method.hpp"
#include "smpsolib/core/position.hpp"

namespace smpsolib::mh {

    using namespace smpsolib::core;

    static unsigned int SeedFrom(long long seed)
    {
        if (seed < 0)
            return static_cast<unsigned int>(std::chrono::steady_clock::now().time_since_epoch().count());
        return static_cast<unsigned int>(seed);
    }

    // -------------------------------------------------------------------------
    // CONSTRUCTOR
    // -------------------------------------------------------------------------
    SMPSO::SMPSO(std::shared_ptr<const IProblem> problem,
                 const TRunData &runData,
                 std::shared_ptr<const IMutation> mutation,
                 std::shared_ptr<const IEvaluator> evaluator)
        : problem_(std::move(problem)),
          runData_(runData),
          mutation_(std::move(mutation)),
          evaluator_(std::move(evaluator)),
          rng_(SeedFrom(runData.seed)),
          state_(SwarmState::Uninitialized),
          evaluations_(0),
          startTime_(0.0),
          leaders_(runData.archiveSize)
    {
        if (!problem_) throw std::invalid_argument("SMPSO requires a problem");
        if (!mutation_) throw std::invalid_argument("SMPSO requires a mutation operator");
        if (!evaluator_) evaluator_ = std::make_shared<SequentialEvaluator>();

        ValidateRunData(runData_);
        ValidateBounds(*problem_);

        limits_ = ComputeSpeedLimits(*problem_);
    }

    void SMPSO::addObserver(std::shared_ptr<IObserver> observer)
    {
        if (observer) observers_.push_back(std::move(observer));
    }

    // -------------------------------------------------------------------------
    // STATE MACHINE
    // -------------------------------------------------------------------------
    void SMPSO::run()
    {
        if (state_ == SwarmState::Uninitialized) initialize();

        while (state_ != SwarmState::Terminated) {
            step();
        }
    }

    void SMPSO::initialize()
    {
        if (state_ != SwarmState::Uninitialized)
            throw std::logic_error("SMPSO::initialize called twice");

        startTime_ = get_time_in_seconds();

        createInitialSwarm();
        evaluateSwarm();
        initializeVelocity();
        initializeParticleBest();
        initializeGlobalBest();
        initProgress();

        state_ = isStoppingConditionReached() ? SwarmState::Terminated : SwarmState::Initialized;
    }

    void SMPSO::step()
    {
        if (state_ == SwarmState::Uninitialized)
            throw std::logic_error("SMPSO::step called before initialize");
        if (state_ == SwarmState::Terminated)
            throw std::logic_error("SMPSO::step called after termination");

        state_ = SwarmState::Running;

        updateVelocity();
        updatePosition();
        perturbation();
        evaluateSwarm();
        updateParticleBest();
        updateGlobalBest();
        updateProgress();

        if (isStoppingConditionReached()) state_ = SwarmState::Terminated;
    }

    bool SMPSO::isStoppingConditionReached() const
    {
        return evaluations_ >= runData_.maxEvaluations;
    }

    double SMPSO::getComputingTime() const
    {
        if (state_ == SwarmState::Uninitialized) return 0.0;
        return get_time_in_seconds() - startTime_;
    }

    // -------------------------------------------------------------------------
    // INITIALIZATION
    // -------------------------------------------------------------------------
    void SMPSO::createInitialSwarm()
    {
        swarm_.clear();
        swarm_.reserve(runData_.swarmSize);

        for (int i = 0; i < runData_.swarmSize; i++) {
            swarm_.push_back(problem_->createSolution(rng_));
        }
    }

    void SMPSO::evaluateSwarm()
    {
        evaluator_->evaluate(swarm_, *problem_);
    }

    void SMPSO::initializeGlobalBest()
    {
        for (const TSol &particle : swarm_) {
            leaders_.add(particle);
        }
    }

    void SMPSO::initializeParticleBest()
    {
        pbest_.initialize(swarm_);
    }

    void SMPSO::initializeVelocity()
    {
        speed_.assign(runData_.swarmSize, std::vector<double>(problem_->getNumberOfVariables(), 0.0));
    }

    void SMPSO::initProgress()
    {
        evaluations_ = runData_.swarmSize;
        leaders_.computeDensityEstimator();
    }

    // -------------------------------------------------------------------------
    // GENERATION
    // -------------------------------------------------------------------------
    void SMPSO::updateVelocity()
    {
        for (int i = 0; i < runData_.swarmSize; i++) {
            TSol bestGlobal = SelectGlobalBest(leaders_, rng_);

            // r1, r2, c1 and c2 are shared by all variables of the particle
            TVelocityTerms terms;
            terms.r1 = randomico(0, 1, rng_);
            terms.r2 = randomico(0, 1, rng_);
            terms.c1 = randomico(runData_.c1Min, runData_.c1Max, rng_);
            terms.c2 = randomico(runData_.c2Min, runData_.c2Max, rng_);
            terms.w = InertiaWeight(evaluations_, runData_.maxEvaluations, runData_.minWeight, runData_.maxWeight);

            ComputeVelocity(speed_[i], swarm_[i].vars, pbest_.bestSeen(i).vars, bestGlobal.vars, terms, limits_);
        }
    }

    void SMPSO::updatePosition()
    {
        for (int i = 0; i < runData_.swarmSize; i++) {
            UpdatePosition(swarm_[i], speed_[i], *problem_, runData_.changeVelocity1, runData_.changeVelocity2);
        }
    }

    void SMPSO::perturbation()
    {
        for (TSol &particle : swarm_) {
            mutation_->execute(particle, *problem_, rng_);
        }
    }

    void SMPSO::updateParticleBest()
    {
        pbest_.update(swarm_);
    }

    void SMPSO::updateGlobalBest()
    {
        for (const TSol &particle : swarm_) {
            leaders_.add(particle);
        }
    }

    void SMPSO::updateProgress()
    {
        evaluations_ += runData_.swarmSize;
        leaders_.computeDensityEstimator();

        notifyObservers();
    }

    void SMPSO::notifyObservers()
    {
        const double computingTime = getComputingTime();

        for (const auto &observer : observers_) {
            try {
                observer->notify(evaluations_, swarm_, computingTime);
            } catch (const std::exception &e) {
                std::cerr << "\nObserver error (ignored): " << e.what() << std::endl;
            } catch (...) {
                std::cerr << "\nObserver error (ignored): unknown exception" << std::endl;
            }
        }
    }

} // namespace smpsolib::mh
