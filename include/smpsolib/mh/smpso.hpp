/**
 * SMPSO Library - Speed-constrained Multi-objective PSO
 * Generation loop driving the swarm, the leaders archive and the personal bests
 */

#pragma once

#include "smpsolib/core/data.hpp"
#include "smpsolib/core/iproblem.hpp"
#include "smpsolib/core/archive.hpp"
#include "smpsolib/core/pbest.hpp"
#include "smpsolib/core/velocity.hpp"
#include "smpsolib/core/mutation.hpp"
#include "smpsolib/core/evaluator.hpp"
#include "smpsolib/core/observer.hpp"

namespace smpsolib::mh {

    /**
    * @brief SMPSO search process
    *
    * Uninitialized -> Initialized (initialize) -> Running (step) -> Terminated
    * once the evaluation counter reaches runData.maxEvaluations. The result is
    * the content of the leaders archive.
    */
    class SMPSO {
    public:
        // -------------------------------------------------------------------------
        // CONSTRUCTOR
        // -------------------------------------------------------------------------

        /**
         * Throws std::invalid_argument on an invalid configuration or problem.
         * A null evaluator selects a SequentialEvaluator owned by this instance.
         */
        SMPSO(std::shared_ptr<const core::IProblem> problem,
              const core::TRunData &runData,
              std::shared_ptr<const core::IMutation> mutation,
              std::shared_ptr<const core::IEvaluator> evaluator = nullptr);

        // -------------------------------------------------------------------------
        // PUBLIC INTERFACE
        // -------------------------------------------------------------------------
        void addObserver(std::shared_ptr<core::IObserver> observer);

        void run();
        void initialize();
        void step();

        bool isStoppingConditionReached() const;

        std::vector<core::TSol> getResult() const { return leaders_.members(); }

        // -------------------------------------------------------------------------
        // ACCESSORS
        // -------------------------------------------------------------------------
        std::string getName() const { return "SMPSO"; }
        core::SwarmState getState() const { return state_; }
        int getEvaluations() const { return evaluations_; }
        double getComputingTime() const;
        const std::vector<core::TSol>& getSwarm() const { return swarm_; }
        const std::vector<std::vector<double>>& getSpeed() const { return speed_; }
        const core::BoundedArchive& getLeaders() const { return leaders_; }
        const core::PersonalBestTracker& getPersonalBests() const { return pbest_; }
        const core::TSpeedLimits& getSpeedLimits() const { return limits_; }

    private:
        // Generation steps
        void createInitialSwarm();
        void evaluateSwarm();
        void initializeGlobalBest();
        void initializeParticleBest();
        void initializeVelocity();
        void updateVelocity();
        void updatePosition();
        void perturbation();
        void updateParticleBest();
        void updateGlobalBest();
        void initProgress();
        void updateProgress();
        void notifyObservers();

        // -------------------------------------------------------------------------
        // MEMBER VARIABLES
        // -------------------------------------------------------------------------
        std::shared_ptr<const core::IProblem> problem_;
        core::TRunData runData_;
        std::shared_ptr<const core::IMutation> mutation_;
        std::shared_ptr<const core::IEvaluator> evaluator_;
        std::vector<std::shared_ptr<core::IObserver>> observers_;

        std::mt19937 rng_;
        core::SwarmState state_;
        int evaluations_;
        double startTime_;

        std::vector<core::TSol> swarm_;
        std::vector<std::vector<double>> speed_;     // swarmSize x numberOfVariables
        core::TSpeedLimits limits_;
        core::BoundedArchive leaders_;
        core::PersonalBestTracker pbest_;
    };

} // namespace smpsolib::mh
