#pragma once

#include "smpsolib/core/data.hpp"

namespace smpsolib::core {

    // Progress notification sent by the loop once per generation
    class IObserver {
        public:
            virtual ~IObserver() = default;

            virtual void notify(int evaluations, const std::vector<TSol> &population, double computingTime) = 0;
    };

    /**
     * Class: ProgressObserver
     * Description: prints a progress line every `frequency` evaluations
     */
    class ProgressObserver : public IObserver {
        public:
            explicit ProgressObserver(int frequency = 1000, std::ostream &out = std::cout);

            void notify(int evaluations, const std::vector<TSol> &population, double computingTime) override;

        private:
            int frequency_;
            int nextReport_;
            std::ostream &out_;
    };

} // namespace smpsolib::core
