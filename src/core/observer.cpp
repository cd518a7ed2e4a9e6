#include "smpsolib/core/observer.hpp"

namespace smpsolib::core {

    ProgressObserver::ProgressObserver(int frequency, std::ostream &out)
        : frequency_(frequency > 0 ? frequency : 1), nextReport_(0), out_(out)
    {}

    void ProgressObserver::notify(int evaluations, const std::vector<TSol> &population, double computingTime)
    {
        if (evaluations < nextReport_) return;

        std::ios_base::fmtflags flags = out_.flags();
        std::streamsize precision = out_.precision();

        out_ << "\nEvaluations: " << std::setw(8) << evaluations
             << " | Swarm: " << population.size()
             << " | Time: " << std::fixed << std::setprecision(3) << computingTime << "s" << std::flush;

        out_.flags(flags);
        out_.precision(precision);

        nextReport_ = (evaluations / frequency_ + 1) * frequency_;
    }

} // namespace smpsolib::core
