#include "smpsolib/core/archive.hpp"
#include "smpsolib/core/density.hpp"
#include "smpsolib/core/method.hpp"

namespace smpsolib::core {

    BoundedArchive::BoundedArchive(int capacity)
        : capacity_(capacity)
    {
        if (capacity_ <= 0)
            throw std::invalid_argument("archive capacity must be positive, got " + std::to_string(capacity_));

        members_.reserve(capacity_ + 1);
    }

    bool BoundedArchive::add(const TSol &s)
    {
        std::vector<std::size_t> dominated;

        // compare the candidate with every member before touching the archive
        for (std::size_t i = 0; i < members_.size(); i++) {
            int flag = dominance_.compare(s, members_[i]);

            if (flag == 1) return false;                        // a member dominates s
            if (flag == -1) dominated.push_back(i);
            else if (members_[i].obj == s.obj) return false;    // same point already stored
        }

        // remove dominated members (back to front keeps the indices valid)
        for (auto it = dominated.rbegin(); it != dominated.rend(); ++it) {
            members_.erase(members_.begin() + static_cast<std::ptrdiff_t>(*it));
        }

        members_.push_back(s);
        bool kept = true;

        if (static_cast<int>(members_.size()) > capacity_) {
            computeDensityEstimator();

            // most crowded member = lowest score, first one found on ties
            std::size_t worst = 0;
            for (std::size_t i = 1; i < members_.size(); i++) {
                if (density_[i] < density_[worst]) worst = i;
            }

            kept = (worst != members_.size() - 1);
            members_.erase(members_.begin() + static_cast<std::ptrdiff_t>(worst));
        }

        computeDensityEstimator();
        return kept;
    }

    void BoundedArchive::computeDensityEstimator()
    {
        density_ = CrowdingDistance(members_);
    }

    std::pair<std::size_t, std::size_t> BoundedArchive::selectTwoForTournament(std::mt19937 &rng) const
    {
        if (members_.empty())
            throw std::logic_error("tournament selection on an empty archive");

        const int n = static_cast<int>(members_.size());
        if (n == 1) return {0, 0};

        int pos1 = irandomico(0, n - 1, rng);
        int pos2 = irandomico(0, n - 2, rng);
        if (pos2 >= pos1) pos2++;

        return {static_cast<std::size_t>(pos1), static_cast<std::size_t>(pos2)};
    }

    int BoundedArchive::compare(std::size_t i, std::size_t j) const
    {
        return crowding_.compare(density_.at(i), density_.at(j));
    }

    const TSol& SelectGlobalBest(const BoundedArchive &leaders, std::mt19937 &rng)
    {
        auto [pos1, pos2] = leaders.selectTwoForTournament(rng);

        if (leaders.compare(pos1, pos2) < 1)
            return leaders.member(pos1);

        return leaders.member(pos2);
    }

} // namespace smpsolib::core
