#include "smpsolib/core/density.hpp"

namespace smpsolib::core {

    std::vector<double> CrowdingDistance(const std::vector<TSol> &set)
    {
        const std::size_t size = set.size();
        std::vector<double> distance(size, 0.0);

        if (size == 0) return distance;

        if (size <= 2) {
            std::fill(distance.begin(), distance.end(), std::numeric_limits<double>::infinity());
            return distance;
        }

        const std::size_t numberOfObjectives = set[0].obj.size();
        for (const TSol &s : set) {
            if (s.obj.size() != numberOfObjectives)
                throw std::invalid_argument("crowding distance over solutions with different number of objectives");
        }

        std::vector<std::size_t> order(size);

        for (std::size_t m = 0; m < numberOfObjectives; m++) {
            std::iota(order.begin(), order.end(), 0);

            // stable sort keeps the scores deterministic when objective values tie
            std::stable_sort(order.begin(), order.end(), [&set, m](std::size_t a, std::size_t b) {
                return set[a].obj[m] < set[b].obj[m];
            });

            distance[order.front()] = std::numeric_limits<double>::infinity();
            distance[order.back()] = std::numeric_limits<double>::infinity();

            const double minObj = set[order.front()].obj[m];
            const double maxObj = set[order.back()].obj[m];
            if (maxObj - minObj == 0.0) continue;

            for (std::size_t i = 1; i < size - 1; i++) {
                distance[order[i]] += (set[order[i + 1]].obj[m] - set[order[i - 1]].obj[m]) / (maxObj - minObj);
            }
        }

        return distance;
    }

} // namespace smpsolib::core
