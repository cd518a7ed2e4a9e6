#include "smpsolib/core/method.hpp"

#include <type_traits>

#include <yaml-cpp/yaml.h>

namespace smpsolib::core {

    // -----------------------------------------------------------------------------
    // General Utilities
    // -----------------------------------------------------------------------------

    double randomico(double min, double max, std::mt19937 &rng)
    {
        if (min == max) return min;
        return std::uniform_real_distribution<double>(min, max)(rng);
    }

    int irandomico(int min, int max, std::mt19937 &rng)
    {
        return std::uniform_int_distribution<int>(min, max)(rng);
    }

    double get_time_in_seconds() {
        #if defined(_WIN32) || defined(_WIN64)
            LARGE_INTEGER frequency;
            LARGE_INTEGER timeCur;
            QueryPerformanceFrequency(&frequency);
            QueryPerformanceCounter(&timeCur);
            return static_cast<double>(timeCur.QuadPart) / frequency.QuadPart;
        #else
            struct timespec timeCur;
            clock_gettime(CLOCK_MONOTONIC, &timeCur);
            return timeCur.tv_sec + timeCur.tv_nsec / 1e9;
        #endif
    }

    // -----------------------------------------------------------------------------
    // Configuration
    // -----------------------------------------------------------------------------

    void ValidateRunData(const TRunData &runData)
    {
        if (runData.swarmSize <= 0)
            throw std::invalid_argument("swarmSize must be positive, got " + std::to_string(runData.swarmSize));
        if (runData.maxEvaluations <= 0)
            throw std::invalid_argument("maxEvaluations must be positive, got " + std::to_string(runData.maxEvaluations));
        if (runData.maxEvaluations > std::numeric_limits<int>::max() - runData.swarmSize)
            throw std::invalid_argument("maxEvaluations too large for the evaluation counter");
        if (runData.archiveSize <= 0)
            throw std::invalid_argument("archiveSize must be positive, got " + std::to_string(runData.archiveSize));
        if (runData.c1Min > runData.c1Max)
            throw std::invalid_argument("c1Min is greater than c1Max");
        if (runData.c2Min > runData.c2Max)
            throw std::invalid_argument("c2Min is greater than c2Max");
        if (runData.minWeight > runData.maxWeight)
            throw std::invalid_argument("minWeight is greater than maxWeight");
        if (runData.mutationProbability > 1.0)
            throw std::invalid_argument("mutationProbability must not exceed 1");
        if (runData.distributionIndex < 0.0)
            throw std::invalid_argument("distributionIndex must not be negative");
        if (runData.MAXRUNS < 1)
            throw std::invalid_argument("MAXRUNS must be at least 1");
    }

    static void LoadYamlLogic(const YAML::Node &methodNode, TRunData &runData)
    {
        // copies a key into the field when present, leaves the default otherwise
        auto read = [&methodNode](const char *key, auto &field) {
            if (methodNode[key])
                field = methodNode[key].as<std::remove_reference_t<decltype(field)>>();
        };

        read("swarmSize", runData.swarmSize);
        read("maxEvaluations", runData.maxEvaluations);
        read("archiveSize", runData.archiveSize);
        read("c1Min", runData.c1Min);
        read("c1Max", runData.c1Max);
        read("c2Min", runData.c2Min);
        read("c2Max", runData.c2Max);
        read("minWeight", runData.minWeight);
        read("maxWeight", runData.maxWeight);
        read("changeVelocity1", runData.changeVelocity1);
        read("changeVelocity2", runData.changeVelocity2);
        read("mutationProbability", runData.mutationProbability);
        read("distributionIndex", runData.distributionIndex);
        read("parallel", runData.parallel);
        read("debug", runData.debug);
        read("MAXRUNS", runData.MAXRUNS);
        read("seed", runData.seed);
    }

    void ReadParametersYaml(const std::string &paramFile, TRunData &runData)
    {
        try {
            YAML::Node config = YAML::LoadFile(paramFile);

            // Guard Clause 1: method section missing
            if (!config["SMPSO"]) {
                throw std::runtime_error("Section 'SMPSO' not found in " + paramFile);
            }

            const YAML::Node &methodNode = config["SMPSO"];

            // Guard Clause 2: invalid format
            if (!methodNode.IsMap()) {
                throw std::runtime_error("Invalid format for section 'SMPSO' in " + paramFile + " (expected a map).");
            }

            LoadYamlLogic(methodNode, runData);

        } catch (const YAML::BadFile &) {
            throw std::runtime_error("Error opening YAML file: " + paramFile);
        } catch (const YAML::ParserException &e) {
            throw std::runtime_error("YAML syntax error in " + paramFile + ": " + e.what());
        } catch (const YAML::BadConversion &e) {
            throw std::runtime_error("Invalid value in " + paramFile + ": " + e.what());
        }
    }

} // namespace smpsolib::core
