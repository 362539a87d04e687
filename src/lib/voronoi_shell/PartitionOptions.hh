#ifndef PARTITIONOPTIONS_HH
#define PARTITIONOPTIONS_HH

#include <nlohmann/json.hpp>
#include <cstdint>
#include <limits>
#include <string>

namespace voroshell {

struct PartitionOptions {
    PartitionOptions() { }
    PartitionOptions(const std::string &jsonPath) {
        load(jsonPath);
    }
    PartitionOptions(const nlohmann::json &config) {
        load(config);
    }

    // Requested number of boundary samples (a provider may ignore it).
    size_t numSurfacePoints = 5000;
    // Maximum number of points scattered on the bisector planes between seeds.
    // Twice this many candidates are drawn, so it may not exceed MAX_CUT_POINTS.
    size_t numCutPoints     = 5000;
    static constexpr size_t MAX_CUT_POINTS = std::numeric_limits<size_t>::max() / 2;
    // Number of regions (seeds).
    size_t numSeeds         = 8;

    // Seed for the seed-point generator.
    uint32_t randomSeed = 42;
    // If true, cut candidates are drawn from a generator seeded with
    // randomSeed + 1, so the whole sampling stage is reproducible. If false,
    // the cut generator is seeded nondeterministically.
    bool deterministicCuts = true;

    // Rejection sampling budget for seed placement.
    size_t maxSeedAttempts = 1000000;
    // Bisectors between seeds closer than sqrt(bisectorEpsilon) are dropped.
    double bisectorEpsilon = 1e-8;

    // Print progress to stdout.
    bool verbose = false;

    void load(const std::string &jsonPath);
    void load(const nlohmann::json &config);

    nlohmann::json toJSON() const;
};

} // namespace voroshell

#endif /* end of include guard: PARTITIONOPTIONS_HH */
