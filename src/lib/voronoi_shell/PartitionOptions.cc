#include "PartitionOptions.hh"
#include <iostream>
#include <fstream>
#include <limits>
#include <set>
#include <stdexcept>

using json = nlohmann::json;

namespace voroshell {

namespace {

// Reads a nonnegative integer option no larger than "maxValue", keeping
// "current" when the key is absent.
template<typename T>
T readCount(const json &config, const std::string &key, T current,
            T maxValue = std::numeric_limits<T>::max()) {
    auto it = config.find(key);
    if (it == config.end()) return current;
    if (!it->is_number_integer())
        throw std::runtime_error("Partition option " + key + " must be an integer");
    if (it->is_number_unsigned()) {
        auto v = it->get<uint64_t>();
        if (v > uint64_t(maxValue))
            throw std::runtime_error("Partition option " + key + " is too large: " + std::to_string(v));
        return T(v);
    }
    auto v = it->get<int64_t>();
    if (v < 0)
        throw std::runtime_error("Partition option " + key + " must be nonnegative; got " + std::to_string(v));
    if (uint64_t(v) > uint64_t(maxValue))
        throw std::runtime_error("Partition option " + key + " is too large: " + std::to_string(v));
    return T(v);
}

}

constexpr size_t PartitionOptions::MAX_CUT_POINTS;

void PartitionOptions::load(const std::string &jsonPath) {
    std::ifstream is(jsonPath);
    if (!is.is_open()) {
        throw std::runtime_error("Cannot read json file: " + jsonPath);
    }
    json config;
    is >> config;
    load(config);
}

void PartitionOptions::load(const nlohmann::json &config) {
    if (!config.is_object())
        throw std::runtime_error("Partition options must be a json object");

    std::set<std::string> expectedKeys = {
        "numSurfacePoints", "numCutPoints", "numSeeds",
        "randomSeed", "deterministicCuts",
        "maxSeedAttempts", "bisectorEpsilon",
        "verbose"
    };

    // Validate keys
    for (auto it : config.items()) {
        if (expectedKeys.count(it.key()) == 0) {
            std::cerr << "WARNING: ignoring unexpected partition option " << it.key() << std::endl;
        }
    }

    numSurfacePoints  = readCount(config, "numSurfacePoints", numSurfacePoints);
    numCutPoints      = readCount(config, "numCutPoints",     numCutPoints, MAX_CUT_POINTS);
    numSeeds          = readCount(config, "numSeeds",         numSeeds);
    randomSeed        = readCount(config, "randomSeed",       randomSeed);
    deterministicCuts = config.value("deterministicCuts", deterministicCuts);
    maxSeedAttempts   = readCount(config, "maxSeedAttempts",  maxSeedAttempts);
    bisectorEpsilon   = config.value("bisectorEpsilon",   bisectorEpsilon);
    verbose           = config.value("verbose",           verbose);

    if (numSeeds == 0)        throw std::runtime_error("numSeeds must be positive");
    if (maxSeedAttempts == 0) throw std::runtime_error("maxSeedAttempts must be positive");
    if (bisectorEpsilon < 0)  throw std::runtime_error("bisectorEpsilon must be nonnegative");
}

json PartitionOptions::toJSON() const {
    return json{
        {"numSurfacePoints",  numSurfacePoints},
        {"numCutPoints",      numCutPoints},
        {"numSeeds",          numSeeds},
        {"randomSeed",        randomSeed},
        {"deterministicCuts", deterministicCuts},
        {"maxSeedAttempts",   maxSeedAttempts},
        {"bisectorEpsilon",   bisectorEpsilon},
        {"verbose",           verbose}
    };
}

} // namespace voroshell
