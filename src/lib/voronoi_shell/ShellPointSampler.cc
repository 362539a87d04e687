#include "ShellPointSampler.hh"
#include "KdTree.hh"
#include "Errors.hh"

#include <MeshFEM/GlobalBenchmark.hh>
#include <iostream>
#include <string>

namespace voroshell {

namespace {

Point3d uniformInBox(const BBox3d &bb, std::mt19937 &rng) {
    Point3d p;
    for (size_t d = 0; d < 3; ++d) {
        std::uniform_real_distribution<double> dist(bb.minCorner[d], bb.maxCorner[d]);
        p[d] = dist(rng);
    }
    return p;
}

}

std::vector<Point3d> sampleSeeds(const GeometryProvider &geometry, size_t numSeeds,
                                 size_t maxAttempts, std::mt19937 &rng) {
    const auto &bb = geometry.boundingBox();
    std::vector<Point3d> seeds;
    seeds.reserve(numSeeds);
    size_t attempts = 0;
    while (seeds.size() < numSeeds) {
        if (attempts == maxAttempts) {
            throw SeedSamplingFailed("Placed only " + std::to_string(seeds.size()) + " of " +
                                     std::to_string(numSeeds) + " seeds in " +
                                     std::to_string(maxAttempts) + " attempts; is the domain empty?");
        }
        ++attempts;
        Point3d p = uniformInBox(bb, rng);
        if (geometry.isInside(p)) seeds.push_back(p);
    }
    return seeds;
}

std::vector<Point3d> sampleInteriorCandidates(const GeometryProvider &geometry, size_t numCandidates,
                                              std::mt19937 &rng) {
    const auto &bb = geometry.boundingBox();
    std::vector<Point3d> candidates;
    candidates.reserve(numCandidates);
    for (size_t i = 0; i < numCandidates; ++i)
        candidates.push_back(uniformInBox(bb, rng));

    std::vector<bool> inside = geometry.contains(candidates);
    std::vector<Point3d> result;
    for (size_t i = 0; i < candidates.size(); ++i)
        if (inside[i]) result.push_back(candidates[i]);
    return result;
}

std::vector<Point3d> projectToBisectors(const std::vector<Point3d> &candidates,
                                        const std::vector<Point3d> &seeds,
                                        double epsilon) {
    std::vector<Point3d> result;
    if ((seeds.size() < 2) || candidates.empty()) return result;

    KdTree3d tree(seeds);
    result.reserve(candidates.size());
    for (const auto &c : candidates) {
        std::vector<size_t> nn = tree.kNearest(c, 2);
        const Point3d &s1 = seeds[nn[0]],
                      &s2 = seeds[nn[1]];
        const Vector3d n = s2 - s1;
        const double normSq = n.squaredNorm();
        if (!(normSq > epsilon)) continue;
        const Point3d midpoint = 0.5 * (s1 + s2);
        result.push_back(c - (((c - midpoint).dot(n)) / normSq) * n);
    }
    return result;
}

ShellSamples sampleShellPoints(const GeometryProvider &geometry, const PartitionOptions &options,
                               std::mt19937 &seedRng, std::mt19937 &cutRng) {
    if (options.numSeeds == 0) throw std::runtime_error("At least one seed is required");
    if (options.numCutPoints > PartitionOptions::MAX_CUT_POINTS)
        throw std::runtime_error("Too many cut points requested: " + std::to_string(options.numCutPoints));

    ShellSamples result;

    BENCHMARK_START_TIMER("Surface points");
    result.points = geometry.surfacePoints(options.numSurfacePoints);
    result.numSurfacePoints = result.points.size();
    BENCHMARK_STOP_TIMER("Surface points");

    BENCHMARK_START_TIMER("Seeds");
    result.seeds = sampleSeeds(geometry, options.numSeeds, options.maxSeedAttempts, seedRng);
    BENCHMARK_STOP_TIMER("Seeds");

    BENCHMARK_START_TIMER("Cut points");
    std::vector<Point3d> candidates = sampleInteriorCandidates(geometry, 2 * options.numCutPoints, cutRng);
    std::vector<Point3d> projected = projectToBisectors(candidates, result.seeds, options.bisectorEpsilon);

    // Projection can leave the domain.
    std::vector<bool> inside = geometry.contains(projected);
    for (size_t i = 0; (i < projected.size()) && (result.numCutPoints < options.numCutPoints); ++i) {
        if (!inside[i]) continue;
        result.points.push_back(projected[i]);
        ++result.numCutPoints;
    }
    BENCHMARK_STOP_TIMER("Cut points");

    if (options.verbose) {
        std::cout << "Generated " << result.points.size() << " points" << std::endl;
        std::cout << "Seeds: " << result.seeds.size() << std::endl;
        std::cout << "Surface points: " << result.numSurfacePoints << std::endl;
        std::cout << "Cut points: " << result.numCutPoints << std::endl;
    }

    return result;
}

} // namespace voroshell
