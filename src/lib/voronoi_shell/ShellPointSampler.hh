////////////////////////////////////////////////////////////////////////////////
// ShellPointSampler.hh
////////////////////////////////////////////////////////////////////////////////
/*! @file
//      Generates the point set to be tetrahedralized: samples on the domain
//      boundary followed by samples on the bisector planes between region
//      seeds ("cut" points). Interior points elsewhere are never generated, so
//      the tetrahedralization resolves only the region interfaces.
*/
////////////////////////////////////////////////////////////////////////////////
#ifndef SHELLPOINTSAMPLER_HH
#define SHELLPOINTSAMPLER_HH

#include "GeometryProvider.hh"
#include "PartitionOptions.hh"
#include <random>
#include <vector>

namespace voroshell {

struct ShellSamples {
    // Boundary points followed by cut points.
    std::vector<Point3d> points;
    // Region representatives; the region id is the index in this list.
    std::vector<Point3d> seeds;
    size_t numSurfacePoints = 0;
    size_t numCutPoints     = 0;
};

// Rejection-sample numSeeds points inside the domain. Throws
// SeedSamplingFailed after maxAttempts draws.
std::vector<Point3d> sampleSeeds(const GeometryProvider &geometry, size_t numSeeds,
                                 size_t maxAttempts, std::mt19937 &rng);

// Uniform samples in the bounding box that pass the membership test.
std::vector<Point3d> sampleInteriorCandidates(const GeometryProvider &geometry, size_t numCandidates,
                                              std::mt19937 &rng);

// Orthogonally project each candidate onto the bisector plane of its two
// nearest seeds. Candidates whose two nearest seeds are (numerically)
// coincident are dropped, as are all candidates when fewer than two seeds
// exist. Survivors keep their relative order.
std::vector<Point3d> projectToBisectors(const std::vector<Point3d> &candidates,
                                        const std::vector<Point3d> &seeds,
                                        double epsilon = 1e-8);

ShellSamples sampleShellPoints(const GeometryProvider &geometry, const PartitionOptions &options,
                               std::mt19937 &seedRng, std::mt19937 &cutRng);

} // namespace voroshell

#endif /* end of include guard: SHELLPOINTSAMPLER_HH */
