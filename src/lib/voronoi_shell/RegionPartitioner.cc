#include "RegionPartitioner.hh"
#include "BoundaryExtractor.hh"
#include "TetPartitioner.hh"

#include <MeshFEM/GlobalBenchmark.hh>
#include <iostream>
#include <stdexcept>

namespace voroshell {

RegionPartitioner::RegionPartitioner(const PartitionOptions &options,
                                     std::unique_ptr<OrientationRepair> repair)
    : m_options(options)
{
    setOrientationRepair(std::move(repair));
}

void RegionPartitioner::setOrientationRepair(std::unique_ptr<OrientationRepair> repair) {
    if (!repair) throw std::runtime_error("An orientation repair strategy is required");
    m_repair = std::move(repair);
}

PartitionResult RegionPartitioner::partition(const GeometryProvider &geometry) const {
    std::mt19937 seedRng(m_options.randomSeed);
    std::mt19937 cutRng;
    if (m_options.deterministicCuts) {
        cutRng.seed(m_options.randomSeed + 1);
    }
    else {
        std::random_device rd;
        cutRng.seed(rd());
    }
    return partition(geometry, seedRng, cutRng);
}

PartitionResult RegionPartitioner::partition(const GeometryProvider &geometry,
                                             std::mt19937 &seedRng, std::mt19937 &cutRng) const {
    BENCHMARK_START_TIMER_SECTION("Sample shell points");
    ShellSamples samples = sampleShellPoints(geometry, m_options, seedRng, cutRng);
    BENCHMARK_STOP_TIMER_SECTION("Sample shell points");

    return partition(geometry, std::move(samples));
}

PartitionResult RegionPartitioner::partition(const GeometryProvider &geometry, ShellSamples samples) const {
    PartitionResult result;
    result.samples = std::move(samples);

    const auto &points = result.samples.points;
    if (m_options.verbose) std::cout << "Triangulating " << points.size() << " points..." << std::endl;

    BENCHMARK_START_TIMER_SECTION("Tetrahedralize");
    result.tetrahedralization = tetrahedralize(points);
    BENCHMARK_STOP_TIMER_SECTION("Tetrahedralize");

    if (m_options.verbose) std::cout << "Partitioning " << result.tetrahedralization.numTets() << " tetrahedra..." << std::endl;

    BENCHMARK_START_TIMER_SECTION("Partition tetrahedra");
    result.labels = partitionTetrahedra(result.tetrahedralization, points, result.samples.seeds,
                                        geometry, m_options.verbose);
    BENCHMARK_STOP_TIMER_SECTION("Partition tetrahedra");

    BENCHMARK_START_TIMER_SECTION("Extract region meshes");
    result.regions = extractRegionMeshes(result.tetrahedralization, result.labels, points,
                                         geometry, *m_repair, m_options.verbose);
    BENCHMARK_STOP_TIMER_SECTION("Extract region meshes");

    if (m_options.verbose) std::cout << "Extracted " << result.regions.size() << " region meshes." << std::endl;

    return result;
}

} // namespace voroshell
