////////////////////////////////////////////////////////////////////////////////
// RegionPartitioner.hh
////////////////////////////////////////////////////////////////////////////////
/*! @file
//      Runs the full partitioning pipeline on a geometry provider:
//          shell sampling -> Delaunay tetrahedralization -> nearest-seed
//          labeling with exterior filtering -> per-region boundary extraction
//      Holds no state between runs beyond its options and repair strategy.
*/
////////////////////////////////////////////////////////////////////////////////
#ifndef REGIONPARTITIONER_HH
#define REGIONPARTITIONER_HH

#include "GeometryProvider.hh"
#include "OrientationRepair.hh"
#include "PartitionOptions.hh"
#include "ShellPointSampler.hh"
#include <MeshFEM/Future.hh>
#include <memory>
#include <random>
#include <vector>

namespace voroshell {

struct PartitionResult {
    ShellSamples samples;
    Tetrahedralization tetrahedralization;
    std::vector<int> labels;
    std::vector<RegionMesh> regions;
};

class RegionPartitioner {
public:
    RegionPartitioner(const PartitionOptions &options = PartitionOptions(),
                      std::unique_ptr<OrientationRepair> repair = Future::make_unique<BFSOrientationRepair>());

    // Samples with generators derived from the options.
    PartitionResult partition(const GeometryProvider &geometry) const;

    // Samples with caller-owned generators.
    PartitionResult partition(const GeometryProvider &geometry,
                              std::mt19937 &seedRng, std::mt19937 &cutRng) const;

    // Tetrahedralize, label and extract a previously sampled point set.
    // Deterministic for fixed samples and geometry.
    PartitionResult partition(const GeometryProvider &geometry, ShellSamples samples) const;

          PartitionOptions &options()       { return m_options; }
    const PartitionOptions &options() const { return m_options; }

    void setOrientationRepair(std::unique_ptr<OrientationRepair> repair);

private:
    PartitionOptions m_options;
    std::unique_ptr<OrientationRepair> m_repair;
};

} // namespace voroshell

#endif /* end of include guard: REGIONPARTITIONER_HH */
