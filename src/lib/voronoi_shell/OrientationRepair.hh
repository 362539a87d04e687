////////////////////////////////////////////////////////////////////////////////
// OrientationRepair.hh
////////////////////////////////////////////////////////////////////////////////
/*! @file
//      Strategies for making the winding of a triangle soup consistent so
//      that face normals point out of the enclosed volume. Repairs are best
//      effort: patches that cannot be resolved are left as they are.
*/
////////////////////////////////////////////////////////////////////////////////
#ifndef ORIENTATIONREPAIR_HH
#define ORIENTATIONREPAIR_HH

#include "PartitionTypes.hh"
#include <vector>

namespace voroshell {

class OrientationRepair {
public:
    // Reorients "elements" in place; returns the number of flipped faces.
    virtual size_t repair(const std::vector<MeshIO::IOVertex> &vertices,
                          std::vector<MeshIO::IOElement> &elements) const = 0;

    virtual ~OrientationRepair() = default;
};

// Propagates the winding of an arbitrary starting face across manifold edges
// (edges shared by exactly two faces) by breadth-first search, then flips
// each edge-connected component whose signed volume is negative.
// Non-manifold edges are not traversed, so components joined only through
// them are oriented independently.
class BFSOrientationRepair : public OrientationRepair {
public:
    virtual size_t repair(const std::vector<MeshIO::IOVertex> &vertices,
                          std::vector<MeshIO::IOElement> &elements) const override;

    virtual ~BFSOrientationRepair() = default;
};

// Leaves the winding untouched.
class NoOrientationRepair : public OrientationRepair {
public:
    virtual size_t repair(const std::vector<MeshIO::IOVertex> &/* vertices */,
                          std::vector<MeshIO::IOElement> &/* elements */) const override { return 0; }

    virtual ~NoOrientationRepair() = default;
};

} // namespace voroshell

#endif /* end of include guard: ORIENTATIONREPAIR_HH */
