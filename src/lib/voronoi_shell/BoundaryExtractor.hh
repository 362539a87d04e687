////////////////////////////////////////////////////////////////////////////////
// BoundaryExtractor.hh
////////////////////////////////////////////////////////////////////////////////
/*! @file
//      Extracts, for every labeled region of a partitioned tetrahedralization,
//      the triangles separating it from differently labeled tetrahedra or from
//      the outside of the triangulation hull.
//
//      A face of tetrahedron t is owned by label(t) exactly when the label on
//      the other side (the neighbor's label, or EXTERIOR across a hull face)
//      differs. EXTERIOR tetrahedra never own faces.
*/
////////////////////////////////////////////////////////////////////////////////
#ifndef BOUNDARYEXTRACTOR_HH
#define BOUNDARYEXTRACTOR_HH

#include "GeometryProvider.hh"
#include "OrientationRepair.hh"
#include <array>
#include <map>
#include <vector>

namespace voroshell {

using Triangle = std::array<size_t, 3>;

// Boundary faces (global point indices) owned by each non-EXTERIOR label.
// Labels without owned faces do not appear.
std::map<int, std::vector<Triangle>> collectBoundaryFaces(const Tetrahedralization &tetrahedralization,
                                                          const std::vector<int> &labels);

// Compact the referenced points into a dense local vertex list (in increasing
// global index order) and remap the faces. Normals are left empty.
RegionMesh compactRegion(int label, const std::vector<Triangle> &faces,
                         const std::vector<Point3d> &points);

// One mesh per label owning at least one face, by increasing label. Winding
// is repaired with "repair" and normals come from geometry.computeNormals.
std::vector<RegionMesh> extractRegionMeshes(const Tetrahedralization &tetrahedralization,
                                            const std::vector<int> &labels,
                                            const std::vector<Point3d> &points,
                                            const GeometryProvider &geometry,
                                            const OrientationRepair &repair,
                                            bool verbose = false);

} // namespace voroshell

#endif /* end of include guard: BOUNDARYEXTRACTOR_HH */
