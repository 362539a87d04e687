////////////////////////////////////////////////////////////////////////////////
// TetPartitioner.hh
////////////////////////////////////////////////////////////////////////////////
/*! @file
//      Delaunay tetrahedralization of the shell points and assignment of each
//      tetrahedron to a region by nearest-seed (Voronoi) lookup of its
//      centroid. Tetrahedra with a centroid outside the domain are labeled
//      EXTERIOR regardless of their nearest seed.
*/
////////////////////////////////////////////////////////////////////////////////
#ifndef TETPARTITIONER_HH
#define TETPARTITIONER_HH

#include "GeometryProvider.hh"
#include <vector>

namespace voroshell {

// Delaunay tetrahedralization of the full point set with per-face neighbor
// adjacency. Throws DegenerateInputError if the points do not span 3D.
Tetrahedralization tetrahedralize(const std::vector<Point3d> &points);

// One label per tetrahedron: the index of the nearest seed to its centroid,
// or EXTERIOR if the centroid lies outside the domain.
std::vector<int> partitionTetrahedra(const Tetrahedralization &tetrahedralization,
                                     const std::vector<Point3d> &points,
                                     const std::vector<Point3d> &seeds,
                                     const GeometryProvider &geometry,
                                     bool verbose = false);

} // namespace voroshell

#endif /* end of include guard: TETPARTITIONER_HH */
