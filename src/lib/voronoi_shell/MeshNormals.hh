#ifndef MESHNORMALS_HH
#define MESHNORMALS_HH

#include "PartitionTypes.hh"
#include <vector>

namespace voroshell {

// Unnormalized normal of triangle e (length is twice its area).
Vector3d triangleAreaNormal(const std::vector<MeshIO::IOVertex> &vertices, const MeshIO::IOElement &e);

// Area-weighted average of the incident triangle normals, normalized.
// Vertices without incident area get a zero normal.
std::vector<Vector3d> vertexNormalsFromFaces(const std::vector<MeshIO::IOVertex>  &vertices,
                                             const std::vector<MeshIO::IOElement> &elements);

} // namespace voroshell

#endif /* end of include guard: MESHNORMALS_HH */
