////////////////////////////////////////////////////////////////////////////////
// GeometryProvider.hh
////////////////////////////////////////////////////////////////////////////////
/*! @file
//      Abstract base class defining the interface to a 3D domain to be
//      partitioned: inside/outside queries, boundary samples, a bounding box
//      and the per-vertex normal policy applied to extracted region meshes.
*/
////////////////////////////////////////////////////////////////////////////////
#ifndef GEOMETRYPROVIDER_HH
#define GEOMETRYPROVIDER_HH

#include "PartitionTypes.hh"
#include <vector>

namespace voroshell {

struct GeometryProvider {
    virtual bool isInside(const Point3d &p) const = 0;

    // Batched membership test.
    std::vector<bool> contains(const std::vector<Point3d> &pts) const;

    // Samples on the domain boundary. Implementations may ignore "count"
    // (e.g., to return the vertices of an exact boundary mesh).
    virtual std::vector<Point3d> surfacePoints(size_t count) const = 0;

    virtual const BBox3d &boundingBox() const = 0;

    // One normal per vertex of the mesh (vertices, elements). "hintNormals"
    // are normals derived from the mesh faces; a provider may return them
    // verbatim or correct them using its own knowledge of the boundary.
    virtual std::vector<Vector3d> computeNormals(const std::vector<MeshIO::IOVertex>  &vertices,
                                                 const std::vector<MeshIO::IOElement> &elements,
                                                 const std::vector<Vector3d> &hintNormals) const = 0;

    virtual ~GeometryProvider() { }
};

} // namespace voroshell

#endif /* end of include guard: GEOMETRYPROVIDER_HH */
