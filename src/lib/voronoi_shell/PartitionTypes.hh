////////////////////////////////////////////////////////////////////////////////
// PartitionTypes.hh
////////////////////////////////////////////////////////////////////////////////
/*! @file
//      Basic types shared by the shell sampler, the tetrahedral partitioner
//      and the boundary extractor.
*/
////////////////////////////////////////////////////////////////////////////////
#ifndef PARTITIONTYPES_HH
#define PARTITIONTYPES_HH

#include <MeshFEM/Geometry.hh>
#include <MeshFEM/MeshIO.hh>
#include <Eigen/Dense>
#include <array>
#include <vector>

namespace voroshell {

using  Point3d = Eigen::Matrix<double, 3, 1>;
using Vector3d = Eigen::Matrix<double, 3, 1>;

using BBox3d = BBox<Point3d>;

// Label assigned to tetrahedra whose centroid lies outside the domain.
constexpr int EXTERIOR = -1;

// Marker for tetrahedron faces on the convex hull.
constexpr int NO_NEIGHBOR = -1;

// Local vertex indices of the face opposite vertex i of a tetrahedron.
constexpr size_t TET_FACE_VERTICES[4][3] = {
    {1, 2, 3}, {0, 2, 3}, {0, 1, 3}, {0, 1, 2}
};

struct Tetrahedralization {
    std::vector<std::array<size_t, 4>> tets;
    // neighbors[t][i] is the tetrahedron across the face opposite vertex i of
    // tetrahedron t, or NO_NEIGHBOR on the hull.
    std::vector<std::array<int, 4>> neighbors;

    size_t numTets() const { return tets.size(); }

    Point3d centroid(size_t t, const std::vector<Point3d> &points) const {
        Point3d c(Point3d::Zero());
        for (size_t v : tets[t]) c += points[v];
        return c / 4.0;
    }
};

// Boundary surface of one labeled region, reindexed to a dense local range.
struct RegionMesh {
    int label = EXTERIOR;
    std::vector<MeshIO::IOVertex>  vertices;
    std::vector<MeshIO::IOElement> elements;
    std::vector<Vector3d>          normals;
    // Local vertex i is global point globalVertexIndices[i].
    std::vector<size_t> globalVertexIndices;

    size_t numVertices() const { return vertices.size(); }
    size_t numFaces()    const { return elements.size(); }
};

} // namespace voroshell

#endif /* end of include guard: PARTITIONTYPES_HH */
