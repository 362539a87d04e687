#include "MeshNormals.hh"
#include <stdexcept>

namespace voroshell {

Vector3d triangleAreaNormal(const std::vector<MeshIO::IOVertex> &vertices, const MeshIO::IOElement &e) {
    if (e.size() != 3) throw std::runtime_error("Expected triangle elements");
    const Point3d &p0 = vertices.at(e[0]).point,
                  &p1 = vertices.at(e[1]).point,
                  &p2 = vertices.at(e[2]).point;
    return (p1 - p0).cross(p2 - p0);
}

std::vector<Vector3d> vertexNormalsFromFaces(const std::vector<MeshIO::IOVertex>  &vertices,
                                             const std::vector<MeshIO::IOElement> &elements) {
    std::vector<Vector3d> normals(vertices.size(), Vector3d::Zero());
    for (const auto &e : elements) {
        Vector3d n = triangleAreaNormal(vertices, e);
        for (size_t c : e) normals[c] += n;
    }
    for (auto &n : normals) {
        double len = n.norm();
        if (len > 0) n /= len;
    }
    return normals;
}

} // namespace voroshell
