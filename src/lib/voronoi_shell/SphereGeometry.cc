#include "SphereGeometry.hh"
#include "SpherePoints.hh"

#include <cmath>
#include <stdexcept>

namespace voroshell {

constexpr double SphereGeometry::SURFACE_BAND;

SphereGeometry::SphereGeometry(double radius)
    : m_radius(radius),
      m_bbox(Point3d(-radius, -radius, -radius), Point3d(radius, radius, radius))
{
    if (!(radius > 0)) throw std::runtime_error("Sphere radius must be positive");
}

std::vector<Point3d> SphereGeometry::surfacePoints(size_t count) const {
    std::vector<Point3d> pts;
    pts.reserve(count);
    generateSpherePoints(count, pts, m_radius, Point3d(Point3d::Zero()));
    return pts;
}

std::vector<Vector3d> SphereGeometry::computeNormals(const std::vector<MeshIO::IOVertex>  &vertices,
                                                     const std::vector<MeshIO::IOElement> &/* elements */,
                                                     const std::vector<Vector3d> &hintNormals) const {
    if (hintNormals.size() != vertices.size())
        throw std::runtime_error("Normal hint size mismatch");

    std::vector<Vector3d> normals(hintNormals);
    for (size_t i = 0; i < vertices.size(); ++i) {
        const Point3d p = vertices[i].point;
        const double dist = p.norm();
        if ((dist > 0) && (std::abs(dist - m_radius) < SURFACE_BAND))
            normals[i] = p / dist;
    }

    for (auto &n : normals) {
        double len = n.norm();
        if (len > 0) n /= len;
    }
    return normals;
}

} // namespace voroshell
