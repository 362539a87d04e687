////////////////////////////////////////////////////////////////////////////////
// SphereGeometry.hh
////////////////////////////////////////////////////////////////////////////////
/*! @file
//      Analytic ball of a given radius centered at the origin.
*/
////////////////////////////////////////////////////////////////////////////////
#ifndef SPHEREGEOMETRY_HH
#define SPHEREGEOMETRY_HH

#include "GeometryProvider.hh"

namespace voroshell {

class SphereGeometry : public GeometryProvider {
public:
    // Vertices closer than this to the sphere get the analytic normal.
    static constexpr double SURFACE_BAND = 0.05;

    SphereGeometry(double radius = 1.0);

    virtual bool isInside(const Point3d &p) const override { return p.norm() < m_radius; }

    // Fibonacci spiral with exactly "count" points.
    virtual std::vector<Point3d> surfacePoints(size_t count) const override;

    virtual const BBox3d &boundingBox() const override { return m_bbox; }

    virtual std::vector<Vector3d> computeNormals(const std::vector<MeshIO::IOVertex>  &vertices,
                                                 const std::vector<MeshIO::IOElement> &elements,
                                                 const std::vector<Vector3d> &hintNormals) const override;

    double radius() const { return m_radius; }

    virtual ~SphereGeometry() { }

private:
    double m_radius;
    BBox3d m_bbox;
};

} // namespace voroshell

#endif /* end of include guard: SPHEREGEOMETRY_HH */
