////////////////////////////////////////////////////////////////////////////////
// MaskGeometry.hh
////////////////////////////////////////////////////////////////////////////////
/*! @file
//      Domain defined by a binary voxel mask. Membership is decided by
//      thresholding the trilinear interpolation of the mask at 0.5, and the
//      boundary is the 0.5 isosurface extracted once with libigl's marching
//      cubes. Its vertices are used verbatim as boundary samples.
*/
////////////////////////////////////////////////////////////////////////////////
#ifndef MASKGEOMETRY_HH
#define MASKGEOMETRY_HH

#include "GeometryProvider.hh"
#include "BinaryMask.hh"

namespace voroshell {

class MaskGeometry : public GeometryProvider {
public:
    MaskGeometry(BinaryMask mask);

    virtual bool isInside(const Point3d &p) const override { return interpolate(p) > 0.5; }

    // Returns the vertices of the boundary mesh; "count" is ignored.
    virtual std::vector<Point3d> surfacePoints(size_t count) const override;

    virtual const BBox3d &boundingBox() const override { return m_bbox; }

    // Mesh-derived normals are trusted as they are.
    virtual std::vector<Vector3d> computeNormals(const std::vector<MeshIO::IOVertex>  &vertices,
                                                 const std::vector<MeshIO::IOElement> &elements,
                                                 const std::vector<Vector3d> &hintNormals) const override;

    // Trilinearly interpolated mask value at a world position.
    double interpolate(const Point3d &p) const;

    Point3d worldToIndex(const Point3d &p) const {
        return (m_invDirection * (p - m_mask.origin)).cwiseQuotient(m_mask.spacing);
    }

    const BinaryMask &mask() const { return m_mask; }
    const Eigen::MatrixXd &surfaceVertices() const { return m_surfaceV; }
    const Eigen::MatrixXi &surfaceFaces()    const { return m_surfaceF; }

    virtual ~MaskGeometry() { }

private:
    void m_extractSurface();

    BinaryMask m_mask;
    Eigen::Matrix3d m_invDirection;
    BBox3d m_bbox;

    Eigen::MatrixXd m_surfaceV;
    Eigen::MatrixXi m_surfaceF;
};

} // namespace voroshell

#endif /* end of include guard: MASKGEOMETRY_HH */
