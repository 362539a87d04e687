#include "MaskGeometry.hh"

#include <cmath>
#include <iostream>
#include <limits>
#include <stdexcept>

#if HAS_LIBIGL
#include <igl/copyleft/marching_cubes.h>
#endif

namespace voroshell {

MaskGeometry::MaskGeometry(BinaryMask mask)
    : m_mask(std::move(mask))
{
    m_mask.validate();

    if (std::abs(m_mask.direction.determinant()) < 1e-12) {
        std::cerr << "WARNING: singular mask direction matrix; using identity for the inverse transform" << std::endl;
        m_invDirection.setIdentity();
    }
    else {
        m_invDirection = m_mask.direction.inverse();
    }

    // Index-space extent of the nonzero voxels
    const auto &dims = m_mask.dims;
    Eigen::Vector3d minIdx = Eigen::Vector3d::Constant( std::numeric_limits<double>::max());
    Eigen::Vector3d maxIdx = Eigen::Vector3d::Constant(-std::numeric_limits<double>::max());
    size_t numSet = 0;
    for (size_t k = 0; k < dims[2]; ++k) {
        for (size_t j = 0; j < dims[1]; ++j) {
            for (size_t i = 0; i < dims[0]; ++i) {
                if (!m_mask.get(i, j, k)) continue;
                Eigen::Vector3d idx(double(i), double(j), double(k));
                minIdx = minIdx.cwiseMin(idx);
                maxIdx = maxIdx.cwiseMax(idx);
                ++numSet;
            }
        }
    }
    if (numSet == 0) throw std::runtime_error("Mask has no voxels set");

    // Voxel values sit at integer indices, so the 0.5 isosurface lies within
    // half a voxel of the extreme set voxels.
    Point3d p1 = m_mask.indexToWorld(minIdx - Eigen::Vector3d::Constant(0.5));
    Point3d p2 = m_mask.indexToWorld(maxIdx + Eigen::Vector3d::Constant(0.5));
    m_bbox = BBox3d(p1.cwiseMin(p2), p1.cwiseMax(p2));

    m_extractSurface();
}

double MaskGeometry::interpolate(const Point3d &p) const {
    const Point3d idx = worldToIndex(p);
    if (!idx.allFinite()) return 0.0;

    const Eigen::Vector3d f = idx.array().floor().matrix();
    const long i0 = long(f[0]), j0 = long(f[1]), k0 = long(f[2]);
    const Eigen::Vector3d t = idx - f;

    double result = 0.0;
    for (int dk = 0; dk < 2; ++dk) {
        const double wk = dk ? t[2] : 1.0 - t[2];
        for (int dj = 0; dj < 2; ++dj) {
            const double wj = dj ? t[1] : 1.0 - t[1];
            for (int di = 0; di < 2; ++di) {
                const double wi = di ? t[0] : 1.0 - t[0];
                result += wi * wj * wk * m_mask.valueAt(i0 + di, j0 + dj, k0 + dk);
            }
        }
    }
    return result;
}

std::vector<Point3d> MaskGeometry::surfacePoints(size_t /* count */) const {
    std::vector<Point3d> pts;
    pts.reserve(m_surfaceV.rows());
    for (int i = 0; i < m_surfaceV.rows(); ++i)
        pts.emplace_back(m_surfaceV(i, 0), m_surfaceV(i, 1), m_surfaceV(i, 2));
    return pts;
}

std::vector<Vector3d> MaskGeometry::computeNormals(const std::vector<MeshIO::IOVertex>  &vertices,
                                                   const std::vector<MeshIO::IOElement> &/* elements */,
                                                   const std::vector<Vector3d> &hintNormals) const {
    if (hintNormals.size() != vertices.size())
        throw std::runtime_error("Normal hint size mismatch");
    return hintNormals;
}

#if HAS_LIBIGL

void MaskGeometry::m_extractSurface() {
    // Sample on a grid padded by one empty voxel on each side so that the
    // extracted surface is closed wherever the mask touches its border.
    const size_t gx = m_mask.dims[0] + 2,
                 gy = m_mask.dims[1] + 2,
                 gz = m_mask.dims[2] + 2;
    const size_t nsamples = gx * gy * gz;

    // Flattened to be accessed as:
    // xi + gx * (yi + gy * zi)
    Eigen::MatrixXd sampleLocations(nsamples, 3);
    Eigen::VectorXd values(nsamples);
    size_t s = 0;
    for (size_t zi = 0; zi < gz; ++zi) {
        for (size_t yi = 0; yi < gy; ++yi) {
            for (size_t xi = 0; xi < gx; ++xi) {
                const long i = long(xi) - 1, j = long(yi) - 1, k = long(zi) - 1;
                sampleLocations.row(s) = m_mask.indexToWorld(Point3d(double(i), double(j), double(k))).transpose();
                // Negative inside, matching the signed distance convention.
                values(s) = 0.5 - m_mask.valueAt(i, j, k);
                ++s;
            }
        }
    }

    igl::copyleft::marching_cubes(values, sampleLocations, gx, gy, gz, m_surfaceV, m_surfaceF);

    if (m_surfaceV.rows() == 0)
        std::cerr << "WARNING: marching cubes produced an empty mask surface" << std::endl;
}

#else // !HAS_LIBIGL

void MaskGeometry::m_extractSurface() {
    throw std::runtime_error("LIBIGL unavailable");
}

#endif // HAS_LIBIGL

} // namespace voroshell
