////////////////////////////////////////////////////////////////////////////////
// BinaryMask.hh
////////////////////////////////////////////////////////////////////////////////
/*! @file
//      Binary voxel volume with an affine index-to-world transform:
//          world = origin + direction * (index .* spacing)
//      Voxel (i, j, k) carries its value at the integer index position and is
//      stored at i + nx * (j + ny * k).
*/
////////////////////////////////////////////////////////////////////////////////
#ifndef BINARYMASK_HH
#define BINARYMASK_HH

#include "PartitionTypes.hh"
#include <array>
#include <stdexcept>
#include <string>
#include <vector>

namespace voroshell {

struct BinaryMask {
    std::array<size_t, 3> dims{{0, 0, 0}};
    Point3d         origin    = Point3d::Zero();
    Vector3d        spacing   = Vector3d::Ones();
    Eigen::Matrix3d direction = Eigen::Matrix3d::Identity();
    std::vector<bool> data;

    BinaryMask() { }
    BinaryMask(size_t nx, size_t ny, size_t nz)
        : dims{{nx, ny, nz}}, data(nx * ny * nz, false) { }

    size_t numVoxels() const { return dims[0] * dims[1] * dims[2]; }

    size_t index(size_t i, size_t j, size_t k) const { return i + dims[0] * (j + dims[1] * k); }

    bool get(size_t i, size_t j, size_t k) const { return data[index(i, j, k)]; }
    void set(size_t i, size_t j, size_t k, bool value) { data[index(i, j, k)] = value; }

    // Value at a possibly out-of-range index; the mask is empty outside its grid.
    double valueAt(long i, long j, long k) const {
        if ((i < 0) || (j < 0) || (k < 0)) return 0.0;
        if ((size_t(i) >= dims[0]) || (size_t(j) >= dims[1]) || (size_t(k) >= dims[2])) return 0.0;
        return get(i, j, k) ? 1.0 : 0.0;
    }

    Point3d indexToWorld(const Point3d &idx) const {
        return origin + direction * idx.cwiseProduct(spacing);
    }

    void validate() const {
        if (data.size() != numVoxels())
            throw std::runtime_error("Mask data size " + std::to_string(data.size()) +
                                     " does not match its dimensions");
        for (size_t d = 0; d < 3; ++d) {
            if (!(spacing[d] > 0)) throw std::runtime_error("Mask spacing must be positive");
        }
    }
};

} // namespace voroshell

#endif /* end of include guard: BINARYMASK_HH */
