////////////////////////////////////////////////////////////////////////////////
// rasterize.cc
////////////////////////////////////////////////////////////////////////////////
/*! @file
//      Implements rasterization of a geometry provider to a binary mask
*/
////////////////////////////////////////////////////////////////////////////////
#include "rasterize.hh"
#include <stdexcept>

namespace voroshell {

BinaryMask rasterize(const GeometryProvider &geometry, const std::vector<size_t> &sizes) {
    if (sizes.size() != 3) throw std::runtime_error("Expected 3 rasterization dimensions.");
    for (size_t s : sizes)
        if (s == 0) throw std::runtime_error("Rasterization dimensions must be nonzero.");

    BinaryMask mask(sizes[0], sizes[1], sizes[2]);

    const auto &bb = geometry.boundingBox();
    Vector3d scale = bb.dimensions();
    for (size_t d = 0; d < 3; ++d) scale[d] /= sizes[d];
    // Flat bounding box dimensions still need a positive spacing.
    for (size_t d = 0; d < 3; ++d) if (!(scale[d] > 0)) scale[d] = 1.0;

    mask.spacing = scale;
    // Voxel values live at integer indices, so index 0 maps to the first
    // voxel center.
    mask.origin = bb.minCorner + 0.5 * scale;

    for (size_t k = 0; k < sizes[2]; ++k) {
        for (size_t j = 0; j < sizes[1]; ++j) {
            for (size_t i = 0; i < sizes[0]; ++i) {
                Point3d center = mask.indexToWorld(Point3d(double(i), double(j), double(k)));
                mask.set(i, j, k, geometry.isInside(center));
            }
        }
    }

    return mask;
}

} // namespace voroshell
