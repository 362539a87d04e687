////////////////////////////////////////////////////////////////////////////////
// rasterize.hh
////////////////////////////////////////////////////////////////////////////////
/*! @file
//      Implements rasterization of a geometry provider to a binary mask
*/
////////////////////////////////////////////////////////////////////////////////
#ifndef RASTERIZE_HH
#define RASTERIZE_HH

#include "GeometryProvider.hh"
#include "BinaryMask.hh"
#include <vector>

namespace voroshell {

// Samples the inside/outside test at the voxel centers of a sizes[0] x
// sizes[1] x sizes[2] grid filling the provider's bounding box.
BinaryMask rasterize(const GeometryProvider &geometry, const std::vector<size_t> &sizes);

} // namespace voroshell

#endif /* end of include guard: RASTERIZE_HH */
