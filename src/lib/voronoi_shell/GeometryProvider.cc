#include "GeometryProvider.hh"

namespace voroshell {

std::vector<bool> GeometryProvider::contains(const std::vector<Point3d> &pts) const {
    std::vector<bool> result(pts.size());
    for (size_t i = 0; i < pts.size(); ++i)
        result[i] = isInside(pts[i]);
    return result;
}

} // namespace voroshell
