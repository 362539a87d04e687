////////////////////////////////////////////////////////////////////////////////
// SpherePoints.hh
////////////////////////////////////////////////////////////////////////////////
/*! @file
//      Generates points approximately evenly distributed on a sphere using a
//      Fibonacci (golden angle) spiral. Point i has polar angle
//      acos(1 - 2 (i + 1/2) / n) and azimuth 2 pi i / phi, so neither pole is
//      sampled exactly.
*/
////////////////////////////////////////////////////////////////////////////////
#ifndef SPHEREPOINTS_HH
#define SPHEREPOINTS_HH
#include <cmath>

namespace voroshell {

// Append numPts points sampled on a unit sphere to "pts"
template<class OutputCollection, typename Real = double>
void generateSpherePoints(size_t numPts, OutputCollection &pts) {
    const Real goldenRatio = (1.0 + std::sqrt(5.0)) / 2.0;
    for (size_t i = 0; i < numPts; ++i) {
        Real theta = 2.0 * M_PI * i / goldenRatio;
        Real phi   = std::acos(1.0 - 2.0 * (i + 0.5) / numPts);
        pts.emplace_back(std::sin(phi) * std::cos(theta),
                         std::sin(phi) * std::sin(theta),
                         std::cos(phi));
    }
}

// Append to "pts" numPts sampled on a sphere of radius "r" and center "c"
template<class OutputCollection, typename Real, class Pt>
void generateSpherePoints(size_t numPts, OutputCollection &pts, Real r, const Pt &c) {
    size_t offset = pts.size();
    generateSpherePoints(numPts, pts);
    for (size_t i = offset; i < pts.size(); ++i) {
        pts[i] *= r;
        pts[i] += c;
    }
}

} // namespace voroshell

#endif /* end of include guard: SPHEREPOINTS_HH */
