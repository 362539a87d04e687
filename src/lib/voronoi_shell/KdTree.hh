#pragma once

////////////////////////////////////////////////////////////////////////////////
#include <nanoflann.hpp>
#include <Eigen/Dense>
#include <memory>
#include <vector>
////////////////////////////////////////////////////////////////////////////////

namespace voroshell {

template<typename Real, int Dim>
struct PointCloud
{
	using Point = Eigen::Matrix<Real, Dim, 1>;

	std::vector<Point> pts;

	// Must return the number of data points
	inline size_t kdtree_get_point_count() const { return pts.size(); }

	// Returns the dim'th component of the idx'th point in the class
	inline Real kdtree_get_pt(const size_t idx, const size_t dim) const { return pts[idx][dim]; }

	// Optional bounding-box computation: return false to default to a standard bbox computation loop.
	template <class BBOX>
	bool kdtree_get_bbox(BBOX& /* bb */) const { return false; }
};

////////////////////////////////////////////////////////////////////////////////

// Nearest-neighbor index over a point set fixed at construction.
template<typename Real, int Dim>
class KdTree {
public:

	using KdTreeType = nanoflann::KDTreeSingleIndexAdaptor<
		nanoflann::L2_Simple_Adaptor<Real, PointCloud<Real, Dim> >,
		PointCloud<Real, Dim>,
		Dim>;

	using Point = typename PointCloud<Real, Dim>::Point;

public:
	KdTree(const std::vector<Point> &points);

	// The tree refers to m_PointCloud by address.
	KdTree(KdTree&&) = delete;
	KdTree& operator=(KdTree&&) = delete;
	KdTree(const KdTree&) = delete;
	KdTree& operator=(const KdTree&) = delete;

	size_t size() const { return m_PointCloud.pts.size(); }

	// Index of the point closest to p.
	size_t nearest(const Point &p) const;

	// Indices of the min(k, size()) points closest to p, by increasing distance.
	std::vector<size_t> kNearest(const Point &p, size_t k) const;

protected:
	PointCloud<Real, Dim> m_PointCloud;
	std::unique_ptr<KdTreeType> m_Tree;
};

////////////////////////////////////////////////////////////////////////////////

using KdTree3d = KdTree<double, 3>;

} // namespace voroshell
