#include "KdTree.hh"
#include <MeshFEM/Future.hh>
#include <algorithm>
#include <stdexcept>

namespace voroshell {

template<typename Real, int Dim>
KdTree<Real, Dim>::KdTree(const std::vector<Point> &points)
	: m_PointCloud()
{
	m_PointCloud.pts = points;
	if (points.empty()) return;
	m_Tree = Future::make_unique<KdTreeType>(Dim, m_PointCloud, nanoflann::KDTreeSingleIndexAdaptorParams(10 /* max leaf */));
	m_Tree->buildIndex();
}

template<typename Real, int Dim>
size_t KdTree<Real, Dim>::nearest(const Point &p) const
{
	auto result = kNearest(p, 1);
	return result.front();
}

template<typename Real, int Dim>
std::vector<size_t> KdTree<Real, Dim>::kNearest(const Point &p, size_t k) const
{
	if (size() == 0) throw std::runtime_error("Nearest-neighbor query on an empty point set");
	const size_t numResults = std::min(k, size());
	if (numResults == 0) return std::vector<size_t>();
	std::vector<size_t> indices(numResults);
	std::vector<Real> distSqr(numResults);
	nanoflann::KNNResultSet<Real> resultSet(numResults);
	resultSet.init(indices.data(), distSqr.data());
	m_Tree->findNeighbors(resultSet, p.data(), nanoflann::SearchParams());
	indices.resize(resultSet.size());
	return indices;
}

template class KdTree<double, 3>;

} // namespace voroshell
