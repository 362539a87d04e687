#include "TetPartitioner.hh"
#include "KdTree.hh"
#include "Errors.hh"

#include <MeshFEM/GlobalBenchmark.hh>
#include "DisableWarnings.hh"
#include <CGAL/Exact_predicates_inexact_constructions_kernel.h>
#include <CGAL/Delaunay_triangulation_3.h>
#include <CGAL/Delaunay_triangulation_cell_base_3.h>
#include <CGAL/Triangulation_vertex_base_with_info_3.h>
#include "EnableWarnings.hh"

#include <iostream>
#include <map>
#include <string>
#include <utility>

namespace voroshell {

// Kernel
typedef CGAL::Exact_predicates_inexact_constructions_kernel K;

// Vertices carry the index of the point they were created from.
typedef CGAL::Triangulation_vertex_base_with_info_3<size_t, K> Vb;
typedef CGAL::Delaunay_triangulation_cell_base_3<K>            Cb;
typedef CGAL::Triangulation_data_structure_3<Vb, Cb>           Tds;
typedef CGAL::Delaunay_triangulation_3<K, Tds>                 Delaunay;
typedef K::Point_3 Point;

Tetrahedralization tetrahedralize(const std::vector<Point3d> &points) {
    if (points.size() < 4)
        throw DegenerateInputError("Tetrahedralization needs at least 4 points; got " + std::to_string(points.size()));

    std::vector<std::pair<Point, size_t>> input;
    input.reserve(points.size());
    for (size_t i = 0; i < points.size(); ++i) {
        const auto &p = points[i];
        if (!p.allFinite())
            throw DegenerateInputError("Non-finite coordinate in point " + std::to_string(i));
        input.emplace_back(Point(p[0], p[1], p[2]), i);
    }

    BENCHMARK_START_TIMER("Delaunay_triangulation_3");
    Delaunay dt(input.begin(), input.end());
    BENCHMARK_STOP_TIMER("Delaunay_triangulation_3");

    if (dt.dimension() < 3)
        throw DegenerateInputError("Points span only " + std::to_string(dt.dimension()) +
                                   " dimension(s); need 4 affinely independent points");

    // Number the finite cells
    std::map<Delaunay::Cell_handle, int> cellIndex;
    int numCells = 0;
    for (auto c = dt.finite_cells_begin(); c != dt.finite_cells_end(); ++c) {
        Delaunay::Cell_handle ch = c;
        cellIndex.emplace(ch, numCells++);
    }

    Tetrahedralization result;
    result.tets.reserve(numCells);
    result.neighbors.reserve(numCells);
    for (auto c = dt.finite_cells_begin(); c != dt.finite_cells_end(); ++c) {
        std::array<size_t, 4> tet;
        std::array<int, 4> nbrs;
        for (int i = 0; i < 4; ++i) {
            tet[i] = c->vertex(i)->info();
            // CGAL's neighbor(i) is opposite vertex(i), matching TET_FACE_VERTICES.
            Delaunay::Cell_handle n = c->neighbor(i);
            nbrs[i] = dt.is_infinite(n) ? NO_NEIGHBOR : cellIndex.at(n);
        }
        result.tets.push_back(tet);
        result.neighbors.push_back(nbrs);
    }

    return result;
}

std::vector<int> partitionTetrahedra(const Tetrahedralization &tetrahedralization,
                                     const std::vector<Point3d> &points,
                                     const std::vector<Point3d> &seeds,
                                     const GeometryProvider &geometry,
                                     bool verbose) {
    if (seeds.empty()) throw std::runtime_error("Partitioning requires at least one seed");

    const size_t nt = tetrahedralization.numTets();
    std::vector<Point3d> centroids;
    centroids.reserve(nt);
    for (size_t t = 0; t < nt; ++t)
        centroids.push_back(tetrahedralization.centroid(t, points));

    // Voronoi partition
    KdTree3d tree(seeds);
    std::vector<int> labels(nt);
    for (size_t t = 0; t < nt; ++t)
        labels[t] = int(tree.nearest(centroids[t]));

    // Geometry filter: takes precedence over the Voronoi label.
    std::vector<bool> inside = geometry.contains(centroids);
    size_t numExterior = 0;
    for (size_t t = 0; t < nt; ++t) {
        if (inside[t]) continue;
        labels[t] = EXTERIOR;
        ++numExterior;
    }

    if (verbose) std::cout << "Removed " << numExterior << " exterior tetrahedra of " << nt << "." << std::endl;

    return labels;
}

} // namespace voroshell
