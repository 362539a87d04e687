////////////////////////////////////////////////////////////////////////////////
#include "test_common.hh"
#include <voronoi_shell/TetPartitioner.hh>
#include <voronoi_shell/SphereGeometry.hh>
#include <voronoi_shell/SpherePoints.hh>
#include <voronoi_shell/Errors.hh>
#include <catch2/catch.hpp>
#include <cmath>
#include <limits>
#include <random>
////////////////////////////////////////////////////////////////////////////////

using namespace voroshell;

namespace {

std::vector<Point3d> cubeWithCenter() {
    std::vector<Point3d> pts;
    for (size_t k = 0; k < 2; ++k)
        for (size_t j = 0; j < 2; ++j)
            for (size_t i = 0; i < 2; ++i)
                pts.emplace_back(double(i), double(j), double(k));
    pts.emplace_back(0.5, 0.5, 0.5);
    return pts;
}

std::vector<Point3d> spherePointsWithInterior() {
    std::vector<Point3d> pts;
    generateSpherePoints(200, pts, 1.0, Point3d(Point3d::Zero()));
    std::mt19937 gen(5);
    std::uniform_real_distribution<double> dist(-0.5, 0.5);
    for (size_t i = 0; i < 100; ++i)
        pts.emplace_back(dist(gen), dist(gen), dist(gen));
    return pts;
}

}

////////////////////////////////////////////////////////////////////////////////

TEST_CASE("tetrahedralize_degenerate", "[tetrahedralize]") {
    SECTION("too_few_points") {
        std::vector<Point3d> pts = { Point3d(0, 0, 0), Point3d(1, 0, 0), Point3d(0, 1, 0) };
        REQUIRE_THROWS_AS(tetrahedralize(pts), DegenerateInputError);
    }

    SECTION("coplanar") {
        std::vector<Point3d> pts;
        for (size_t i = 0; i < 10; ++i)
            pts.emplace_back(std::cos(i * 0.6), std::sin(i * 0.6), 0.0);
        REQUIRE_THROWS_AS(tetrahedralize(pts), DegenerateInputError);
    }

    SECTION("duplicates_only") {
        std::vector<Point3d> pts(6, Point3d(1, 2, 3));
        REQUIRE_THROWS_AS(tetrahedralize(pts), DegenerateInputError);
    }

    SECTION("non_finite") {
        auto pts = cubeWithCenter();
        pts[3][1] = std::numeric_limits<double>::quiet_NaN();
        REQUIRE_THROWS_AS(tetrahedralize(pts), DegenerateInputError);
    }
}

TEST_CASE("tetrahedralize_adjacency", "[tetrahedralize]") {
    const auto pts = cubeWithCenter();
    Tetrahedralization tr = tetrahedralize(pts);
    REQUIRE(tr.numTets() > 0);
    REQUIRE(tr.neighbors.size() == tr.numTets());

    size_t numHullFaces = 0;
    for (size_t t = 0; t < tr.numTets(); ++t) {
        const auto &tet = tr.tets[t];
        for (size_t i = 0; i < 4; ++i) {
            REQUIRE(tet[i] < pts.size());
            for (size_t j = i + 1; j < 4; ++j) REQUIRE(tet[i] != tet[j]);
        }

        for (size_t i = 0; i < 4; ++i) {
            const int n = tr.neighbors[t][i];
            auto face = test::sortedFace(tet[TET_FACE_VERTICES[i][0]],
                                         tet[TET_FACE_VERTICES[i][1]],
                                         tet[TET_FACE_VERTICES[i][2]]);
            if (n == NO_NEIGHBOR) { ++numHullFaces; continue; }
            REQUIRE(n >= 0);
            REQUIRE(size_t(n) < tr.numTets());

            // Symmetric adjacency through the same face
            bool found = false;
            for (size_t j = 0; j < 4; ++j) {
                if (tr.neighbors[n][j] != int(t)) continue;
                const auto &ntet = tr.tets[n];
                auto nface = test::sortedFace(ntet[TET_FACE_VERTICES[j][0]],
                                              ntet[TET_FACE_VERTICES[j][1]],
                                              ntet[TET_FACE_VERTICES[j][2]]);
                REQUIRE(nface == face);
                found = true;
            }
            REQUIRE(found);
        }
    }

    // Each of the 6 cube faces is split into two triangles.
    REQUIRE(numHullFaces == 12);
}

TEST_CASE("partition_labels", "[partition]") {
    const auto pts = spherePointsWithInterior();
    Tetrahedralization tr = tetrahedralize(pts);
    std::vector<Point3d> seeds = { Point3d(0.5, 0, 0), Point3d(-0.5, 0, 0), Point3d(0, 0.5, 0) };

    SECTION("voronoi_assignment") {
        SphereGeometry sphere(1.0);
        auto labels = partitionTetrahedra(tr, pts, seeds, sphere);
        REQUIRE(labels.size() == tr.numTets());
        for (size_t t = 0; t < tr.numTets(); ++t) {
            REQUIRE(labels[t] >= EXTERIOR);
            REQUIRE(labels[t] < int(seeds.size()));
            Point3d c = tr.centroid(t, pts);
            if (labels[t] == EXTERIOR) {
                REQUIRE(!sphere.isInside(c));
                continue;
            }
            for (size_t s = 0; s < seeds.size(); ++s)
                REQUIRE((c - seeds[labels[t]]).norm() <= (c - seeds[s]).norm() + 1e-12);
        }
    }

    SECTION("exterior_takes_precedence") {
        test::HalfBoxGeometry half;
        auto labels = partitionTetrahedra(tr, pts, seeds, half);
        size_t numExterior = 0;
        for (size_t t = 0; t < tr.numTets(); ++t) {
            bool inside = half.isInside(tr.centroid(t, pts));
            REQUIRE((labels[t] == EXTERIOR) == !inside);
            numExterior += !inside;
        }
        REQUIRE(numExterior > 0);
        REQUIRE(numExterior < tr.numTets());
    }

    SECTION("empty_domain") {
        test::EmptyGeometry empty;
        auto labels = partitionTetrahedra(tr, pts, seeds, empty);
        for (int l : labels) REQUIRE(l == EXTERIOR);
    }

    SECTION("deterministic") {
        SphereGeometry sphere(1.0);
        Tetrahedralization tr2 = tetrahedralize(pts);
        REQUIRE(tr2.tets == tr.tets);
        REQUIRE(tr2.neighbors == tr.neighbors);
        REQUIRE(partitionTetrahedra(tr, pts, seeds, sphere) == partitionTetrahedra(tr2, pts, seeds, sphere));
    }

    SECTION("no_seeds") {
        SphereGeometry sphere(1.0);
        REQUIRE_THROWS_AS(partitionTetrahedra(tr, pts, {}, sphere), std::runtime_error);
    }
}
