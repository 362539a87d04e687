////////////////////////////////////////////////////////////////////////////////
#include "test_common.hh"
#include <voronoi_shell/RegionPartitioner.hh>
#include <voronoi_shell/RegionScene.hh>
#include <voronoi_shell/SphereGeometry.hh>
#include <voronoi_shell/MaskGeometry.hh>
#include <voronoi_shell/rasterize.hh>
#include <voronoi_shell/Errors.hh>
#include <catch2/catch.hpp>
#include <boost/filesystem.hpp>
#include <fstream>
#include <set>
////////////////////////////////////////////////////////////////////////////////

using namespace voroshell;
namespace fs = boost::filesystem;

namespace {

void checkRegions(const PartitionResult &result, size_t numSeeds) {
    REQUIRE(result.labels.size() == result.tetrahedralization.numTets());
    REQUIRE(result.regions.size() <= numSeeds);

    std::set<int> labels;
    for (const auto &r : result.regions) {
        REQUIRE(r.label >= 0);
        REQUIRE(r.label < int(numSeeds));
        REQUIRE(labels.insert(r.label).second);

        REQUIRE(r.numFaces() > 0);
        REQUIRE(r.normals.size() == r.numVertices());
        REQUIRE(r.globalVertexIndices.size() == r.numVertices());
        for (size_t i = 0; i < r.numVertices(); ++i) {
            const size_t g = r.globalVertexIndices[i];
            REQUIRE(g < result.samples.points.size());
            REQUIRE((r.vertices[i].point - result.samples.points[g]).norm() == 0);
        }
        for (const auto &e : r.elements) {
            REQUIRE(e.size() == 3);
            for (size_t c : e) REQUIRE(c < r.numVertices());
        }
    }
}

}

////////////////////////////////////////////////////////////////////////////////

TEST_CASE("sphere_partition", "[pipeline]") {
    PartitionOptions opts;
    opts.numSurfacePoints = 2000;
    opts.numCutPoints     = 4000;
    opts.numSeeds         = 8;
    RegionPartitioner partitioner(opts);
    SphereGeometry sphere(1.0);

    PartitionResult result = partitioner.partition(sphere);
    REQUIRE(result.samples.numSurfacePoints == 2000);
    REQUIRE(result.samples.numCutPoints <= 4000);
    REQUIRE(result.samples.seeds.size() == 8);
    checkRegions(result, 8);
    REQUIRE(result.regions.size() > 1);

    for (const auto &r : result.regions) {
        for (size_t i = 0; i < r.numVertices(); ++i) {
            const Point3d &p = r.vertices[i].point;
            for (size_t d = 0; d < 3; ++d) REQUIRE(std::abs(p[d]) <= 1.0 + 1e-9);
            // Boundary vertices get the analytic normal.
            if (std::abs(p.norm() - 1.0) < SphereGeometry::SURFACE_BAND)
                REQUIRE((r.normals[i] - p.normalized()).norm() < 1e-9);
        }
    }

    SECTION("reproducible") {
        PartitionResult again = partitioner.partition(sphere);
        REQUIRE(again.samples.seeds  == result.samples.seeds);
        REQUIRE(again.samples.points == result.samples.points);
        REQUIRE(again.labels == result.labels);
    }

    SECTION("fixed_samples_are_deterministic") {
        PartitionResult a = partitioner.partition(sphere, result.samples);
        PartitionResult b = partitioner.partition(sphere, result.samples);
        REQUIRE(a.labels == b.labels);
        REQUIRE(a.labels == result.labels);
        REQUIRE(a.regions.size() == b.regions.size());
        for (size_t i = 0; i < a.regions.size(); ++i) {
            REQUIRE(a.regions[i].label == b.regions[i].label);
            REQUIRE(a.regions[i].globalVertexIndices == b.regions[i].globalVertexIndices);
            REQUIRE(a.regions[i].numFaces() == b.regions[i].numFaces());
            for (size_t f = 0; f < a.regions[i].numFaces(); ++f) {
                const auto &ea = a.regions[i].elements[f],
                           &eb = b.regions[i].elements[f];
                REQUIRE(ea.size() == eb.size());
                for (size_t c = 0; c < ea.size(); ++c) REQUIRE(ea[c] == eb[c]);
            }
        }
    }

    SECTION("caller_owned_generators") {
        std::mt19937 seedRng(opts.randomSeed), cutRng(opts.randomSeed + 1);
        PartitionResult c = partitioner.partition(sphere, seedRng, cutRng);
        REQUIRE(c.samples.points == result.samples.points);
    }
}

TEST_CASE("sphere_partition_full_size", "[pipeline]") {
    PartitionOptions opts;
    opts.numSurfacePoints = 5000;
    opts.numCutPoints     = 10000;
    opts.numSeeds         = 8;
    SphereGeometry sphere(1.0);

    PartitionResult result = RegionPartitioner(opts).partition(sphere);
    REQUIRE(result.samples.numSurfacePoints == 5000);
    REQUIRE(result.samples.numCutPoints <= 10000);
    checkRegions(result, 8);
    REQUIRE(!result.regions.empty());
    REQUIRE(result.regions.size() <= 8);

    std::set<int> distinctLabels(result.labels.begin(), result.labels.end());
    REQUIRE(distinctLabels.size() <= 9);

    const auto &bb = sphere.boundingBox();
    for (const auto &r : result.regions) {
        for (const auto &v : r.vertices) {
            for (size_t d = 0; d < 3; ++d) {
                REQUIRE(v.point[d] >= bb.minCorner[d] - 1e-12);
                REQUIRE(v.point[d] <= bb.maxCorner[d] + 1e-12);
            }
        }
    }
}

TEST_CASE("single_region_is_hull", "[pipeline]") {
    PartitionOptions opts;
    opts.numSurfacePoints = 500;
    opts.numCutPoints     = 1000;
    opts.numSeeds         = 1;
    RegionPartitioner partitioner(opts);
    SphereGeometry sphere(1.0);

    PartitionResult result = partitioner.partition(sphere);
    REQUIRE(result.samples.numCutPoints == 0);
    REQUIRE(result.samples.points.size() == 500);
    checkRegions(result, 1);

    // Every tetrahedron of a point set inscribed in the sphere lies inside it.
    for (int l : result.labels) REQUIRE(l == 0);

    REQUIRE(result.regions.size() == 1);
    const auto &r = result.regions[0];
    REQUIRE(r.numVertices() == 500);
    REQUIRE(r.numFaces() == 2 * 500 - 4);
    REQUIRE(test::facesPointAwayFrom(r.vertices, r.elements, Point3d::Zero()));
}

TEST_CASE("partition_failures", "[pipeline]") {
    SECTION("seed_sampling_exhausted") {
        PartitionOptions opts;
        opts.numSurfacePoints = 100;
        opts.maxSeedAttempts  = 50;
        RegionPartitioner partitioner(opts);
        test::EmptyGeometry empty;
        REQUIRE_THROWS_AS(partitioner.partition(empty), SeedSamplingFailed);
    }

    SECTION("degenerate_samples") {
        RegionPartitioner partitioner;
        SphereGeometry sphere(1.0);
        ShellSamples samples;
        samples.points = { Point3d(0, 0, 0), Point3d(0.1, 0, 0), Point3d(0, 0.1, 0) };
        samples.seeds  = { Point3d(0, 0, 0) };
        samples.numSurfacePoints = 3;
        REQUIRE_THROWS_AS(partitioner.partition(sphere, samples), DegenerateInputError);
    }

    SECTION("null_repair") {
        RegionPartitioner partitioner;
        REQUIRE_THROWS_AS(partitioner.setOrientationRepair(nullptr), std::runtime_error);
    }
}

TEST_CASE("region_scene", "[pipeline]") {
    PartitionOptions opts;
    opts.numSurfacePoints = 400;
    opts.numCutPoints     = 800;
    opts.numSeeds         = 3;
    SphereGeometry sphere(1.0);
    PartitionResult result = RegionPartitioner(opts).partition(sphere);
    REQUIRE(!result.regions.empty());

    RegionScene scene("sphere");
    scene.add(result.regions);
    REQUIRE(scene.size() == result.regions.size());
    REQUIRE(scene.nodes()[0].name == RegionScene::nodeName(result.regions[0].label));

    SECTION("duplicate_node") {
        REQUIRE_THROWS_AS(scene.add(scene.nodes()[0].name, result.regions[0]), std::runtime_error);
    }

    SECTION("batch_add_is_all_or_nothing") {
        RegionScene partial("partial");
        partial.add(RegionScene::nodeName(result.regions[0].label), result.regions[0]);

        // The second mesh collides with the existing node.
        std::vector<RegionMesh> batch;
        RegionMesh fresh = result.regions[0];
        fresh.label = 100;
        batch.push_back(fresh);
        batch.push_back(result.regions[0]);
        REQUIRE_THROWS_AS(partial.add(batch), std::runtime_error);
        REQUIRE(partial.size() == 1);

        // Duplicates within one batch
        std::vector<RegionMesh> twice = { fresh, fresh };
        REQUIRE_THROWS_AS(partial.add(twice), std::runtime_error);
        REQUIRE(partial.size() == 1);

        // A later invalid mesh rejects the whole batch.
        RegionMesh bare = fresh;
        bare.label = 101;
        bare.normals.clear();
        std::vector<RegionMesh> withBare = { fresh, bare };
        REQUIRE_THROWS_AS(partial.add(withBare), std::runtime_error);
        REQUIRE(partial.size() == 1);

        partial.add(std::vector<RegionMesh>{ fresh });
        REQUIRE(partial.size() == 2);
    }

    SECTION("missing_normals") {
        RegionMesh bare = result.regions[0];
        bare.normals.clear();
        REQUIRE_THROWS_AS(scene.add("bare", bare), std::runtime_error);
    }

    SECTION("manifest") {
        auto m = scene.manifest();
        REQUIRE(m["name"] == "sphere");
        REQUIRE(m["regions"].size() == scene.size());
        REQUIRE(m["regions"][0]["numFaces"].get<size_t>() == result.regions[0].numFaces());
    }

    SECTION("save") {
        fs::path dir = fs::temp_directory_path() / fs::unique_path("voroshell-%%%%-%%%%");
        scene.save(dir.string(), opts.toJSON());
        for (const auto &n : scene.nodes()) {
            REQUIRE(fs::exists(dir / (n.name + ".msh")));
            REQUIRE(fs::exists(dir / (n.name + ".obj")));
        }
        REQUIRE(fs::exists(dir / "scene.json"));

        std::ifstream is((dir / "scene.json").string());
        nlohmann::json m;
        is >> m;
        REQUIRE(m["metadata"]["numSeeds"] == 3);
        fs::remove_all(dir);
    }
}

#if HAS_LIBIGL
TEST_CASE("mask_partition", "[pipeline]") {
    SphereGeometry sphere(1.0);
    MaskGeometry mask(rasterize(sphere, {16, 16, 16}));

    PartitionOptions opts;
    opts.numCutPoints = 2000;
    opts.numSeeds     = 4;
    PartitionResult result = RegionPartitioner(opts).partition(mask);

    REQUIRE(result.samples.numSurfacePoints == size_t(mask.surfaceVertices().rows()));
    checkRegions(result, 4);
    REQUIRE(!result.regions.empty());
    for (int l : result.labels) REQUIRE(l >= EXTERIOR);
}
#endif // HAS_LIBIGL
