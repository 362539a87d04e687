////////////////////////////////////////////////////////////////////////////////

#include <voronoi_shell/RegionPartitioner.hh>
#include <voronoi_shell/RegionScene.hh>
#include <voronoi_shell/SphereGeometry.hh>
#include <voronoi_shell/MaskGeometry.hh>
#include <voronoi_shell/rasterize.hh>
#include <voronoi_shell/Errors.hh>
#include <MeshFEM/GlobalBenchmark.hh>
#include <CLI/CLI.hpp>
#include <cstdint>
#include <iostream>
#include <MeshFEM/Future.hh>
#include <memory>

using namespace voroshell;

////////////////////////////////////////////////////////////////////////////////

struct Args {
    std::string outDir;
    std::string shape = "sphere";
    std::string config;
    double radius = 1.0;
    size_t maskResolution = 48;
    size_t regions = 0;
    size_t surfacePoints = 0;
    size_t cutPoints = 0;
    uint32_t seed = 0;
    bool verbose = false;
};

////////////////////////////////////////////////////////////////////////////////

int main(int argc, char *argv[]) {
    Args args;

    // Parse arguments
    CLI::App app{"voroshell_cli"};

    app.add_option("outDir",            args.outDir,         "output directory for the region meshes and scene.json")->required();
    app.add_option("--shape",           args.shape,          "domain to partition (sphere, sphere_mask)");
    app.add_option("--radius",          args.radius,         "sphere radius");
    app.add_option("--maskResolution",  args.maskResolution, "voxels per axis when rasterizing the sphere to a mask");
    app.add_option("-c,--config",       args.config,         "partition options file (json)")->check(CLI::ExistingFile);
    app.add_option("-r,--regions",      args.regions,        "number of regions (overrides config)");
    app.add_option("--surfacePoints",   args.surfacePoints,  "number of boundary samples (overrides config)");
    app.add_option("--cutPoints",       args.cutPoints,      "number of bisector samples (overrides config)");
    app.add_option("--seed",            args.seed,           "random seed (overrides config)");
    app.add_flag("-v,--verbose",        args.verbose,        "print progress");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError &e) {
        return app.exit(e);
    }

    PartitionOptions options;
    try {
        if (args.config.size()) options.load(args.config);
    }
    catch (const std::exception &e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
    if (args.regions)       options.numSeeds = args.regions;
    if (args.surfacePoints) options.numSurfacePoints = args.surfacePoints;
    if (args.cutPoints)     options.numCutPoints = args.cutPoints;
    if (app.count("--seed")) options.randomSeed = args.seed;
    if (args.verbose)       options.verbose = true;

    std::unique_ptr<GeometryProvider> geometry;
    try {
        if (args.shape == "sphere") {
            geometry = Future::make_unique<SphereGeometry>(args.radius);
        }
        else if (args.shape == "sphere_mask") {
            const size_t n = args.maskResolution;
            BENCHMARK_START_TIMER_SECTION("Rasterize");
            BinaryMask mask = rasterize(SphereGeometry(args.radius), {n, n, n});
            BENCHMARK_STOP_TIMER_SECTION("Rasterize");
            BENCHMARK_START_TIMER_SECTION("Mask surface");
            geometry = Future::make_unique<MaskGeometry>(std::move(mask));
            BENCHMARK_STOP_TIMER_SECTION("Mask surface");
        }
        else {
            std::cerr << "Error: unknown shape '" << args.shape << "'; expected 'sphere' or 'sphere_mask'" << std::endl;
            return 1;
        }
    }
    catch (const std::exception &e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    std::cout << "Processing " << args.shape << "..." << std::endl;
    RegionPartitioner partitioner(options);
    PartitionResult result;
    try {
        result = partitioner.partition(*geometry);
    }
    catch (const SeedSamplingFailed &e) {
        std::cerr << "Seed sampling failed: " << e.what() << std::endl;
        return 2;
    }
    catch (const DegenerateInputError &e) {
        std::cerr << "Degenerate input: " << e.what() << std::endl;
        return 3;
    }
    catch (const std::exception &e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    RegionScene scene(args.shape);
    try {
        scene.add(std::move(result.regions));
        std::cout << "Exporting " << scene.size() << " regions to " << args.outDir << "..." << std::endl;
        nlohmann::json metadata = options.toJSON();
        metadata["shape"] = args.shape;
        scene.save(args.outDir, metadata);
    }
    catch (const std::exception &e) {
        std::cerr << "Export failed: " << e.what() << std::endl;
        return 4;
    }
    std::cout << "Done." << std::endl;

    BENCHMARK_REPORT();
    return 0;
}
