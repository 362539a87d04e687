#include "BoundaryExtractor.hh"
#include "MeshNormals.hh"

#include <MeshFEM/GlobalBenchmark.hh>
#include <algorithm>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <string>

namespace voroshell {

std::map<int, std::vector<Triangle>> collectBoundaryFaces(const Tetrahedralization &tetrahedralization,
                                                          const std::vector<int> &labels) {
    const size_t nt = tetrahedralization.numTets();
    if (labels.size() != nt)
        throw std::runtime_error("Expected one label per tetrahedron");
    if (tetrahedralization.neighbors.size() != nt)
        throw std::runtime_error("Expected one neighbor entry per tetrahedron");

    std::map<int, std::vector<Triangle>> result;
    for (size_t t = 0; t < nt; ++t) {
        const int label = labels[t];
        if (label == EXTERIOR) continue;

        const auto &tet = tetrahedralization.tets[t];
        for (size_t i = 0; i < 4; ++i) {
            const int n = tetrahedralization.neighbors[t][i];
            const int otherLabel = (n == NO_NEIGHBOR) ? EXTERIOR : labels.at(n);
            if (otherLabel == label) continue;
            result[label].push_back({{tet[TET_FACE_VERTICES[i][0]],
                                      tet[TET_FACE_VERTICES[i][1]],
                                      tet[TET_FACE_VERTICES[i][2]]}});
        }
    }
    return result;
}

RegionMesh compactRegion(int label, const std::vector<Triangle> &faces,
                         const std::vector<Point3d> &points) {
    RegionMesh mesh;
    mesh.label = label;

    for (const auto &f : faces) {
        for (size_t v : f) {
            if (v >= points.size())
                throw std::runtime_error("Face references point " + std::to_string(v) + " out of range");
            mesh.globalVertexIndices.push_back(v);
        }
    }
    std::sort(mesh.globalVertexIndices.begin(), mesh.globalVertexIndices.end());
    mesh.globalVertexIndices.erase(std::unique(mesh.globalVertexIndices.begin(), mesh.globalVertexIndices.end()),
                                   mesh.globalVertexIndices.end());

    const size_t invalidId = std::numeric_limits<size_t>::max();
    std::vector<size_t> localId(points.size(), invalidId);
    mesh.vertices.reserve(mesh.globalVertexIndices.size());
    for (size_t i = 0; i < mesh.globalVertexIndices.size(); ++i) {
        const size_t g = mesh.globalVertexIndices[i];
        localId[g] = i;
        mesh.vertices.emplace_back(points[g]);
    }

    mesh.elements.reserve(faces.size());
    for (const auto &f : faces)
        mesh.elements.emplace_back(localId[f[0]], localId[f[1]], localId[f[2]]);

    return mesh;
}

std::vector<RegionMesh> extractRegionMeshes(const Tetrahedralization &tetrahedralization,
                                            const std::vector<int> &labels,
                                            const std::vector<Point3d> &points,
                                            const GeometryProvider &geometry,
                                            const OrientationRepair &repair,
                                            bool verbose) {
    BENCHMARK_START_TIMER("Collect boundary faces");
    auto regionFaces = collectBoundaryFaces(tetrahedralization, labels);
    BENCHMARK_STOP_TIMER("Collect boundary faces");

    std::vector<RegionMesh> regions;
    regions.reserve(regionFaces.size());
    for (const auto &entry : regionFaces) {
        RegionMesh mesh = compactRegion(entry.first, entry.second, points);

        try {
            size_t numFlipped = repair.repair(mesh.vertices, mesh.elements);
            if (verbose && numFlipped)
                std::cout << "Region " << mesh.label << ": flipped " << numFlipped << " faces" << std::endl;
        }
        catch (const std::exception &e) {
            std::cerr << "WARNING: orientation repair failed for region " << mesh.label
                      << ": " << e.what() << std::endl;
        }

        std::vector<Vector3d> hint = vertexNormalsFromFaces(mesh.vertices, mesh.elements);
        mesh.normals = geometry.computeNormals(mesh.vertices, mesh.elements, hint);
        if (mesh.normals.size() != mesh.vertices.size())
            throw std::runtime_error("Geometry returned " + std::to_string(mesh.normals.size()) +
                                     " normals for " + std::to_string(mesh.vertices.size()) + " vertices");

        if (verbose) {
            std::cout << "Region " << mesh.label << ": " << mesh.numVertices() << " vertices, "
                      << mesh.numFaces() << " faces" << std::endl;
        }
        regions.push_back(std::move(mesh));
    }

    return regions;
}

} // namespace voroshell
