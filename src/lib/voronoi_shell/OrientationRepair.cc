#include "OrientationRepair.hh"

#include <map>
#include <queue>
#include <stdexcept>
#include <utility>

namespace voroshell {

namespace {

using Edge = std::pair<size_t, size_t>;

Edge canonicalEdge(size_t a, size_t b) { return (a < b) ? Edge(a, b) : Edge(b, a); }

// Whether face "e" traverses the edge a -> b (as opposed to b -> a).
bool traverses(const MeshIO::IOElement &e, size_t a, size_t b) {
    for (size_t i = 0; i < 3; ++i) {
        if ((e[i] == a) && (e[(i + 1) % 3] == b)) return true;
    }
    return false;
}

void flip(MeshIO::IOElement &e) { std::swap(e[1], e[2]); }

}

size_t BFSOrientationRepair::repair(const std::vector<MeshIO::IOVertex> &vertices,
                                    std::vector<MeshIO::IOElement> &elements) const {
    const size_t nf = elements.size();
    for (const auto &e : elements) {
        if (e.size() != 3) throw std::runtime_error("Orientation repair expects triangles");
        for (size_t c : e)
            if (c >= vertices.size()) throw std::runtime_error("Element references a missing vertex");
    }

    std::map<Edge, std::vector<size_t>> edgeFaces;
    for (size_t f = 0; f < nf; ++f) {
        const auto &e = elements[f];
        for (size_t i = 0; i < 3; ++i)
            edgeFaces[canonicalEdge(e[i], e[(i + 1) % 3])].push_back(f);
    }

    std::vector<bool> shouldFlip(nf, false), visited(nf, false);
    std::vector<size_t> component(nf, 0);
    size_t numComponents = 0;

    for (size_t seed = 0; seed < nf; ++seed) {
        if (visited[seed]) continue;
        const size_t ci = numComponents++;
        std::queue<size_t> toProcess;
        toProcess.push(seed);
        visited[seed] = true;
        component[seed] = ci;

        while (!toProcess.empty()) {
            size_t f = toProcess.front();
            toProcess.pop();
            const auto &face = elements[f];
            for (size_t i = 0; i < 3; ++i) {
                const size_t a = face[i], b = face[(i + 1) % 3];
                const auto &adj = edgeFaces.at(canonicalEdge(a, b));
                if (adj.size() != 2) continue;
                const size_t g = (adj[0] == f) ? adj[1] : adj[0];
                if (visited[g] || (g == f)) continue;
                // Consistent neighbors traverse the shared edge in opposite
                // directions.
                bool sameDirection = traverses(elements[g], a, b);
                shouldFlip[g] = (shouldFlip[f] != sameDirection);
                visited[g] = true;
                component[g] = ci;
                toProcess.push(g);
            }
        }
    }

    for (size_t f = 0; f < nf; ++f)
        if (shouldFlip[f]) flip(elements[f]);

    // Orient each component outward: signed volume relative to the
    // component's vertex centroid must be nonnegative.
    std::vector<Point3d> center(numComponents, Point3d::Zero());
    std::vector<size_t>  count(numComponents, 0);
    for (size_t f = 0; f < nf; ++f) {
        for (size_t c : elements[f]) center[component[f]] += vertices[c].point;
        count[component[f]] += 3;
    }
    for (size_t ci = 0; ci < numComponents; ++ci) center[ci] /= double(count[ci]);

    std::vector<double> volume(numComponents, 0.0);
    for (size_t f = 0; f < nf; ++f) {
        const auto &e = elements[f];
        const Point3d &c = center[component[f]];
        const Point3d p0 = vertices[e[0]].point - c,
                      p1 = vertices[e[1]].point - c,
                      p2 = vertices[e[2]].point - c;
        volume[component[f]] += p0.dot(p1.cross(p2)) / 6.0;
    }

    size_t numFlipped = 0;
    for (size_t f = 0; f < nf; ++f) {
        if (volume[component[f]] < 0) {
            flip(elements[f]);
            shouldFlip[f] = !shouldFlip[f];
        }
        if (shouldFlip[f]) ++numFlipped;
    }

    return numFlipped;
}

} // namespace voroshell
