#include "RegionScene.hh"

#include <MeshFEM/MeshIO.hh>
#include <MeshFEM/MSHFieldWriter.hh>
#include <MeshFEM/Fields.hh>
#include <boost/filesystem.hpp>
#include <fstream>
#include <set>
#include <stdexcept>

namespace fs = boost::filesystem;
using json = nlohmann::json;

namespace voroshell {

void RegionScene::add(std::vector<RegionMesh> regions) {
    // Validate the whole batch first so a failure leaves the scene unchanged.
    std::set<std::string> names;
    for (const auto &n : m_nodes) names.insert(n.name);
    for (const auto &r : regions) {
        const std::string n = nodeName(r.label);
        if (!names.insert(n).second) throw std::runtime_error("Duplicate scene node " + n);
        m_validate(n, r);
    }

    m_nodes.reserve(m_nodes.size() + regions.size());
    for (auto &r : regions) {
        std::string n = nodeName(r.label);
        m_nodes.push_back(Node{n, std::move(r)});
    }
}

void RegionScene::add(const std::string &nodeName, RegionMesh mesh) {
    for (const auto &n : m_nodes) {
        if (n.name == nodeName) throw std::runtime_error("Duplicate scene node " + nodeName);
    }
    m_validate(nodeName, mesh);
    m_nodes.push_back(Node{nodeName, std::move(mesh)});
}

void RegionScene::m_validate(const std::string &nodeName, const RegionMesh &mesh) {
    if (mesh.normals.size() != mesh.vertices.size())
        throw std::runtime_error("Node " + nodeName + " needs one normal per vertex");
}

json RegionScene::manifest() const {
    json regions = json::array();
    for (const auto &n : m_nodes) {
        regions.push_back({
            {"name",        n.name},
            {"label",       n.mesh.label},
            {"numVertices", n.mesh.numVertices()},
            {"numFaces",    n.mesh.numFaces()},
            {"msh",         n.name + ".msh"},
            {"obj",         n.name + ".obj"}
        });
    }
    return json{{"name", m_name}, {"regions", regions}};
}

void RegionScene::save(const std::string &directory, const json &metadata) const {
    fs::path dir(directory);
    if (!fs::exists(dir)) fs::create_directories(dir);
    if (!fs::is_directory(dir)) throw std::runtime_error("Not a directory: " + directory);

    for (const auto &n : m_nodes) {
        const auto &mesh = n.mesh;
        MeshIO::save((dir / (n.name + ".obj")).string(), mesh.vertices, mesh.elements);

        MSHFieldWriter writer((dir / (n.name + ".msh")).string(), mesh.vertices, mesh.elements);
        VectorField<Real, 3> normals(mesh.numVertices());
        for (size_t i = 0; i < mesh.numVertices(); ++i)
            normals(i) = mesh.normals[i];
        writer.addField("normals", normals, DomainType::PER_NODE);
    }

    json m = manifest();
    m["metadata"] = metadata;
    const std::string manifestPath = (dir / "scene.json").string();
    std::ofstream os(manifestPath);
    if (!os.is_open()) throw std::runtime_error("Cannot write " + manifestPath);
    os << m.dump(4) << std::endl;
}

} // namespace voroshell
