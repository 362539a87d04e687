////////////////////////////////////////////////////////////////////////////////
// RegionScene.hh
////////////////////////////////////////////////////////////////////////////////
/*! @file
//      Named collection of region meshes and its export to disk: one .msh
//      file (with a per-vertex "normals" field) and one .obj file per region,
//      plus a scene.json manifest.
*/
////////////////////////////////////////////////////////////////////////////////
#ifndef REGIONSCENE_HH
#define REGIONSCENE_HH

#include "PartitionTypes.hh"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace voroshell {

class RegionScene {
public:
    struct Node {
        std::string name;
        RegionMesh mesh;
    };

    RegionScene(const std::string &name) : m_name(name) { }

    // Adds each mesh under the node name "region_<label>". Either all meshes
    // are added or, if any name is taken or any mesh is invalid, none is.
    void add(std::vector<RegionMesh> regions);
    void add(const std::string &nodeName, RegionMesh mesh);

    static std::string nodeName(int label) { return "region_" + std::to_string(label); }

    const std::string &name() const { return m_name; }
    const std::vector<Node> &nodes() const { return m_nodes; }
    size_t size() const { return m_nodes.size(); }

    nlohmann::json manifest() const;

    // Writes all nodes and the manifest into "directory" (created if needed).
    // "metadata" is stored in the manifest verbatim.
    void save(const std::string &directory, const nlohmann::json &metadata = nlohmann::json::object()) const;

private:
    static void m_validate(const std::string &nodeName, const RegionMesh &mesh);

    std::string m_name;
    std::vector<Node> m_nodes;
};

} // namespace voroshell

#endif /* end of include guard: REGIONSCENE_HH */
