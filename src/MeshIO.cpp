#include "MeshIO.hpp"
#include <iostream>
#include <fstream>
#include <sstream>
#include <iomanip>
#include <map>
#include <limits>

namespace V2M {
namespace MeshIO {

namespace {

// Parses the vertex part of an OBJ face token ("7", "7/1", "7//3", "-2")
bool parseFaceIndex(const std::string& token, int num_vertices, int& index) {
    std::string head = token.substr(0, token.find('/'));
    if (head.empty()) return false;

    int value = 0;
    try {
        value = std::stoi(head);
    } catch (const std::exception&) {
        return false;
    }

    if (value > 0) {
        index = value - 1;
    } else if (value < 0) {
        index = num_vertices + value;
    } else {
        return false;
    }
    return index >= 0 && index < num_vertices;
}

} // namespace

bool readObj(const std::string& filename, std::vector<SurfaceMesh>& structures) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        std::cerr << "MeshIO: Cannot open file: " << filename << std::endl;
        return false;
    }

    std::vector<std::array<double, 3>> all_vertices;

    // Vertices belong to the object that is open when they are declared;
    // faces reference global vertex numbers and are re-indexed per object.
    struct RawObject {
        std::string name;
        std::map<int, int> local;   // global -> local vertex index
        std::vector<int> order;     // local -> global
        std::vector<std::array<int, 3>> faces;

        int localIndex(int global) {
            auto it = local.find(global);
            if (it != local.end()) return it->second;
            int id = static_cast<int>(order.size());
            local[global] = id;
            order.push_back(global);
            return id;
        }
    };
    std::vector<RawObject> objects;

    std::string line;
    int line_num = 0;

    while (std::getline(file, line)) {
        line_num++;
        std::istringstream ss(line);
        std::string tag;
        if (!(ss >> tag) || tag[0] == '#') {
            continue;
        }

        if (tag == "v") {
            std::array<double, 3> p{};
            if (!(ss >> p[0] >> p[1] >> p[2])) {
                std::cerr << "MeshIO: Invalid vertex at line " << line_num
                          << " of " << filename << std::endl;
                return false;
            }
            if (objects.empty()) {
                objects.emplace_back();
            }
            objects.back().localIndex(static_cast<int>(all_vertices.size()));
            all_vertices.push_back(p);
        } else if (tag == "o" || tag == "g") {
            std::string name;
            std::getline(ss >> std::ws, name);
            // "o name" directly followed by "g name" describes one object
            if (!objects.empty() && objects.back().order.empty() &&
                objects.back().faces.empty()) {
                objects.back().name = name;
            } else {
                objects.emplace_back();
                objects.back().name = name;
            }
        } else if (tag == "f") {
            if (objects.empty()) {
                objects.emplace_back();
            }
            std::vector<int> corners;
            std::string token;
            while (ss >> token) {
                int idx = 0;
                if (!parseFaceIndex(token, static_cast<int>(all_vertices.size()), idx)) {
                    std::cerr << "MeshIO: Invalid face index '" << token
                              << "' at line " << line_num << " of " << filename << std::endl;
                    return false;
                }
                corners.push_back(objects.back().localIndex(idx));
            }
            if (corners.size() < 3) {
                std::cerr << "MeshIO: Face with fewer than 3 vertices at line "
                          << line_num << " of " << filename << std::endl;
                return false;
            }
            for (size_t k = 1; k + 1 < corners.size(); ++k) {
                objects.back().faces.push_back({corners[0], corners[k], corners[k + 1]});
            }
        }
        // vn, vt, usemtl, s, ... are not needed for templates
    }

    structures.clear();
    for (size_t o = 0; o < objects.size(); ++o) {
        const RawObject& raw = objects[o];
        if (raw.order.empty()) continue;

        SurfaceMesh mesh;
        mesh.name = raw.name.empty() ? "structure_" + std::to_string(structures.size())
                                     : raw.name;
        mesh.vertices.reserve(raw.order.size());
        for (int g : raw.order) {
            mesh.vertices.push_back(all_vertices[g]);
        }
        mesh.faces = raw.faces;
        structures.push_back(std::move(mesh));
    }

    if (structures.empty()) {
        std::cerr << "MeshIO: No vertices in file: " << filename << std::endl;
        return false;
    }
    return true;
}

bool writeObj(const std::string& filename, const SurfaceMesh& mesh) {
    return writeObj(filename, std::vector<SurfaceMesh>{mesh});
}

bool writeObj(const std::string& filename, const std::vector<SurfaceMesh>& structures) {
    std::ofstream file(filename);
    if (!file.is_open()) {
        std::cerr << "MeshIO: Cannot create file: " << filename << std::endl;
        return false;
    }

    file << std::setprecision(std::numeric_limits<double>::max_digits10);

    int offset = 1;  // OBJ indices are 1-based and global
    for (const auto& mesh : structures) {
        if (!mesh.name.empty()) {
            file << "o " << mesh.name << "\n";
        }
        for (const auto& v : mesh.vertices) {
            file << "v " << v[0] << " " << v[1] << " " << v[2] << "\n";
        }
        for (const auto& f : mesh.faces) {
            file << "f " << f[0] + offset << " " << f[1] + offset << " "
                 << f[2] + offset << "\n";
        }
        offset += mesh.numVertices();
    }

    if (!file) {
        std::cerr << "MeshIO: Write failed for file: " << filename << std::endl;
        return false;
    }
    return true;
}

} // namespace MeshIO
} // namespace V2M
