#include "rig.hpp"

#include <fstream>
#include <iostream>
#include <sstream>
#include <filesystem>
#include <set>
#include <cstdint>

namespace vb
{
[[nodiscard]] int load_rig_from_file(const std::string& path, Rig& rig)
{
    std::ifstream rig_file(path);
    if (!rig_file.is_open())
    {
        std::cerr << "Failed to open rig file: " << path << std::endl;
        return 1;
    }
    rig.name = std::filesystem::path(path).stem().string();
    rig.joints.clear();
    rig.vertices.clear();

    std::set<int> joint_ids;
    std::string line;
    uint32_t line_number = 0;

    // every line is either empty, a comment, an influence or a vertex
    while (std::getline(rig_file, line))
    {
        ++line_number;
        line.erase(0, line.find_first_not_of(" \t\r"));
        if (line.empty() || line[0] == '#') continue;

        if (line.find("influence:") == 0)
        {
            std::stringstream ss(line.substr(10)); // skip "influence:"
            Joint joint;
            if (!(ss >> joint.id >> joint.name >> joint.position.x >> joint.position.y >> joint.position.z) || joint.id < 0)
            {
                std::cerr << "Failed to parse influence in line " << line_number << ": " << line << std::endl;
                return 1;
            }
            if (!joint_ids.insert(joint.id).second)
            {
                std::cerr << "Duplicate influence id " << joint.id << " in line " << line_number << std::endl;
                return 1;
            }
            rig.joints.push_back(joint);
        }
        else if (line.find("vertex:") == 0)
        {
            std::stringstream ss(line.substr(7)); // skip "vertex:"
            glm::vec3 position;
            if (!(ss >> position.x >> position.y >> position.z))
            {
                std::cerr << "Failed to parse vertex in line " << line_number << ": " << line << std::endl;
                return 1;
            }
            rig.vertices.push_back(position);
        }
        else
        {
            std::cerr << "Unknown entry in line " << line_number << ": " << line << std::endl;
            return 1;
        }
    }

    if (rig.joints.empty() || rig.vertices.empty())
    {
        std::cerr << "Rig needs at least one influence and one vertex!" << std::endl;
        return 1;
    }
    std::cout << "Parsed rig " << rig.name << ": " << rig.joints.size() << " influences, " << rig.vertices.size() << " vertices" << std::endl;
    return 0;
}

Rig create_demo_rig()
{
    Rig rig;
    rig.name = "body";
    // id 3 is left free so the influence list has a null slot
    rig.joints = {
        {0, "Root", glm::vec3(0.0f, 0.0f, 0.0f)},
        {1, "Spine", glm::vec3(0.0f, 1.0f, 0.0f)},
        {2, "L_Arm", glm::vec3(-1.0f, 1.5f, 0.0f)},
        {4, "R_Arm", glm::vec3(1.0f, 1.5f, 0.0f)},
        {5, "Head", glm::vec3(0.0f, 2.0f, 0.0f)},
    };

    // torso
    for (uint32_t level = 0; level < 9; ++level)
    {
        float y = 0.25f * float(level);
        rig.vertices.emplace_back(-0.2f, y, 0.0f);
        rig.vertices.emplace_back(0.2f, y, 0.0f);
    }
    // arms
    for (uint32_t i = 0; i < 5; ++i)
    {
        float x = 0.4f + 0.25f * float(i);
        rig.vertices.emplace_back(-x, 1.5f, 0.0f);
        rig.vertices.emplace_back(x, 1.5f, 0.0f);
    }
    return rig;
}
} // namespace vb
