#pragma once
#include <string>
#include <vector>
#include "glm/vec3.hpp"

namespace vb
{
struct Joint
{
  int id;
  std::string name;
  glm::vec3 position;
};

// bind pose of a skinned mesh, joint ids may be sparse
struct Rig
{
  std::string name;
  std::vector<Joint> joints;
  std::vector<glm::vec3> vertices;
};

[[nodiscard]] int load_rig_from_file(const std::string& path, Rig& rig);
Rig create_demo_rig();
} // namespace vb
