#pragma once
#include <map>
#include <string>
#include <utility>

namespace vb
{
// flat key=value file, keys like "editor/size"
class Settings
{
public:
  explicit Settings(std::string path);

  [[nodiscard]] int load();
  [[nodiscard]] int save() const;

  bool contains(const std::string& key) const;
  std::string get(const std::string& key, const std::string& fallback = "") const;
  void set(const std::string& key, const std::string& value);

  // two integers separated by a space, fallback if missing or malformed
  std::pair<int, int> get_pair(const std::string& key, std::pair<int, int> fallback) const;
  void set_pair(const std::string& key, std::pair<int, int> value);

  const std::string& get_path() const { return path; }

private:
  std::string path;
  std::map<std::string, std::string> values;
};
} // namespace vb
