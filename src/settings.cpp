#include "settings.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>

namespace vb
{
namespace
{
std::string trim(const std::string& text)
{
    size_t first = text.find_first_not_of(" \t\r");
    if (first == std::string::npos) return "";
    size_t last = text.find_last_not_of(" \t\r");
    return text.substr(first, last - first + 1);
}
} // namespace

Settings::Settings(std::string path) : path(std::move(path))
{}

int Settings::load()
{
    if (!std::filesystem::exists(path)) return 1;
    std::ifstream file(path);
    if (!file.is_open())
    {
        std::cerr << "Failed to open settings file: " << path << std::endl;
        return 1;
    }

    values.clear();
    std::string line;
    while (std::getline(file, line))
    {
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;
        size_t separator = line.find('=');
        if (separator == std::string::npos)
        {
            std::cerr << "Skipping malformed settings line: " << line << std::endl;
            continue;
        }
        values[trim(line.substr(0, separator))] = trim(line.substr(separator + 1));
    }
    return 0;
}

int Settings::save() const
{
    std::filesystem::path file_path(path);
    if (file_path.has_parent_path() && !std::filesystem::exists(file_path.parent_path())) std::filesystem::create_directories(file_path.parent_path());

    std::ofstream file(path);
    if (!file.is_open())
    {
        std::cerr << "Failed to open settings file for writing: " << path << std::endl;
        return 1;
    }
    for (const auto& [key, value] : values) file << key << "=" << value << "\n";
    return file.good() ? 0 : 1;
}

bool Settings::contains(const std::string& key) const
{
    return values.count(key) > 0;
}

std::string Settings::get(const std::string& key, const std::string& fallback) const
{
    auto found = values.find(key);
    return found != values.end() ? found->second : fallback;
}

void Settings::set(const std::string& key, const std::string& value)
{
    values[key] = value;
}

std::pair<int, int> Settings::get_pair(const std::string& key, std::pair<int, int> fallback) const
{
    auto found = values.find(key);
    if (found == values.end()) return fallback;

    std::stringstream ss(found->second);
    std::pair<int, int> value;
    if (!(ss >> value.first >> value.second)) return fallback;
    return value;
}

void Settings::set_pair(const std::string& key, std::pair<int, int> value)
{
    values[key] = std::to_string(value.first) + " " + std::to_string(value.second);
}
} // namespace vb
