#include "editor.hpp"
#include "rig.hpp"

#include <iostream>

int main(int argc, char* argv[])
{
    vb::Rig rig;
    if (argc > 1)
    {
        std::string path = argv[1];
        std::cout << "Loading rig from file: " << path << std::endl;
        if (vb::load_rig_from_file(path, rig) != 0)
        {
            std::cerr << "Failed to load rig!" << std::endl;
            return 1;
        }
    } else
    {
        std::cout << "No file provided. Using the demo rig." << std::endl;
        rig = vb::create_demo_rig();
    }

    try
    {
        return vb::run_editor(rig);
    }
    catch (const std::exception& e)
    {
        std::cerr << "Editor stopped: " << e.what() << std::endl;
        return 1;
    }
}
