#include "editor.hpp"

#include "editor_state.hpp"
#include "errors.hpp"
#include "mesh_weight_source.hpp"
#include "settings.hpp"
#include "weight_edit_orchestrator.hpp"
#include "work_context.hpp"
#include "util/timer.hpp"
#include "util/vb_log.hpp"
#include "backends/imgui_impl_sdl3.h"
#include <SDL3/SDL.h>

#include <iostream>

namespace vb
{
namespace
{
const char* settings_path = "settings/vblend.ini";

struct GPUContext
{
    explicit GPUContext(EditorState& state) : wc(vmc)
    {
        vmc.construct(state.get_window_extent().width, state.get_window_extent().height, state.window_x, state.window_y);
        wc.construct(state);
    }

    ~GPUContext()
    {
        wc.destruct();
        vmc.destruct();
    }

    VulkanMainContext vmc;
    WorkContext wc;
};

void load_settings(const Settings& settings, EditorState& state)
{
    auto [width, height] = settings.get_pair("editor/size", {int(state.get_window_extent().width), int(state.get_window_extent().height)});
    if (width > 0 && height > 0) state.set_window_extent(vk::Extent2D(uint32_t(width), uint32_t(height)));
    auto [x, y] = settings.get_pair("editor/pos", {-1, -1});
    state.window_x = x;
    state.window_y = y;
}

void store_settings(Settings& settings, const Window& window)
{
    settings.set_pair("editor/size", window.get_size());
    settings.set_pair("editor/pos", window.get_position());
    if (settings.save() != 0) std::cerr << "Failed to save settings to " << settings.get_path() << std::endl;
}
} // namespace

int run_editor(const Rig& rig)
{
    EditorState state;
    Timer<float> timer;

    Settings settings(settings_path);
    if (settings.load() == 0) load_settings(settings, state);
    else std::cout << "No settings found at " << settings_path << ", using defaults." << std::endl;

    MeshWeightSource mesh(rig);
    WeightEditOrchestrator orchestrator(mesh, mesh);
    std::cout << VB_C_GREEN << "[TIMING] rig setup: " << timer.restart<ms>() << " ms" << VB_C_WHITE << std::endl;

    GPUContext gpu_context(state);
    UI& ui = gpu_context.wc.get_ui();
    ui.set_orchestrator(&orchestrator);
    ui.set_mesh(&mesh);
    ui.set_action_runner([&state](const char* name, const std::function<void()>& action)
    {
        try
        {
            action();
            state.status.clear();
        }
        catch (const Error& e)
        {
            state.status = std::string(name) + ": " + e.what();
            std::cerr << VB_C_YELLOW << "Action '" << name << "' failed" << VB_C_WHITE << std::endl;
        }
    });
    std::cout << VB_C_GREEN << "[TIMING] gpu context: " << timer.restart<ms>() << " ms" << VB_C_WHITE << std::endl;

    bool quit = false;
    bool resized = false;
    Timer rendering_timer;
    SDL_Event e;

    while (!quit)
    {
        if (gpu_context.vmc.window->is_minimized())
        {
            SDL_Delay(10);
        }
        else
        {
            try
            {
                if (resized)
                {
                    state.set_window_extent(gpu_context.wc.recreate_swapchain(state.vsync));
                    resized = false;
                }
                gpu_context.wc.draw_frame(state);
            } catch (const vk::OutOfDateKHRError&)
            {
                state.set_window_extent(gpu_context.wc.recreate_swapchain(state.vsync));
            }
        }

        while (SDL_PollEvent(&e))
        {
            ImGui_ImplSDL3_ProcessEvent(&e);
            if (e.type == SDL_EVENT_QUIT || e.type == SDL_EVENT_WINDOW_CLOSE_REQUESTED) quit = true;
            if (e.type == SDL_EVENT_WINDOW_PIXEL_SIZE_CHANGED) resized = true;
            if (e.type == SDL_EVENT_KEY_UP && e.key.key == SDLK_F2) state.show_ui = !state.show_ui;
        }
        state.time_diff = rendering_timer.restart();
    }

    store_settings(settings, *gpu_context.vmc.window);
    return 0;
}
} // namespace vb
