/**
 * @file BlogForgeApp.hpp
 * @brief Main application class for the BlogForge dashboard.
 */

#pragma once

#include <memory>
#include <string>

#include "ui/DashboardState.hpp"

struct SDL_Window;

namespace blogforge::app {

/**
 * @class BlogForgeApp
 * @brief Orchestrates the dashboard lifecycle, including initialization, the main loop, and shutdown.
 */
class BlogForgeApp {
public:
    /**
     * @brief Starts the application main loop.
     * @return Exit code (0 for success).
     */
    int Run();

private:
    /**
     * @brief Loads settings, wires the services and initializes SDL, OpenGL and ImGui.
     * @return True if initialization succeeded.
     */
    bool Init();
    bool InitServices();
    bool InitWindow();
    bool InitImGui();

    /** @brief Feeds pending SDL events to ImGui. @return False once the user asked to quit. */
    bool PumpEvents();

    /**
     * @brief Cleans up all resources before exiting.
     */
    void Shutdown();

    std::unique_ptr<ui::DashboardState> m_state; ///< Dashboard state, created once settings are loaded.
    SDL_Window* m_window = nullptr; ///< SDL window handle.
    void* m_glContext = nullptr; ///< OpenGL context.
    bool m_sdlInitialized = false; ///< Flag indicating SDL initialization status.
    bool m_imguiInitialized = false;
    bool m_backendsInitialized = false;
    std::string m_videoDriver; ///< SDL driver hint from settings.json, empty for SDL's choice.
};

} // namespace blogforge::app
