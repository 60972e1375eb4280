/**
 * @file BlogForgeApp.cpp
 * @brief Implementation of the BlogForgeApp class.
 */
#include "app/BlogForgeApp.hpp"

#include "ui/DashboardRenderer.hpp"

#include "imgui.h"
#include "imgui_impl_opengl3.h"
#include "imgui_impl_sdl2.h"

#include <SDL2/SDL.h>
#include <SDL2/SDL_opengl.h>

#include <filesystem>
#include <initializer_list>
#include <iostream>
#include <memory>
#include <string>
#include "application/AsyncTaskManager.hpp"
#include "application/BlogGenerationService.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/DraftArchive.hpp"
#include "infrastructure/OllamaStageExecutors.hpp"

namespace blogforge::app {

namespace {

constexpr int kWindowWidth = 1280;
constexpr int kWindowHeight = 800;
constexpr float kFontSize = 16.0f;

const char* FirstExisting(std::initializer_list<const char*> candidates) {
    for (const char* path : candidates) {
        if (std::filesystem::exists(path)) {
            return path;
        }
    }
    return nullptr;
}

/**
 * @brief Installs the UI font and merges an emoji font for the agent icons.
 * @return True when emoji glyphs are available.
 */
bool LoadFonts(ImGuiIO& io) {
    const char* basePath = FirstExisting({
        "/usr/share/fonts/truetype/noto/NotoSans-Regular.ttf",
        "/usr/share/fonts/TTF/NotoSans-Regular.ttf",
        "/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf",
    });
    ImFont* baseFont = basePath ? io.Fonts->AddFontFromFileTTF(basePath, kFontSize) : nullptr;
    io.FontDefault = baseFont ? baseFont : io.Fonts->AddFontDefault();

    const char* emojiPath = FirstExisting({
        "assets/fonts/NotoEmoji-Regular.ttf",
        "/usr/share/fonts/google-noto-emoji-fonts/NotoEmoji-Regular.ttf",
        "/usr/share/fonts/truetype/noto/NotoEmoji-Regular.ttf",
    });
    if (!emojiPath) {
        std::cerr << "[BlogForgeApp] No emoji font found, agent labels use plain text." << std::endl;
        return false;
    }

    // Symbols and pictographs used by the agent table.
    static const ImWchar kEmojiRanges[] = {0x2000, 0x3000, 0x1F300, 0x1FAFF, 0};
    ImFontConfig config;
    config.MergeMode = true;
    config.PixelSnapH = true;
    std::cout << "[BlogForgeApp] Merging emoji font: " << emojiPath << std::endl;
    return io.Fonts->AddFontFromFileTTF(emojiPath, kFontSize, &config, kEmojiRanges) != nullptr;
}

} // namespace

bool BlogForgeApp::Init() {
    return InitServices() && InitWindow() && InitImGui();
}

bool BlogForgeApp::InitServices() {
    auto config = infrastructure::ConfigLoader::Load(infrastructure::ConfigLoader::kDefaultFileName);
    if (auto violation = application::FindLimitsViolation(config.workflow)) {
        std::cerr << "[BlogForgeApp] Invalid workflow settings: " << *violation << std::endl;
        return false;
    }

    // Composition root
    auto executors = infrastructure::MakeOllamaExecutors(config.ollama, config.workflow.qualityThreshold);
    auto service = std::make_shared<application::BlogGenerationService>(
        executors, config.workflow, config.progress.bufferCapacity, config.progress.overflow);
    auto archive = std::make_shared<infrastructure::DraftArchive>(config.output.directory);

    m_videoDriver = config.videoDriver;
    m_state = std::make_unique<ui::DashboardState>(std::move(config));
    m_state->InjectServices(std::move(service), std::make_shared<application::AsyncTaskManager>(),
                            std::move(archive));
    return true;
}

bool BlogForgeApp::InitWindow() {
    if (m_videoDriver == "x11" || m_videoDriver == "wayland") {
        std::cout << "[BlogForgeApp] Using " << m_videoDriver << " video driver from settings.json" << std::endl;
        SDL_SetHint(SDL_HINT_VIDEODRIVER, m_videoDriver.c_str());
    }

    if (SDL_Init(SDL_INIT_VIDEO | SDL_INIT_TIMER) != 0) {
        std::cerr << "[BlogForgeApp] SDL_Init failed: " << SDL_GetError() << std::endl;
        return false;
    }
    m_sdlInitialized = true;

    SDL_GL_SetAttribute(SDL_GL_CONTEXT_FLAGS, 0);
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_PROFILE_MASK, SDL_GL_CONTEXT_PROFILE_CORE);
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_MAJOR_VERSION, 3);
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_MINOR_VERSION, 0);

    const auto flags = static_cast<SDL_WindowFlags>(SDL_WINDOW_OPENGL | SDL_WINDOW_RESIZABLE | SDL_WINDOW_ALLOW_HIGHDPI);
    m_window = SDL_CreateWindow("BlogForge", SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED,
                                kWindowWidth, kWindowHeight, flags);
    if (!m_window) {
        std::cerr << "[BlogForgeApp] SDL_CreateWindow failed: " << SDL_GetError() << std::endl;
        return false;
    }

    m_glContext = SDL_GL_CreateContext(m_window);
    if (!m_glContext) {
        std::cerr << "[BlogForgeApp] SDL_GL_CreateContext failed: " << SDL_GetError() << std::endl;
        return false;
    }
    SDL_GL_MakeCurrent(m_window, m_glContext);
    SDL_GL_SetSwapInterval(1);
    return true;
}

bool BlogForgeApp::InitImGui() {
    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    m_imguiInitialized = true;

    ImGuiIO& io = ImGui::GetIO();
    io.ConfigFlags |= ImGuiConfigFlags_NavEnableKeyboard;
    m_state->ui.emojiEnabled = LoadFonts(io);
    ImGui::StyleColorsDark();

    if (!ImGui_ImplSDL2_InitForOpenGL(m_window, m_glContext) || !ImGui_ImplOpenGL3_Init("#version 130")) {
        std::cerr << "[BlogForgeApp] ImGui backend initialization failed." << std::endl;
        return false;
    }
    m_backendsInitialized = true;
    return true;
}

void BlogForgeApp::Shutdown() {
    // Cancels a running generation and joins its worker.
    m_state.reset();

    if (m_backendsInitialized) {
        ImGui_ImplOpenGL3_Shutdown();
        ImGui_ImplSDL2_Shutdown();
        m_backendsInitialized = false;
    }
    if (m_imguiInitialized) {
        ImGui::DestroyContext();
        m_imguiInitialized = false;
    }

    if (m_glContext) {
        SDL_GL_DeleteContext(m_glContext);
        m_glContext = nullptr;
    }
    if (m_window) {
        SDL_DestroyWindow(m_window);
        m_window = nullptr;
    }
    if (m_sdlInitialized) {
        SDL_Quit();
        m_sdlInitialized = false;
    }
}

int BlogForgeApp::Run() {
    if (!Init()) {
        Shutdown();
        return -1;
    }

    while (PumpEvents()) {
        ImGui_ImplOpenGL3_NewFrame();
        ImGui_ImplSDL2_NewFrame();
        ImGui::NewFrame();

        ui::DrawUI(*m_state);

        ImGui::Render();
        const ImVec2 size = ImGui::GetIO().DisplaySize;
        glViewport(0, 0, static_cast<int>(size.x), static_cast<int>(size.y));
        glClearColor(0.10f, 0.10f, 0.10f, 1.00f);
        glClear(GL_COLOR_BUFFER_BIT);
        ImGui_ImplOpenGL3_RenderDrawData(ImGui::GetDrawData());
        SDL_GL_SwapWindow(m_window);
    }

    Shutdown();
    return 0;
}

bool BlogForgeApp::PumpEvents() {
    SDL_Event event;
    bool keepRunning = !m_state->ui.requestExit;
    while (SDL_PollEvent(&event)) {
        ImGui_ImplSDL2_ProcessEvent(&event);
        if (event.type == SDL_QUIT) {
            keepRunning = false;
        }
    }
    return keepRunning;
}

} // namespace blogforge::app
