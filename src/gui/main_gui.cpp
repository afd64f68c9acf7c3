// arqsim GUI - Selective Repeat ARQ simulator front end
// Dear ImGui on SDL2 with the OpenGL 2.1 backend

#include "app.hpp"

#include "imgui.h"
#include "imgui_impl_sdl2.h"
#include "imgui_impl_opengl2.h"

#include <SDL.h>
#include <SDL_opengl.h>

#include <cstdio>
#include <exception>
#include <string>

#include "arqsim/logging.hpp"
#include "sim/sim_settings.hpp"

static void printGuiUsage(const char* prog) {
    std::printf("Usage: %s [--config FILE] [-v]\n", prog);
}

int main(int argc, char* argv[]) {
    arqsim::sim::loadDotEnv();

    // INFO by default; ARQSIM_LOG overrides
    arqsim::setLogLevel(arqsim::LogLevel::INFO);
    arqsim::configureLoggingFromEnv();

    arqsim::gui::App::Options opts;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "--config" || arg == "-c") && i + 1 < argc) {
            opts.config_path = argv[++i];
        } else if (arg == "-v") {
            arqsim::setLogLevel(arqsim::LogLevel::DEBUG);
        } else if (arg == "-h" || arg == "--help") {
            printGuiUsage(argv[0]);
            return 0;
        }
    }

    if (SDL_Init(SDL_INIT_VIDEO | SDL_INIT_TIMER) != 0) {
        const char* sdl_err = SDL_GetError();
        LOG_APP(ERROR, "SDL_Init failed: %s", sdl_err ? sdl_err : "<unknown>");
        return 1;
    }

    SDL_Window* window = nullptr;
    SDL_GLContext gl_context = nullptr;

    auto failStartup = [&](const char* what) -> int {
        const char* sdl_err = SDL_GetError();
        LOG_APP(ERROR, "%s failed: %s", what, (sdl_err && sdl_err[0]) ? sdl_err : "<unknown>");
        if (gl_context) {
            SDL_GL_DeleteContext(gl_context);
        }
        if (window) {
            SDL_DestroyWindow(window);
        }
        SDL_Quit();
        return 1;
    };

    // OpenGL 2.1 context
    SDL_GL_SetAttribute(SDL_GL_DOUBLEBUFFER, 1);
    SDL_GL_SetAttribute(SDL_GL_DEPTH_SIZE, 24);
    SDL_GL_SetAttribute(SDL_GL_STENCIL_SIZE, 8);
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_MAJOR_VERSION, 2);
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_MINOR_VERSION, 1);

    window = SDL_CreateWindow(
        "ARQ Protocol Simulator",
        SDL_WINDOWPOS_CENTERED,
        SDL_WINDOWPOS_CENTERED,
        760, 560,
        (SDL_WindowFlags)(SDL_WINDOW_OPENGL | SDL_WINDOW_RESIZABLE | SDL_WINDOW_ALLOW_HIGHDPI)
    );
    if (!window) {
        return failStartup("SDL_CreateWindow");
    }

    gl_context = SDL_GL_CreateContext(window);
    if (!gl_context) {
        return failStartup("SDL_GL_CreateContext");
    }
    if (SDL_GL_MakeCurrent(window, gl_context) != 0) {
        return failStartup("SDL_GL_MakeCurrent");
    }
    if (SDL_GL_SetSwapInterval(1) != 0) {
        LOG_APP(DEBUG, "No vsync: %s", SDL_GetError());
    }

    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImGuiIO& io = ImGui::GetIO();
    io.ConfigFlags |= ImGuiConfigFlags_NavEnableKeyboard;
    io.IniFilename = nullptr;  // Fixed layout

    ImGui::StyleColorsDark();
    ImGui::GetStyle().WindowRounding = 0.0f;
    ImGui::GetStyle().FrameRounding = 3.0f;

    if (!ImGui_ImplSDL2_InitForOpenGL(window, gl_context)) {
        ImGui::DestroyContext();
        return failStartup("ImGui_ImplSDL2_InitForOpenGL");
    }
    if (!ImGui_ImplOpenGL2_Init()) {
        ImGui_ImplSDL2_Shutdown();
        ImGui::DestroyContext();
        return failStartup("ImGui_ImplOpenGL2_Init");
    }

    int exit_code = 0;
    try {
        arqsim::gui::App app(opts);
        LOG_APP(INFO, "GUI ready");

        bool quit = false;
        while (!quit) {
            SDL_Event event;
            while (SDL_PollEvent(&event)) {
                ImGui_ImplSDL2_ProcessEvent(&event);
                bool closed = event.type == SDL_WINDOWEVENT &&
                              event.window.event == SDL_WINDOWEVENT_CLOSE &&
                              event.window.windowID == SDL_GetWindowID(window);
                if (event.type == SDL_QUIT || closed) {
                    quit = true;
                }
            }

            ImGui_ImplOpenGL2_NewFrame();
            ImGui_ImplSDL2_NewFrame();
            ImGui::NewFrame();

            app.render();

            ImGui::Render();
            int fb_w = 0, fb_h = 0;
            SDL_GL_GetDrawableSize(window, &fb_w, &fb_h);
            glViewport(0, 0, fb_w, fb_h);
            glClearColor(0.08f, 0.09f, 0.11f, 1.0f);
            glClear(GL_COLOR_BUFFER_BIT);
            ImGui_ImplOpenGL2_RenderDrawData(ImGui::GetDrawData());
            SDL_GL_SwapWindow(window);
        }
    } catch (const std::exception& e) {
        LOG_APP(ERROR, "Fatal: %s", e.what());
        exit_code = 1;
    }

    ImGui_ImplOpenGL2_Shutdown();
    ImGui_ImplSDL2_Shutdown();
    ImGui::DestroyContext();

    SDL_GL_DeleteContext(gl_context);
    SDL_DestroyWindow(window);
    SDL_Quit();

    return exit_code;
}
