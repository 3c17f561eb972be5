// On Windows, SDL may redefine main() to SDL_main unless SDL2main is linked.
// We provide our own entry point, so prevent SDL from overriding it.
#ifdef _WIN32
#define SDL_MAIN_HANDLED
#endif

#include "CVarWindow.h"
#include "DiplomacyWindow.h"
#include "LogWindow.h"

#include "entente/core/Args.h"
#include "entente/core/CVar.h"
#include "entente/core/Log.h"
#include "entente/diplo/DiplomacyConfig.h"
#include "entente/diplo/DiplomacyText.h"

#include <SDL.h>
#include <SDL_opengl.h>

#ifdef main
#undef main
#endif

#include <imgui.h>
#include <backends/imgui_impl_opengl3.h>
#include <backends/imgui_impl_sdl2.h>

#include <algorithm>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

using namespace entente;

struct ToastMsg {
  std::string text;
  double ttl{3.0}; // seconds remaining
};

static void printHelp() {
  std::cout << "entente_inspector\n"
            << "  --roster <path>            Faction roster (EntenteRoster 1)\n"
            << "  --interactions <path>      Interaction log replayed at startup\n"
            << "  --config <path>            Config file with 'name = value' cvar lines\n"
            << "  --seed <u64>               Seed for threat estimation (default: 1337)\n";
}

// Loads roster and history into `world`. Failures are logged; the inspector
// still opens so they can be read in the log window.
static void loadWorld(const core::Args& args, inspector::InspectorWorld& world, const core::CVarRegistry& reg) {
  std::string path;
  if (args.getString("roster", path)) {
    std::string err;
    if (!world.roster.loadFile(path, &err)) {
      ENTENTE_LOG_ERROR("roster: " + err);
    } else {
      ENTENTE_LOG_INFO("roster: " + std::to_string(world.roster.size()) + " factions from " + path);
    }
  } else {
    ENTENTE_LOG_WARN("no --roster given; the inspector starts empty");
  }

  inspector::rebuildEngine(world, reg);

  if (args.getString("interactions", path)) {
    std::vector<diplo::InteractionInput> log;
    std::string err;
    if (!diplo::loadInteractionLogFile(path, log, &err)) {
      ENTENTE_LOG_ERROR("interactions: " + err);
      return;
    }
    const auto r = world.engine->replayInteractions(std::move(log));
    if (!r.ok()) {
      ENTENTE_LOG_ERROR("interactions: " + r.message);
      return;
    }
    world.nowDays = r.value;
  }
}

int main(int argc, char** argv) {
  core::Args args;
  args.parse(argc, argv);
  if (args.hasFlag("help") || args.hasFlag("h")) {
    printHelp();
    return 0;
  }

  inspector::LogRing logRing;
  const core::ScopedLogSink logToWindow(logRing.sink());
  core::setLogLevel(core::LogLevel::Debug);

  core::CVarRegistry& reg = core::cvars();
  core::installDefaultCVars(reg);
  diplo::installDiplomacyCVars(reg);
  {
    std::string path;
    if (args.getString("config", path)) {
      std::string err;
      if (!reg.loadFile(path, &err)) ENTENTE_LOG_ERROR("config: " + err);
    }
  }

  inspector::InspectorWorld world;
  {
    unsigned long long s = (unsigned long long)world.seed;
    (void)args.getU64("seed", s);
    world.seed = (core::u64)s;
    world.rng.reseed(world.seed);
  }
  loadWorld(args, world, reg);

#ifdef _WIN32
  SDL_SetMainReady();
#endif

  if (SDL_Init(SDL_INIT_VIDEO | SDL_INIT_TIMER) != 0) {
    std::cerr << "SDL_Init failed: " << SDL_GetError() << "\n";
    return 1;
  }

  SDL_GL_SetAttribute(SDL_GL_CONTEXT_FLAGS, 0);
  SDL_GL_SetAttribute(SDL_GL_CONTEXT_PROFILE_MASK, SDL_GL_CONTEXT_PROFILE_CORE);
  SDL_GL_SetAttribute(SDL_GL_CONTEXT_MAJOR_VERSION, 3);
  SDL_GL_SetAttribute(SDL_GL_CONTEXT_MINOR_VERSION, 3);
  SDL_GL_SetAttribute(SDL_GL_DOUBLEBUFFER, 1);
  SDL_GL_SetAttribute(SDL_GL_DEPTH_SIZE, 24);
  SDL_GL_SetAttribute(SDL_GL_STENCIL_SIZE, 8);

  SDL_Window* window = SDL_CreateWindow("Entente Inspector", SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED, 1280, 720,
                                        SDL_WINDOW_OPENGL | SDL_WINDOW_RESIZABLE);
  if (!window) {
    std::cerr << "SDL_CreateWindow failed: " << SDL_GetError() << "\n";
    SDL_Quit();
    return 1;
  }

  SDL_GLContext glContext = SDL_GL_CreateContext(window);
  if (!glContext) {
    std::cerr << "SDL_GL_CreateContext failed: " << SDL_GetError() << "\n";
    SDL_DestroyWindow(window);
    SDL_Quit();
    return 1;
  }
  SDL_GL_MakeCurrent(window, glContext);
  SDL_GL_SetSwapInterval(1);

  IMGUI_CHECKVERSION();
  ImGui::CreateContext();
  ImGuiIO& io = ImGui::GetIO();
  io.ConfigFlags |= ImGuiConfigFlags_NavEnableKeyboard;
  ImGui::StyleColorsDark();

  ImGui_ImplSDL2_InitForOpenGL(window, glContext);
  ImGui_ImplOpenGL3_Init("#version 330 core");

  inspector::DiplomacyWindowState diploWindow;
  inspector::CVarWindowState cvarWindow;
  cvarWindow.open = false;
  inspector::LogWindowState logWindow;

  std::vector<ToastMsg> toasts;
  const inspector::ToastFn toast = [&](const std::string& msg, double ttlSec) { toasts.push_back({msg, ttlSec}); };

  Uint64 lastTicks = SDL_GetPerformanceCounter();
  bool running = true;
  while (running) {
    SDL_Event event;
    while (SDL_PollEvent(&event)) {
      ImGui_ImplSDL2_ProcessEvent(&event);
      if (event.type == SDL_QUIT) running = false;
      if (event.type == SDL_WINDOWEVENT && event.window.event == SDL_WINDOWEVENT_CLOSE &&
          event.window.windowID == SDL_GetWindowID(window)) {
        running = false;
      }
    }

    const Uint64 nowTicks = SDL_GetPerformanceCounter();
    const double dtReal = (double)(nowTicks - lastTicks) / (double)SDL_GetPerformanceFrequency();
    lastTicks = nowTicks;

    ImGui_ImplOpenGL3_NewFrame();
    ImGui_ImplSDL2_NewFrame();
    ImGui::NewFrame();

    if (ImGui::BeginMainMenuBar()) {
      if (ImGui::BeginMenu("Windows")) {
        ImGui::MenuItem("Diplomacy", nullptr, &diploWindow.open);
        ImGui::MenuItem("Console variables", nullptr, &cvarWindow.open);
        ImGui::MenuItem("Log", nullptr, &logWindow.open);
        ImGui::EndMenu();
      }
      if (ImGui::BeginMenu("World")) {
        if (ImGui::MenuItem("Rebuild engine from cvars")) {
          inspector::rebuildEngine(world, reg);
          diploWindow = inspector::DiplomacyWindowState{};
          toast("Engine rebuilt.", 1.8);
        }
        if (ImGui::MenuItem("Quit")) running = false;
        ImGui::EndMenu();
      }
      ImGui::EndMainMenuBar();
    }

    inspector::drawDiplomacyWindow(diploWindow, world, reg, toast);
    inspector::drawCVarWindow(cvarWindow, reg, toast);
    inspector::drawLogWindow(logWindow, logRing, toast);

    for (auto& t : toasts) t.ttl -= dtReal;
    toasts.erase(std::remove_if(toasts.begin(), toasts.end(), [](const ToastMsg& t) { return t.ttl <= 0.0; }),
                 toasts.end());
    {
      ImDrawList* draw = ImGui::GetForegroundDrawList();
      float y = 28.0f;
      for (const auto& t : toasts) {
        draw->AddText({18.0f, y}, IM_COL32(240, 240, 240, 220), t.text.c_str());
        y += 18.0f;
      }
    }

    ImGui::Render();
    int w = 0, h = 0;
    SDL_GL_GetDrawableSize(window, &w, &h);
    glViewport(0, 0, w, h);
    glClearColor(0.06f, 0.07f, 0.09f, 1.0f);
    glClear(GL_COLOR_BUFFER_BIT);
    ImGui_ImplOpenGL3_RenderDrawData(ImGui::GetDrawData());
    SDL_GL_SwapWindow(window);
  }

  world.engine.reset();

  ImGui_ImplOpenGL3_Shutdown();
  ImGui_ImplSDL2_Shutdown();
  ImGui::DestroyContext();

  SDL_GL_DeleteContext(glContext);
  SDL_DestroyWindow(window);
  SDL_Quit();
  return 0;
}
