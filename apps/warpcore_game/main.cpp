#include "warpcore/core/Log.h"
#include "warpcore/math/Math.h"
#include "warpcore/sim/Catalog.h"
#include "warpcore/sim/SaveGame.h"
#include "warpcore/sim/Simulation.h"
#include "warpcore/sim/Tuning.h"
#include "warpcore/sim/VoiceLines.h"

#include <SDL.h>
#include <SDL_opengl.h>

#include <imgui.h>
#include <backends/imgui_impl_opengl3.h>
#include <backends/imgui_impl_sdl2.h>

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <iostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

using namespace warpcore;

static constexpr const char* kSavePath = "warpcore_save.txt";
static constexpr const char* kTuningPath = "warpcore_tuning.txt";

static ImVec4 statusColor(sim::SystemStatus s) {
  switch (s) {
    case sim::SystemStatus::Online: return {0.45f, 0.95f, 0.45f, 1.0f};
    case sim::SystemStatus::Damaged: return {0.95f, 0.75f, 0.25f, 1.0f};
    case sim::SystemStatus::Offline: return {0.95f, 0.30f, 0.30f, 1.0f};
    case sim::SystemStatus::Charging: return {0.40f, 0.70f, 0.95f, 1.0f};
  }
  return {1, 1, 1, 1};
}

static ImVec4 alertColor(sim::AlertLevel a) {
  switch (a) {
    case sim::AlertLevel::Green: return {0.45f, 0.95f, 0.45f, 1.0f};
    case sim::AlertLevel::Yellow: return {0.95f, 0.85f, 0.25f, 1.0f};
    case sim::AlertLevel::Red: return {0.95f, 0.25f, 0.25f, 1.0f};
  }
  return {1, 1, 1, 1};
}

static void bar(const char* label, double value01, const char* overlay) {
  ImGui::TextUnformatted(label);
  ImGui::SameLine(110.0f);
  ImGui::ProgressBar((float)std::clamp(value01, 0.0, 1.0), ImVec2(-1.0f, 0.0f), overlay);
}

// Top-down (x/z) plot centred on the ship, forward up.
static void drawRadar(const sim::Simulation& s, float range) {
  const ImVec2 size(220.0f, 220.0f);
  const ImVec2 origin = ImGui::GetCursorScreenPos();
  const ImVec2 center(origin.x + size.x * 0.5f, origin.y + size.y * 0.5f);
  const float radius = size.x * 0.5f - 4.0f;

  ImDrawList* dl = ImGui::GetWindowDrawList();
  dl->AddCircleFilled(center, radius, IM_COL32(10, 20, 30, 220), 48);
  dl->AddCircle(center, radius, IM_COL32(80, 160, 220, 255), 48);
  dl->AddCircle(center, radius * 0.5f, IM_COL32(60, 110, 160, 160), 48);

  const auto& pose = s.pose();
  const double yaw = pose.euler().yaw;
  const double c = std::cos(yaw);
  const double sn = std::sin(yaw);

  auto plot = [&](const math::Vec3d& world) -> std::pair<bool, ImVec2> {
    const math::Vec3d d = world - pose.position;
    // Rotate into the ship's heading so forward (-Z) points up.
    const double x = d.x * c - d.z * sn;
    const double z = d.x * sn + d.z * c;
    const double scale = radius / range;
    const float px = (float)(x * scale);
    const float pz = (float)(z * scale);
    if (px * px + pz * pz > radius * radius) return {false, {}};
    return {true, ImVec2(center.x + px, center.y + pz)};
  };

  const std::string& target = s.weapons().targetId();
  for (const auto& b : s.catalog().bodies()) {
    const auto [inside, p] = plot(b.position);
    if (!inside) continue;
    const ImU32 col = b.kind == sim::BodyKind::Star ? IM_COL32(255, 220, 90, 255)
                      : b.kind == sim::BodyKind::Station ? IM_COL32(150, 220, 255, 255)
                                                         : IM_COL32(200, 200, 200, 255);
    dl->AddCircleFilled(p, 3.0f, col);
    if (b.id == target) dl->AddCircle(p, 7.0f, IM_COL32(255, 120, 60, 255));
  }
  for (const auto& ct : s.catalog().contacts()) {
    if (!ct.alive) continue;
    const auto [inside, p] = plot(ct.position);
    if (!inside) continue;
    dl->AddTriangleFilled(ImVec2(p.x, p.y - 4), ImVec2(p.x - 4, p.y + 3), ImVec2(p.x + 4, p.y + 3),
                          IM_COL32(255, 70, 70, 255));
    if (ct.id == target) dl->AddCircle(p, 7.0f, IM_COL32(255, 120, 60, 255));
  }
  for (const auto& t : s.weapons().state().torpedoes) {
    const auto [inside, p] = plot(t.position);
    if (inside) dl->AddCircleFilled(p, 1.5f, IM_COL32(255, 160, 60, 255));
  }

  dl->AddTriangleFilled(ImVec2(center.x, center.y - 6), ImVec2(center.x - 4, center.y + 4),
                        ImVec2(center.x + 4, center.y + 4), IM_COL32(120, 255, 120, 255));

  ImGui::Dummy(size);
}

int main(int argc, char** argv) {
  (void)argc; (void)argv;

  core::setLogLevel(core::LogLevel::Info);

  sim::SimTuning tuning;
  {
    // Optional; a missing file keeps the defaults.
    std::string err;
    if (!sim::loadTuning(kTuningPath, tuning, &err)) {
      core::log(core::LogLevel::Info, "Using default tuning (" + err + ")");
    }
  }

  if (SDL_Init(SDL_INIT_VIDEO | SDL_INIT_TIMER) != 0) {
    core::log(core::LogLevel::Error, std::string("SDL_Init failed: ") + SDL_GetError());
    return 1;
  }

  // GL 3.3 core
  SDL_GL_SetAttribute(SDL_GL_CONTEXT_FLAGS, 0);
  SDL_GL_SetAttribute(SDL_GL_CONTEXT_PROFILE_MASK, SDL_GL_CONTEXT_PROFILE_CORE);
  SDL_GL_SetAttribute(SDL_GL_CONTEXT_MAJOR_VERSION, 3);
  SDL_GL_SetAttribute(SDL_GL_CONTEXT_MINOR_VERSION, 3);
  SDL_GL_SetAttribute(SDL_GL_DOUBLEBUFFER, 1);

  SDL_Window* window = SDL_CreateWindow(
      "warpcore bridge",
      SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED,
      1280, 720,
      SDL_WINDOW_OPENGL | SDL_WINDOW_RESIZABLE);

  if (!window) {
    core::log(core::LogLevel::Error, std::string("SDL_CreateWindow failed: ") + SDL_GetError());
    SDL_Quit();
    return 1;
  }

  SDL_GLContext glContext = SDL_GL_CreateContext(window);
  if (!glContext) {
    core::log(core::LogLevel::Error, std::string("SDL_GL_CreateContext failed: ") + SDL_GetError());
    SDL_DestroyWindow(window);
    SDL_Quit();
    return 1;
  }
  SDL_GL_MakeCurrent(window, glContext);
  SDL_GL_SetSwapInterval(1);

  // --- ImGui setup ---
  IMGUI_CHECKVERSION();
  ImGui::CreateContext();
  ImGuiIO& io = ImGui::GetIO();
  io.ConfigFlags |= ImGuiConfigFlags_NavEnableKeyboard;
  ImGui::StyleColorsDark();

  ImGui_ImplSDL2_InitForOpenGL(window, glContext);
  ImGui_ImplOpenGL3_Init("#version 330 core");

  // --- Session ---
  sim::Simulation session(sim::makeSolCatalog(), tuning, (core::u64)SDL_GetPerformanceCounter());

  // A pair of raiders near the spacedock, for the tactical console.
  session.addContact({"raider-1", "Raider Alpha", {240.0, 12.0, -170.0}, 2.0, true});
  session.addContact({"raider-2", "Raider Beta", {205.0, 4.0, -210.0}, 2.0, true});

  sim::Announcer announcer(tuning.announcer);
  session.events().add(&announcer);
  (void)announcer.announceImmediate("welcome");

  const std::vector<const sim::Body*> destinations = session.catalog().navigableBodies();
  int destIndex = 0;
  for (std::size_t i = 0; i < destinations.size(); ++i) {
    if (destinations[i]->id == "earth") destIndex = (int)i;
  }

  float radarRange = 400.0f;
  bool phasersHeld = false;
  std::string statusLine;

  // Warnings from the core also surface on the HUD.
  core::setLogSink([&statusLine](core::LogLevel level, std::string_view message) {
    std::ostream& os = (level >= core::LogLevel::Warn) ? std::cerr : std::cout;
    os << core::formatLogLine(level, message) << "\n";
    if (level >= core::LogLevel::Warn) statusLine = std::string(message);
  });

  Uint64 prevCounter = SDL_GetPerformanceCounter();
  const double freq = (double)SDL_GetPerformanceFrequency();

  bool running = true;
  while (running) {
    const Uint64 counter = SDL_GetPerformanceCounter();
    const double dt = (double)(counter - prevCounter) / freq;
    prevCounter = counter;

    // Events
    SDL_Event event;
    while (SDL_PollEvent(&event)) {
      ImGui_ImplSDL2_ProcessEvent(&event);

      if (event.type == SDL_QUIT) running = false;
      if (event.type == SDL_WINDOWEVENT && event.window.event == SDL_WINDOWEVENT_CLOSE) running = false;

      if (event.type == SDL_MOUSEMOTION && !io.WantCaptureMouse && (event.motion.state & SDL_BUTTON_LMASK)) {
        session.camera().orbitRotate(-event.motion.xrel * 0.005, -event.motion.yrel * 0.005);
      }
      if (event.type == SDL_MOUSEWHEEL && !io.WantCaptureMouse) {
        session.camera().orbitZoom(event.wheel.y > 0 ? 0.9 : 1.1);
      }

      if (event.type == SDL_KEYDOWN && !event.key.repeat && !io.WantCaptureKeyboard) {
        const SDL_Keycode key = event.key.keysym.sym;
        if (key == SDLK_ESCAPE) running = false;

        if (key == SDLK_SPACE && !destinations.empty()) {
          const sim::Body* dest = destinations[(std::size_t)destIndex];
          statusLine = session.engageWarp(dest->id) ? "Course laid in for " + dest->name : "Warp engage refused";
        }
        if (key == SDLK_x && session.warp().active()) (void)session.disengageWarp();
        if (key == SDLK_t) (void)session.skipToDestination();
        if (key >= SDLK_1 && key <= SDLK_9) session.setWarpLevel((int)(key - SDLK_0));

        if (key == SDLK_TAB && !session.cycleTarget()) statusLine = "No targets in range";
        if (key == SDLK_p) {
          phasersHeld = !phasersHeld;
          phasersHeld = session.setPhasers(phasersHeld);
        }
        if (key == SDLK_g && !session.fireTorpedo()) statusLine = "Torpedo launcher not ready";
        if (key == SDLK_k && !session.startScan()) {
          const auto msg = sim::scanErrorMessage(session.scanner().session().error);
          statusLine = msg.empty() ? "Scan unavailable" : std::string(msg);
        }

        if (key == SDLK_v) session.toggleCameraMode(sim::CameraMode::Cinematic);
        if (key == SDLK_i) session.toggleCameraMode(sim::CameraMode::FreeLook);
        if (key == SDLK_h) session.toggleCameraMode(sim::CameraMode::Photo);

        if (key == SDLK_F5) {
          std::string err;
          statusLine = sim::saveToFile(session.snapshot(), kSavePath, &err) ? "Session saved" : "Save failed: " + err;
        }
        if (key == SDLK_F9) {
          sim::SimSnapshot snap;
          std::string err;
          if (sim::loadFromFile(kSavePath, snap, &err) && session.restore(snap, &err)) {
            phasersHeld = session.weapons().state().firingPhasers;
            statusLine = "Session restored";
          } else {
            statusLine = "Load failed: " + err;
          }
        }
      }
    }

    // Held keys feed the helm.
    sim::FlightInput input;
    if (!io.WantCaptureKeyboard) {
      const Uint8* keys = SDL_GetKeyboardState(nullptr);
      input.thrust = (keys[SDL_SCANCODE_W] ? 1.0 : 0.0) - (keys[SDL_SCANCODE_S] ? 1.0 : 0.0);
      input.yaw = (keys[SDL_SCANCODE_A] ? 1.0 : 0.0) - (keys[SDL_SCANCODE_D] ? 1.0 : 0.0);
      input.pitch = (keys[SDL_SCANCODE_R] ? 1.0 : 0.0) - (keys[SDL_SCANCODE_F] ? 1.0 : 0.0);
      input.roll = (keys[SDL_SCANCODE_Q] ? 1.0 : 0.0) - (keys[SDL_SCANCODE_E] ? 1.0 : 0.0);
      input.strafe = (keys[SDL_SCANCODE_C] ? 1.0 : 0.0) - (keys[SDL_SCANCODE_Z] ? 1.0 : 0.0);
      input.fullStop = keys[SDL_SCANCODE_X] != 0;
    }

    session.tick(dt, input);
    announcer.update(dt);

    // Overheat drops the trigger.
    if (phasersHeld && !session.weapons().state().firingPhasers && session.weapons().state().phaserOverheated) {
      phasersHeld = false;
    }

    int w = 0, h = 0;
    SDL_GL_GetDrawableSize(window, &w, &h);

    // ---- Render ---
    glViewport(0, 0, w, h);
    glClearColor(0.01f, 0.01f, 0.02f, 1.0f);
    glClear(GL_COLOR_BUFFER_BIT);

    // ---- UI ----
    ImGui_ImplOpenGL3_NewFrame();
    ImGui_ImplSDL2_NewFrame();
    ImGui::NewFrame();

    const bool showUi = session.cameraMode().showUi();
    if (showUi) {
      const auto& pose = session.pose();
      const auto& flight = session.flight().state();
      const auto& warp = session.warp().session();
      const auto e = pose.euler();

      // Helm
      ImGui::SetNextWindowPos(ImVec2(10, 10), ImGuiCond_FirstUseEver);
      ImGui::Begin("Helm");
      ImGui::Text("Position  %.1f  %.1f  %.1f", pose.position.x, pose.position.y, pose.position.z);
      ImGui::Text("Heading   P %.1f  Y %.1f  R %.1f", math::radToDeg(e.pitch), math::radToDeg(e.yaw),
                  math::radToDeg(e.roll));
      char overlay[64];
      std::snprintf(overlay, sizeof(overlay), "%.0f%% (target %.0f%%)", flight.impulsePercent, flight.targetImpulse);
      bar("Impulse", flight.impulsePercent / 100.0, overlay);
      ImGui::Text("Speed %.1f u/s", flight.speed);
      ImGui::Text("Camera: %s", std::string(sim::toString(session.cameraMode().mode)).c_str());
      if (!statusLine.empty()) ImGui::TextDisabled("%s", statusLine.c_str());
      ImGui::End();

      // Warp
      ImGui::SetNextWindowPos(ImVec2(10, 190), ImGuiCond_FirstUseEver);
      ImGui::Begin("Navigation");
      if (!destinations.empty()) {
        const sim::Body* current = destinations[(std::size_t)destIndex];
        if (ImGui::BeginCombo("Destination", current->name.c_str())) {
          for (std::size_t i = 0; i < destinations.size(); ++i) {
            const double dist = destinations[i]->position.distanceTo(pose.position);
            const std::string label = destinations[i]->name + "  (" + std::to_string((int)dist) + ")";
            if (ImGui::Selectable(label.c_str(), (int)i == destIndex)) destIndex = (int)i;
          }
          ImGui::EndCombo();
        }
      }
      int level = session.warp().warpLevel();
      if (ImGui::SliderInt("Warp factor", &level, 1, 9)) session.setWarpLevel(level);
      ImGui::Text("Phase: %s", std::string(sim::toString(warp.phase)).c_str());
      if (session.warp().active()) {
        std::snprintf(overlay, sizeof(overlay), "%.0f%%", warp.progress * 100.0);
        bar("Progress", warp.progress, overlay);
        ImGui::Text("ETA %s  remaining %.0f", sim::formatEta(warp.eta).c_str(), warp.distanceRemaining);
        if (ImGui::Button("Emergency stop")) (void)session.disengageWarp();
        ImGui::SameLine();
        if (ImGui::Button("Skip")) (void)session.skipToDestination();
      } else if (ImGui::Button("Engage") && !destinations.empty()) {
        if (!session.engageWarp(destinations[(std::size_t)destIndex]->id)) statusLine = "Warp engage refused";
      }
      ImGui::End();

      // Shields, hull, subsystems
      const auto& ship = session.ship();
      ImGui::SetNextWindowPos(ImVec2(w - 330.0f, 10), ImGuiCond_FirstUseEver);
      ImGui::Begin("Engineering");
      ImGui::TextColored(alertColor(ship.alertLevel()), "Alert: %s", std::string(sim::toString(ship.alertLevel())).c_str());
      std::snprintf(overlay, sizeof(overlay), "%.0f", ship.hull());
      bar("Hull", ship.hull() / 100.0, overlay);
      std::snprintf(overlay, sizeof(overlay), "%.0f%s", ship.shields().overall, ship.shieldsOnline() ? "" : " (down)");
      bar("Shields", ship.shields().overall / 100.0, overlay);
      for (std::size_t q = 0; q < sim::kShieldQuadrantCount; ++q) {
        const auto quad = (sim::ShieldQuadrant)q;
        std::snprintf(overlay, sizeof(overlay), "%.0f", ship.shields().get(quad));
        bar(std::string(sim::toString(quad)).c_str(), ship.shields().get(quad) / 100.0, overlay);
      }
      ImGui::Separator();
      for (const auto& [id, sys] : ship.subsystems()) {
        ImGui::TextColored(statusColor(sys.status), "%-18s %-8s %5.1f%s", sys.name.c_str(),
                           std::string(sim::toString(sys.status)).c_str(), sys.power, sys.active ? "  *" : "");
      }
      if (ImGui::Button("Reset systems")) session.resetSystems();
      ImGui::SameLine();
      if (ImGui::Button("Debris hit")) session.handleDebrisCollision();
      ImGui::End();

      // Tactical
      const auto& weapons = session.weapons().state();
      ImGui::SetNextWindowPos(ImVec2(w - 330.0f, 330), ImGuiCond_FirstUseEver);
      ImGui::Begin("Tactical");
      const auto target = session.selectedTarget();
      ImGui::Text("Target: %s", target ? std::string(target->name).c_str() : "none");
      if (target) {
        ImGui::Text("Range %.0f", target->position.distanceTo(pose.position));
        if (const auto* rec = session.targets().find(target->id)) {
          std::snprintf(overlay, sizeof(overlay), "%.0f / %.0f (%s)", rec->health, rec->maxHealth,
                        std::string(sim::toString(rec->state)).c_str());
          bar("Integrity", rec->health / rec->maxHealth, overlay);
        }
      }
      std::snprintf(overlay, sizeof(overlay), "%.0f%s", weapons.phaserHeat, weapons.phaserOverheated ? " OVERHEAT" : "");
      bar("Phaser heat", weapons.phaserHeat / 100.0, overlay);
      ImGui::Text("Torpedoes %d%s  in flight %d", weapons.torpedoCount, weapons.torpedoLoading ? " (loading)" : "",
                  (int)weapons.torpedoes.size());
      ImGui::End();

      // Science
      const auto& scan = session.scanner().session();
      ImGui::SetNextWindowPos(ImVec2(10, 420), ImGuiCond_FirstUseEver);
      ImGui::Begin("Sensors");
      if (scan.scanning) {
        std::snprintf(overlay, sizeof(overlay), "%.0f%%", scan.progress);
        bar("Scanning", scan.progress / 100.0, overlay);
      } else if (scan.error != sim::ScanError::None) {
        ImGui::TextColored(ImVec4(0.95f, 0.4f, 0.3f, 1.0f), "%s", std::string(sim::scanErrorMessage(scan.error)).c_str());
      }
      if (scan.complete && scan.result) {
        const auto& r = *scan.result;
        ImGui::Text("Target: %s", scan.targetId.c_str());
        ImGui::Text("Population: %s", r.population.c_str());
        std::string res;
        for (const auto& x : r.resources) res += (res.empty() ? "" : ", ") + x;
        ImGui::TextWrapped("Resources: %s", res.c_str());
        ImGui::TextWrapped("Atmosphere: %s", r.atmosphereDetails.c_str());
        ImGui::Text("Threat: %s  Life signs: %s", r.threatLevel.c_str(), r.lifeSigns.c_str());
        ImGui::TextWrapped("%s", r.tacticalAnalysis.c_str());
      }
      ImGui::End();

      // Radar
      ImGui::SetNextWindowPos(ImVec2(w - 250.0f, h - 290.0f), ImGuiCond_FirstUseEver);
      ImGui::Begin("Radar", nullptr, ImGuiWindowFlags_AlwaysAutoResize);
      ImGui::SliderFloat("Range", &radarRange, 50.0f, 2000.0f, "%.0f");
      drawRadar(session, radarRange);
      ImGui::End();

      // Announcements
      if (const sim::VoiceLine* line = announcer.current()) {
        ImGui::SetNextWindowPos(ImVec2(w * 0.5f, h - 40.0f), ImGuiCond_Always, ImVec2(0.5f, 1.0f));
        ImGui::Begin("##subtitle", nullptr,
                     ImGuiWindowFlags_NoDecoration | ImGuiWindowFlags_AlwaysAutoResize | ImGuiWindowFlags_NoInputs);
        ImGui::TextUnformatted(std::string(line->text).c_str());
        ImGui::End();
      }

      ImGui::SetNextWindowPos(ImVec2(w * 0.5f, 10), ImGuiCond_FirstUseEver, ImVec2(0.5f, 0.0f));
      ImGui::Begin("Keys", nullptr, ImGuiWindowFlags_AlwaysAutoResize);
      ImGui::TextDisabled("W/S thrust  A/D yaw  R/F pitch  Q/E roll  Z/C strafe  X stop");
      ImGui::TextDisabled("Space engage  T skip  1-9 warp  Tab target  P phasers  G torpedo  K scan");
      ImGui::TextDisabled("V cinematic  I free look  H photo  F5 save  F9 load");
      ImGui::End();
    }

    ImGui::Render();
    ImGui_ImplOpenGL3_RenderDrawData(ImGui::GetDrawData());

    SDL_GL_SwapWindow(window);
  }

  // Cleanup
  core::clearLogSink();
  ImGui_ImplOpenGL3_Shutdown();
  ImGui_ImplSDL2_Shutdown();
  ImGui::DestroyContext();

  SDL_GL_DeleteContext(glContext);
  SDL_DestroyWindow(window);
  SDL_Quit();

  return 0;
}
