/**
 * @file debug_ui.cpp
 * @brief Viewer sidebar implementation.
 */

#include <windscape/renderer/debug_ui.hpp>
#include <windscape/pipeline/coordinator.hpp>

#include "imgui.h"
#include "rlImGui.h"
#include "raylib.h"

#include <algorithm>

namespace windscape {
namespace renderer {

namespace {

void index_state_line(const char *label, spatial::IndexState state,
                      const char *suffix) {
  ImVec4 color = ImVec4(0.45f, 0.85f, 0.55f, 1.0f);
  if (state == spatial::IndexState::STALE) {
    color = ImVec4(1.0f, 0.8f, 0.2f, 1.0f);
  } else if (state != spatial::IndexState::BUILT) {
    color = ImVec4(1.0f, 0.4f, 0.3f, 1.0f);
  }
  ImGui::Text("%s", label);
  ImGui::SameLine();
  ImGui::TextColored(color, "%s%s", spatial::index_state_name(state), suffix);
}

} // namespace

void DebugUI::init() {
  rlImGuiSetup(true);
  initialized_ = true;

  ImGuiStyle &style = ImGui::GetStyle();

  // Flat panels, compact spacing
  style.WindowRounding = 0.0f;
  style.FrameRounding = 2.0f;
  style.GrabRounding = 2.0f;
  style.ScrollbarRounding = 0.0f;
  style.WindowPadding = ImVec2(8, 8);
  style.FramePadding = ImVec2(4, 3);
  style.ItemSpacing = ImVec2(6, 4);
  style.WindowBorderSize = 1.0f;

  // Slate background, sky-blue accents
  ImVec4 *colors = style.Colors;
  colors[ImGuiCol_WindowBg] = ImVec4(0.07f, 0.09f, 0.11f, 0.96f);
  colors[ImGuiCol_ChildBg] = ImVec4(0.05f, 0.06f, 0.08f, 1.00f);
  colors[ImGuiCol_Border] = ImVec4(0.25f, 0.32f, 0.38f, 0.60f);
  colors[ImGuiCol_FrameBg] = ImVec4(0.12f, 0.15f, 0.18f, 1.00f);
  colors[ImGuiCol_FrameBgHovered] = ImVec4(0.17f, 0.22f, 0.27f, 1.00f);
  colors[ImGuiCol_FrameBgActive] = ImVec4(0.20f, 0.28f, 0.34f, 1.00f);
  colors[ImGuiCol_Text] = ImVec4(0.86f, 0.90f, 0.93f, 1.00f);
  colors[ImGuiCol_TextDisabled] = ImVec4(0.45f, 0.50f, 0.55f, 1.00f);
  colors[ImGuiCol_Header] = ImVec4(0.14f, 0.30f, 0.42f, 1.00f);
  colors[ImGuiCol_HeaderHovered] = ImVec4(0.18f, 0.38f, 0.52f, 1.00f);
  colors[ImGuiCol_HeaderActive] = ImVec4(0.22f, 0.45f, 0.60f, 1.00f);
  colors[ImGuiCol_Button] = ImVec4(0.14f, 0.24f, 0.32f, 1.00f);
  colors[ImGuiCol_ButtonHovered] = ImVec4(0.20f, 0.34f, 0.45f, 1.00f);
  colors[ImGuiCol_ButtonActive] = ImVec4(0.26f, 0.42f, 0.55f, 1.00f);
  colors[ImGuiCol_SliderGrab] = ImVec4(0.40f, 0.70f, 0.90f, 1.00f);
  colors[ImGuiCol_SliderGrabActive] = ImVec4(0.55f, 0.80f, 0.95f, 1.00f);
  colors[ImGuiCol_CheckMark] = ImVec4(0.45f, 0.85f, 0.55f, 1.00f);
  colors[ImGuiCol_PlotLines] = ImVec4(0.40f, 0.70f, 0.90f, 1.00f);
  colors[ImGuiCol_PlotHistogram] = ImVec4(0.45f, 0.75f, 0.50f, 1.00f);
}

void DebugUI::shutdown() {
  if (initialized_) {
    rlImGuiShutdown();
    initialized_ = false;
  }
}

void DebugUI::begin_frame() { rlImGuiBegin(); }
void DebugUI::end_frame() { rlImGuiEnd(); }

void DebugUI::draw_sidebar(ViewerControls &controls,
                           const pipeline::PipelineCoordinator &coordinator,
                           float sidebar_width) {
  ImGui::SetNextWindowPos(ImVec2(0, 0), ImGuiCond_Always);
  ImGui::SetNextWindowSize(ImVec2(sidebar_width, static_cast<float>(GetScreenHeight())),
                           ImGuiCond_Always);

  ImGuiWindowFlags flags = ImGuiWindowFlags_NoMove | ImGuiWindowFlags_NoResize |
                           ImGuiWindowFlags_NoCollapse | ImGuiWindowFlags_NoTitleBar;

  const pipeline::FrameStats &stats = coordinator.last_frame_stats();

  if (ImGui::Begin("##Sidebar", nullptr, flags)) {
    // === TITLE ===
    ImGui::PushStyleColor(ImGuiCol_Text, ImVec4(0.45f, 0.78f, 0.95f, 1.0f));
    ImGui::Text("WINDSCAPE");
    ImGui::PopStyleColor();
    ImGui::SameLine(sidebar_width - 70);
    ImGui::TextDisabled("v0.1.0");
    ImGui::Separator();

    // === TIMELINE ===
    if (ImGui::CollapsingHeader("Timeline", ImGuiTreeNodeFlags_DefaultOpen)) {
      ImGui::SetNextItemWidth(-1);
      ImGui::SliderInt("##year", &controls.year, controls.min_year, controls.max_year,
                       "Year %d");
      if (ImGui::Button(controls.autoplay ? "[STOP]" : "[PLAY]", ImVec2(-1, 0))) {
        controls.autoplay = !controls.autoplay;
      }
      ImGui::Checkbox("Animate blades", &controls.animate_blades);
    }

    ImGui::Spacing();

    // === PIPELINE ===
    if (ImGui::CollapsingHeader("Pipeline", ImGuiTreeNodeFlags_DefaultOpen)) {
      const char *presets[] = {"standard", "aggressive", "extreme"};
      ImGui::SetNextItemWidth(-1);
      ImGui::Combo("##preset", &controls.preset, presets, 3);
      ImGui::Checkbox("Quadtree prefilter", &controls.use_prefilter);
      ImGui::Checkbox("Frustum culling", &controls.use_frustum);
      ImGui::Checkbox("Show quadtree", &controls.show_quadtree);
    }

    ImGui::Spacing();

    // === FRAME STATS ===
    if (ImGui::CollapsingHeader("Frame", ImGuiTreeNodeFlags_DefaultOpen)) {
      ImGui::Text("Total:     %zu", stats.total);
      ImGui::Text("Active:    %zu", stats.active);
      ImGui::Text("Spatial:   %zu (-%zu)", stats.after_spatial, stats.culled_by_spatial);
      ImGui::Text("Frustum:   -%zu", stats.culled_by_frustum);
      ImGui::PushStyleColor(ImGuiCol_Text, ImVec4(0.45f, 0.85f, 0.55f, 1.0f));
      ImGui::Text("Visible:   %zu", stats.visible);
      ImGui::PopStyleColor();

      index_state_line("Quadtree:", stats.spatial_state,
                       stats.prefilter_used ? "" : " (idle)");
      index_state_line("Years:   ", stats.temporal_state, "");

      ImGui::Text("Polygons:  %lld", static_cast<long long>(stats.polygons));
      ImGui::Text("Saved:     %.1f%%", stats.savings_percent);
      ImGui::Text("Pipeline:  %.2f ms", stats.elapsed_ms);
    }

    ImGui::Spacing();

    // === LOD DISTRIBUTION ===
    if (ImGui::CollapsingHeader("LOD Tiers", ImGuiTreeNodeFlags_DefaultOpen)) {
      const auto &lod = coordinator.lod_manager();
      float visible = static_cast<float>(std::max<size_t>(1, stats.visible));
      for (size_t t = 0; t < stats.per_tier.size() && t < lod.levels().size(); ++t) {
        const auto &level = lod.level(static_cast<int>(t));
        ImGui::Text("%s  %5.1f%%  %zu", level.name.c_str(),
                    level.polygon_ratio * 100.0f, stats.per_tier[t]);
        ImGui::ProgressBar(static_cast<float>(stats.per_tier[t]) / visible,
                           ImVec2(-1, 6), "");
      }
      if (ImGui::TreeNode("Configuration")) {
        ImGui::TextUnformatted(lod.summary().c_str());
        ImGui::TreePop();
      }
    }

    ImGui::Spacing();

    // === PERFORMANCE ===
    if (ImGui::CollapsingHeader("Performance", ImGuiTreeNodeFlags_DefaultOpen)) {
      ImGui::Text("FPS: %d", GetFPS());
      ImGui::Text("Frame: %.1f ms", GetFrameTime() * 1000.0f);

      static float frame_times[60] = {0};
      static int idx = 0;
      frame_times[idx] = GetFrameTime() * 1000.0f;
      idx = (idx + 1) % 60;
      ImGui::PlotLines("##ft", frame_times, 60, idx, nullptr, 0, 33.3f, ImVec2(-1, 30));
    }

    // === CONTROLS HELP ===
    ImGui::Spacing();
    if (ImGui::CollapsingHeader("Controls")) {
      ImGui::TextDisabled("Left drag / WASD: Orbit");
      ImGui::TextDisabled("Mouse Wheel: Zoom");
      ImGui::TextDisabled("Space: Play/Stop years");
      ImGui::TextDisabled("F3: Toggle event log");
    }

    // === LOG ===
    if (show_log_ && ImGui::CollapsingHeader("Event Log", ImGuiTreeNodeFlags_DefaultOpen)) {
      ImGui::BeginChild("##log", ImVec2(-1, 120), true);
      for (const auto &entry : log_entries_) {
        ImVec4 col = entry.severity == 2 ? ImVec4(1, 0.3f, 0.3f, 1) :
                     entry.severity == 1 ? ImVec4(1, 0.8f, 0.2f, 1) :
                                           ImVec4(0.7f, 0.7f, 0.7f, 1);
        ImGui::TextColored(col, "[%.0f] %s", entry.time, entry.message.c_str());
      }
      if (auto_scroll_log_) ImGui::SetScrollHereY(1.0f);
      ImGui::EndChild();
    }
  }
  ImGui::End();
}

void DebugUI::add_log(double time, const std::string &message, int severity) {
  log_entries_.push_back({time, message, severity});
  if (log_entries_.size() > MAX_LOG_ENTRIES) {
    log_entries_.pop_front();
  }
}

void DebugUI::clear_log() { log_entries_.clear(); }

bool DebugUI::is_capturing_mouse() const {
  return ImGui::GetIO().WantCaptureMouse;
}

} // namespace renderer
} // namespace windscape
