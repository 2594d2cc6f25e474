/**
 * @file main.cpp
 * @brief Entry point for the Windscape turbine viewer.
 */

#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <string>

#include "raylib.h"

#include <windscape/core/constants.hpp>
#include <windscape/lod/lod_manager.hpp>
#include <windscape/pipeline/coordinator.hpp>
#include <windscape/renderer/debug_ui.hpp>
#include <windscape/renderer/renderer.hpp>

using namespace windscape;

int main(int argc, char **argv) {
  std::cout << "=== Windscape Turbine Viewer ===" << std::endl;
  std::cout << "Initializing systems..." << std::endl;

  // Feature count from the command line, full dataset size otherwise
  long requested = constants::FULL_DATASET_SIZE;
  if (argc > 1) {
    char *end = nullptr;
    requested = std::strtol(argv[1], &end, 10);
    if (end == argv[1] || *end != '\0' || requested < 0) {
      std::cerr << "[ERROR] Invalid turbine count: " << argv[1] << std::endl;
      return 1;
    }
  }

  // Pipeline and synthetic field
  pipeline::PipelineConfig pipeline_config;
  pipeline::PipelineCoordinator coordinator(pipeline_config);

  coordinator.store().spawn_random_field(static_cast<size_t>(requested),
                                         pipeline_config.quadtree.bounds,
                                         constants::FIRST_YEAR, constants::LAST_YEAR);
  std::cout << "[OK] Features: " << coordinator.store().size() << " turbines ("
            << constants::FIRST_YEAR << "-" << constants::LAST_YEAR << ")"
            << std::endl;

  coordinator.build_indices();

  // Initialize Renderer
  renderer::RendererConfig render_config;
  render_config.title = "Windscape - Wind Turbine Viewer";

  renderer::Renderer viewer;
  viewer.init(render_config);
  std::cout << "[OK] Renderer: " << render_config.window_width << "x"
            << render_config.window_height << " window" << std::endl;

  // Initialize Debug UI
  renderer::DebugUI debug_ui;
  debug_ui.init();
  std::cout << "[OK] Debug UI: Dear ImGui initialized" << std::endl;

  renderer::ViewerControls controls;
  if (coordinator.year_index().year_count() > 0) {
    controls.min_year = coordinator.year_index().min_year();
    controls.max_year = coordinator.year_index().max_year();
  }
  controls.year = controls.max_year;
  controls.preset = static_cast<int>(coordinator.preset());

  debug_ui.add_log(0.0, "Loaded " + std::to_string(coordinator.store().size()) +
                            " turbines, preset " +
                            lod::LODManager::preset_name(coordinator.preset()));

  std::cout << std::endl;
  std::cout << "=== Viewer Running ===" << std::endl;
  std::cout << "Controls:" << std::endl;
  std::cout << "  Left drag / WASD: Orbit camera" << std::endl;
  std::cout << "  Mouse Wheel: Zoom" << std::endl;
  std::cout << "  Space: Play/Stop year animation" << std::endl;
  std::cout << "  F3: Toggle event log" << std::endl;
  std::cout << std::endl;

  double time = 0.0;
  double year_timer = 0.0;
  spatial::IndexState last_state = spatial::IndexState::BUILT;
  size_t frames = 0;

  while (!viewer.should_close()) {
    if (IsKeyPressed(KEY_F3))
      debug_ui.toggle_log();

    viewer.update_input(debug_ui.is_capturing_mouse());
    if (viewer.is_autoplay_toggled())
      controls.autoplay = !controls.autoplay;

    double dt = static_cast<double>(GetFrameTime());
    time += dt;

    // Year animation: one year per second, wrapping at the end
    if (controls.autoplay) {
      year_timer += dt;
      while (year_timer >= 1.0) {
        year_timer -= 1.0;
        controls.year = controls.year >= controls.max_year ? controls.min_year
                                                           : controls.year + 1;
      }
    }

    if (controls.animate_blades)
      coordinator.store().update(dt);

    // Apply sidebar choices
    auto &config = coordinator.config();
    config.use_spatial_prefilter = controls.use_prefilter;
    config.use_frustum_culling = controls.use_frustum;

    auto preset = static_cast<lod::LODPreset>(std::clamp(controls.preset, 0, 2));
    if (preset != coordinator.preset()) {
      coordinator.set_preset(preset);
      debug_ui.add_log(time, std::string("LOD preset: ") +
                                 lod::LODManager::preset_name(preset));
    }

    // Pipeline
    coordinator.update_camera(viewer.pose());
    pipeline::FrameOutput frame = coordinator.render_frame(controls.year);

    const auto &stats = coordinator.last_frame_stats();
    if (stats.spatial_state != last_state) {
      if (stats.spatial_state != spatial::IndexState::BUILT) {
        debug_ui.add_log(time, "Quadtree unavailable, prefilter skipped", 1);
      }
      last_state = stats.spatial_state;
    }

    // Render
    viewer.begin_frame();
    viewer.draw_ground(coordinator.quadtree().bounds());
    if (controls.show_quadtree)
      viewer.draw_quadtree(coordinator.quadtree());
    viewer.draw_turbines(coordinator.store().registry(), frame,
                         coordinator.lod_manager());
    viewer.end_world();

    debug_ui.begin_frame();
    debug_ui.draw_sidebar(controls, coordinator, render_config.sidebar_width);
    debug_ui.end_frame();

    viewer.end_frame();
    ++frames;
  }

  // Cleanup
  debug_ui.shutdown();
  viewer.shutdown();

  std::cout << std::endl;
  std::cout << "=== Viewer Closed ===" << std::endl;
  std::cout << "Frames: " << frames << std::endl;
  std::cout << coordinator.stats_summary();

  return 0;
}
