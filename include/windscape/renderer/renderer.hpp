#pragma once

/**
 * @file renderer.hpp
 * @brief Raylib-based 3D viewer for the turbine field.
 *
 * Features:
 * - Orbit camera (drag to rotate, wheel to zoom)
 * - Per-tier turbine geometry from the LOD table
 * - Ground plane and quadtree leaf overlay
 */

#include "raylib.h"
#include "entt/entt.hpp"
#include <string>

#include <windscape/culling/frustum.hpp>
#include <windscape/lod/lod_manager.hpp>
#include <windscape/pipeline/coordinator.hpp>
#include <windscape/spatial/quadtree.hpp>

namespace windscape {
namespace renderer {

/**
 * @brief Renderer configuration.
 */
struct RendererConfig {
  int window_width = 1500;
  int window_height = 1000;
  std::string title = "Windscape";
  int target_fps = 60;
  float sidebar_width = 260.0f;  // Mouse input left of this goes to the UI
};

/**
 * @brief Turbine field visualization.
 */
class Renderer {
public:
  Renderer() = default;
  ~Renderer() = default;

  // Lifecycle
  void init(const RendererConfig &config);
  void shutdown();
  bool should_close() const;

  // Input handling
  void update_input(bool ui_capturing_mouse);

  // Rendering
  void begin_frame();
  void draw_ground(const spatial::BoundingBox &bounds);
  void draw_quadtree(const spatial::Quadtree &quadtree);
  void draw_turbines(const entt::registry &registry,
                     const pipeline::FrameOutput &frame,
                     const lod::LODManager &lod_manager);
  void end_world();  // Leave 3D mode before screen-space UI
  void end_frame();

  // State accessors
  const culling::CameraPose &pose() const { return pose_; }
  const Camera3D &get_camera() const { return camera_; }
  bool is_autoplay_toggled() const { return autoplay_toggled_; }

private:
  RendererConfig config_;
  Camera3D camera_{};
  culling::CameraPose pose_;

  // Mouse state
  Vector2 last_mouse_pos_{};
  bool dragging_ = false;
  bool autoplay_toggled_ = false;

  // Internal helpers
  void handle_camera_input(bool ui_capturing_mouse);
  void sync_camera();
  void draw_turbine(float x, float z, const features::TurbineShape &shape,
                    const lod::LODLevel &level, Color color);
};

// === Inline implementations ===

inline bool Renderer::should_close() const { return WindowShouldClose(); }

} // namespace renderer
} // namespace windscape
