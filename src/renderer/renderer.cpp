/**
 * @file renderer.cpp
 * @brief Implementation of the Raylib-based turbine viewer.
 */

#include <windscape/renderer/renderer.hpp>
#include <windscape/renderer/color_maps.hpp>
#include <windscape/features/components.hpp>
#include <windscape/core/constants.hpp>

#include <algorithm>
#include <cmath>

namespace windscape {
namespace renderer {

void Renderer::init(const RendererConfig &config) {
  config_ = config;

  SetConfigFlags(FLAG_WINDOW_RESIZABLE | FLAG_VSYNC_HINT | FLAG_MSAA_4X_HINT);
  InitWindow(config_.window_width, config_.window_height, config_.title.c_str());
  SetTargetFPS(config_.target_fps);

  camera_.target = {0.0f, 0.0f, 0.0f};
  camera_.up = {0.0f, 1.0f, 0.0f};
  camera_.projection = CAMERA_PERSPECTIVE;
  sync_camera();
}

void Renderer::shutdown() { CloseWindow(); }

void Renderer::update_input(bool ui_capturing_mouse) {
  handle_camera_input(ui_capturing_mouse);

  autoplay_toggled_ = IsKeyPressed(KEY_SPACE);
  sync_camera();
}

void Renderer::handle_camera_input(bool ui_capturing_mouse) {
  Vector2 mouse_pos = GetMousePosition();
  bool over_world = !ui_capturing_mouse && mouse_pos.x > config_.sidebar_width;

  // Orbit with left mouse drag
  if (over_world && IsMouseButtonPressed(MOUSE_BUTTON_LEFT)) {
    dragging_ = true;
    last_mouse_pos_ = mouse_pos;
  }
  if (IsMouseButtonReleased(MOUSE_BUTTON_LEFT)) {
    dragging_ = false;
  }
  if (dragging_) {
    Vector2 delta = {mouse_pos.x - last_mouse_pos_.x,
                     mouse_pos.y - last_mouse_pos_.y};
    pose_.rot_y -= delta.x * 0.3f;
    pose_.rot_x = std::clamp(pose_.rot_x + delta.y * 0.3f,
                             constants::CAMERA_MIN_PITCH,
                             constants::CAMERA_MAX_PITCH);
    last_mouse_pos_ = mouse_pos;
  }

  // Zoom with mouse wheel
  float wheel = GetMouseWheelMove();
  if (over_world && wheel != 0) {
    pose_.zoom = std::clamp(pose_.zoom - wheel * 0.2f, constants::CAMERA_MIN_ZOOM,
                            constants::CAMERA_MAX_ZOOM);
  }

  // Keyboard orbit
  float dt = GetFrameTime();
  if (IsKeyDown(KEY_A) || IsKeyDown(KEY_LEFT)) pose_.rot_y -= 60.0f * dt;
  if (IsKeyDown(KEY_D) || IsKeyDown(KEY_RIGHT)) pose_.rot_y += 60.0f * dt;
  if (IsKeyDown(KEY_W) || IsKeyDown(KEY_UP)) {
    pose_.rot_x = std::min(pose_.rot_x + 40.0f * dt, constants::CAMERA_MAX_PITCH);
  }
  if (IsKeyDown(KEY_S) || IsKeyDown(KEY_DOWN)) {
    pose_.rot_x = std::max(pose_.rot_x - 40.0f * dt, constants::CAMERA_MIN_PITCH);
  }
}

void Renderer::sync_camera() {
  int height = std::max(1, GetScreenHeight());
  pose_.aspect = static_cast<float>(GetScreenWidth()) / static_cast<float>(height);

  camera_.position = pose_.eye();
  camera_.fovy = pose_.fov;
}

void Renderer::begin_frame() {
  BeginDrawing();
  ClearBackground({18, 22, 28, 255});
  BeginMode3D(camera_);
}

void Renderer::draw_ground(const spatial::BoundingBox &bounds) {
  Vector3 center = {bounds.center_x(), constants::TERRAIN_HEIGHT, bounds.center_z()};
  DrawPlane(center, {bounds.width(), bounds.height()}, {46, 58, 48, 255});
}

void Renderer::draw_quadtree(const spatial::Quadtree &quadtree) {
  const float y = constants::TERRAIN_HEIGHT + 0.001f;
  const Color line = {120, 200, 230, 60};

  quadtree.for_each_leaf([&](const spatial::BoundingBox &box, int, size_t count) {
    if (count == 0) return; // Empty leaves only add clutter
    Vector3 a = {box.x_min(), y, box.z_min()};
    Vector3 b = {box.x_max(), y, box.z_min()};
    Vector3 c = {box.x_max(), y, box.z_max()};
    Vector3 d = {box.x_min(), y, box.z_max()};
    DrawLine3D(a, b, line);
    DrawLine3D(b, c, line);
    DrawLine3D(c, d, line);
    DrawLine3D(d, a, line);
  });
}

void Renderer::draw_turbines(const entt::registry &registry,
                             const pipeline::FrameOutput &frame,
                             const lod::LODManager &lod_manager) {
  float last_tier = static_cast<float>(std::max(1, lod_manager.tier_count() - 1));

  for (const auto &batch : frame.tiers) {
    const lod::LODLevel &level = lod_manager.level(batch.tier);
    float fraction = static_cast<float>(batch.tier) / last_tier;

    for (auto entity : batch.features) {
      const auto &pos = registry.get<features::GroundPosition>(entity);
      const auto &shape = registry.get<features::TurbineShape>(entity);
      const auto &install = registry.get<features::Installation>(entity);

      Color color = tier_shade(power_to_color(install.magnitude), fraction);
      draw_turbine(pos.x, pos.z, shape, level, color);
    }
  }
}

void Renderer::draw_turbine(float x, float z, const features::TurbineShape &shape,
                            const lod::LODLevel &level, Color color) {
  if (level.use_billboard) {
    DrawCube({x, shape.base_height + 0.5f * shape.height, z}, 0.008f, 0.008f,
             0.008f, color);
    return;
  }

  // Tower
  float tower_radius = shape.height * 0.04f;
  DrawCylinder({x, shape.base_height, z}, tower_radius * 0.6f, tower_radius,
               shape.height, level.segment_count, color);

  Vector3 hub = {x, shape.base_height + shape.height, z};

  // Nacelle
  if (!level.skip_nacelle) {
    DrawCube(hub, shape.height * 0.12f, shape.height * 0.1f, shape.height * 0.22f,
             {220, 220, 225, 255});
  }

  // Blades in the rotor plane facing +z
  if (!level.skip_blades && level.blade_count > 0) {
    Vector3 rotor = {hub.x, hub.y, hub.z + shape.height * 0.12f};
    float step = 360.0f / static_cast<float>(level.blade_count);
    for (int i = 0; i < level.blade_count; ++i) {
      float angle = (shape.blade_angle + step * i) * constants::DEGREES_TO_RADIANS;
      Vector3 tip = {rotor.x + std::cos(angle) * shape.rotor_radius,
                     rotor.y + std::sin(angle) * shape.rotor_radius, rotor.z};
      DrawLine3D(rotor, tip, {235, 235, 240, 255});
    }
  }
}

void Renderer::end_world() { EndMode3D(); }

void Renderer::end_frame() { EndDrawing(); }

} // namespace renderer
} // namespace windscape
