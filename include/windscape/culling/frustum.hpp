#pragma once

/**
 * @file frustum.hpp
 * @brief Six-plane view frustum for turbine visibility tests.
 *
 * Two extraction paths:
 * - From orbit camera parameters (rotation, zoom, FOV, clip distances)
 * - From projection/modelview matrices (Gribb & Hartmann)
 *
 * Sphere and AABB tests are conservative: an object that is truly visible
 * is never rejected, objects near the edges may be kept.
 */

#include "raylib.h"
#include <windscape/core/constants.hpp>
#include <windscape/spatial/bounding_box.hpp>

#include <array>
#include <optional>

namespace windscape {
namespace culling {

/**
 * @brief Plane ax + by + cz + d = 0; positive side is inside.
 */
struct Plane {
  float a = 0.0f;
  float b = 0.0f;
  float c = 0.0f;
  float d = 1.0f;

  /**
   * @brief Scale to a unit normal. A zero-length normal yields the
   * always-pass plane (0, 0, 0, 1).
   */
  Plane normalized() const;

  float distance(float x, float y, float z) const {
    return a * x + b * y + c * z + d;
  }

  static Plane always_pass() { return {0.0f, 0.0f, 0.0f, 1.0f}; }
};

/**
 * @brief Orbit camera around the map origin.
 */
struct CameraPose {
  float rot_x = constants::CAMERA_ROT_X;   // Pitch (degrees)
  float rot_y = constants::CAMERA_ROT_Y;   // Yaw (degrees)
  float zoom = constants::CAMERA_ZOOM;     // Distance to origin
  float fov = constants::CAMERA_FOV;       // Vertical FOV (degrees)
  float aspect = 1.5f;                     // width / height
  float near_clip = constants::CAMERA_NEAR;
  float far_clip = constants::CAMERA_FAR;

  /**
   * @brief Eye position on the orbit sphere.
   */
  Vector3 eye() const;
};

/**
 * @brief View frustum with eye position and corner points.
 */
class ViewFrustum {
public:
  enum PlaneIndex { NEAR = 0, FAR = 1, LEFT = 2, RIGHT = 3, TOP = 4, BOTTOM = 5 };

  ViewFrustum() = default;

  /**
   * @brief Build planes from an orbit camera looking at the origin.
   * @param full_3d Build true top/bottom planes; otherwise they always pass
   */
  void extract_from_camera(const CameraPose &pose, bool full_3d = false);
  void extract_from_camera(float rot_x, float rot_y, float zoom, float fov,
                           float aspect, float near_clip, float far_clip);

  /**
   * @brief Gribb-Hartmann extraction from raylib (column-major) matrices.
   */
  void extract_from_matrices(const Matrix &projection, const Matrix &modelview);

  bool is_point_visible(float x, float y, float z) const;
  bool is_sphere_visible(float x, float y, float z, float radius) const;

  /**
   * @brief p-vertex test: per plane only the corner furthest along the
   * normal is checked.
   */
  bool is_aabb_visible(float x_min, float x_max, float y_min, float y_max,
                       float z_min, float z_max) const;

  /**
   * @brief xz bounds of the visible volume between heights y_min and y_max,
   * far distance capped at max_range (<= 0: the far clip).
   *
   * With pass-through top/bottom planes the volume is open along the camera
   * up axis, so the bounds come from where its edges cross the two heights.
   * Empty when the camera is not extracted or the volume is unbounded.
   */
  std::optional<spatial::BoundingBox>
  ground_footprint(float max_range, float y_min = 0.0f, float y_max = 0.0f) const;

  bool is_extracted() const { return extracted_; }
  const Plane &plane(PlaneIndex index) const { return planes_[index]; }
  const std::array<Plane, 6> &planes() const { return planes_; }
  Vector3 eye() const { return eye_; }

private:
  std::array<Plane, 6> planes_{};
  bool extracted_ = false;

  Vector3 eye_{0.0f, 0.0f, 0.0f};
  std::array<Vector3, 4> near_corners_{};
  std::array<Vector3, 4> far_corners_{};
  float near_dist_ = 0.0f;
  float far_dist_ = 0.0f;

  // Camera path with pass-through top/bottom planes
  bool vertical_open_ = false;
  Vector3 forward_{0.0f, 0.0f, -1.0f};
  Vector3 right_{1.0f, 0.0f, 0.0f};
  Vector3 up_{0.0f, 1.0f, 0.0f};
  float tan_half_h_ = 0.0f;
};

/**
 * @brief Frustum for the given camera pose (camera-parameter path).
 */
ViewFrustum update_camera(const CameraPose &pose);
ViewFrustum update_camera(float rot_x, float rot_y, float zoom, float fov,
                          float aspect, float near_clip, float far_clip);

}  // namespace culling
}  // namespace windscape
