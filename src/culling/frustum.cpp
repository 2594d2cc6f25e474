/**
 * @file frustum.cpp
 * @brief Frustum plane extraction and visibility tests.
 */

#include <windscape/culling/frustum.hpp>

#include "raymath.h"

#include <algorithm>
#include <cmath>

namespace windscape {
namespace culling {

namespace {

constexpr float MIN_LENGTH = 1e-6f;
constexpr float MIN_UP_HEIGHT = 1e-3f; // Below this the open volume is unbounded

Plane plane_through(Vector3 normal, Vector3 point) {
  return Plane{normal.x, normal.y, normal.z,
               -Vector3DotProduct(normal, point)}.normalized();
}

Plane row_plane(float a, float b, float c, float d) {
  return Plane{a, b, c, d}.normalized();
}

} // namespace

// ============ Plane ============

Plane Plane::normalized() const {
  float length = std::sqrt(a * a + b * b + c * c);
  if (!(length > MIN_LENGTH)) {
    return always_pass();
  }
  return {a / length, b / length, c / length, d / length};
}

// ============ CameraPose ============

Vector3 CameraPose::eye() const {
  float rad_x = rot_x * constants::DEGREES_TO_RADIANS;
  float rad_y = rot_y * constants::DEGREES_TO_RADIANS;
  return {zoom * std::sin(rad_y) * std::cos(rad_x),
          zoom * std::sin(rad_x),
          zoom * std::cos(rad_y) * std::cos(rad_x)};
}

// ============ ViewFrustum ============

void ViewFrustum::extract_from_camera(float rot_x, float rot_y, float zoom,
                                      float fov, float aspect, float near_clip,
                                      float far_clip) {
  CameraPose pose;
  pose.rot_x = rot_x;
  pose.rot_y = rot_y;
  pose.zoom = zoom;
  pose.fov = fov;
  pose.aspect = aspect;
  pose.near_clip = near_clip;
  pose.far_clip = far_clip;
  extract_from_camera(pose);
}

void ViewFrustum::extract_from_camera(const CameraPose &pose, bool full_3d) {
  eye_ = pose.eye();

  // Camera looks at the origin
  Vector3 forward = Vector3Negate(eye_);
  if (Vector3Length(forward) > MIN_LENGTH) {
    forward = Vector3Normalize(forward);
  } else {
    forward = {0.0f, 0.0f, -1.0f};
  }

  Vector3 right = Vector3CrossProduct(forward, {0.0f, 1.0f, 0.0f});
  if (Vector3Length(right) > MIN_LENGTH) {
    right = Vector3Normalize(right);
  } else {
    right = {1.0f, 0.0f, 0.0f}; // Looking straight down
  }
  Vector3 up = Vector3CrossProduct(right, forward);

  float half_v = 0.5f * pose.fov * constants::DEGREES_TO_RADIANS;
  float half_h = std::atan(std::tan(half_v) * pose.aspect);

  // Near/far: offset along forward
  Vector3 near_center = Vector3Add(eye_, Vector3Scale(forward, pose.near_clip));
  Vector3 far_center = Vector3Add(eye_, Vector3Scale(forward, pose.far_clip));
  planes_[NEAR] = plane_through(forward, near_center);
  planes_[FAR] = plane_through(Vector3Negate(forward), far_center);

  // Left/right: forward rotated about the camera up axis, normals inward
  float cos_h = std::cos(half_h);
  float sin_h = std::sin(half_h);
  planes_[LEFT] = plane_through(
      Vector3Add(Vector3Scale(right, cos_h), Vector3Scale(forward, sin_h)), eye_);
  planes_[RIGHT] = plane_through(
      Vector3Add(Vector3Scale(right, -cos_h), Vector3Scale(forward, sin_h)), eye_);

  // Top/bottom: turbines are short relative to the camera height range,
  // so the near-planar field keeps them as pass-through planes.
  if (full_3d) {
    float cos_v = std::cos(half_v);
    float sin_v = std::sin(half_v);
    planes_[TOP] = plane_through(
        Vector3Add(Vector3Scale(up, -cos_v), Vector3Scale(forward, sin_v)), eye_);
    planes_[BOTTOM] = plane_through(
        Vector3Add(Vector3Scale(up, cos_v), Vector3Scale(forward, sin_v)), eye_);
  } else {
    planes_[TOP] = Plane::always_pass();
    planes_[BOTTOM] = Plane::always_pass();
  }

  // Corner points for the ground footprint
  float near_h = pose.near_clip * std::tan(half_v);
  float near_w = pose.near_clip * std::tan(half_h);
  float far_h = pose.far_clip * std::tan(half_v);
  float far_w = pose.far_clip * std::tan(half_h);

  for (int i = 0; i < 4; ++i) {
    float sx = (i & 1) ? 1.0f : -1.0f;
    float sy = (i & 2) ? 1.0f : -1.0f;
    near_corners_[i] = Vector3Add(
        near_center, Vector3Add(Vector3Scale(right, sx * near_w),
                                Vector3Scale(up, sy * near_h)));
    far_corners_[i] = Vector3Add(
        far_center, Vector3Add(Vector3Scale(right, sx * far_w),
                               Vector3Scale(up, sy * far_h)));
  }
  near_dist_ = pose.near_clip;
  far_dist_ = pose.far_clip;

  vertical_open_ = !full_3d;
  forward_ = forward;
  right_ = right;
  up_ = up;
  tan_half_h_ = std::tan(half_h);

  extracted_ = true;
}

void ViewFrustum::extract_from_matrices(const Matrix &projection,
                                        const Matrix &modelview) {
  // raymath multiplies in row-vector order: this is projection * modelview
  Matrix clip = MatrixMultiply(modelview, projection);

  // Clip-matrix rows (column-major storage)
  // row0 = m0 m4 m8 m12, row1 = m1 m5 m9 m13,
  // row2 = m2 m6 m10 m14, row3 = m3 m7 m11 m15
  planes_[LEFT] = row_plane(clip.m3 + clip.m0, clip.m7 + clip.m4,
                            clip.m11 + clip.m8, clip.m15 + clip.m12);
  planes_[RIGHT] = row_plane(clip.m3 - clip.m0, clip.m7 - clip.m4,
                             clip.m11 - clip.m8, clip.m15 - clip.m12);
  planes_[BOTTOM] = row_plane(clip.m3 + clip.m1, clip.m7 + clip.m5,
                              clip.m11 + clip.m9, clip.m15 + clip.m13);
  planes_[TOP] = row_plane(clip.m3 - clip.m1, clip.m7 - clip.m5,
                           clip.m11 - clip.m9, clip.m15 - clip.m13);
  planes_[NEAR] = row_plane(clip.m3 + clip.m2, clip.m7 + clip.m6,
                            clip.m11 + clip.m10, clip.m15 + clip.m14);
  planes_[FAR] = row_plane(clip.m3 - clip.m2, clip.m7 - clip.m6,
                           clip.m11 - clip.m10, clip.m15 - clip.m14);

  // Eye = -R^T * t for a rigid modelview
  const Matrix &mv = modelview;
  eye_ = {-(mv.m0 * mv.m12 + mv.m1 * mv.m13 + mv.m2 * mv.m14),
          -(mv.m4 * mv.m12 + mv.m5 * mv.m13 + mv.m6 * mv.m14),
          -(mv.m8 * mv.m12 + mv.m9 * mv.m13 + mv.m10 * mv.m14)};

  for (int i = 0; i < 4; ++i) {
    float sx = (i & 1) ? 1.0f : -1.0f;
    float sy = (i & 2) ? 1.0f : -1.0f;
    near_corners_[i] = Vector3Unproject({sx, sy, -1.0f}, projection, modelview);
    far_corners_[i] = Vector3Unproject({sx, sy, 1.0f}, projection, modelview);
  }

  Vector3 near_center = Vector3Zero();
  Vector3 far_center = Vector3Zero();
  for (int i = 0; i < 4; ++i) {
    near_center = Vector3Add(near_center, Vector3Scale(near_corners_[i], 0.25f));
    far_center = Vector3Add(far_center, Vector3Scale(far_corners_[i], 0.25f));
  }
  Vector3 axis = Vector3Subtract(far_center, near_center);
  if (Vector3Length(axis) > MIN_LENGTH) {
    Vector3 forward = Vector3Normalize(axis);
    near_dist_ = Vector3DotProduct(Vector3Subtract(near_center, eye_), forward);
    far_dist_ = Vector3DotProduct(Vector3Subtract(far_center, eye_), forward);
  } else {
    near_dist_ = 0.0f;
    far_dist_ = 0.0f;
  }
  vertical_open_ = false;

  extracted_ = true;
}

bool ViewFrustum::is_point_visible(float x, float y, float z) const {
  if (!extracted_) return true; // Nothing to test against: keep everything

  for (const auto &plane : planes_) {
    if (plane.distance(x, y, z) < 0.0f) return false;
  }
  return true;
}

bool ViewFrustum::is_sphere_visible(float x, float y, float z,
                                    float radius) const {
  if (!extracted_) return true;

  for (const auto &plane : planes_) {
    if (plane.distance(x, y, z) < -radius) return false;
  }
  return true;
}

bool ViewFrustum::is_aabb_visible(float x_min, float x_max, float y_min,
                                  float y_max, float z_min, float z_max) const {
  if (!extracted_) return true;

  for (const auto &plane : planes_) {
    float px = plane.a >= 0.0f ? x_max : x_min;
    float py = plane.b >= 0.0f ? y_max : y_min;
    float pz = plane.c >= 0.0f ? z_max : z_min;
    if (plane.distance(px, py, pz) < 0.0f) return false;
  }
  return true;
}

std::optional<spatial::BoundingBox>
ViewFrustum::ground_footprint(float max_range, float y_min, float y_max) const {
  if (!extracted_) return std::nullopt;

  float t = 1.0f;
  if (max_range > 0.0f && far_dist_ > near_dist_) {
    t = std::clamp((max_range - near_dist_) / (far_dist_ - near_dist_), 0.0f, 1.0f);
  }
  float reach = near_dist_ + t * (far_dist_ - near_dist_);

  float x_min = eye_.x, x_max = eye_.x;
  float z_min = eye_.z, z_max = eye_.z;
  auto grow = [&](const Vector3 &p) {
    x_min = std::min(x_min, p.x);
    x_max = std::max(x_max, p.x);
    z_min = std::min(z_min, p.z);
    z_max = std::max(z_max, p.z);
  };

  if (vertical_open_) {
    if (std::fabs(up_.y) < MIN_UP_HEIGHT) return std::nullopt;

    // Side edges of the near/far trapezoid, slid along up to each height
    const float depths[2] = {near_dist_, reach};
    const float heights[2] = {y_min, y_max};
    for (float depth : depths) {
      for (float side : {-1.0f, 1.0f}) {
        Vector3 edge = Vector3Add(
            Vector3Add(eye_, Vector3Scale(forward_, depth)),
            Vector3Scale(right_, side * depth * tan_half_h_));
        for (float y : heights) {
          grow(Vector3Add(edge, Vector3Scale(up_, (y - edge.y) / up_.y)));
        }
      }
    }
  } else {
    for (int i = 0; i < 4; ++i) {
      grow(near_corners_[i]);
      grow(Vector3Lerp(near_corners_[i], far_corners_[i], t));
    }
  }

  if (!std::isfinite(x_min) || !std::isfinite(x_max) ||
      !std::isfinite(z_min) || !std::isfinite(z_max)) {
    return std::nullopt;
  }
  return spatial::BoundingBox(x_min, x_max, z_min, z_max);
}

// ============ Free functions ============

ViewFrustum update_camera(const CameraPose &pose) {
  ViewFrustum frustum;
  frustum.extract_from_camera(pose);
  return frustum;
}

ViewFrustum update_camera(float rot_x, float rot_y, float zoom, float fov,
                          float aspect, float near_clip, float far_clip) {
  ViewFrustum frustum;
  frustum.extract_from_camera(rot_x, rot_y, zoom, fov, aspect, near_clip,
                              far_clip);
  return frustum;
}

}  // namespace culling
}  // namespace windscape
