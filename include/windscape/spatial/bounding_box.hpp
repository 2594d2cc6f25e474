#pragma once

/**
 * @file bounding_box.hpp
 * @brief Axis-aligned rectangle on the ground plane (x, z).
 */

#include <algorithm>

namespace windscape {
namespace spatial {

/**
 * @brief Immutable 2D AABB. All edge tests are inclusive.
 */
class BoundingBox {
public:
  BoundingBox() = default;

  BoundingBox(float x_min, float x_max, float z_min, float z_max)
      : x_min_(std::min(x_min, x_max)), x_max_(std::max(x_min, x_max)),
        z_min_(std::min(z_min, z_max)), z_max_(std::max(z_min, z_max)) {}

  float x_min() const { return x_min_; }
  float x_max() const { return x_max_; }
  float z_min() const { return z_min_; }
  float z_max() const { return z_max_; }

  float width() const { return x_max_ - x_min_; }
  float height() const { return z_max_ - z_min_; }
  float center_x() const { return (x_min_ + x_max_) * 0.5f; }
  float center_z() const { return (z_min_ + z_max_) * 0.5f; }

  bool is_degenerate() const { return width() <= 0.0f || height() <= 0.0f; }

  bool contains(float x, float z) const {
    return x_min_ <= x && x <= x_max_ && z_min_ <= z && z <= z_max_;
  }

  bool intersects(const BoundingBox &other) const {
    return x_min_ <= other.x_max_ && x_max_ >= other.x_min_ &&
           z_min_ <= other.z_max_ && z_max_ >= other.z_min_;
  }

  /**
   * @brief Quadrant of this box split at its center.
   * @param index 0 = NW, 1 = NE, 2 = SW, 3 = SE
   */
  BoundingBox quadrant(int index) const {
    float cx = center_x();
    float cz = center_z();
    bool east = (index & 1) != 0;
    bool south = (index & 2) != 0;
    return {east ? cx : x_min_, east ? x_max_ : cx,
            south ? cz : z_min_, south ? z_max_ : cz};
  }

  BoundingBox expanded_to(float x, float z) const {
    return {std::min(x_min_, x), std::max(x_max_, x),
            std::min(z_min_, z), std::max(z_max_, z)};
  }

  BoundingBox expanded_by(float margin) const {
    return {x_min_ - margin, x_max_ + margin, z_min_ - margin, z_max_ + margin};
  }

private:
  float x_min_ = 0.0f;
  float x_max_ = 0.0f;
  float z_min_ = 0.0f;
  float z_max_ = 0.0f;
};

}  // namespace spatial
}  // namespace windscape
