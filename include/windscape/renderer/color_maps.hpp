#pragma once

/**
 * @file color_maps.hpp
 * @brief Color utilities for turbine visualization.
 */

#include "raylib.h"
#include <algorithm>

namespace windscape {
namespace renderer {

/**
 * @brief Linearly interpolate between two colors.
 */
inline Color lerp_color(Color a, Color b, float t) {
  t = std::clamp(t, 0.0f, 1.0f);
  return {static_cast<unsigned char>(a.r + (b.r - a.r) * t),
          static_cast<unsigned char>(a.g + (b.g - a.g) * t),
          static_cast<unsigned char>(a.b + (b.b - a.b) * t),
          static_cast<unsigned char>(a.a + (b.a - a.a) * t)};
}

/**
 * @brief Rated power class (green < 1 MW, yellow < 3 MW, orange < 5 MW, red).
 */
inline Color power_to_color(float power_kw) {
  if (power_kw < 1000.0f) return {60, 200, 80, 255};
  if (power_kw < 3000.0f) return {235, 215, 50, 255};
  if (power_kw < 5000.0f) return {245, 140, 30, 255};
  return {225, 50, 40, 255};
}

/**
 * @brief Fade toward the background for coarse tiers.
 * @param tier_fraction tier / (tier_count - 1)
 */
inline Color tier_shade(Color base, float tier_fraction) {
  return lerp_color(base, {40, 45, 50, 255}, tier_fraction * 0.45f);
}

} // namespace renderer
} // namespace windscape
