#pragma once

#include <windscape/core/constants.hpp>

namespace windscape {
namespace features {

/**
 * @brief Position on the ground plane.
 */
struct GroundPosition {
  float x;
  float z;
};

/**
 * @brief Activation year and magnitude (rated power in kW).
 */
struct Installation {
  int year = constants::INSTALL_YEAR;
  float magnitude = constants::RATED_POWER_KW;
};

/**
 * @brief Turbine geometry used for the culling sphere and drawing.
 */
struct TurbineShape {
  float height = constants::TURBINE_HEIGHT;
  float rotor_radius = constants::ROTOR_RADIUS;
  float base_height = constants::TERRAIN_HEIGHT; // Terrain under the tower
  float blade_angle = 0.0f;                      // Degrees
};

/**
 * @brief Per-frame detail state, written by the pipeline.
 */
struct LodState {
  int tier = 0;
  float distance_to_camera = 0.0f;
};

}  // namespace features
}  // namespace windscape
