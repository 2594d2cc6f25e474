#pragma once

/**
 * @file constants.hpp
 * @brief Map extents, camera limits and dataset defaults for windscape.
 */

namespace windscape {
namespace constants {

// === Map extents (normalized ground plane, x = east, z = south) ===
constexpr float MAP_X_MIN = -1.6f;
constexpr float MAP_X_MAX = 1.6f;
constexpr float MAP_Z_MIN = -1.9f;
constexpr float MAP_Z_MAX = 1.9f;

// === Turbine geometry defaults (map units) ===
constexpr float TURBINE_HEIGHT = 0.08f;
constexpr float ROTOR_RADIUS = 0.04f;
constexpr float TERRAIN_HEIGHT = 0.18f;  // Extruded map surface
constexpr float RATED_POWER_KW = 3000.0f;
constexpr int INSTALL_YEAR = 2000;

// === Camera ===
constexpr float CAMERA_ROT_X = 45.0f;    // Pitch (degrees)
constexpr float CAMERA_ROT_Y = 25.0f;    // Yaw (degrees)
constexpr float CAMERA_ZOOM = 3.8f;      // Orbit distance
constexpr float CAMERA_MIN_ZOOM = 1.5f;
constexpr float CAMERA_MAX_ZOOM = 6.0f;
constexpr float CAMERA_MIN_PITCH = 5.0f;
constexpr float CAMERA_MAX_PITCH = 89.0f;
constexpr float CAMERA_FOV = 45.0f;      // Vertical FOV (degrees)
constexpr float CAMERA_NEAR = 0.01f;
constexpr float CAMERA_FAR = 10.0f;

// === Dataset ===
constexpr int FIRST_YEAR = 1990;
constexpr int LAST_YEAR = 2023;
constexpr int FULL_DATASET_SIZE = 29722;

constexpr float DEGREES_TO_RADIANS = 0.017453292519943295f;

}  // namespace constants
}  // namespace windscape
