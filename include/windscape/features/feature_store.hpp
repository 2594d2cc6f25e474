#pragma once

#include "entt/entt.hpp"
#include <windscape/features/components.hpp>
#include <windscape/spatial/bounding_box.hpp>

#include <cstdint>
#include <random>

namespace windscape {
namespace features {

/**
 * @brief Optional per-turbine attributes; defaults match the map scale.
 */
struct TurbineSpec {
  float height = constants::TURBINE_HEIGHT;
  float rotor_radius = constants::ROTOR_RADIUS;
  float power_kw = constants::RATED_POWER_KW;
  int year = constants::INSTALL_YEAR;
  float base_height = constants::TERRAIN_HEIGHT;
};

/**
 * @brief Owns the feature set in an EnTT registry.
 *
 * Features are only ever added or cleared as a whole. Every structural
 * change bumps generation(), which indices compare against to detect
 * staleness.
 */
class FeatureStore {
public:
  FeatureStore() = default;
  ~FeatureStore() = default;

  FeatureStore(const FeatureStore &) = delete;
  FeatureStore &operator=(const FeatureStore &) = delete;

  // Lifecycle
  void init(uint32_t seed = 42);
  void clear();

  // Spawning
  entt::entity add_turbine(float x, float z, const TurbineSpec &spec = {});

  /**
   * @brief Populate a deterministic synthetic field.
   * Positions are uniform over bounds, years uniform in
   * [first_year, last_year], power uniform in [2000, 8000] kW.
   */
  void spawn_random_field(size_t count, const spatial::BoundingBox &bounds,
                          int first_year, int last_year);

  // Systems
  void update(double dt); // Blade animation

  // Accessors
  entt::registry &registry() { return registry_; }
  const entt::registry &registry() const { return registry_; }

  size_t size() const { return count_; }
  bool empty() const { return count_ == 0; }
  uint64_t generation() const { return generation_; }

  float blade_speed() const { return blade_speed_; }
  void set_blade_speed(float deg_per_second) { blade_speed_ = deg_per_second; }

private:
  entt::registry registry_;
  size_t count_ = 0;
  uint64_t generation_ = 0;
  float blade_speed_ = 90.0f;

  std::mt19937 rng_{42};
};

}  // namespace features
}  // namespace windscape
