#include <windscape/features/feature_store.hpp>

#include <algorithm>
#include <cmath>

namespace windscape {
namespace features {

void FeatureStore::init(uint32_t seed) {
  clear();
  // Seed the RNG for deterministic synthetic fields
  rng_.seed(seed);
}

void FeatureStore::clear() {
  registry_.clear();
  count_ = 0;
  ++generation_;
}

entt::entity FeatureStore::add_turbine(float x, float z,
                                       const TurbineSpec &spec) {
  auto entity = registry_.create();

  registry_.emplace<GroundPosition>(entity, x, z);
  registry_.emplace<Installation>(entity, spec.year, spec.power_kw);

  // Stagger blade phases so neighbouring rotors don't spin in lockstep
  float phase = static_cast<float>((count_ * 37) % 360);
  registry_.emplace<TurbineShape>(entity, spec.height, spec.rotor_radius,
                                  spec.base_height, phase);
  registry_.emplace<LodState>(entity);

  ++count_;
  ++generation_;
  return entity;
}

void FeatureStore::spawn_random_field(size_t count,
                                      const spatial::BoundingBox &bounds,
                                      int first_year, int last_year) {
  std::uniform_real_distribution<float> dist_x(bounds.x_min(), bounds.x_max());
  std::uniform_real_distribution<float> dist_z(bounds.z_min(), bounds.z_max());
  std::uniform_int_distribution<int> dist_year(std::min(first_year, last_year),
                                               std::max(first_year, last_year));
  std::uniform_real_distribution<float> dist_power(2000.0f, 8000.0f);

  for (size_t i = 0; i < count; ++i) {
    TurbineSpec spec;
    float x = dist_x(rng_);
    float z = dist_z(rng_);
    spec.year = dist_year(rng_);
    spec.power_kw = dist_power(rng_);
    add_turbine(x, z, spec);
  }
}

void FeatureStore::update(double dt) {
  float delta = blade_speed_ * static_cast<float>(dt);
  auto view = registry_.view<TurbineShape>();

  view.each([delta](TurbineShape &shape) {
    shape.blade_angle = std::fmod(shape.blade_angle + delta, 360.0f);
  });
}

}  // namespace features
}  // namespace windscape
