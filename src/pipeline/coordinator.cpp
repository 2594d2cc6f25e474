/**
 * @file coordinator.cpp
 * @brief Pipeline stages and index lifecycle.
 */

#include <windscape/pipeline/coordinator.hpp>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <omp.h>
#include <sstream>

namespace windscape {
namespace pipeline {

size_t FrameOutput::visible_count() const {
  size_t total = 0;
  for (const auto &batch : tiers) {
    total += batch.features.size();
  }
  return total;
}

PipelineCoordinator::PipelineCoordinator(const PipelineConfig &config)
    : config_(config), quadtree_(config.quadtree) {
  store_.init();
}

entt::entity PipelineCoordinator::add_turbine(float x, float z,
                                              const features::TurbineSpec &spec) {
  // Bumps the store generation, which marks both indices stale
  return store_.add_turbine(x, z, spec);
}

void PipelineCoordinator::build_indices() {
  year_index_.build(store_);

  // Build completely, then replace
  spatial::Quadtree fresh = build_spatial_index(store_, config_.quadtree);
  quadtree_ = std::move(fresh);

  if (config_.auto_select_preset) {
    preset_ = lod::LODManager::preset_for_feature_count(store_.size());
    lod_manager_ = lod::LODManager::from_preset(preset_);
  }

  auto stats = quadtree_.stats();
  std::cout << "[OK] Indices: " << store_.size() << " features, "
            << year_index_.year_count() << " years, " << stats.leaves
            << " leaves (depth " << stats.max_depth << "), LOD preset "
            << lod::LODManager::preset_name(preset_) << ", "
            << omp_get_max_threads() << " cull threads" << std::endl;
  if (stats.rejected > 0) {
    std::cerr << "[WARN] Quadtree: " << stats.rejected
              << " features with invalid positions not indexed" << std::endl;
  }
}

const culling::ViewFrustum &
PipelineCoordinator::update_camera(const culling::CameraPose &pose) {
  frustum_ = culling::update_camera(pose);
  return frustum_;
}

void PipelineCoordinator::set_preset(lod::LODPreset preset) {
  preset_ = preset;
  lod_manager_ = lod::LODManager::from_preset(preset);
  config_.auto_select_preset = false; // Explicit choice sticks across rebuilds
}

spatial::IndexState
PipelineCoordinator::spatial_state(const spatial::Quadtree &quadtree) const {
  if (!quadtree.is_built()) return spatial::IndexState::NOT_BUILT;
  if (quadtree.source() != &store_) return spatial::IndexState::FOREIGN;
  if (quadtree.built_generation() != store_.generation()) {
    return spatial::IndexState::STALE;
  }
  return spatial::IndexState::BUILT;
}

spatial::IndexState
PipelineCoordinator::temporal_state(const temporal::YearIndex &year_index) const {
  if (!year_index.source()) return spatial::IndexState::NOT_BUILT;
  if (year_index.source() != &store_) return spatial::IndexState::FOREIGN;
  if (year_index.is_stale()) return spatial::IndexState::STALE;
  return spatial::IndexState::BUILT;
}

void PipelineCoordinator::warn_index_skipped(const char *index_name,
                                             spatial::IndexState state,
                                             const char *fallback,
                                             uint64_t &warned_generation) const {
  if (warned_generation == store_.generation()) return;
  std::cerr << "[WARN] Pipeline: " << index_name << " "
            << spatial::index_state_name(state) << ", " << fallback << std::endl;
  warned_generation = store_.generation();
}

const PipelineCoordinator::SphereExtent &PipelineCoordinator::sphere_extent() {
  if (extent_generation_ != store_.generation()) {
    SphereExtent extent;
    bool first = true;
    auto view = store_.registry().view<const features::TurbineShape>();
    for (auto [entity, shape] : view.each()) {
      float centre = shape.base_height + 0.5f * shape.height;
      extent.radius = std::max(extent.radius, std::max(shape.height, shape.rotor_radius));
      extent.y_min = first ? centre : std::min(extent.y_min, centre);
      extent.y_max = first ? centre : std::max(extent.y_max, centre);
      first = false;
    }
    sphere_extent_ = extent;
    extent_generation_ = store_.generation();
  }
  return sphere_extent_;
}

FrameOutput PipelineCoordinator::render_frame(int year) {
  return run_pipeline(year, frustum_, quadtree_, year_index_, lod_manager_);
}

// ============ Pipeline ============

FrameOutput PipelineCoordinator::run_pipeline(int year,
                                              const culling::ViewFrustum &frustum,
                                              const spatial::Quadtree &quadtree,
                                              temporal::YearIndex &year_index,
                                              const lod::LODManager &lod_manager) {
  auto start = std::chrono::high_resolution_clock::now();

  FrameStats stats;
  stats.year = year;
  stats.total = store_.size();
  stats.spatial_state = spatial_state(quadtree);
  stats.temporal_state = temporal_state(year_index);

  // 1. Temporal filter
  std::vector<entt::entity> candidates;
  temporal_filter(year, year_index, candidates, stats);
  stats.active = candidates.size();

  // 2. Spatial prefilter (all or nothing)
  if (config_.use_spatial_prefilter &&
      candidates.size() > config_.prefilter_threshold) {
    prefilter(year, frustum, quadtree, candidates, stats);
  }
  stats.after_spatial = candidates.size();
  stats.culled_by_spatial = stats.active - stats.after_spatial;

  // 3. Frustum cull
  if (config_.use_frustum_culling) {
    frustum_cull(frustum, candidates);
  }
  stats.visible = candidates.size();
  stats.culled_by_frustum = stats.after_spatial - stats.visible;

  // 4 + 5. LOD and per-tier output
  FrameOutput output = assign_lod(frustum, lod_manager, candidates, stats);

  auto end = std::chrono::high_resolution_clock::now();
  stats.elapsed_ms = std::chrono::duration<double, std::milli>(end - start).count();

  last_stats_ = std::move(stats);
  return output;
}

void PipelineCoordinator::temporal_filter(int year, temporal::YearIndex &year_index,
                                          std::vector<entt::entity> &candidates,
                                          const FrameStats &stats) {
  // Only indices built from this store are read; STALE ones rebuild here
  if (stats.temporal_state == spatial::IndexState::BUILT ||
      stats.temporal_state == spatial::IndexState::STALE) {
    size_t count = 0;
    if (year_index.count_until(year, count)) {
      candidates.reserve(count);
    }
    if (year_index.get_until(year, candidates)) {
      return;
    }
    candidates.clear();
  }

  warn_index_skipped("year index", stats.temporal_state, "scanning the store",
                     temporal_warned_generation_);

  auto view = store_.registry().view<const features::Installation>();
  candidates.reserve(store_.size());
  for (auto [entity, install] : view.each()) {
    if (install.year <= year) {
      candidates.push_back(entity);
    }
  }
}

void PipelineCoordinator::prefilter(int year, const culling::ViewFrustum &frustum,
                                    const spatial::Quadtree &quadtree,
                                    std::vector<entt::entity> &candidates,
                                    FrameStats &stats) {
  if (stats.spatial_state != spatial::IndexState::BUILT) {
    warn_index_skipped("spatial index", stats.spatial_state, "prefilter skipped",
                       spatial_warned_generation_);
    return;
  }

  // A sphere touching the volume has its centre within one radius of it
  const SphereExtent &extent = sphere_extent();
  float margin = extent.radius * config_.sphere_padding;
  auto footprint = frustum.ground_footprint(config_.prefilter_max_range,
                                            extent.y_min - margin,
                                            extent.y_max + margin);
  if (!footprint) {
    return; // No camera yet, or an unbounded volume: nothing to narrow against
  }
  spatial::BoundingBox window = footprint->expanded_by(margin);

  std::vector<entt::entity> nearby;
  if (!quadtree.query(window, nearby)) {
    return;
  }

  // Intersect with the year filter so the result stays a subset
  const auto &registry = store_.registry();
  std::vector<entt::entity> narrowed;
  narrowed.reserve(nearby.size());
  for (auto entity : nearby) {
    if (registry.get<features::Installation>(entity).year <= year) {
      narrowed.push_back(entity);
    }
  }

  candidates.swap(narrowed);
  stats.prefilter_used = true;
}

void PipelineCoordinator::frustum_cull(const culling::ViewFrustum &frustum,
                                       std::vector<entt::entity> &candidates) const {
  struct Sphere {
    float x, y, z, radius;
  };

  // Gather serially; the registry is not touched inside the parallel loop
  const auto &registry = store_.registry();
  std::vector<Sphere> spheres;
  spheres.reserve(candidates.size());
  for (auto entity : candidates) {
    const auto &pos = registry.get<features::GroundPosition>(entity);
    const auto &shape = registry.get<features::TurbineShape>(entity);
    spheres.push_back({pos.x, shape.base_height + 0.5f * shape.height, pos.z,
                       std::max(shape.height, shape.rotor_radius) *
                           config_.sphere_padding});
  }

  const int count = static_cast<int>(spheres.size());
  std::vector<unsigned char> keep(spheres.size(), 0);

#pragma omp parallel for schedule(static)
  for (int i = 0; i < count; ++i) {
    const Sphere &s = spheres[i];
    keep[i] = frustum.is_sphere_visible(s.x, s.y, s.z, s.radius) ? 1 : 0;
  }

  // Serial compaction keeps the input order
  size_t out = 0;
  for (size_t i = 0; i < candidates.size(); ++i) {
    if (keep[i]) {
      candidates[out++] = candidates[i];
    }
  }
  candidates.resize(out);
}

FrameOutput PipelineCoordinator::assign_lod(const culling::ViewFrustum &frustum,
                                            const lod::LODManager &lod_manager,
                                            const std::vector<entt::entity> &visible,
                                            FrameStats &stats) {
  FrameOutput output;
  output.tiers.resize(lod_manager.tier_count());
  for (int t = 0; t < lod_manager.tier_count(); ++t) {
    output.tiers[t].tier = t;
    output.tiers[t].name = lod_manager.level(t).name;
  }
  stats.per_tier.assign(lod_manager.tier_count(), 0);

  Vector3 eye = frustum.eye();
  float max_distance = config_.max_lod_distance > 0.0f ? config_.max_lod_distance : 1.0f;
  auto &registry = store_.registry();

  for (auto entity : visible) {
    const auto &pos = registry.get<features::GroundPosition>(entity);
    float dx = pos.x - eye.x;
    float dz = pos.z - eye.z;
    float distance = std::sqrt(dx * dx + dz * dz);
    float normalized = std::clamp(distance / max_distance, 0.0f, 1.0f);

    int tier = lod_manager.tier_for_distance(normalized);
    auto &state = registry.get<features::LodState>(entity);
    state.tier = tier;
    state.distance_to_camera = distance;

    output.tiers[tier].features.push_back(entity);
    ++stats.per_tier[tier];
    stats.polygons += std::lround(config_.base_polygon_count *
                                  lod_manager.level(tier).polygon_ratio);
  }

  stats.base_polygons = static_cast<int64_t>(visible.size()) * config_.base_polygon_count;
  if (stats.base_polygons > 0) {
    stats.savings_percent =
        (1.0 - static_cast<double>(stats.polygons) /
                   static_cast<double>(stats.base_polygons)) * 100.0;
  }
  return output;
}

std::string PipelineCoordinator::stats_summary() const {
  const auto &s = last_stats_;

  std::ostringstream out;
  out << "Year " << s.year << ": " << s.visible << " / " << s.total << " visible\n";
  out << "  active (year filter): " << s.active << "\n";
  out << "  after spatial:        " << s.after_spatial << " (-" << s.culled_by_spatial
      << (s.prefilter_used ? ")" : ", skipped)") << "\n";
  out << "  culled by frustum:    " << s.culled_by_frustum << "\n";
  out << "  tiers:";
  for (size_t t = 0; t < s.per_tier.size(); ++t) {
    out << " LOD" << t << "=" << s.per_tier[t];
  }
  out << "\n";
  out << std::fixed << std::setprecision(1);
  out << "  polygons: " << s.polygons << " / " << s.base_polygons << " ("
      << s.savings_percent << "% saved)\n";
  out << std::setprecision(3);
  out << "  indices: year " << spatial::index_state_name(s.temporal_state)
      << ", spatial " << spatial::index_state_name(s.spatial_state) << ", "
      << s.elapsed_ms << " ms\n";
  return out.str();
}

// ============ Free functions ============

spatial::Quadtree build_spatial_index(const features::FeatureStore &store,
                                      const spatial::QuadtreeConfig &config) {
  spatial::Quadtree tree(config);
  tree.build(store);
  return tree;
}

temporal::YearIndex build_year_index(const features::FeatureStore &store) {
  temporal::YearIndex index;
  index.build(store);
  return index;
}

}  // namespace pipeline
}  // namespace windscape
