#pragma once

/**
 * @file coordinator.hpp
 * @brief Per-frame culling pipeline: year filter, spatial prefilter,
 * frustum test and LOD assignment.
 *
 * Each stage only removes features, so every stage output is a subset of
 * the previous one. The coordinator owns the feature store and a default
 * set of indices; run_pipeline() also accepts externally built ones.
 * An index that cannot be trusted for this store (never built, stale or
 * built from another store) is never dereferenced: its stage falls back to
 * a linear pass or is skipped, and the state is reported in FrameStats.
 */

#include "entt/entt.hpp"
#include <windscape/culling/frustum.hpp>
#include <windscape/features/feature_store.hpp>
#include <windscape/lod/lod_manager.hpp>
#include <windscape/spatial/quadtree.hpp>
#include <windscape/temporal/year_index.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace windscape {
namespace pipeline {

/**
 * @brief Configuration for PipelineCoordinator.
 */
struct PipelineConfig {
  size_t prefilter_threshold = 1000;  // Active features before the quadtree is used
  bool use_spatial_prefilter = true;
  bool use_frustum_culling = true;
  float prefilter_max_range = 0.0f;   // Footprint far-distance cap; <= 0 follows the far clip
  float max_lod_distance = 2.0f;      // Ground distance mapped to 1.0
  float sphere_padding = 1.2f;        // Bounding sphere scale
  int base_polygon_count = 150;       // Polygons of a full-detail turbine
  bool auto_select_preset = true;     // Pick the LOD preset from feature count
  spatial::QuadtreeConfig quadtree;
};

/**
 * @brief Visible features of one LOD tier.
 */
struct TierBatch {
  int tier = 0;
  std::string name;
  std::vector<entt::entity> features;
};

/**
 * @brief Pipeline result: one batch per tier, in tier order.
 */
struct FrameOutput {
  std::vector<TierBatch> tiers;

  size_t visible_count() const;
};

/**
 * @brief Counters for the last frame.
 */
struct FrameStats {
  int year = 0;
  size_t total = 0;            // Features in the store
  size_t active = 0;           // After the year filter
  size_t after_spatial = 0;    // After the quadtree prefilter
  size_t culled_by_spatial = 0;
  size_t culled_by_frustum = 0;
  size_t visible = 0;
  std::vector<size_t> per_tier;
  int64_t base_polygons = 0;   // visible * base_polygon_count
  int64_t polygons = 0;        // With LOD applied
  double savings_percent = 0.0;
  double elapsed_ms = 0.0;
  spatial::IndexState spatial_state = spatial::IndexState::NOT_BUILT;
  spatial::IndexState temporal_state = spatial::IndexState::NOT_BUILT;
  bool prefilter_used = false;
};

class PipelineCoordinator {
public:
  explicit PipelineCoordinator(const PipelineConfig &config = {});

  // Data
  entt::entity add_turbine(float x, float z, const features::TurbineSpec &spec = {});

  /**
   * @brief Rebuild the year index and quadtree; pick the LOD preset when
   * auto_select_preset is set. The old quadtree stays in place until the
   * new one is complete.
   */
  void build_indices();

  // Camera
  const culling::ViewFrustum &update_camera(const culling::CameraPose &pose);

  /**
   * @brief Run all stages for one frame and record stats.
   *
   * Features are read from this coordinator's store. A year index that was
   * never built or was built from another store is replaced by a linear
   * year scan of the store; a stale one rebuilds itself. A quadtree that is
   * not BUILT for this store skips the prefilter.
   *
   * The prefilter window is the ground footprint of the frustum out to
   * min(prefilter_max_range, far clip), padded by the largest culling
   * sphere. A positive prefilter_max_range shorter than the far clip drops
   * features beyond it even where the frustum would keep them.
   */
  FrameOutput run_pipeline(int year, const culling::ViewFrustum &frustum,
                           const spatial::Quadtree &quadtree,
                           temporal::YearIndex &year_index,
                           const lod::LODManager &lod_manager);

  /**
   * @brief run_pipeline() on the coordinator's own frustum and indices.
   */
  FrameOutput render_frame(int year);

  const FrameStats &last_frame_stats() const { return last_stats_; }
  std::string stats_summary() const;

  /**
   * @brief State of a quadtree relative to the store.
   */
  spatial::IndexState spatial_state(const spatial::Quadtree &quadtree) const;

  /**
   * @brief State of a year index relative to the store. STALE indices
   * built from this store rebuild on their next query.
   */
  spatial::IndexState temporal_state(const temporal::YearIndex &year_index) const;

  // LOD
  void set_preset(lod::LODPreset preset);
  lod::LODPreset preset() const { return preset_; }

  // Accessors
  features::FeatureStore &store() { return store_; }
  const features::FeatureStore &store() const { return store_; }
  const spatial::Quadtree &quadtree() const { return quadtree_; }
  temporal::YearIndex &year_index() { return year_index_; }
  const lod::LODManager &lod_manager() const { return lod_manager_; }
  const culling::ViewFrustum &frustum() const { return frustum_; }
  PipelineConfig &config() { return config_; }
  const PipelineConfig &config() const { return config_; }

private:
  PipelineConfig config_;
  features::FeatureStore store_;
  spatial::Quadtree quadtree_;
  temporal::YearIndex year_index_;
  lod::LODManager lod_manager_;
  lod::LODPreset preset_ = lod::LODPreset::STANDARD;
  culling::ViewFrustum frustum_;
  FrameStats last_stats_;

  // Store generation of the last skip warning, per index
  uint64_t spatial_warned_generation_ = UINT64_MAX;
  uint64_t temporal_warned_generation_ = UINT64_MAX;

  // Culling-sphere extents of the store, cached per store generation
  struct SphereExtent {
    float radius = 0.0f;   // Largest unpadded radius
    float y_min = 0.0f;    // Lowest sphere centre
    float y_max = 0.0f;    // Highest sphere centre
  };
  SphereExtent sphere_extent_;
  uint64_t extent_generation_ = UINT64_MAX;

  void warn_index_skipped(const char *index_name, spatial::IndexState state,
                          const char *fallback, uint64_t &warned_generation) const;
  const SphereExtent &sphere_extent();

  // Stages
  void temporal_filter(int year, temporal::YearIndex &year_index,
                       std::vector<entt::entity> &candidates,
                       const FrameStats &stats);
  void prefilter(int year, const culling::ViewFrustum &frustum,
                 const spatial::Quadtree &quadtree,
                 std::vector<entt::entity> &candidates, FrameStats &stats);
  void frustum_cull(const culling::ViewFrustum &frustum,
                    std::vector<entt::entity> &candidates) const;
  FrameOutput assign_lod(const culling::ViewFrustum &frustum,
                         const lod::LODManager &lod_manager,
                         const std::vector<entt::entity> &visible,
                         FrameStats &stats);
};

/**
 * @brief Quadtree over every feature in the store.
 */
spatial::Quadtree build_spatial_index(const features::FeatureStore &store,
                                      const spatial::QuadtreeConfig &config = {});

/**
 * @brief Year index over every feature in the store.
 */
temporal::YearIndex build_year_index(const features::FeatureStore &store);

}  // namespace pipeline
}  // namespace windscape
