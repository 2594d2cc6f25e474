#pragma once

/**
 * @file lod_manager.hpp
 * @brief Distance-based level of detail for turbine geometry.
 *
 * Each tier starts at a normalized distance threshold (0 = at the camera,
 * 1 = max LOD distance) and carries a polygon ratio plus the geometry
 * simplifications the renderer applies. Tiers are sorted by threshold.
 */

#include <cstdint>
#include <string>
#include <vector>

namespace windscape {
namespace lod {

/**
 * @brief One detail tier.
 */
struct LODLevel {
    std::string name;
    float polygon_ratio = 1.0f;      // Fraction of base polygons [0, 1]
    float distance_threshold = 0.0f; // Normalized distance where tier starts
    int segment_count = 8;           // Tower cylinder segments (>= 3)
    int blade_count = 3;             // Rotor blades [0, 3]
    bool skip_nacelle = false;
    bool skip_blades = false;
    bool use_billboard = false;      // Single marker instead of geometry
};

enum class LODPreset { STANDARD, AGGRESSIVE, EXTREME };

/**
 * @brief Polygon budget for a set of distances.
 */
struct LodSavings {
    int64_t base_polygons = 0;
    int64_t lod_polygons = 0;
    double savings_percent = 0.0;
    std::vector<size_t> distribution; // Features per tier
};

/**
 * @brief Tier table with distance and screen-size selection.
 *
 * Stateless after construction; safe to share across frames.
 */
class LODManager {
public:
    /**
     * @brief Standard three-tier table.
     */
    LODManager();

    /**
     * @param levels Tier table, any order; sorted by threshold
     * @param allow_increasing_ratio Accept tables whose ratio grows with
     *        distance (legacy tables)
     * @throws std::invalid_argument on an empty or malformed table
     */
    explicit LODManager(std::vector<LODLevel> levels,
                        bool allow_increasing_ratio = false);

    static LODManager from_preset(LODPreset preset);

    /**
     * @throws std::invalid_argument for names other than
     *         "standard", "aggressive", "extreme"
     */
    static LODManager from_preset_name(const std::string &name);

    static std::vector<LODLevel> preset_levels(LODPreset preset);
    static LODPreset preset_for_feature_count(size_t count);
    static const char *preset_name(LODPreset preset);

    /**
     * @brief Tier with the greatest threshold <= distance.
     * Distances below the first threshold map to tier 0.
     */
    const LODLevel &get_lod_for_distance(float normalized_distance) const;
    int tier_for_distance(float normalized_distance) const;

    /**
     * @brief Same lookup without a sqrt at the call site.
     */
    const LODLevel &get_lod_for_distance_squared(float distance_sq,
                                                 float max_distance_sq = 1.0f) const;

    /**
     * @brief Tier from projected pixel height.
     * @param fov Vertical field of view (degrees)
     */
    int select_by_screen_size(float object_height, float distance,
                              float screen_height, float fov) const;

    int polygon_count(int base_polygons, float normalized_distance) const;
    LodSavings calculate_savings(const std::vector<float> &distances,
                                 int base_polygons) const;

    /**
     * @brief Human-readable tier table.
     */
    std::string summary() const;

    const std::vector<LODLevel> &levels() const { return levels_; }
    const LODLevel &level(int tier) const { return levels_[tier]; }
    int tier_count() const { return static_cast<int>(levels_.size()); }

private:
    std::vector<LODLevel> levels_;
    std::vector<float> thresholds_; // Parallel to levels_, for binary search
};

} // namespace lod
} // namespace windscape
