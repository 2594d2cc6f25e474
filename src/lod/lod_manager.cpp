/**
 * @file lod_manager.cpp
 * @brief Tier tables, validation and tier selection.
 */

#include <windscape/lod/lod_manager.hpp>
#include <windscape/core/constants.hpp>

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace windscape {
namespace lod {

namespace {

LODLevel make_level(const char *name, float ratio, float threshold,
                    int segments = 8, int blades = 3,
                    bool skip_nacelle = false, bool skip_blades = false,
                    bool billboard = false) {
    LODLevel level;
    level.name = name;
    level.polygon_ratio = ratio;
    level.distance_threshold = threshold;
    level.segment_count = segments;
    level.blade_count = blades;
    level.skip_nacelle = skip_nacelle;
    level.skip_blades = skip_blades;
    level.use_billboard = billboard;
    return level;
}

void validate_level(const LODLevel &level) {
    const std::string where = "LODManager: level '" + level.name + "' ";
    if (!(level.polygon_ratio >= 0.0f && level.polygon_ratio <= 1.0f)) {
        throw std::invalid_argument(where + "polygon_ratio must be in [0, 1]");
    }
    if (!(level.distance_threshold >= 0.0f)) {
        throw std::invalid_argument(where + "distance_threshold must be >= 0");
    }
    if (level.segment_count < 3) {
        throw std::invalid_argument(where + "needs at least 3 segments");
    }
    if (level.blade_count < 0 || level.blade_count > 3) {
        throw std::invalid_argument(where + "blade_count must be in [0, 3]");
    }
}

} // namespace

LODManager::LODManager() : LODManager(preset_levels(LODPreset::STANDARD)) {}

LODManager::LODManager(std::vector<LODLevel> levels,
                       bool allow_increasing_ratio)
    : levels_(std::move(levels)) {
    if (levels_.empty()) {
        throw std::invalid_argument("LODManager: at least one level required");
    }

    for (const auto &level : levels_) {
        validate_level(level);
    }

    std::stable_sort(levels_.begin(), levels_.end(),
                     [](const LODLevel &a, const LODLevel &b) {
                         return a.distance_threshold < b.distance_threshold;
                     });

    for (size_t i = 1; i < levels_.size(); ++i) {
        const auto &prev = levels_[i - 1];
        const auto &cur = levels_[i];
        if (cur.distance_threshold == prev.distance_threshold) {
            throw std::invalid_argument("LODManager: duplicate threshold for '" +
                                        prev.name + "' and '" + cur.name + "'");
        }
        if (!allow_increasing_ratio && cur.polygon_ratio > prev.polygon_ratio) {
            throw std::invalid_argument("LODManager: polygon_ratio of '" +
                                        cur.name + "' exceeds nearer tier '" +
                                        prev.name + "'");
        }
    }

    thresholds_.reserve(levels_.size());
    for (const auto &level : levels_) {
        thresholds_.push_back(level.distance_threshold);
    }
}

// ============ Presets ============

std::vector<LODLevel> LODManager::preset_levels(LODPreset preset) {
    switch (preset) {
    case LODPreset::AGGRESSIVE:
        return {
            make_level("LOD0", 1.00f, 0.00f, 8, 3),
            make_level("LOD1", 0.60f, 0.15f, 6, 3),
            make_level("LOD2", 0.25f, 0.35f, 4, 3),
            make_level("LOD3", 0.08f, 0.55f, 4, 1, true),
            make_level("LOD4", 0.02f, 0.85f, 3, 0, true, true, true),
        };
    case LODPreset::EXTREME:
        return {
            make_level("LOD0", 1.00f, 0.00f, 6, 3),
            make_level("LOD1", 0.40f, 0.10f, 4, 2),
            make_level("LOD2", 0.15f, 0.25f, 4, 1, true),
            make_level("LOD3", 0.05f, 0.45f, 3, 0, true, true),
            make_level("LOD4", 0.01f, 0.70f, 3, 0, true, true, true),
        };
    case LODPreset::STANDARD:
    default:
        return {
            make_level("LOD0", 1.0f, 0.0f),
            make_level("LOD1", 0.5f, 0.3f),
            make_level("LOD2", 0.1f, 0.8f),
        };
    }
}

LODManager LODManager::from_preset(LODPreset preset) {
    return LODManager(preset_levels(preset));
}

LODManager LODManager::from_preset_name(const std::string &name) {
    if (name == "standard") return from_preset(LODPreset::STANDARD);
    if (name == "aggressive") return from_preset(LODPreset::AGGRESSIVE);
    if (name == "extreme") return from_preset(LODPreset::EXTREME);
    throw std::invalid_argument("LODManager: unknown preset '" + name + "'");
}

LODPreset LODManager::preset_for_feature_count(size_t count) {
    if (count > 25000) return LODPreset::EXTREME;
    if (count > 10000) return LODPreset::AGGRESSIVE;
    return LODPreset::STANDARD;
}

const char *LODManager::preset_name(LODPreset preset) {
    switch (preset) {
    case LODPreset::AGGRESSIVE: return "aggressive";
    case LODPreset::EXTREME: return "extreme";
    case LODPreset::STANDARD:
    default: return "standard";
    }
}

// ============ Selection ============

int LODManager::tier_for_distance(float normalized_distance) const {
    // Greatest threshold <= distance; before the first one falls to tier 0
    auto it = std::upper_bound(thresholds_.begin(), thresholds_.end(),
                               normalized_distance);
    int index = static_cast<int>(it - thresholds_.begin()) - 1;
    return std::max(0, index);
}

const LODLevel &LODManager::get_lod_for_distance(float normalized_distance) const {
    return levels_[tier_for_distance(normalized_distance)];
}

const LODLevel &LODManager::get_lod_for_distance_squared(float distance_sq,
                                                         float max_distance_sq) const {
    float normalized = 1.0f;
    if (max_distance_sq > 0.0f) {
        normalized = std::min(1.0f, std::sqrt(std::max(0.0f, distance_sq) / max_distance_sq));
    }
    return get_lod_for_distance(normalized);
}

int LODManager::select_by_screen_size(float object_height, float distance,
                                      float screen_height, float fov) const {
    float half_fov = 0.5f * fov * constants::DEGREES_TO_RADIANS;
    float factor = screen_height / (2.0f * std::tan(half_fov));

    float pixels = distance < 0.001f ? std::numeric_limits<float>::infinity()
                                     : object_height * factor / distance;

    // <10 px billboard, <25 / <50 / <100 step down, else full detail
    int target = 0;
    if (pixels < 10.0f) {
        target = 4;
    } else if (pixels < 25.0f) {
        target = 3;
    } else if (pixels < 50.0f) {
        target = 2;
    } else if (pixels < 100.0f) {
        target = 1;
    }
    return std::min(target, tier_count() - 1);
}

// ============ Budget ============

int LODManager::polygon_count(int base_polygons, float normalized_distance) const {
    const auto &level = get_lod_for_distance(normalized_distance);
    return static_cast<int>(std::lround(base_polygons * level.polygon_ratio));
}

LodSavings LODManager::calculate_savings(const std::vector<float> &distances,
                                         int base_polygons) const {
    LodSavings savings;
    savings.distribution.assign(levels_.size(), 0);

    for (float distance : distances) {
        int tier = tier_for_distance(distance);
        savings.lod_polygons += std::lround(base_polygons * levels_[tier].polygon_ratio);
        ++savings.distribution[tier];
    }

    savings.base_polygons = static_cast<int64_t>(distances.size()) * base_polygons;
    if (savings.base_polygons > 0) {
        savings.savings_percent =
            (1.0 - static_cast<double>(savings.lod_polygons) /
                       static_cast<double>(savings.base_polygons)) * 100.0;
    }
    return savings;
}

std::string LODManager::summary() const {
    std::ostringstream out;
    out << "LOD configuration (" << levels_.size() << " tiers)\n";
    out << std::string(40, '-') << "\n";

    out << std::fixed;
    for (const auto &level : levels_) {
        out << "  " << level.name << ": " << std::setprecision(1) << std::setw(5)
            << level.polygon_ratio * 100.0f << "% @ dist="
            << std::setprecision(2) << level.distance_threshold
            << " (seg=" << level.segment_count
            << ", blades=" << level.blade_count << ")";

        std::string flags;
        if (level.skip_nacelle) flags += "no-nacelle";
        if (level.skip_blades) flags += flags.empty() ? "no-blades" : ", no-blades";
        if (level.use_billboard) flags += flags.empty() ? "billboard" : ", billboard";
        if (!flags.empty()) out << " [" << flags << "]";
        out << "\n";
    }
    return out.str();
}

} // namespace lod
} // namespace windscape
