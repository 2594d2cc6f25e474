#pragma once

/**
 * @file year_index.hpp
 * @brief Ordered year -> entities index for "active by year Y" queries.
 *
 * Built from a FeatureStore and remembers its source. When the store has
 * changed since the last build, queries rebuild before answering.
 */

#include "entt/entt.hpp"

#include <cstdint>
#include <map>
#include <vector>

namespace windscape {
namespace features {
class FeatureStore;
}

namespace temporal {

class YearIndex {
public:
    YearIndex() = default;

    /**
     * @brief Group every feature by installation year.
     * The store must outlive the index (it is kept for lazy rebuilds).
     */
    void build(const features::FeatureStore &store);

    void invalidate() { valid_ = false; }
    bool is_valid() const { return valid_; }

    /**
     * @brief Invalid, or the source store changed since build.
     */
    bool is_stale() const;

    /**
     * @brief Number of features with year <= year; 0 if never built.
     */
    size_t count_until(int year);

    /**
     * @return false if never built (out_count untouched)
     */
    bool count_until(int year, size_t &out_count);

    /**
     * @brief Append features with year <= year to out_result, oldest first.
     * @return false if never built (out_result untouched)
     */
    bool get_until(int year, std::vector<entt::entity> &out_result);

    // Year range of the indexed features; 0 when empty
    int min_year() const;
    int max_year() const;
    size_t year_count() const { return by_year_.size(); }
    size_t size() const { return size_; }

    // Store the index was built from; null if never built
    const features::FeatureStore *source() const { return source_; }

private:
    std::map<int, std::vector<entt::entity>> by_year_;
    const features::FeatureStore *source_ = nullptr;
    uint64_t built_generation_ = 0;
    size_t size_ = 0;
    bool valid_ = false;

    // Rebuild from source_ when stale; false if there is nothing to build from
    bool ensure_current();
};

} // namespace temporal
} // namespace windscape
