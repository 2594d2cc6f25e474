/**
 * @file year_index.cpp
 * @brief Year index build and cumulative queries.
 */

#include <windscape/temporal/year_index.hpp>
#include <windscape/features/feature_store.hpp>

namespace windscape {
namespace temporal {

void YearIndex::build(const features::FeatureStore &store) {
    std::map<int, std::vector<entt::entity>> fresh;
    size_t count = 0;

    auto view = store.registry().view<const features::Installation>();
    for (auto [entity, install] : view.each()) {
        fresh[install.year].push_back(entity);
        ++count;
    }

    by_year_.swap(fresh);
    size_ = count;
    source_ = &store;
    built_generation_ = store.generation();
    valid_ = true;
}

bool YearIndex::is_stale() const {
    if (!valid_) return true;
    return source_ && source_->generation() != built_generation_;
}

bool YearIndex::ensure_current() {
    if (!is_stale()) return true;
    if (!source_) return false; // Never built

    build(*source_);
    return true;
}

size_t YearIndex::count_until(int year) {
    size_t total = 0;
    return count_until(year, total) ? total : 0;
}

bool YearIndex::count_until(int year, size_t &out_count) {
    if (!ensure_current()) return false;

    size_t total = 0;
    for (auto it = by_year_.begin(); it != by_year_.end() && it->first <= year; ++it) {
        total += it->second.size();
    }
    out_count = total;
    return true;
}

bool YearIndex::get_until(int year, std::vector<entt::entity> &out_result) {
    if (!ensure_current()) return false;

    for (auto it = by_year_.begin(); it != by_year_.end() && it->first <= year; ++it) {
        out_result.insert(out_result.end(), it->second.begin(), it->second.end());
    }
    return true;
}

int YearIndex::min_year() const {
    return by_year_.empty() ? 0 : by_year_.begin()->first;
}

int YearIndex::max_year() const {
    return by_year_.empty() ? 0 : by_year_.rbegin()->first;
}

} // namespace temporal
} // namespace windscape
