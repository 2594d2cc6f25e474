/**
 * @file test_year_index.cpp
 * @brief Unit tests for the year index.
 */

#include <cassert>
#include <iostream>
#include <set>
#include <vector>

#include <windscape/core/constants.hpp>
#include <windscape/features/feature_store.hpp>
#include <windscape/temporal/year_index.hpp>

using namespace windscape;

static entt::entity add_with_year(features::FeatureStore &store, int year) {
  features::TurbineSpec spec;
  spec.year = year;
  return store.add_turbine(0.0f, 0.0f, spec);
}

void test_year_counts() {
  std::cout << "Testing year counts..." << std::endl;

  features::FeatureStore store;
  store.init();
  for (int year : {1990, 1990, 1995, 2000}) {
    add_with_year(store, year);
  }

  temporal::YearIndex index;
  index.build(store);
  assert(index.is_valid() && !index.is_stale());

  assert(index.count_until(1995) == 3);
  assert(index.count_until(1989) == 0);
  assert(index.count_until(2025) == 4);
  assert(index.count_until(1990) == 2);

  assert(index.min_year() == 1990);
  assert(index.max_year() == 2000);
  assert(index.year_count() == 3);
  assert(index.size() == 4);

  std::cout << "  Year Counts: PASS" << std::endl;
}

void test_monotonic() {
  std::cout << "Testing monotonic counts..." << std::endl;

  features::FeatureStore store;
  store.init(3);
  spatial::BoundingBox bounds(constants::MAP_X_MIN, constants::MAP_X_MAX,
                              constants::MAP_Z_MIN, constants::MAP_Z_MAX);
  store.spawn_random_field(3000, bounds, constants::FIRST_YEAR, constants::LAST_YEAR);

  temporal::YearIndex index;
  index.build(store);

  size_t previous = 0;
  for (int year = constants::FIRST_YEAR - 5; year <= constants::LAST_YEAR + 5; ++year) {
    size_t count = index.count_until(year);
    assert(count >= previous);
    previous = count;
  }
  assert(previous == 3000);
  assert(index.count_until(index.min_year() - 1) == 0);

  std::cout << "  Monotonic: PASS" << std::endl;
}

void test_get_until_matches_filter() {
  std::cout << "Testing get_until against a linear filter..." << std::endl;

  features::FeatureStore store;
  store.init(11);
  spatial::BoundingBox bounds(-1.0f, 1.0f, -1.0f, 1.0f);
  store.spawn_random_field(800, bounds, 1995, 2010);

  temporal::YearIndex index;
  index.build(store);

  for (int year : {1994, 1995, 2002, 2010, 2030}) {
    std::vector<entt::entity> found;
    assert(index.get_until(year, found));
    assert(found.size() == index.count_until(year));

    std::set<entt::entity> expected;
    auto view = store.registry().view<const features::Installation>();
    for (auto [entity, install] : view.each()) {
      if (install.year <= year) expected.insert(entity);
    }
    assert(std::set<entt::entity>(found.begin(), found.end()) == expected);

    // Oldest first
    int last_year = 0;
    for (auto entity : found) {
      int y = store.registry().get<features::Installation>(entity).year;
      assert(y >= last_year);
      last_year = y;
    }
  }

  std::cout << "  get_until: PASS" << std::endl;
}

void test_lazy_rebuild() {
  std::cout << "Testing lazy rebuild..." << std::endl;

  features::FeatureStore store;
  store.init();
  add_with_year(store, 2000);

  temporal::YearIndex index;
  index.build(store);
  assert(index.count_until(2020) == 1);

  // Mutation marks the index stale; the next query rebuilds
  add_with_year(store, 2005);
  assert(index.is_stale());
  assert(index.count_until(2020) == 2);
  assert(!index.is_stale());

  // Explicit invalidation also rebuilds
  index.invalidate();
  assert(!index.is_valid());
  std::vector<entt::entity> found;
  assert(index.get_until(2001, found));
  assert(found.size() == 1);
  assert(index.is_valid());

  std::cout << "  Lazy Rebuild: PASS" << std::endl;
}

void test_empty_and_unbuilt() {
  std::cout << "Testing empty and unbuilt index..." << std::endl;

  temporal::YearIndex unbuilt;
  assert(!unbuilt.is_valid());
  assert(unbuilt.is_stale());
  assert(unbuilt.count_until(2023) == 0);
  assert(unbuilt.source() == nullptr);

  // Not-built is reported, not mistaken for an empty year range
  size_t count = 42;
  assert(!unbuilt.count_until(2023, count));
  assert(count == 42);
  std::vector<entt::entity> found;
  assert(!unbuilt.get_until(2023, found));
  assert(found.empty());
  assert(unbuilt.min_year() == 0 && unbuilt.max_year() == 0);

  features::FeatureStore store;
  store.init();
  temporal::YearIndex empty;
  empty.build(store);
  assert(empty.is_valid());
  assert(empty.source() == &store);
  assert(empty.count_until(3000, count));
  assert(count == 0);
  assert(empty.count_until(1900) == 0);
  assert(empty.count_until(3000) == 0);
  assert(empty.year_count() == 0);

  std::cout << "  Empty/Unbuilt: PASS" << std::endl;
}

int main() {
  std::cout << "=== Running Year Index Tests ===" << std::endl;

  test_year_counts();
  test_monotonic();
  test_get_until_matches_filter();
  test_lazy_rebuild();
  test_empty_and_unbuilt();

  std::cout << std::endl;
  std::cout << "All tests PASSED!" << std::endl;
  return 0;
}
