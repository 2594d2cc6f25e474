/**
 * @file test_quadtree.cpp
 * @brief Unit tests for BoundingBox and the ground-plane quadtree.
 */

#include <cassert>
#include <cmath>
#include <iostream>
#include <limits>
#include <random>
#include <set>
#include <stdexcept>
#include <vector>

#include <windscape/core/constants.hpp>
#include <windscape/features/feature_store.hpp>
#include <windscape/spatial/bounding_box.hpp>
#include <windscape/spatial/quadtree.hpp>

using namespace windscape;
using EntitySet = std::set<entt::entity>;

static spatial::BoundingBox map_bounds() {
  return {constants::MAP_X_MIN, constants::MAP_X_MAX, constants::MAP_Z_MIN,
          constants::MAP_Z_MAX};
}

static EntitySet brute_force(const features::FeatureStore &store,
                             const spatial::BoundingBox &box) {
  EntitySet result;
  auto view = store.registry().view<const features::GroundPosition>();
  for (auto [entity, pos] : view.each()) {
    if (box.contains(pos.x, pos.z)) result.insert(entity);
  }
  return result;
}

void test_bounding_box() {
  std::cout << "Testing bounding box..." << std::endl;

  spatial::BoundingBox box(1.0f, -1.0f, 2.0f, -2.0f); // Reversed input
  assert(box.x_min() == -1.0f && box.x_max() == 1.0f);
  assert(box.z_min() == -2.0f && box.z_max() == 2.0f);

  // Inclusive edges
  assert(box.contains(1.0f, 2.0f));
  assert(box.contains(-1.0f, -2.0f));
  assert(!box.contains(1.01f, 0.0f));

  assert(box.intersects({1.0f, 3.0f, 0.0f, 1.0f})); // Touching edge
  assert(!box.intersects({1.5f, 3.0f, 0.0f, 1.0f}));

  // Quadrants tile the parent
  auto nw = box.quadrant(0);
  auto se = box.quadrant(3);
  assert(nw.x_max() == 0.0f && nw.z_max() == 0.0f);
  assert(se.x_min() == 0.0f && se.z_min() == 0.0f);
  assert(se.x_max() == 1.0f && se.z_max() == 2.0f);

  auto grown = box.expanded_to(5.0f, -3.0f);
  assert(grown.x_max() == 5.0f && grown.z_min() == -3.0f);

  spatial::BoundingBox point(0.5f, 0.5f, 0.5f, 0.5f);
  assert(point.is_degenerate());
  assert(point.contains(0.5f, 0.5f));

  std::cout << "  Bounding Box: PASS" << std::endl;
}

void test_completeness() {
  std::cout << "Testing quadtree completeness..." << std::endl;

  features::FeatureStore store;
  store.init(7);
  store.spawn_random_field(2000, map_bounds(), 1990, 2023);

  spatial::Quadtree tree;
  tree.build(store);
  assert(tree.is_built());
  assert(tree.size() == 2000);

  std::vector<entt::entity> found;
  assert(tree.query(tree.bounds(), found));
  assert(found.size() == 2000); // No duplicates

  EntitySet all = brute_force(store, tree.bounds());
  assert(EntitySet(found.begin(), found.end()) == all);

  auto stats = tree.stats();
  assert(stats.features == 2000);
  assert(stats.leaves > 1);
  assert(stats.nodes == 1 + (stats.leaves - 1) / 3 * 4);
  assert(stats.query_count == 1);

  std::cout << "  Completeness: PASS" << std::endl;
}

void test_disjoint_query() {
  std::cout << "Testing disjoint query..." << std::endl;

  features::FeatureStore store;
  store.init();
  store.spawn_random_field(500, map_bounds(), 1990, 2023);

  spatial::Quadtree tree;
  tree.build(store);

  std::vector<entt::entity> found;
  assert(tree.query({10.0f, 11.0f, 10.0f, 11.0f}, found));
  assert(found.empty());
  assert(tree.count({-20.0f, -19.0f, 0.0f, 1.0f}) == 0);

  std::cout << "  Disjoint Query: PASS" << std::endl;
}

void test_brute_force_window() {
  std::cout << "Testing 10k window query vs brute force..." << std::endl;

  features::FeatureStore store;
  store.init(42);
  store.spawn_random_field(10000, map_bounds(), 1990, 2023);

  spatial::QuadtreeConfig config;
  config.leaf_capacity = 8;
  spatial::Quadtree tree(config);
  tree.build(store);

  spatial::BoundingBox window(-0.8f, 0.8f, -0.9f, 0.9f);
  std::vector<entt::entity> found;
  assert(tree.query(window, found));

  EntitySet expected = brute_force(store, window);
  assert(found.size() == expected.size());
  assert(EntitySet(found.begin(), found.end()) == expected);
  assert(tree.count(window) == expected.size());

  std::cout << "  Window Query (" << found.size() << " hits): PASS" << std::endl;
}

void test_random_boxes() {
  std::cout << "Testing random boxes vs brute force..." << std::endl;

  std::mt19937 rng(42);
  std::uniform_real_distribution<float> coord(-2.5f, 2.5f);

  for (size_t count : {0u, 1u, 9u, 300u, 3000u}) {
    features::FeatureStore store;
    store.init(static_cast<uint32_t>(count));
    store.spawn_random_field(count, map_bounds(), 1990, 2023);

    spatial::Quadtree tree;
    tree.build(store);

    for (int i = 0; i < 40; ++i) {
      spatial::BoundingBox box(coord(rng), coord(rng), coord(rng), coord(rng));
      std::vector<entt::entity> found;
      assert(tree.query(box, found));
      EntitySet expected = brute_force(store, box);
      assert(found.size() == expected.size());
      assert(EntitySet(found.begin(), found.end()) == expected);
    }
  }

  std::cout << "  Random Boxes: PASS" << std::endl;
}

void test_empty_and_unbuilt() {
  std::cout << "Testing empty and unbuilt trees..." << std::endl;

  spatial::Quadtree unbuilt;
  std::vector<entt::entity> found;
  assert(!unbuilt.is_built());
  assert(!unbuilt.query(map_bounds(), found)); // Not-built is reported
  assert(found.empty());
  assert(unbuilt.count(map_bounds()) == 0);
  size_t count = 7;
  assert(!unbuilt.count(map_bounds(), count));
  assert(count == 7);
  assert(unbuilt.source() == nullptr);

  features::FeatureStore store;
  store.init();
  spatial::Quadtree tree;
  tree.build(store);
  assert(tree.is_built());
  assert(tree.size() == 0);
  assert(tree.source() == &store);
  assert(tree.query(map_bounds(), found));
  assert(found.empty());
  assert(tree.count(map_bounds(), count));
  assert(count == 0);

  std::cout << "  Empty/Unbuilt: PASS" << std::endl;
}

void test_invalid_config() {
  std::cout << "Testing invalid configuration..." << std::endl;

  spatial::QuadtreeConfig config;
  config.leaf_capacity = 0;
  bool threw = false;
  try {
    spatial::Quadtree tree(config);
  } catch (const std::invalid_argument &) {
    threw = true;
  }
  assert(threw);

  config.leaf_capacity = 4;
  config.max_depth = -1;
  threw = false;
  try {
    spatial::Quadtree tree(config);
  } catch (const std::invalid_argument &) {
    threw = true;
  }
  assert(threw);

  std::cout << "  Invalid Config: PASS" << std::endl;
}

void test_degenerate_input() {
  std::cout << "Testing degenerate input..." << std::endl;

  features::FeatureStore store;
  store.init();

  // Many features on one point: depth cap stops splitting
  for (int i = 0; i < 100; ++i) {
    store.add_turbine(0.25f, 0.25f);
  }
  auto nan_entity = store.add_turbine(std::numeric_limits<float>::quiet_NaN(), 0.0f);

  spatial::QuadtreeConfig config;
  config.leaf_capacity = 4;
  config.max_depth = 6;
  spatial::Quadtree tree(config);
  tree.build(store);

  auto stats = tree.stats();
  assert(stats.max_depth <= 6);
  assert(stats.rejected == 1);
  assert(tree.size() == 100);

  std::vector<entt::entity> found;
  assert(tree.query({0.25f, 0.25f, 0.25f, 0.25f}, found));
  assert(found.size() == 100);
  for (auto entity : found) {
    assert(entity != nan_entity);
  }

  // Features outside the configured extent grow the root
  store.add_turbine(5.0f, -4.0f);
  tree.build(store);
  assert(tree.bounds().contains(5.0f, -4.0f));
  assert(tree.count({4.9f, 5.1f, -4.1f, -3.9f}) == 1);

  std::cout << "  Degenerate Input: PASS" << std::endl;
}

void test_rebuild_generation() {
  std::cout << "Testing rebuild generation..." << std::endl;

  features::FeatureStore store;
  store.init();
  store.add_turbine(0.0f, 0.0f);

  spatial::Quadtree tree;
  tree.build(store);
  assert(tree.built_generation() == store.generation());

  auto late = store.add_turbine(0.1f, 0.1f);
  assert(tree.built_generation() != store.generation()); // Stale

  std::vector<entt::entity> found;
  assert(tree.query(map_bounds(), found));
  assert(found.size() == 1); // Stale tree omits the new feature

  tree.build(store);
  found.clear();
  assert(tree.query(map_bounds(), found));
  assert(EntitySet(found.begin(), found.end()).count(late) == 1);

  std::cout << "  Rebuild Generation: PASS" << std::endl;
}

int main() {
  std::cout << "=== Running Quadtree Tests ===" << std::endl;

  test_bounding_box();
  test_completeness();
  test_disjoint_query();
  test_brute_force_window();
  test_random_boxes();
  test_empty_and_unbuilt();
  test_invalid_config();
  test_degenerate_input();
  test_rebuild_generation();

  std::cout << std::endl;
  std::cout << "All tests PASSED!" << std::endl;
  return 0;
}
