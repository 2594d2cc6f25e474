#pragma once

/**
 * @file quadtree.hpp
 * @brief 2D point quadtree over the ground plane (x, z).
 *
 * Turbines all stand on the terrain, so culling only needs the ground
 * projection. Each internal node has exactly four children (NW, NE, SW, SE)
 * split at its midpoint; leaves hold entity entries.
 *
 * Complexity:
 * - build: O(n log n)
 * - query: O(log n + k), k = result size
 */

#include "entt/entt.hpp"
#include <windscape/core/constants.hpp>
#include <windscape/spatial/bounding_box.hpp>

#include <array>
#include <cstdint>
#include <functional>
#include <memory>
#include <vector>

namespace windscape {
namespace features {
class FeatureStore;
}

namespace spatial {

/**
 * @brief Configuration for Quadtree.
 */
struct QuadtreeConfig {
  BoundingBox bounds{constants::MAP_X_MIN, constants::MAP_X_MAX,
                     constants::MAP_Z_MIN, constants::MAP_Z_MAX};
  int leaf_capacity = 8;        // Entries per leaf before split
  int max_depth = 10;           // Hard cap against degenerate clustering
  bool fit_to_features = true;  // Grow root bounds to cover every feature
};

/**
 * @brief Build state of a spatial or temporal index relative to a store.
 *
 * FOREIGN: built, but from a different store (or filled by hand), so its
 * entity handles must not be resolved against this store.
 */
enum class IndexState { NOT_BUILT, BUILT, STALE, FOREIGN };

const char *index_state_name(IndexState state);

/**
 * @brief Debug statistics for the current tree.
 */
struct QuadtreeStats {
  size_t nodes = 0;
  size_t leaves = 0;
  size_t features = 0;
  int max_depth = 0;
  double avg_per_leaf = 0.0;
  size_t rejected = 0;
  double build_time_ms = 0.0;
  uint64_t query_count = 0;
};

/**
 * @brief Point quadtree of entity handles.
 */
class Quadtree {
public:
  /**
   * @throws std::invalid_argument if leaf_capacity <= 0 or max_depth < 0
   */
  explicit Quadtree(const QuadtreeConfig &config = {});
  ~Quadtree();

  Quadtree(Quadtree &&other) noexcept;
  Quadtree &operator=(Quadtree &&other) noexcept;
  Quadtree(const Quadtree &) = delete;
  Quadtree &operator=(const Quadtree &) = delete;

  /**
   * @brief Rebuild from every feature in the store.
   *
   * The new tree is assembled off to the side and swapped in when complete.
   */
  void build(const features::FeatureStore &store);

  /**
   * @brief Insert a single entry.
   * @return false if the position is non-finite or outside the root bounds
   */
  bool insert(entt::entity entity, float x, float z);

  /**
   * @brief Append every entity whose position lies in box to out_result.
   * @return false if the tree was never built (out_result untouched)
   */
  bool query(const BoundingBox &box,
             std::vector<entt::entity> &out_result) const;

  /**
   * @brief Count entities in box without collecting them; 0 if never built.
   */
  size_t count(const BoundingBox &box) const;

  /**
   * @return false if the tree was never built (out_count untouched)
   */
  bool count(const BoundingBox &box, size_t &out_count) const;

  /**
   * @brief Visit every leaf (bounds, depth, entry count).
   */
  using LeafVisitor = std::function<void(const BoundingBox &, int, size_t)>;
  void for_each_leaf(const LeafVisitor &visitor) const;

  QuadtreeStats stats() const;

  bool is_built() const { return built_; }
  uint64_t built_generation() const { return built_generation_; }
  const features::FeatureStore *source() const { return source_; } // Null unless built from a store
  const BoundingBox &bounds() const;
  const QuadtreeConfig &config() const { return config_; }
  size_t size() const { return size_; }

private:
  struct Entry {
    entt::entity entity;
    float x;
    float z;
  };

  struct Node {
    BoundingBox bounds;
    int depth = 0;
    std::vector<Entry> entries;
    std::array<std::unique_ptr<Node>, 4> children;

    bool is_leaf() const { return !children[0]; }
  };

  QuadtreeConfig config_;
  std::unique_ptr<Node> root_;
  bool built_ = false;
  const features::FeatureStore *source_ = nullptr;
  uint64_t built_generation_ = 0;
  size_t size_ = 0;
  size_t rejected_ = 0;
  double build_time_ms_ = 0.0;
  mutable uint64_t query_count_ = 0;

  // Internal helpers
  void insert_into(Node &node, const Entry &entry);
  void split(Node &node);
  static int quadrant_of(const Node &node, float x, float z);
  static void query_node(const Node &node, const BoundingBox &box,
                         std::vector<entt::entity> &out_result);
  static size_t count_node(const Node &node, const BoundingBox &box);
  static void visit_leaves(const Node &node, const LeafVisitor &visitor);
  static void collect_stats(const Node &node, QuadtreeStats &stats);
};

}  // namespace spatial
}  // namespace windscape
