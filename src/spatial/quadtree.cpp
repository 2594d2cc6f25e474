/**
 * @file quadtree.cpp
 * @brief Quadtree build, split and windowed query.
 */

#include <windscape/spatial/quadtree.hpp>
#include <windscape/features/feature_store.hpp>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <stdexcept>
#include <string>

namespace windscape {
namespace spatial {

const char *index_state_name(IndexState state) {
  switch (state) {
  case IndexState::BUILT: return "built";
  case IndexState::STALE: return "stale";
  case IndexState::FOREIGN: return "foreign";
  case IndexState::NOT_BUILT:
  default: return "not built";
  }
}

Quadtree::Quadtree(const QuadtreeConfig &config) : config_(config) {
  if (config_.leaf_capacity <= 0) {
    throw std::invalid_argument("Quadtree: leaf_capacity must be > 0, got " +
                                std::to_string(config_.leaf_capacity));
  }
  if (config_.max_depth < 0) {
    throw std::invalid_argument("Quadtree: max_depth must be >= 0, got " +
                                std::to_string(config_.max_depth));
  }
  root_ = std::make_unique<Node>();
  root_->bounds = config_.bounds;
}

Quadtree::~Quadtree() = default;
Quadtree::Quadtree(Quadtree &&other) noexcept = default;
Quadtree &Quadtree::operator=(Quadtree &&other) noexcept = default;

const BoundingBox &Quadtree::bounds() const {
  return root_ ? root_->bounds : config_.bounds;
}

void Quadtree::build(const features::FeatureStore &store) {
  auto start = std::chrono::high_resolution_clock::now();

  const auto &registry = store.registry();
  auto view = registry.view<const features::GroundPosition>();

  // Root bounds: configured extent, grown to cover every finite position
  BoundingBox root_bounds = config_.bounds;
  if (config_.fit_to_features) {
    for (auto [entity, pos] : view.each()) {
      if (std::isfinite(pos.x) && std::isfinite(pos.z)) {
        root_bounds = root_bounds.expanded_to(pos.x, pos.z);
      }
    }
  }

  // Build into a fresh root, then swap so readers never see a partial tree
  Quadtree fresh(config_);
  fresh.root_->bounds = root_bounds;
  for (auto [entity, pos] : view.each()) {
    fresh.insert(entity, pos.x, pos.z);
  }

  auto end = std::chrono::high_resolution_clock::now();

  root_ = std::move(fresh.root_);
  size_ = fresh.size_;
  rejected_ = fresh.rejected_;
  built_ = true;
  source_ = &store;
  built_generation_ = store.generation();
  build_time_ms_ = std::chrono::duration<double, std::milli>(end - start).count();
}

bool Quadtree::insert(entt::entity entity, float x, float z) {
  if (!root_) {
    root_ = std::make_unique<Node>();
    root_->bounds = config_.bounds;
  }
  if (!std::isfinite(x) || !std::isfinite(z) || !root_->bounds.contains(x, z)) {
    ++rejected_;
    return false;
  }

  insert_into(*root_, {entity, x, z});
  ++size_;
  built_ = true;
  return true;
}

int Quadtree::quadrant_of(const Node &node, float x, float z) {
  // Lower bound inclusive, upper bound exclusive: a point on the split
  // line always goes east/south, never to both sides.
  int index = 0;
  if (x >= node.bounds.center_x()) index += 1;
  if (z >= node.bounds.center_z()) index += 2;
  return index;
}

void Quadtree::insert_into(Node &node, const Entry &entry) {
  Node *current = &node;
  while (!current->is_leaf()) {
    current = current->children[quadrant_of(*current, entry.x, entry.z)].get();
  }

  current->entries.push_back(entry);

  if (current->entries.size() > static_cast<size_t>(config_.leaf_capacity) &&
      current->depth < config_.max_depth) {
    split(*current);
  }
}

void Quadtree::split(Node &node) {
  for (int i = 0; i < 4; ++i) {
    auto child = std::make_unique<Node>();
    child->bounds = node.bounds.quadrant(i);
    child->depth = node.depth + 1;
    node.children[i] = std::move(child);
  }

  // Redistribute; a child that overflows splits in turn (depth-capped)
  std::vector<Entry> moved;
  moved.swap(node.entries);
  for (const auto &entry : moved) {
    insert_into(*node.children[quadrant_of(node, entry.x, entry.z)], entry);
  }
}

bool Quadtree::query(const BoundingBox &box,
                     std::vector<entt::entity> &out_result) const {
  if (!built_ || !root_) {
    return false;
  }
  ++query_count_;
  query_node(*root_, box, out_result);
  return true;
}

void Quadtree::query_node(const Node &node, const BoundingBox &box,
                          std::vector<entt::entity> &out_result) {
  if (!node.bounds.intersects(box)) {
    return; // Whole subtree outside the window
  }

  if (node.is_leaf()) {
    // Leaf bounds may extend past the window: exact test per entry
    for (const auto &entry : node.entries) {
      if (box.contains(entry.x, entry.z)) {
        out_result.push_back(entry.entity);
      }
    }
    return;
  }

  for (const auto &child : node.children) {
    query_node(*child, box, out_result);
  }
}

size_t Quadtree::count(const BoundingBox &box) const {
  size_t total = 0;
  return count(box, total) ? total : 0;
}

bool Quadtree::count(const BoundingBox &box, size_t &out_count) const {
  if (!built_ || !root_) return false;
  out_count = count_node(*root_, box);
  return true;
}

size_t Quadtree::count_node(const Node &node, const BoundingBox &box) {
  if (!node.bounds.intersects(box)) return 0;

  size_t total = 0;
  if (node.is_leaf()) {
    for (const auto &entry : node.entries) {
      if (box.contains(entry.x, entry.z)) ++total;
    }
  } else {
    for (const auto &child : node.children) {
      total += count_node(*child, box);
    }
  }
  return total;
}

void Quadtree::for_each_leaf(const LeafVisitor &visitor) const {
  if (!root_) return;
  visit_leaves(*root_, visitor);
}

void Quadtree::visit_leaves(const Node &node, const LeafVisitor &visitor) {
  if (node.is_leaf()) {
    visitor(node.bounds, node.depth, node.entries.size());
    return;
  }
  for (const auto &child : node.children) {
    visit_leaves(*child, visitor);
  }
}

QuadtreeStats Quadtree::stats() const {
  QuadtreeStats stats;
  if (root_) {
    collect_stats(*root_, stats);
  }
  stats.avg_per_leaf = static_cast<double>(stats.features) /
                       static_cast<double>(std::max<size_t>(1, stats.leaves));
  stats.rejected = rejected_;
  stats.build_time_ms = build_time_ms_;
  stats.query_count = query_count_;
  return stats;
}

void Quadtree::collect_stats(const Node &node, QuadtreeStats &stats) {
  ++stats.nodes;
  stats.max_depth = std::max(stats.max_depth, node.depth);

  if (node.is_leaf()) {
    ++stats.leaves;
    stats.features += node.entries.size();
    return;
  }
  for (const auto &child : node.children) {
    collect_stats(*child, stats);
  }
}

}  // namespace spatial
}  // namespace windscape
