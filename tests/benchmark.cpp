/**
 * @file benchmark.cpp
 * @brief Benchmark suite for the culling pipeline stages.
 */

#include <chrono>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

#include <windscape/core/constants.hpp>
#include <windscape/culling/frustum.hpp>
#include <windscape/lod/lod_manager.hpp>
#include <windscape/pipeline/coordinator.hpp>
#include <windscape/spatial/quadtree.hpp>
#include <windscape/temporal/year_index.hpp>

using namespace windscape;
using Clock = std::chrono::high_resolution_clock;

struct BenchmarkResult {
  std::string name;
  double total_ms;
  double per_step_us;
  size_t iterations;
};

template <typename Func>
BenchmarkResult run_benchmark(const std::string &name, size_t iterations,
                              Func &&func) {
  auto start = Clock::now();
  for (size_t i = 0; i < iterations; ++i) {
    func();
  }
  auto end = Clock::now();

  double total_ms =
      std::chrono::duration<double, std::milli>(end - start).count();
  double per_step_us = (total_ms * 1000.0) / iterations;

  return {name, total_ms, per_step_us, iterations};
}

void print_result(const BenchmarkResult &r) {
  std::cout << std::left << std::setw(34) << r.name << std::right
            << std::setw(10) << std::fixed << std::setprecision(2) << r.total_ms
            << " ms  " << std::setw(10) << r.per_step_us << " µs/op  ("
            << r.iterations << " iters)\n";
}

int main() {
  std::cout
      << "╔══════════════════════════════════════════════════════════════╗\n";
  std::cout
      << "║           WINDSCAPE CULLING - BENCHMARK SUITE                ║\n";
  std::cout
      << "╚══════════════════════════════════════════════════════════════╝\n\n";

  std::vector<BenchmarkResult> results;
  const size_t FEATURES = constants::FULL_DATASET_SIZE;
  const size_t BUILD_ITERS = 20;
  const size_t QUERY_ITERS = 2000;
  const size_t FRAME_ITERS = 200;

  spatial::BoundingBox bounds(constants::MAP_X_MIN, constants::MAP_X_MAX,
                              constants::MAP_Z_MIN, constants::MAP_Z_MAX);

  pipeline::PipelineCoordinator coordinator;
  coordinator.store().spawn_random_field(FEATURES, bounds, constants::FIRST_YEAR,
                                         constants::LAST_YEAR);
  coordinator.build_indices();
  std::cout << "\n";

  // =========================================================================
  // INDICES
  // =========================================================================
  std::cout << "═══ INDICES (" << FEATURES << " features) ═══\n";

  {
    results.push_back(run_benchmark("Quadtree build", BUILD_ITERS, [&]() {
      spatial::Quadtree tree = pipeline::build_spatial_index(coordinator.store());
      (void)tree;
    }));
    print_result(results.back());
  }

  {
    results.push_back(run_benchmark("Year index build", BUILD_ITERS, [&]() {
      temporal::YearIndex index = pipeline::build_year_index(coordinator.store());
      (void)index;
    }));
    print_result(results.back());
  }

  {
    const auto &tree = coordinator.quadtree();
    spatial::BoundingBox window(-0.8f, 0.8f, -0.9f, 0.9f);
    std::vector<entt::entity> found;
    found.reserve(FEATURES);

    results.push_back(run_benchmark("Quadtree query (quarter map)", QUERY_ITERS, [&]() {
      found.clear();
      if (!tree.query(window, found)) return;
    }));
    print_result(results.back());

    size_t brute = 0;
    const auto &registry = coordinator.store().registry();
    auto view = registry.view<const features::GroundPosition>();
    results.push_back(run_benchmark("Linear scan (quarter map)", QUERY_ITERS, [&]() {
      brute = 0;
      for (auto [entity, pos] : view.each()) {
        if (window.contains(pos.x, pos.z)) ++brute;
      }
    }));
    print_result(results.back());

    std::cout << "  (" << found.size() << " hits, scan " << brute << ")\n";
  }

  {
    auto &index = coordinator.year_index();
    size_t total = 0;
    results.push_back(run_benchmark("Year count_until sweep", QUERY_ITERS, [&]() {
      for (int year = constants::FIRST_YEAR; year <= constants::LAST_YEAR; ++year) {
        total += index.count_until(year);
      }
    }));
    print_result(results.back());
  }

  // =========================================================================
  // CAMERA & LOD
  // =========================================================================
  std::cout << "\n═══ CAMERA & LOD ═══\n";

  {
    culling::CameraPose pose;
    results.push_back(run_benchmark("Frustum from camera", QUERY_ITERS * 10, [&]() {
      pose.rot_y += 0.01f;
      culling::ViewFrustum frustum = culling::update_camera(pose);
      (void)frustum;
    }));
    print_result(results.back());
  }

  {
    auto manager = lod::LODManager::from_preset(lod::LODPreset::EXTREME);
    std::vector<float> distances(FEATURES);
    for (size_t i = 0; i < FEATURES; ++i) {
      distances[i] = static_cast<float>(i) / static_cast<float>(FEATURES);
    }

    lod::LodSavings savings;
    results.push_back(run_benchmark("LOD savings (extreme)", FRAME_ITERS, [&]() {
      savings = manager.calculate_savings(distances, 150);
    }));
    print_result(results.back());
    std::cout << "  (" << std::setprecision(1) << savings.savings_percent
              << "% polygons saved)\n";
  }

  // =========================================================================
  // FULL FRAME
  // =========================================================================
  std::cout << "\n═══ FULL FRAME ═══\n";

  culling::CameraPose pose;
  coordinator.update_camera(pose);

  {
    coordinator.config().use_spatial_prefilter = true;
    results.push_back(run_benchmark("Pipeline frame (prefilter)", FRAME_ITERS, [&]() {
      coordinator.render_frame(constants::LAST_YEAR);
    }));
    print_result(results.back());
  }

  {
    coordinator.config().use_spatial_prefilter = false;
    results.push_back(run_benchmark("Pipeline frame (no prefilter)", FRAME_ITERS, [&]() {
      coordinator.render_frame(constants::LAST_YEAR);
    }));
    print_result(results.back());
  }

  {
    coordinator.config().use_spatial_prefilter = true;
    int year = constants::FIRST_YEAR;
    results.push_back(run_benchmark("Pipeline frame (year sweep)", FRAME_ITERS, [&]() {
      coordinator.render_frame(year);
      year = year >= constants::LAST_YEAR ? constants::FIRST_YEAR : year + 1;
    }));
    print_result(results.back());
  }

  // =========================================================================
  // SUMMARY
  // =========================================================================
  std::cout
      << "\n╔══════════════════════════════════════════════════════════════╗\n";
  std::cout
      << "║                        SUMMARY                               ║\n";
  std::cout
      << "╚══════════════════════════════════════════════════════════════╝\n\n";

  coordinator.render_frame(constants::LAST_YEAR);
  std::cout << coordinator.stats_summary() << "\n";

  double frame_us = 0;
  for (const auto &r : results) {
    if (r.name == "Pipeline frame (prefilter)") {
      frame_us = r.per_step_us;
    }
  }

  double target_fps = 60.0;
  double budget_us = 1000000.0 / target_fps;
  double usage_percent = frame_us / budget_us * 100.0;

  std::cout << "Target frame budget (60 FPS): " << std::setprecision(0)
            << budget_us << " µs\n";
  std::cout << "Culling usage: " << std::setprecision(1) << usage_percent
            << "%\n";

  if (usage_percent < 50) {
    std::cout << "Status: ✅ EXCELLENT - Plenty of headroom for rendering\n";
  } else if (usage_percent < 80) {
    std::cout << "Status: ✅ GOOD - Some headroom available\n";
  } else if (usage_percent < 100) {
    std::cout << "Status: ⚠️  TIGHT - Consider optimization\n";
  } else {
    std::cout << "Status: ❌ OVER BUDGET - Optimization required\n";
  }

  return 0;
}
