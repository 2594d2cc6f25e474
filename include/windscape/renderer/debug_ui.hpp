#pragma once

/**
 * @file debug_ui.hpp
 * @brief Left-side ImGui panel for the turbine viewer.
 *
 * Provides:
 * - Year slider and autoplay
 * - LOD preset and pipeline stage toggles
 * - Frame statistics and tier distribution
 * - Event log
 */

#include <deque>
#include <string>

namespace windscape {
namespace pipeline {
class PipelineCoordinator;
}
} // namespace windscape

namespace windscape {
namespace renderer {

/**
 * @brief Log entry for the event log.
 */
struct LogEntry {
  double time;
  std::string message;
  int severity; // 0=info, 1=warning, 2=error
};

/**
 * @brief Viewer state edited from the sidebar.
 */
struct ViewerControls {
  int year = 2023;
  int min_year = 1990;
  int max_year = 2023;
  bool autoplay = false;
  int preset = 0;              // Index into standard/aggressive/extreme
  bool use_prefilter = true;
  bool use_frustum = true;
  bool show_quadtree = false;
  bool animate_blades = true;
};

class DebugUI {
public:
  DebugUI() = default;
  ~DebugUI() = default;

  // Lifecycle
  void init();
  void shutdown();

  // Frame management
  void begin_frame();
  void end_frame();

  /**
   * @brief Draw the sidebar; edits controls in place.
   */
  void draw_sidebar(ViewerControls &controls,
                    const pipeline::PipelineCoordinator &coordinator,
                    float sidebar_width);

  // Logging
  void add_log(double time, const std::string &message, int severity = 0);
  void clear_log();

  bool is_capturing_mouse() const;

  void toggle_log() { show_log_ = !show_log_; }

private:
  bool initialized_ = false;
  bool show_log_ = true;

  std::deque<LogEntry> log_entries_;
  static constexpr size_t MAX_LOG_ENTRIES = 200;
  bool auto_scroll_log_ = true;
};

} // namespace renderer
} // namespace windscape
