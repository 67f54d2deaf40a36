#pragma once
#include <cstddef>
#include <afopt/analysis.hpp>

namespace afopt {

// RAII dashboard that renders one analysis: opportunity table plus both
// overtake plans.
class ViewerApp {
public:
  explicit ViewerApp(const Analysis& analysis);
  int run(); // returns 0 on normal exit

private:
  enum class Pane : int { Opportunities = 0, MinTime = 1, MinTracks = 2, Count };

  // Input
  void process_input_();
  // Rendering
  void render_frame_();
  void draw_hud_();
  void draw_opportunities_(int y0);
  void draw_plan_(const OvertakePlan& plan, int y0);

  std::size_t row_count_() const;
  int visible_rows_(int y0) const;

  // Dependencies
  const Analysis& analysis_;

  // UI state
  Pane pane_{Pane::Opportunities};
  std::size_t scroll_{0};
  bool show_all_tiers_{false};
};

} // namespace afopt
