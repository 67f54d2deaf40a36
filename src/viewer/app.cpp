#include <raylib.h>
#include <algorithm>
#include <cstdio>
#include <string>

#include <afopt/viewer/app.hpp>
#include <afopt/time_codec.hpp>

namespace afopt {

namespace {

// --- HUD layout (keep in sync with draw_hud_) ---
static constexpr int kHUD_LINE1_Y    = 20;  // size 20
static constexpr int kHUD_LINE2_Y    = 46;  // size 18
static constexpr int kHUD_LINE3_Y    = 72;  // size 14
static constexpr int kHUD_BOTTOM_PAD = 24;  // extra breathing room below HUD

static constexpr int kRowH = 18;
static constexpr int kPad  = 8;
static constexpr int kX0   = 20;

static const Color colDefault = Color{200,200,210,255};
static const Color colHeader  = Color{220,220,230,255};
static const Color colNA      = Color{ 80,220,120,255};  // free gain
static const Color colBest    = Color{180, 90,255,255};  // best tier of a track
static const Color colMuted   = Color{120,120,135,255};
static const Color colWarn    = Color{235,120,100,255};

static const char* pane_name(int p) {
  switch (p) {
    case 0: return "Opportunities";
    case 1: return "Overtake: min time";
    case 2: return "Overtake: min tracks";
    default: return "Unknown";
  }
}

static void fmt_efficiency(const Efficiency& e, char* out, int cap) {
  if (cap <= 0 || out == nullptr) return;
  if (e.infinite) { std::snprintf(out, (size_t)cap, "%s", "inf"); return; }
  // per second reads better than per centisecond
  std::snprintf(out, (size_t)cap, "%.5f", e.value * 100.0);
}

static void draw_panel(int x, int y, int w, int h) {
  DrawRectangle(x - 6, y - 6, w + 12, h + 12, Color{0,0,0,80});
  DrawRectangle(x, y, w, h, Color{24,24,28,220});
  DrawLine(x, y + kPad + kRowH, x + w, y + kPad + kRowH, Color{60,60,70,255});
}

} // namespace

// ---- ViewerApp ----

ViewerApp::ViewerApp(const Analysis& analysis) : analysis_(analysis) {}

int ViewerApp::run() {
  const int W = 1180, H = 768;
  InitWindow(W, H, "afopt - Average Finish");
  SetTargetFPS(60);

  while (!WindowShouldClose()) {
    process_input_();
    render_frame_();
  }

  CloseWindow();
  return 0;
}

std::size_t ViewerApp::row_count_() const {
  switch (pane_) {
    case Pane::Opportunities: {
      if (!show_all_tiers_) return analysis_.opportunities.size();
      std::size_t n = 0;
      for (const auto& o : analysis_.opportunities) n += std::max<std::size_t>(1, o.tiers.size());
      return n;
    }
    case Pane::MinTime:   return analysis_.min_time ? analysis_.min_time->items.size() : 0;
    case Pane::MinTracks: return analysis_.min_tracks ? analysis_.min_tracks->items.size() : 0;
    default: return 0;
  }
}

int ViewerApp::visible_rows_(int y0) const {
  const int avail = GetScreenHeight() - y0 - kPad * 2 - kRowH * 2;
  return std::max(1, avail / kRowH);
}

void ViewerApp::process_input_() {
  // Pane selection
  if (IsKeyPressed(KEY_TAB)) {
    pane_ = static_cast<Pane>((static_cast<int>(pane_) + 1) % static_cast<int>(Pane::Count));
    scroll_ = 0;
  }
  if (IsKeyPressed(KEY_ONE))   { pane_ = Pane::Opportunities; scroll_ = 0; }
  if (IsKeyPressed(KEY_TWO))   { pane_ = Pane::MinTime;       scroll_ = 0; }
  if (IsKeyPressed(KEY_THREE)) { pane_ = Pane::MinTracks;     scroll_ = 0; }

  if (IsKeyPressed(KEY_T)) { show_all_tiers_ = !show_all_tiers_; scroll_ = 0; }

  // Scrolling
  const std::size_t rows = row_count_();
  const int wheel = static_cast<int>(GetMouseWheelMove());
  if ((IsKeyPressed(KEY_DOWN) || wheel < 0) && scroll_ + 1 < rows) ++scroll_;
  if ((IsKeyPressed(KEY_UP)   || wheel > 0) && scroll_ > 0)        --scroll_;
  if (IsKeyPressed(KEY_PAGE_DOWN)) scroll_ = std::min(rows ? rows - 1 : 0, scroll_ + 20);
  if (IsKeyPressed(KEY_PAGE_UP))   scroll_ = scroll_ > 20 ? scroll_ - 20 : 0;
  if (IsKeyPressed(KEY_HOME))      scroll_ = 0;
}

void ViewerApp::render_frame_() {
  BeginDrawing();
  ClearBackground(Color{18,22,30,255});

  const int y0 = kHUD_LINE3_Y + /*line height*/ 14 + kHUD_BOTTOM_PAD;
  switch (pane_) {
    case Pane::Opportunities:
      draw_opportunities_(y0);
      break;
    case Pane::MinTime:
      if (analysis_.min_time) draw_plan_(*analysis_.min_time, y0);
      else DrawText("No rival configured (config key 'rival').", kX0, y0, 18, colMuted);
      break;
    case Pane::MinTracks:
      if (analysis_.min_tracks) draw_plan_(*analysis_.min_tracks, y0);
      else DrawText("No rival configured (config key 'rival').", kX0, y0, 18, colMuted);
      break;
    default:
      break;
  }

  draw_hud_();
  EndDrawing();
}

void ViewerApp::draw_opportunities_(int y0) {
  const int box_w = GetScreenWidth() - kX0 * 2;
  const int rows  = visible_rows_(y0);
  const int box_h = kPad*2 + kRowH*(rows + 1);
  draw_panel(kX0, y0, box_w, box_h);

  // Column x-positions (match row draws below)
  const int X_TRACK = kX0 + kPad + 0;
  const int X_RANK  = kX0 + kPad + 330;
  const int X_TIME  = kX0 + kPad + 400;
  const int X_TGT   = kX0 + kPad + 490;
  const int X_NEED  = kX0 + kPad + 570;
  const int X_GAIN  = kX0 + kPad + 680;
  const int X_AF    = kX0 + kPad + 750;
  const int X_EFF   = kX0 + kPad + 840;

  DrawText("Track variant", X_TRACK, y0 + kPad - 2, 16, colHeader);
  DrawText("Rank",  X_RANK, y0 + kPad - 2, 16, colHeader);
  DrawText("Time",  X_TIME, y0 + kPad - 2, 16, colHeader);
  DrawText("Goal",  X_TGT,  y0 + kPad - 2, 16, colHeader);
  DrawText("Need",  X_NEED, y0 + kPad - 2, 16, colHeader);
  DrawText("+Pos",  X_GAIN, y0 + kPad - 2, 16, colHeader);
  DrawText("AF -",  X_AF,   y0 + kPad - 2, 16, colHeader);
  DrawText("Eff/s", X_EFF,  y0 + kPad - 2, 16, colHeader);

  char buf_eff[32];
  int y = y0 + kPad + kRowH + 2;
  std::size_t row = 0;
  int drawn = 0;

  for (const auto& o : analysis_.opportunities) {
    const std::size_t n_rows = show_all_tiers_ ? std::max<std::size_t>(1, o.tiers.size()) : 1;
    for (std::size_t r = 0; r < n_rows; ++r, ++row) {
      if (row < scroll_) continue;
      if (drawn >= rows) return;

      const bool first = (r == 0);
      if (first) {
        DrawText(o.variant.key().c_str(), X_TRACK, y, 16, o.is_na ? colNA : colDefault);
        DrawText(TextFormat("%d", o.current_rank), X_RANK, y, 16, colDefault);
        DrawText(o.is_na ? "N/A" : format_time(o.current_time).c_str(), X_TIME, y, 16, colDefault);
      }

      const std::size_t ti = show_all_tiers_ ? r : o.best_tier_idx;
      if (ti < o.tiers.size()) {
        const Tier& t = o.tiers[ti];
        const Color c = (ti == o.best_tier_idx) ? colBest : colDefault;
        fmt_efficiency(t.efficiency, buf_eff, sizeof(buf_eff));
        DrawText(TextFormat("#%d", t.target_rank), X_TGT, y, 16, c);
        DrawText(o.is_na ? "any time" : format_time(t.time_delta).c_str(), X_NEED, y, 16, c);
        DrawText(TextFormat("%d", t.positions_gained), X_GAIN, y, 16, c);
        DrawText(TextFormat("%.4f", t.af_improvement), X_AF, y, 16, c);
        DrawText(buf_eff, X_EFF, y, 16, c);
      } else {
        DrawText("--", X_TGT, y, 16, colMuted);
      }

      y += kRowH;
      ++drawn;
    }
  }
}

void ViewerApp::draw_plan_(const OvertakePlan& plan, int y0) {
  // Plan header line
  DrawText(TextFormat("Target %s  AF %.3f  gap %.4f  need +%d  got +%d  time %s  AF -> %.3f",
                      plan.target_username.c_str(), plan.target_af, plan.af_gap,
                      plan.positions_needed, plan.positions_gained,
                      format_time(plan.time_investment).c_str(), plan.new_af),
           kX0, y0 - 4, 16, plan.feasible ? colHeader : colWarn);
  if (!plan.feasible) {
    DrawText("Not enough improvement available to overtake.", kX0, y0 + 14, 16, colWarn);
  }

  const int top   = y0 + 40;
  const int box_w = GetScreenWidth() - kX0 * 2;
  const int rows  = visible_rows_(top);
  const int box_h = kPad*2 + kRowH*(rows + 1);
  draw_panel(kX0, top, box_w, box_h);

  const int X_TRACK = kX0 + kPad + 0;
  const int X_RANK  = kX0 + kPad + 330;
  const int X_TIME  = kX0 + kPad + 440;
  const int X_NEED  = kX0 + kPad + 620;
  const int X_GAIN  = kX0 + kPad + 720;
  const int X_AF    = kX0 + kPad + 800;

  DrawText("Track variant", X_TRACK, top + kPad - 2, 16, colHeader);
  DrawText("Rank",     X_RANK, top + kPad - 2, 16, colHeader);
  DrawText("Time",     X_TIME, top + kPad - 2, 16, colHeader);
  DrawText("Improve",  X_NEED, top + kPad - 2, 16, colHeader);
  DrawText("+Pos",     X_GAIN, top + kPad - 2, 16, colHeader);
  DrawText("AF -",     X_AF,   top + kPad - 2, 16, colHeader);

  int y = top + kPad + kRowH + 2;
  int drawn = 0;
  for (std::size_t i = scroll_; i < plan.items.size() && drawn < rows; ++i, ++drawn) {
    const auto& it = plan.items[i];
    const Color c = it.is_na ? colNA : colDefault;
    DrawText(it.variant.key().c_str(), X_TRACK, y, 16, c);
    DrawText(TextFormat("%d -> %d", it.current_rank, it.new_rank), X_RANK, y, 16, c);
    if (it.is_na) {
      DrawText("submit a time", X_TIME, y, 16, c);
      DrawText("--", X_NEED, y, 16, c);
    } else {
      const std::string from = format_time(it.current_time);
      const std::string to   = format_time(it.target_time);
      DrawText(TextFormat("%s -> %s", from.c_str(), to.c_str()), X_TIME, y, 16, c);
      DrawText(format_time(it.time_delta).c_str(), X_NEED, y, 16, c);
    }
    DrawText(TextFormat("%d", it.positions_gained), X_GAIN, y, 16, c);
    DrawText(TextFormat("%.4f", it.af_improvement), X_AF, y, 16, c);
    y += kRowH;
  }
}

void ViewerApp::draw_hud_() {
  DrawText(TextFormat("player=%s  AF=%.3f%s  tracks=%d  opportunities=%d",
                      analysis_.username.c_str(),
                      analysis_.current_af,
                      analysis_.current_af_estimated ? " (est)" : "",
                      analysis_.total_tracks,
                      (int)analysis_.opportunities.size()),
           kX0, kHUD_LINE1_Y, 20, Color{220,235,220,255});

  DrawText(TextFormat("View: %s%s  (%d/%d)",
                      pane_name(static_cast<int>(pane_)),
                      (pane_ == Pane::Opportunities && show_all_tiers_) ? "  [all tiers]" : "",
                      (int)std::min(scroll_ + 1, std::max<std::size_t>(1, row_count_())),
                      (int)row_count_()),
           kX0, kHUD_LINE2_Y, 18, Color{235,220,220,255});

  DrawText("Tab or 1..3: View | T: All tiers | Up/Down, Wheel, PgUp/PgDn: Scroll | Home: Top | Esc: Quit",
           kX0, kHUD_LINE3_Y, 14, Color{190,205,190,255});
}

} // namespace afopt
