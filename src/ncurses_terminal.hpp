#pragma once
/*
 * NcursesTerminal
 *
 * Purpose: ITerminal implementation using ncurses for drawing and input.
 * Note: initialization/teardown is managed by Terminal RAII wrapper.
 * Colors: pairs are allocated on first use per (fg, bg) combination.
 */
#include <map>
#include <utility>
#include "iterminal.hpp"

class NcursesTerminal : public ITerminal {
public:
  NcursesTerminal();
  TermSize getSize() const override;
  void clear() override;
  void draw_styled(int row, int col, const std::string& text, Color fg, Color bg) override;
  void move_cursor(int row, int col) override;
  void refresh() override;
  std::optional<Key> read_key(int timeout_ms) override;
private:
  short color_number(Color c) const;
  int pair_for(Color fg, Color bg);
  bool colors_ = false;
  bool default_colors_ = false;
  std::map<std::pair<Color, Color>, int> pairs_;
  int next_pair_ = 1;
};
