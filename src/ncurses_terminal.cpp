#include "ncurses_terminal.hpp"
#include <ncurses.h>

NcursesTerminal::NcursesTerminal() {
  if (has_colors()) {
    start_color();
    colors_ = true;
    default_colors_ = (use_default_colors() == OK);
  }
}

TermSize NcursesTerminal::getSize() const {
  int r, c; getmaxyx(stdscr, r, c); return {r, c};
}

void NcursesTerminal::clear() { erase(); }

short NcursesTerminal::color_number(Color c) const {
  bool bright = COLORS >= 16;
  switch (c) {
    case Color::Default: return default_colors_ ? -1 : COLOR_WHITE;
    case Color::Black: return COLOR_BLACK;
    case Color::Red: return COLOR_RED;
    case Color::Green: return COLOR_GREEN;
    case Color::Yellow: return COLOR_YELLOW;
    case Color::Blue: return COLOR_BLUE;
    case Color::Magenta: return COLOR_MAGENTA;
    case Color::Cyan: return COLOR_CYAN;
    case Color::White: return bright ? 15 : COLOR_WHITE;
    case Color::Grey: return COLOR_WHITE;
    case Color::DarkGrey: return bright ? 8 : COLOR_BLACK;
  }
  return -1;
}

int NcursesTerminal::pair_for(Color fg, Color bg) {
  if (!colors_) return 0;
  auto key = std::make_pair(fg, bg);
  auto it = pairs_.find(key);
  if (it != pairs_.end()) return it->second;
  if (next_pair_ >= COLOR_PAIRS) return 0;
  int id = next_pair_++;
  short f = color_number(fg);
  short b = color_number(bg);
  if (!default_colors_ && bg == Color::Default) b = COLOR_BLACK;
  init_pair(static_cast<short>(id), f, b);
  pairs_[key] = id;
  return id;
}

void NcursesTerminal::draw_styled(int row, int col, const std::string& text, Color fg, Color bg) {
  int pair = pair_for(fg, bg);
  attr_t attrs = COLOR_PAIR(pair);
  if (!colors_ && (bg == Color::Grey || bg == Color::White)) attrs |= A_REVERSE;
  attron(attrs);
  mvaddnstr(row, col, text.c_str(), static_cast<int>(text.size()));
  attroff(attrs);
}

void NcursesTerminal::move_cursor(int row, int col) { move(row, col); }

void NcursesTerminal::refresh() { ::refresh(); }

std::optional<Key> NcursesTerminal::read_key(int timeout_ms) {
  timeout(timeout_ms);
  wint_t ch = 0;
  int r = wget_wch(stdscr, &ch);
  if (r == ERR) return std::nullopt;
  Key k;
  k.code = static_cast<int>(ch);
  k.special = (r == KEY_CODE_YES);
  return k;
}
