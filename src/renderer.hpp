#pragma once
/*
 * Renderer
 *
 * Purpose: draw the document, status line, request line and popups into a
 *          cell frame, then send only the cells that changed since the last
 *          frame (one styled write per run of same-style changed cells).
 * Dependency: draws via ITerminal to allow backend replacement.
 * State: previous frame and scroll offset; everything else comes in the
 *        RenderView snapshot.
 */
#include <algorithm>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "config.hpp"
#include "highlighter.hpp"
#include "iterminal.hpp"
#include "menu.hpp"
#include "request_coordinator.hpp"
#include "text_buffer.hpp"
#include "types.hpp"
#include "wrap_layout.hpp"

struct Cell {
  char32_t ch = U' ';
  Color fg = Color::Default;
  Color bg = Color::Default;
  bool operator==(const Cell& o) const { return ch == o.ch && fg == o.fg && bg == o.bg; }
  bool operator!=(const Cell& o) const { return !(*this == o); }
};

struct RenderView {
  const TextBuffer* buf = nullptr;
  Cursor cur{};
  std::optional<std::pair<size_t, size_t>> selection; // [start, end) chars
  Mode mode = Mode::Normal;
  MenuState menu = MenuState::Inactive;
  std::string file_name;
  bool modified = false;
  std::string message;
  RequestState request;
  bool show_line_numbers = true;
  int tab_width = SCRIBE_TAB_WIDTH;
  const FilePicker* picker = nullptr;
  std::string picker_dir;
};

class Renderer {
public:
  void render(ITerminal& term, const RenderView& view, SyntaxHighlighter& hl);
  void force_redraw() { force_ = true; }

  int scroll() const { return scroll_; }
  int text_height() const { return std::max(1, rows_ - 2); }
  const std::vector<WrappedLine>& wrapped() const { return wrapped_; }
  /* styled writes sent by the last render */
  size_t last_runs() const { return last_runs_; }

  static std::pair<Color, Color> style_colors(Style s);
  static std::string status_text(const RenderView& view);

private:
  void resize(int rows, int cols);
  void put(int row, int col, char32_t ch, Color fg, Color bg);
  int put_text(int row, int col, const std::string& text, Color fg, Color bg, int max_col);
  void fill_row(int row, int from, int to, Color fg, Color bg);
  void draw_text_area(const RenderView& view, SyntaxHighlighter& hl, int gutter);
  void draw_status(const RenderView& view);
  void draw_box(int top, int left, int height, int width, const std::string& title);
  void draw_help_popup(MenuState menu);
  void draw_file_picker(const RenderView& view);
  void draw_save_as(const RenderView& view, int& cursor_row, int& cursor_col);
  void flush(ITerminal& term);

  int rows_ = 0;
  int cols_ = 0;
  std::vector<Cell> cur_;
  std::vector<Cell> prev_;
  std::vector<WrappedLine> wrapped_;
  int scroll_ = 0;
  bool force_ = true;
  size_t last_runs_ = 0;
};
