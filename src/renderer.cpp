#include "renderer.hpp"
#include <algorithm>
#include "utf8.hpp"

static int digits_of(int n) {
  int d = 1;
  while (n >= 10) { n /= 10; d++; }
  return d;
}

static const char* mode_name(Mode m) {
  switch (m) {
    case Mode::Normal: return "NORMAL";
    case Mode::Insert: return "INSERT";
    case Mode::Select: return "SELECT";
  }
  return "NORMAL";
}

std::pair<Color, Color> Renderer::style_colors(Style s) {
  switch (s) {
    case Style::Normal: return {Color::Default, Color::Default};
    case Style::Keyword: return {Color::Magenta, Color::Default};
    case Style::Function: return {Color::Blue, Color::Default};
    case Style::Type: return {Color::Cyan, Color::Default};
    case Style::String: return {Color::Green, Color::Default};
    case Style::Number: return {Color::Yellow, Color::Default};
    case Style::Comment: return {Color::DarkGrey, Color::Default};
    case Style::Variable: return {Color::Default, Color::Default};
    case Style::Constant: return {Color::Yellow, Color::Default};
    case Style::Operator: return {Color::Default, Color::Default};
    case Style::Error: return {Color::Red, Color::White};
    case Style::Selection: return {Color::Black, Color::Grey};
  }
  return {Color::Default, Color::Default};
}

std::string Renderer::status_text(const RenderView& view) {
  std::string s = view.file_name.empty() ? "[No Name]" : view.file_name;
  if (view.modified) s += " [+]";
  s += " - ";
  s += (view.menu != MenuState::Inactive) ? "WAITING FOR COMMAND" : mode_name(view.mode);
  if (!view.message.empty()) s += "  " + view.message;
  return s;
}

void Renderer::resize(int rows, int cols) {
  rows_ = rows;
  cols_ = cols;
  size_t n = static_cast<size_t>(std::max(0, rows)) * static_cast<size_t>(std::max(0, cols));
  cur_.assign(n, Cell{});
  prev_.assign(n, Cell{});
  force_ = true;
}

void Renderer::put(int row, int col, char32_t ch, Color fg, Color bg) {
  if (row < 0 || row >= rows_ || col < 0 || col >= cols_) return;
  cur_[static_cast<size_t>(row) * static_cast<size_t>(cols_) + static_cast<size_t>(col)] = Cell{ch, fg, bg};
}

int Renderer::put_text(int row, int col, const std::string& text, Color fg, Color bg, int max_col) {
  size_t i = 0;
  while (i < text.size() && col < max_col) {
    char32_t c = utf8::decode_next(text, i);
    if (c == U'\n' || c == U'\t') c = U' ';
    put(row, col++, c, fg, bg);
  }
  return col;
}

void Renderer::fill_row(int row, int from, int to, Color fg, Color bg) {
  for (int c = from; c < to; ++c) put(row, c, U' ', fg, bg);
}

void Renderer::draw_text_area(const RenderView& view, SyntaxHighlighter& hl, int gutter) {
  const TextBuffer& buf = *view.buf;
  const int height = text_height();
  int cached_line = -1;
  std::u32string chars;
  size_t line_start = 0;
  for (int i = 0; i < height; ++i) {
    int wi = scroll_ + i;
    if (wi >= static_cast<int>(wrapped_.size())) break;
    const WrappedLine& w = wrapped_[static_cast<size_t>(wi)];
    if (w.line != cached_line) {
      cached_line = w.line;
      chars = utf8::decode(buf.line(w.line));
      line_start = buf.line_to_char(static_cast<size_t>(w.line));
    }
    if (gutter > 0 && w.start_col == 0) {
      std::string num = std::to_string(w.line + 1);
      int pad = gutter - 1 - static_cast<int>(num.size());
      put_text(i, std::max(0, pad), num, Color::DarkGrey, Color::Default, gutter - 1);
    }
    int x = 0;
    for (int c = w.start_col; c < w.end_col; ++c) {
      char32_t ch = chars[static_cast<size_t>(c)];
      int nx = advance_column(ch, x, view.tab_width);
      size_t idx = line_start + static_cast<size_t>(c);
      Style st;
      if (view.selection && idx >= view.selection->first && idx < view.selection->second) st = Style::Selection;
      else st = hl.get_style(buf, w.line, c);
      auto [fg, bg] = style_colors(st);
      for (int col = x; col < nx; ++col) put(i, gutter + col, ch == U'\t' ? U' ' : ch, fg, bg);
      x = nx;
    }
    /* a selected line terminator shows as one highlighted cell */
    size_t term_idx = line_start + chars.size();
    if (w.end_col == static_cast<int>(chars.size()) && view.selection &&
        term_idx >= view.selection->first && term_idx < view.selection->second) {
      auto [fg, bg] = style_colors(Style::Selection);
      put(i, gutter + x, U' ', fg, bg);
    }
  }
}

void Renderer::draw_status(const RenderView& view) {
  int status_row = rows_ - 2;
  int request_row = rows_ - 1;
  if (status_row >= 0) {
    fill_row(status_row, 0, cols_, Color::Black, Color::Grey);
    std::string right = std::to_string(view.cur.row + 1) + ":" + std::to_string(view.cur.col + 1);
    int right_col = std::max(0, cols_ - static_cast<int>(right.size()) - 1);
    put_text(status_row, 0, status_text(view), Color::Black, Color::Grey, std::max(0, right_col - 1));
    put_text(status_row, right_col, right, Color::Black, Color::Grey, cols_);
  }
  if (request_row >= 0) {
    Color fg = view.request.status == RequestStatus::Error ? Color::Red
             : view.request.status == RequestStatus::Processing ? Color::Yellow
             : Color::Default;
    put_text(request_row, 0, request_status_text(view.request), fg, Color::Default, cols_);
  }
}

void Renderer::draw_box(int top, int left, int height, int width, const std::string& title) {
  for (int r = 0; r < height; ++r) {
    for (int c = 0; c < width; ++c) {
      char32_t ch = U' ';
      bool t = r == 0, b = r == height - 1, l = c == 0, rt = c == width - 1;
      if (t && l) ch = U'┌';
      else if (t && rt) ch = U'┐';
      else if (b && l) ch = U'└';
      else if (b && rt) ch = U'┘';
      else if (t || b) ch = U'─';
      else if (l || rt) ch = U'│';
      put(top + r, left + c, ch, Color::Default, Color::Default);
    }
  }
  if (!title.empty()) put_text(top, left + 2, " " + title + " ", Color::Cyan, Color::Default, left + width - 1);
}

void Renderer::draw_help_popup(MenuState menu) {
  const auto& entries = menu_entries(menu);
  if (entries.empty()) return;
  std::vector<std::string> lines;
  int width = static_cast<int>(std::string(menu_title(menu)).size()) + 6;
  for (const auto& e : entries) {
    std::string s = utf8::encode(static_cast<char32_t>(e.key)) + "  " + e.label;
    width = std::max(width, static_cast<int>(s.size()) + 4);
    lines.push_back(std::move(s));
  }
  int height = static_cast<int>(lines.size()) + 2;
  int top = std::max(0, rows_ - 2 - height);
  int left = std::max(0, cols_ - width - 1);
  draw_box(top, left, height, width, menu_title(menu));
  for (size_t i = 0; i < lines.size(); ++i) {
    put_text(top + 1 + static_cast<int>(i), left + 2, lines[i], Color::Default, Color::Default, left + width - 1);
  }
}

void Renderer::draw_file_picker(const RenderView& view) {
  if (!view.picker) return;
  const auto& entries = view.picker->entries();
  int longest = 0;
  for (const auto& e : entries) longest = std::max(longest, static_cast<int>(utf8::length(e)));
  int width = std::min(std::max(2, cols_ - 2), std::max(40, longest + 4));
  int height = std::min(std::max(3, rows_ - 4), static_cast<int>(entries.size()) + 2);
  int top = std::max(0, (rows_ - 2 - height) / 2);
  int left = std::max(0, (cols_ - width) / 2);
  std::string title = std::string(menu_title(MenuState::FilePickerLoad));
  if (!view.picker_dir.empty()) title += ": " + view.picker_dir;
  draw_box(top, left, height, width, title);
  int visible = height - 2;
  int first = std::max(0, view.picker->index() - visible + 1);
  for (int i = 0; i < visible && first + i < static_cast<int>(entries.size()); ++i) {
    int idx = first + i;
    bool sel = idx == view.picker->index();
    Color fg = sel ? Color::Black : Color::Default;
    Color bg = sel ? Color::White : Color::Default;
    int row = top + 1 + i;
    if (sel) fill_row(row, left + 1, left + width - 1, fg, bg);
    put_text(row, left + 2, entries[static_cast<size_t>(idx)], fg, bg, left + width - 1);
  }
}

void Renderer::draw_save_as(const RenderView& view, int& cursor_row, int& cursor_col) {
  if (!view.picker) return;
  int width = std::min(40, std::max(10, cols_ - 2));
  int height = 4;
  int top = std::max(0, (rows_ - 2 - height) / 2);
  int left = std::max(0, (cols_ - width) / 2);
  draw_box(top, left, height, width, menu_title(MenuState::FilePickerSave));
  int inner = width - 4;
  std::u32string input = utf8::decode(view.picker->input());
  int first = std::max(0, view.picker->cursor() - inner + 1);
  std::string shown = utf8::encode(std::u32string_view(input).substr(static_cast<size_t>(std::min<int>(first, static_cast<int>(input.size())))));
  put_text(top + 1, left + 2, shown, Color::Default, Color::Default, left + 2 + inner);
  put_text(top + 2, left + 2, "Enter: Save | Esc: Cancel", Color::DarkGrey, Color::Default, left + width - 1);
  cursor_row = top + 1;
  cursor_col = left + 2 + view.picker->cursor() - first;
}

void Renderer::flush(ITerminal& term) {
  last_runs_ = 0;
  if (force_) {
    term.clear();
    for (auto& c : prev_) c = Cell{U'\0', Color::Default, Color::Default};
    force_ = false;
  }
  for (int r = 0; r < rows_; ++r) {
    size_t base = static_cast<size_t>(r) * static_cast<size_t>(cols_);
    int c = 0;
    while (c < cols_) {
      const Cell& cell = cur_[base + static_cast<size_t>(c)];
      if (cell == prev_[base + static_cast<size_t>(c)]) { c++; continue; }
      int start = c;
      std::u32string run;
      while (c < cols_) {
        const Cell& n = cur_[base + static_cast<size_t>(c)];
        if (n == prev_[base + static_cast<size_t>(c)] || n.fg != cell.fg || n.bg != cell.bg) break;
        run.push_back(n.ch);
        c++;
      }
      term.draw_styled(r, start, utf8::encode(run), cell.fg, cell.bg);
      last_runs_++;
    }
  }
  std::swap(prev_, cur_);
}

void Renderer::render(ITerminal& term, const RenderView& view, SyntaxHighlighter& hl) {
  TermSize sz = term.getSize();
  if (sz.rows != rows_ || sz.cols != cols_) resize(sz.rows, sz.cols);
  if (rows_ <= 0 || cols_ <= 0 || !view.buf) return;
  for (auto& c : cur_) c = Cell{};

  const TextBuffer& buf = *view.buf;
  int gutter = view.show_line_numbers ? digits_of(buf.line_count()) + 1 : 0;
  int text_width = std::max(1, cols_ - gutter);
  wrapped_ = compute_wrapped_lines(buf, text_width, view.tab_width);
  int cursor_row = wrapped_row_of(wrapped_, view.cur);
  scroll_ = clamp_scroll(scroll_, cursor_row, static_cast<int>(wrapped_.size()), text_height());

  hl.sync(buf);
  draw_text_area(view, hl, gutter);
  draw_status(view);

  int screen_row = cursor_row - scroll_;
  int screen_col = gutter;
  if (!wrapped_.empty()) {
    const WrappedLine& w = wrapped_[static_cast<size_t>(cursor_row)];
    std::u32string chars = utf8::decode(buf.line(w.line));
    int x = 0;
    for (int c = w.start_col; c < view.cur.col && c < static_cast<int>(chars.size()); ++c) {
      x = advance_column(chars[static_cast<size_t>(c)], x, view.tab_width);
    }
    screen_col = std::min(gutter + x, cols_ - 1);
  }

  if (view.menu == MenuState::GoTo || view.menu == MenuState::File || view.menu == MenuState::AI) {
    draw_help_popup(view.menu);
  } else if (view.menu == MenuState::FilePickerLoad) {
    draw_file_picker(view);
  } else if (view.menu == MenuState::FilePickerSave) {
    draw_save_as(view, screen_row, screen_col);
  }

  flush(term);
  term.move_cursor(std::clamp(screen_row, 0, std::max(0, rows_ - 1)), std::clamp(screen_col, 0, std::max(0, cols_ - 1)));
  term.refresh();
}
