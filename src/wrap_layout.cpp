#include "wrap_layout.hpp"
#include <algorithm>
#include "utf8.hpp"

int advance_column(char32_t c, int x, int tab_width) {
  if (c == U'\t') return (x / tab_width + 1) * tab_width;
  return x + 1;
}

std::vector<WrappedLine> compute_wrapped_lines(const TextBuffer& buf, int width, int tab_width) {
  std::vector<WrappedLine> rows;
  width = std::max(1, width);
  tab_width = std::max(1, tab_width);
  int n = buf.line_count();
  rows.reserve(static_cast<size_t>(n));
  for (int l = 0; l < n; ++l) {
    std::u32string chars = utf8::decode(buf.line(l));
    int len = static_cast<int>(chars.size());
    int start = 0;
    int x = 0;
    for (int c = 0; c < len; ++c) {
      int nx = advance_column(chars[static_cast<size_t>(c)], x, tab_width);
      if (nx > width && c > start) {
        rows.push_back(WrappedLine{l, start, c});
        start = c;
        x = 0;
        nx = advance_column(chars[static_cast<size_t>(c)], x, tab_width);
      }
      x = nx;
    }
    rows.push_back(WrappedLine{l, start, len});
  }
  return rows;
}

int wrapped_row_of(const std::vector<WrappedLine>& rows, const Cursor& cur) {
  auto it = std::lower_bound(rows.begin(), rows.end(), cur.row,
                             [](const WrappedLine& w, int line){ return w.line < line; });
  if (it == rows.end()) return rows.empty() ? 0 : static_cast<int>(rows.size()) - 1;
  int idx = static_cast<int>(it - rows.begin());
  while (idx + 1 < static_cast<int>(rows.size()) && rows[static_cast<size_t>(idx) + 1].line == cur.row &&
         rows[static_cast<size_t>(idx) + 1].start_col <= cur.col) {
    idx++;
  }
  return idx;
}

int clamp_scroll(int scroll, int cursor_row, int total_rows, int height) {
  height = std::max(1, height);
  if (cursor_row < scroll) scroll = cursor_row;
  if (cursor_row >= scroll + height) scroll = cursor_row - height + 1;
  scroll = std::min(scroll, std::max(0, total_rows - height));
  return std::max(0, scroll);
}
