#pragma once
/*
 * WrapLayout
 *
 * Purpose: soft-wrap geometry for one frame. Each WrappedLine is one screen
 *          row holding characters [start_col, end_col) of a logical line.
 * Tabs: advance to the next multiple of tab_width, measured from the start of
 *       the screen row. Every other character is one column wide.
 */
#include <vector>
#include "text_buffer.hpp"
#include "types.hpp"

struct WrappedLine {
  int line = 0;
  int start_col = 0;
  int end_col = 0;
};

/* display column reached after a character at column x */
int advance_column(char32_t c, int x, int tab_width);

std::vector<WrappedLine> compute_wrapped_lines(const TextBuffer& buf, int width, int tab_width);

/* wrapped row index containing the cursor; the cursor may sit one past a line's last char */
int wrapped_row_of(const std::vector<WrappedLine>& rows, const Cursor& cur);

/* keeps cursor_row inside [scroll, scroll + height) and scroll <= max(0, total - height) */
int clamp_scroll(int scroll, int cursor_row, int total_rows, int height);
