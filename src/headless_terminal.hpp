#pragma once
/*
 * HeadlessTerminal
 *
 * Purpose: in-memory ITerminal for automated tests and render verification.
 * Records every styled write, keeps a cell grid of what is on "screen", and
 * feeds scripted keys to read_key.
 */
#include <deque>
#include <string>
#include <vector>
#include "iterminal.hpp"

class HeadlessTerminal : public ITerminal {
public:
  struct Write {
    int row;
    int col;
    std::string text;
    Color fg;
    Color bg;
  };
  struct Cell {
    char32_t ch = U' ';
    Color fg = Color::Default;
    Color bg = Color::Default;
  };

  HeadlessTerminal(int rows, int cols);

  TermSize getSize() const override { return {rows_, cols_}; }
  void clear() override;
  void draw_styled(int row, int col, const std::string& text, Color fg, Color bg) override;
  void move_cursor(int row, int col) override { cursor_row_ = row; cursor_col_ = col; }
  void refresh() override { refreshes_++; }
  std::optional<Key> read_key(int timeout_ms) override;

  void resize(int rows, int cols);
  void push_key(int code, bool special = false) { keys_.push_back(Key{code, special}); }
  void push_text(const std::string& utf8_text);

  const std::vector<Write>& writes() const { return writes_; }
  void clear_writes() { writes_.clear(); }
  std::string row_text(int row) const;
  const Cell& cell(int row, int col) const { return grid_[static_cast<size_t>(row)][static_cast<size_t>(col)]; }
  int cursor_row() const { return cursor_row_; }
  int cursor_col() const { return cursor_col_; }
  int refreshes() const { return refreshes_; }
  bool keys_pending() const { return !keys_.empty(); }

private:
  int rows_;
  int cols_;
  std::vector<std::vector<Cell>> grid_;
  std::vector<Write> writes_;
  std::deque<Key> keys_;
  int cursor_row_ = 0;
  int cursor_col_ = 0;
  int refreshes_ = 0;
};
