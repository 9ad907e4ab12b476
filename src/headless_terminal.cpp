#include "headless_terminal.hpp"
#include "utf8.hpp"

HeadlessTerminal::HeadlessTerminal(int rows, int cols) : rows_(rows), cols_(cols) {
  grid_.assign(static_cast<size_t>(rows_), std::vector<Cell>(static_cast<size_t>(cols_)));
}

void HeadlessTerminal::clear() {
  for (auto& row : grid_) row.assign(static_cast<size_t>(cols_), Cell{});
}

void HeadlessTerminal::draw_styled(int row, int col, const std::string& text, Color fg, Color bg) {
  writes_.push_back(Write{row, col, text, fg, bg});
  if (row < 0 || row >= rows_) return;
  std::u32string chars = utf8::decode(text);
  for (size_t i = 0; i < chars.size(); ++i) {
    int c = col + static_cast<int>(i);
    if (c < 0 || c >= cols_) continue;
    grid_[static_cast<size_t>(row)][static_cast<size_t>(c)] = Cell{chars[i], fg, bg};
  }
}

std::optional<Key> HeadlessTerminal::read_key(int) {
  if (keys_.empty()) return std::nullopt;
  Key k = keys_.front();
  keys_.pop_front();
  return k;
}

void HeadlessTerminal::resize(int rows, int cols) {
  rows_ = rows;
  cols_ = cols;
  grid_.assign(static_cast<size_t>(rows_), std::vector<Cell>(static_cast<size_t>(cols_)));
}

void HeadlessTerminal::push_text(const std::string& utf8_text) {
  for (char32_t c : utf8::decode(utf8_text)) keys_.push_back(Key{static_cast<int>(c), false});
}

std::string HeadlessTerminal::row_text(int row) const {
  std::u32string out;
  for (const auto& c : grid_[static_cast<size_t>(row)]) out.push_back(c.ch);
  size_t end = out.find_last_not_of(U' ');
  out.erase(end == std::u32string::npos ? 0 : end + 1);
  return utf8::encode(out);
}
