#include "text_buffer.hpp"
#include <algorithm>
#include "utf8.hpp"

static std::vector<std::string> split_lines(std::string_view text) {
  std::vector<std::string> out;
  size_t start = 0;
  for (size_t i = 0; i < text.size(); ++i) {
    if (text[i] == '\n') {
      size_t end = i;
      if (end > start && text[end - 1] == '\r') end--;
      out.emplace_back(text.substr(start, end - start));
      start = i + 1;
    }
  }
  out.emplace_back(text.substr(start));
  return out;
}

TextBuffer::TextBuffer() { ensure_not_empty(); }

TextBuffer TextBuffer::from_string(std::string_view text) {
  TextBuffer b;
  b.set_text(text);
  return b;
}

std::string_view TextBuffer::backend_name() const { return core.get_name(); }

int TextBuffer::line_count() const { return core.line_count(); }
std::string TextBuffer::line(int r) const { return core.get_line(r); }
int TextBuffer::line_len(int r) const {
  if (r < 0 || r >= line_count()) return 0;
  return static_cast<int>(utf8::length(core.get_line(r)));
}

size_t TextBuffer::len_lines() const { return static_cast<size_t>(line_count()); }

size_t TextBuffer::len_chars() const {
  size_t lines = len_lines();
  return core.char_count() + (lines > 0 ? lines - 1 : 0);
}

size_t TextBuffer::line_to_char(size_t line) const {
  if (line >= len_lines()) return len_chars();
  return core.weight_before(line);
}

size_t TextBuffer::char_to_line(size_t idx) const {
  return core.locate(std::min(idx, len_chars())).first;
}

size_t TextBuffer::char_idx_from_position(const Cursor& pos) const {
  int row = std::clamp(pos.row, 0, line_count() - 1);
  int col = std::clamp(pos.col, 0, line_len(row));
  return line_to_char(static_cast<size_t>(row)) + static_cast<size_t>(col);
}

Cursor TextBuffer::position_from_char_idx(size_t idx) const {
  auto [row, col] = core.locate(std::min(idx, len_chars()));
  return Cursor{static_cast<int>(row), static_cast<int>(col)};
}

Cursor TextBuffer::end_position() const {
  int last = line_count() - 1;
  return Cursor{last, line_len(last)};
}

void TextBuffer::insert_char(size_t idx, char32_t c) {
  insert_str(idx, utf8::encode(c));
}

void TextBuffer::insert_str(size_t idx, std::string_view s) {
  if (s.empty()) return;
  Cursor pos = position_from_char_idx(idx);
  std::string cur = line(pos.row);
  size_t at = utf8::byte_offset(cur, static_cast<size_t>(pos.col));
  std::string head = cur.substr(0, at);
  std::string tail = cur.substr(at);
  std::vector<std::string> pieces = split_lines(s);
  pieces.front().insert(0, head);
  pieces.back().append(tail);
  core.replace_line(static_cast<size_t>(pos.row), pieces.front());
  if (pieces.size() > 1) {
    core.insert_lines(static_cast<size_t>(pos.row) + 1,
                      std::span<const std::string>(pieces.data() + 1, pieces.size() - 1));
  }
}

void TextBuffer::remove(size_t start, size_t end) {
  size_t total = len_chars();
  end = std::min(end, total);
  if (start >= end) return;
  Cursor a = position_from_char_idx(start);
  Cursor b = position_from_char_idx(end);
  std::string first = line(a.row);
  std::string merged = first.substr(0, utf8::byte_offset(first, static_cast<size_t>(a.col)));
  if (a.row == b.row) {
    merged += first.substr(utf8::byte_offset(first, static_cast<size_t>(b.col)));
  } else {
    std::string last = line(b.row);
    merged += last.substr(utf8::byte_offset(last, static_cast<size_t>(b.col)));
    core.erase_lines(static_cast<size_t>(a.row) + 1, static_cast<size_t>(b.row) + 1);
  }
  core.replace_line(static_cast<size_t>(a.row), merged);
  ensure_not_empty();
}

std::string TextBuffer::slice(size_t start, size_t end) const {
  end = std::min(end, len_chars());
  if (start >= end) return std::string();
  Cursor a = position_from_char_idx(start);
  Cursor b = position_from_char_idx(end);
  std::string out;
  for (int r = a.row; r <= b.row; ++r) {
    std::string s = line(r);
    size_t from = (r == a.row) ? utf8::byte_offset(s, static_cast<size_t>(a.col)) : 0;
    size_t to = (r == b.row) ? utf8::byte_offset(s, static_cast<size_t>(b.col)) : s.size();
    out.append(s, from, to - from);
    if (r != b.row) out.push_back('\n');
  }
  return out;
}

std::string TextBuffer::to_string() const {
  std::string out;
  int n = line_count();
  for (int i = 0; i < n; ++i) {
    out += line(i);
    if (i + 1 < n) out.push_back('\n');
  }
  return out;
}

void TextBuffer::ensure_not_empty() {
  if (line_count() == 0) core.insert_line(static_cast<size_t>(0), std::string_view());
}

void TextBuffer::init_from_lines(const std::vector<std::string>& src) {
  core.init_from_lines(src);
  ensure_not_empty();
}

void TextBuffer::set_text(std::string_view text) {
  init_from_lines(split_lines(text));
}
