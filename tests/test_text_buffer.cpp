#include "text_buffer.hpp"
#include <cassert>
#include <string>
#include <vector>

static void test_lines_and_counts() {
  TextBuffer b;
  assert(b.line_count() == 1);
  assert(b.len_chars() == 0);
  assert(b.line(0).empty());

  b = TextBuffer::from_string("ab\n");
  assert(b.line_count() == 2);
  assert(b.line(1).empty());
  assert(b.len_chars() == 3);

  b = TextBuffer::from_string("a\r\nb\r\nc");
  assert(b.line_count() == 3);
  assert(b.line(0) == std::string("a"));
  assert(b.to_string() == std::string("a\nb\nc"));
}

static void test_char_indexing() {
  TextBuffer b = TextBuffer::from_string("héllo\nwörld\n");
  assert(b.line_len(0) == 5);
  assert(b.len_chars() == 12);
  assert(b.line_to_char(1) == 6);
  assert(b.line_to_char(2) == 12);
  assert(b.char_to_line(5) == 0);
  assert(b.char_to_line(6) == 1);
  Cursor p = b.position_from_char_idx(8);
  assert(p.row == 1 && p.col == 2);
  assert(b.char_idx_from_position(Cursor{1, 2}) == 8);
  assert(b.char_idx_from_position(Cursor{1, 99}) == 11);
  assert(b.slice(1, 4) == std::string("éll"));
  assert(b.slice(4, 8) == std::string("o\nwö"));
}

static void test_insert_remove_inverse() {
  const std::string original = "first line\nsecond\nthird";
  TextBuffer b = TextBuffer::from_string(original);
  size_t before = b.len_chars();

  b.insert_str(7, "X\nY");
  assert(b.len_chars() == before + 3);
  assert(b.line_count() == 4);
  assert(b.line(0) == std::string("first lX"));
  assert(b.line(1) == std::string("Yine"));
  b.remove(7, 10);
  assert(b.to_string() == original);

  b.insert_char(0, U'ü');
  assert(b.line(0) == std::string("üfirst line"));
  b.remove(0, 1);
  assert(b.to_string() == original);

  b.remove(10, 11);
  assert(b.line_count() == 2);
  assert(b.line(0) == std::string("first linesecond"));
  b.insert_char(10, U'\n');
  assert(b.to_string() == original);
}

static void test_remove_everything_keeps_a_line() {
  TextBuffer b = TextBuffer::from_string("x");
  b.remove(0, 1);
  assert(b.line_count() == 1);
  assert(b.len_chars() == 0);
  Cursor end = b.end_position();
  assert(end.row == 0 && end.col == 0);

  b = TextBuffer::from_string("a\nb\nc");
  b.remove(0, b.len_chars());
  assert(b.line_count() == 1);
  assert(b.to_string().empty());
}

static void test_many_lines() {
  std::vector<std::string> lines;
  for (int i = 0; i < 1000; ++i) lines.push_back("line " + std::to_string(i));
  TextBuffer b;
  b.init_from_lines(lines);
  assert(b.line_count() == 1000);
  assert(b.line(999) == std::string("line 999"));
  size_t at = b.line_to_char(500);
  assert(b.char_to_line(at) == 500);
  b.remove(b.line_to_char(100), b.line_to_char(900));
  assert(b.line_count() == 200);
  assert(b.line(100) == std::string("line 900"));
}

int main() {
  test_lines_and_counts();
  test_char_indexing();
  test_insert_remove_inverse();
  test_remove_everything_keeps_a_line();
  test_many_lines();
  return 0;
}
