#pragma once
/*
 * TextBuffer
 *
 * Purpose: character-addressed text store over the line rope.
 * Model: lines joined by '\n'; offsets and columns count Unicode scalar
 *        values; the buffer always holds at least one line.
 */
#include <string>
#include <string_view>
#include <vector>
#include "i_text_buffer_core.hpp"
#include "rope_text_buffer_core.hpp"
#include "types.hpp"

class TextBuffer {
public:
  TextBuffer();
  using CoreType = RopeTextBufferCore;
  static_assert(TextBufferCoreCRTPConcept<CoreType>, "Selected backend must satisfy CRTP concept");

  static TextBuffer from_string(std::string_view text);

  std::string_view backend_name() const;
  int line_count() const;
  std::string line(int r) const;
  /* characters in line r, terminator excluded */
  int line_len(int r) const;

  size_t len_chars() const;
  size_t len_lines() const;
  size_t line_to_char(size_t line) const;
  size_t char_to_line(size_t idx) const;
  size_t char_idx_from_position(const Cursor& pos) const;
  Cursor position_from_char_idx(size_t idx) const;
  Cursor end_position() const;

  void insert_char(size_t idx, char32_t c);
  void insert_str(size_t idx, std::string_view s);
  void remove(size_t start, size_t end); // [start, end)
  std::string slice(size_t start, size_t end) const;
  std::string to_string() const;

  void init_from_lines(const std::vector<std::string>& lines);
  void set_text(std::string_view text);
  void ensure_not_empty();

private:
  CoreType core;
};
