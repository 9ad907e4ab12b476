#pragma once
#include <concepts>
#include <cstddef>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

/*
 * Line storage interface. Lines never contain '\n'; a line's weight is its
 * character count plus one terminator, so offsets below count the virtual
 * terminator after every line.
 */
template <typename Derived>
class TextBufferCoreCRTP {
public:
  std::string_view get_name() const { return as_const_derived().get_name_sv(); }
  void init_from_lines(const std::vector<std::string>& lines) { as_derived().do_init_from_lines(lines); }
  int line_count() const { return as_const_derived().do_line_count(); }
  std::string get_line(int r) const { return as_const_derived().do_get_line(r); }
  size_t char_count() const { return as_const_derived().do_char_count(); }
  /* sum of (chars + 1) over lines [0, row) */
  size_t weight_before(size_t row) const { return as_const_derived().do_weight_before(row); }
  /* line containing weighted offset idx, and idx's column in it */
  std::pair<size_t, size_t> locate(size_t idx) const { return as_const_derived().do_locate(idx); }
  /*insert*/
  void insert_line(size_t row, std::string_view s) { as_derived().do_insert_line(row, s); }
  void insert_lines(size_t row, std::span<const std::string> ss) { as_derived().do_insert_lines(row, ss); }
  /*erase*/
  void erase_line(size_t row) { as_derived().do_erase_line(row); }
  void erase_lines(size_t start_row, size_t end_row) { as_derived().do_erase_lines(start_row, end_row); }
  /*replace*/
  void replace_line(size_t row, std::string_view s) { as_derived().do_replace_line(row, s); }

private:
  Derived& as_derived() { return static_cast<Derived&>(*this); }
  const Derived& as_const_derived() const { return static_cast<const Derived&>(*this); }
};

template <typename T>
concept TextBufferCoreCRTPConcept = std::derived_from<T, TextBufferCoreCRTP<T>> && requires(T t, const T ct, size_t n, std::string_view sv) {
  { ct.do_line_count() } -> std::convertible_to<int>;
  { ct.do_get_line(0) } -> std::convertible_to<std::string>;
  { ct.do_char_count() } -> std::convertible_to<size_t>;
  { ct.do_weight_before(n) } -> std::convertible_to<size_t>;
  t.do_insert_line(n, sv);
  t.do_erase_lines(n, n);
  t.do_replace_line(n, sv);
};
