#pragma once
#include <string>
#include <vector>
#include <memory>
#include <string_view>
#include <span>
#include <future>
#include "i_text_buffer_core.hpp"

/*
 * RopeTextBufferCore
 *
 * AVL tree whose leaves hold runs of lines. Every node aggregates line and
 * character counts, so row lookups and offset<->row conversion are O(log n).
 * Internal nodes always have two children; only leaves carry lines.
 */
class RopeTextBufferCore : public TextBufferCoreCRTP<RopeTextBufferCore> {
public:
  static constexpr std::string_view get_name_sv() { return "rope"; }
  void init_from_lines(const std::vector<std::string>& lines);
  int line_count() const;
  std::string get_line(int r) const;
  size_t char_count() const;
  size_t weight_before(size_t row) const;
  std::pair<size_t, size_t> locate(size_t idx) const;

  void insert_line(size_t row, std::string_view s);
  void insert_lines(size_t row, std::span<const std::string> ss);
  void erase_line(size_t row);
  void erase_lines(size_t start_row, size_t end_row); // end_row exclusive
  void replace_line(size_t row, std::string_view s);

  /*forward to CRTP impl*/
  void do_init_from_lines(const std::vector<std::string>& lines) { init_from_lines(lines); }
  int do_line_count() const { return line_count(); }
  std::string do_get_line(int r) const { return get_line(r); }
  size_t do_char_count() const { return char_count(); }
  size_t do_weight_before(size_t row) const { return weight_before(row); }
  std::pair<size_t, size_t> do_locate(size_t idx) const { return locate(idx); }
  void do_insert_line(size_t row, std::string_view s) { insert_line(row, s); }
  void do_insert_lines(size_t row, std::span<const std::string> ss) { insert_lines(row, ss); }
  void do_erase_line(size_t row) { erase_line(row); }
  void do_erase_lines(size_t start_row, size_t end_row) { erase_lines(start_row, end_row); }
  void do_replace_line(size_t row, std::string_view s) { replace_line(row, s); }

  int height() const { return node_height(root_.get()); }

private:
  struct Node {
    std::unique_ptr<Node> left;
    std::unique_ptr<Node> right;
    std::vector<std::string> lines; /* non-empty only for leaves */
    size_t lines_count = 0;         /* aggregated number of lines */
    size_t chars_count = 0;         /* aggregated characters, terminators excluded */
    int height = 1;                 /* AVL height */
  };
  std::unique_ptr<Node> root_;

  static bool is_leaf(const Node* n) { return !n->left && !n->right; }
  static size_t count_lines(const Node* n) { return n ? n->lines_count : 0; }
  static size_t count_chars(const Node* n) { return n ? n->chars_count : 0; }
  static size_t weight(const Node* n) { return count_lines(n) + count_chars(n); }
  static int node_height(const Node* n) { return n ? n->height : 0; }
  static int balance_factor(const Node* n) { return n ? (node_height(n->left.get()) - node_height(n->right.get())) : 0; }
  static void recalc(Node* n);
  static std::unique_ptr<Node> rotate_left(std::unique_ptr<Node> x);
  static std::unique_ptr<Node> rotate_right(std::unique_ptr<Node> y);
  static std::unique_ptr<Node> balance(std::unique_ptr<Node> n);

  static std::unique_ptr<Node> make_leaf(std::vector<std::string>&& lines);
  static std::unique_ptr<Node> make_parent(std::unique_ptr<Node> a, std::unique_ptr<Node> b);
  static std::unique_ptr<Node> concat(std::unique_ptr<Node> a, std::unique_ptr<Node> b);
  static std::pair<std::unique_ptr<Node>, std::unique_ptr<Node>> split(std::unique_ptr<Node> n, size_t k);
  static std::unique_ptr<Node> split_oversized_leaf(std::unique_ptr<Node> n);
  static std::unique_ptr<Node> insert_at(std::unique_ptr<Node> n, size_t row, std::string_view s);
  static void replace_at(Node* n, size_t row, std::string_view s);
  static std::unique_ptr<Node> build_balanced(std::span<const std::string> lines);
  static std::unique_ptr<Node> build_balanced_parallel(std::span<const std::string> lines);
};

static_assert(TextBufferCoreCRTPConcept<RopeTextBufferCore>, "Rope backend must satisfy CRTP concept");
