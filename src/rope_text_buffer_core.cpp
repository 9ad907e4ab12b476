#include "rope_text_buffer_core.hpp"
#include <algorithm>
#include "config.hpp"
#include "utf8.hpp"

static constexpr size_t LEAF_MAX_LINES = SCRIBE_ROPE_LEAF_LINES;

void RopeTextBufferCore::recalc(Node* n) {
  if (!n) return;
  if (is_leaf(n)) {
    size_t chars = 0;
    for (const auto& s : n->lines) chars += utf8::length(s);
    n->lines_count = n->lines.size();
    n->chars_count = chars;
    n->height = 1;
    return;
  }
  n->lines_count = count_lines(n->left.get()) + count_lines(n->right.get());
  n->chars_count = count_chars(n->left.get()) + count_chars(n->right.get());
  n->height = 1 + std::max(node_height(n->left.get()), node_height(n->right.get()));
}

std::unique_ptr<RopeTextBufferCore::Node> RopeTextBufferCore::rotate_left(std::unique_ptr<Node> x) {
  auto y = std::move(x->right);
  auto T2 = std::move(y->left);
  y->left = std::move(x);
  y->left->right = std::move(T2);
  recalc(y->left.get());
  recalc(y.get());
  return y;
}

std::unique_ptr<RopeTextBufferCore::Node> RopeTextBufferCore::rotate_right(std::unique_ptr<Node> y) {
  auto x = std::move(y->left);
  auto T2 = std::move(x->right);
  x->right = std::move(y);
  x->right->left = std::move(T2);
  recalc(x->right.get());
  recalc(x.get());
  return x;
}

std::unique_ptr<RopeTextBufferCore::Node> RopeTextBufferCore::balance(std::unique_ptr<Node> n) {
  if (!n || is_leaf(n.get())) return n;
  recalc(n.get());
  int bf = balance_factor(n.get());
  if (bf > 1) { // left heavy
    if (balance_factor(n->left.get()) < 0) {
      n->left = rotate_left(std::move(n->left));
    }
    return rotate_right(std::move(n));
  } else if (bf < -1) { // right heavy
    if (balance_factor(n->right.get()) > 0) {
      n->right = rotate_right(std::move(n->right));
    }
    return rotate_left(std::move(n));
  }
  return n;
}

std::unique_ptr<RopeTextBufferCore::Node> RopeTextBufferCore::make_leaf(std::vector<std::string>&& lines) {
  if (lines.empty()) return nullptr;
  auto n = std::make_unique<Node>();
  n->lines = std::move(lines);
  recalc(n.get());
  return n;
}

std::unique_ptr<RopeTextBufferCore::Node> RopeTextBufferCore::make_parent(std::unique_ptr<Node> a, std::unique_ptr<Node> b) {
  auto p = std::make_unique<Node>();
  p->left = std::move(a);
  p->right = std::move(b);
  recalc(p.get());
  return p;
}

/* AVL join: descend the taller side until heights are within one. */
std::unique_ptr<RopeTextBufferCore::Node> RopeTextBufferCore::concat(std::unique_ptr<Node> a, std::unique_ptr<Node> b) {
  if (!a) return b;
  if (!b) return a;
  if (is_leaf(a.get()) && is_leaf(b.get()) && a->lines.size() + b->lines.size() <= LEAF_MAX_LINES) {
    for (auto& s : b->lines) a->lines.push_back(std::move(s));
    recalc(a.get());
    return a;
  }
  int ha = node_height(a.get());
  int hb = node_height(b.get());
  if (ha > hb + 1) {
    a->right = concat(std::move(a->right), std::move(b));
    return balance(std::move(a));
  }
  if (hb > ha + 1) {
    b->left = concat(std::move(a), std::move(b->left));
    return balance(std::move(b));
  }
  return make_parent(std::move(a), std::move(b));
}

std::pair<std::unique_ptr<RopeTextBufferCore::Node>, std::unique_ptr<RopeTextBufferCore::Node>>
RopeTextBufferCore::split(std::unique_ptr<Node> n, size_t k) {
  if (!n) return {nullptr, nullptr};
  if (k == 0) return {nullptr, std::move(n)};
  if (k >= n->lines_count) return {std::move(n), nullptr};
  if (is_leaf(n.get())) {
    std::vector<std::string> left_lines;
    std::vector<std::string> right_lines;
    left_lines.reserve(k);
    right_lines.reserve(n->lines.size() - k);
    for (size_t i = 0; i < n->lines.size(); ++i) {
      if (i < k) left_lines.push_back(std::move(n->lines[i])); else right_lines.push_back(std::move(n->lines[i]));
    }
    return {make_leaf(std::move(left_lines)), make_leaf(std::move(right_lines))};
  }
  auto left = std::move(n->left);
  auto right = std::move(n->right);
  size_t left_count = count_lines(left.get());
  if (k <= left_count) {
    auto [a, b] = split(std::move(left), k);
    return {std::move(a), concat(std::move(b), std::move(right))};
  }
  auto [a, b] = split(std::move(right), k - left_count);
  return {concat(std::move(left), std::move(a)), std::move(b)};
}

std::unique_ptr<RopeTextBufferCore::Node> RopeTextBufferCore::split_oversized_leaf(std::unique_ptr<Node> n) {
  if (!n || !is_leaf(n.get()) || n->lines.size() <= LEAF_MAX_LINES) return n;
  size_t mid = n->lines.size() / 2;
  std::vector<std::string> right_lines(std::make_move_iterator(n->lines.begin() + static_cast<std::ptrdiff_t>(mid)),
                                       std::make_move_iterator(n->lines.end()));
  n->lines.resize(mid);
  recalc(n.get());
  return make_parent(std::move(n), make_leaf(std::move(right_lines)));
}

std::unique_ptr<RopeTextBufferCore::Node> RopeTextBufferCore::insert_at(std::unique_ptr<Node> n, size_t row, std::string_view s) {
  if (!n) return make_leaf(std::vector<std::string>{std::string(s)});
  if (is_leaf(n.get())) {
    row = std::min(row, n->lines.size());
    n->lines.insert(n->lines.begin() + static_cast<std::ptrdiff_t>(row), std::string(s));
    recalc(n.get());
    return split_oversized_leaf(std::move(n));
  }
  size_t left_count = count_lines(n->left.get());
  if (row <= left_count) n->left = insert_at(std::move(n->left), row, s);
  else n->right = insert_at(std::move(n->right), row - left_count, s);
  return balance(std::move(n));
}

void RopeTextBufferCore::replace_at(Node* n, size_t row, std::string_view s) {
  if (is_leaf(n)) {
    n->lines[row] = std::string(s);
    recalc(n);
    return;
  }
  size_t left_count = count_lines(n->left.get());
  if (row < left_count) replace_at(n->left.get(), row, s);
  else replace_at(n->right.get(), row - left_count, s);
  recalc(n);
}

std::unique_ptr<RopeTextBufferCore::Node>
RopeTextBufferCore::build_balanced(std::span<const std::string> lines) {
  size_t len = lines.size();
  if (len == 0) return nullptr;
  if (len <= LEAF_MAX_LINES) {
    return make_leaf(std::vector<std::string>(lines.begin(), lines.end()));
  }
  size_t mid = len / 2;
  auto left = build_balanced(lines.subspan(0, mid));
  auto right = build_balanced(lines.subspan(mid));
  return concat(std::move(left), std::move(right));
}

std::unique_ptr<RopeTextBufferCore::Node>
RopeTextBufferCore::build_balanced_parallel(std::span<const std::string> lines) {
  size_t len = lines.size();
  if (len <= 4096) return build_balanced(lines);
  size_t mid = len / 2;
  auto fut_left = std::async(std::launch::async, [&]{ return build_balanced(lines.subspan(0, mid)); });
  auto right = build_balanced(lines.subspan(mid));
  auto left = fut_left.get();
  return concat(std::move(left), std::move(right));
}

void RopeTextBufferCore::init_from_lines(const std::vector<std::string>& lines) {
  root_ = build_balanced_parallel(std::span<const std::string>(lines.data(), lines.size()));
}

int RopeTextBufferCore::line_count() const { return static_cast<int>(count_lines(root_.get())); }

size_t RopeTextBufferCore::char_count() const { return count_chars(root_.get()); }

std::string RopeTextBufferCore::get_line(int r) const {
  if (r < 0) return std::string();
  size_t idx = static_cast<size_t>(r);
  const Node* cur = root_.get();
  if (idx >= count_lines(cur)) return std::string();
  while (cur && !is_leaf(cur)) {
    size_t lc = count_lines(cur->left.get());
    if (idx < lc) { cur = cur->left.get(); }
    else { idx -= lc; cur = cur->right.get(); }
  }
  return cur ? cur->lines[idx] : std::string();
}

size_t RopeTextBufferCore::weight_before(size_t row) const {
  size_t acc = 0;
  const Node* cur = root_.get();
  if (row >= count_lines(cur)) return weight(cur);
  while (cur && !is_leaf(cur)) {
    size_t lc = count_lines(cur->left.get());
    if (row < lc) { cur = cur->left.get(); }
    else { acc += weight(cur->left.get()); row -= lc; cur = cur->right.get(); }
  }
  if (!cur) return acc;
  for (size_t i = 0; i < row; ++i) acc += utf8::length(cur->lines[i]) + 1;
  return acc;
}

std::pair<size_t, size_t> RopeTextBufferCore::locate(size_t idx) const {
  const Node* cur = root_.get();
  size_t total_lines = count_lines(cur);
  if (total_lines == 0) return {0, 0};
  if (idx >= weight(cur)) {
    size_t last = total_lines - 1;
    return {last, utf8::length(get_line(static_cast<int>(last)))};
  }
  size_t row = 0;
  while (cur && !is_leaf(cur)) {
    size_t lw = weight(cur->left.get());
    if (idx < lw) { cur = cur->left.get(); }
    else { idx -= lw; row += count_lines(cur->left.get()); cur = cur->right.get(); }
  }
  for (const auto& s : cur->lines) {
    size_t w = utf8::length(s) + 1;
    if (idx < w) return {row, idx};
    idx -= w;
    ++row;
  }
  return {row, 0};
}

void RopeTextBufferCore::insert_line(size_t row, std::string_view s) {
  size_t L = count_lines(root_.get()); if (row > L) row = L;
  root_ = insert_at(std::move(root_), row, s);
}

void RopeTextBufferCore::insert_lines(size_t row, std::span<const std::string> ss) {
  if (ss.empty()) return;
  if (ss.size() == 1) { insert_line(row, ss.front()); return; }
  size_t L = count_lines(root_.get()); if (row > L) row = L;
  auto [A, B] = split(std::move(root_), row);
  auto M = (ss.size() >= 4096) ? build_balanced_parallel(ss) : build_balanced(ss);
  root_ = concat(concat(std::move(A), std::move(M)), std::move(B));
}

void RopeTextBufferCore::erase_line(size_t row) { erase_lines(row, row + 1); }

void RopeTextBufferCore::erase_lines(size_t start_row, size_t end_row) {
  size_t L = count_lines(root_.get());
  if (end_row < start_row) end_row = start_row;
  if (start_row >= L) return;
  if (end_row > L) end_row = L;
  auto [A, B] = split(std::move(root_), start_row);
  auto [M, C] = split(std::move(B), end_row - start_row);
  root_ = concat(std::move(A), std::move(C));
}

void RopeTextBufferCore::replace_line(size_t row, std::string_view s) {
  size_t L = count_lines(root_.get()); if (row >= L) return;
  replace_at(root_.get(), row, s);
}
