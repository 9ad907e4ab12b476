#pragma once
/*
 * HighlightCache
 *
 * Purpose: per-line style vectors plus a dirty flag per line, both indexed by
 *          line number. A line is authoritative when it is cached and not
 *          dirty; anything else must be recomputed.
 * Length guard: the owner records the document length after each notified
 *          edit; a mismatch seen by check_length means an unnotified edit
 *          happened and the whole cache is dropped.
 */
#include <cstddef>
#include <cstdint>
#include <vector>
#include "types.hpp"

class HighlightCache {
public:
  /* nullptr unless the line is authoritative */
  const std::vector<Style>* lookup(int line) const {
    if (line < 0 || static_cast<size_t>(line) >= state_.size() || state_[line] != Cached) return nullptr;
    return &styles_[line];
  }
  void store(int line, std::vector<Style> styles);
  bool is_line_cached(int line) const { return lookup(line) != nullptr; }

  void invalidate_line(int line);
  /* marks every cached line in [first, last) dirty */
  void invalidate_range(int first, int last);
  /* marks every cached line >= line dirty */
  void invalidate_from(int line) { invalidate_range(line, static_cast<int>(state_.size())); }
  void clear();

  /* returns true when total differs from the recorded length (cache cleared) */
  bool check_length(size_t total_chars);
  void record_length(size_t total_chars) { last_total_chars_ = total_chars; has_length_ = true; }

  size_t cached_count() const { return cached_ + dirty_; }
  size_t dirty_count() const { return dirty_; }

private:
  enum LineState : uint8_t { Absent, Cached, Dirty };

  std::vector<std::vector<Style>> styles_;
  std::vector<uint8_t> state_;
  size_t cached_ = 0;
  size_t dirty_ = 0;
  size_t last_total_chars_ = 0;
  bool has_length_ = false;
};
