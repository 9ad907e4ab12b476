#include "highlight_cache.hpp"

void HighlightCache::store(int line, std::vector<Style> styles) {
  if (line < 0) return;
  size_t i = static_cast<size_t>(line);
  if (i >= state_.size()) {
    state_.resize(i + 1, Absent);
    styles_.resize(i + 1);
  }
  if (state_[i] == Dirty) dirty_--;
  if (state_[i] != Cached) cached_++;
  state_[i] = Cached;
  styles_[i] = std::move(styles);
}

void HighlightCache::invalidate_line(int line) {
  if (line < 0 || static_cast<size_t>(line) >= state_.size() || state_[line] != Cached) return;
  state_[line] = Dirty;
  cached_--;
  dirty_++;
}

void HighlightCache::invalidate_range(int first, int last) {
  if (first < 0) first = 0;
  if (last > static_cast<int>(state_.size())) last = static_cast<int>(state_.size());
  for (int l = first; l < last; ++l) invalidate_line(l);
}

void HighlightCache::clear() {
  styles_.clear();
  state_.clear();
  cached_ = 0;
  dirty_ = 0;
}

bool HighlightCache::check_length(size_t total_chars) {
  if (has_length_ && total_chars == last_total_chars_) return false;
  bool changed = has_length_;
  clear();
  record_length(total_chars);
  return changed;
}
