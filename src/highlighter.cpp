#include "highlighter.hpp"
#include <algorithm>
#include "utf8.hpp"

/* char_at[b] = number of characters in src[0, b) */
static std::vector<size_t> char_index_table(std::string_view src) {
  std::vector<size_t> char_at(src.size() + 1, 0);
  size_t chars = 0;
  size_t i = 0;
  while (i < src.size()) {
    size_t start = i;
    utf8::decode_next(src, i);
    for (size_t b = start; b < i; ++b) char_at[b] = chars;
    chars++;
  }
  char_at[src.size()] = chars;
  return char_at;
}

SyntaxHighlighter::SyntaxHighlighter(const LanguageRegistry& registry, CaptureStyleMap styles)
  : registry_(registry), styles_(std::move(styles)) {}

void SyntaxHighlighter::set_document(const std::optional<std::filesystem::path>& path) {
  doc_parser_ = nullptr;
  if (path && path->has_extension()) doc_parser_ = registry_.for_extension(path->extension().string());
  clear();
}

void SyntaxHighlighter::sync(const TextBuffer& buf) {
  if (cache_.check_length(buf.len_chars())) fences_dirty_ = true;
}

Style SyntaxHighlighter::get_style(const TextBuffer& buf, int line, int col) {
  const std::vector<Style>& v = line_styles(buf, line);
  if (col < 0 || col >= static_cast<int>(v.size())) return Style::Normal;
  return v[static_cast<size_t>(col)];
}

const std::vector<Style>& SyntaxHighlighter::line_styles(const TextBuffer& buf, int line) {
  static const std::vector<Style> empty;
  if (line < 0 || line >= buf.line_count()) return empty;
  if (const auto* v = cache_.lookup(line)) return *v;
  compute_line(buf, line);
  const auto* v = cache_.lookup(line);
  return v ? *v : empty;
}

void SyntaxHighlighter::invalidate_line(const TextBuffer& buf, int line) {
  touch_fence_state(buf, line);
  if (const FenceRegion* f = parsed_region_of(buf, line)) cache_.invalidate_range(f->open_line + 1, f->close_line);
  else cache_.invalidate_line(line);
  cache_.record_length(buf.len_chars());
}

void SyntaxHighlighter::invalidate_from(const TextBuffer& buf, int line) {
  if (!doc_parser_) fences_dirty_ = true;
  const FenceRegion* f = parsed_region_of(buf, line);
  cache_.invalidate_from(f ? std::min(line, f->open_line + 1) : line);
  cache_.record_length(buf.len_chars());
}

void SyntaxHighlighter::clear() {
  cache_.clear();
  fences_.clear();
  fence_lines_.clear();
  fences_dirty_ = true;
}

void SyntaxHighlighter::touch_fence_state(const TextBuffer& buf, int line) {
  if (doc_parser_) return;
  bool was = std::binary_search(fence_lines_.begin(), fence_lines_.end(), line);
  bool now = line >= 0 && line < buf.line_count() && is_fence_line(buf.line(line));
  if (was || now) {
    fences_dirty_ = true;
    cache_.invalidate_from(line);
  }
}

const FenceRegion* SyntaxHighlighter::parsed_region_of(const TextBuffer& buf, int line) {
  if (doc_parser_) return nullptr;
  ensure_fences(buf);
  auto it = std::upper_bound(fences_.begin(), fences_.end(), line,
                             [](int l, const FenceRegion& f) { return l < f.open_line; });
  if (it == fences_.begin()) return nullptr;
  --it;
  if (line <= it->open_line || line >= it->close_line) return nullptr;
  return registry_.for_fence_tag(it->tag) ? &*it : nullptr;
}

void SyntaxHighlighter::ensure_fences(const TextBuffer& buf) {
  if (!fences_dirty_) return;
  fences_ = scan_fences(buf);
  fence_lines_.clear();
  for (const auto& f : fences_) {
    fence_lines_.push_back(f.open_line);
    if (f.close_line < buf.line_count()) fence_lines_.push_back(f.close_line);
  }
  fences_dirty_ = false;
}

void SyntaxHighlighter::apply_captures(const std::vector<Capture>& caps, std::string_view src,
                                       std::vector<Style>& char_styles) const {
  std::vector<size_t> char_at = char_index_table(src);
  for (const auto& cap : caps) {
    Style st = styles_.lookup(cap.name);
    size_t cs = char_at[std::min(cap.start_byte, src.size())];
    size_t ce = char_at[std::min(cap.end_byte, src.size())];
    for (size_t c = cs; c < ce && c < char_styles.size(); ++c) char_styles[c] = st;
  }
}

void SyntaxHighlighter::compute_line(const TextBuffer& buf, int line) {
  if (doc_parser_) {
    std::string text = buf.line(line);
    std::vector<Style> out(utf8::length(text), Style::Normal);
    ++parse_count_;
    apply_captures(doc_parser_->parse(text), text, out);
    cache_.store(line, std::move(out));
    return;
  }
  ensure_fences(buf);
  for (const auto& f : fences_) {
    if (line > f.open_line && line < f.close_line) {
      if (const SyntaxParser* p = registry_.for_fence_tag(f.tag)) {
        compute_region(buf, f, *p);
        return;
      }
      break;
    }
  }
  cache_.store(line, std::vector<Style>(static_cast<size_t>(buf.line_len(line)), Style::Normal));
}

void SyntaxHighlighter::compute_region(const TextBuffer& buf, const FenceRegion& region,
                                       const SyntaxParser& parser) {
  int first = region.open_line + 1;
  int last = std::min(region.close_line, buf.line_count()) - 1;
  if (last < first) return;

  std::string src;
  for (int r = first; r <= last; ++r) {
    src += buf.line(r);
    if (r < last) src.push_back('\n');
  }
  ++parse_count_;
  std::vector<Capture> caps = parser.parse(src);
  std::vector<size_t> char_at = char_index_table(src);

  /* document character offsets of each region line */
  const size_t region_start = buf.line_to_char(static_cast<size_t>(first));
  std::vector<size_t> line_start;
  std::vector<std::vector<Style>> per_line;
  size_t at = region_start;
  for (int r = first; r <= last; ++r) {
    int len = buf.line_len(r);
    line_start.push_back(at);
    per_line.emplace_back(static_cast<size_t>(len), Style::Normal);
    at += static_cast<size_t>(len) + 1;
  }

  for (const auto& cap : caps) {
    Style st = styles_.lookup(cap.name);
    if (st == Style::Normal) continue;
    size_t cs = region_start + char_at[std::min(cap.start_byte, src.size())];
    size_t ce = region_start + char_at[std::min(cap.end_byte, src.size())];
    if (cs >= ce) continue;
    size_t li = static_cast<size_t>(std::upper_bound(line_start.begin(), line_start.end(), cs) - line_start.begin()) - 1;
    for (; li < line_start.size() && line_start[li] < ce; ++li) {
      auto& v = per_line[li];
      size_t from = std::max(cs, line_start[li]) - line_start[li];
      size_t to = std::min(ce, line_start[li] + v.size()) - line_start[li];
      for (size_t c = from; c < to; ++c) v[c] = st;
    }
  }

  for (int r = first; r <= last; ++r) {
    if (cache_.is_line_cached(r)) continue;
    cache_.store(r, std::move(per_line[static_cast<size_t>(r - first)]));
  }
}
