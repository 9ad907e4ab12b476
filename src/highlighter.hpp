#pragma once
/*
 * SyntaxHighlighter
 *
 * Purpose: answers get_style(line, col) for the renderer from the
 *          HighlightCache, computing missing lines on demand.
 * Modes: a file whose extension names a registered language is parsed line by
 *        line; any other document is treated as composite and only ``` fenced
 *        regions with a registered tag are parsed (as a whole region).
 * Edits: callers report invalidate_line / invalidate_from with the buffer
 *        after the edit so the recorded length stays in step. An in-place
 *        edit inside a parsed fence dirties the whole fence, since the region
 *        is parsed as one unit.
 * Frames: sync() runs the document-length guard once per frame; lookups
 *        between syncs are plain vector reads.
 */
#include <filesystem>
#include <optional>
#include <vector>
#include "highlight_cache.hpp"
#include "syntax.hpp"
#include "text_buffer.hpp"

class SyntaxHighlighter {
public:
  SyntaxHighlighter(const LanguageRegistry& registry, CaptureStyleMap styles);

  /* picks the whole-file language from the path and drops everything cached */
  void set_document(const std::optional<std::filesystem::path>& path);
  const SyntaxParser* document_parser() const { return doc_parser_; }

  /* drops the cache when the document length moved without a notified edit */
  void sync(const TextBuffer& buf);
  Style get_style(const TextBuffer& buf, int line, int col);
  const std::vector<Style>& line_styles(const TextBuffer& buf, int line);

  void invalidate_line(const TextBuffer& buf, int line);
  void invalidate_from(const TextBuffer& buf, int line);
  void clear();

  CaptureStyleMap& styles() { return styles_; }
  const HighlightCache& cache() const { return cache_; }
  /* parser invocations so far */
  size_t parse_count() const { return parse_count_; }

private:
  void touch_fence_state(const TextBuffer& buf, int line);
  const FenceRegion* parsed_region_of(const TextBuffer& buf, int line);
  void ensure_fences(const TextBuffer& buf);
  void compute_line(const TextBuffer& buf, int line);
  void compute_region(const TextBuffer& buf, const FenceRegion& region, const SyntaxParser& parser);
  void apply_captures(const std::vector<Capture>& caps, std::string_view src, std::vector<Style>& char_styles) const;

  const LanguageRegistry& registry_;
  CaptureStyleMap styles_;
  HighlightCache cache_;
  const SyntaxParser* doc_parser_ = nullptr;
  std::vector<FenceRegion> fences_;
  std::vector<int> fence_lines_;
  bool fences_dirty_ = true;
  size_t parse_count_ = 0;
};
