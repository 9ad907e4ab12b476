#pragma once
/*
 * Syntax
 *
 * Purpose: parser seam for highlighting. A SyntaxParser turns source text into
 *          byte-ranged captures named like "keyword" or "function.macro";
 *          CaptureStyleMap folds capture names into the closed Style enum.
 * TreeSitterParser: the only parser; grammars and their highlights queries
 *          are compiled in (see highlight_queries.hpp).
 * LanguageRegistry: resolves file extensions and fence tags to parsers.
 */
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>
#include "types.hpp"

class TextBuffer;

struct Capture {
  size_t start_byte = 0;
  size_t end_byte = 0;
  std::string name;
};

class SyntaxParser {
public:
  virtual ~SyntaxParser() = default;
  virtual const std::string& language() const = 0;
  virtual std::vector<Capture> parse(std::string_view source) const = 0;
};

struct TSLanguage;
struct TSQuery;

/*
 * TreeSitterParser: a tree-sitter grammar plus its highlights query. parse()
 * runs a fresh TSParser over the source and returns the query's captures in
 * document order; when several patterns capture the same node the earliest
 * pattern in the query wins.
 */
class TreeSitterParser : public SyntaxParser {
public:
  /* nullptr with msg set when the grammar is ABI-incompatible or the query does not compile */
  static std::unique_ptr<TreeSitterParser> create(std::string name, const TSLanguage* grammar,
                                                  std::string_view query_source, std::string& msg);
  ~TreeSitterParser() override;
  TreeSitterParser(const TreeSitterParser&) = delete;
  TreeSitterParser& operator=(const TreeSitterParser&) = delete;

  const std::string& language() const override { return name_; }
  std::vector<Capture> parse(std::string_view source) const override;

private:
  TreeSitterParser(std::string name, const TSLanguage* grammar, TSQuery* query);
  std::string name_;
  const TSLanguage* grammar_;
  TSQuery* query_;
};

bool style_from_name(const std::string& name, Style& out);
const char* style_name(Style s);

class CaptureStyleMap {
public:
  static CaptureStyleMap with_defaults();
  void set(const std::string& capture, Style style) { map_[capture] = style; }
  /* exact name first, then dotted prefixes ("variable.field" -> "variable"); unknown -> Normal */
  Style lookup(std::string_view capture) const;
  size_t size() const { return map_.size(); }
private:
  std::unordered_map<std::string, Style> map_;
};

class LanguageRegistry {
public:
  /* languages whose query fails to compile are skipped and reported in problems */
  static LanguageRegistry with_builtin_languages(std::vector<std::string>* problems = nullptr);
  void register_parser(std::unique_ptr<SyntaxParser> parser,
                       const std::vector<std::string>& extensions,
                       const std::vector<std::string>& fence_tags);
  const SyntaxParser* for_extension(std::string_view ext) const;
  const SyntaxParser* for_fence_tag(std::string_view tag) const;
  size_t size() const { return parsers_.size(); }
private:
  std::vector<std::unique_ptr<SyntaxParser>> parsers_;
  std::unordered_map<std::string, size_t> by_ext_;
  std::unordered_map<std::string, size_t> by_tag_;
};

/*
 * FenceRegion: a ``` block in a composite document. Content lines are
 * (open_line, close_line); close_line == line_count when the fence is unclosed.
 */
struct FenceRegion {
  int open_line = 0;
  int close_line = 0;
  std::string tag;
};

/* a line that opens or closes a fence: optional indentation then ``` */
bool is_fence_line(std::string_view line, std::string* tag = nullptr);
std::vector<FenceRegion> scan_fences(const TextBuffer& buf);
