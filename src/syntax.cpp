#include "syntax.hpp"
#include <tree_sitter/api.h>
#include <algorithm>
#include <cctype>
#include <set>
#include <utility>
#include "highlight_queries.hpp"
#include "text_buffer.hpp"

extern "C" const TSLanguage* tree_sitter_cpp();
extern "C" const TSLanguage* tree_sitter_rust();
extern "C" const TSLanguage* tree_sitter_python();
extern "C" const TSLanguage* tree_sitter_bash();

static std::string to_lower(std::string s) {
  for (char& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return s;
}

struct ParserDeleter { void operator()(TSParser* p) const { ts_parser_delete(p); } };
struct TreeDeleter { void operator()(TSTree* t) const { ts_tree_delete(t); } };
struct CursorDeleter { void operator()(TSQueryCursor* c) const { ts_query_cursor_delete(c); } };

static const char* query_error_name(TSQueryError e) {
  switch (e) {
    case TSQueryErrorNone: return "none";
    case TSQueryErrorSyntax: return "syntax";
    case TSQueryErrorNodeType: return "node type";
    case TSQueryErrorField: return "field";
    case TSQueryErrorCapture: return "capture";
    case TSQueryErrorStructure: return "structure";
    case TSQueryErrorLanguage: return "language";
  }
  return "unknown";
}

TreeSitterParser::TreeSitterParser(std::string name, const TSLanguage* grammar, TSQuery* query)
  : name_(std::move(name)), grammar_(grammar), query_(query) {}

TreeSitterParser::~TreeSitterParser() {
  ts_query_delete(query_);
}

std::unique_ptr<TreeSitterParser> TreeSitterParser::create(std::string name, const TSLanguage* grammar,
                                                           std::string_view query_source, std::string& msg) {
  if (!grammar) {
    msg = name + ": grammar missing";
    return nullptr;
  }
  std::unique_ptr<TSParser, ParserDeleter> check(ts_parser_new());
  if (!ts_parser_set_language(check.get(), grammar)) {
    msg = name + ": grammar ABI not supported by this tree-sitter runtime";
    return nullptr;
  }
  uint32_t err_offset = 0;
  TSQueryError err = TSQueryErrorNone;
  TSQuery* query = ts_query_new(grammar, query_source.data(), static_cast<uint32_t>(query_source.size()),
                                &err_offset, &err);
  if (!query) {
    msg = name + ": highlights query " + query_error_name(err) + " error at offset " + std::to_string(err_offset);
    return nullptr;
  }
  return std::unique_ptr<TreeSitterParser>(new TreeSitterParser(std::move(name), grammar, query));
}

std::vector<Capture> TreeSitterParser::parse(std::string_view src) const {
  std::vector<Capture> out;
  std::unique_ptr<TSParser, ParserDeleter> parser(ts_parser_new());
  if (!ts_parser_set_language(parser.get(), grammar_)) return out;
  std::unique_ptr<TSTree, TreeDeleter> tree(
      ts_parser_parse_string(parser.get(), nullptr, src.data(), static_cast<uint32_t>(src.size())));
  if (!tree) return out;

  std::unique_ptr<TSQueryCursor, CursorDeleter> cursor(ts_query_cursor_new());
  ts_query_cursor_exec(cursor.get(), query_, ts_tree_root_node(tree.get()));

  /* nodes already styled by an earlier pattern */
  std::set<std::pair<uint32_t, uint32_t>> taken;
  TSQueryMatch match;
  uint32_t index = 0;
  while (ts_query_cursor_next_capture(cursor.get(), &match, &index)) {
    const TSQueryCapture& cap = match.captures[index];
    uint32_t b = ts_node_start_byte(cap.node);
    uint32_t e = ts_node_end_byte(cap.node);
    if (b >= e || !taken.insert({b, e}).second) continue;
    uint32_t len = 0;
    const char* name = ts_query_capture_name_for_id(query_, cap.index, &len);
    out.push_back({b, e, std::string(name, len)});
  }
  return out;
}

static const std::pair<const char*, Style> kStyleNames[] = {
  {"normal", Style::Normal},     {"keyword", Style::Keyword},   {"function", Style::Function},
  {"type", Style::Type},         {"string", Style::String},     {"number", Style::Number},
  {"comment", Style::Comment},   {"variable", Style::Variable}, {"constant", Style::Constant},
  {"operator", Style::Operator}, {"error", Style::Error},       {"selection", Style::Selection},
};

bool style_from_name(const std::string& name, Style& out) {
  std::string n = to_lower(name);
  for (const auto& [k, v] : kStyleNames) {
    if (n == k) { out = v; return true; }
  }
  return false;
}

const char* style_name(Style s) {
  for (const auto& [k, v] : kStyleNames) {
    if (v == s) return k;
  }
  return "normal";
}

CaptureStyleMap CaptureStyleMap::with_defaults() {
  CaptureStyleMap m;
  m.set("keyword", Style::Keyword);
  m.set("function", Style::Function);
  m.set("function.macro", Style::Function);
  m.set("type", Style::Type);
  m.set("string", Style::String);
  m.set("number", Style::Number);
  m.set("comment", Style::Comment);
  m.set("variable", Style::Variable);
  m.set("variable.field", Style::Variable);
  m.set("variable.builtin", Style::Variable);
  m.set("constant", Style::Constant);
  m.set("operator", Style::Operator);
  return m;
}

Style CaptureStyleMap::lookup(std::string_view capture) const {
  std::string key(capture);
  while (true) {
    auto it = map_.find(key);
    if (it != map_.end()) return it->second;
    size_t dot = key.rfind('.');
    if (dot == std::string::npos) return Style::Normal;
    key.resize(dot);
  }
}

void LanguageRegistry::register_parser(std::unique_ptr<SyntaxParser> parser,
                                       const std::vector<std::string>& extensions,
                                       const std::vector<std::string>& fence_tags) {
  size_t idx = parsers_.size();
  parsers_.push_back(std::move(parser));
  for (const auto& e : extensions) by_ext_[to_lower(e)] = idx;
  for (const auto& t : fence_tags) by_tag_[to_lower(t)] = idx;
}

const SyntaxParser* LanguageRegistry::for_extension(std::string_view ext) const {
  std::string e = to_lower(std::string(ext));
  if (!e.empty() && e[0] == '.') e.erase(0, 1);
  auto it = by_ext_.find(e);
  return it == by_ext_.end() ? nullptr : parsers_[it->second].get();
}

const SyntaxParser* LanguageRegistry::for_fence_tag(std::string_view tag) const {
  auto it = by_tag_.find(to_lower(std::string(tag)));
  return it == by_tag_.end() ? nullptr : parsers_[it->second].get();
}

LanguageRegistry LanguageRegistry::with_builtin_languages(std::vector<std::string>* problems) {
  struct Builtin {
    const char* name;
    const TSLanguage* grammar;
    const char* query;
    std::vector<std::string> extensions;
    std::vector<std::string> fence_tags;
  };
  const Builtin builtins[] = {
    {"cpp", tree_sitter_cpp(), kCppHighlightsQuery,
     {"c", "h", "cc", "cpp", "cxx", "hpp", "hxx"}, {"c", "cpp", "c++", "cxx", "cc", "h", "hpp"}},
    {"rust", tree_sitter_rust(), kRustHighlightsQuery, {"rs"}, {"rust", "rs"}},
    {"python", tree_sitter_python(), kPythonHighlightsQuery, {"py"}, {"python", "py", "python3"}},
    {"bash", tree_sitter_bash(), kBashHighlightsQuery, {"sh", "bash"}, {"bash", "sh", "shell", "zsh", "console"}},
  };

  LanguageRegistry r;
  for (const auto& b : builtins) {
    std::string msg;
    auto parser = TreeSitterParser::create(b.name, b.grammar, b.query, msg);
    if (!parser) {
      if (problems) problems->push_back(msg);
      continue;
    }
    r.register_parser(std::move(parser), b.extensions, b.fence_tags);
  }
  return r;
}

bool is_fence_line(std::string_view line, std::string* tag) {
  size_t i = 0;
  while (i < line.size() && (line[i] == ' ' || line[i] == '\t')) i++;
  if (line.substr(i, 3) != "```") return false;
  if (tag) {
    size_t b = i + 3;
    size_t e = b;
    while (e < line.size() && (std::isalnum(static_cast<unsigned char>(line[e])) || line[e] == '_' || line[e] == '+')) e++;
    *tag = std::string(line.substr(b, e - b));
  }
  return true;
}

std::vector<FenceRegion> scan_fences(const TextBuffer& buf) {
  std::vector<FenceRegion> out;
  int n = buf.line_count();
  bool open = false;
  FenceRegion cur;
  for (int r = 0; r < n; ++r) {
    std::string tag;
    if (!is_fence_line(buf.line(r), &tag)) continue;
    if (!open) {
      cur = FenceRegion{r, n, tag};
      open = true;
    } else {
      cur.close_line = r;
      out.push_back(cur);
      open = false;
    }
  }
  if (open) out.push_back(cur);
  return out;
}
