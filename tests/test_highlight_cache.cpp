#include "highlighter.hpp"
#include <cassert>
#include <string>
#include <vector>

static void test_cache_dirty_tracking() {
  HighlightCache c;
  assert(c.lookup(0) == nullptr);
  c.store(0, {Style::Keyword});
  c.store(1, {Style::String});
  c.store(5, {Style::Number});
  assert(c.lookup(1) && (*c.lookup(1))[0] == Style::String);

  c.invalidate_line(1);
  assert(c.lookup(1) == nullptr);
  assert(!c.is_line_cached(1));
  assert(c.is_line_cached(0));
  c.invalidate_line(3);
  assert(c.dirty_count() == 1);

  c.invalidate_range(0, 1);
  assert(c.lookup(0) == nullptr);
  c.store(0, {Style::Keyword});
  assert(c.dirty_count() == 1);

  c.invalidate_from(1);
  assert(c.lookup(5) == nullptr);
  assert(c.lookup(0) != nullptr);
  c.store(5, {Style::Comment});
  assert(c.lookup(5) && (*c.lookup(5))[0] == Style::Comment);

  assert(!c.check_length(10));
  assert(!c.check_length(10));
  assert(c.check_length(11));
  assert(c.cached_count() == 0);
  assert(c.dirty_count() == 0);
}

static TextBuffer ten_line_program() {
  std::string text;
  for (int i = 0; i < 10; ++i) text += "int v" + std::to_string(i) + " = " + std::to_string(i) + ";\n";
  text.pop_back();
  return TextBuffer::from_string(text);
}

static void test_edit_recomputes_only_the_edited_line() {
  LanguageRegistry reg = LanguageRegistry::with_builtin_languages();
  SyntaxHighlighter hl(reg, CaptureStyleMap::with_defaults());
  hl.set_document(std::filesystem::path("prog.cpp"));
  TextBuffer buf = ten_line_program();

  std::vector<std::vector<Style>> before;
  for (int l = 0; l < 10; ++l) before.push_back(hl.line_styles(buf, l));
  assert(hl.parse_count() == 10);
  assert(before[3][0] == Style::Type);
  assert(before[3][7] == Style::Operator);
  assert(before[3][9] == Style::Number);

  /* "int v3 = 3;" -> "int v3 = \"s\";" */
  size_t at = buf.line_to_char(3) + 9;
  buf.remove(at, at + 1);
  buf.insert_str(at, "\"s\"");
  hl.invalidate_line(buf, 3);

  for (int l = 0; l < 10; ++l) {
    if (l == 3) continue;
    assert(hl.line_styles(buf, l) == before[static_cast<size_t>(l)]);
  }
  assert(hl.parse_count() == 10);

  assert(hl.get_style(buf, 3, 9) == Style::String);
  assert(hl.get_style(buf, 3, 11) == Style::String);
  assert(hl.get_style(buf, 3, 12) == Style::Normal);
  assert(hl.parse_count() == 11);
  hl.get_style(buf, 3, 0);
  assert(hl.parse_count() == 11);
}

static void test_unnotified_edit_clears_cache() {
  LanguageRegistry reg = LanguageRegistry::with_builtin_languages();
  SyntaxHighlighter hl(reg, CaptureStyleMap::with_defaults());
  hl.set_document(std::filesystem::path("prog.cpp"));
  TextBuffer buf = ten_line_program();
  for (int l = 0; l < 10; ++l) hl.line_styles(buf, l);
  assert(hl.cache().cached_count() == 10);

  buf.insert_char(0, U' ');
  hl.sync(buf);
  assert(hl.cache().cached_count() == 0);
  hl.get_style(buf, 5, 0);
  assert(hl.cache().cached_count() == 1);
  assert(hl.parse_count() == 11);
}

static void test_invalidate_from_marks_the_tail() {
  LanguageRegistry reg = LanguageRegistry::with_builtin_languages();
  SyntaxHighlighter hl(reg, CaptureStyleMap::with_defaults());
  hl.set_document(std::filesystem::path("prog.cpp"));
  TextBuffer buf = ten_line_program();
  for (int l = 0; l < 10; ++l) hl.line_styles(buf, l);

  buf.insert_char(buf.line_to_char(6), U'\n');
  hl.invalidate_from(buf, 6);
  assert(hl.cache().dirty_count() == 4);
  for (int l = 0; l < 6; ++l) hl.line_styles(buf, l);
  assert(hl.parse_count() == 10);
  assert(hl.line_styles(buf, 6).empty());
  assert(hl.get_style(buf, 7, 0) == Style::Type);
}

static void test_composite_document_fences() {
  LanguageRegistry reg = LanguageRegistry::with_builtin_languages();
  SyntaxHighlighter hl(reg, CaptureStyleMap::with_defaults());
  hl.set_document(std::filesystem::path("notes.md"));
  TextBuffer buf = TextBuffer::from_string(
      "# if while\n"
      "```python\n"
      "def f():\n"
      "    \"\"\"doc\n"
      "    more\"\"\"\n"
      "```\n"
      "return 1");

  assert(hl.get_style(buf, 0, 2) == Style::Normal);
  assert(hl.get_style(buf, 2, 0) == Style::Keyword);
  size_t parses = hl.parse_count();
  assert(parses == 1);
  assert(hl.get_style(buf, 3, 4) == Style::String);
  assert(hl.get_style(buf, 4, 4) == Style::String);
  assert(hl.get_style(buf, 4, 0) == Style::String);
  assert(hl.parse_count() == parses);
  assert(hl.get_style(buf, 6, 0) == Style::Normal);
  assert(hl.get_style(buf, 1, 3) == Style::Normal);

  /* removing the closing fence extends the region to the document end */
  size_t close = buf.line_to_char(5);
  buf.remove(close, close + 3);
  hl.invalidate_line(buf, 5);
  assert(hl.get_style(buf, 6, 0) == Style::Keyword);
}

static void test_unknown_fence_tag_stays_plain() {
  LanguageRegistry reg = LanguageRegistry::with_builtin_languages();
  SyntaxHighlighter hl(reg, CaptureStyleMap::with_defaults());
  hl.set_document(std::nullopt);
  TextBuffer buf = TextBuffer::from_string("```brainfuck\nif x\n```\n```sh\necho $HOME\n```");
  assert(hl.get_style(buf, 1, 0) == Style::Normal);
  assert(hl.get_style(buf, 4, 0) == Style::Function);
  assert(hl.get_style(buf, 4, 5) == Style::Variable);
  assert(hl.get_style(buf, 4, 6) == Style::Variable);
}

static std::vector<std::vector<Style>> all_styles(SyntaxHighlighter& hl, const TextBuffer& buf) {
  std::vector<std::vector<Style>> out;
  for (int l = 0; l < buf.line_count(); ++l) out.push_back(hl.line_styles(buf, l));
  return out;
}

static void test_edit_inside_fence_restyles_following_lines() {
  LanguageRegistry reg = LanguageRegistry::with_builtin_languages();
  SyntaxHighlighter hl(reg, CaptureStyleMap::with_defaults());
  hl.set_document(std::filesystem::path("notes.md"));
  TextBuffer buf = TextBuffer::from_string(
      "```cpp\n"
      "int a;\n"
      "int b;\n"
      "int c; /* x */\n"
      "```");
  all_styles(hl, buf);
  assert(hl.get_style(buf, 2, 0) == Style::Type);
  assert(hl.get_style(buf, 3, 7) == Style::Comment);

  /* opening a block comment on line 1 swallows lines 2 and 3 */
  buf.insert_str(buf.line_to_char(1), "/*");
  hl.invalidate_line(buf, 1);
  assert(hl.get_style(buf, 1, 0) == Style::Comment);
  assert(hl.get_style(buf, 2, 0) == Style::Comment);
  assert(hl.get_style(buf, 3, 0) == Style::Comment);

  SyntaxHighlighter fresh(reg, CaptureStyleMap::with_defaults());
  fresh.set_document(std::filesystem::path("notes.md"));
  assert(all_styles(hl, buf) == all_styles(fresh, buf));

  /* closing it again restores the code styles */
  buf.remove(buf.line_to_char(1), buf.line_to_char(1) + 2);
  hl.invalidate_line(buf, 1);
  assert(hl.get_style(buf, 2, 0) == Style::Type);
  assert(hl.get_style(buf, 3, 0) == Style::Type);
}

static void test_repeated_invalidation_and_store_are_idempotent() {
  HighlightCache c;
  c.store(2, {Style::Keyword, Style::Normal});
  c.store(2, {Style::Keyword, Style::Normal});
  assert(c.cached_count() == 1);
  assert(c.lookup(2) && *c.lookup(2) == (std::vector<Style>{Style::Keyword, Style::Normal}));
  c.invalidate_line(2);
  c.invalidate_line(2);
  assert(c.dirty_count() == 1);
  assert(c.cached_count() == 1);
  assert(c.lookup(2) == nullptr);
  c.invalidate_from(0);
  assert(c.dirty_count() == 1);

  LanguageRegistry reg = LanguageRegistry::with_builtin_languages();
  SyntaxHighlighter once(reg, CaptureStyleMap::with_defaults());
  SyntaxHighlighter twice(reg, CaptureStyleMap::with_defaults());
  once.set_document(std::filesystem::path("prog.cpp"));
  twice.set_document(std::filesystem::path("prog.cpp"));
  TextBuffer buf = ten_line_program();
  std::vector<std::vector<Style>> before = all_styles(once, buf);
  assert(all_styles(twice, buf) == before);

  once.invalidate_line(buf, 4);
  twice.invalidate_line(buf, 4);
  twice.invalidate_line(buf, 4);
  assert(once.cache().dirty_count() == twice.cache().dirty_count());
  size_t parses = twice.parse_count();
  assert(all_styles(once, buf) == all_styles(twice, buf));
  assert(all_styles(twice, buf) == before);
  assert(twice.parse_count() == parses + 1);
}

int main() {
  test_cache_dirty_tracking();
  test_edit_recomputes_only_the_edited_line();
  test_unnotified_edit_clears_cache();
  test_invalidate_from_marks_the_tail();
  test_composite_document_fences();
  test_unknown_fence_tag_stays_plain();
  test_edit_inside_fence_restyles_following_lines();
  test_repeated_invalidation_and_store_are_idempotent();
  return 0;
}
