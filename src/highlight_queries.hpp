#pragma once
/*
 * Highlights queries for the compiled-in tree-sitter grammars. Capture names
 * follow the CaptureStyleMap defaults; patterns are listed most specific
 * first because the first pattern to capture a node decides its style.
 * Queries carry no predicates: the C API does not evaluate them.
 */

extern const char* const kCppHighlightsQuery;
extern const char* const kRustHighlightsQuery;
extern const char* const kPythonHighlightsQuery;
extern const char* const kBashHighlightsQuery;
