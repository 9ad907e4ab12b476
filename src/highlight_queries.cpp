#include "highlight_queries.hpp"

const char* const kCppHighlightsQuery = R"scm(
[
  "break" "case" "const" "continue" "default" "do" "else" "enum" "extern"
  "for" "goto" "if" "inline" "return" "sizeof" "static" "struct" "switch"
  "typedef" "union" "volatile" "while"
  "catch" "class" "constexpr" "delete" "explicit" "final" "friend"
  "namespace" "noexcept" "new" "override" "private" "protected" "public"
  "template" "throw" "try" "typename" "using" "virtual"
  "#define" "#include" "#if" "#ifdef" "#ifndef" "#else" "#elif" "#endif"
] @keyword

(call_expression function: (identifier) @function)
(call_expression function: (field_expression field: (field_identifier) @function))
(function_declarator declarator: (identifier) @function)
(function_declarator declarator: (field_identifier) @function)
(function_declarator declarator: (qualified_identifier name: (identifier) @function))
(preproc_function_def name: (identifier) @function.macro)

(primitive_type) @type
(sized_type_specifier) @type
(type_identifier) @type
(namespace_identifier) @type

(string_literal) @string
(raw_string_literal) @string
(char_literal) @string
(system_lib_string) @string
(number_literal) @number
(comment) @comment

(true) @constant
(false) @constant
(null) @constant
(this) @constant

(field_identifier) @variable.field
(identifier) @variable

[
  "=" "+" "-" "*" "/" "%" "==" "!=" "<" ">" "<=" ">=" "&&" "||" "!"
  "++" "--" "+=" "-=" "->" "::"
] @operator
)scm";

const char* const kRustHighlightsQuery = R"scm(
[
  "as" "async" "await" "break" "const" "continue" "dyn" "else" "enum"
  "extern" "fn" "for" "if" "impl" "in" "let" "loop" "match" "mod" "move"
  "pub" "ref" "return" "static" "struct" "trait" "type" "unsafe" "use"
  "where" "while"
] @keyword
(mutable_specifier) @keyword
(crate) @keyword
(super) @keyword
(self) @constant

(macro_invocation macro: (identifier) @function.macro)
(function_item name: (identifier) @function)
(call_expression function: (identifier) @function)
(call_expression function: (field_expression field: (field_identifier) @function))
(call_expression function: (scoped_identifier name: (identifier) @function))

(lifetime) @type
(primitive_type) @type
(type_identifier) @type

(string_literal) @string
(raw_string_literal) @string
(char_literal) @string
(integer_literal) @number
(float_literal) @number
(boolean_literal) @constant
(line_comment) @comment
(block_comment) @comment

(field_identifier) @variable.field
(identifier) @variable

[
  "=" "+" "-" "*" "/" "==" "!=" "<=" ">=" "&&" "||" "->" "=>"
] @operator
)scm";

const char* const kPythonHighlightsQuery = R"scm(
[
  "and" "as" "assert" "async" "await" "break" "class" "continue" "def"
  "del" "elif" "else" "except" "finally" "for" "from" "global" "if"
  "import" "in" "is" "lambda" "nonlocal" "not" "or" "pass" "raise"
  "return" "try" "while" "with" "yield"
] @keyword

(function_definition name: (identifier) @function)
(class_definition name: (identifier) @type)
(call function: (identifier) @function)
(call function: (attribute attribute: (identifier) @function))

(string) @string
(integer) @number
(float) @number
(comment) @comment
(true) @constant
(false) @constant
(none) @constant

(attribute attribute: (identifier) @variable.field)
(identifier) @variable

[
  "=" "+" "-" "*" "/" "%" "==" "!=" "<" ">" "<=" ">=" "->"
] @operator
)scm";

const char* const kBashHighlightsQuery = R"scm(
[
  "if" "then" "else" "elif" "fi" "case" "esac" "for" "in" "do" "done"
  "while" "until" "function" "export" "local" "declare" "readonly"
] @keyword

(function_definition name: (word) @function)
(command_name) @function

(comment) @comment
(string) @string
(raw_string) @string

(simple_expansion) @variable
(expansion) @variable
(variable_name) @variable

[
  "=" "&&" "||" "|"
] @operator
)scm";
