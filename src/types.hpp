#pragma once
/*
 * Types
 *
 * Purpose: shared lightweight structs/enums (Mode/MenuState/Cursor/Style/Key).
 * Principle: carry simple state; avoid cross-module coupling/business logic.
 */
#include <cstdint>

enum class Mode { Normal, Insert, Select };

enum class MenuState { Inactive, GoTo, File, AI, FilePickerLoad, FilePickerSave };

struct Cursor {
  int row = 0;
  int col = 0;
  bool operator==(const Cursor& o) const { return row == o.row && col == o.col; }
  bool operator!=(const Cursor& o) const { return !(*this == o); }
};

enum class Style : uint8_t {
  Normal,
  Keyword,
  Function,
  Type,
  String,
  Number,
  Comment,
  Variable,
  Constant,
  Operator,
  Error,
  Selection,
};

enum class Color : uint8_t { Default, Black, Red, Green, Yellow, Blue, Magenta, Cyan, White, Grey, DarkGrey };

/*
 * Key: one input event. Special keys carry an ncurses KEY_* code,
 * everything else carries a Unicode scalar value.
 */
struct Key {
  int code = 0;
  bool special = false;
};

static constexpr int ESC = 27;
static constexpr int BACKSPACE_ASCII = 127;
static constexpr int CTRL_Q = 'Q' - 64;
