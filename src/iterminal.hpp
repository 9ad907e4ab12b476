#pragma once
/*
 * ITerminal
 *
 * Purpose: abstract terminal backend (size, clear, styled draw, cursor, refresh, keys).
 * Goal: decouple from concrete impls (ncurses/headless), enable testing.
 */
#include <optional>
#include <string>
#include "types.hpp"

struct TermSize { int rows; int cols; };

class ITerminal {
public:
  virtual ~ITerminal() = default;
  virtual TermSize getSize() const = 0;
  virtual void clear() = 0;
  /* text is UTF-8, one column per character */
  virtual void draw_styled(int row, int col, const std::string& text, Color fg, Color bg) = 0;
  virtual void move_cursor(int row, int col) = 0;
  virtual void refresh() = 0;
  /* waits at most timeout_ms; nullopt when no key arrived */
  virtual std::optional<Key> read_key(int timeout_ms) = 0;
};
